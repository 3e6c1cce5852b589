// Coalesces directory refresh requests: one listing in flight, at most one
// queued behind it.
#pragma once
#include "skiff/RemoteTypes.hpp"
#include <QMetaType>
#include <QObject>
#include <QString>
#include <QVector>
#include <mutex>
#include <string>
#include <thread>

Q_DECLARE_METATYPE(skiff::RemoteEntry)

namespace skiff {

class SessionManager;

class RefreshCoordinator : public QObject {
    Q_OBJECT
public:
    explicit RefreshCoordinator(SessionManager *session, QObject *parent = nullptr);
    ~RefreshCoordinator() override;

    void setFollowUpDelay(int ms) { followUpDelayMs_ = ms < 0 ? 0 : ms; }
    // Empty path means the session's current directory.
    void requestRefresh(const QString &path = QString());
    bool isBusy() const;

signals:
    void refreshed(const QString &path, const QVector<skiff::RemoteEntry> &entries);
    void refreshFailed(const QString &path, const QString &message);

private:
    void launch(const std::string &path);
    void deliver(const QString &path, bool ok, const QVector<RemoteEntry> &entries,
                 const QString &message);

    SessionManager *session_;
    int followUpDelayMs_ = 500;

    mutable std::mutex mtx_; // protects the flags below
    bool inFlight_ = false;
    bool followUp_ = false;
    std::string followUpPath_;

    std::thread worker_;
};

} // namespace skiff
