#include "RefreshCoordinator.hpp"
#include "SessionManager.hpp"
#include "skiff/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <QTimer>
#include <vector>
Q_LOGGING_CATEGORY(skRefresh, "skiff.refresh")

namespace skiff {

RefreshCoordinator::RefreshCoordinator(SessionManager *session, QObject *parent)
    : QObject(parent), session_(session) {
    qRegisterMetaType<skiff::RemoteEntry>("skiff::RemoteEntry");
    qRegisterMetaType<QVector<skiff::RemoteEntry>>("QVector<skiff::RemoteEntry>");
}

RefreshCoordinator::~RefreshCoordinator() {
    if (worker_.joinable())
        worker_.join();
}

bool RefreshCoordinator::isBusy() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return inFlight_;
}

void RefreshCoordinator::requestRefresh(const QString &path) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (inFlight_) {
            followUp_ = true;
            followUpPath_ = path.toStdString();
            qCDebug(skRefresh) << "refresh coalesced";
            return;
        }
        inFlight_ = true;
    }
    launch(path.toStdString());
}

void RefreshCoordinator::launch(const std::string &path) {
    // The previous worker has already handed over its result.
    if (worker_.joinable())
        worker_.join();
    worker_ = std::thread([this, path]() {
        const std::string target = path.empty() ? session_->currentDir() : path;
        std::vector<RemoteEntry> out;
        std::string err;
        const bool ok = session_->list(target, out, err);
        QVector<RemoteEntry> entries;
        entries.reserve(static_cast<int>(out.size()));
        for (auto &e : out)
            entries.push_back(std::move(e));
        const QString qpath = QString::fromStdString(target);
        const QString message = QString::fromStdString(err);
        QMetaObject::invokeMethod(
            this, [this, qpath, ok, entries, message]() { deliver(qpath, ok, entries, message); },
            Qt::QueuedConnection);
    });
}

void RefreshCoordinator::deliver(const QString &path, bool ok,
                                 const QVector<RemoteEntry> &entries, const QString &message) {
    if (ok) {
        qCDebug(skRefresh) << "refreshed" << QString::fromStdString(loggablePath(path.toStdString()))
                           << "entries=" << entries.size();
        emit refreshed(path, entries);
    } else {
        qCWarning(skRefresh) << "refresh failed:" << message;
        emit refreshFailed(path, message);
    }

    std::string next;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!followUp_) {
            inFlight_ = false;
            return;
        }
        // inFlight_ stays set until the follow-up delivers.
        followUp_ = false;
        next = followUpPath_;
        followUpPath_.clear();
    }
    if (followUpDelayMs_ == 0) {
        launch(next);
        return;
    }
    QTimer::singleShot(followUpDelayMs_, this, [this, next]() { launch(next); });
}

} // namespace skiff
