// Transfer queue: FIFO scheduling with bounded concurrency and
// pause/resume/cancel per item.
#pragma once
#include "Stores.hpp"
#include "skiff/RemoteClient.hpp"
#include <QObject>
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace skiff {

struct TransferItem {
    enum class Direction { Upload, Download };
    //  - Pending: waiting for a free slot
    //  - Running: a worker owns it
    //  - Paused: stopped by the user, still holds its slot
    //  - Completed / Failed / Cancelled: terminal
    enum class Status { Pending, Running, Paused, Completed, Failed, Cancelled };

    quint64 id = 0;
    Direction direction = Direction::Download;
    std::string local_path;
    std::string remote_path;
    std::uint64_t expected_size = 0;
    Status status = Status::Pending;
    int progress = 0; // 0..100
    std::uint64_t bytes_done = 0;
    double speed_bps = 0.0;
    int eta_seconds = -1;
    std::string error;
    int attempt = 0; // bumped on every promotion to running
    qint64 started_at_ms = 0;
    qint64 finished_at_ms = 0;
    std::shared_ptr<std::atomic<bool>> cancel;

    bool isTerminal() const {
        return status == Status::Completed || status == Status::Failed ||
               status == Status::Cancelled;
    }
};

const char *transferStatusName(TransferItem::Status st);

// Runs one transfer to completion on the calling (worker) thread.
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;
    virtual bool execute(const TransferItem &item,
                         const RemoteClient::ProgressCB &progress,
                         const RemoteClient::CancelCB &shouldCancel,
                         std::string &err) = 0;
};

class TransferQueue : public QObject {
    Q_OBJECT
public:
    TransferQueue(int capacity, std::shared_ptr<TransferExecutor> executor,
                  QObject *parent = nullptr);
    ~TransferQueue() override;

    // Not owned.
    void setHistoryStore(HistoryStore *store) { history_ = store; }
    void setConnectionName(const std::string &name);
    void setShutdownTimeout(int ms) { shutdownTimeoutMs_ = ms < 0 ? 0 : ms; }

    quint64 add(TransferItem item);
    quint64 enqueueUpload(const QString &local, const QString &remote);
    quint64 enqueueDownload(const QString &remote, const QString &local);

    bool pause(quint64 id);
    bool resume(quint64 id);
    bool cancel(quint64 id);
    int clearCompleted();

    QVector<TransferItem> getAll() const;
    std::optional<TransferItem> item(quint64 id) const;
    std::vector<quint64> activeIds() const;
    std::vector<quint64> pendingIds() const;
    int capacity() const { return capacity_; }

signals:
    void tasksChanged();
    void transferFinished(quint64 id, int status, const QString &error);

public slots:
    // Promotes pending items while there is a free slot.
    void schedule();

private:
    // Outlives the queue so detached workers can tell it is gone.
    struct Shared;
    class ReportGuard;
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void launch(const TransferItem &snapshot);
    void onProgress(quint64 id, int attempt, std::size_t done, std::size_t total);
    void onFinished(quint64 id, int attempt, bool ok, const std::string &err);
    void recordHistory(const TransferItem &it);
    void reapWorkers();
    TransferItem *findActive(quint64 id);

    const int capacity_;
    std::shared_ptr<TransferExecutor> executor_;
    std::shared_ptr<Shared> shared_;
    HistoryStore *history_ = nullptr;
    int shutdownTimeoutMs_ = 5000;
    std::atomic<bool> shuttingDown_{false};
    std::atomic<qint64> lastProgressEmitMs_{0};

    mutable std::mutex mtx_; // protects the three collections and connection_
    std::deque<TransferItem> pending_;
    std::vector<TransferItem> active_;
    std::vector<TransferItem> finished_;
    std::string connection_;
    quint64 nextId_ = 1;

    std::mutex workersMtx_;
    std::vector<Worker> workers_;
};

} // namespace skiff
