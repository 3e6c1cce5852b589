// Queue implementation: each running item gets its own worker thread and the
// executor opens whatever connection it needs.
#include "TransferQueue.hpp"
#include "skiff/RuntimeLogging.hpp"
#include <QDateTime>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMetaObject>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
Q_LOGGING_CATEGORY(skXfer, "skiff.transfer")

namespace skiff {

const char *transferStatusName(TransferItem::Status st) {
    switch (st) {
    case TransferItem::Status::Pending:
        return "Pending";
    case TransferItem::Status::Running:
        return "Running";
    case TransferItem::Status::Paused:
        return "Paused";
    case TransferItem::Status::Completed:
        return "Completed";
    case TransferItem::Status::Failed:
        return "Failed";
    case TransferItem::Status::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

static const char *directionName(TransferItem::Direction d) {
    return d == TransferItem::Direction::Upload ? "upload" : "download";
}

struct TransferQueue::Shared {
    std::mutex m;
    std::condition_variable cv;
    bool closed = false;
    int reporters = 0;
};

// Held by a worker while it touches the queue. Never granted once the
// queue has started tearing down.
class TransferQueue::ReportGuard {
public:
    explicit ReportGuard(const std::shared_ptr<Shared> &s) : s_(s) {
        std::lock_guard<std::mutex> lk(s_->m);
        if (!s_->closed) {
            ++s_->reporters;
            granted_ = true;
        }
    }
    ~ReportGuard() {
        if (!granted_)
            return;
        std::lock_guard<std::mutex> lk(s_->m);
        --s_->reporters;
        s_->cv.notify_all();
    }
    ReportGuard(const ReportGuard &) = delete;
    ReportGuard &operator=(const ReportGuard &) = delete;
    explicit operator bool() const { return granted_; }

private:
    std::shared_ptr<Shared> s_;
    bool granted_ = false;
};

TransferQueue::TransferQueue(int capacity, std::shared_ptr<TransferExecutor> executor,
                             QObject *parent)
    : QObject(parent), capacity_(capacity < 1 ? 1 : capacity),
      executor_(std::move(executor)), shared_(std::make_shared<Shared>()) {}

TransferQueue::~TransferQueue() {
    shuttingDown_ = true;
    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto cancelAll = [&](TransferItem &t) {
            if (t.cancel)
                t.cancel->store(true);
            t.status = TransferItem::Status::Cancelled;
            t.speed_bps = 0.0;
            t.eta_seconds = -1;
            t.finished_at_ms = nowMs;
            finished_.push_back(t);
        };
        for (auto &t : active_)
            cancelAll(t);
        for (auto &t : pending_)
            cancelAll(t);
        active_.clear();
        pending_.clear();
    }

    // Give cooperative workers a chance to unwind.
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(shutdownTimeoutMs_);
    for (;;) {
        bool allDone = true;
        {
            std::lock_guard<std::mutex> wl(workersMtx_);
            for (const auto &w : workers_) {
                if (!w.done->load()) {
                    allDone = false;
                    break;
                }
            }
        }
        if (allDone || std::chrono::steady_clock::now() >= deadline)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    {
        std::unique_lock<std::mutex> lk(shared_->m);
        shared_->closed = true;
        shared_->cv.wait(lk, [this]() { return shared_->reporters == 0; });
    }

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> wl(workersMtx_);
        workers.swap(workers_);
    }
    int stragglers = 0;
    for (auto &w : workers) {
        if (!w.thread.joinable())
            continue;
        if (w.done->load()) {
            w.thread.join();
        } else {
            w.thread.detach();
            ++stragglers;
        }
    }
    if (stragglers > 0)
        qCWarning(skXfer) << "shutdown detached" << stragglers << "unfinished worker(s)";
}

void TransferQueue::setConnectionName(const std::string &name) {
    std::lock_guard<std::mutex> lk(mtx_);
    connection_ = name;
}

quint64 TransferQueue::add(TransferItem item) {
    quint64 id = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        id = nextId_++;
        item.id = id;
        item.status = TransferItem::Status::Pending;
        item.attempt = 0;
        item.cancel = std::make_shared<std::atomic<bool>>(false);
        pending_.push_back(item);
    }
    const LogPolicy policy = LogPolicy::fromEnvironment();
    qCInfo(skXfer) << "enqueue" << id << directionName(item.direction)
                   << QString::fromStdString(policy.path(item.local_path)) << "<->"
                   << QString::fromStdString(policy.path(item.remote_path));
    emit tasksChanged();
    schedule();
    return id;
}

quint64 TransferQueue::enqueueUpload(const QString &local, const QString &remote) {
    TransferItem t;
    t.direction = TransferItem::Direction::Upload;
    t.local_path = local.toStdString();
    t.remote_path = remote.toStdString();
    const QFileInfo fi(local);
    if (fi.exists() && fi.isFile())
        t.expected_size = static_cast<std::uint64_t>(fi.size());
    return add(std::move(t));
}

quint64 TransferQueue::enqueueDownload(const QString &remote, const QString &local) {
    TransferItem t;
    t.direction = TransferItem::Direction::Download;
    t.local_path = local.toStdString();
    t.remote_path = remote.toStdString();
    return add(std::move(t));
}

TransferItem *TransferQueue::findActive(quint64 id) {
    for (auto &t : active_) {
        if (t.id == id)
            return &t;
    }
    return nullptr;
}

void TransferQueue::reapWorkers() {
    std::lock_guard<std::mutex> wl(workersMtx_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable())
                it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TransferQueue::schedule() {
    if (shuttingDown_)
        return;
    reapWorkers();
    std::vector<TransferItem> launched;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        while (static_cast<int>(active_.size()) < capacity_ && !pending_.empty()) {
            TransferItem t = pending_.front();
            pending_.pop_front();
            t.status = TransferItem::Status::Running;
            t.attempt += 1;
            t.cancel = std::make_shared<std::atomic<bool>>(false);
            t.started_at_ms = QDateTime::currentMSecsSinceEpoch();
            t.speed_bps = 0.0;
            t.eta_seconds = -1;
            t.error.clear();
            active_.push_back(t);
            launched.push_back(t);
        }
    }
    if (launched.empty())
        return;
    for (const auto &t : launched)
        launch(t);
    emit tasksChanged();
}

void TransferQueue::launch(const TransferItem &snapshot) {
    qCInfo(skXfer) << "start" << snapshot.id << directionName(snapshot.direction)
                   << "attempt" << snapshot.attempt;
    Worker w;
    w.done = std::make_shared<std::atomic<bool>>(false);
    auto done = w.done;
    auto shared = shared_;
    auto executor = executor_;
    w.thread = std::thread([this, snapshot, done, shared, executor]() {
        const quint64 id = snapshot.id;
        const int attempt = snapshot.attempt;
        const auto flag = snapshot.cancel;
        RemoteClient::ProgressCB progress = [this, shared, id, attempt](std::size_t d,
                                                                        std::size_t t) {
            ReportGuard g(shared);
            if (g)
                onProgress(id, attempt, d, t);
        };
        RemoteClient::CancelCB shouldCancel = [flag]() { return flag->load(); };

        std::string err;
        bool ok = false;
        if (!executor) {
            err = "No transfer executor";
        } else {
            try {
                ok = executor->execute(snapshot, progress, shouldCancel, err);
            } catch (const std::exception &e) {
                ok = false;
                err = e.what();
            }
        }
        {
            ReportGuard g(shared);
            if (g)
                onFinished(id, attempt, ok, err);
        }
        done->store(true);
    });
    std::lock_guard<std::mutex> wl(workersMtx_);
    workers_.push_back(std::move(w));
}

void TransferQueue::onProgress(quint64 id, int attempt, std::size_t done, std::size_t total) {
    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        TransferItem *t = findActive(id);
        if (!t || t->attempt != attempt || t->status != TransferItem::Status::Running)
            return;
        t->bytes_done = done;
        if (total > 0)
            t->expected_size = total;
        if (t->expected_size > 0)
            t->progress = static_cast<int>(
                std::min<std::uint64_t>(100, (std::uint64_t(done) * 100) / t->expected_size));
        const qint64 elapsedMs = nowMs - t->started_at_ms;
        if (elapsedMs > 0) {
            t->speed_bps = (static_cast<double>(done) * 1000.0) / static_cast<double>(elapsedMs);
            if (t->speed_bps > 0.0 && t->expected_size >= done)
                t->eta_seconds = static_cast<int>(
                    static_cast<double>(t->expected_size - done) / t->speed_bps);
        }
    }
    // At most ten refreshes a second, plus the final chunk.
    const qint64 last = lastProgressEmitMs_.load();
    if (nowMs - last >= 100 || (total > 0 && done >= total)) {
        lastProgressEmitMs_.store(nowMs);
        emit tasksChanged();
    }
}

void TransferQueue::onFinished(quint64 id, int attempt, bool ok, const std::string &err) {
    TransferItem copy;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = std::find_if(active_.begin(), active_.end(),
                               [id](const TransferItem &t) { return t.id == id; });
        // Stale report from a paused or cancelled attempt
        if (it == active_.end() || it->attempt != attempt)
            return;
        if (it->status != TransferItem::Status::Running)
            return;
        it->finished_at_ms = QDateTime::currentMSecsSinceEpoch();
        it->speed_bps = 0.0;
        if (ok) {
            it->status = TransferItem::Status::Completed;
            it->progress = 100;
            it->eta_seconds = 0;
            if (it->expected_size > it->bytes_done)
                it->bytes_done = it->expected_size;
            it->error.clear();
        } else {
            it->status = TransferItem::Status::Failed;
            it->eta_seconds = -1;
            it->error = err.empty() ? std::string("Transfer failed") : err;
        }
        copy = *it;
        finished_.push_back(*it);
        active_.erase(it);
    }
    if (ok)
        qCInfo(skXfer) << "done" << id << "bytes=" << copy.bytes_done;
    else
        qCWarning(skXfer) << "failed" << id << QString::fromStdString(copy.error);
    recordHistory(copy);
    emit transferFinished(id, static_cast<int>(copy.status), QString::fromStdString(copy.error));
    emit tasksChanged();
    QMetaObject::invokeMethod(this, "schedule", Qt::QueuedConnection);
}

void TransferQueue::recordHistory(const TransferItem &it) {
    if (!history_)
        return;
    HistoryRecord r;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        r.connection_name = connection_;
    }
    r.operation = directionName(it.direction);
    r.local_path = it.local_path;
    r.remote_path = it.remote_path;
    r.status = transferStatusName(it.status);
    if (!it.error.empty())
        r.error = it.error;
    r.size = it.expected_size > 0 ? it.expected_size : it.bytes_done;
    if (it.started_at_ms > 0 && it.finished_at_ms >= it.started_at_ms)
        r.duration_seconds = static_cast<double>(it.finished_at_ms - it.started_at_ms) / 1000.0;
    r.timestamp_ms = it.finished_at_ms;
    history_->appendHistory(r);
}

bool TransferQueue::pause(quint64 id) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        TransferItem *t = findActive(id);
        if (!t || t->status != TransferItem::Status::Running)
            return false;
        t->status = TransferItem::Status::Paused;
        t->speed_bps = 0.0;
        t->eta_seconds = -1;
        if (t->cancel)
            t->cancel->store(true);
    }
    qCInfo(skXfer) << "pause" << id;
    emit tasksChanged();
    return true;
}

bool TransferQueue::resume(quint64 id) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = std::find_if(active_.begin(), active_.end(),
                               [id](const TransferItem &t) { return t.id == id; });
        if (it == active_.end() || it->status != TransferItem::Status::Paused)
            return false;
        TransferItem t = *it;
        active_.erase(it);
        t.status = TransferItem::Status::Pending;
        t.cancel = std::make_shared<std::atomic<bool>>(false);
        pending_.push_back(t);
    }
    qCInfo(skXfer) << "resume" << id;
    emit tasksChanged();
    schedule();
    return true;
}

bool TransferQueue::cancel(quint64 id) {
    TransferItem copy;
    bool found = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto pit = std::find_if(pending_.begin(), pending_.end(),
                                [id](const TransferItem &t) { return t.id == id; });
        if (pit != pending_.end()) {
            copy = *pit;
            pending_.erase(pit);
            found = true;
        } else {
            auto ait = std::find_if(active_.begin(), active_.end(),
                                    [id](const TransferItem &t) { return t.id == id; });
            if (ait != active_.end()) {
                copy = *ait;
                active_.erase(ait);
                found = true;
            }
        }
        if (!found)
            return false;
        if (copy.cancel)
            copy.cancel->store(true);
        copy.status = TransferItem::Status::Cancelled;
        copy.speed_bps = 0.0;
        copy.eta_seconds = -1;
        copy.finished_at_ms = QDateTime::currentMSecsSinceEpoch();
        finished_.push_back(copy);
    }
    qCInfo(skXfer) << "cancel" << id;
    recordHistory(copy);
    emit transferFinished(id, static_cast<int>(copy.status), QString());
    emit tasksChanged();
    schedule();
    return true;
}

int TransferQueue::clearCompleted() {
    int removed = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        removed = static_cast<int>(finished_.size());
        finished_.clear();
    }
    if (removed > 0)
        emit tasksChanged();
    return removed;
}

QVector<TransferItem> TransferQueue::getAll() const {
    std::lock_guard<std::mutex> lk(mtx_);
    QVector<TransferItem> out;
    out.reserve(static_cast<int>(active_.size() + pending_.size() + finished_.size()));
    for (const auto &t : active_)
        out.push_back(t);
    for (const auto &t : pending_)
        out.push_back(t);
    for (const auto &t : finished_)
        out.push_back(t);
    return out;
}

std::optional<TransferItem> TransferQueue::item(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &t : active_)
        if (t.id == id)
            return t;
    for (const auto &t : pending_)
        if (t.id == id)
            return t;
    for (const auto &t : finished_)
        if (t.id == id)
            return t;
    return std::nullopt;
}

std::vector<quint64> TransferQueue::activeIds() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<quint64> ids;
    for (const auto &t : active_)
        ids.push_back(t.id);
    return ids;
}

std::vector<quint64> TransferQueue::pendingIds() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<quint64> ids;
    for (const auto &t : pending_)
        ids.push_back(t.id);
    return ids;
}

} // namespace skiff
