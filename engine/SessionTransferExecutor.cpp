#include "SessionTransferExecutor.hpp"
#include "SessionManager.hpp"
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <chrono>
#include <thread>

namespace skiff {

using namespace std::chrono_literals;

std::unique_ptr<RemoteClient>
SessionTransferExecutor::openConnection(const RemoteClient::CancelCB &shouldCancel,
                                        std::string &err) {
    RemoteError lastErr;
    for (int i = 0; i < 3; ++i) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled by user";
            return nullptr;
        }
        lastErr.clear();
        auto conn = session_->openWorkerClient(lastErr);
        if (conn)
            return conn;
        // Retrying cannot fix bad input or rejected credentials.
        if (lastErr.category == ErrorCategory::InputValidation ||
            lastErr.category == ErrorCategory::Authentication)
            break;
        if (lastErr.message == "Not connected")
            break;
        if (i < 2)
            std::this_thread::sleep_for((1 << i) * 500ms);
    }
    err = lastErr.message.empty() ? "Could not create transfer connection" : lastErr.message;
    return nullptr;
}

bool SessionTransferExecutor::execute(const TransferItem &item,
                                      const RemoteClient::ProgressCB &progress,
                                      const RemoteClient::CancelCB &shouldCancel,
                                      std::string &err) {
    if (!session_) {
        err = "Not connected";
        return false;
    }
    auto conn = openConnection(shouldCancel, err);
    if (!conn)
        return false;

    bool ok = false;
    if (item.direction == TransferItem::Direction::Upload) {
        ok = conn->upload(item.local_path, item.remote_path, err, progress, shouldCancel);
    } else {
        const QString local = QString::fromStdString(item.local_path);
        QDir().mkpath(QFileInfo(local).dir().absolutePath());
        ok = conn->download(item.remote_path, item.local_path, err, progress, shouldCancel);
    }
    conn->disconnect();
    return ok;
}

} // namespace skiff
