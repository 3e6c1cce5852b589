// Runs queued transfers over dedicated connections cloned from the live
// session, so a long transfer never blocks browsing.
#pragma once
#include "TransferQueue.hpp"

namespace skiff {

class SessionManager;

class SessionTransferExecutor : public TransferExecutor {
public:
    // The manager must outlive every queue using this executor.
    explicit SessionTransferExecutor(SessionManager *session) : session_(session) {}

    bool execute(const TransferItem &item,
                 const RemoteClient::ProgressCB &progress,
                 const RemoteClient::CancelCB &shouldCancel,
                 std::string &err) override;

private:
    std::unique_ptr<RemoteClient> openConnection(const RemoteClient::CancelCB &shouldCancel,
                                                 std::string &err);

    SessionManager *session_;
};

} // namespace skiff
