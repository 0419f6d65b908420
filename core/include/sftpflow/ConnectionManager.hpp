// Opens sessions for a connection identity with bounded retry and backoff.
#pragma once
#include "Errors.hpp"
#include "SftpClient.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace sftpflow {

// Bounded retry: up to maxAttempts connection attempts; the wait before
// retry n (1-based) is initialDelay + (n - 1) * step. No wait follows the
// last attempt. The default of three attempts in total waits 15 s, then
// 20 s; maxAttempts = 4 adds a third wait of 25 s.
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::seconds initialDelay{15};
    std::chrono::seconds step{5};
    std::chrono::seconds operationTimeout{15};

    std::chrono::seconds delayBeforeRetry(int retry) const {
        return initialDelay + step * (retry - 1);
    }
};

class ConnectionManager {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    // `prototype` selects the backend; it is never connected itself and must
    // outlive the manager. `base` supplies host key settings and callbacks.
    ConnectionManager(SftpClient& prototype,
                      SessionOptions base = {},
                      RetryPolicy policy = {},
                      Sleeper sleeper = {});

    // Returns a connected session with the operation timeout applied, or
    // nullptr with an ErrorKind::Connection error once attempts run out.
    std::unique_ptr<SftpClient> connect(const ConnectionIdentity& id, Error& err);

    const RetryPolicy& policy() const { return policy_; }

private:
    SftpClient& prototype_;
    SessionOptions base_;
    RetryPolicy policy_;
    Sleeper sleeper_;
};

} // namespace sftpflow
