// Connection establishment with a growing retry interval.
#include "sftpflow/ConnectionManager.hpp"
#include "sftpflow/Log.hpp"
#include <thread>

namespace sftpflow {

ConnectionManager::ConnectionManager(SftpClient& prototype,
                                     SessionOptions base,
                                     RetryPolicy policy,
                                     Sleeper sleeper)
    : prototype_(prototype),
      base_(std::move(base)),
      policy_(policy),
      sleeper_(std::move(sleeper)) {
    if (policy_.maxAttempts < 1) policy_.maxAttempts = 1;
    if (!sleeper_) {
        sleeper_ = [](std::chrono::seconds d) { std::this_thread::sleep_for(d); };
    }
}

std::unique_ptr<SftpClient> ConnectionManager::connect(const ConnectionIdentity& id, Error& err) {
    SessionOptions opt = base_;
    opt.identity = id;

    std::string lastErr;
    for (int attempt = 1; attempt <= policy_.maxAttempts; ++attempt) {
        std::string cerr;
        std::unique_ptr<SftpClient> session = prototype_.newConnectionLike(opt, cerr);
        if (session && session->isConnected()) {
            session->setTimeout(std::chrono::duration_cast<std::chrono::milliseconds>(policy_.operationTimeout));
            LOGV("Connected to %s", id.host.c_str());
            return session;
        }
        lastErr = cerr.empty() ? std::string("unknown error") : cerr;
        LOGD("Connection attempt %d to %s failed: %s", attempt, id.host.c_str(), lastErr.c_str());
        if (attempt == policy_.maxAttempts) break;

        const auto wait = policy_.delayBeforeRetry(attempt);
        LOGW("Failed to connect to %s; waiting %lld seconds before retrying.",
             id.host.c_str(), (long long)wait.count());
        sleeper_(wait);
    }

    err.set(ErrorKind::Connection, "Failed to connect to " + id.host + " (" + lastErr + ")");
    LOGE("%s", err.message.c_str());
    return nullptr;
}

} // namespace sftpflow
