#pragma once

#include "types.h"
#include <mutex>
#include <optional>

namespace ocl {
namespace gaiasync {

class Logger;
class RemoteCatalogService;

/**
 * SessionManager - Remote session lifecycle for a batch
 *
 * LoggedOut -> LoggedIn -> LoggedOut. Without credentials, or when the
 * login is refused, the batch runs anonymously: exclusion sets are then
 * sent inline instead of as user tables. logout() is issued at most once,
 * and only after a successful login.
 *
 * The artifact mutex is shared by every region worker using the session.
 */
class SessionManager {
public:
    SessionManager(RemoteCatalogService& service,
                   std::optional<Credentials> credentials,
                   Logger& logger);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * Log in if credentials are configured. Failures are logged as
     * SESSION_ERROR and leave the session anonymous.
     * @return true when the session is authenticated
     */
    bool login();

    /**
     * Best effort logout, only the first call after a successful login
     * reaches the remote service
     */
    void logout();

    bool isAuthenticated() const { return authenticated_; }

    RemoteCatalogService& service() { return service_; }

    std::mutex& artifactMutex() { return artifact_mutex_; }

private:
    RemoteCatalogService& service_;
    std::optional<Credentials> credentials_;
    Logger& logger_;
    bool authenticated_ = false;
    std::mutex artifact_mutex_;
};

/**
 * Logs in on construction and out on destruction, also on early exit
 */
class ScopedSession {
public:
    explicit ScopedSession(SessionManager& session) : session_(session) {
        session_.login();
    }

    ~ScopedSession() { session_.logout(); }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

private:
    SessionManager& session_;
};

} // namespace gaiasync
} // namespace ocl
