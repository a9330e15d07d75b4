#include "ocl_gaiasync/session_manager.h"
#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/remote_catalog_service.h"

namespace ocl {
namespace gaiasync {

SessionManager::SessionManager(RemoteCatalogService& service,
                               std::optional<Credentials> credentials,
                               Logger& logger)
    : service_(service), credentials_(std::move(credentials)), logger_(logger) {
    if (credentials_ && credentials_->username.empty()) {
        credentials_.reset();
    }
}

bool SessionManager::login() {
    if (authenticated_) {
        return true;
    }

    if (!credentials_) {
        logger_.info("No credentials configured, running anonymously");
        return false;
    }

    try {
        service_.login(*credentials_);
        authenticated_ = true;
        logger_.info("Logged in as " + credentials_->username);
    } catch (const SyncException& e) {
        logger_.error(errorCodeToString(ErrorCode::SESSION_ERROR) + ": login as " +
                      credentials_->username + " failed: " + e.what() +
                      ". Continuing anonymously");
    }
    return authenticated_;
}

void SessionManager::logout() {
    if (!authenticated_) {
        return;
    }
    authenticated_ = false;

    try {
        service_.logout();
        logger_.info("Logged out");
    } catch (const SyncException& e) {
        logger_.warn(std::string("Logout failed: ") + e.what());
    }
}

} // namespace gaiasync
} // namespace ocl
