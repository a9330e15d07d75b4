#include "fake_catalog_service.h"
#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/session_manager.h"
#include <gtest/gtest.h>

using namespace ocl::gaiasync;
using ocl::gaiasync::test_support::FakeCatalogService;

namespace {

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        service.setAcceptedCredentials("jdoe", "secret");
    }

    Logger logger{LogLevel::SILENT};
    FakeCatalogService service;
};

} // namespace

TEST_F(SessionManagerTest, LoginAndLogoutOnce) {
    SessionManager session(service, Credentials{"jdoe", "secret"}, logger);

    EXPECT_TRUE(session.login());
    EXPECT_TRUE(session.isAuthenticated());
    EXPECT_TRUE(service.isAuthenticated());

    // Second login is a no-op
    EXPECT_TRUE(session.login());
    EXPECT_EQ(service.loginCalls(), 1);

    session.logout();
    session.logout();
    EXPECT_FALSE(session.isAuthenticated());
    EXPECT_EQ(service.logoutCalls(), 1);
}

TEST_F(SessionManagerTest, NoCredentialsIsAnonymous) {
    SessionManager session(service, std::nullopt, logger);

    EXPECT_FALSE(session.login());
    EXPECT_FALSE(session.isAuthenticated());
    EXPECT_EQ(service.loginCalls(), 0);

    session.logout();
    EXPECT_EQ(service.logoutCalls(), 0);
}

TEST_F(SessionManagerTest, EmptyUsernameIsAnonymous) {
    SessionManager session(service, Credentials{"", ""}, logger);

    EXPECT_FALSE(session.login());
    EXPECT_EQ(service.loginCalls(), 0);
}

TEST_F(SessionManagerTest, RejectedLoginDegradesToAnonymous) {
    SessionManager session(service, Credentials{"jdoe", "wrong"}, logger);

    EXPECT_NO_THROW(EXPECT_FALSE(session.login()));
    EXPECT_FALSE(session.isAuthenticated());
    EXPECT_EQ(service.loginCalls(), 1);

    // Never logged in, nothing to close
    session.logout();
    EXPECT_EQ(service.logoutCalls(), 0);
}

TEST_F(SessionManagerTest, LogoutFailureIsNotThrown) {
    SessionManager session(service, Credentials{"jdoe", "secret"}, logger);
    session.login();
    service.setLogoutFails(true);

    EXPECT_NO_THROW(session.logout());
    EXPECT_FALSE(session.isAuthenticated());
    EXPECT_EQ(service.logoutCalls(), 1);
}

TEST_F(SessionManagerTest, ScopedSessionLogsOutOnException) {
    SessionManager session(service, Credentials{"jdoe", "secret"}, logger);

    try {
        ScopedSession scope(session);
        EXPECT_TRUE(session.isAuthenticated());
        throw SyncException(ErrorCode::CANCELLED, "interrupted");
    } catch (const SyncException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CANCELLED);
    }

    EXPECT_FALSE(session.isAuthenticated());
    EXPECT_EQ(service.loginCalls(), 1);
    EXPECT_EQ(service.logoutCalls(), 1);
}
