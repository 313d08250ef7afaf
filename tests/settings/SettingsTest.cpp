#include <gtest/gtest.h>
#include "settings/AppSettings.hpp"
#include "settings/DbSettings.hpp"
#include <cstdlib>

using namespace bullion::settings;
using namespace std::chrono_literals;

class SettingsTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("BULLION_DB_CONNECT_TIMEOUT_SECONDS");
        unsetenv("BULLION_DB_STATEMENT_TIMEOUT_MS");
        unsetenv("BULLION_CLEAR_QUEUE_ON_START");
    }
};

TEST_F(SettingsTest, DbDefaults_BoundConnectAndStatement) {
    DbSettings settings;

    auto conn = settings.getConnectionString();
    EXPECT_NE(conn.find(" connect_timeout=5"), std::string::npos);
    EXPECT_EQ(settings.getStatementTimeout(), 2000ms);
}

TEST_F(SettingsTest, DbTimeouts_ReadFromEnv) {
    setenv("BULLION_DB_CONNECT_TIMEOUT_SECONDS", "2", 1);
    setenv("BULLION_DB_STATEMENT_TIMEOUT_MS", "750", 1);

    DbSettings settings;

    EXPECT_NE(settings.getConnectionString().find(" connect_timeout=2"), std::string::npos);
    EXPECT_EQ(settings.getStatementTimeout(), 750ms);
}

TEST_F(SettingsTest, ClearQueueOnStart_OffUnlessTrue) {
    EXPECT_FALSE(AppSettings().clearQueueOnStart());

    setenv("BULLION_CLEAR_QUEUE_ON_START", "yes", 1);
    EXPECT_FALSE(AppSettings().clearQueueOnStart());

    setenv("BULLION_CLEAR_QUEUE_ON_START", "true", 1);
    EXPECT_TRUE(AppSettings().clearQueueOnStart());
}
