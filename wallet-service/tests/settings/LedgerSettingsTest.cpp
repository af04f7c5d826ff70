/**
 * @file LedgerSettingsTest.cpp
 * @brief Unit tests for LedgerSettings, DbSettings and RabbitMQSettings
 */

#include <gtest/gtest.h>
#include "settings/LedgerSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <cstdlib>
#include <stdexcept>

using namespace wallet::settings;

class LedgerSettingsTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"LEDGER_LOCK_TIMEOUT_MS", "LEDGER_LOCK_RETRIES", "TOPUP_MIN_CENTS",
                                 "TOPUP_MAX_CENTS", "SCHEDULER_ENABLED", "WALLET_STORE",
                                 "SCHEDULER_HORIZON_DAYS", "WALLET_DB_HOST", "RABBITMQ_EXCHANGE"}) {
            unsetenv(name);
        }
    }
};

TEST_F(LedgerSettingsTest, Defaults) {
    LedgerSettings settings;

    EXPECT_EQ(settings.getLockTimeout(), std::chrono::milliseconds{2000});
    EXPECT_EQ(settings.getLockRetries(), 3);
    EXPECT_EQ(settings.getRetryBackoff(), std::chrono::milliseconds{25});
    EXPECT_EQ(settings.getTopUpMinCents(), 500);
    EXPECT_EQ(settings.getTopUpMaxCents(), 1000000);
    EXPECT_EQ(settings.getHorizonDays(), 31);
    EXPECT_EQ(settings.getSchedulerInterval(), std::chrono::milliseconds{60000});
    EXPECT_TRUE(settings.isSchedulerEnabled());
    EXPECT_EQ(settings.getStoreType(), "postgres");
}

TEST_F(LedgerSettingsTest, ReadsEnvironment) {
    setenv("LEDGER_LOCK_TIMEOUT_MS", "150", 1);
    setenv("LEDGER_LOCK_RETRIES", "0", 1);
    setenv("SCHEDULER_HORIZON_DAYS", "7", 1);
    setenv("SCHEDULER_ENABLED", "false", 1);
    setenv("WALLET_STORE", "memory", 1);

    LedgerSettings settings;

    EXPECT_EQ(settings.getLockTimeout(), std::chrono::milliseconds{150});
    EXPECT_EQ(settings.getLockRetries(), 0);
    EXPECT_EQ(settings.getHorizonDays(), 7);
    EXPECT_FALSE(settings.isSchedulerEnabled());
    EXPECT_EQ(settings.getStoreType(), "memory");
}

TEST_F(LedgerSettingsTest, NonNumeric_Throws) {
    setenv("LEDGER_LOCK_TIMEOUT_MS", "soon", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);
}

TEST_F(LedgerSettingsTest, Negative_Throws) {
    setenv("LEDGER_LOCK_RETRIES", "-1", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);
}

TEST_F(LedgerSettingsTest, TrailingGarbage_Throws) {
    setenv("TOPUP_MIN_CENTS", "500abc", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);
}

TEST_F(LedgerSettingsTest, MinAboveMax_Throws) {
    setenv("TOPUP_MIN_CENTS", "5000", 1);
    setenv("TOPUP_MAX_CENTS", "100", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);
}

TEST_F(LedgerSettingsTest, UnknownStore_Throws) {
    setenv("WALLET_STORE", "redis", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);
}

TEST_F(LedgerSettingsTest, DbSettings_ConnectionString) {
    setenv("WALLET_DB_HOST", "db.local", 1);
    DbSettings settings;

    auto conn = settings.getConnectionString();
    EXPECT_NE(conn.find("host=db.local"), std::string::npos);
    EXPECT_NE(conn.find("dbname="), std::string::npos);
}

TEST_F(LedgerSettingsTest, RabbitMQSettings_Exchange) {
    setenv("RABBITMQ_EXCHANGE", "wallet.test", 1);
    RabbitMQSettings settings;

    EXPECT_EQ(settings.getExchange(), "wallet.test");
    EXPECT_EQ(settings.getQueue(), "wallet.commands");
}
