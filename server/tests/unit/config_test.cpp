#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "stakematch/config.hpp"

TEST(ConfigTest, DefaultsWhenEnvironmentIsEmpty) {
  unsetenv("PAYOUT_TAX_PERCENT");
  unsetenv("QUEUE_TTL_SECONDS");
  unsetenv("IDLE_FORFEIT_SECONDS");
  unsetenv("PAIRING_MAX_ATTEMPTS");
  auto config = stakematch::LoadConfigFromEnv();
  EXPECT_EQ(config.payout_tax_percent, 15);
  EXPECT_EQ(config.queue_ttl_seconds, 180u);
  EXPECT_EQ(config.game_expiry_seconds, 180u);
  EXPECT_EQ(config.queue_processing_visibility_seconds, 60u);
  EXPECT_EQ(config.pairing_max_attempts, 5);
  EXPECT_EQ(config.pairing_race_delay_ms, 50u);
  EXPECT_EQ(config.idle_warning_seconds, 45u);
  EXPECT_EQ(config.idle_forfeit_seconds, 90u);
  EXPECT_EQ(config.disconnect_grace_seconds, 120u);
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
  setenv("PAYOUT_TAX_PERCENT", "10", 1);
  setenv("QUEUE_TTL_SECONDS", "30", 1);
  auto config = stakematch::LoadConfigFromEnv();
  EXPECT_EQ(config.payout_tax_percent, 10);
  EXPECT_EQ(config.queue_ttl_seconds, 30u);
  unsetenv("PAYOUT_TAX_PERCENT");
  unsetenv("QUEUE_TTL_SECONDS");
}

TEST(ConfigTest, OutOfRangeTaxPercentFailsAtStartup) {
  setenv("PAYOUT_TAX_PERCENT", "101", 1);
  EXPECT_THROW(stakematch::LoadConfigFromEnv(), std::invalid_argument);
  setenv("PAYOUT_TAX_PERCENT", "-5", 1);
  EXPECT_THROW(stakematch::LoadConfigFromEnv(), std::invalid_argument);
  setenv("PAYOUT_TAX_PERCENT", "100", 1);
  EXPECT_EQ(stakematch::LoadConfigFromEnv().payout_tax_percent, 100);
  unsetenv("PAYOUT_TAX_PERCENT");
}

TEST(ConfigTest, RuntimeOverrideAcceptsKnownKeys) {
  auto config = stakematch::LoadConfigFromEnv();
  EXPECT_TRUE(stakematch::ApplyRuntimeOverride(config, "payout_tax_percent", "12"));
  EXPECT_TRUE(stakematch::ApplyRuntimeOverride(config, "idle_forfeit_seconds", "120"));
  EXPECT_TRUE(stakematch::ApplyRuntimeOverride(config, "min_stake_amount", "500"));
  EXPECT_EQ(config.payout_tax_percent, 12);
  EXPECT_EQ(config.idle_forfeit_seconds, 120u);
  EXPECT_EQ(config.min_stake_amount, 500);
}

TEST(ConfigTest, RuntimeOverrideRejectsBadValues) {
  auto config = stakematch::LoadConfigFromEnv();
  EXPECT_FALSE(stakematch::ApplyRuntimeOverride(config, "payout_tax_percent", "150"));
  EXPECT_FALSE(stakematch::ApplyRuntimeOverride(config, "payout_tax_percent", "abc"));
  EXPECT_FALSE(stakematch::ApplyRuntimeOverride(config, "queue_ttl_seconds", "-1"));
  EXPECT_FALSE(stakematch::ApplyRuntimeOverride(config, "queue_ttl_seconds", "12x"));
  EXPECT_FALSE(stakematch::ApplyRuntimeOverride(config, "unknown_key", "1"));
  EXPECT_EQ(config.payout_tax_percent, 15);
}
