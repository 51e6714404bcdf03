#include <stdexcept>

#include <gtest/gtest.h>

#include "stakematch/session_lifecycle.hpp"

TEST(PayoutMathTest, DefaultTaxSplitsPot) {
  auto split = stakematch::ComputePayout(1000, 15);
  EXPECT_EQ(split.pot, 2000);
  EXPECT_EQ(split.tax, 300);
  EXPECT_EQ(split.net, 1700);
}

TEST(PayoutMathTest, TaxRoundsDownInMinorUnits) {
  auto split = stakematch::ComputePayout(333, 15);
  EXPECT_EQ(split.pot, 666);
  EXPECT_EQ(split.tax, 99);
  EXPECT_EQ(split.net, 567);
  EXPECT_EQ(split.tax + split.net, split.pot);
}

TEST(PayoutMathTest, BoundaryRates) {
  EXPECT_EQ(stakematch::ComputePayout(500, 0).net, 1000);
  EXPECT_EQ(stakematch::ComputePayout(500, 0).tax, 0);
  EXPECT_EQ(stakematch::ComputePayout(500, 100).net, 0);
}

TEST(PayoutMathTest, RejectsInvalidInput) {
  EXPECT_THROW(stakematch::ComputePayout(0, 15), std::invalid_argument);
  EXPECT_THROW(stakematch::ComputePayout(-5, 15), std::invalid_argument);
  EXPECT_THROW(stakematch::ComputePayout(1000, 101), std::invalid_argument);
  EXPECT_THROW(stakematch::ComputePayout(1000, -1), std::invalid_argument);
}

TEST(PayoutMathTest, OutcomeText) {
  EXPECT_EQ(stakematch::ToString(stakematch::SettlementOutcome::kApplied), "applied");
  EXPECT_EQ(stakematch::ToString(stakematch::SettlementOutcome::kAlreadyProcessed), "already_processed");
}
