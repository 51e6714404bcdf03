#include <chrono>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "it_support.hpp"
#include "stakematch/config.hpp"
#include "stakematch/runtime_config.hpp"

namespace {
using stakematch::QueueStatus;
using Clock = std::chrono::system_clock;

class RecoveryItTest : public ittest::StakeFixture {
 protected:
  QueueStatus StatusOf(std::int64_t queue_id) {
    auto entry = queue_repository->Find(queue_id);
    EXPECT_TRUE(entry.has_value());
    return entry ? entry->status : QueueStatus::kCancelled;
  }
};
}  // namespace

TEST_F(RecoveryItTest, StuckClaimIsResetAndMatchable) {
  auto alice = FundedPlayer("alice", 1000);
  auto bob = FundedPlayer("bob", 1000);
  auto entry = pairing->Enqueue(alice, 1000, std::nullopt, false);

  // 워커가 꺼내고 선점한 직후 죽은 상황.
  ASSERT_EQ(operational_queue->PopAndStage(1000, Clock::now() - std::chrono::minutes(2)), entry.id);
  ASSERT_TRUE(queue_repository->ClaimForMatching(entry.id));

  EXPECT_EQ(recovery->SweepStuckProcessing(Clock::now(), std::chrono::seconds(30)), 1u);
  EXPECT_EQ(StatusOf(entry.id), QueueStatus::kQueued);
  EXPECT_EQ(operational_queue->ProcessingCount(1000), 0u);
  EXPECT_EQ(operational_queue->Length(1000), 1u);

  auto result = pairing->JoinQueue(bob, 1000, std::nullopt);
  ASSERT_TRUE(result.matched);
  EXPECT_EQ(result.opponent_player_id, alice);
}

TEST_F(RecoveryItTest, FreshClaimIsLeftAlone) {
  auto alice = FundedPlayer("alice", 1000);
  auto entry = pairing->Enqueue(alice, 1000, std::nullopt, false);
  ASSERT_EQ(operational_queue->PopAndStage(1000, Clock::now()), entry.id);
  ASSERT_TRUE(queue_repository->ClaimForMatching(entry.id));

  EXPECT_EQ(recovery->SweepStuckProcessing(Clock::now(), std::chrono::seconds(30)), 0u);
  EXPECT_EQ(StatusOf(entry.id), QueueStatus::kMatching);
  EXPECT_EQ(operational_queue->ProcessingCount(1000), 1u);
}

TEST_F(RecoveryItTest, OrphanedProcessingEntryReturnsToWaitingList) {
  auto alice = FundedPlayer("alice", 1000);
  auto bob = FundedPlayer("bob", 1000);
  auto entry = pairing->Enqueue(alice, 1000, std::nullopt, false);

  // 꺼낸 뒤 DB 선점 전에 워커가 사라졌다. 행은 queued 그대로다.
  ASSERT_EQ(operational_queue->PopAndStage(1000, Clock::now() - std::chrono::minutes(2)), entry.id);
  EXPECT_EQ(operational_queue->Length(1000), 0u);

  EXPECT_EQ(recovery->SweepStuckProcessing(Clock::now(), std::chrono::seconds(30)), 1u);
  EXPECT_EQ(StatusOf(entry.id), QueueStatus::kQueued);
  EXPECT_EQ(operational_queue->ProcessingCount(1000), 0u);
  EXPECT_EQ(operational_queue->Length(1000), 1u);

  auto result = pairing->JoinQueue(bob, 1000, std::nullopt);
  ASSERT_TRUE(result.matched);
  EXPECT_EQ(result.opponent_player_id, alice);
}

TEST_F(RecoveryItTest, StuckClaimFallsBackToDatabaseClaimTime) {
  auto alice = FundedPlayer("alice", 1000);
  auto entry = queue_repository->Enqueue(alice, 1000, std::chrono::seconds(180), false);
  ASSERT_TRUE(queue_repository->ClaimForMatching(entry.id));
  Sql("UPDATE matchmaking_queue SET claimed_at=DATE_SUB(NOW(6), INTERVAL 5 MINUTE) WHERE id=" +
      std::to_string(entry.id));

  EXPECT_EQ(recovery->SweepStuckProcessing(Clock::now(), std::chrono::seconds(30)), 1u);
  EXPECT_EQ(StatusOf(entry.id), QueueStatus::kQueued);
  EXPECT_EQ(operational_queue->Length(1000), 1u);
}

TEST_F(RecoveryItTest, ExpiredQueueEntryIsRemovedWithoutRefund) {
  auto alice = FundedPlayer("alice", 1000);
  auto transactions = ledger->TransactionCount();
  auto entry = pairing->Enqueue(alice, 1000, std::chrono::seconds(0), false);
  EXPECT_EQ(operational_queue->Length(1000), 1u);

  EXPECT_EQ(recovery->SweepExpiredQueue(), 1u);
  EXPECT_EQ(recovery->SweepExpiredQueue(), 0u);
  EXPECT_EQ(StatusOf(entry.id), QueueStatus::kExpired);
  EXPECT_EQ(operational_queue->Length(1000), 0u);
  EXPECT_EQ(ledger->TransactionCount(), transactions);
  EXPECT_EQ(Funds(alice), 1000);

  // 만료 행은 다시 선점되지 않는다.
  EXPECT_FALSE(queue_repository->ClaimForMatching(entry.id));

  outbox->Drain();
  EXPECT_EQ(sink->Count("queue_expired"), 1u);
}

TEST_F(RecoveryItTest, QueueRehydratesOnlyEmptyStakeLists) {
  auto alice = FundedPlayer("alice", 1000);
  auto bob = FundedPlayer("bob", 1000);
  auto carol = FundedPlayer("carol", 1000);
  auto first = queue_repository->Enqueue(alice, 1000, std::chrono::seconds(180), false);
  auto second = queue_repository->Enqueue(bob, 1000, std::chrono::seconds(180), false);
  queue_repository->Enqueue(carol, 1000, std::chrono::seconds(180), true);

  EXPECT_EQ(recovery->RehydrateQueue(), 2u);
  EXPECT_EQ(operational_queue->Length(1000), 2u);
  EXPECT_EQ(operational_queue->PopAndStage(1000, Clock::now()), first.id);
  operational_queue->ClearProcessing(1000, first.id);
  operational_queue->Requeue(1000, first.id);

  EXPECT_EQ(recovery->RehydrateQueue(), 0u);
  EXPECT_EQ(operational_queue->Length(1000), 2u);
  EXPECT_NE(first.id, second.id);
}

TEST_F(RecoveryItTest, ActiveSessionsRehydrateIntoFreshRegistry) {
  auto alice = FundedPlayer("alice", 1000);
  auto bob = FundedPlayer("bob", 1000);
  auto result = PairTwo(alice, bob, 1000);
  ASSERT_TRUE(result.matched);

  // 재시작한 프로세스를 흉내 낸다.
  auto fresh_registry = std::make_shared<stakematch::SessionRegistry>();
  auto fresh_lifecycle = std::make_shared<stakematch::SessionLifecycleManager>(
      db, ledger, sessions, players, fresh_registry, outbox, activity, observability, stakematch::LifecycleSettings{});
  auto fresh_recovery = std::make_shared<stakematch::RecoveryJobs>(queue_repository, sessions, operational_queue,
                                                                   fresh_lifecycle, outbox, observability);
  EXPECT_EQ(fresh_lifecycle->GetActiveGameCount(), 0u);

  EXPECT_EQ(fresh_recovery->RehydrateSessions(), 1u);
  EXPECT_EQ(fresh_lifecycle->GetActiveGameCount(), 1u);
  EXPECT_EQ(fresh_lifecycle->ForfeitByConcede(alice), stakematch::SettlementOutcome::kApplied);
  EXPECT_EQ(Winnings(bob), 1700);
}

TEST_F(RecoveryItTest, RuntimeConfigSeedsUpdatesAndApplies) {
  stakematch::RuntimeConfigRepository runtime_config(db, observability);
  auto config = stakematch::LoadConfigFromEnv();
  runtime_config.SeedDefaults(config);

  auto entries = runtime_config.ListAll();
  EXPECT_EQ(entries.size(), 7u);

  EXPECT_TRUE(runtime_config.Update("payout_tax_percent", "10", "ops"));
  EXPECT_FALSE(runtime_config.Update("no_such_key", "1", "ops"));
  EXPECT_THROW(runtime_config.Update("queue_ttl_seconds", "abc", "ops"), std::invalid_argument);

  // 기존 값은 다시 시드해도 덮어쓰지 않는다.
  runtime_config.SeedDefaults(config);
  EXPECT_EQ(runtime_config.ApplyTo(config), 7u);
  EXPECT_EQ(config.payout_tax_percent, 10);

  bool found = false;
  for (const auto& entry : runtime_config.ListAll()) {
    if (entry.key == "payout_tax_percent") {
      found = true;
      EXPECT_EQ(entry.value, "10");
      EXPECT_EQ(entry.updated_by, std::optional<std::string>("ops"));
    }
  }
  EXPECT_TRUE(found);
}
