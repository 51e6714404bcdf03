#include <chrono>

#include <gtest/gtest.h>

#include "stakematch/session_registry.hpp"

namespace {
stakematch::LiveSession MakeSession(std::int64_t id, std::int64_t p1, std::int64_t p2,
                                    stakematch::SessionStatus status = stakematch::SessionStatus::kInProgress) {
  stakematch::LiveSession session;
  session.session_id = id;
  session.token = "tok-" + std::to_string(id);
  session.player1_id = p1;
  session.player2_id = p2;
  session.stake_amount = 1000;
  session.status = status;
  return session;
}
}  // namespace

TEST(SessionRegistryTest, IndexesBySessionAndPlayer) {
  stakematch::SessionRegistry registry;
  auto handle = registry.Register(MakeSession(10, 1, 2));

  auto by_session = registry.FindBySession(10);
  auto by_player = registry.FindByPlayer(2);
  ASSERT_TRUE(by_session.has_value());
  ASSERT_TRUE(by_player.has_value());
  EXPECT_EQ(by_session->index, handle.index);
  EXPECT_EQ(by_player->index, handle.index);

  auto live = registry.Get(handle);
  ASSERT_TRUE(live.has_value());
  EXPECT_TRUE(live->HasPlayer(1));
  EXPECT_EQ(live->OpponentOf(1), 2);
  EXPECT_EQ(live->OpponentOf(2), 1);
}

TEST(SessionRegistryTest, StaleHandleIsRejectedAfterRelease) {
  stakematch::SessionRegistry registry;
  auto old_handle = registry.Register(MakeSession(10, 1, 2));
  ASSERT_TRUE(registry.Release(old_handle));
  EXPECT_FALSE(registry.Release(old_handle));
  EXPECT_FALSE(registry.FindBySession(10).has_value());
  EXPECT_FALSE(registry.FindByPlayer(1).has_value());

  // 같은 슬롯이 재사용돼도 이전 세대 핸들은 새 세션에 닿지 못한다.
  auto new_handle = registry.Register(MakeSession(11, 3, 4));
  EXPECT_EQ(new_handle.index, old_handle.index);
  EXPECT_NE(new_handle.generation, old_handle.generation);
  EXPECT_FALSE(registry.Get(old_handle).has_value());
  EXPECT_FALSE(registry.Update(old_handle, [](stakematch::LiveSession& s) { s.current_turn_player_id = 3; }));
  ASSERT_TRUE(registry.Get(new_handle).has_value());
  EXPECT_EQ(registry.Get(new_handle)->session_id, 11);
}

TEST(SessionRegistryTest, RegisterReplacesSameSession) {
  stakematch::SessionRegistry registry;
  registry.Register(MakeSession(10, 1, 2, stakematch::SessionStatus::kWaiting));
  auto handle = registry.Register(MakeSession(10, 1, 2, stakematch::SessionStatus::kInProgress));
  EXPECT_EQ(registry.ActiveCount(), 1u);
  EXPECT_EQ(registry.Get(handle)->status, stakematch::SessionStatus::kInProgress);
}

TEST(SessionRegistryTest, UpdateMutatesInPlace) {
  stakematch::SessionRegistry registry;
  auto handle = registry.Register(MakeSession(10, 1, 2));
  EXPECT_TRUE(registry.Update(handle, [](stakematch::LiveSession& s) { s.current_turn_player_id = 2; }));
  EXPECT_EQ(registry.Get(handle)->current_turn_player_id, 2);
}

TEST(SessionRegistryTest, DisconnectKeepsFirstTimestampAndOnlyInProgressCounts) {
  stakematch::SessionRegistry registry;
  registry.Register(MakeSession(10, 1, 2));
  registry.Register(MakeSession(11, 3, 4, stakematch::SessionStatus::kWaiting));
  auto t0 = std::chrono::system_clock::now();

  EXPECT_TRUE(registry.MarkDisconnected(1, t0));
  EXPECT_TRUE(registry.MarkDisconnected(1, t0 + std::chrono::seconds(50)));
  EXPECT_TRUE(registry.MarkDisconnected(3, t0));
  EXPECT_FALSE(registry.MarkDisconnected(99, t0));

  auto stale = registry.DisconnectedBefore(t0 + std::chrono::seconds(10));
  ASSERT_EQ(stale.size(), 1u);
  EXPECT_EQ(stale[0].session_id, 10);
  EXPECT_EQ(stale[0].player_id, 1);
  EXPECT_EQ(stale[0].since, t0);

  EXPECT_TRUE(registry.MarkConnected(1));
  EXPECT_TRUE(registry.DisconnectedBefore(t0 + std::chrono::seconds(10)).empty());
}

TEST(SessionRegistryTest, ActiveCountIgnoresTerminalSessions) {
  stakematch::SessionRegistry registry;
  registry.Register(MakeSession(10, 1, 2));
  registry.Register(MakeSession(11, 3, 4, stakematch::SessionStatus::kWaiting));
  registry.Register(MakeSession(12, 5, 6, stakematch::SessionStatus::kCompleted));
  EXPECT_EQ(registry.ActiveCount(), 2u);
}

TEST(SessionRegistryTest, StatusTextRoundTripsAndRejectsUnknown) {
  EXPECT_EQ(stakematch::ToString(stakematch::SessionStatus::kInProgress), "IN_PROGRESS");
  EXPECT_EQ(stakematch::ParseSessionStatus("CANCELLED"), stakematch::SessionStatus::kCancelled);
  EXPECT_THROW(stakematch::ParseSessionStatus("DONE"), std::invalid_argument);
}
