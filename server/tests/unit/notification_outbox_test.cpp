#include <memory>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "stakematch/notification_outbox.hpp"

namespace {
struct Delivered {
  std::int64_t player_id;
  std::string type;
  nlohmann::json payload;
};

class RecordingSink : public stakematch::NotificationSink {
 public:
  void Deliver(std::int64_t player_id, const std::string& type, const nlohmann::json& payload) override {
    if (player_id == fail_for) {
      throw std::runtime_error("연결 없음");
    }
    delivered.push_back(Delivered{player_id, type, payload});
  }

  std::int64_t fail_for{-1};
  std::vector<Delivered> delivered;
};
}  // namespace

TEST(NotificationOutboxTest, DrainDeliversToEveryRecipientInOrder) {
  auto sink = std::make_shared<RecordingSink>();
  stakematch::NotificationOutbox outbox(sink, std::make_shared<stakematch::Observability>());
  outbox.Enqueue({"match_found", {1, 2}, {{"sessionId", 5}}});
  outbox.Enqueue({"game_over", {2}, {{"sessionId", 5}}});
  EXPECT_EQ(outbox.Pending(), 2u);

  EXPECT_EQ(outbox.Drain(), 2u);
  EXPECT_EQ(outbox.Pending(), 0u);
  ASSERT_EQ(sink->delivered.size(), 3u);
  EXPECT_EQ(sink->delivered[0].player_id, 1);
  EXPECT_EQ(sink->delivered[1].player_id, 2);
  EXPECT_EQ(sink->delivered[2].type, "game_over");
  EXPECT_EQ(sink->delivered[2].payload["sessionId"], 5);
}

TEST(NotificationOutboxTest, DrainRespectsBatchLimit) {
  auto sink = std::make_shared<RecordingSink>();
  stakematch::NotificationOutbox outbox(sink, std::make_shared<stakematch::Observability>());
  for (int i = 0; i < 5; ++i) {
    outbox.Enqueue({"queue_expired", {i}, nlohmann::json::object()});
  }
  EXPECT_EQ(outbox.Drain(3), 3u);
  EXPECT_EQ(outbox.Pending(), 2u);
  EXPECT_EQ(outbox.Drain(3), 2u);
}

TEST(NotificationOutboxTest, SinkFailureDoesNotBlockOtherRecipients) {
  auto sink = std::make_shared<RecordingSink>();
  sink->fail_for = 1;
  stakematch::NotificationOutbox outbox(sink, std::make_shared<stakematch::Observability>(stakematch::LogLevel::kError));
  outbox.Enqueue({"game_draw", {1, 2}, nlohmann::json::object()});
  EXPECT_EQ(outbox.Drain(), 1u);
  ASSERT_EQ(sink->delivered.size(), 1u);
  EXPECT_EQ(sink->delivered[0].player_id, 2);
  EXPECT_EQ(outbox.Pending(), 0u);
}
