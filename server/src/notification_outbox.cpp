/*
 * 설명: 알림 이벤트 적재와 최선 노력 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/notification_outbox_test.cpp
 */
#include "stakematch/notification_outbox.hpp"

namespace stakematch {

void LoggingNotificationSink::Deliver(std::int64_t player_id, const std::string& type, const nlohmann::json& payload) {
  if (observability_) {
    observability_->Info("notification.delivered", {{"playerId", player_id}, {"type", type}, {"payload", payload}});
  }
}

NotificationOutbox::NotificationOutbox(std::shared_ptr<NotificationSink> sink,
                                       std::shared_ptr<Observability> observability)
    : sink_(std::move(sink)), observability_(std::move(observability)) {}

void NotificationOutbox::Enqueue(OutboundEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.push_back(std::move(event));
}

std::size_t NotificationOutbox::Drain(std::size_t max_events) {
  std::deque<OutboundEvent> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!pending_.empty() && batch.size() < max_events) {
      batch.push_back(std::move(pending_.front()));
      pending_.pop_front();
    }
  }
  for (const auto& event : batch) {
    for (std::int64_t player_id : event.player_ids) {
      try {
        sink_->Deliver(player_id, event.type, event.payload);
      } catch (const std::exception& ex) {
        // 전달 실패는 재시도하지 않는다. 상태 원본은 DB에 있다.
        if (observability_) {
          observability_->Warn("notification.failed",
                               {{"playerId", player_id}, {"type", event.type}, {"error", ex.what()}});
        }
      }
    }
  }
  return batch.size();
}

std::size_t NotificationOutbox::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

}  // namespace stakematch
