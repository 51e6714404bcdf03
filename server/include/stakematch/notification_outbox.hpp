/*
 * 설명: 커밋 이후 발생한 외부 알림 이벤트를 적재하고 notifier가 싱크로 비운다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/notification_outbox_test.cpp
 */
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "stakematch/observability.hpp"

namespace stakematch {

struct OutboundEvent {
  std::string type;
  std::vector<std::int64_t> player_ids;
  nlohmann::json payload;
};

class NotificationSink {
 public:
  virtual ~NotificationSink() = default;
  virtual void Deliver(std::int64_t player_id, const std::string& type, const nlohmann::json& payload) = 0;
};

// 기본 싱크. 전달 대신 구조화 로그로 남긴다.
class LoggingNotificationSink : public NotificationSink {
 public:
  explicit LoggingNotificationSink(std::shared_ptr<Observability> observability)
      : observability_(std::move(observability)) {}
  void Deliver(std::int64_t player_id, const std::string& type, const nlohmann::json& payload) override;

 private:
  std::shared_ptr<Observability> observability_;
};

class NotificationOutbox {
 public:
  NotificationOutbox(std::shared_ptr<NotificationSink> sink, std::shared_ptr<Observability> observability);

  void Enqueue(OutboundEvent event);
  // 적재된 이벤트를 최대 max_events개까지 전달하고 전달한 이벤트 수를 돌려준다.
  std::size_t Drain(std::size_t max_events = 256);
  std::size_t Pending() const;

 private:
  std::shared_ptr<NotificationSink> sink_;
  std::shared_ptr<Observability> observability_;
  std::deque<OutboundEvent> pending_;
  mutable std::mutex mutex_;
};

}  // namespace stakematch
