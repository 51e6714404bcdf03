/*
 * 설명: 활동 저장소의 마감 항목을 꺼내 재검증한 뒤 경고 또는 몰수를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/idle_worker_test.cpp
 */
#include "stakematch/idle_worker.hpp"

#include <exception>

namespace stakematch {
namespace {
std::int64_t ToEpochMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}
}  // namespace

IdleWorker::IdleWorker(std::shared_ptr<ActivityStore> activity_store, std::shared_ptr<IdleSessionGateway> gateway,
                       std::shared_ptr<NotificationOutbox> outbox, std::shared_ptr<Observability> observability,
                       IdleSettings settings)
    : activity_store_(std::move(activity_store)), gateway_(std::move(gateway)), outbox_(std::move(outbox)),
      observability_(std::move(observability)), settings_(settings) {}

std::optional<IdleSessionView> IdleWorker::StillIdle(const ActivityKey& key, std::chrono::system_clock::time_point now,
                                                     std::chrono::seconds threshold,
                                                     std::optional<std::chrono::system_clock::time_point>& last_active) {
  last_active = activity_store_->LastActive(key);
  if (!last_active || now - *last_active < threshold) {
    return std::nullopt;
  }
  auto view = gateway_->LoadForIdleCheck(key.session_id);
  if (!view || view->status != SessionStatus::kInProgress) {
    return std::nullopt;
  }
  if (!view->current_turn_player_id || *view->current_turn_player_id != key.player_id) {
    return std::nullopt;
  }
  return view;
}

IdlePollResult IdleWorker::PollOnce(std::chrono::system_clock::time_point now) {
  IdlePollResult result;
  for (const auto& key : activity_store_->PopDueWarnings(now)) {
    try {
      std::optional<std::chrono::system_clock::time_point> last_active;
      auto view = StillIdle(key, now, settings_.warning, last_active);
      if (!view) {
        continue;
      }
      auto forfeit_at = *last_active + settings_.forfeit;
      outbox_->Enqueue(OutboundEvent{"player_idle_warning",
                                     {view->player1_id, view->player2_id},
                                     {{"sessionId", key.session_id},
                                      {"playerId", key.player_id},
                                      {"forfeitAt", ToEpochMillis(forfeit_at)}}});
      ++result.warnings;
    } catch (const std::exception& ex) {
      observability_->Error("idle.warning_failed",
                            {{"sessionId", key.session_id}, {"playerId", key.player_id}, {"error", ex.what()}});
    }
  }

  for (const auto& key : activity_store_->PopDueForfeits(now)) {
    try {
      std::optional<std::chrono::system_clock::time_point> last_active;
      auto view = StillIdle(key, now, settings_.forfeit, last_active);
      if (!view) {
        continue;
      }
      if (gateway_->ForfeitIdle(key.session_id, key.player_id) != SettlementOutcome::kApplied) {
        observability_->Debug("idle.forfeit_skipped", {{"sessionId", key.session_id}, {"playerId", key.player_id}});
        continue;
      }
      outbox_->Enqueue(OutboundEvent{"player_forfeit",
                                     {view->player1_id, view->player2_id},
                                     {{"sessionId", key.session_id},
                                      {"playerId", key.player_id},
                                      {"reason", "forfeit_idle"}}});
      ++result.forfeits;
    } catch (const std::exception& ex) {
      observability_->Error("idle.forfeit_failed",
                            {{"sessionId", key.session_id}, {"playerId", key.player_id}, {"error", ex.what()}});
    }
  }
  return result;
}

std::size_t IdleWorker::DisconnectSweep(std::chrono::system_clock::time_point now) {
  std::size_t forfeited = 0;
  for (const auto& entry : gateway_->DisconnectedBefore(now - settings_.disconnect_grace)) {
    try {
      if (gateway_->ForfeitDisconnected(entry.session_id, entry.player_id) == SettlementOutcome::kApplied) {
        ++forfeited;
      }
    } catch (const std::exception& ex) {
      observability_->Error("disconnect.forfeit_failed",
                            {{"sessionId", entry.session_id}, {"playerId", entry.player_id}, {"error", ex.what()}});
    }
  }
  return forfeited;
}

}  // namespace stakematch
