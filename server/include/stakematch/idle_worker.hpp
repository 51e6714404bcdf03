/*
 * 설명: 턴 무응답 경고/몰수와 연결 끊김 몰수를 주기적으로 판정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/idle_worker_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "stakematch/activity_store.hpp"
#include "stakematch/notification_outbox.hpp"
#include "stakematch/observability.hpp"
#include "stakematch/session_registry.hpp"

namespace stakematch {

// 정산 호출 결과. 이미 끝난 세션이면 kAlreadyProcessed로 아무것도 옮기지 않는다.
enum class SettlementOutcome { kApplied, kAlreadyProcessed };

struct IdleSessionView {
  SessionStatus status{SessionStatus::kWaiting};
  std::optional<std::int64_t> current_turn_player_id;
  std::int64_t player1_id{0};
  std::int64_t player2_id{0};
};

// 워커가 세션 원본을 확인하고 몰수를 위임하는 경계.
class IdleSessionGateway {
 public:
  virtual ~IdleSessionGateway() = default;
  virtual std::optional<IdleSessionView> LoadForIdleCheck(std::int64_t session_id) = 0;
  virtual SettlementOutcome ForfeitIdle(std::int64_t session_id, std::int64_t player_id) = 0;
  virtual SettlementOutcome ForfeitDisconnected(std::int64_t session_id, std::int64_t player_id) = 0;
  virtual std::vector<DisconnectedPlayer> DisconnectedBefore(std::chrono::system_clock::time_point cutoff) = 0;
};

struct IdleSettings {
  std::chrono::seconds warning{45};
  std::chrono::seconds forfeit{90};
  std::chrono::seconds disconnect_grace{120};
};

struct IdlePollResult {
  std::size_t warnings{0};
  std::size_t forfeits{0};
};

class IdleWorker {
 public:
  IdleWorker(std::shared_ptr<ActivityStore> activity_store, std::shared_ptr<IdleSessionGateway> gateway,
             std::shared_ptr<NotificationOutbox> outbox, std::shared_ptr<Observability> observability,
             IdleSettings settings);

  IdlePollResult PollOnce(std::chrono::system_clock::time_point now);
  std::size_t DisconnectSweep(std::chrono::system_clock::time_point now);

 private:
  // 마지막 활동이 threshold보다 오래됐고 여전히 해당 플레이어 턴인 진행 중 세션인지 확인한다.
  std::optional<IdleSessionView> StillIdle(const ActivityKey& key, std::chrono::system_clock::time_point now,
                                           std::chrono::seconds threshold,
                                           std::optional<std::chrono::system_clock::time_point>& last_active);

  std::shared_ptr<ActivityStore> activity_store_;
  std::shared_ptr<IdleSessionGateway> gateway_;
  std::shared_ptr<NotificationOutbox> outbox_;
  std::shared_ptr<Observability> observability_;
  IdleSettings settings_;
};

}  // namespace stakematch
