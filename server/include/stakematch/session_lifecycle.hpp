/*
 * 설명: 게임 세션 상태 머신과 지급/환불/취소 정산을 단일 트랜잭션으로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/lifecycle_it_test.cpp, server/tests/unit/payout_math_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "stakematch/activity_store.hpp"
#include "stakematch/db_client.hpp"
#include "stakematch/idle_worker.hpp"
#include "stakematch/ledger.hpp"
#include "stakematch/notification_outbox.hpp"
#include "stakematch/observability.hpp"
#include "stakematch/player_directory.hpp"
#include "stakematch/session_registry.hpp"
#include "stakematch/session_repository.hpp"

namespace stakematch {

constexpr const char* kWinNormal = "normal";
constexpr const char* kWinDraw = "draw";
constexpr const char* kWinForfeitDisconnect = "forfeit_disconnect";
constexpr const char* kWinForfeitIdle = "forfeit_idle";
constexpr const char* kWinConcede = "concede";

std::string ToString(SettlementOutcome outcome);

struct PayoutSplit {
  std::int64_t pot;
  std::int64_t tax;
  std::int64_t net;
};

PayoutSplit ComputePayout(std::int64_t stake_amount, int tax_percent);

struct LifecycleSettings {
  int tax_percent{15};
  std::chrono::seconds idle_warning{45};
  std::chrono::seconds idle_forfeit{90};
};

// 게임 컴포넌트가 보고하는 종료 상태.
struct FinalGameState {
  std::int64_t session_id{0};
  SessionStatus status{SessionStatus::kCompleted};
  std::optional<std::int64_t> winner_id;
  std::string win_type;
  nlohmann::json snapshot = nlohmann::json::object();
};

class SessionLifecycleManager : public IdleSessionGateway {
 public:
  SessionLifecycleManager(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<LedgerService> ledger,
                          std::shared_ptr<SessionRepository> sessions, std::shared_ptr<PlayerDirectory> players,
                          std::shared_ptr<SessionRegistry> registry, std::shared_ptr<NotificationOutbox> outbox,
                          std::shared_ptr<ActivityStore> activity_store, std::shared_ptr<Observability> observability,
                          LifecycleSettings settings);

  void Track(const SessionRecord& record);
  bool MarkStarted(std::int64_t session_id);

  SettlementOutcome ProcessWinnerPayout(std::int64_t session_id, std::int64_t winner_id, std::int64_t stake_amount);
  SettlementOutcome CompleteWithWinner(std::int64_t session_id, std::int64_t winner_id, const std::string& win_type);
  SettlementOutcome CompleteAsDraw(std::int64_t session_id);
  SettlementOutcome CancelExpired(std::int64_t session_id);
  std::size_t SweepExpiredSessions();

  // loser_id의 상대가 승리한다.
  SettlementOutcome Forfeit(std::int64_t session_id, std::int64_t loser_id, const std::string& win_type);
  SettlementOutcome ForfeitByDisconnect(std::int64_t player_id);
  SettlementOutcome ForfeitByConcede(std::int64_t player_id);

  bool UpdateTurn(std::int64_t session_id, std::int64_t player_id);
  bool MarkConnected(std::int64_t player_id);
  bool MarkDisconnected(std::int64_t player_id, std::chrono::system_clock::time_point at);
  std::optional<int> RecordMove(std::int64_t session_id, std::int64_t player_id, const std::string& move_type,
                                const nlohmann::json& payload);
  SettlementOutcome SaveFinalGameState(const FinalGameState& state);
  std::size_t GetActiveGameCount() const;

  std::optional<IdleSessionView> LoadForIdleCheck(std::int64_t session_id) override;
  SettlementOutcome ForfeitIdle(std::int64_t session_id, std::int64_t player_id) override;
  SettlementOutcome ForfeitDisconnected(std::int64_t session_id, std::int64_t player_id) override;
  std::vector<DisconnectedPlayer> DisconnectedBefore(std::chrono::system_clock::time_point cutoff) override;

 private:
  struct Settled {
    SettlementOutcome outcome{SettlementOutcome::kAlreadyProcessed};
    SessionRecord record;
    std::int64_t net{0};
    std::int64_t tax{0};
  };

  Settled SettleWin(std::int64_t session_id, std::optional<std::int64_t> winner_id,
                    std::optional<std::int64_t> loser_id, const std::string& win_type);
  std::int64_t SessionForPlayer(std::int64_t player_id) const;
  void Untrack(const SessionRecord& record, SessionStatus final_status);

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<LedgerService> ledger_;
  std::shared_ptr<SessionRepository> sessions_;
  std::shared_ptr<PlayerDirectory> players_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<NotificationOutbox> outbox_;
  std::shared_ptr<ActivityStore> activity_store_;
  std::shared_ptr<Observability> observability_;
  LifecycleSettings settings_;
};

}  // namespace stakematch
