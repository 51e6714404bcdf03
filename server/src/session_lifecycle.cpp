/*
 * 설명: 세션 시작/완료/무승부/취소/몰수 전이와 원장 정산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/lifecycle_it_test.cpp, server/tests/unit/payout_math_test.cpp
 */
#include "stakematch/session_lifecycle.hpp"

#include <stdexcept>

#include "stakematch/errors.hpp"

namespace stakematch {
namespace {
bool IsParticipant(const SessionRecord& record, std::int64_t player_id) {
  return player_id == record.player1_id || player_id == record.player2_id;
}

std::int64_t OpponentOf(const SessionRecord& record, std::int64_t player_id) {
  return player_id == record.player1_id ? record.player2_id : record.player1_id;
}

LiveSession ToLiveSession(const SessionRecord& record) {
  LiveSession live;
  live.session_id = record.id;
  live.token = record.token;
  live.player1_id = record.player1_id;
  live.player2_id = record.player2_id;
  live.stake_amount = record.stake_amount;
  live.status = record.status;
  live.current_turn_player_id = record.current_turn_player_id;
  live.expiry_time = record.expiry_time;
  return live;
}
}  // namespace

std::string ToString(SettlementOutcome outcome) {
  return outcome == SettlementOutcome::kApplied ? "applied" : "already_processed";
}

PayoutSplit ComputePayout(std::int64_t stake_amount, int tax_percent) {
  if (stake_amount <= 0) {
    throw std::invalid_argument("스테이크 금액은 양수여야 합니다");
  }
  if (tax_percent < 0 || tax_percent > 100) {
    throw std::invalid_argument("세율은 0~100 사이여야 합니다");
  }
  std::int64_t pot = stake_amount * 2;
  std::int64_t tax = pot * tax_percent / 100;
  return PayoutSplit{pot, tax, pot - tax};
}

SessionLifecycleManager::SessionLifecycleManager(std::shared_ptr<MariaDbClient> db_client,
                                                 std::shared_ptr<LedgerService> ledger,
                                                 std::shared_ptr<SessionRepository> sessions,
                                                 std::shared_ptr<PlayerDirectory> players,
                                                 std::shared_ptr<SessionRegistry> registry,
                                                 std::shared_ptr<NotificationOutbox> outbox,
                                                 std::shared_ptr<ActivityStore> activity_store,
                                                 std::shared_ptr<Observability> observability,
                                                 LifecycleSettings settings)
    : db_client_(std::move(db_client)), ledger_(std::move(ledger)), sessions_(std::move(sessions)),
      players_(std::move(players)), registry_(std::move(registry)), outbox_(std::move(outbox)),
      activity_store_(std::move(activity_store)), observability_(std::move(observability)), settings_(settings) {}

void SessionLifecycleManager::Track(const SessionRecord& record) { registry_->Register(ToLiveSession(record)); }

void SessionLifecycleManager::Untrack(const SessionRecord& record, SessionStatus final_status) {
  if (auto handle = registry_->FindBySession(record.id)) {
    registry_->Update(*handle, [final_status](LiveSession& live) { live.status = final_status; });
    registry_->Release(*handle);
  }
  activity_store_->Clear(ActivityKey{record.id, record.player1_id});
  activity_store_->Clear(ActivityKey{record.id, record.player2_id});
}

bool SessionLifecycleManager::MarkStarted(std::int64_t session_id) {
  if (!sessions_->MarkStarted(session_id)) {
    return false;
  }
  auto record = sessions_->Find(session_id);
  if (!record) {
    return false;
  }
  auto handle = registry_->FindBySession(session_id);
  if (handle) {
    registry_->Update(*handle, [](LiveSession& live) { live.status = SessionStatus::kInProgress; });
  } else {
    Track(*record);
  }
  auto now = std::chrono::system_clock::now();
  for (std::int64_t player_id : {record->player1_id, record->player2_id}) {
    activity_store_->Touch(ActivityKey{session_id, player_id}, now, settings_.idle_warning, settings_.idle_forfeit);
  }
  observability_->Info("session.started", {{"sessionId", session_id}});
  return true;
}

SessionLifecycleManager::Settled SessionLifecycleManager::SettleWin(std::int64_t session_id,
                                                                    std::optional<std::int64_t> winner_id,
                                                                    std::optional<std::int64_t> loser_id,
                                                                    const std::string& win_type) {
  Settled settled;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    settled = Settled{};
    auto record = sessions_->LockSessionInTx(conn, session_id);
    if (!record) {
      throw EntityNotFoundError("세션을 찾을 수 없습니다: " + std::to_string(session_id));
    }
    settled.record = *record;
    if (loser_id && !IsParticipant(*record, *loser_id)) {
      throw ServiceError("not_participant", "세션 참가자가 아닙니다");
    }
    std::int64_t winner = winner_id ? *winner_id : OpponentOf(*record, *loser_id);
    if (!IsParticipant(*record, winner)) {
      throw ServiceError("not_participant", "승자가 세션 참가자가 아닙니다");
    }
    if (record->status == SessionStatus::kCompleted ||
        sessions_->EscrowRowExistsInTx(conn, session_id, EscrowEntryType::kPayout)) {
      return false;
    }
    if (record->status == SessionStatus::kCancelled) {
      throw ServiceError("session_closed", "취소된 세션입니다");
    }

    auto split = ComputePayout(record->stake_amount, settings_.tax_percent);
    auto escrow = ledger_->GetOrCreateAccountInTx(conn, AccountType::kEscrow, std::nullopt);
    auto tax = ledger_->GetOrCreateAccountInTx(conn, AccountType::kTax, std::nullopt);
    auto winnings = ledger_->GetOrCreateAccountInTx(conn, AccountType::kPlayerWinnings, winner);
    if (split.tax > 0) {
      ledger_->Transfer(conn, escrow.id, tax.id, split.tax, kRefSession, session_id, "Payout tax");
    }
    if (split.net > 0) {
      ledger_->Transfer(conn, escrow.id, winnings.id, split.net, kRefSession, session_id, "Winner payout (after tax)");
    }
    sessions_->InsertEscrowRowInTx(conn, session_id, std::nullopt, EscrowEntryType::kPayout, winner, split.net,
                                   "Winner payout");

    players_->AddGamePlayedInTx(conn, record->player1_id);
    players_->AddGamePlayedInTx(conn, record->player2_id);
    players_->AddWinInTx(conn, winner, split.net);

    if (win_type != kWinNormal) {
      std::int64_t loser = OpponentOf(*record, winner);
      std::string move_type = win_type == kWinConcede ? "CONCEDE" : "FORFEIT";
      sessions_->InsertMoveInTx(conn, session_id, loser, move_type, {{"winType", win_type}});
    }
    sessions_->CompleteInTx(conn, session_id, winner, win_type);

    settled.outcome = SettlementOutcome::kApplied;
    settled.record.status = SessionStatus::kCompleted;
    settled.record.winner_id = winner;
    settled.record.win_type = win_type;
    settled.net = split.net;
    settled.tax = split.tax;
    return true;
  });

  if (settled.outcome == SettlementOutcome::kAlreadyProcessed) {
    observability_->Info("settlement.already_processed", {{"sessionId", session_id}, {"kind", "payout"}});
    return settled;
  }

  Untrack(settled.record, SessionStatus::kCompleted);
  observability_->IncrementPayout();
  if (win_type != kWinNormal) {
    observability_->IncrementForfeit();
  }
  observability_->Info("session.completed", {{"sessionId", session_id},
                                             {"winnerId", *settled.record.winner_id},
                                             {"winType", win_type},
                                             {"net", settled.net},
                                             {"tax", settled.tax}});
  outbox_->Enqueue(OutboundEvent{"game_over",
                                 {settled.record.player1_id, settled.record.player2_id},
                                 {{"sessionId", session_id},
                                  {"winnerId", *settled.record.winner_id},
                                  {"winType", win_type},
                                  {"payout", settled.net}}});
  return settled;
}

SettlementOutcome SessionLifecycleManager::ProcessWinnerPayout(std::int64_t session_id, std::int64_t winner_id,
                                                               std::int64_t stake_amount) {
  auto record = sessions_->Find(session_id);
  if (!record) {
    throw EntityNotFoundError("세션을 찾을 수 없습니다: " + std::to_string(session_id));
  }
  if (record->stake_amount != stake_amount) {
    throw std::invalid_argument("세션 스테이크와 지급 요청 금액이 다릅니다");
  }
  return CompleteWithWinner(session_id, winner_id, kWinNormal);
}

SettlementOutcome SessionLifecycleManager::CompleteWithWinner(std::int64_t session_id, std::int64_t winner_id,
                                                              const std::string& win_type) {
  return SettleWin(session_id, winner_id, std::nullopt, win_type).outcome;
}

SettlementOutcome SessionLifecycleManager::CompleteAsDraw(std::int64_t session_id) {
  SettlementOutcome outcome = SettlementOutcome::kAlreadyProcessed;
  SessionRecord settled_record;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    outcome = SettlementOutcome::kAlreadyProcessed;
    auto record = sessions_->LockSessionInTx(conn, session_id);
    if (!record) {
      throw EntityNotFoundError("세션을 찾을 수 없습니다: " + std::to_string(session_id));
    }
    if (record->status == SessionStatus::kCompleted ||
        sessions_->EscrowRowExistsInTx(conn, session_id, EscrowEntryType::kDrawRefund)) {
      return false;
    }
    if (record->status == SessionStatus::kCancelled) {
      throw ServiceError("session_closed", "취소된 세션입니다");
    }
    auto escrow = ledger_->GetOrCreateAccountInTx(conn, AccountType::kEscrow, std::nullopt);
    for (std::int64_t player_id : {record->player1_id, record->player2_id}) {
      auto funds = ledger_->GetOrCreateAccountInTx(conn, AccountType::kPlayerFunds, player_id);
      ledger_->Transfer(conn, escrow.id, funds.id, record->stake_amount, kRefSession, session_id, "DRAW_REFUND");
      sessions_->InsertEscrowRowInTx(conn, session_id, std::nullopt, EscrowEntryType::kDrawRefund, player_id,
                                     record->stake_amount, "Draw refund to player");
      players_->AddGamePlayedInTx(conn, player_id);
      players_->AddDrawInTx(conn, player_id);
    }
    sessions_->CompleteInTx(conn, session_id, std::nullopt, kWinDraw);
    settled_record = *record;
    outcome = SettlementOutcome::kApplied;
    return true;
  });

  if (outcome == SettlementOutcome::kAlreadyProcessed) {
    observability_->Info("settlement.already_processed", {{"sessionId", session_id}, {"kind", "draw_refund"}});
    return outcome;
  }
  Untrack(settled_record, SessionStatus::kCompleted);
  observability_->IncrementRefund();
  observability_->Info("session.draw", {{"sessionId", session_id}, {"refund", settled_record.stake_amount}});
  outbox_->Enqueue(OutboundEvent{"game_draw",
                                 {settled_record.player1_id, settled_record.player2_id},
                                 {{"sessionId", session_id}, {"refund", settled_record.stake_amount}}});
  return outcome;
}

SettlementOutcome SessionLifecycleManager::CancelExpired(std::int64_t session_id) {
  SettlementOutcome outcome = SettlementOutcome::kAlreadyProcessed;
  SessionRecord settled_record;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    outcome = SettlementOutcome::kAlreadyProcessed;
    auto record = sessions_->LockSessionInTx(conn, session_id);
    if (!record) {
      throw EntityNotFoundError("세션을 찾을 수 없습니다: " + std::to_string(session_id));
    }
    if (record->status != SessionStatus::kWaiting ||
        sessions_->EscrowRowExistsInTx(conn, session_id, EscrowEntryType::kSessionCancel)) {
      return false;
    }
    auto escrow = ledger_->GetOrCreateAccountInTx(conn, AccountType::kEscrow, std::nullopt);
    for (std::int64_t player_id : {record->player1_id, record->player2_id}) {
      auto funds = ledger_->GetOrCreateAccountInTx(conn, AccountType::kPlayerFunds, player_id);
      ledger_->Transfer(conn, escrow.id, funds.id, record->stake_amount, kRefSession, session_id, "SESSION_CANCEL");
      sessions_->InsertEscrowRowInTx(conn, session_id, std::nullopt, EscrowEntryType::kSessionCancel, player_id,
                                     record->stake_amount, "Session expired - refund to player");
    }
    sessions_->CancelInTx(conn, session_id);
    settled_record = *record;
    outcome = SettlementOutcome::kApplied;
    return true;
  });

  if (outcome == SettlementOutcome::kAlreadyProcessed) {
    observability_->Info("settlement.already_processed", {{"sessionId", session_id}, {"kind", "session_cancel"}});
    return outcome;
  }
  Untrack(settled_record, SessionStatus::kCancelled);
  observability_->IncrementRefund();
  observability_->Info("session.cancelled", {{"sessionId", session_id}, {"refund", settled_record.stake_amount}});
  outbox_->Enqueue(OutboundEvent{"session_cancelled",
                                 {settled_record.player1_id, settled_record.player2_id},
                                 {{"sessionId", session_id}, {"reason", "expired"}}});
  return outcome;
}

std::size_t SessionLifecycleManager::SweepExpiredSessions() {
  std::size_t cancelled = 0;
  for (std::int64_t session_id : sessions_->ListExpiredWaiting()) {
    try {
      if (CancelExpired(session_id) == SettlementOutcome::kApplied) {
        ++cancelled;
      }
    } catch (const std::exception& ex) {
      observability_->Error("session.cancel_failed", {{"sessionId", session_id}, {"error", ex.what()}});
    }
  }
  return cancelled;
}

SettlementOutcome SessionLifecycleManager::Forfeit(std::int64_t session_id, std::int64_t loser_id,
                                                   const std::string& win_type) {
  return SettleWin(session_id, std::nullopt, loser_id, win_type).outcome;
}

std::int64_t SessionLifecycleManager::SessionForPlayer(std::int64_t player_id) const {
  auto handle = registry_->FindByPlayer(player_id);
  std::optional<LiveSession> live;
  if (handle) {
    live = registry_->Get(*handle);
  }
  if (!live) {
    throw EntityNotFoundError("진행 중 세션이 없습니다: player=" + std::to_string(player_id));
  }
  return live->session_id;
}

SettlementOutcome SessionLifecycleManager::ForfeitByDisconnect(std::int64_t player_id) {
  return Forfeit(SessionForPlayer(player_id), player_id, kWinForfeitDisconnect);
}

SettlementOutcome SessionLifecycleManager::ForfeitByConcede(std::int64_t player_id) {
  return Forfeit(SessionForPlayer(player_id), player_id, kWinConcede);
}

bool SessionLifecycleManager::UpdateTurn(std::int64_t session_id, std::int64_t player_id) {
  if (!sessions_->UpdateTurn(session_id, player_id)) {
    return false;
  }
  if (auto handle = registry_->FindBySession(session_id)) {
    registry_->Update(*handle, [player_id](LiveSession& live) { live.current_turn_player_id = player_id; });
  }
  activity_store_->Touch(ActivityKey{session_id, player_id}, std::chrono::system_clock::now(), settings_.idle_warning,
                         settings_.idle_forfeit);
  return true;
}

bool SessionLifecycleManager::MarkConnected(std::int64_t player_id) { return registry_->MarkConnected(player_id); }

bool SessionLifecycleManager::MarkDisconnected(std::int64_t player_id, std::chrono::system_clock::time_point at) {
  return registry_->MarkDisconnected(player_id, at);
}

std::optional<int> SessionLifecycleManager::RecordMove(std::int64_t session_id, std::int64_t player_id,
                                                       const std::string& move_type, const nlohmann::json& payload) {
  activity_store_->Touch(ActivityKey{session_id, player_id}, std::chrono::system_clock::now(), settings_.idle_warning,
                         settings_.idle_forfeit);
  try {
    return sessions_->InsertMove(session_id, player_id, move_type, payload);
  } catch (const std::exception& ex) {
    // 수 기록은 감사용이라 실패해도 게임 진행을 막지 않는다.
    observability_->Warn("move.record_failed",
                         {{"sessionId", session_id}, {"playerId", player_id}, {"error", ex.what()}});
    return std::nullopt;
  }
}

SettlementOutcome SessionLifecycleManager::SaveFinalGameState(const FinalGameState& state) {
  try {
    sessions_->InsertGameState(state.session_id, state.snapshot);
  } catch (const std::exception& ex) {
    observability_->Warn("session.state_save_failed", {{"sessionId", state.session_id}, {"error", ex.what()}});
  }

  switch (state.status) {
    case SessionStatus::kCompleted:
      if (state.win_type == kWinDraw) {
        return CompleteAsDraw(state.session_id);
      }
      if (!state.winner_id) {
        throw std::invalid_argument("완료 상태에는 승자 또는 무승부가 필요합니다");
      }
      return CompleteWithWinner(state.session_id, *state.winner_id,
                                state.win_type.empty() ? std::string(kWinNormal) : state.win_type);
    case SessionStatus::kInProgress:
      return MarkStarted(state.session_id) ? SettlementOutcome::kApplied : SettlementOutcome::kAlreadyProcessed;
    default:
      throw std::invalid_argument("지원하지 않는 최종 상태: " + ToString(state.status));
  }
}

std::size_t SessionLifecycleManager::GetActiveGameCount() const { return registry_->ActiveCount(); }

std::optional<IdleSessionView> SessionLifecycleManager::LoadForIdleCheck(std::int64_t session_id) {
  auto record = sessions_->Find(session_id);
  if (!record) {
    return std::nullopt;
  }
  return IdleSessionView{record->status, record->current_turn_player_id, record->player1_id, record->player2_id};
}

SettlementOutcome SessionLifecycleManager::ForfeitIdle(std::int64_t session_id, std::int64_t player_id) {
  return Forfeit(session_id, player_id, kWinForfeitIdle);
}

SettlementOutcome SessionLifecycleManager::ForfeitDisconnected(std::int64_t session_id, std::int64_t player_id) {
  return Forfeit(session_id, player_id, kWinForfeitDisconnect);
}

std::vector<DisconnectedPlayer> SessionLifecycleManager::DisconnectedBefore(
    std::chrono::system_clock::time_point cutoff) {
  return registry_->DisconnectedBefore(cutoff);
}

}  // namespace stakematch
