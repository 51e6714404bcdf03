/*
 * 설명: 대기열 입장, 캐시/DB 선점 루프, 원자적 세션 생성과 통합 보상 경로를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/pairing_it_test.cpp
 */
#include "stakematch/pairing_service.hpp"

#include <stdexcept>
#include <thread>

#include "stakematch/errors.hpp"
#include "stakematch/token.hpp"

namespace stakematch {
namespace {
constexpr std::size_t kSessionTokenBytes = 16;

PairingResult Searching(std::int64_t queue_id) {
  PairingResult result;
  result.queue_id = queue_id;
  return result;
}

PairingResult Failed(std::int64_t queue_id, const std::string& code, const std::string& message) {
  PairingResult result = Searching(queue_id);
  result.error_code = code;
  result.error_message = message;
  return result;
}
}  // namespace

PairingService::PairingService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<LedgerService> ledger,
                               std::shared_ptr<QueueRepository> queue_repository,
                               std::shared_ptr<SessionRepository> sessions,
                               std::shared_ptr<OperationalQueue> operational_queue,
                               std::shared_ptr<SessionLifecycleManager> lifecycle,
                               std::shared_ptr<NotificationOutbox> outbox, std::shared_ptr<Observability> observability,
                               PairingSettings settings)
    : db_client_(std::move(db_client)), ledger_(std::move(ledger)), queue_repository_(std::move(queue_repository)),
      sessions_(std::move(sessions)), operational_queue_(std::move(operational_queue)),
      lifecycle_(std::move(lifecycle)), outbox_(std::move(outbox)), observability_(std::move(observability)),
      settings_(settings) {}

QueueEntry PairingService::Enqueue(std::int64_t player_id, std::int64_t stake_amount,
                                   std::optional<std::chrono::seconds> ttl, bool is_private) {
  auto entry = queue_repository_->Enqueue(player_id, stake_amount, ttl.value_or(settings_.default_ttl), is_private);
  if (!is_private) {
    try {
      operational_queue_->Push(stake_amount, entry.id);
    } catch (const CacheUnavailableError& ex) {
      observability_->Error("queue.cache_push_failed", {{"queueId", entry.id}, {"error", ex.what()}});
    }
  }
  observability_->Info("queue.enqueued",
                       {{"queueId", entry.id}, {"playerId", player_id}, {"stake", stake_amount}, {"private", is_private}});
  return entry;
}

PairingResult PairingService::JoinQueue(std::int64_t player_id, std::int64_t stake_amount,
                                        std::optional<std::chrono::seconds> ttl) {
  auto entry = Enqueue(player_id, stake_amount, ttl, false);
  return TryPair(entry);
}

PairingResult PairingService::JoinPrivateByCode(std::int64_t player_id, std::int64_t stake_amount,
                                                const std::string& match_code) {
  auto entry = Enqueue(player_id, stake_amount, std::nullopt, true);
  auto result = JoinPrivateMatch(match_code, entry);
  if (!result.matched) {
    queue_repository_->Cancel(entry.id, player_id);
  }
  return result;
}

PairingResult PairingService::TryPair(const QueueEntry& mine) {
  if (mine.is_private) {
    return Failed(mine.id, "private_entry", "비공개 항목은 코드로만 매칭됩니다");
  }
  if (!queue_repository_->ClaimForMatching(mine.id)) {
    return StateOf(mine.id);
  }

  PairingResult result;
  try {
    try {
      result = PairViaCache(mine);
    } catch (const CacheUnavailableError& ex) {
      observability_->Error("pairing.degraded", {{"queueId", mine.id}, {"error", ex.what()}});
      // 캐시 실패 시점에 자기 행이 queued로 돌아갔을 수 있다.
      if (!queue_repository_->ClaimForMatching(mine.id)) {
        auto current = queue_repository_->Find(mine.id);
        if (!current || current->status != QueueStatus::kMatching) {
          return StateOf(mine.id);
        }
      }
      result = PairViaDatabase(mine);
    }
  } catch (const std::exception& ex) {
    observability_->Error("pairing.failed", {{"queueId", mine.id}, {"error", ex.what()}});
    queue_repository_->ResetToQueued(mine.id);
    // 자기 항목이 이미 pop되었을 수 있으므로 대기 목록에 다시 올린다.
    try {
      operational_queue_->Push(mine.stake_amount, mine.id);
    } catch (const CacheUnavailableError& cache_ex) {
      observability_->Warn("pairing.repush_failed", {{"queueId", mine.id}, {"error", cache_ex.what()}});
    }
    throw;
  }
  result.queue_id = mine.id;
  return result;
}

PairingResult PairingService::PairViaCache(const QueueEntry& mine) {
  const std::int64_t stake = mine.stake_amount;
  std::vector<QueueEntry> held;
  // pop 이후 이 호출이 책임지는 상대 항목. 넘겨주거나 내려놓으면 비운다.
  std::optional<std::int64_t> staged;
  try {
    return PairViaCacheLoop(mine, held, staged);
  } catch (const std::exception& ex) {
    observability_->Error("pairing.cache_attempt_failed", {{"queueId", mine.id}, {"error", ex.what()}});
    if (staged) {
      RestoreStaged(stake, *staged);
    }
    try {
      Reoffer(stake, held);
    } catch (const CacheUnavailableError& cache_ex) {
      observability_->Warn("pairing.reoffer_failed", {{"queueId", mine.id}, {"error", cache_ex.what()}});
    }
    throw;
  }
}

PairingResult PairingService::PairViaCacheLoop(const QueueEntry& mine, std::vector<QueueEntry>& held,
                                               std::optional<std::int64_t>& staged) {
  const std::int64_t stake = mine.stake_amount;
  for (int attempt = 0; attempt < settings_.max_attempts; ++attempt) {
    auto candidate = operational_queue_->PopAndStage(stake, OperationalQueue::Clock::now());
    if (!candidate) {
      ReleaseOwnRow(mine, true);
      if (operational_queue_->Length(stake) < 2) {
        Reoffer(stake, held);
        return Searching(mine.id);
      }
      // 거의 동시에 들어온 상대가 있다. 잠시 뒤 한 번 더 시도한다.
      std::this_thread::sleep_for(settings_.race_delay);
      if (!queue_repository_->ClaimForMatching(mine.id)) {
        Reoffer(stake, held);
        return StateOf(mine.id);
      }
      operational_queue_->Remove(stake, mine.id);
      observability_->Debug("pairing.quick_retry", {{"queueId", mine.id}, {"stake", stake}});
      continue;
    }

    if (*candidate == mine.id) {
      operational_queue_->ClearProcessing(stake, *candidate);
      continue;
    }
    staged = *candidate;
    if (!queue_repository_->ClaimForMatching(*candidate)) {
      operational_queue_->ClearProcessing(stake, *candidate);
      staged.reset();
      observability_->IncrementClaimRace();
      continue;
    }
    auto opponent = queue_repository_->Find(*candidate);
    if (!opponent) {
      operational_queue_->ClearProcessing(stake, *candidate);
      staged.reset();
      continue;
    }
    if (opponent->player_id == mine.player_id) {
      queue_repository_->ResetToQueued(opponent->id);
      operational_queue_->ClearProcessing(stake, opponent->id);
      staged.reset();
      held.push_back(*opponent);
      continue;
    }

    bool opponent_short = false;
    auto result = CreateSession(mine, *opponent, true, opponent_short);
    staged.reset();
    if (result.matched || !result.error_code.empty()) {
      Reoffer(stake, held);
      return result;
    }
    // 자금이 모자란 상대를 바로 앞에 되돌리면 다음 pop이 또 같은 상대를 꺼낸다.
    if (opponent_short) {
      held.push_back(*opponent);
    }
    if (!queue_repository_->ClaimForMatching(mine.id)) {
      Reoffer(stake, held);
      return StateOf(mine.id);
    }
  }

  ReleaseOwnRow(mine, true);
  Reoffer(stake, held);
  return Searching(mine.id);
}

PairingResult PairingService::PairViaDatabase(const QueueEntry& mine) {
  for (int attempt = 0; attempt < settings_.max_attempts; ++attempt) {
    auto opponent = queue_repository_->ClaimOldestCandidate(mine.stake_amount, mine.player_id);
    if (!opponent) {
      break;
    }
    observability_->IncrementDegradedClaim();
    bool opponent_short = false;
    auto result = CreateSession(mine, *opponent, false, opponent_short);
    if (result.matched || !result.error_code.empty()) {
      return result;
    }
    if (!queue_repository_->ClaimForMatching(mine.id)) {
      return StateOf(mine.id);
    }
  }
  ReleaseOwnRow(mine, false);
  return Searching(mine.id);
}

PairingResult PairingService::CreateSession(const QueueEntry& mine, const QueueEntry& opponent,
                                            bool reoffer_to_cache, bool& opponent_short) {
  const std::int64_t stake = mine.stake_amount;
  const std::string token = GenerateToken(kSessionTokenBytes);
  std::int64_t session_id = 0;
  bool caller_short = false;

  auto compensate = [&]() {
    queue_repository_->ResetToQueued(mine.id);
    queue_repository_->ResetToQueued(opponent.id);
    if (!reoffer_to_cache) {
      return;
    }
    try {
      if (opponent_short) {
        operational_queue_->ClearProcessing(stake, opponent.id);
      } else {
        operational_queue_->Requeue(stake, opponent.id);
      }
    } catch (const CacheUnavailableError& ex) {
      observability_->Error("pairing.reoffer_failed", {{"queueId", opponent.id}, {"error", ex.what()}});
    }
  };

  TxResult tx = db_client_->RunTransaction(
      [&](MYSQL* conn) {
        caller_short = false;
        opponent_short = false;
        session_id =
            sessions_->InsertSessionInTx(conn, token, opponent.player_id, mine.player_id, stake, settings_.game_expiry);
        auto escrow = ledger_->GetOrCreateAccountInTx(conn, AccountType::kEscrow, std::nullopt);
        for (const QueueEntry* entry : {&opponent, &mine}) {
          auto funds = ledger_->GetOrCreateAccountInTx(conn, AccountType::kPlayerFunds, entry->player_id);
          try {
            ledger_->Transfer(conn, funds.id, escrow.id, stake, kRefSession, session_id, "Stake moved to escrow");
          } catch (const InsufficientFundsError&) {
            caller_short = entry == &mine;
            opponent_short = entry == &opponent;
            throw;
          }
          sessions_->InsertEscrowRowInTx(conn, session_id, entry->id, EscrowEntryType::kStakeIn, entry->player_id,
                                         stake, "Stake moved to escrow");
        }
        return queue_repository_->MarkMatchedInTx(conn, opponent.id, session_id) &&
               queue_repository_->MarkMatchedInTx(conn, mine.id, session_id);
      },
      compensate);

  if (!tx.committed) {
    observability_->Warn("pairing.session_failed", {{"queueId", mine.id},
                                                    {"opponentQueueId", opponent.id},
                                                    {"errorCode", tx.error_code},
                                                    {"error", tx.error_message}});
    if (caller_short) {
      return Failed(mine.id, "insufficient_funds", tx.error_message);
    }
    return Searching(mine.id);
  }

  if (reoffer_to_cache) {
    try {
      operational_queue_->ClearProcessing(stake, opponent.id);
    } catch (const CacheUnavailableError& ex) {
      observability_->Warn("pairing.processing_clear_failed", {{"queueId", opponent.id}, {"error", ex.what()}});
    }
  }
  if (auto record = sessions_->Find(session_id)) {
    lifecycle_->Track(*record);
  }
  observability_->IncrementPairing();
  observability_->Info("pairing.matched", {{"sessionId", session_id},
                                           {"queueId", mine.id},
                                           {"opponentQueueId", opponent.id},
                                           {"stake", stake}});
  for (const auto& pair : {std::make_pair(&mine, &opponent), std::make_pair(&opponent, &mine)}) {
    outbox_->Enqueue(OutboundEvent{"match_found",
                                   {pair.first->player_id},
                                   {{"sessionId", session_id},
                                    {"sessionToken", token},
                                    {"queueId", pair.first->id},
                                    {"opponentPlayerId", pair.second->player_id},
                                    {"stake", stake}}});
  }

  PairingResult result = Searching(mine.id);
  result.matched = true;
  result.state = "matched";
  result.session_id = session_id;
  result.session_token = token;
  result.opponent_player_id = opponent.player_id;
  return result;
}

PairingResult PairingService::JoinPrivateMatch(const std::string& match_code, const QueueEntry& mine) {
  if (!queue_repository_->ClaimForMatching(mine.id)) {
    return StateOf(mine.id);
  }
  std::optional<QueueEntry> host;
  try {
    host = queue_repository_->ClaimPrivateByCode(match_code);
  } catch (const std::exception&) {
    queue_repository_->ResetToQueued(mine.id);
    throw;
  }
  if (!host) {
    queue_repository_->ResetToQueued(mine.id);
    return Failed(mine.id, "not_found", "유효한 매치 코드가 아닙니다");
  }
  if (host->player_id == mine.player_id || host->stake_amount != mine.stake_amount) {
    queue_repository_->ResetToQueued(mine.id);
    queue_repository_->ResetToQueued(host->id);
    if (host->player_id == mine.player_id) {
      return Failed(mine.id, "self_join", "자신의 비공개 매치에는 참가할 수 없습니다");
    }
    return Failed(mine.id, "stake_mismatch", "스테이크 금액이 일치하지 않습니다");
  }
  bool host_short = false;
  auto result = CreateSession(mine, *host, false, host_short);
  if (!result.matched && result.error_code.empty()) {
    result.error_code = "pairing_failed";
    result.error_message = "세션 생성에 실패했습니다";
  }
  return result;
}

PairingResult PairingService::RequeueWithCredit(std::int64_t player_id, std::optional<std::int64_t> queue_id,
                                               std::optional<std::int64_t> stake_amount,
                                               std::optional<std::chrono::seconds> ttl) {
  std::int64_t stake = 0;
  if (queue_id) {
    auto expired = queue_repository_->Find(*queue_id);
    if (!expired || expired->player_id != player_id || expired->status != QueueStatus::kExpired) {
      return Failed(0, "not_found", "재입장할 수 있는 만료 항목이 없습니다");
    }
    stake = expired->stake_amount;
  } else if (stake_amount) {
    stake = *stake_amount;
  } else {
    auto latest = queue_repository_->FindLatestExpired(player_id, std::nullopt);
    if (!latest) {
      return Failed(0, "not_found", "재입장할 수 있는 만료 항목이 없습니다");
    }
    stake = latest->stake_amount;
  }
  if (stake <= 0) {
    throw std::invalid_argument("스테이크 금액은 양수여야 합니다");
  }

  // 대기 중인 다른 항목이 같은 자금을 이미 쓰고 있을 수 있다.
  auto available =
      ledger_->GetBalance(AccountType::kPlayerFunds, player_id) - queue_repository_->SumOpenStakes(player_id);
  if (available < stake) {
    observability_->Info("queue.requeue_rejected", {{"playerId", player_id}, {"stake", stake}, {"available", available}});
    return Failed(0, "insufficient_funds", "재입장에 쓸 자금이 부족합니다");
  }
  observability_->Info("queue.requeue_credit", {{"playerId", player_id}, {"stake", stake}});
  return JoinQueue(player_id, stake, ttl);
}

bool PairingService::CancelQueueEntry(std::int64_t queue_id, std::int64_t player_id) {
  auto entry = queue_repository_->Find(queue_id);
  if (!entry || entry->player_id != player_id) {
    return false;
  }
  if (!queue_repository_->Cancel(queue_id, player_id)) {
    return false;
  }
  if (!entry->is_private) {
    try {
      operational_queue_->Remove(entry->stake_amount, queue_id);
    } catch (const CacheUnavailableError& ex) {
      observability_->Warn("queue.cache_remove_failed", {{"queueId", queue_id}, {"error", ex.what()}});
    }
  }
  observability_->Info("queue.cancelled", {{"queueId", queue_id}, {"playerId", player_id}});
  return true;
}

std::map<std::int64_t, std::size_t> PairingService::GetQueueStatus() const {
  return queue_repository_->CountQueuedByStake();
}

PairingResult PairingService::StateOf(std::int64_t queue_id) const {
  auto entry = queue_repository_->Find(queue_id);
  if (!entry) {
    return Failed(queue_id, "not_found", "대기열 항목을 찾을 수 없습니다");
  }
  PairingResult result = Searching(queue_id);
  result.match_code = entry->match_code;
  switch (entry->status) {
    case QueueStatus::kMatched:
      result.matched = true;
      result.state = "matched";
      result.session_id = entry->session_id;
      if (entry->session_id) {
        if (auto session = sessions_->Find(*entry->session_id)) {
          result.session_token = session->token;
          result.opponent_player_id =
              session->player1_id == entry->player_id ? session->player2_id : session->player1_id;
        }
      }
      break;
    case QueueStatus::kExpired:
    case QueueStatus::kCancelled:
      result.state = ToString(entry->status);
      break;
    case QueueStatus::kQueued:
    case QueueStatus::kMatching:
      break;
  }
  return result;
}

void PairingService::RestoreStaged(std::int64_t stake, std::int64_t queue_id) {
  try {
    queue_repository_->ResetToQueued(queue_id);
    auto entry = queue_repository_->Find(queue_id);
    if (entry && entry->status == QueueStatus::kQueued) {
      operational_queue_->Requeue(stake, queue_id);
    } else {
      operational_queue_->ClearProcessing(stake, queue_id);
    }
    observability_->Info("pairing.staged_restored", {{"queueId", queue_id}, {"stake", stake}});
  } catch (const std::exception& ex) {
    // 복원하지 못한 항목은 SweepStuckProcessing이 처리 목록에서 회수한다.
    observability_->Error("pairing.staged_restore_failed", {{"queueId", queue_id}, {"error", ex.what()}});
  }
}

void PairingService::ReleaseOwnRow(const QueueEntry& mine, bool push_to_cache) {
  queue_repository_->ResetToQueued(mine.id);
  if (push_to_cache) {
    operational_queue_->Push(mine.stake_amount, mine.id);
  }
}

void PairingService::Reoffer(std::int64_t stake, const std::vector<QueueEntry>& held) {
  for (const auto& entry : held) {
    operational_queue_->Push(stake, entry.id);
  }
}

}  // namespace stakematch
