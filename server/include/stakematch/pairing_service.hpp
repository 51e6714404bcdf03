/*
 * 설명: 캐시 선점과 DB 조건부 갱신을 결합해 두 대기열 항목을 정확히 한 번 세션으로 묶는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/pairing_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stakematch/db_client.hpp"
#include "stakematch/ledger.hpp"
#include "stakematch/notification_outbox.hpp"
#include "stakematch/observability.hpp"
#include "stakematch/operational_queue.hpp"
#include "stakematch/queue_repository.hpp"
#include "stakematch/session_lifecycle.hpp"
#include "stakematch/session_repository.hpp"

namespace stakematch {

struct PairingResult {
  bool matched{false};
  // matched, searching, expired, cancelled 중 하나.
  std::string state{"searching"};
  std::int64_t queue_id{0};
  std::optional<std::string> match_code;
  std::optional<std::int64_t> session_id;
  std::optional<std::string> session_token;
  std::optional<std::int64_t> opponent_player_id;
  std::string error_code;
  std::string error_message;
};

struct PairingSettings {
  int max_attempts{5};
  std::chrono::milliseconds race_delay{50};
  std::chrono::seconds default_ttl{180};
  std::chrono::seconds game_expiry{180};
};

class PairingService {
 public:
  PairingService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<LedgerService> ledger,
                 std::shared_ptr<QueueRepository> queue_repository, std::shared_ptr<SessionRepository> sessions,
                 std::shared_ptr<OperationalQueue> operational_queue,
                 std::shared_ptr<SessionLifecycleManager> lifecycle, std::shared_ptr<NotificationOutbox> outbox,
                 std::shared_ptr<Observability> observability, PairingSettings settings);

  QueueEntry Enqueue(std::int64_t player_id, std::int64_t stake_amount, std::optional<std::chrono::seconds> ttl,
                     bool is_private);
  PairingResult TryPair(const QueueEntry& mine);
  PairingResult JoinPrivateMatch(const std::string& match_code, const QueueEntry& mine);

  // 입장 후 곧바로 페어링을 시도한다.
  PairingResult JoinQueue(std::int64_t player_id, std::int64_t stake_amount, std::optional<std::chrono::seconds> ttl);
  PairingResult JoinPrivateByCode(std::int64_t player_id, std::int64_t stake_amount, const std::string& match_code);

  // 만료된 항목이 남긴 플레이어 자금으로 새 입금 없이 다시 대기열에 들어간다.
  // queue_id가 있으면 그 만료 항목의 스테이크를, 없으면 stake_amount나 가장 최근 만료 항목의 스테이크를 쓴다.
  PairingResult RequeueWithCredit(std::int64_t player_id, std::optional<std::int64_t> queue_id,
                                  std::optional<std::int64_t> stake_amount, std::optional<std::chrono::seconds> ttl);

  bool CancelQueueEntry(std::int64_t queue_id, std::int64_t player_id);
  std::map<std::int64_t, std::size_t> GetQueueStatus() const;

 private:
  PairingResult PairViaCache(const QueueEntry& mine);
  PairingResult PairViaCacheLoop(const QueueEntry& mine, std::vector<QueueEntry>& held,
                                 std::optional<std::int64_t>& staged);
  PairingResult PairViaDatabase(const QueueEntry& mine);
  // 한 트랜잭션으로 세션 생성, 양측 스테이크 에스크로 이동, 두 행 matched 확정을 수행한다.
  // opponent_short는 상대 자금 부족으로 실패했을 때 true가 된다. 이때 상대는 호출자가 나중에 재제공한다.
  PairingResult CreateSession(const QueueEntry& mine, const QueueEntry& opponent, bool reoffer_to_cache,
                              bool& opponent_short);
  PairingResult StateOf(std::int64_t queue_id) const;
  // pop한 뒤 실패로 손을 뗀 상대를 queued로 돌리고 캐시 대기 목록 맨 앞에 다시 올린다.
  void RestoreStaged(std::int64_t stake, std::int64_t queue_id);
  void ReleaseOwnRow(const QueueEntry& mine, bool push_to_cache);
  void Reoffer(std::int64_t stake, const std::vector<QueueEntry>& held);

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<LedgerService> ledger_;
  std::shared_ptr<QueueRepository> queue_repository_;
  std::shared_ptr<SessionRepository> sessions_;
  std::shared_ptr<OperationalQueue> operational_queue_;
  std::shared_ptr<SessionLifecycleManager> lifecycle_;
  std::shared_ptr<NotificationOutbox> outbox_;
  std::shared_ptr<Observability> observability_;
  PairingSettings settings_;
};

}  // namespace stakematch
