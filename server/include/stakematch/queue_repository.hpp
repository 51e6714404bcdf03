/*
 * 설명: matchmaking_queue 테이블을 페어링 상태의 원본으로 다루며 조건부 상태 전이만 허용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/pairing_it_test.cpp, server/tests/it/recovery_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "stakematch/db_client.hpp"

namespace stakematch {

enum class QueueStatus { kQueued, kMatching, kMatched, kExpired, kCancelled };

std::string ToString(QueueStatus status);
QueueStatus ParseQueueStatus(const std::string& text);

struct QueueEntry {
  std::int64_t id{0};
  std::int64_t player_id{0};
  std::int64_t stake_amount{0};
  QueueStatus status{QueueStatus::kQueued};
  bool is_private{false};
  std::optional<std::string> match_code;
  std::optional<std::int64_t> session_id;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point expires_at;
  std::optional<std::chrono::system_clock::time_point> claimed_at;
  std::optional<std::chrono::system_clock::time_point> matched_at;
};

class QueueRepository {
 public:
  explicit QueueRepository(std::shared_ptr<MariaDbClient> db_client);

  // 스테이크는 이미 플레이어 자금 계정에 예약된 상태여야 한다.
  QueueEntry Enqueue(std::int64_t player_id, std::int64_t stake_amount, std::chrono::seconds ttl, bool is_private);

  // queued -> matching. 영향받은 행이 없으면 다른 워커가 먼저 가져갔거나 만료/종료 상태다.
  bool ClaimForMatching(std::int64_t queue_id);
  bool ClaimForMatchingInTx(MYSQL* conn, std::int64_t queue_id);
  std::optional<QueueEntry> ClaimPrivateByCode(const std::string& match_code);
  std::optional<QueueEntry> ClaimOldestCandidate(std::int64_t stake_amount, std::int64_t exclude_player_id);

  // 호출자 트랜잭션 안에서 matching -> matched. 정확히 한 행이 바뀌어야 한다.
  bool MarkMatchedInTx(MYSQL* conn, std::int64_t queue_id, std::int64_t session_id);
  bool ResetToQueued(std::int64_t queue_id);
  bool Cancel(std::int64_t queue_id, std::int64_t player_id);
  bool Expire(std::int64_t queue_id);

  std::optional<QueueEntry> Find(std::int64_t queue_id) const;
  // 가장 최근에 만료된 항목. stake_amount가 있으면 그 금액만 본다.
  std::optional<QueueEntry> FindLatestExpired(std::int64_t player_id, std::optional<std::int64_t> stake_amount) const;
  // 아직 끝나지 않은(queued, matching) 항목들이 묶어 둔 스테이크 합계.
  std::int64_t SumOpenStakes(std::int64_t player_id) const;
  std::vector<QueueEntry> ListRehydratable() const;
  std::vector<QueueEntry> ListStuckMatching() const;
  std::vector<std::int64_t> ListExpiredIds() const;
  std::map<std::int64_t, std::size_t> CountQueuedByStake() const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace stakematch
