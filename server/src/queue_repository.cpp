/*
 * 설명: 대기열 행 삽입, 조건부 상태 전이, 복구용 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/pairing_it_test.cpp, server/tests/it/recovery_it_test.cpp
 */
#include "stakematch/queue_repository.hpp"

#include <sstream>
#include <stdexcept>

#include "stakematch/errors.hpp"
#include "stakematch/token.hpp"

namespace stakematch {
namespace {
constexpr const char* kEntryColumns =
    "id, player_id, stake_amount, status, is_private, match_code, session_id, created_at, expires_at, claimed_at, "
    "matched_at";
constexpr std::size_t kMatchCodeLength = 6;
constexpr std::size_t kMatchCodeAttempts = 5;

QueueEntry BuildEntry(MYSQL_ROW row) {
  QueueEntry entry;
  entry.id = ToInt64(row[0]);
  entry.player_id = ToInt64(row[1]);
  entry.stake_amount = ToInt64(row[2]);
  entry.status = ParseQueueStatus(row[3] ? row[3] : "");
  entry.is_private = ToInt64(row[4]) != 0;
  if (row[5]) {
    entry.match_code = std::string(row[5]);
  }
  if (row[6]) {
    entry.session_id = ToInt64(row[6]);
  }
  entry.created_at = ParseDbTimestamp(row[7]);
  entry.expires_at = ParseDbTimestamp(row[8]);
  if (row[9]) {
    entry.claimed_at = ParseDbTimestamp(row[9]);
  }
  if (row[10]) {
    entry.matched_at = ParseDbTimestamp(row[10]);
  }
  return entry;
}
}  // namespace

std::string ToString(QueueStatus status) {
  switch (status) {
    case QueueStatus::kQueued:
      return "queued";
    case QueueStatus::kMatching:
      return "matching";
    case QueueStatus::kMatched:
      return "matched";
    case QueueStatus::kExpired:
      return "expired";
    case QueueStatus::kCancelled:
      return "cancelled";
  }
  return "queued";
}

QueueStatus ParseQueueStatus(const std::string& text) {
  if (text == "queued") {
    return QueueStatus::kQueued;
  }
  if (text == "matching") {
    return QueueStatus::kMatching;
  }
  if (text == "matched") {
    return QueueStatus::kMatched;
  }
  if (text == "expired") {
    return QueueStatus::kExpired;
  }
  if (text == "cancelled") {
    return QueueStatus::kCancelled;
  }
  throw std::invalid_argument("알 수 없는 대기열 상태: " + text);
}

QueueRepository::QueueRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

QueueEntry QueueRepository::Enqueue(std::int64_t player_id, std::int64_t stake_amount, std::chrono::seconds ttl,
                                    bool is_private) {
  if (stake_amount <= 0) {
    throw std::invalid_argument("스테이크 금액은 양수여야 합니다");
  }
  std::int64_t queue_id = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    for (std::size_t attempt = 1; attempt <= kMatchCodeAttempts; ++attempt) {
      std::string code_sql = "NULL";
      if (is_private) {
        code_sql = "'" + GenerateMatchCode(kMatchCodeLength) + "'";
      }
      std::ostringstream oss;
      oss << "INSERT INTO matchmaking_queue(player_id, stake_amount, status, is_private, match_code, created_at, "
             "expires_at) VALUES("
          << player_id << ", " << stake_amount << ", 'queued', " << (is_private ? 1 : 0) << ", " << code_sql
          << ", NOW(6), DATE_ADD(NOW(6), INTERVAL " << ttl.count() << " SECOND));";
      if (mysql_query(conn, oss.str().c_str()) == 0) {
        queue_id = static_cast<std::int64_t>(mysql_insert_id(conn));
        return;
      }
      // 매치 코드 충돌은 새 코드로 다시 시도한다.
      if (!(is_private && mysql_errno(conn) == kDuplicateEntry)) {
        db_client_->RaiseError(conn, "대기열 삽입 실패");
      }
    }
    throw ServiceError("match_code_exhausted", "매치 코드 생성이 반복 충돌했습니다");
  });
  auto entry = Find(queue_id);
  if (!entry) {
    throw EntityNotFoundError("삽입한 대기열 행을 찾을 수 없습니다: " + std::to_string(queue_id));
  }
  return *entry;
}

bool QueueRepository::ClaimForMatching(std::int64_t queue_id) {
  bool claimed = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { claimed = ClaimForMatchingInTx(conn, queue_id); });
  return claimed;
}

bool QueueRepository::ClaimForMatchingInTx(MYSQL* conn, std::int64_t queue_id) {
  std::ostringstream oss;
  oss << "UPDATE matchmaking_queue SET status='matching', claimed_at=NOW(6) WHERE id=" << queue_id
      << " AND status='queued' AND expires_at > NOW(6);";
  return db_client_->Execute(conn, oss.str(), "대기열 선점 실패") == 1;
}

std::optional<QueueEntry> QueueRepository::ClaimPrivateByCode(const std::string& match_code) {
  std::optional<QueueEntry> claimed;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    claimed.reset();
    std::ostringstream select;
    select << "SELECT " << kEntryColumns << " FROM matchmaking_queue WHERE match_code='"
           << db_client_->Escape(conn, match_code)
           << "' AND is_private=1 AND status='queued' AND expires_at > NOW(6) FOR UPDATE;";
    std::optional<QueueEntry> found;
    db_client_->QueryRows(conn, select.str(), "비공개 대기열 조회 실패", [&](MYSQL_ROW row) { found = BuildEntry(row); });
    if (!found) {
      return false;
    }
    if (!ClaimForMatchingInTx(conn, found->id)) {
      return false;
    }
    found->status = QueueStatus::kMatching;
    claimed = found;
    return true;
  });
  return claimed;
}

std::optional<QueueEntry> QueueRepository::ClaimOldestCandidate(std::int64_t stake_amount,
                                                                std::int64_t exclude_player_id) {
  std::optional<QueueEntry> claimed;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    claimed.reset();
    std::ostringstream select;
    select << "SELECT " << kEntryColumns << " FROM matchmaking_queue WHERE status='queued' AND is_private=0"
           << " AND stake_amount=" << stake_amount << " AND player_id<>" << exclude_player_id
           << " AND expires_at > NOW(6) ORDER BY created_at, id LIMIT 1 FOR UPDATE SKIP LOCKED;";
    std::optional<QueueEntry> found;
    db_client_->QueryRows(conn, select.str(), "후보 잠금 조회 실패", [&](MYSQL_ROW row) { found = BuildEntry(row); });
    if (!found || !ClaimForMatchingInTx(conn, found->id)) {
      return false;
    }
    found->status = QueueStatus::kMatching;
    claimed = found;
    return true;
  });
  return claimed;
}

bool QueueRepository::MarkMatchedInTx(MYSQL* conn, std::int64_t queue_id, std::int64_t session_id) {
  std::ostringstream oss;
  oss << "UPDATE matchmaking_queue SET status='matched', session_id=" << session_id
      << ", matched_at=NOW(6) WHERE id=" << queue_id << " AND status='matching' AND session_id IS NULL;";
  return db_client_->Execute(conn, oss.str(), "매칭 확정 실패") == 1;
}

bool QueueRepository::ResetToQueued(std::int64_t queue_id) {
  bool reset = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE matchmaking_queue SET status='queued', claimed_at=NULL WHERE id=" << queue_id
        << " AND status='matching';";
    reset = db_client_->Execute(conn, oss.str(), "대기열 복원 실패") == 1;
  });
  return reset;
}

bool QueueRepository::Cancel(std::int64_t queue_id, std::int64_t player_id) {
  bool cancelled = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE matchmaking_queue SET status='cancelled' WHERE id=" << queue_id << " AND player_id=" << player_id
        << " AND status='queued';";
    cancelled = db_client_->Execute(conn, oss.str(), "대기열 취소 실패") == 1;
  });
  return cancelled;
}

bool QueueRepository::Expire(std::int64_t queue_id) {
  bool expired = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE matchmaking_queue SET status='expired' WHERE id=" << queue_id
        << " AND status='queued' AND expires_at <= NOW(6);";
    expired = db_client_->Execute(conn, oss.str(), "대기열 만료 실패") == 1;
  });
  return expired;
}

std::optional<QueueEntry> QueueRepository::Find(std::int64_t queue_id) const {
  std::optional<QueueEntry> entry;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kEntryColumns << " FROM matchmaking_queue WHERE id=" << queue_id << ";";
    db_client_->QueryRows(conn, oss.str(), "대기열 조회 실패", [&](MYSQL_ROW row) { entry = BuildEntry(row); });
  });
  return entry;
}

std::optional<QueueEntry> QueueRepository::FindLatestExpired(std::int64_t player_id,
                                                             std::optional<std::int64_t> stake_amount) const {
  std::optional<QueueEntry> entry;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    entry.reset();
    std::ostringstream oss;
    oss << "SELECT " << kEntryColumns << " FROM matchmaking_queue WHERE player_id=" << player_id
        << " AND status='expired'";
    if (stake_amount) {
      oss << " AND stake_amount=" << *stake_amount;
    }
    oss << " ORDER BY id DESC LIMIT 1;";
    db_client_->QueryRows(conn, oss.str(), "만료 항목 조회 실패", [&](MYSQL_ROW row) { entry = BuildEntry(row); });
  });
  return entry;
}

std::int64_t QueueRepository::SumOpenStakes(std::int64_t player_id) const {
  std::int64_t total = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT COALESCE(SUM(stake_amount), 0) FROM matchmaking_queue WHERE player_id=" << player_id
        << " AND status IN ('queued','matching');";
    total = db_client_->QueryInt(conn, oss.str(), "대기 스테이크 합계 실패").value_or(0);
  });
  return total;
}

std::vector<QueueEntry> QueueRepository::ListRehydratable() const {
  std::vector<QueueEntry> entries;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    entries.clear();
    std::ostringstream oss;
    oss << "SELECT " << kEntryColumns
        << " FROM matchmaking_queue WHERE status='queued' AND is_private=0 AND expires_at > NOW(6)"
           " ORDER BY created_at, id;";
    db_client_->QueryRows(conn, oss.str(), "재적재 대상 조회 실패",
                          [&](MYSQL_ROW row) { entries.push_back(BuildEntry(row)); });
  });
  return entries;
}

std::vector<QueueEntry> QueueRepository::ListStuckMatching() const {
  std::vector<QueueEntry> entries;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    entries.clear();
    std::ostringstream oss;
    oss << "SELECT " << kEntryColumns << " FROM matchmaking_queue WHERE status='matching' ORDER BY id;";
    db_client_->QueryRows(conn, oss.str(), "선점 행 조회 실패", [&](MYSQL_ROW row) { entries.push_back(BuildEntry(row)); });
  });
  return entries;
}

std::vector<std::int64_t> QueueRepository::ListExpiredIds() const {
  std::vector<std::int64_t> ids;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    ids.clear();
    db_client_->QueryRows(conn,
                          "SELECT id FROM matchmaking_queue WHERE status='queued' AND expires_at <= NOW(6) ORDER BY id;",
                          "만료 대상 조회 실패", [&](MYSQL_ROW row) { ids.push_back(ToInt64(row[0])); });
  });
  return ids;
}

std::map<std::int64_t, std::size_t> QueueRepository::CountQueuedByStake() const {
  std::map<std::int64_t, std::size_t> counts;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    counts.clear();
    db_client_->QueryRows(conn,
                          "SELECT stake_amount, COUNT(*) FROM matchmaking_queue WHERE status IN ('queued','matching') "
                          "AND is_private=0 GROUP BY stake_amount ORDER BY stake_amount;",
                          "스테이크별 대기열 집계 실패", [&](MYSQL_ROW row) {
                            counts[ToInt64(row[0])] = static_cast<std::size_t>(ToInt64(row[1]));
                          });
  });
  return counts;
}

}  // namespace stakematch
