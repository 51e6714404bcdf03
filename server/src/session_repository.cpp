/*
 * 설명: 세션 행 상태 전이와 에스크로 감사 행, 수 기록, 최종 스냅샷 저장을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/lifecycle_it_test.cpp
 */
#include "stakematch/session_repository.hpp"

#include <sstream>

#include "stakematch/errors.hpp"

namespace stakematch {
namespace {
constexpr const char* kSessionColumns =
    "id, game_token, player1_id, player2_id, stake_amount, status, winner_id, win_type, current_turn_player_id, "
    "created_at, expiry_time, started_at, completed_at";

std::string OptionalId(std::optional<std::int64_t> value) {
  return value ? std::to_string(*value) : std::string("NULL");
}

SessionRecord BuildRecord(MYSQL_ROW row) {
  SessionRecord record;
  record.id = ToInt64(row[0]);
  record.token = row[1] ? row[1] : "";
  record.player1_id = ToInt64(row[2]);
  record.player2_id = ToInt64(row[3]);
  record.stake_amount = ToInt64(row[4]);
  record.status = ParseSessionStatus(row[5] ? row[5] : "");
  if (row[6]) {
    record.winner_id = ToInt64(row[6]);
  }
  if (row[7]) {
    record.win_type = std::string(row[7]);
  }
  if (row[8]) {
    record.current_turn_player_id = ToInt64(row[8]);
  }
  record.created_at = ParseDbTimestamp(row[9]);
  record.expiry_time = ParseDbTimestamp(row[10]);
  if (row[11]) {
    record.started_at = ParseDbTimestamp(row[11]);
  }
  if (row[12]) {
    record.completed_at = ParseDbTimestamp(row[12]);
  }
  return record;
}
}  // namespace

std::string ToString(EscrowEntryType type) {
  switch (type) {
    case EscrowEntryType::kStakeIn:
      return "STAKE_IN";
    case EscrowEntryType::kPayout:
      return "PAYOUT";
    case EscrowEntryType::kDrawRefund:
      return "DRAW_REFUND";
    case EscrowEntryType::kSessionCancel:
      return "SESSION_CANCEL";
  }
  return "STAKE_IN";
}

SessionRepository::SessionRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::int64_t SessionRepository::InsertSessionInTx(MYSQL* conn, const std::string& token, std::int64_t player1_id,
                                                  std::int64_t player2_id, std::int64_t stake_amount,
                                                  std::chrono::seconds expiry) {
  std::ostringstream oss;
  oss << "INSERT INTO game_sessions(game_token, player1_id, player2_id, stake_amount, status, created_at, expiry_time) "
         "VALUES('"
      << db_client_->Escape(conn, token) << "', " << player1_id << ", " << player2_id << ", " << stake_amount
      << ", 'WAITING', NOW(6), DATE_ADD(NOW(6), INTERVAL " << expiry.count() << " SECOND));";
  db_client_->Execute(conn, oss.str(), "세션 생성 실패");
  return static_cast<std::int64_t>(mysql_insert_id(conn));
}

std::optional<SessionRecord> SessionRepository::LockSessionInTx(MYSQL* conn, std::int64_t session_id) {
  std::ostringstream oss;
  oss << "SELECT " << kSessionColumns << " FROM game_sessions WHERE id=" << session_id << " FOR UPDATE;";
  std::optional<SessionRecord> record;
  db_client_->QueryRows(conn, oss.str(), "세션 잠금 실패", [&](MYSQL_ROW row) { record = BuildRecord(row); });
  return record;
}

std::optional<SessionRecord> SessionRepository::Find(std::int64_t session_id) const {
  std::optional<SessionRecord> record;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kSessionColumns << " FROM game_sessions WHERE id=" << session_id << ";";
    db_client_->QueryRows(conn, oss.str(), "세션 조회 실패", [&](MYSQL_ROW row) { record = BuildRecord(row); });
  });
  return record;
}

bool SessionRepository::MarkStarted(std::int64_t session_id) {
  bool updated = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE game_sessions SET status='IN_PROGRESS', started_at=COALESCE(started_at, NOW(6)) WHERE id="
        << session_id << " AND status IN ('WAITING','IN_PROGRESS');";
    updated = db_client_->Execute(conn, oss.str(), "세션 시작 표시 실패") == 1;
  });
  return updated;
}

void SessionRepository::CompleteInTx(MYSQL* conn, std::int64_t session_id, std::optional<std::int64_t> winner_id,
                                     const std::string& win_type) {
  std::ostringstream oss;
  oss << "UPDATE game_sessions SET status='COMPLETED', winner_id=" << OptionalId(winner_id) << ", win_type='"
      << db_client_->Escape(conn, win_type)
      << "', started_at=COALESCE(started_at, NOW(6)), completed_at=NOW(6) WHERE id=" << session_id << ";";
  db_client_->Execute(conn, oss.str(), "세션 완료 갱신 실패");
}

void SessionRepository::CancelInTx(MYSQL* conn, std::int64_t session_id) {
  std::ostringstream oss;
  oss << "UPDATE game_sessions SET status='CANCELLED', completed_at=NOW(6) WHERE id=" << session_id << ";";
  db_client_->Execute(conn, oss.str(), "세션 취소 갱신 실패");
}

bool SessionRepository::UpdateTurn(std::int64_t session_id, std::int64_t player_id) {
  bool updated = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE game_sessions SET current_turn_player_id=" << player_id << " WHERE id=" << session_id
        << " AND status IN ('WAITING','IN_PROGRESS') AND (player1_id=" << player_id << " OR player2_id=" << player_id
        << ");";
    updated = db_client_->Execute(conn, oss.str(), "턴 갱신 실패") == 1;
  });
  return updated;
}

void SessionRepository::InsertEscrowRowInTx(MYSQL* conn, std::int64_t session_id, std::optional<std::int64_t> queue_id,
                                            EscrowEntryType type, std::int64_t player_id, std::int64_t amount,
                                            const std::string& description) {
  std::ostringstream oss;
  oss << "INSERT INTO escrow_ledger(session_id, queue_id, entry_type, player_id, amount, description, created_at) "
         "VALUES("
      << session_id << ", " << OptionalId(queue_id) << ", '" << ToString(type) << "', " << player_id << ", " << amount
      << ", '" << db_client_->Escape(conn, description) << "', NOW(6));";
  db_client_->Execute(conn, oss.str(), "에스크로 감사 행 기록 실패");
}

bool SessionRepository::EscrowRowExistsInTx(MYSQL* conn, std::int64_t session_id, EscrowEntryType type) {
  std::ostringstream oss;
  oss << "SELECT COUNT(*) FROM escrow_ledger WHERE session_id=" << session_id << " AND entry_type='" << ToString(type)
      << "';";
  return db_client_->QueryInt(conn, oss.str(), "에스크로 감사 행 조회 실패").value_or(0) > 0;
}

std::size_t SessionRepository::CountEscrowRows(std::int64_t session_id, EscrowEntryType type) const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT COUNT(*) FROM escrow_ledger WHERE session_id=" << session_id << " AND entry_type='"
        << ToString(type) << "';";
    count = static_cast<std::size_t>(db_client_->QueryInt(conn, oss.str(), "에스크로 감사 행 집계 실패").value_or(0));
  });
  return count;
}

int SessionRepository::InsertMoveInTx(MYSQL* conn, std::int64_t session_id, std::int64_t player_id,
                                      const std::string& move_type, const nlohmann::json& payload) {
  std::ostringstream lock;
  lock << "SELECT id FROM game_sessions WHERE id=" << session_id << " FOR UPDATE;";
  if (!db_client_->QueryInt(conn, lock.str(), "수 기록 세션 잠금 실패")) {
    throw EntityNotFoundError("세션을 찾을 수 없습니다: " + std::to_string(session_id));
  }
  std::ostringstream next;
  next << "SELECT COALESCE(MAX(move_number), 0) + 1 FROM game_moves WHERE session_id=" << session_id << ";";
  int move_number = static_cast<int>(db_client_->QueryInt(conn, next.str(), "수 번호 조회 실패").value_or(1));

  std::ostringstream insert;
  insert << "INSERT INTO game_moves(session_id, player_id, move_number, move_type, payload, created_at) VALUES("
         << session_id << ", " << player_id << ", " << move_number << ", '" << db_client_->Escape(conn, move_type)
         << "', '" << db_client_->Escape(conn, payload.dump()) << "', NOW(6));";
  db_client_->Execute(conn, insert.str(), "수 기록 실패");
  return move_number;
}

int SessionRepository::InsertMove(std::int64_t session_id, std::int64_t player_id, const std::string& move_type,
                                  const nlohmann::json& payload) {
  int move_number = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    move_number = InsertMoveInTx(conn, session_id, player_id, move_type, payload);
    return true;
  });
  return move_number;
}

std::size_t SessionRepository::CountMoves(std::int64_t session_id) const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT COUNT(*) FROM game_moves WHERE session_id=" << session_id << ";";
    count = static_cast<std::size_t>(db_client_->QueryInt(conn, oss.str(), "수 집계 실패").value_or(0));
  });
  return count;
}

void SessionRepository::InsertGameState(std::int64_t session_id, const nlohmann::json& state) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO game_states(session_id, game_state, created_at) VALUES(" << session_id << ", '"
        << db_client_->Escape(conn, state.dump()) << "', NOW(6));";
    db_client_->Execute(conn, oss.str(), "최종 상태 저장 실패");
  });
}

std::vector<std::int64_t> SessionRepository::ListExpiredWaiting() const {
  std::vector<std::int64_t> ids;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    ids.clear();
    db_client_->QueryRows(conn,
                          "SELECT id FROM game_sessions WHERE status='WAITING' AND expiry_time < NOW(6) ORDER BY id;",
                          "만료 세션 조회 실패", [&](MYSQL_ROW row) { ids.push_back(ToInt64(row[0])); });
  });
  return ids;
}

std::vector<SessionRecord> SessionRepository::ListActive() const {
  std::vector<SessionRecord> records;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    records.clear();
    std::ostringstream oss;
    oss << "SELECT " << kSessionColumns
        << " FROM game_sessions WHERE status IN ('WAITING','IN_PROGRESS') ORDER BY id;";
    db_client_->QueryRows(conn, oss.str(), "활성 세션 조회 실패",
                          [&](MYSQL_ROW row) { records.push_back(BuildRecord(row)); });
  });
  return records;
}

}  // namespace stakematch
