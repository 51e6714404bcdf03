/*
 * 설명: game_sessions, escrow_ledger, game_moves, game_states 테이블 접근을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/lifecycle_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>
#include <nlohmann/json.hpp>

#include "stakematch/db_client.hpp"
#include "stakematch/session_registry.hpp"

namespace stakematch {

enum class EscrowEntryType { kStakeIn, kPayout, kDrawRefund, kSessionCancel };

std::string ToString(EscrowEntryType type);

struct SessionRecord {
  std::int64_t id{0};
  std::string token;
  std::int64_t player1_id{0};
  std::int64_t player2_id{0};
  std::int64_t stake_amount{0};
  SessionStatus status{SessionStatus::kWaiting};
  std::optional<std::int64_t> winner_id;
  std::optional<std::string> win_type;
  std::optional<std::int64_t> current_turn_player_id;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point expiry_time;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;
};

class SessionRepository {
 public:
  explicit SessionRepository(std::shared_ptr<MariaDbClient> db_client);

  std::int64_t InsertSessionInTx(MYSQL* conn, const std::string& token, std::int64_t player1_id,
                                 std::int64_t player2_id, std::int64_t stake_amount, std::chrono::seconds expiry);
  std::optional<SessionRecord> LockSessionInTx(MYSQL* conn, std::int64_t session_id);
  std::optional<SessionRecord> Find(std::int64_t session_id) const;

  bool MarkStarted(std::int64_t session_id);
  void CompleteInTx(MYSQL* conn, std::int64_t session_id, std::optional<std::int64_t> winner_id,
                    const std::string& win_type);
  void CancelInTx(MYSQL* conn, std::int64_t session_id);
  bool UpdateTurn(std::int64_t session_id, std::int64_t player_id);

  void InsertEscrowRowInTx(MYSQL* conn, std::int64_t session_id, std::optional<std::int64_t> queue_id,
                           EscrowEntryType type, std::int64_t player_id, std::int64_t amount,
                           const std::string& description);
  bool EscrowRowExistsInTx(MYSQL* conn, std::int64_t session_id, EscrowEntryType type);
  std::size_t CountEscrowRows(std::int64_t session_id, EscrowEntryType type) const;

  // 세션 행을 잠가 번호 경합을 직렬화한 뒤 다음 move_number로 기록한다.
  int InsertMoveInTx(MYSQL* conn, std::int64_t session_id, std::int64_t player_id, const std::string& move_type,
                     const nlohmann::json& payload);
  int InsertMove(std::int64_t session_id, std::int64_t player_id, const std::string& move_type,
                 const nlohmann::json& payload);
  std::size_t CountMoves(std::int64_t session_id) const;
  void InsertGameState(std::int64_t session_id, const nlohmann::json& state);

  std::vector<std::int64_t> ListExpiredWaiting() const;
  std::vector<SessionRecord> ListActive() const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace stakematch
