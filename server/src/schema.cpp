/*
 * 설명: 매칭/원장/세션 테이블을 멱등하게 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ledger_it_test.cpp
 */
#include "stakematch/schema.hpp"

#include <array>

namespace stakematch {
namespace {
// owner_player_id=0 은 플랫폼 단위 계정(ESCROW, TAX 등)을 뜻한다.
constexpr std::array<const char*, 9> kSchemaStatements{
    "CREATE TABLE IF NOT EXISTS players ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " identity VARCHAR(64) NOT NULL,"
    " display_name VARCHAR(100) NOT NULL DEFAULT '',"
    " total_games_played INT NOT NULL DEFAULT 0,"
    " total_games_won INT NOT NULL DEFAULT 0,"
    " total_games_drawn INT NOT NULL DEFAULT 0,"
    " total_winnings BIGINT NOT NULL DEFAULT 0,"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " UNIQUE KEY uq_players_identity (identity)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS accounts ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " account_type VARCHAR(32) NOT NULL,"
    " owner_player_id BIGINT NOT NULL DEFAULT 0,"
    " balance BIGINT NOT NULL DEFAULT 0,"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " updated_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " UNIQUE KEY uq_accounts_type_owner (account_type, owner_player_id)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS account_transactions ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " debit_account_id BIGINT NOT NULL,"
    " credit_account_id BIGINT NOT NULL,"
    " amount BIGINT NOT NULL CHECK (amount > 0),"
    " reference_type VARCHAR(32) NOT NULL,"
    " reference_id BIGINT NULL,"
    " description VARCHAR(200) NOT NULL DEFAULT '',"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " KEY idx_acct_tx_reference (reference_type, reference_id),"
    " KEY idx_acct_tx_debit (debit_account_id),"
    " KEY idx_acct_tx_credit (credit_account_id)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS matchmaking_queue ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " player_id BIGINT NOT NULL,"
    " stake_amount BIGINT NOT NULL,"
    " status VARCHAR(16) NOT NULL DEFAULT 'queued',"
    " is_private TINYINT(1) NOT NULL DEFAULT 0,"
    " match_code VARCHAR(16) NULL,"
    " session_id BIGINT NULL,"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " expires_at DATETIME(6) NOT NULL,"
    " claimed_at DATETIME(6) NULL,"
    " matched_at DATETIME(6) NULL,"
    " UNIQUE KEY uq_queue_match_code (match_code),"
    " KEY idx_queue_status_stake (status, stake_amount, created_at),"
    " KEY idx_queue_player (player_id)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS game_sessions ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " game_token VARCHAR(64) NOT NULL,"
    " player1_id BIGINT NOT NULL,"
    " player2_id BIGINT NOT NULL,"
    " stake_amount BIGINT NOT NULL,"
    " status VARCHAR(16) NOT NULL DEFAULT 'WAITING',"
    " winner_id BIGINT NULL,"
    " win_type VARCHAR(32) NULL,"
    " current_turn_player_id BIGINT NULL,"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " expiry_time DATETIME(6) NOT NULL,"
    " started_at DATETIME(6) NULL,"
    " completed_at DATETIME(6) NULL,"
    " UNIQUE KEY uq_sessions_token (game_token),"
    " KEY idx_sessions_status (status, expiry_time)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS escrow_ledger ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " session_id BIGINT NOT NULL,"
    " queue_id BIGINT NULL,"
    " entry_type VARCHAR(20) NOT NULL,"
    " player_id BIGINT NOT NULL,"
    " amount BIGINT NOT NULL,"
    " description VARCHAR(200) NOT NULL DEFAULT '',"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " KEY idx_escrow_session_type (session_id, entry_type)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS game_moves ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " session_id BIGINT NOT NULL,"
    " player_id BIGINT NOT NULL,"
    " move_number INT NOT NULL,"
    " move_type VARCHAR(32) NOT NULL,"
    " payload LONGTEXT NOT NULL,"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " UNIQUE KEY uq_moves_session_number (session_id, move_number)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS game_states ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " session_id BIGINT NOT NULL,"
    " game_state LONGTEXT NOT NULL,"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " KEY idx_states_session (session_id)"
    ") ENGINE=InnoDB;",

    "CREATE TABLE IF NOT EXISTS runtime_config ("
    " config_key VARCHAR(64) PRIMARY KEY,"
    " config_value VARCHAR(255) NOT NULL,"
    " value_type VARCHAR(16) NOT NULL DEFAULT 'int',"
    " description VARCHAR(255) NOT NULL DEFAULT '',"
    " updated_by VARCHAR(100) NULL,"
    " updated_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6)"
    ") ENGINE=InnoDB;"};
}  // namespace

void EnsureSchema(const MariaDbClient& db_client) {
  db_client.WithConnectionRetry([&](MYSQL* conn) {
    for (const char* statement : kSchemaStatements) {
      db_client.Execute(conn, statement, "스키마 생성 실패");
    }
  });
}

void TruncateAll(const MariaDbClient& db_client) {
  db_client.WithConnectionRetry([&](MYSQL* conn) {
    for (const char* table : {"game_states", "game_moves", "escrow_ledger", "game_sessions", "matchmaking_queue",
                              "account_transactions", "accounts", "players", "runtime_config"}) {
      db_client.Execute(conn, std::string("DELETE FROM ") + table + ";", "테이블 비우기 실패");
    }
  });
}

}  // namespace stakematch
