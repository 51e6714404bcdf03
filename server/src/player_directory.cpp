/*
 * 설명: players 테이블 기반 신원 해석과 통계 갱신을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/lifecycle_it_test.cpp
 */
#include "stakematch/player_directory.hpp"

#include <sstream>
#include <stdexcept>

#include "stakematch/errors.hpp"

namespace stakematch {
namespace {
constexpr const char* kPlayerColumns =
    "id, identity, display_name, total_games_played, total_games_won, total_games_drawn, total_winnings";

PlayerProfile BuildProfile(MYSQL_ROW row) {
  return PlayerProfile{ToInt64(row[0]),
                       row[1] ? row[1] : "",
                       row[2] ? row[2] : "",
                       static_cast<int>(ToInt64(row[3])),
                       static_cast<int>(ToInt64(row[4])),
                       static_cast<int>(ToInt64(row[5])),
                       ToInt64(row[6])};
}
}  // namespace

PlayerDirectory::PlayerDirectory(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

PlayerProfile PlayerDirectory::Resolve(const std::string& identity, const std::string& display_name) {
  if (identity.empty()) {
    throw std::invalid_argument("identity가 비어 있습니다");
  }
  std::optional<PlayerProfile> profile;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::string escaped_identity = db_client_->Escape(conn, identity);
    std::string name_expr = display_name.empty() ? "display_name" : "VALUES(display_name)";
    std::ostringstream upsert;
    upsert << "INSERT INTO players(identity, display_name, created_at) VALUES('" << escaped_identity << "', '"
           << db_client_->Escape(conn, display_name) << "', NOW(6)) ON DUPLICATE KEY UPDATE display_name = "
           << name_expr << ";";
    db_client_->Execute(conn, upsert.str(), "플레이어 보장 실패");

    std::ostringstream select;
    select << "SELECT " << kPlayerColumns << " FROM players WHERE identity='" << escaped_identity << "';";
    db_client_->QueryRows(conn, select.str(), "플레이어 조회 실패", [&](MYSQL_ROW row) { profile = BuildProfile(row); });
  });
  if (!profile) {
    throw EntityNotFoundError("플레이어를 찾을 수 없습니다: " + identity);
  }
  return *profile;
}

std::optional<PlayerProfile> PlayerDirectory::Find(std::int64_t player_id) const {
  std::optional<PlayerProfile> profile;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kPlayerColumns << " FROM players WHERE id=" << player_id << ";";
    db_client_->QueryRows(conn, oss.str(), "플레이어 조회 실패", [&](MYSQL_ROW row) { profile = BuildProfile(row); });
  });
  return profile;
}

std::optional<PlayerProfile> PlayerDirectory::FindByIdentity(const std::string& identity) const {
  std::optional<PlayerProfile> profile;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kPlayerColumns << " FROM players WHERE identity='" << db_client_->Escape(conn, identity) << "';";
    db_client_->QueryRows(conn, oss.str(), "플레이어 조회 실패", [&](MYSQL_ROW row) { profile = BuildProfile(row); });
  });
  return profile;
}

void PlayerDirectory::AddGamePlayedInTx(MYSQL* conn, std::int64_t player_id) {
  std::ostringstream oss;
  oss << "UPDATE players SET total_games_played = total_games_played + 1 WHERE id=" << player_id << ";";
  db_client_->Execute(conn, oss.str(), "경기 수 갱신 실패");
}

void PlayerDirectory::AddWinInTx(MYSQL* conn, std::int64_t player_id, std::int64_t net_winnings) {
  std::ostringstream oss;
  oss << "UPDATE players SET total_games_won = total_games_won + 1, total_winnings = total_winnings + "
      << net_winnings << " WHERE id=" << player_id << ";";
  db_client_->Execute(conn, oss.str(), "승리 통계 갱신 실패");
}

void PlayerDirectory::AddDrawInTx(MYSQL* conn, std::int64_t player_id) {
  std::ostringstream oss;
  oss << "UPDATE players SET total_games_drawn = total_games_drawn + 1 WHERE id=" << player_id << ";";
  db_client_->Execute(conn, oss.str(), "무승부 통계 갱신 실패");
}

}  // namespace stakematch
