/*
 * 설명: 외부 신원을 플레이어 id로 해석하고 전적 통계를 갱신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/lifecycle_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "stakematch/db_client.hpp"

namespace stakematch {

struct PlayerProfile {
  std::int64_t id{0};
  std::string identity;
  std::string display_name;
  int games_played{0};
  int games_won{0};
  int games_drawn{0};
  std::int64_t total_winnings{0};
};

class IdentityResolver {
 public:
  virtual ~IdentityResolver() = default;
  // 처음 보는 신원이면 플레이어를 만든다. display_name이 비어 있으면 기존 값을 유지한다.
  virtual PlayerProfile Resolve(const std::string& identity, const std::string& display_name) = 0;
};

class PlayerDirectory : public IdentityResolver {
 public:
  explicit PlayerDirectory(std::shared_ptr<MariaDbClient> db_client);

  PlayerProfile Resolve(const std::string& identity, const std::string& display_name) override;
  std::optional<PlayerProfile> Find(std::int64_t player_id) const;
  // Resolve와 달리 새 플레이어를 만들지 않는다.
  std::optional<PlayerProfile> FindByIdentity(const std::string& identity) const;

  void AddGamePlayedInTx(MYSQL* conn, std::int64_t player_id);
  void AddWinInTx(MYSQL* conn, std::int64_t player_id, std::int64_t net_winnings);
  void AddDrawInTx(MYSQL* conn, std::int64_t player_id);

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace stakematch
