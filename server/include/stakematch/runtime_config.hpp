/*
 * 설명: runtime_config 테이블의 운영 조정 값을 읽고 갱신해 AppConfig 위에 덮어쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/recovery_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stakematch/config.hpp"
#include "stakematch/db_client.hpp"
#include "stakematch/observability.hpp"

namespace stakematch {

struct RuntimeConfigEntry {
  std::string key;
  std::string value;
  std::string value_type;
  std::string description;
  std::optional<std::string> updated_by;
};

class RuntimeConfigRepository {
 public:
  RuntimeConfigRepository(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability);

  // 없는 키만 현재 설정값으로 채운다.
  void SeedDefaults(const AppConfig& config);
  std::vector<RuntimeConfigEntry> ListAll() const;
  // 키가 없으면 false, 값이 형식에 맞지 않으면 std::invalid_argument.
  bool Update(const std::string& key, const std::string& value, const std::string& updated_by);
  std::size_t ApplyTo(AppConfig& config) const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace stakematch
