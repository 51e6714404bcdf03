/*
 * 설명: runtime_config 조회/갱신과 설정 덮어쓰기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/recovery_it_test.cpp
 */
#include "stakematch/runtime_config.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace stakematch {
namespace {
std::vector<std::pair<std::string, std::string>> DefaultRows(const AppConfig& config) {
  return {
      {"payout_tax_percent", std::to_string(config.payout_tax_percent)},
      {"min_stake_amount", std::to_string(config.min_stake_amount)},
      {"queue_ttl_seconds", std::to_string(config.queue_ttl_seconds)},
      {"game_expiry_seconds", std::to_string(config.game_expiry_seconds)},
      {"idle_warning_seconds", std::to_string(config.idle_warning_seconds)},
      {"idle_forfeit_seconds", std::to_string(config.idle_forfeit_seconds)},
      {"disconnect_grace_seconds", std::to_string(config.disconnect_grace_seconds)},
  };
}

bool IsValidValue(const std::string& value_type, const std::string& value) {
  if (value_type == "int") {
    if (value.empty()) {
      return false;
    }
    std::size_t start = value[0] == '-' ? 1 : 0;
    if (start == value.size()) {
      return false;
    }
    for (std::size_t i = start; i < value.size(); ++i) {
      if (value[i] < '0' || value[i] > '9') {
        return false;
      }
    }
    return true;
  }
  if (value_type == "bool") {
    return value == "true" || value == "false";
  }
  return true;
}
}  // namespace

RuntimeConfigRepository::RuntimeConfigRepository(std::shared_ptr<MariaDbClient> db_client,
                                                 std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)), observability_(std::move(observability)) {}

void RuntimeConfigRepository::SeedDefaults(const AppConfig& config) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    for (const auto& [key, value] : DefaultRows(config)) {
      std::ostringstream oss;
      oss << "INSERT IGNORE INTO runtime_config(config_key, config_value, value_type) VALUES('" << key << "', '"
          << value << "', 'int');";
      db_client_->Execute(conn, oss.str(), "런타임 설정 기본값 삽입 실패");
    }
  });
}

std::vector<RuntimeConfigEntry> RuntimeConfigRepository::ListAll() const {
  std::vector<RuntimeConfigEntry> entries;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    entries.clear();
    db_client_->QueryRows(conn,
                          "SELECT config_key, config_value, value_type, description, updated_by FROM runtime_config "
                          "ORDER BY config_key;",
                          "런타임 설정 조회 실패", [&](MYSQL_ROW row) {
                            RuntimeConfigEntry entry;
                            entry.key = row[0] ? row[0] : "";
                            entry.value = row[1] ? row[1] : "";
                            entry.value_type = row[2] ? row[2] : "int";
                            entry.description = row[3] ? row[3] : "";
                            if (row[4]) {
                              entry.updated_by = std::string(row[4]);
                            }
                            entries.push_back(std::move(entry));
                          });
  });
  return entries;
}

bool RuntimeConfigRepository::Update(const std::string& key, const std::string& value,
                                     const std::string& updated_by) {
  std::optional<RuntimeConfigEntry> existing;
  for (auto& entry : ListAll()) {
    if (entry.key == key) {
      existing = std::move(entry);
      break;
    }
  }
  if (!existing) {
    return false;
  }
  if (!IsValidValue(existing->value_type, value)) {
    throw std::invalid_argument("설정 값 형식이 올바르지 않습니다: " + key + "=" + value);
  }
  bool updated = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE runtime_config SET config_value='" << db_client_->Escape(conn, value) << "', updated_by='"
        << db_client_->Escape(conn, updated_by) << "', updated_at=NOW(6) WHERE config_key='"
        << db_client_->Escape(conn, key) << "';";
    updated = db_client_->Execute(conn, oss.str(), "런타임 설정 갱신 실패") == 1;
  });
  observability_->Info("config.updated", {{"key", key}, {"value", value}, {"updatedBy", updated_by}});
  return updated;
}

std::size_t RuntimeConfigRepository::ApplyTo(AppConfig& config) const {
  std::size_t applied = 0;
  for (const auto& entry : ListAll()) {
    if (ApplyRuntimeOverride(config, entry.key, entry.value)) {
      ++applied;
    } else {
      observability_->Warn("config.override_skipped", {{"key", entry.key}, {"value", entry.value}});
    }
  }
  observability_->Info("config.overrides_applied", {{"count", applied}});
  return applied;
}

}  // namespace stakematch
