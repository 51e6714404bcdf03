/*
 * 설명: 환경 변수에서 설정을 읽고 런타임 덮어쓰기 값을 검증해 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "stakematch/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace stakematch {
namespace {
bool ParseNonNegative(const std::string& value, long long& out) {
  try {
    std::size_t consumed = 0;
    long long parsed = std::stoll(value, &consumed);
    if (consumed != value.size() || parsed < 0) {
      return false;
    }
    out = parsed;
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&](const char* key, const char* def) {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  long long tax_percent = 0;
  if (!ParseNonNegative(get_env("PAYOUT_TAX_PERCENT", "15"), tax_percent) || tax_percent > 100) {
    throw std::invalid_argument("PAYOUT_TAX_PERCENT는 0에서 100 사이여야 합니다");
  }
  cfg.payout_tax_percent = static_cast<int>(tax_percent);
  cfg.min_stake_amount = std::stoll(get_env("MIN_STAKE_AMOUNT", "1000"));
  cfg.queue_ttl_seconds = get_size("QUEUE_TTL_SECONDS", "180");
  cfg.game_expiry_seconds = get_size("GAME_EXPIRY_SECONDS", "180");
  cfg.queue_processing_visibility_seconds = get_size("QUEUE_PROCESSING_VISIBILITY_SECONDS", "60");
  cfg.pairing_max_attempts = std::stoi(get_env("PAIRING_MAX_ATTEMPTS", "5"));
  cfg.pairing_race_delay_ms = get_size("PAIRING_RACE_DELAY_MS", "50");
  cfg.idle_warning_seconds = get_size("IDLE_WARNING_SECONDS", "45");
  cfg.idle_forfeit_seconds = get_size("IDLE_FORFEIT_SECONDS", "90");
  cfg.disconnect_grace_seconds = get_size("DISCONNECT_GRACE_SECONDS", "120");
  cfg.session_sweep_interval_seconds = get_size("SESSION_SWEEP_INTERVAL_SECONDS", "30");
  cfg.disconnect_sweep_interval_seconds = get_size("DISCONNECT_SWEEP_INTERVAL_SECONDS", "10");
  cfg.idle_poll_interval_ms = get_size("IDLE_POLL_INTERVAL_MS", "1000");
  cfg.queue_sweep_interval_seconds = get_size("QUEUE_SWEEP_INTERVAL_SECONDS", "15");
  cfg.stuck_sweep_interval_seconds = get_size("STUCK_SWEEP_INTERVAL_SECONDS", "30");
  cfg.notifier_interval_ms = get_size("NOTIFIER_INTERVAL_MS", "100");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

bool ApplyRuntimeOverride(AppConfig& config, const std::string& key, const std::string& value) {
  long long parsed = 0;
  if (!ParseNonNegative(value, parsed)) {
    return false;
  }
  if (key == "payout_tax_percent") {
    if (parsed > 100) {
      return false;
    }
    config.payout_tax_percent = static_cast<int>(parsed);
  } else if (key == "min_stake_amount") {
    config.min_stake_amount = parsed;
  } else if (key == "queue_ttl_seconds") {
    config.queue_ttl_seconds = static_cast<std::size_t>(parsed);
  } else if (key == "game_expiry_seconds") {
    config.game_expiry_seconds = static_cast<std::size_t>(parsed);
  } else if (key == "idle_warning_seconds") {
    config.idle_warning_seconds = static_cast<std::size_t>(parsed);
  } else if (key == "idle_forfeit_seconds") {
    config.idle_forfeit_seconds = static_cast<std::size_t>(parsed);
  } else if (key == "disconnect_grace_seconds") {
    config.disconnect_grace_seconds = static_cast<std::size_t>(parsed);
  } else {
    return false;
  }
  return true;
}

}  // namespace stakematch
