/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace stakematch {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  int payout_tax_percent;
  std::int64_t min_stake_amount;
  std::size_t queue_ttl_seconds;
  std::size_t game_expiry_seconds;
  std::size_t queue_processing_visibility_seconds;
  int pairing_max_attempts;
  std::size_t pairing_race_delay_ms;
  std::size_t idle_warning_seconds;
  std::size_t idle_forfeit_seconds;
  std::size_t disconnect_grace_seconds;
  std::size_t session_sweep_interval_seconds;
  std::size_t disconnect_sweep_interval_seconds;
  std::size_t idle_poll_interval_ms;
  std::size_t queue_sweep_interval_seconds;
  std::size_t stuck_sweep_interval_seconds;
  std::size_t notifier_interval_ms;
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();

// runtime_config 행 하나를 반영한다. 모르는 키거나 값이 잘못되면 false.
bool ApplyRuntimeOverride(AppConfig& config, const std::string& key, const std::string& value);

}  // namespace stakematch
