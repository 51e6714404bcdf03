/*
 * 설명: 구조화 로그와 매칭/정산 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace stakematch {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);

struct LogContext {
  std::string trace_id;
  std::optional<std::int64_t> player_id;
  std::optional<std::int64_t> session_id;
  std::string name;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t pairings{0};
  std::uint64_t claim_races{0};
  std::uint64_t degraded_claims{0};
  std::uint64_t payouts{0};
  std::uint64_t refunds{0};
  std::uint64_t forfeits{0};
  std::uint64_t active_sessions{0};
  std::uint64_t queue_length{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo) : level_(level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementPairing() { pairings_.fetch_add(1); }
  void IncrementClaimRace() { claim_races_.fetch_add(1); }
  void IncrementDegradedClaim() { degraded_claims_.fetch_add(1); }
  void IncrementPayout() { payouts_.fetch_add(1); }
  void IncrementRefund() { refunds_.fetch_add(1); }
  void IncrementForfeit() { forfeits_.fetch_add(1); }
  MetricsSnapshot Snapshot(std::uint64_t active_sessions, std::uint64_t queue_length) const;

  void Log(const LogContext& ctx) const;
  void Event(LogLevel level, const std::string& name, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Debug(const std::string& name, const nlohmann::json& fields = nlohmann::json::object()) const {
    Event(LogLevel::kDebug, name, fields);
  }
  void Info(const std::string& name, const nlohmann::json& fields = nlohmann::json::object()) const {
    Event(LogLevel::kInfo, name, fields);
  }
  void Warn(const std::string& name, const nlohmann::json& fields = nlohmann::json::object()) const {
    Event(LogLevel::kWarn, name, fields);
  }
  void Error(const std::string& name, const nlohmann::json& fields = nlohmann::json::object()) const {
    Event(LogLevel::kError, name, fields);
  }

 private:
  LogLevel level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> pairings_{0};
  std::atomic<std::uint64_t> claim_races_{0};
  std::atomic<std::uint64_t> degraded_claims_{0};
  std::atomic<std::uint64_t> payouts_{0};
  std::atomic<std::uint64_t> refunds_{0};
  std::atomic<std::uint64_t> forfeits_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace stakematch
