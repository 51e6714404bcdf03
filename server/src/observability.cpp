/*
 * 설명: 구조화 로그와 매칭/정산 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "stakematch/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace stakematch {
namespace {
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string NowIso() {
  auto now = std::chrono::system_clock::now();
  auto tt = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions, std::uint64_t queue_length) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.pairings = pairings_.load();
  snapshot.claim_races = claim_races_.load();
  snapshot.degraded_claims = degraded_claims_.load();
  snapshot.payouts = payouts_.load();
  snapshot.refunds = refunds_.load();
  snapshot.forfeits = forfeits_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.queue_length = queue_length;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["ts"] = NowIso();
  log_json["level"] = "info";
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.player_id) {
    log_json["playerId"] = *ctx.player_id;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << log_json.dump() << std::endl;
}

void Observability::Event(LogLevel level, const std::string& name, const nlohmann::json& fields) const {
  if (level < level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = NowIso();
  log_json["level"] = LevelName(level);
  log_json["eventName"] = name;
  if (fields.is_object()) {
    for (auto it = fields.begin(); it != fields.end(); ++it) {
      log_json[it.key()] = it.value();
    }
  }
  std::lock_guard<std::mutex> lock(OutputMutex());
  if (level >= LogLevel::kWarn) {
    std::cerr << log_json.dump() << std::endl;
  } else {
    std::cout << log_json.dump() << std::endl;
  }
}

}  // namespace stakematch
