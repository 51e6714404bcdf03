/*
 * 설명: JSON 응답 엔벨로프를 생성하고 오류 코드를 HTTP 상태로 옮긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "stakematch/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace stakematch {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto itt = clock::to_time_t(clock::now());
  std::tm tm = *std::gmtime(&itt);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

unsigned int HttpStatusForError(std::string_view code) {
  if (code == "bad_request" || code == "private_entry") {
    return 400;
  }
  if (code == "unauthorized") {
    return 401;
  }
  if (code == "insufficient_funds") {
    return 402;
  }
  if (code == "not_found") {
    return 404;
  }
  if (code == "not_participant" || code == "session_closed" || code == "self_join" || code == "stake_mismatch" ||
      code == "pairing_failed" || code == "move_rejected") {
    return 409;
  }
  if (code == "infrastructure_degraded") {
    return 503;
  }
  return 500;
}

}  // namespace stakematch
