/*
 * 설명: REST 응답 엔벨로프 생성과 오류 코드별 HTTP 상태 매핑을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace stakematch {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

unsigned int HttpStatusForError(std::string_view code);

}  // namespace stakematch
