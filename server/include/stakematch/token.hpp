/*
 * 설명: 세션 토큰과 비공개 매치 코드를 암호학적 난수로 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace stakematch {

std::string GenerateToken(std::size_t bytes);

// 사람이 옮겨 적기 쉬운 문자만 사용한다(0/O, 1/I 제외).
std::string GenerateMatchCode(std::size_t length);

constexpr const char* kMatchCodeAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";

}  // namespace stakematch
