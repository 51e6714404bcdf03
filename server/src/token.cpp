/*
 * 설명: 세션 토큰과 비공개 매치 코드를 암호학적 난수로 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_test.cpp
 */
#include "stakematch/token.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace stakematch {
namespace {
std::vector<unsigned char> RandomBytes(std::size_t count) {
  std::vector<unsigned char> buffer(count);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return buffer;
}
}  // namespace

std::string GenerateToken(std::size_t bytes) {
  auto buffer = RandomBytes(bytes);
  std::ostringstream oss;
  for (unsigned char byte : buffer) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}

std::string GenerateMatchCode(std::size_t length) {
  const std::size_t alphabet_size = std::strlen(kMatchCodeAlphabet);
  auto buffer = RandomBytes(length);
  std::string code;
  code.reserve(length);
  for (unsigned char byte : buffer) {
    code.push_back(kMatchCodeAlphabet[byte % alphabet_size]);
  }
  return code;
}

}  // namespace stakematch
