/*
 * 설명: 원장/매칭/세션 계층이 호출자에게 드러내는 도메인 예외를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace stakematch {

class ServiceError : public std::runtime_error {
 public:
  ServiceError(std::string code, const std::string& message) : std::runtime_error(message), code_(std::move(code)) {}
  const std::string& code() const { return code_; }

 private:
  std::string code_;
};

class InsufficientFundsError : public ServiceError {
 public:
  InsufficientFundsError(std::int64_t account_id, std::int64_t required, std::int64_t available)
      : ServiceError("insufficient_funds", "잔액이 부족합니다: account=" + std::to_string(account_id) +
                                               " required=" + std::to_string(required) +
                                               " available=" + std::to_string(available)),
        account_id(account_id), required(required), available(available) {}
  std::int64_t account_id;
  std::int64_t required;
  std::int64_t available;
};

class EntityNotFoundError : public ServiceError {
 public:
  explicit EntityNotFoundError(const std::string& message) : ServiceError("not_found", message) {}
};

// 공유 캐시를 사용할 수 없을 때 던진다. 매칭은 DB 단독 경로로 강등된다.
class CacheUnavailableError : public ServiceError {
 public:
  explicit CacheUnavailableError(const std::string& message) : ServiceError("infrastructure_degraded", message) {}
};

}  // namespace stakematch
