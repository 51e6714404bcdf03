/*
 * 설명: MariaDB 연결과 트랜잭션 재시도/보상 정책을 캡슐화한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ledger_it_test.cpp, server/tests/it/pairing_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace stakematch {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

// 트랜잭션 한 번의 결과. committed가 false면 보상 루틴이 이미 실행된 상태다.
struct TxResult {
  bool committed{false};
  std::string error_code;
  std::string error_message;
};

constexpr unsigned int kDuplicateEntry = 1062;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  // work가 false를 반환하거나 예외를 던지면 롤백 후 compensate를 정확히 한 번 호출한다.
  // 예외는 삼키지 않고 error_code/error_message로 옮긴 뒤 rethrow_on_error에 따라 다시 던진다.
  TxResult RunTransaction(const std::function<bool(MYSQL*)>& work, const std::function<void()>& compensate,
                          bool rethrow_on_error = false) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

  std::uint64_t Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  void QueryRows(MYSQL* conn, const std::string& sql, const std::string& ctx,
                 const std::function<void(MYSQL_ROW)>& on_row) const;
  std::optional<std::int64_t> QueryInt(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

 private:
  MYSQL* Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 5;
  std::function<bool(std::size_t)> transient_injector_;
};

std::int64_t ToInt64(const char* value);
std::chrono::system_clock::time_point ParseDbTimestamp(const char* text);

}  // namespace stakematch
