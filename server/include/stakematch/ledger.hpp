/*
 * 설명: 복식부기 계정과 원자적 이체를 MariaDB 위에서 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ledger_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "stakematch/db_client.hpp"

namespace stakematch {

enum class AccountType { kPlayerFunds, kPlayerWinnings, kPlatform, kEscrow, kTax, kSettlement };

std::string ToString(AccountType type);
AccountType ParseAccountType(const std::string& text);

struct Account {
  std::int64_t id;
  AccountType type;
  std::optional<std::int64_t> owner_player_id;
  std::int64_t balance;
};

// 이체 참조 유형. account_transactions.reference_type 컬럼에 그대로 저장된다.
constexpr const char* kRefSession = "SESSION";
constexpr const char* kRefDeposit = "DEPOSIT";

class LedgerService {
 public:
  explicit LedgerService(std::shared_ptr<MariaDbClient> db_client);

  Account GetOrCreateAccount(AccountType type, std::optional<std::int64_t> owner);
  Account GetOrCreateAccountInTx(MYSQL* conn, AccountType type, std::optional<std::int64_t> owner);

  // 호출자 트랜잭션 안에서만 사용한다. 두 계정을 id 오름차순으로 잠근다.
  void Transfer(MYSQL* conn, std::int64_t from_account_id, std::int64_t to_account_id, std::int64_t amount,
                const std::string& reference_type, std::optional<std::int64_t> reference_id,
                const std::string& description);

  // 외부 결제 단계가 예약한 금액을 SETTLEMENT에서 플레이어 자금 계정으로 옮긴다.
  void Deposit(std::int64_t player_id, std::int64_t amount, std::optional<std::int64_t> reference_id);

  std::int64_t GetBalance(AccountType type, std::optional<std::int64_t> owner);
  std::int64_t NetEscrowForSession(std::int64_t session_id);
  std::size_t TransactionCount();

 private:
  std::optional<Account> FindAccount(MYSQL* conn, AccountType type, std::int64_t owner_key, bool for_update);
  Account LockAccount(MYSQL* conn, std::int64_t account_id);

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace stakematch
