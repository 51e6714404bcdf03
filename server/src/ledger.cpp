/*
 * 설명: 계정 지연 생성, 고정 순서 락을 사용하는 이체, 감사 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ledger_it_test.cpp
 */
#include "stakematch/ledger.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "stakematch/errors.hpp"

namespace stakematch {
namespace {
std::int64_t OwnerKey(std::optional<std::int64_t> owner) { return owner ? *owner : 0; }

Account BuildAccount(MYSQL_ROW row) {
  std::int64_t owner = ToInt64(row[2]);
  return Account{ToInt64(row[0]), ParseAccountType(row[1] ? row[1] : ""),
                 owner == 0 ? std::nullopt : std::optional<std::int64_t>(owner), ToInt64(row[3])};
}
}  // namespace

std::string ToString(AccountType type) {
  switch (type) {
    case AccountType::kPlayerFunds:
      return "PLAYER_FUNDS";
    case AccountType::kPlayerWinnings:
      return "PLAYER_WINNINGS";
    case AccountType::kPlatform:
      return "PLATFORM";
    case AccountType::kEscrow:
      return "ESCROW";
    case AccountType::kTax:
      return "TAX";
    case AccountType::kSettlement:
      return "SETTLEMENT";
  }
  return "PLATFORM";
}

AccountType ParseAccountType(const std::string& text) {
  if (text == "PLAYER_FUNDS") {
    return AccountType::kPlayerFunds;
  }
  if (text == "PLAYER_WINNINGS") {
    return AccountType::kPlayerWinnings;
  }
  if (text == "ESCROW") {
    return AccountType::kEscrow;
  }
  if (text == "TAX") {
    return AccountType::kTax;
  }
  if (text == "SETTLEMENT") {
    return AccountType::kSettlement;
  }
  if (text == "PLATFORM") {
    return AccountType::kPlatform;
  }
  throw std::invalid_argument("알 수 없는 계정 유형: " + text);
}

LedgerService::LedgerService(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

Account LedgerService::GetOrCreateAccount(AccountType type, std::optional<std::int64_t> owner) {
  std::optional<Account> account;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { account = GetOrCreateAccountInTx(conn, type, owner); });
  return *account;
}

Account LedgerService::GetOrCreateAccountInTx(MYSQL* conn, AccountType type, std::optional<std::int64_t> owner) {
  std::int64_t owner_key = OwnerKey(owner);
  if (auto existing = FindAccount(conn, type, owner_key, false)) {
    return *existing;
  }
  std::ostringstream insert;
  insert << "INSERT INTO accounts(account_type, owner_player_id, balance, created_at, updated_at) VALUES('"
         << ToString(type) << "', " << owner_key << ", 0, NOW(6), NOW(6));";
  if (mysql_query(conn, insert.str().c_str()) != 0) {
    // 동시에 최초 생성한 쪽이 이겼다. 유니크 제약이 중복을 막으므로 다시 읽는다.
    if (mysql_errno(conn) != kDuplicateEntry) {
      db_client_->RaiseError(conn, "계정 생성 실패");
    }
  }
  // 일반 SELECT는 트랜잭션 스냅샷을 보므로 방금 커밋된 상대의 행이 보이지 않는다. 잠금 읽기로 최신 행을 읽는다.
  auto created = FindAccount(conn, type, owner_key, true);
  if (!created) {
    throw EntityNotFoundError("계정 생성 후 조회 실패: " + ToString(type));
  }
  return *created;
}

std::optional<Account> LedgerService::FindAccount(MYSQL* conn, AccountType type, std::int64_t owner_key,
                                                  bool for_update) {
  std::ostringstream oss;
  oss << "SELECT id, account_type, owner_player_id, balance FROM accounts WHERE account_type='" << ToString(type)
      << "' AND owner_player_id=" << owner_key << (for_update ? " FOR UPDATE;" : ";");
  std::optional<Account> result;
  db_client_->QueryRows(conn, oss.str(), "계정 조회 실패", [&](MYSQL_ROW row) { result = BuildAccount(row); });
  return result;
}

Account LedgerService::LockAccount(MYSQL* conn, std::int64_t account_id) {
  std::ostringstream oss;
  oss << "SELECT id, account_type, owner_player_id, balance FROM accounts WHERE id=" << account_id << " FOR UPDATE;";
  std::optional<Account> result;
  db_client_->QueryRows(conn, oss.str(), "계정 잠금 실패", [&](MYSQL_ROW row) { result = BuildAccount(row); });
  if (!result) {
    throw EntityNotFoundError("이체 대상 계정이 없습니다: " + std::to_string(account_id));
  }
  return *result;
}

void LedgerService::Transfer(MYSQL* conn, std::int64_t from_account_id, std::int64_t to_account_id,
                             std::int64_t amount, const std::string& reference_type,
                             std::optional<std::int64_t> reference_id, const std::string& description) {
  if (amount <= 0) {
    throw std::invalid_argument("이체 금액은 양수여야 합니다");
  }
  if (from_account_id == to_account_id) {
    throw std::invalid_argument("같은 계정 간 이체는 허용되지 않습니다");
  }

  std::int64_t first_id = std::min(from_account_id, to_account_id);
  std::int64_t second_id = std::max(from_account_id, to_account_id);
  Account first = LockAccount(conn, first_id);
  Account second = LockAccount(conn, second_id);
  const Account& from = first.id == from_account_id ? first : second;

  if (from.type != AccountType::kSettlement && from.balance < amount) {
    throw InsufficientFundsError(from.id, amount, from.balance);
  }

  std::ostringstream debit;
  debit << "UPDATE accounts SET balance = balance - " << amount << ", updated_at = NOW(6) WHERE id=" << from_account_id
        << ";";
  db_client_->Execute(conn, debit.str(), "출금 갱신 실패");

  std::ostringstream credit;
  credit << "UPDATE accounts SET balance = balance + " << amount << ", updated_at = NOW(6) WHERE id=" << to_account_id
         << ";";
  db_client_->Execute(conn, credit.str(), "입금 갱신 실패");

  std::ostringstream record;
  record << "INSERT INTO account_transactions(debit_account_id, credit_account_id, amount, reference_type, "
            "reference_id, description, created_at) VALUES("
         << from_account_id << ", " << to_account_id << ", " << amount << ", '"
         << db_client_->Escape(conn, reference_type) << "', "
         << (reference_id ? std::to_string(*reference_id) : std::string("NULL")) << ", '"
         << db_client_->Escape(conn, description) << "', NOW(6));";
  db_client_->Execute(conn, record.str(), "이체 기록 실패");
}

void LedgerService::Deposit(std::int64_t player_id, std::int64_t amount, std::optional<std::int64_t> reference_id) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto settlement = GetOrCreateAccountInTx(conn, AccountType::kSettlement, std::nullopt);
    auto funds = GetOrCreateAccountInTx(conn, AccountType::kPlayerFunds, player_id);
    Transfer(conn, settlement.id, funds.id, amount, kRefDeposit, reference_id, "Stake reserved upstream");
    return true;
  });
}

std::int64_t LedgerService::GetBalance(AccountType type, std::optional<std::int64_t> owner) {
  std::int64_t balance = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto account = FindAccount(conn, type, OwnerKey(owner), false);
    balance = account ? account->balance : 0;
  });
  return balance;
}

std::int64_t LedgerService::NetEscrowForSession(std::int64_t session_id) {
  std::int64_t net = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT COALESCE(SUM(CASE WHEN t.credit_account_id = a.id THEN t.amount ELSE -t.amount END), 0) "
           "FROM account_transactions t JOIN accounts a ON a.account_type='ESCROW' AND a.owner_player_id=0 "
           "WHERE t.reference_type='"
        << kRefSession << "' AND t.reference_id=" << session_id
        << " AND (t.credit_account_id = a.id OR t.debit_account_id = a.id);";
    net = db_client_->QueryInt(conn, oss.str(), "에스크로 합계 조회 실패").value_or(0);
  });
  return net;
}

std::size_t LedgerService::TransactionCount() {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    count = static_cast<std::size_t>(
        db_client_->QueryInt(conn, "SELECT COUNT(*) FROM account_transactions;", "이체 건수 조회 실패").value_or(0));
  });
  return count;
}

}  // namespace stakematch
