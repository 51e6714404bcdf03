// 통합 테스트 공용 조립 코드. DB_* 환경 변수가 가리키는 MariaDB를 매 테스트마다 비운다.
#pragma once

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "stakematch/activity_store.hpp"
#include "stakematch/db_client.hpp"
#include "stakematch/ledger.hpp"
#include "stakematch/notification_outbox.hpp"
#include "stakematch/observability.hpp"
#include "stakematch/operational_queue.hpp"
#include "stakematch/pairing_service.hpp"
#include "stakematch/player_directory.hpp"
#include "stakematch/queue_repository.hpp"
#include "stakematch/recovery_jobs.hpp"
#include "stakematch/schema.hpp"
#include "stakematch/session_lifecycle.hpp"
#include "stakematch/session_registry.hpp"
#include "stakematch/session_repository.hpp"

namespace ittest {

inline stakematch::DbConfig TestDbConfig() {
  stakematch::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

class RecordingSink : public stakematch::NotificationSink {
 public:
  void Deliver(std::int64_t player_id, const std::string& type, const nlohmann::json& payload) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back({player_id, type, payload});
  }

  std::size_t Count(const std::string& type) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& event : events_) {
      if (event.type == type) {
        ++count;
      }
    }
    return count;
  }

 private:
  struct Event {
    std::int64_t player_id;
    std::string type;
    nlohmann::json payload;
  };
  std::vector<Event> events_;
  std::mutex mutex_;
};

class StakeFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    db = std::make_shared<stakematch::MariaDbClient>(TestDbConfig());
    stakematch::EnsureSchema(*db);
    stakematch::TruncateAll(*db);
    observability = std::make_shared<stakematch::Observability>(stakematch::LogLevel::kError);
    ledger = std::make_shared<stakematch::LedgerService>(db);
    players = std::make_shared<stakematch::PlayerDirectory>(db);
    queue_repository = std::make_shared<stakematch::QueueRepository>(db);
    sessions = std::make_shared<stakematch::SessionRepository>(db);
    operational_queue = std::make_shared<stakematch::InMemoryOperationalQueue>();
    activity = std::make_shared<stakematch::InMemoryActivityStore>();
    registry = std::make_shared<stakematch::SessionRegistry>();
    sink = std::make_shared<RecordingSink>();
    outbox = std::make_shared<stakematch::NotificationOutbox>(sink, observability);
    lifecycle = std::make_shared<stakematch::SessionLifecycleManager>(
        db, ledger, sessions, players, registry, outbox, activity, observability, stakematch::LifecycleSettings{});
    pairing_settings.race_delay = std::chrono::milliseconds(5);
    pairing = std::make_shared<stakematch::PairingService>(db, ledger, queue_repository, sessions, operational_queue,
                                                           lifecycle, outbox, observability, pairing_settings);
    recovery = std::make_shared<stakematch::RecoveryJobs>(queue_repository, sessions, operational_queue, lifecycle,
                                                          outbox, observability);
  }

  // 신원을 등록하고 결제 예약 단계처럼 자금을 넣는다.
  std::int64_t FundedPlayer(const std::string& identity, std::int64_t amount) {
    auto profile = players->Resolve(identity, identity);
    if (amount > 0) {
      ledger->Deposit(profile.id, amount, std::nullopt);
    }
    return profile.id;
  }

  std::int64_t Funds(std::int64_t player_id) {
    return ledger->GetBalance(stakematch::AccountType::kPlayerFunds, player_id);
  }
  std::int64_t Winnings(std::int64_t player_id) {
    return ledger->GetBalance(stakematch::AccountType::kPlayerWinnings, player_id);
  }
  std::int64_t Escrow() { return ledger->GetBalance(stakematch::AccountType::kEscrow, std::nullopt); }
  std::int64_t Tax() { return ledger->GetBalance(stakematch::AccountType::kTax, std::nullopt); }

  void Sql(const std::string& statement) {
    db->WithConnectionRetry([&](MYSQL* conn) { db->Execute(conn, statement, "테스트 SQL 실패"); });
  }

  std::int64_t Scalar(const std::string& query) {
    std::int64_t value = 0;
    db->WithConnectionRetry([&](MYSQL* conn) { value = db->QueryInt(conn, query, "테스트 조회 실패").value_or(0); });
    return value;
  }

  // 대기열 입장 후 곧바로 상대와 묶는다.
  stakematch::PairingResult PairTwo(std::int64_t first, std::int64_t second, std::int64_t stake) {
    auto waiting = pairing->JoinQueue(first, stake, std::nullopt);
    EXPECT_FALSE(waiting.matched);
    return pairing->JoinQueue(second, stake, std::nullopt);
  }

  std::shared_ptr<stakematch::MariaDbClient> db;
  std::shared_ptr<stakematch::Observability> observability;
  std::shared_ptr<stakematch::LedgerService> ledger;
  std::shared_ptr<stakematch::PlayerDirectory> players;
  std::shared_ptr<stakematch::QueueRepository> queue_repository;
  std::shared_ptr<stakematch::SessionRepository> sessions;
  std::shared_ptr<stakematch::InMemoryOperationalQueue> operational_queue;
  std::shared_ptr<stakematch::InMemoryActivityStore> activity;
  std::shared_ptr<stakematch::SessionRegistry> registry;
  std::shared_ptr<RecordingSink> sink;
  std::shared_ptr<stakematch::NotificationOutbox> outbox;
  std::shared_ptr<stakematch::SessionLifecycleManager> lifecycle;
  stakematch::PairingSettings pairing_settings;
  std::shared_ptr<stakematch::PairingService> pairing;
  std::shared_ptr<stakematch::RecoveryJobs> recovery;
};

}  // namespace ittest
