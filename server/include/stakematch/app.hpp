/*
 * 설명: 서비스 객체를 한 번 조립하고 스키마 준비, 재적재, 주기 작업, HTTP 리스너 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "stakematch/activity_store.hpp"
#include "stakematch/config.hpp"
#include "stakematch/db_client.hpp"
#include "stakematch/http_session.hpp"
#include "stakematch/idle_worker.hpp"
#include "stakematch/ledger.hpp"
#include "stakematch/notification_outbox.hpp"
#include "stakematch/observability.hpp"
#include "stakematch/operational_queue.hpp"
#include "stakematch/pairing_service.hpp"
#include "stakematch/player_directory.hpp"
#include "stakematch/queue_repository.hpp"
#include "stakematch/recovery_jobs.hpp"
#include "stakematch/runtime_config.hpp"
#include "stakematch/scheduler.hpp"
#include "stakematch/session_lifecycle.hpp"
#include "stakematch/session_registry.hpp"
#include "stakematch/session_repository.hpp"

namespace stakematch {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<PairingService> GetPairingService() { return pairing_; }
  std::shared_ptr<SessionLifecycleManager> GetLifecycle() { return lifecycle_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  // runtime_config 반영 이후 설정값으로 서비스를 만든다.
  void Bootstrap();
  void BuildServices();
  void ScheduleSweeps();
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<RuntimeConfigRepository> runtime_config_;
  std::shared_ptr<LedgerService> ledger_;
  std::shared_ptr<PlayerDirectory> players_;
  std::shared_ptr<QueueRepository> queue_repository_;
  std::shared_ptr<SessionRepository> session_repository_;
  std::shared_ptr<OperationalQueue> operational_queue_;
  std::shared_ptr<ActivityStore> activity_store_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<NotificationOutbox> outbox_;
  std::shared_ptr<SessionLifecycleManager> lifecycle_;
  std::shared_ptr<PairingService> pairing_;
  std::shared_ptr<IdleWorker> idle_worker_;
  std::shared_ptr<RecoveryJobs> recovery_;
  std::shared_ptr<SweepScheduler> scheduler_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace stakematch
