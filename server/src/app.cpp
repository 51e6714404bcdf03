/*
 * 설명: 서버 수명주기와 리스닝 스레드, 시작 시 복구와 주기 작업 등록을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_flow_test.cpp
 */
#include "stakematch/app.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "stakematch/schema.hpp"

namespace stakematch {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const HttpServices> services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), services_(std::move(services)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const HttpServices> services_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  runtime_config_ = std::make_shared<RuntimeConfigRepository>(db_client_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Bootstrap() {
  EnsureSchema(*db_client_);
  runtime_config_->SeedDefaults(config_);
  runtime_config_->ApplyTo(config_);
  BuildServices();
  // 캐시가 비었을 때만 채우므로 여러 인스턴스가 동시에 떠도 중복 적재되지 않는다.
  recovery_->RehydrateQueue();
  recovery_->RehydrateSessions();
}

void ServerApp::BuildServices() {
  ledger_ = std::make_shared<LedgerService>(db_client_);
  players_ = std::make_shared<PlayerDirectory>(db_client_);
  queue_repository_ = std::make_shared<QueueRepository>(db_client_);
  session_repository_ = std::make_shared<SessionRepository>(db_client_);
  operational_queue_ = std::make_shared<InMemoryOperationalQueue>();
  activity_store_ = std::make_shared<InMemoryActivityStore>();
  registry_ = std::make_shared<SessionRegistry>();
  outbox_ = std::make_shared<NotificationOutbox>(std::make_shared<LoggingNotificationSink>(observability_),
                                                 observability_);

  LifecycleSettings lifecycle_settings;
  lifecycle_settings.tax_percent = config_.payout_tax_percent;
  lifecycle_settings.idle_warning = std::chrono::seconds(config_.idle_warning_seconds);
  lifecycle_settings.idle_forfeit = std::chrono::seconds(config_.idle_forfeit_seconds);
  lifecycle_ = std::make_shared<SessionLifecycleManager>(db_client_, ledger_, session_repository_, players_, registry_,
                                                         outbox_, activity_store_, observability_, lifecycle_settings);

  PairingSettings pairing_settings;
  pairing_settings.max_attempts = config_.pairing_max_attempts;
  pairing_settings.race_delay = std::chrono::milliseconds(config_.pairing_race_delay_ms);
  pairing_settings.default_ttl = std::chrono::seconds(config_.queue_ttl_seconds);
  pairing_settings.game_expiry = std::chrono::seconds(config_.game_expiry_seconds);
  pairing_ = std::make_shared<PairingService>(db_client_, ledger_, queue_repository_, session_repository_,
                                              operational_queue_, lifecycle_, outbox_, observability_,
                                              pairing_settings);

  IdleSettings idle_settings;
  idle_settings.warning = std::chrono::seconds(config_.idle_warning_seconds);
  idle_settings.forfeit = std::chrono::seconds(config_.idle_forfeit_seconds);
  idle_settings.disconnect_grace = std::chrono::seconds(config_.disconnect_grace_seconds);
  idle_worker_ = std::make_shared<IdleWorker>(activity_store_, lifecycle_, outbox_, observability_, idle_settings);

  recovery_ = std::make_shared<RecoveryJobs>(queue_repository_, session_repository_, operational_queue_, lifecycle_,
                                             outbox_, observability_);
}

void ServerApp::ScheduleSweeps() {
  using std::chrono::milliseconds;
  using std::chrono::seconds;
  scheduler_ = std::make_shared<SweepScheduler>(ioc_, observability_);
  auto lifecycle = lifecycle_;
  auto idle_worker = idle_worker_;
  auto recovery = recovery_;
  auto outbox = outbox_;
  const auto visibility = seconds(config_.queue_processing_visibility_seconds);

  scheduler_->Add("session_expiry", seconds(config_.session_sweep_interval_seconds),
                  [lifecycle]() { lifecycle->SweepExpiredSessions(); });
  scheduler_->Add("disconnect_sweep", seconds(config_.disconnect_sweep_interval_seconds),
                  [idle_worker]() { idle_worker->DisconnectSweep(std::chrono::system_clock::now()); });
  scheduler_->Add("idle_poll", milliseconds(config_.idle_poll_interval_ms),
                  [idle_worker]() { idle_worker->PollOnce(std::chrono::system_clock::now()); });
  scheduler_->Add("queue_expiry", seconds(config_.queue_sweep_interval_seconds),
                  [recovery]() { recovery->SweepExpiredQueue(); });
  scheduler_->Add("stuck_processing", seconds(config_.stuck_sweep_interval_seconds), [recovery, visibility]() {
    recovery->SweepStuckProcessing(std::chrono::system_clock::now(), visibility);
  });
  scheduler_->Add("notifier", milliseconds(config_.notifier_interval_ms), [outbox]() { outbox->Drain(); });
  scheduler_->Start();
}

void ServerApp::Run() {
  try {
    running_ = true;
    Bootstrap();
    auto services = std::make_shared<HttpServices>();
    services->config = config_;
    services->identity = players_;
    services->players = players_;
    services->ledger = ledger_;
    services->pairing = pairing_;
    services->lifecycle = lifecycle_;
    services->operational_queue = operational_queue_;
    services->runtime_config = runtime_config_;
    services->observability = observability_;

    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, services);
    listener_->Run();
    ScheduleSweeps();
    observability_->Info("server.started", {{"port", config_.port}, {"taxPercent", config_.payout_tax_percent}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    throw;
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(2u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (scheduler_) {
    scheduler_->Stop();
  }
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace stakematch
