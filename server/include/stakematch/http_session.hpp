/*
 * 설명: HTTP 연결을 처리하고 대기열/세션/운영 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "stakematch/api_response.hpp"
#include "stakematch/config.hpp"
#include "stakematch/ledger.hpp"
#include "stakematch/observability.hpp"
#include "stakematch/operational_queue.hpp"
#include "stakematch/pairing_service.hpp"
#include "stakematch/player_directory.hpp"
#include "stakematch/runtime_config.hpp"
#include "stakematch/session_lifecycle.hpp"

namespace stakematch {

// ServerApp이 한 번 만들어 모든 연결에 공유한다.
struct HttpServices {
  AppConfig config;
  std::shared_ptr<IdentityResolver> identity;
  std::shared_ptr<PlayerDirectory> players;
  std::shared_ptr<LedgerService> ledger;
  std::shared_ptr<PairingService> pairing;
  std::shared_ptr<SessionLifecycleManager> lifecycle;
  std::shared_ptr<OperationalQueue> operational_queue;
  std::shared_ptr<RuntimeConfigRepository> runtime_config;
  std::shared_ptr<Observability> observability;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const HttpServices> services);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleQueueJoin(Response& res);
  void HandlePrivateJoin(Response& res);
  void HandleQueueCancel(Response& res);
  void HandleQueueRequeue(Response& res);
  void HandlePlayerStats(Response& res, const std::string& identity);
  void HandleSessionAction(Response& res, std::int64_t session_id, const std::string& action);
  void HandleConnection(Response& res);
  void HandleOps(Response& res, const std::string& path);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const HttpServices> services_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace stakematch
