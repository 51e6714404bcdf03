#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "stakematch/api_response.hpp"

namespace {

unsigned short ResolvePort() {
  const char* env_port = std::getenv("E2E_LB_PORT");
  return env_port ? static_cast<unsigned short>(std::stoi(env_port)) : 8080;
}

std::string ResolveHost() {
  const char* env_host = std::getenv("E2E_LB_HOST");
  return env_host ? std::string{env_host} : std::string{"127.0.0.1"};
}

std::string ResolveOpsToken() {
  const char* env_token = std::getenv("E2E_OPS_TOKEN");
  return env_token ? std::string{env_token} : std::string{};
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  ASSERT_TRUE(body.contains("success"));
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
  EXPECT_TRUE(body["meta"].is_object());
}

void ExpectErrorEnvelope(const SimpleHttpResponse& res, const std::string& code) {
  ASSERT_TRUE(res.body.is_object());
  EXPECT_FALSE(res.body["success"].get<bool>());
  EXPECT_TRUE(res.body["data"].is_null());
  ASSERT_TRUE(res.body["error"].is_object());
  EXPECT_EQ(res.body["error"]["code"], code);
  EXPECT_EQ(static_cast<unsigned>(res.status), stakematch::HttpStatusForError(code));
}

// 실행마다 다른 신원과 스테이크를 써서 이전 실행이나 다른 테스트의 대기 항목과 섞이지 않게 한다.
std::string UniqueSuffix() {
  auto now = std::chrono::steady_clock::now().time_since_epoch();
  return std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

std::int64_t UniqueStake() {
  auto now = std::chrono::steady_clock::now().time_since_epoch();
  return 100000 + std::chrono::duration_cast<std::chrono::microseconds>(now).count() % 900000;
}

class QueueFlowFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    host_ = ResolveHost();
    port_ = ResolvePort();
    WaitForReady();
  }

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target, const nlohmann::json* body,
                          const std::string& ops_token = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, host_);
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (body) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body->dump();
    }
    if (!ops_token.empty()) {
      req.set("X-Ops-Token", ops_token);
    }
    req.prepare_payload();

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse PostJson(const std::string& target, const nlohmann::json& body) {
    return Send(boost::beast::http::verb::post, target, &body);
  }

  SimpleHttpResponse Get(const std::string& target, const std::string& ops_token = "") {
    return Send(boost::beast::http::verb::get, target, nullptr, ops_token);
  }

  void WaitForReady() {
    for (int attempt = 0; attempt < 30; ++attempt) {
      try {
        auto res = Get("/api/health");
        if (res.status == boost::beast::http::status::ok) {
          return;
        }
      } catch (const std::exception&) {
        // 서버가 아직 뜨지 않았다.
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    FAIL() << "서버가 준비되지 않았습니다: " << host_ << ":" << port_;
  }

  std::string host_;
  unsigned short port_{0};
};

}  // namespace

TEST_F(QueueFlowFixture, HealthReportsVersion) {
  auto res = Get("/api/health");
  EXPECT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_EQ(res.body["data"]["status"], "ok");
}

TEST_F(QueueFlowFixture, TwoPlayersPairPlayAndSettle) {
  const auto suffix = UniqueSuffix();
  const auto stake = UniqueStake();
  const std::string alice = "alice-" + suffix;
  const std::string bob = "bob-" + suffix;

  auto first = PostJson("/api/queue/join", {{"identity", alice}, {"stake", stake}});
  ASSERT_EQ(first.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(first.body);
  EXPECT_FALSE(first.body["data"]["matched"].get<bool>());
  EXPECT_EQ(first.body["data"]["state"], "searching");
  const auto alice_id = first.body["data"]["playerId"].get<std::int64_t>();

  auto status = Get("/api/queue/status");
  ExpectSuccessEnvelope(status.body);
  bool listed = false;
  for (const auto& row : status.body["data"]["stakes"]) {
    if (row["stake"] == stake) {
      listed = true;
      EXPECT_EQ(row["waiting"], 1);
    }
  }
  EXPECT_TRUE(listed);

  auto second = PostJson("/api/queue/join", {{"identity", bob}, {"stake", stake}});
  ASSERT_EQ(second.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(second.body);
  const auto& matched = second.body["data"];
  ASSERT_TRUE(matched["matched"].get<bool>());
  EXPECT_EQ(matched["opponentPlayerId"], alice_id);
  ASSERT_TRUE(matched.contains("sessionToken"));
  const auto session_id = matched["sessionId"].get<std::int64_t>();
  const auto bob_id = matched["playerId"].get<std::int64_t>();
  const std::string base = "/api/sessions/" + std::to_string(session_id);

  auto start = PostJson(base + "/start", {{"currentTurnPlayerId", alice_id}});
  ASSERT_EQ(start.status, boost::beast::http::status::ok);
  EXPECT_EQ(start.body["data"]["status"], "IN_PROGRESS");

  auto move = PostJson(base + "/moves", {{"identity", alice},
                                         {"moveType", "PLACE"},
                                         {"payload", {{"cell", 4}}},
                                         {"nextTurnPlayerId", bob_id}});
  ASSERT_EQ(move.status, boost::beast::http::status::created);
  EXPECT_EQ(move.body["data"]["moveNumber"], 1);

  auto result = PostJson(base + "/result", {{"status", "COMPLETED"},
                                            {"winnerId", alice_id},
                                            {"winType", "normal"},
                                            {"snapshot", {{"board", "x--/-o-/--x"}}}});
  ASSERT_EQ(result.status, boost::beast::http::status::ok);
  EXPECT_EQ(result.body["data"]["outcome"], "applied");

  auto replay = PostJson(base + "/result", {{"status", "COMPLETED"}, {"winnerId", alice_id}});
  ASSERT_EQ(replay.status, boost::beast::http::status::ok);
  EXPECT_EQ(replay.body["data"]["outcome"], "already_processed");

  auto stats = Get("/api/players/" + alice + "/stats");
  ASSERT_EQ(stats.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(stats.body);
  EXPECT_EQ(stats.body["data"]["playerId"], alice_id);
  EXPECT_EQ(stats.body["data"]["gamesPlayed"], 1);
  EXPECT_EQ(stats.body["data"]["gamesWon"], 1);
  EXPECT_EQ(stats.body["data"]["winRate"].get<double>(), 100.0);

  auto metrics = Get("/metrics");
  ExpectSuccessEnvelope(metrics.body);
  EXPECT_GE(metrics.body["data"]["pairing"]["matched"].get<std::uint64_t>(), 1u);
  EXPECT_GE(metrics.body["data"]["settlement"]["payouts"].get<std::uint64_t>(), 1u);
}

TEST_F(QueueFlowFixture, ConcedeAwardsOpponent) {
  const auto suffix = UniqueSuffix();
  const auto stake = UniqueStake();
  PostJson("/api/queue/join", {{"identity", "p1-" + suffix}, {"stake", stake}});
  auto second = PostJson("/api/queue/join", {{"identity", "p2-" + suffix}, {"stake", stake}});
  ASSERT_TRUE(second.body["data"]["matched"].get<bool>());
  const std::string base = "/api/sessions/" + std::to_string(second.body["data"]["sessionId"].get<std::int64_t>());

  PostJson(base + "/start", nlohmann::json::object());
  auto outsider = PostJson(base + "/concede", {{"identity", "outsider-" + suffix}});
  ExpectErrorEnvelope(outsider, "not_participant");

  auto concede = PostJson(base + "/concede", {{"identity", "p2-" + suffix}});
  ASSERT_EQ(concede.status, boost::beast::http::status::ok);
  EXPECT_EQ(concede.body["data"]["outcome"], "applied");
}

TEST_F(QueueFlowFixture, PrivateMatchByCode) {
  const auto suffix = UniqueSuffix();
  const auto stake = UniqueStake();

  auto host = PostJson("/api/queue/join", {{"identity", "host-" + suffix}, {"stake", stake}, {"private", true}});
  ASSERT_EQ(host.status, boost::beast::http::status::created);
  const auto code = host.body["data"]["matchCode"].get<std::string>();
  ASSERT_FALSE(code.empty());

  auto self = PostJson("/api/queue/private/join", {{"identity", "host-" + suffix}, {"stake", stake}, {"code", code}});
  ExpectErrorEnvelope(self, "self_join");

  auto guest = PostJson("/api/queue/private/join", {{"identity", "guest-" + suffix}, {"stake", stake}, {"code", code}});
  ASSERT_EQ(guest.status, boost::beast::http::status::ok);
  EXPECT_TRUE(guest.body["data"]["matched"].get<bool>());

  auto late = PostJson("/api/queue/private/join", {{"identity", "late-" + suffix}, {"stake", stake}, {"code", code}});
  ExpectErrorEnvelope(late, "not_found");
}

TEST_F(QueueFlowFixture, CancelLeavesQueue) {
  const auto suffix = UniqueSuffix();
  const auto stake = UniqueStake();
  auto joined = PostJson("/api/queue/join", {{"identity", "solo-" + suffix}, {"stake", stake}});
  ASSERT_EQ(joined.status, boost::beast::http::status::ok);
  const auto queue_id = joined.body["data"]["queueId"].get<std::int64_t>();

  auto other = PostJson("/api/queue/cancel", {{"identity", "other-" + suffix}, {"queueId", queue_id}});
  ExpectErrorEnvelope(other, "not_found");

  auto cancel = PostJson("/api/queue/cancel", {{"identity", "solo-" + suffix}, {"queueId", queue_id}});
  ASSERT_EQ(cancel.status, boost::beast::http::status::ok);
  EXPECT_TRUE(cancel.body["data"]["cancelled"].get<bool>());
}

TEST_F(QueueFlowFixture, RequeueReusesCreditWithoutDeposit) {
  const auto suffix = UniqueSuffix();
  const auto stake = UniqueStake();
  const std::string solo = "credit-" + suffix;
  auto joined = PostJson("/api/queue/join", {{"identity", solo}, {"stake", stake}});
  ASSERT_EQ(joined.status, boost::beast::http::status::ok);
  PostJson("/api/queue/cancel", {{"identity", solo}, {"queueId", joined.body["data"]["queueId"]}});

  auto requeued = PostJson("/api/queue/requeue", {{"identity", solo}, {"stake", stake}});
  ASSERT_EQ(requeued.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(requeued.body);
  EXPECT_EQ(requeued.body["data"]["state"], "searching");

  auto stats = Get("/api/players/" + solo + "/stats");
  ASSERT_EQ(stats.status, boost::beast::http::status::ok);
  EXPECT_EQ(stats.body["data"]["funds"], stake);
  EXPECT_EQ(stats.body["data"]["gamesPlayed"], 0);

  ExpectErrorEnvelope(PostJson("/api/queue/requeue", {{"identity", solo}, {"stake", stake}}), "insufficient_funds");

  auto unknown = Get("/api/players/nobody-" + suffix + "/stats");
  ASSERT_EQ(unknown.status, boost::beast::http::status::ok);
  EXPECT_EQ(unknown.body["data"]["gamesPlayed"], 0);
}

TEST_F(QueueFlowFixture, RejectsInvalidRequests) {
  const auto suffix = UniqueSuffix();
  ExpectErrorEnvelope(PostJson("/api/queue/join", {{"identity", "tiny-" + suffix}, {"stake", 1}}), "bad_request");
  ExpectErrorEnvelope(PostJson("/api/queue/join", {{"stake", 5000}}), "bad_request");
  ExpectErrorEnvelope(Get("/api/unknown"), "not_found");
  ExpectErrorEnvelope(Get("/ops/status"), "unauthorized");
}

TEST_F(QueueFlowFixture, OpsEndpointsRequireToken) {
  const auto token = ResolveOpsToken();
  if (token.empty()) {
    GTEST_SKIP() << "E2E_OPS_TOKEN이 설정되지 않았습니다";
  }
  auto status = Get("/ops/status", token);
  ASSERT_EQ(status.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(status.body);
  EXPECT_TRUE(status.body["data"].contains("queueLength"));

  auto config = Get("/ops/config", token);
  ASSERT_EQ(config.status, boost::beast::http::status::ok);
  EXPECT_TRUE(config.body["data"]["entries"].is_array());
}
