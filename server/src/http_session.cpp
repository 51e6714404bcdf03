/*
 * 설명: HTTP 요청을 파싱해 대기열/세션/운영 엔드포인트로 분기하고 엔벨로프로 응답한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_flow_test.cpp
 */
#include "stakematch/http_session.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "stakematch/errors.hpp"

namespace stakematch {

namespace {
namespace http = boost::beast::http;

void WriteJson(HttpSession::Response& res, http::status status, const nlohmann::json& envelope) {
  auto body = envelope.dump();
  res.result(status);
  res.body() = body;
  res.content_length(body.size());
}

void WriteOk(HttpSession::Response& res, const nlohmann::json& data, http::status status = http::status::ok) {
  WriteJson(res, status, MakeSuccessEnvelope(data));
}

void WriteError(HttpSession::Response& res, const std::string& code, const std::string& message) {
  WriteJson(res, static_cast<http::status>(HttpStatusForError(code)), MakeErrorEnvelope(code, message));
}

nlohmann::json ParseBody(const std::string& body) {
  try {
    auto parsed = nlohmann::json::parse(body.empty() ? std::string("{}") : body);
    if (!parsed.is_object()) {
      throw ServiceError("bad_request", "JSON 객체 본문이 필요합니다");
    }
    return parsed;
  } catch (const nlohmann::json::parse_error&) {
    throw ServiceError("bad_request", "JSON 본문이 올바르지 않습니다");
  }
}

std::string RequireString(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
    throw ServiceError("bad_request", std::string(key) + " 값이 필요합니다");
  }
  return body[key].get<std::string>();
}

std::int64_t RequireInt(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || !body[key].is_number_integer()) {
    throw ServiceError("bad_request", std::string(key) + " 정수 값이 필요합니다");
  }
  return body[key].get<std::int64_t>();
}

std::optional<std::int64_t> OptionalInt(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) {
    return std::nullopt;
  }
  return RequireInt(body, key);
}

nlohmann::json PairingToJson(const PairingResult& result, std::int64_t player_id) {
  nlohmann::json data{{"playerId", player_id},
                      {"queueId", result.queue_id},
                      {"state", result.state},
                      {"matched", result.matched}};
  if (result.match_code) {
    data["matchCode"] = *result.match_code;
  }
  if (result.session_id) {
    data["sessionId"] = *result.session_id;
  }
  if (result.session_token) {
    data["sessionToken"] = *result.session_token;
  }
  if (result.opponent_player_id) {
    data["opponentPlayerId"] = *result.opponent_player_id;
  }
  return data;
}

// "/api/sessions/{id}/{action}"
bool ParseSessionPath(const std::string& path, std::int64_t& session_id, std::string& action) {
  const std::string prefix = "/api/sessions/";
  if (path.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  auto rest = path.substr(prefix.size());
  auto slash = rest.find('/');
  if (slash == std::string::npos || slash == 0) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    session_id = std::stoll(rest.substr(0, slash), &consumed);
    if (consumed != slash || session_id <= 0) {
      return false;
    }
  } catch (const std::logic_error&) {
    return false;
  }
  action = rest.substr(slash + 1);
  return !action.empty();
}

// "/api/players/{identity}/stats"
bool ParsePlayerStatsPath(const std::string& path, std::string& identity) {
  const std::string prefix = "/api/players/";
  const std::string suffix = "/stats";
  if (path.size() <= prefix.size() + suffix.size() || path.compare(0, prefix.size(), prefix) != 0 ||
      path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return false;
  }
  identity = path.substr(prefix.size(), path.size() - prefix.size() - suffix.size());
  return identity.find('/') == std::string::npos;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const HttpServices> services)
    : stream_(std::move(socket)), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  const auto& observability = services_->observability;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability->NextTraceId();
  observability->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "stakematch");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }
  const auto method = req_.method();

  try {
    std::int64_t session_id = 0;
    std::string action;
    std::string identity;
    if (method == http::verb::get && path == "/api/health") {
      WriteOk(*res, {{"status", "ok"}, {"version", "v1.0.0"}});
    } else if (method == http::verb::get && path == "/metrics") {
      std::size_t queue_length = 0;
      bool cache_available = true;
      try {
        queue_length = services_->operational_queue->TotalLength();
      } catch (const CacheUnavailableError&) {
        cache_available = false;
      }
      auto snapshot = observability->Snapshot(services_->lifecycle->GetActiveGameCount(), queue_length);
      WriteOk(*res, {{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                     {"pairing",
                      {{"matched", snapshot.pairings},
                       {"claimRaces", snapshot.claim_races},
                       {"degradedClaims", snapshot.degraded_claims}}},
                     {"settlement",
                      {{"payouts", snapshot.payouts}, {"refunds", snapshot.refunds}, {"forfeits", snapshot.forfeits}}},
                     {"sessions", {{"active", snapshot.active_sessions}}},
                     {"queue", {{"length", snapshot.queue_length}, {"cacheAvailable", cache_available}}}});
    } else if (method == http::verb::post && path == "/api/queue/join") {
      HandleQueueJoin(*res);
    } else if (method == http::verb::post && path == "/api/queue/private/join") {
      HandlePrivateJoin(*res);
    } else if (method == http::verb::post && path == "/api/queue/cancel") {
      HandleQueueCancel(*res);
    } else if (method == http::verb::post && path == "/api/queue/requeue") {
      HandleQueueRequeue(*res);
    } else if (method == http::verb::get && ParsePlayerStatsPath(path, identity)) {
      HandlePlayerStats(*res, identity);
    } else if (method == http::verb::get && path == "/api/queue/status") {
      nlohmann::json stakes = nlohmann::json::array();
      for (const auto& [stake, waiting] : services_->pairing->GetQueueStatus()) {
        stakes.push_back({{"stake", stake}, {"waiting", waiting}});
      }
      WriteOk(*res, {{"stakes", stakes}, {"activeGames", services_->lifecycle->GetActiveGameCount()}});
    } else if (method == http::verb::post && path == "/api/players/connection") {
      HandleConnection(*res);
    } else if (method == http::verb::post && ParseSessionPath(path, session_id, action)) {
      HandleSessionAction(*res, session_id, action);
    } else if (path.compare(0, 5, "/ops/") == 0) {
      HandleOps(*res, path);
    } else {
      WriteError(*res, "not_found", "지원되지 않는 경로입니다");
    }
  } catch (const ServiceError& ex) {
    WriteError(*res, ex.code(), ex.what());
  } catch (const std::invalid_argument& ex) {
    WriteError(*res, "bad_request", ex.what());
  } catch (const std::exception& ex) {
    observability->Error("http.unhandled", {{"traceId", trace_id_}, {"path", path}, {"error", ex.what()}});
    WriteError(*res, "internal_error", "요청 처리 중 오류가 발생했습니다");
  }
  SendResponse(res);
}

void HttpSession::HandleQueueJoin(Response& res) {
  auto body = ParseBody(req_.body());
  auto identity = RequireString(body, "identity");
  std::string display_name = body.contains("displayName") && body["displayName"].is_string()
                                 ? body["displayName"].get<std::string>()
                                 : std::string();
  auto stake = RequireInt(body, "stake");
  bool is_private = false;
  if (body.contains("private")) {
    if (!body["private"].is_boolean()) {
      throw ServiceError("bad_request", "private 값이 올바르지 않습니다");
    }
    is_private = body["private"].get<bool>();
  }
  std::optional<std::chrono::seconds> ttl;
  if (auto ttl_seconds = OptionalInt(body, "ttlSeconds")) {
    if (*ttl_seconds < 0) {
      throw ServiceError("bad_request", "ttlSeconds 값이 올바르지 않습니다");
    }
    ttl = std::chrono::seconds(*ttl_seconds);
  }
  if (stake < services_->config.min_stake_amount) {
    throw ServiceError("bad_request", "최소 스테이크 금액보다 작습니다");
  }

  auto player = services_->identity->Resolve(identity, display_name);
  // 결제 예약 단계가 스테이크를 플레이어 자금 계정에 넣어 둔다.
  services_->ledger->Deposit(player.id, stake, std::nullopt);

  if (is_private) {
    auto entry = services_->pairing->Enqueue(player.id, stake, ttl, true);
    WriteOk(res, {{"playerId", player.id},
                  {"queueId", entry.id},
                  {"state", "searching"},
                  {"matched", false},
                  {"matchCode", entry.match_code.value_or("")}},
            http::status::created);
    return;
  }
  auto result = services_->pairing->JoinQueue(player.id, stake, ttl);
  if (!result.error_code.empty()) {
    WriteError(res, result.error_code, result.error_message);
    return;
  }
  WriteOk(res, PairingToJson(result, player.id));
}

void HttpSession::HandlePrivateJoin(Response& res) {
  auto body = ParseBody(req_.body());
  auto identity = RequireString(body, "identity");
  auto code = RequireString(body, "code");
  auto stake = RequireInt(body, "stake");
  if (stake < services_->config.min_stake_amount) {
    throw ServiceError("bad_request", "최소 스테이크 금액보다 작습니다");
  }
  auto player = services_->identity->Resolve(identity, "");
  services_->ledger->Deposit(player.id, stake, std::nullopt);
  auto result = services_->pairing->JoinPrivateByCode(player.id, stake, code);
  if (!result.error_code.empty()) {
    WriteError(res, result.error_code, result.error_message);
    return;
  }
  WriteOk(res, PairingToJson(result, player.id));
}

void HttpSession::HandleQueueCancel(Response& res) {
  auto body = ParseBody(req_.body());
  auto player = services_->identity->Resolve(RequireString(body, "identity"), "");
  auto queue_id = RequireInt(body, "queueId");
  if (!services_->pairing->CancelQueueEntry(queue_id, player.id)) {
    WriteError(res, "not_found", "취소할 수 있는 대기열 항목이 없습니다");
    return;
  }
  WriteOk(res, {{"queueId", queue_id}, {"cancelled", true}});
}

void HttpSession::HandleQueueRequeue(Response& res) {
  auto body = ParseBody(req_.body());
  auto player = services_->identity->Resolve(RequireString(body, "identity"), "");
  auto queue_id = OptionalInt(body, "queueId");
  auto stake = OptionalInt(body, "stake");
  if (stake && *stake < services_->config.min_stake_amount) {
    throw ServiceError("bad_request", "최소 스테이크 금액보다 작습니다");
  }
  std::optional<std::chrono::seconds> ttl;
  if (auto ttl_seconds = OptionalInt(body, "ttlSeconds")) {
    if (*ttl_seconds < 0) {
      throw ServiceError("bad_request", "ttlSeconds 값이 올바르지 않습니다");
    }
    ttl = std::chrono::seconds(*ttl_seconds);
  }
  // 입금 없이 기존 플레이어 자금을 다시 쓴다.
  auto result = services_->pairing->RequeueWithCredit(player.id, queue_id, stake, ttl);
  if (!result.error_code.empty()) {
    WriteError(res, result.error_code, result.error_message);
    return;
  }
  WriteOk(res, PairingToJson(result, player.id));
}

void HttpSession::HandlePlayerStats(Response& res, const std::string& identity) {
  auto profile = services_->players->FindByIdentity(identity);
  if (!profile) {
    // 한 번도 입장하지 않은 신원은 빈 통계로 본다.
    PlayerProfile empty;
    empty.identity = identity;
    profile = empty;
  }
  double win_rate = profile->games_played > 0 ? 100.0 * profile->games_won / profile->games_played : 0.0;
  std::int64_t funds = profile->id > 0 ? services_->ledger->GetBalance(AccountType::kPlayerFunds, profile->id) : 0;
  WriteOk(res, {{"playerId", profile->id},
                {"identity", profile->identity},
                {"displayName", profile->display_name},
                {"gamesPlayed", profile->games_played},
                {"gamesWon", profile->games_won},
                {"gamesDrawn", profile->games_drawn},
                {"gamesLost", profile->games_played - profile->games_won - profile->games_drawn},
                {"totalWinnings", profile->total_winnings},
                {"winRate", win_rate},
                {"funds", funds}});
}

void HttpSession::HandleSessionAction(Response& res, std::int64_t session_id, const std::string& action) {
  auto body = ParseBody(req_.body());
  const auto& lifecycle = services_->lifecycle;

  if (action == "start") {
    if (!lifecycle->MarkStarted(session_id)) {
      WriteError(res, "not_found", "시작할 수 있는 세션이 없습니다");
      return;
    }
    if (auto first_turn = OptionalInt(body, "currentTurnPlayerId")) {
      lifecycle->UpdateTurn(session_id, *first_turn);
    }
    WriteOk(res, {{"sessionId", session_id}, {"status", ToString(SessionStatus::kInProgress)}});
    return;
  }

  if (action == "concede") {
    auto player = services_->identity->Resolve(RequireString(body, "identity"), "");
    auto outcome = lifecycle->Forfeit(session_id, player.id, kWinConcede);
    WriteOk(res, {{"sessionId", session_id}, {"outcome", ToString(outcome)}});
    return;
  }

  if (action == "moves") {
    auto player = services_->identity->Resolve(RequireString(body, "identity"), "");
    auto move_type = RequireString(body, "moveType");
    nlohmann::json payload = body.contains("payload") ? body["payload"] : nlohmann::json::object();
    auto move_number = lifecycle->RecordMove(session_id, player.id, move_type, payload);
    if (!move_number) {
      WriteError(res, "move_rejected", "수를 기록하지 못했습니다");
      return;
    }
    if (auto next_turn = OptionalInt(body, "nextTurnPlayerId")) {
      lifecycle->UpdateTurn(session_id, *next_turn);
    }
    WriteOk(res, {{"sessionId", session_id}, {"moveNumber", *move_number}}, http::status::created);
    return;
  }

  if (action == "result") {
    FinalGameState state;
    state.session_id = session_id;
    state.status = ParseSessionStatus(RequireString(body, "status"));
    state.winner_id = OptionalInt(body, "winnerId");
    if (body.contains("winType") && body["winType"].is_string()) {
      state.win_type = body["winType"].get<std::string>();
    }
    if (body.contains("snapshot")) {
      state.snapshot = body["snapshot"];
    }
    auto outcome = lifecycle->SaveFinalGameState(state);
    WriteOk(res, {{"sessionId", session_id}, {"outcome", ToString(outcome)}});
    return;
  }

  WriteError(res, "not_found", "지원되지 않는 세션 동작입니다");
}

void HttpSession::HandleConnection(Response& res) {
  auto body = ParseBody(req_.body());
  auto player = services_->identity->Resolve(RequireString(body, "identity"), "");
  if (!body.contains("connected") || !body["connected"].is_boolean()) {
    throw ServiceError("bad_request", "connected 값이 필요합니다");
  }
  bool connected = body["connected"].get<bool>();
  bool tracked = connected ? services_->lifecycle->MarkConnected(player.id)
                           : services_->lifecycle->MarkDisconnected(player.id, std::chrono::system_clock::now());
  WriteOk(res, {{"playerId", player.id}, {"connected", connected}, {"tracked", tracked}});
}

void HttpSession::HandleOps(Response& res, const std::string& path) {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  if (services_->config.ops_token.empty() || header_token != services_->config.ops_token) {
    WriteError(res, "unauthorized", "운영 토큰이 올바르지 않습니다");
    return;
  }

  if (req_.method() == http::verb::get && path == "/ops/config") {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : services_->runtime_config->ListAll()) {
      entries.push_back({{"key", entry.key},
                         {"value", entry.value},
                         {"valueType", entry.value_type},
                         {"updatedBy", entry.updated_by ? nlohmann::json(*entry.updated_by) : nlohmann::json()}});
    }
    WriteOk(res, {{"entries", entries}});
    return;
  }
  if (req_.method() == http::verb::post && path == "/ops/config") {
    auto body = ParseBody(req_.body());
    auto key = RequireString(body, "key");
    auto value = RequireString(body, "value");
    std::string updated_by =
        body.contains("updatedBy") && body["updatedBy"].is_string() ? body["updatedBy"].get<std::string>() : "ops";
    if (!services_->runtime_config->Update(key, value, updated_by)) {
      WriteError(res, "not_found", "알 수 없는 설정 키입니다");
      return;
    }
    WriteOk(res, {{"key", key}, {"value", value}, {"appliesOnRestart", true}});
    return;
  }
  if (req_.method() == http::verb::get && path == "/ops/status") {
    std::size_t queue_length = 0;
    try {
      queue_length = services_->operational_queue->TotalLength();
    } catch (const CacheUnavailableError&) {
      queue_length = 0;
    }
    auto snapshot = services_->observability->Snapshot(services_->lifecycle->GetActiveGameCount(), queue_length);
    WriteOk(res, {{"activeSessions", snapshot.active_sessions},
                  {"queueLength", snapshot.queue_length},
                  {"degradedClaims", snapshot.degraded_claims},
                  {"errorCount", snapshot.request_errors}});
    return;
  }
  WriteError(res, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  const auto& observability = services_->observability;
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability->Log(LogContext{trace_id_, std::nullopt, std::nullopt, std::string(req_.target()), latency});
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace stakematch
