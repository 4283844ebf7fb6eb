/*
 * 설명: HTTP 요청을 리더보드 조회/이력/운영 엔드포인트로 분기하고 예외를 오류 엔벨로프로 변환한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp
 */
#include "leaderboard/http_session.hpp"

#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

#include <boost/beast/version.hpp>

#include "leaderboard/api_response.hpp"
#include "leaderboard/db_client.hpp"
#include "leaderboard/errors.hpp"

namespace leaderboard {

namespace {
QueryParams ParseQueryParams(const std::string& query) {
  QueryParams params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && eq + 1 <= pair.size()) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  if (value.empty() || value[0] == '-' || value[0] == '+') {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos < path.size()) {
    auto slash = path.find('/', pos);
    auto segment = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}

std::optional<std::string> OptionalParam(const QueryParams& query, const std::string& key) {
  auto it = query.find(key);
  if (it == query.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

// limit/offset은 범위를 벗어나면 leaderboard_range로 응답한다.
int PageParam(const QueryParams& query, const std::string& key, int fallback) {
  auto it = query.find(key);
  if (it == query.end()) {
    return fallback;
  }
  auto parsed = ParsePositiveInt(it->second);
  if (!parsed || *parsed > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::out_of_range(key + " 값이 허용 범위를 벗어났습니다");
  }
  return static_cast<int>(*parsed);
}

std::int64_t IdSegment(const std::string& segment, const std::string& name) {
  auto parsed = ParsePositiveInt(segment);
  if (!parsed || *parsed == 0 ||
      *parsed > static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max())) {
    throw ConfigurationError(name + "가 올바르지 않습니다: " + segment);
  }
  return static_cast<std::int64_t>(*parsed);
}

std::optional<std::string> OptionalString(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) {
    return std::nullopt;
  }
  return body[key].get<std::string>();
}

std::optional<std::int64_t> OptionalInt(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) {
    return std::nullopt;
  }
  return body[key].get<std::int64_t>();
}

void WriteJson(HttpResponse& res, boost::beast::http::status status, const nlohmann::json& envelope) {
  res.result(status);
  res.body() = envelope.dump();
  res.content_length(res.body().size());
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<QueryService> query_service, std::shared_ptr<CacheLayer> cache,
                         std::shared_ptr<SnapshotService> snapshot_service,
                         std::shared_ptr<LeaderboardEventConsumer> event_consumer,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), query_service_(std::move(query_service)),
      cache_(std::move(cache)), snapshot_service_(std::move(snapshot_service)),
      event_consumer_(std::move(event_consumer)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
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
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<HttpResponse>();
  res->version(req_.version());
  res->set(http::field::server, "leaderboard-engine");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  try {
    Route(path, ParseQueryParams(query), *res);
  } catch (const ConfigurationError& e) {
    WriteJson(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", e.what()));
  } catch (const std::out_of_range& e) {
    WriteJson(*res, http::status::bad_request, MakeErrorEnvelope("leaderboard_range", e.what()));
  } catch (const nlohmann::json::exception&) {
    WriteJson(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  } catch (const DbException& e) {
    nlohmann::json detail{{"dbCode", e.code}, {"retryable", e.retryable}};
    WriteJson(*res, http::status::internal_server_error,
              MakeErrorEnvelope("internal_error", "기록 저장소를 조회하지 못했습니다", detail));
  } catch (const std::exception& e) {
    WriteJson(*res, http::status::internal_server_error, MakeErrorEnvelope("internal_error", e.what()));
  }
  SendResponse(res);
}

void HttpSession::Route(const std::string& path, const QueryParams& query, HttpResponse& res) {
  using namespace boost::beast;
  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"},
                           {"version", "v1.1.0"},
                           {"computeEnabled", config_.flags.compute_enabled},
                           {"cacheEnabled", config_.flags.cache_enabled},
                           {"apiEnabled", config_.flags.api_enabled}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(MetricsToJson(observability_->Snapshot())));
  }

  if (path.rfind("/api/leaderboards/", 0) == 0) {
    if (!config_.flags.api_enabled) {
      return WriteJson(res, http::status::not_found,
                       MakeErrorEnvelope("not_found", "리더보드 API가 비활성화되어 있습니다"));
    }
    if (req_.method() != http::verb::get) {
      return WriteJson(res, http::status::method_not_allowed,
                       MakeErrorEnvelope("method_not_allowed", "GET만 지원합니다"));
    }
    return HandleLeaderboard(path, query, res);
  }

  if (req_.method() == http::verb::post && path.rfind("/ops/leaderboards/", 0) == 0) {
    if (!HasValidOpsToken()) {
      return WriteJson(res, http::status::unauthorized,
                       MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    return HandleOps(path, res);
  }

  WriteJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleLeaderboard(const std::string& path, const QueryParams& query, HttpResponse& res) {
  using namespace boost::beast;
  auto segments = SplitPath(path);
  // segments[0] == "api", segments[1] == "leaderboards"
  if (segments.size() == 4 && segments[2] == "tournament") {
    auto params = ScopeParams::Tournament(IdSegment(segments[3], "tournamentId"));
    auto page = query_service_->List(params, PageParam(query, "limit", QueryService::kDefaultLimit),
                                     PageParam(query, "offset", 0));
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(PageToJson(page)));
  }

  if (segments.size() == 5 && segments[2] == "player" && segments[4] == "history") {
    auto player_id = IdSegment(segments[3], "playerId");
    ScopeParams params;
    params.scope = ParseScope(OptionalParam(query, "scope").value_or("all_time"));
    if (params.scope == Scope::kTournament) {
      auto tournament_id = OptionalParam(query, "tournamentId");
      if (tournament_id) {
        params.tournament_id = IdSegment(*tournament_id, "tournamentId");
      }
    }
    params.season_id = OptionalParam(query, "seasonId");
    params.game_code = NormalizeGameCode(OptionalParam(query, "gameCode"));
    int days = 0;
    auto days_param = OptionalParam(query, "days");
    if (days_param) {
      auto parsed = ParsePositiveInt(*days_param);
      if (!parsed || *parsed > 3650) {
        throw ConfigurationError("days 값이 올바르지 않습니다: " + *days_param);
      }
      days = static_cast<int>(*parsed);
    }
    auto history = query_service_->History(player_id, params, days);
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(PlayerHistoryToJson(history)));
  }

  if (segments.size() == 3 && (segments[2] == "season" || segments[2] == "all_time")) {
    ScopeParams params;
    params.scope = ParseScope(segments[2]);
    params.game_code = NormalizeGameCode(OptionalParam(query, "gameCode"));
    if (params.scope == Scope::kSeason) {
      params.season_id = OptionalParam(query, "seasonId");
    }
    auto page = query_service_->List(params, PageParam(query, "limit", QueryService::kDefaultLimit),
                                     PageParam(query, "offset", 0));
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(PageToJson(page)));
  }

  WriteJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleOps(const std::string& path, HttpResponse& res) {
  using namespace boost::beast;
  auto body = req_.body().empty() ? nlohmann::json::object() : nlohmann::json::parse(req_.body());

  if (path == "/ops/leaderboards/invalidate") {
    ScopeParams params;
    params.scope = ParseScope(body.at("scope").get<std::string>());
    params.tournament_id = OptionalInt(body, "tournamentId");
    params.season_id = OptionalString(body, "seasonId");
    params.game_code = NormalizeGameCode(OptionalString(body, "gameCode"));
    bool invalidated = cache_->Invalidate(params, std::chrono::milliseconds(config_.cache_timeout_ms));
    nlohmann::json data{{"invalidated", invalidated}, {"key", CacheLayer::CacheKey(params)}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (path == "/ops/leaderboards/snapshot") {
    auto date = OptionalString(body, "date").value_or(ToDateString(std::chrono::system_clock::now()));
    // 잘못된 날짜와 기존 스냅샷보다 이전 날짜는 ConfigurationError(400)로 걸러진다.
    ShiftDate(date, 0);
    auto reports = snapshot_service_->Run(date);
    nlohmann::json items = nlohmann::json::array();
    for (const auto& report : reports) {
      items.push_back(SnapshotReportToJson(report));
    }
    nlohmann::json data{{"date", date}, {"reports", items}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (path == "/ops/leaderboards/events") {
    LeaderboardEvent event;
    event.type = ParseEventType(body.at("event").get<std::string>());
    event.tournament_id = OptionalInt(body, "tournamentId");
    event.season_id = OptionalString(body, "seasonId");
    event.game_code = NormalizeGameCode(OptionalString(body, "gameCode"));
    auto invalidated = event_consumer_->Handle(event);
    nlohmann::json keys = nlohmann::json::array();
    for (const auto& params : invalidated) {
      keys.push_back(CacheLayer::CacheKey(params));
    }
    nlohmann::json data{{"event", EventTypeName(event.type)}, {"invalidated", keys}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  WriteJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

bool HttpSession::HasValidOpsToken() const {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  return !config_.ops_token.empty() && header_token == config_.ops_token;
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res) {
  auto self = shared_from_this();
  if (observability_) {
    auto status = static_cast<unsigned>(res->result_int());
    if (status >= 400) {
      observability_->IncrementError();
    }
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = "http.request";
    ctx.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                           request_start_)
                         .count();
    ctx.level = status >= 500 ? LogLevel::kError : LogLevel::kInfo;
    ctx.fields = {{"method", std::string(req_.method_string())}, {"target", std::string(req_.target())},
                  {"status", status}};
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace leaderboard
