/*
 * 설명: HTTP 연결을 처리하고 리더보드 조회/이력/운영(무효화, 스냅샷, 이벤트) 엔드포인트를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "leaderboard/cache_layer.hpp"
#include "leaderboard/config.hpp"
#include "leaderboard/event_consumer.hpp"
#include "leaderboard/observability.hpp"
#include "leaderboard/query_service.hpp"
#include "leaderboard/snapshot_service.hpp"

namespace leaderboard {

using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using QueryParams = std::unordered_map<std::string, std::string>;

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<QueryService> query_service, std::shared_ptr<CacheLayer> cache,
              std::shared_ptr<SnapshotService> snapshot_service,
              std::shared_ptr<LeaderboardEventConsumer> event_consumer,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(const std::string& path, const QueryParams& query, HttpResponse& res);
  void HandleLeaderboard(const std::string& path, const QueryParams& query, HttpResponse& res);
  void HandleOps(const std::string& path, HttpResponse& res);
  void SendResponse(std::shared_ptr<HttpResponse> res);
  bool HasValidOpsToken() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<QueryService> query_service_;
  std::shared_ptr<CacheLayer> cache_;
  std::shared_ptr<SnapshotService> snapshot_service_;
  std::shared_ptr<LeaderboardEventConsumer> event_consumer_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace leaderboard
