/*
 * 설명: 서버 수명주기, 리스닝 스레드, 리더보드 서비스 조립을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp
 */
#include "leaderboard/app.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "leaderboard/db_client.hpp"
#include "leaderboard/http_session.hpp"
#include "leaderboard/mariadb_record_store.hpp"
#include "leaderboard/mariadb_snapshot_store.hpp"
#include "leaderboard/memory_cache_backend.hpp"

namespace leaderboard {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<QueryService> query_service, std::shared_ptr<CacheLayer> cache,
           std::shared_ptr<SnapshotService> snapshot_service,
           std::shared_ptr<LeaderboardEventConsumer> event_consumer, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        query_service_(std::move(query_service)), cache_(std::move(cache)),
        snapshot_service_(std::move(snapshot_service)), event_consumer_(std::move(event_consumer)),
        observability_(std::move(observability)) {
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
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->query_service_, self->cache_,
                                          self->snapshot_service_, self->event_consumer_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<QueryService> query_service_;
  std::shared_ptr<CacheLayer> cache_;
  std::shared_ptr<SnapshotService> snapshot_service_;
  std::shared_ptr<LeaderboardEventConsumer> event_consumer_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  DbConfig db_config{config.db_host,
                     config.db_port,
                     config.db_user,
                     config.db_password,
                     config.db_name,
                     config.db_connect_timeout_seconds,
                     config.db_query_timeout_seconds};
  auto db_client = std::make_shared<MariaDbClient>(db_config);
  records_ = std::make_shared<MariaDbRecordStore>(db_client);
  snapshots_ = std::make_shared<MariaDbSnapshotStore>(db_client);
  cache_backend_ = std::make_shared<MemoryCacheBackend>(config.cache_max_entries);
  Assemble();
}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<RecordStore> records,
                     std::shared_ptr<SnapshotStore> snapshots, std::shared_ptr<CacheBackend> cache_backend,
                     std::shared_ptr<Observability> observability)
    : config_(config),
      ioc_(1),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      observability_(observability ? std::move(observability)
                                   : std::make_shared<Observability>(ParseLogLevel(config.log_level))),
      records_(std::move(records)),
      snapshots_(std::move(snapshots)),
      cache_backend_(std::move(cache_backend)) {
  Assemble();
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Assemble() {
  if (config_.scoring_tables_path.empty()) {
    scoring_ = std::make_shared<ScoringRegistry>();
  } else {
    scoring_ = std::make_shared<ScoringRegistry>(LoadScoringRegistryFromFile(config_.scoring_tables_path));
  }
  const auto cache_timeout = std::chrono::milliseconds(config_.cache_timeout_ms);
  computer_ = std::make_shared<LeaderboardComputer>(records_, scoring_, observability_);
  cache_ = std::make_shared<CacheLayer>(cache_backend_, computer_, config_.flags, config_.cache_ttl, observability_);
  query_service_ = std::make_shared<QueryService>(cache_, snapshots_, cache_timeout);

  SnapshotServiceOptions options;
  for (const auto& scope_text : config_.snapshot_scopes) {
    options.tracked_scopes.push_back(ParseScopeSpec(scope_text));
  }
  options.retention_days = config_.snapshot_retention_days;
  options.cache_timeout = cache_timeout;
  snapshot_service_ =
      std::make_shared<SnapshotService>(computer_, snapshots_, records_, cache_, options, observability_);
  scheduler_ = std::make_shared<SnapshotScheduler>(
      ioc_, snapshot_service_, std::chrono::seconds(config_.snapshot_interval_seconds), observability_);
  event_consumer_ = std::make_shared<LeaderboardEventConsumer>(cache_, cache_timeout, observability_);
}

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, query_service_, cache_, snapshot_service_,
                                           event_consumer_, observability_);
    listener_->Run();
    if (config_.snapshot_interval_seconds > 0) {
      scheduler_->Start();
    }
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
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

}  // namespace leaderboard
