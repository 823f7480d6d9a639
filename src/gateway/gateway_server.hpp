#pragma once

#include "config/gate_config.hpp"
#include "gateway/gateway_session.hpp"
#include "health/health_check.hpp"
#include "logger/structured_logger.hpp"
#include "scan/scan_engine.hpp"
#include "stats/security_posture.hpp"
#include "stats/stats_collector.hpp"
#include "stats/uds_server.hpp"
#include "waf/request_filter.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <unordered_map>

// ---------------------------------------------------------------------------
// GatewayServer
//   TCP 리슨 → GatewaySession 생성 → Graceful Shutdown 을 담당하는 메인 서버.
//
//   사용 예:
//     GatewayServer server(config, config_path, scan_mode);
//     server.run(io_ctx);   // io_ctx.run() 은 호출자가 실행
//
//   시그널:
//     SIGTERM / SIGINT → stop()
//     SIGHUP           → reload() : YAML + 환경변수를 다시 읽어 필터 규칙만 교체.
//                        실패하면 기존 규칙 유지.
//
//   암호 키와 업로드/스캔 설정은 프로세스 수명 동안 고정이다.
// ---------------------------------------------------------------------------
class GatewayServer {
public:
    // logger 가 nullptr 이면 run() 에서 server 설정으로 생성한다.
    GatewayServer(GateConfig                        config,
                  std::filesystem::path             config_path,
                  ScanMode                          scan_mode,
                  std::shared_ptr<StructuredLogger> logger = nullptr);

    ~GatewayServer() = default;

    GatewayServer(const GatewayServer&)            = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;
    GatewayServer(GatewayServer&&)                 = delete;
    GatewayServer& operator=(GatewayServer&&)      = delete;

    // run
    //   리스너/운영 채널/health check/시그널 핸들러를 io_ctx 에 등록한다.
    //   listen/upstream 주소를 해석할 수 없으면 std::runtime_error.
    void run(boost::asio::io_context& io_ctx);

    // stop
    //   새 연결 Accept 중단 → 대기 중 세션 close → 세션 0개이면 io_context 중단.
    void stop();

    // reload: SIGHUP 핸들러에서 호출. 성공 여부 반환.
    bool reload();

    [[nodiscard]] SecurityPosture posture() const;

    [[nodiscard]] std::shared_ptr<StatsCollector> stats() const noexcept { return stats_; }
    [[nodiscard]] std::shared_ptr<RequestFilter>  filter() const noexcept { return filter_; }

private:
    boost::asio::awaitable<void> accept_loop(boost::asio::ip::tcp::endpoint listen_ep);
    void wait_for_hup();
    void on_session_done(std::uint64_t sid);

    GateConfig                        config_;
    std::filesystem::path             config_path_;
    ScanMode                          scan_mode_;
    bool                              stopping_{false};

    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<StatsCollector>   stats_;
    std::shared_ptr<RequestFilter>    filter_;
    std::unique_ptr<UdsServer>        uds_server_{};
    std::unique_ptr<HealthCheck>      health_check_{};

    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_{};
    std::unique_ptr<boost::asio::signal_set>        signals_stop_{};
    std::unique_ptr<boost::asio::signal_set>        signals_hup_{};

    boost::asio::ip::tcp::endpoint    upstream_endpoint_{};
    std::atomic<std::uint64_t>        next_session_id_{1};
    std::unordered_map<std::uint64_t, std::shared_ptr<GatewaySession>> sessions_{};

    boost::asio::io_context*          io_ctx_{nullptr};
};
