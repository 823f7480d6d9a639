#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "scan/scan_engine.hpp"

class StatsCollector;

// ---------------------------------------------------------------------------
// HealthStatus
//   kHealthy   : 정상 동작 중 (HTTP 200)
//   kUnhealthy : 비정상 상태 (HTTP 503)
// ---------------------------------------------------------------------------
enum class HealthStatus : std::uint8_t {
    kHealthy   = 0,
    kUnhealthy = 1,
};

// ---------------------------------------------------------------------------
// HealthCheck
//   GET /health 전용 HTTP/1.0 서버.
//
//   - kHealthy   -> 200 {"status":"ok","scan_mode":"...","active_connections":N}
//   - kUnhealthy -> 503 {"status":"unhealthy","reason":"...","scan_mode":"..."}
//
//   scan_mode 를 항상 포함하여 휴리스틱 전용 상태를 운영자가 놓치지 않게 한다.
//   max_connections 에 도달하면 게이트웨이가 set_unhealthy() 를 호출한다.
// ---------------------------------------------------------------------------
class HealthCheck {
public:
    HealthCheck(std::uint16_t                   port,
                std::shared_ptr<StatsCollector> stats,
                ScanMode                        scan_mode,
                boost::asio::io_context&        io_context);

    ~HealthCheck() = default;

    HealthCheck(const HealthCheck&)            = delete;
    HealthCheck& operator=(const HealthCheck&) = delete;
    HealthCheck(HealthCheck&&)                 = delete;
    HealthCheck& operator=(HealthCheck&&)      = delete;

    // run: 포트 바인딩 후 accept 루프. 게이트웨이 io_context 에서 co_spawn 한다.
    auto run() -> boost::asio::awaitable<void>;

    // stop: acceptor 를 닫는다 (io_context 스레드에서 호출)
    void stop();

    void set_unhealthy(std::string_view reason);
    void set_healthy();

    [[nodiscard]] auto status() const noexcept -> HealthStatus;

    // response_for: 요청 바이트 → 완성된 HTTP 응답 (소켓 없이 테스트 가능)
    [[nodiscard]] std::string response_for(std::string_view request) const;

private:
    auto handle_connection(boost::asio::ip::tcp::socket socket) -> boost::asio::awaitable<void>;

    std::uint16_t                   port_;
    std::shared_ptr<StatsCollector> stats_;
    ScanMode                        scan_mode_;
    boost::asio::io_context&        io_context_;
    boost::asio::ip::tcp::acceptor  acceptor_;

    std::atomic<HealthStatus>       status_{HealthStatus::kHealthy};
    mutable std::mutex              reason_mutex_;
    std::string                     unhealthy_reason_{};
};
