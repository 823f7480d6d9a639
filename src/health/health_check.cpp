#include "health/health_check.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <format>
#include <string>

#include "logger/structured_logger.hpp"

// ---------------------------------------------------------------------------
// HealthCheck: HTTP/1.0 subset
//
// GET /health 외의 요청 → 404. 응답 후 소켓 즉시 close.
// ---------------------------------------------------------------------------

namespace {

std::string make_http_response(int status_code, std::string_view status_text, std::string_view body) {
    return std::format(
        "HTTP/1.0 {} {}\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: {}\r\n"
        "Cache-Control: no-store\r\n"
        "Connection: close\r\n"
        "\r\n"
        "{}",
        status_code, status_text, body.size(), body);
}

// 요청 첫 줄이 "GET /health" 이고 뒤가 공백 또는 '?' 인지
bool is_health_request(std::string_view request) {
    constexpr std::string_view kPrefix = "GET /health";
    if (!request.starts_with(kPrefix)) {
        return false;
    }
    return request.size() == kPrefix.size() || request[kPrefix.size()] == ' '
        || request[kPrefix.size()] == '?';
}

}  // namespace

HealthCheck::HealthCheck(std::uint16_t                   port,
                         std::shared_ptr<StatsCollector> stats,
                         ScanMode                        scan_mode,
                         boost::asio::io_context&        io_context)
    : port_{port}
    , stats_{std::move(stats)}
    , scan_mode_{scan_mode}
    , io_context_{io_context}
    , acceptor_{io_context}
{}

std::string HealthCheck::response_for(std::string_view request) const {
    if (!is_health_request(request)) {
        return make_http_response(404, "Not Found", R"({"status":"not found"})");
    }

    const std::string_view mode = scan_mode_name(scan_mode_);
    if (status() == HealthStatus::kHealthy) {
        const std::uint64_t active = stats_ ? stats_->snapshot().active_connections : 0;
        return make_http_response(200, "OK",
            std::format(R"({{"status":"ok","scan_mode":"{}","active_connections":{}}})", mode, active));
    }

    std::string reason;
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        reason = unhealthy_reason_.empty() ? "service unavailable" : unhealthy_reason_;
    }
    return make_http_response(503, "Service Unavailable",
        std::format(R"({{"status":"unhealthy","reason":"{}","scan_mode":"{}"}})",
                    escape_json_string(reason), mode));
}

auto HealthCheck::handle_connection(boost::asio::ip::tcp::socket socket) -> boost::asio::awaitable<void> {
    std::array<char, 512> buf{};
    boost::system::error_code ec;

    const std::size_t n = co_await socket.async_read_some(
        boost::asio::buffer(buf), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[health_check] read error: {}", ec.message());
        co_return;
    }

    const std::string response = response_for(std::string_view{buf.data(), n});
    co_await boost::asio::async_write(socket, boost::asio::buffer(response),
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[health_check] write error: {}", ec.message());
    }

    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

auto HealthCheck::run() -> boost::asio::awaitable<void> {
    const boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), port_};

    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        spdlog::error("[health_check] cannot listen on port {}: {}", port_, ec.message());
        co_return;
    }

    spdlog::info("[health_check] listening on port {} (scan_mode={})", port_, scan_mode_name(scan_mode_));

    while (true) {
        auto socket = co_await acceptor_.async_accept(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            if (ec == boost::asio::error::operation_aborted || ec == boost::asio::error::bad_descriptor) {
                spdlog::info("[health_check] acceptor closed, stopping");
                break;
            }
            spdlog::warn("[health_check] accept error: {}", ec.message());
            continue;
        }
        boost::asio::co_spawn(io_context_, handle_connection(std::move(socket)), boost::asio::detached);
    }
}

void HealthCheck::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::debug("[health_check] acceptor close: {}", ec.message());
    }
}

void HealthCheck::set_unhealthy(std::string_view reason) {
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        unhealthy_reason_ = std::string{reason};
    }
    status_.store(HealthStatus::kUnhealthy, std::memory_order_release);
}

void HealthCheck::set_healthy() {
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        unhealthy_reason_.clear();
    }
    status_.store(HealthStatus::kHealthy, std::memory_order_release);
}

auto HealthCheck::status() const noexcept -> HealthStatus {
    return status_.load(std::memory_order_acquire);
}
