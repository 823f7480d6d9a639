#pragma once

#include "config/gate_config.hpp"
#include "gateway/http_message.hpp"
#include "logger/structured_logger.hpp"
#include "stats/stats_collector.hpp"
#include "waf/request_filter.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// SessionState
//   kReadingRequest : 요청 헤드 수신 중
//   kForwarding     : 필터 통과, 업스트림으로 요청 전달 중
//   kRelaying       : 업스트림 응답을 클라이언트로 릴레이 중
//   kClosed         : 세션 종료
// ---------------------------------------------------------------------------
enum class SessionState : std::uint8_t {
    kReadingRequest = 0,
    kForwarding     = 1,
    kRelaying       = 2,
    kClosed         = 3,
};

// ---------------------------------------------------------------------------
// GatewaySession
//   클라이언트 연결 1개에서 HTTP 요청 1개를 처리한다.
//
//   흐름:
//     1. 요청 헤드 수신 (max_request_head_bytes 초과 시 431)
//     2. RequestView 생성 → RequestFilter::evaluate
//     3. 차단이면 상세 없는 403 JSON
//     4. chunked 바디 411, 바디 한도 초과 413
//     5. 업스트림 연결 → "Connection: close" 로 요청 전달
//     6. 응답 헤드의 보안 헤더를 교체하여 릴레이
//
//   요청마다 연결을 닫으므로 요청 간 공유되는 가변 상태가 없다.
//   connection_timeout_sec 안에 끝나지 않으면 deadline 이 소켓을 닫는다.
// ---------------------------------------------------------------------------
class GatewaySession : public std::enable_shared_from_this<GatewaySession> {
public:
    GatewaySession(std::uint64_t                     session_id,
                   boost::asio::ip::tcp::socket      client_socket,
                   boost::asio::ip::tcp::endpoint    upstream_endpoint,
                   const ServerSection&              limits,
                   std::shared_ptr<RequestFilter>    filter,
                   std::shared_ptr<StructuredLogger> logger,
                   std::shared_ptr<StatsCollector>   stats);

    ~GatewaySession() = default;

    GatewaySession(const GatewaySession&)            = delete;
    GatewaySession& operator=(const GatewaySession&) = delete;
    GatewaySession(GatewaySession&&)                 = delete;
    GatewaySession& operator=(GatewaySession&&)      = delete;

    auto run() -> boost::asio::awaitable<void>;

    // close: 진행 중인 I/O 를 취소한다. 여러 번 호출해도 안전.
    void close();

    [[nodiscard]] auto state() const noexcept -> SessionState { return state_; }

private:
    // RequestOutcome: 요청 1건의 처리 결과 (stats / 요청 로그용)
    //   status == 0 이면 요청을 받기 전에 연결이 끝난 것
    struct RequestOutcome {
        int         status{0};
        std::string method{};
        std::string path{};
        std::string client_ip{};
        bool        blocked{false};
        bool        logged_match{false};
    };

    auto handle_request(const std::string& peer_ip) -> boost::asio::awaitable<RequestOutcome>;

    // read_head: "\r\n\r\n" 까지 읽는다. 헤드 이후 이미 받은 바이트는 leftover 로 남는다.
    auto read_head(boost::asio::ip::tcp::socket& socket, std::size_t limit, std::string& buffer)
        -> boost::asio::awaitable<std::expected<std::size_t, GateError>>;

    // forward_request: 업스트림 연결 + 헤드/바디 전달
    auto forward_request(HttpRequestHead head, std::string leftover, const std::string& client_ip)
        -> boost::asio::awaitable<std::expected<void, GateError>>;

    // relay_response: 업스트림 응답 헤드 파싱 → 보안 헤더 적용 → 바디 스트리밍. 상태 코드 반환.
    auto relay_response(const HttpRequestHead& request)
        -> boost::asio::awaitable<std::expected<int, GateError>>;

    // respond: 게이트웨이 자체 JSON 응답 (보안 헤더 포함)
    auto respond(int status, std::string_view json_body, std::string_view path)
        -> boost::asio::awaitable<void>;

    void arm_deadline();
    void shutdown_sockets();

    std::uint64_t                     session_id_;
    boost::asio::ip::tcp::socket      client_socket_;
    boost::asio::ip::tcp::socket      upstream_socket_;
    boost::asio::ip::tcp::endpoint    upstream_endpoint_;
    ServerSection                     limits_;

    std::shared_ptr<RequestFilter>    filter_;
    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<StatsCollector>   stats_;

    boost::asio::steady_timer         deadline_;
    SessionState                      state_{SessionState::kReadingRequest};
    std::atomic<bool>                 closing_{false};
};
