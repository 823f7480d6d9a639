#include "gateway/gateway_session.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

// ---------------------------------------------------------------------------
// GatewaySession 구현
//
// 흐름:
//   1. stats_.on_connection_open(), deadline 설정
//   2. handle_request():
//        헤드 수신 → 파싱 → RequestFilter::evaluate
//        kBlock → 403, kLog → 감사 로그 후 통과
//        바디 프레이밍 검사 → 업스트림 전달 → 응답 릴레이
//   3. 소켓 정리 → stats_.on_request() → logger_.log_request()
//
// [알려진 한계]
// - 업스트림이 "Connection: close" 를 무시하고 길이 없는 chunked 응답을
//   keep-alive 로 보내면 deadline 까지 연결이 유지된다.
// ---------------------------------------------------------------------------

namespace asio = boost::asio;

namespace {

constexpr std::size_t kReadChunk            = 8192;
constexpr std::size_t kMaxResponseHeadBytes = 64 * 1024;

// 클라이언트 응답 바디. 차단 사유는 절대 포함하지 않는다.
constexpr std::string_view kForbiddenBody       = R"({"error":"Forbidden"})";
constexpr std::string_view kBadRequestBody      = R"({"error":"Bad request"})";
constexpr std::string_view kHeaderTooLargeBody  = R"({"error":"Request header too large"})";
constexpr std::string_view kLengthRequiredBody  = R"({"error":"Length required"})";
constexpr std::string_view kBodyTooLargeBody    = R"({"error":"Request body too large"})";
constexpr std::string_view kBadGatewayBody      = R"({"error":"Bad gateway"})";

// 업스트림으로 넘기지 않는 hop-by-hop 헤더
constexpr std::array<std::string_view, 7> kHopByHopHeaders{
    "Connection", "Keep-Alive", "Proxy-Connection", "TE", "Trailer", "Upgrade", "Expect",
};

constexpr std::string_view kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";

std::string peer_address(const asio::ip::tcp::socket& socket) {
    boost::system::error_code ec;
    const auto ep = socket.remote_endpoint(ec);
    if (ec) {
        return {};
    }
    const auto addr = ep.address();
    // dual-stack 리스너: ::ffff:a.b.c.d → a.b.c.d (허용목록 비교용)
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
        return asio::ip::make_address_v4(asio::ip::v4_mapped, addr.to_v6()).to_string();
    }
    return addr.to_string();
}

GateError bad_gateway(std::string detail) {
    return GateError{GateErrorCode::kInternal, "Bad gateway", std::move(detail)};
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성자
// ---------------------------------------------------------------------------
GatewaySession::GatewaySession(std::uint64_t                     session_id,
                               asio::ip::tcp::socket             client_socket,
                               asio::ip::tcp::endpoint           upstream_endpoint,
                               const ServerSection&              limits,
                               std::shared_ptr<RequestFilter>    filter,
                               std::shared_ptr<StructuredLogger> logger,
                               std::shared_ptr<StatsCollector>   stats)
    : session_id_{session_id}
    , client_socket_{std::move(client_socket)}
    , upstream_socket_{client_socket_.get_executor()}
    , upstream_endpoint_{std::move(upstream_endpoint)}
    , limits_{limits}
    , filter_{std::move(filter)}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
    , deadline_{client_socket_.get_executor()}
{}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
auto GatewaySession::run() -> asio::awaitable<void>
{
    auto self = shared_from_this();
    const auto started = std::chrono::steady_clock::now();

    stats_->on_connection_open();
    struct StatsGuard {
        StatsCollector* stats;
        ~StatsGuard() { stats->on_connection_close(); }
    } stats_guard{stats_.get()};

    const std::string peer_ip = peer_address(client_socket_);
    arm_deadline();

    RequestOutcome outcome = co_await handle_request(peer_ip);

    deadline_.cancel();
    shutdown_sockets();
    state_ = SessionState::kClosed;

    if (outcome.status == 0) {
        spdlog::debug("[gateway {}] connection closed without a request", session_id_);
        co_return;
    }

    stats_->on_request(outcome.blocked, outcome.logged_match);

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);
    logger_->log_request(RequestLog{
        .request_id = session_id_,
        .method     = std::move(outcome.method),
        .path       = std::move(outcome.path),
        .client_ip  = std::move(outcome.client_ip),
        .status     = outcome.status,
        .timestamp  = std::chrono::system_clock::now(),
        .duration   = elapsed,
    });
}

// ---------------------------------------------------------------------------
// handle_request
// ---------------------------------------------------------------------------
auto GatewaySession::handle_request(const std::string& peer_ip) -> asio::awaitable<RequestOutcome>
{
    RequestOutcome outcome;
    outcome.client_ip = peer_ip;

    // -----------------------------------------------------------------------
    // 1. 요청 헤드
    // -----------------------------------------------------------------------
    std::string buffer;
    auto head_len = co_await read_head(client_socket_, limits_.max_request_head_bytes, buffer);
    if (!head_len) {
        if (head_len.error().code == GateErrorCode::kValidation) {
            spdlog::warn("[gateway {}] {} (peer={})", session_id_, head_len.error().detail, peer_ip);
            outcome.status = 431;
            co_await respond(431, kHeaderTooLargeBody, "/");
        } else {
            spdlog::debug("[gateway {}] read: {}", session_id_, head_len.error().detail);
        }
        co_return outcome;
    }

    auto parsed = HttpRequestHead::parse(std::string_view{buffer}.substr(0, *head_len));
    if (!parsed) {
        spdlog::warn("[gateway {}] malformed request from {}: {}",
                     session_id_, peer_ip, parsed.error().detail);
        outcome.status = http_status_for(parsed.error().code);
        co_await respond(outcome.status, kBadRequestBody, "/");
        co_return outcome;
    }
    const HttpRequestHead request = std::move(*parsed);
    outcome.method = request.method;
    outcome.path   = request.path;

    // -----------------------------------------------------------------------
    // 2. 필터
    // -----------------------------------------------------------------------
    const RequestView view{
        .request_id = session_id_,
        .method     = request.method,
        .path       = request.path,
        .query      = request.query,
        .headers    = request.headers,
        .peer_ip    = peer_ip,
    };
    const FilterDecision decision = filter_->evaluate(view);
    outcome.client_ip = decision.client_ip.empty() ? filter_->client_ip_for(view) : decision.client_ip;

    if (decision.action != FilterAction::kAllow) {
        logger_->log_block(BlockLog{
            .request_id      = session_id_,
            .client_ip       = outcome.client_ip,
            .method          = request.method,
            .path            = request.path,
            .rule            = decision.rule,
            .category        = decision.category,
            .matched_pattern = decision.matched_pattern,
            .reason          = decision.reason,
            .mode            = decision.blocked() ? "block" : "log_only",
            .timestamp       = std::chrono::system_clock::now(),
        });
    }

    if (decision.blocked()) {
        outcome.blocked = true;
        outcome.status  = 403;
        co_await respond(403, kForbiddenBody, request.path);
        co_return outcome;
    }
    outcome.logged_match = decision.action == FilterAction::kLog;

    // -----------------------------------------------------------------------
    // 3. 바디 프레이밍
    // -----------------------------------------------------------------------
    if (request.chunked) {
        outcome.status = 411;
        co_await respond(411, kLengthRequiredBody, request.path);
        co_return outcome;
    }
    const std::uint64_t body_len = request.content_length.value_or(0);
    if (body_len > limits_.max_request_body_bytes) {
        spdlog::warn("[gateway {}] body {} bytes exceeds limit {}",
                     session_id_, body_len, limits_.max_request_body_bytes);
        outcome.status = 413;
        co_await respond(413, kBodyTooLargeBody, request.path);
        co_return outcome;
    }

    std::string leftover = buffer.substr(*head_len);
    if (body_len > leftover.size()
        && iequals(find_header(request.headers, "Expect"), "100-continue")) {
        boost::system::error_code cont_ec;
        co_await asio::async_write(
            client_socket_, asio::buffer(kContinueResponse), asio::redirect_error(asio::use_awaitable, cont_ec));
        if (cont_ec) {
            spdlog::debug("[gateway {}] 100-continue write failed: {}", session_id_, cont_ec.message());
            co_return outcome;
        }
    }

    // -----------------------------------------------------------------------
    // 4. 업스트림 전달 + 응답 릴레이
    // -----------------------------------------------------------------------
    state_ = SessionState::kForwarding;
    auto forwarded = co_await forward_request(request, std::move(leftover), outcome.client_ip);
    if (!forwarded) {
        spdlog::error("[gateway {}] {}", session_id_, forwarded.error().detail);
        outcome.status = 502;
        co_await respond(502, kBadGatewayBody, request.path);
        co_return outcome;
    }

    auto relayed = co_await relay_response(request);
    if (!relayed) {
        spdlog::error("[gateway {}] {}", session_id_, relayed.error().detail);
        outcome.status = 502;
        co_await respond(502, kBadGatewayBody, request.path);
        co_return outcome;
    }
    outcome.status = *relayed;
    co_return outcome;
}

// ---------------------------------------------------------------------------
// read_head
// ---------------------------------------------------------------------------
auto GatewaySession::read_head(asio::ip::tcp::socket& socket, std::size_t limit, std::string& buffer)
    -> asio::awaitable<std::expected<std::size_t, GateError>>
{
    std::array<char, kReadChunk> chunk{};

    for (;;) {
        if (const auto end = find_head_end(buffer)) {
            if (*end > limit) {
                break;
            }
            co_return *end;
        }
        if (buffer.size() >= limit) {
            break;
        }

        boost::system::error_code ec;
        const std::size_t n = co_await socket.async_read_some(
            asio::buffer(chunk), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(GateError{GateErrorCode::kInternal, "Connection closed", ec.message()});
        }
        buffer.append(chunk.data(), n);
    }

    co_return std::unexpected(GateError{
        GateErrorCode::kValidation,
        "Request header too large",
        fmt::format("message head exceeds {} bytes", limit),
    });
}

// ---------------------------------------------------------------------------
// forward_request
// ---------------------------------------------------------------------------
auto GatewaySession::forward_request(HttpRequestHead head, std::string leftover, const std::string& client_ip)
    -> asio::awaitable<std::expected<void, GateError>>
{
    boost::system::error_code connect_ec;
    co_await upstream_socket_.async_connect(
        upstream_endpoint_, asio::redirect_error(asio::use_awaitable, connect_ec));
    if (connect_ec) {
        co_return std::unexpected(bad_gateway(fmt::format("upstream connect failed: {}", connect_ec.message())));
    }

    for (const auto name : kHopByHopHeaders) {
        remove_header(head.headers, name);
    }
    set_header(head.headers, "Connection", "close");
    // 업스트림은 게이트웨이가 판별한 IP 만 본다 (클라이언트가 보낸 값 폐기)
    set_header(head.headers, "X-Forwarded-For", client_ip);
    set_header(head.headers, "X-Real-IP", client_ip);
    set_header(head.headers, "X-Request-ID", std::to_string(session_id_));

    const std::uint64_t body_len = head.content_length.value_or(0);
    if (leftover.size() > body_len) {
        // 파이프라이닝된 후속 요청은 버린다
        leftover.resize(body_len);
    }

    std::string out = head.serialize();
    out += leftover;
    boost::system::error_code head_ec;
    co_await asio::async_write(
        upstream_socket_, asio::buffer(out), asio::redirect_error(asio::use_awaitable, head_ec));
    if (head_ec) {
        co_return std::unexpected(bad_gateway(fmt::format("upstream write failed: {}", head_ec.message())));
    }

    std::uint64_t remaining = body_len - leftover.size();
    std::array<char, kReadChunk> chunk{};
    while (remaining > 0) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, chunk.size()));
        boost::system::error_code rd_ec;
        const std::size_t n = co_await client_socket_.async_read_some(
            asio::buffer(chunk.data(), want), asio::redirect_error(asio::use_awaitable, rd_ec));
        if (rd_ec) {
            co_return std::unexpected(GateError{
                GateErrorCode::kInternal, "Connection closed",
                fmt::format("client body read failed with {} bytes outstanding: {}", remaining, rd_ec.message())});
        }
        boost::system::error_code wr_ec;
        co_await asio::async_write(
            upstream_socket_, asio::buffer(chunk.data(), n), asio::redirect_error(asio::use_awaitable, wr_ec));
        if (wr_ec) {
            co_return std::unexpected(bad_gateway(fmt::format("upstream body write failed: {}", wr_ec.message())));
        }
        remaining -= n;
    }

    co_return std::expected<void, GateError>{};
}

// ---------------------------------------------------------------------------
// relay_response
//   헤드를 클라이언트에 쓰기 전의 오류만 unexpected 로 반환한다.
//   바디 릴레이 중 오류는 로그만 남기고 상태 코드를 반환한다.
// ---------------------------------------------------------------------------
auto GatewaySession::relay_response(const HttpRequestHead& request)
    -> asio::awaitable<std::expected<int, GateError>>
{
    std::string buffer;
    HttpResponseHead response;
    std::size_t head_len = 0;

    // 1xx 중간 응답은 건너뛴다 (Expect 는 업스트림으로 보내지 않는다)
    for (;;) {
        auto len = co_await read_head(upstream_socket_, kMaxResponseHeadBytes, buffer);
        if (!len) {
            co_return std::unexpected(bad_gateway(fmt::format("upstream response head: {}", len.error().detail)));
        }
        auto parsed = HttpResponseHead::parse(std::string_view{buffer}.substr(0, *len));
        if (!parsed) {
            co_return std::unexpected(bad_gateway(fmt::format("upstream response head: {}", parsed.error().detail)));
        }
        if (parsed->status >= 200) {
            response = std::move(*parsed);
            head_len = *len;
            break;
        }
        buffer.erase(0, *len);
    }

    state_ = SessionState::kRelaying;

    remove_header(response.headers, "Connection");
    remove_header(response.headers, "Keep-Alive");
    set_header(response.headers, "Connection", "close");
    filter_->apply_response_headers(response.headers, request.path);

    const bool no_body = request.method == "HEAD" || response.status == 204 || response.status == 304;

    // remaining: nullopt 이면 업스트림 EOF 까지 릴레이
    std::optional<std::uint64_t> remaining;
    if (no_body) {
        remaining = 0;
    } else if (!response.chunked) {
        remaining = response.content_length;
    }

    std::string body_prefix = buffer.substr(head_len);
    if (remaining) {
        if (body_prefix.size() > *remaining) {
            body_prefix.resize(static_cast<std::size_t>(*remaining));
        }
        *remaining -= body_prefix.size();
    }

    std::string out = response.serialize();
    out += body_prefix;
    boost::system::error_code head_ec;
    co_await asio::async_write(
        client_socket_, asio::buffer(out), asio::redirect_error(asio::use_awaitable, head_ec));
    if (head_ec) {
        spdlog::debug("[gateway {}] client write failed: {}", session_id_, head_ec.message());
        co_return response.status;
    }

    std::array<char, kReadChunk> chunk{};
    while (!remaining || *remaining > 0) {
        const std::size_t want = remaining
            ? static_cast<std::size_t>(std::min<std::uint64_t>(*remaining, chunk.size()))
            : chunk.size();
        boost::system::error_code rd_ec;
        const std::size_t n = co_await upstream_socket_.async_read_some(
            asio::buffer(chunk.data(), want), asio::redirect_error(asio::use_awaitable, rd_ec));
        if (rd_ec) {
            if (rd_ec != asio::error::eof || remaining) {
                spdlog::warn("[gateway {}] upstream body truncated: {}", session_id_, rd_ec.message());
            }
            break;
        }
        boost::system::error_code wr_ec;
        co_await asio::async_write(
            client_socket_, asio::buffer(chunk.data(), n), asio::redirect_error(asio::use_awaitable, wr_ec));
        if (wr_ec) {
            spdlog::debug("[gateway {}] client write failed: {}", session_id_, wr_ec.message());
            break;
        }
        if (remaining) {
            *remaining -= n;
        }
    }

    co_return response.status;
}

// ---------------------------------------------------------------------------
// respond
// ---------------------------------------------------------------------------
auto GatewaySession::respond(int status, std::string_view json_body, std::string_view path)
    -> asio::awaitable<void>
{
    const std::string response = make_json_response(status, json_body, filter_->response_headers(path));
    boost::system::error_code ec;
    co_await asio::async_write(
        client_socket_, asio::buffer(response), asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[gateway {}] response write failed: {}", session_id_, ec.message());
    }
}

// ---------------------------------------------------------------------------
// deadline / 소켓 정리
// ---------------------------------------------------------------------------
void GatewaySession::arm_deadline()
{
    if (limits_.connection_timeout_sec == 0) {
        return;
    }
    deadline_.expires_after(std::chrono::seconds(limits_.connection_timeout_sec));
    deadline_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (!ec) {
            spdlog::warn("[gateway {}] connection timeout ({}s), closing",
                         self->session_id_, self->limits_.connection_timeout_sec);
            self->shutdown_sockets();
        }
    });
}

void GatewaySession::shutdown_sockets()
{
    boost::system::error_code ec;
    if (client_socket_.is_open()) {
        client_socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        client_socket_.close(ec);
    }
    if (upstream_socket_.is_open()) {
        upstream_socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        upstream_socket_.close(ec);
    }
}

// ---------------------------------------------------------------------------
// close
//   Graceful Shutdown: 요청 헤드를 기다리는 중이면 읽기를 취소한다.
//   이미 전달/릴레이 중인 요청은 끝까지 처리된다 (deadline 으로 상한).
// ---------------------------------------------------------------------------
void GatewaySession::close()
{
    bool expected = false;
    if (!closing_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    spdlog::debug("[gateway {}] close() called", session_id_);
    if (state_ == SessionState::kReadingRequest) {
        boost::system::error_code ec;
        client_socket_.cancel(ec);
    }
}
