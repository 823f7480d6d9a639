// ---------------------------------------------------------------------------
// uds_server.cpp
//
// [프로토콜]
//   요청/응답 모두 4byte LE 길이 프리픽스 + JSON 바디.
//   요청 JSON 은 yaml-cpp 로 파싱한다 (JSON 은 YAML flow 문법의 부분집합).
// ---------------------------------------------------------------------------

#include "stats/uds_server.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "logger/structured_logger.hpp"

namespace {

// 운영 채널 요청은 작다. 과대 길이는 프레임 오류로 본다.
constexpr std::uint32_t kMaxRequestSize = 64u * 1024u;

std::string serialize_snapshot(const StatsSnapshot& s) {
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        s.captured_at.time_since_epoch()).count();

    return fmt::format(
        R"({{"total_connections":{},"active_connections":{},"total_requests":{},"blocked_requests":{},)"
        R"("logged_matches":{},"uploads_accepted":{},"uploads_rejected":{},"auth_failures":{},)"
        R"("rps":{:.4f},"block_rate":{:.4f},"captured_at_ms":{}}})",
        s.total_connections,
        s.active_connections,
        s.total_requests,
        s.blocked_requests,
        s.logged_matches,
        s.uploads_accepted,
        s.uploads_rejected,
        s.auth_failures,
        s.rps,
        s.block_rate,
        epoch_ms);
}

std::string make_ok_response(std::string_view payload) {
    return fmt::format(R"({{"ok":true,"payload":{}}})", payload);
}

std::string make_error_response(std::string_view msg) {
    return fmt::format(R"({{"ok":false,"error":"{}"}})", escape_json_string(msg));
}

std::array<std::uint8_t, 4> encode_le4(std::uint32_t val) {
    return {
        static_cast<std::uint8_t>(val),
        static_cast<std::uint8_t>(val >> 8),
        static_cast<std::uint8_t>(val >> 16),
        static_cast<std::uint8_t>(val >> 24),
    };
}

std::uint32_t decode_le4(const std::array<std::uint8_t, 4>& buf) {
    return static_cast<std::uint32_t>(buf[0])
         | (static_cast<std::uint32_t>(buf[1]) << 8)
         | (static_cast<std::uint32_t>(buf[2]) << 16)
         | (static_cast<std::uint32_t>(buf[3]) << 24);
}

// parse_command: {"command": "<value>"} 에서 값 추출. 실패 시 빈 문자열.
std::string parse_command(std::string_view json) {
    try {
        const YAML::Node root = YAML::Load(std::string(json));
        if (!root.IsMap()) {
            return {};
        }
        const YAML::Node cmd = root["command"];
        if (!cmd || !cmd.IsScalar()) {
            return {};
        }
        return cmd.as<std::string>();
    } catch (const YAML::Exception& e) {
        spdlog::debug("[uds_server] request parse error: {}", e.what());
        return {};
    }
}

}  // namespace

UdsServer::UdsServer(const std::filesystem::path&    socket_path,
                     std::shared_ptr<StatsCollector> stats,
                     PostureProvider                 posture,
                     asio::io_context&               ioc)
    : socket_path_{socket_path}
    , stats_{std::move(stats)}
    , posture_{std::move(posture)}
    , ioc_{ioc}
    , acceptor_{ioc}
{}

UdsServer::~UdsServer() {
    stop();
    std::error_code ec;
    std::filesystem::remove(socket_path_, ec);
}

void UdsServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_acceptor = [this]() {
        boost::system::error_code cancel_ec;
        acceptor_.cancel(cancel_ec);
        if (cancel_ec && cancel_ec != asio::error::bad_descriptor) {
            spdlog::warn("[uds_server] stop: acceptor cancel error: {}", cancel_ec.message());
        }
        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        if (close_ec && close_ec != asio::error::bad_descriptor) {
            spdlog::warn("[uds_server] stop: acceptor close error: {}", close_ec.message());
        }
    };

    // acceptor 소유 스레드(io_context)에서 정리한다
    if (ioc_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(ioc_, std::move(close_acceptor));
}

std::string UdsServer::dispatch(std::string_view request_json) const {
    const std::string cmd = parse_command(request_json);

    if (cmd == "stats") {
        if (!stats_) {
            return make_error_response("stats unavailable");
        }
        return make_ok_response(serialize_snapshot(stats_->snapshot()));
    }
    if (cmd == "posture") {
        if (!posture_) {
            return make_error_response("posture unavailable");
        }
        return make_ok_response(serialize_posture(posture_()));
    }
    if (cmd.empty()) {
        spdlog::warn("[uds_server] missing or malformed 'command' field");
        return make_error_response("missing or malformed 'command' field");
    }
    spdlog::warn("[uds_server] unknown command '{}'", cmd);
    return make_error_response(fmt::format("unknown command '{}'", cmd));
}

asio::awaitable<void> UdsServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("[uds_server] failed to remove old socket {}: {}", socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("[uds_server] open error: {}", ec.message());
        co_return;
    }
    acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    if (ec) {
        spdlog::error("[uds_server] bind error on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }
    // 운영 채널: 소유자만 접근
    std::filesystem::permissions(socket_path_, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, fs_ec);
    if (fs_ec) {
        spdlog::warn("[uds_server] chmod 0600 failed on {}: {}", socket_path_.string(), fs_ec.message());
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[uds_server] listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("[uds_server] listening on {}", socket_path_.string());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return;
        }

        stream_protocol::socket client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(client_socket, asio::redirect_error(asio::use_awaitable, accept_ec));

        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted
                || accept_ec == boost::system::errc::bad_file_descriptor) {
                spdlog::info("[uds_server] accept loop stopped");
            } else {
                spdlog::error("[uds_server] accept error: {}", accept_ec.message());
            }
            co_return;
        }

        asio::co_spawn(ioc_, handle_client(std::move(client_socket)), asio::detached);
    }
}

asio::awaitable<void> UdsServer::handle_client(asio::local::stream_protocol::socket socket) {
    std::array<std::uint8_t, 4> req_hdr{};
    boost::system::error_code hdr_ec;
    co_await asio::async_read(socket, asio::buffer(req_hdr),
                              asio::redirect_error(asio::use_awaitable, hdr_ec));
    if (hdr_ec) {
        if (hdr_ec != asio::error::eof) {
            spdlog::warn("[uds_server] read header error: {}", hdr_ec.message());
        }
        co_return;
    }

    const std::uint32_t body_len = decode_le4(req_hdr);
    if (body_len == 0 || body_len > kMaxRequestSize) {
        spdlog::warn("[uds_server] invalid body length {}", body_len);
        co_return;
    }

    std::vector<char> body_buf(body_len);
    boost::system::error_code body_ec;
    const std::size_t body_n = co_await asio::async_read(socket, asio::buffer(body_buf),
                                                         asio::redirect_error(asio::use_awaitable, body_ec));
    if (body_ec) {
        spdlog::warn("[uds_server] read body error: {}", body_ec.message());
        co_return;
    }

    const std::string response_body = dispatch(std::string_view{body_buf.data(), body_n});

    const auto resp_hdr = encode_le4(static_cast<std::uint32_t>(response_body.size()));
    std::array<asio::const_buffer, 2> bufs{
        asio::buffer(resp_hdr),
        asio::buffer(response_body),
    };
    boost::system::error_code write_ec;
    const std::size_t write_n = co_await asio::async_write(
        socket, bufs, asio::redirect_error(asio::use_awaitable, write_ec));
    if (write_ec) {
        spdlog::warn("[uds_server] write error: {}", write_ec.message());
        co_return;
    }
    spdlog::debug("[uds_server] handled response_bytes={}", write_n);
}
