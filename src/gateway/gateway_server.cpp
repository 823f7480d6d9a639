#include "gateway/gateway_server.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <format>
#include <stdexcept>
#include <utility>

#include "config/config_loader.hpp"

// ---------------------------------------------------------------------------
// GatewayServer 구현
//
// run() 흐름:
//   1. io_ctx_ 저장, logger_ 준비
//   2. 업스트림 엔드포인트 해석
//   3. uds_server_ + co_spawn(run)
//   4. health_check_ + co_spawn(run)
//   5. SIGTERM/SIGINT 핸들러 + SIGHUP 핸들러
//   6. accept 루프: 세션 생성 + co_spawn(session->run())
//      완료 콜백에서 sessions_.erase()
// ---------------------------------------------------------------------------

namespace {

// co_spawn 완료 핸들러: 코루틴 밖으로 나온 예외를 로그로 남긴다
auto log_exception(const char* component) {
    return [component](std::exception_ptr eptr) {
        if (eptr) {
            try { std::rethrow_exception(eptr); }
            catch (const std::exception& e) {
                spdlog::error("[gateway] {} error: {}", component, e.what());
            }
        }
    };
}

boost::asio::ip::tcp::endpoint resolve_endpoint(boost::asio::io_context& io_ctx,
                                                const std::string&       host,
                                                std::uint16_t            port)
{
    boost::system::error_code ec;
    const auto addr = boost::asio::ip::make_address(host, ec);
    if (!ec) {
        return boost::asio::ip::tcp::endpoint{addr, port};
    }

    // 호스트명이면 시작 시 한 번만 해석한다
    boost::asio::ip::tcp::resolver resolver{io_ctx};
    const auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec || results.empty()) {
        throw std::runtime_error(std::format("cannot resolve '{}': {}",
                                             host, ec ? ec.message() : "no results"));
    }
    return results.begin()->endpoint();
}

}  // namespace

GatewayServer::GatewayServer(GateConfig                        config,
                             std::filesystem::path             config_path,
                             ScanMode                          scan_mode,
                             std::shared_ptr<StructuredLogger> logger)
    : config_{std::move(config)}
    , config_path_{std::move(config_path)}
    , scan_mode_{scan_mode}
    , logger_{std::move(logger)}
    , stats_{std::make_shared<StatsCollector>()}
    , filter_{std::make_shared<RequestFilter>(FilterRules::build(config_))}
{}

// ---------------------------------------------------------------------------
// posture
//   필터 관련 값은 현재 스냅샷(리로드 반영), 나머지는 고정 설정에서 읽는다.
// ---------------------------------------------------------------------------
SecurityPosture GatewayServer::posture() const
{
    SecurityPosture p;
    p.scan_mode                 = std::string(scan_mode_name(scan_mode_));
    p.encryption_required       = config_.upload.require_encryption;
    p.legacy_plaintext_fallback = config_.upload.allow_legacy_plaintext;

    if (const auto rules = filter_->snapshot()) {
        p.waf_enabled                = rules->waf.enabled;
        p.waf_block_mode             = rules->waf.block_mode;
        p.admin_allowlist_configured = rules->admin_allowlist.is_configured();
        p.trust_forwarded_headers    = rules->trust_forwarded_headers;
    } else {
        // 규칙 없음 = fail-close. 모든 요청 차단 상태를 그대로 보고한다.
        p.waf_enabled    = true;
        p.waf_block_mode = true;
    }
    return p;
}

// ---------------------------------------------------------------------------
// reload
// ---------------------------------------------------------------------------
bool GatewayServer::reload()
{
    spdlog::info("[gateway] SIGHUP received, reloading filter configuration: {}",
                 config_path_.string());

    auto loaded = ConfigLoader::load_or_default(config_path_);
    if (!loaded) {
        spdlog::warn("[gateway] reload failed (keeping current rules): {}", loaded.error());
        return false;
    }
    ConfigLoader::apply_env(*loaded);
    if (auto valid = ConfigLoader::validate(*loaded); !valid) {
        spdlog::warn("[gateway] reload rejected (keeping current rules): {}", valid.error());
        return false;
    }

    filter_->reload(FilterRules::build(*loaded));

    // 필터에 속한 섹션만 교체. 나머지는 재시작해야 반영된다.
    config_.waf     = loaded->waf;
    config_.headers = loaded->headers;
    config_.network = loaded->network;
    return true;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
void GatewayServer::run(boost::asio::io_context& io_ctx)
{
    io_ctx_ = &io_ctx;

    if (!logger_) {
        logger_ = std::make_shared<StructuredLogger>(parse_log_level(config_.server.log_level),
                                                     config_.server.log_path);
    }

    const auto listen_ep = resolve_endpoint(io_ctx, config_.server.listen_address,
                                            config_.server.listen_port);
    upstream_endpoint_   = resolve_endpoint(io_ctx, config_.server.upstream_address,
                                            config_.server.upstream_port);

    if (scan_mode_ == ScanMode::kHeuristic) {
        spdlog::warn("[gateway] upload scanning runs in heuristic mode (no signature scanner)");
    }

    // -----------------------------------------------------------------------
    // UdsServer
    // -----------------------------------------------------------------------
    uds_server_ = std::make_unique<UdsServer>(
        config_.server.uds_socket_path,
        stats_,
        [this]() { return posture(); },
        io_ctx
    );
    boost::asio::co_spawn(io_ctx, uds_server_->run(), log_exception("uds_server"));

    // -----------------------------------------------------------------------
    // HealthCheck
    // -----------------------------------------------------------------------
    health_check_ = std::make_unique<HealthCheck>(
        config_.server.health_check_port,
        stats_,
        scan_mode_,
        io_ctx
    );
    boost::asio::co_spawn(io_ctx, health_check_->run(), log_exception("health_check"));

    // -----------------------------------------------------------------------
    // 시그널
    // -----------------------------------------------------------------------
    signals_stop_ = std::make_unique<boost::asio::signal_set>(io_ctx, SIGTERM, SIGINT);
    signals_stop_->async_wait(
        [this](const boost::system::error_code& ec, int signum) {
            if (!ec) {
                spdlog::info("[gateway] shutdown signal {} received", signum);
                stop();
            }
        }
    );

    signals_hup_ = std::make_unique<boost::asio::signal_set>(io_ctx, SIGHUP);
    wait_for_hup();

    // -----------------------------------------------------------------------
    // Accept 루프
    // -----------------------------------------------------------------------
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_ctx);
    acceptor_->open(listen_ep.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(listen_ep);
    acceptor_->listen();

    boost::asio::co_spawn(io_ctx, accept_loop(listen_ep), log_exception("accept loop"));
}

void GatewayServer::wait_for_hup()
{
    signals_hup_->async_wait(
        [this](const boost::system::error_code& ec, int /*signum*/) {
            if (ec) {
                return;
            }
            reload();
            wait_for_hup();
        }
    );
}

// ---------------------------------------------------------------------------
// accept_loop
// ---------------------------------------------------------------------------
boost::asio::awaitable<void> GatewayServer::accept_loop(boost::asio::ip::tcp::endpoint listen_ep)
{
    spdlog::info("[gateway] listening on {}:{} -> upstream {}:{}",
                 listen_ep.address().to_string(), listen_ep.port(),
                 upstream_endpoint_.address().to_string(), upstream_endpoint_.port());

    const std::uint32_t max_connections = config_.server.max_connections;

    while (!stopping_) {
        boost::system::error_code ec;
        auto client_sock = co_await acceptor_->async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );

        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                spdlog::info("[gateway] acceptor closed");
                break;
            }
            if (!stopping_) {
                spdlog::warn("[gateway] accept error: {}", ec.message());
            }
            continue;
        }

        if (stopping_) {
            boost::system::error_code close_ec;
            client_sock.close(close_ec);
            continue;
        }

        // max_connections 도달 시 unhealthy 전환 + 연결 거부
        if (max_connections > 0) {
            const auto snap = stats_->snapshot();
            if (snap.active_connections >= max_connections) {
                spdlog::warn("[gateway] max_connections ({}) reached, rejecting new connection",
                             max_connections);
                health_check_->set_unhealthy(
                    std::format("max_connections ({}) reached", max_connections));
                boost::system::error_code close_ec;
                client_sock.close(close_ec);
                continue;
            }
            if (health_check_->status() == HealthStatus::kUnhealthy) {
                health_check_->set_healthy();
            }
        }

        const std::uint64_t sid = next_session_id_.fetch_add(1, std::memory_order_relaxed);

        auto session = std::make_shared<GatewaySession>(
            sid,
            std::move(client_sock),
            upstream_endpoint_,
            config_.server,
            filter_,
            logger_,
            stats_
        );
        sessions_.emplace(sid, session);

        boost::asio::co_spawn(
            *io_ctx_,
            session->run(),
            [this, sid](std::exception_ptr eptr) {
                log_exception("session")(eptr);
                on_session_done(sid);
            }
        );
    }
}

void GatewayServer::on_session_done(std::uint64_t sid)
{
    sessions_.erase(sid);

    if (stopping_ && sessions_.empty()) {
        spdlog::info("[gateway] all sessions closed, stopping io_context");
        io_ctx_->stop();
    }
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------
void GatewayServer::stop()
{
    if (stopping_) {
        return;
    }
    stopping_ = true;

    spdlog::info("[gateway] stopping, active sessions: {}", sessions_.size());

    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
    if (signals_hup_) {
        boost::system::error_code ec;
        signals_hup_->cancel(ec);
    }
    if (health_check_) {
        health_check_->set_unhealthy("gateway shutting down");
        health_check_->stop();
    }
    if (uds_server_) {
        uds_server_->stop();
    }

    for (auto& [sid, session] : sessions_) {
        session->close();
    }

    if (sessions_.empty() && io_ctx_ != nullptr) {
        spdlog::info("[gateway] no active sessions, stopping io_context");
        io_ctx_->stop();
    }
}
