#pragma once

// ---------------------------------------------------------------------------
// uds_server.hpp
//
// Unix Domain Socket 운영 채널. 통계와 보안 상태(posture)를 노출한다.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청: [4byte LE 길이][JSON]   예: {"command": "stats"}
//   응답: [4byte LE 길이][JSON]
//     성공: {"ok": true,  "payload": {...}}
//     실패: {"ok": false, "error": "<메시지>"}
//
// [지원 커맨드]
//   "stats"   : StatsSnapshot
//   "posture" : SecurityPosture (스캔 모드, 허용목록 fail-open 여부 등)
//
// [격리 원칙]
//   UDS I/O 실패는 요청 처리로 전파되지 않는다. 접근은 모두 read-only.
// ---------------------------------------------------------------------------

#include "stats/security_posture.hpp"
#include "stats/stats_collector.hpp"

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace asio = boost::asio;

class UdsServer {
public:
    // PostureProvider: 호출 시점의 posture 를 반환 (SIGHUP 리로드 반영)
    using PostureProvider = std::function<SecurityPosture()>;

    UdsServer(const std::filesystem::path&    socket_path,
              std::shared_ptr<StatsCollector> stats,
              PostureProvider                 posture,
              asio::io_context&               ioc);

    ~UdsServer();

    UdsServer(const UdsServer&)            = delete;
    UdsServer& operator=(const UdsServer&) = delete;
    UdsServer(UdsServer&&)                 = delete;
    UdsServer& operator=(UdsServer&&)      = delete;

    // run: 기존 소켓 파일 제거 → bind/listen → accept 루프
    asio::awaitable<void> run();

    // stop: acceptor 를 닫아 run() 을 종료한다. 여러 번 호출해도 안전.
    void stop();

    // dispatch: 요청 JSON → 응답 JSON (소켓 없이 테스트 가능)
    [[nodiscard]] std::string dispatch(std::string_view request_json) const;

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    std::filesystem::path                  socket_path_;
    std::shared_ptr<StatsCollector>        stats_;
    PostureProvider                        posture_;
    asio::io_context&                      ioc_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                      stop_requested_{false};
};
