// ---------------------------------------------------------------------------
// test_uds_server.cpp
//
// UdsServer (운영 채널) 단위 테스트.
//
// [테스트 범위]
// - dispatch(): "stats" / "posture" / 미지원 / command 누락 (소켓 없이)
// - posture 는 호출 시점의 provider 값을 반영 (리로드)
// - 소켓 경유 왕복, 잘못된 프레임(0 / 과대 길이) 시 응답 없이 종료
// - 여러 클라이언트 동시 접속
// - run() 전 stop()
//
// [테스트 패턴]
// - 임시 소켓 경로 /tmp/trustgate_uds_<pid>_<N>.sock
// - 서버 io_context 는 백그라운드 스레드, 클라이언트는 동기 소켓.
// ---------------------------------------------------------------------------

#include "stats/security_posture.hpp"
#include "stats/stats_collector.hpp"
#include "stats/uds_server.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <vector>

using stream_protocol = asio::local::stream_protocol;

namespace {

std::filesystem::path temp_socket_path() {
    static std::atomic<int> counter{0};
    return std::filesystem::path("/tmp")
         / ("trustgate_uds_" + std::to_string(::getpid()) + "_"
            + std::to_string(counter.fetch_add(1)) + ".sock");
}

std::array<std::uint8_t, 4> le32(std::uint32_t v) {
    return {
        static_cast<std::uint8_t>(v),
        static_cast<std::uint8_t>(v >> 8),
        static_cast<std::uint8_t>(v >> 16),
        static_cast<std::uint8_t>(v >> 24),
    };
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

// 동기 클라이언트. 서버와 다른 io_context 를 쓴다.
struct OpsClient {
    asio::io_context        ioc;
    stream_protocol::socket sock{ioc};

    void connect(const std::filesystem::path& path) {
        sock.connect(stream_protocol::endpoint{path.string()});
    }

    void send(std::string_view body) {
        const auto hdr = le32(static_cast<std::uint32_t>(body.size()));
        std::array<asio::const_buffer, 2> bufs{
            asio::buffer(hdr),
            asio::buffer(body.data(), body.size()),
        };
        asio::write(sock, bufs);
    }

    void send_header_only(std::uint32_t declared) {
        const auto hdr = le32(declared);
        boost::system::error_code ec;
        asio::write(sock, asio::buffer(hdr), ec);
    }

    // 서버가 응답 없이 닫으면 빈 문자열
    std::string recv() {
        std::array<std::uint8_t, 4> hdr{};
        boost::system::error_code ec;
        asio::read(sock, asio::buffer(hdr), ec);
        if (ec) {
            return {};
        }
        const std::uint32_t len = static_cast<std::uint32_t>(hdr[0])
                                | (static_cast<std::uint32_t>(hdr[1]) << 8)
                                | (static_cast<std::uint32_t>(hdr[2]) << 16)
                                | (static_cast<std::uint32_t>(hdr[3]) << 24);
        if (len == 0 || len > 1024u * 1024u) {
            return {};
        }
        std::string body(len, '\0');
        asio::read(sock, asio::buffer(body), ec);
        return ec ? std::string{} : body;
    }
};

SecurityPosture heuristic_fail_open_posture() {
    SecurityPosture p;
    p.scan_mode                  = "heuristic";
    p.admin_allowlist_configured = false;
    p.waf_block_mode             = false;
    return p;
}

}  // namespace

class UdsServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket_path_ = temp_socket_path();
        stats_       = std::make_shared<StatsCollector>();
        ioc_         = std::make_unique<asio::io_context>();
        server_      = std::make_unique<UdsServer>(
            socket_path_, stats_, [this] { return posture_; }, *ioc_);
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        ioc_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        server_.reset();
        std::error_code ec;
        std::filesystem::remove(socket_path_, ec);
    }

    // 서버 기동 후 소켓 파일이 생길 때까지 대기 (최대 2초)
    bool start_server() {
        asio::co_spawn(*ioc_, server_->run(), asio::detached);
        server_thread_ = std::thread([this] { ioc_->run(); });

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
        while (std::chrono::steady_clock::now() < deadline) {
            if (std::filesystem::exists(socket_path_)) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        return false;
    }

    std::filesystem::path             socket_path_;
    std::shared_ptr<StatsCollector>   stats_;
    SecurityPosture                   posture_{};
    std::unique_ptr<asio::io_context> ioc_;
    std::unique_ptr<UdsServer>        server_;
    std::thread                       server_thread_;
};

// ---------------------------------------------------------------------------
// dispatch
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, Dispatch_StatsReportsRequestCounters) {
    stats_->on_connection_open();
    stats_->on_request(false);
    stats_->on_request(true);
    stats_->on_request(false, true);

    const std::string resp = server_->dispatch(R"({"command": "stats"})");
    EXPECT_TRUE(contains(resp, R"("ok":true)")) << resp;
    EXPECT_TRUE(contains(resp, R"("total_requests":3)")) << resp;
    EXPECT_TRUE(contains(resp, R"("blocked_requests":1)")) << resp;
    EXPECT_TRUE(contains(resp, R"("logged_matches":1)")) << resp;
    EXPECT_TRUE(contains(resp, R"("active_connections":1)")) << resp;
    EXPECT_TRUE(contains(resp, R"("block_rate":0.3333)")) << resp;
}

TEST_F(UdsServerTest, Dispatch_PostureExposesFailOpenAndHeuristicMode) {
    posture_ = heuristic_fail_open_posture();

    const std::string resp = server_->dispatch(R"({"command":"posture"})");
    EXPECT_TRUE(contains(resp, R"("ok":true)")) << resp;
    EXPECT_TRUE(contains(resp, R"("scan_mode":"heuristic")")) << resp;
    EXPECT_TRUE(contains(resp, R"("admin_allowlist_fail_open":true)")) << resp;
    EXPECT_TRUE(contains(resp, R"("waf_block_mode":false)")) << resp;
}

TEST_F(UdsServerTest, Dispatch_PostureReflectsProviderAtCallTime) {
    posture_.admin_allowlist_configured = false;
    EXPECT_TRUE(contains(server_->dispatch(R"({"command":"posture"})"),
                         R"("admin_allowlist_configured":false)"));

    posture_.admin_allowlist_configured = true;
    EXPECT_TRUE(contains(server_->dispatch(R"({"command":"posture"})"),
                         R"("admin_allowlist_configured":true)"));
}

TEST_F(UdsServerTest, Dispatch_UnknownAndMissingCommand) {
    const std::string unknown = server_->dispatch(R"({"command":"drop_tables"})");
    EXPECT_TRUE(contains(unknown, R"("ok":false)")) << unknown;
    EXPECT_TRUE(contains(unknown, "drop_tables")) << unknown;

    for (const char* body : {R"({"version":1})", "not json at all: [", "[1,2]", R"({"command":{"x":1}})"}) {
        const std::string resp = server_->dispatch(body);
        EXPECT_TRUE(contains(resp, R"("ok":false)")) << body << " -> " << resp;
    }
}

// ---------------------------------------------------------------------------
// 소켓 경유
// ---------------------------------------------------------------------------
TEST_F(UdsServerTest, Socket_StatsRoundTrip) {
    stats_->on_upload(true);
    stats_->on_auth_failure();
    ASSERT_TRUE(start_server()) << "socket not created within 2s";

    OpsClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));
    client.send(R"({"command":"stats"})");

    const std::string resp = client.recv();
    EXPECT_TRUE(contains(resp, R"("uploads_accepted":1)")) << resp;
    EXPECT_TRUE(contains(resp, R"("auth_failures":1)")) << resp;
}

TEST_F(UdsServerTest, Socket_SocketFileIsOwnerOnly) {
    ASSERT_TRUE(start_server());
    std::this_thread::sleep_for(std::chrono::milliseconds{50});

    const auto perms = std::filesystem::status(socket_path_).permissions();
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);
}

TEST_F(UdsServerTest, Socket_ZeroLengthFrameClosesWithoutResponse) {
    ASSERT_TRUE(start_server());

    OpsClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));
    client.send_header_only(0u);
    EXPECT_TRUE(client.recv().empty());
}

TEST_F(UdsServerTest, Socket_OversizedFrameClosesWithoutResponse) {
    ASSERT_TRUE(start_server());

    OpsClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));
    client.send_header_only(0xFFFFFFFFu);
    EXPECT_TRUE(client.recv().empty());
}

TEST_F(UdsServerTest, Socket_ConcurrentClients) {
    constexpr std::size_t kClients = 4;
    ASSERT_TRUE(start_server());

    std::vector<std::string> responses(kClients);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < kClients; ++i) {
        threads.emplace_back([this, i, &responses] {
            OpsClient client;
            try {
                client.connect(socket_path_);
                client.send(i % 2 == 0 ? R"({"command":"stats"})" : R"({"command":"posture"})");
                responses[i] = client.recv();
            } catch (const std::exception& e) {
                responses[i] = std::string("EXCEPTION: ") + e.what();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (std::size_t i = 0; i < kClients; ++i) {
        EXPECT_TRUE(contains(responses[i], R"("ok":true)")) << "client " << i << ": " << responses[i];
    }
}

TEST_F(UdsServerTest, StopBeforeRun_NoCrash) {
    ASSERT_NO_THROW(server_->stop());
    ASSERT_NO_THROW(server_->stop());
}
