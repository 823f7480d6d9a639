// ---------------------------------------------------------------------------
// test_stats_collector.cpp
//
// StatsCollector / serialize_posture 단위 테스트.
//
// [테스트 범위]
// - 초기 상태, 연결 open/close (언더플로우 방지)
// - on_request: blocked / logged_match 분리 집계
// - 업로드 / 인증 실패 카운터
// - block_rate 계산, total == 0 처리
// - 멀티스레드 갱신
// - posture JSON 직렬화
//
// [알려진 한계]
// - rps 는 누적 평균이라 실행 시간에 따라 달라진다. 양수 여부만 본다.
// ---------------------------------------------------------------------------

#include "stats/security_posture.hpp"
#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

TEST(StatsCollector, InitialState_AllZero) {
    const StatsCollector stats;
    const auto snap = stats.snapshot();

    EXPECT_EQ(snap.total_connections, 0u);
    EXPECT_EQ(snap.active_connections, 0u);
    EXPECT_EQ(snap.total_requests, 0u);
    EXPECT_EQ(snap.blocked_requests, 0u);
    EXPECT_EQ(snap.logged_matches, 0u);
    EXPECT_NEAR(snap.block_rate, 0.0, 1e-9);
}

TEST(StatsCollector, ConnectionOpenClose_TracksActive) {
    StatsCollector stats;
    stats.on_connection_open();
    stats.on_connection_open();
    stats.on_connection_close();

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_connections, 2u);
    EXPECT_EQ(snap.active_connections, 1u);
}

TEST(StatsCollector, ConnectionClose_NoUnderflow) {
    StatsCollector stats;
    stats.on_connection_close();
    stats.on_connection_close();
    EXPECT_EQ(stats.snapshot().active_connections, 0u);
}

// ---------------------------------------------------------------------------
// on_request
//   log-only 매칭은 차단 수에 포함되지 않는다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnRequest_SeparatesBlockedAndLoggedMatches) {
    StatsCollector stats;
    stats.on_request(false);
    stats.on_request(true);
    stats.on_request(false, true);
    stats.on_request(false, true);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_requests, 4u);
    EXPECT_EQ(snap.blocked_requests, 1u);
    EXPECT_EQ(snap.logged_matches, 2u);
    EXPECT_NEAR(snap.block_rate, 0.25, 1e-9);
}

TEST(StatsCollector, UploadAndAuthCounters) {
    StatsCollector stats;
    stats.on_upload(true);
    stats.on_upload(false);
    stats.on_upload(false);
    stats.on_auth_failure();

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.uploads_accepted, 1u);
    EXPECT_EQ(snap.uploads_rejected, 2u);
    EXPECT_EQ(snap.auth_failures, 1u);
    EXPECT_EQ(snap.total_requests, 0u) << "upload/auth hooks do not count as requests";
}

TEST(StatsCollector, Snapshot_RpsPositiveAndTimestampSet) {
    StatsCollector stats;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    stats.on_request(false);

    const auto before = std::chrono::system_clock::now();
    const auto snap   = stats.snapshot();
    EXPECT_GT(snap.rps, 0.0);
    EXPECT_GE(snap.captured_at, before);
}

TEST(StatsCollector, ConcurrentUpdates_AreCounted) {
    constexpr int kThreads    = 8;
    constexpr int kPerThread  = 1000;
    StatsCollector stats;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&stats, t] {
            for (int i = 0; i < kPerThread; ++i) {
                stats.on_connection_open();
                stats.on_request(t % 2 == 0);
                stats.on_connection_close();
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_connections, static_cast<std::uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(snap.active_connections, 0u);
    EXPECT_EQ(snap.total_requests, static_cast<std::uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(snap.blocked_requests, static_cast<std::uint64_t>(kThreads / 2 * kPerThread));
}

// ---------------------------------------------------------------------------
// serialize_posture
// ---------------------------------------------------------------------------
TEST(SecurityPosture, Serialize_IncludesFailOpenFlag) {
    SecurityPosture p;
    p.scan_mode                  = "delegated";
    p.admin_allowlist_configured = true;
    p.trust_forwarded_headers    = true;

    const std::string json = serialize_posture(p);
    EXPECT_EQ(json,
              R"({"scan_mode":"delegated","waf_enabled":true,"waf_block_mode":true,)"
              R"("admin_allowlist_configured":true,"admin_allowlist_fail_open":false,)"
              R"("trust_forwarded_headers":true,"encryption_required":true,)"
              R"("legacy_plaintext_fallback":false})");
}
