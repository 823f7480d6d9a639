#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 게이트 실시간 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_* 갱신 메서드: 요청 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로 (UDS). 갱신 경로와 mutex 없이 분리된다.
//
// [격리 원칙]
// - 통계 실패가 요청 처리로 전파되지 않도록 모든 갱신 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   rps        : 수집 시작 이후 평균 초당 요청 수
//   block_rate : blocked_requests / total_requests (total == 0 이면 0.0)
//   logged_matches : log-only 모드에서 매칭되었지만 통과된 요청 수
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         total_connections{0};
    std::uint64_t                         active_connections{0};
    std::uint64_t                         total_requests{0};
    std::uint64_t                         blocked_requests{0};
    std::uint64_t                         logged_matches{0};
    std::uint64_t                         uploads_accepted{0};
    std::uint64_t                         uploads_rejected{0};
    std::uint64_t                         auth_failures{0};
    double                                rps{0.0};
    double                                block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept
        : window_start_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    void on_connection_open() noexcept {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        active_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_connection_close() noexcept {
        std::uint64_t current = active_connections_.load(std::memory_order_relaxed);
        while (current > 0
               && !active_connections_.compare_exchange_weak(current, current - 1,
                                                             std::memory_order_relaxed)) {
        }
    }

    // on_request
    //   blocked       : WAF 또는 관리자 허용목록에 의해 거부됨
    //   logged_match  : log-only 모드에서 매칭되었지만 통과됨
    void on_request(bool blocked, bool logged_match = false) noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        if (blocked) {
            blocked_requests_.fetch_add(1, std::memory_order_relaxed);
        }
        if (logged_match) {
            logged_matches_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void on_upload(bool accepted) noexcept {
        if (accepted) {
            uploads_accepted_.fetch_add(1, std::memory_order_relaxed);
        } else {
            uploads_rejected_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void on_auth_failure() noexcept {
        auth_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now       = std::chrono::system_clock::now();
        const auto total_req = total_requests_.load(std::memory_order_relaxed);
        const auto blocked   = blocked_requests_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(now - window_start_).count();
        const double rps = elapsed_sec > 0.0 ? static_cast<double>(total_req) / elapsed_sec : 0.0;
        const double block_rate =
            total_req > 0 ? static_cast<double>(blocked) / static_cast<double>(total_req) : 0.0;

        return StatsSnapshot{
            .total_connections  = total_connections_.load(std::memory_order_relaxed),
            .active_connections = active_connections_.load(std::memory_order_relaxed),
            .total_requests     = total_req,
            .blocked_requests   = blocked,
            .logged_matches     = logged_matches_.load(std::memory_order_relaxed),
            .uploads_accepted   = uploads_accepted_.load(std::memory_order_relaxed),
            .uploads_rejected   = uploads_rejected_.load(std::memory_order_relaxed),
            .auth_failures      = auth_failures_.load(std::memory_order_relaxed),
            .rps                = rps,
            .block_rate         = block_rate,
            .captured_at        = now,
        };
    }

private:
    std::atomic<std::uint64_t> total_connections_{0};
    std::atomic<std::uint64_t> active_connections_{0};
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> blocked_requests_{0};
    std::atomic<std::uint64_t> logged_matches_{0};
    std::atomic<std::uint64_t> uploads_accepted_{0};
    std::atomic<std::uint64_t> uploads_rejected_{0};
    std::atomic<std::uint64_t> auth_failures_{0};

    const std::chrono::system_clock::time_point window_start_;
};
