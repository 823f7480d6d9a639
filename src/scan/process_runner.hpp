#pragma once

// ---------------------------------------------------------------------------
// process_runner.hpp
//
// 외부 프로그램 실행 (fork + execvp, 셸 미사용).
// stdout 을 캡처하고 하드 타임아웃을 강제한다.
//
// [설계 원칙]
// - 인자는 argv 배열로만 전달한다. 셸 해석이 없으므로 파일명 인젝션 불가.
// - 타임아웃 시 SIGKILL 후 waitpid 로 회수한다 (좀비 프로세스 방지).
// - stdin / stderr 는 /dev/null 로 연결한다.
// - 캡처는 max_output_bytes 까지만. 초과분은 읽어서 버린다 (파이프 막힘 방지).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

struct ProcessResult {
    int         exit_code{-1};     // 정상 종료 시 종료 코드, 시그널 종료 시 -1
    bool        timed_out{false};
    std::string output{};          // 캡처된 stdout
};

// run_process
//   실패(std::unexpected)는 실행 자체를 시작하지 못한 경우(pipe/fork 실패)만.
//   실행 파일이 없으면 자식이 127 로 종료한다.
[[nodiscard]] std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv,
            std::chrono::milliseconds       timeout,
            std::size_t                     max_output_bytes = 64 * 1024);
