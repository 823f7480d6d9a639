// ---------------------------------------------------------------------------
// process_runner.cpp
//
// [멀티스레드 주의]
// 게이트웨이는 Asio 워커 스레드를 가진 상태에서 fork 한다. 자식 프로세스에서는
// async-signal-safe 함수(dup2, open, close, execvp, _exit)만 호출하고,
// argv 배열은 fork 이전에 준비한다.
// ---------------------------------------------------------------------------

#include "scan/process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <spdlog/spdlog.h>

namespace {

using Clock = std::chrono::steady_clock;

void kill_and_reap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

[[nodiscard]] int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

}  // namespace

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv,
            std::chrono::milliseconds       timeout,
            std::size_t                     max_output_bytes) {
    if (argv.empty()) {
        return std::unexpected(std::string{"empty argv"});
    }

    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(fmt::format("pipe2 failed: {}", std::strerror(errno)));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(fmt::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // ── 자식 ───────────────────────────────────────────────────────
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::execvp(c_args[0], c_args.data());
        ::_exit(127);
    }

    // ── 부모 ───────────────────────────────────────────────────────────
    ::close(fds[1]);
    const auto deadline = Clock::now() + timeout;

    ProcessResult result{};
    std::array<char, 4096> buf{};
    bool eof = false;

    while (!eof) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        pollfd pfd{fds[0], POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("process_runner: poll failed: {}", std::strerror(errno));
            result.timed_out = true;
            break;
        }
        if (rc == 0) {
            continue;
        }
        const ssize_t n = ::read(fds[0], buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            eof = true;
        } else if (n == 0) {
            eof = true;
        } else if (result.output.size() < max_output_bytes) {
            const auto keep = std::min(static_cast<std::size_t>(n), max_output_bytes - result.output.size());
            result.output.append(buf.data(), keep);
        }
    }
    ::close(fds[0]);

    if (result.timed_out) {
        kill_and_reap(pid);
        return result;
    }

    // stdout 을 닫은 뒤에도 자식이 계속 실행될 수 있으므로 남은 시간 동안만 기다린다
    int status = 0;
    while (true) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            result.exit_code = decode_status(status);
            return result;
        }
        if (w < 0 && errno != EINTR) {
            return std::unexpected(fmt::format("waitpid failed: {}", std::strerror(errno)));
        }
        if (Clock::now() >= deadline) {
            result.timed_out = true;
            kill_and_reap(pid);
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}
