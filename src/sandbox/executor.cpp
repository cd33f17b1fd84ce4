// ---------------------------------------------------------------------------
// executor.cpp
//
// SandboxExecutor 구현 (fork + pipe + poll).
//
// [worker 프레임]
//   [u8 status][payload]
//     0 value    : payload = ValueCodec 인코딩 결과
//     1 error    : payload = 오류 메시지
//     2 timeout  : 인터프리터가 deadline 초과를 스스로 보고
//     3 too large: 결과가 max_result_bytes 초과
//
// [fork 이후 자식 규칙]
//   - 로그 금지, 부모 객체 소멸자 실행 금지 (_exit 로만 종료)
//   - 표준 출력/에러에 쓰지 않는다
// ---------------------------------------------------------------------------

#include "sandbox/executor.hpp"

#include "sandbox/value_codec.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <expected>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

enum class FrameStatus : std::uint8_t {
    kValue    = 0,
    kError    = 1,
    kTimeout  = 2,
    kTooLarge = 3,
};

// 자식 종료 코드 (프레임을 쓰지 못한 경우)
constexpr int kExitSetupFailed = 120;
constexpr int kExitOrphaned    = 121;
constexpr int kExitWriteFailed = 122;

// 자식에서 결과 pipe 가 위치할 fd 번호
constexpr int kChildResultFd = 3;

std::string errno_message(int err) {
    return std::error_code(err, std::generic_category()).message();
}

// ---------------------------------------------------------------------------
// FdGuard
//   fd 소유권 RAII.
// ---------------------------------------------------------------------------
class FdGuard {
public:
    explicit FdGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&)            = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    FdGuard(FdGuard&&)                 = delete;
    FdGuard& operator=(FdGuard&&)      = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

    int release() noexcept { return std::exchange(fd_, -1); }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

// ---------------------------------------------------------------------------
// ChildGuard
//   reap 되지 않은 worker 는 소멸 시 SIGKILL 후 회수한다 (좀비/고아 방지).
// ---------------------------------------------------------------------------
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) noexcept : pid_(pid) {}
    ~ChildGuard() { kill(); }

    ChildGuard(const ChildGuard&)            = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;
    ChildGuard(ChildGuard&&)                 = delete;
    ChildGuard& operator=(ChildGuard&&)      = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    void kill() noexcept {
        if (pid_ <= 0) {
            return;
        }
        ::kill(pid_, SIGKILL);
        static_cast<void>(reap());
    }

    // try_reap: 종료했으면 wait status, 아직이면 nullopt
    std::optional<int> try_reap() noexcept {
        if (pid_ <= 0) {
            return std::nullopt;
        }
        int status = 0;
        const pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_ || (r < 0 && errno != EINTR)) {
            pid_ = -1;
            return status;
        }
        return std::nullopt;
    }

private:
    int reap() noexcept {
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
        return status;
    }

    pid_t pid_;
};

bool write_all(int fd, std::string_view data) noexcept {
    while (!data.empty()) {
        const ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

bool set_limit(int resource, rlim_t soft, rlim_t hard) noexcept {
    const rlimit limit{soft, hard};
    return ::setrlimit(resource, &limit) == 0;
}

void close_inherited_fds() noexcept {
    if (::close_range(kChildResultFd + 1, ~0U, 0) == 0) {
        return;
    }
    const long max_fd = ::sysconf(_SC_OPEN_MAX);
    for (long fd = kChildResultFd + 1; fd < (max_fd > 0 ? max_fd : 1024); ++fd) {
        ::close(static_cast<int>(fd));
    }
}

std::string make_frame(FrameStatus status, std::string_view payload = {}) {
    std::string frame;
    frame.reserve(payload.size() + 1);
    frame.push_back(static_cast<char>(status));
    frame.append(payload);
    return frame;
}

// ---------------------------------------------------------------------------
// run_child
//   fork 된 자식에서만 호출된다. 반환하지 않는다.
// ---------------------------------------------------------------------------
[[noreturn]] void run_child(int                                   result_fd,
                            pid_t                                 parent,
                            const Program&                        program,
                            const SandboxBindings&                bindings,
                            const ExecutorLimits&                 limits,
                            std::chrono::milliseconds             timeout,
                            std::chrono::steady_clock::time_point deadline) {
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (::getppid() != parent) {
        ::_exit(kExitOrphaned);
    }
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        ::_exit(kExitSetupFailed);
    }

    if (result_fd != kChildResultFd) {
        if (::dup2(result_fd, kChildResultFd) < 0) {
            ::_exit(kExitSetupFailed);
        }
        ::close(result_fd);
    }
    close_inherited_fds();

    const auto cpu_seconds = static_cast<rlim_t>(
        std::chrono::ceil<std::chrono::seconds>(timeout).count() + 1);
    bool limited = set_limit(RLIMIT_CPU, cpu_seconds, cpu_seconds + 1) &&
                   set_limit(RLIMIT_FSIZE, 0, 0) &&
                   set_limit(RLIMIT_CORE, 0, 0);
    if (limits.memory_limit_bytes > 0) {
        limited = limited && set_limit(RLIMIT_AS, limits.memory_limit_bytes, limits.memory_limit_bytes);
    }
    if (!limited) {
        ::_exit(kExitSetupFailed);
    }

    std::string frame;
    try {
        // 인터프리터와 결과는 해제하지 않는다. 워커는 프레임을 쓴 뒤 바로
        // _exit 하며, 깊게 중첩된 컨테이너의 재귀 소멸은 스택을 넘긴다.
        auto* interpreter = new Interpreter{bindings, InterpreterLimits{.deadline = deadline}};
        auto* result      = new std::expected<Value, ScriptFailure>(interpreter->run(program));
        if (!*result) {
            frame = result->error().timed_out
                ? make_frame(FrameStatus::kTimeout)
                : make_frame(FrameStatus::kError, result->error().message);
        } else {
            auto encoded = ValueCodec::encode(**result, limits.max_result_bytes);
            frame = encoded ? make_frame(FrameStatus::kValue, *encoded)
                            : make_frame(FrameStatus::kTooLarge);
        }
        ::_exit(write_all(kChildResultFd, frame) ? 0 : kExitWriteFailed);
    } catch (const std::bad_alloc&) {
        frame = make_frame(FrameStatus::kError, "MemoryError: out of memory");
    } catch (const std::exception& e) {
        frame = make_frame(FrameStatus::kError, e.what());
    }

    ::_exit(write_all(kChildResultFd, frame) ? 0 : kExitWriteFailed);
}

}  // namespace

// ---------------------------------------------------------------------------
// SandboxExecutor
// ---------------------------------------------------------------------------
SandboxExecutor::SandboxExecutor(ExecutorLimits limits)
    : limits_(limits)
{}

ExecutionResult SandboxExecutor::run(const Program& program, const SandboxBindings& bindings) const {
    return run(program, bindings, limits_.timeout);
}

ExecutionResult SandboxExecutor::run(const Program&            program,
                                     const SandboxBindings&    bindings,
                                     std::chrono::milliseconds timeout) const {
    using clock = std::chrono::steady_clock;

    const auto started  = clock::now();
    const auto deadline = started + timeout;

    ExecutionResult result{};
    const auto finish = [&](ExecutionOutcome outcome, std::string error) {
        result.outcome = outcome;
        result.error   = std::move(error);
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);
        return std::move(result);
    };

    std::array<int, 2> fds{-1, -1};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        const int err = errno;
        spdlog::error("executor: pipe2 failed: {}", errno_message(err));
        return finish(ExecutionOutcome::kRuntimeFailure,
                      fmt::format("failed to create worker pipe: {}", errno_message(err)));
    }
    FdGuard read_end{fds[0]};
    FdGuard write_end{fds[1]};

    const pid_t parent = ::getpid();
    const pid_t pid    = ::fork();
    if (pid < 0) {
        const int err = errno;
        spdlog::error("executor: fork failed: {}", errno_message(err));
        return finish(ExecutionOutcome::kRuntimeFailure,
                      fmt::format("failed to start worker: {}", errno_message(err)));
    }
    if (pid == 0) {
        ::close(read_end.release());
        run_child(write_end.release(), parent, program, bindings, limits_, timeout, deadline);
    }

    write_end.reset();
    ChildGuard child{pid};

    // ── 결과 수신 (deadline 까지) ───────────────────────────────────────
    const std::size_t frame_cap = limits_.max_result_bytes + 1;
    std::string       frame;
    std::array<char, 64 * 1024> buf{};

    for (;;) {
        const auto now = clock::now();
        if (now >= deadline) {
            child.kill();
            spdlog::warn("executor: worker pid {} exceeded {}ms, killed", pid, timeout.count());
            return finish(ExecutionOutcome::kTimeout,
                          fmt::format("execution exceeded {}ms", timeout.count()));
        }

        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        pollfd pfd{read_end.get(), POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            child.kill();
            return finish(ExecutionOutcome::kRuntimeFailure,
                          fmt::format("failed to wait for worker: {}", errno_message(err)));
        }
        if (rc == 0) {
            continue;
        }

        const ssize_t n = ::read(read_end.get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            const int err = errno;
            child.kill();
            return finish(ExecutionOutcome::kRuntimeFailure,
                          fmt::format("failed to read worker result: {}", errno_message(err)));
        }
        if (n == 0) {
            break;
        }
        frame.append(buf.data(), static_cast<std::size_t>(n));
        if (frame.size() > frame_cap) {
            child.kill();
            return finish(ExecutionOutcome::kResultTooLarge,
                          fmt::format("result exceeds {} bytes", limits_.max_result_bytes));
        }
    }

    // ── 종료 상태 회수 ──────────────────────────────────────────────────
    std::optional<int> status;
    while (!(status = child.try_reap())) {
        if (clock::now() >= deadline) {
            child.kill();
            spdlog::warn("executor: worker pid {} did not exit after closing its pipe, killed", pid);
            return finish(ExecutionOutcome::kTimeout,
                          fmt::format("execution exceeded {}ms", timeout.count()));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }

    if (WIFSIGNALED(*status)) {
        const int sig = WTERMSIG(*status);
        if (sig == SIGXCPU || (sig == SIGKILL && clock::now() >= deadline)) {
            return finish(ExecutionOutcome::kTimeout, "worker exceeded its CPU time limit");
        }
        spdlog::warn("executor: worker pid {} terminated by signal {}", pid, sig);
        return finish(ExecutionOutcome::kRuntimeFailure,
                      fmt::format("worker terminated by signal {}", sig));
    }
    if (WIFEXITED(*status) && WEXITSTATUS(*status) != 0) {
        spdlog::warn("executor: worker pid {} exited with status {}", pid, WEXITSTATUS(*status));
        return finish(ExecutionOutcome::kRuntimeFailure,
                      fmt::format("worker exited with status {}", WEXITSTATUS(*status)));
    }
    if (frame.empty()) {
        return finish(ExecutionOutcome::kRuntimeFailure, "worker produced no result");
    }

    // ── 프레임 해석 ─────────────────────────────────────────────────────
    const std::string_view payload = std::string_view{frame}.substr(1);
    switch (static_cast<FrameStatus>(frame[0])) {
        case FrameStatus::kValue: {
            auto decoded = ValueCodec::decode(payload);
            if (!decoded) {
                spdlog::error("executor: malformed worker result: {}", decoded.error());
                return finish(ExecutionOutcome::kRuntimeFailure,
                              fmt::format("malformed worker result: {}", decoded.error()));
            }
            result.value = std::move(*decoded);
            return finish(ExecutionOutcome::kSuccess, {});
        }
        case FrameStatus::kError:
            return finish(ExecutionOutcome::kRuntimeFailure, std::string(payload));
        case FrameStatus::kTimeout:
            return finish(ExecutionOutcome::kTimeout,
                          fmt::format("execution exceeded {}ms", timeout.count()));
        case FrameStatus::kTooLarge:
            return finish(ExecutionOutcome::kResultTooLarge,
                          fmt::format("result exceeds {} bytes", limits_.max_result_bytes));
    }
    return finish(ExecutionOutcome::kRuntimeFailure,
                  fmt::format("malformed worker result: unknown status {}",
                              static_cast<unsigned>(static_cast<std::uint8_t>(frame[0]))));
}
