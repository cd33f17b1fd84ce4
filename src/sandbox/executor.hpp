#pragma once

// ---------------------------------------------------------------------------
// executor.hpp
//
// 검증된 Program 을 격리된 worker 프로세스에서 시간 제한을 두고 실행한다.
//
// [격리 모델]
//   실행마다 fork 한 자식 프로세스가 새 인터프리터 네임스페이스에서
//   스니펫을 평가하고, 결과를 ValueCodec 으로 인코딩해 pipe 로 보낸 뒤
//   _exit 한다. 부모는 pipe 를 deadline 까지 poll 한다.
//
//   자식 프로세스 제한:
//   - RLIMIT_AS (메모리), RLIMIT_CPU (timeout + 1초), RLIMIT_FSIZE=0, RLIMIT_CORE=0
//   - PR_SET_NO_NEW_PRIVS, PR_SET_PDEATHSIG(SIGKILL)
//   - pipe 를 제외한 상속 fd 를 닫는다 (리스닝 소켓 등)
//   - 자식은 로그를 남기지 않는다 (fork 이후 spdlog mutex 상태 불명)
//
// [결과 분류]
//   kSuccess        : 값 반환
//   kTimeout        : deadline 초과 → SIGKILL. 부분 결과 없음. SIGXCPU 도 포함
//   kRuntimeFailure : 스니펫 오류, API 예외, 비정상 종료, 잘못된 wire 데이터
//   kResultTooLarge : 인코딩된 결과가 max_result_bytes 초과
//
// [스레드 안전성]
//   run() 은 const 이며 여러 스레드에서 동시에 호출 가능하다.
// ---------------------------------------------------------------------------

#include "parser/ast.hpp"
#include "sandbox/interpreter.hpp"
#include "sandbox/value.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ExecutionOutcome
// ---------------------------------------------------------------------------
enum class ExecutionOutcome : std::uint8_t {
    kSuccess        = 0,
    kTimeout        = 1,
    kRuntimeFailure = 2,
    kResultTooLarge = 3,
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionOutcome outcome) noexcept {
    switch (outcome) {
        case ExecutionOutcome::kSuccess:        return "success";
        case ExecutionOutcome::kTimeout:        return "timeout";
        case ExecutionOutcome::kRuntimeFailure: return "runtime_failure";
        case ExecutionOutcome::kResultTooLarge: return "result_too_large";
    }
    return "runtime_failure";
}

// ---------------------------------------------------------------------------
// ExecutionResult
//   value 는 kSuccess 일 때만 채워진다.
// ---------------------------------------------------------------------------
struct ExecutionResult {
    ExecutionOutcome          outcome{ExecutionOutcome::kRuntimeFailure};
    std::optional<Value>      value{};
    std::string               error{};
    std::chrono::milliseconds elapsed{0};
};

// ---------------------------------------------------------------------------
// ExecutorLimits
//   memory_limit_bytes 가 0 이면 RLIMIT_AS 를 설정하지 않는다.
// ---------------------------------------------------------------------------
struct ExecutorLimits {
    std::chrono::milliseconds timeout{2000};
    std::size_t               memory_limit_bytes{std::size_t{512} * 1024 * 1024};
    std::size_t               max_result_bytes{std::size_t{16} * 1024 * 1024};
};

// ---------------------------------------------------------------------------
// SandboxExecutor
// ---------------------------------------------------------------------------
class SandboxExecutor {
public:
    explicit SandboxExecutor(ExecutorLimits limits = {});
    ~SandboxExecutor() = default;

    SandboxExecutor(const SandboxExecutor&)            = default;
    SandboxExecutor& operator=(const SandboxExecutor&) = default;
    SandboxExecutor(SandboxExecutor&&)                 = default;
    SandboxExecutor& operator=(SandboxExecutor&&)      = default;

    // run
    //   limits().timeout 을 사용한다.
    [[nodiscard]] ExecutionResult run(const Program&         program,
                                      const SandboxBindings& bindings) const;

    // run
    //   timeout 을 호출 단위로 지정한다.
    [[nodiscard]] ExecutionResult run(const Program&            program,
                                      const SandboxBindings&    bindings,
                                      std::chrono::milliseconds timeout) const;

    [[nodiscard]] const ExecutorLimits& limits() const noexcept { return limits_; }

private:
    ExecutorLimits limits_;
};
