#pragma once

// ---------------------------------------------------------------------------
// interpreter.hpp
//
// 검증을 통과한 Program 을 평가하는 트리 워킹 인터프리터.
// SandboxExecutor 가 fork 한 worker 프로세스 안에서만 호출한다.
//
// [네임스페이스]
//   읽기 전용 바인딩(oci, config) + 실행마다 새로 만드는 지역 변수 +
//   컴프리헨션 스코프 스택. 실행 사이에 상태가 남지 않는다.
//
// [결과 값]
//   스니펫이 `result` 를 대입했으면 그 값, 아니면 마지막 최상위 식 문장의
//   값, 둘 다 없으면 none.
//
// [보안 원칙]
// - 인터프리터에는 파일/프로세스/네트워크 primitive 가 없다. 외부 접근은
//   바인딩된 HostObject 를 통해서만 가능하다.
// - 허용된 builtins 집합 밖의 이름은 NameError 로 처리한다.
// - 1024 스텝마다 deadline 을 확인한다. 강제 종료는 executor 의 SIGKILL 이
//   보장하며 이 검사는 빠른 경로다.
// ---------------------------------------------------------------------------

#include "parser/ast.hpp"
#include "sandbox/value.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <map>
#include <set>
#include <string>

// ---------------------------------------------------------------------------
// SandboxBindings
//   names   : 스니펫 시작 시 미리 바인딩되는 이름
//   modules : import 로 가져올 수 있는 최상위 모듈
//   builtins: 사용 가능한 내장 함수 이름 (화이트리스트 allowed_builtins)
// ---------------------------------------------------------------------------
struct SandboxBindings {
    std::map<std::string, Value> names{};
    std::map<std::string, Value> modules{};
    std::set<std::string>        builtins{};
};

// ---------------------------------------------------------------------------
// InterpreterLimits
// ---------------------------------------------------------------------------
struct InterpreterLimits {
    std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
    std::size_t                           max_sequence_length{std::size_t{1} << 24};
};

// ---------------------------------------------------------------------------
// ScriptFailure
//   timed_out=true 면 deadline 초과, 아니면 실행 오류 (message 에 원인).
// ---------------------------------------------------------------------------
struct ScriptFailure {
    bool        timed_out{false};
    std::string message{};
};

// ---------------------------------------------------------------------------
// Interpreter
// ---------------------------------------------------------------------------
class Interpreter {
public:
    explicit Interpreter(const SandboxBindings& bindings, InterpreterLimits limits = {});
    ~Interpreter() = default;

    Interpreter(const Interpreter&)            = delete;
    Interpreter& operator=(const Interpreter&) = delete;
    Interpreter(Interpreter&&)                 = delete;
    Interpreter& operator=(Interpreter&&)      = delete;

    // run
    //   program 을 새 네임스페이스에서 평가한다. 예외를 던지지 않는다.
    [[nodiscard]] std::expected<Value, ScriptFailure> run(const Program& program);

private:
    const SandboxBindings& bindings_;
    InterpreterLimits      limits_;
};
