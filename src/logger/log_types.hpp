#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [민감정보 취급 주의]
// - snippet 은 호출자가 보낸 원문이다. StructuredLogger 가 kMaxLoggedSnippet
//   바이트로 잘라서 기록한다.
// - 실행 결과 값은 기록하지 않는다 (크기만 기록).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. LOG_LEVEL 환경 변수에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// QueryLog
//   execute_query 한 건의 결과 (성공/실패 모두).
//   error_kind: 성공이면 빈 문자열, 실패면 "ExecutionTimeout" 등
// ---------------------------------------------------------------------------
struct QueryLog {
    std::uint64_t                         request_id{0};
    std::string                           snippet{};
    std::string                           whitelist_version{};
    bool                                  ok{false};
    std::string                           error_kind{};
    std::string                           message{};
    std::size_t                           result_bytes{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::milliseconds             duration{0};
};

// ---------------------------------------------------------------------------
// DenyLog
//   Validator 가 스니펫을 거부한 이벤트.
//   violations: "node_kind@line:column reason" 형식
// ---------------------------------------------------------------------------
struct DenyLog {
    std::uint64_t                         request_id{0};
    std::string                           snippet{};
    std::string                           whitelist_version{};
    std::vector<std::string>              violations{};
    std::chrono::system_clock::time_point timestamp{};
};
