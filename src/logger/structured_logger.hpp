#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 이벤트 한 건 = JSON 객체 한 줄. 필드명은 snake_case.
// - 싱크: stderr + rotating file (100MB x 3). stdout 은 --run 모드의
//   envelope 출력에 쓰이므로 사용하지 않는다.
// - snippet 은 kMaxLoggedSnippet 바이트로 자른다 (UTF-8 경계 유지).
//
// [JSON 스키마]
//   {"event":"query_executed","request_id":1,"ok":true,"error_kind":"",
//    "message":"","whitelist_version":"...","snippet":"...",
//    "snippet_truncated":false,"result_bytes":120,"duration_ms":35,
//    "timestamp":"2026-01-01T00:00:00.000Z"}
//   {"event":"query_denied","request_id":2,"whitelist_version":"...",
//    "snippet":"...","snippet_truncated":false,"violations":["..."],
//    "timestamp":"..."}
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    static constexpr std::size_t kMaxLoggedSnippet = 512;

    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   초기화 실패 시 std::runtime_error.
    StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_query
    //   ok 면 info, 실패면 warn 레벨로 기록한다.
    void log_query(const QueryLog& entry);

    // log_deny
    //   Validator 거부 이벤트 (warn).
    void log_deny(const DenyLog& entry);

    // flush: 테스트/종료 시 버퍼 비우기
    void flush();

    // truncate_snippet: UTF-8 경계에서 max_bytes 이하로 자른다
    [[nodiscard]] static std::string_view truncate_snippet(std::string_view snippet,
                                                           std::size_t max_bytes = kMaxLoggedSnippet) noexcept;

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};

// parse_log_level: "debug" | "info" | "warn" | "error" (대소문자 무시). 그 외 kInfo
[[nodiscard]] LogLevel parse_log_level(std::string_view text);
