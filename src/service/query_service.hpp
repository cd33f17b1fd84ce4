#pragma once

// ---------------------------------------------------------------------------
// query_service.hpp
//
// execute_query / describe_capabilities 진입점.
//
// [처리 순서]
//   1. 세션 refresh (설정 파일이 바뀐 경우만)
//   2. SnippetParser::parse          실패 → SyntaxInvalid
//   3. Validator::check              거부 → CapabilityDenied (위반 전체 포함)
//   4. SandboxExecutor::run          Timeout → ExecutionTimeout
//                                    RuntimeFailure → RuntimeFailure
//                                    ResultTooLarge → SerializationFailure
//   5. ResultSerializer::serialize   실패 → SerializationFailure
//
//   실패는 정확히 하나의 kind 로 보고된다. execute() 밖으로 예외가
//   전파되지 않는다.
//
// [바인딩]
//   실행마다 새로 만든다. 화이트리스트 bindings 섹션을 따른다.
//     module : ClientFactory 의 모듈 객체 (예: oci)
//     value  : "config" 는 세션 프로파일 dict. 세션이 없으면 바인딩하지 않는다
//     <타입> : 해당 클라이언트를 config 로 생성한 객체
//
// [스레드 안전성]
//   execute() / describe_capabilities() 는 const 이며 동시 호출 안전.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "policy/capability.hpp"
#include "policy/validator.hpp"
#include "sandbox/executor.hpp"
#include "serializer/json_value.hpp"
#include "serializer/result_serializer.hpp"
#include "session/oci_session.hpp"
#include "stats/stats_collector.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

inline constexpr std::string_view kToolName        = "read_create_update_oci_resources";
inline constexpr std::string_view kToolDescription = "Execute a oci python code snippet to query OCI resources";

// ---------------------------------------------------------------------------
// QueryRequest
// ---------------------------------------------------------------------------
struct QueryRequest {
    std::uint64_t request_id{0};
    std::string   snippet{};
};

// ---------------------------------------------------------------------------
// Envelope
//   성공: {"ok":true,"result":...}
//   실패: {"ok":false,"kind":"...","message":"...","violations":[...]}
//         violations 는 CapabilityDenied 일 때만 포함된다.
// ---------------------------------------------------------------------------
struct Envelope {
    bool                          ok{false};
    JsonValue                     result{};
    std::optional<QueryErrorKind> kind{};
    std::string                   message{};
    std::vector<Violation>        violations{};

    [[nodiscard]] static Envelope success(JsonValue result);
    [[nodiscard]] static Envelope failure(QueryErrorKind kind, std::string message,
                                          std::vector<Violation> violations = {});

    [[nodiscard]] JsonValue to_json() const;
};

// ---------------------------------------------------------------------------
// ServiceOptions
// ---------------------------------------------------------------------------
struct ServiceOptions {
    ExecutorLimits   executor{};
    SerializerLimits serializer{};
    ParserLimits     parser{};
};

// ---------------------------------------------------------------------------
// QueryService
// ---------------------------------------------------------------------------
class QueryService {
public:
    // whitelist : 시작 시 로드된 불변 화이트리스트 (nullptr 이면 모든 요청 거부)
    // session   : 필수. snapshot() 이 nullptr 이면 config 바인딩 없이 실행
    // logger    : nullptr 허용 (이벤트 로그 생략)
    // stats     : nullptr 허용
    QueryService(std::shared_ptr<const CapabilityWhitelist> whitelist,
                 std::shared_ptr<OciSession>                session,
                 ServiceOptions                             options = {},
                 std::shared_ptr<StructuredLogger>          logger  = nullptr,
                 std::shared_ptr<StatsCollector>            stats   = nullptr);

    ~QueryService() = default;

    QueryService(const QueryService&)            = delete;
    QueryService& operator=(const QueryService&) = delete;
    QueryService(QueryService&&)                 = delete;
    QueryService& operator=(QueryService&&)      = delete;

    // execute: 예외를 던지지 않는다.
    [[nodiscard]] Envelope execute(const QueryRequest& request) const;

    // describe_capabilities: 도구 스키마 + 화이트리스트 요약
    [[nodiscard]] JsonValue describe_capabilities() const;

    // next_request_id: 전송 계층이 요청 ID 를 부여할 때 사용 (1부터 증가)
    [[nodiscard]] std::uint64_t next_request_id() noexcept {
        return next_request_id_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] const std::shared_ptr<StatsCollector>& stats() const noexcept { return stats_; }
    [[nodiscard]] const std::shared_ptr<OciSession>&     session() const noexcept { return session_; }

private:
    [[nodiscard]] Envelope execute_checked(const QueryRequest& request) const;
    [[nodiscard]] SandboxBindings make_bindings() const;

    void record(const QueryRequest& request, const Envelope& envelope,
                std::chrono::steady_clock::time_point started) const;

    std::shared_ptr<const CapabilityWhitelist> whitelist_;
    std::shared_ptr<OciSession>                session_;
    ServiceOptions                             options_;
    std::shared_ptr<StructuredLogger>          logger_;
    std::shared_ptr<StatsCollector>            stats_;

    Validator        validator_;
    SandboxExecutor  executor_;
    ResultSerializer serializer_;

    std::atomic<std::uint64_t> next_request_id_{1};
};
