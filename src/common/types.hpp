#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// SourceLocation
//   스니펫 원문 내 위치 (1-based line/column, column 은 바이트 단위).
//   parser 가 생성하고 validator/logger 레이어에 값으로 전달한다.
// ---------------------------------------------------------------------------
struct SourceLocation {
    std::uint32_t line{1};
    std::uint32_t column{1};
};

// ---------------------------------------------------------------------------
// ParseErrorCode
//   스니펫 파싱 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kEmptySnippet        = 0,  // 공백/주석만 있는 입력
    kUnexpectedCharacter = 1,  // 렉서가 인식하지 못한 문자
    kUnterminatedString  = 2,  // 닫히지 않은 문자열 리터럴
    kInvalidLiteral      = 3,  // 숫자 범위 초과, 잘못된 escape
    kUnexpectedToken     = 4,  // 문법 오류
    kUnsupportedSyntax   = 5,  // def/class/try 등 지원하지 않는 구문
    kNestingTooDeep      = 6,  // 중첩 한도 초과
    kSnippetTooLarge     = 7,  // 입력 크기 한도 초과
    kInternalError       = 8,  // 파서 내부 오류 (예: 할당 실패)
};

// ---------------------------------------------------------------------------
// ParseError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode code{ParseErrorCode::kInternalError};
    std::string    message{};   // 사람이 읽을 수 있는 오류 설명
    SourceLocation location{};  // 오류가 발생한 위치
    std::string    context{};   // 오류 위치의 토큰 단편 (로깅용)
};

// ---------------------------------------------------------------------------
// QueryErrorKind
//   execute_query 실패 분류. envelope 의 "kind" 필드로 그대로 노출된다.
//   각 실패는 정확히 하나의 kind 로만 보고된다 (generic fallback 없음).
// ---------------------------------------------------------------------------
enum class QueryErrorKind : std::uint8_t {
    kSyntaxInvalid        = 0,  // 스니펫이 문법적으로 올바르지 않음
    kCapabilityDenied     = 1,  // validator 가 하나 이상의 노드를 거부함
    kExecutionTimeout     = 2,  // 실행 시간 한도 초과
    kRuntimeFailure       = 3,  // 실행 중 오류 (API 예외 포함)
    kSerializationFailure = 4,  // 결과를 JSON 으로 표현할 수 없음
};

[[nodiscard]] constexpr std::string_view to_string(QueryErrorKind kind) noexcept {
    switch (kind) {
        case QueryErrorKind::kSyntaxInvalid:        return "SyntaxInvalid";
        case QueryErrorKind::kCapabilityDenied:     return "CapabilityDenied";
        case QueryErrorKind::kExecutionTimeout:     return "ExecutionTimeout";
        case QueryErrorKind::kRuntimeFailure:       return "RuntimeFailure";
        case QueryErrorKind::kSerializationFailure: return "SerializationFailure";
    }
    return "RuntimeFailure";
}
