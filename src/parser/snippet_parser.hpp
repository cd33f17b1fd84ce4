#pragma once

// ---------------------------------------------------------------------------
// snippet_parser.hpp
//
// 토큰 열을 구문 트리(Program)로 변환하는 재귀 하강 파서.
//
// [문법 요약]
// - 문장 구분: 줄바꿈 또는 ';'. 블록은 '{' ... '}'.
// - 문장: import / from-import / global / if-elif-else / for / while /
//         break / continue / pass / 대입(=, +=, -=, *=) / 식
// - 식: 삼항, and/or/not, 비교(연쇄 허용), 산술, 속성, 호출(키워드 인자),
//       첨자/슬라이스, 리스트/딕셔너리 표기와 컴프리헨션, lambda
// - 괄호 (), [], 딕셔너리 {} 내부의 줄바꿈은 무시한다.
//
// [파서 보안 원칙]
// - 파싱 실패는 절대 실행으로 이어지지 않는다. 호출자는 error path 에서
//   SyntaxInvalid 를 보고해야 한다.
// - def/class/return/try/with 등 지원하지 않는 구문은 SyntaxInvalid 이다.
// - 중첩 깊이와 입력 크기에 상한을 둔다 (스택 고갈 방지).
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "parser/ast.hpp"

#include <cstddef>
#include <expected>
#include <string_view>

// ---------------------------------------------------------------------------
// ParserLimits
// ---------------------------------------------------------------------------
struct ParserLimits {
    std::size_t max_nesting_depth{64};         // 식/블록 중첩 한도
    std::size_t max_source_bytes{64 * 1024};   // 스니펫 최대 크기
};

// ---------------------------------------------------------------------------
// SnippetParser
//   스니펫 문자열을 받아 Program 으로 변환한다.
//   실패 시 std::unexpected(ParseError) 를 반환한다.
// ---------------------------------------------------------------------------
class SnippetParser {
public:
    SnippetParser() = default;
    explicit SnippetParser(ParserLimits limits) : limits_(limits) {}
    ~SnippetParser() = default;

    // 복사/이동 허용 (설정 값만 보유)
    SnippetParser(const SnippetParser&)            = default;
    SnippetParser& operator=(const SnippetParser&) = default;
    SnippetParser(SnippetParser&&)                 = default;
    SnippetParser& operator=(SnippetParser&&)      = default;

    // parse
    //   source: 스니펫 원문
    //   반환: Program 또는 첫 번째 오류 위치의 ParseError
    [[nodiscard]] std::expected<Program, ParseError>
    parse(std::string_view source) const;

    [[nodiscard]] const ParserLimits& limits() const noexcept { return limits_; }

private:
    ParserLimits limits_{};
};
