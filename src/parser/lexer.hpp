#pragma once

// ---------------------------------------------------------------------------
// lexer.hpp
//
// 스니펫 원문을 토큰 열로 변환하는 단일 패스 스캐너.
//
// [토큰 규칙]
// - 식별자: [A-Za-z_][A-Za-z0-9_]*. 예약어는 kKeyword 로 분류한다.
//   True/False/None 은 true/false/none 으로 정규화한다.
// - 숫자: 10진 정수, 0x 16진 정수, 소수/지수 표기 실수. '_' 구분자 허용.
// - 문자열: '...' 또는 "..." (한 줄). \n \t \r \0 \\ \' \" \xHH \uXXXX 지원.
// - 주석: '#' 부터 줄 끝까지 무시.
// - 줄바꿈: kNewline 토큰 (연속 줄바꿈은 하나로 합친다). 줄 끝 '\' 는 이어쓰기.
//
// [알려진 한계]
// - 여러 줄 문자열(""" ... """), 문자열 접두사(r/b/f)는 지원하지 않는다.
//   f"..." 는 식별자 f 와 문자열로 분리되어 파서에서 문법 오류가 된다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// TokenType
// ---------------------------------------------------------------------------
enum class TokenType : std::uint8_t {
    kName     = 0,
    kKeyword  = 1,
    kInt      = 2,
    kFloat    = 3,
    kString   = 4,  // text 는 escape 해제된 값
    kOperator = 5,
    kNewline  = 6,
    kEnd      = 7,
};

struct Token {
    TokenType      type{TokenType::kEnd};
    std::string    text{};
    SourceLocation location{};
};

// ---------------------------------------------------------------------------
// SnippetLexer
//   stateless. 실패 시 첫 번째 오류 위치의 ParseError 를 반환한다.
// ---------------------------------------------------------------------------
class SnippetLexer {
public:
    SnippetLexer()  = default;
    ~SnippetLexer() = default;

    SnippetLexer(const SnippetLexer&)            = default;
    SnippetLexer& operator=(const SnippetLexer&) = default;
    SnippetLexer(SnippetLexer&&)                 = default;
    SnippetLexer& operator=(SnippetLexer&&)      = default;

    // tokenize
    //   반환 토큰 열은 항상 kEnd 로 끝난다.
    [[nodiscard]] std::expected<std::vector<Token>, ParseError>
    tokenize(std::string_view source) const;
};
