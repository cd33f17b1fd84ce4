// ---------------------------------------------------------------------------
// lexer.cpp
//
// SnippetLexer 구현. 상태 머신 스캐너 (문자 단위 전진, 위치 추적).
// ---------------------------------------------------------------------------

#include "parser/lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace {

// 예약어. 지원하지 않는 구문 키워드도 포함하여 식별자로 쓰이지 않게 한다.
constexpr std::array<std::string_view, 38> kKeywords = {
    "import", "from",   "as",     "if",     "elif",     "else",   "for",
    "in",     "while",  "break",  "continue", "pass",   "and",    "or",
    "not",    "is",     "lambda", "global", "nonlocal", "true",   "false",
    "none",   "def",    "class",  "return", "try",      "except", "finally",
    "with",   "del",    "yield",  "async",  "await",    "raise",  "assert",
    "True",   "False",  "None",
};

[[nodiscard]] bool is_keyword(std::string_view word) noexcept {
    for (const auto kw : kKeywords) {
        if (kw == word) {
            return true;
        }
    }
    return false;
}

// True/False/None → true/false/none
[[nodiscard]] std::string normalize_keyword(std::string_view word) {
    if (word == "True")  { return "true"; }
    if (word == "False") { return "false"; }
    if (word == "None")  { return "none"; }
    return std::string(word);
}

[[nodiscard]] bool is_ident_start(char c) noexcept {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

// 코드 포인트 → UTF-8
void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ---------------------------------------------------------------------------
// Scanner
//   tokenize() 한 번 동안만 사용하는 내부 상태.
// ---------------------------------------------------------------------------
class Scanner {
public:
    explicit Scanner(std::string_view source) : src_(source) {}

    std::expected<std::vector<Token>, ParseError> run() {
        while (pos_ < src_.size()) {
            const char c = src_[pos_];

            if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
                advance();
                continue;
            }
            if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') {
                    advance();
                }
                continue;
            }
            if (c == '\\') {
                // 줄 이어쓰기: '\' 뒤에 (선택적 \r) \n
                std::size_t look = pos_ + 1;
                if (look < src_.size() && src_[look] == '\r') { ++look; }
                if (look < src_.size() && src_[look] == '\n') {
                    while (pos_ <= look) { advance(); }
                    continue;
                }
                return std::unexpected(error(ParseErrorCode::kUnexpectedCharacter,
                                             "unexpected character '\\'"));
            }
            if (c == '\n') {
                const SourceLocation loc = here();
                advance();
                if (!tokens_.empty() && tokens_.back().type != TokenType::kNewline) {
                    tokens_.push_back(Token{TokenType::kNewline, "\n", loc});
                }
                continue;
            }
            if (is_ident_start(c)) {
                scan_identifier();
                continue;
            }
            if (is_digit(c) || (c == '.' && pos_ + 1 < src_.size() && is_digit(src_[pos_ + 1]))) {
                if (auto r = scan_number(); !r) {
                    return std::unexpected(std::move(r.error()));
                }
                continue;
            }
            if (c == '"' || c == '\'') {
                if (auto r = scan_string(c); !r) {
                    return std::unexpected(std::move(r.error()));
                }
                continue;
            }
            if (auto r = scan_operator(); !r) {
                return std::unexpected(std::move(r.error()));
            }
        }

        tokens_.push_back(Token{TokenType::kEnd, "", here()});
        return std::move(tokens_);
    }

private:
    [[nodiscard]] SourceLocation here() const noexcept {
        return SourceLocation{line_, column_};
    }

    void advance() noexcept {
        if (pos_ >= src_.size()) {
            return;
        }
        if (src_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }

    [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    [[nodiscard]] ParseError error(ParseErrorCode code, std::string message) const {
        const std::size_t ctx_len = std::min<std::size_t>(16, src_.size() - pos_);
        return ParseError{
            .code     = code,
            .message  = std::move(message),
            .location = here(),
            .context  = std::string(src_.substr(pos_, ctx_len)),
        };
    }

    void scan_identifier() {
        const SourceLocation loc = here();
        const std::size_t start = pos_;
        while (pos_ < src_.size() && is_ident_char(src_[pos_])) {
            advance();
        }
        const std::string_view word = src_.substr(start, pos_ - start);
        if (is_keyword(word)) {
            tokens_.push_back(Token{TokenType::kKeyword, normalize_keyword(word), loc});
        } else {
            tokens_.push_back(Token{TokenType::kName, std::string(word), loc});
        }
    }

    std::expected<void, ParseError> scan_number() {
        const SourceLocation loc = here();

        // 16진 정수
        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
            advance();
            advance();
            std::string digits;
            while (pos_ < src_.size() && (hex_value(src_[pos_]) >= 0 || src_[pos_] == '_')) {
                if (src_[pos_] != '_') { digits += src_[pos_]; }
                advance();
            }
            std::int64_t value{0};
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(),
                                                   value, 16);
            if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
                return std::unexpected(error(ParseErrorCode::kInvalidLiteral,
                                             "invalid hexadecimal literal"));
            }
            tokens_.push_back(Token{TokenType::kInt, std::to_string(value), loc});
            return {};
        }

        std::string text;
        bool is_float = false;
        const auto take_digits = [&]() {
            while (pos_ < src_.size() && (is_digit(src_[pos_]) || src_[pos_] == '_')) {
                if (src_[pos_] != '_') { text += src_[pos_]; }
                advance();
            }
        };

        take_digits();
        if (peek() == '.' && is_digit(peek(1))) {
            is_float = true;
            text += '.';
            advance();
            take_digits();
        }
        if ((peek() == 'e' || peek() == 'E') &&
            (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
            is_float = true;
            text += 'e';
            advance();
            if (peek() == '+' || peek() == '-') {
                text += peek();
                advance();
            }
            take_digits();
        }
        if (is_ident_char(peek())) {
            return std::unexpected(error(ParseErrorCode::kInvalidLiteral,
                                         "invalid character in numeric literal"));
        }

        if (is_float) {
            double value{0.0};
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{}) {
                return std::unexpected(error(ParseErrorCode::kInvalidLiteral,
                                             fmt::format("invalid float literal '{}'", text)));
            }
            tokens_.push_back(Token{TokenType::kFloat, std::move(text), loc});
            return {};
        }

        std::int64_t value{0};
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{}) {
            return std::unexpected(error(ParseErrorCode::kInvalidLiteral,
                                         fmt::format("integer literal '{}' out of range", text)));
        }
        tokens_.push_back(Token{TokenType::kInt, std::move(text), loc});
        return {};
    }

    std::expected<void, ParseError> scan_string(char quote) {
        const SourceLocation loc = here();
        advance();  // 여는 따옴표

        std::string value;
        for (;;) {
            if (pos_ >= src_.size() || src_[pos_] == '\n') {
                return std::unexpected(ParseError{
                    .code     = ParseErrorCode::kUnterminatedString,
                    .message  = "unterminated string literal",
                    .location = loc,
                    .context  = std::string(1, quote),
                });
            }
            const char c = src_[pos_];
            if (c == quote) {
                advance();
                break;
            }
            if (c != '\\') {
                value += c;
                advance();
                continue;
            }

            // escape
            advance();
            const char e = peek();
            switch (e) {
                case 'n':  value += '\n'; advance(); break;
                case 't':  value += '\t'; advance(); break;
                case 'r':  value += '\r'; advance(); break;
                case '0':  value += '\0'; advance(); break;
                case '\\': value += '\\'; advance(); break;
                case '\'': value += '\''; advance(); break;
                case '"':  value += '"';  advance(); break;
                case 'x':
                case 'u': {
                    const int width = (e == 'x') ? 2 : 4;
                    advance();
                    std::uint32_t cp = 0;
                    for (int i = 0; i < width; ++i) {
                        const int h = hex_value(peek());
                        if (h < 0) {
                            return std::unexpected(error(ParseErrorCode::kInvalidLiteral,
                                                         "truncated escape sequence"));
                        }
                        cp = (cp << 4) | static_cast<std::uint32_t>(h);
                        advance();
                    }
                    if (cp >= 0xD800 && cp <= 0xDFFF) {
                        return std::unexpected(error(ParseErrorCode::kInvalidLiteral,
                                                     "surrogate code point in escape"));
                    }
                    append_utf8(value, cp);
                    break;
                }
                default:
                    // 알 수 없는 escape 는 그대로 유지
                    value += '\\';
                    break;
            }
        }

        tokens_.push_back(Token{TokenType::kString, std::move(value), loc});
        return {};
    }

    std::expected<void, ParseError> scan_operator() {
        static constexpr std::array<std::string_view, 8> kTwoChar = {
            "==", "!=", "<=", ">=", "+=", "-=", "*=", "//",
        };
        static constexpr std::string_view kOneChar = "()[]{},.:;+-*/%<>=";

        const SourceLocation loc = here();
        const char c = peek();

        if (c == '*' && peek(1) == '*') {
            return std::unexpected(error(ParseErrorCode::kUnsupportedSyntax,
                                         "operator '**' is not supported"));
        }
        for (const auto op : kTwoChar) {
            if (c == op[0] && peek(1) == op[1]) {
                advance();
                advance();
                tokens_.push_back(Token{TokenType::kOperator, std::string(op), loc});
                return {};
            }
        }
        if (kOneChar.find(c) != std::string_view::npos) {
            advance();
            tokens_.push_back(Token{TokenType::kOperator, std::string(1, c), loc});
            return {};
        }

        const auto uc = static_cast<unsigned char>(c);
        if (uc >= 0x20 && uc < 0x7F) {
            return std::unexpected(error(ParseErrorCode::kUnexpectedCharacter,
                                         fmt::format("unexpected character '{}'", c)));
        }
        return std::unexpected(error(ParseErrorCode::kUnexpectedCharacter,
                                     fmt::format("unexpected byte 0x{:02x}", uc)));
    }

    std::string_view   src_;
    std::size_t        pos_{0};
    std::uint32_t      line_{1};
    std::uint32_t      column_{1};
    std::vector<Token> tokens_;
};

}  // namespace

std::expected<std::vector<Token>, ParseError>
SnippetLexer::tokenize(std::string_view source) const {
    Scanner scanner{source};
    return scanner.run();
}
