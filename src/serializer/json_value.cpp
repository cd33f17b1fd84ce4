#include "serializer/json_value.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <system_error>

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

// utf8_sequence_length
//   s[pos] 에서 시작하는 유효한 UTF-8 시퀀스 길이. 유효하지 않으면 0.
std::size_t utf8_sequence_length(std::string_view s, std::size_t pos) noexcept {
    const auto byte = [&](std::size_t i) {
        return static_cast<unsigned char>(s[pos + i]);
    };
    const auto continuation = [&](std::size_t i) {
        return pos + i < s.size() && (byte(i) & 0xC0U) == 0x80U;
    };

    const unsigned char c = byte(0);
    if (c < 0x80U) {
        return 1;
    }
    if (c >= 0xC2U && c <= 0xDFU) {
        return continuation(1) ? 2 : 0;
    }
    if (c >= 0xE0U && c <= 0xEFU) {
        if (!continuation(1) || !continuation(2)) {
            return 0;
        }
        const unsigned char c1 = byte(1);
        if (c == 0xE0U && c1 < 0xA0U) { return 0; }  // overlong
        if (c == 0xEDU && c1 >= 0xA0U) { return 0; } // surrogate
        return 3;
    }
    if (c >= 0xF0U && c <= 0xF4U) {
        if (!continuation(1) || !continuation(2) || !continuation(3)) {
            return 0;
        }
        const unsigned char c1 = byte(1);
        if (c == 0xF0U && c1 < 0x90U) { return 0; }
        if (c == 0xF4U && c1 >= 0x90U) { return 0; }
        return 4;
    }
    return 0;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80U) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800U) {
        out += static_cast<char>(0xC0U | (cp >> 6));
        out += static_cast<char>(0x80U | (cp & 0x3FU));
    } else if (cp < 0x10000U) {
        out += static_cast<char>(0xE0U | (cp >> 12));
        out += static_cast<char>(0x80U | ((cp >> 6) & 0x3FU));
        out += static_cast<char>(0x80U | (cp & 0x3FU));
    } else {
        out += static_cast<char>(0xF0U | (cp >> 18));
        out += static_cast<char>(0x80U | ((cp >> 12) & 0x3FU));
        out += static_cast<char>(0x80U | ((cp >> 6) & 0x3FU));
        out += static_cast<char>(0x80U | (cp & 0x3FU));
    }
}

// format_number
//   유한한 double 의 최단 왕복 표현. 정수 형태면 ".0" 을 붙여 float 임을 유지한다.
std::string format_number(double d) {
    if (!std::isfinite(d)) {
        return "null";
    }
    std::string text = fmt::format("{}", d);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

// ---------------------------------------------------------------------------
// Parser
//   RFC 8259 JSON. 실패 시 오프셋을 포함한 메시지.
// ---------------------------------------------------------------------------
class Parser {
public:
    Parser(std::string_view text, std::size_t max_depth)
        : text_(text), max_depth_(max_depth) {}

    auto parse_document() -> std::expected<JsonValue, std::string> {
        auto value = parse_value(0);
        if (!value) {
            return value;
        }
        skip_ws();
        if (pos_ != text_.size()) {
            return fail("trailing characters");
        }
        return value;
    }

private:
    auto fail(std::string_view what) const -> std::unexpected<std::string> {
        return std::unexpected(fmt::format("{} at offset {}", what, pos_));
    }

    void skip_ws() noexcept {
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            ++pos_;
        }
    }

    auto consume(std::string_view word) noexcept -> bool {
        if (text_.substr(pos_, word.size()) == word) {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    auto parse_value(std::size_t depth) -> std::expected<JsonValue, std::string> {
        if (depth > max_depth_) {
            return fail("nesting too deep");
        }
        skip_ws();
        if (pos_ >= text_.size()) {
            return fail("unexpected end of input");
        }
        switch (text_[pos_]) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': {
                auto s = parse_string();
                if (!s) {
                    return std::unexpected(s.error());
                }
                return JsonValue::string(std::move(*s));
            }
            case 't':
                if (consume("true")) { return JsonValue::boolean(true); }
                return fail("invalid literal");
            case 'f':
                if (consume("false")) { return JsonValue::boolean(false); }
                return fail("invalid literal");
            case 'n':
                if (consume("null")) { return JsonValue::null(); }
                return fail("invalid literal");
            default:
                return parse_number();
        }
    }

    auto parse_object(std::size_t depth) -> std::expected<JsonValue, std::string> {
        ++pos_;  // '{'
        JsonValue out = JsonValue::object();
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return out;
        }
        for (;;) {
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                return fail("expected object key");
            }
            auto key = parse_string();
            if (!key) {
                return std::unexpected(key.error());
            }
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != ':') {
                return fail("expected ':'");
            }
            ++pos_;
            auto value = parse_value(depth + 1);
            if (!value) {
                return value;
            }
            out.set(std::move(*key), std::move(*value));
            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (pos_ < text_.size() && text_[pos_] == '}') {
                ++pos_;
                return out;
            }
            return fail("expected ',' or '}'");
        }
    }

    auto parse_array(std::size_t depth) -> std::expected<JsonValue, std::string> {
        ++pos_;  // '['
        JsonValue out = JsonValue::array();
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return out;
        }
        for (;;) {
            auto value = parse_value(depth + 1);
            if (!value) {
                return value;
            }
            out.push_back(std::move(*value));
            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (pos_ < text_.size() && text_[pos_] == ']') {
                ++pos_;
                return out;
            }
            return fail("expected ',' or ']'");
        }
    }

    auto parse_hex4() -> std::expected<std::uint32_t, std::string> {
        if (text_.size() - pos_ < 4) {
            return fail("truncated \\u escape");
        }
        std::uint32_t cp = 0;
        const char* first = text_.data() + pos_;
        const auto [ptr, ec] = std::from_chars(first, first + 4, cp, 16);
        if (ec != std::errc{} || ptr != first + 4) {
            return fail("invalid \\u escape");
        }
        pos_ += 4;
        return cp;
    }

    auto parse_string() -> std::expected<std::string, std::string> {
        ++pos_;  // '"'
        std::string out;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '"') {
                ++pos_;
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20U) {
                return fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                ++pos_;
                continue;
            }
            ++pos_;
            if (pos_ >= text_.size()) {
                break;
            }
            const char esc = text_[pos_++];
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    auto cp = parse_hex4();
                    if (!cp) {
                        return std::unexpected(cp.error());
                    }
                    std::uint32_t code = *cp;
                    if (code >= 0xD800U && code <= 0xDBFFU) {
                        if (!consume("\\u")) {
                            return fail("unpaired surrogate");
                        }
                        auto low = parse_hex4();
                        if (!low) {
                            return std::unexpected(low.error());
                        }
                        if (*low < 0xDC00U || *low > 0xDFFFU) {
                            return fail("invalid low surrogate");
                        }
                        code = 0x10000U + ((code - 0xD800U) << 10) + (*low - 0xDC00U);
                    } else if (code >= 0xDC00U && code <= 0xDFFFU) {
                        return fail("unpaired surrogate");
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return fail("invalid escape");
            }
        }
        return fail("unterminated string");
    }

    auto parse_number() -> std::expected<JsonValue, std::string> {
        const std::size_t start = pos_;
        bool is_float = false;
        if (pos_ < text_.size() && text_[pos_] == '-') {
            ++pos_;
        }
        const std::size_t digits = pos_;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c >= '0' && c <= '9') {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
                is_float = true;
                ++pos_;
            } else {
                break;
            }
        }
        if (pos_ == digits) {
            return fail("unexpected character");
        }

        const char* first = text_.data() + start;
        const char* last  = text_.data() + pos_;
        if (!is_float) {
            std::int64_t v = 0;
            const auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc{} && ptr == last) {
                return JsonValue::integer(v);
            }
        }
        double d = 0.0;
        const auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || ptr != last) {
            pos_ = start;
            return fail("invalid number");
        }
        return JsonValue::number(d);
    }

    std::string_view text_;
    std::size_t      max_depth_;
    std::size_t      pos_{0};
};

}  // namespace

// ---------------------------------------------------------------------------
// 팩토리
// ---------------------------------------------------------------------------
JsonValue JsonValue::boolean(bool v) {
    JsonValue out;
    out.type_ = Type::kBool;
    out.bool_ = v;
    return out;
}

JsonValue JsonValue::integer(std::int64_t v) {
    JsonValue out;
    out.type_ = Type::kInt;
    out.int_  = v;
    return out;
}

JsonValue JsonValue::number(double v) {
    JsonValue out;
    out.type_   = Type::kDouble;
    out.double_ = v;
    return out;
}

JsonValue JsonValue::string(std::string v) {
    JsonValue out;
    out.type_   = Type::kString;
    out.string_ = std::move(v);
    return out;
}

JsonValue JsonValue::array(Array items) {
    JsonValue out;
    out.type_  = Type::kArray;
    out.array_ = std::move(items);
    return out;
}

JsonValue JsonValue::object(Object members) {
    JsonValue out;
    out.type_   = Type::kObject;
    out.object_ = std::move(members);
    return out;
}

double JsonValue::as_double() const noexcept {
    return type_ == Type::kInt ? static_cast<double>(int_) : double_;
}

void JsonValue::push_back(JsonValue v) {
    if (type_ == Type::kArray) {
        array_.push_back(std::move(v));
    }
}

void JsonValue::set(std::string key, JsonValue v) {
    if (type_ != Type::kObject) {
        return;
    }
    for (auto& [name, value] : object_) {
        if (name == key) {
            value = std::move(v);
            return;
        }
    }
    object_.emplace_back(std::move(key), std::move(v));
}

const JsonValue* JsonValue::find(std::string_view key) const noexcept {
    if (type_ != Type::kObject) {
        return nullptr;
    }
    for (const auto& [name, value] : object_) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

std::size_t JsonValue::size() const noexcept {
    switch (type_) {
        case Type::kArray:  return array_.size();
        case Type::kObject: return object_.size();
        default:            return 0;
    }
}

std::string JsonValue::dump() const {
    std::string out;
    dump_to(out);
    return out;
}

void JsonValue::dump_to(std::string& out) const {
    switch (type_) {
        case Type::kNull:
            out += "null";
            return;
        case Type::kBool:
            out += bool_ ? "true" : "false";
            return;
        case Type::kInt:
            out += fmt::format("{}", int_);
            return;
        case Type::kDouble:
            out += format_number(double_);
            return;
        case Type::kString:
            out += '"';
            out += json_escape(string_);
            out += '"';
            return;
        case Type::kArray: {
            out += '[';
            bool first = true;
            for (const auto& item : array_) {
                if (!first) { out += ','; }
                first = false;
                item.dump_to(out);
            }
            out += ']';
            return;
        }
        case Type::kObject: {
            out += '{';
            bool first = true;
            for (const auto& [key, value] : object_) {
                if (!first) { out += ','; }
                first = false;
                out += '"';
                out += json_escape(key);
                out += "\":";
                value.dump_to(out);
            }
            out += '}';
            return;
        }
    }
}

// static
std::expected<JsonValue, std::string> JsonValue::parse(std::string_view text, std::size_t max_depth) {
    Parser parser{text, max_depth};
    return parser.parse_document();
}

// ---------------------------------------------------------------------------
// 문자열 헬퍼
// ---------------------------------------------------------------------------
std::string sanitize_utf8(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    std::size_t pos = 0;
    while (pos < s.size()) {
        const std::size_t n = utf8_sequence_length(s, pos);
        if (n == 0) {
            out += kReplacementChar;
            ++pos;
        } else {
            out.append(s.substr(pos, n));
            pos += n;
        }
    }
    return out;
}

std::string json_escape(std::string_view s) {
    const std::string valid = sanitize_utf8(s);
    std::string out;
    out.reserve(valid.size() + 8);
    for (char c : valid) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20U) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}
