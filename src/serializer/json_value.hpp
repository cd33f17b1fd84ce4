#pragma once

// ---------------------------------------------------------------------------
// json_value.hpp
//
// 순환 없는 JSON 트리와 직렬화/파싱 헬퍼.
//
// [용도]
//   - ResultSerializer 의 출력 (query 결과)
//   - Envelope / describe_capabilities 응답 본문
//   - UdsServer 요청 본문 파싱
//
// [문자열]
//   dump() 는 항상 유효한 UTF-8 을 출력한다. 잘못된 바이트 시퀀스는
//   U+FFFD 로 치환된다.
//
// [객체]
//   키 순서는 삽입 순서를 유지한다. set() 은 같은 키가 있으면 값을 교체한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class JsonValue {
public:
    enum class Type : std::uint8_t {
        kNull   = 0,
        kBool   = 1,
        kInt    = 2,
        kDouble = 3,
        kString = 4,
        kArray  = 5,
        kObject = 6,
    };

    using Array  = std::vector<JsonValue>;
    using Object = std::vector<std::pair<std::string, JsonValue>>;

    JsonValue() = default;

    [[nodiscard]] static JsonValue null() { return JsonValue{}; }
    [[nodiscard]] static JsonValue boolean(bool v);
    [[nodiscard]] static JsonValue integer(std::int64_t v);
    [[nodiscard]] static JsonValue number(double v);
    [[nodiscard]] static JsonValue string(std::string v);
    [[nodiscard]] static JsonValue array(Array items = {});
    [[nodiscard]] static JsonValue object(Object members = {});

    [[nodiscard]] Type type() const noexcept { return type_; }
    [[nodiscard]] bool is_null() const noexcept { return type_ == Type::kNull; }
    [[nodiscard]] bool is_bool() const noexcept { return type_ == Type::kBool; }
    [[nodiscard]] bool is_int() const noexcept { return type_ == Type::kInt; }
    [[nodiscard]] bool is_double() const noexcept { return type_ == Type::kDouble; }
    [[nodiscard]] bool is_string() const noexcept { return type_ == Type::kString; }
    [[nodiscard]] bool is_array() const noexcept { return type_ == Type::kArray; }
    [[nodiscard]] bool is_object() const noexcept { return type_ == Type::kObject; }

    // 타입이 맞지 않으면 기본값을 반환한다.
    [[nodiscard]] bool               as_bool() const noexcept { return bool_; }
    [[nodiscard]] std::int64_t       as_int() const noexcept { return int_; }
    [[nodiscard]] double             as_double() const noexcept;
    [[nodiscard]] const std::string& as_string() const noexcept { return string_; }
    [[nodiscard]] const Array&       as_array() const noexcept { return array_; }
    [[nodiscard]] const Object&      as_object() const noexcept { return object_; }

    // push_back: 배열에 원소 추가 (배열이 아니면 무시)
    void push_back(JsonValue v);

    // set: 객체 멤버 설정 (객체가 아니면 무시)
    void set(std::string key, JsonValue v);

    // find: 객체 멤버 조회. 없거나 객체가 아니면 nullptr
    [[nodiscard]] const JsonValue* find(std::string_view key) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    // dump: 공백 없는 JSON 텍스트
    [[nodiscard]] std::string dump() const;

    // parse: JSON 텍스트 → 트리. 중첩이 max_depth 를 넘으면 실패
    [[nodiscard]] static std::expected<JsonValue, std::string>
    parse(std::string_view text, std::size_t max_depth = 64);

    friend bool operator==(const JsonValue&, const JsonValue&) = default;

private:
    void dump_to(std::string& out) const;

    Type         type_{Type::kNull};
    bool         bool_{false};
    std::int64_t int_{0};
    double       double_{0.0};
    std::string  string_{};
    Array        array_{};
    Object       object_{};
};

// ---------------------------------------------------------------------------
// 문자열 헬퍼
// ---------------------------------------------------------------------------

// sanitize_utf8: 잘못된 UTF-8 시퀀스를 U+FFFD 로 치환
[[nodiscard]] std::string sanitize_utf8(std::string_view s);

// json_escape: JSON 문자열 값 이스케이프 (따옴표 없이 내용만 반환)
[[nodiscard]] std::string json_escape(std::string_view s);
