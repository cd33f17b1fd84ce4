#pragma once

// ---------------------------------------------------------------------------
// result_serializer.hpp
//
// 인터프리터 결과 값(Value 그래프) → JSON 안전 트리 변환.
//
// [매핑]
//   none → null, bool → bool, int → int, float → number
//   비유한 float (inf/nan) → 문자열 ("inf", "nan")
//   str    → 문자열 (잘못된 UTF-8 은 U+FFFD 로 치환)
//   list / tuple / set → 배열
//   dict   → 객체 (키는 문자열 형태로 변환: 1 → "1", None → "None")
//   record → 필드 객체
//   host   → repr 문자열
//
// [절단]
//   현재 경로에서 이미 방문한 컨테이너(순환) 또는 max_depth 도달 시
//   {"__truncated__": "cycle" | "max_depth"} 로 대체한다.
//
// [실패]
//   노드 수가 max_nodes 를 넘을 때만 SerializeError 를 반환한다.
//   알 수 없는 leaf 타입은 문자열로 강제 변환하며 예외를 던지지 않는다.
// ---------------------------------------------------------------------------

#include "sandbox/value.hpp"
#include "serializer/json_value.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

// ---------------------------------------------------------------------------
// SerializeError
// ---------------------------------------------------------------------------
enum class SerializeErrorCode : std::uint8_t {
    kNodeBudgetExceeded = 0,
};

struct SerializeError {
    SerializeErrorCode code{SerializeErrorCode::kNodeBudgetExceeded};
    std::string        message{};
};

// ---------------------------------------------------------------------------
// SerializerLimits
// ---------------------------------------------------------------------------
struct SerializerLimits {
    std::size_t max_depth{32};
    std::size_t max_nodes{200000};
};

// ---------------------------------------------------------------------------
// ResultSerializer
//   상태를 갖지 않으며 serialize() 는 순수 함수다.
// ---------------------------------------------------------------------------
class ResultSerializer {
public:
    static constexpr std::string_view kTruncatedKey = "__truncated__";

    explicit ResultSerializer(SerializerLimits limits = {});

    [[nodiscard]] std::expected<JsonValue, SerializeError> serialize(const Value& value) const;

    [[nodiscard]] const SerializerLimits& limits() const noexcept { return limits_; }

private:
    SerializerLimits limits_;
};
