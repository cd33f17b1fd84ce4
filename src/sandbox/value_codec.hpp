#pragma once

// ---------------------------------------------------------------------------
// value_codec.hpp
//
// worker → executor 결과 전송용 바이너리 코덱.
//
// [포맷] 모든 정수는 little-endian
//   0 none
//   1 bool    [u8]
//   2 int     [i64]
//   3 float   [u64 IEEE-754 비트]
//   4 str     [u32 len][bytes]
//   5 list    [u8 tuple][u32 count][value...]
//   6 dict    [u32 count][key value...]
//   7 set     [u32 count][value...]
//   8 record  [str type][u32 count][(str name, value)...]
//   9 opaque  [str type][str repr]     host 객체는 문자열 표현만 전송
//
// [순환/깊이]
//   현재 경로에 이미 있는 컨테이너를 다시 만나거나 max_depth 를 넘으면
//   {"__truncated__": "<reason>"} dict 로 대체한다. 부모 프로세스는 순환
//   없는 트리만 받는다.
//
// [크기]
//   encode 는 max_bytes 를 넘는 순간 중단하고 kTooLarge 를 반환한다.
//   decode 는 모든 길이 필드를 남은 바이트 수로 검증한다.
// ---------------------------------------------------------------------------

#include "sandbox/value.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// EncodeError
// ---------------------------------------------------------------------------
enum class EncodeError : std::uint8_t {
    kTooLarge = 0,
};

// ---------------------------------------------------------------------------
// ValueCodec
// ---------------------------------------------------------------------------
class ValueCodec {
public:
    static constexpr std::size_t kDefaultMaxDepth = 128;

    // encode
    //   value    : 인코딩할 값 (순환 허용)
    //   max_bytes: 출력 상한
    [[nodiscard]] static std::expected<std::string, EncodeError>
    encode(const Value& value, std::size_t max_bytes, std::size_t max_depth = kDefaultMaxDepth);

    // decode
    //   실패 시 사람이 읽을 수 있는 오류 메시지.
    [[nodiscard]] static std::expected<Value, std::string>
    decode(std::string_view bytes, std::size_t max_depth = kDefaultMaxDepth + 1);
};
