#pragma once

// ---------------------------------------------------------------------------
// capability_loader.hpp
//
// YAML 능력 화이트리스트 파일을 로드하여 CapabilityWhitelist 로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 화이트리스트를 반환하지 않는다.
// - Fail-close: 알 수 없는 node kind, 불완전한 호출 패턴, 샌드박스가 제공하지
//   않는 builtin 은 모두 오류다. 느슨한 기본값으로 대체하지 않는다.
// - 필수 금지 능력 분류(kMandatoryForbiddenKinds)가 빠져 있으면 경고 후 추가한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [YAML 스키마]
//   version: "2024.06-r1"            # 필수
//   allowed_modules: [oci]
//   allowed_builtins: [len, sorted]  # 생략 시 kSandboxBuiltins 전체
//   bindings:
//     oci: module                    # module | value | <클라이언트 타입>
//     config: value
//   forbidden_node_kinds: [dynamic_eval, file_access, ...]
//   allowed_call_patterns:
//     - receiver: oci.core
//       member: ComputeClient
//       returns: oci.core.ComputeClient
//     - receiver: oci.core.ComputeClient
//       member: "list_*"
// ---------------------------------------------------------------------------

#include "policy/capability.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// CapabilityLoader
//   YAML 파일 경로 또는 YAML 문자열을 받아 CapabilityWhitelist 를 반환한다.
//   실패 시 std::unexpected(에러 메시지) 를 반환한다.
// ---------------------------------------------------------------------------
class CapabilityLoader {
public:
    CapabilityLoader()  = default;
    ~CapabilityLoader() = default;

    CapabilityLoader(const CapabilityLoader&)            = default;
    CapabilityLoader& operator=(const CapabilityLoader&) = default;
    CapabilityLoader(CapabilityLoader&&)                 = default;
    CapabilityLoader& operator=(CapabilityLoader&&)      = default;

    // load
    //   config_path: YAML 화이트리스트 파일 경로 (절대/상대 모두 허용)
    [[nodiscard]] static std::expected<CapabilityWhitelist, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   YAML 문서 문자열을 직접 파싱한다 (테스트/내장 설정용).
    [[nodiscard]] static std::expected<CapabilityWhitelist, std::string>
    load_from_string(std::string_view yaml_text);
};
