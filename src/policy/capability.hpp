#pragma once

// ---------------------------------------------------------------------------
// capability.hpp
//
// 능력 화이트리스트 구조체 정의 (헤더만, 판정 로직 없음).
// yaml-cpp 를 통해 config/capabilities.yaml 에서 로드된다.
//
// [설계 원칙]
// - 프로세스 시작 시 한 번 로드되고 이후 불변이다.
//   shared_ptr<const CapabilityWhitelist> 로만 공유한다 (reload 경로 없음).
// - version 은 모든 Verdict 에 기록되어 판정 재현에 사용된다.
// - 모든 컨테이너 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 판정 로직은 Validator 에 있다. 이 구조체는 데이터만 담는다.
// ---------------------------------------------------------------------------

#include "parser/ast.hpp"  // NodeKind

#include <array>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// CallPattern
//   허용된 (receiver, member) 호출 패턴.
//
//   receiver: 모듈 경로("oci.core"), 클라이언트 타입("oci.core.ComputeClient"),
//             또는 예약어 "value"(일반 결과 데이터). fnmatch glob 허용.
//   member  : 메서드/속성 이름 glob (예: "list_*", "get_*").
//   returns : 비어있지 않으면 호출 결과가 이 클라이언트 타입이 된다 (생성자).
//             비어있으면 호출 결과는 일반 값이다.
// ---------------------------------------------------------------------------
struct CallPattern {
    std::string receiver{};
    std::string member{};
    std::string returns{};
};

// ---------------------------------------------------------------------------
// BindingKind / BindingSpec
//   네임스페이스에 미리 바인딩되는 이름의 정적 종류.
//   kModule: type_name 은 모듈 경로, kClient: type_name 은 클라이언트 타입.
// ---------------------------------------------------------------------------
enum class BindingKind : std::uint8_t {
    kModule = 0,
    kValue  = 1,
    kClient = 2,
};

struct BindingSpec {
    BindingKind kind{BindingKind::kValue};
    std::string type_name{};
};

// ---------------------------------------------------------------------------
// kMandatoryForbiddenKinds
//   설정과 무관하게 항상 금지되는 능력 분류.
//   CapabilityLoader 는 설정에서 누락된 항목을 경고와 함께 추가한다.
// ---------------------------------------------------------------------------
inline constexpr std::array<NodeKind, 7> kMandatoryForbiddenKinds = {
    NodeKind::kDynamicEval,
    NodeKind::kFileAccess,
    NodeKind::kProcessSpawn,
    NodeKind::kNetworkAccess,
    NodeKind::kReflection,
    NodeKind::kGlobalScopeWrite,
    NodeKind::kAttributeStore,
};

// ---------------------------------------------------------------------------
// kSandboxBuiltins
//   sandbox 인터프리터가 구현하는 내장 함수 전체 목록.
//   allowed_builtins 는 이 목록의 부분집합이어야 한다.
// ---------------------------------------------------------------------------
inline constexpr std::array<std::string_view, 20> kSandboxBuiltins = {
    "len",  "str",  "int",    "float",  "bool",      "list",
    "dict", "set",  "sorted", "reversed", "min",     "max",
    "sum",  "range", "enumerate", "zip", "any",      "all",
    "abs",  "round",
};

// ---------------------------------------------------------------------------
// CapabilityWhitelist
//   스니펫이 사용할 수 있는 모듈/내장 함수/호출 패턴과 금지 노드 종류.
// ---------------------------------------------------------------------------
struct CapabilityWhitelist {
    std::string                        version{};
    std::vector<std::string>           allowed_modules{};        // 접두사 일치 ("oci" → "oci.core")
    std::vector<std::string>           allowed_builtins{};
    std::map<std::string, BindingSpec> bindings{};
    std::vector<CallPattern>           allowed_call_patterns{};
    std::set<NodeKind>                 forbidden_node_kinds{
        kMandatoryForbiddenKinds.begin(), kMandatoryForbiddenKinds.end()};
};
