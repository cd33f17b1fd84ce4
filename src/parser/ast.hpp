#pragma once

// ---------------------------------------------------------------------------
// ast.hpp
//
// 스니펫 구문 트리 정의.
//
// [노드 레이아웃]
// 모든 노드는 동일한 Node 구조체를 사용하고 kind 별로 children 의미가 다르다.
//   kImport      text=모듈 경로, alias=바인딩 이름(없으면 빈 문자열)
//   kImportFrom  text=모듈 경로, member=가져올 이름, alias=바인딩 이름
//   kGlobal      text=이름
//   kAssign      [target, value]           target: kName | kAttribute | kSubscript
//   kAugAssign   [target, value], text=연산자("+", "-", "*")
//   kIf          [cond, then_block, else_block?]  elif 는 else_block 안의 kIf
//   kFor         [target, iterable, body]  target: kName | kTuple(kName...)
//   kWhile       [cond, body]
//   kExprStmt    [expr]
//   kBlock       [stmt...]
//   kName        text=식별자
//   kLiteral     literal
//   kList/kTuple [elem...]
//   kDict        [key0, value0, key1, value1, ...]
//   kListComp    [elem, target, iterable, cond...]
//   kDictComp    [key, value, target, iterable, cond...]
//   kBinaryOp    [lhs, rhs], text=연산자
//   kUnaryOp     [operand], text="-" | "+" | "not"
//   kBoolOp      [lhs, rhs], text="and" | "or"
//   kCompare     [lhs, rhs], text=연산자 ("==", "in", "not in", "is not", ...)
//   kIfExp       [cond, then, else]
//   kAttribute   [object], text=속성명
//   kCall        [callee, arg...]  키워드 인자는 kKeyword(text=이름, [value])
//   kSubscript   [object, index]   index 는 식 또는 kSlice
//   kSlice       [lower, upper]    생략된 경계는 none 리터럴
//   kLambda      [body], text=쉼표로 연결한 파라미터 목록
//
// [능력 분류 kind]
// kDynamicEval 이후의 값은 파서가 만들지 않는다. validator 가 노드를 보안
// 범주로 분류할 때 사용하며 forbidden_node_kinds 설정 값으로도 쓰인다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// NodeKind
// ---------------------------------------------------------------------------
enum class NodeKind : std::uint8_t {
    // 문장
    kImport = 0,
    kImportFrom,
    kGlobal,
    kAssign,
    kAugAssign,
    kIf,
    kFor,
    kWhile,
    kBreak,
    kContinue,
    kPass,
    kExprStmt,
    kBlock,

    // 식
    kName,
    kLiteral,
    kList,
    kTuple,
    kDict,
    kListComp,
    kDictComp,
    kBinaryOp,
    kUnaryOp,
    kBoolOp,
    kCompare,
    kIfExp,
    kAttribute,
    kCall,
    kKeyword,
    kSubscript,
    kSlice,
    kLambda,

    // 능력 분류 (validator 전용)
    kDynamicEval,
    kFileAccess,
    kProcessSpawn,
    kNetworkAccess,
    kReflection,
    kGlobalScopeWrite,
    kAttributeStore,
};

// node_kind_name: "import_from", "dynamic_eval" 처럼 snake_case 이름을 반환한다.
[[nodiscard]] std::string_view node_kind_name(NodeKind kind) noexcept;

// node_kind_from_name: 설정 파일의 이름을 NodeKind 로 변환. 모르는 이름이면 nullopt.
[[nodiscard]] std::optional<NodeKind> node_kind_from_name(std::string_view name) noexcept;

// is_capability_kind: 능력 분류 kind 여부
[[nodiscard]] constexpr bool is_capability_kind(NodeKind kind) noexcept {
    return static_cast<std::uint8_t>(kind) >= static_cast<std::uint8_t>(NodeKind::kDynamicEval);
}

// ---------------------------------------------------------------------------
// Literal
//   monostate 는 none 을 나타낸다.
// ---------------------------------------------------------------------------
using Literal = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

struct Node;
using NodePtr = std::unique_ptr<Node>;

struct Node {
    NodeKind             kind{NodeKind::kPass};
    SourceLocation       location{};
    std::string          text{};
    std::string          member{};
    std::string          alias{};
    Literal              literal{};
    std::vector<NodePtr> children{};
};

// clone_node: 서브트리 깊은 복사 (비교 연쇄 desugar 에서 사용)
[[nodiscard]] NodePtr clone_node(const Node& node);

// ---------------------------------------------------------------------------
// Program
//   파싱 결과. source 는 원문 그대로 보존하며 로깅 용도로만 사용한다.
//   파싱 이후에는 읽기 전용이다 (fork 된 worker 가 그대로 공유한다).
// ---------------------------------------------------------------------------
struct Program {
    std::string          source{};
    std::vector<NodePtr> statements{};
};
