// ---------------------------------------------------------------------------
// ast.cpp
//
// NodeKind 이름 테이블과 서브트리 복사.
// ---------------------------------------------------------------------------

#include "parser/ast.hpp"

#include <array>
#include <utility>

namespace {

struct KindName {
    NodeKind         kind;
    std::string_view name;
};

// NodeKind 선언 순서와 동일하게 유지한다.
constexpr std::array<KindName, 38> kKindNames{{
    {NodeKind::kImport,           "import"},
    {NodeKind::kImportFrom,       "import_from"},
    {NodeKind::kGlobal,           "global"},
    {NodeKind::kAssign,           "assign"},
    {NodeKind::kAugAssign,        "aug_assign"},
    {NodeKind::kIf,               "if"},
    {NodeKind::kFor,              "for"},
    {NodeKind::kWhile,            "while"},
    {NodeKind::kBreak,            "break"},
    {NodeKind::kContinue,         "continue"},
    {NodeKind::kPass,             "pass"},
    {NodeKind::kExprStmt,         "expr_stmt"},
    {NodeKind::kBlock,            "block"},
    {NodeKind::kName,             "name"},
    {NodeKind::kLiteral,          "literal"},
    {NodeKind::kList,             "list"},
    {NodeKind::kTuple,            "tuple"},
    {NodeKind::kDict,             "dict"},
    {NodeKind::kListComp,         "list_comp"},
    {NodeKind::kDictComp,         "dict_comp"},
    {NodeKind::kBinaryOp,         "binary_op"},
    {NodeKind::kUnaryOp,          "unary_op"},
    {NodeKind::kBoolOp,           "bool_op"},
    {NodeKind::kCompare,          "compare"},
    {NodeKind::kIfExp,            "if_exp"},
    {NodeKind::kAttribute,        "attribute"},
    {NodeKind::kCall,             "call"},
    {NodeKind::kKeyword,          "keyword"},
    {NodeKind::kSubscript,        "subscript"},
    {NodeKind::kSlice,            "slice"},
    {NodeKind::kLambda,           "lambda"},
    {NodeKind::kDynamicEval,      "dynamic_eval"},
    {NodeKind::kFileAccess,       "file_access"},
    {NodeKind::kProcessSpawn,     "process_spawn"},
    {NodeKind::kNetworkAccess,    "network_access"},
    {NodeKind::kReflection,       "reflection"},
    {NodeKind::kGlobalScopeWrite, "global_scope_write"},
    {NodeKind::kAttributeStore,   "attribute_store"},
}};

}  // namespace

std::string_view node_kind_name(NodeKind kind) noexcept {
    const auto index = static_cast<std::size_t>(kind);
    if (index < kKindNames.size()) {
        return kKindNames[index].name;
    }
    return "unknown";
}

std::optional<NodeKind> node_kind_from_name(std::string_view name) noexcept {
    for (const auto& entry : kKindNames) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

NodePtr clone_node(const Node& node) {
    auto copy = std::make_unique<Node>();
    copy->kind     = node.kind;
    copy->location = node.location;
    copy->text     = node.text;
    copy->member   = node.member;
    copy->alias    = node.alias;
    copy->literal  = node.literal;
    copy->children.reserve(node.children.size());
    for (const auto& child : node.children) {
        copy->children.push_back(child ? clone_node(*child) : nullptr);
    }
    return copy;
}
