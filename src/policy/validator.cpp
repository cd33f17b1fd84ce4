// ---------------------------------------------------------------------------
// validator.cpp
//
// Validator 구현.
//
// [판정 순서 (노드마다, 전위 순회)]
//   1. 구문 kind 가 forbidden_node_kinds 에 있는지
//   2. 능력 분류 (정적 테이블) 가 금지되었는지
//   3. kind 별 검사: import 모듈, 호출 패턴, 모듈/클라이언트 속성 읽기
//   4. 자식 노드 재귀
//
// [오탐/미탐 트레이드오프]
// - 흐름 비민감 추론이므로 조건부로만 재바인딩되는 이름도 모든 kind 를
//   가진 것으로 본다. 정상 스니펫이 거부될 수 있으나 (false positive)
//   우회는 막는다.
// - 능력 분류 테이블에 없는 위험 API 가 있더라도 호출 패턴 default deny 에서
//   걸린다. 테이블은 거부 사유를 구체적으로 보고하기 위한 것이다.
// ---------------------------------------------------------------------------

#include "policy/validator.hpp"

#include <algorithm>
#include <compare>
#include <cstdint>
#include <fnmatch.h>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>

namespace {

// ---------------------------------------------------------------------------
// 능력 분류 테이블
// ---------------------------------------------------------------------------

// 이름(builtin) → 능력 분류
const std::unordered_map<std::string_view, NodeKind>& name_classes() {
    static const std::unordered_map<std::string_view, NodeKind> kMap = {
        {"eval",         NodeKind::kDynamicEval},
        {"exec",         NodeKind::kDynamicEval},
        {"execfile",     NodeKind::kDynamicEval},
        {"compile",      NodeKind::kDynamicEval},
        {"__import__",   NodeKind::kDynamicEval},
        {"open",         NodeKind::kFileAccess},
        {"file",         NodeKind::kFileAccess},
        {"socket",       NodeKind::kNetworkAccess},
        {"getattr",      NodeKind::kReflection},
        {"setattr",      NodeKind::kReflection},
        {"delattr",      NodeKind::kReflection},
        {"hasattr",      NodeKind::kReflection},
        {"globals",      NodeKind::kReflection},
        {"locals",       NodeKind::kReflection},
        {"vars",         NodeKind::kReflection},
        {"dir",          NodeKind::kReflection},
        {"type",         NodeKind::kReflection},
        {"super",        NodeKind::kReflection},
        {"breakpoint",   NodeKind::kReflection},
        {"memoryview",   NodeKind::kReflection},
        {"classmethod",  NodeKind::kReflection},
        {"staticmethod", NodeKind::kReflection},
    };
    return kMap;
}

// 속성 이름 → 능력 분류 ('_' 접두사는 별도로 reflection)
const std::unordered_map<std::string_view, NodeKind>& member_classes() {
    static const std::unordered_map<std::string_view, NodeKind> kMap = {
        {"eval",              NodeKind::kDynamicEval},
        {"exec",              NodeKind::kDynamicEval},
        {"compile",           NodeKind::kDynamicEval},
        {"import_module",     NodeKind::kDynamicEval},
        {"system",            NodeKind::kProcessSpawn},
        {"popen",             NodeKind::kProcessSpawn},
        {"Popen",             NodeKind::kProcessSpawn},
        {"fork",              NodeKind::kProcessSpawn},
        {"forkpty",           NodeKind::kProcessSpawn},
        {"spawnl",            NodeKind::kProcessSpawn},
        {"spawnle",           NodeKind::kProcessSpawn},
        {"spawnlp",           NodeKind::kProcessSpawn},
        {"spawnv",            NodeKind::kProcessSpawn},
        {"spawnve",           NodeKind::kProcessSpawn},
        {"spawnvp",           NodeKind::kProcessSpawn},
        {"posix_spawn",       NodeKind::kProcessSpawn},
        {"execl",             NodeKind::kProcessSpawn},
        {"execle",            NodeKind::kProcessSpawn},
        {"execlp",            NodeKind::kProcessSpawn},
        {"execv",             NodeKind::kProcessSpawn},
        {"execve",            NodeKind::kProcessSpawn},
        {"execvp",            NodeKind::kProcessSpawn},
        {"check_output",      NodeKind::kProcessSpawn},
        {"check_call",        NodeKind::kProcessSpawn},
        {"getoutput",         NodeKind::kProcessSpawn},
        {"getstatusoutput",   NodeKind::kProcessSpawn},
        {"kill",              NodeKind::kProcessSpawn},
        {"killpg",            NodeKind::kProcessSpawn},
        {"open",              NodeKind::kFileAccess},
        {"read_text",         NodeKind::kFileAccess},
        {"write_text",        NodeKind::kFileAccess},
        {"read_bytes",        NodeKind::kFileAccess},
        {"write_bytes",       NodeKind::kFileAccess},
        {"unlink",            NodeKind::kFileAccess},
        {"remove",            NodeKind::kFileAccess},
        {"rmdir",             NodeKind::kFileAccess},
        {"rmtree",            NodeKind::kFileAccess},
        {"mkdir",             NodeKind::kFileAccess},
        {"makedirs",          NodeKind::kFileAccess},
        {"listdir",           NodeKind::kFileAccess},
        {"scandir",           NodeKind::kFileAccess},
        {"walk",              NodeKind::kFileAccess},
        {"chmod",             NodeKind::kFileAccess},
        {"chown",             NodeKind::kFileAccess},
        {"rename",            NodeKind::kFileAccess},
        {"symlink",           NodeKind::kFileAccess},
        {"copyfile",          NodeKind::kFileAccess},
        {"socket",            NodeKind::kNetworkAccess},
        {"create_connection", NodeKind::kNetworkAccess},
        {"connect",           NodeKind::kNetworkAccess},
        {"urlopen",           NodeKind::kNetworkAccess},
        {"urlretrieve",       NodeKind::kNetworkAccess},
        {"getaddrinfo",       NodeKind::kNetworkAccess},
        {"gethostbyname",     NodeKind::kNetworkAccess},
        {"sendall",           NodeKind::kNetworkAccess},
        {"recv",              NodeKind::kNetworkAccess},
        {"getattr",           NodeKind::kReflection},
        {"setattr",           NodeKind::kReflection},
        {"globals",           NodeKind::kReflection},
        {"locals",            NodeKind::kReflection},
        {"vars",              NodeKind::kReflection},
    };
    return kMap;
}

// 최상위 모듈 이름 → 능력 분류
const std::unordered_map<std::string_view, NodeKind>& module_classes() {
    static const std::unordered_map<std::string_view, NodeKind> kMap = {
        {"os",              NodeKind::kProcessSpawn},
        {"subprocess",      NodeKind::kProcessSpawn},
        {"pty",             NodeKind::kProcessSpawn},
        {"multiprocessing", NodeKind::kProcessSpawn},
        {"signal",          NodeKind::kProcessSpawn},
        {"socket",          NodeKind::kNetworkAccess},
        {"ssl",             NodeKind::kNetworkAccess},
        {"urllib",          NodeKind::kNetworkAccess},
        {"http",            NodeKind::kNetworkAccess},
        {"requests",        NodeKind::kNetworkAccess},
        {"ftplib",          NodeKind::kNetworkAccess},
        {"smtplib",         NodeKind::kNetworkAccess},
        {"asyncio",         NodeKind::kNetworkAccess},
        {"shutil",          NodeKind::kFileAccess},
        {"pathlib",         NodeKind::kFileAccess},
        {"io",              NodeKind::kFileAccess},
        {"tempfile",        NodeKind::kFileAccess},
        {"glob",            NodeKind::kFileAccess},
        {"fileinput",       NodeKind::kFileAccess},
        {"importlib",       NodeKind::kDynamicEval},
        {"builtins",        NodeKind::kDynamicEval},
        {"ctypes",          NodeKind::kDynamicEval},
        {"pickle",          NodeKind::kDynamicEval},
        {"marshal",         NodeKind::kDynamicEval},
        {"code",            NodeKind::kDynamicEval},
        {"runpy",           NodeKind::kDynamicEval},
        {"sys",             NodeKind::kReflection},
        {"inspect",         NodeKind::kReflection},
        {"gc",              NodeKind::kReflection},
        {"types",           NodeKind::kReflection},
    };
    return kMap;
}

[[nodiscard]] std::string_view describe_class(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::kDynamicEval:      return "dynamic code evaluation";
        case NodeKind::kFileAccess:       return "file-system access";
        case NodeKind::kProcessSpawn:     return "process spawning";
        case NodeKind::kNetworkAccess:    return "raw network access";
        case NodeKind::kReflection:       return "reflection";
        case NodeKind::kGlobalScopeWrite: return "write outside the local scope";
        case NodeKind::kAttributeStore:   return "attribute assignment";
        default:                          return "restricted capability";
    }
}

[[nodiscard]] std::string_view root_module(std::string_view path) noexcept {
    const auto dot = path.find('.');
    return dot == std::string_view::npos ? path : path.substr(0, dot);
}

// ---------------------------------------------------------------------------
// Kind
//   식이 가질 수 있는 정적 종류.
//   kModule  : type = 모듈 경로
//   kClient  : type = 클라이언트 타입
//   kCallable: type = 호출 결과 클라이언트 타입 (비어있으면 일반 값), origin = "receiver.member"
//   kValue   : 일반 데이터
// ---------------------------------------------------------------------------
struct Kind {
    enum class Tag : std::uint8_t { kModule = 0, kClient = 1, kCallable = 2, kValue = 3 };

    Tag         tag{Tag::kValue};
    std::string type{};
    std::string origin{};

    auto operator<=>(const Kind&) const = default;
};

using KindSet = std::set<Kind>;

[[nodiscard]] Kind value_kind() { return Kind{Kind::Tag::kValue, {}, {}}; }

[[nodiscard]] std::string describe_kind(const Kind& k) {
    switch (k.tag) {
        case Kind::Tag::kModule:   return fmt::format("module '{}'", k.type);
        case Kind::Tag::kClient:   return fmt::format("client '{}'", k.type);
        case Kind::Tag::kCallable: return fmt::format("callable '{}'", k.origin);
        case Kind::Tag::kValue:    return "a plain value";
    }
    return "a plain value";
}

struct Classification {
    NodeKind    kind;
    std::string reason;
};

// 이름 바인딩 이벤트: 대입식(value) 또는 고정 kind. site 는 위반 보고 위치
struct BindingEvent {
    std::string         name;
    const Node*         value{nullptr};
    std::optional<Kind> fixed{};
    const Node*         site{nullptr};
};

// 고정점 반복 상한 / 이름당 kind 상한
//   어느 쪽이든 넘으면 부분 집합으로 계속하지 않고 위반으로 거부한다.
constexpr int         kMaxFixpointRounds = 8;
constexpr std::size_t kMaxKindsPerName   = 16;

// ---------------------------------------------------------------------------
// Analysis
//   check() 한 번 동안만 사용하는 내부 상태.
// ---------------------------------------------------------------------------
class Analysis {
public:
    explicit Analysis(const CapabilityWhitelist& wl) : wl_(wl) {}

    Verdict run(const Program& program) {
        for (const auto& stmt : program.statements) {
            collect_events(*stmt);
        }
        infer_names();
        for (const auto& stmt : program.statements) {
            visit(*stmt, false);
        }

        Verdict verdict{};
        verdict.admitted          = violations_.empty();
        verdict.whitelist_version = wl_.version;
        verdict.violations        = std::move(violations_);
        return verdict;
    }

private:
    // ── 화이트리스트 질의 ───────────────────────────────────────────────
    [[nodiscard]] bool module_allowed(std::string_view path) const {
        return std::any_of(wl_.allowed_modules.begin(), wl_.allowed_modules.end(),
                           [&](const std::string& m) {
                               return path == m ||
                                      (path.size() > m.size() && path.starts_with(m) &&
                                       path[m.size()] == '.');
                           });
    }

    [[nodiscard]] bool builtin_allowed(std::string_view name) const {
        return std::find(wl_.allowed_builtins.begin(), wl_.allowed_builtins.end(), name) !=
               wl_.allowed_builtins.end();
    }

    [[nodiscard]] const CallPattern* find_pattern(const std::string& receiver,
                                                  const std::string& member) const {
        for (const auto& p : wl_.allowed_call_patterns) {
            if (::fnmatch(p.receiver.c_str(), receiver.c_str(), 0) == 0 &&
                ::fnmatch(p.member.c_str(), member.c_str(), 0) == 0) {
                return &p;
            }
        }
        return nullptr;
    }

    [[nodiscard]] bool forbidden(NodeKind kind) const {
        return wl_.forbidden_node_kinds.contains(kind);
    }

    // ── 이름 kind 수집 ──────────────────────────────────────────────────
    void add_loop_targets(const Node& target) {
        if (target.kind == NodeKind::kName) {
            events_.push_back(BindingEvent{target.text, nullptr, value_kind(), &target});
            assigned_.insert(target.text);
            return;
        }
        for (const auto& child : target.children) {
            add_loop_targets(*child);
        }
    }

    void collect_events(const Node& node) {
        switch (node.kind) {
            case NodeKind::kAssign:
                if (node.children[0]->kind == NodeKind::kName) {
                    events_.push_back(BindingEvent{node.children[0]->text, node.children[1].get(), {}, &node});
                    assigned_.insert(node.children[0]->text);
                }
                break;
            case NodeKind::kAugAssign:
                if (node.children[0]->kind == NodeKind::kName) {
                    events_.push_back(BindingEvent{node.children[0]->text, nullptr, value_kind(), &node});
                    assigned_.insert(node.children[0]->text);
                }
                break;
            case NodeKind::kFor:
                add_loop_targets(*node.children[0]);
                break;
            case NodeKind::kListComp:
                add_loop_targets(*node.children[1]);
                break;
            case NodeKind::kDictComp:
                add_loop_targets(*node.children[2]);
                break;
            case NodeKind::kImport: {
                // import a.b   → a 에 모듈 a 바인딩
                // import a.b as c → c 에 모듈 a.b 바인딩
                const std::string name = node.alias.empty()
                    ? std::string(root_module(node.text)) : node.alias;
                const std::string path = node.alias.empty()
                    ? std::string(root_module(node.text)) : node.text;
                events_.push_back(BindingEvent{name, nullptr, Kind{Kind::Tag::kModule, path, {}}, &node});
                assigned_.insert(name);
                break;
            }
            case NodeKind::kImportFrom:
                events_.push_back(BindingEvent{
                    node.alias, nullptr,
                    attribute_kind(Kind{Kind::Tag::kModule, node.text, {}}, node.member), &node});
                assigned_.insert(node.alias);
                break;
            default:
                break;
        }
        for (const auto& child : node.children) {
            if (child) {
                collect_events(*child);
            }
        }
    }

    void infer_names() {
        for (const auto& [name, spec] : wl_.bindings) {
            switch (spec.kind) {
                case BindingKind::kModule:
                    names_[name].insert(Kind{Kind::Tag::kModule, spec.type_name, {}});
                    break;
                case BindingKind::kClient:
                    names_[name].insert(Kind{Kind::Tag::kClient, spec.type_name, {}});
                    break;
                case BindingKind::kValue:
                    names_[name].insert(value_kind());
                    break;
            }
        }

        std::set<std::string> overflowed;
        const BindingEvent*   last_changed = nullptr;
        for (int round = 0; round < kMaxFixpointRounds; ++round) {
            last_changed = nullptr;
            for (const auto& ev : events_) {
                if (overflowed.contains(ev.name)) {
                    continue;
                }
                const KindSet kinds = ev.value ? kinds_of(*ev.value) : KindSet{*ev.fixed};
                auto& target = names_[ev.name];
                for (const auto& k : kinds) {
                    if (target.contains(k)) {
                        continue;
                    }
                    if (target.size() >= kMaxKindsPerName) {
                        overflowed.insert(ev.name);
                        add_violation(ev.site->kind, *ev.site, fmt::format(
                            "too many possible kinds for '{}' (limit {})", ev.name, kMaxKindsPerName));
                        break;
                    }
                    target.insert(k);
                    last_changed = &ev;
                }
            }
            if (last_changed == nullptr) {
                return;
            }
        }
        // 상한 안에 수렴하지 않음
        add_violation(last_changed->site->kind, *last_changed->site, fmt::format(
            "kind analysis did not converge within {} rounds (last change: '{}')",
            kMaxFixpointRounds, last_changed->name));
    }

    // ── kind 추론 ───────────────────────────────────────────────────────
    [[nodiscard]] Kind attribute_kind(const Kind& receiver, const std::string& member) const {
        switch (receiver.tag) {
            case Kind::Tag::kModule:
                if (const auto* p = find_pattern(receiver.type, member)) {
                    return Kind{Kind::Tag::kCallable, p->returns, receiver.type + "." + member};
                }
                return Kind{Kind::Tag::kModule, receiver.type + "." + member, {}};
            case Kind::Tag::kClient:
                if (const auto* p = find_pattern(receiver.type, member)) {
                    return Kind{Kind::Tag::kCallable, p->returns, receiver.type + "." + member};
                }
                return value_kind();
            case Kind::Tag::kCallable:
            case Kind::Tag::kValue:
                return value_kind();
        }
        return value_kind();
    }

    [[nodiscard]] KindSet kinds_of(const Node& expr) const {
        switch (expr.kind) {
            case NodeKind::kName: {
                if (const auto it = names_.find(expr.text); it != names_.end() && !it->second.empty()) {
                    return it->second;
                }
                if (builtin_allowed(expr.text)) {
                    return KindSet{Kind{Kind::Tag::kCallable, {}, expr.text}};
                }
                return KindSet{value_kind()};
            }
            case NodeKind::kAttribute: {
                KindSet out;
                for (const auto& k : kinds_of(*expr.children[0])) {
                    out.insert(attribute_kind(k, expr.text));
                }
                return out;
            }
            case NodeKind::kCall: {
                KindSet out;
                for (const auto& k : kinds_of(*expr.children[0])) {
                    if (k.tag == Kind::Tag::kCallable && !k.type.empty()) {
                        out.insert(Kind{Kind::Tag::kClient, k.type, {}});
                    } else {
                        out.insert(value_kind());
                    }
                }
                return out;
            }
            case NodeKind::kIfExp: {
                KindSet out = kinds_of(*expr.children[1]);
                out.merge(kinds_of(*expr.children[2]));
                return out;
            }
            case NodeKind::kBoolOp: {
                KindSet out = kinds_of(*expr.children[0]);
                out.merge(kinds_of(*expr.children[1]));
                return out;
            }
            default:
                return KindSet{value_kind()};
        }
    }

    // ── 능력 분류 ───────────────────────────────────────────────────────
    [[nodiscard]] std::optional<Classification> classify(const Node& node) const {
        const auto make = [](NodeKind kind, std::string_view subject) {
            return Classification{
                kind,
                fmt::format("{} belongs to capability class '{}' ({})",
                            subject, node_kind_name(kind), describe_class(kind)),
            };
        };

        switch (node.kind) {
            case NodeKind::kName: {
                if (assigned_.contains(node.text)) {
                    return std::nullopt;
                }
                const auto& names = name_classes();
                if (const auto it = names.find(node.text); it != names.end()) {
                    return make(it->second, fmt::format("'{}'", node.text));
                }
                if (node.text.starts_with("__")) {
                    return make(NodeKind::kReflection, fmt::format("'{}'", node.text));
                }
                return std::nullopt;
            }
            case NodeKind::kAttribute: {
                if (node.text.starts_with("_")) {
                    return make(NodeKind::kReflection, fmt::format("attribute '{}'", node.text));
                }
                const auto& members = member_classes();
                if (const auto it = members.find(node.text); it != members.end()) {
                    return make(it->second, fmt::format("attribute '{}'", node.text));
                }
                return std::nullopt;
            }
            case NodeKind::kImport:
            case NodeKind::kImportFrom: {
                const auto& modules = module_classes();
                if (const auto it = modules.find(root_module(node.text)); it != modules.end()) {
                    return make(it->second, fmt::format("module '{}'", node.text));
                }
                if (node.kind == NodeKind::kImportFrom) {
                    const auto& names = name_classes();
                    if (const auto it = names.find(node.member); it != names.end()) {
                        return make(it->second, fmt::format("'{}'", node.member));
                    }
                }
                return std::nullopt;
            }
            case NodeKind::kGlobal:
                return make(NodeKind::kGlobalScopeWrite, fmt::format("'global {}'", node.text));
            case NodeKind::kLambda:
                return make(NodeKind::kDynamicEval, "lambda");
            case NodeKind::kAssign:
            case NodeKind::kAugAssign: {
                const Node& target = *node.children[0];
                if (target.kind == NodeKind::kAttribute) {
                    return make(NodeKind::kAttributeStore,
                                fmt::format("assignment to attribute '{}'", target.text));
                }
                if (target.kind == NodeKind::kName && wl_.bindings.contains(target.text)) {
                    return make(NodeKind::kGlobalScopeWrite,
                                fmt::format("rebinding of pre-authorized name '{}'", target.text));
                }
                return std::nullopt;
            }
            default:
                return std::nullopt;
        }
    }

    // ── 위반 기록 ───────────────────────────────────────────────────────
    void add_violation(NodeKind kind, const Node& node, std::string reason) {
        violations_.push_back(Violation{kind, node.location, std::move(reason)});
    }

    void check_forbidden_kind(const Node& node) {
        if (forbidden(node.kind)) {
            add_violation(node.kind, node,
                          fmt::format("'{}' constructs are forbidden", node_kind_name(node.kind)));
        }
    }

    // 금지된 능력 분류면 위반을 기록하고 true
    bool check_capability_class(const Node& node) {
        auto cls = classify(node);
        if (cls && forbidden(cls->kind)) {
            add_violation(cls->kind, node, std::move(cls->reason));
            return true;
        }
        return false;
    }

    [[nodiscard]] bool classified_forbidden(const Node& node) const {
        const auto cls = classify(node);
        return cls && forbidden(cls->kind);
    }

    void check_loop_target(const Node& target) {
        if (target.kind == NodeKind::kName) {
            if (wl_.bindings.contains(target.text) && forbidden(NodeKind::kGlobalScopeWrite)) {
                add_violation(NodeKind::kGlobalScopeWrite, target,
                              fmt::format("loop variable rebinds pre-authorized name '{}'",
                                          target.text));
            }
            return;
        }
        for (const auto& child : target.children) {
            check_loop_target(*child);
        }
    }

    // ── kind 별 검사 ────────────────────────────────────────────────────
    void check_import(const Node& node) {
        if (!module_allowed(node.text)) {
            add_violation(NodeKind::kImport, node,
                          fmt::format("module '{}' is not in allowed_modules", node.text));
        }
    }

    void check_import_from(const Node& node) {
        if (!module_allowed(node.text)) {
            add_violation(NodeKind::kImportFrom, node,
                          fmt::format("module '{}' is not in allowed_modules", node.text));
            return;
        }
        if (!find_pattern(node.text, node.member) &&
            !module_allowed(node.text + "." + node.member)) {
            add_violation(NodeKind::kImportFrom, node,
                          fmt::format("'{}' from '{}' is not whitelisted", node.member, node.text));
        }
    }

    void check_call(const Node& call) {
        const Node& callee = *call.children[0];

        if (callee.kind == NodeKind::kName) {
            if (const auto it = names_.find(callee.text); it != names_.end() && !it->second.empty()) {
                for (const auto& k : it->second) {
                    if (k.tag != Kind::Tag::kCallable) {
                        add_violation(NodeKind::kCall, call, fmt::format(
                            "'{}' may hold {}, which is not a whitelisted callable",
                            callee.text, describe_kind(k)));
                        return;
                    }
                }
                return;
            }
            if (!builtin_allowed(callee.text)) {
                add_violation(NodeKind::kCall, call,
                              fmt::format("call to '{}' is not whitelisted", callee.text));
            }
            return;
        }

        if (callee.kind == NodeKind::kAttribute) {
            const std::string& member = callee.text;
            for (const auto& k : kinds_of(*callee.children[0])) {
                switch (k.tag) {
                    case Kind::Tag::kModule:
                    case Kind::Tag::kClient:
                        if (!find_pattern(k.type, member)) {
                            add_violation(NodeKind::kCall, call, fmt::format(
                                "'{}.{}' is not in allowed_call_patterns", k.type, member));
                            return;
                        }
                        break;
                    case Kind::Tag::kValue:
                        if (!find_pattern("value", member)) {
                            add_violation(NodeKind::kCall, call, fmt::format(
                                "method '{}' on plain values is not in allowed_call_patterns",
                                member));
                            return;
                        }
                        break;
                    case Kind::Tag::kCallable:
                        add_violation(NodeKind::kCall, call, fmt::format(
                            "attribute '{}' of {} cannot be called", member, describe_kind(k)));
                        return;
                }
            }
            return;
        }

        for (const auto& k : kinds_of(callee)) {
            if (k.tag != Kind::Tag::kCallable) {
                add_violation(NodeKind::kCall, call, fmt::format(
                    "call target of kind '{}' may hold {}, which is not a whitelisted callable",
                    node_kind_name(callee.kind), describe_kind(k)));
                return;
            }
        }
    }

    void check_attribute_read(const Node& node) {
        const std::string& member = node.text;
        for (const auto& k : kinds_of(*node.children[0])) {
            switch (k.tag) {
                case Kind::Tag::kModule:
                    if (!find_pattern(k.type, member) && !module_allowed(k.type + "." + member)) {
                        add_violation(NodeKind::kAttribute, node, fmt::format(
                            "'{}.{}' is not accessible under the whitelist", k.type, member));
                        return;
                    }
                    break;
                case Kind::Tag::kClient:
                    if (!find_pattern(k.type, member)) {
                        add_violation(NodeKind::kAttribute, node, fmt::format(
                            "'{}.{}' is not in allowed_call_patterns", k.type, member));
                        return;
                    }
                    break;
                case Kind::Tag::kCallable:
                    add_violation(NodeKind::kAttribute, node, fmt::format(
                        "attribute '{}' of {} is not accessible", member, describe_kind(k)));
                    return;
                case Kind::Tag::kValue:
                    break;
            }
        }
    }

    // ── 순회 ────────────────────────────────────────────────────────────
    void visit_assignment(const Node& node) {
        const Node& target = *node.children[0];
        if (target.kind == NodeKind::kAttribute) {
            check_forbidden_kind(target);
            check_capability_class(target);
            visit(*target.children[0], false);
        } else if (target.kind == NodeKind::kSubscript) {
            visit(target, false);
        } else {
            check_forbidden_kind(target);
        }
        visit(*node.children[1], false);
    }

    void visit_call(const Node& node) {
        const Node& callee = *node.children[0];
        if (!classified_forbidden(callee)) {
            check_call(node);
        }
        visit(callee, true);
        for (std::size_t i = 1; i < node.children.size(); ++i) {
            visit(*node.children[i], false);
        }
    }

    void visit(const Node& node, bool as_callee) {
        check_forbidden_kind(node);
        const bool classified = check_capability_class(node);

        switch (node.kind) {
            case NodeKind::kImport:
                if (!classified) { check_import(node); }
                break;
            case NodeKind::kImportFrom:
                if (!classified) { check_import_from(node); }
                break;
            case NodeKind::kAssign:
            case NodeKind::kAugAssign:
                visit_assignment(node);
                return;
            case NodeKind::kFor:
                check_loop_target(*node.children[0]);
                break;
            case NodeKind::kListComp:
                check_loop_target(*node.children[1]);
                break;
            case NodeKind::kDictComp:
                check_loop_target(*node.children[2]);
                break;
            case NodeKind::kCall:
                visit_call(node);
                return;
            case NodeKind::kAttribute:
                if (!as_callee && !classified) { check_attribute_read(node); }
                break;
            default:
                break;
        }

        for (const auto& child : node.children) {
            if (child) {
                visit(*child, false);
            }
        }
    }

    const CapabilityWhitelist&     wl_;
    std::vector<BindingEvent>      events_;
    std::set<std::string>          assigned_;
    std::map<std::string, KindSet> names_;
    std::vector<Violation>         violations_;
};

}  // namespace

// ---------------------------------------------------------------------------
// Validator 구현
// ---------------------------------------------------------------------------
Validator::Validator(std::shared_ptr<const CapabilityWhitelist> whitelist, SnippetParser parser)
    : whitelist_(std::move(whitelist))
    , parser_(parser)
{}

std::expected<Verdict, ParseError> Validator::check(std::string_view snippet) const {
    auto program = parser_.parse(snippet);
    if (!program) {
        return std::unexpected(std::move(program.error()));
    }
    return check(*program);
}

Verdict Validator::check(const Program& program) const {
    // fail-close: 화이트리스트 없음
    if (!whitelist_) {
        Verdict verdict{};
        verdict.admitted = false;
        verdict.violations.push_back(Violation{
            program.statements.empty() ? NodeKind::kPass : program.statements.front()->kind,
            SourceLocation{},
            "no capability whitelist is loaded",
        });
        return verdict;
    }

    Analysis analysis{*whitelist_};
    return analysis.run(program);
}
