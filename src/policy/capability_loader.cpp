// ---------------------------------------------------------------------------
// capability_loader.cpp
//
// YAML 능력 화이트리스트를 로드하여 CapabilityWhitelist 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 섹션 하나라도 실패하면 std::unexpected 를 반환한다.
// - Fail-close: 잘못된 설정을 "허용"으로 해석하지 않는다.
//   예) allowed_builtins 에 eval 을 적으면 로드 자체가 실패한다.
// - 필수 금지 능력 분류 누락은 오류가 아니라 경고 후 자동 추가한다.
//   설정 실수로 보안 경계가 약해지는 경우를 막는다.
//
// [알려진 한계]
// - member/receiver glob 은 fnmatch(3) 문법만 허용한다. 문자 클래스([...])는
//   허용 문자 검사에서 거부된다.
// ---------------------------------------------------------------------------

#include "policy/capability_loader.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

// 로드 실패 결과. 메시지를 error 로그로 남기고 그대로 반환한다.
[[nodiscard]] std::unexpected<std::string> load_error(std::string message) {
    spdlog::error("{}", message);
    return std::unexpected(std::move(message));
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::string>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// sequence 가 아닌 노드는 오류 (조용히 무시하면 설정 실수를 놓친다).
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<std::string>, std::string>
read_string_sequence(const YAML::Node& node, std::string_view field) {
    std::vector<std::string> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        return std::unexpected(fmt::format("'{}' must be a sequence", field));
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return std::unexpected(fmt::format("'{}' entries must be scalars", field));
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

[[nodiscard]] bool is_identifier(std::string_view s) noexcept {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s.front())) != 0) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });
}

// "oci.core" 같은 점 구분 경로
[[nodiscard]] bool is_dotted_path(std::string_view s) noexcept {
    if (s.empty()) {
        return false;
    }
    std::size_t start = 0;
    for (;;) {
        const auto dot = s.find('.', start);
        const auto part = s.substr(start, dot == std::string_view::npos ? s.npos : dot - start);
        if (!is_identifier(part)) {
            return false;
        }
        if (dot == std::string_view::npos) {
            return true;
        }
        start = dot + 1;
    }
}

// glob 허용 문자: 식별자 문자, '.', '*', '?'
[[nodiscard]] bool is_valid_glob(std::string_view s) noexcept {
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
               c == '_' || c == '.' || c == '*' || c == '?';
    });
}

[[nodiscard]] bool is_sandbox_builtin(std::string_view name) noexcept {
    return std::find(kSandboxBuiltins.begin(), kSandboxBuiltins.end(), name) !=
           kSandboxBuiltins.end();
}

// ---------------------------------------------------------------------------
// 섹션 파서
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<std::string>, std::string>
parse_allowed_modules(const YAML::Node& node) {
    auto modules = read_string_sequence(node, "allowed_modules");
    if (!modules) {
        return modules;
    }
    for (const auto& m : *modules) {
        if (!is_dotted_path(m)) {
            return std::unexpected(fmt::format("allowed_modules: '{}' is not a module path", m));
        }
    }
    return modules;
}

[[nodiscard]] std::expected<std::vector<std::string>, std::string>
parse_allowed_builtins(const YAML::Node& node) {
    if (!node) {
        // 생략 시 샌드박스 내장 함수 전체
        return std::vector<std::string>(kSandboxBuiltins.begin(), kSandboxBuiltins.end());
    }
    auto builtins = read_string_sequence(node, "allowed_builtins");
    if (!builtins) {
        return builtins;
    }
    for (const auto& b : *builtins) {
        if (!is_sandbox_builtin(b)) {
            return std::unexpected(fmt::format(
                "allowed_builtins: '{}' is not provided by the sandbox interpreter", b));
        }
    }
    return builtins;
}

[[nodiscard]] std::expected<std::map<std::string, BindingSpec>, std::string>
parse_bindings(const YAML::Node& node) {
    std::map<std::string, BindingSpec> bindings;
    if (!node || node.IsNull()) {
        return bindings;
    }
    if (!node.IsMap()) {
        return std::unexpected(std::string("'bindings' must be a map of name to kind"));
    }
    for (const auto& entry : node) {
        const auto name = entry.first.as<std::string>();
        const auto kind = read_string(entry.second, "");
        if (!is_identifier(name)) {
            return std::unexpected(fmt::format("bindings: '{}' is not an identifier", name));
        }
        BindingSpec spec{};
        if (kind == "module") {
            spec.kind      = BindingKind::kModule;
            spec.type_name = name;
        } else if (kind == "value") {
            spec.kind = BindingKind::kValue;
        } else if (is_dotted_path(kind)) {
            spec.kind      = BindingKind::kClient;
            spec.type_name = kind;
        } else {
            return std::unexpected(fmt::format(
                "bindings: '{}' has invalid kind '{}' (module | value | <client type>)",
                name, kind));
        }
        bindings.emplace(name, std::move(spec));
    }
    return bindings;
}

[[nodiscard]] std::expected<std::vector<CallPattern>, std::string>
parse_call_patterns(const YAML::Node& node) {
    std::vector<CallPattern> patterns;
    if (!node || node.IsNull()) {
        return patterns;
    }
    if (!node.IsSequence()) {
        return std::unexpected(std::string("'allowed_call_patterns' must be a sequence"));
    }
    patterns.reserve(node.size());
    std::size_t index = 0;
    for (const auto& item : node) {
        if (!item.IsMap()) {
            return std::unexpected(fmt::format("allowed_call_patterns[{}] must be a map", index));
        }
        CallPattern p{};
        p.receiver = read_string(item["receiver"], "");
        p.member   = read_string(item["member"], "");
        p.returns  = read_string(item["returns"], "");

        if (!is_valid_glob(p.receiver)) {
            return std::unexpected(fmt::format(
                "allowed_call_patterns[{}]: receiver '{}' is missing or invalid", index, p.receiver));
        }
        if (!is_valid_glob(p.member)) {
            return std::unexpected(fmt::format(
                "allowed_call_patterns[{}]: member '{}' is missing or invalid", index, p.member));
        }
        if (!p.returns.empty() && !is_dotted_path(p.returns)) {
            return std::unexpected(fmt::format(
                "allowed_call_patterns[{}]: returns '{}' is not a type name", index, p.returns));
        }
        patterns.push_back(std::move(p));
        ++index;
    }
    return patterns;
}

[[nodiscard]] std::expected<std::set<NodeKind>, std::string>
parse_forbidden_kinds(const YAML::Node& node) {
    auto names = read_string_sequence(node, "forbidden_node_kinds");
    if (!names) {
        return std::unexpected(names.error());
    }
    std::set<NodeKind> kinds;
    for (const auto& name : *names) {
        const auto kind = node_kind_from_name(name);
        if (!kind) {
            return std::unexpected(fmt::format("forbidden_node_kinds: unknown node kind '{}'", name));
        }
        kinds.insert(*kind);
    }
    for (const auto mandatory : kMandatoryForbiddenKinds) {
        if (kinds.insert(mandatory).second) {
            spdlog::warn("capability_loader: '{}' missing from forbidden_node_kinds, forcing it",
                         node_kind_name(mandatory));
        }
    }
    return kinds;
}

// ---------------------------------------------------------------------------
// parse_root
//   최상위 맵을 섹션별로 파싱한다 (try-catch per section: YAML 예외 안전).
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<CapabilityWhitelist, std::string>
parse_root(const YAML::Node& root, std::string_view source_name) {
    if (!root || !root.IsMap()) {
        return load_error(fmt::format(
            "capability_loader: '{}' is not a valid YAML map (top-level)", source_name));
    }

    CapabilityWhitelist wl{};

    // 섹션 하나를 파싱하고 실패 시 섹션 이름을 붙여 반환한다
    const auto section = [&](const char* name, auto&& parse_fn, auto& target)
        -> std::expected<void, std::string> {
        try {
            auto parsed = parse_fn(root[name]);
            if (!parsed) {
                return std::unexpected(fmt::format(
                    "capability_loader: error in '{}' section: {}", name, parsed.error()));
            }
            target = std::move(*parsed);
            return {};
        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format(
                "capability_loader: error parsing '{}' section: {}", name, e.what()));
        }
    };

    try {
        wl.version = read_string(root["version"], "");
    } catch (const YAML::Exception& e) {
        return load_error(fmt::format("capability_loader: error parsing 'version': {}", e.what()));
    }
    if (wl.version.empty()) {
        return load_error("capability_loader: 'version' is required");
    }

    if (auto r = section("allowed_modules", parse_allowed_modules, wl.allowed_modules); !r) {
        return load_error(r.error());
    }
    if (auto r = section("allowed_builtins", parse_allowed_builtins, wl.allowed_builtins); !r) {
        return load_error(r.error());
    }
    if (auto r = section("bindings", parse_bindings, wl.bindings); !r) {
        return load_error(r.error());
    }
    if (auto r = section("allowed_call_patterns", parse_call_patterns, wl.allowed_call_patterns); !r) {
        return load_error(r.error());
    }
    if (auto r = section("forbidden_node_kinds", parse_forbidden_kinds, wl.forbidden_node_kinds); !r) {
        return load_error(r.error());
    }

    if (wl.allowed_modules.empty()) {
        spdlog::warn("capability_loader: allowed_modules is empty, every import will be denied");
    }

    spdlog::info(
        "capability_loader: whitelist '{}' loaded from '{}' (modules={}, builtins={}, "
        "bindings={}, call_patterns={}, forbidden_kinds={})",
        wl.version, source_name,
        wl.allowed_modules.size(),
        wl.allowed_builtins.size(),
        wl.bindings.size(),
        wl.allowed_call_patterns.size(),
        wl.forbidden_node_kinds.size());

    return wl;
}

}  // namespace

// ---------------------------------------------------------------------------
// CapabilityLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<CapabilityWhitelist, std::string>
CapabilityLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return load_error(fmt::format("capability_loader: cannot resolve config path '{}': {}",
                                      config_path.string(), ec.message()));
    }

    spdlog::info("capability_loader: loading whitelist from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return load_error(fmt::format("capability_loader: cannot open file '{}': {}",
                                      canonical_path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return load_error(fmt::format(
            "capability_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return load_error(fmt::format("capability_loader: YAML error in '{}': {}",
                                      canonical_path.string(), e.what()));
    }

    return parse_root(root, canonical_path.string());
}

// ---------------------------------------------------------------------------
// CapabilityLoader::load_from_string 구현
// ---------------------------------------------------------------------------
std::expected<CapabilityWhitelist, std::string>
CapabilityLoader::load_from_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        return load_error(fmt::format(
            "capability_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return load_error(fmt::format("capability_loader: YAML error: {}", e.what()));
    }
    return parse_root(root, "<inline>");
}
