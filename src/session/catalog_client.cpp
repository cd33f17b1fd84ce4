// ---------------------------------------------------------------------------
// catalog_client.cpp
//
// CatalogClientFactory 구현.
//
// [설계 원칙]
// - All-or-nothing: fixture 의 한 부분이라도 잘못되면 로드 실패.
// - 모듈/클라이언트 객체는 root_module() 호출마다 새로 만든다.
//   Catalog 데이터는 불변이며 여러 실행이 공유한다.
// - 호출 실패는 ScriptError 로 던진다. 인터프리터가 RuntimeFailure 로 보고한다.
// ---------------------------------------------------------------------------

#include "session/catalog_client.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <charconv>
#include <set>
#include <system_error>
#include <utility>

namespace {

constexpr std::size_t kMaxFixtureDepth = 32;

// 필드 필터로 해석하지 않는 list_* 키워드
const std::set<std::string, std::less<>> kPagingKeywords = {
    "limit", "page", "sort_by", "sort_order",
};

[[nodiscard]] std::unexpected<std::string> load_error(std::string message) {
    spdlog::error("{}", message);
    return std::unexpected(std::move(message));
}

// ---------------------------------------------------------------------------
// YAML → Value
// ---------------------------------------------------------------------------
Value scalar_value(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        // 따옴표로 감싼 스칼라는 항상 문자열
        return make_str(text);
    }
    if (text == "null" || text == "~" || text == "Null" || text == "NULL") {
        return make_none();
    }
    if (text == "true" || text == "True") {
        return make_bool(true);
    }
    if (text == "false" || text == "False") {
        return make_bool(false);
    }

    const char* first = text.data();
    const char* last  = text.data() + text.size();
    std::int64_t i = 0;
    if (auto [ptr, ec] = std::from_chars(first, last, i); ec == std::errc{} && ptr == last) {
        return make_int(i);
    }
    double d = 0.0;
    if (auto [ptr, ec] = std::from_chars(first, last, d); ec == std::errc{} && ptr == last) {
        return make_float(d);
    }
    return make_str(text);
}

std::expected<Value, std::string> to_value(const YAML::Node& node, std::size_t depth) {
    if (depth > kMaxFixtureDepth) {
        return std::unexpected(std::string("nesting too deep"));
    }
    if (!node || node.IsNull()) {
        return make_none();
    }
    if (node.IsScalar()) {
        return scalar_value(node);
    }
    if (node.IsSequence()) {
        std::vector<Value> items;
        items.reserve(node.size());
        for (const auto& item : node) {
            auto v = to_value(item, depth + 1);
            if (!v) {
                return v;
            }
            items.push_back(std::move(*v));
        }
        return make_list(std::move(items));
    }
    if (node.IsMap()) {
        Value out = make_dict();
        auto& dict = **out.get_if<DictPtr>();
        for (const auto& entry : node) {
            auto v = to_value(entry.second, depth + 1);
            if (!v) {
                return v;
            }
            dict.set(make_str(entry.first.as<std::string>()), std::move(*v));
        }
        return out;
    }
    return std::unexpected(std::string("unsupported YAML node"));
}

std::expected<Value, std::string> to_record(const YAML::Node& node, const std::string& model) {
    if (!node.IsMap()) {
        return std::unexpected(std::string("items must be maps"));
    }
    std::vector<std::pair<std::string, Value>> fields;
    fields.reserve(node.size());
    bool has_id = false;
    for (const auto& entry : node) {
        auto name = entry.first.as<std::string>();
        auto v = to_value(entry.second, 1);
        if (!v) {
            return std::unexpected(v.error());
        }
        if (name == "id") {
            has_id = v->is<std::string>();
        }
        fields.emplace_back(std::move(name), std::move(*v));
    }
    if (!has_id) {
        return std::unexpected(std::string("every item needs a string 'id'"));
    }
    return make_record(model, std::move(fields));
}

bool is_identifier(std::string_view s) noexcept {
    if (s.empty() || (s.front() >= '0' && s.front() <= '9')) {
        return false;
    }
    for (char c : s) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

// "oci.core.ComputeClient" → {"oci", "core", "ComputeClient"}
std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        const auto dot = path.find('.', start);
        parts.emplace_back(path.substr(start, dot == std::string_view::npos ? path.npos : dot - start));
        if (dot == std::string_view::npos) {
            return parts;
        }
        start = dot + 1;
    }
}

std::expected<CatalogCollection, std::string>
parse_collection(const YAML::Node& node) {
    if (!node.IsMap()) {
        return std::unexpected(std::string("collection must be a map"));
    }
    CatalogCollection out{};
    if (node["model"] && node["model"].IsScalar()) {
        out.model = node["model"].as<std::string>();
    }
    if (out.model.empty()) {
        return std::unexpected(std::string("'model' is required"));
    }

    if (const auto error = node["error"]; error) {
        if (!error.IsMap()) {
            return std::unexpected(std::string("'error' must be a map"));
        }
        CatalogError e{};
        e.status  = error["status"] ? error["status"].as<std::int64_t>() : 500;
        e.code    = error["code"] ? error["code"].as<std::string>() : "InternalServerError";
        e.message = error["message"] ? error["message"].as<std::string>() : "";
        out.error = std::move(e);
    }

    if (const auto items = node["items"]; items && !items.IsNull()) {
        if (!items.IsSequence()) {
            return std::unexpected(std::string("'items' must be a sequence"));
        }
        for (const auto& item : items) {
            auto record = to_record(item, out.model);
            if (!record) {
                return std::unexpected(record.error());
            }
            out.items.push_back(std::move(*record));
        }
    }
    return out;
}

std::expected<Catalog, std::string> parse_catalog(const YAML::Node& root, std::string_view source) {
    if (!root || !root.IsMap()) {
        return load_error(fmt::format("catalog: '{}' is not a valid YAML map (top-level)", source));
    }
    const auto clients = root["clients"];
    if (!clients || !clients.IsMap()) {
        return load_error(fmt::format("catalog: '{}' needs a 'clients' map", source));
    }

    Catalog catalog{};
    for (const auto& entry : clients) {
        const auto type_name = entry.first.as<std::string>();
        const auto parts     = split_path(type_name);
        if (parts.size() < 2 ||
            !std::all_of(parts.begin(), parts.end(), [](const std::string& p) { return is_identifier(p); })) {
            return load_error(fmt::format("catalog: client type '{}' is not a dotted path", type_name));
        }
        if (catalog.root.empty()) {
            catalog.root = parts.front();
        } else if (catalog.root != parts.front()) {
            return load_error(fmt::format(
                "catalog: client type '{}' is outside root module '{}'", type_name, catalog.root));
        }
        if (!entry.second.IsMap()) {
            return load_error(fmt::format("catalog: client '{}' must map collections", type_name));
        }

        CatalogClientSpec spec{};
        spec.type_name = type_name;
        for (const auto& coll : entry.second) {
            const auto coll_name = coll.first.as<std::string>();
            if (!is_identifier(coll_name)) {
                return load_error(fmt::format(
                    "catalog: '{}.{}' is not a valid collection name", type_name, coll_name));
            }
            auto parsed = parse_collection(coll.second);
            if (!parsed) {
                return load_error(fmt::format(
                    "catalog: error in '{}.{}': {}", type_name, coll_name, parsed.error()));
            }
            spec.collections.emplace(coll_name, std::move(*parsed));
        }
        catalog.clients.emplace(type_name, std::move(spec));
    }

    if (catalog.clients.empty()) {
        return load_error(fmt::format("catalog: '{}' defines no clients", source));
    }

    spdlog::info("catalog: loaded {} client types from '{}'", catalog.clients.size(), source);
    return catalog;
}

// ---------------------------------------------------------------------------
// 응답/오류
// ---------------------------------------------------------------------------
[[noreturn]] void throw_service_error(const CatalogError& error, std::string_view operation) {
    throw ScriptError(service_error_message(error, operation));
}

Value make_response(std::string_view operation, Value data) {
    const std::string request_id = fmt::format("catalog/{}", operation);
    Value headers = make_dict();
    (*headers.get_if<DictPtr>())->set(make_str("opc-request-id"), make_str(request_id));
    return make_record("oci.response.Response", {
        {"status",     make_int(200)},
        {"headers",    std::move(headers)},
        {"data",       std::move(data)},
        {"next_page",  make_none()},
        {"request_id", make_str(request_id)},
    });
}

// get_instance → instances / get_policy → policies / get_vcn → vcns
const CatalogCollection* find_singular(const CatalogClientSpec& spec, const std::string& singular,
                                       std::string& collection_name) {
    std::vector<std::string> candidates{singular + "s", singular + "es", singular};
    if (!singular.empty() && singular.back() == 'y') {
        candidates.push_back(singular.substr(0, singular.size() - 1) + "ies");
    }
    for (const auto& name : candidates) {
        const auto it = spec.collections.find(name);
        if (it != spec.collections.end()) {
            collection_name = name;
            return &it->second;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// 호출 구현
// ---------------------------------------------------------------------------
Value list_items(const CatalogCollection& coll, const std::string& operation,
                 const CallArguments& args) {
    if (coll.error) {
        throw_service_error(*coll.error, operation);
    }

    std::vector<std::pair<std::string, Value>> filters;
    if (!args.positional.empty()) {
        filters.emplace_back("compartment_id", args.positional.front());
    }

    std::set<std::string, std::less<>> known_fields;
    for (const auto& item : coll.items) {
        for (const auto& [name, value] : (*item.get_if<RecordPtr>())->fields) {
            known_fields.insert(name);
        }
    }

    std::optional<std::int64_t> limit;
    for (const auto& [name, value] : args.keywords) {
        if (name == "limit") {
            if (!is_integral(value) || integral_of(value) < 0) {
                throw ScriptError(fmt::format("TypeError: {}() limit must be a non-negative int", operation));
            }
            limit = integral_of(value);
            continue;
        }
        if (kPagingKeywords.contains(name) || !known_fields.contains(name)) {
            continue;
        }
        filters.emplace_back(name, value);
    }

    std::vector<Value> out;
    for (const auto& item : coll.items) {
        if (limit && static_cast<std::int64_t>(out.size()) >= *limit) {
            break;
        }
        const auto& record = *item.get_if<RecordPtr>();
        bool match = true;
        for (const auto& [name, expected] : filters) {
            const Value* field = record->field(name);
            if (!field || !values_equal(*field, expected)) {
                match = false;
                break;
            }
        }
        if (match) {
            out.push_back(item);
        }
    }
    return make_response(operation, make_list(std::move(out)));
}

Value get_item(const CatalogCollection& coll, const std::string& operation,
               const std::string& singular, const CallArguments& args) {
    if (coll.error) {
        throw_service_error(*coll.error, operation);
    }

    const std::string id_keyword = singular + "_id";
    const Value* id = args.positional.empty() ? args.keyword(id_keyword) : &args.positional.front();
    if (!id) {
        throw ScriptError(fmt::format("TypeError: {}() missing required argument '{}'",
                                      operation, id_keyword));
    }
    for (const auto& item : coll.items) {
        const Value* field = (*item.get_if<RecordPtr>())->field("id");
        if (field && values_equal(*field, *id)) {
            return make_response(operation, item);
        }
    }
    throw_service_error(CatalogError{404, "NotAuthorizedOrNotFound",
                                     "Authorization failed or requested resource not found."},
                        operation);
}

// ---------------------------------------------------------------------------
// CatalogClient
//   한 클라이언트 인스턴스. list_* / get_* 만 노출한다.
// ---------------------------------------------------------------------------
class CatalogClient final : public HostObject {
public:
    CatalogClient(std::shared_ptr<const Catalog> catalog, const CatalogClientSpec& spec)
        : catalog_(std::move(catalog)), spec_(spec) {}

    [[nodiscard]] Kind        host_kind() const noexcept override { return Kind::kClient; }
    [[nodiscard]] std::string type_name() const override { return spec_.type_name; }
    [[nodiscard]] std::string repr() const override {
        return fmt::format("<{} object>", spec_.type_name);
    }

    Value get_attribute(std::string_view name) override {
        const std::string member{name};
        const std::string qualified = fmt::format("{}.{}", spec_.type_name, member);

        if (member.starts_with("list_")) {
            const auto it = spec_.collections.find(member.substr(5));
            if (it != spec_.collections.end()) {
                const CatalogCollection* coll = &it->second;
                auto keep = catalog_;
                return make_host(std::make_shared<NativeFunction>(
                    qualified, [keep, coll, member](const CallArguments& args) {
                        return list_items(*coll, member, args);
                    }));
            }
        } else if (member.starts_with("get_")) {
            const std::string singular = member.substr(4);
            std::string collection_name;
            if (const CatalogCollection* coll = find_singular(spec_, singular, collection_name)) {
                auto keep = catalog_;
                return make_host(std::make_shared<NativeFunction>(
                    qualified, [keep, coll, member, singular](const CallArguments& args) {
                        return get_item(*coll, member, singular, args);
                    }));
            }
        }
        return HostObject::get_attribute(name);
    }

private:
    std::shared_ptr<const Catalog> catalog_;
    const CatalogClientSpec&       spec_;
};

// list_call_get_all_results(fn, *args, **kwargs)
Value list_call_get_all_results(const CallArguments& args) {
    if (args.positional.empty()) {
        throw ScriptError("TypeError: list_call_get_all_results() missing required argument 'list_func_ref'");
    }
    CallArguments forwarded;
    forwarded.positional.assign(args.positional.begin() + 1, args.positional.end());
    for (const auto& [name, value] : args.keywords) {
        if (name != "limit") {
            forwarded.keywords.emplace_back(name, value);
        }
    }
    const auto* fn = args.positional.front().get_if<HostPtr>();
    if (!fn) {
        throw ScriptError(fmt::format("TypeError: '{}' object is not callable",
                                      type_name(args.positional.front())));
    }
    return (*fn)->call(forwarded);
}

}  // namespace

// ---------------------------------------------------------------------------
// service_error_message
// ---------------------------------------------------------------------------
std::string service_error_message(const CatalogError& error, std::string_view operation) {
    return fmt::format(
        "ServiceError: {{'status': {}, 'code': '{}', 'operation_name': '{}', 'message': '{}'}}",
        error.status, error.code, operation, error.message);
}

// ---------------------------------------------------------------------------
// CatalogClientFactory
// ---------------------------------------------------------------------------
CatalogClientFactory::CatalogClientFactory(std::shared_ptr<const Catalog> catalog)
    : catalog_(std::move(catalog))
{}

std::expected<std::shared_ptr<CatalogClientFactory>, std::string>
CatalogClientFactory::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile& e) {
        return load_error(fmt::format("catalog: cannot open file '{}': {}", path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return load_error(fmt::format("catalog: YAML parse error in '{}' at line {}, col {}: {}",
                                      path.string(), e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return load_error(fmt::format("catalog: YAML error in '{}': {}", path.string(), e.what()));
    }

    try {
        auto catalog = parse_catalog(root, path.string());
        if (!catalog) {
            return std::unexpected(catalog.error());
        }
        return std::make_shared<CatalogClientFactory>(
            std::make_shared<const Catalog>(std::move(*catalog)));
    } catch (const YAML::Exception& e) {
        return load_error(fmt::format("catalog: invalid value in '{}': {}", path.string(), e.what()));
    }
}

std::expected<std::shared_ptr<CatalogClientFactory>, std::string>
CatalogClientFactory::load_from_string(std::string_view yaml_text) {
    try {
        const YAML::Node root = YAML::Load(std::string(yaml_text));
        auto catalog = parse_catalog(root, "<inline>");
        if (!catalog) {
            return std::unexpected(catalog.error());
        }
        return std::make_shared<CatalogClientFactory>(
            std::make_shared<const Catalog>(std::move(*catalog)));
    } catch (const YAML::Exception& e) {
        return load_error(fmt::format("catalog: YAML error: {}", e.what()));
    }
}

HostPtr CatalogClientFactory::root_module() const {
    auto root = std::make_shared<ModuleObject>(catalog_->root);
    std::map<std::string, std::shared_ptr<ModuleObject>> modules{{catalog_->root, root}};

    // 경로의 모듈을 필요할 때 만든다
    const auto module_for = [&](const std::vector<std::string>& parts, std::size_t count) {
        std::shared_ptr<ModuleObject> current = root;
        std::string path = parts.front();
        for (std::size_t i = 1; i < count; ++i) {
            path += '.';
            path += parts[i];
            auto& slot = modules[path];
            if (!slot) {
                slot = std::make_shared<ModuleObject>(path);
                current->add(parts[i], make_host(slot));
            }
            current = slot;
        }
        return current;
    };

    for (const auto& [type_name, spec] : catalog_->clients) {
        const auto parts = split_path(type_name);
        auto module = module_for(parts, parts.size() - 1);

        auto catalog = catalog_;
        const CatalogClientSpec* client_spec = &spec;
        const std::string class_name = parts.back();
        module->add(class_name, make_host(std::make_shared<NativeFunction>(
            type_name, [catalog, client_spec, class_name](const CallArguments& args) {
                const Value* config = args.positional.empty() ? args.keyword("config")
                                                              : &args.positional.front();
                if (config && !config->is<DictPtr>()) {
                    throw ScriptError(fmt::format(
                        "InvalidConfig: {}() config must be a dict, got '{}'",
                        class_name, ::type_name(*config)));
                }
                return make_host(std::make_shared<CatalogClient>(catalog, *client_spec));
            })));
    }

    auto pagination = module_for({catalog_->root, "pagination"}, 2);
    pagination->add("list_call_get_all_results", make_host(std::make_shared<NativeFunction>(
        catalog_->root + ".pagination.list_call_get_all_results", list_call_get_all_results)));

    return root;
}
