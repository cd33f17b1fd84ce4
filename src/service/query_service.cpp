// ---------------------------------------------------------------------------
// query_service.cpp
//
// QueryService 구현. parse → validate → execute → serialize 파이프라인과
// 실패 분류, 이벤트 로그, 통계 갱신을 담당한다.
// ---------------------------------------------------------------------------

#include "service/query_service.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace {

JsonValue string_array(const std::vector<std::string>& items) {
    JsonValue out = JsonValue::array();
    for (const auto& item : items) {
        out.push_back(JsonValue::string(item));
    }
    return out;
}

std::string_view binding_kind_name(const BindingSpec& spec) noexcept {
    switch (spec.kind) {
        case BindingKind::kModule: return "module";
        case BindingKind::kValue:  return "value";
        case BindingKind::kClient: return spec.type_name;
    }
    return "value";
}

std::string describe_violation(const Violation& v) {
    return fmt::format("{}@{}:{} {}", node_kind_name(v.node_kind),
                       v.location.line, v.location.column, v.reason);
}

}  // namespace

// ---------------------------------------------------------------------------
// Envelope
// ---------------------------------------------------------------------------
Envelope Envelope::success(JsonValue result) {
    Envelope out{};
    out.ok     = true;
    out.result = std::move(result);
    return out;
}

Envelope Envelope::failure(QueryErrorKind kind, std::string message, std::vector<Violation> violations) {
    Envelope out{};
    out.ok         = false;
    out.kind       = kind;
    out.message    = std::move(message);
    out.violations = std::move(violations);
    return out;
}

JsonValue Envelope::to_json() const {
    JsonValue out = JsonValue::object();
    out.set("ok", JsonValue::boolean(ok));
    if (ok) {
        out.set("result", result);
        return out;
    }

    out.set("kind", JsonValue::string(std::string(to_string(kind.value_or(QueryErrorKind::kRuntimeFailure)))));
    out.set("message", JsonValue::string(message));
    if (!violations.empty()) {
        JsonValue list = JsonValue::array();
        for (const auto& v : violations) {
            JsonValue item = JsonValue::object();
            item.set("node_kind", JsonValue::string(std::string(node_kind_name(v.node_kind))));
            item.set("line", JsonValue::integer(v.location.line));
            item.set("column", JsonValue::integer(v.location.column));
            item.set("reason", JsonValue::string(v.reason));
            list.push_back(std::move(item));
        }
        out.set("violations", std::move(list));
    }
    return out;
}

// ---------------------------------------------------------------------------
// QueryService
// ---------------------------------------------------------------------------
QueryService::QueryService(std::shared_ptr<const CapabilityWhitelist> whitelist,
                           std::shared_ptr<OciSession>                session,
                           ServiceOptions                             options,
                           std::shared_ptr<StructuredLogger>          logger,
                           std::shared_ptr<StatsCollector>            stats)
    : whitelist_(std::move(whitelist))
    , session_(std::move(session))
    , options_(options)
    , logger_(std::move(logger))
    , stats_(std::move(stats))
    , validator_(whitelist_, SnippetParser{options_.parser})
    , executor_(options_.executor)
    , serializer_(options_.serializer)
{}

Envelope QueryService::execute(const QueryRequest& request) const {
    const auto started = std::chrono::steady_clock::now();

    Envelope envelope;
    try {
        envelope = execute_checked(request);
    } catch (const std::exception& e) {
        spdlog::error("query_service: request {} failed internally: {}", request.request_id, e.what());
        envelope = Envelope::failure(QueryErrorKind::kRuntimeFailure,
                                     fmt::format("internal error: {}", e.what()));
    }

    try {
        record(request, envelope, started);
    } catch (const std::exception& e) {
        spdlog::warn("query_service: failed to record request {}: {}", request.request_id, e.what());
    }
    return envelope;
}

Envelope QueryService::execute_checked(const QueryRequest& request) const {
    if (session_) {
        if (auto refreshed = session_->refresh(); !refreshed) {
            spdlog::debug("query_service: session refresh skipped: {}", refreshed.error());
        } else if (*refreshed) {
            spdlog::info("query_service: session profile reloaded");
        }
    }

    // ── 1. 파싱 ─────────────────────────────────────────────────────────
    auto program = validator_.parser().parse(request.snippet);
    if (!program) {
        const ParseError& err = program.error();
        return Envelope::failure(
            QueryErrorKind::kSyntaxInvalid,
            fmt::format("line {}, column {}: {}", err.location.line, err.location.column, err.message));
    }

    // ── 2. 검증 ─────────────────────────────────────────────────────────
    Verdict verdict = validator_.check(*program);
    if (!verdict.admitted) {
        std::string message = "snippet was rejected by the capability whitelist";
        if (!verdict.violations.empty()) {
            const Violation& first = verdict.violations.front();
            message = fmt::format("{} at line {}, column {}: {}",
                                  node_kind_name(first.node_kind),
                                  first.location.line, first.location.column, first.reason);
        }
        return Envelope::failure(QueryErrorKind::kCapabilityDenied, std::move(message),
                                 std::move(verdict.violations));
    }

    // ── 3. 실행 ─────────────────────────────────────────────────────────
    const SandboxBindings bindings = make_bindings();
    ExecutionResult       result{};
    {
        const ExecutionScope in_flight{stats_.get()};
        result = executor_.run(*program, bindings);
    }

    switch (result.outcome) {
        case ExecutionOutcome::kTimeout:
            return Envelope::failure(QueryErrorKind::kExecutionTimeout, std::move(result.error));
        case ExecutionOutcome::kRuntimeFailure:
            return Envelope::failure(QueryErrorKind::kRuntimeFailure, std::move(result.error));
        case ExecutionOutcome::kResultTooLarge:
            return Envelope::failure(QueryErrorKind::kSerializationFailure, std::move(result.error));
        case ExecutionOutcome::kSuccess:
            break;
    }
    if (!result.value) {
        return Envelope::failure(QueryErrorKind::kRuntimeFailure, "worker returned no value");
    }

    // ── 4. 직렬화 ───────────────────────────────────────────────────────
    auto json = serializer_.serialize(*result.value);
    if (!json) {
        return Envelope::failure(QueryErrorKind::kSerializationFailure, json.error().message);
    }
    return Envelope::success(std::move(*json));
}

SandboxBindings QueryService::make_bindings() const {
    SandboxBindings bindings;
    if (!whitelist_) {
        return bindings;
    }
    bindings.builtins.insert(whitelist_->allowed_builtins.begin(), whitelist_->allowed_builtins.end());

    const auto factory = session_ ? session_->get_client_factory() : nullptr;
    const auto profile = session_ ? session_->snapshot() : nullptr;

    HostPtr root = factory ? factory->root_module() : nullptr;
    if (root) {
        bindings.modules.emplace(root->type_name(), make_host(root));
    }
    std::optional<Value> config;
    if (profile) {
        config = profile->to_value();
    }

    for (const auto& [name, spec] : whitelist_->bindings) {
        switch (spec.kind) {
            case BindingKind::kModule: {
                HostPtr module = (root && spec.type_name == root->type_name())
                    ? root
                    : (factory ? factory->resolve(spec.type_name) : nullptr);
                if (module) {
                    bindings.names.emplace(name, make_host(std::move(module)));
                } else {
                    spdlog::warn("query_service: module binding '{}' is not provided by the client factory", name);
                }
                break;
            }
            case BindingKind::kValue:
                if (name == "config" && config) {
                    bindings.names.emplace(name, *config);
                } else {
                    spdlog::debug("query_service: no value available for binding '{}'", name);
                }
                break;
            case BindingKind::kClient: {
                const HostPtr ctor = factory ? factory->resolve(spec.type_name) : nullptr;
                if (!ctor) {
                    spdlog::warn("query_service: client type '{}' for binding '{}' is unknown",
                                 spec.type_name, name);
                    break;
                }
                CallArguments args;
                if (config) {
                    args.positional.push_back(*config);
                }
                try {
                    bindings.names.emplace(name, ctor->call(args));
                } catch (const ScriptError& e) {
                    spdlog::warn("query_service: cannot construct '{}' for binding '{}': {}",
                                 spec.type_name, name, e.what());
                }
                break;
            }
        }
    }
    return bindings;
}

void QueryService::record(const QueryRequest&                   request,
                          const Envelope&                       envelope,
                          std::chrono::steady_clock::time_point started) const {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (stats_) {
        stats_->on_query(envelope.ok ? std::nullopt : envelope.kind);
    }

    if (envelope.ok) {
        spdlog::debug("query_service: request {} ok in {}ms", request.request_id, elapsed.count());
    } else {
        spdlog::info("query_service: request {} failed kind={} in {}ms", request.request_id,
                     to_string(envelope.kind.value_or(QueryErrorKind::kRuntimeFailure)), elapsed.count());
    }

    if (!logger_) {
        return;
    }
    const std::string version = whitelist_ ? whitelist_->version : std::string{};
    const auto now = std::chrono::system_clock::now();

    if (envelope.kind == QueryErrorKind::kCapabilityDenied) {
        DenyLog deny{};
        deny.request_id        = request.request_id;
        deny.snippet           = request.snippet;
        deny.whitelist_version = version;
        deny.timestamp         = now;
        for (const auto& v : envelope.violations) {
            deny.violations.push_back(describe_violation(v));
        }
        logger_->log_deny(deny);
    }

    QueryLog entry{};
    entry.request_id        = request.request_id;
    entry.snippet           = request.snippet;
    entry.whitelist_version = version;
    entry.ok                = envelope.ok;
    entry.error_kind        = envelope.ok ? "" : std::string(to_string(*envelope.kind));
    entry.message           = envelope.message;
    entry.result_bytes      = envelope.ok ? envelope.result.dump().size() : 0;
    entry.timestamp         = now;
    entry.duration          = elapsed;
    logger_->log_query(entry);
}

JsonValue QueryService::describe_capabilities() const {
    JsonValue schema = JsonValue::object();
    schema.set("type", JsonValue::string("object"));
    {
        JsonValue snippet = JsonValue::object();
        snippet.set("type", JsonValue::string("string"));
        snippet.set("description", JsonValue::string(
            "oci sdk to query OCI resources. The value assigned to `result`, or the last "
            "expression, is returned as JSON."));
        JsonValue properties = JsonValue::object();
        properties.set("code_snippet", std::move(snippet));
        schema.set("properties", std::move(properties));
    }
    schema.set("required", string_array({"code_snippet"}));

    JsonValue tool = JsonValue::object();
    tool.set("name", JsonValue::string(std::string(kToolName)));
    tool.set("description", JsonValue::string(std::string(kToolDescription)));
    tool.set("input_schema", std::move(schema));

    JsonValue out = JsonValue::object();
    out.set("version", JsonValue::string(whitelist_ ? whitelist_->version : ""));
    out.set("tool", std::move(tool));
    out.set("timeout_ms", JsonValue::integer(options_.executor.timeout.count()));
    if (!whitelist_) {
        return out;
    }

    out.set("allowed_modules", string_array(whitelist_->allowed_modules));
    out.set("allowed_builtins", string_array(whitelist_->allowed_builtins));

    JsonValue bindings = JsonValue::object();
    for (const auto& [name, spec] : whitelist_->bindings) {
        bindings.set(name, JsonValue::string(std::string(binding_kind_name(spec))));
    }
    out.set("bindings", std::move(bindings));

    JsonValue patterns = JsonValue::array();
    for (const auto& p : whitelist_->allowed_call_patterns) {
        JsonValue item = JsonValue::object();
        item.set("receiver", JsonValue::string(p.receiver));
        item.set("member", JsonValue::string(p.member));
        if (!p.returns.empty()) {
            item.set("returns", JsonValue::string(p.returns));
        }
        patterns.push_back(std::move(item));
    }
    out.set("allowed_call_patterns", std::move(patterns));

    JsonValue forbidden = JsonValue::array();
    for (const auto kind : whitelist_->forbidden_node_kinds) {
        forbidden.push_back(JsonValue::string(std::string(node_kind_name(kind))));
    }
    out.set("forbidden_node_kinds", std::move(forbidden));
    return out;
}
