#include "logger/structured_logger.hpp"
#include "policy/capability_loader.hpp"
#include "server/uds_server.hpp"
#include "service/query_service.hpp"
#include "session/catalog_client.hpp"
#include "session/oci_session.hpp"
#include "stats/stats_collector.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::optional<std::uint32_t> parse_u32(std::string_view text) {
    std::uint32_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return parsed;
}

std::uint32_t env_u32(const char* name, std::uint32_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    const auto parsed = parse_u32(val);
    if (!parsed || *parsed == 0) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
    return *parsed;
}

// ~/ 로 시작하면 $HOME 으로 확장
std::string expand_home(const std::string& path) {
    if (path.rfind("~/", 0) != 0) {
        return path;
    }
    const char* home = std::getenv("HOME");  // NOLINT(concurrency-mt-unsafe)
    if (home == nullptr || home[0] == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

enum class Mode { kServe, kRun, kDescribe };

struct AppConfig {
    Mode          mode{Mode::kServe};
    std::string   run_source{};
    std::string   config_file{};
    std::string   profile{};
    std::string   capabilities_path{};
    std::string   catalog_path{};
    std::string   socket_path{};
    std::string   log_path{};
    std::string   log_level{};
    std::uint32_t timeout_ms{2000};
    std::uint32_t worker_memory_mb{512};
    std::uint32_t worker_threads{4};
};

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--run <file|->] [--describe]\n"
              << "       [--config-file <path>] [--profile <name>] [--capabilities <path>]\n"
              << "       [--catalog <path>] [--socket <path>] [--timeout-ms <n>]\n";
}

// 인자 파싱. 잘못된 인자면 nullopt (usage 출력은 호출자가 한다)
std::optional<AppConfig> parse_args(int argc, char* argv[]) {
    AppConfig config;
    config.config_file       = env_str("OCI_CONFIG_FILE",      "~/.oci/config");
    config.profile           = env_str("OCI_PROFILE",          "DEFAULT");
    config.capabilities_path = env_str("OCIGATE_CAPABILITIES", "config/capabilities.yaml");
    config.catalog_path      = env_str("OCIGATE_CATALOG",      "");
    config.socket_path       = env_str("OCIGATE_SOCKET_PATH",  "/tmp/ocigate.sock");
    config.log_path          = env_str("LOG_PATH",             "/tmp/ocigate.log");
    config.log_level         = env_str("LOG_LEVEL",            "info");
    config.timeout_ms        = env_u32("QUERY_TIMEOUT_MS",     2000);
    config.worker_memory_mb  = env_u32("WORKER_MEMORY_MB",     512);
    config.worker_threads    = env_u32("WORKER_THREADS",       4);

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                spdlog::error("option {} requires a value", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--describe") {
            config.mode = Mode::kDescribe;
            continue;
        }
        if (arg == "--serve") {
            config.mode = Mode::kServe;
            continue;
        }

        auto v = value();
        if (!v) {
            return std::nullopt;
        }
        if (arg == "--run") {
            config.mode       = Mode::kRun;
            config.run_source = *v;
        } else if (arg == "--config-file") {
            config.config_file = *v;
        } else if (arg == "--profile") {
            config.profile = *v;
        } else if (arg == "--capabilities") {
            config.capabilities_path = *v;
        } else if (arg == "--catalog") {
            config.catalog_path = *v;
        } else if (arg == "--socket") {
            config.socket_path = *v;
        } else if (arg == "--timeout-ms") {
            const auto parsed = parse_u32(*v);
            if (!parsed || *parsed == 0) {
                spdlog::error("--timeout-ms: invalid value '{}'", *v);
                return std::nullopt;
            }
            config.timeout_ms = *parsed;
        } else {
            spdlog::error("unknown option '{}'", arg);
            return std::nullopt;
        }
    }
    config.config_file = expand_home(config.config_file);
    return config;
}

std::optional<std::string> read_snippet(const std::string& source) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(source, std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("cannot open snippet file '{}'", source);
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// ---------------------------------------------------------------------------
// serve: UDS 서버 + 시그널 처리
//   SIGTERM / SIGINT → 종료
//   SIGHUP           → 세션 즉시 재로드
// ---------------------------------------------------------------------------
int serve(const AppConfig& config, const std::shared_ptr<QueryService>& service) {
    boost::asio::io_context ioc;
    UdsServer server{config.socket_path, service, ioc, config.worker_threads};

    boost::asio::co_spawn(
        ioc,
        server.run(),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("main: uds_server error: {}", e.what());
                }
            }
        }
    );

    boost::asio::signal_set signals_stop{ioc, SIGTERM, SIGINT};
    signals_stop.async_wait([&](const boost::system::error_code& ec, int /*signum*/) {
        if (!ec) {
            spdlog::info("main: shutdown signal received");
            server.stop();
            ioc.stop();
        }
    });

    boost::asio::signal_set signals_hup{ioc, SIGHUP};
    // SIGHUP 핸들러: 수신 후 재등록하여 반복 감지
    std::function<void()> setup_hup;
    setup_hup = [&]() {
        signals_hup.async_wait([&](const boost::system::error_code& ec, int /*signum*/) {
            if (ec) {
                return;
            }
            if (auto loaded = service->session()->load(); !loaded) {
                spdlog::warn("main: session reload failed, keeping previous profile: {}", loaded.error());
            } else {
                spdlog::info("main: session reloaded");
            }
            setup_hup();
        });
    };
    setup_hup();

    ioc.run();
    spdlog::info("ocigate stopped");
    return EXIT_SUCCESS;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 설정 로드 (인자 > 환경변수 > 기본값) ─────────────────────────────
    const auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    const AppConfig& config = *parsed;

    const LogLevel log_level = parse_log_level(config.log_level);
    switch (log_level) {
        case LogLevel::kDebug: spdlog::set_level(spdlog::level::debug); break;
        case LogLevel::kInfo:  spdlog::set_level(spdlog::level::info);  break;
        case LogLevel::kWarn:  spdlog::set_level(spdlog::level::warn);  break;
        case LogLevel::kError: spdlog::set_level(spdlog::level::err);   break;
    }

    spdlog::info("Starting ocigate");
    spdlog::info("Capabilities: {}", config.capabilities_path);
    spdlog::info("OCI config: {} [{}]", config.config_file, config.profile);
    spdlog::info("Timeout: {}ms", config.timeout_ms);

    // ── 화이트리스트 (fail-close: 로드 실패 시 기동 거부) ───────────────
    auto whitelist = CapabilityLoader::load(config.capabilities_path);
    if (!whitelist) {
        spdlog::critical("failed to load capabilities: {}", whitelist.error());
        return EXIT_FAILURE;
    }
    auto shared_whitelist = std::make_shared<const CapabilityWhitelist>(std::move(*whitelist));
    spdlog::info("Capability whitelist version: {}", shared_whitelist->version);

    // ── 클라이언트 팩토리 + 세션 ───────────────────────────────────────
    std::shared_ptr<ClientFactory> factory;
    if (!config.catalog_path.empty()) {
        auto catalog = CatalogClientFactory::load(config.catalog_path);
        if (!catalog) {
            spdlog::critical("failed to load catalog: {}", catalog.error());
            return EXIT_FAILURE;
        }
        factory = std::move(*catalog);
        spdlog::info("Catalog: {}", config.catalog_path);
    } else {
        spdlog::warn("no client factory configured (--catalog); the oci module is unavailable to snippets");
    }

    auto session = std::make_shared<OciSession>(config.config_file, config.profile, factory);
    if (auto loaded = session->load(); !loaded) {
        if (!factory) {
            spdlog::critical("failed to load OCI profile: {}", loaded.error());
            return EXIT_FAILURE;
        }
        spdlog::warn("OCI profile unavailable, serving without 'config': {}", loaded.error());
    }

    // ── 서비스 조립 ─────────────────────────────────────────────────────
    ServiceOptions options;
    options.executor.timeout            = std::chrono::milliseconds{config.timeout_ms};
    options.executor.memory_limit_bytes = std::size_t{config.worker_memory_mb} * 1024 * 1024;

    std::shared_ptr<StructuredLogger> logger;
    try {
        logger = std::make_shared<StructuredLogger>(log_level, config.log_path);
    } catch (const std::runtime_error& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }
    auto stats   = std::make_shared<StatsCollector>();
    auto service = std::make_shared<QueryService>(shared_whitelist, session, options, logger, stats);

    switch (config.mode) {
        case Mode::kDescribe:
            std::cout << service->describe_capabilities().dump() << '\n';
            return EXIT_SUCCESS;

        case Mode::kRun: {
            const auto snippet = read_snippet(config.run_source);
            if (!snippet) {
                return EXIT_FAILURE;
            }
            QueryRequest request{};
            request.request_id = service->next_request_id();
            request.snippet    = *snippet;
            const Envelope envelope = service->execute(request);
            std::cout << envelope.to_json().dump() << '\n';
            return envelope.ok ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        case Mode::kServe:
            spdlog::info("UDS socket: {}", config.socket_path);
            return serve(config, service);
    }
    return EXIT_FAILURE;
}
