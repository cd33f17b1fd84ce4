// ---------------------------------------------------------------------------
// test_query_service.cpp
//
// QueryService 통합 테스트.
// 저장소 화이트리스트 + 예제 catalog fixture + 임시 OCI 설정 파일 사용.
// 실제 fork 로 스니펫을 실행한다.
//
// [테스트 범위]
// - 성공 envelope: result 변수, 마지막 식, config 바인딩
// - 실패 분류 (정확히 하나의 kind):
//   SyntaxInvalid / CapabilityDenied(violations 포함) / ExecutionTimeout /
//   RuntimeFailure(NameError, ServiceError) / SerializationFailure
// - 화이트리스트 없음 → 모든 요청 CapabilityDenied
// - describe_capabilities: 도구 스키마와 화이트리스트 요약
// - 통계 집계, 이벤트 로그 기록
// ---------------------------------------------------------------------------

#include "policy/capability_loader.hpp"
#include "service/query_service.hpp"
#include "session/catalog_client.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr const char* kOciConfig =
    "[DEFAULT]\n"
    "user=ocid1.user.oc1..tester\n"
    "fingerprint=aa:bb\n"
    "key_file=/keys/test.pem\n"
    "tenancy=ocid1.compartment.oc1..prod\n"
    "region=us-ashburn-1\n";

std::shared_ptr<const CapabilityWhitelist> repo_whitelist() {
    auto wl = CapabilityLoader::load(OCIGATE_SOURCE_DIR "/config/capabilities.yaml");
    EXPECT_TRUE(wl.has_value()) << (wl ? "" : wl.error());
    return std::make_shared<const CapabilityWhitelist>(wl ? std::move(*wl) : CapabilityWhitelist{});
}

class QueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "ocigate_test_service" / info->name();
        fs::create_directories(dir_);
        {
            std::ofstream out{dir_ / "config"};
            out << kOciConfig;
        }

        auto factory = CatalogClientFactory::load(OCIGATE_SOURCE_DIR "/config/catalog.example.yaml");
        ASSERT_TRUE(factory.has_value()) << factory.error();

        session_ = std::make_shared<OciSession>(dir_ / "config", "DEFAULT", *factory);
        ASSERT_TRUE(session_->load().has_value());
        stats_ = std::make_shared<StatsCollector>();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::unique_ptr<QueryService> make_service(ServiceOptions options = {},
                                               std::shared_ptr<StructuredLogger> logger = nullptr) {
        return std::make_unique<QueryService>(repo_whitelist(), session_, options,
                                              std::move(logger), stats_);
    }

    static Envelope run(const QueryService& service, std::string snippet) {
        return service.execute(QueryRequest{1, std::move(snippet)});
    }

    fs::path                        dir_;
    std::shared_ptr<OciSession>     session_;
    std::shared_ptr<StatsCollector> stats_;
};

}  // namespace

// ---------------------------------------------------------------------------
// 성공
// ---------------------------------------------------------------------------

TEST_F(QueryServiceTest, ListRunningInstances) {
    const auto service = make_service();
    const auto env = run(*service,
        "import oci\n"
        "compute = oci.core.ComputeClient(config)\n"
        "resp = compute.list_instances(compartment_id=config['tenancy'])\n"
        "result = [i.display_name for i in resp.data if i.lifecycle_state == 'RUNNING']\n");

    ASSERT_TRUE(env.ok) << env.message;
    EXPECT_FALSE(env.kind.has_value());
    EXPECT_EQ(env.result.dump(), R"(["web-1"])");
    EXPECT_EQ(env.to_json().dump(), R"({"ok":true,"result":["web-1"]})");
}

TEST_F(QueryServiceTest, LastExpressionAndRecords) {
    const auto service = make_service();
    const auto env = run(*service,
        "net = oci.core.VirtualNetworkClient(config)\n"
        "net.get_vcn('ocid1.vcn.oc1..main').data\n");

    ASSERT_TRUE(env.ok) << env.message;
    ASSERT_TRUE(env.result.is_object());
    ASSERT_NE(env.result.find("cidr_block"), nullptr);
    EXPECT_EQ(env.result.find("cidr_block")->as_string(), "10.0.0.0/16");
}

TEST_F(QueryServiceTest, NoResultIsNull) {
    const auto service = make_service();
    const auto env = run(*service, "x = 1\n");
    ASSERT_TRUE(env.ok) << env.message;
    EXPECT_TRUE(env.result.is_null());
}

// ---------------------------------------------------------------------------
// 실패 분류
// ---------------------------------------------------------------------------

TEST_F(QueryServiceTest, SyntaxErrorIsSyntaxInvalid) {
    const auto service = make_service();
    const auto env = run(*service, "x = (1 +\n");

    EXPECT_FALSE(env.ok);
    ASSERT_TRUE(env.kind.has_value());
    EXPECT_EQ(*env.kind, QueryErrorKind::kSyntaxInvalid);
    EXPECT_EQ(env.message.rfind("line ", 0), 0u) << "Got: " << env.message;
    EXPECT_TRUE(env.violations.empty());
}

TEST_F(QueryServiceTest, DeniedSnippetCarriesAllViolations) {
    const auto service = make_service();
    const auto env = run(*service, "import os\nx = eval('1')\n");

    EXPECT_FALSE(env.ok);
    ASSERT_TRUE(env.kind.has_value());
    EXPECT_EQ(*env.kind, QueryErrorKind::kCapabilityDenied);
    EXPECT_GE(env.violations.size(), 2u);

    const auto json = env.to_json();
    ASSERT_NE(json.find("violations"), nullptr);
    EXPECT_EQ(json.find("kind")->as_string(), "CapabilityDenied");
    const auto& first = json.find("violations")->as_array().front();
    EXPECT_GE(first.find("line")->as_int(), 1);
    EXPECT_FALSE(first.find("reason")->as_string().empty());
}

TEST_F(QueryServiceTest, MutatingCallIsDenied) {
    const auto service = make_service();
    const auto env = run(*service,
        "c = oci.core.ComputeClient(config)\n"
        "c.terminate_instance('ocid1.instance.oc1..web1')\n");
    ASSERT_TRUE(env.kind.has_value());
    EXPECT_EQ(*env.kind, QueryErrorKind::kCapabilityDenied);
}

TEST_F(QueryServiceTest, InfiniteLoopIsExecutionTimeout) {
    ServiceOptions options;
    options.executor.timeout = std::chrono::milliseconds{300};
    const auto service = make_service(options);

    const auto started = std::chrono::steady_clock::now();
    const auto env     = run(*service, "while true { x = 1 }\n");
    const auto waited  = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(env.kind.has_value());
    EXPECT_EQ(*env.kind, QueryErrorKind::kExecutionTimeout);
    EXPECT_EQ(env.to_json().find("result"), nullptr) << "timeout must not carry a partial result";
    EXPECT_LT(waited, std::chrono::milliseconds{300 + 500});

    // 같은 서비스가 곧바로 다음 요청을 처리한다
    const auto next = run(*service, "result = len([1, 2, 3])\n");
    ASSERT_TRUE(next.ok) << next.message;
    EXPECT_EQ(next.to_json().dump(), R"({"ok":true,"result":3})");
    EXPECT_EQ(stats_->snapshot().in_flight, 0u);
}

TEST_F(QueryServiceTest, UnboundNameIsRuntimeFailure) {
    const auto service = make_service();
    const auto env = run(*service, "result = missing_name + 1\n");
    ASSERT_TRUE(env.kind.has_value());
    EXPECT_EQ(*env.kind, QueryErrorKind::kRuntimeFailure);
    EXPECT_EQ(env.message, "NameError: name 'missing_name' is not defined");
}

TEST_F(QueryServiceTest, ServiceErrorIsRuntimeFailure) {
    const auto service = make_service();
    const auto env = run(*service,
        "ident = oci.identity.IdentityClient(config)\n"
        "ident.list_users(config['tenancy']).data\n");
    ASSERT_TRUE(env.kind.has_value());
    EXPECT_EQ(*env.kind, QueryErrorKind::kRuntimeFailure);
    EXPECT_EQ(env.message.rfind("ServiceError: {'status': 401", 0), 0u) << "Got: " << env.message;
}

TEST_F(QueryServiceTest, OversizedResultIsSerializationFailure) {
    ServiceOptions options;
    options.executor.max_result_bytes = 128;
    const auto service = make_service(options);

    const auto env = run(*service, "result = 'x' * 4096\n");
    ASSERT_TRUE(env.kind.has_value());
    EXPECT_EQ(*env.kind, QueryErrorKind::kSerializationFailure);
}

TEST_F(QueryServiceTest, NodeBudgetIsSerializationFailure) {
    ServiceOptions options;
    options.serializer.max_nodes = 10;
    const auto service = make_service(options);

    const auto env = run(*service, "result = list(range(100))\n");
    ASSERT_TRUE(env.kind.has_value());
    EXPECT_EQ(*env.kind, QueryErrorKind::kSerializationFailure);
    EXPECT_EQ(env.message, "result has more than 10 nodes");
}

// 화이트리스트가 없으면 아무 것도 실행하지 않는다
TEST_F(QueryServiceTest, MissingWhitelistDeniesEverything) {
    const QueryService service{nullptr, session_};
    const auto env = service.execute(QueryRequest{1, "result = 1\n"});
    ASSERT_TRUE(env.kind.has_value());
    EXPECT_EQ(*env.kind, QueryErrorKind::kCapabilityDenied);
}

// ---------------------------------------------------------------------------
// describe_capabilities
// ---------------------------------------------------------------------------

TEST_F(QueryServiceTest, DescribeCapabilities) {
    ServiceOptions options;
    options.executor.timeout = std::chrono::milliseconds{1500};
    const auto service = make_service(options);
    const auto caps = service->describe_capabilities();

    EXPECT_EQ(caps.find("version")->as_string(), "2026.10-r1");
    EXPECT_EQ(caps.find("timeout_ms")->as_int(), 1500);

    const auto* tool = caps.find("tool");
    ASSERT_NE(tool, nullptr);
    EXPECT_EQ(tool->find("name")->as_string(), "read_create_update_oci_resources");
    const auto* schema = tool->find("input_schema");
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(schema->find("required")->as_array().front().as_string(), "code_snippet");

    ASSERT_NE(caps.find("allowed_modules"), nullptr);
    EXPECT_EQ(caps.find("allowed_modules")->as_array().front().as_string(), "oci");
    EXPECT_EQ(caps.find("bindings")->find("oci")->as_string(), "module");
    EXPECT_EQ(caps.find("bindings")->find("config")->as_string(), "value");
    EXPECT_GT(caps.find("allowed_call_patterns")->size(), 0u);
    EXPECT_GE(caps.find("forbidden_node_kinds")->size(), kMandatoryForbiddenKinds.size());
}

// ---------------------------------------------------------------------------
// 통계 / 로그
// ---------------------------------------------------------------------------

TEST_F(QueryServiceTest, StatsCountEveryOutcome) {
    const auto service = make_service();
    (void)run(*service, "result = 1\n");
    (void)run(*service, "import os\n");
    (void)run(*service, "x = (\n");
    (void)run(*service, "y = nope\n");

    const auto snap = stats_->snapshot();
    EXPECT_EQ(snap.total_queries, 4u);
    EXPECT_EQ(snap.succeeded_queries, 1u);
    EXPECT_EQ(snap.error_count(QueryErrorKind::kCapabilityDenied), 1u);
    EXPECT_EQ(snap.error_count(QueryErrorKind::kSyntaxInvalid), 1u);
    EXPECT_EQ(snap.error_count(QueryErrorKind::kRuntimeFailure), 1u);
    EXPECT_EQ(snap.in_flight, 0u);
    EXPECT_DOUBLE_EQ(snap.deny_rate, 0.25);
}

TEST_F(QueryServiceTest, EventsAreLogged) {
    const auto log_file = dir_ / "events.log";
    auto logger = std::make_shared<StructuredLogger>(LogLevel::kDebug, log_file);
    const auto service = make_service({}, logger);

    (void)run(*service, "result = 1\n");
    (void)run(*service, "import socket\n");
    logger->flush();

    std::ifstream in{log_file};
    std::vector<JsonValue> events;
    std::string line;
    while (std::getline(in, line)) {
        const auto start = line.find('{');
        if (start == std::string::npos) {
            continue;
        }
        auto parsed = JsonValue::parse(line.substr(start));
        ASSERT_TRUE(parsed.has_value()) << parsed.error() << " in: " << line;
        events.push_back(std::move(*parsed));
    }

    // executed(ok), denied, executed(fail)
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].find("event")->as_string(), "query_executed");
    EXPECT_TRUE(events[0].find("ok")->as_bool());
    EXPECT_EQ(events[0].find("result_bytes")->as_int(), 1);
    EXPECT_EQ(events[1].find("event")->as_string(), "query_denied");
    EXPECT_EQ(events[1].find("whitelist_version")->as_string(), "2026.10-r1");
    EXPECT_GE(events[1].find("violations")->size(), 1u);
    EXPECT_EQ(events[2].find("error_kind")->as_string(), "CapabilityDenied");
}

TEST_F(QueryServiceTest, RequestIdsIncrease) {
    const auto service = make_service();
    const auto a = service->next_request_id();
    const auto b = service->next_request_id();
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
}
