// ---------------------------------------------------------------------------
// test_catalog_client.cpp
//
// CatalogClientFactory 단위 테스트. 스니펫은 Interpreter 로 같은 프로세스에서
// 평가한다 (fork 없음).
//
// [테스트 범위]
// - 저장소 예제 fixture(config/catalog.example.yaml) 로드와 모듈 트리
// - list_*: compartment 위치 인자, 필드 키워드 필터, limit
// - get_*: 위치 인자 / <singular>_id 키워드, 없는 id → 404 ServiceError
// - error 가 고정된 컬렉션 → ServiceError 메시지 형식
// - Client(config): dict 가 아니면 InvalidConfig
// - oci.pagination.list_call_get_all_results
// - resolve(): 점 경로 탐색
// - 로드 실패: clients 누락, 점 경로 아닌 타입, id 없는 항목, model 누락
// ---------------------------------------------------------------------------

#include "parser/snippet_parser.hpp"
#include "policy/capability.hpp"
#include "sandbox/interpreter.hpp"
#include "session/catalog_client.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {

std::shared_ptr<CatalogClientFactory> example_factory() {
    auto factory = CatalogClientFactory::load(OCIGATE_SOURCE_DIR "/config/catalog.example.yaml");
    EXPECT_TRUE(factory.has_value()) << (factory ? "" : factory.error());
    return factory ? *factory : nullptr;
}

std::expected<Value, ScriptFailure> run(const ClientFactory& factory, std::string_view source) {
    SandboxBindings bindings;
    bindings.builtins.insert(kSandboxBuiltins.begin(), kSandboxBuiltins.end());
    bindings.modules["oci"] = make_host(factory.root_module());
    bindings.names["config"] = make_dict();

    auto program = SnippetParser{}.parse(source);
    EXPECT_TRUE(program.has_value()) << (program ? "" : program.error().message);
    if (!program) {
        return std::unexpected(ScriptFailure{false, "parse failed"});
    }
    Interpreter interpreter{bindings};
    return interpreter.run(*program);
}

std::string run_repr(const ClientFactory& factory, std::string_view source) {
    const auto v = run(factory, source);
    EXPECT_TRUE(v.has_value()) << (v ? "" : v.error().message);
    return v ? repr(*v) : std::string{};
}

std::string run_error(const ClientFactory& factory, std::string_view source) {
    const auto v = run(factory, source);
    EXPECT_FALSE(v.has_value()) << "expected failure for: " << source;
    return v ? std::string{} : v.error().message;
}

}  // namespace

// ---------------------------------------------------------------------------
// 로드
// ---------------------------------------------------------------------------

TEST(CatalogClient, LoadsExampleCatalog) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    EXPECT_EQ(factory->name(), "catalog");
    EXPECT_EQ(factory->catalog().root, "oci");
    EXPECT_EQ(factory->catalog().clients.size(), 3u);
    EXPECT_EQ(factory->catalog().clients.at("oci.core.ComputeClient")
                  .collections.at("instances").items.size(), 3u);
}

TEST(CatalogClient, ResolveFollowsDottedPath) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);

    const auto ctor = factory->resolve("oci.core.ComputeClient");
    ASSERT_NE(ctor, nullptr);
    EXPECT_EQ(ctor->host_kind(), HostObject::Kind::kCallable);

    const auto module = factory->resolve("oci.core");
    ASSERT_NE(module, nullptr);
    EXPECT_EQ(module->type_name(), "oci.core");

    EXPECT_EQ(factory->resolve("oci.core.NoSuchClient"), nullptr);
    EXPECT_EQ(factory->resolve("boto3.client"), nullptr);
}

// ---------------------------------------------------------------------------
// list_* / get_*
// ---------------------------------------------------------------------------

TEST(CatalogClient, ListFiltersByCompartment) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    EXPECT_EQ(run_repr(*factory,
        "import oci\n"
        "compute = oci.core.ComputeClient(config)\n"
        "[i.display_name for i in compute.list_instances('ocid1.compartment.oc1..prod').data]\n"),
        "['web-1', 'web-2']");
}

TEST(CatalogClient, ListFiltersByFieldKeywordAndLimit) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    EXPECT_EQ(run_repr(*factory,
        "import oci\n"
        "c = oci.core.ComputeClient(config)\n"
        "[i.id for i in c.list_instances(lifecycle_state='RUNNING').data]\n"),
        "['ocid1.instance.oc1..web1', 'ocid1.instance.oc1..batch1']");

    EXPECT_EQ(run_repr(*factory,
        "import oci\n"
        "c = oci.core.ComputeClient(config)\n"
        "len(c.list_instances(limit=1).data)\n"),
        "1");
}

// 항목에 없는 키워드 (예: sort_by, 모르는 필드) 는 무시한다
TEST(CatalogClient, UnknownKeywordsAreIgnored) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    EXPECT_EQ(run_repr(*factory,
        "import oci\n"
        "c = oci.core.ComputeClient(config)\n"
        "len(c.list_instances(sort_by='TIMECREATED', availability_domain='AD-1').data)\n"),
        "3");
}

TEST(CatalogClient, ResponseEnvelopeFields) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    EXPECT_EQ(run_repr(*factory,
        "import oci\n"
        "r = oci.core.VirtualNetworkClient(config).list_vcns('ocid1.compartment.oc1..prod')\n"
        "[r.status, r.request_id, r.next_page, r.headers['opc-request-id']]\n"),
        "[200, 'catalog/list_vcns', None, 'catalog/list_vcns']");
}

TEST(CatalogClient, GetByPositionalAndKeywordId) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    EXPECT_EQ(run_repr(*factory,
        "import oci\n"
        "c = oci.core.ComputeClient(config)\n"
        "c.get_instance('ocid1.instance.oc1..web2').data.lifecycle_state\n"),
        "'STOPPED'");
    EXPECT_EQ(run_repr(*factory,
        "from oci.core import ComputeClient\n"
        "ComputeClient(config).get_instance(instance_id='ocid1.instance.oc1..batch1').data.shape\n"),
        "'VM.Standard3.Flex'");
}

TEST(CatalogClient, GetUnknownIdIsNotFound) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    const auto msg = run_error(*factory,
        "import oci\n"
        "oci.core.ComputeClient(config).get_instance('ocid1.instance.oc1..nope')\n");
    EXPECT_EQ(msg,
        "ServiceError: {'status': 404, 'code': 'NotAuthorizedOrNotFound', "
        "'operation_name': 'get_instance', "
        "'message': 'Authorization failed or requested resource not found.'}");
}

TEST(CatalogClient, GetWithoutIdIsTypeError) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    const auto msg = run_error(*factory,
        "import oci\noci.core.ComputeClient(config).get_instance()\n");
    EXPECT_EQ(msg, "TypeError: get_instance() missing required argument 'instance_id'");
}

// get_compartment → compartments 컬렉션
TEST(CatalogClient, GetResolvesPluralCollection) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    EXPECT_EQ(run_repr(*factory,
        "import oci\n"
        "oci.identity.IdentityClient(config).get_compartment('ocid1.compartment.oc1..dev').data.name\n"),
        "'dev'");
}

TEST(CatalogClient, FixedCollectionErrorIsServiceError) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    const auto msg = run_error(*factory,
        "import oci\noci.identity.IdentityClient(config).list_users('ocid1.tenancy.oc1..root')\n");
    EXPECT_EQ(msg.rfind("ServiceError: {'status': 401, 'code': 'NotAuthenticated', "
                        "'operation_name': 'list_users'", 0), 0u) << "Got: " << msg;
}

TEST(CatalogClient, UnknownMethodIsAttributeError) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    const auto msg = run_error(*factory,
        "import oci\noci.core.ComputeClient(config).terminate_instance('x')\n");
    EXPECT_EQ(msg.rfind("AttributeError:", 0), 0u) << "Got: " << msg;
}

TEST(CatalogClient, ConfigMustBeDict) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    const auto msg = run_error(*factory, "import oci\noci.core.ComputeClient('profile')\n");
    EXPECT_EQ(msg.rfind("InvalidConfig: ComputeClient() config must be a dict", 0), 0u)
        << "Got: " << msg;

    // config 생략은 허용
    EXPECT_EQ(run_repr(*factory, "import oci\nlen(oci.core.ComputeClient().list_instances().data)\n"),
              "3");
}

TEST(CatalogClient, PaginationHelperDropsLimit) {
    const auto factory = example_factory();
    ASSERT_NE(factory, nullptr);
    EXPECT_EQ(run_repr(*factory,
        "import oci\n"
        "c = oci.core.ComputeClient(config)\n"
        "r = oci.pagination.list_call_get_all_results(c.list_instances, "
        "'ocid1.compartment.oc1..prod', limit=1)\n"
        "len(r.data)\n"),
        "2");
}

// ---------------------------------------------------------------------------
// 로드 실패 (all-or-nothing)
// ---------------------------------------------------------------------------

TEST(CatalogClientLoad, MissingClientsMapFails) {
    const auto f = CatalogClientFactory::load_from_string("version: 1\n");
    ASSERT_FALSE(f.has_value());
    EXPECT_NE(f.error().find("needs a 'clients' map"), std::string::npos) << f.error();
}

TEST(CatalogClientLoad, UndottedClientTypeFails) {
    const auto f = CatalogClientFactory::load_from_string(R"(
clients:
  ComputeClient:
    instances: {model: M}
)");
    ASSERT_FALSE(f.has_value());
    EXPECT_NE(f.error().find("is not a dotted path"), std::string::npos) << f.error();
}

TEST(CatalogClientLoad, ItemWithoutIdFails) {
    const auto f = CatalogClientFactory::load_from_string(R"(
clients:
  oci.core.ComputeClient:
    instances:
      model: oci.core.models.Instance
      items:
        - display_name: no-id
)");
    ASSERT_FALSE(f.has_value());
    EXPECT_NE(f.error().find("every item needs a string 'id'"), std::string::npos) << f.error();
}

TEST(CatalogClientLoad, CollectionWithoutModelFails) {
    const auto f = CatalogClientFactory::load_from_string(R"(
clients:
  oci.core.ComputeClient:
    instances:
      items: []
)");
    ASSERT_FALSE(f.has_value());
    EXPECT_NE(f.error().find("'model' is required"), std::string::npos) << f.error();
}

TEST(CatalogClientLoad, MixedRootModulesFail) {
    const auto f = CatalogClientFactory::load_from_string(R"(
clients:
  oci.core.ComputeClient:
    instances: {model: M}
  other.core.ComputeClient:
    instances: {model: M}
)");
    ASSERT_FALSE(f.has_value());
    EXPECT_NE(f.error().find("outside root module"), std::string::npos) << f.error();
}

TEST(CatalogClientLoad, MissingFileFails) {
    EXPECT_FALSE(CatalogClientFactory::load("/nonexistent/ocigate/catalog.yaml").has_value());
}
