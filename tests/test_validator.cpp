// ---------------------------------------------------------------------------
// test_validator.cpp
//
// Validator 단위 테스트. 저장소 기본 화이트리스트를 사용한다.
//
// [테스트 범위]
// - 허용: 클라이언트 생성 → list_*/get_* 호출, 페이지네이션 헬퍼,
//   결과 데이터 가공(builtin, 문자열/리스트 메서드, 컴프리헨션)
// - 거부 (능력 분류): eval/exec/open/__import__, os/subprocess/socket import,
//   '_' 속성(reflection), lambda, global, 속성 대입, 사전 바인딩 재대입
// - 거부 (default deny): 화이트리스트 밖 모듈, 패턴 밖 클라이언트 메서드,
//   허용되지 않은 값 메서드, 별칭을 통한 우회
// - fail-close: 화이트리스트 없음, 파싱 실패
// - 결정성: 같은 입력 → 같은 위반 목록
//
// [알려진 한계]
// - 정의되지 않은 이름은 여기서 거부하지 않는다 (실행 시 NameError).
// ---------------------------------------------------------------------------

#include "policy/capability_loader.hpp"
#include "policy/validator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>

namespace {

std::shared_ptr<const CapabilityWhitelist> repo_whitelist() {
    auto wl = CapabilityLoader::load(OCIGATE_SOURCE_DIR "/config/capabilities.yaml");
    EXPECT_TRUE(wl.has_value()) << (wl ? "" : wl.error());
    return std::make_shared<const CapabilityWhitelist>(wl ? std::move(*wl) : CapabilityWhitelist{});
}

class ValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        validator_ = std::make_unique<Validator>(repo_whitelist());
    }

    Verdict check(std::string_view snippet) const {
        auto verdict = validator_->check(snippet);
        EXPECT_TRUE(verdict.has_value())
            << "unexpected parse error: " << (verdict ? "" : verdict.error().message);
        return verdict ? std::move(*verdict) : Verdict{};
    }

    static bool has_violation(const Verdict& v, NodeKind kind) {
        return std::any_of(v.violations.begin(), v.violations.end(),
                           [&](const Violation& x) { return x.node_kind == kind; });
    }

    static std::string dump(const Verdict& v) {
        std::string out;
        for (const auto& x : v.violations) {
            out += std::string(node_kind_name(x.node_kind)) + ": " + x.reason + "\n";
        }
        return out;
    }

    std::unique_ptr<Validator> validator_;
};

}  // namespace

// ---------------------------------------------------------------------------
// 허용
// ---------------------------------------------------------------------------

TEST_F(ValidatorTest, ListInstancesSnippetIsAdmitted) {
    const auto v = check(
        "import oci\n"
        "compute = oci.core.ComputeClient(config)\n"
        "resp = compute.list_instances(compartment_id=config['tenancy'])\n"
        "result = [i.display_name for i in resp.data if i.lifecycle_state == 'RUNNING']\n");
    EXPECT_TRUE(v.admitted) << dump(v);
    EXPECT_TRUE(v.violations.empty());
    EXPECT_FALSE(v.whitelist_version.empty());
}

TEST_F(ValidatorTest, FromImportConstructorIsAdmitted) {
    const auto v = check(
        "from oci.identity import IdentityClient\n"
        "client = IdentityClient(config)\n"
        "result = client.get_user(config['user']).data\n");
    EXPECT_TRUE(v.admitted) << dump(v);
}

TEST_F(ValidatorTest, PaginationHelperIsAdmitted) {
    const auto v = check(
        "net = oci.core.VirtualNetworkClient(config)\n"
        "all_vcns = oci.pagination.list_call_get_all_results(net.list_vcns, config['tenancy'])\n"
        "result = len(all_vcns.data)\n");
    EXPECT_TRUE(v.admitted) << dump(v);
}

TEST_F(ValidatorTest, PlainDataProcessingIsAdmitted) {
    const auto v = check(
        "names = []\n"
        "for n in ['A', 'b'] {\n"
        "    names.append(n.lower().strip())\n"
        "}\n"
        "counts = {k: len(k) for k in names}\n"
        "result = sorted(counts.keys(), reverse=True)\n");
    EXPECT_TRUE(v.admitted) << dump(v);
}

// 정의되지 않은 이름은 실행 시점에 NameError 가 된다
TEST_F(ValidatorTest, UndefinedNameIsNotAValidationError) {
    const auto v = check("result = undefined_thing + 1\n");
    EXPECT_TRUE(v.admitted) << dump(v);
}

// ---------------------------------------------------------------------------
// 거부: 능력 분류
// ---------------------------------------------------------------------------

TEST_F(ValidatorTest, EvalIsDynamicEval) {
    const auto v = check("x = eval('1 + 1')\n");
    EXPECT_FALSE(v.admitted);
    ASSERT_TRUE(has_violation(v, NodeKind::kDynamicEval)) << dump(v);
    EXPECT_NE(v.violations[0].reason.find("'eval' belongs to capability class 'dynamic_eval'"),
              std::string::npos) << v.violations[0].reason;
}

TEST_F(ValidatorTest, ExecAndDunderImportAreDynamicEval) {
    EXPECT_TRUE(has_violation(check("exec('x = 1')\n"), NodeKind::kDynamicEval));
    EXPECT_TRUE(has_violation(check("m = __import__('os')\n"), NodeKind::kDynamicEval));
}

TEST_F(ValidatorTest, OpenIsFileAccess) {
    const auto v = check("data = open('/etc/passwd')\n");
    EXPECT_FALSE(v.admitted);
    EXPECT_TRUE(has_violation(v, NodeKind::kFileAccess)) << dump(v);
}

TEST_F(ValidatorTest, OsImportIsProcessSpawn) {
    const auto v = check("import os\nos.system('id')\n");
    EXPECT_FALSE(v.admitted);
    EXPECT_TRUE(has_violation(v, NodeKind::kProcessSpawn)) << dump(v);
}

TEST_F(ValidatorTest, FromSubprocessImportIsProcessSpawn) {
    const auto v = check("from subprocess import check_output\n");
    EXPECT_TRUE(has_violation(v, NodeKind::kProcessSpawn)) << dump(v);
}

TEST_F(ValidatorTest, SocketImportIsNetworkAccess) {
    const auto v = check("import socket\n");
    EXPECT_TRUE(has_violation(v, NodeKind::kNetworkAccess)) << dump(v);
}

TEST_F(ValidatorTest, UnderscoreAttributeIsReflection) {
    const auto v = check("k = config.__class__\n");
    EXPECT_FALSE(v.admitted);
    EXPECT_TRUE(has_violation(v, NodeKind::kReflection)) << dump(v);
}

TEST_F(ValidatorTest, GetattrIsReflection) {
    const auto v = check("c = getattr(oci, 'core')\n");
    EXPECT_TRUE(has_violation(v, NodeKind::kReflection)) << dump(v);
}

TEST_F(ValidatorTest, DunderNameIsReflection) {
    const auto v = check("b = __builtins__\n");
    EXPECT_TRUE(has_violation(v, NodeKind::kReflection)) << dump(v);
}

TEST_F(ValidatorTest, LambdaIsForbidden) {
    const auto v = check("f = lambda x: x\n");
    EXPECT_FALSE(v.admitted);
    EXPECT_TRUE(has_violation(v, NodeKind::kLambda)) << dump(v);
    EXPECT_TRUE(has_violation(v, NodeKind::kDynamicEval)) << dump(v);
}

TEST_F(ValidatorTest, GlobalIsForbidden) {
    const auto v = check("global counter\n");
    EXPECT_FALSE(v.admitted);
    EXPECT_TRUE(has_violation(v, NodeKind::kGlobal)) << dump(v);
    EXPECT_TRUE(has_violation(v, NodeKind::kGlobalScopeWrite)) << dump(v);
}

TEST_F(ValidatorTest, AttributeAssignmentIsAttributeStore) {
    const auto v = check("config.region = 'x'\n");
    EXPECT_FALSE(v.admitted);
    EXPECT_TRUE(has_violation(v, NodeKind::kAttributeStore)) << dump(v);
}

TEST_F(ValidatorTest, RebindingPreauthorizedNameIsGlobalScopeWrite) {
    const auto v = check("oci = 1\n");
    EXPECT_FALSE(v.admitted);
    EXPECT_TRUE(has_violation(v, NodeKind::kGlobalScopeWrite)) << dump(v);
}

TEST_F(ValidatorTest, LoopVariableRebindingPreauthorizedNameIsDenied) {
    const auto v = check("for config in [1, 2] { pass }\n");
    EXPECT_TRUE(has_violation(v, NodeKind::kGlobalScopeWrite)) << dump(v);
}

// ---------------------------------------------------------------------------
// 거부: default deny
// ---------------------------------------------------------------------------

TEST_F(ValidatorTest, ModuleOutsideWhitelistIsDenied) {
    const auto v = check("import json\n");
    EXPECT_FALSE(v.admitted);
    ASSERT_EQ(v.violations.size(), 1u) << dump(v);
    EXPECT_EQ(v.violations[0].node_kind, NodeKind::kImport);
    EXPECT_EQ(v.violations[0].reason, "module 'json' is not in allowed_modules");
    EXPECT_EQ(v.violations[0].location.line, 1u);
}

TEST_F(ValidatorTest, MutatingClientMethodIsDenied) {
    const auto v = check(
        "compute = oci.core.ComputeClient(config)\n"
        "compute.terminate_instance('ocid1.instance.oc1..x')\n");
    EXPECT_FALSE(v.admitted);
    ASSERT_TRUE(has_violation(v, NodeKind::kCall)) << dump(v);
    EXPECT_NE(dump(v).find("'oci.core.ComputeClient.terminate_instance' is not in allowed_call_patterns"),
              std::string::npos) << dump(v);
}

TEST_F(ValidatorTest, AliasDoesNotBypassPatterns) {
    const auto v = check(
        "x = oci\n"
        "y = x.core.ComputeClient(config)\n"
        "y.delete_instance('a')\n");
    EXPECT_FALSE(v.admitted) << "aliasing the module must keep its kind";
    EXPECT_TRUE(has_violation(v, NodeKind::kCall)) << dump(v);
}

TEST_F(ValidatorTest, ConditionalRebindingKeepsEveryKind) {
    // c 는 클라이언트 또는 일반 값일 수 있다. 두 kind 모두에서 허용되어야 한다
    const auto v = check(
        "c = oci.core.ComputeClient(config) if config else 'x'\n"
        "c.launch_instance({})\n");
    EXPECT_FALSE(v.admitted) << dump(v);
}

// ---------------------------------------------------------------------------
// 이름당 kind 상한을 넘기면 나머지 kind 를 버리지 않고 거부한다.
//   c 를 도달 불가능한 모듈 kind 로, x 를 builtin 으로 채운 뒤 클라이언트와
//   허용되지 않은 메서드를 대입해도 통과해서는 안 된다.
// ---------------------------------------------------------------------------
TEST_F(ValidatorTest, KindOverflowIsDenied) {
    std::string snippet = "if False {\n";
    for (int i = 0; i < 16; ++i) {
        snippet += "    c = oci.m" + std::to_string(i) + "\n";
    }
    for (const char* name : {"len", "str", "int", "float", "bool", "list", "dict", "set",
                             "sorted", "reversed", "min", "max", "sum", "range", "enumerate", "zip"}) {
        snippet += "    x = " + std::string(name) + "\n";
    }
    snippet += "}\n"
               "c = oci.core.ComputeClient(config)\n"
               "x = c.delete_instance\n"
               "result = x('ocid1.instance.oc1..web1')\n";

    const auto v = check(snippet);
    EXPECT_FALSE(v.admitted) << "kind overflow must not admit the snippet";
    EXPECT_NE(dump(v).find("too many possible kinds for 'c'"), std::string::npos) << dump(v);
    EXPECT_NE(dump(v).find("too many possible kinds for 'x'"), std::string::npos) << dump(v);

    const auto it = std::find_if(v.violations.begin(), v.violations.end(), [](const Violation& x) {
        return x.reason.find("'c'") != std::string::npos;
    });
    ASSERT_NE(it, v.violations.end());
    EXPECT_EQ(it->node_kind, NodeKind::kAssign);
    EXPECT_EQ(it->location.line, 35u) << "violation must point at the overflowing assignment";
}

// 역순으로 이어진 별칭 체인은 반복 상한 안에 수렴하지 않는다 → 거부
TEST_F(ValidatorTest, NonConvergingKindAnalysisIsDenied) {
    std::string snippet;
    for (int i = 9; i >= 1; --i) {
        snippet += "x" + std::to_string(i) + " = x" + std::to_string(i - 1) + "\n";
    }
    snippet += "x0 = oci.core\n"
               "result = x9.ComputeClient(config)\n";

    const auto v = check(snippet);
    EXPECT_FALSE(v.admitted) << dump(v);
    EXPECT_NE(dump(v).find("kind analysis did not converge"), std::string::npos) << dump(v);
}

// 상한 안쪽의 별칭 체인은 그대로 허용된다
TEST_F(ValidatorTest, ForwardAliasChainIsAdmitted) {
    const auto v = check(
        "a = oci.core\n"
        "b = a\n"
        "result = len(b.ComputeClient(config).list_instances(config['tenancy']).data)\n");
    EXPECT_TRUE(v.admitted) << dump(v);
}

TEST_F(ValidatorTest, UnlistedValueMethodIsDenied) {
    const auto v = check("s = 'a {}'.format(1)\n");
    EXPECT_FALSE(v.admitted);
    EXPECT_NE(dump(v).find("method 'format' on plain values"), std::string::npos) << dump(v);
}

TEST_F(ValidatorTest, UnlistedCallIsDenied) {
    const auto v = check("print('x')\n");
    EXPECT_FALSE(v.admitted);
    ASSERT_EQ(v.violations.size(), 1u) << dump(v);
    EXPECT_EQ(v.violations[0].reason, "call to 'print' is not whitelisted");
}

TEST_F(ValidatorTest, UnknownSubmoduleConstructorIsDenied) {
    const auto v = check("c = oci.core.ComputeManagementClient(config)\n");
    EXPECT_FALSE(v.admitted) << dump(v);
}

TEST_F(ValidatorTest, EveryViolationIsReported) {
    const auto v = check(
        "import json\n"
        "x = eval('1')\n"
        "config.a = 1\n");
    EXPECT_FALSE(v.admitted);
    EXPECT_GE(v.violations.size(), 3u) << dump(v);
    // 전위 순회 소스 순서
    EXPECT_EQ(v.violations.front().location.line, 1u);
    EXPECT_EQ(v.violations.back().location.line, 3u);
}

// ---------------------------------------------------------------------------
// fail-close / 결정성
// ---------------------------------------------------------------------------

TEST(Validator, NullWhitelistDeniesEverything) {
    Validator validator{nullptr};
    const auto v = validator.check("x = 1\n");
    ASSERT_TRUE(v.has_value());
    EXPECT_FALSE(v->admitted);
    ASSERT_EQ(v->violations.size(), 1u);
    EXPECT_EQ(v->violations[0].reason, "no capability whitelist is loaded");
}

TEST(Validator, ParseErrorIsReturnedNotAdmitted) {
    Validator validator{repo_whitelist()};
    const auto v = validator.check("def f() { pass }\n");
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ParseErrorCode::kUnsupportedSyntax);
}

TEST(Validator, VerdictIsDeterministic) {
    Validator validator{repo_whitelist()};
    const std::string snippet = "import os\nx = eval('1')\nconfig.y = open('f')\n";
    const auto a = validator.check(snippet);
    const auto b = validator.check(snippet);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(a->violations.size(), b->violations.size());
    for (std::size_t i = 0; i < a->violations.size(); ++i) {
        EXPECT_EQ(a->violations[i].node_kind, b->violations[i].node_kind);
        EXPECT_EQ(a->violations[i].reason, b->violations[i].reason);
        EXPECT_EQ(a->violations[i].location.line, b->violations[i].location.line);
        EXPECT_EQ(a->violations[i].location.column, b->violations[i].location.column);
    }
}

TEST(Validator, ClientBindingAllowsDirectCalls) {
    auto wl = CapabilityLoader::load_from_string(R"(
version: "client-binding"
bindings:
  compute: oci.core.ComputeClient
allowed_call_patterns:
  - {receiver: oci.core.ComputeClient, member: "list_*"}
)");
    ASSERT_TRUE(wl.has_value()) << wl.error();
    Validator validator{std::make_shared<const CapabilityWhitelist>(std::move(*wl))};

    const auto ok = validator.check("result = compute.list_instances('c').data\n");
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(ok->admitted);
    EXPECT_EQ(ok->whitelist_version, "client-binding");

    const auto denied = validator.check("compute.get_instance('i')\n");
    ASSERT_TRUE(denied.has_value());
    EXPECT_FALSE(denied->admitted);
}
