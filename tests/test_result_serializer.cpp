// ---------------------------------------------------------------------------
// test_result_serializer.cpp
//
// ResultSerializer / JsonValue 단위 테스트.
//
// [테스트 범위]
// - 스칼라/컨테이너 매핑 (tuple, set → 배열, record → 객체)
// - dict 키 문자열화 (1 → "1", None → "None")
// - 비유한 float → 문자열, 잘못된 UTF-8 → U+FFFD
// - 순환 / 깊이 초과 → {"__truncated__": ...} 표식
// - 공유(비순환) 컨테이너는 절단하지 않는다
// - 같은 값을 두 번 직렬화하면 같은 결과
// - 노드 예산 초과 → SerializeError
// - host 객체 → repr 문자열
// - JsonValue parse/dump: 이스케이프, 깊이 제한, 잘못된 입력
// ---------------------------------------------------------------------------

#include "sandbox/value.hpp"
#include "serializer/json_value.hpp"
#include "serializer/result_serializer.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>

namespace {

std::string dump(const Value& v, SerializerLimits limits = {}) {
    const auto json = ResultSerializer{limits}.serialize(v);
    EXPECT_TRUE(json.has_value()) << (json ? "" : json.error().message);
    return json ? json->dump() : std::string{};
}

Value dict_of(std::initializer_list<std::pair<Value, Value>> entries) {
    Value d = make_dict();
    for (const auto& [k, v] : entries) {
        (*d.get_if<DictPtr>())->set(k, v);
    }
    return d;
}

}  // namespace

// ---------------------------------------------------------------------------
// 매핑
// ---------------------------------------------------------------------------

TEST(ResultSerializer, Scalars) {
    EXPECT_EQ(dump(make_none()), "null");
    EXPECT_EQ(dump(make_bool(true)), "true");
    EXPECT_EQ(dump(make_int(-12)), "-12");
    EXPECT_EQ(dump(make_float(1.5)), "1.5");
    EXPECT_EQ(dump(make_float(2.0)), "2.0");
    EXPECT_EQ(dump(make_str("a\"b\n")), R"("a\"b\n")");
}

TEST(ResultSerializer, ContainersBecomeArraysAndObjects) {
    EXPECT_EQ(dump(make_list({make_int(1), make_str("x")})), R"([1,"x"])");
    EXPECT_EQ(dump(make_tuple({make_int(1), make_int(2)})), "[1,2]");

    Value s = make_set();
    (*s.get_if<SetPtr>())->add(make_int(3));
    EXPECT_EQ(dump(s), "[3]");

    EXPECT_EQ(dump(dict_of({{make_str("a"), make_int(1)}, {make_str("b"), make_none()}})),
              R"({"a":1,"b":null})");
}

// 문자열이 아닌 키는 문자열 형태로 바뀐다
TEST(ResultSerializer, NonStringDictKeysAreStringified) {
    EXPECT_EQ(dump(dict_of({{make_int(1), make_str("one")}, {make_none(), make_int(0)}})),
              R"({"1":"one","None":0})");
}

TEST(ResultSerializer, RecordBecomesFieldObject) {
    const Value inst = make_record("oci.core.models.Instance", {
        {"id",              make_str("ocid1.instance.oc1..a")},
        {"lifecycle_state", make_str("RUNNING")},
    });
    EXPECT_EQ(dump(inst), R"({"id":"ocid1.instance.oc1..a","lifecycle_state":"RUNNING"})");
}

TEST(ResultSerializer, NonFiniteFloatsBecomeStrings) {
    EXPECT_EQ(dump(make_float(std::numeric_limits<double>::infinity())), R"("inf")");
    EXPECT_EQ(dump(make_float(-std::numeric_limits<double>::infinity())), R"("-inf")");
    EXPECT_EQ(dump(make_float(std::numeric_limits<double>::quiet_NaN())), R"("nan")");
}

TEST(ResultSerializer, InvalidUtf8IsReplaced) {
    const auto out = dump(make_str(std::string("ok\xff", 3)));
    EXPECT_EQ(out, "\"ok\xEF\xBF\xBD\"") << "Got: " << out;
}

TEST(ResultSerializer, HostObjectsUseRepr) {
    const Value fn = make_host(std::make_shared<NativeFunction>(
        "oci.core.ComputeClient.list_instances", [](const CallArguments&) { return make_none(); }));
    EXPECT_EQ(dump(fn), R"("<function oci.core.ComputeClient.list_instances>")");

    const Value opaque = make_host(std::make_shared<OpaqueObject>("oci.core.ComputeClient",
                                                                  "<oci.core.ComputeClient>"));
    EXPECT_EQ(dump(opaque), R"("<oci.core.ComputeClient>")");
}

// ---------------------------------------------------------------------------
// 절단
// ---------------------------------------------------------------------------

TEST(ResultSerializer, CycleIsReplacedByMarker) {
    Value list = make_list({make_int(1)});
    const auto& ptr = *list.get_if<ListPtr>();
    ptr->items.push_back(list);

    EXPECT_EQ(dump(list), R"([1,{"__truncated__":"cycle"}])");
    ptr->items.clear();  // shared_ptr 순환 해제
}

TEST(ResultSerializer, DictSelfReferenceIsReplacedByMarker) {
    Value d = make_dict();
    const auto& ptr = *d.get_if<DictPtr>();
    ptr->set(make_str("self"), d);

    EXPECT_EQ(dump(d), R"({"self":{"__truncated__":"cycle"}})");
    ptr->set(make_str("self"), make_none());
}

// 같은 컨테이너가 형제 위치에 두 번 나오는 것은 순환이 아니다
TEST(ResultSerializer, SharedSiblingIsNotACycle) {
    const Value inner = make_list({make_int(7)});
    EXPECT_EQ(dump(make_list({inner, inner})), "[[7],[7]]");
}

// ---------------------------------------------------------------------------
// 같은 값을 두 번 직렬화하면 결과가 같다 (record 목록 + 공유 형제 + 순환)
// ---------------------------------------------------------------------------
TEST(ResultSerializer, SerializingTwiceIsIdentical) {
    const Value shared = dict_of({{make_str("cidr"), make_str("10.0.0.0/16")},
                                  {make_int(2), make_none()}});
    Value labels = make_set();
    (*labels.get_if<SetPtr>())->add(make_str("b"));
    (*labels.get_if<SetPtr>())->add(make_str("a"));

    Value records = make_list();
    for (int i = 0; i < 3; ++i) {
        (*records.get_if<ListPtr>())->items.push_back(make_record("oci.core.models.Vcn", {
            {"id",     make_str("ocid1.vcn.oc1.." + std::to_string(i))},
            {"size",   make_float(0.5 * i)},
            {"labels", labels},
            {"net",    shared},
        }));
    }
    const Value root = make_list({records, shared, shared});
    const auto& root_list = *root.get_if<ListPtr>();
    root_list->items.push_back(root);

    const ResultSerializer serializer;
    const auto first  = serializer.serialize(root);
    const auto second = serializer.serialize(root);
    ASSERT_TRUE(first.has_value()) << first.error().message;
    ASSERT_TRUE(second.has_value()) << second.error().message;

    EXPECT_EQ(first->dump(), second->dump());
    EXPECT_EQ(*first, *second);
    EXPECT_NE(first->dump().find(R"({"__truncated__":"cycle"})"), std::string::npos) << first->dump();
    root_list->items.clear();  // shared_ptr 순환 해제
}

TEST(ResultSerializer, DepthLimitIsReplacedByMarker) {
    Value v = make_int(0);
    for (int i = 0; i < 5; ++i) {
        v = make_list({v});
    }
    SerializerLimits limits;
    limits.max_depth = 3;
    EXPECT_EQ(dump(v, limits), R"([[[{"__truncated__":"max_depth"}]]])");
}

TEST(ResultSerializer, NodeBudgetExceededFails) {
    std::vector<Value> items(100, make_int(1));
    SerializerLimits limits;
    limits.max_nodes = 50;

    const auto json = ResultSerializer{limits}.serialize(make_list(std::move(items)));
    ASSERT_FALSE(json.has_value());
    EXPECT_EQ(json.error().code, SerializeErrorCode::kNodeBudgetExceeded);
    EXPECT_EQ(json.error().message, "result has more than 50 nodes");
}

// ---------------------------------------------------------------------------
// JsonValue
// ---------------------------------------------------------------------------

TEST(JsonValue, ParseObjectAndFind) {
    const auto v = JsonValue::parse(R"({"command":"execute_query","timeout_ms":500,"ok":true,"x":null})");
    ASSERT_TRUE(v.has_value()) << v.error();
    ASSERT_TRUE(v->is_object());

    const auto* command = v->find("command");
    ASSERT_NE(command, nullptr);
    EXPECT_EQ(command->as_string(), "execute_query");
    ASSERT_NE(v->find("timeout_ms"), nullptr);
    EXPECT_EQ(v->find("timeout_ms")->as_int(), 500);
    EXPECT_TRUE(v->find("ok")->as_bool());
    EXPECT_TRUE(v->find("x")->is_null());
    EXPECT_EQ(v->find("missing"), nullptr);
}

TEST(JsonValue, ParseUnicodeEscape) {
    const auto v = JsonValue::parse(R"(["é\n"])");
    ASSERT_TRUE(v.has_value()) << v.error();
    ASSERT_EQ(v->size(), 1u);
    EXPECT_EQ(v->as_array()[0].as_string(), "\xC3\xA9\n");
}

TEST(JsonValue, DumpEscapesControlCharacters) {
    EXPECT_EQ(JsonValue::string(std::string("\x01", 1)).dump(), R"("\u0001")");
}

TEST(JsonValue, SetReplacesExistingKey) {
    JsonValue obj = JsonValue::object();
    obj.set("a", JsonValue::integer(1));
    obj.set("b", JsonValue::integer(2));
    obj.set("a", JsonValue::integer(3));
    EXPECT_EQ(obj.dump(), R"({"a":3,"b":2})");
}

TEST(JsonValue, ParseRejectsMalformedInput) {
    EXPECT_FALSE(JsonValue::parse("").has_value());
    EXPECT_FALSE(JsonValue::parse("{\"a\":}").has_value());
    EXPECT_FALSE(JsonValue::parse("[1,2").has_value());
    EXPECT_FALSE(JsonValue::parse("{} trailing").has_value());
}

TEST(JsonValue, ParseRejectsDeepNesting) {
    const std::string deep = std::string(100, '[') + std::string(100, ']');
    EXPECT_FALSE(JsonValue::parse(deep, 64).has_value());
    EXPECT_TRUE(JsonValue::parse(deep, 200).has_value());
}
