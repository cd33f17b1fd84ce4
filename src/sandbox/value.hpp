#pragma once

// ---------------------------------------------------------------------------
// value.hpp
//
// 샌드박스 인터프리터가 다루는 값 모델.
//
// [종류]
//   none / bool / int(int64) / float(double) / str(UTF-8)
//   list  : 가변, 공유 (shared_ptr). tuple 은 tuple=true 인 List
//   dict  : 삽입 순서 유지, 스칼라/tuple 키만 허용
//   set   : 삽입 순서 유지 (결과 재현성을 위해 정렬하지 않는다)
//   record: SDK 모델 객체 형태 (type_name + 순서 있는 필드). 불변
//   host  : 모듈/클라이언트/호출 가능 객체/불투명 객체 (HostObject)
//
// [설계 원칙]
// - 컨테이너는 shared_ptr 로 공유한다. 순환 참조가 만들어질 수 있으며
//   직렬화 계층이 seen-set 으로 처리한다.
// - 스크립트 오류는 ScriptError 예외로 전달하고 Interpreter::run 경계에서
//   std::expected 로 변환한다.
// - 외부 API 접근은 HostObject 의 get_attribute / call 로만 가능하다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

class HostObject;
struct List;
class Dict;
class Set;
struct Record;

using ListPtr   = std::shared_ptr<List>;
using DictPtr   = std::shared_ptr<Dict>;
using SetPtr    = std::shared_ptr<Set>;
using RecordPtr = std::shared_ptr<const Record>;
using HostPtr   = std::shared_ptr<HostObject>;

// ---------------------------------------------------------------------------
// ScriptError
//   스니펫 실행 중 오류. 메시지는 "TypeError: ..." 형식이다.
// ---------------------------------------------------------------------------
class ScriptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------
struct Value {
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string,
                                 ListPtr, DictPtr, SetPtr, RecordPtr, HostPtr>;

    Storage data{};

    [[nodiscard]] bool is_none() const noexcept {
        return std::holds_alternative<std::monostate>(data);
    }

    template <typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&data);
    }
};

[[nodiscard]] Value make_none();
[[nodiscard]] Value make_bool(bool v);
[[nodiscard]] Value make_int(std::int64_t v);
[[nodiscard]] Value make_float(double v);
[[nodiscard]] Value make_str(std::string v);
[[nodiscard]] Value make_list(std::vector<Value> items = {});
[[nodiscard]] Value make_tuple(std::vector<Value> items);
[[nodiscard]] Value make_dict();
[[nodiscard]] Value make_set();
[[nodiscard]] Value make_record(std::string type_name,
                                std::vector<std::pair<std::string, Value>> fields);
[[nodiscard]] Value make_host(HostPtr host);

// ---------------------------------------------------------------------------
// List
// ---------------------------------------------------------------------------
struct List {
    std::vector<Value> items{};
    bool               tuple{false};
};

// ---------------------------------------------------------------------------
// Dict
//   키는 hash_key() 로 정규화한 문자열로 색인한다 (1 == 1.0 == True).
// ---------------------------------------------------------------------------
class Dict {
public:
    [[nodiscard]] const Value* find(const Value& key) const;
    void set(Value key, Value value);

    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] const std::vector<std::pair<Value, Value>>& items() const noexcept {
        return items_;
    }

private:
    std::vector<std::pair<Value, Value>>         items_;
    std::unordered_map<std::string, std::size_t> index_;
};

// ---------------------------------------------------------------------------
// Set
// ---------------------------------------------------------------------------
class Set {
public:
    [[nodiscard]] bool contains(const Value& item) const;
    void add(Value item);

    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] const std::vector<Value>& items() const noexcept { return items_; }

private:
    std::vector<Value>                           items_;
    std::unordered_map<std::string, std::size_t> index_;
};

// ---------------------------------------------------------------------------
// Record
//   SDK 응답 모델. 필드 순서는 모델 정의 순서를 따른다.
// ---------------------------------------------------------------------------
struct Record {
    std::string                                type_name{};
    std::vector<std::pair<std::string, Value>> fields{};

    [[nodiscard]] const Value* field(std::string_view name) const noexcept;
};

// ---------------------------------------------------------------------------
// CallArguments
// ---------------------------------------------------------------------------
struct CallArguments {
    std::vector<Value>                         positional{};
    std::vector<std::pair<std::string, Value>> keywords{};

    [[nodiscard]] const Value* keyword(std::string_view name) const noexcept;
};

// ---------------------------------------------------------------------------
// HostObject
//   스니펫에 노출되는 외부 객체. 기본 구현은 속성 접근/호출을 거부한다.
// ---------------------------------------------------------------------------
class HostObject {
public:
    enum class Kind : std::uint8_t {
        kModule   = 0,
        kClient   = 1,
        kCallable = 2,
        kOpaque   = 3,
    };

    HostObject()          = default;
    virtual ~HostObject() = default;

    HostObject(const HostObject&)            = delete;
    HostObject& operator=(const HostObject&) = delete;
    HostObject(HostObject&&)                 = delete;
    HostObject& operator=(HostObject&&)      = delete;

    [[nodiscard]] virtual Kind        host_kind() const noexcept = 0;
    [[nodiscard]] virtual std::string type_name() const          = 0;

    virtual Value get_attribute(std::string_view name);
    virtual Value call(const CallArguments& args);

    // repr: 직렬화 시 문자열 강제 변환에 사용된다.
    [[nodiscard]] virtual std::string repr() const;
};

// ---------------------------------------------------------------------------
// NativeFunction
//   C++ 함수를 감싼 호출 가능 객체 (클라이언트 메서드 등).
// ---------------------------------------------------------------------------
class NativeFunction final : public HostObject {
public:
    using Fn = std::function<Value(const CallArguments&)>;

    NativeFunction(std::string qualified_name, Fn fn);

    [[nodiscard]] Kind        host_kind() const noexcept override { return Kind::kCallable; }
    [[nodiscard]] std::string type_name() const override { return "function"; }
    [[nodiscard]] std::string repr() const override;

    Value call(const CallArguments& args) override;

    [[nodiscard]] const std::string& qualified_name() const noexcept { return name_; }

private:
    std::string name_;
    Fn          fn_;
};

// ---------------------------------------------------------------------------
// OpaqueObject
//   worker 에서 전달받은 host 객체의 문자열 표현. 속성/호출을 지원하지 않는다.
// ---------------------------------------------------------------------------
class OpaqueObject final : public HostObject {
public:
    OpaqueObject(std::string type_name, std::string repr);

    [[nodiscard]] Kind        host_kind() const noexcept override { return Kind::kOpaque; }
    [[nodiscard]] std::string type_name() const override { return type_name_; }
    [[nodiscard]] std::string repr() const override { return repr_; }

private:
    std::string type_name_;
    std::string repr_;
};

// ---------------------------------------------------------------------------
// 값 연산 헬퍼 (Python 의미론 근사)
// ---------------------------------------------------------------------------

// type_name: "int", "str", "list", record 는 모델 타입 이름
[[nodiscard]] std::string type_name(const Value& v);

// is_numeric / is_integral: bool 은 int 로 취급한다
[[nodiscard]] bool         is_numeric(const Value& v) noexcept;
[[nodiscard]] bool         is_integral(const Value& v) noexcept;
[[nodiscard]] std::int64_t integral_of(const Value& v) noexcept;
[[nodiscard]] double       double_of(const Value& v) noexcept;

// truthy: 빈 컨테이너/0/none/"" 은 false
[[nodiscard]] bool truthy(const Value& v);

// to_str: str(x) 결과. 문자열은 그대로, 나머지는 repr
[[nodiscard]] std::string to_str(const Value& v);

// repr: repr(x) 결과 ('문자열', [1, 2], {'a': 1}, None, True)
[[nodiscard]] std::string repr(const Value& v);

// format_float: Python 식 float 표기 (1.0, 0.1, inf, nan)
[[nodiscard]] std::string format_float(double d);

// values_equal: == 의미론. 숫자는 타입을 넘어 비교한다
[[nodiscard]] bool values_equal(const Value& a, const Value& b);

// compare_values: < 의미론. 비교 불가한 타입이면 ScriptError
//   반환: 음수(a<b), 0, 양수(a>b)
[[nodiscard]] int compare_values(const Value& a, const Value& b);

// hash_key: dict/set 색인 키. hashable 하지 않으면 ScriptError
[[nodiscard]] std::string hash_key(const Value& v);

// utf8_length: 코드 포인트 개수 (len(str))
[[nodiscard]] std::size_t utf8_length(std::string_view s) noexcept;

// utf8_split: 코드 포인트 단위 분할
[[nodiscard]] std::vector<std::string> utf8_split(std::string_view s);
