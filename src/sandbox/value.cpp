// ---------------------------------------------------------------------------
// value.cpp
//
// 값 모델 구현과 Python 의미론 근사 헬퍼.
// ---------------------------------------------------------------------------

#include "sandbox/value.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

#include <fmt/format.h>

namespace {

// 비교/repr 재귀 상한. 순환 참조나 과도한 중첩에서 스택 고갈을 막는다.
constexpr int kMaxCompareDepth = 200;

std::string type_name_of_list(const List& list) {
    return list.tuple ? "tuple" : "list";
}

void repr_string(std::string_view s, std::string& out) {
    const bool use_double = s.find('\'') != std::string_view::npos &&
                            s.find('"') == std::string_view::npos;
    const char quote = use_double ? '"' : '\'';
    out += quote;
    for (const char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c == quote) {
                    out += '\\';
                    out += c;
                } else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                    out += fmt::format("\\x{:02x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
                } else {
                    out += c;
                }
                break;
        }
    }
    out += quote;
}

// 순환 컨테이너는 Python 처럼 [...] / {...} 로 표기한다.
void repr_impl(const Value& v, std::string& out, std::vector<const void*>& active) {
    const auto enter = [&](const void* p) {
        if (std::find(active.begin(), active.end(), p) != active.end() ||
            active.size() >= static_cast<std::size_t>(kMaxCompareDepth)) {
            return false;
        }
        active.push_back(p);
        return true;
    };

    std::visit([&](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "None";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += x ? "True" : "False";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            out += fmt::format("{}", x);
        } else if constexpr (std::is_same_v<T, double>) {
            out += format_float(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            repr_string(x, out);
        } else if constexpr (std::is_same_v<T, ListPtr>) {
            const char open  = x->tuple ? '(' : '[';
            const char close = x->tuple ? ')' : ']';
            if (!enter(x.get())) {
                out += open;
                out += "...";
                out += close;
                return;
            }
            out += open;
            for (std::size_t i = 0; i < x->items.size(); ++i) {
                if (i > 0) { out += ", "; }
                repr_impl(x->items[i], out, active);
            }
            if (x->tuple && x->items.size() == 1) { out += ','; }
            out += close;
            active.pop_back();
        } else if constexpr (std::is_same_v<T, DictPtr>) {
            if (!enter(x.get())) {
                out += "{...}";
                return;
            }
            out += '{';
            bool first = true;
            for (const auto& [key, value] : x->items()) {
                if (!first) { out += ", "; }
                first = false;
                repr_impl(key, out, active);
                out += ": ";
                repr_impl(value, out, active);
            }
            out += '}';
            active.pop_back();
        } else if constexpr (std::is_same_v<T, SetPtr>) {
            if (x->size() == 0) {
                out += "set()";
                return;
            }
            out += '{';
            bool first = true;
            for (const auto& item : x->items()) {
                if (!first) { out += ", "; }
                first = false;
                repr_impl(item, out, active);
            }
            out += '}';
        } else if constexpr (std::is_same_v<T, RecordPtr>) {
            if (!enter(x.get())) {
                out += x->type_name + "(...)";
                return;
            }
            out += x->type_name;
            out += '(';
            bool first = true;
            for (const auto& [name, value] : x->fields) {
                if (!first) { out += ", "; }
                first = false;
                out += name;
                out += '=';
                repr_impl(value, out, active);
            }
            out += ')';
            active.pop_back();
        } else if constexpr (std::is_same_v<T, HostPtr>) {
            out += x->repr();
        }
    }, v.data);
}

bool equal_impl(const Value& a, const Value& b, int depth) {
    if (depth > kMaxCompareDepth) {
        throw ScriptError("RecursionError: maximum recursion depth exceeded in comparison");
    }
    if (is_numeric(a) && is_numeric(b)) {
        if (is_integral(a) && is_integral(b)) {
            return integral_of(a) == integral_of(b);
        }
        return double_of(a) == double_of(b);
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x == y;
        } else if constexpr (std::is_same_v<T, ListPtr>) {
            if (x == y) { return true; }
            if (x->tuple != y->tuple || x->items.size() != y->items.size()) { return false; }
            for (std::size_t i = 0; i < x->items.size(); ++i) {
                if (!equal_impl(x->items[i], y->items[i], depth + 1)) { return false; }
            }
            return true;
        } else if constexpr (std::is_same_v<T, DictPtr>) {
            if (x == y) { return true; }
            if (x->size() != y->size()) { return false; }
            for (const auto& [key, value] : x->items()) {
                const Value* other = y->find(key);
                if (!other || !equal_impl(value, *other, depth + 1)) { return false; }
            }
            return true;
        } else if constexpr (std::is_same_v<T, SetPtr>) {
            if (x == y) { return true; }
            if (x->size() != y->size()) { return false; }
            return std::all_of(x->items().begin(), x->items().end(),
                               [&](const Value& item) { return y->contains(item); });
        } else if constexpr (std::is_same_v<T, RecordPtr>) {
            if (x == y) { return true; }
            if (x->type_name != y->type_name || x->fields.size() != y->fields.size()) { return false; }
            for (std::size_t i = 0; i < x->fields.size(); ++i) {
                if (x->fields[i].first != y->fields[i].first ||
                    !equal_impl(x->fields[i].second, y->fields[i].second, depth + 1)) {
                    return false;
                }
            }
            return true;
        } else if constexpr (std::is_same_v<T, HostPtr>) {
            return x == y;
        } else {
            return false;  // 숫자는 위에서 처리됨
        }
    }, a.data);
}

int compare_impl(const Value& a, const Value& b, int depth) {
    if (depth > kMaxCompareDepth) {
        throw ScriptError("RecursionError: maximum recursion depth exceeded in comparison");
    }
    if (is_numeric(a) && is_numeric(b)) {
        if (is_integral(a) && is_integral(b)) {
            const auto x = integral_of(a);
            const auto y = integral_of(b);
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        const double x = double_of(a);
        const double y = double_of(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (const auto* x = a.get_if<std::string>()) {
        if (const auto* y = b.get_if<std::string>()) {
            const int c = x->compare(*y);
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
    }
    if (const auto* x = a.get_if<ListPtr>()) {
        if (const auto* y = b.get_if<ListPtr>(); y && (*x)->tuple == (*y)->tuple) {
            const auto& xs = (*x)->items;
            const auto& ys = (*y)->items;
            const std::size_t n = std::min(xs.size(), ys.size());
            for (std::size_t i = 0; i < n; ++i) {
                if (!equal_impl(xs[i], ys[i], depth + 1)) {
                    return compare_impl(xs[i], ys[i], depth + 1);
                }
            }
            return xs.size() < ys.size() ? -1 : (xs.size() > ys.size() ? 1 : 0);
        }
    }
    throw ScriptError(fmt::format(
        "TypeError: '<' not supported between instances of '{}' and '{}'",
        type_name(a), type_name(b)));
}

}  // namespace

// ---------------------------------------------------------------------------
// 숫자 헬퍼
// ---------------------------------------------------------------------------
bool is_numeric(const Value& v) noexcept {
    return v.is<bool>() || v.is<std::int64_t>() || v.is<double>();
}

bool is_integral(const Value& v) noexcept {
    return v.is<bool>() || v.is<std::int64_t>();
}

std::int64_t integral_of(const Value& v) noexcept {
    if (const auto* b = v.get_if<bool>()) { return *b ? 1 : 0; }
    return *v.get_if<std::int64_t>();
}

double double_of(const Value& v) noexcept {
    if (const auto* d = v.get_if<double>()) { return *d; }
    return static_cast<double>(integral_of(v));
}

// ---------------------------------------------------------------------------
// 생성 헬퍼
// ---------------------------------------------------------------------------
Value make_none() { return Value{}; }
Value make_bool(bool v) { return Value{v}; }
Value make_int(std::int64_t v) { return Value{v}; }
Value make_float(double v) { return Value{v}; }
Value make_str(std::string v) { return Value{std::move(v)}; }

Value make_list(std::vector<Value> items) {
    auto list = std::make_shared<List>();
    list->items = std::move(items);
    return Value{std::move(list)};
}

Value make_tuple(std::vector<Value> items) {
    auto list = std::make_shared<List>();
    list->items = std::move(items);
    list->tuple = true;
    return Value{std::move(list)};
}

Value make_dict() { return Value{std::make_shared<Dict>()}; }
Value make_set() { return Value{std::make_shared<Set>()}; }

Value make_record(std::string type_name, std::vector<std::pair<std::string, Value>> fields) {
    auto record = std::make_shared<Record>();
    record->type_name = std::move(type_name);
    record->fields    = std::move(fields);
    return Value{RecordPtr{std::move(record)}};
}

Value make_host(HostPtr host) { return Value{std::move(host)}; }

// ---------------------------------------------------------------------------
// Dict / Set / Record / CallArguments
// ---------------------------------------------------------------------------
const Value* Dict::find(const Value& key) const {
    const auto it = index_.find(hash_key(key));
    return it == index_.end() ? nullptr : &items_[it->second].second;
}

void Dict::set(Value key, Value value) {
    auto hk = hash_key(key);
    if (const auto it = index_.find(hk); it != index_.end()) {
        items_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(std::move(hk), items_.size());
    items_.emplace_back(std::move(key), std::move(value));
}

bool Set::contains(const Value& item) const {
    return index_.contains(hash_key(item));
}

void Set::add(Value item) {
    auto hk = hash_key(item);
    if (index_.contains(hk)) {
        return;
    }
    index_.emplace(std::move(hk), items_.size());
    items_.push_back(std::move(item));
}

const Value* Record::field(std::string_view name) const noexcept {
    for (const auto& [key, value] : fields) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

const Value* CallArguments::keyword(std::string_view name) const noexcept {
    for (const auto& [key, value] : keywords) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// HostObject 기본 구현
// ---------------------------------------------------------------------------
Value HostObject::get_attribute(std::string_view name) {
    throw ScriptError(fmt::format("AttributeError: '{}' object has no attribute '{}'",
                                  type_name(), name));
}

Value HostObject::call(const CallArguments& /*args*/) {
    throw ScriptError(fmt::format("TypeError: '{}' object is not callable", type_name()));
}

std::string HostObject::repr() const {
    return fmt::format("<{}>", type_name());
}

NativeFunction::NativeFunction(std::string qualified_name, Fn fn)
    : name_(std::move(qualified_name))
    , fn_(std::move(fn))
{}

std::string NativeFunction::repr() const {
    return fmt::format("<function {}>", name_);
}

Value NativeFunction::call(const CallArguments& args) {
    return fn_(args);
}

OpaqueObject::OpaqueObject(std::string type_name, std::string repr)
    : type_name_(std::move(type_name))
    , repr_(std::move(repr))
{}

// ---------------------------------------------------------------------------
// 값 연산 헬퍼
// ---------------------------------------------------------------------------
std::string type_name(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>)     { return "NoneType"; }
        else if constexpr (std::is_same_v<T, bool>)          { return "bool"; }
        else if constexpr (std::is_same_v<T, std::int64_t>)  { return "int"; }
        else if constexpr (std::is_same_v<T, double>)        { return "float"; }
        else if constexpr (std::is_same_v<T, std::string>)   { return "str"; }
        else if constexpr (std::is_same_v<T, ListPtr>)       { return type_name_of_list(*x); }
        else if constexpr (std::is_same_v<T, DictPtr>)       { return "dict"; }
        else if constexpr (std::is_same_v<T, SetPtr>)        { return "set"; }
        else if constexpr (std::is_same_v<T, RecordPtr>)     { return x->type_name; }
        else                                                 { return x->type_name(); }
    }, v.data);
}

bool truthy(const Value& v) {
    return std::visit([](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>)     { return false; }
        else if constexpr (std::is_same_v<T, bool>)          { return x; }
        else if constexpr (std::is_same_v<T, std::int64_t>)  { return x != 0; }
        else if constexpr (std::is_same_v<T, double>)        { return x != 0.0; }
        else if constexpr (std::is_same_v<T, std::string>)   { return !x.empty(); }
        else if constexpr (std::is_same_v<T, ListPtr>)       { return !x->items.empty(); }
        else if constexpr (std::is_same_v<T, DictPtr>)       { return x->size() > 0; }
        else if constexpr (std::is_same_v<T, SetPtr>)        { return x->size() > 0; }
        else                                                 { return true; }
    }, v.data);
}

std::string format_float(double d) {
    if (std::isnan(d)) { return "nan"; }
    if (std::isinf(d)) { return d > 0 ? "inf" : "-inf"; }
    std::string s = fmt::format("{}", d);
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string repr(const Value& v) {
    std::string out;
    std::vector<const void*> active;
    repr_impl(v, out, active);
    return out;
}

std::string to_str(const Value& v) {
    if (const auto* s = v.get_if<std::string>()) {
        return *s;
    }
    return repr(v);
}

bool values_equal(const Value& a, const Value& b) {
    return equal_impl(a, b, 0);
}

int compare_values(const Value& a, const Value& b) {
    return compare_impl(a, b, 0);
}

std::string hash_key(const Value& v) {
    if (v.is_none()) {
        return "n";
    }
    if (is_integral(v)) {
        return fmt::format("i:{}", integral_of(v));
    }
    if (const auto* d = v.get_if<double>()) {
        constexpr double kLimit = 9.2e18;
        if (std::isfinite(*d) && std::floor(*d) == *d && std::fabs(*d) < kLimit) {
            return fmt::format("i:{}", static_cast<std::int64_t>(*d));
        }
        return "f:" + format_float(*d);
    }
    if (const auto* s = v.get_if<std::string>()) {
        return "s:" + *s;
    }
    if (const auto* l = v.get_if<ListPtr>(); l && (*l)->tuple) {
        std::string out = "t:(";
        for (const auto& item : (*l)->items) {
            const auto part = hash_key(item);
            out += fmt::format("{}:{}", part.size(), part);
        }
        out += ')';
        return out;
    }
    if (const auto* h = v.get_if<HostPtr>()) {
        return fmt::format("h:{}", static_cast<const void*>(h->get()));
    }
    throw ScriptError(fmt::format("TypeError: unhashable type: '{}'", type_name(v)));
}

std::size_t utf8_length(std::string_view s) noexcept {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::vector<std::string> utf8_split(std::string_view s) {
    std::vector<std::string> out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size();) {
        std::size_t j = i + 1;
        while (j < s.size() && (static_cast<unsigned char>(s[j]) & 0xC0) == 0x80) {
            ++j;
        }
        out.emplace_back(s.substr(i, j - i));
        i = j;
    }
    return out;
}
