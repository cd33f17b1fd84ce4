// ---------------------------------------------------------------------------
// interpreter.cpp
//
// Interpreter 구현.
//
// [구조]
//   Evaluator  : 한 번의 run() 동안만 존재하는 평가 상태 (지역 변수, 스코프)
//   call_builtin / call_method : 내장 함수와 일반 값 메서드 (상태 없음)
//
// [오류 전달]
//   내부에서는 ScriptError 를 던지고 run() 경계에서 ScriptFailure 로 변환한다.
//   deadline 초과는 std::exception 이 아닌 DeadlineExceeded 로 구분한다.
// ---------------------------------------------------------------------------

#include "sandbox/interpreter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <new>
#include <numeric>
#include <optional>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>

namespace {

struct DeadlineExceeded {};

enum class Flow : std::uint8_t {
    kNormal   = 0,
    kBreak    = 1,
    kContinue = 2,
};

constexpr std::uint64_t kDeadlineCheckMask = 1024 - 1;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

// ---------------------------------------------------------------------------
// 정수 연산 (overflow 검사)
// ---------------------------------------------------------------------------
[[noreturn]] void throw_overflow() {
    throw ScriptError("OverflowError: integer result out of range");
}

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
    std::int64_t r{};
    if (__builtin_add_overflow(a, b, &r)) { throw_overflow(); }
    return r;
}

std::int64_t checked_sub(std::int64_t a, std::int64_t b) {
    std::int64_t r{};
    if (__builtin_sub_overflow(a, b, &r)) { throw_overflow(); }
    return r;
}

std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
    std::int64_t r{};
    if (__builtin_mul_overflow(a, b, &r)) { throw_overflow(); }
    return r;
}

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        throw ScriptError("ZeroDivisionError: integer division or modulo by zero");
    }
    if (a == std::numeric_limits<std::int64_t>::min() && b == -1) { throw_overflow(); }
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

std::int64_t floor_mod(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        throw ScriptError("ZeroDivisionError: integer division or modulo by zero");
    }
    if (b == -1) {
        return 0;
    }
    std::int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) {
        r += b;
    }
    return r;
}

// ---------------------------------------------------------------------------
// 공통 헬퍼
// ---------------------------------------------------------------------------
[[noreturn]] void throw_type_error(std::string message) {
    throw ScriptError("TypeError: " + message);
}

const ListPtr* as_list(const Value& v) noexcept { return v.get_if<ListPtr>(); }
const DictPtr* as_dict(const Value& v) noexcept { return v.get_if<DictPtr>(); }
const SetPtr*  as_set(const Value& v) noexcept  { return v.get_if<SetPtr>(); }
const std::string* as_str(const Value& v) noexcept { return v.get_if<std::string>(); }

const std::string& require_str(const Value& v, std::string_view what) {
    if (const auto* s = as_str(v)) {
        return *s;
    }
    throw_type_error(fmt::format("{} must be str, not {}", what, type_name(v)));
}

std::int64_t require_int(const Value& v, std::string_view what) {
    if (is_integral(v)) {
        return integral_of(v);
    }
    throw_type_error(fmt::format("{} must be an integer, not '{}'", what, type_name(v)));
}

// iterate: for 문/컨테이너 생성자가 순회하는 원소 목록 (스냅샷)
std::vector<Value> iterate(const Value& v) {
    if (const auto* l = as_list(v)) {
        return (*l)->items;
    }
    if (const auto* s = as_set(v)) {
        return (*s)->items();
    }
    if (const auto* d = as_dict(v)) {
        std::vector<Value> keys;
        keys.reserve((*d)->size());
        for (const auto& [key, value] : (*d)->items()) {
            keys.push_back(key);
        }
        return keys;
    }
    if (const auto* s = as_str(v)) {
        std::vector<Value> chars;
        for (auto& ch : utf8_split(*s)) {
            chars.push_back(make_str(std::move(ch)));
        }
        return chars;
    }
    throw_type_error(fmt::format("'{}' object is not iterable", type_name(v)));
}

void check_arity(std::string_view name, const CallArguments& args,
                 std::size_t min_args, std::size_t max_args) {
    const auto n = args.positional.size();
    if (n < min_args || n > max_args) {
        if (min_args == max_args) {
            throw_type_error(fmt::format("{}() takes exactly {} argument(s) ({} given)",
                                         name, min_args, n));
        }
        throw_type_error(fmt::format("{}() takes from {} to {} arguments ({} given)",
                                     name, min_args, max_args, n));
    }
}

void check_keywords(std::string_view name, const CallArguments& args,
                    std::initializer_list<std::string_view> allowed) {
    for (const auto& [key, value] : args.keywords) {
        if (std::find(allowed.begin(), allowed.end(), key) == allowed.end()) {
            throw_type_error(fmt::format("'{}' is an invalid keyword argument for {}()", key, name));
        }
    }
}

// 위치 인자 또는 키워드 인자 (없으면 nullptr)
const Value* arg_or_keyword(const CallArguments& args, std::size_t index, std::string_view keyword) {
    if (index < args.positional.size()) {
        return &args.positional[index];
    }
    return args.keyword(keyword);
}

std::int64_t normalize_index(std::int64_t index, std::size_t size, std::string_view what) {
    const auto n = static_cast<std::int64_t>(size);
    if (index < 0) {
        index += n;
    }
    if (index < 0 || index >= n) {
        throw ScriptError(fmt::format("IndexError: {} index out of range", what));
    }
    return index;
}

// 슬라이스 경계 정규화 (Python 의미론, step 은 1 고정)
std::pair<std::size_t, std::size_t> slice_bounds(const Value& lower, const Value& upper,
                                                 std::size_t size) {
    const auto n = static_cast<std::int64_t>(size);
    const auto clamp = [n](const Value& v, std::int64_t fallback) {
        if (v.is_none()) {
            return fallback;
        }
        std::int64_t i = require_int(v, "slice indices");
        if (i < 0) {
            i += n;
        }
        return std::clamp<std::int64_t>(i, 0, n);
    };
    const std::int64_t lo = clamp(lower, 0);
    const std::int64_t hi = clamp(upper, n);
    if (hi <= lo) {
        return {static_cast<std::size_t>(lo), static_cast<std::size_t>(lo)};
    }
    return {static_cast<std::size_t>(lo), static_cast<std::size_t>(hi)};
}

void check_length(std::size_t length, const InterpreterLimits& limits) {
    if (length > limits.max_sequence_length) {
        throw ScriptError(fmt::format(
            "MemoryError: sequence of {} elements exceeds the sandbox limit of {}",
            length, limits.max_sequence_length));
    }
}

// ---------------------------------------------------------------------------
// 연산자
// ---------------------------------------------------------------------------
[[noreturn]] void throw_operand_error(std::string_view op, const Value& a, const Value& b) {
    throw_type_error(fmt::format("unsupported operand type(s) for {}: '{}' and '{}'",
                                 op, type_name(a), type_name(b)));
}

Value repeat_sequence(const Value& seq, std::int64_t count, const InterpreterLimits& limits) {
    const std::size_t times = count > 0 ? static_cast<std::size_t>(count) : 0;
    const std::size_t unit  = as_str(seq) ? as_str(seq)->size() : (*as_list(seq))->items.size();
    if (times > 0 && unit > limits.max_sequence_length / times) {
        check_length(limits.max_sequence_length + 1, limits);
    }

    if (const auto* s = as_str(seq)) {
        std::string out;
        out.reserve(unit * times);
        for (std::size_t i = 0; i < times; ++i) {
            out += *s;
        }
        return make_str(std::move(out));
    }
    const auto& list = *as_list(seq);
    std::vector<Value> out;
    out.reserve(unit * times);
    for (std::size_t i = 0; i < times; ++i) {
        out.insert(out.end(), list->items.begin(), list->items.end());
    }
    return list->tuple ? make_tuple(std::move(out)) : make_list(std::move(out));
}

Value binary_op(std::string_view op, const Value& a, const Value& b, const InterpreterLimits& limits) {
    const bool numeric  = is_numeric(a) && is_numeric(b);
    const bool integral = is_integral(a) && is_integral(b);

    if (op == "+") {
        if (integral) { return make_int(checked_add(integral_of(a), integral_of(b))); }
        if (numeric)  { return make_float(double_of(a) + double_of(b)); }
        if (const auto* x = as_str(a)) {
            if (const auto* y = as_str(b)) {
                check_length(x->size() + y->size(), limits);
                return make_str(*x + *y);
            }
        }
        if (const auto* x = as_list(a)) {
            if (const auto* y = as_list(b); y && (*x)->tuple == (*y)->tuple) {
                check_length((*x)->items.size() + (*y)->items.size(), limits);
                std::vector<Value> out = (*x)->items;
                out.insert(out.end(), (*y)->items.begin(), (*y)->items.end());
                return (*x)->tuple ? make_tuple(std::move(out)) : make_list(std::move(out));
            }
        }
        throw_operand_error(op, a, b);
    }
    if (op == "-") {
        if (integral) { return make_int(checked_sub(integral_of(a), integral_of(b))); }
        if (numeric)  { return make_float(double_of(a) - double_of(b)); }
        if (const auto* x = as_set(a)) {
            if (const auto* y = as_set(b)) {
                auto out = std::make_shared<Set>();
                for (const auto& item : (*x)->items()) {
                    if (!(*y)->contains(item)) {
                        out->add(item);
                    }
                }
                return Value{SetPtr{std::move(out)}};
            }
        }
        throw_operand_error(op, a, b);
    }
    if (op == "*") {
        if (integral) { return make_int(checked_mul(integral_of(a), integral_of(b))); }
        if (numeric)  { return make_float(double_of(a) * double_of(b)); }
        if ((as_str(a) || as_list(a)) && is_integral(b)) {
            return repeat_sequence(a, integral_of(b), limits);
        }
        if ((as_str(b) || as_list(b)) && is_integral(a)) {
            return repeat_sequence(b, integral_of(a), limits);
        }
        throw_operand_error(op, a, b);
    }
    if (op == "/") {
        if (!numeric) { throw_operand_error(op, a, b); }
        const double divisor = double_of(b);
        if (divisor == 0.0) {
            throw ScriptError("ZeroDivisionError: division by zero");
        }
        return make_float(double_of(a) / divisor);
    }
    if (op == "//") {
        if (integral) { return make_int(floor_div(integral_of(a), integral_of(b))); }
        if (!numeric) { throw_operand_error(op, a, b); }
        const double divisor = double_of(b);
        if (divisor == 0.0) {
            throw ScriptError("ZeroDivisionError: float floor division by zero");
        }
        return make_float(std::floor(double_of(a) / divisor));
    }
    if (op == "%") {
        if (integral) { return make_int(floor_mod(integral_of(a), integral_of(b))); }
        if (!numeric) { throw_operand_error(op, a, b); }
        const double divisor = double_of(b);
        if (divisor == 0.0) {
            throw ScriptError("ZeroDivisionError: float modulo");
        }
        double r = std::fmod(double_of(a), divisor);
        if (r != 0.0 && ((r < 0.0) != (divisor < 0.0))) {
            r += divisor;
        }
        return make_float(r);
    }
    throw ScriptError(fmt::format("SyntaxError: unsupported operator '{}'", op));
}

bool contains(const Value& container, const Value& item) {
    if (const auto* s = as_str(container)) {
        const auto& needle = require_str(item, "'in <string>' left operand");
        return s->find(needle) != std::string::npos;
    }
    if (const auto* l = as_list(container)) {
        return std::any_of((*l)->items.begin(), (*l)->items.end(),
                           [&](const Value& v) { return values_equal(v, item); });
    }
    if (const auto* d = as_dict(container)) {
        return (*d)->find(item) != nullptr;
    }
    if (const auto* s = as_set(container)) {
        return (*s)->contains(item);
    }
    throw_type_error(fmt::format("argument of type '{}' is not iterable", type_name(container)));
}

bool identical(const Value& a, const Value& b) {
    if (a.data.index() != b.data.index()) {
        return false;
    }
    return std::visit([&](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else {
            return x == y;
        }
    }, a.data);
}

bool compare_op(std::string_view op, const Value& a, const Value& b) {
    if (op == "==")     { return values_equal(a, b); }
    if (op == "!=")     { return !values_equal(a, b); }
    if (op == "<")      { return compare_values(a, b) < 0; }
    if (op == "<=")     { return compare_values(a, b) <= 0; }
    if (op == ">")      { return compare_values(a, b) > 0; }
    if (op == ">=")     { return compare_values(a, b) >= 0; }
    if (op == "in")     { return contains(b, a); }
    if (op == "not in") { return !contains(b, a); }
    if (op == "is")     { return identical(a, b); }
    if (op == "is not") { return !identical(a, b); }
    throw ScriptError(fmt::format("SyntaxError: unsupported comparison '{}'", op));
}

Value call_value(const Value& callee, const CallArguments& args) {
    if (const auto* host = callee.get_if<HostPtr>()) {
        return (*host)->call(args);
    }
    throw_type_error(fmt::format("'{}' object is not callable", type_name(callee)));
}

// key= 인자가 있으면 원소마다 호출한 결과를 비교 키로 사용한다.
std::vector<Value> sort_keys(const std::vector<Value>& items, const Value* key) {
    if (!key || key->is_none()) {
        return items;
    }
    std::vector<Value> keys;
    keys.reserve(items.size());
    for (const auto& item : items) {
        keys.push_back(call_value(*key, CallArguments{{item}, {}}));
    }
    return keys;
}

// ---------------------------------------------------------------------------
// 문자열 헬퍼
// ---------------------------------------------------------------------------
std::string ascii_transform(std::string_view s, int (*fn)(int)) {
    std::string out(s);
    for (auto& c : out) {
        if (static_cast<unsigned char>(c) < 0x80) {
            c = static_cast<char>(fn(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

std::string_view strip_chars(std::string_view s, std::string_view chars, bool left, bool right) {
    if (left) {
        const auto start = s.find_first_not_of(chars);
        s = start == std::string_view::npos ? std::string_view{} : s.substr(start);
    }
    if (right) {
        const auto end = s.find_last_not_of(chars);
        s = end == std::string_view::npos ? std::string_view{} : s.substr(0, end + 1);
    }
    return s;
}

std::vector<Value> split_string(std::string_view s, const Value* sep, std::int64_t maxsplit) {
    std::vector<Value> out;
    if (!sep || sep->is_none()) {
        std::size_t pos = 0;
        while (true) {
            pos = s.find_first_not_of(kWhitespace, pos);
            if (pos == std::string_view::npos) {
                break;
            }
            if (maxsplit >= 0 && static_cast<std::int64_t>(out.size()) == maxsplit) {
                out.push_back(make_str(std::string(strip_chars(s.substr(pos), kWhitespace, false, true))));
                break;
            }
            const auto end = s.find_first_of(kWhitespace, pos);
            out.push_back(make_str(std::string(s.substr(pos, end - pos))));
            if (end == std::string_view::npos) {
                break;
            }
            pos = end;
        }
        return out;
    }

    const auto& delim = require_str(*sep, "separator");
    if (delim.empty()) {
        throw ScriptError("ValueError: empty separator");
    }
    std::size_t pos = 0;
    while (true) {
        if (maxsplit >= 0 && static_cast<std::int64_t>(out.size()) == maxsplit) {
            out.push_back(make_str(std::string(s.substr(pos))));
            break;
        }
        const auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            out.push_back(make_str(std::string(s.substr(pos))));
            break;
        }
        out.push_back(make_str(std::string(s.substr(pos, next - pos))));
        pos = next + delim.size();
    }
    return out;
}

bool affix_matches(std::string_view s, const Value& affix, bool prefix) {
    const auto test = [&](const Value& v) {
        const auto& a = require_str(v, prefix ? "startswith arg" : "endswith arg");
        return prefix ? s.starts_with(a) : s.ends_with(a);
    };
    if (const auto* l = as_list(affix); l && (*l)->tuple) {
        return std::any_of((*l)->items.begin(), (*l)->items.end(), test);
    }
    return test(affix);
}

// ---------------------------------------------------------------------------
// 일반 값 메서드
// ---------------------------------------------------------------------------
bool has_value_method(const Value& receiver, std::string_view name) {
    static constexpr std::array<std::string_view, 11> kStrMethods = {
        "lower", "upper", "strip", "lstrip", "rstrip", "split",
        "join", "replace", "startswith", "endswith", "find",
    };
    if (as_str(receiver)) {
        return std::find(kStrMethods.begin(), kStrMethods.end(), name) != kStrMethods.end();
    }
    if (const auto* l = as_list(receiver)) {
        if ((*l)->tuple) {
            return name == "index" || name == "count";
        }
        return name == "append" || name == "extend" || name == "index" ||
               name == "count" || name == "pop";
    }
    if (as_dict(receiver)) {
        return name == "get" || name == "keys" || name == "values" || name == "items";
    }
    return false;
}

Value call_str_method(const std::string& s, std::string_view name, const CallArguments& args) {
    if (name == "lower" || name == "upper") {
        check_arity(name, args, 0, 0);
        return make_str(ascii_transform(s, name == "lower" ? ::tolower : ::toupper));
    }
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        check_arity(name, args, 0, 1);
        std::string_view chars = kWhitespace;
        if (!args.positional.empty() && !args.positional[0].is_none()) {
            chars = require_str(args.positional[0], fmt::format("{} arg", name));
        }
        return make_str(std::string(strip_chars(s, chars, name != "rstrip", name != "lstrip")));
    }
    if (name == "split") {
        check_arity(name, args, 0, 2);
        check_keywords(name, args, {"sep", "maxsplit"});
        const Value* maxsplit = arg_or_keyword(args, 1, "maxsplit");
        return make_list(split_string(s, arg_or_keyword(args, 0, "sep"),
                                      maxsplit ? require_int(*maxsplit, "maxsplit") : -1));
    }
    if (name == "join") {
        check_arity(name, args, 1, 1);
        std::string out;
        const auto items = iterate(args.positional[0]);
        for (std::size_t i = 0; i < items.size(); ++i) {
            const auto* part = as_str(items[i]);
            if (!part) {
                throw_type_error(fmt::format("sequence item {}: expected str instance, {} found",
                                             i, type_name(items[i])));
            }
            if (i > 0) {
                out += s;
            }
            out += *part;
        }
        return make_str(std::move(out));
    }
    if (name == "replace") {
        check_arity(name, args, 2, 3);
        const auto& from = require_str(args.positional[0], "replace() argument 1");
        const auto& to   = require_str(args.positional[1], "replace() argument 2");
        std::int64_t count = args.positional.size() > 2 ? require_int(args.positional[2], "count") : -1;
        if (from.empty()) {
            return make_str(s);
        }
        std::string out;
        std::size_t pos = 0;
        while (count != 0) {
            const auto next = s.find(from, pos);
            if (next == std::string::npos) {
                break;
            }
            out.append(s, pos, next - pos);
            out += to;
            pos = next + from.size();
            if (count > 0) {
                --count;
            }
        }
        out.append(s, pos);
        return make_str(std::move(out));
    }
    if (name == "startswith" || name == "endswith") {
        check_arity(name, args, 1, 1);
        return make_bool(affix_matches(s, args.positional[0], name == "startswith"));
    }
    if (name == "find") {
        check_arity(name, args, 1, 1);
        const auto pos = s.find(require_str(args.positional[0], "find() argument"));
        if (pos == std::string::npos) {
            return make_int(-1);
        }
        return make_int(static_cast<std::int64_t>(utf8_length(std::string_view(s).substr(0, pos))));
    }
    throw ScriptError(fmt::format("AttributeError: 'str' object has no attribute '{}'", name));
}

Value call_list_method(const ListPtr& list, std::string_view name, const CallArguments& args,
                       const InterpreterLimits& limits) {
    if (name == "append") {
        check_arity(name, args, 1, 1);
        check_length(list->items.size() + 1, limits);
        list->items.push_back(args.positional[0]);
        return make_none();
    }
    if (name == "extend") {
        check_arity(name, args, 1, 1);
        auto items = iterate(args.positional[0]);
        check_length(list->items.size() + items.size(), limits);
        list->items.insert(list->items.end(), std::make_move_iterator(items.begin()),
                           std::make_move_iterator(items.end()));
        return make_none();
    }
    if (name == "index") {
        check_arity(name, args, 1, 1);
        for (std::size_t i = 0; i < list->items.size(); ++i) {
            if (values_equal(list->items[i], args.positional[0])) {
                return make_int(static_cast<std::int64_t>(i));
            }
        }
        throw ScriptError(fmt::format("ValueError: {} is not in list", repr(args.positional[0])));
    }
    if (name == "count") {
        check_arity(name, args, 1, 1);
        return make_int(static_cast<std::int64_t>(std::count_if(
            list->items.begin(), list->items.end(),
            [&](const Value& v) { return values_equal(v, args.positional[0]); })));
    }
    if (name == "pop") {
        check_arity(name, args, 0, 1);
        if (list->items.empty()) {
            throw ScriptError("IndexError: pop from empty list");
        }
        const std::int64_t raw = args.positional.empty() ? -1 : require_int(args.positional[0], "pop index");
        const auto index = static_cast<std::size_t>(normalize_index(raw, list->items.size(), "pop"));
        Value out = list->items[index];
        list->items.erase(list->items.begin() + static_cast<std::ptrdiff_t>(index));
        return out;
    }
    throw ScriptError(fmt::format("AttributeError: 'list' object has no attribute '{}'", name));
}

Value call_dict_method(const DictPtr& dict, std::string_view name, const CallArguments& args) {
    if (name == "get") {
        check_arity(name, args, 1, 2);
        if (const Value* found = dict->find(args.positional[0])) {
            return *found;
        }
        return args.positional.size() > 1 ? args.positional[1] : make_none();
    }
    check_arity(name, args, 0, 0);
    std::vector<Value> out;
    out.reserve(dict->size());
    for (const auto& [key, value] : dict->items()) {
        if (name == "keys") {
            out.push_back(key);
        } else if (name == "values") {
            out.push_back(value);
        } else if (name == "items") {
            out.push_back(make_tuple({key, value}));
        } else {
            throw ScriptError(fmt::format("AttributeError: 'dict' object has no attribute '{}'", name));
        }
    }
    return make_list(std::move(out));
}

Value call_method(const Value& receiver, std::string_view name, const CallArguments& args,
                  const InterpreterLimits& limits) {
    if (!has_value_method(receiver, name)) {
        throw ScriptError(fmt::format("AttributeError: '{}' object has no attribute '{}'",
                                      type_name(receiver), name));
    }
    if (const auto* s = as_str(receiver)) {
        return call_str_method(*s, name, args);
    }
    if (const auto* l = as_list(receiver)) {
        return call_list_method(*l, name, args, limits);
    }
    return call_dict_method(*as_dict(receiver), name, args);
}

// ---------------------------------------------------------------------------
// 내장 함수
// ---------------------------------------------------------------------------
Value builtin_int(const CallArguments& args) {
    check_arity("int", args, 0, 1);
    if (args.positional.empty()) {
        return make_int(0);
    }
    const Value& v = args.positional[0];
    if (is_integral(v)) {
        return make_int(integral_of(v));
    }
    if (const auto* d = v.get_if<double>()) {
        if (!std::isfinite(*d)) {
            throw ScriptError(fmt::format("ValueError: cannot convert float {} to integer", format_float(*d)));
        }
        const double t = std::trunc(*d);
        if (t < -9.223372036854775808e18 || t >= 9.223372036854775808e18) { throw_overflow(); }
        return make_int(static_cast<std::int64_t>(t));
    }
    if (const auto* s = as_str(v)) {
        auto text = strip_chars(*s, kWhitespace, true, true);
        if (text.starts_with('+')) {
            text.remove_prefix(1);
        }
        std::string digits;
        for (const char c : text) {
            if (c != '_') { digits += c; }
        }
        std::int64_t out{};
        const auto* end = digits.data() + digits.size();
        const auto [ptr, ec] = std::from_chars(digits.data(), end, out);
        if (digits.empty() || ec == std::errc::invalid_argument || ptr != end) {
            throw ScriptError(fmt::format("ValueError: invalid literal for int() with base 10: {}", repr(v)));
        }
        if (ec == std::errc::result_out_of_range) { throw_overflow(); }
        return make_int(out);
    }
    throw_type_error(fmt::format("int() argument must be a string or a number, not '{}'", type_name(v)));
}

Value builtin_float(const CallArguments& args) {
    check_arity("float", args, 0, 1);
    if (args.positional.empty()) {
        return make_float(0.0);
    }
    const Value& v = args.positional[0];
    if (is_numeric(v)) {
        return make_float(double_of(v));
    }
    if (const auto* s = as_str(v)) {
        std::string text(strip_chars(*s, kWhitespace, true, true));
        std::string lowered = ascii_transform(text, ::tolower);
        bool negative = false;
        if (!lowered.empty() && (lowered[0] == '+' || lowered[0] == '-')) {
            negative = lowered[0] == '-';
            lowered.erase(0, 1);
        }
        if (lowered == "inf" || lowered == "infinity") {
            return make_float(negative ? -std::numeric_limits<double>::infinity()
                                       : std::numeric_limits<double>::infinity());
        }
        if (lowered == "nan") {
            return make_float(std::numeric_limits<double>::quiet_NaN());
        }
        if (!text.empty() && text[0] == '+') {
            text.erase(0, 1);
        }
        double out{};
        const auto* end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, out);
        if (text.empty() || ec != std::errc{} || ptr != end) {
            throw ScriptError(fmt::format("ValueError: could not convert string to float: {}", repr(v)));
        }
        return make_float(out);
    }
    throw_type_error(fmt::format("float() argument must be a string or a number, not '{}'", type_name(v)));
}

Value builtin_len(const CallArguments& args) {
    check_arity("len", args, 1, 1);
    const Value& v = args.positional[0];
    if (const auto* s = as_str(v))  { return make_int(static_cast<std::int64_t>(utf8_length(*s))); }
    if (const auto* l = as_list(v)) { return make_int(static_cast<std::int64_t>((*l)->items.size())); }
    if (const auto* d = as_dict(v)) { return make_int(static_cast<std::int64_t>((*d)->size())); }
    if (const auto* s = as_set(v))  { return make_int(static_cast<std::int64_t>((*s)->size())); }
    throw_type_error(fmt::format("object of type '{}' has no len()", type_name(v)));
}

Value builtin_dict(const CallArguments& args) {
    check_arity("dict", args, 0, 1);
    auto out = std::make_shared<Dict>();
    if (!args.positional.empty()) {
        const Value& source = args.positional[0];
        if (const auto* d = as_dict(source)) {
            for (const auto& [key, value] : (*d)->items()) {
                out->set(key, value);
            }
        } else {
            for (const auto& pair : iterate(source)) {
                const auto* l = as_list(pair);
                if (!l || (*l)->items.size() != 2) {
                    throw ScriptError("ValueError: dictionary update sequence element has wrong length");
                }
                out->set((*l)->items[0], (*l)->items[1]);
            }
        }
    }
    for (const auto& [key, value] : args.keywords) {
        out->set(make_str(key), value);
    }
    return Value{std::move(out)};
}

Value builtin_set(const CallArguments& args) {
    check_arity("set", args, 0, 1);
    auto out = std::make_shared<Set>();
    if (!args.positional.empty()) {
        for (auto& item : iterate(args.positional[0])) {
            out->add(std::move(item));
        }
    }
    return Value{std::move(out)};
}

Value builtin_sorted(const CallArguments& args) {
    check_arity("sorted", args, 1, 1);
    check_keywords("sorted", args, {"key", "reverse"});
    auto items = iterate(args.positional[0]);
    const auto keys = sort_keys(items, args.keyword("key"));
    const Value* reverse = args.keyword("reverse");
    const bool descending = reverse && truthy(*reverse);

    std::vector<std::size_t> order(items.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return descending ? compare_values(keys[b], keys[a]) < 0
                          : compare_values(keys[a], keys[b]) < 0;
    });

    std::vector<Value> out;
    out.reserve(items.size());
    for (const auto i : order) {
        out.push_back(std::move(items[i]));
    }
    return make_list(std::move(out));
}

Value builtin_reversed(const CallArguments& args) {
    check_arity("reversed", args, 1, 1);
    const Value& v = args.positional[0];
    if (!as_list(v) && !as_str(v)) {
        throw_type_error(fmt::format("'{}' object is not reversible", type_name(v)));
    }
    auto items = iterate(v);
    std::reverse(items.begin(), items.end());
    return make_list(std::move(items));
}

Value builtin_min_max(std::string_view name, const CallArguments& args, bool want_max) {
    check_keywords(name, args, {"key", "default"});
    if (args.positional.empty()) {
        throw_type_error(fmt::format("{} expected at least 1 argument, got 0", name));
    }
    auto items = args.positional.size() == 1 ? iterate(args.positional[0]) : args.positional;
    if (items.empty()) {
        if (const Value* fallback = args.keyword("default")) {
            return *fallback;
        }
        throw ScriptError(fmt::format("ValueError: {}() arg is an empty sequence", name));
    }
    const auto keys = sort_keys(items, args.keyword("key"));
    std::size_t best = 0;
    for (std::size_t i = 1; i < items.size(); ++i) {
        const int c = compare_values(keys[i], keys[best]);
        if (want_max ? c > 0 : c < 0) {
            best = i;
        }
    }
    return items[best];
}

Value builtin_sum(const CallArguments& args, const InterpreterLimits& limits) {
    check_arity("sum", args, 1, 2);
    check_keywords("sum", args, {"start"});
    const Value* start = arg_or_keyword(args, 1, "start");
    Value total = start ? *start : make_int(0);
    if (as_str(total)) {
        throw_type_error("sum() can't sum strings [use ''.join(seq) instead]");
    }
    for (const auto& item : iterate(args.positional[0])) {
        total = binary_op("+", total, item, limits);
    }
    return total;
}

Value builtin_range(const CallArguments& args, const InterpreterLimits& limits) {
    check_arity("range", args, 1, 3);
    std::int64_t start = 0;
    std::int64_t stop  = 0;
    std::int64_t step  = 1;
    if (args.positional.size() == 1) {
        stop = require_int(args.positional[0], "range() argument");
    } else {
        start = require_int(args.positional[0], "range() argument");
        stop  = require_int(args.positional[1], "range() argument");
        if (args.positional.size() == 3) {
            step = require_int(args.positional[2], "range() argument");
        }
    }
    if (step == 0) {
        throw ScriptError("ValueError: range() arg 3 must not be zero");
    }

    // 원소 개수 = ceil((stop - start) / step), 음수면 0
    const long double span = static_cast<long double>(stop) - static_cast<long double>(start);
    const long double count_ld = std::ceil(span / static_cast<long double>(step));
    const std::size_t count = count_ld > 0 ? static_cast<std::size_t>(
        std::min<long double>(count_ld, static_cast<long double>(limits.max_sequence_length) + 1)) : 0;
    check_length(count, limits);

    std::vector<Value> out;
    out.reserve(count);
    std::int64_t current = start;
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(make_int(current));
        if (i + 1 < count) {
            current += step;
        }
    }
    return make_list(std::move(out));
}

Value builtin_enumerate(const CallArguments& args) {
    check_arity("enumerate", args, 1, 2);
    check_keywords("enumerate", args, {"start"});
    const Value* start_arg = arg_or_keyword(args, 1, "start");
    std::int64_t index = start_arg ? require_int(*start_arg, "enumerate start") : 0;
    std::vector<Value> out;
    for (auto& item : iterate(args.positional[0])) {
        out.push_back(make_tuple({make_int(index), std::move(item)}));
        index = checked_add(index, 1);
    }
    return make_list(std::move(out));
}

Value builtin_zip(const CallArguments& args) {
    std::vector<std::vector<Value>> columns;
    columns.reserve(args.positional.size());
    std::size_t length = std::numeric_limits<std::size_t>::max();
    for (const auto& arg : args.positional) {
        columns.push_back(iterate(arg));
        length = std::min(length, columns.back().size());
    }
    if (columns.empty()) {
        return make_list();
    }
    std::vector<Value> out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        std::vector<Value> row;
        row.reserve(columns.size());
        for (auto& column : columns) {
            row.push_back(std::move(column[i]));
        }
        out.push_back(make_tuple(std::move(row)));
    }
    return make_list(std::move(out));
}

Value builtin_abs(const CallArguments& args) {
    check_arity("abs", args, 1, 1);
    const Value& v = args.positional[0];
    if (is_integral(v)) {
        const auto i = integral_of(v);
        if (i == std::numeric_limits<std::int64_t>::min()) { throw_overflow(); }
        return make_int(i < 0 ? -i : i);
    }
    if (const auto* d = v.get_if<double>()) {
        return make_float(std::fabs(*d));
    }
    throw_type_error(fmt::format("bad operand type for abs(): '{}'", type_name(v)));
}

Value builtin_round(const CallArguments& args) {
    check_arity("round", args, 1, 2);
    check_keywords("round", args, {"ndigits"});
    const Value& v = args.positional[0];
    const Value* ndigits = arg_or_keyword(args, 1, "ndigits");
    if (is_integral(v)) {
        return make_int(integral_of(v));
    }
    const auto* d = v.get_if<double>();
    if (!d) {
        throw_type_error(fmt::format("type {} doesn't define __round__ method", type_name(v)));
    }
    if (ndigits && !ndigits->is_none()) {
        if (!std::isfinite(*d)) {
            return make_float(*d);
        }
        const double scale = std::pow(10.0, static_cast<double>(require_int(*ndigits, "ndigits")));
        return make_float(std::nearbyint(*d * scale) / scale);
    }
    if (!std::isfinite(*d)) {
        throw ScriptError(fmt::format("ValueError: cannot convert float {} to integer", format_float(*d)));
    }
    const double r = std::nearbyint(*d);
    if (r < -9.223372036854775808e18 || r >= 9.223372036854775808e18) { throw_overflow(); }
    return make_int(static_cast<std::int64_t>(r));
}

Value call_builtin(std::string_view name, const CallArguments& args, const InterpreterLimits& limits) {
    if (name != "sorted" && name != "min" && name != "max" && name != "sum" &&
        name != "dict" && name != "enumerate" && name != "round" && !args.keywords.empty()) {
        throw_type_error(fmt::format("{}() takes no keyword arguments", name));
    }

    if (name == "len")       { return builtin_len(args); }
    if (name == "str") {
        check_arity(name, args, 0, 1);
        return make_str(args.positional.empty() ? std::string{} : to_str(args.positional[0]));
    }
    if (name == "int")       { return builtin_int(args); }
    if (name == "float")     { return builtin_float(args); }
    if (name == "bool") {
        check_arity(name, args, 0, 1);
        return make_bool(!args.positional.empty() && truthy(args.positional[0]));
    }
    if (name == "list") {
        check_arity(name, args, 0, 1);
        return make_list(args.positional.empty() ? std::vector<Value>{} : iterate(args.positional[0]));
    }
    if (name == "dict")      { return builtin_dict(args); }
    if (name == "set")       { return builtin_set(args); }
    if (name == "sorted")    { return builtin_sorted(args); }
    if (name == "reversed")  { return builtin_reversed(args); }
    if (name == "min")       { return builtin_min_max(name, args, false); }
    if (name == "max")       { return builtin_min_max(name, args, true); }
    if (name == "sum")       { return builtin_sum(args, limits); }
    if (name == "range")     { return builtin_range(args, limits); }
    if (name == "enumerate") { return builtin_enumerate(args); }
    if (name == "zip")       { return builtin_zip(args); }
    if (name == "any" || name == "all") {
        check_arity(name, args, 1, 1);
        const auto items = iterate(args.positional[0]);
        return make_bool(name == "any" ? std::any_of(items.begin(), items.end(), truthy)
                                       : std::all_of(items.begin(), items.end(), truthy));
    }
    if (name == "abs")       { return builtin_abs(args); }
    if (name == "round")     { return builtin_round(args); }
    throw ScriptError(fmt::format("NameError: name '{}' is not defined", name));
}

// ---------------------------------------------------------------------------
// BuiltinFunction / BoundMethod
//   내장 함수와 값 메서드를 일급 값으로 다룰 때 (key=len, f = s.lower) 사용.
// ---------------------------------------------------------------------------
class BuiltinFunction final : public HostObject {
public:
    BuiltinFunction(std::string name, InterpreterLimits limits)
        : name_(std::move(name)), limits_(limits) {}

    [[nodiscard]] Kind        host_kind() const noexcept override { return Kind::kCallable; }
    [[nodiscard]] std::string type_name() const override { return "builtin_function_or_method"; }
    [[nodiscard]] std::string repr() const override {
        return fmt::format("<built-in function {}>", name_);
    }

    Value call(const CallArguments& args) override {
        return call_builtin(name_, args, limits_);
    }

private:
    std::string       name_;
    InterpreterLimits limits_;
};

class BoundMethod final : public HostObject {
public:
    BoundMethod(Value receiver, std::string name, InterpreterLimits limits)
        : receiver_(std::move(receiver)), name_(std::move(name)), limits_(limits) {}

    [[nodiscard]] Kind        host_kind() const noexcept override { return Kind::kCallable; }
    [[nodiscard]] std::string type_name() const override { return "builtin_function_or_method"; }
    [[nodiscard]] std::string repr() const override {
        return fmt::format("<built-in method {} of {} object>", name_, ::type_name(receiver_));
    }

    Value call(const CallArguments& args) override {
        return call_method(receiver_, name_, args, limits_);
    }

private:
    Value             receiver_;
    std::string       name_;
    InterpreterLimits limits_;
};

// ---------------------------------------------------------------------------
// Evaluator
// ---------------------------------------------------------------------------
using Scope = std::unordered_map<std::string, Value>;

class Evaluator {
public:
    Evaluator(const SandboxBindings& bindings, const InterpreterLimits& limits)
        : bindings_(bindings), limits_(limits) {}

    Value run(const Program& program) {
        std::optional<Value> last;
        for (const auto& stmt : program.statements) {
            tick();
            if (stmt->kind == NodeKind::kExprStmt) {
                last = eval(*stmt->children[0]);
                continue;
            }
            if (exec(*stmt) != Flow::kNormal) {
                throw ScriptError("SyntaxError: 'break' or 'continue' outside loop");
            }
        }
        if (const auto it = locals_.find("result"); it != locals_.end()) {
            return it->second;
        }
        return last ? std::move(*last) : make_none();
    }

private:
    void tick() {
        if ((++steps_ & kDeadlineCheckMask) == 0 &&
            std::chrono::steady_clock::now() >= limits_.deadline) {
            throw DeadlineExceeded{};
        }
    }

    // ── 문장 ────────────────────────────────────────────────────────────
    Flow exec_block(const Node& block) {
        for (const auto& stmt : block.children) {
            tick();
            const Flow flow = exec(*stmt);
            if (flow != Flow::kNormal) {
                return flow;
            }
        }
        return Flow::kNormal;
    }

    Flow exec(const Node& stmt) {
        switch (stmt.kind) {
            case NodeKind::kImport:
                exec_import(stmt);
                return Flow::kNormal;
            case NodeKind::kImportFrom:
                exec_import_from(stmt);
                return Flow::kNormal;
            case NodeKind::kGlobal:
                throw ScriptError("SyntaxError: global declarations are not supported");
            case NodeKind::kAssign:
                assign(*stmt.children[0], eval(*stmt.children[1]));
                return Flow::kNormal;
            case NodeKind::kAugAssign:
                exec_aug_assign(stmt);
                return Flow::kNormal;
            case NodeKind::kIf:
                if (truthy(eval(*stmt.children[0]))) {
                    return exec_block(*stmt.children[1]);
                }
                if (stmt.children.size() > 2) {
                    return exec_block(*stmt.children[2]);
                }
                return Flow::kNormal;
            case NodeKind::kFor:
                return exec_for(stmt);
            case NodeKind::kWhile:
                while (truthy(eval(*stmt.children[0]))) {
                    tick();
                    if (exec_block(*stmt.children[1]) == Flow::kBreak) {
                        break;
                    }
                }
                return Flow::kNormal;
            case NodeKind::kBreak:
                return Flow::kBreak;
            case NodeKind::kContinue:
                return Flow::kContinue;
            case NodeKind::kPass:
                return Flow::kNormal;
            case NodeKind::kExprStmt:
                static_cast<void>(eval(*stmt.children[0]));
                return Flow::kNormal;
            case NodeKind::kBlock:
                return exec_block(stmt);
            default:
                throw ScriptError(fmt::format("SyntaxError: '{}' is not a statement",
                                              node_kind_name(stmt.kind)));
        }
    }

    Flow exec_for(const Node& stmt) {
        const auto items = iterate(eval(*stmt.children[1]));
        for (const auto& item : items) {
            tick();
            bind_target(*stmt.children[0], item, locals_);
            if (exec_block(*stmt.children[2]) == Flow::kBreak) {
                break;
            }
        }
        return Flow::kNormal;
    }

    void exec_aug_assign(const Node& stmt) {
        const Node& target = *stmt.children[0];
        Value current = eval(target);
        Value operand = eval(*stmt.children[1]);

        // list += iterable 은 제자리 확장 (같은 리스트를 공유하는 참조에도 보인다)
        if (stmt.text == "+") {
            if (const auto* l = as_list(current); l && !(*l)->tuple && as_list(operand)) {
                auto items = iterate(operand);
                check_length((*l)->items.size() + items.size(), limits_);
                (*l)->items.insert((*l)->items.end(), items.begin(), items.end());
                return;
            }
        }
        assign(target, binary_op(stmt.text, current, operand, limits_));
    }

    Value resolve_module(const std::string& path) {
        const auto dot = path.find('.');
        const std::string root = path.substr(0, dot);
        const auto it = bindings_.modules.find(root);
        if (it == bindings_.modules.end()) {
            throw ScriptError(fmt::format("ModuleNotFoundError: No module named '{}'", root));
        }
        Value current = it->second;
        std::size_t pos = dot;
        while (pos != std::string::npos) {
            const auto next = path.find('.', pos + 1);
            const auto part = path.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1);
            current = get_attribute(current, part);
            pos = next;
        }
        return current;
    }

    void exec_import(const Node& stmt) {
        const Value module = resolve_module(stmt.text);
        if (!stmt.alias.empty()) {
            locals_[stmt.alias] = module;
            return;
        }
        const std::string root = stmt.text.substr(0, stmt.text.find('.'));
        locals_[root] = bindings_.modules.at(root);
    }

    void exec_import_from(const Node& stmt) {
        const Value module = resolve_module(stmt.text);
        locals_[stmt.alias.empty() ? stmt.member : stmt.alias] = get_attribute(module, stmt.member);
    }

    void bind_target(const Node& target, const Value& value, Scope& scope) {
        if (target.kind == NodeKind::kName) {
            scope[target.text] = value;
            return;
        }
        if (target.kind == NodeKind::kTuple || target.kind == NodeKind::kList) {
            const auto items = iterate(value);
            if (items.size() != target.children.size()) {
                throw ScriptError(fmt::format(
                    "ValueError: {} values to unpack (expected {}, got {})",
                    items.size() < target.children.size() ? "not enough" : "too many",
                    target.children.size(), items.size()));
            }
            for (std::size_t i = 0; i < items.size(); ++i) {
                bind_target(*target.children[i], items[i], scope);
            }
            return;
        }
        throw ScriptError(fmt::format("SyntaxError: cannot assign to {}", node_kind_name(target.kind)));
    }

    void assign(const Node& target, Value value) {
        switch (target.kind) {
            case NodeKind::kName:
                locals_[target.text] = std::move(value);
                return;
            case NodeKind::kSubscript: {
                const Value container = eval(*target.children[0]);
                const Node& index_node = *target.children[1];
                if (index_node.kind == NodeKind::kSlice) {
                    throw_type_error("slice assignment is not supported");
                }
                const Value index = eval(index_node);
                if (const auto* l = as_list(container); l && !(*l)->tuple) {
                    const auto i = normalize_index(require_int(index, "list indices"),
                                                   (*l)->items.size(), "list assignment");
                    (*l)->items[static_cast<std::size_t>(i)] = std::move(value);
                    return;
                }
                if (const auto* d = as_dict(container)) {
                    (*d)->set(index, std::move(value));
                    return;
                }
                throw_type_error(fmt::format("'{}' object does not support item assignment",
                                             type_name(container)));
            }
            case NodeKind::kAttribute:
                throw ScriptError("AttributeError: attribute assignment is not supported");
            default:
                throw ScriptError(fmt::format("SyntaxError: cannot assign to {}",
                                              node_kind_name(target.kind)));
        }
    }

    // ── 식 ──────────────────────────────────────────────────────────────
    Value eval(const Node& expr) {
        tick();
        switch (expr.kind) {
            case NodeKind::kName:
                return lookup(expr.text);
            case NodeKind::kLiteral:
                return literal_value(expr.literal);
            case NodeKind::kList:
            case NodeKind::kTuple: {
                std::vector<Value> items;
                items.reserve(expr.children.size());
                for (const auto& child : expr.children) {
                    items.push_back(eval(*child));
                }
                return expr.kind == NodeKind::kTuple ? make_tuple(std::move(items))
                                                     : make_list(std::move(items));
            }
            case NodeKind::kDict: {
                auto dict = std::make_shared<Dict>();
                for (std::size_t i = 0; i + 1 < expr.children.size(); i += 2) {
                    Value key = eval(*expr.children[i]);
                    dict->set(std::move(key), eval(*expr.children[i + 1]));
                }
                return Value{std::move(dict)};
            }
            case NodeKind::kListComp:
                return eval_list_comp(expr);
            case NodeKind::kDictComp:
                return eval_dict_comp(expr);
            case NodeKind::kBinaryOp: {
                Value lhs = eval(*expr.children[0]);
                return binary_op(expr.text, lhs, eval(*expr.children[1]), limits_);
            }
            case NodeKind::kUnaryOp:
                return eval_unary(expr);
            case NodeKind::kBoolOp: {
                Value lhs = eval(*expr.children[0]);
                const bool lhs_true = truthy(lhs);
                if (expr.text == "and" ? !lhs_true : lhs_true) {
                    return lhs;
                }
                return eval(*expr.children[1]);
            }
            case NodeKind::kCompare: {
                Value lhs = eval(*expr.children[0]);
                return make_bool(compare_op(expr.text, lhs, eval(*expr.children[1])));
            }
            case NodeKind::kIfExp:
                return truthy(eval(*expr.children[0])) ? eval(*expr.children[1])
                                                       : eval(*expr.children[2]);
            case NodeKind::kAttribute:
                return get_attribute(eval(*expr.children[0]), expr.text);
            case NodeKind::kCall:
                return eval_call(expr);
            case NodeKind::kSubscript:
                return eval_subscript(expr);
            case NodeKind::kLambda:
                throw ScriptError("SyntaxError: lambda is not supported in the sandbox");
            default:
                throw ScriptError(fmt::format("SyntaxError: '{}' is not an expression",
                                              node_kind_name(expr.kind)));
        }
    }

    static Value literal_value(const Literal& literal) {
        return std::visit([](const auto& x) -> Value {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return make_none();
            } else {
                return Value{x};
            }
        }, literal);
    }

    Value eval_unary(const Node& expr) {
        Value operand = eval(*expr.children[0]);
        if (expr.text == "not") {
            return make_bool(!truthy(operand));
        }
        if (is_integral(operand)) {
            const auto i = integral_of(operand);
            return make_int(expr.text == "-" ? checked_sub(0, i) : i);
        }
        if (const auto* d = operand.get_if<double>()) {
            return make_float(expr.text == "-" ? -*d : *d);
        }
        throw_type_error(fmt::format("bad operand type for unary {}: '{}'", expr.text, type_name(operand)));
    }

    [[nodiscard]] const Value* find_name(const std::string& name) const {
        for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
            if (const auto found = it->find(name); found != it->end()) {
                return &found->second;
            }
        }
        if (const auto found = locals_.find(name); found != locals_.end()) {
            return &found->second;
        }
        if (const auto found = bindings_.names.find(name); found != bindings_.names.end()) {
            return &found->second;
        }
        return nullptr;
    }

    Value lookup(const std::string& name) {
        if (const Value* found = find_name(name)) {
            return *found;
        }
        if (bindings_.builtins.contains(name)) {
            return make_host(std::make_shared<BuiltinFunction>(name, limits_));
        }
        throw ScriptError(fmt::format("NameError: name '{}' is not defined", name));
    }

    Value get_attribute(const Value& object, const std::string& name) {
        if (const auto* host = object.get_if<HostPtr>()) {
            return (*host)->get_attribute(name);
        }
        if (const auto* record = object.get_if<RecordPtr>()) {
            if (const Value* field = (*record)->field(name)) {
                return *field;
            }
        } else if (has_value_method(object, name)) {
            return make_host(std::make_shared<BoundMethod>(object, name, limits_));
        }
        throw ScriptError(fmt::format("AttributeError: '{}' object has no attribute '{}'",
                                      type_name(object), name));
    }

    CallArguments eval_arguments(const Node& call) {
        CallArguments args;
        for (std::size_t i = 1; i < call.children.size(); ++i) {
            const Node& arg = *call.children[i];
            if (arg.kind == NodeKind::kKeyword) {
                args.keywords.emplace_back(arg.text, eval(*arg.children[0]));
            } else {
                args.positional.push_back(eval(arg));
            }
        }
        return args;
    }

    Value eval_call(const Node& call) {
        const Node& callee = *call.children[0];

        if (callee.kind == NodeKind::kName && !find_name(callee.text) &&
            bindings_.builtins.contains(callee.text)) {
            return call_builtin(callee.text, eval_arguments(call), limits_);
        }

        if (callee.kind == NodeKind::kAttribute) {
            const Value object = eval(*callee.children[0]);
            if (!object.is<HostPtr>() && !object.is<RecordPtr>() &&
                has_value_method(object, callee.text)) {
                return call_method(object, callee.text, eval_arguments(call), limits_);
            }
            const Value function = get_attribute(object, callee.text);
            return call_value(function, eval_arguments(call));
        }

        const Value function = eval(callee);
        return call_value(function, eval_arguments(call));
    }

    Value eval_subscript(const Node& expr) {
        const Value container = eval(*expr.children[0]);
        const Node& index_node = *expr.children[1];

        if (index_node.kind == NodeKind::kSlice) {
            const Value lower = eval(*index_node.children[0]);
            const Value upper = eval(*index_node.children[1]);
            if (const auto* s = as_str(container)) {
                const auto chars = utf8_split(*s);
                const auto [lo, hi] = slice_bounds(lower, upper, chars.size());
                std::string out;
                for (std::size_t i = lo; i < hi; ++i) {
                    out += chars[i];
                }
                return make_str(std::move(out));
            }
            if (const auto* l = as_list(container)) {
                const auto [lo, hi] = slice_bounds(lower, upper, (*l)->items.size());
                std::vector<Value> out((*l)->items.begin() + static_cast<std::ptrdiff_t>(lo),
                                       (*l)->items.begin() + static_cast<std::ptrdiff_t>(hi));
                return (*l)->tuple ? make_tuple(std::move(out)) : make_list(std::move(out));
            }
            throw_type_error(fmt::format("'{}' object is not subscriptable", type_name(container)));
        }

        const Value index = eval(index_node);
        if (const auto* l = as_list(container)) {
            const auto i = normalize_index(require_int(index, "list indices"), (*l)->items.size(),
                                           (*l)->tuple ? "tuple" : "list");
            return (*l)->items[static_cast<std::size_t>(i)];
        }
        if (const auto* s = as_str(container)) {
            const auto chars = utf8_split(*s);
            const auto i = normalize_index(require_int(index, "string indices"), chars.size(), "string");
            return make_str(chars[static_cast<std::size_t>(i)]);
        }
        if (const auto* d = as_dict(container)) {
            if (const Value* found = (*d)->find(index)) {
                return *found;
            }
            throw ScriptError(fmt::format("KeyError: {}", repr(index)));
        }
        throw_type_error(fmt::format("'{}' object is not subscriptable", type_name(container)));
    }

    // 컴프리헨션: [elem, target, iterable, cond...] / [key, value, target, iterable, cond...]
    class ScopeGuard {
    public:
        explicit ScopeGuard(std::vector<Scope>& scopes) : scopes_(scopes) { scopes_.emplace_back(); }
        ~ScopeGuard() { scopes_.pop_back(); }
        ScopeGuard(const ScopeGuard&)            = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

    private:
        std::vector<Scope>& scopes_;
    };

    bool conditions_hold(const Node& comp, std::size_t first_condition) {
        for (std::size_t i = first_condition; i < comp.children.size(); ++i) {
            if (!truthy(eval(*comp.children[i]))) {
                return false;
            }
        }
        return true;
    }

    Value eval_list_comp(const Node& comp) {
        const auto items = iterate(eval(*comp.children[2]));
        ScopeGuard guard{scopes_};
        std::vector<Value> out;
        for (const auto& item : items) {
            tick();
            bind_target(*comp.children[1], item, scopes_.back());
            if (conditions_hold(comp, 3)) {
                check_length(out.size() + 1, limits_);
                out.push_back(eval(*comp.children[0]));
            }
        }
        return make_list(std::move(out));
    }

    Value eval_dict_comp(const Node& comp) {
        const auto items = iterate(eval(*comp.children[3]));
        ScopeGuard guard{scopes_};
        auto dict = std::make_shared<Dict>();
        for (const auto& item : items) {
            tick();
            bind_target(*comp.children[2], item, scopes_.back());
            if (conditions_hold(comp, 4)) {
                Value key = eval(*comp.children[0]);
                dict->set(std::move(key), eval(*comp.children[1]));
            }
        }
        return Value{std::move(dict)};
    }

    const SandboxBindings& bindings_;
    InterpreterLimits      limits_;
    Scope                  locals_;
    std::vector<Scope>     scopes_;
    std::uint64_t          steps_{0};
};

}  // namespace

// ---------------------------------------------------------------------------
// Interpreter
// ---------------------------------------------------------------------------
Interpreter::Interpreter(const SandboxBindings& bindings, InterpreterLimits limits)
    : bindings_(bindings)
    , limits_(limits)
{}

std::expected<Value, ScriptFailure> Interpreter::run(const Program& program) {
    try {
        Evaluator evaluator{bindings_, limits_};
        return evaluator.run(program);
    } catch (const DeadlineExceeded&) {
        return std::unexpected(ScriptFailure{true, "execution deadline exceeded"});
    } catch (const std::bad_alloc&) {
        return std::unexpected(ScriptFailure{false, "MemoryError: out of memory"});
    } catch (const std::exception& e) {
        // ScriptError 와 HostObject 가 던진 예외 (API 오류 등)
        return std::unexpected(ScriptFailure{false, e.what()});
    }
}
