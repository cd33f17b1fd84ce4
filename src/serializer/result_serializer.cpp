#include "serializer/result_serializer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

struct BudgetExceeded {};

// ---------------------------------------------------------------------------
// Walker
//   path_ 는 현재 경로의 컨테이너 주소 (순환 검출용).
//   같은 컨테이너가 형제 위치에 여러 번 나타나는 것은 순환이 아니다.
// ---------------------------------------------------------------------------
class Walker {
public:
    explicit Walker(const SerializerLimits& limits) : limits_(limits) {}

    JsonValue walk(const Value& v, std::size_t depth) {
        count();
        return std::visit([&](const auto& x) -> JsonValue {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return JsonValue::null();
            } else if constexpr (std::is_same_v<T, bool>) {
                return JsonValue::boolean(x);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return JsonValue::integer(x);
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(x)) {
                    return JsonValue::string(format_float(x));
                }
                return JsonValue::number(x);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return JsonValue::string(sanitize_utf8(x));
            } else if constexpr (std::is_same_v<T, ListPtr>) {
                return container(x.get(), depth, [&](JsonValue& out) {
                    out = JsonValue::array();
                    for (const auto& item : x->items) {
                        out.push_back(walk(item, depth + 1));
                    }
                });
            } else if constexpr (std::is_same_v<T, SetPtr>) {
                return container(x.get(), depth, [&](JsonValue& out) {
                    out = JsonValue::array();
                    for (const auto& item : x->items()) {
                        out.push_back(walk(item, depth + 1));
                    }
                });
            } else if constexpr (std::is_same_v<T, DictPtr>) {
                return container(x.get(), depth, [&](JsonValue& out) {
                    out = JsonValue::object();
                    for (const auto& [key, item] : x->items()) {
                        out.set(key_string(key), walk(item, depth + 1));
                    }
                });
            } else if constexpr (std::is_same_v<T, RecordPtr>) {
                return container(x.get(), depth, [&](JsonValue& out) {
                    out = JsonValue::object();
                    for (const auto& [name, item] : x->fields) {
                        out.set(sanitize_utf8(name), walk(item, depth + 1));
                    }
                });
            } else {
                return JsonValue::string(sanitize_utf8(x->repr()));
            }
        }, v.data);
    }

private:
    template <typename Fill>
    JsonValue container(const void* p, std::size_t depth, Fill&& fill) {
        if (depth >= limits_.max_depth) {
            return truncated("max_depth");
        }
        if (std::find(path_.begin(), path_.end(), p) != path_.end()) {
            return truncated("cycle");
        }
        path_.push_back(p);
        JsonValue out;
        fill(out);
        path_.pop_back();
        return out;
    }

    JsonValue truncated(std::string_view reason) {
        count();
        JsonValue out = JsonValue::object();
        out.set(std::string(ResultSerializer::kTruncatedKey), JsonValue::string(std::string(reason)));
        return out;
    }

    static std::string key_string(const Value& key) {
        if (const auto* s = key.get_if<std::string>()) {
            return sanitize_utf8(*s);
        }
        return sanitize_utf8(to_str(key));
    }

    void count() {
        if (++nodes_ > limits_.max_nodes) {
            throw BudgetExceeded{};
        }
    }

    const SerializerLimits&  limits_;
    std::vector<const void*> path_;
    std::size_t              nodes_{0};
};

}  // namespace

ResultSerializer::ResultSerializer(SerializerLimits limits)
    : limits_(limits)
{}

std::expected<JsonValue, SerializeError> ResultSerializer::serialize(const Value& value) const {
    Walker walker{limits_};
    try {
        return walker.walk(value, 0);
    } catch (const BudgetExceeded&) {
        return std::unexpected(SerializeError{
            SerializeErrorCode::kNodeBudgetExceeded,
            fmt::format("result has more than {} nodes", limits_.max_nodes),
        });
    }
}
