#include "sandbox/value_codec.hpp"

#include <algorithm>
#include <bit>
#include <memory>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

// ---------------------------------------------------------------------------
// ValueCodec: 구현
//
// 인코더는 현재 경로의 컨테이너 주소를 스택으로 유지한다 (순환 검출).
// 디코더는 모든 읽기에서 남은 바이트 수를 확인한다.
// ---------------------------------------------------------------------------

namespace {

enum class Tag : std::uint8_t {
    kNone   = 0,
    kBool   = 1,
    kInt    = 2,
    kFloat  = 3,
    kString = 4,
    kList   = 5,
    kDict   = 6,
    kSet    = 7,
    kRecord = 8,
    kOpaque = 9,
};

constexpr std::string_view kTruncatedKey = "__truncated__";

// ---------------------------------------------------------------------------
// Encoder
// ---------------------------------------------------------------------------
struct TooLarge {};

class Encoder {
public:
    Encoder(std::size_t max_bytes, std::size_t max_depth)
        : max_bytes_(max_bytes), max_depth_(max_depth) {}

    auto take() -> std::string { return std::move(out_); }

    void value(const Value& v, std::size_t depth) {
        std::visit([&](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                tag(Tag::kNone);
            } else if constexpr (std::is_same_v<T, bool>) {
                tag(Tag::kBool);
                u8(x ? 1 : 0);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                tag(Tag::kInt);
                u64(static_cast<std::uint64_t>(x));
            } else if constexpr (std::is_same_v<T, double>) {
                tag(Tag::kFloat);
                u64(std::bit_cast<std::uint64_t>(x));
            } else if constexpr (std::is_same_v<T, std::string>) {
                tag(Tag::kString);
                str(x);
            } else if constexpr (std::is_same_v<T, ListPtr>) {
                if (!enter(x.get(), depth)) { return; }
                tag(Tag::kList);
                u8(x->tuple ? 1 : 0);
                u32(x->items.size());
                for (const auto& item : x->items) {
                    value(item, depth + 1);
                }
                leave();
            } else if constexpr (std::is_same_v<T, DictPtr>) {
                if (!enter(x.get(), depth)) { return; }
                tag(Tag::kDict);
                u32(x->size());
                for (const auto& [key, item] : x->items()) {
                    value(key, depth + 1);
                    value(item, depth + 1);
                }
                leave();
            } else if constexpr (std::is_same_v<T, SetPtr>) {
                if (!enter(x.get(), depth)) { return; }
                tag(Tag::kSet);
                u32(x->size());
                for (const auto& item : x->items()) {
                    value(item, depth + 1);
                }
                leave();
            } else if constexpr (std::is_same_v<T, RecordPtr>) {
                if (!enter(x.get(), depth)) { return; }
                tag(Tag::kRecord);
                str(x->type_name);
                u32(x->fields.size());
                for (const auto& [name, item] : x->fields) {
                    str(name);
                    value(item, depth + 1);
                }
                leave();
            } else if constexpr (std::is_same_v<T, HostPtr>) {
                tag(Tag::kOpaque);
                str(x->type_name());
                str(x->repr());
            }
        }, v.data);
    }

private:
    // 순환/깊이 초과 시 marker 를 쓰고 false
    auto enter(const void* p, std::size_t depth) -> bool {
        const char* reason = nullptr;
        if (depth >= max_depth_) {
            reason = "max_depth";
        } else if (std::find(path_.begin(), path_.end(), p) != path_.end()) {
            reason = "cycle";
        }
        if (reason) {
            tag(Tag::kDict);
            u32(1);
            tag(Tag::kString);
            str(kTruncatedKey);
            tag(Tag::kString);
            str(reason);
            return false;
        }
        path_.push_back(p);
        return true;
    }

    void leave() { path_.pop_back(); }

    void reserve(std::size_t n) {
        if (out_.size() + n > max_bytes_) {
            throw TooLarge{};
        }
    }

    void tag(Tag t) { u8(static_cast<std::uint8_t>(t)); }

    void u8(std::uint8_t v) {
        reserve(1);
        out_.push_back(static_cast<char>(v));
    }

    void u32(std::size_t v) {
        reserve(4);
        const auto n = static_cast<std::uint32_t>(v);
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<char>((n >> (8U * static_cast<unsigned>(i))) & 0xFFU));
        }
    }

    void u64(std::uint64_t v) {
        reserve(8);
        for (int i = 0; i < 8; ++i) {
            out_.push_back(static_cast<char>((v >> (8U * static_cast<unsigned>(i))) & 0xFFU));
        }
    }

    void str(std::string_view s) {
        u32(s.size());
        reserve(s.size());
        out_.append(s);
    }

    std::size_t              max_bytes_;
    std::size_t              max_depth_;
    std::string              out_;
    std::vector<const void*> path_;
};

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------
struct Malformed {
    std::string message;
};

class Decoder {
public:
    Decoder(std::string_view bytes, std::size_t max_depth)
        : bytes_(bytes), max_depth_(max_depth) {}

    auto at_end() const noexcept -> bool { return pos_ == bytes_.size(); }
    auto position() const noexcept -> std::size_t { return pos_; }

    auto value(std::size_t depth) -> Value {
        if (depth > max_depth_) {
            throw Malformed{"nesting too deep"};
        }
        const auto t = static_cast<Tag>(u8());
        switch (t) {
            case Tag::kNone:
                return make_none();
            case Tag::kBool:
                return make_bool(u8() != 0);
            case Tag::kInt:
                return make_int(static_cast<std::int64_t>(u64()));
            case Tag::kFloat:
                return make_float(std::bit_cast<double>(u64()));
            case Tag::kString:
                return make_str(str());
            case Tag::kList: {
                const bool tuple = u8() != 0;
                const auto count = count_field(1);
                std::vector<Value> items;
                items.reserve(count);
                for (std::uint32_t i = 0; i < count; ++i) {
                    items.push_back(value(depth + 1));
                }
                return tuple ? make_tuple(std::move(items)) : make_list(std::move(items));
            }
            case Tag::kDict: {
                const auto count = count_field(2);
                auto dict = std::make_shared<Dict>();
                for (std::uint32_t i = 0; i < count; ++i) {
                    Value key = value(depth + 1);
                    Value item = value(depth + 1);
                    dict->set(std::move(key), std::move(item));
                }
                return Value{std::move(dict)};
            }
            case Tag::kSet: {
                const auto count = count_field(1);
                auto set = std::make_shared<Set>();
                for (std::uint32_t i = 0; i < count; ++i) {
                    set->add(value(depth + 1));
                }
                return Value{std::move(set)};
            }
            case Tag::kRecord: {
                std::string type = str();
                const auto count = count_field(5);
                std::vector<std::pair<std::string, Value>> fields;
                fields.reserve(count);
                for (std::uint32_t i = 0; i < count; ++i) {
                    std::string name = str();
                    fields.emplace_back(std::move(name), value(depth + 1));
                }
                return make_record(std::move(type), std::move(fields));
            }
            case Tag::kOpaque: {
                std::string type = str();
                std::string text = str();
                return make_host(std::make_shared<OpaqueObject>(std::move(type), std::move(text)));
            }
        }
        throw Malformed{fmt::format("unknown tag {} at offset {}", static_cast<unsigned>(t), pos_ - 1)};
    }

private:
    void need(std::size_t n) const {
        if (bytes_.size() - pos_ < n) {
            throw Malformed{fmt::format("truncated at offset {}", pos_)};
        }
    }

    auto u8() -> std::uint8_t {
        need(1);
        return static_cast<std::uint8_t>(bytes_[pos_++]);
    }

    auto u32() -> std::uint32_t {
        need(4);
        std::uint32_t v = 0;
        for (unsigned i = 0; i < 4; ++i) {
            v |= static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes_[pos_++])) << (8U * i);
        }
        return v;
    }

    auto u64() -> std::uint64_t {
        need(8);
        std::uint64_t v = 0;
        for (unsigned i = 0; i < 8; ++i) {
            v |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(bytes_[pos_++])) << (8U * i);
        }
        return v;
    }

    // 원소 하나가 최소 min_element_bytes 를 차지하므로 그 이상은 거짓 길이다.
    auto count_field(std::size_t min_element_bytes) -> std::uint32_t {
        const auto count = u32();
        if (static_cast<std::size_t>(count) * min_element_bytes > bytes_.size() - pos_) {
            throw Malformed{fmt::format("element count {} exceeds remaining bytes at offset {}",
                                        count, pos_)};
        }
        return count;
    }

    auto str() -> std::string {
        const auto len = u32();
        need(len);
        std::string out(bytes_.substr(pos_, len));
        pos_ += len;
        return out;
    }

    std::string_view bytes_;
    std::size_t      max_depth_;
    std::size_t      pos_{0};
};

}  // namespace

// static
auto ValueCodec::encode(const Value& value, std::size_t max_bytes, std::size_t max_depth)
    -> std::expected<std::string, EncodeError>
{
    Encoder encoder{max_bytes, max_depth};
    try {
        encoder.value(value, 0);
    } catch (const TooLarge&) {
        return std::unexpected(EncodeError::kTooLarge);
    }
    return encoder.take();
}

// static
auto ValueCodec::decode(std::string_view bytes, std::size_t max_depth)
    -> std::expected<Value, std::string>
{
    Decoder decoder{bytes, max_depth};
    try {
        Value out = decoder.value(0);
        if (!decoder.at_end()) {
            return std::unexpected(fmt::format("{} trailing bytes after value",
                                               bytes.size() - decoder.position()));
        }
        return out;
    } catch (const Malformed& e) {
        return std::unexpected(e.message);
    } catch (const ScriptError& e) {
        // 잘못된 dict 키 (unhashable) 등
        return std::unexpected(std::string(e.what()));
    }
}
