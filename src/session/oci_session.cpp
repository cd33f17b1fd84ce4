#include "session/oci_session.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace {

constexpr std::string_view kDefaultSection = "DEFAULT";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
        s.remove_suffix(1);
    }
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string expand_user(const std::string& path) {
    if (path.empty() || path.front() != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home || *home == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

using Sections = std::map<std::string, std::map<std::string, std::string>>;

// parse_ini: 섹션 → (키 → 값). 섹션 밖의 키/중복 섹션은 오류
std::expected<Sections, std::string> parse_ini(std::string_view text) {
    Sections sections;
    std::map<std::string, std::string>* current = nullptr;
    std::size_t line_no = 0;

    std::size_t pos = 0;
    while (pos <= text.size()) {
        const auto eol = text.find('\n', pos);
        const auto raw = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = eol == std::string_view::npos ? text.size() + 1 : eol + 1;
        ++line_no;

        const auto line = trim(raw);
        if (line.empty() || line.front() == '#' || line.front() == ';') {
            continue;
        }
        if (line.front() == '[') {
            if (line.back() != ']') {
                return std::unexpected(fmt::format("line {}: malformed section header", line_no));
            }
            const std::string name{trim(line.substr(1, line.size() - 2))};
            if (name.empty()) {
                return std::unexpected(fmt::format("line {}: empty section name", line_no));
            }
            auto [it, inserted] = sections.try_emplace(name);
            if (!inserted) {
                return std::unexpected(fmt::format("line {}: duplicate section '{}'", line_no, name));
            }
            current = &it->second;
            continue;
        }

        const auto sep = line.find_first_of("=:");
        if (sep == std::string_view::npos) {
            return std::unexpected(fmt::format("line {}: expected 'key=value'", line_no));
        }
        if (!current) {
            return std::unexpected(fmt::format("line {}: key outside of a section", line_no));
        }
        const auto key = to_lower(trim(line.substr(0, sep)));
        if (key.empty()) {
            return std::unexpected(fmt::format("line {}: empty key", line_no));
        }
        current->insert_or_assign(key, std::string(trim(line.substr(sep + 1))));
    }
    return sections;
}

}  // namespace

// ---------------------------------------------------------------------------
// OciProfile
// ---------------------------------------------------------------------------
std::optional<std::string> OciProfile::get(std::string_view key) const {
    const auto it = values.find(std::string(key));
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

Value OciProfile::to_value() const {
    Value out = make_dict();
    auto& dict = **out.get_if<DictPtr>();
    for (const auto& [key, value] : values) {
        dict.set(make_str(key), make_str(value));
    }
    return out;
}

// ---------------------------------------------------------------------------
// OciSession
// ---------------------------------------------------------------------------
OciSession::OciSession(std::filesystem::path          config_file,
                       std::string                    profile,
                       std::shared_ptr<ClientFactory> factory)
    : config_file_(std::move(config_file))
    , profile_name_(std::move(profile))
    , factory_(std::move(factory))
{}

// static
std::expected<OciProfile, std::string>
OciSession::parse_profile(std::string_view ini_text, std::string_view profile) {
    auto sections = parse_ini(ini_text);
    if (!sections) {
        return std::unexpected(sections.error());
    }

    const auto defaults = sections->find(std::string(kDefaultSection));
    const auto selected = sections->find(std::string(profile));
    if (selected == sections->end()) {
        return std::unexpected(fmt::format("profile '{}' not found", profile));
    }

    OciProfile out{};
    out.name = std::string(profile);
    if (defaults != sections->end()) {
        out.values = defaults->second;
    }
    for (const auto& [key, value] : selected->second) {
        out.values.insert_or_assign(key, value);
    }

    std::vector<std::string_view> missing;
    for (const auto key : kRequiredProfileKeys) {
        const auto it = out.values.find(std::string(key));
        if (it == out.values.end() || it->second.empty()) {
            missing.push_back(key);
        }
    }
    if (!missing.empty()) {
        return std::unexpected(fmt::format("profile '{}' is missing required keys: {}",
                                           profile, fmt::join(missing, ", ")));
    }

    out.values["key_file"] = expand_user(out.values["key_file"]);
    return out;
}

std::expected<void, std::string> OciSession::load() {
    std::lock_guard lock{reload_mutex_};
    return load_locked();
}

std::expected<bool, std::string> OciSession::refresh() {
    std::lock_guard lock{reload_mutex_};

    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(config_file_, ec);
    if (ec) {
        const auto message = fmt::format("oci_session: cannot stat '{}': {}",
                                         config_file_.string(), ec.message());
        spdlog::warn("{} (keeping previous profile)", message);
        return std::unexpected(message);
    }
    if (seen_mtime_ && *seen_mtime_ == mtime) {
        return false;
    }

    auto loaded = load_locked();
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    return true;
}

std::expected<void, std::string> OciSession::load_locked() {
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(config_file_, ec);

    std::ifstream in{config_file_};
    if (ec || !in) {
        const auto message = fmt::format("oci_session: cannot read config file '{}'",
                                         config_file_.string());
        spdlog::error("{}", message);
        return std::unexpected(message);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    // 실패한 내용도 다시 읽지 않도록 시도한 시점의 mtime 을 기록한다
    seen_mtime_ = mtime;

    auto parsed = parse_profile(buf.str(), profile_name_);
    if (!parsed) {
        const auto message = fmt::format("oci_session: '{}': {}", config_file_.string(), parsed.error());
        spdlog::error("{}", message);
        return std::unexpected(message);
    }

    profile_.store(std::make_shared<const OciProfile>(std::move(*parsed)), std::memory_order_release);
    spdlog::info("oci_session: profile '{}' loaded from '{}' (region={})",
                 profile_name_, config_file_.string(),
                 snapshot()->get("region").value_or(""));
    return {};
}
