#pragma once

// ---------------------------------------------------------------------------
// oci_session.hpp
//
// OCI 설정 파일(INI) 기반 세션. main 에서 한 번 만들고 shared_ptr 로
// QueryService 에 주입한다 (전역 싱글톤 없음).
//
// [설정 파일]
//   [DEFAULT]
//   user=ocid1.user.oc1..aaa
//   fingerprint=12:34:...
//   key_file=~/.oci/oci_api_key.pem
//   tenancy=ocid1.tenancy.oc1..bbb
//   region=us-ashburn-1
//
//   [ADMIN]
//   user=ocid1.user.oc1..ccc      # 나머지 키는 DEFAULT 에서 상속
//
//   - '#' 또는 ';' 로 시작하는 줄은 주석이다.
//   - 키는 소문자로 정규화한다. 값의 앞뒤 공백은 제거한다.
//   - key_file 의 선행 '~' 는 $HOME 으로 확장한다.
//   - 필수 키: user, fingerprint, key_file, tenancy, region
//
// [수명 주기]
//   load()    : 최초 로드. 실패 시 snapshot() 은 nullptr 로 남는다.
//   refresh() : 파일 mtime 이 바뀌었을 때만 다시 읽는다. 실패하면 이전
//               스냅샷을 유지하고, 같은 mtime 의 파일은 다시 시도하지 않는다.
//   snapshot(): 불변 스냅샷 (atomic shared_ptr). 진행 중인 실행은 교체와
//               무관하게 자신이 읽은 스냅샷으로 끝난다.
//
// [스레드 안전성]
//   snapshot() 은 lock-free. load()/refresh() 는 내부 mutex 로 직렬화된다.
// ---------------------------------------------------------------------------

#include "sandbox/value.hpp"
#include "session/client_factory.hpp"

#include <array>
#include <atomic>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

inline constexpr std::array<std::string_view, 5> kRequiredProfileKeys = {
    "user", "fingerprint", "key_file", "tenancy", "region",
};

// ---------------------------------------------------------------------------
// OciProfile
//   DEFAULT 상속이 적용된 한 프로파일의 설정 값.
// ---------------------------------------------------------------------------
struct OciProfile {
    std::string                        name{};
    std::map<std::string, std::string> values{};

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // to_value: 스니펫의 `config` 바인딩 (str → str dict)
    [[nodiscard]] Value to_value() const;
};

// ---------------------------------------------------------------------------
// OciSession
// ---------------------------------------------------------------------------
class OciSession {
public:
    OciSession(std::filesystem::path          config_file,
               std::string                    profile,
               std::shared_ptr<ClientFactory> factory);
    ~OciSession() = default;

    OciSession(const OciSession&)            = delete;
    OciSession& operator=(const OciSession&) = delete;
    OciSession(OciSession&&)                 = delete;
    OciSession& operator=(OciSession&&)      = delete;

    // parse_profile
    //   INI 텍스트에서 profile 을 찾아 DEFAULT 상속/검증/~ 확장을 적용한다.
    [[nodiscard]] static std::expected<OciProfile, std::string>
    parse_profile(std::string_view ini_text, std::string_view profile);

    // load: 파일을 무조건 다시 읽는다.
    [[nodiscard]] std::expected<void, std::string> load();

    // refresh
    //   mtime 이 바뀐 경우에만 다시 읽는다.
    //   반환: 스냅샷 교체 여부. 실패 시 에러 (이전 스냅샷 유지).
    [[nodiscard]] std::expected<bool, std::string> refresh();

    [[nodiscard]] std::shared_ptr<const OciProfile> snapshot() const {
        return profile_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::shared_ptr<ClientFactory> get_client_factory() const noexcept {
        return factory_;
    }

    [[nodiscard]] const std::filesystem::path& config_file() const noexcept { return config_file_; }
    [[nodiscard]] const std::string&           profile_name() const noexcept { return profile_name_; }

private:
    std::expected<void, std::string> load_locked();

    std::filesystem::path          config_file_;
    std::string                    profile_name_;
    std::shared_ptr<ClientFactory> factory_;

    std::mutex                                   reload_mutex_;
    std::optional<std::filesystem::file_time_type> seen_mtime_;
    std::atomic<std::shared_ptr<const OciProfile>> profile_;
};
