#pragma once

// ---------------------------------------------------------------------------
// catalog_client.hpp
//
// YAML 리소스 fixture 로 OCI 클라이언트 호출에 응답하는 오프라인 ClientFactory.
//
// [YAML 스키마]
//   clients:
//     oci.core.ComputeClient:          # 클라이언트 타입 (모듈 경로 + 클래스 이름)
//       instances:                     # 컬렉션 → list_instances / get_instance
//         model: oci.core.models.Instance
//         items:
//           - id: ocid1.instance.oc1..aaa
//             compartment_id: ocid1.compartment.oc1..ccc
//             display_name: web-1
//             lifecycle_state: RUNNING
//     oci.identity.IdentityClient:
//       users:
//         model: oci.identity.models.User
//         error: {status: 401, code: NotAuthenticated, message: "..."}
//
// [호출 의미]
//   Client(config)         : config 는 생략 가능, 주어지면 dict 여야 한다
//   list_<collection>(...) : 위치 인자 0 은 compartment_id. 키워드 인자가
//                            항목 필드 이름이면 같은 값만 남긴다.
//                            limit 은 결과 개수 제한. 나머지 키워드는 무시.
//   get_<singular>(id)     : id 필드로 조회. 없으면 404 ServiceError
//   error 가 지정된 컬렉션은 모든 호출이 해당 ServiceError 를 던진다.
//   응답은 oci.response.Response record (status, headers, data, next_page,
//   request_id).
//
//   oci.pagination.list_call_get_all_results(fn, *args, **kwargs) 는 limit 을
//   제외한 인자로 fn 을 호출한다 (fixture 는 페이지를 나누지 않는다).
// ---------------------------------------------------------------------------

#include "session/client_factory.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// CatalogError
//   컬렉션에 고정된 서비스 오류.
// ---------------------------------------------------------------------------
struct CatalogError {
    std::int64_t status{500};
    std::string  code{};
    std::string  message{};
};

struct CatalogCollection {
    std::string                 model{};
    std::vector<Value>          items{};  // Record
    std::optional<CatalogError> error{};
};

struct CatalogClientSpec {
    std::string                              type_name{};
    std::map<std::string, CatalogCollection> collections{};
};

struct Catalog {
    std::string                              root{};     // 최상위 모듈 이름 ("oci")
    std::map<std::string, CatalogClientSpec> clients{};  // 타입 이름 → 스펙
};

// ---------------------------------------------------------------------------
// CatalogClientFactory
// ---------------------------------------------------------------------------
class CatalogClientFactory final : public ClientFactory {
public:
    explicit CatalogClientFactory(std::shared_ptr<const Catalog> catalog);

    // load / load_from_string
    //   all-or-nothing. 실패 시 에러 메시지.
    [[nodiscard]] static std::expected<std::shared_ptr<CatalogClientFactory>, std::string>
    load(const std::filesystem::path& path);

    [[nodiscard]] static std::expected<std::shared_ptr<CatalogClientFactory>, std::string>
    load_from_string(std::string_view yaml_text);

    [[nodiscard]] std::string name() const override { return "catalog"; }
    [[nodiscard]] HostPtr     root_module() const override;

    [[nodiscard]] const Catalog& catalog() const noexcept { return *catalog_; }

private:
    std::shared_ptr<const Catalog> catalog_;
};

// service_error_message: SDK ServiceError 의 문자열 표현
[[nodiscard]] std::string service_error_message(const CatalogError& error,
                                                std::string_view    operation);
