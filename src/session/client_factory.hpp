#pragma once

// ---------------------------------------------------------------------------
// client_factory.hpp
//
// 클라우드 API 표면을 스니펫에 노출하는 인터페이스.
//
// [역할]
//   root_module() 은 실행마다 새로 만든 `oci` 모듈 객체를 반환한다.
//   QueryService 가 이를 SandboxBindings 의 "oci" 이름과 모듈 테이블에
//   넣는다. 스니펫은 모듈/클라이언트 객체의 get_attribute / call 로만
//   API 에 접근한다.
//
// [구현]
//   CatalogClientFactory: YAML fixture 기반 오프라인 구현 (catalog_client.hpp)
//   서명된 REST 호출을 하는 라이브 구현은 이 저장소 밖의 협력자다.
//
// [스레드 안전성]
//   root_module() / resolve() 는 여러 스레드에서 동시에 호출될 수 있다.
//   반환된 객체는 한 실행에서만 사용된다.
// ---------------------------------------------------------------------------

#include "sandbox/value.hpp"

#include <map>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ClientFactory
// ---------------------------------------------------------------------------
class ClientFactory {
public:
    ClientFactory()          = default;
    virtual ~ClientFactory() = default;

    ClientFactory(const ClientFactory&)            = delete;
    ClientFactory& operator=(const ClientFactory&) = delete;
    ClientFactory(ClientFactory&&)                 = delete;
    ClientFactory& operator=(ClientFactory&&)      = delete;

    // name: 로그용 구현 이름 ("catalog" 등)
    [[nodiscard]] virtual std::string name() const = 0;

    // root_module: 최상위 모듈 객체 (type_name 은 모듈 경로, 예: "oci")
    [[nodiscard]] virtual HostPtr root_module() const = 0;

    // resolve
    //   "oci.core.ComputeClient" 같은 경로를 root_module 부터 따라간다.
    //   경로가 없으면 nullptr.
    [[nodiscard]] virtual HostPtr resolve(std::string_view qualified_name) const;
};

// ---------------------------------------------------------------------------
// ModuleObject
//   이름 → 값 테이블을 가진 모듈. 멤버가 없으면 AttributeError.
// ---------------------------------------------------------------------------
class ModuleObject final : public HostObject {
public:
    explicit ModuleObject(std::string path);

    [[nodiscard]] Kind        host_kind() const noexcept override { return Kind::kModule; }
    [[nodiscard]] std::string type_name() const override { return path_; }
    [[nodiscard]] std::string repr() const override;

    Value get_attribute(std::string_view name) override;

    // add: 멤버 등록 (같은 이름은 교체)
    void add(std::string name, Value value);

    [[nodiscard]] const std::string&                  path() const noexcept { return path_; }
    [[nodiscard]] const std::map<std::string, Value>& members() const noexcept { return members_; }

private:
    std::string                  path_;
    std::map<std::string, Value> members_;
};
