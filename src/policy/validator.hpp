#pragma once

// ---------------------------------------------------------------------------
// validator.hpp
//
// 스니펫 구문 트리를 능력 화이트리스트와 대조하여 실행 허가 여부를 판정한다.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. 파싱 실패 → check(string) 가 ParseError 반환. 실행으로 이어지지 않는다.
// 2. 화이트리스트 없음(nullptr) → admitted=false
// 3. 패턴에 없는 호출 → 거부 (default deny)
// 4. admitted=true 는 violations 가 비어있을 때만 반환
//
// [판정 규칙]
// - forbidden_node_kinds 에 포함된 구문 kind 를 가진 노드
// - 능력 분류(dynamic_eval, file_access, process_spawn, network_access,
//   reflection, global_scope_write, attribute_store)가 금지된 노드
// - allowed_modules 밖의 모듈 import
// - 호출: 허용 builtin, 화이트리스트 callable 로 추론된 이름, 또는
//   (receiver kind, member) 가 allowed_call_patterns 와 일치하는 속성만 허용
// - 모듈/클라이언트의 속성 읽기도 패턴 또는 허용 하위 모듈이어야 한다
//
// [receiver kind 추론]
// 흐름 비민감(flow-insensitive) 고정점 분석. 이름 하나가 가질 수 있는 모든
// kind 를 모으고, 호출은 가능한 모든 kind 에서 허용되어야 통과한다.
//
// [알려진 한계 / 의도된 동작]
// - 정의되지 않은 이름 참조는 여기서 거부하지 않는다. 실행 시점에
//   RuntimeFailure 로 보고된다.
// - 판정은 (스니펫, 화이트리스트) 의 순수 함수다. 같은 입력은 항상 같은
//   Verdict 를 만든다 (위반 순서 포함, 전위 순회 소스 순서).
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "parser/ast.hpp"
#include "parser/snippet_parser.hpp"
#include "policy/capability.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// Violation
//   거부된 노드 하나. node_kind 는 구문 kind 또는 능력 분류 kind.
//   reason 은 사람이 읽을 수 있는 설명 (envelope 으로 노출된다).
// ---------------------------------------------------------------------------
struct Violation {
    NodeKind       node_kind{NodeKind::kPass};
    SourceLocation location{};
    std::string    reason{};
};

// ---------------------------------------------------------------------------
// Verdict
//   admitted 기본값 false (fail-close).
// ---------------------------------------------------------------------------
struct Verdict {
    bool                   admitted{false};
    std::string            whitelist_version{};
    std::vector<Violation> violations{};
};

// ---------------------------------------------------------------------------
// Validator
//
//   [스레드 안전성]
//   - check: 읽기 전용. 화이트리스트가 불변이므로 concurrent 호출 안전.
// ---------------------------------------------------------------------------
class Validator {
public:
    // whitelist 가 nullptr 이면 모든 check() 가 admitted=false 를 반환한다.
    explicit Validator(std::shared_ptr<const CapabilityWhitelist> whitelist,
                       SnippetParser                              parser = SnippetParser{});

    ~Validator() = default;

    Validator(const Validator&)            = default;
    Validator& operator=(const Validator&) = default;
    Validator(Validator&&)                 = default;
    Validator& operator=(Validator&&)      = default;

    // check
    //   스니펫 원문을 파싱 후 판정한다. 파싱 실패 시 ParseError (SyntaxInvalid).
    [[nodiscard]] std::expected<Verdict, ParseError> check(std::string_view snippet) const;

    // check
    //   이미 파싱된 Program 을 판정한다.
    [[nodiscard]] Verdict check(const Program& program) const;

    [[nodiscard]] const SnippetParser& parser() const noexcept { return parser_; }

    [[nodiscard]] const std::shared_ptr<const CapabilityWhitelist>& whitelist() const noexcept {
        return whitelist_;
    }

private:
    std::shared_ptr<const CapabilityWhitelist> whitelist_;
    SnippetParser                              parser_;
};
