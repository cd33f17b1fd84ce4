// ---------------------------------------------------------------------------
// snippet_parser.cpp
//
// SnippetParser 구현.
//
// 내부적으로 SyntaxFailure 예외로 오류를 전파하고, parse() 경계에서
// std::expected 로 변환한다. 예외는 이 파일 밖으로 나가지 않는다.
//
// [줄바꿈 처리]
// bracket_depth_ > 0 (괄호/대괄호/딕셔너리 내부) 이면 kNewline 토큰을 건너뛴다.
// 블록 '{' 는 문장 위치에서만 열리므로 항상 bracket_depth_ == 0 이다.
// ---------------------------------------------------------------------------

#include "parser/snippet_parser.hpp"

#include "parser/lexer.hpp"

#include <charconv>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

// ---------------------------------------------------------------------------
// SyntaxFailure
//   파서 내부 전용 예외. parse() 에서 ParseError 로 변환된다.
// ---------------------------------------------------------------------------
class SyntaxFailure : public std::exception {
public:
    explicit SyntaxFailure(ParseError error) : error_(std::move(error)) {}

    [[nodiscard]] const char* what() const noexcept override { return error_.message.c_str(); }
    [[nodiscard]] const ParseError& error() const noexcept { return error_; }

private:
    ParseError error_;
};

[[nodiscard]] NodePtr make_node(NodeKind kind, SourceLocation loc) {
    auto node = std::make_unique<Node>();
    node->kind     = kind;
    node->location = loc;
    return node;
}

[[nodiscard]] NodePtr make_none_literal(SourceLocation loc) {
    auto node = make_node(NodeKind::kLiteral, loc);
    node->literal = std::monostate{};
    return node;
}

// 지원하지 않는 구문 키워드
[[nodiscard]] bool is_unsupported_keyword(std::string_view kw) noexcept {
    return kw == "def" || kw == "class" || kw == "return" || kw == "try" ||
           kw == "except" || kw == "finally" || kw == "with" || kw == "del" ||
           kw == "yield" || kw == "async" || kw == "await" || kw == "raise" ||
           kw == "assert";
}

// ---------------------------------------------------------------------------
// Parser
//   parse() 한 번 동안만 사용하는 내부 상태.
// ---------------------------------------------------------------------------
class Parser {
public:
    Parser(std::vector<Token> tokens, const ParserLimits& limits)
        : tokens_(std::move(tokens)), limits_(limits) {}

    std::vector<NodePtr> parse_program() {
        std::vector<NodePtr> statements;
        skip_separators();
        while (!at_end()) {
            parse_statement(statements);
            expect_separator();
        }
        return statements;
    }

private:
    // ── 깊이/괄호 가드 ──────────────────────────────────────────────────
    class DepthGuard {
    public:
        explicit DepthGuard(Parser& p) : p_(p) {
            if (++p_.depth_ > p_.limits_.max_nesting_depth) {
                p_.fail(ParseErrorCode::kNestingTooDeep,
                        fmt::format("nesting deeper than {} levels",
                                    p_.limits_.max_nesting_depth));
            }
        }
        ~DepthGuard() { --p_.depth_; }
        DepthGuard(const DepthGuard&)            = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& p_;
    };

    class BracketGuard {
    public:
        explicit BracketGuard(Parser& p) : p_(p) { ++p_.bracket_depth_; }
        ~BracketGuard() { --p_.bracket_depth_; }
        BracketGuard(const BracketGuard&)            = delete;
        BracketGuard& operator=(const BracketGuard&) = delete;

    private:
        Parser& p_;
    };

    // ── 토큰 접근 ───────────────────────────────────────────────────────
    [[nodiscard]] std::size_t index_at(std::size_t ahead) const noexcept {
        std::size_t i = pos_;
        for (;;) {
            if (bracket_depth_ > 0) {
                while (i < tokens_.size() - 1 && tokens_[i].type == TokenType::kNewline) {
                    ++i;
                }
            }
            if (ahead == 0 || i >= tokens_.size() - 1) {
                return i;
            }
            ++i;
            --ahead;
        }
    }

    [[nodiscard]] const Token& peek(std::size_t ahead = 0) const noexcept {
        return tokens_[index_at(ahead)];
    }

    const Token& advance() noexcept {
        pos_ = index_at(0);
        const Token& tok = tokens_[pos_];
        if (pos_ < tokens_.size() - 1) {
            ++pos_;
        }
        return tok;
    }

    [[nodiscard]] bool at_end() const noexcept { return peek().type == TokenType::kEnd; }

    [[nodiscard]] bool is_op(std::string_view op, std::size_t ahead = 0) const noexcept {
        const Token& t = peek(ahead);
        return t.type == TokenType::kOperator && t.text == op;
    }

    [[nodiscard]] bool is_keyword(std::string_view kw, std::size_t ahead = 0) const noexcept {
        const Token& t = peek(ahead);
        return t.type == TokenType::kKeyword && t.text == kw;
    }

    bool accept_op(std::string_view op) {
        if (is_op(op)) {
            advance();
            return true;
        }
        return false;
    }

    bool accept_keyword(std::string_view kw) {
        if (is_keyword(kw)) {
            advance();
            return true;
        }
        return false;
    }

    [[noreturn]] void fail(ParseErrorCode code, std::string message) const {
        const Token& t = peek();
        throw SyntaxFailure(ParseError{
            .code     = code,
            .message  = std::move(message),
            .location = t.location,
            .context  = t.type == TokenType::kEnd ? std::string("<end>") : t.text,
        });
    }

    [[noreturn]] void fail_unexpected(std::string_view expected) const {
        const Token& t = peek();
        if (t.type == TokenType::kEnd) {
            fail(ParseErrorCode::kUnexpectedToken,
                 fmt::format("unexpected end of snippet, expected {}", expected));
        }
        if (t.type == TokenType::kNewline) {
            fail(ParseErrorCode::kUnexpectedToken,
                 fmt::format("unexpected newline, expected {}", expected));
        }
        fail(ParseErrorCode::kUnexpectedToken,
             fmt::format("unexpected '{}', expected {}", t.text, expected));
    }

    void expect_op(std::string_view op) {
        if (!accept_op(op)) {
            fail_unexpected(fmt::format("'{}'", op));
        }
    }

    void expect_keyword(std::string_view kw) {
        if (!accept_keyword(kw)) {
            fail_unexpected(fmt::format("'{}'", kw));
        }
    }

    std::string expect_name(std::string_view what) {
        const Token& t = peek();
        if (t.type != TokenType::kName) {
            fail_unexpected(what);
        }
        return advance().text;
    }

    // ── 문장 구분 ───────────────────────────────────────────────────────
    void skip_separators() {
        while (peek().type == TokenType::kNewline || is_op(";")) {
            advance();
        }
    }

    void expect_separator() {
        if (peek().type == TokenType::kNewline || is_op(";")) {
            skip_separators();
            return;
        }
        if (at_end() || is_op("}")) {
            return;
        }
        fail_unexpected("newline or ';' after statement");
    }

    // ── 문장 ────────────────────────────────────────────────────────────
    void parse_statement(std::vector<NodePtr>& out) {
        const Token& t = peek();

        if (t.type == TokenType::kKeyword) {
            const std::string& kw = t.text;
            if (kw == "import")                        { parse_import(out); return; }
            if (kw == "from")                          { parse_from_import(out); return; }
            if (kw == "global" || kw == "nonlocal")    { parse_global(out); return; }
            if (kw == "if")                            { out.push_back(parse_if()); return; }
            if (kw == "for")                           { out.push_back(parse_for()); return; }
            if (kw == "while")                         { out.push_back(parse_while()); return; }
            if (kw == "break") {
                out.push_back(make_node(NodeKind::kBreak, advance().location));
                return;
            }
            if (kw == "continue") {
                out.push_back(make_node(NodeKind::kContinue, advance().location));
                return;
            }
            if (kw == "pass") {
                out.push_back(make_node(NodeKind::kPass, advance().location));
                return;
            }
            if (is_unsupported_keyword(kw)) {
                fail(ParseErrorCode::kUnsupportedSyntax,
                     fmt::format("'{}' is not supported in query snippets", kw));
            }
        }

        out.push_back(parse_simple_statement());
    }

    // 'import' dotted ['as' NAME] {',' dotted ['as' NAME]}
    void parse_import(std::vector<NodePtr>& out) {
        advance();  // import
        do {
            const SourceLocation loc = peek().location;
            auto node = make_node(NodeKind::kImport, loc);
            node->text = parse_dotted_name();
            if (accept_keyword("as")) {
                node->alias = expect_name("alias name after 'as'");
            }
            out.push_back(std::move(node));
        } while (accept_op(","));
    }

    // 'from' dotted 'import' NAME ['as' NAME] {',' NAME ['as' NAME]}
    void parse_from_import(std::vector<NodePtr>& out) {
        advance();  // from
        const std::string module = parse_dotted_name();
        expect_keyword("import");
        if (is_op("*")) {
            fail(ParseErrorCode::kUnsupportedSyntax, "wildcard import is not supported");
        }
        do {
            const SourceLocation loc = peek().location;
            auto node = make_node(NodeKind::kImportFrom, loc);
            node->text   = module;
            node->member = expect_name("imported name");
            node->alias  = accept_keyword("as") ? expect_name("alias name after 'as'")
                                                : node->member;
            out.push_back(std::move(node));
        } while (accept_op(","));
    }

    std::string parse_dotted_name() {
        std::string path = expect_name("module name");
        while (accept_op(".")) {
            path += '.';
            path += expect_name("module name after '.'");
        }
        return path;
    }

    void parse_global(std::vector<NodePtr>& out) {
        advance();  // global | nonlocal
        do {
            const SourceLocation loc = peek().location;
            auto node = make_node(NodeKind::kGlobal, loc);
            node->text = expect_name("name");
            out.push_back(std::move(node));
        } while (accept_op(","));
    }

    // 'if' 또는 'elif' 가 현재 토큰일 때 호출
    NodePtr parse_if() {
        DepthGuard guard{*this};
        const SourceLocation loc = advance().location;  // if | elif
        auto node = make_node(NodeKind::kIf, loc);
        node->children.push_back(parse_expression());
        node->children.push_back(parse_block());

        // '}' 뒤 줄바꿈을 건너뛰고 elif/else 를 찾는다
        const std::size_t saved = pos_;
        while (peek().type == TokenType::kNewline) {
            advance();
        }
        if (is_keyword("elif")) {
            auto else_block = make_node(NodeKind::kBlock, peek().location);
            else_block->children.push_back(parse_if());
            node->children.push_back(std::move(else_block));
        } else if (is_keyword("else")) {
            advance();
            node->children.push_back(parse_block());
        } else {
            pos_ = saved;
        }
        return node;
    }

    NodePtr parse_for() {
        const SourceLocation loc = advance().location;  // for
        auto node = make_node(NodeKind::kFor, loc);
        node->children.push_back(parse_for_target());
        expect_keyword("in");
        node->children.push_back(parse_expression());
        node->children.push_back(parse_block());
        return node;
    }

    // NAME [',' NAME]*
    NodePtr parse_for_target() {
        const SourceLocation loc = peek().location;
        auto first = make_node(NodeKind::kName, loc);
        first->text = expect_name("loop variable");
        if (!is_op(",")) {
            return first;
        }
        auto tuple = make_node(NodeKind::kTuple, loc);
        tuple->children.push_back(std::move(first));
        while (accept_op(",")) {
            auto name = make_node(NodeKind::kName, peek().location);
            name->text = expect_name("loop variable");
            tuple->children.push_back(std::move(name));
        }
        return tuple;
    }

    NodePtr parse_while() {
        const SourceLocation loc = advance().location;  // while
        auto node = make_node(NodeKind::kWhile, loc);
        node->children.push_back(parse_expression());
        node->children.push_back(parse_block());
        return node;
    }

    NodePtr parse_block() {
        DepthGuard guard{*this};
        const SourceLocation loc = peek().location;
        expect_op("{");
        auto block = make_node(NodeKind::kBlock, loc);
        skip_separators();
        while (!is_op("}")) {
            if (at_end()) {
                fail(ParseErrorCode::kUnexpectedToken, "unterminated block, expected '}'");
            }
            parse_statement(block->children);
            expect_separator();
        }
        advance();  // }
        return block;
    }

    // 대입 또는 식 문장
    NodePtr parse_simple_statement() {
        const SourceLocation loc = peek().location;
        NodePtr expr = parse_expression();

        if (is_op("=") || is_op("+=") || is_op("-=") || is_op("*=")) {
            const std::string op = advance().text;
            if (expr->kind != NodeKind::kName && expr->kind != NodeKind::kAttribute &&
                expr->kind != NodeKind::kSubscript) {
                throw SyntaxFailure(ParseError{
                    .code     = ParseErrorCode::kUnexpectedToken,
                    .message  = fmt::format("cannot assign to {}", node_kind_name(expr->kind)),
                    .location = loc,
                    .context  = op,
                });
            }
            auto node = make_node(op == "=" ? NodeKind::kAssign : NodeKind::kAugAssign, loc);
            if (op != "=") {
                node->text = op.substr(0, 1);
            }
            node->children.push_back(std::move(expr));
            node->children.push_back(parse_expression());
            return node;
        }

        auto stmt = make_node(NodeKind::kExprStmt, loc);
        stmt->children.push_back(std::move(expr));
        return stmt;
    }

    // ── 식 ──────────────────────────────────────────────────────────────
    NodePtr parse_expression() {
        DepthGuard guard{*this};
        if (is_keyword("lambda")) {
            return parse_lambda();
        }
        NodePtr body = parse_or();
        if (is_keyword("if")) {
            const SourceLocation loc = advance().location;
            auto node = make_node(NodeKind::kIfExp, loc);
            NodePtr cond = parse_or();
            expect_keyword("else");
            NodePtr orelse = parse_expression();
            node->children.push_back(std::move(cond));
            node->children.push_back(std::move(body));
            node->children.push_back(std::move(orelse));
            return node;
        }
        return body;
    }

    NodePtr parse_lambda() {
        const SourceLocation loc = advance().location;  // lambda
        auto node = make_node(NodeKind::kLambda, loc);
        std::string params;
        while (!is_op(":")) {
            if (!params.empty()) {
                expect_op(",");
                params += ',';
            }
            params += expect_name("lambda parameter");
        }
        expect_op(":");
        node->text = std::move(params);
        node->children.push_back(parse_expression());
        return node;
    }

    NodePtr parse_or() {
        NodePtr left = parse_and();
        while (is_keyword("or")) {
            const SourceLocation loc = advance().location;
            auto node = make_node(NodeKind::kBoolOp, loc);
            node->text = "or";
            node->children.push_back(std::move(left));
            node->children.push_back(parse_and());
            left = std::move(node);
        }
        return left;
    }

    NodePtr parse_and() {
        NodePtr left = parse_not();
        while (is_keyword("and")) {
            const SourceLocation loc = advance().location;
            auto node = make_node(NodeKind::kBoolOp, loc);
            node->text = "and";
            node->children.push_back(std::move(left));
            node->children.push_back(parse_not());
            left = std::move(node);
        }
        return left;
    }

    NodePtr parse_not() {
        if (is_keyword("not")) {
            DepthGuard guard{*this};
            const SourceLocation loc = advance().location;
            auto node = make_node(NodeKind::kUnaryOp, loc);
            node->text = "not";
            node->children.push_back(parse_not());
            return node;
        }
        return parse_comparison();
    }

    // 비교 연산자를 소비하고 정규화된 연산자 문자열을 반환한다. 없으면 빈 문자열.
    std::string accept_comparison_op() {
        const Token& t = peek();
        if (t.type == TokenType::kOperator &&
            (t.text == "==" || t.text == "!=" || t.text == "<" || t.text == "<=" ||
             t.text == ">" || t.text == ">=")) {
            return advance().text;
        }
        if (is_keyword("in")) {
            advance();
            return "in";
        }
        if (is_keyword("not") && is_keyword("in", 1)) {
            advance();
            advance();
            return "not in";
        }
        if (is_keyword("is")) {
            advance();
            if (accept_keyword("not")) {
                return "is not";
            }
            return "is";
        }
        return {};
    }

    // a < b < c → (a < b) and (b < c)
    NodePtr parse_comparison() {
        NodePtr left = parse_arith();

        std::vector<std::pair<std::string, NodePtr>> chain;
        std::vector<SourceLocation> locations;
        for (;;) {
            const SourceLocation loc = peek().location;
            std::string op = accept_comparison_op();
            if (op.empty()) {
                break;
            }
            locations.push_back(loc);
            chain.emplace_back(std::move(op), parse_arith());
        }
        if (chain.empty()) {
            return left;
        }

        NodePtr result;
        const Node* prev = nullptr;
        for (std::size_t i = 0; i < chain.size(); ++i) {
            auto cmp = make_node(NodeKind::kCompare, locations[i]);
            cmp->text = chain[i].first;
            cmp->children.push_back(i == 0 ? std::move(left) : clone_node(*prev));
            prev = chain[i].second.get();
            cmp->children.push_back(std::move(chain[i].second));
            if (!result) {
                result = std::move(cmp);
            } else {
                auto conj = make_node(NodeKind::kBoolOp, locations[i]);
                conj->text = "and";
                conj->children.push_back(std::move(result));
                conj->children.push_back(std::move(cmp));
                result = std::move(conj);
            }
        }
        return result;
    }

    NodePtr parse_arith() {
        NodePtr left = parse_term();
        while (is_op("+") || is_op("-")) {
            const Token& op = advance();
            auto node = make_node(NodeKind::kBinaryOp, op.location);
            node->text = op.text;
            node->children.push_back(std::move(left));
            node->children.push_back(parse_term());
            left = std::move(node);
        }
        return left;
    }

    NodePtr parse_term() {
        NodePtr left = parse_unary();
        while (is_op("*") || is_op("/") || is_op("//") || is_op("%")) {
            const Token& op = advance();
            auto node = make_node(NodeKind::kBinaryOp, op.location);
            node->text = op.text;
            node->children.push_back(std::move(left));
            node->children.push_back(parse_unary());
            left = std::move(node);
        }
        return left;
    }

    NodePtr parse_unary() {
        if (is_op("-") || is_op("+")) {
            DepthGuard guard{*this};
            const Token& op = advance();
            auto node = make_node(NodeKind::kUnaryOp, op.location);
            node->text = op.text;
            node->children.push_back(parse_unary());
            return node;
        }
        return parse_postfix();
    }

    NodePtr parse_postfix() {
        NodePtr node = parse_atom();
        for (;;) {
            if (is_op(".")) {
                const SourceLocation loc = advance().location;
                auto attr = make_node(NodeKind::kAttribute, loc);
                attr->text = expect_name("attribute name after '.'");
                attr->children.push_back(std::move(node));
                node = std::move(attr);
            } else if (is_op("(")) {
                node = parse_call(std::move(node));
            } else if (is_op("[")) {
                node = parse_subscript(std::move(node));
            } else {
                return node;
            }
        }
    }

    NodePtr parse_call(NodePtr callee) {
        DepthGuard depth{*this};
        const SourceLocation loc = callee->location;
        auto call = make_node(NodeKind::kCall, loc);
        call->children.push_back(std::move(callee));

        BracketGuard bracket{*this};
        advance();  // (
        bool seen_keyword = false;
        std::vector<std::string> keyword_names;
        while (!is_op(")")) {
            if (peek().type == TokenType::kName && is_op("=", 1)) {
                const SourceLocation kw_loc = peek().location;
                std::string name = advance().text;
                advance();  // =
                for (const auto& seen : keyword_names) {
                    if (seen == name) {
                        fail(ParseErrorCode::kUnexpectedToken,
                             fmt::format("keyword argument '{}' repeated", name));
                    }
                }
                keyword_names.push_back(name);
                auto kw = make_node(NodeKind::kKeyword, kw_loc);
                kw->text = std::move(name);
                kw->children.push_back(parse_expression());
                call->children.push_back(std::move(kw));
                seen_keyword = true;
            } else {
                if (seen_keyword) {
                    fail(ParseErrorCode::kUnexpectedToken,
                         "positional argument follows keyword argument");
                }
                NodePtr arg = parse_expression();
                // f(x for x in items) → 리스트 컴프리헨션으로 취급
                if (is_keyword("for")) {
                    arg = parse_list_comp_tail(std::move(arg));
                }
                call->children.push_back(std::move(arg));
            }
            if (!accept_op(",")) {
                break;
            }
        }
        expect_op(")");
        return call;
    }

    NodePtr parse_subscript(NodePtr object) {
        DepthGuard depth{*this};
        BracketGuard bracket{*this};
        const SourceLocation loc = advance().location;  // [
        auto node = make_node(NodeKind::kSubscript, loc);
        node->children.push_back(std::move(object));

        NodePtr lower;
        if (!is_op(":")) {
            lower = parse_expression();
        }
        if (is_op(":")) {
            const SourceLocation slice_loc = advance().location;
            auto slice = make_node(NodeKind::kSlice, slice_loc);
            slice->children.push_back(lower ? std::move(lower) : make_none_literal(slice_loc));
            slice->children.push_back(is_op("]") ? make_none_literal(slice_loc)
                                                 : parse_expression());
            node->children.push_back(std::move(slice));
        } else {
            node->children.push_back(std::move(lower));
        }
        expect_op("]");
        return node;
    }

    NodePtr parse_atom() {
        const Token& t = peek();
        const SourceLocation loc = t.location;

        switch (t.type) {
            case TokenType::kName: {
                auto node = make_node(NodeKind::kName, loc);
                node->text = advance().text;
                return node;
            }
            case TokenType::kInt: {
                const std::string& text = advance().text;
                std::int64_t value{0};
                const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                if (ec != std::errc{}) {
                    fail(ParseErrorCode::kInvalidLiteral, fmt::format("invalid integer '{}'", text));
                }
                auto node = make_node(NodeKind::kLiteral, loc);
                node->literal = value;
                return node;
            }
            case TokenType::kFloat: {
                const std::string& text = advance().text;
                double value{0.0};
                const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                if (ec != std::errc{}) {
                    fail(ParseErrorCode::kInvalidLiteral, fmt::format("invalid float '{}'", text));
                }
                auto node = make_node(NodeKind::kLiteral, loc);
                node->literal = value;
                return node;
            }
            case TokenType::kString: {
                // 인접 문자열 리터럴은 이어 붙인다
                std::string value = advance().text;
                while (peek().type == TokenType::kString) {
                    value += advance().text;
                }
                auto node = make_node(NodeKind::kLiteral, loc);
                node->literal = std::move(value);
                return node;
            }
            case TokenType::kKeyword: {
                if (t.text == "true" || t.text == "false") {
                    auto node = make_node(NodeKind::kLiteral, loc);
                    node->literal = (advance().text == "true");
                    return node;
                }
                if (t.text == "none") {
                    advance();
                    return make_none_literal(loc);
                }
                if (t.text == "lambda") {
                    return parse_expression();
                }
                if (is_unsupported_keyword(t.text)) {
                    fail(ParseErrorCode::kUnsupportedSyntax,
                         fmt::format("'{}' is not supported in query snippets", t.text));
                }
                fail_unexpected("expression");
            }
            case TokenType::kOperator:
                if (t.text == "(") { return parse_paren(); }
                if (t.text == "[") { return parse_list(); }
                if (t.text == "{") { return parse_dict(); }
                fail_unexpected("expression");
            case TokenType::kNewline:
            case TokenType::kEnd:
                fail_unexpected("expression");
        }
        fail_unexpected("expression");
    }

    NodePtr parse_paren() {
        DepthGuard depth{*this};
        BracketGuard bracket{*this};
        const SourceLocation loc = advance().location;  // (
        if (accept_op(")")) {
            return make_node(NodeKind::kTuple, loc);
        }
        NodePtr first = parse_expression();
        if (is_keyword("for")) {
            NodePtr comp = parse_list_comp_tail(std::move(first));
            expect_op(")");
            return comp;
        }
        if (!is_op(",")) {
            expect_op(")");
            return first;
        }
        auto tuple = make_node(NodeKind::kTuple, loc);
        tuple->children.push_back(std::move(first));
        while (accept_op(",")) {
            if (is_op(")")) {
                break;
            }
            tuple->children.push_back(parse_expression());
        }
        expect_op(")");
        return tuple;
    }

    NodePtr parse_list() {
        DepthGuard depth{*this};
        BracketGuard bracket{*this};
        const SourceLocation loc = advance().location;  // [
        auto list = make_node(NodeKind::kList, loc);
        if (accept_op("]")) {
            return list;
        }
        NodePtr first = parse_expression();
        if (is_keyword("for")) {
            NodePtr comp = parse_list_comp_tail(std::move(first));
            expect_op("]");
            return comp;
        }
        list->children.push_back(std::move(first));
        while (accept_op(",")) {
            if (is_op("]")) {
                break;
            }
            list->children.push_back(parse_expression());
        }
        expect_op("]");
        return list;
    }

    NodePtr parse_dict() {
        DepthGuard depth{*this};
        BracketGuard bracket{*this};
        const SourceLocation loc = advance().location;  // {
        auto dict = make_node(NodeKind::kDict, loc);
        if (accept_op("}")) {
            return dict;
        }
        NodePtr key = parse_expression();
        expect_op(":");
        NodePtr value = parse_expression();
        if (is_keyword("for")) {
            auto comp = make_node(NodeKind::kDictComp, loc);
            comp->children.push_back(std::move(key));
            comp->children.push_back(std::move(value));
            parse_comprehension_clauses(*comp);
            expect_op("}");
            return comp;
        }
        dict->children.push_back(std::move(key));
        dict->children.push_back(std::move(value));
        while (accept_op(",")) {
            if (is_op("}")) {
                break;
            }
            dict->children.push_back(parse_expression());
            expect_op(":");
            dict->children.push_back(parse_expression());
        }
        expect_op("}");
        return dict;
    }

    NodePtr parse_list_comp_tail(NodePtr element) {
        auto comp = make_node(NodeKind::kListComp, element->location);
        comp->children.push_back(std::move(element));
        parse_comprehension_clauses(*comp);
        return comp;
    }

    // 'for' target 'in' or_expr {'if' or_expr}
    void parse_comprehension_clauses(Node& comp) {
        expect_keyword("for");
        comp.children.push_back(parse_for_target());
        expect_keyword("in");
        comp.children.push_back(parse_or());
        while (accept_keyword("if")) {
            comp.children.push_back(parse_or());
        }
        if (is_keyword("for")) {
            fail(ParseErrorCode::kUnsupportedSyntax,
                 "nested comprehension clauses are not supported");
        }
    }

    std::vector<Token>  tokens_;
    const ParserLimits& limits_;
    std::size_t         pos_{0};
    std::size_t         depth_{0};
    std::size_t         bracket_depth_{0};
};

}  // namespace

// ---------------------------------------------------------------------------
// SnippetParser::parse 구현
// ---------------------------------------------------------------------------
std::expected<Program, ParseError>
SnippetParser::parse(std::string_view source) const {
    if (source.size() > limits_.max_source_bytes) {
        return std::unexpected(ParseError{
            .code     = ParseErrorCode::kSnippetTooLarge,
            .message  = fmt::format("snippet is {} bytes, limit is {}",
                                    source.size(), limits_.max_source_bytes),
            .location = {},
            .context  = {},
        });
    }

    const SnippetLexer lexer;
    auto tokens = lexer.tokenize(source);
    if (!tokens) {
        return std::unexpected(std::move(tokens.error()));
    }

    bool has_content = false;
    for (const auto& tok : *tokens) {
        if (tok.type != TokenType::kNewline && tok.type != TokenType::kEnd &&
            !(tok.type == TokenType::kOperator && tok.text == ";")) {
            has_content = true;
            break;
        }
    }
    if (!has_content) {
        return std::unexpected(ParseError{
            .code     = ParseErrorCode::kEmptySnippet,
            .message  = "snippet is empty",
            .location = {},
            .context  = {},
        });
    }

    Program program;
    program.source = std::string(source);
    try {
        Parser parser{std::move(*tokens), limits_};
        program.statements = parser.parse_program();
    } catch (const SyntaxFailure& failure) {
        return std::unexpected(failure.error());
    } catch (const std::bad_alloc&) {
        return std::unexpected(ParseError{
            .code     = ParseErrorCode::kInternalError,
            .message  = "out of memory while parsing",
            .location = {},
            .context  = {},
        });
    }
    return program;
}
