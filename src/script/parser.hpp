#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "script/ast.hpp"
#include "script/lexer.hpp"

namespace toolbridge::script {

// Parsed snippet. The body runs as an async function, so top-level
// "return" and "await" are allowed.
struct Program {
    std::shared_ptr<FunctionNode> function;
};

// Recursive descent parser with automatic semicolon insertion. Throws
// ScriptError (SyntaxError) on invalid input.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    static Program parse_program(const std::string& source);
    static ExprPtr parse_standalone_expression(const std::string& source, int line);

private:
    const Token& peek(std::size_t offset = 0) const;
    const Token& advance();
    bool check(const std::string& punct) const;
    bool check_word(const std::string& word) const;
    bool match(const std::string& punct);
    const Token& expect(const std::string& punct);
    std::string expect_identifier();
    void consume_semicolon();
    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void fail_unexpected() const;

    std::vector<StmtPtr> parse_statements_until_end();
    StmtPtr parse_statement();
    StmtPtr parse_block();
    StmtPtr parse_variable_declaration(bool in_for_head);
    StmtPtr parse_function_declaration();
    StmtPtr parse_if();
    StmtPtr parse_for();
    StmtPtr parse_while();
    StmtPtr parse_do_while();
    StmtPtr parse_return();
    StmtPtr parse_try();
    StmtPtr parse_switch();

    PatternPtr parse_binding_target();
    PatternPtr parse_array_pattern();
    PatternPtr parse_object_pattern();
    void parse_parameters(FunctionNode& function);
    std::shared_ptr<FunctionNode> parse_function_rest(const std::string& name, int line);
    void parse_function_body(FunctionNode& function);

    ExprPtr parse_expression();
    ExprPtr parse_assignment();
    ExprPtr parse_arrow_function();
    bool at_arrow_function() const;
    ExprPtr parse_conditional();
    ExprPtr parse_binary(int min_precedence);
    ExprPtr parse_unary();
    ExprPtr parse_postfix();
    ExprPtr parse_call_member(ExprPtr object, bool allow_call);
    std::vector<ExprPtr> parse_arguments();
    ExprPtr parse_new();
    ExprPtr parse_primary();
    ExprPtr parse_array_literal();
    ExprPtr parse_object_literal();
    ExprPtr parse_template(const Token& token);

    ExprPtr make_expr(ExprKind kind, int line) const;
    StmtPtr make_stmt(StmtKind kind, int line) const;

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
};

}  // namespace toolbridge::script
