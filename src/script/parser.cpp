#include "script/parser.hpp"

#include <set>
#include "script/script_error.hpp"
#include "script/value.hpp"

namespace toolbridge::script {

namespace {

constexpr std::size_t kMaxNesting = 400;

const std::set<std::string>& reserved_words() {
    static const std::set<std::string> words = {
        "break", "case", "catch", "class", "const", "continue", "default", "delete",
        "do", "else", "export", "extends", "finally", "for", "function", "if",
        "import", "in", "instanceof", "let", "new", "return", "super", "switch",
        "throw", "try", "typeof", "var", "void", "while", "with", "yield",
        "true", "false", "null"};
    return words;
}

bool is_assignment_operator(const Token& token) {
    static const std::set<std::string> ops = {
        "=", "+=", "-=", "*=", "/=", "%=", "**=", "<<=", ">>=", ">>>=",
        "&=", "|=", "^=", "&&=", "||=", "?\?="};
    return token.type == TokenType::Punctuator && ops.count(token.text) > 0;
}

int binary_precedence(const Token& token) {
    if (token.type == TokenType::Identifier) {
        return token.text == "instanceof" || token.text == "in" ? 8 : -1;
    }
    if (token.type != TokenType::Punctuator) {
        return -1;
    }
    const std::string& op = token.text;
    if (op == "??") return 1;
    if (op == "||") return 2;
    if (op == "&&") return 3;
    if (op == "|") return 4;
    if (op == "^") return 5;
    if (op == "&") return 6;
    if (op == "==" || op == "!=" || op == "===" || op == "!==") return 7;
    if (op == "<" || op == ">" || op == "<=" || op == ">=") return 8;
    if (op == "<<" || op == ">>" || op == ">>>") return 9;
    if (op == "+" || op == "-") return 10;
    if (op == "*" || op == "/" || op == "%") return 11;
    if (op == "**") return 12;
    return -1;
}

class NestingGuard {
public:
    explicit NestingGuard(std::size_t& depth) : depth_(depth) { ++depth_; }
    ~NestingGuard() { --depth_; }
    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    std::size_t& depth_;
};

}  // namespace

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::End) {
        Token end;
        end.type = TokenType::End;
        tokens_.push_back(end);
    }
}

Program Parser::parse_program(const std::string& source) {
    Parser parser(Lexer(source).tokenize());
    Program program;
    program.function = std::make_shared<FunctionNode>();
    program.function->name = "<snippet>";
    program.function->body = parser.parse_statements_until_end();
    return program;
}

ExprPtr Parser::parse_standalone_expression(const std::string& source, const int line) {
    Parser parser(Lexer(source, line).tokenize());
    ExprPtr expr = parser.parse_expression();
    if (parser.peek().type != TokenType::End) {
        parser.fail_unexpected();
    }
    return expr;
}

const Token& Parser::peek(const std::size_t offset) const {
    const std::size_t index = pos_ + offset;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

const Token& Parser::advance() {
    const Token& token = peek();
    if (pos_ < tokens_.size() - 1) {
        ++pos_;
    }
    return token;
}

bool Parser::check(const std::string& punct) const {
    return peek().type == TokenType::Punctuator && peek().text == punct;
}

bool Parser::check_word(const std::string& word) const {
    return peek().type == TokenType::Identifier && peek().text == word;
}

bool Parser::match(const std::string& punct) {
    if (check(punct)) {
        advance();
        return true;
    }
    return false;
}

const Token& Parser::expect(const std::string& punct) {
    if (!check(punct)) {
        fail("Expected '" + punct + "'");
    }
    return advance();
}

std::string Parser::expect_identifier() {
    const Token& token = peek();
    if (token.type != TokenType::Identifier || reserved_words().count(token.text) > 0) {
        fail_unexpected();
    }
    return advance().text;
}

void Parser::consume_semicolon() {
    if (match(";")) {
        return;
    }
    if (check("}") || peek().type == TokenType::End || peek().newline_before) {
        return;
    }
    fail_unexpected();
}

void Parser::fail(const std::string& message) const {
    throw ScriptError(make_error_object(
        "SyntaxError", message + " (line " + std::to_string(peek().line) + ")"));
}

void Parser::fail_unexpected() const {
    const Token& token = peek();
    switch (token.type) {
        case TokenType::End:
            fail("Unexpected end of input");
        case TokenType::Number:
            fail("Unexpected number");
        case TokenType::String:
            fail("Unexpected string");
        case TokenType::Template:
            fail("Unexpected template string");
        default:
            fail("Unexpected token '" + token.text + "'");
    }
}

ExprPtr Parser::make_expr(const ExprKind kind, const int line) const {
    auto expr = std::make_shared<Expr>();
    expr->kind = kind;
    expr->line = line;
    return expr;
}

StmtPtr Parser::make_stmt(const StmtKind kind, const int line) const {
    auto stmt = std::make_shared<Stmt>();
    stmt->kind = kind;
    stmt->line = line;
    return stmt;
}

std::vector<StmtPtr> Parser::parse_statements_until_end() {
    std::vector<StmtPtr> statements;
    while (peek().type != TokenType::End) {
        statements.push_back(parse_statement());
    }
    return statements;
}

StmtPtr Parser::parse_statement() {
    NestingGuard guard(depth_);
    if (depth_ > kMaxNesting) {
        fail("Statement nesting too deep");
    }

    const Token& token = peek();
    if (check("{")) {
        return parse_block();
    }
    if (check(";")) {
        advance();
        return make_stmt(StmtKind::Empty, token.line);
    }
    if (token.type == TokenType::Identifier) {
        const std::string& word = token.text;
        if (word == "const" || word == "let" || word == "var") {
            return parse_variable_declaration(false);
        }
        if (word == "function") {
            return parse_function_declaration();
        }
        if (word == "async" && peek(1).type == TokenType::Identifier &&
            peek(1).text == "function" && !peek(1).newline_before) {
            advance();
            return parse_function_declaration();
        }
        if (word == "if") return parse_if();
        if (word == "for") return parse_for();
        if (word == "while") return parse_while();
        if (word == "do") return parse_do_while();
        if (word == "return") return parse_return();
        if (word == "try") return parse_try();
        if (word == "switch") return parse_switch();
        if (word == "break" || word == "continue") {
            auto stmt = make_stmt(word == "break" ? StmtKind::Break : StmtKind::Continue,
                                  token.line);
            advance();
            if (peek().type == TokenType::Identifier && !peek().newline_before) {
                fail("Labeled statements are not supported");
            }
            consume_semicolon();
            return stmt;
        }
        if (word == "throw") {
            auto stmt = make_stmt(StmtKind::Throw, token.line);
            advance();
            if (peek().newline_before) {
                fail("Illegal newline after throw");
            }
            stmt->expr = parse_expression();
            consume_semicolon();
            return stmt;
        }
        if (word == "class" || word == "import" || word == "export" || word == "with") {
            fail("'" + word + "' is not supported");
        }
    }

    auto stmt = make_stmt(StmtKind::Expression, token.line);
    stmt->expr = parse_expression();
    consume_semicolon();
    return stmt;
}

StmtPtr Parser::parse_block() {
    auto stmt = make_stmt(StmtKind::Block, peek().line);
    expect("{");
    while (!check("}")) {
        if (peek().type == TokenType::End) {
            fail_unexpected();
        }
        stmt->statements.push_back(parse_statement());
    }
    advance();
    return stmt;
}

StmtPtr Parser::parse_variable_declaration(const bool in_for_head) {
    auto stmt = make_stmt(StmtKind::VarDecl, peek().line);
    stmt->decl_kind = advance().text;
    while (true) {
        Declarator declarator;
        declarator.target = parse_binding_target();
        if (match("=")) {
            declarator.init = parse_assignment();
        } else if (!in_for_head) {
            if (stmt->decl_kind == "const") {
                fail("Missing initializer in const declaration");
            }
            if (declarator.target->kind != Pattern::Kind::Identifier) {
                fail("Missing initializer in destructuring declaration");
            }
        }
        stmt->declarations.push_back(std::move(declarator));
        if (!match(",")) {
            break;
        }
    }
    if (!in_for_head) {
        consume_semicolon();
    }
    return stmt;
}

StmtPtr Parser::parse_function_declaration() {
    const int line = peek().line;
    advance();
    if (check("*")) {
        fail("Generator functions are not supported");
    }
    const std::string name = expect_identifier();
    auto stmt = make_stmt(StmtKind::FunctionDecl, line);
    stmt->function = parse_function_rest(name, line);
    return stmt;
}

StmtPtr Parser::parse_if() {
    auto stmt = make_stmt(StmtKind::If, peek().line);
    advance();
    expect("(");
    stmt->expr = parse_expression();
    expect(")");
    stmt->body = parse_statement();
    if (check_word("else")) {
        advance();
        stmt->alternate = parse_statement();
    }
    return stmt;
}

StmtPtr Parser::parse_for() {
    const int line = peek().line;
    advance();
    if (check_word("await")) {
        advance();
    }
    expect("(");

    StmtPtr init;
    if (check_word("const") || check_word("let") || check_word("var")) {
        const std::string kind = peek().text;
        if ((peek(2).type == TokenType::Identifier &&
             (peek(2).text == "of" || peek(2).text == "in")) ||
            peek(1).type == TokenType::Punctuator) {
            // Either "for (const x of/in ...)" or a destructuring head.
            const std::size_t saved = pos_;
            advance();
            PatternPtr target = parse_binding_target();
            if (check_word("of") || check_word("in")) {
                auto stmt = make_stmt(peek().text == "of" ? StmtKind::ForOf : StmtKind::ForIn,
                                      line);
                advance();
                stmt->decl_kind = kind;
                stmt->binding = target;
                stmt->expr = stmt->kind == StmtKind::ForOf ? parse_assignment()
                                                           : parse_expression();
                expect(")");
                stmt->body = parse_statement();
                return stmt;
            }
            pos_ = saved;
        }
        init = parse_variable_declaration(true);
    } else if (peek().type == TokenType::Identifier && peek(1).type == TokenType::Identifier &&
               (peek(1).text == "of" || peek(1).text == "in")) {
        auto stmt = make_stmt(peek(1).text == "of" ? StmtKind::ForOf : StmtKind::ForIn, line);
        auto target = std::make_shared<Pattern>();
        target->name = expect_identifier();
        advance();
        stmt->binding = target;
        stmt->expr = stmt->kind == StmtKind::ForOf ? parse_assignment() : parse_expression();
        expect(")");
        stmt->body = parse_statement();
        return stmt;
    } else if (!check(";")) {
        init = make_stmt(StmtKind::Expression, peek().line);
        init->expr = parse_expression();
    }

    auto stmt = make_stmt(StmtKind::For, line);
    stmt->init = init;
    expect(";");
    if (!check(";")) {
        stmt->expr = parse_expression();
    }
    expect(";");
    if (!check(")")) {
        stmt->update = parse_expression();
    }
    expect(")");
    stmt->body = parse_statement();
    return stmt;
}

StmtPtr Parser::parse_while() {
    auto stmt = make_stmt(StmtKind::While, peek().line);
    advance();
    expect("(");
    stmt->expr = parse_expression();
    expect(")");
    stmt->body = parse_statement();
    return stmt;
}

StmtPtr Parser::parse_do_while() {
    auto stmt = make_stmt(StmtKind::DoWhile, peek().line);
    advance();
    stmt->body = parse_statement();
    if (!check_word("while")) {
        fail("Expected 'while' after do body");
    }
    advance();
    expect("(");
    stmt->expr = parse_expression();
    expect(")");
    match(";");
    return stmt;
}

StmtPtr Parser::parse_return() {
    auto stmt = make_stmt(StmtKind::Return, peek().line);
    advance();
    if (!check(";") && !check("}") && peek().type != TokenType::End && !peek().newline_before) {
        stmt->expr = parse_expression();
    }
    consume_semicolon();
    return stmt;
}

StmtPtr Parser::parse_try() {
    auto stmt = make_stmt(StmtKind::Try, peek().line);
    advance();
    stmt->body = parse_block();
    if (check_word("catch")) {
        advance();
        if (match("(")) {
            stmt->catch_param = parse_binding_target();
            expect(")");
        }
        stmt->handler = parse_block();
    }
    if (check_word("finally")) {
        advance();
        stmt->finalizer = parse_block();
    }
    if (!stmt->handler && !stmt->finalizer) {
        fail("Missing catch or finally after try");
    }
    return stmt;
}

StmtPtr Parser::parse_switch() {
    auto stmt = make_stmt(StmtKind::Switch, peek().line);
    advance();
    expect("(");
    stmt->expr = parse_expression();
    expect(")");
    expect("{");
    bool seen_default = false;
    while (!match("}")) {
        SwitchCase entry;
        if (check_word("case")) {
            advance();
            entry.test = parse_expression();
        } else if (check_word("default")) {
            if (seen_default) {
                fail("More than one default clause in switch statement");
            }
            seen_default = true;
            advance();
        } else {
            fail_unexpected();
        }
        expect(":");
        while (!check("}") && !check_word("case") && !check_word("default")) {
            if (peek().type == TokenType::End) {
                fail_unexpected();
            }
            entry.body.push_back(parse_statement());
        }
        stmt->cases.push_back(std::move(entry));
    }
    return stmt;
}

PatternPtr Parser::parse_binding_target() {
    if (check("[")) {
        return parse_array_pattern();
    }
    if (check("{")) {
        return parse_object_pattern();
    }
    auto pattern = std::make_shared<Pattern>();
    pattern->name = expect_identifier();
    return pattern;
}

PatternPtr Parser::parse_array_pattern() {
    auto pattern = std::make_shared<Pattern>();
    pattern->kind = Pattern::Kind::Array;
    expect("[");
    while (!check("]")) {
        if (match(",")) {
            pattern->entries.push_back(PatternEntry{});
            continue;
        }
        if (match("...")) {
            pattern->rest = parse_binding_target();
            break;
        }
        PatternEntry entry;
        entry.target = parse_binding_target();
        if (match("=")) {
            entry.default_value = parse_assignment();
        }
        pattern->entries.push_back(std::move(entry));
        if (!check("]")) {
            expect(",");
        }
    }
    expect("]");
    return pattern;
}

PatternPtr Parser::parse_object_pattern() {
    auto pattern = std::make_shared<Pattern>();
    pattern->kind = Pattern::Kind::Object;
    expect("{");
    while (!check("}")) {
        if (match("...")) {
            pattern->rest = std::make_shared<Pattern>();
            pattern->rest->name = expect_identifier();
            break;
        }
        PatternEntry entry;
        const Token& key = peek();
        bool shorthand_allowed = false;
        if (match("[")) {
            entry.computed_key = parse_assignment();
            expect("]");
        } else if (key.type == TokenType::Identifier) {
            entry.key = key.text;
            shorthand_allowed = reserved_words().count(key.text) == 0;
            advance();
        } else if (key.type == TokenType::String) {
            entry.key = key.text;
            advance();
        } else if (key.type == TokenType::Number) {
            entry.key = format_number(key.number);
            advance();
        } else {
            fail_unexpected();
        }

        if (match(":")) {
            entry.target = parse_binding_target();
        } else {
            if (!shorthand_allowed) {
                fail_unexpected();
            }
            entry.target = std::make_shared<Pattern>();
            entry.target->name = entry.key;
        }
        if (match("=")) {
            entry.default_value = parse_assignment();
        }
        pattern->entries.push_back(std::move(entry));
        if (!check("}")) {
            expect(",");
        }
    }
    expect("}");
    return pattern;
}

void Parser::parse_parameters(FunctionNode& function) {
    expect("(");
    while (!check(")")) {
        if (match("...")) {
            function.rest = parse_binding_target();
            break;
        }
        PatternEntry param;
        param.target = parse_binding_target();
        if (match("=")) {
            param.default_value = parse_assignment();
        }
        function.params.push_back(std::move(param));
        if (!check(")")) {
            expect(",");
        }
    }
    expect(")");
}

std::shared_ptr<FunctionNode> Parser::parse_function_rest(const std::string& name,
                                                          const int line) {
    auto function = std::make_shared<FunctionNode>();
    function->name = name;
    function->line = line;
    parse_parameters(*function);
    parse_function_body(*function);
    return function;
}

void Parser::parse_function_body(FunctionNode& function) {
    expect("{");
    while (!check("}")) {
        if (peek().type == TokenType::End) {
            fail_unexpected();
        }
        function.body.push_back(parse_statement());
    }
    advance();
}

ExprPtr Parser::parse_expression() {
    ExprPtr first = parse_assignment();
    if (!check(",")) {
        return first;
    }
    auto sequence = make_expr(ExprKind::Sequence, first->line);
    sequence->items.push_back(first);
    while (match(",")) {
        sequence->items.push_back(parse_assignment());
    }
    return sequence;
}

bool Parser::at_arrow_function() const {
    std::size_t start = 0;
    if (check_word("async") && !peek(1).newline_before &&
        ((peek(1).type == TokenType::Identifier && reserved_words().count(peek(1).text) == 0) ||
         (peek(1).type == TokenType::Punctuator && peek(1).text == "("))) {
        start = 1;
    }
    const Token& first = peek(start);
    if (first.type == TokenType::Identifier) {
        const Token& next = peek(start + 1);
        return reserved_words().count(first.text) == 0 &&
               next.type == TokenType::Punctuator && next.text == "=>";
    }
    if (first.type != TokenType::Punctuator || first.text != "(") {
        return false;
    }
    int depth = 0;
    for (std::size_t i = pos_ + start; i < tokens_.size(); ++i) {
        const Token& token = tokens_[i];
        if (token.type == TokenType::End) {
            return false;
        }
        if (token.type != TokenType::Punctuator) {
            continue;
        }
        if (token.text == "(" || token.text == "[" || token.text == "{") {
            ++depth;
        } else if (token.text == ")" || token.text == "]" || token.text == "}") {
            --depth;
            if (depth == 0) {
                return i + 1 < tokens_.size() && tokens_[i + 1].type == TokenType::Punctuator &&
                       tokens_[i + 1].text == "=>";
            }
        }
    }
    return false;
}

ExprPtr Parser::parse_arrow_function() {
    auto expr = make_expr(ExprKind::Function, peek().line);
    auto function = std::make_shared<FunctionNode>();
    function->is_arrow = true;
    function->name = "<anonymous>";
    function->line = peek().line;
    if (check_word("async")) {
        advance();
    }
    if (peek().type == TokenType::Identifier) {
        PatternEntry param;
        param.target = std::make_shared<Pattern>();
        param.target->name = expect_identifier();
        function->params.push_back(std::move(param));
    } else {
        parse_parameters(*function);
    }
    expect("=>");
    if (check("{")) {
        parse_function_body(*function);
    } else {
        function->expression_body = parse_assignment();
    }
    expr->function = function;
    return expr;
}

ExprPtr Parser::parse_assignment() {
    if (at_arrow_function()) {
        return parse_arrow_function();
    }
    ExprPtr left = parse_conditional();
    if (!is_assignment_operator(peek())) {
        return left;
    }
    if (left->kind != ExprKind::Identifier && left->kind != ExprKind::Member) {
        fail("Invalid left-hand side in assignment");
    }
    if (left->kind == ExprKind::Member && left->optional) {
        fail("Invalid left-hand side in assignment");
    }
    auto assign = make_expr(ExprKind::Assign, left->line);
    assign->text = advance().text;
    assign->a = left;
    assign->b = parse_assignment();
    return assign;
}

ExprPtr Parser::parse_conditional() {
    ExprPtr test = parse_binary(1);
    if (!match("?")) {
        return test;
    }
    auto conditional = make_expr(ExprKind::Conditional, test->line);
    conditional->a = test;
    conditional->b = parse_assignment();
    expect(":");
    conditional->c = parse_assignment();
    return conditional;
}

ExprPtr Parser::parse_binary(const int min_precedence) {
    ExprPtr left = parse_unary();
    while (true) {
        const int precedence = binary_precedence(peek());
        if (precedence < min_precedence || precedence < 0) {
            return left;
        }
        const std::string op = advance().text;
        // "**" is right-associative.
        ExprPtr right = op == "**" ? parse_binary(precedence) : parse_binary(precedence + 1);
        const bool logical = op == "&&" || op == "||" || op == "??";
        auto node = make_expr(logical ? ExprKind::Logical : ExprKind::Binary, left->line);
        node->text = op;
        node->a = left;
        node->b = right;
        left = node;
    }
}

ExprPtr Parser::parse_unary() {
    NestingGuard guard(depth_);
    if (depth_ > kMaxNesting) {
        fail("Expression nesting too deep");
    }

    const Token& token = peek();
    const bool unary_punct = token.type == TokenType::Punctuator &&
                             (token.text == "!" || token.text == "-" || token.text == "+" ||
                              token.text == "~");
    const bool unary_word = token.type == TokenType::Identifier &&
                            (token.text == "typeof" || token.text == "void" ||
                             token.text == "delete" || token.text == "await");
    if (unary_punct || unary_word) {
        auto node = make_expr(ExprKind::Unary, token.line);
        node->text = advance().text;
        node->a = parse_unary();
        return node;
    }
    if (check("++") || check("--")) {
        auto node = make_expr(ExprKind::Update, token.line);
        node->text = advance().text;
        node->flag = true;
        node->a = parse_unary();
        if (node->a->kind != ExprKind::Identifier && node->a->kind != ExprKind::Member) {
            fail("Invalid left-hand side expression in prefix operation");
        }
        return node;
    }
    return parse_postfix();
}

ExprPtr Parser::parse_postfix() {
    ExprPtr base = check_word("new") ? parse_new() : parse_primary();
    ExprPtr expr = parse_call_member(base, true);
    if ((check("++") || check("--")) && !peek().newline_before) {
        if (expr->kind != ExprKind::Identifier && expr->kind != ExprKind::Member) {
            fail("Invalid left-hand side expression in postfix operation");
        }
        auto node = make_expr(ExprKind::Update, expr->line);
        node->text = advance().text;
        node->flag = false;
        node->a = expr;
        return node;
    }
    return expr;
}

ExprPtr Parser::parse_call_member(ExprPtr object, const bool allow_call) {
    bool in_optional_chain = false;
    while (true) {
        const int line = peek().line;
        if (match(".")) {
            if (peek().type != TokenType::Identifier) {
                fail_unexpected();
            }
            auto member = make_expr(ExprKind::Member, line);
            member->a = object;
            member->text = advance().text;
            member->optional = in_optional_chain;
            object = member;
        } else if (check("?.")) {
            if (!allow_call) {
                fail("Invalid optional chain from new expression");
            }
            advance();
            in_optional_chain = true;
            if (check("(")) {
                auto call = make_expr(ExprKind::Call, line);
                call->a = object;
                call->items = parse_arguments();
                call->optional = true;
                object = call;
            } else if (match("[")) {
                auto member = make_expr(ExprKind::Member, line);
                member->a = object;
                member->b = parse_expression();
                member->flag = true;
                member->optional = true;
                expect("]");
                object = member;
            } else {
                if (peek().type != TokenType::Identifier) {
                    fail_unexpected();
                }
                auto member = make_expr(ExprKind::Member, line);
                member->a = object;
                member->text = advance().text;
                member->optional = true;
                object = member;
            }
        } else if (match("[")) {
            auto member = make_expr(ExprKind::Member, line);
            member->a = object;
            member->b = parse_expression();
            member->flag = true;
            member->optional = in_optional_chain;
            expect("]");
            object = member;
        } else if (allow_call && check("(")) {
            auto call = make_expr(ExprKind::Call, line);
            call->a = object;
            call->items = parse_arguments();
            call->optional = in_optional_chain;
            object = call;
        } else if (peek().type == TokenType::Template && !peek().newline_before) {
            fail("Tagged templates are not supported");
        } else {
            return object;
        }
    }
}

std::vector<ExprPtr> Parser::parse_arguments() {
    std::vector<ExprPtr> args;
    expect("(");
    while (!check(")")) {
        if (check("...")) {
            auto spread = make_expr(ExprKind::Spread, advance().line);
            spread->a = parse_assignment();
            args.push_back(spread);
        } else {
            args.push_back(parse_assignment());
        }
        if (!check(")")) {
            expect(",");
        }
    }
    expect(")");
    return args;
}

ExprPtr Parser::parse_new() {
    auto node = make_expr(ExprKind::New, peek().line);
    advance();
    ExprPtr callee = check_word("new") ? parse_new() : parse_primary();
    node->a = parse_call_member(callee, false);
    if (check("(")) {
        node->items = parse_arguments();
    }
    return node;
}

ExprPtr Parser::parse_primary() {
    const Token& token = peek();
    switch (token.type) {
        case TokenType::Number: {
            auto node = make_expr(ExprKind::Number, token.line);
            node->number = advance().number;
            return node;
        }
        case TokenType::String: {
            auto node = make_expr(ExprKind::String, token.line);
            node->text = advance().text;
            return node;
        }
        case TokenType::Template: {
            const Token& tpl = advance();
            return parse_template(tpl);
        }
        case TokenType::End:
            fail_unexpected();
        default:
            break;
    }

    if (token.type == TokenType::Identifier) {
        const std::string& word = token.text;
        const int line = token.line;
        if (word == "true" || word == "false") {
            auto node = make_expr(ExprKind::Boolean, line);
            node->flag = word == "true";
            advance();
            return node;
        }
        if (word == "null") {
            advance();
            return make_expr(ExprKind::Null, line);
        }
        if (word == "function" ||
            (word == "async" && peek(1).type == TokenType::Identifier &&
             peek(1).text == "function" && !peek(1).newline_before)) {
            if (word == "async") {
                advance();
            }
            advance();
            if (check("*")) {
                fail("Generator functions are not supported");
            }
            std::string name = "<anonymous>";
            if (peek().type == TokenType::Identifier) {
                name = expect_identifier();
            }
            auto node = make_expr(ExprKind::Function, line);
            node->function = parse_function_rest(name, line);
            return node;
        }
        if (word == "this") {
            auto node = make_expr(ExprKind::Identifier, line);
            node->text = advance().text;
            return node;
        }
        if (word == "class" || word == "import" || word == "super" || word == "yield") {
            fail("'" + word + "' is not supported");
        }
        auto node = make_expr(ExprKind::Identifier, line);
        node->text = expect_identifier();
        return node;
    }

    if (check("(")) {
        advance();
        ExprPtr inner = parse_expression();
        expect(")");
        return inner;
    }
    if (check("[")) {
        return parse_array_literal();
    }
    if (check("{")) {
        return parse_object_literal();
    }
    fail_unexpected();
}

ExprPtr Parser::parse_array_literal() {
    auto node = make_expr(ExprKind::Array, peek().line);
    expect("[");
    while (!check("]")) {
        if (check(",")) {
            node->items.push_back(make_expr(ExprKind::Hole, advance().line));
            continue;
        }
        if (check("...")) {
            auto spread = make_expr(ExprKind::Spread, advance().line);
            spread->a = parse_assignment();
            node->items.push_back(spread);
        } else {
            node->items.push_back(parse_assignment());
        }
        if (!check("]")) {
            expect(",");
        }
    }
    expect("]");
    return node;
}

ExprPtr Parser::parse_object_literal() {
    auto node = make_expr(ExprKind::Object, peek().line);
    expect("{");
    while (!check("}")) {
        ObjectProperty property;
        if (match("...")) {
            property.spread = true;
            property.value = parse_assignment();
            node->properties.push_back(std::move(property));
            if (!check("}")) {
                expect(",");
            }
            continue;
        }

        // "async name() {}" method shorthand
        if (check_word("async") && peek(1).type != TokenType::Punctuator) {
            advance();
        }

        const Token& key = peek();
        const int line = key.line;
        bool shorthand_allowed = false;
        if (match("[")) {
            property.computed_key = parse_assignment();
            expect("]");
        } else if (key.type == TokenType::Identifier) {
            property.key = key.text;
            shorthand_allowed = reserved_words().count(key.text) == 0;
            advance();
        } else if (key.type == TokenType::String) {
            property.key = key.text;
            advance();
        } else if (key.type == TokenType::Number) {
            property.key = format_number(key.number);
            advance();
        } else {
            fail_unexpected();
        }

        if (check("(")) {
            auto method = make_expr(ExprKind::Function, line);
            method->function = parse_function_rest(property.key.empty() ? "<anonymous>"
                                                                        : property.key,
                                                   line);
            property.value = method;
        } else if (match(":")) {
            property.value = parse_assignment();
        } else {
            if (!shorthand_allowed) {
                fail_unexpected();
            }
            auto reference = make_expr(ExprKind::Identifier, line);
            reference->text = property.key;
            property.value = reference;
        }
        node->properties.push_back(std::move(property));
        if (!check("}")) {
            expect(",");
        }
    }
    expect("}");
    return node;
}

ExprPtr Parser::parse_template(const Token& token) {
    auto node = make_expr(ExprKind::Template, token.line);
    node->strings = token.quasis;
    for (const auto& source : token.substitutions) {
        node->items.push_back(parse_standalone_expression(source, token.line));
    }
    return node;
}

}  // namespace toolbridge::script
