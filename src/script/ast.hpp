#pragma once

#include <memory>
#include <string>
#include <vector>

namespace toolbridge::script {

struct Expr;
struct Stmt;
struct Pattern;
struct FunctionNode;

using ExprPtr = std::shared_ptr<Expr>;
using StmtPtr = std::shared_ptr<Stmt>;
using PatternPtr = std::shared_ptr<Pattern>;

// One slot of a destructuring pattern or parameter list. For array patterns
// a null target is a hole.
struct PatternEntry {
    std::string key;
    ExprPtr computed_key;
    PatternPtr target;
    ExprPtr default_value;
};

struct Pattern {
    enum class Kind {
        Identifier,
        Array,
        Object
    };

    Kind kind = Kind::Identifier;
    std::string name;
    std::vector<PatternEntry> entries;
    PatternPtr rest;
};

struct FunctionNode {
    std::string name;
    std::vector<PatternEntry> params;
    PatternPtr rest;
    std::vector<StmtPtr> body;
    // Arrow functions with a concise body
    ExprPtr expression_body;
    bool is_arrow = false;
    int line = 1;
};

enum class ExprKind {
    Number,
    String,
    Template,
    Boolean,
    Null,
    Identifier,
    Array,
    Object,
    Function,
    Unary,
    Update,
    Binary,
    Logical,
    Conditional,
    Assign,
    Member,
    Call,
    New,
    Spread,
    Sequence,
    Hole
};

struct ObjectProperty {
    std::string key;
    ExprPtr computed_key;
    ExprPtr value;
    bool spread = false;
};

// Fields are shared across kinds:
//   text      identifier name, string value, operator, static member name
//   a, b, c   operands (object/callee/left, property/right, alternate)
//   items     array elements, call arguments, template substitutions
//   flag      computed member, prefix update, boolean literal value
//   optional  member or call inside an optional chain
struct Expr {
    ExprKind kind = ExprKind::Null;
    int line = 1;
    double number = 0.0;
    std::string text;
    bool flag = false;
    bool optional = false;
    ExprPtr a;
    ExprPtr b;
    ExprPtr c;
    std::vector<ExprPtr> items;
    std::vector<std::string> strings;
    std::vector<ObjectProperty> properties;
    std::shared_ptr<FunctionNode> function;
};

enum class StmtKind {
    Expression,
    VarDecl,
    FunctionDecl,
    Return,
    If,
    Block,
    While,
    DoWhile,
    For,
    ForOf,
    ForIn,
    Break,
    Continue,
    Throw,
    Try,
    Switch,
    Empty
};

struct Declarator {
    PatternPtr target;
    ExprPtr init;
};

struct SwitchCase {
    // Null for "default:"
    ExprPtr test;
    std::vector<StmtPtr> body;
};

struct Stmt {
    StmtKind kind = StmtKind::Empty;
    int line = 1;
    // Expression, return/throw argument, loop or if test, for-of subject
    ExprPtr expr;
    // "const", "let", "var"; empty for loop heads binding an existing name
    std::string decl_kind;
    std::vector<Declarator> declarations;
    PatternPtr binding;
    StmtPtr init;
    ExprPtr update;
    StmtPtr body;
    StmtPtr alternate;
    std::vector<StmtPtr> statements;
    std::shared_ptr<FunctionNode> function;
    PatternPtr catch_param;
    StmtPtr handler;
    StmtPtr finalizer;
    std::vector<SwitchCase> cases;
};

}  // namespace toolbridge::script
