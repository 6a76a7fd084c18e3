#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "script/ast.hpp"
#include "script/value.hpp"

namespace toolbridge::script {

class Scope {
public:
    struct Binding {
        Value value;
        bool is_const = false;
    };

    Scope(std::shared_ptr<Scope> parent, bool function_scope)
        : parent_(std::move(parent)), function_scope_(function_scope) {}

    // Returns false if the name is already declared in this scope.
    bool declare(const std::string& name, Value value, bool is_const);
    Binding* find(const std::string& name);
    Binding* find_own(const std::string& name);
    Scope& nearest_function_scope();
    void copy_bindings_from(const Scope& other);
    void clear() { bindings_.clear(); }

private:
    std::shared_ptr<Scope> parent_;
    bool function_scope_;
    std::unordered_map<std::string, Binding> bindings_;
};

// Tree-walking interpreter for the snippet language. One instance runs one
// snippet; host functions are installed as globals before run(). Arrays,
// objects and functions created while it is alive are emptied when it is
// destroyed, so convert results (to_json) before letting it go.
class Interpreter {
public:
    static constexpr std::size_t kDefaultMaxCallDepth = 256;

    Interpreter();
    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    void define_global(const std::string& name, Value value);

    // Execution stops with a TimeoutError once the deadline passes.
    void set_timeout(std::chrono::milliseconds timeout);
    void set_max_call_depth(std::size_t depth) { max_call_depth_ = depth; }

    // Parses the source and runs it as the body of an async function,
    // returning its completion value. Throws ScriptError.
    Value run(const std::string& source);

    Value call(const Value& callee, std::vector<Value> args, const Value& this_value = Value());

    Value get_property(const Value& object, const std::string& key);
    void set_property(const Value& object, const std::string& key, Value value);

    // Error object whose stack reflects the current call frames.
    Value make_error(const std::string& name, const std::string& message) const;
    [[noreturn]] void throw_error(const std::string& name, const std::string& message) const;

    void check_budget() const;

private:
    enum class Flow {
        Normal,
        Return,
        Break,
        Continue
    };

    struct Frame {
        std::string name;
        int line;
    };

    class FrameGuard;

    std::shared_ptr<Scope> new_scope(std::shared_ptr<Scope> parent, bool function_scope);

    Flow exec_statements(const std::vector<StmtPtr>& statements,
                         const std::shared_ptr<Scope>& scope, Value& result);
    Flow exec(const Stmt& stmt, const std::shared_ptr<Scope>& scope, Value& result);
    void exec_declaration(const Stmt& stmt, const std::shared_ptr<Scope>& scope);
    Flow exec_if(const Stmt& stmt, const std::shared_ptr<Scope>& scope, Value& result);
    Flow exec_while(const Stmt& stmt, const std::shared_ptr<Scope>& scope, Value& result);
    Flow exec_for(const Stmt& stmt, const std::shared_ptr<Scope>& scope, Value& result);
    Flow exec_for_each(const Stmt& stmt, const std::shared_ptr<Scope>& scope, Value& result);
    Flow exec_try(const Stmt& stmt, const std::shared_ptr<Scope>& scope, Value& result);
    Flow exec_switch(const Stmt& stmt, const std::shared_ptr<Scope>& scope, Value& result);
    void hoist_functions(const std::vector<StmtPtr>& statements,
                         const std::shared_ptr<Scope>& scope);

    void bind_pattern(const Pattern& pattern, const Value& value,
                      const std::shared_ptr<Scope>& scope, const std::string& decl_kind);
    void bind_name(const std::string& name, const Value& value,
                   const std::shared_ptr<Scope>& scope, const std::string& decl_kind);
    void assign_name(const std::string& name, const Value& value,
                     const std::shared_ptr<Scope>& scope);

    Value eval(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_identifier(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_array(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_object(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_unary(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_update(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_logical(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_assign(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_member(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_call(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value eval_new(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value binary_operation(const std::string& op, const Value& left, const Value& right);
    Value member_key(const Expr& member, const std::shared_ptr<Scope>& scope);
    std::vector<Value> eval_arguments(const std::vector<ExprPtr>& args,
                                      const std::shared_ptr<Scope>& scope);
    std::vector<Value> iterate(const Value& iterable);

    Value get_member(const Value& object, const Value& key);
    void set_member(const Value& object, const Value& key, Value value);

    Value make_closure(const std::shared_ptr<FunctionNode>& node,
                       const std::shared_ptr<Scope>& scope);
    Value invoke_script(const FunctionData& function, std::vector<Value>& args,
                        const Value& this_value);
    bool instance_of(const Value& value, const Value& constructor);
    std::string describe_callee(const Expr& callee) const;

    // First member: installed before the builtins are created.
    ContainerArena arena_;
    std::shared_ptr<Scope> globals_;
    std::vector<std::weak_ptr<Scope>> scopes_;
    std::size_t scope_prune_threshold_ = 1024;
    std::vector<Frame> frames_;
    std::size_t max_call_depth_ = kDefaultMaxCallDepth;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::chrono::milliseconds timeout_{0};
};

// Property key for a value used as obj[key].
std::string to_property_key(const Value& key);

// Splits a UTF-8 string into one string per code point.
std::vector<std::string> utf8_characters(const std::string& text);

}  // namespace toolbridge::script
