#include "script/interpreter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <set>
#include "script/builtins.hpp"
#include "script/parser.hpp"
#include "script/script_error.hpp"

namespace toolbridge::script {

using core::errors::ErrorCategory;

namespace {

constexpr double kMaxArrayLength = 16777216.0;
constexpr const char* kSnippetFrame = "<snippet>";

std::int32_t to_int32(const double value) {
    if (!std::isfinite(value)) {
        return 0;
    }
    double wrapped = std::fmod(std::trunc(value), 4294967296.0);
    if (wrapped < 0) {
        wrapped += 4294967296.0;
    }
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(wrapped));
}

std::uint32_t to_uint32(const double value) {
    return static_cast<std::uint32_t>(to_int32(value));
}

bool is_primitive(const Value& value) {
    return !value.is_array() && !value.is_object() && !value.is_function();
}

std::optional<std::size_t> parse_index(const std::string& key) {
    if (key.empty() || key.size() > 15 || (key.size() > 1 && key[0] == '0')) {
        return std::nullopt;
    }
    std::size_t index = 0;
    for (const char c : key) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        index = index * 10 + static_cast<std::size_t>(c - '0');
    }
    return index;
}

std::optional<std::size_t> number_index(const Value& key) {
    if (!key.is_number()) {
        return std::nullopt;
    }
    const double number = key.as_number();
    if (number < 0 || std::trunc(number) != number || number >= kMaxArrayLength * 64) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(number);
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string to_property_key(const Value& key) {
    if (key.is_string()) {
        return key.as_string();
    }
    return key.to_display_string();
}

std::vector<std::string> utf8_characters(const std::string& text) {
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 1;
        if (lead >= 0xF0) {
            length = 4;
        } else if (lead >= 0xE0) {
            length = 3;
        } else if (lead >= 0xC0) {
            length = 2;
        }
        length = std::min(length, text.size() - i);
        out.push_back(text.substr(i, length));
        i += length;
    }
    return out;
}

bool Scope::declare(const std::string& name, Value value, const bool is_const) {
    return bindings_.emplace(name, Binding{std::move(value), is_const}).second;
}

Scope::Binding* Scope::find_own(const std::string& name) {
    const auto it = bindings_.find(name);
    return it == bindings_.end() ? nullptr : &it->second;
}

Scope::Binding* Scope::find(const std::string& name) {
    for (Scope* scope = this; scope != nullptr; scope = scope->parent_.get()) {
        if (Binding* binding = scope->find_own(name)) {
            return binding;
        }
    }
    return nullptr;
}

Scope& Scope::nearest_function_scope() {
    Scope* scope = this;
    while (!scope->function_scope_ && scope->parent_) {
        scope = scope->parent_.get();
    }
    return *scope;
}

void Scope::copy_bindings_from(const Scope& other) {
    for (const auto& entry : other.bindings_) {
        bindings_[entry.first] = entry.second;
    }
}

class Interpreter::FrameGuard {
public:
    FrameGuard(std::vector<Frame>& frames, const std::string& name, const int line)
        : frames_(frames) {
        frames_.push_back(Frame{name, line});
    }
    ~FrameGuard() { frames_.pop_back(); }

    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;

private:
    std::vector<Frame>& frames_;
};

Interpreter::Interpreter() {
    globals_ = new_scope(nullptr, true);
    globals_->declare("undefined", Value(), true);
    globals_->declare("NaN", Value(std::nan("")), true);
    globals_->declare("Infinity", Value(HUGE_VAL), true);
    globals_->declare("this", Value(), true);
    install_builtins(*this);
}

Interpreter::~Interpreter() {
    // Snippets can build cycles (closures capturing their own scope, objects
    // pointing at themselves); empty everything this run allocated.
    arena_.release();
    for (const auto& weak : scopes_) {
        if (auto scope = weak.lock()) {
            scope->clear();
        }
    }
}

void Interpreter::define_global(const std::string& name, Value value) {
    if (Scope::Binding* existing = globals_->find_own(name)) {
        existing->value = std::move(value);
        return;
    }
    globals_->declare(name, std::move(value), false);
}

void Interpreter::set_timeout(const std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    if (timeout.count() > 0) {
        deadline_ = std::chrono::steady_clock::now() + timeout;
    } else {
        deadline_.reset();
    }
}

void Interpreter::check_budget() const {
    if (deadline_ && std::chrono::steady_clock::now() > *deadline_) {
        throw ScriptError(make_error("TimeoutError", "Execution timed out after " +
                                                         std::to_string(timeout_.count()) +
                                                         " ms"),
                          ErrorCategory::Timeout);
    }
}

Value Interpreter::make_error(const std::string& name, const std::string& message) const {
    Value error = make_error_object(name, message);
    std::string stack = name + ": " + message;
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (it->name == kSnippetFrame) {
            stack += "\n    at " + it->name + ":" + std::to_string(it->line);
        } else {
            stack += "\n    at " + it->name + " (" + kSnippetFrame + ":" +
                     std::to_string(it->line) + ")";
        }
    }
    error.as_object().properties["stack"] = stack;
    return error;
}

void Interpreter::throw_error(const std::string& name, const std::string& message) const {
    throw ScriptError(make_error(name, message));
}

std::shared_ptr<Scope> Interpreter::new_scope(std::shared_ptr<Scope> parent,
                                              const bool function_scope) {
    auto scope = std::make_shared<Scope>(std::move(parent), function_scope);
    scopes_.push_back(scope);
    if (scopes_.size() > scope_prune_threshold_) {
        scopes_.erase(std::remove_if(scopes_.begin(), scopes_.end(),
                                     [](const std::weak_ptr<Scope>& weak) {
                                         return weak.expired();
                                     }),
                      scopes_.end());
        scope_prune_threshold_ = std::max<std::size_t>(1024, scopes_.size() * 2);
    }
    return scope;
}

Value Interpreter::run(const std::string& source) {
    const Program program = Parser::parse_program(source);
    FunctionData entry;
    entry.name = kSnippetFrame;
    entry.node = program.function;
    entry.closure = globals_;
    std::vector<Value> args;
    return invoke_script(entry, args, Value());
}

Value Interpreter::call(const Value& callee, std::vector<Value> args, const Value& this_value) {
    check_budget();
    if (!callee.is_function()) {
        throw_error("TypeError", callee.type_of() + " is not a function");
    }
    const std::shared_ptr<FunctionData> function = callee.as_function();
    if (function->is_native()) {
        return function->native(*this, args);
    }
    return invoke_script(*function, args, this_value);
}

Value Interpreter::make_closure(const std::shared_ptr<FunctionNode>& node,
                                const std::shared_ptr<Scope>& scope) {
    auto function = std::make_shared<FunctionData>();
    function->name = node->name;
    function->node = node;
    function->closure = scope;
    ContainerArena::track(function);
    return Value(std::move(function));
}

Value Interpreter::invoke_script(const FunctionData& function, std::vector<Value>& args,
                                 const Value& this_value) {
    if (frames_.size() >= max_call_depth_) {
        throw_error("RangeError", "Maximum call stack size exceeded");
    }
    const std::shared_ptr<const FunctionNode> node = function.node;
    FrameGuard guard(frames_, function.name, node->line);

    auto scope = new_scope(function.closure, true);
    if (!node->is_arrow) {
        scope->declare("this", this_value, false);
        scope->declare("arguments", Value::array(args), false);
    }
    for (std::size_t i = 0; i < node->params.size(); ++i) {
        const PatternEntry& param = node->params[i];
        Value value = i < args.size() ? args[i] : Value();
        if (value.is_undefined() && param.default_value) {
            value = eval(*param.default_value, scope);
        }
        bind_pattern(*param.target, value, scope, "let");
    }
    if (node->rest) {
        std::vector<Value> rest;
        for (std::size_t i = node->params.size(); i < args.size(); ++i) {
            rest.push_back(args[i]);
        }
        bind_pattern(*node->rest, Value::array(std::move(rest)), scope, "let");
    }

    if (node->expression_body) {
        return eval(*node->expression_body, scope);
    }
    Value result;
    if (exec_statements(node->body, scope, result) == Flow::Return) {
        return result;
    }
    return Value();
}

void Interpreter::hoist_functions(const std::vector<StmtPtr>& statements,
                                  const std::shared_ptr<Scope>& scope) {
    for (const auto& stmt : statements) {
        if (stmt->kind != StmtKind::FunctionDecl) {
            continue;
        }
        Value closure = make_closure(stmt->function, scope);
        if (Scope::Binding* existing = scope->find_own(stmt->function->name)) {
            existing->value = closure;
        } else {
            scope->declare(stmt->function->name, closure, false);
        }
    }
}

Interpreter::Flow Interpreter::exec_statements(const std::vector<StmtPtr>& statements,
                                               const std::shared_ptr<Scope>& scope,
                                               Value& result) {
    hoist_functions(statements, scope);
    for (const auto& stmt : statements) {
        const Flow flow = exec(*stmt, scope, result);
        if (flow != Flow::Normal) {
            return flow;
        }
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::exec(const Stmt& stmt, const std::shared_ptr<Scope>& scope,
                                    Value& result) {
    check_budget();
    if (!frames_.empty()) {
        frames_.back().line = stmt.line;
    }

    switch (stmt.kind) {
        case StmtKind::Expression:
            eval(*stmt.expr, scope);
            return Flow::Normal;
        case StmtKind::VarDecl:
            exec_declaration(stmt, scope);
            return Flow::Normal;
        case StmtKind::FunctionDecl:
        case StmtKind::Empty:
            return Flow::Normal;
        case StmtKind::Return:
            result = stmt.expr ? eval(*stmt.expr, scope) : Value();
            return Flow::Return;
        case StmtKind::If:
            return exec_if(stmt, scope, result);
        case StmtKind::Block:
            return exec_statements(stmt.statements, new_scope(scope, false), result);
        case StmtKind::While:
        case StmtKind::DoWhile:
            return exec_while(stmt, scope, result);
        case StmtKind::For:
            return exec_for(stmt, scope, result);
        case StmtKind::ForOf:
        case StmtKind::ForIn:
            return exec_for_each(stmt, scope, result);
        case StmtKind::Break:
            return Flow::Break;
        case StmtKind::Continue:
            return Flow::Continue;
        case StmtKind::Throw:
            throw ScriptError(eval(*stmt.expr, scope));
        case StmtKind::Try:
            return exec_try(stmt, scope, result);
        case StmtKind::Switch:
            return exec_switch(stmt, scope, result);
    }
    return Flow::Normal;
}

void Interpreter::exec_declaration(const Stmt& stmt, const std::shared_ptr<Scope>& scope) {
    for (const auto& declarator : stmt.declarations) {
        // "var x;" keeps an existing value.
        if (!declarator.init && stmt.decl_kind == "var" &&
            declarator.target->kind == Pattern::Kind::Identifier &&
            scope->nearest_function_scope().find_own(declarator.target->name) != nullptr) {
            continue;
        }
        const Value value = declarator.init ? eval(*declarator.init, scope) : Value();
        bind_pattern(*declarator.target, value, scope, stmt.decl_kind);
    }
}

Interpreter::Flow Interpreter::exec_if(const Stmt& stmt, const std::shared_ptr<Scope>& scope,
                                       Value& result) {
    if (eval(*stmt.expr, scope).truthy()) {
        return exec(*stmt.body, scope, result);
    }
    if (stmt.alternate) {
        return exec(*stmt.alternate, scope, result);
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::exec_while(const Stmt& stmt, const std::shared_ptr<Scope>& scope,
                                          Value& result) {
    while (true) {
        if (stmt.kind == StmtKind::While && !eval(*stmt.expr, scope).truthy()) {
            break;
        }
        const Flow flow = exec(*stmt.body, scope, result);
        if (flow == Flow::Return) {
            return flow;
        }
        if (flow == Flow::Break) {
            break;
        }
        if (stmt.kind == StmtKind::DoWhile && !eval(*stmt.expr, scope).truthy()) {
            break;
        }
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::exec_for(const Stmt& stmt, const std::shared_ptr<Scope>& scope,
                                        Value& result) {
    auto current = new_scope(scope, false);
    // let/const loop variables get a fresh binding per iteration.
    const bool per_iteration = stmt.init && stmt.init->kind == StmtKind::VarDecl &&
                               stmt.init->decl_kind != "var";
    if (stmt.init) {
        Value ignored;
        exec(*stmt.init, current, ignored);
    }
    while (true) {
        check_budget();
        if (stmt.expr && !eval(*stmt.expr, current).truthy()) {
            break;
        }
        const Flow flow = exec(*stmt.body, current, result);
        if (flow == Flow::Return) {
            return flow;
        }
        if (flow == Flow::Break) {
            break;
        }
        if (per_iteration) {
            auto next = new_scope(scope, false);
            next->copy_bindings_from(*current);
            current = next;
        }
        if (stmt.update) {
            eval(*stmt.update, current);
        }
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::exec_for_each(const Stmt& stmt,
                                             const std::shared_ptr<Scope>& scope,
                                             Value& result) {
    const Value subject = eval(*stmt.expr, scope);
    std::vector<Value> items;
    if (stmt.kind == StmtKind::ForOf) {
        items = iterate(subject);
    } else if (subject.is_object()) {
        for (const auto& entry : subject.as_object().properties) {
            items.emplace_back(entry.first);
        }
    } else if (subject.is_array()) {
        for (std::size_t i = 0; i < subject.as_array().items.size(); ++i) {
            items.emplace_back(std::to_string(i));
        }
    } else if (subject.is_string()) {
        for (std::size_t i = 0; i < subject.as_string().size(); ++i) {
            items.emplace_back(std::to_string(i));
        }
    } else if (subject.is_function()) {
        for (const auto& entry : subject.as_function()->properties) {
            items.emplace_back(entry.first);
        }
    }

    for (const auto& item : items) {
        check_budget();
        auto iteration = new_scope(scope, false);
        bind_pattern(*stmt.binding, item, iteration, stmt.decl_kind);
        const Flow flow = exec(*stmt.body, iteration, result);
        if (flow == Flow::Return) {
            return flow;
        }
        if (flow == Flow::Break) {
            break;
        }
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::exec_try(const Stmt& stmt, const std::shared_ptr<Scope>& scope,
                                        Value& result) {
    Flow flow = Flow::Normal;
    std::exception_ptr pending;
    try {
        flow = exec(*stmt.body, scope, result);
    } catch (const ScriptError& error) {
        if (!error.catchable() || !stmt.handler) {
            pending = std::current_exception();
        } else {
            try {
                auto catch_scope = new_scope(scope, false);
                if (stmt.catch_param) {
                    bind_pattern(*stmt.catch_param, error.thrown(), catch_scope, "let");
                }
                flow = exec(*stmt.handler, catch_scope, result);
            } catch (const ScriptError&) {
                pending = std::current_exception();
            }
        }
    }

    if (stmt.finalizer) {
        Value final_result;
        const Flow final_flow = exec(*stmt.finalizer, scope, final_result);
        if (final_flow != Flow::Normal) {
            result = final_result;
            return final_flow;
        }
    }
    if (pending) {
        std::rethrow_exception(pending);
    }
    return flow;
}

Interpreter::Flow Interpreter::exec_switch(const Stmt& stmt, const std::shared_ptr<Scope>& scope,
                                           Value& result) {
    const Value discriminant = eval(*stmt.expr, scope);
    auto block = new_scope(scope, false);

    std::optional<std::size_t> start;
    std::optional<std::size_t> default_case;
    for (std::size_t i = 0; i < stmt.cases.size(); ++i) {
        hoist_functions(stmt.cases[i].body, block);
        if (!stmt.cases[i].test) {
            default_case = i;
            continue;
        }
        if (!start && eval(*stmt.cases[i].test, block).strict_equals(discriminant)) {
            start = i;
        }
    }
    if (!start) {
        start = default_case;
    }
    if (!start) {
        return Flow::Normal;
    }

    for (std::size_t i = *start; i < stmt.cases.size(); ++i) {
        for (const auto& inner : stmt.cases[i].body) {
            const Flow flow = exec(*inner, block, result);
            if (flow == Flow::Break) {
                return Flow::Normal;
            }
            if (flow != Flow::Normal) {
                return flow;
            }
        }
    }
    return Flow::Normal;
}

void Interpreter::bind_name(const std::string& name, const Value& value,
                            const std::shared_ptr<Scope>& scope, const std::string& decl_kind) {
    if (decl_kind.empty()) {
        assign_name(name, value, scope);
        return;
    }
    if (decl_kind == "var") {
        Scope& function_scope = scope->nearest_function_scope();
        if (Scope::Binding* existing = function_scope.find_own(name)) {
            existing->value = value;
        } else {
            function_scope.declare(name, value, false);
        }
        return;
    }
    if (!scope->declare(name, value, decl_kind == "const")) {
        throw_error("SyntaxError", "Identifier '" + name + "' has already been declared");
    }
}

void Interpreter::assign_name(const std::string& name, const Value& value,
                              const std::shared_ptr<Scope>& scope) {
    Scope::Binding* binding = scope->find(name);
    if (binding == nullptr) {
        throw_error("ReferenceError", name + " is not defined");
    }
    if (binding->is_const) {
        throw_error("TypeError", "Assignment to constant variable.");
    }
    binding->value = value;
}

void Interpreter::bind_pattern(const Pattern& pattern, const Value& value,
                               const std::shared_ptr<Scope>& scope,
                               const std::string& decl_kind) {
    switch (pattern.kind) {
        case Pattern::Kind::Identifier:
            bind_name(pattern.name, value, scope, decl_kind);
            return;
        case Pattern::Kind::Array: {
            const std::vector<Value> items = iterate(value);
            for (std::size_t i = 0; i < pattern.entries.size(); ++i) {
                const PatternEntry& entry = pattern.entries[i];
                if (!entry.target) {
                    continue;
                }
                Value item = i < items.size() ? items[i] : Value();
                if (item.is_undefined() && entry.default_value) {
                    item = eval(*entry.default_value, scope);
                }
                bind_pattern(*entry.target, item, scope, decl_kind);
            }
            if (pattern.rest) {
                std::vector<Value> rest;
                for (std::size_t i = pattern.entries.size(); i < items.size(); ++i) {
                    rest.push_back(items[i]);
                }
                bind_pattern(*pattern.rest, Value::array(std::move(rest)), scope, decl_kind);
            }
            return;
        }
        case Pattern::Kind::Object: {
            if (value.is_nullish()) {
                throw_error("TypeError", "Cannot destructure '" + value.to_display_string() +
                                             "' as it is " + value.to_display_string() + ".");
            }
            std::set<std::string> used;
            for (const auto& entry : pattern.entries) {
                const std::string key = entry.computed_key
                                            ? to_property_key(eval(*entry.computed_key, scope))
                                            : entry.key;
                used.insert(key);
                Value item = get_property(value, key);
                if (item.is_undefined() && entry.default_value) {
                    item = eval(*entry.default_value, scope);
                }
                bind_pattern(*entry.target, item, scope, decl_kind);
            }
            if (pattern.rest) {
                Value rest = Value::object();
                if (value.is_object()) {
                    for (const auto& entry : value.as_object().properties) {
                        if (used.count(entry.first) == 0) {
                            rest.as_object().properties[entry.first] = entry.second;
                        }
                    }
                }
                bind_pattern(*pattern.rest, rest, scope, decl_kind);
            }
            return;
        }
    }
}

std::vector<Value> Interpreter::iterate(const Value& iterable) {
    if (iterable.is_array()) {
        return iterable.as_array().items;
    }
    if (iterable.is_string()) {
        std::vector<Value> out;
        for (auto& character : utf8_characters(iterable.as_string())) {
            out.emplace_back(std::move(character));
        }
        return out;
    }
    throw_error("TypeError", (iterable.is_nullish() ? iterable.to_display_string()
                                                    : iterable.type_of()) +
                                 " is not iterable");
}

Value Interpreter::eval(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    switch (expr.kind) {
        case ExprKind::Number:
            return Value(expr.number);
        case ExprKind::String:
            return Value(expr.text);
        case ExprKind::Template: {
            std::string out;
            for (std::size_t i = 0; i < expr.strings.size(); ++i) {
                out += expr.strings[i];
                if (i < expr.items.size()) {
                    out += eval(*expr.items[i], scope).to_display_string();
                }
            }
            return Value(std::move(out));
        }
        case ExprKind::Boolean:
            return Value(expr.flag);
        case ExprKind::Null:
            return Value(nullptr);
        case ExprKind::Identifier:
            return eval_identifier(expr, scope);
        case ExprKind::Array:
            return eval_array(expr, scope);
        case ExprKind::Object:
            return eval_object(expr, scope);
        case ExprKind::Function:
            return make_closure(expr.function, scope);
        case ExprKind::Unary:
            return eval_unary(expr, scope);
        case ExprKind::Update:
            return eval_update(expr, scope);
        case ExprKind::Binary: {
            const Value left = eval(*expr.a, scope);
            const Value right = eval(*expr.b, scope);
            return binary_operation(expr.text, left, right);
        }
        case ExprKind::Logical:
            return eval_logical(expr, scope);
        case ExprKind::Conditional:
            return eval(*expr.a, scope).truthy() ? eval(*expr.b, scope) : eval(*expr.c, scope);
        case ExprKind::Assign:
            return eval_assign(expr, scope);
        case ExprKind::Member:
            return eval_member(expr, scope);
        case ExprKind::Call:
            return eval_call(expr, scope);
        case ExprKind::New:
            return eval_new(expr, scope);
        case ExprKind::Sequence: {
            Value last;
            for (const auto& item : expr.items) {
                last = eval(*item, scope);
            }
            return last;
        }
        case ExprKind::Hole:
            return Value();
        case ExprKind::Spread:
            throw_error("SyntaxError", "Unexpected spread element");
    }
    return Value();
}

Value Interpreter::eval_identifier(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    if (Scope::Binding* binding = scope->find(expr.text)) {
        return binding->value;
    }
    throw_error("ReferenceError", expr.text + " is not defined");
}

Value Interpreter::eval_array(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    std::vector<Value> items;
    items.reserve(expr.items.size());
    for (const auto& item : expr.items) {
        if (item->kind == ExprKind::Spread) {
            for (auto& element : iterate(eval(*item->a, scope))) {
                items.push_back(std::move(element));
            }
        } else {
            items.push_back(eval(*item, scope));
        }
    }
    return Value::array(std::move(items));
}

Value Interpreter::eval_object(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    Value object = Value::object();
    auto& properties = object.as_object().properties;
    for (const auto& property : expr.properties) {
        if (property.spread) {
            const Value source = eval(*property.value, scope);
            if (source.is_object()) {
                for (const auto& entry : source.as_object().properties) {
                    properties[entry.first] = entry.second;
                }
            } else if (source.is_array()) {
                const auto& items = source.as_array().items;
                for (std::size_t i = 0; i < items.size(); ++i) {
                    properties[std::to_string(i)] = items[i];
                }
            } else if (source.is_string()) {
                const auto characters = utf8_characters(source.as_string());
                for (std::size_t i = 0; i < characters.size(); ++i) {
                    properties[std::to_string(i)] = characters[i];
                }
            }
            continue;
        }
        const std::string key = property.computed_key
                                    ? to_property_key(eval(*property.computed_key, scope))
                                    : property.key;
        properties[key] = eval(*property.value, scope);
    }
    return object;
}

Value Interpreter::eval_unary(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    const std::string& op = expr.text;
    if (op == "typeof" && expr.a->kind == ExprKind::Identifier) {
        Scope::Binding* binding = scope->find(expr.a->text);
        return Value(binding == nullptr ? std::string("undefined") : binding->value.type_of());
    }
    if (op == "delete") {
        if (expr.a->kind != ExprKind::Member) {
            return Value(true);
        }
        const Value object = eval(*expr.a->a, scope);
        const std::string key = to_property_key(member_key(*expr.a, scope));
        if (object.is_object()) {
            object.as_object().properties.erase(key);
        } else if (object.is_function()) {
            object.as_function()->properties.erase(key);
        } else if (object.is_array()) {
            const auto index = parse_index(key);
            auto& items = object.as_array().items;
            if (index && *index < items.size()) {
                items[*index] = Value();
            }
        }
        return Value(true);
    }

    const Value operand = eval(*expr.a, scope);
    if (op == "!") return Value(!operand.truthy());
    if (op == "-") return Value(-operand.to_number());
    if (op == "+") return Value(operand.to_number());
    if (op == "~") return Value(static_cast<double>(~to_int32(operand.to_number())));
    if (op == "typeof") return Value(operand.type_of());
    if (op == "void") return Value();
    // Capabilities complete synchronously, so awaiting yields the value itself.
    if (op == "await") return operand;
    throw_error("SyntaxError", "Unsupported unary operator " + op);
}

Value Interpreter::eval_update(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    const double delta = expr.text == "++" ? 1.0 : -1.0;
    const Expr& target = *expr.a;
    if (target.kind == ExprKind::Identifier) {
        Scope::Binding* binding = scope->find(target.text);
        if (binding == nullptr) {
            throw_error("ReferenceError", target.text + " is not defined");
        }
        if (binding->is_const) {
            throw_error("TypeError", "Assignment to constant variable.");
        }
        const double old_value = binding->value.to_number();
        binding->value = Value(old_value + delta);
        return Value(expr.flag ? old_value + delta : old_value);
    }
    const Value object = eval(*target.a, scope);
    const Value key = member_key(target, scope);
    const double old_value = get_member(object, key).to_number();
    set_member(object, key, Value(old_value + delta));
    return Value(expr.flag ? old_value + delta : old_value);
}

Value Interpreter::eval_logical(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    Value left = eval(*expr.a, scope);
    if (expr.text == "&&") {
        return left.truthy() ? eval(*expr.b, scope) : left;
    }
    if (expr.text == "||") {
        return left.truthy() ? left : eval(*expr.b, scope);
    }
    return left.is_nullish() ? eval(*expr.b, scope) : left;
}

Value Interpreter::eval_assign(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    const std::string& op = expr.text;
    const Expr& target = *expr.a;
    const bool logical = op == "&&=" || op == "||=" || op == "?\?=";
    auto short_circuits = [&op](const Value& current) {
        if (op == "&&=") return !current.truthy();
        if (op == "||=") return current.truthy();
        return !current.is_nullish();
    };

    if (target.kind == ExprKind::Identifier) {
        if (op == "=") {
            Value value = eval(*expr.b, scope);
            assign_name(target.text, value, scope);
            return value;
        }
        const Value current = eval_identifier(target, scope);
        if (logical && short_circuits(current)) {
            return current;
        }
        Value value = logical ? eval(*expr.b, scope)
                              : binary_operation(op.substr(0, op.size() - 1), current,
                                                 eval(*expr.b, scope));
        assign_name(target.text, value, scope);
        return value;
    }

    const Value object = eval(*target.a, scope);
    const Value key = member_key(target, scope);
    if (op == "=") {
        Value value = eval(*expr.b, scope);
        set_member(object, key, value);
        return value;
    }
    const Value current = get_member(object, key);
    if (logical && short_circuits(current)) {
        return current;
    }
    Value value = logical ? eval(*expr.b, scope)
                          : binary_operation(op.substr(0, op.size() - 1), current,
                                             eval(*expr.b, scope));
    set_member(object, key, value);
    return value;
}

Value Interpreter::member_key(const Expr& member, const std::shared_ptr<Scope>& scope) {
    if (member.flag) {
        return eval(*member.b, scope);
    }
    return Value(member.text);
}

Value Interpreter::eval_member(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    const Value object = eval(*expr.a, scope);
    if (expr.optional && object.is_nullish()) {
        return Value();
    }
    return get_member(object, member_key(expr, scope));
}

std::vector<Value> Interpreter::eval_arguments(const std::vector<ExprPtr>& args,
                                               const std::shared_ptr<Scope>& scope) {
    std::vector<Value> values;
    values.reserve(args.size());
    for (const auto& arg : args) {
        if (arg->kind == ExprKind::Spread) {
            for (auto& element : iterate(eval(*arg->a, scope))) {
                values.push_back(std::move(element));
            }
        } else {
            values.push_back(eval(*arg, scope));
        }
    }
    return values;
}

std::string Interpreter::describe_callee(const Expr& callee) const {
    switch (callee.kind) {
        case ExprKind::Identifier:
            return callee.text;
        case ExprKind::Member:
            return describe_callee(*callee.a) + (callee.flag ? "[...]" : "." + callee.text);
        case ExprKind::Call:
            return describe_callee(*callee.a) + "(...)";
        default:
            return "expression";
    }
}

Value Interpreter::eval_call(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    const Expr& callee = *expr.a;
    Value this_value;
    Value function;
    if (callee.kind == ExprKind::Member) {
        this_value = eval(*callee.a, scope);
        if (callee.optional && this_value.is_nullish()) {
            return Value();
        }
        function = get_member(this_value, member_key(callee, scope));
    } else {
        function = eval(callee, scope);
    }
    if (expr.optional && function.is_nullish()) {
        return Value();
    }
    if (!function.is_function()) {
        throw_error("TypeError", describe_callee(callee) + " is not a function");
    }
    return call(function, eval_arguments(expr.items, scope), this_value);
}

Value Interpreter::eval_new(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    const Value constructor = eval(*expr.a, scope);
    if (!constructor.is_function() ||
        (!constructor.as_function()->is_native() && constructor.as_function()->node->is_arrow)) {
        throw_error("TypeError", describe_callee(*expr.a) + " is not a constructor");
    }
    std::vector<Value> args = eval_arguments(expr.items, scope);
    const std::shared_ptr<FunctionData> function = constructor.as_function();
    if (function->is_native()) {
        return function->native(*this, args);
    }
    check_budget();
    Value instance = Value::object();
    instance.as_object().constructed_by = function;
    const Value returned = invoke_script(*function, args, instance);
    return returned.is_object() || returned.is_array() ? returned : instance;
}

bool Interpreter::instance_of(const Value& value, const Value& constructor) {
    if (!constructor.is_function()) {
        throw_error("TypeError", "Right-hand side of 'instanceof' is not callable");
    }
    const std::shared_ptr<FunctionData>& function = constructor.as_function();
    if (!function->is_native()) {
        return value.is_object() && value.as_object().constructed_by.lock() == function;
    }
    const std::string& name = function->name;
    if (name == "Array") return value.is_array();
    if (name == "Object") return !is_primitive(value);
    if (name == "Function") return value.is_function();
    if (ends_with(name, "Error") && value.is_object()) {
        const auto& props = value.as_object().properties;
        const auto it = props.find("name");
        if (it == props.end() || !it->second.is_string()) {
            return false;
        }
        return name == "Error" ? ends_with(it->second.as_string(), "Error")
                               : it->second.as_string() == name;
    }
    return false;
}

Value Interpreter::binary_operation(const std::string& op, const Value& left,
                                    const Value& right) {
    if (op == "+") {
        if (left.is_string() || right.is_string() || !is_primitive(left) ||
            !is_primitive(right)) {
            return Value(left.to_display_string() + right.to_display_string());
        }
        return Value(left.to_number() + right.to_number());
    }
    if (op == "-") return Value(left.to_number() - right.to_number());
    if (op == "*") return Value(left.to_number() * right.to_number());
    if (op == "/") return Value(left.to_number() / right.to_number());
    if (op == "%") return Value(std::fmod(left.to_number(), right.to_number()));
    if (op == "**") return Value(std::pow(left.to_number(), right.to_number()));
    if (op == "===") return Value(left.strict_equals(right));
    if (op == "!==") return Value(!left.strict_equals(right));
    if (op == "==") return Value(left.loose_equals(right));
    if (op == "!=") return Value(!left.loose_equals(right));

    if (op == "<" || op == ">" || op == "<=" || op == ">=") {
        if (left.is_string() && right.is_string()) {
            const int cmp = left.as_string().compare(right.as_string());
            if (op == "<") return Value(cmp < 0);
            if (op == ">") return Value(cmp > 0);
            if (op == "<=") return Value(cmp <= 0);
            return Value(cmp >= 0);
        }
        const double a = left.to_number();
        const double b = right.to_number();
        if (op == "<") return Value(a < b);
        if (op == ">") return Value(a > b);
        if (op == "<=") return Value(a <= b);
        return Value(a >= b);
    }

    if (op == "&") return Value(static_cast<double>(to_int32(left.to_number()) & to_int32(right.to_number())));
    if (op == "|") return Value(static_cast<double>(to_int32(left.to_number()) | to_int32(right.to_number())));
    if (op == "^") return Value(static_cast<double>(to_int32(left.to_number()) ^ to_int32(right.to_number())));
    if (op == "<<" || op == ">>" || op == ">>>") {
        const std::uint32_t shift = to_uint32(right.to_number()) & 31U;
        if (op == "<<") {
            return Value(static_cast<double>(
                static_cast<std::int32_t>(to_uint32(left.to_number()) << shift)));
        }
        if (op == ">>") {
            return Value(static_cast<double>(to_int32(left.to_number()) >> shift));
        }
        return Value(static_cast<double>(to_uint32(left.to_number()) >> shift));
    }

    if (op == "instanceof") {
        return Value(instance_of(left, right));
    }
    if (op == "in") {
        const std::string key = to_property_key(left);
        if (right.is_object()) {
            return Value(right.as_object().properties.count(key) > 0);
        }
        if (right.is_array()) {
            const auto index = parse_index(key);
            return Value(key == "length" ||
                         (index.has_value() && *index < right.as_array().items.size()));
        }
        if (right.is_function()) {
            return Value(right.as_function()->properties.count(key) > 0);
        }
        throw_error("TypeError", "Cannot use 'in' operator to search for '" + key + "' in " +
                                     right.to_display_string());
    }
    throw_error("SyntaxError", "Unsupported operator " + op);
}

Value Interpreter::get_member(const Value& object, const Value& key) {
    if (const auto index = number_index(key)) {
        if (object.is_array()) {
            const auto& items = object.as_array().items;
            return *index < items.size() ? items[*index] : Value();
        }
        if (object.is_string()) {
            const auto& text = object.as_string();
            return *index < text.size() ? Value(std::string(1, text[*index])) : Value();
        }
    }
    return get_property(object, to_property_key(key));
}

void Interpreter::set_member(const Value& object, const Value& key, Value value) {
    if (const auto index = number_index(key)) {
        if (object.is_array()) {
            set_property(object, std::to_string(*index), std::move(value));
            return;
        }
    }
    set_property(object, to_property_key(key), std::move(value));
}

Value Interpreter::get_property(const Value& object, const std::string& key) {
    switch (object.type()) {
        case Value::Type::Undefined:
        case Value::Type::Null:
            throw_error("TypeError", "Cannot read properties of " + object.to_display_string() +
                                         " (reading '" + key + "')");
        case Value::Type::Array: {
            const auto& items = object.as_array().items;
            if (key == "length") {
                return Value(items.size());
            }
            if (const auto index = parse_index(key)) {
                return *index < items.size() ? items[*index] : Value();
            }
            break;
        }
        case Value::Type::String: {
            const auto& text = object.as_string();
            if (key == "length") {
                return Value(text.size());
            }
            if (const auto index = parse_index(key)) {
                return *index < text.size() ? Value(std::string(1, text[*index])) : Value();
            }
            break;
        }
        case Value::Type::Object: {
            const auto& props = object.as_object().properties;
            const auto it = props.find(key);
            if (it != props.end()) {
                return it->second;
            }
            break;
        }
        case Value::Type::Function: {
            const auto& function = object.as_function();
            if (key == "name") {
                return Value(function->name);
            }
            const auto it = function->properties.find(key);
            if (it != function->properties.end()) {
                return it->second;
            }
            break;
        }
        default:
            break;
    }
    if (auto method = builtin_method(object, key)) {
        return *method;
    }
    return Value();
}

void Interpreter::set_property(const Value& object, const std::string& key, Value value) {
    switch (object.type()) {
        case Value::Type::Undefined:
        case Value::Type::Null:
            throw_error("TypeError", "Cannot set properties of " + object.to_display_string() +
                                         " (setting '" + key + "')");
        case Value::Type::Array: {
            auto& items = object.as_array().items;
            if (key == "length") {
                const double length = value.to_number();
                if (length < 0 || std::trunc(length) != length || length > kMaxArrayLength) {
                    throw_error("RangeError", "Invalid array length");
                }
                items.resize(static_cast<std::size_t>(length));
                return;
            }
            if (const auto index = parse_index(key)) {
                if (static_cast<double>(*index) >= kMaxArrayLength) {
                    throw_error("RangeError", "Invalid array length");
                }
                if (*index >= items.size()) {
                    items.resize(*index + 1);
                }
                items[*index] = std::move(value);
            }
            return;
        }
        case Value::Type::Object:
            object.as_object().properties[key] = std::move(value);
            return;
        case Value::Type::Function:
            object.as_function()->properties[key] = std::move(value);
            return;
        default:
            return;
    }
}

}  // namespace toolbridge::script
