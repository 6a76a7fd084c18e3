#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbridge::script {

class Interpreter;
class Value;
struct ArrayData;
struct ObjectData;
struct FunctionData;

struct Undefined {};

// Deepest array/object nesting that serialization and string conversion walk
// before giving up with a RangeError.
inline constexpr std::size_t kMaxValueDepth = 512;

using NativeFn = std::function<Value(Interpreter&, std::vector<Value>&)>;

// Dynamically typed snippet value. Arrays, objects and functions are shared
// by reference, like in the language the snippets are written in.
class Value {
public:
    enum class Type {
        Undefined,
        Null,
        Boolean,
        Number,
        String,
        Array,
        Object,
        Function
    };

    Value() = default;
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(int i) : data_(static_cast<double>(i)) {}
    Value(std::size_t n) : data_(static_cast<double>(n)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::shared_ptr<ArrayData> a) : data_(std::move(a)) {}
    Value(std::shared_ptr<ObjectData> o) : data_(std::move(o)) {}
    Value(std::shared_ptr<FunctionData> f) : data_(std::move(f)) {}

    static Value array(std::vector<Value> items = {});
    static Value object();
    static Value native(std::string name, NativeFn fn);

    Type type() const { return static_cast<Type>(data_.index()); }
    bool is_undefined() const { return type() == Type::Undefined; }
    bool is_null() const { return type() == Type::Null; }
    bool is_nullish() const { return is_undefined() || is_null(); }
    bool is_bool() const { return type() == Type::Boolean; }
    bool is_number() const { return type() == Type::Number; }
    bool is_string() const { return type() == Type::String; }
    bool is_array() const { return type() == Type::Array; }
    bool is_object() const { return type() == Type::Object; }
    bool is_function() const { return type() == Type::Function; }

    bool as_bool() const { return std::get<bool>(data_); }
    double as_number() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    ArrayData& as_array() const { return *std::get<std::shared_ptr<ArrayData>>(data_); }
    ObjectData& as_object() const { return *std::get<std::shared_ptr<ObjectData>>(data_); }
    const std::shared_ptr<FunctionData>& as_function() const {
        return std::get<std::shared_ptr<FunctionData>>(data_);
    }

    // Identity for reference types, value equality otherwise (===).
    bool strict_equals(const Value& other) const;
    bool loose_equals(const Value& other) const;

    bool truthy() const;
    double to_number() const;
    // String conversion used by concatenation and String(x).
    std::string to_display_string() const;
    std::string type_of() const;

private:
    std::variant<Undefined, std::nullptr_t, bool, double, std::string,
                 std::shared_ptr<ArrayData>, std::shared_ptr<ObjectData>,
                 std::shared_ptr<FunctionData>>
        data_;
};

// Container destructors hand their contents to a per-thread release queue,
// so dropping a deeply nested value never recurses once per level.
struct ArrayData {
    ~ArrayData();

    std::vector<Value> items;
};

// Keys are kept sorted, matching how responses are serialized.
struct ObjectData {
    ~ObjectData();

    std::map<std::string, Value> properties;
    // Set by "new" on a script function; consulted by instanceof.
    std::weak_ptr<FunctionData> constructed_by;
};

struct FunctionNode;
class Scope;

struct FunctionData {
    ~FunctionData();

    std::string name;
    // Script closure
    std::shared_ptr<const FunctionNode> node;
    std::shared_ptr<Scope> closure;
    // Host function
    NativeFn native;
    // Static members such as JSON.parse or Number.isInteger
    std::map<std::string, Value> properties;

    bool is_native() const { return static_cast<bool>(native); }
};

// Records every container allocated on this thread while it is installed.
// Scripts can build reference cycles (a.self = a) that shared ownership never
// frees; release() empties every container still alive, which breaks them.
// Arenas nest: the most recently constructed one that is still alive receives
// new containers.
class ContainerArena {
public:
    ContainerArena();
    ~ContainerArena();

    ContainerArena(const ContainerArena&) = delete;
    ContainerArena& operator=(const ContainerArena&) = delete;

    static void track(const std::shared_ptr<ArrayData>& array);
    static void track(const std::shared_ptr<ObjectData>& object);
    static void track(const std::shared_ptr<FunctionData>& function);

    void release();
    // Tracked containers that are still referenced from somewhere.
    std::size_t live() const;

private:
    void prune();

    std::vector<std::weak_ptr<ArrayData>> arrays_;
    std::vector<std::weak_ptr<ObjectData>> objects_;
    std::vector<std::weak_ptr<FunctionData>> functions_;
    std::size_t prune_threshold_ = 4096;
};

std::string format_number(double value);

// Array.prototype.join; cyclic references render as "". Throws ScriptError
// (RangeError) past kMaxValueDepth.
std::string join_values(const ArrayData& array, const std::string& separator);

// Throws ScriptError: TypeError for circular structures, RangeError past
// kMaxValueDepth.
nlohmann::json to_json(const Value& value);
// Throws ScriptError (RangeError) for documents nested past kMaxValueDepth.
Value from_json(const nlohmann::json& document);

}  // namespace toolbridge::script
