#include "script/value.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include "script/script_error.hpp"

namespace toolbridge::script {

using nlohmann::json;

namespace {

constexpr double kMaxSafeInteger = 9007199254740991.0;

std::string trim_ascii(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool holds_container(const Value& value) {
    return value.is_array() || value.is_object() || value.is_function();
}

// Contents of destroyed containers wait here while an outer destructor is
// already draining, instead of being destroyed on the current stack.
struct ReleaseQueue {
    std::vector<Value> values;
    std::vector<std::shared_ptr<Scope>> scopes;
    std::vector<NativeFn> natives;
};

thread_local ReleaseQueue* active_release = nullptr;

void drain(ReleaseQueue& queue) {
    active_release = &queue;
    while (true) {
        if (!queue.values.empty()) {
            Value doomed = std::move(queue.values.back());
            queue.values.pop_back();
        } else if (!queue.scopes.empty()) {
            std::shared_ptr<Scope> doomed = std::move(queue.scopes.back());
            queue.scopes.pop_back();
        } else if (!queue.natives.empty()) {
            NativeFn doomed = std::move(queue.natives.back());
            queue.natives.pop_back();
        } else {
            break;
        }
    }
    active_release = nullptr;
}

template <typename Collect>
void release_contents(Collect collect) {
    if (active_release != nullptr) {
        collect(*active_release);
        return;
    }
    ReleaseQueue queue;
    collect(queue);
    drain(queue);
}

void collect_values(std::vector<Value>& values, ReleaseQueue& queue) {
    for (auto& value : values) {
        if (holds_container(value)) {
            queue.values.push_back(std::move(value));
        }
    }
}

void collect_values(std::map<std::string, Value>& properties, ReleaseQueue& queue) {
    for (auto& entry : properties) {
        if (holds_container(entry.second)) {
            queue.values.push_back(std::move(entry.second));
        }
    }
}

// Installed arenas, innermost last.
thread_local std::vector<ContainerArena*> arena_stack;

template <typename T>
std::vector<std::shared_ptr<T>> lock_all(std::vector<std::weak_ptr<T>>& tracked) {
    std::vector<std::shared_ptr<T>> alive;
    alive.reserve(tracked.size());
    for (const auto& weak : tracked) {
        if (auto strong = weak.lock()) {
            alive.push_back(std::move(strong));
        }
    }
    tracked.clear();
    return alive;
}

template <typename T>
std::size_t count_live(const std::vector<std::weak_ptr<T>>& tracked) {
    return static_cast<std::size_t>(
        std::count_if(tracked.begin(), tracked.end(),
                      [](const std::weak_ptr<T>& weak) { return !weak.expired(); }));
}

template <typename T>
void drop_expired(std::vector<std::weak_ptr<T>>& tracked) {
    tracked.erase(std::remove_if(tracked.begin(), tracked.end(),
                                 [](const std::weak_ptr<T>& weak) { return weak.expired(); }),
                  tracked.end());
}

[[noreturn]] void throw_range_error(const std::string& message) {
    throw ScriptError(make_error_object("RangeError", message));
}

// Containers whose string conversion is in progress on this thread.
thread_local std::vector<const void*> display_stack;

class DisplayGuard {
public:
    explicit DisplayGuard(const void* container) {
        if (display_stack.size() >= kMaxValueDepth) {
            throw_range_error("Maximum call stack size exceeded");
        }
        display_stack.push_back(container);
    }
    ~DisplayGuard() { display_stack.pop_back(); }

    DisplayGuard(const DisplayGuard&) = delete;
    DisplayGuard& operator=(const DisplayGuard&) = delete;

    static bool active(const void* container) {
        return std::find(display_stack.begin(), display_stack.end(), container) !=
               display_stack.end();
    }
};

json scalar_to_json(const Value& value) {
    switch (value.type()) {
        case Value::Type::Boolean:
            return value.as_bool();
        case Value::Type::Number: {
            const double number = value.as_number();
            if (!std::isfinite(number)) {
                return nullptr;
            }
            if (std::trunc(number) == number && std::fabs(number) <= kMaxSafeInteger) {
                return static_cast<std::int64_t>(number);
            }
            return number;
        }
        case Value::Type::String:
            return value.as_string();
        default:
            return nullptr;
    }
}

Value from_json_at(const json& document, const std::size_t depth) {
    switch (document.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return Value(nullptr);
        case json::value_t::boolean:
            return Value(document.get<bool>());
        case json::value_t::number_integer:
            return Value(static_cast<double>(document.get<std::int64_t>()));
        case json::value_t::number_unsigned:
            return Value(static_cast<double>(document.get<std::uint64_t>()));
        case json::value_t::number_float:
            return Value(document.get<double>());
        case json::value_t::string:
            return Value(document.get<std::string>());
        default:
            break;
    }
    if (depth >= kMaxValueDepth) {
        throw_range_error("JSON nesting is too deep");
    }
    if (document.is_array()) {
        std::vector<Value> items;
        items.reserve(document.size());
        for (const auto& item : document) {
            items.push_back(from_json_at(item, depth + 1));
        }
        return Value::array(std::move(items));
    }
    if (document.is_object()) {
        Value out = Value::object();
        for (auto it = document.begin(); it != document.end(); ++it) {
            out.as_object().properties[it.key()] = from_json_at(it.value(), depth + 1);
        }
        return out;
    }
    return Value();
}

}  // namespace

ArrayData::~ArrayData() {
    release_contents([this](ReleaseQueue& queue) { collect_values(items, queue); });
}

ObjectData::~ObjectData() {
    release_contents([this](ReleaseQueue& queue) { collect_values(properties, queue); });
}

FunctionData::~FunctionData() {
    release_contents([this](ReleaseQueue& queue) {
        collect_values(properties, queue);
        if (closure) {
            queue.scopes.push_back(std::move(closure));
        }
        if (native) {
            queue.natives.push_back(std::move(native));
        }
    });
}

ContainerArena::ContainerArena() {
    arena_stack.push_back(this);
}

ContainerArena::~ContainerArena() {
    release();
    arena_stack.erase(std::remove(arena_stack.begin(), arena_stack.end(), this),
                      arena_stack.end());
}

void ContainerArena::track(const std::shared_ptr<ArrayData>& array) {
    if (!arena_stack.empty()) {
        arena_stack.back()->arrays_.push_back(array);
        arena_stack.back()->prune();
    }
}

void ContainerArena::track(const std::shared_ptr<ObjectData>& object) {
    if (!arena_stack.empty()) {
        arena_stack.back()->objects_.push_back(object);
        arena_stack.back()->prune();
    }
}

void ContainerArena::track(const std::shared_ptr<FunctionData>& function) {
    if (!arena_stack.empty()) {
        arena_stack.back()->functions_.push_back(function);
        arena_stack.back()->prune();
    }
}

void ContainerArena::prune() {
    const std::size_t tracked = arrays_.size() + objects_.size() + functions_.size();
    if (tracked <= prune_threshold_) {
        return;
    }
    drop_expired(arrays_);
    drop_expired(objects_);
    drop_expired(functions_);
    prune_threshold_ =
        std::max<std::size_t>(4096, (arrays_.size() + objects_.size() + functions_.size()) * 2);
}

void ContainerArena::release() {
    // Hold every survivor first so emptying one never destroys another
    // mid-walk.
    auto arrays = lock_all(arrays_);
    auto objects = lock_all(objects_);
    auto functions = lock_all(functions_);

    for (const auto& array : arrays) {
        array->items.clear();
    }
    for (const auto& object : objects) {
        object->properties.clear();
        object->constructed_by.reset();
    }
    for (const auto& function : functions) {
        function->properties.clear();
        function->closure.reset();
        function->native = nullptr;
    }
}

std::size_t ContainerArena::live() const {
    return count_live(arrays_) + count_live(objects_) + count_live(functions_);
}

Value Value::array(std::vector<Value> items) {
    auto data = std::make_shared<ArrayData>();
    data->items = std::move(items);
    ContainerArena::track(data);
    return Value(std::move(data));
}

Value Value::object() {
    auto data = std::make_shared<ObjectData>();
    ContainerArena::track(data);
    return Value(std::move(data));
}

Value Value::native(std::string name, NativeFn fn) {
    auto data = std::make_shared<FunctionData>();
    data->name = std::move(name);
    data->native = std::move(fn);
    ContainerArena::track(data);
    return Value(std::move(data));
}

bool Value::strict_equals(const Value& other) const {
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case Type::Undefined:
        case Type::Null:
            return true;
        case Type::Boolean:
            return as_bool() == other.as_bool();
        case Type::Number:
            return as_number() == other.as_number();
        case Type::String:
            return as_string() == other.as_string();
        case Type::Array:
            return &as_array() == &other.as_array();
        case Type::Object:
            return &as_object() == &other.as_object();
        case Type::Function:
            return as_function() == other.as_function();
    }
    return false;
}

bool Value::loose_equals(const Value& other) const {
    if (is_nullish() && other.is_nullish()) {
        return true;
    }
    if (is_nullish() || other.is_nullish()) {
        return false;
    }
    if (type() == other.type()) {
        return strict_equals(other);
    }
    const bool primitive_pair =
        (is_number() || is_string() || is_bool()) &&
        (other.is_number() || other.is_string() || other.is_bool());
    if (primitive_pair) {
        return to_number() == other.to_number();
    }
    return false;
}

bool Value::truthy() const {
    switch (type()) {
        case Type::Undefined:
        case Type::Null:
            return false;
        case Type::Boolean:
            return as_bool();
        case Type::Number:
            return as_number() != 0.0 && !std::isnan(as_number());
        case Type::String:
            return !as_string().empty();
        default:
            return true;
    }
}

double Value::to_number() const {
    switch (type()) {
        case Type::Undefined:
            return std::numeric_limits<double>::quiet_NaN();
        case Type::Null:
            return 0.0;
        case Type::Boolean:
            return as_bool() ? 1.0 : 0.0;
        case Type::Number:
            return as_number();
        case Type::String: {
            const std::string text = trim_ascii(as_string());
            if (text.empty()) {
                return 0.0;
            }
            char* end = nullptr;
            const double parsed = std::strtod(text.c_str(), &end);
            if (end == nullptr || *end != '\0') {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return parsed;
        }
        case Type::Array:
            // Arrays convert through their string form: [] is 0, [" 7"] is 7.
            return Value(to_display_string()).to_number();
        default:
            return std::numeric_limits<double>::quiet_NaN();
    }
}

std::string Value::to_display_string() const {
    switch (type()) {
        case Type::Undefined:
            return "undefined";
        case Type::Null:
            return "null";
        case Type::Boolean:
            return as_bool() ? "true" : "false";
        case Type::Number:
            return format_number(as_number());
        case Type::String:
            return as_string();
        case Type::Array:
            return join_values(as_array(), ",");
        case Type::Object: {
            // Error objects print as "Name: message".
            const auto& props = as_object().properties;
            const auto name = props.find("name");
            const auto message = props.find("message");
            if (name != props.end() && message != props.end() && name->second.is_string()) {
                if (DisplayGuard::active(&as_object())) {
                    return "";
                }
                const DisplayGuard guard(&as_object());
                return name->second.as_string() + ": " + message->second.to_display_string();
            }
            return "[object Object]";
        }
        case Type::Function:
            return "function " + as_function()->name + "() { [code] }";
    }
    return "";
}

std::string join_values(const ArrayData& array, const std::string& separator) {
    // An array already being converted further up renders as "".
    if (DisplayGuard::active(&array)) {
        return "";
    }
    const DisplayGuard guard(&array);
    std::string out;
    for (std::size_t i = 0; i < array.items.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        if (!array.items[i].is_nullish()) {
            out += array.items[i].to_display_string();
        }
    }
    return out;
}

std::string Value::type_of() const {
    switch (type()) {
        case Type::Undefined:
            return "undefined";
        case Type::Boolean:
            return "boolean";
        case Type::Number:
            return "number";
        case Type::String:
            return "string";
        case Type::Function:
            return "function";
        default:
            return "object";
    }
}

std::string format_number(const double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    if (value == 0.0) {
        return "0";
    }
    if (std::trunc(value) == value && std::fabs(value) <= kMaxSafeInteger) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%lld", static_cast<long long>(value));
        return buffer;
    }
    // Shortest representation that parses back to the same double.
    char buffer[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    return buffer;
}

json to_json(const Value& value) {
    // Containers still being converted, outermost first. Walking with an
    // explicit stack keeps native recursion flat however deep the value is.
    struct Open {
        Value container;
        const void* identity;
        json out;
        std::size_t next_item = 0;
        std::map<std::string, Value>::const_iterator next_property;
        std::string key;
    };
    std::vector<Open> open;
    json result;

    const auto place = [&open, &result](json item) {
        if (open.empty()) {
            result = std::move(item);
        } else if (open.back().out.is_array()) {
            open.back().out.push_back(std::move(item));
        } else {
            open.back().out[open.back().key] = std::move(item);
        }
    };

    const auto enter = [&open, &place](const Value& item) {
        if (!item.is_array() && !item.is_object()) {
            place(scalar_to_json(item));
            return;
        }
        const void* identity = item.is_array() ? static_cast<const void*>(&item.as_array())
                                               : static_cast<const void*>(&item.as_object());
        for (const auto& ancestor : open) {
            if (ancestor.identity == identity) {
                throw ScriptError(
                    make_error_object("TypeError", "Converting circular structure to JSON"));
            }
        }
        if (open.size() >= kMaxValueDepth) {
            throw_range_error("Maximum call stack size exceeded");
        }
        Open entry;
        entry.container = item;
        entry.identity = identity;
        if (item.is_array()) {
            entry.out = json::array();
        } else {
            entry.out = json::object();
            entry.next_property = item.as_object().properties.begin();
        }
        open.push_back(std::move(entry));
    };

    enter(value);
    while (!open.empty()) {
        Open& top = open.back();
        if (top.container.is_array()) {
            const auto& items = top.container.as_array().items;
            if (top.next_item < items.size()) {
                const Value item = items[top.next_item++];
                enter(item);
                continue;
            }
        } else {
            const auto& properties = top.container.as_object().properties;
            while (top.next_property != properties.end() &&
                   (top.next_property->second.is_undefined() ||
                    top.next_property->second.is_function())) {
                ++top.next_property;
            }
            if (top.next_property != properties.end()) {
                top.key = top.next_property->first;
                const Value item = top.next_property->second;
                ++top.next_property;
                enter(item);
                continue;
            }
        }
        json finished = std::move(top.out);
        open.pop_back();
        place(std::move(finished));
    }
    return result;
}

Value from_json(const json& document) {
    return from_json_at(document, 0);
}

}  // namespace toolbridge::script
