#include "script/builtins.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <random>
#include "core/logging/logger.hpp"
#include "script/interpreter.hpp"
#include "script/script_error.hpp"

namespace toolbridge::script {

using nlohmann::json;

namespace {

constexpr std::size_t kMaxStringLength = 1U << 26;

using Args = std::vector<Value>;

Value arg(const Args& args, const std::size_t index) {
    return index < args.size() ? args[index] : Value();
}

void set_member(Value& holder, const std::string& name, Value value) {
    if (holder.is_function()) {
        holder.as_function()->properties[name] = std::move(value);
    } else {
        holder.as_object().properties[name] = std::move(value);
    }
}

void add_method(Value& holder, const std::string& name, NativeFn fn) {
    set_member(holder, name, Value::native(name, std::move(fn)));
}

Value math_fn(const std::string& name, double (*fn)(double)) {
    return Value::native(name, [fn](Interpreter&, Args& args) {
        return Value(fn(arg(args, 0).to_number()));
    });
}

// Resolves a relative start/end argument the way slice() does.
std::size_t relative_index(const Value& value, const std::size_t length,
                           const std::size_t fallback) {
    if (value.is_undefined()) {
        return fallback;
    }
    double relative = value.to_number();
    if (std::isnan(relative)) {
        relative = 0;
    }
    relative = std::trunc(relative);
    const auto size = static_cast<double>(length);
    if (relative < 0) {
        return relative + size < 0 ? 0 : static_cast<std::size_t>(relative + size);
    }
    return relative > size ? length : static_cast<std::size_t>(relative);
}

std::size_t clamped_index(const Value& value, const std::size_t length) {
    double number = value.to_number();
    if (std::isnan(number) || number < 0) {
        return 0;
    }
    number = std::trunc(number);
    return number > static_cast<double>(length) ? length : static_cast<std::size_t>(number);
}

bool same_value_zero(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number() && std::isnan(a.as_number()) &&
        std::isnan(b.as_number())) {
        return true;
    }
    return a.strict_equals(b);
}

constexpr std::size_t kMaxConsoleDepth = 32;

// JSON-shaped rendering for console output. Unlike JSON.stringify it never
// throws: cycles print as "[Circular]" and deep nesting is cut off.
json inspect(const Value& value, std::vector<const void*>& ancestors) {
    if (!value.is_array() && !value.is_object()) {
        return to_json(value);
    }
    const void* identity = value.is_array() ? static_cast<const void*>(&value.as_array())
                                            : static_cast<const void*>(&value.as_object());
    if (std::find(ancestors.begin(), ancestors.end(), identity) != ancestors.end()) {
        return "[Circular]";
    }
    if (ancestors.size() >= kMaxConsoleDepth) {
        return value.is_array() ? "[Array]" : "[Object]";
    }
    ancestors.push_back(identity);
    json out;
    if (value.is_array()) {
        out = json::array();
        for (const auto& item : value.as_array().items) {
            out.push_back(inspect(item, ancestors));
        }
    } else {
        out = json::object();
        for (const auto& entry : value.as_object().properties) {
            if (entry.second.is_undefined() || entry.second.is_function()) {
                continue;
            }
            out[entry.first] = inspect(entry.second, ancestors);
        }
    }
    ancestors.pop_back();
    return out;
}

std::string console_text(const Value& value) {
    switch (value.type()) {
        case Value::Type::String:
            return value.as_string();
        case Value::Type::Undefined:
            return "undefined";
        case Value::Type::Number:
            return format_number(value.as_number());
        case Value::Type::Function:
            return "[Function: " + value.as_function()->name + "]";
        default: {
            std::vector<const void*> ancestors;
            return inspect(value, ancestors).dump(-1, ' ', false, json::error_handler_t::replace);
        }
    }
}

Value console_method(const std::string& name, const core::logging::LogLevel level) {
    return Value::native(name, [name, level](Interpreter&, Args& args) {
        std::string line;
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (i > 0) {
                line += " ";
            }
            line += console_text(args[i]);
        }
        core::logging::Logger::get().log(level, "console." + name + ": " + line);
        return Value();
    });
}

Value error_constructor(const std::string& name) {
    return Value::native(name, [name](Interpreter& interpreter, Args& args) {
        const Value message = arg(args, 0);
        Value error = interpreter.make_error(
            name, message.is_undefined() ? std::string() : message.to_display_string());
        const Value options = arg(args, 1);
        if (options.is_object()) {
            const auto& props = options.as_object().properties;
            const auto cause = props.find("cause");
            if (cause != props.end()) {
                error.as_object().properties["cause"] = cause->second;
            }
        }
        return error;
    });
}

std::string trim_left(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    return first == std::string::npos ? "" : text.substr(first);
}

std::string trim_right(const std::string& text) {
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return last == std::string::npos ? "" : text.substr(0, last + 1);
}

double parse_int(const std::string& input, int radix) {
    std::string text = trim_left(input);
    double sign = 1;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        sign = text[0] == '-' ? -1 : 1;
        text.erase(0, 1);
    }
    if ((radix == 0 || radix == 16) && text.size() > 1 && text[0] == '0' &&
        (text[1] == 'x' || text[1] == 'X')) {
        text.erase(0, 2);
        radix = 16;
    }
    if (radix == 0) {
        radix = 10;
    }
    if (radix < 2 || radix > 36) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double result = 0;
    bool any = false;
    for (const char c : text) {
        int digit = -1;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'z') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'Z') {
            digit = c - 'A' + 10;
        }
        if (digit < 0 || digit >= radix) {
            break;
        }
        result = result * radix + digit;
        any = true;
    }
    return any ? sign * result : std::numeric_limits<double>::quiet_NaN();
}

double parse_float(const std::string& input) {
    const std::string text = trim_left(input);
    const std::string body = !text.empty() && (text[0] == '+' || text[0] == '-')
                                 ? text.substr(1)
                                 : text;
    if (body.compare(0, 8, "Infinity") == 0) {
        return text[0] == '-' ? -HUGE_VAL : HUGE_VAL;
    }
    // strtod also accepts hex, inf and nan spellings that parseFloat does not.
    if (body.empty() || !(std::isdigit(static_cast<unsigned char>(body[0])) != 0 ||
                          body[0] == '.')) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    std::size_t end = 0;
    while (end < body.size() && (std::isdigit(static_cast<unsigned char>(body[end])) != 0 ||
                                 body[end] == '.' || body[end] == 'e' || body[end] == 'E' ||
                                 ((body[end] == '+' || body[end] == '-') && end > 0 &&
                                  (body[end - 1] == 'e' || body[end - 1] == 'E')))) {
        ++end;
    }
    const std::string numeric = (text[0] == '-' ? "-" : "") + body.substr(0, end);
    char* parsed_end = nullptr;
    const double value = std::strtod(numeric.c_str(), &parsed_end);
    if (parsed_end == numeric.c_str()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return value;
}

std::string number_to_radix(const double value, const int radix) {
    if (radix == 10 || !std::isfinite(value) || std::trunc(value) != value ||
        std::fabs(value) > 9007199254740991.0) {
        return format_number(value);
    }
    static const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
    auto magnitude = static_cast<unsigned long long>(std::fabs(value));
    std::string out;
    do {
        out.push_back(digits[magnitude % static_cast<unsigned long long>(radix)]);
        magnitude /= static_cast<unsigned long long>(radix);
    } while (magnitude > 0);
    if (value < 0) {
        out.push_back('-');
    }
    std::reverse(out.begin(), out.end());
    return out;
}

Value array_from_strings(const std::vector<std::string>& parts) {
    std::vector<Value> items;
    items.reserve(parts.size());
    for (const auto& part : parts) {
        items.emplace_back(part);
    }
    return Value::array(std::move(items));
}

std::vector<std::string> object_keys(const Value& value) {
    std::vector<std::string> keys;
    if (value.is_object()) {
        for (const auto& entry : value.as_object().properties) {
            keys.push_back(entry.first);
        }
    } else if (value.is_array()) {
        for (std::size_t i = 0; i < value.as_array().items.size(); ++i) {
            keys.push_back(std::to_string(i));
        }
    } else if (value.is_string()) {
        for (std::size_t i = 0; i < value.as_string().size(); ++i) {
            keys.push_back(std::to_string(i));
        }
    } else if (value.is_function()) {
        for (const auto& entry : value.as_function()->properties) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

void flatten_into(Interpreter& interpreter, std::vector<Value>& out,
                  const std::vector<Value>& items, const double depth, const std::size_t level) {
    for (const auto& item : items) {
        if (!item.is_array() || depth < 1) {
            out.push_back(item);
            continue;
        }
        // flat(Infinity) over a cyclic array would never bottom out.
        if (level >= kMaxValueDepth) {
            throw ScriptError(make_error_object("RangeError", "Maximum call stack size exceeded"));
        }
        interpreter.check_budget();
        flatten_into(interpreter, out, item.as_array().items, depth - 1, level + 1);
    }
}

std::string pad(const std::string& text, const Args& args, const bool at_start) {
    const double target = arg(args, 0).to_number();
    const std::string filler = arg(args, 1).is_undefined() ? " " : arg(args, 1).to_display_string();
    if (std::isnan(target) || target <= static_cast<double>(text.size()) || filler.empty()) {
        return text;
    }
    if (target > static_cast<double>(kMaxStringLength)) {
        throw ScriptError(make_error_object("RangeError", "Invalid string length"));
    }
    const auto needed = static_cast<std::size_t>(target) - text.size();
    std::string padding;
    while (padding.size() < needed) {
        padding += filler;
    }
    padding.resize(needed);
    return at_start ? padding + text : text + padding;
}

Value replace_text(Interpreter& interpreter, const std::string& text, const Args& args,
                   const bool all) {
    const std::string pattern = arg(args, 0).to_display_string();
    const Value replacement = arg(args, 1);
    std::string out;
    std::size_t cursor = 0;
    while (cursor <= text.size()) {
        const std::size_t found = text.find(pattern, cursor);
        if (found == std::string::npos) {
            break;
        }
        out += text.substr(cursor, found - cursor);
        if (replacement.is_function()) {
            out += interpreter
                       .call(replacement, {Value(pattern), Value(found), Value(text)})
                       .to_display_string();
        } else {
            out += replacement.to_display_string();
        }
        cursor = found + pattern.size();
        if (!all) {
            break;
        }
        if (pattern.empty()) {
            if (cursor < text.size()) {
                out.push_back(text[cursor]);
            }
            ++cursor;
        }
    }
    if (cursor < text.size()) {
        out += text.substr(cursor);
    }
    return Value(std::move(out));
}

std::optional<Value> string_method(const std::string& self, const std::string& name) {
    auto method = [&name](NativeFn fn) { return std::optional<Value>(Value::native(name, std::move(fn))); };

    if (name == "charAt" || name == "at") {
        const bool relative = name == "at";
        return method([self, relative](Interpreter&, Args& args) {
            double index = std::trunc(arg(args, 0).to_number());
            if (std::isnan(index)) {
                index = 0;
            }
            if (relative && index < 0) {
                index += static_cast<double>(self.size());
            }
            if (index < 0 || index >= static_cast<double>(self.size())) {
                return relative ? Value() : Value("");
            }
            return Value(std::string(1, self[static_cast<std::size_t>(index)]));
        });
    }
    if (name == "charCodeAt") {
        return method([self](Interpreter&, Args& args) {
            const std::size_t index = clamped_index(arg(args, 0), self.size());
            if (index >= self.size()) {
                return Value(std::numeric_limits<double>::quiet_NaN());
            }
            return Value(static_cast<double>(static_cast<unsigned char>(self[index])));
        });
    }
    if (name == "indexOf" || name == "includes") {
        const bool boolean = name == "includes";
        return method([self, boolean](Interpreter&, Args& args) {
            const std::size_t from = clamped_index(arg(args, 1), self.size());
            const std::size_t found = self.find(arg(args, 0).to_display_string(), from);
            if (boolean) {
                return Value(found != std::string::npos);
            }
            return found == std::string::npos ? Value(-1) : Value(found);
        });
    }
    if (name == "lastIndexOf") {
        return method([self](Interpreter&, Args& args) {
            const std::size_t found = self.rfind(arg(args, 0).to_display_string());
            return found == std::string::npos ? Value(-1) : Value(found);
        });
    }
    if (name == "startsWith") {
        return method([self](Interpreter&, Args& args) {
            const std::string prefix = arg(args, 0).to_display_string();
            const std::size_t position = clamped_index(arg(args, 1), self.size());
            return Value(self.compare(position, prefix.size(), prefix) == 0);
        });
    }
    if (name == "endsWith") {
        return method([self](Interpreter&, Args& args) {
            const std::string suffix = arg(args, 0).to_display_string();
            const std::size_t end = arg(args, 1).is_undefined()
                                        ? self.size()
                                        : clamped_index(arg(args, 1), self.size());
            return Value(end >= suffix.size() &&
                         self.compare(end - suffix.size(), suffix.size(), suffix) == 0);
        });
    }
    if (name == "slice") {
        return method([self](Interpreter&, Args& args) {
            const std::size_t start = relative_index(arg(args, 0), self.size(), 0);
            const std::size_t end = relative_index(arg(args, 1), self.size(), self.size());
            return start >= end ? Value("") : Value(self.substr(start, end - start));
        });
    }
    if (name == "substring") {
        return method([self](Interpreter&, Args& args) {
            std::size_t start = clamped_index(arg(args, 0), self.size());
            std::size_t end = arg(args, 1).is_undefined() ? self.size()
                                                          : clamped_index(arg(args, 1), self.size());
            if (start > end) {
                std::swap(start, end);
            }
            return Value(self.substr(start, end - start));
        });
    }
    if (name == "substr") {
        return method([self](Interpreter&, Args& args) {
            const std::size_t start = relative_index(arg(args, 0), self.size(), 0);
            const std::size_t length = arg(args, 1).is_undefined()
                                           ? self.size()
                                           : clamped_index(arg(args, 1), self.size());
            return Value(self.substr(start, length));
        });
    }
    if (name == "toUpperCase" || name == "toLowerCase") {
        const bool upper = name == "toUpperCase";
        return method([self, upper](Interpreter&, Args&) {
            std::string out = self;
            std::transform(out.begin(), out.end(), out.begin(), [upper](const unsigned char c) {
                return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
            });
            return Value(std::move(out));
        });
    }
    if (name == "trim") {
        return method([self](Interpreter&, Args&) { return Value(trim_right(trim_left(self))); });
    }
    if (name == "trimStart") {
        return method([self](Interpreter&, Args&) { return Value(trim_left(self)); });
    }
    if (name == "trimEnd") {
        return method([self](Interpreter&, Args&) { return Value(trim_right(self)); });
    }
    if (name == "split") {
        return method([self](Interpreter&, Args& args) {
            const Value separator = arg(args, 0);
            const double limit = arg(args, 1).is_undefined()
                                     ? std::numeric_limits<double>::infinity()
                                     : arg(args, 1).to_number();
            std::vector<std::string> parts;
            if (separator.is_undefined()) {
                parts.push_back(self);
            } else {
                const std::string sep = separator.to_display_string();
                if (sep.empty()) {
                    parts = utf8_characters(self);
                } else {
                    std::size_t start = 0;
                    while (true) {
                        const std::size_t found = self.find(sep, start);
                        if (found == std::string::npos) {
                            parts.push_back(self.substr(start));
                            break;
                        }
                        parts.push_back(self.substr(start, found - start));
                        start = found + sep.size();
                    }
                }
            }
            if (static_cast<double>(parts.size()) > limit) {
                parts.resize(limit > 0 ? static_cast<std::size_t>(limit) : 0);
            }
            return array_from_strings(parts);
        });
    }
    if (name == "replace" || name == "replaceAll") {
        const bool all = name == "replaceAll";
        return method([self, all](Interpreter& interpreter, Args& args) {
            return replace_text(interpreter, self, args, all);
        });
    }
    if (name == "repeat") {
        return method([self](Interpreter&, Args& args) {
            const double count = std::trunc(arg(args, 0).to_number());
            if (count < 0 || std::isinf(count) ||
                count * static_cast<double>(self.size()) > static_cast<double>(kMaxStringLength)) {
                throw ScriptError(make_error_object("RangeError", "Invalid count value"));
            }
            std::string out;
            for (double i = 0; i < count; ++i) {
                out += self;
            }
            return Value(std::move(out));
        });
    }
    if (name == "padStart" || name == "padEnd") {
        const bool at_start = name == "padStart";
        return method([self, at_start](Interpreter&, Args& args) {
            return Value(pad(self, args, at_start));
        });
    }
    if (name == "concat") {
        return method([self](Interpreter&, Args& args) {
            std::string out = self;
            for (const auto& part : args) {
                out += part.to_display_string();
            }
            return Value(std::move(out));
        });
    }
    if (name == "localeCompare") {
        return method([self](Interpreter&, Args& args) {
            const int cmp = self.compare(arg(args, 0).to_display_string());
            return Value(cmp < 0 ? -1 : (cmp > 0 ? 1 : 0));
        });
    }
    if (name == "toString" || name == "valueOf" || name == "normalize") {
        return method([self](Interpreter&, Args&) { return Value(self); });
    }
    return std::nullopt;
}

// Calls fn(item, index, array) for each element present at call time.
template <typename Visit>
void for_each_item(Interpreter& interpreter, const Value& self, const Value& fn, Visit visit) {
    if (!fn.is_function()) {
        interpreter.throw_error("TypeError", fn.to_display_string() + " is not a function");
    }
    const std::size_t length = self.as_array().items.size();
    for (std::size_t i = 0; i < length && i < self.as_array().items.size(); ++i) {
        const Value item = self.as_array().items[i];
        const Value result = interpreter.call(fn, {item, Value(i), self});
        if (!visit(i, item, result)) {
            return;
        }
    }
}

std::optional<Value> array_method(const Value& self, const std::string& name) {
    auto method = [&name](NativeFn fn) { return std::optional<Value>(Value::native(name, std::move(fn))); };

    if (name == "push") {
        return method([self](Interpreter& interpreter, Args& args) {
            auto& items = self.as_array().items;
            if (items.size() + args.size() > (1U << 24)) {
                interpreter.throw_error("RangeError", "Invalid array length");
            }
            items.insert(items.end(), args.begin(), args.end());
            return Value(items.size());
        });
    }
    if (name == "pop") {
        return method([self](Interpreter&, Args&) {
            auto& items = self.as_array().items;
            if (items.empty()) {
                return Value();
            }
            Value last = items.back();
            items.pop_back();
            return last;
        });
    }
    if (name == "shift") {
        return method([self](Interpreter&, Args&) {
            auto& items = self.as_array().items;
            if (items.empty()) {
                return Value();
            }
            Value first = items.front();
            items.erase(items.begin());
            return first;
        });
    }
    if (name == "unshift") {
        return method([self](Interpreter&, Args& args) {
            auto& items = self.as_array().items;
            items.insert(items.begin(), args.begin(), args.end());
            return Value(items.size());
        });
    }
    if (name == "slice") {
        return method([self](Interpreter&, Args& args) {
            const auto& items = self.as_array().items;
            const std::size_t start = relative_index(arg(args, 0), items.size(), 0);
            const std::size_t end = relative_index(arg(args, 1), items.size(), items.size());
            if (start >= end) {
                return Value::array();
            }
            return Value::array(std::vector<Value>(items.begin() + static_cast<std::ptrdiff_t>(start),
                                                   items.begin() + static_cast<std::ptrdiff_t>(end)));
        });
    }
    if (name == "splice") {
        return method([self](Interpreter&, Args& args) {
            auto& items = self.as_array().items;
            const std::size_t start = relative_index(arg(args, 0), items.size(), 0);
            std::size_t count = items.size() - start;
            if (args.size() >= 2) {
                count = std::min(clamped_index(args[1], items.size()), items.size() - start);
            } else if (args.empty()) {
                count = 0;
            }
            const auto first = items.begin() + static_cast<std::ptrdiff_t>(start);
            std::vector<Value> removed(first, first + static_cast<std::ptrdiff_t>(count));
            items.erase(first, first + static_cast<std::ptrdiff_t>(count));
            if (args.size() > 2) {
                items.insert(items.begin() + static_cast<std::ptrdiff_t>(start), args.begin() + 2,
                             args.end());
            }
            return Value::array(std::move(removed));
        });
    }
    if (name == "concat") {
        return method([self](Interpreter&, Args& args) {
            std::vector<Value> out = self.as_array().items;
            for (const auto& part : args) {
                if (part.is_array()) {
                    const auto& items = part.as_array().items;
                    out.insert(out.end(), items.begin(), items.end());
                } else {
                    out.push_back(part);
                }
            }
            return Value::array(std::move(out));
        });
    }
    if (name == "join" || name == "toString") {
        const bool plain = name == "toString";
        return method([self, plain](Interpreter&, Args& args) {
            const std::string separator = plain || arg(args, 0).is_undefined()
                                              ? ","
                                              : arg(args, 0).to_display_string();
            return Value(join_values(self.as_array(), separator));
        });
    }
    if (name == "indexOf" || name == "lastIndexOf" || name == "includes") {
        const std::string kind = name;
        return method([self, kind](Interpreter&, Args& args) {
            const auto& items = self.as_array().items;
            const Value needle = arg(args, 0);
            if (kind == "lastIndexOf") {
                for (std::size_t i = items.size(); i > 0; --i) {
                    if (items[i - 1].strict_equals(needle)) {
                        return Value(i - 1);
                    }
                }
                return Value(-1);
            }
            const std::size_t from = relative_index(arg(args, 1), items.size(), 0);
            for (std::size_t i = from; i < items.size(); ++i) {
                const bool hit = kind == "includes" ? same_value_zero(items[i], needle)
                                                    : items[i].strict_equals(needle);
                if (hit) {
                    return kind == "includes" ? Value(true) : Value(i);
                }
            }
            return kind == "includes" ? Value(false) : Value(-1);
        });
    }
    if (name == "find" || name == "findIndex") {
        const bool want_index = name == "findIndex";
        return method([self, want_index](Interpreter& interpreter, Args& args) {
            Value found = want_index ? Value(-1) : Value();
            for_each_item(interpreter, self, arg(args, 0),
                          [&](std::size_t i, const Value& item, const Value& result) {
                              if (!result.truthy()) {
                                  return true;
                              }
                              found = want_index ? Value(i) : item;
                              return false;
                          });
            return found;
        });
    }
    if (name == "findLast" || name == "findLastIndex") {
        const bool want_index = name == "findLastIndex";
        return method([self, want_index](Interpreter& interpreter, Args& args) {
            const Value fn = arg(args, 0);
            const auto items = self.as_array().items;
            for (std::size_t i = items.size(); i > 0; --i) {
                if (interpreter.call(fn, {items[i - 1], Value(i - 1), self}).truthy()) {
                    return want_index ? Value(i - 1) : items[i - 1];
                }
            }
            return want_index ? Value(-1) : Value();
        });
    }
    if (name == "filter") {
        return method([self](Interpreter& interpreter, Args& args) {
            std::vector<Value> out;
            for_each_item(interpreter, self, arg(args, 0),
                          [&out](std::size_t, const Value& item, const Value& result) {
                              if (result.truthy()) {
                                  out.push_back(item);
                              }
                              return true;
                          });
            return Value::array(std::move(out));
        });
    }
    if (name == "map") {
        return method([self](Interpreter& interpreter, Args& args) {
            std::vector<Value> out;
            for_each_item(interpreter, self, arg(args, 0),
                          [&out](std::size_t, const Value&, const Value& result) {
                              out.push_back(result);
                              return true;
                          });
            return Value::array(std::move(out));
        });
    }
    if (name == "forEach") {
        return method([self](Interpreter& interpreter, Args& args) {
            for_each_item(interpreter, self, arg(args, 0),
                          [](std::size_t, const Value&, const Value&) { return true; });
            return Value();
        });
    }
    if (name == "some" || name == "every") {
        const bool every = name == "every";
        return method([self, every](Interpreter& interpreter, Args& args) {
            bool outcome = every;
            for_each_item(interpreter, self, arg(args, 0),
                          [&outcome, every](std::size_t, const Value&, const Value& result) {
                              if (result.truthy() != every) {
                                  outcome = !every;
                                  return false;
                              }
                              return true;
                          });
            return Value(outcome);
        });
    }
    if (name == "reduce" || name == "reduceRight") {
        const bool from_right = name == "reduceRight";
        return method([self, from_right](Interpreter& interpreter, Args& args) {
            const Value fn = arg(args, 0);
            if (!fn.is_function()) {
                interpreter.throw_error("TypeError", fn.to_display_string() + " is not a function");
            }
            std::vector<Value> items = self.as_array().items;
            if (from_right) {
                std::reverse(items.begin(), items.end());
            }
            std::size_t start = 0;
            Value accumulator;
            if (args.size() >= 2) {
                accumulator = args[1];
            } else if (items.empty()) {
                interpreter.throw_error("TypeError", "Reduce of empty array with no initial value");
            } else {
                accumulator = items[0];
                start = 1;
            }
            for (std::size_t i = start; i < items.size(); ++i) {
                const std::size_t index = from_right ? items.size() - 1 - i : i;
                accumulator = interpreter.call(fn, {accumulator, items[i], Value(index), self});
            }
            return accumulator;
        });
    }
    if (name == "sort") {
        return method([self](Interpreter& interpreter, Args& args) {
            const Value compare = arg(args, 0);
            std::vector<Value> items = self.as_array().items;
            std::stable_sort(items.begin(), items.end(),
                             [&interpreter, &compare](const Value& a, const Value& b) {
                                 if (a.is_undefined() || b.is_undefined()) {
                                     return !a.is_undefined() && b.is_undefined();
                                 }
                                 if (compare.is_function()) {
                                     return interpreter.call(compare, {a, b}).to_number() < 0;
                                 }
                                 return a.to_display_string() < b.to_display_string();
                             });
            self.as_array().items = std::move(items);
            return self;
        });
    }
    if (name == "reverse") {
        return method([self](Interpreter&, Args&) {
            auto& items = self.as_array().items;
            std::reverse(items.begin(), items.end());
            return self;
        });
    }
    if (name == "flat") {
        return method([self](Interpreter& interpreter, Args& args) {
            const double depth = arg(args, 0).is_undefined() ? 1 : arg(args, 0).to_number();
            std::vector<Value> out;
            flatten_into(interpreter, out, self.as_array().items, depth, 0);
            return Value::array(std::move(out));
        });
    }
    if (name == "flatMap") {
        return method([self](Interpreter& interpreter, Args& args) {
            std::vector<Value> out;
            for_each_item(interpreter, self, arg(args, 0),
                          [&out](std::size_t, const Value&, const Value& result) {
                              if (result.is_array()) {
                                  const auto& items = result.as_array().items;
                                  out.insert(out.end(), items.begin(), items.end());
                              } else {
                                  out.push_back(result);
                              }
                              return true;
                          });
            return Value::array(std::move(out));
        });
    }
    if (name == "fill") {
        return method([self](Interpreter&, Args& args) {
            auto& items = self.as_array().items;
            const std::size_t start = relative_index(arg(args, 1), items.size(), 0);
            const std::size_t end = relative_index(arg(args, 2), items.size(), items.size());
            for (std::size_t i = start; i < end; ++i) {
                items[i] = arg(args, 0);
            }
            return self;
        });
    }
    if (name == "at") {
        return method([self](Interpreter&, Args& args) {
            const auto& items = self.as_array().items;
            double index = std::trunc(arg(args, 0).to_number());
            if (std::isnan(index)) {
                index = 0;
            }
            if (index < 0) {
                index += static_cast<double>(items.size());
            }
            if (index < 0 || index >= static_cast<double>(items.size())) {
                return Value();
            }
            return items[static_cast<std::size_t>(index)];
        });
    }
    if (name == "keys" || name == "values" || name == "entries") {
        const std::string kind = name;
        return method([self, kind](Interpreter&, Args&) {
            const auto& items = self.as_array().items;
            std::vector<Value> out;
            out.reserve(items.size());
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (kind == "keys") {
                    out.emplace_back(i);
                } else if (kind == "values") {
                    out.push_back(items[i]);
                } else {
                    out.push_back(Value::array({Value(i), items[i]}));
                }
            }
            return Value::array(std::move(out));
        });
    }
    return std::nullopt;
}

std::optional<Value> number_method(const double self, const std::string& name) {
    if (name == "toFixed") {
        return Value::native(name, [self](Interpreter& interpreter, Args& args) {
            const double digits = arg(args, 0).is_undefined() ? 0 : arg(args, 0).to_number();
            if (std::isnan(digits) || digits < 0 || digits > 100) {
                interpreter.throw_error("RangeError", "toFixed() digits argument must be between 0 and 100");
            }
            if (!std::isfinite(self) || std::fabs(self) >= 1e21) {
                return Value(format_number(self));
            }
            char buffer[160];
            std::snprintf(buffer, sizeof(buffer), "%.*f", static_cast<int>(digits), self);
            return Value(std::string(buffer));
        });
    }
    if (name == "toString") {
        return Value::native(name, [self](Interpreter& interpreter, Args& args) {
            const double radix = arg(args, 0).is_undefined() ? 10 : arg(args, 0).to_number();
            if (radix < 2 || radix > 36) {
                interpreter.throw_error("RangeError", "toString() radix must be between 2 and 36");
            }
            return Value(number_to_radix(self, static_cast<int>(radix)));
        });
    }
    if (name == "valueOf") {
        return Value::native(name, [self](Interpreter&, Args&) { return Value(self); });
    }
    return std::nullopt;
}

std::optional<Value> function_method(const Value& self, const std::string& name) {
    if (name == "call") {
        return Value::native(name, [self](Interpreter& interpreter, Args& args) {
            std::vector<Value> rest;
            if (args.size() > 1) {
                rest.assign(args.begin() + 1, args.end());
            }
            return interpreter.call(self, std::move(rest), arg(args, 0));
        });
    }
    if (name == "apply") {
        return Value::native(name, [self](Interpreter& interpreter, Args& args) {
            const Value list = arg(args, 1);
            std::vector<Value> rest = list.is_array() ? list.as_array().items : std::vector<Value>{};
            return interpreter.call(self, std::move(rest), arg(args, 0));
        });
    }
    if (name == "bind") {
        return Value::native(name, [self](Interpreter&, Args& args) {
            const Value bound_this = arg(args, 0);
            std::vector<Value> bound_args;
            if (args.size() > 1) {
                bound_args.assign(args.begin() + 1, args.end());
            }
            return Value::native(self.as_function()->name,
                                 [self, bound_this, bound_args](Interpreter& interpreter,
                                                                Args& call_args) {
                                     std::vector<Value> combined = bound_args;
                                     combined.insert(combined.end(), call_args.begin(),
                                                     call_args.end());
                                     return interpreter.call(self, std::move(combined),
                                                             bound_this);
                                 });
        });
    }
    return std::nullopt;
}

Value make_json() {
    Value json_object = Value::object();
    add_method(json_object, "stringify", [](Interpreter& interpreter, Args& args) {
        const Value value = arg(args, 0);
        if (value.is_undefined() || value.is_function()) {
            return Value();
        }
        const Value space = arg(args, 2);
        int indent = -1;
        char indent_char = ' ';
        if (space.is_number()) {
            indent = static_cast<int>(std::min(10.0, std::max(0.0, space.as_number())));
            if (indent == 0) {
                indent = -1;
            }
        } else if (space.is_string() && !space.as_string().empty()) {
            indent_char = space.as_string()[0];
            indent = static_cast<int>(std::min<std::size_t>(10, space.as_string().size()));
        }
        if (!arg(args, 1).is_nullish()) {
            LOG_DEBUG("JSON.stringify: replacer argument is ignored");
        }
        interpreter.check_budget();
        return Value(to_json(value).dump(indent, indent_char, false,
                                         json::error_handler_t::replace));
    });
    add_method(json_object, "parse", [](Interpreter& interpreter, Args& args) {
        const std::string text = arg(args, 0).to_display_string();
        const json document = json::parse(text, nullptr, false);
        if (document.is_discarded()) {
            interpreter.throw_error("SyntaxError", "Unexpected token in JSON input");
        }
        return from_json(document);
    });
    return json_object;
}

Value make_math() {
    Value math = Value::object();
    set_member(math, "PI", Value(M_PI));
    set_member(math, "E", Value(M_E));
    set_member(math, "LN2", Value(M_LN2));
    set_member(math, "LN10", Value(M_LN10));
    set_member(math, "SQRT2", Value(M_SQRT2));

    const std::vector<std::pair<std::string, double (*)(double)>> unary = {
        {"abs", [](double x) { return std::fabs(x); }},
        {"floor", [](double x) { return std::floor(x); }},
        {"ceil", [](double x) { return std::ceil(x); }},
        {"round", [](double x) { return std::floor(x + 0.5); }},
        {"trunc", [](double x) { return std::trunc(x); }},
        {"sign", [](double x) { return std::isnan(x) ? x : (x > 0 ? 1.0 : (x < 0 ? -1.0 : x)); }},
        {"sqrt", [](double x) { return std::sqrt(x); }},
        {"cbrt", [](double x) { return std::cbrt(x); }},
        {"log", [](double x) { return std::log(x); }},
        {"log2", [](double x) { return std::log2(x); }},
        {"log10", [](double x) { return std::log10(x); }},
        {"exp", [](double x) { return std::exp(x); }},
        {"sin", [](double x) { return std::sin(x); }},
        {"cos", [](double x) { return std::cos(x); }},
        {"tan", [](double x) { return std::tan(x); }},
        {"asin", [](double x) { return std::asin(x); }},
        {"acos", [](double x) { return std::acos(x); }},
        {"atan", [](double x) { return std::atan(x); }}};
    for (const auto& entry : unary) {
        set_member(math, entry.first, math_fn(entry.first, entry.second));
    }

    add_method(math, "pow", [](Interpreter&, Args& args) {
        return Value(std::pow(arg(args, 0).to_number(), arg(args, 1).to_number()));
    });
    add_method(math, "atan2", [](Interpreter&, Args& args) {
        return Value(std::atan2(arg(args, 0).to_number(), arg(args, 1).to_number()));
    });
    add_method(math, "hypot", [](Interpreter&, Args& args) {
        double sum = 0;
        for (const auto& value : args) {
            const double number = value.to_number();
            sum += number * number;
        }
        return Value(std::sqrt(sum));
    });
    add_method(math, "min", [](Interpreter&, Args& args) {
        double result = HUGE_VAL;
        for (const auto& value : args) {
            const double number = value.to_number();
            if (std::isnan(number)) {
                return Value(number);
            }
            result = std::min(result, number);
        }
        return Value(result);
    });
    add_method(math, "max", [](Interpreter&, Args& args) {
        double result = -HUGE_VAL;
        for (const auto& value : args) {
            const double number = value.to_number();
            if (std::isnan(number)) {
                return Value(number);
            }
            result = std::max(result, number);
        }
        return Value(result);
    });
    add_method(math, "random", [](Interpreter&, Args&) {
        static thread_local std::mt19937_64 engine{std::random_device{}()};
        std::uniform_real_distribution<double> distribution(0.0, 1.0);
        return Value(distribution(engine));
    });
    return math;
}

Value make_object_constructor() {
    Value object = Value::native("Object", [](Interpreter&, Args& args) {
        const Value value = arg(args, 0);
        return value.is_nullish() ? Value::object() : value;
    });
    add_method(object, "keys", [](Interpreter&, Args& args) {
        return array_from_strings(object_keys(arg(args, 0)));
    });
    add_method(object, "values", [](Interpreter& interpreter, Args& args) {
        const Value value = arg(args, 0);
        std::vector<Value> out;
        for (const auto& key : object_keys(value)) {
            out.push_back(interpreter.get_property(value, key));
        }
        return Value::array(std::move(out));
    });
    add_method(object, "entries", [](Interpreter& interpreter, Args& args) {
        const Value value = arg(args, 0);
        std::vector<Value> out;
        for (const auto& key : object_keys(value)) {
            out.push_back(Value::array({Value(key), interpreter.get_property(value, key)}));
        }
        return Value::array(std::move(out));
    });
    add_method(object, "assign", [](Interpreter& interpreter, Args& args) {
        const Value target = arg(args, 0);
        if (target.is_nullish()) {
            interpreter.throw_error("TypeError", "Cannot convert undefined or null to object");
        }
        for (std::size_t i = 1; i < args.size(); ++i) {
            for (const auto& key : object_keys(args[i])) {
                interpreter.set_property(target, key, interpreter.get_property(args[i], key));
            }
        }
        return target;
    });
    add_method(object, "fromEntries", [](Interpreter& interpreter, Args& args) {
        Value out = Value::object();
        const Value entries = arg(args, 0);
        if (!entries.is_array()) {
            interpreter.throw_error("TypeError", "Object.fromEntries requires an array of pairs");
        }
        for (const auto& entry : entries.as_array().items) {
            if (!entry.is_array()) {
                interpreter.throw_error("TypeError", "Iterator value " + entry.to_display_string() +
                                                         " is not an entry object");
            }
            const auto& pair = entry.as_array().items;
            const Value key = pair.empty() ? Value() : pair[0];
            out.as_object().properties[to_property_key(key)] = pair.size() > 1 ? pair[1] : Value();
        }
        return out;
    });
    add_method(object, "freeze", [](Interpreter&, Args& args) { return arg(args, 0); });
    return object;
}

Value make_array_constructor() {
    Value array = Value::native("Array", [](Interpreter& interpreter, Args& args) {
        if (args.size() == 1 && args[0].is_number()) {
            const double length = args[0].as_number();
            if (length < 0 || std::trunc(length) != length || length > (1U << 24)) {
                interpreter.throw_error("RangeError", "Invalid array length");
            }
            return Value::array(std::vector<Value>(static_cast<std::size_t>(length)));
        }
        return Value::array(args);
    });
    add_method(array, "isArray", [](Interpreter&, Args& args) {
        return Value(arg(args, 0).is_array());
    });
    add_method(array, "of", [](Interpreter&, Args& args) { return Value::array(args); });
    add_method(array, "from", [](Interpreter& interpreter, Args& args) {
        const Value source = arg(args, 0);
        const Value map_fn = arg(args, 1);
        std::vector<Value> items;
        if (source.is_array()) {
            items = source.as_array().items;
        } else if (source.is_string()) {
            for (auto& character : utf8_characters(source.as_string())) {
                items.emplace_back(std::move(character));
            }
        } else if (source.is_object()) {
            const double length = interpreter.get_property(source, "length").to_number();
            if (length > (1U << 24)) {
                interpreter.throw_error("RangeError", "Invalid array length");
            }
            for (double i = 0; i < length; ++i) {
                items.push_back(interpreter.get_property(source, format_number(i)));
            }
        }
        if (map_fn.is_function()) {
            for (std::size_t i = 0; i < items.size(); ++i) {
                items[i] = interpreter.call(map_fn, {items[i], Value(i)});
            }
        }
        return Value::array(std::move(items));
    });
    return array;
}

Value make_number_constructor() {
    Value number = Value::native("Number", [](Interpreter&, Args& args) {
        return Value(args.empty() ? 0.0 : args[0].to_number());
    });
    add_method(number, "isInteger", [](Interpreter&, Args& args) {
        const Value value = arg(args, 0);
        return Value(value.is_number() && std::isfinite(value.as_number()) &&
                     std::trunc(value.as_number()) == value.as_number());
    });
    add_method(number, "isSafeInteger", [](Interpreter&, Args& args) {
        const Value value = arg(args, 0);
        return Value(value.is_number() && std::trunc(value.as_number()) == value.as_number() &&
                     std::fabs(value.as_number()) <= 9007199254740991.0);
    });
    add_method(number, "isFinite", [](Interpreter&, Args& args) {
        const Value value = arg(args, 0);
        return Value(value.is_number() && std::isfinite(value.as_number()));
    });
    add_method(number, "isNaN", [](Interpreter&, Args& args) {
        const Value value = arg(args, 0);
        return Value(value.is_number() && std::isnan(value.as_number()));
    });
    add_method(number, "parseFloat", [](Interpreter&, Args& args) {
        return Value(parse_float(arg(args, 0).to_display_string()));
    });
    add_method(number, "parseInt", [](Interpreter&, Args& args) {
        return Value(parse_int(arg(args, 0).to_display_string(),
                               static_cast<int>(arg(args, 1).is_undefined() ? 0 : arg(args, 1).to_number())));
    });
    set_member(number, "MAX_SAFE_INTEGER", Value(9007199254740991.0));
    set_member(number, "MIN_SAFE_INTEGER", Value(-9007199254740991.0));
    set_member(number, "EPSILON", Value(std::numeric_limits<double>::epsilon()));
    set_member(number, "MAX_VALUE", Value(std::numeric_limits<double>::max()));
    set_member(number, "POSITIVE_INFINITY", Value(HUGE_VAL));
    set_member(number, "NEGATIVE_INFINITY", Value(-HUGE_VAL));
    return number;
}

// Capabilities complete before returning, so promises are plain values here.
Value make_promise() {
    Value promise = Value::object();
    add_method(promise, "resolve", [](Interpreter&, Args& args) { return arg(args, 0); });
    add_method(promise, "reject", [](Interpreter&, Args& args) -> Value {
        throw ScriptError(arg(args, 0));
    });
    add_method(promise, "all", [](Interpreter& interpreter, Args& args) {
        const Value values = arg(args, 0);
        if (!values.is_array()) {
            interpreter.throw_error("TypeError", "Promise.all expects an array");
        }
        return Value::array(values.as_array().items);
    });
    add_method(promise, "allSettled", [](Interpreter& interpreter, Args& args) {
        const Value values = arg(args, 0);
        if (!values.is_array()) {
            interpreter.throw_error("TypeError", "Promise.allSettled expects an array");
        }
        std::vector<Value> out;
        for (const auto& value : values.as_array().items) {
            Value settled = Value::object();
            settled.as_object().properties["status"] = "fulfilled";
            settled.as_object().properties["value"] = value;
            out.push_back(settled);
        }
        return Value::array(std::move(out));
    });
    add_method(promise, "race", [](Interpreter&, Args& args) {
        const Value values = arg(args, 0);
        if (values.is_array() && !values.as_array().items.empty()) {
            return values.as_array().items.front();
        }
        return Value();
    });
    return promise;
}

Value make_console() {
    using core::logging::LogLevel;
    Value console = Value::object();
    set_member(console, "log", console_method("log", LogLevel::INFO));
    set_member(console, "info", console_method("info", LogLevel::INFO));
    set_member(console, "debug", console_method("debug", LogLevel::DEBUG));
    set_member(console, "warn", console_method("warn", LogLevel::WARN));
    set_member(console, "error", console_method("error", LogLevel::ERROR));
    return console;
}

}  // namespace

std::optional<Value> builtin_method(const Value& self, const std::string& name) {
    switch (self.type()) {
        case Value::Type::String:
            return string_method(self.as_string(), name);
        case Value::Type::Array:
            return array_method(self, name);
        case Value::Type::Number:
            return number_method(self.as_number(), name);
        case Value::Type::Boolean:
            if (name == "toString") {
                const bool flag = self.as_bool();
                return Value::native(name, [flag](Interpreter&, Args&) {
                    return Value(flag ? "true" : "false");
                });
            }
            return std::nullopt;
        case Value::Type::Object:
            if (name == "hasOwnProperty") {
                return Value::native(name, [self](Interpreter&, Args& args) {
                    return Value(self.as_object().properties.count(
                                     to_property_key(arg(args, 0))) > 0);
                });
            }
            if (name == "toString") {
                return Value::native(name, [self](Interpreter&, Args&) {
                    return Value(self.to_display_string());
                });
            }
            return std::nullopt;
        case Value::Type::Function:
            return function_method(self, name);
        default:
            return std::nullopt;
    }
}

void install_builtins(Interpreter& interpreter) {
    interpreter.define_global("JSON", make_json());
    interpreter.define_global("Math", make_math());
    interpreter.define_global("Object", make_object_constructor());
    interpreter.define_global("Array", make_array_constructor());
    interpreter.define_global("Number", make_number_constructor());
    interpreter.define_global("Promise", make_promise());
    interpreter.define_global("console", make_console());

    interpreter.define_global("String", Value::native("String", [](Interpreter&, Args& args) {
        return Value(args.empty() ? std::string() : args[0].to_display_string());
    }));
    interpreter.define_global("Boolean", Value::native("Boolean", [](Interpreter&, Args& args) {
        return Value(arg(args, 0).truthy());
    }));
    interpreter.define_global("parseInt", Value::native("parseInt", [](Interpreter&, Args& args) {
        return Value(parse_int(arg(args, 0).to_display_string(),
                               static_cast<int>(arg(args, 1).is_undefined() ? 0 : arg(args, 1).to_number())));
    }));
    interpreter.define_global("parseFloat", Value::native("parseFloat", [](Interpreter&, Args& args) {
        return Value(parse_float(arg(args, 0).to_display_string()));
    }));
    interpreter.define_global("isNaN", Value::native("isNaN", [](Interpreter&, Args& args) {
        return Value(std::isnan(arg(args, 0).to_number()));
    }));
    interpreter.define_global("isFinite", Value::native("isFinite", [](Interpreter&, Args& args) {
        return Value(std::isfinite(arg(args, 0).to_number()));
    }));

    for (const char* name : {"Error", "TypeError", "RangeError", "SyntaxError", "ReferenceError"}) {
        interpreter.define_global(name, error_constructor(name));
    }

    Value date = Value::object();
    add_method(date, "now", [](Interpreter&, Args&) {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return Value(static_cast<double>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now).count()));
    });
    interpreter.define_global("Date", date);
}

}  // namespace toolbridge::script
