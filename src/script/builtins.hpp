#pragma once

#include <optional>
#include <string>
#include "script/value.hpp"

namespace toolbridge::script {

class Interpreter;

// Installs the pure globals every snippet sees: JSON, Math, Object, Array,
// String, Number, Boolean, Error types, Promise, console and the numeric
// helpers. Capabilities that reach outside the process are bound separately.
void install_builtins(Interpreter& interpreter);

// Method lookup on strings, numbers, arrays and plain objects, e.g.
// "abc".toUpperCase or [1, 2].map. Returns nullopt for unknown names.
std::optional<Value> builtin_method(const Value& self, const std::string& name);

}  // namespace toolbridge::script
