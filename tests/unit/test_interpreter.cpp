#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "script/interpreter.hpp"
#include "script/script_error.hpp"

namespace {

using nlohmann::json;
using toolbridge::core::errors::ErrorCategory;
using toolbridge::script::ContainerArena;
using toolbridge::script::FunctionData;
using toolbridge::script::Interpreter;
using toolbridge::script::ScriptError;
using toolbridge::script::Value;

// Far deeper than native recursion survives with a default-sized stack.
constexpr const char* kDeepChain =
    "let a = []; for (let i = 0; i < 200000; i++) { a = [a]; } ";

json run(const std::string& source) {
    Interpreter interpreter;
    return toolbridge::script::to_json(interpreter.run(source));
}

ScriptError run_failing(const std::string& source) {
    Interpreter interpreter;
    try {
        interpreter.run(source);
    } catch (const ScriptError& e) {
        return e;
    }
    ADD_FAILURE() << "expected a script error from: " << source;
    return ScriptError(Value("no error"));
}

TEST(InterpreterTest, EvaluatesArithmeticAndReturnsIntegers) {
    EXPECT_EQ(run("return 1+1"), json(2));
    EXPECT_EQ(run("return 2 ** 10 - 24 / 4 % 5"), json(1023));
    EXPECT_EQ(run("return 0.1 + 0.2 > 0.3"), json(true));
    EXPECT_EQ(run("return 7 / 2"), json(3.5));
    EXPECT_EQ(run("return (5 & 3) | (1 << 4)"), json(17));
}

TEST(InterpreterTest, MissingReturnYieldsNull) {
    EXPECT_TRUE(run("const x = 1;").is_null());
    EXPECT_TRUE(run("return undefined").is_null());
}

TEST(InterpreterTest, SupportsDeclarationsAndScoping) {
    EXPECT_EQ(run("let a = 1; { let a = 2; } return a;"), json(1));
    EXPECT_EQ(run("var total = 0; for (var i = 0; i < 4; i++) { total += i; } return [total, i];"),
              json::array({6, 4}));
    EXPECT_EQ(run("const fns = []; for (let i = 0; i < 3; i++) fns.push(() => i);"
                  "return fns.map(f => f());"),
              json::array({0, 1, 2}));
}

TEST(InterpreterTest, ConstReassignmentThrowsTypeError) {
    const auto error = run_failing("const x = 1; x = 2;");
    EXPECT_STREQ(error.what(), "Assignment to constant variable.");
    EXPECT_EQ(error.category(), ErrorCategory::Execution);
}

TEST(InterpreterTest, UndefinedVariableIsReferenceError) {
    const auto error = run_failing("return missingName + 1;");
    EXPECT_STREQ(error.what(), "missingName is not defined");
    EXPECT_NE(error.stack().find("ReferenceError"), std::string::npos);
}

TEST(InterpreterTest, ControlFlowStatements) {
    EXPECT_EQ(run(R"(
        let out = [];
        let n = 0;
        while (true) {
            n++;
            if (n % 2 === 0) continue;
            if (n > 7) break;
            out.push(n);
        }
        do { n--; } while (n > 5);
        switch (n) {
            case 4: out.push('four'); break;
            case 5: out.push('five');
            default: out.push('fallthrough');
        }
        return out;
    )"),
              json::array({1, 3, 5, 7, "five", "fallthrough"}));
}

TEST(InterpreterTest, ForOfAndForIn) {
    EXPECT_EQ(run(R"(
        const obj = {b: 2, a: 1};
        const keys = [];
        for (const k in obj) keys.push(k);
        let sum = 0;
        for (const [k, v] of Object.entries(obj)) sum += v;
        const chars = [];
        for (const c of 'hé') chars.push(c);
        return {keys, sum, chars};
    )"),
              json({{"keys", {"a", "b"}}, {"sum", 3}, {"chars", {"h", "é"}}}));
}

TEST(InterpreterTest, FunctionsClosuresAndRecursion) {
    EXPECT_EQ(run(R"(
        function fib(n) { return n < 2 ? n : fib(n - 1) + fib(n - 2); }
        const counter = (() => { let c = 0; return () => ++c; })();
        counter(); counter();
        const add = function (a, b = 10, ...rest) { return a + b + rest.length; };
        return [fib(15), counter(), add(1), add(1, 2, 3, 4)];
    )"),
              json::array({610, 3, 11, 5}));
}

TEST(InterpreterTest, DestructuringAndSpread) {
    EXPECT_EQ(run(R"(
        const {a, b: {c = 5} = {}, ...others} = {a: 1, d: 4, e: 5};
        const [x, , y = 9, ...tail] = [1, 2, undefined, 4, 5];
        const merged = {...others, a, list: [...tail, ...'ab']};
        return [a, c, x, y, tail, merged, Math.max(...tail)];
    )"),
              json::parse(R"([1, 5, 1, 9, [4, 5],
                             {"a": 1, "d": 4, "e": 5, "list": [4, 5, "a", "b"]}, 5])"));
}

TEST(InterpreterTest, TemplateLiteralsAndStringMethods) {
    EXPECT_EQ(run(R"(
        const name = 'octocat';
        const repo = { stars: 42 };
        return `${name.toUpperCase()} has ${repo.stars} stars, ${'a-b-c'.split('-').join('+')}`;
    )"),
              json("OCTOCAT has 42 stars, a+b+c"));
    EXPECT_EQ(run("return ['  pad '.trim(), 'abc'.slice(-2), 'x'.padStart(3, '0'), "
                  "'a.b.a'.replaceAll('a', 'z'), 'Hello'.includes('ell')]"),
              json::array({"pad", "bc", "00x", "z.b.z", true}));
}

TEST(InterpreterTest, ArrayHigherOrderMethods) {
    EXPECT_EQ(run(R"(
        const issues = [
            {id: 3, open: true, labels: ['bug']},
            {id: 1, open: false, labels: []},
            {id: 2, open: true, labels: ['docs', 'bug']},
        ];
        const open = issues.filter(i => i.open).map(i => i.id);
        const sorted = issues.map(i => i.id).sort((a, b) => a - b);
        const labelCount = issues.reduce((n, i) => n + i.labels.length, 0);
        const firstBug = issues.find(i => i.labels.includes('bug')).id;
        return {open, sorted, labelCount, firstBug,
                every: issues.every(i => i.id > 0), flat: issues.flatMap(i => i.labels)};
    )"),
              json::parse(R"({"open": [3, 2], "sorted": [1, 2, 3], "labelCount": 3,
                              "firstBug": 3, "every": true, "flat": ["bug", "docs", "bug"]})"));
}

TEST(InterpreterTest, DefaultSortComparesAsStrings) {
    EXPECT_EQ(run("return [10, 9, 1, 100].sort()"), json::array({1, 10, 100, 9}));
}

TEST(InterpreterTest, OptionalChainingAndNullish) {
    EXPECT_EQ(run(R"(
        const user = {profile: null, tags: ['a']};
        return [user.profile?.name, user.missing?.deep.value, user.tags?.[0],
                user.profile ?? 'none', 0 ?? 1, user.nothing?.()];
    )"),
              json::array({nullptr, nullptr, "a", "none", 0, nullptr}));
}

TEST(InterpreterTest, LogicalAssignmentOperators) {
    EXPECT_EQ(run("const o = {a: null, b: 0, c: 1};"
                  "o.a ?\?= 'set'; o.b ?\?= 5; o.b ||= 7; o.c &&= 9; let x; x ?\?= 4;"
                  "return [o.a, o.b, o.c, x];"),
              json::array({"set", 7, 9, 4}));
}

TEST(InterpreterTest, JsonAndMathBuiltins) {
    EXPECT_EQ(run(R"(return JSON.stringify({b: [1, 'x'], a: null}))"),
              json(R"({"a":null,"b":[1,"x"]})"));
    EXPECT_EQ(run(R"(return JSON.parse('{"n": 3, "list": [true]}').list[0])"), json(true));
    EXPECT_EQ(run("return [Math.floor(2.7), Math.round(2.5), Math.abs(-3), Math.min(4, 2, 8)]"),
              json::array({2, 3, 3, 2}));
    EXPECT_EQ(run("return [parseInt('42px'), Number('3.5'), (255).toString(16), (1.005).toFixed(1)]"),
              json::array({42, 3.5, "ff", "1.0"}));
}

TEST(InterpreterTest, InvalidJsonParseIsCatchableSyntaxError) {
    EXPECT_EQ(run("try { JSON.parse('{nope'); } catch (e) { return e.name; }"), json("SyntaxError"));
}

TEST(InterpreterTest, TryCatchFinallyAndCustomErrors) {
    EXPECT_EQ(run(R"(
        const log = [];
        try {
            try {
                throw new TypeError('bad input');
            } finally {
                log.push('inner finally');
            }
        } catch (e) {
            log.push(`${e.name}: ${e.message}`);
            log.push(e instanceof TypeError, e instanceof Error, e instanceof RangeError);
        }
        try { throw {code: 7}; } catch ({code}) { log.push(code); }
        return log;
    )"),
              json::array({"inner finally", "TypeError: bad input", true, true, false, 7}));
}

TEST(InterpreterTest, UncaughtThrowCarriesMessageAndStack) {
    const auto error = run_failing(R"(
        function explode() {
            throw new Error('kaboom');
        }
        explode();
    )");
    EXPECT_STREQ(error.what(), "kaboom");
    EXPECT_EQ(error.category(), ErrorCategory::Execution);
    const std::string stack = error.stack();
    EXPECT_EQ(stack.rfind("Error: kaboom", 0), 0u);
    EXPECT_NE(stack.find("at explode (<snippet>:3)"), std::string::npos);
    EXPECT_NE(stack.find("at <snippet>:5"), std::string::npos);
}

TEST(InterpreterTest, ThrownPrimitiveBecomesMessage) {
    const auto error = run_failing("throw 'plain text'");
    EXPECT_STREQ(error.what(), "plain text");
    EXPECT_TRUE(error.stack().empty());
}

TEST(InterpreterTest, ConnectionErrorNameKeepsConnectionCategory) {
    const auto error = run_failing(R"(
        const e = new Error('socket closed');
        e.name = 'ConnectionError';
        throw e;
    )");
    EXPECT_EQ(error.category(), ErrorCategory::Connection);
}

TEST(InterpreterTest, SyntaxErrorsReportLine) {
    const auto error = run_failing("const a = 1;\nconst b = ;");
    EXPECT_NE(std::string(error.what()).find("line 2"), std::string::npos);
    EXPECT_EQ(error.category(), ErrorCategory::Execution);
}

TEST(InterpreterTest, RecursionDepthIsLimited) {
    const auto error = run_failing("function down(n) { return down(n + 1); } return down(0);");
    EXPECT_STREQ(error.what(), "Maximum call stack size exceeded");
    EXPECT_EQ(error.category(), ErrorCategory::Execution);
}

TEST(InterpreterTest, CustomCallDepthLimit) {
    Interpreter interpreter;
    interpreter.set_max_call_depth(8);
    EXPECT_THROW(interpreter.run("function d(n) { return n === 0 ? 0 : d(n - 1); } return d(20);"),
                 ScriptError);
}

TEST(InterpreterTest, TimeoutStopsInfiniteLoopAndCannotBeCaught) {
    Interpreter interpreter;
    interpreter.set_timeout(std::chrono::milliseconds(50));
    try {
        interpreter.run("while (true) { try { for (;;) {} } catch (e) { } }");
        FAIL() << "expected a timeout";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Timeout);
        EXPECT_STREQ(e.what(), "Execution timed out after 50 ms");
    }
}

TEST(InterpreterTest, AwaitAndAsyncFunctionsReturnPlainValues) {
    EXPECT_EQ(run(R"(
        const load = async (n) => n * 2;
        async function both() {
            const values = await Promise.all([load(1), load(2)]);
            return values;
        }
        return await both();
    )"),
              json::array({2, 4}));
}

TEST(InterpreterTest, HostFunctionsReceiveArguments) {
    Interpreter interpreter;
    interpreter.define_global(
        "double", Value::native("double", [](Interpreter&, std::vector<Value>& args) {
            return Value(args.at(0).to_number() * 2);
        }));
    EXPECT_EQ(toolbridge::script::to_json(interpreter.run("return double(21)")), json(42));
}

TEST(InterpreterTest, ConsoleWritesToDiagnosticLog) {
    std::ostringstream sink;
    auto& logger = toolbridge::core::logging::Logger::get();
    logger.set_sink(&sink);
    run("console.log('hello', 42, {a: 1}); console.error('bad');");
    logger.set_sink(nullptr);

    const std::string text = sink.str();
    EXPECT_NE(text.find("console.log: hello 42 {\"a\":1}"), std::string::npos);
    EXPECT_NE(text.find("[ERROR]"), std::string::npos);
}

TEST(InterpreterTest, ObjectsSerializeWithSortedKeysAndSkipFunctions) {
    EXPECT_EQ(run("return {z: 1, a: {fn: () => 1, keep: [undefined, 2]}}"),
              json::parse(R"({"a": {"keep": [null, 2]}, "z": 1})"));
}

TEST(InterpreterTest, ConstructorsAndInstanceof) {
    EXPECT_EQ(run(R"(
        function Point(x, y) { this.x = x; this.y = y; }
        const p = new Point(1, 2);
        return [p.x + p.y, p instanceof Point, [] instanceof Array, Array.isArray(p)];
    )"),
              json::array({3, true, true, false}));
}

TEST(InterpreterTest, ReduceOfEmptyArrayThrows) {
    const auto error = run_failing("return [].reduce((a, b) => a + b);");
    EXPECT_STREQ(error.what(), "Reduce of empty array with no initial value");
}

TEST(InterpreterTest, ReturningCircularValueIsTypeError) {
    Interpreter interpreter;
    const Value result = interpreter.run("const node = {name: 'loop'}; node.self = node; return node;");
    try {
        toolbridge::script::to_json(result);
        FAIL() << "expected a circular structure error";
    } catch (const ScriptError& e) {
        EXPECT_STREQ(e.what(), "Converting circular structure to JSON");
        EXPECT_EQ(e.stack().rfind("TypeError", 0), 0u);
        EXPECT_EQ(e.category(), ErrorCategory::Execution);
    }
}

TEST(InterpreterTest, StringifyOfCircularValueIsCatchable) {
    EXPECT_EQ(run(R"(
        const list = [1];
        list.push(list);
        try {
            JSON.stringify(list);
        } catch (e) {
            return [e.name, e.message, e instanceof TypeError];
        }
    )"),
              json::array({"TypeError", "Converting circular structure to JSON", true}));
}

TEST(InterpreterTest, SharedReferencesAreNotCircular) {
    EXPECT_EQ(run("const s = {v: 1}; return JSON.stringify({a: s, b: [s, s]});"),
              json(R"({"a":{"v":1},"b":[{"v":1},{"v":1}]})"));
}

TEST(InterpreterTest, JoinAndStringRenderCyclesAsEmpty) {
    EXPECT_EQ(run(R"(
        const a = [1, 2];
        a.push(a);
        const b = ['x'];
        b.push([b]);
        return [a.join('-'), String(a), a + '', `${b}`, a.length];
    )"),
              json::array({"1-2-", "1,2,", "1,2,", "x,", 3}));
}

TEST(InterpreterTest, FlatOfCircularArrayIsRangeError) {
    const auto error = run_failing("const a = [1]; a.push(a); return a.flat(Infinity);");
    EXPECT_STREQ(error.what(), "Maximum call stack size exceeded");
    EXPECT_EQ(run("const a = [1]; a.push(a); return a.flat().length;"), json(3));
}

TEST(InterpreterTest, ConsoleLogOfCircularAndDeepValuesDoesNotThrow) {
    std::ostringstream sink;
    auto& logger = toolbridge::core::logging::Logger::get();
    logger.set_sink(&sink);
    const json result =
        run(std::string(kDeepChain) +
            "const node = {n: 1}; node.self = node; console.log(node); console.log(a); return 1;");
    logger.set_sink(nullptr);

    EXPECT_EQ(result, json(1));
    const std::string text = sink.str();
    EXPECT_NE(text.find(R"(console.log: {"n":1,"self":"[Circular]"})"), std::string::npos);
    EXPECT_NE(text.find("\"[Array]\""), std::string::npos);
}

TEST(InterpreterTest, DeeplyNestedValueCanBeBuiltAndDropped) {
    EXPECT_EQ(run(std::string(kDeepChain) + "return 1;"), json(1));
    EXPECT_EQ(run(std::string(kDeepChain) + "a = null; return 2;"), json(2));
}

TEST(InterpreterTest, DeeplyNestedValueIsRangeErrorWhenConverted) {
    Interpreter interpreter;
    const Value deep = interpreter.run(std::string(kDeepChain) + "return a;");
    try {
        toolbridge::script::to_json(deep);
        FAIL() << "expected a nesting error";
    } catch (const ScriptError& e) {
        EXPECT_STREQ(e.what(), "Maximum call stack size exceeded");
        EXPECT_EQ(e.stack().rfind("RangeError", 0), 0u);
    }

    EXPECT_EQ(run(std::string(kDeepChain) + R"(
        const names = [];
        for (const convert of [() => JSON.stringify(a), () => String(a)]) {
            try { convert(); } catch (e) { names.push(e.name); }
        }
        return names;
    )"),
              json::array({"RangeError", "RangeError"}));
}

TEST(InterpreterTest, DeeplyNestedJsonParseIsRangeError) {
    const auto error = run_failing("return JSON.parse('['.repeat(5000) + ']'.repeat(5000));");
    EXPECT_STREQ(error.what(), "JSON nesting is too deep");
    EXPECT_EQ(run("return JSON.parse('[[[1]]]')[0][0][0];"), json(1));
}

TEST(InterpreterTest, TeardownEmptiesValuesItAllocated) {
    Value kept;
    {
        Interpreter interpreter;
        interpreter.define_global(
            "keep", Value::native("keep", [&kept](Interpreter&, std::vector<Value>& args) {
                kept = args.at(0);
                return Value();
            }));
        interpreter.run("const node = {name: 'n'}; node.self = node; keep(node);");
        EXPECT_EQ(kept.as_object().properties.size(), 2u);
    }
    EXPECT_TRUE(kept.as_object().properties.empty());
}

TEST(ContainerArenaTest, ReleaseBreaksReferenceCycles) {
    std::weak_ptr<FunctionData> observer;
    ContainerArena arena;
    {
        Value fn = Value::native("f", [](Interpreter&, std::vector<Value>&) { return Value(); });
        Value holder = Value::object();
        holder.as_object().properties["fn"] = fn;
        fn.as_function()->properties["holder"] = holder;
        observer = fn.as_function();
    }
    EXPECT_EQ(arena.live(), 2u);
    EXPECT_FALSE(observer.expired());

    arena.release();
    EXPECT_TRUE(observer.expired());
    EXPECT_EQ(arena.live(), 0u);
}

TEST(ContainerArenaTest, InnermostArenaTracksNewContainers) {
    ContainerArena outer;
    Value first = Value::array();
    {
        ContainerArena inner;
        Value second = Value::array();
        EXPECT_EQ(inner.live(), 1u);
        EXPECT_EQ(outer.live(), 1u);
    }
    Value third = Value::object();
    EXPECT_EQ(outer.live(), 2u);
}

TEST(ValueTest, DroppingDeeplyNestedArrayDoesNotRecurse) {
    Value chain = Value::array();
    for (int i = 0; i < 1000000; ++i) {
        chain = Value::array({chain});
    }
    chain = Value();
    EXPECT_TRUE(chain.is_undefined());
}

}  // namespace
