#include <gtest/gtest.h>

import std;
import pal;

namespace {

using pal::InterpretResult;

class VirtualMachineTest : public ::testing::Test
{
protected:
    auto hooks() -> pal::Hooks
    {
        return {
                .on_variable_changed = [this](std::string_view name, const pal::Value & value) {
                    m_changes.push_back(std::format("{}={}", name, value));
                },
                .on_action = [this](pal::Action action) { m_actions.push_back(action); },
                .wait = [this](std::chrono::duration<double> delay) { m_waits.push_back(delay.count()); },
                .output = [this](std::string_view line) { m_output.emplace_back(line); },
                .error = [this](std::string_view line) { m_errors.emplace_back(line); },
        };
    }

    auto run(std::string_view source) -> InterpretResult { return m_vm.run(source); }

    std::vector<std::string> m_output;
    std::vector<std::string> m_errors;
    std::vector<std::string> m_changes;
    std::vector<pal::Action> m_actions;
    std::vector<double> m_waits;
    pal::VirtualMachine m_vm{hooks(), pal::standard_globals()};
};

using Lines = std::vector<std::string>;

} // namespace

TEST_F(VirtualMachineTest, PrintsExpressions)
{
    EXPECT_EQ(run("(1 + 2)?\n(\"a\" + \"b\")?\n(2 ^ 3)?\n(5 | 2)?\n(1 <= 2)?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"3", "ab", "2000", "7", "true"}));
}

TEST_F(VirtualMachineTest, PrintLeavesTheValueInPlace)
{
    EXPECT_EQ(run("var a = 5?\na?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"5", "5"}));
}

TEST_F(VirtualMachineTest, PrintBindsTighterThanOperators)
{
    EXPECT_EQ(run("var s = 1 + 2?\ns?\n-3?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"2", "3", "-3"}));
}

TEST_F(VirtualMachineTest, GlobalAssignment)
{
    EXPECT_EQ(run("var x = 1\nx = x + 2\nx?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"3"});
    EXPECT_EQ(m_changes, (Lines{"x=1", "x=3"}));
    ASSERT_TRUE(m_vm.global("x").has_value());
    EXPECT_EQ(std::format("{}", m_vm.global("x").value()), "3");
}

TEST_F(VirtualMachineTest, RepeatedIncrement)
{
    EXPECT_EQ(run("var x = 1\nx = x + 1\nx = x + 1\nx?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"3"});
}

TEST_F(VirtualMachineTest, GlobalsSurviveBetweenRuns)
{
    EXPECT_EQ(run("var a = 1"), InterpretResult::Ok);
    EXPECT_EQ(run("a = a + 1\na?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"2"});
}

TEST_F(VirtualMachineTest, HostDefinedGlobals)
{
    m_vm.define_global("exposure", pal::Value::number(0.25));
    EXPECT_EQ(run("exposure?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"0.25"});
}

TEST_F(VirtualMachineTest, UndefinedVariable)
{
    EXPECT_EQ(run("y = 1"), InterpretResult::RuntimeError);
    EXPECT_EQ(m_errors, (Lines{"Undefined variable 'y'.", "[line 1 in script]"}));

    m_errors.clear();
    EXPECT_EQ(run("y?"), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "Undefined variable 'y'.");

    EXPECT_EQ(run("var y = 1\ny?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"1"});
}

TEST_F(VirtualMachineTest, LocalsShadowOuterVariables)
{
    EXPECT_EQ(run("var a = 1\n{\nvar a = 2\na?\n{\nvar a = 3\na?\n}\na?\n}\na?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"2", "3", "2", "1"}));
}

TEST_F(VirtualMachineTest, DuplicateLocalIsACompileError)
{
    EXPECT_EQ(run("{\nvar a = 1\nvar a = 2\n}"), InterpretResult::CompileError);
    EXPECT_EQ(m_errors, Lines{"[3:5] Error at 'a': Already a variable with this name in this scope."});
    EXPECT_TRUE(m_output.empty());
}

TEST_F(VirtualMachineTest, ForLoop)
{
    EXPECT_EQ(run("for (var i = 0, i < 5, i = i + 1) {\n    i?\n}"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"0", "1", "2", "3", "4"}));
}

TEST_F(VirtualMachineTest, ForLoopThatNeverRuns)
{
    EXPECT_EQ(run("for (var i = 0, i > 0, i = i + 1) {\n    i?\n}\n\"done\"?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"done"});
}

TEST_F(VirtualMachineTest, FunctionCall)
{
    EXPECT_EQ(run("func add(a, b) {\n    return a + b\n}\nadd(1, 2)?\nadd?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"3", "<func add>"}));
}

TEST_F(VirtualMachineTest, FunctionWithoutReturnGivesVoid)
{
    EXPECT_EQ(run("func f() {\n    1\n}\nf()?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"void"});
}

TEST_F(VirtualMachineTest, ArityMismatch)
{
    EXPECT_EQ(run("func f(a) {\n    return a\n}\nf(1, 2)"), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "Expected 1 arguments but got 2.");
}

TEST_F(VirtualMachineTest, CallingANumber)
{
    EXPECT_EQ(run("1()"), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "Can only call functions and generators, got 'Number'.");
}

TEST_F(VirtualMachineTest, UnsupportedOperands)
{
    EXPECT_EQ(run("1 + \"a\""), InterpretResult::RuntimeError);
    EXPECT_EQ(m_errors, (Lines{"Unsupported operand types for add: 'Number' and 'String'.", "[line 1 in script]"}));
}

TEST_F(VirtualMachineTest, RuntimeErrorTraceback)
{
    EXPECT_EQ(run("func f() {\n    return 1 + true\n}\nf()"), InterpretResult::RuntimeError);
    EXPECT_EQ(
            m_errors,
            (Lines{"Unsupported operand types for add: 'Number' and 'Bool'.", "[line 2 in f]", "[line 4 in script]"})
    );
}

TEST_F(VirtualMachineTest, MachineIsUsableAfterAnError)
{
    EXPECT_EQ(run("1 + \"a\""), InterpretResult::RuntimeError);
    EXPECT_EQ(run("1?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"1"});
}

TEST_F(VirtualMachineTest, DeepRecursionOverflows)
{
    EXPECT_EQ(run("func f() {\n    return f()\n}\nf()"), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "Stack overflow.");
}

TEST_F(VirtualMachineTest, GeneratorDrivesForeach)
{
    constexpr std::string_view source = "iter count(n) {\n"
                                        "    for (var i = 0, i < n, i = i + 1) {\n"
                                        "        yield i\n"
                                        "    }\n"
                                        "}\n"
                                        "foreach (var x = count(3)) {\n"
                                        "    x?\n"
                                        "}\n"
                                        "\"done\"?";
    EXPECT_EQ(run(source), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"0", "1", "2", "done"}));
}

TEST_F(VirtualMachineTest, ReturnInsideGeneratorYields)
{
    constexpr std::string_view source = "iter twice(v) {\n"
                                        "    return v\n"
                                        "    return v + 1\n"
                                        "}\n"
                                        "foreach (var x = twice(10)) {\n"
                                        "    x?\n"
                                        "}";
    EXPECT_EQ(run(source), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"10", "11"}));
}

TEST_F(VirtualMachineTest, EmptyGenerator)
{
    EXPECT_EQ(run("iter none() {\n}\nforeach (var x = none()) {\n    x?\n}\n\"after\"?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"after"});
}

TEST_F(VirtualMachineTest, NestedForeach)
{
    constexpr std::string_view source = "iter count(n) {\n"
                                        "    for (var i = 0, i < n, i = i + 1) {\n"
                                        "        yield i\n"
                                        "    }\n"
                                        "}\n"
                                        "foreach (var a = count(2)) {\n"
                                        "    foreach (var b = count(2)) {\n"
                                        "        (a + b)?\n"
                                        "    }\n"
                                        "}";
    EXPECT_EQ(run(source), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"0", "1", "1", "2"}));
}

TEST_F(VirtualMachineTest, CallingAGeneratorGivesAnIterator)
{
    EXPECT_EQ(run("iter g() {\n    yield 1\n}\ng?\ng()?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"<iter g>", "<iterator g>"}));
}

TEST_F(VirtualMachineTest, NativeIterator)
{
    EXPECT_EQ(run("foreach (var i = range(3)) {\n    i?\n}"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"0", "1", "2"}));
}

TEST_F(VirtualMachineTest, ExhaustedIteratorSkipsOverNestedLoops)
{
    constexpr std::string_view source = "foreach (var i = range(2)) {\n"
                                        "    for (var j = 0, j < 2, j = j + 1) {\n"
                                        "        (i + j)?\n"
                                        "    }\n"
                                        "}\n"
                                        "\"done\"?";
    EXPECT_EQ(run(source), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"0", "1", "1", "2", "done"}));
}

TEST_F(VirtualMachineTest, ForeachInsideAFunction)
{
    constexpr std::string_view source = "iter count(n) {\n"
                                        "    for (var i = 0, i < n, i = i + 1) {\n"
                                        "        yield i\n"
                                        "    }\n"
                                        "}\n"
                                        "func total(n) {\n"
                                        "    var sum = 0\n"
                                        "    foreach (var i = range(n)) {\n"
                                        "        sum = sum + i\n"
                                        "    }\n"
                                        "    foreach (var i = count(n)) {\n"
                                        "        sum = sum + i\n"
                                        "    }\n"
                                        "    return sum\n"
                                        "}\n"
                                        "total(4)?\n"
                                        "total(0)?";
    EXPECT_EQ(run(source), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"12", "0"}));
}

TEST_F(VirtualMachineTest, ForeachOverANumber)
{
    EXPECT_EQ(run("foreach (var x = 1) {\n}"), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "Can only iterate over iterators, got 'Number'.");
}

TEST_F(VirtualMachineTest, NativeFunctionArity)
{
    EXPECT_EQ(run("clock(1)"), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "Expected 0 arguments but got 1.");
}

TEST_F(VirtualMachineTest, NativeFunctionErrorsAbortTheRun)
{
    EXPECT_EQ(run("range(\"x\")"), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "range() expects a number, got 'String'.");
}

TEST_F(VirtualMachineTest, Namespaces)
{
    EXPECT_EQ(run("namespace Color {\n    Red,\n    Green\n}\nColor.Green?\nColor?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"1", "<namespace Color>"}));
}

TEST_F(VirtualMachineTest, MissingNamespaceMember)
{
    EXPECT_EQ(run("namespace Color {\n    Red\n}\nColor.Blue"), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "<namespace Color> has no member 'Blue'.");
}

TEST_F(VirtualMachineTest, NativeNamespace)
{
    EXPECT_EQ(run("Action.Manage?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"4"});
}

TEST_F(VirtualMachineTest, ListsAndTags)
{
    EXPECT_EQ(run("var l = [1, 2] | [3]\nl?\n!l?\n(drift == drift)?\nManhattan?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, (Lines{"[1, 2, 3]", "[3, 2, 1]", "true", "Manhattan"}));
}

TEST_F(VirtualMachineTest, PathsJoin)
{
    EXPECT_EQ(run("var out = 'C:/captures'\n(out + \"run.tiff\")?"), InterpretResult::Ok);
    EXPECT_EQ(m_output, Lines{"'C:/captures/run.tiff'"});
}

TEST_F(VirtualMachineTest, Actions)
{
    EXPECT_EQ(run("Scan\nCluster\nfilter\nMark\nTighten\nSearch"), InterpretResult::Ok);
    EXPECT_EQ(
            m_actions,
            (std::vector{
                    pal::Action::Survey,
                    pal::Action::Segment,
                    pal::Action::Filter,
                    pal::Action::Interact,
                    pal::Action::Manage,
                    pal::Action::Scan,
            })
    );
}

TEST_F(VirtualMachineTest, Wait)
{
    EXPECT_EQ(run("wait 0.5\nwait 2"), InterpretResult::Ok);
    EXPECT_EQ(m_waits, (std::vector{0.5, 2.0}));

    EXPECT_EQ(run("wait \"soon\""), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "Wait expects a number of seconds, got 'String'.");
}

TEST_F(VirtualMachineTest, WaitRejectsNegativeDelays)
{
    EXPECT_EQ(run("wait -1"), InterpretResult::RuntimeError);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_EQ(m_errors[0], "Wait expects a non-negative number of seconds, got '-1'.");
    EXPECT_TRUE(m_waits.empty());
}

TEST_F(VirtualMachineTest, WaitRejectsDelaysTooLongToSleep)
{
    EXPECT_EQ(run("wait 1 ^ 300"), InterpretResult::RuntimeError);
    EXPECT_EQ(run("wait 1 ^ 400"), InterpretResult::RuntimeError);
    ASSERT_GE(m_errors.size(), 2U);
    EXPECT_EQ(m_errors[0], "Wait expects a non-negative number of seconds, got '1e+300'.");
    EXPECT_TRUE(m_waits.empty());
}

TEST(VirtualMachineHooksTest, UnhandledActionFallsBackToUnknownOpcode)
{
    std::vector<pal::Byte> unknown;
    std::vector<std::string> errors;
    pal::VirtualMachine vm({
            .on_unknown_opcode = [&unknown](pal::Byte instruction) { unknown.push_back(instruction); },
            .error = [&errors](std::string_view line) { errors.emplace_back(line); },
    });

    EXPECT_EQ(vm.run("Scan\nSearch"), InterpretResult::Ok);
    EXPECT_EQ(
            unknown,
            (std::vector{static_cast<pal::Byte>(pal::OpCode::Survey), static_cast<pal::Byte>(pal::OpCode::Scan)})
    );
    EXPECT_TRUE(errors.empty());
}

TEST(VirtualMachineHooksTest, DefaultUnknownOpcodeAbortsTheRun)
{
    std::vector<std::string> errors;
    pal::VirtualMachine vm({.error = [&errors](std::string_view line) { errors.emplace_back(line); }});

    EXPECT_EQ(vm.run("Scan"), InterpretResult::RuntimeError);
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(
            errors[0],
            std::format("Unhandled opcode {} (OP_SURVEY)", std::to_underlying(pal::OpCode::Survey))
    );
}

TEST(VirtualMachineHooksTest, HostErrorsAreReported)
{
    std::vector<std::string> errors;
    pal::VirtualMachine vm(
            {
                    .on_action = [](pal::Action) { throw std::invalid_argument("stage offline"); },
                    .error = [&errors](std::string_view line) { errors.emplace_back(line); },
            }
    );

    EXPECT_EQ(vm.run("Tighten"), InterpretResult::RuntimeError);
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors[0], "Host error: stage offline");
}

TEST(VirtualMachineHooksTest, PrintCodeListsTheScript)
{
    std::vector<std::string> output;
    pal::VirtualMachine vm(
            {.output = [&output](std::string_view line) { output.emplace_back(line); }},
            {},
            {.print_code = true}
    );

    EXPECT_EQ(vm.run("1?"), InterpretResult::Ok);
    ASSERT_FALSE(output.empty());
    EXPECT_EQ(output.front(), "== <script> ==");
    EXPECT_EQ(output.back(), "1");
}

TEST(VirtualMachineHooksTest, TraceExecution)
{
    std::vector<std::string> output;
    pal::VirtualMachine vm(
            {.output = [&output](std::string_view line) { output.emplace_back(line); }},
            {},
            {.trace_execution = true}
    );

    EXPECT_EQ(vm.run("1"), InterpretResult::Ok);
    auto has = [&output](std::string_view needle) {
        return std::ranges::any_of(output, [needle](const std::string & line) { return line.contains(needle); });
    };
    EXPECT_TRUE(has("OP_CONSTANT"));
    EXPECT_TRUE(has("OP_RETURN"));
    EXPECT_TRUE(has("[ <script> ]"));
}

TEST(VirtualMachineLifetimeTest, SuspendedGeneratorsAreReleasedWithTheMachine)
{
    constexpr std::string_view source = "iter g() {\n"
                                        "    var handle = numbers\n"
                                        "    yield 1\n"
                                        "    yield 2\n"
                                        "}\n"
                                        "var numbers = g()\n"
                                        "func first() {\n"
                                        "    foreach (var x = numbers) {\n"
                                        "        return x\n"
                                        "    }\n"
                                        "}\n"
                                        "first()?";

    std::vector<std::string> output;
    std::weak_ptr<pal::Generator> generator;
    {
        pal::VirtualMachine vm({.output = [&output](std::string_view line) { output.emplace_back(line); }});
        ASSERT_EQ(vm.run(source), InterpretResult::Ok);

        auto numbers = vm.global("numbers");
        ASSERT_TRUE(numbers.has_value());
        ASSERT_TRUE(numbers->holds<pal::value::IteratorPtr>());
        generator = numbers->as<pal::value::IteratorPtr>()->get_generator_ptr();
        ASSERT_FALSE(generator.expired());
        EXPECT_FALSE(generator.lock()->is_finished());
    }
    EXPECT_EQ(output, std::vector<std::string>{"1"});
    EXPECT_TRUE(generator.expired());
}
