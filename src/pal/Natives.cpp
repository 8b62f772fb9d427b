module pal;

import std;

import :Natives;
import :Object;
import :RuntimeError;
import :Value;
import :VirtualMachine;

namespace pal {

namespace {

auto clock_native(std::span<const Value> /* args */) -> Value
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return Value::number(std::chrono::duration<double>(now).count());
}

auto range_native(std::span<const Value> args) -> Value
{
    if (!args[0].holds<value::Number>()) {
        throw RuntimeError(std::format("range() expects a number, got '{}'.", args[0].get_type()));
    }

    auto count = args[0].as<value::Number>();
    auto next = [count, index = 0.0]() mutable -> std::optional<Value> {
        if (index >= count) {
            return std::nullopt;
        }
        return Value::number(index++);
    };
    return Value{std::make_shared<NativeIterator>("range", std::move(next))};
}

} // namespace

auto standard_globals() -> Globals
{
    Globals globals;
    globals.emplace("clock", Value{std::make_shared<NativeFunction>("clock", 0, clock_native)});
    globals.emplace("range", Value{std::make_shared<NativeFunction>("range", 1, range_native)});
    globals.emplace("Action", Value{NativeEnum::from<Action>("Action")});
    return globals;
}

} // namespace pal
