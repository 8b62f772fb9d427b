module pal;

import std;

import :Object;
import :RuntimeError;
import :Stack;
import :Value;

namespace pal {

namespace {

auto check_arity(std::size_t expected, std::size_t got) -> void
{
    if (expected != got) {
        throw RuntimeError(std::format("Expected {} arguments but got {}.", expected, got));
    }
}

// Absolute slot of the callee that sits below `arg_count` arguments.
auto callee_slot(const Stack & stack, std::size_t arg_count) -> std::size_t
{
    std::ignore = stack.peek(arg_count); // throws on underflow
    return stack.size() - arg_count - 1;
}

} // namespace

auto Generator::resume() -> SavedFrame
{
    if (!m_saved.has_value()) {
        throw RuntimeError(std::format("Generator '{}' is not primed", get_name()));
    }
    SavedFrame frame = std::move(m_saved.value());
    m_saved.reset();
    return frame;
}

auto Generator::suspend(SavedFrame frame) -> void { m_saved = std::move(frame); }

auto Generator::finish() -> void
{
    m_saved.reset();
    m_finished = true;
}

auto NativeIterator::over(std::string name, std::vector<Value> values) -> value::NativeIteratorPtr
{
    auto next = [values = std::move(values), index = 0UZ]() mutable -> std::optional<Value> {
        if (index >= values.size()) {
            return std::nullopt;
        }
        return values[index++];
    };
    return std::make_shared<NativeIterator>(std::move(name), std::move(next));
}

auto Enum::find(std::string_view member) const -> std::optional<double>
{
    auto it = std::ranges::find(m_members, member);
    if (it == m_members.end()) {
        return std::nullopt;
    }
    return static_cast<double>(std::distance(m_members.begin(), it));
}

auto NativeEnum::find(std::string_view member) const -> std::optional<double>
{
    auto it = std::ranges::find(m_members, member, &Members::value_type::first);
    if (it == m_members.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto Value::call(CallContext & context, std::size_t arg_count) const -> bool
{
    auto & stack = context.stack();

    switch (get_type()) {
    case ValueType::Function: {
        const auto & function = as<value::FunctionPtr>();
        if (function->get_kind() == FunctionKind::Script) {
            return false;
        }
        check_arity(function->arity(), arg_count);
        context.push_frame(function, arg_count);
        return true;
    }
    case ValueType::NativeFunction: {
        const auto & native = as<value::NativeFunctionPtr>();
        if (auto arity = native->get_arity(); arity.has_value()) {
            check_arity(arity.value(), arg_count);
        }
        std::size_t callee = callee_slot(stack, arg_count);
        Value result = (*native)(stack.window(callee + 1));
        stack.truncate(callee);
        stack.push(std::move(result));
        return true;
    }
    case ValueType::Generator: {
        const auto & declared = as<value::GeneratorPtr>();
        check_arity(declared->get_function()->arity(), arg_count);
        std::size_t callee = callee_slot(stack, arg_count);

        // Priming only captures the arguments; the body starts running on the first advance.
        auto primed = std::make_shared<Generator>(declared->get_function());
        primed->prime(stack.take_window(callee));
        stack.push(Value{std::make_shared<Iterator>(std::move(primed))});
        return true;
    }
    default: return false;
    }
}

} // namespace pal
