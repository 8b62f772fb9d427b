export module pal:Stack;

import std;

import :RuntimeError;
import :Value;

namespace pal {

// Operand stack shared by all frames of a run. Slots below the floor belong to callers and are
// out of reach of push/pop/peek.
export class Stack
{
public:
    auto push(Value value) -> void { m_values.push_back(std::move(value)); }

    auto pop() -> Value
    {
        if (m_values.size() <= m_floor) {
            throw RuntimeError("Stack underflow");
        }
        Value value = std::move(m_values.back());
        m_values.pop_back();
        return value;
    }

    [[nodiscard]] auto peek(std::size_t distance = 0) const -> const Value &
    {
        if (distance >= m_values.size() - m_floor) {
            throw RuntimeError("Stack underflow");
        }
        return m_values[m_values.size() - 1 - distance];
    }

    [[nodiscard]] auto size() const -> std::size_t { return m_values.size(); }
    [[nodiscard]] auto empty() const -> bool { return m_values.empty(); }

    // Absolute slot access, used by local variable opcodes.
    [[nodiscard]] auto slot(std::size_t index) -> Value &
    {
        if (index < m_floor || index >= m_values.size()) {
            throw RuntimeError(std::format("Invalid stack slot {}", index));
        }
        return m_values[index];
    }

    auto set_floor(std::size_t floor) -> void { m_floor = std::min(floor, m_values.size()); }

    [[nodiscard]] auto window(std::size_t bottom) const -> std::span<const Value>
    {
        return std::span{m_values}.subspan(std::min(bottom, m_values.size()));
    }

    // Drops every slot from `size` upwards.
    auto truncate(std::size_t size) -> void
    {
        if (size < m_values.size()) {
            m_values.erase(m_values.begin() + static_cast<std::ptrdiff_t>(size), m_values.end());
        }
        m_floor = std::min(m_floor, m_values.size());
    }

    // Moves the slots from `bottom` upwards out of the stack.
    auto take_window(std::size_t bottom) -> std::vector<Value>
    {
        auto first = m_values.begin() + static_cast<std::ptrdiff_t>(std::min(bottom, m_values.size()));
        std::vector<Value> window(std::make_move_iterator(first), std::make_move_iterator(m_values.end()));
        truncate(bottom);
        return window;
    }

    auto splice(const std::vector<Value> & window) -> void
    {
        m_values.insert(m_values.end(), window.begin(), window.end());
    }

    auto clear() -> void
    {
        m_values.clear();
        m_floor = 0;
    }

private:
    std::vector<Value> m_values;
    std::size_t m_floor = 0;
};

} // namespace pal
