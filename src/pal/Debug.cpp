module pal;

import std;

import :Chunk;
import :Debug;
import :Object;
import :OpCode;

namespace pal {

namespace {

auto simple(std::ostream & out, std::string_view name, std::size_t offset) -> std::size_t
{
    std::println(out, "{}", name);
    return offset + 1;
}

auto constant(std::ostream & out, std::string_view name, const Chunk & chunk, std::size_t offset)
        -> std::size_t
{
    Byte constant_idx = chunk.code[offset + 1];
    std::println(out, "{:16} {:4} '{}'", name, constant_idx, chunk.constants[constant_idx]);
    return offset + 2;
}

auto byte(std::ostream & out, std::string_view name, const Chunk & chunk, std::size_t offset)
        -> std::size_t
{
    Byte slot = chunk.code[offset + 1];
    std::println(out, "{:16} {:4}", name, slot);
    return offset + 2;
}

auto jump(std::ostream & out, std::string_view name, bool forward, const Chunk & chunk, std::size_t offset)
        -> std::size_t
{
    DoubleByte jump_length = static_cast<DoubleByte>(chunk.code[offset + 1] << BYTE_DIGITS)
            | chunk.code[offset + 2];

    std::size_t jump_to = offset + 3;
    if (forward) {
        jump_to += jump_length;
    }
    else {
        jump_to -= jump_length;
    }

    std::println(out, "{:16} {:4} -> {}", name, offset, jump_to);

    return offset + 3;
}

} // namespace

auto print_stack(std::ostream & out, std::span<const Value> stack_view) -> void
{
    std::print(out, "{:15}", ' ');
    if (stack_view.empty()) {
        std::println(out, "<stack empty>");
        return;
    }
    for (const auto & value : stack_view) {
        std::print(out, "[ {} ]", value);
    }
    std::println(out);
}

auto disassemble_instruction(std::ostream & out, const Chunk & chunk, std::size_t offset) -> std::size_t
{
    std::print(out, "{:04} ", offset);
    auto sloc = chunk.locations[offset];
    if (offset > 0 && sloc.line == chunk.locations[offset - 1].line) {
        std::print(out, "{:>4}:{:<4} ", '|', sloc.column);
    }
    else {
        std::print(out, "{:>4}:{:<4} ", sloc.line, sloc.column);
    }

    Byte code = chunk.code[offset];
    if (!is_opcode(code)) {
        std::println(out, "Unknown opcode {:x}", code);
        return offset + 1;
    }

    auto instruction = static_cast<OpCode>(code);
    auto name = opcode_label(instruction);

    if (offset + instruction_length(chunk, offset) > chunk.code.size()) {
        std::println(out, "{:16} <truncated>", name);
        return chunk.code.size();
    }

    switch (operand_kind(instruction)) {
    case OperandKind::None: return simple(out, name, offset);
    case OperandKind::Constant: return constant(out, name, chunk, offset);
    case OperandKind::Byte: return byte(out, name, chunk, offset);
    case OperandKind::Jump: return jump(out, name, /* forward = */ true, chunk, offset);
    case OperandKind::Loop: return jump(out, name, /* forward = */ false, chunk, offset);
    }

    return offset + 1;
}

auto disassemble_chunk(std::ostream & out, const Chunk & chunk, std::string_view chunk_name) -> void
{
    std::println(out, "== {} ==", chunk_name);

    for (std::size_t offset = 0; offset < chunk.code.size();) {
        offset = disassemble_instruction(out, chunk, offset);
    }
}

// NOLINTNEXTLINE(misc-no-recursion)
auto disassemble_function(std::ostream & out, const value::FunctionPtr & function) -> void
{
    const auto & chunk = function->get_chunk();
    disassemble_chunk(out, chunk, std::format("{}", Value{function}));

    for (const auto & constant : chunk.constants) {
        if (constant.holds<value::FunctionPtr>()) {
            disassemble_function(out, constant.as<value::FunctionPtr>());
        }
        else if (constant.holds<value::GeneratorPtr>()) {
            disassemble_function(out, constant.as<value::GeneratorPtr>()->get_function());
        }
    }
}

} // namespace pal
