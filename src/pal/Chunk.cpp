module pal;

import std;

import magic_enum;

import :Chunk;
import :RuntimeError;
import :Value;

namespace pal {

auto write_chunk(Chunk & chunk, Byte data, SourceLocation sloc) -> void
{
    chunk.code.push_back(data);
    chunk.locations.push_back(sloc);
}

auto write_chunk(Chunk & chunk, OpCode op, SourceLocation sloc) -> void
{
    write_chunk(chunk, static_cast<Byte>(op), sloc);
}

auto add_constant(Chunk & chunk, Value value) -> std::size_t
{
    chunk.constants.push_back(std::move(value));
    return chunk.constants.size() - 1;
}

auto is_opcode(Byte byte) -> bool { return magic_enum::enum_contains<OpCode>(byte); }

auto instruction_length(const Chunk & chunk, std::size_t offset) -> std::size_t
{
    Byte byte = chunk.code[offset];
    if (!is_opcode(byte)) {
        return 1;
    }
    return 1 + operand_width(operand_kind(static_cast<OpCode>(byte)));
}

auto InstructionPointer::advance() -> Byte
{
    if (is_at_end()) {
        throw RuntimeError("Instruction pointer ran past the end of the chunk");
    }
    return m_chunk->code[m_offset++];
}

auto InstructionPointer::advance_double() -> DoubleByte
{
    auto high = static_cast<DoubleByte>(advance() << BYTE_DIGITS);
    return high | advance();
}

auto InstructionPointer::peek(std::size_t distance) const -> std::optional<Byte>
{
    if (m_offset + distance >= m_chunk->code.size()) {
        return std::nullopt;
    }
    return m_chunk->code[m_offset + distance];
}

auto InstructionPointer::previous() const -> std::optional<Byte>
{
    if (m_offset == 0) {
        return std::nullopt;
    }
    return m_chunk->code[m_offset - 1];
}

auto InstructionPointer::jump(std::ptrdiff_t distance) -> void
{
    auto target = static_cast<std::ptrdiff_t>(m_offset) + distance;
    if (target < 0 || std::cmp_greater(target, m_chunk->code.size())) {
        throw RuntimeError(std::format("Jump to {} is outside of the chunk", target));
    }
    m_offset = static_cast<std::size_t>(target);
}

auto InstructionPointer::location() const -> SourceLocation
{
    if (m_chunk->locations.empty()) {
        return {.line = 0, .column = 0};
    }
    return m_chunk->locations[m_offset == 0 ? 0 : std::min(m_offset, m_chunk->locations.size()) - 1];
}

} // namespace pal
