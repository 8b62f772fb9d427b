export module pal:Chunk;

import std;

import :EnumFormatter;
import :OpCode;
import :SourceLocation;
import :Value;

namespace pal {

export constexpr const unsigned int BYTE_DIGITS = std::numeric_limits<Byte>::digits;
export constexpr const Byte BYTE_MAX = std::numeric_limits<Byte>::max();
export constexpr const DoubleByte DOUBLE_BYTE_MAX = std::numeric_limits<DoubleByte>::max();

export struct Chunk
{
    std::vector<Byte> code;
    std::vector<SourceLocation> locations; // one entry per byte of `code`
    std::vector<Value> constants;
};

export auto write_chunk(Chunk & chunk, Byte data, SourceLocation sloc) -> void;
export auto write_chunk(Chunk & chunk, OpCode op, SourceLocation sloc) -> void;
export auto add_constant(Chunk & chunk, Value value) -> std::size_t;

export [[nodiscard]] auto is_opcode(Byte byte) -> bool;

// Length of the instruction starting at `offset`, operands included.
export [[nodiscard]] auto instruction_length(const Chunk & chunk, std::size_t offset) -> std::size_t;

export class InstructionPointer
{
public:
    explicit InstructionPointer(const Chunk & chunk, std::size_t offset = 0)
        : m_chunk(&chunk)
        , m_offset(offset)
    {
    }

    [[nodiscard]] auto at() const -> std::size_t { return m_offset; }
    [[nodiscard]] auto is_at_end() const -> bool { return m_offset >= m_chunk->code.size(); }
    [[nodiscard]] auto chunk() const -> const Chunk & { return *m_chunk; }

    auto advance() -> Byte;
    auto advance_double() -> DoubleByte;

    // Looks `distance` bytes ahead without moving.
    [[nodiscard]] auto peek(std::size_t distance = 0) const -> std::optional<Byte>;
    [[nodiscard]] auto previous() const -> std::optional<Byte>;

    auto jump(std::ptrdiff_t distance) -> void;

    // Location of the most recently read byte.
    [[nodiscard]] auto location() const -> SourceLocation;

private:
    const Chunk * m_chunk;
    std::size_t m_offset;
};

} // namespace pal

template <> struct std::formatter<pal::OpCode> : pal::EnumFormatter<pal::OpCode>
{
};
