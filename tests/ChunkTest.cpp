#include <gtest/gtest.h>

import std;
import pal;

namespace {

using pal::OpCode;

constexpr pal::SourceLocation FIRST_LINE{.line = 1, .column = 1};
constexpr pal::SourceLocation SECOND_LINE{.line = 2, .column = 3};

auto sample_chunk() -> pal::Chunk
{
    pal::Chunk chunk;
    auto constant = pal::add_constant(chunk, pal::Value::number(1.5));
    pal::write_chunk(chunk, OpCode::Constant, FIRST_LINE);
    pal::write_chunk(chunk, static_cast<pal::Byte>(constant), FIRST_LINE);
    pal::write_chunk(chunk, OpCode::Jump, SECOND_LINE);
    pal::write_chunk(chunk, pal::Byte{0x01}, SECOND_LINE);
    pal::write_chunk(chunk, pal::Byte{0x02}, SECOND_LINE);
    pal::write_chunk(chunk, OpCode::Return, SECOND_LINE);
    return chunk;
}

} // namespace

TEST(ChunkTest, WriteKeepsCodeAndLocationsInStep)
{
    auto chunk = sample_chunk();
    ASSERT_EQ(chunk.code.size(), 6U);
    ASSERT_EQ(chunk.locations.size(), chunk.code.size());
    EXPECT_EQ(chunk.code[0], static_cast<pal::Byte>(OpCode::Constant));
    EXPECT_EQ(chunk.locations[2].line, 2U);
    ASSERT_EQ(chunk.constants.size(), 1U);
}

TEST(ChunkTest, AddConstantReturnsIndex)
{
    pal::Chunk chunk;
    EXPECT_EQ(pal::add_constant(chunk, pal::Value::nil()), 0U);
    EXPECT_EQ(pal::add_constant(chunk, pal::Value::string("x")), 1U);
}

TEST(ChunkTest, InstructionLength)
{
    auto chunk = sample_chunk();
    EXPECT_EQ(pal::instruction_length(chunk, 0), 2U);
    EXPECT_EQ(pal::instruction_length(chunk, 2), 3U);
    EXPECT_EQ(pal::instruction_length(chunk, 5), 1U);
}

TEST(ChunkTest, IsOpcode)
{
    EXPECT_TRUE(pal::is_opcode(static_cast<pal::Byte>(OpCode::Constant)));
    EXPECT_TRUE(pal::is_opcode(static_cast<pal::Byte>(OpCode::Scan)));
    EXPECT_FALSE(pal::is_opcode(pal::BYTE_MAX));
}

TEST(InstructionPointerTest, ReadsBytesAndDoubleBytes)
{
    auto chunk = sample_chunk();
    pal::InstructionPointer ip(chunk);

    EXPECT_FALSE(ip.previous().has_value());
    EXPECT_EQ(ip.advance(), static_cast<pal::Byte>(OpCode::Constant));
    EXPECT_EQ(ip.advance(), 0);
    EXPECT_EQ(ip.advance(), static_cast<pal::Byte>(OpCode::Jump));
    EXPECT_EQ(ip.advance_double(), 0x0102);
    EXPECT_EQ(ip.at(), 5U);
    EXPECT_EQ(ip.previous(), pal::Byte{0x02});
    EXPECT_EQ(ip.location().line, 2U);
}

TEST(InstructionPointerTest, PeekDoesNotMove)
{
    auto chunk = sample_chunk();
    pal::InstructionPointer ip(chunk, 2);

    EXPECT_EQ(ip.peek(), static_cast<pal::Byte>(OpCode::Jump));
    EXPECT_EQ(ip.peek(3), static_cast<pal::Byte>(OpCode::Return));
    EXPECT_FALSE(ip.peek(4).has_value());
    EXPECT_EQ(ip.at(), 2U);
}

TEST(InstructionPointerTest, Jumps)
{
    auto chunk = sample_chunk();
    pal::InstructionPointer ip(chunk);

    ip.jump(5);
    EXPECT_EQ(ip.at(), 5U);
    ip.jump(-3);
    EXPECT_EQ(ip.at(), 2U);
    ip.jump(4);
    EXPECT_TRUE(ip.is_at_end());

    EXPECT_THROW(ip.jump(1), pal::RuntimeError);
    EXPECT_THROW(ip.jump(-7), pal::RuntimeError);
    EXPECT_THROW(ip.advance(), pal::RuntimeError);
}

TEST(DebugTest, DisassemblesEveryOperandKind)
{
    auto chunk = sample_chunk();

    std::ostringstream out;
    pal::disassemble_chunk(out, chunk, "sample");
    auto listing = out.str();

    EXPECT_TRUE(listing.starts_with("== sample ==\n"));
    EXPECT_NE(listing.find("OP_CONSTANT"), std::string::npos);
    EXPECT_NE(listing.find("'1.5'"), std::string::npos);
    EXPECT_NE(listing.find("OP_JUMP"), std::string::npos);
    // jump target is measured from the end of the instruction
    EXPECT_NE(listing.find("-> 263"), std::string::npos);
    EXPECT_NE(listing.find("OP_RETURN"), std::string::npos);
}

TEST(DebugTest, UnknownOpcode)
{
    pal::Chunk chunk;
    pal::write_chunk(chunk, pal::BYTE_MAX, FIRST_LINE);

    std::ostringstream out;
    EXPECT_EQ(pal::disassemble_instruction(out, chunk, 0), 1U);
    EXPECT_NE(out.str().find("Unknown opcode ff"), std::string::npos);
}

TEST(StackTest, PushPopPeek)
{
    pal::Stack stack;
    stack.push(pal::Value::number(1));
    stack.push(pal::Value::number(2));

    EXPECT_EQ(stack.peek().as<pal::value::Number>(), 2);
    EXPECT_EQ(stack.peek(1).as<pal::value::Number>(), 1);
    EXPECT_EQ(stack.pop().as<pal::value::Number>(), 2);
    EXPECT_EQ(stack.size(), 1U);
}

TEST(StackTest, FloorGuardsCallerSlots)
{
    pal::Stack stack;
    stack.push(pal::Value::number(1));
    stack.push(pal::Value::number(2));
    stack.set_floor(1);

    EXPECT_THROW(std::ignore = stack.peek(1), pal::RuntimeError);
    EXPECT_THROW(std::ignore = stack.slot(0), pal::RuntimeError);
    std::ignore = stack.pop();
    EXPECT_THROW(std::ignore = stack.pop(), pal::RuntimeError);
}

TEST(StackTest, WindowsMoveInAndOut)
{
    pal::Stack stack;
    for (double number : {1.0, 2.0, 3.0}) {
        stack.push(pal::Value::number(number));
    }

    auto window = stack.take_window(1);
    ASSERT_EQ(window.size(), 2U);
    EXPECT_EQ(window[0].as<pal::value::Number>(), 2);
    EXPECT_EQ(stack.size(), 1U);

    stack.splice(window);
    EXPECT_EQ(stack.size(), 3U);
    EXPECT_EQ(stack.window(2).size(), 1U);

    stack.truncate(1);
    EXPECT_EQ(stack.size(), 1U);
}
