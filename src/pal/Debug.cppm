export module pal:Debug;

import std;

import :Chunk;
import :Value;

namespace pal {

export auto print_stack(std::ostream & out, std::span<const Value> stack_view) -> void;
export auto disassemble_instruction(std::ostream & out, const Chunk & chunk, std::size_t offset)
        -> std::size_t;
export auto disassemble_chunk(std::ostream & out, const Chunk & chunk, std::string_view chunk_name)
        -> void;

// Disassembles a function and, recursively, every function in its constant pool.
export auto disassemble_function(std::ostream & out, const value::FunctionPtr & function) -> void;

} // namespace pal
