export module pal:Compiler;

import std;

import :Diagnostics;
import :EnumFormatter;
import :Value;

namespace pal {

export enum class Precedence : std::uint8_t {
    None,
    Declaration,
    Statement,
    Assignment,
    Comparison, // == != < > <= >=
    Term,       // + - |
    Exponent,   // ^
    Prefix,     // unary - ! and ?
    Call,       // () .
};

// Compiles a whole script into its top-level function. Returns nullptr if any error was reported.
export [[nodiscard]] auto compile(std::string_view source, Diagnostics & diagnostics)
        -> value::FunctionPtr;

} // namespace pal

template <> struct std::formatter<pal::Precedence> : pal::EnumFormatter<pal::Precedence>
{
};
