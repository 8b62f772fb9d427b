export module pal:SourceLocation;

import std;

namespace pal {

export struct SourceLocation
{
    std::size_t line;
    std::size_t column;
};

} // namespace pal

template <> struct std::formatter<pal::SourceLocation> : std::formatter<std::string_view>
{
    auto format(const pal::SourceLocation & sloc, std::format_context & ctx) const
    {
        return std::format_to(ctx.out(), "{}:{}", sloc.line, sloc.column);
    }
};
