export module pal:Token;

import std;

import :EnumFormatter;
import :SourceLocation;

namespace pal {

export enum class TokenType : std::uint8_t {
    // Single-character tokens
    Comma,            // ,
    Dot,              // .
    Equal,            // =
    Question,         // ?
    LeftParenthesis,  // (
    RightParenthesis, // )
    LeftBracket,      // [
    RightBracket,     // ]
    LeftBrace,        // {
    RightBrace,       // }
    Minus,            // -
    Bang,             // !
    Caret,            // ^
    Plus,             // +
    Bar,              // |
    Less,             // <
    Greater,          // >

    // Two character tokens
    EqualEqual,   // ==
    BangEqual,    // !=
    LessEqual,    // <=
    GreaterEqual, // >=

    // Literals
    Identifier, // function names, variable names
    Keyword,    // see Keyword
    Number,     // 4, 10.01
    Hex,        // \xFF
    Binary,     // \b1010
    String,     // "hello"
    Path,       // 'C:/data/run.tiff'

    EndOfLine,
    Error,
    EndOfFile,
};

export enum class Keyword : std::uint8_t {
    None,

    // Literals
    True,
    False,
    Void,

    // Correction tags
    Drift,
    Emission,
    Focus,

    // Distance algorithms
    Manhattan,
    Euclidean,
    Minkowski,

    // Declarations
    Var,
    Func,
    Iter,
    Namespace,

    // Control flow
    For,
    Foreach,
    Return,
    Yield,
    Wait,

    // Domain actions
    Survey,   // Scan
    Segment,  // Cluster
    Filter,   // filter
    Interact, // Mark
    Manage,   // Tighten
    Scan,     // Search
};

export struct NumberLiteral
{
    double value;
    int base;
};

export struct Token
{
    using Payload = std::variant<std::monostate, NumberLiteral, std::string_view>;

    TokenType type;
    std::string_view lexeme; // points into the source, which must outlive the token
    SourceLocation sloc;
    Keyword keyword = Keyword::None;
    Payload payload = {};

    [[nodiscard]] auto is_keyword(Keyword kw) const -> bool
    {
        return type == TokenType::Keyword && keyword == kw;
    }

    [[nodiscard]] auto number() const -> double { return std::get<NumberLiteral>(payload).value; }
    [[nodiscard]] auto text() const -> std::string_view
    {
        return std::get<std::string_view>(payload);
    }
};

export auto keyword_lexeme(Keyword keyword) -> std::string_view;
export auto find_keyword(std::string_view lexeme) -> std::optional<Keyword>;

} // namespace pal

template <> struct std::formatter<pal::TokenType> : pal::EnumFormatter<pal::TokenType>
{
};

template <> struct std::formatter<pal::Keyword> : pal::EnumFormatter<pal::Keyword>
{
};
