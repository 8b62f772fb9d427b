export module pal:Lexer;

import std;

import :SourceLocation;
import :Token;

namespace pal {

export class Lexer
{
public:
    explicit Lexer(std::string_view source)
        : m_source(source)
    {
    }

    // Produces the next token; keeps returning EndOfFile once the source is exhausted.
    auto scan_token() -> Token;

private:
    [[nodiscard]] auto is_at_end() const -> bool { return m_current >= m_source.length(); }
    [[nodiscard]] auto peek(std::size_t distance = 0) const -> char;

    auto advance() -> char;

    auto skip_whitespace() -> void;
    auto scan_identifier() -> Token;
    auto scan_number() -> Token;
    auto scan_prefixed_number(int base) -> Token;
    auto scan_quoted(char delimiter, TokenType type) -> Token;
    auto scan_symbol() -> Token;

    [[nodiscard]] auto lexeme() const -> std::string_view
    {
        return m_source.substr(m_start, m_current - m_start);
    }
    [[nodiscard]] auto make_token(TokenType type, Token::Payload payload = {}) const -> Token;
    // `message` must have static storage duration, tokens outlive the lexer
    [[nodiscard]] auto error_token(std::string_view message) const -> Token;

    std::string_view m_source;
    std::size_t m_start = 0;
    std::size_t m_current = 0;
    SourceLocation m_start_sloc{.line = 1, .column = 1};
    SourceLocation m_sloc{.line = 1, .column = 1};
};

// Scans the whole source. The result always ends with exactly one EndOfFile token.
export auto tokenize(std::string_view source) -> std::vector<Token>;

} // namespace pal
