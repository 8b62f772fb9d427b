module pal;

import std;

import fast_float;

import :Lexer;
import :Token;

namespace pal {

namespace {

constexpr const std::size_t TAB_WIDTH = 4;
constexpr const std::size_t MAX_SYMBOL_LENGTH = 3;

constexpr auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }
constexpr auto is_hex_digit(char c) -> bool
{
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}
constexpr auto is_binary_digit(char c) -> bool { return c == '0' || c == '1'; }
constexpr auto is_alpha(char c) -> bool
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}
constexpr auto is_alnum(char c) -> bool { return is_digit(c) || is_alpha(c); }

struct Symbol
{
    std::string_view text;
    TokenType type;
};

consteval auto generate_symbol_table()
{
    using enum TokenType;

    return std::to_array<Symbol>({
            {.text = "==", .type = EqualEqual},
            {.text = "!=", .type = BangEqual},
            {.text = "<=", .type = LessEqual},
            {.text = ">=", .type = GreaterEqual},
            {.text = ",", .type = Comma},
            {.text = ".", .type = Dot},
            {.text = "=", .type = Equal},
            {.text = "?", .type = Question},
            {.text = "(", .type = LeftParenthesis},
            {.text = ")", .type = RightParenthesis},
            {.text = "[", .type = LeftBracket},
            {.text = "]", .type = RightBracket},
            {.text = "{", .type = LeftBrace},
            {.text = "}", .type = RightBrace},
            {.text = "-", .type = Minus},
            {.text = "!", .type = Bang},
            {.text = "^", .type = Caret},
            {.text = "+", .type = Plus},
            {.text = "|", .type = Bar},
            {.text = "<", .type = Less},
            {.text = ">", .type = Greater},
    });
}

constexpr auto SYMBOLS = generate_symbol_table();

static_assert(std::ranges::all_of(SYMBOLS, [](const Symbol & symbol) {
    return symbol.text.size() <= MAX_SYMBOL_LENGTH;
}));

} // namespace

auto Lexer::peek(std::size_t distance) const -> char
{
    if (m_current + distance >= m_source.length()) {
        return '\0';
    }
    return m_source[m_current + distance];
}

auto Lexer::advance() -> char
{
    char c = m_source[m_current++];
    if (c == '\n') {
        m_sloc.line++;
        m_sloc.column = 1;
    }
    else if (c == '\t') {
        m_sloc.column += TAB_WIDTH;
    }
    else {
        m_sloc.column++;
    }
    return c;
}

auto Lexer::skip_whitespace() -> void
{
    while (!is_at_end()) {
        switch (peek()) {
        case ' ':
        case '\r':
        case '\t': advance(); break;
        default: return;
        }
    }
}

auto Lexer::scan_token() -> Token
{
    skip_whitespace();

    m_start = m_current;
    m_start_sloc = m_sloc;

    if (is_at_end()) {
        return make_token(TokenType::EndOfFile);
    }

    char c = peek();

    if (c == '\n') {
        advance();
        return make_token(TokenType::EndOfLine);
    }
    if (is_alpha(c)) {
        return scan_identifier();
    }
    if (is_digit(c)) {
        return scan_number();
    }

    switch (c) {
    case '"': return scan_quoted('"', TokenType::String);
    case '\'': return scan_quoted('\'', TokenType::Path);
    case '\\': {
        char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1))));
        if (prefix == 'x') {
            return scan_prefixed_number(16); // NOLINT(readability-magic-numbers)
        }
        if (prefix == 'b') {
            return scan_prefixed_number(2);
        }
        break;
    }
    default: break;
    }

    return scan_symbol();
}

auto Lexer::scan_identifier() -> Token
{
    while (is_alnum(peek())) {
        advance();
    }

    auto token = make_token(TokenType::Identifier);
    if (auto keyword = find_keyword(token.lexeme); keyword.has_value()) {
        token.type = TokenType::Keyword;
        token.keyword = keyword.value();
    }
    return token;
}

auto Lexer::scan_number() -> Token
{
    while (is_digit(peek())) {
        advance();
    }

    // Fractional part, possibly empty (`1.`)
    if (peek() == '.') {
        advance(); // consume the '.'
        while (is_digit(peek())) {
            advance();
        }
    }

    auto text = lexeme();
    double number = 0;
    auto answer = fast_float::from_chars(text.data(), text.data() + text.size(), number);
    if (answer.ec != std::errc()) {
        return error_token("Invalid numerical literal");
    }

    return make_token(TokenType::Number, NumberLiteral{.value = number, .base = 10}); // NOLINT
}

auto Lexer::scan_prefixed_number(int base) -> Token
{
    // consume the two-character prefix
    advance();
    advance();

    auto accepts = base == 2 ? is_binary_digit : is_hex_digit;
    std::size_t digits_start = m_current;
    while (accepts(peek())) {
        advance();
    }

    if (m_current == digits_start) {
        return error_token("Expected numerical literal");
    }

    auto digits = m_source.substr(digits_start, m_current - digits_start);
    std::uint64_t number = 0;
    auto answer = std::from_chars(digits.data(), digits.data() + digits.size(), number, base);
    if (answer.ec != std::errc()) {
        return error_token("Numerical literal out of range");
    }

    return make_token(
            base == 2 ? TokenType::Binary : TokenType::Hex,
            NumberLiteral{.value = static_cast<double>(number), .base = base}
    );
}

auto Lexer::scan_quoted(char delimiter, TokenType type) -> Token
{
    advance(); // opening delimiter

    while (peek() != delimiter && peek() != '\n' && !is_at_end()) {
        advance();
    }

    if (peek() != delimiter) {
        return error_token(type == TokenType::Path ? "Unterminated path" : "Unterminated string");
    }

    advance(); // closing delimiter

    // the payload excludes both delimiters
    return make_token(type, lexeme().substr(1, m_current - m_start - 2));
}

auto Lexer::scan_symbol() -> Token
{
    for (std::size_t length = MAX_SYMBOL_LENGTH; length > 0; --length) {
        if (m_start + length > m_source.length()) {
            continue;
        }
        auto candidate = m_source.substr(m_start, length);
        auto symbol = std::ranges::find(SYMBOLS, candidate, &Symbol::text);
        if (symbol != SYMBOLS.end()) {
            for (std::size_t i = 0; i < length; ++i) {
                advance();
            }
            return make_token(symbol->type);
        }
    }

    advance();
    return error_token("Unknown symbol");
}

auto Lexer::make_token(TokenType type, Token::Payload payload) const -> Token
{
    return {
            .type = type,
            .lexeme = lexeme(),
            .sloc = m_start_sloc,
            .keyword = Keyword::None,
            .payload = payload,
    };
}

// Error tokens carry their message as the lexeme, the offending text as the payload.
auto Lexer::error_token(std::string_view message) const -> Token
{
    return {
            .type = TokenType::Error,
            .lexeme = message,
            .sloc = m_start_sloc,
            .keyword = Keyword::None,
            .payload = lexeme(),
    };
}

auto tokenize(std::string_view source) -> std::vector<Token>
{
    Lexer lexer(source);
    std::vector<Token> tokens;
    for (;;) {
        tokens.push_back(lexer.scan_token());
        if (tokens.back().type == TokenType::EndOfFile) {
            return tokens;
        }
    }
}

} // namespace pal
