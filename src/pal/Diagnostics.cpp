module pal;

import std;

import :Diagnostics;
import :Token;

namespace pal {

auto Diagnostics::error_at(const Token & token, std::string_view message) -> void
{
    std::string where;
    switch (token.type) {
    case TokenType::EndOfFile: where = " at end"; break;
    case TokenType::EndOfLine: where = " at end of line"; break;
    // error tokens carry the message as their lexeme and the offending text as payload
    case TokenType::Error: where = std::format(" at '{}'", token.text()); break;
    default: where = std::format(" at '{}'", token.lexeme); break;
    }

    auto formatted = std::format("[{}] Error{}: {}", token.sloc, where, message);
    if (m_sink) {
        m_sink(formatted);
    }
    m_messages.push_back(std::move(formatted));
}

} // namespace pal
