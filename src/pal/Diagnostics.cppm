export module pal:Diagnostics;

import std;

import :Token;

namespace pal {

// Collects the compile errors of one compilation and forwards each to a sink as it is reported.
export class Diagnostics
{
public:
    using Sink = std::function<void(std::string_view)>;

    explicit Diagnostics(Sink sink)
        : m_sink(std::move(sink))
    {
    }

    auto error_at(const Token & token, std::string_view message) -> void;

    [[nodiscard]] auto has_errors() const -> bool { return !m_messages.empty(); }
    [[nodiscard]] auto get_messages() const -> const std::vector<std::string> & { return m_messages; }

private:
    Sink m_sink;
    std::vector<std::string> m_messages;
};

} // namespace pal
