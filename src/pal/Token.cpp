module pal;

import std;

import :Token;

namespace pal {

namespace {

struct KeywordEntry
{
    std::string_view lexeme;
    Keyword keyword;
};

consteval auto generate_keyword_table()
{
    using enum Keyword;

    return std::to_array<KeywordEntry>({
            {.lexeme = "true", .keyword = True},
            {.lexeme = "false", .keyword = False},
            {.lexeme = "void", .keyword = Void},
            {.lexeme = "drift", .keyword = Drift},
            {.lexeme = "emission", .keyword = Emission},
            {.lexeme = "focus", .keyword = Focus},
            {.lexeme = "Manhattan", .keyword = Manhattan},
            {.lexeme = "Euclidean", .keyword = Euclidean},
            {.lexeme = "Minkowski", .keyword = Minkowski},
            {.lexeme = "var", .keyword = Var},
            {.lexeme = "func", .keyword = Func},
            {.lexeme = "iter", .keyword = Iter},
            {.lexeme = "namespace", .keyword = Namespace},
            {.lexeme = "for", .keyword = For},
            {.lexeme = "foreach", .keyword = Foreach},
            {.lexeme = "return", .keyword = Return},
            {.lexeme = "yield", .keyword = Yield},
            {.lexeme = "wait", .keyword = Wait},
            {.lexeme = "Scan", .keyword = Survey},
            {.lexeme = "Cluster", .keyword = Segment},
            {.lexeme = "filter", .keyword = Filter},
            {.lexeme = "Mark", .keyword = Interact},
            {.lexeme = "Tighten", .keyword = Manage},
            {.lexeme = "Search", .keyword = Scan},
    });
}

constexpr auto KEYWORDS = generate_keyword_table();

} // namespace

auto keyword_lexeme(Keyword keyword) -> std::string_view
{
    auto it = std::ranges::find(KEYWORDS, keyword, &KeywordEntry::keyword);
    return it != KEYWORDS.end() ? it->lexeme : std::string_view{};
}

auto find_keyword(std::string_view lexeme) -> std::optional<Keyword>
{
    auto it = std::ranges::find(KEYWORDS, lexeme, &KeywordEntry::lexeme);
    if (it == KEYWORDS.end()) {
        return std::nullopt;
    }
    return it->keyword;
}

} // namespace pal
