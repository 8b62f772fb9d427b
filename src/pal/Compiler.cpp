module pal;

import std;

import magic_enum;

import :Chunk;
import :Compiler;
import :Diagnostics;
import :Lexer;
import :Object;
import :Token;
import :Value;

namespace pal {

namespace {

constexpr const std::size_t MAX_ARITY = 255;
constexpr const std::size_t MAX_LOCALS = 256;
constexpr const std::string_view ITERATOR_SLOT_NAME = "(iterator)";

struct Local
{
    std::string_view name;
    int depth; // -1 while the initializer is being compiled
};

// One per function being compiled, chained to the function it is nested in.
struct CompilerScope
{
    CompilerScope * enclosing = nullptr;
    value::FunctionPtr function;
    std::vector<Local> locals;
    int scope_depth = 0;
};

struct ParseContext
{
    bool can_assign;
};

class Parser;

using ParseFn = auto (*)(Parser &, ParseContext) -> void;
using StatementFn = auto (*)(Parser &) -> void;

struct ParseRule
{
    ParseFn prefix = nullptr;
    ParseFn infix = nullptr;
    Precedence precedence = Precedence::None;
};

struct KeywordRule
{
    ParseFn prefix = nullptr;
    StatementFn statement = nullptr;
    bool synchronizes = false; // parsing resumes here after an error
};

auto get_rule(const Token & token) -> const ParseRule &;
auto get_keyword_rule(Keyword keyword) -> const KeywordRule &;

class Parser
{
public:
    Parser(std::string_view source, Diagnostics & diagnostics)
        : m_lexer(source)
        , m_diagnostics(diagnostics)
    {
    }

    auto compile_script() -> value::FunctionPtr
    {
        CompilerScope script;
        begin_function(script, "script", FunctionKind::Script);

        advance();
        skip_newlines();
        while (!match(TokenType::EndOfFile)) {
            declaration();
            skip_newlines();
        }

        auto function = end_function();
        return m_had_error ? nullptr : function;
    }

    // *** Token Parser ***

    [[nodiscard]] auto previous() const -> const Token & { return m_previous; }
    [[nodiscard]] auto current() const -> const Token & { return m_current; }

    auto error_at(const Token & token, std::string_view message) -> void
    {
        if (m_panic_mode) {
            return;
        }
        m_panic_mode = true;
        m_had_error = true;
        m_diagnostics.error_at(token, message);
    }

    auto error(std::string_view message) -> void { error_at(m_previous, message); }
    auto error_at_current(std::string_view message) -> void { error_at(m_current, message); }

    auto advance() -> void
    {
        m_previous = m_current;

        for (;;) {
            m_current = m_lexer.scan_token();
            if (m_current.type != TokenType::Error) {
                break;
            }
            error_at_current(m_current.lexeme);
        }
    }

    auto consume(TokenType type, std::string_view message) -> void
    {
        if (m_current.type == type) {
            advance();
            return;
        }

        error_at_current(message);
    }

    [[nodiscard]] auto check(TokenType type) const -> bool { return m_current.type == type; }
    [[nodiscard]] auto check(Keyword keyword) const -> bool { return m_current.is_keyword(keyword); }

    auto match(TokenType type) -> bool
    {
        if (!check(type)) {
            return false;
        }
        advance();
        return true;
    }

    auto match(Keyword keyword) -> bool
    {
        if (!check(keyword)) {
            return false;
        }
        advance();
        return true;
    }

    auto skip_newlines() -> void
    {
        while (match(TokenType::EndOfLine)) {
        }
    }

    [[nodiscard]] auto at_statement_end() const -> bool
    {
        return check(TokenType::EndOfLine) || check(TokenType::RightBrace)
                || check(TokenType::EndOfFile);
    }

    auto synchronize() -> void
    {
        m_panic_mode = false;

        while (m_current.type != TokenType::EndOfFile) {
            if (m_previous.type == TokenType::EndOfLine) {
                return;
            }
            if (m_current.type == TokenType::EndOfLine) {
                advance();
                return;
            }
            if (m_current.type == TokenType::Keyword
                && get_keyword_rule(m_current.keyword).synchronizes) {
                return;
            }

            advance();
        }
    }

    // *** Byte Code Emitter ***

    [[nodiscard]] auto current_chunk() -> Chunk & { return m_compiler->function->get_chunk(); }
    [[nodiscard]] auto compiler() -> CompilerScope & { return *m_compiler; }

    auto emit_byte(Byte byte, SourceLocation sloc) -> void { write_chunk(current_chunk(), byte, sloc); }
    auto emit_byte(OpCode op, SourceLocation sloc) -> void { write_chunk(current_chunk(), op, sloc); }
    auto emit_byte(Byte byte) -> void { emit_byte(byte, m_previous.sloc); }
    auto emit_byte(OpCode op) -> void { emit_byte(op, m_previous.sloc); }

    template <typename ByteT, typename... Bytes> auto emit_bytes(ByteT byte, Bytes... bytes) -> void
    {
        emit_byte(byte);
        if constexpr (sizeof...(bytes) > 0) {
            emit_bytes(bytes...);
        }
    }

    auto emit_loop(std::size_t start) -> void
    {
        emit_byte(OpCode::Loop);

        std::size_t offset = current_chunk().code.size() - start + 2;
        if (offset > DOUBLE_BYTE_MAX) {
            error("Loop body too large.");
        }

        emit_byte(static_cast<Byte>((offset >> BYTE_DIGITS) & BYTE_MAX));
        emit_byte(static_cast<Byte>(offset & BYTE_MAX));
    }

    auto emit_jump(OpCode instruction) -> std::size_t
    {
        emit_bytes(instruction, BYTE_MAX, BYTE_MAX);

        return current_chunk().code.size() - 2;
    }

    auto patch_jump(std::size_t offset) -> void
    {
        std::size_t jump_length = current_chunk().code.size() - offset - 2;

        if (jump_length > DOUBLE_BYTE_MAX) {
            error("Too much code to jump over.");
        }

        current_chunk().code[offset] = (jump_length >> BYTE_DIGITS) & BYTE_MAX;
        current_chunk().code[offset + 1] = jump_length & BYTE_MAX;
    }

    auto make_constant(Value value) -> Byte
    {
        std::size_t constant = add_constant(current_chunk(), std::move(value));
        if (constant > BYTE_MAX) {
            error("Too many constants in one chunk.");
            return 0;
        }

        return static_cast<Byte>(constant);
    }

    auto emit_constant(Value value) -> void { emit_bytes(OpCode::Constant, make_constant(std::move(value))); }

    auto emit_return() -> void { emit_bytes(OpCode::Nil, OpCode::Return); }

    // *** Compilers and scopes ***

    auto begin_function(CompilerScope & scope, std::string_view name, FunctionKind kind) -> void
    {
        scope.enclosing = m_compiler;
        scope.function = std::make_shared<Function>(std::string{name}, kind);
        // slot 0 holds the callee
        scope.locals.push_back({.name = "", .depth = 0});

        m_compiler = &scope;
    }

    auto end_function() -> value::FunctionPtr
    {
        emit_return();
        auto function = m_compiler->function;
        m_compiler = m_compiler->enclosing;
        return function;
    }

    [[nodiscard]] auto function_kind() const -> FunctionKind { return m_compiler->function->get_kind(); }
    [[nodiscard]] auto is_scope_local() const -> bool { return m_compiler->scope_depth > 0; }

    auto begin_scope() -> void { m_compiler->scope_depth++; }

    auto end_scope() -> void
    {
        m_compiler->scope_depth--;

        while (!m_compiler->locals.empty() && m_compiler->locals.back().depth > m_compiler->scope_depth) {
            emit_byte(OpCode::Pop);
            m_compiler->locals.pop_back();
        }
    }

    auto identifier_constant(const Token & name) -> Byte
    {
        return make_constant(Value::string(std::string{name.lexeme}));
    }

    auto add_local(std::string_view name) -> void
    {
        if (m_compiler->locals.size() >= MAX_LOCALS) {
            error("Too many local variables in function.");
            return;
        }

        m_compiler->locals.push_back({.name = name, .depth = -1});
    }

    [[nodiscard]] auto last_local_slot() const -> Byte
    {
        return static_cast<Byte>(m_compiler->locals.size() - 1);
    }

    auto resolve_local(const Token & name) -> std::optional<std::size_t>
    {
        const auto & locals = m_compiler->locals;
        for (std::size_t idx = locals.size(); idx-- > 0;) {
            if (locals[idx].name == name.lexeme) {
                if (locals[idx].depth == -1) {
                    error("Can't read local variable in its own initializer.");
                }
                return idx;
            }
        }
        return std::nullopt;
    }

    auto mark_initialized() -> void
    {
        if (m_compiler->scope_depth == 0) {
            return;
        }
        m_compiler->locals.back().depth = m_compiler->scope_depth;
    }

    auto declare_local(const Token & name) -> void
    {
        for (const auto & local : std::ranges::reverse_view{m_compiler->locals}) {
            if (local.depth != -1 && local.depth < m_compiler->scope_depth) {
                break;
            }

            if (local.name == name.lexeme) {
                error("Already a variable with this name in this scope.");
            }
        }

        add_local(name.lexeme);
    }

    auto declare_variable() -> void
    {
        if (!is_scope_local()) {
            return;
        }
        declare_local(m_previous);
    }

    auto parse_variable(std::string_view message) -> Byte
    {
        consume(TokenType::Identifier, message);

        declare_variable();
        if (is_scope_local()) {
            return 0;
        }

        return identifier_constant(m_previous);
    }

    auto define_variable(Byte global) -> void
    {
        if (is_scope_local()) {
            mark_initialized();
            return;
        }

        emit_bytes(OpCode::DefineGlobal, global);
    }

    auto named_variable(const Token & name, bool can_assign) -> void
    {
        OpCode get_op{};
        OpCode set_op{};
        Byte arg{};

        if (auto local = resolve_local(name); local.has_value()) {
            arg = static_cast<Byte>(local.value());
            get_op = OpCode::GetLocal;
            set_op = OpCode::SetLocal;
        }
        else {
            arg = identifier_constant(name);
            get_op = OpCode::GetGlobal;
            set_op = OpCode::SetGlobal;
        }

        if (can_assign && match(TokenType::Equal)) {
            expression();
            emit_bytes(set_op, arg);
        }
        else {
            emit_bytes(get_op, arg);
        }
    }

    // *** Expressions ***

    auto expression() -> void { parse_precedence(Precedence::None); }

    // NOLINTNEXTLINE(misc-no-recursion)
    auto parse_precedence(Precedence precedence) -> void
    {
        advance();
        ParseFn prefix_rule = get_rule(m_previous).prefix;
        if (prefix_rule == nullptr) {
            error("Expected expression");
            return;
        }

        ParseContext ctx{.can_assign = precedence < Precedence::Assignment};
        prefix_rule(*this, ctx);

        while (precedence < get_rule(m_current).precedence) {
            advance();
            ParseFn infix_rule = get_rule(m_previous).infix;
            infix_rule(*this, ctx);
        }

        if (ctx.can_assign && match(TokenType::Equal)) {
            error("Invalid assignment target.");
        }
    }

    auto argument_list() -> Byte
    {
        std::size_t arg_count = 0;
        if (!check(TokenType::RightParenthesis)) {
            do {
                expression();
                if (arg_count == MAX_ARITY) {
                    error("Can't have more than 255 arguments.");
                }
                arg_count++;
            } while (match(TokenType::Comma));
        }
        consume(TokenType::RightParenthesis, "Expected ')' after arguments");
        return static_cast<Byte>(arg_count);
    }

    // *** Statements ***

    // NOLINTBEGIN(misc-no-recursion)
    auto declaration() -> void
    {
        statement();

        if (!m_panic_mode && !at_statement_end()) {
            error_at_current("Expected a newline between statements");
        }
        if (m_panic_mode) {
            synchronize();
        }
    }

    auto statement() -> void
    {
        if (m_current.type == TokenType::Keyword) {
            if (auto rule = get_keyword_rule(m_current.keyword).statement; rule != nullptr) {
                advance();
                rule(*this);
                return;
            }
        }

        if (match(TokenType::LeftBrace)) {
            begin_scope();
            block();
            end_scope();
            return;
        }

        expression();
        emit_byte(OpCode::Pop);
    }

    // Expects the opening brace to be consumed already.
    auto block() -> void
    {
        skip_newlines();
        while (!check(TokenType::RightBrace) && !check(TokenType::EndOfFile)) {
            declaration();
            skip_newlines();
        }

        consume(TokenType::RightBrace, "Expected '}' after block");
    }

    auto scoped_block(std::string_view message) -> void
    {
        consume(TokenType::LeftBrace, message);
        begin_scope();
        block();
        end_scope();
    }

    auto function(FunctionKind kind) -> void
    {
        CompilerScope scope;
        begin_function(scope, m_previous.lexeme, kind);

        begin_scope();

        consume(TokenType::LeftParenthesis, "Expected '(' after function name");
        if (!check(TokenType::RightParenthesis)) {
            do {
                m_compiler->function->arity()++;
                if (m_compiler->function->arity() > MAX_ARITY) {
                    error_at_current("Can't have more than 255 parameters.");
                }
                Byte constant = parse_variable("Expected parameter name");
                define_variable(constant);
            } while (match(TokenType::Comma));
        }
        consume(TokenType::RightParenthesis, "Expected ')' after parameters");
        consume(TokenType::LeftBrace, "Expected '{' before function body");
        block();

        auto function = end_function();
        if (kind == FunctionKind::Generator) {
            emit_constant(Value{std::make_shared<Generator>(std::move(function))});
        }
        else {
            emit_constant(Value{std::move(function)});
        }
    }
    // NOLINTEND(misc-no-recursion)

private:
    Lexer m_lexer;
    Diagnostics & m_diagnostics;
    CompilerScope * m_compiler = nullptr;

    Token m_current{.type = TokenType::EndOfFile, .lexeme = "", .sloc = {.line = 1, .column = 1}};
    Token m_previous = m_current;
    bool m_had_error = false;
    bool m_panic_mode = false;
};

// *** Expression Rules ***

auto number(Parser & parser, ParseContext /* ctx */) -> void
{
    parser.emit_constant(Value::number(parser.previous().number()));
}

auto string(Parser & parser, ParseContext /* ctx */) -> void
{
    parser.emit_constant(Value::string(std::string{parser.previous().text()}));
}

auto path(Parser & parser, ParseContext /* ctx */) -> void
{
    parser.emit_constant(Value::path(std::string{parser.previous().text()}));
}

auto variable(Parser & parser, ParseContext ctx) -> void
{
    parser.named_variable(parser.previous(), ctx.can_assign);
}

auto grouping(Parser & parser, ParseContext /* ctx */) -> void
{
    parser.expression();
    parser.consume(TokenType::RightParenthesis, "Expected ')' after expression");
}

auto list(Parser & parser, ParseContext /* ctx */) -> void
{
    parser.emit_byte(OpCode::Array);

    parser.skip_newlines();
    if (!parser.check(TokenType::RightBracket)) {
        do {
            parser.skip_newlines();
            parser.expression();
            parser.emit_byte(OpCode::AppendElement);
            parser.skip_newlines();
        } while (parser.match(TokenType::Comma));
    }
    parser.consume(TokenType::RightBracket, "Expected ']' after list elements");
}

auto unary(Parser & parser, ParseContext /* ctx */) -> void
{
    Token op = parser.previous();

    parser.parse_precedence(Precedence::Prefix);

    switch (op.type) {
    case TokenType::Minus: parser.emit_byte(OpCode::Negate, op.sloc); break;
    case TokenType::Bang: parser.emit_byte(OpCode::Invert, op.sloc); break;
    default: std::unreachable();
    }
}

auto binary(Parser & parser, ParseContext /* ctx */) -> void
{
    Token op = parser.previous();

    parser.parse_precedence(get_rule(op).precedence);

    auto emit = [&](OpCode code) { parser.emit_byte(code, op.sloc); };

    switch (op.type) {
    case TokenType::Plus: emit(OpCode::Add); break;
    case TokenType::Minus: emit(OpCode::Subtract); break;
    case TokenType::Caret: emit(OpCode::Power); break;
    case TokenType::Bar: emit(OpCode::Mix); break;
    case TokenType::EqualEqual: emit(OpCode::Equal); break;
    case TokenType::BangEqual:
        emit(OpCode::Equal);
        emit(OpCode::Invert);
        break;
    case TokenType::Less: emit(OpCode::Less); break;
    case TokenType::Greater: emit(OpCode::More); break;
    case TokenType::LessEqual:
        emit(OpCode::More);
        emit(OpCode::Invert);
        break;
    case TokenType::GreaterEqual:
        emit(OpCode::Less);
        emit(OpCode::Invert);
        break;
    default: std::unreachable();
    }
}

auto print(Parser & parser, ParseContext /* ctx */) -> void { parser.emit_byte(OpCode::Print); }

auto call(Parser & parser, ParseContext /* ctx */) -> void
{
    SourceLocation sloc = parser.previous().sloc;
    Byte arg_count = parser.argument_list();
    parser.emit_byte(OpCode::Call, sloc);
    parser.emit_byte(arg_count, sloc);
}

auto member(Parser & parser, ParseContext /* ctx */) -> void
{
    parser.consume(TokenType::Identifier, "Expected member name after '.'");
    Byte name = parser.identifier_constant(parser.previous());
    parser.emit_bytes(OpCode::GetField, name);
}

auto keyword(Parser & parser, ParseContext ctx) -> void
{
    ParseFn prefix_rule = get_keyword_rule(parser.previous().keyword).prefix;
    if (prefix_rule == nullptr) {
        parser.error("Expected expression");
        return;
    }
    prefix_rule(parser, ctx);
}

auto literal(Parser & parser, ParseContext /* ctx */) -> void
{
    using enum Keyword;

    switch (parser.previous().keyword) {
    case True: parser.emit_byte(OpCode::True); break;
    case False: parser.emit_byte(OpCode::False); break;
    case Void: parser.emit_byte(OpCode::Nil); break;
    case Drift: parser.emit_constant(Value{Correction::Drift}); break;
    case Emission: parser.emit_constant(Value{Correction::Emission}); break;
    case Focus: parser.emit_constant(Value{Correction::Focus}); break;
    case Manhattan: parser.emit_constant(Value{Algorithm::Manhattan}); break;
    case Euclidean: parser.emit_constant(Value{Algorithm::Euclidean}); break;
    case Minkowski: parser.emit_constant(Value{Algorithm::Minkowski}); break;
    default: std::unreachable();
    }
}

// *** Statement Rules ***

// NOLINTBEGIN(misc-no-recursion)
auto var_declaration(Parser & parser) -> void
{
    Byte global = parser.parse_variable("Expected variable name");

    parser.consume(TokenType::Equal, "Expected '=' after variable name");
    parser.expression();

    parser.define_variable(global);
}

auto script_level_only(Parser & parser) -> bool
{
    if (parser.function_kind() != FunctionKind::Script) {
        parser.error("Function nesting is not supported");
        return false;
    }
    return true;
}

auto function_declaration(Parser & parser, FunctionKind kind) -> void
{
    if (!script_level_only(parser)) {
        return;
    }

    Byte global = parser.parse_variable("Expected function name");
    parser.mark_initialized();
    parser.function(kind);
    parser.define_variable(global);
}

auto func_declaration(Parser & parser) -> void { function_declaration(parser, FunctionKind::Function); }
auto iter_declaration(Parser & parser) -> void { function_declaration(parser, FunctionKind::Generator); }

auto namespace_declaration(Parser & parser) -> void
{
    if (!script_level_only(parser)) {
        return;
    }

    Byte global = parser.parse_variable("Expected namespace name");
    Token name = parser.previous();

    parser.emit_bytes(OpCode::Enum, parser.identifier_constant(name));
    parser.define_variable(global);
    parser.named_variable(name, /* can_assign = */ false);

    parser.consume(TokenType::LeftBrace, "Expected '{' before namespace members");
    parser.skip_newlines();
    while (!parser.check(TokenType::RightBrace) && !parser.check(TokenType::EndOfFile)) {
        parser.consume(TokenType::Identifier, "Expected member name");
        parser.emit_bytes(OpCode::DefineField, parser.identifier_constant(parser.previous()));
        parser.skip_newlines();
        if (!parser.match(TokenType::Comma)) {
            break;
        }
        parser.skip_newlines();
    }
    parser.consume(TokenType::RightBrace, "Expected '}' after namespace members");

    parser.emit_byte(OpCode::Pop);
}

auto for_statement(Parser & parser) -> void
{
    parser.begin_scope();

    parser.consume(TokenType::LeftParenthesis, "Expected '(' after 'for'");
    if (!parser.match(Keyword::Var)) {
        parser.error_at_current("Expected a variable declaration to start the loop");
    }
    var_declaration(parser);
    parser.consume(TokenType::Comma, "Expected ',' after loop variable");

    std::size_t loop_start = parser.current_chunk().code.size();
    parser.expression();
    parser.consume(TokenType::Comma, "Expected ',' after loop condition");

    std::size_t exit_jump = parser.emit_jump(OpCode::JumpIfFalse);
    parser.emit_byte(OpCode::Pop);

    // The increment runs after the body, so jump over it on the way in.
    std::size_t body_jump = parser.emit_jump(OpCode::Jump);
    std::size_t increment_start = parser.current_chunk().code.size();
    parser.expression();
    parser.emit_byte(OpCode::Pop);
    parser.consume(TokenType::RightParenthesis, "Expected ')' after loop clauses");

    parser.emit_loop(loop_start);
    loop_start = increment_start;
    parser.patch_jump(body_jump);

    parser.scoped_block("Expected '{' to begin a loop");
    parser.emit_loop(loop_start);

    parser.patch_jump(exit_jump);
    parser.emit_byte(OpCode::Pop);

    parser.end_scope();
}

auto foreach_statement(Parser & parser) -> void
{
    parser.begin_scope();

    parser.consume(TokenType::LeftParenthesis, "Expected '(' after 'foreach'");
    if (!parser.match(Keyword::Var)) {
        parser.error_at_current("Expected a variable declaration to start the loop");
    }
    parser.consume(TokenType::Identifier, "Expected loop variable name");
    Token name = parser.previous();
    parser.consume(TokenType::Equal, "Expected '=' after loop variable");

    // The iterator lives in a hidden local below the loop variable.
    parser.expression();
    parser.add_local(ITERATOR_SLOT_NAME);
    parser.mark_initialized();
    Byte iterator_slot = parser.last_local_slot();

    parser.emit_byte(OpCode::Nil);
    parser.declare_local(name);
    parser.mark_initialized();
    Byte variable_slot = parser.last_local_slot();

    parser.consume(TokenType::RightParenthesis, "Expected ')' after loop iterator");

    // Once the iterator is exhausted the machine skips ahead past the loop-back jump to this offset.
    std::size_t loop_start = parser.current_chunk().code.size();
    parser.emit_bytes(OpCode::Advance, iterator_slot);
    parser.emit_bytes(OpCode::SetLocal, variable_slot);
    parser.emit_byte(OpCode::Pop);

    parser.scoped_block("Expected '{' to begin a loop");
    parser.emit_loop(loop_start);

    parser.end_scope();
}

auto return_statement(Parser & parser) -> void
{
    FunctionKind kind = parser.function_kind();
    if (kind == FunctionKind::Script) {
        parser.error("Can't return from top-level code.");
        return;
    }

    if (parser.at_statement_end()) {
        parser.emit_byte(OpCode::Nil);
    }
    else {
        parser.expression();
    }

    // Generators hand their value to the loop driving them and carry on from here next time.
    parser.emit_byte(kind == FunctionKind::Generator ? OpCode::Yield : OpCode::Return);
}

auto yield_statement(Parser & parser) -> void
{
    if (parser.function_kind() != FunctionKind::Generator) {
        parser.error("Can only yield from inside a generator.");
        return;
    }

    if (parser.at_statement_end()) {
        parser.emit_byte(OpCode::Nil);
    }
    else {
        parser.expression();
    }
    parser.emit_byte(OpCode::Yield);
}

auto wait_statement(Parser & parser) -> void
{
    parser.expression();
    parser.emit_byte(OpCode::Wait);
}

template <OpCode Action> auto action_statement(Parser & parser) -> void { parser.emit_byte(Action); }
// NOLINTEND(misc-no-recursion)

consteval auto generate_rule_table()
{
    using enum TokenType;

    std::array<ParseRule, magic_enum::enum_count<TokenType>()> rules{};

    auto set = [&rules](TokenType type, ParseRule rule) { rules[std::to_underlying(type)] = rule; };

    set(LeftParenthesis, {.prefix = grouping, .infix = call, .precedence = Precedence::Call});
    set(LeftBracket, {.prefix = list});
    set(Dot, {.infix = member, .precedence = Precedence::Call});
    set(Question, {.infix = print, .precedence = Precedence::Prefix});
    set(Minus, {.prefix = unary, .infix = binary, .precedence = Precedence::Term});
    set(Plus, {.infix = binary, .precedence = Precedence::Term});
    set(Bar, {.infix = binary, .precedence = Precedence::Term});
    set(Caret, {.infix = binary, .precedence = Precedence::Exponent});
    set(Bang, {.prefix = unary});
    set(EqualEqual, {.infix = binary, .precedence = Precedence::Comparison});
    set(BangEqual, {.infix = binary, .precedence = Precedence::Comparison});
    set(Less, {.infix = binary, .precedence = Precedence::Comparison});
    set(Greater, {.infix = binary, .precedence = Precedence::Comparison});
    set(LessEqual, {.infix = binary, .precedence = Precedence::Comparison});
    set(GreaterEqual, {.infix = binary, .precedence = Precedence::Comparison});
    set(Identifier, {.prefix = variable});
    set(Keyword, {.prefix = keyword});
    set(Number, {.prefix = number});
    set(Hex, {.prefix = number});
    set(Binary, {.prefix = number});
    set(String, {.prefix = string});
    set(Path, {.prefix = path});

    return rules;
}

consteval auto generate_keyword_rule_table()
{
    using enum Keyword;

    std::array<KeywordRule, magic_enum::enum_count<Keyword>()> rules{};

    auto set = [&rules](Keyword keyword, KeywordRule rule) { rules[std::to_underlying(keyword)] = rule; };

    for (auto tag : {True, False, Void, Drift, Emission, Focus, Manhattan, Euclidean, Minkowski}) {
        set(tag, {.prefix = literal});
    }

    set(Var, {.statement = var_declaration, .synchronizes = true});
    set(Func, {.statement = func_declaration, .synchronizes = true});
    set(Iter, {.statement = iter_declaration, .synchronizes = true});
    set(Namespace, {.statement = namespace_declaration, .synchronizes = true});
    set(For, {.statement = for_statement, .synchronizes = true});
    set(Foreach, {.statement = foreach_statement, .synchronizes = true});
    set(Return, {.statement = return_statement, .synchronizes = true});
    set(Yield, {.statement = yield_statement, .synchronizes = true});
    set(Wait, {.statement = wait_statement, .synchronizes = true});

    set(Survey, {.statement = action_statement<OpCode::Survey>, .synchronizes = true});
    set(Segment, {.statement = action_statement<OpCode::Segment>, .synchronizes = true});
    set(Filter, {.statement = action_statement<OpCode::Filter>, .synchronizes = true});
    set(Interact, {.statement = action_statement<OpCode::Interact>, .synchronizes = true});
    set(Manage, {.statement = action_statement<OpCode::Manage>, .synchronizes = true});
    set(Scan, {.statement = action_statement<OpCode::Scan>, .synchronizes = true});

    return rules;
}

constexpr auto RULE_TABLE = generate_rule_table();
constexpr auto KEYWORD_RULE_TABLE = generate_keyword_rule_table();

auto get_rule(const Token & token) -> const ParseRule & { return RULE_TABLE[std::to_underlying(token.type)]; }

auto get_keyword_rule(Keyword keyword) -> const KeywordRule &
{
    return KEYWORD_RULE_TABLE[std::to_underlying(keyword)];
}

} // namespace

auto compile(std::string_view source, Diagnostics & diagnostics) -> value::FunctionPtr
{
    Parser parser(source, diagnostics);
    return parser.compile_script();
}

} // namespace pal
