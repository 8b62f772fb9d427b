export module pal:Object;

import std;

export import :ObjectFwd;

import :Chunk;
import :EnumFormatter;
import :Stack;
import :Value;

import magic_enum;

namespace pal {

export enum class FunctionKind : std::uint8_t {
    Script,
    Function,
    Generator,
};

// What a callee needs from the machine that calls it.
export class CallContext
{
public:
    CallContext() = default;
    CallContext(const CallContext &) = delete;
    CallContext(CallContext &&) = delete;
    auto operator=(const CallContext &) -> CallContext & = delete;
    auto operator=(CallContext &&) -> CallContext & = delete;
    virtual ~CallContext() = default;

    virtual auto stack() -> Stack & = 0;

    // Starts executing `function`, whose callee and arguments are the top `arg_count + 1` slots.
    virtual auto push_frame(value::FunctionPtr function, std::size_t arg_count) -> void = 0;
};

export class Function
{
public:
    Function(std::string name, FunctionKind kind)
        : m_name(std::move(name))
        , m_kind(kind)
    {
    }

    [[nodiscard]] auto get_name() const -> std::string_view { return m_name; }
    [[nodiscard]] auto get_kind() const -> FunctionKind { return m_kind; }

    template <class Self> [[nodiscard]] auto get_chunk(this Self && self) -> auto &&
    {
        return std::forward<Self>(self).m_chunk;
    }

    template <class Self> [[nodiscard]] auto arity(this Self && self) -> auto &&
    {
        return std::forward<Self>(self).m_arity;
    }

private:
    std::string m_name;
    FunctionKind m_kind;
    std::size_t m_arity = 0;
    Chunk m_chunk;
};

export class NativeFunction
{
public:
    using Callback = std::function<Value(std::span<const Value>)>;

    // No arity means the function accepts any number of arguments.
    NativeFunction(std::string name, std::optional<std::size_t> arity, Callback callback)
        : m_name(std::move(name))
        , m_arity(arity)
        , m_callback(std::move(callback))
    {
    }

    [[nodiscard]] auto get_name() const -> std::string_view { return m_name; }
    [[nodiscard]] auto get_arity() const -> std::optional<std::size_t> { return m_arity; }

    auto operator()(std::span<const Value> args) const -> Value { return m_callback(args); }

private:
    std::string m_name;
    std::optional<std::size_t> m_arity;
    Callback m_callback;
};

// Frozen state of a suspended generator frame.
export struct SavedFrame
{
    std::vector<Value> window; // callee, arguments and locals
    std::size_t ip = 0;
};

// A declared generator is a Generator without state. Calling it primes a fresh Generator that
// owns the argument window, and that one is what iterators drive. The saved window may reference an
// iterator over this same generator; finish() releases it.
export class Generator
{
public:
    explicit Generator(value::FunctionPtr function)
        : m_function(std::move(function))
    {
    }

    [[nodiscard]] auto get_name() const -> std::string_view { return m_function->get_name(); }
    [[nodiscard]] auto get_function() const -> const value::FunctionPtr & { return m_function; }

    [[nodiscard]] auto is_finished() const -> bool { return m_finished; }

    auto prime(std::vector<Value> window) -> void { m_saved = SavedFrame{.window = std::move(window)}; }

    // Hands the saved frame over to a resuming call frame.
    auto resume() -> SavedFrame;
    auto suspend(SavedFrame frame) -> void;
    auto finish() -> void;

private:
    value::FunctionPtr m_function;
    std::optional<SavedFrame> m_saved;
    bool m_finished = false;
};

export class Iterator
{
public:
    explicit Iterator(value::GeneratorPtr generator)
        : m_generator(std::move(generator))
    {
    }

    [[nodiscard]] auto get_generator() const -> Generator & { return *m_generator; }
    [[nodiscard]] auto get_generator_ptr() const -> const value::GeneratorPtr & { return m_generator; }

private:
    value::GeneratorPtr m_generator;
};

export class NativeIterator
{
public:
    using Next = std::function<std::optional<Value>()>;

    NativeIterator(std::string name, Next next)
        : m_name(std::move(name))
        , m_next(std::move(next))
    {
    }

    // Creates an iterator over a copy of `values`.
    static auto over(std::string name, std::vector<Value> values) -> value::NativeIteratorPtr;

    [[nodiscard]] auto get_name() const -> std::string_view { return m_name; }

    // std::nullopt once exhausted.
    auto next() -> std::optional<Value> { return m_next(); }

private:
    std::string m_name;
    Next m_next;
};

export class Enum
{
public:
    explicit Enum(std::string name)
        : m_name(std::move(name))
    {
    }

    [[nodiscard]] auto get_name() const -> std::string_view { return m_name; }
    [[nodiscard]] auto get_members() const -> const std::vector<std::string> & { return m_members; }

    auto define(std::string member) -> void { m_members.push_back(std::move(member)); }

    // Members evaluate to their declaration index.
    [[nodiscard]] auto find(std::string_view member) const -> std::optional<double>;

private:
    std::string m_name;
    std::vector<std::string> m_members;
};

export class NativeEnum
{
public:
    using Members = std::vector<std::pair<std::string, double>>;

    NativeEnum(std::string name, Members members)
        : m_name(std::move(name))
        , m_members(std::move(members))
    {
    }

    // Mirrors a C++ enumeration, members map to their underlying values.
    template <typename E>
        requires std::is_enum_v<E>
    static auto from(std::string name) -> value::NativeEnumPtr
    {
        Members members;
        for (const auto & [value, member] : magic_enum::enum_entries<E>()) {
            members.emplace_back(std::string{member}, static_cast<double>(magic_enum::enum_integer(value)));
        }
        return std::make_shared<NativeEnum>(std::move(name), std::move(members));
    }

    [[nodiscard]] auto get_name() const -> std::string_view { return m_name; }
    [[nodiscard]] auto get_members() const -> const Members & { return m_members; }

    [[nodiscard]] auto find(std::string_view member) const -> std::optional<double>;

private:
    std::string m_name;
    Members m_members;
};

export class NativeObject
{
public:
    NativeObject(std::string name, std::any object)
        : m_name(std::move(name))
        , m_object(std::move(object))
    {
    }

    [[nodiscard]] auto get_name() const -> std::string_view { return m_name; }

    template <typename T> [[nodiscard]] auto get() -> T * { return std::any_cast<T>(&m_object); }

private:
    std::string m_name;
    std::any m_object;
};

} // namespace pal

template <> struct std::formatter<pal::FunctionKind> : pal::EnumFormatter<pal::FunctionKind>
{
};
