export module pal:Value;

import std;

import :EnumFormatter;
import :ObjectFwd;

namespace pal {

export enum class Correction : std::uint8_t {
    Drift,
    Emission,
    Focus,
};

export enum class Algorithm : std::uint8_t {
    Manhattan,
    Euclidean,
    Minkowski,
};

export enum class BinaryOp : std::uint8_t {
    Add,
    Subtract,
    Power,
    Mix,
    Equal,
    Less,
    More,
};

export enum class UnaryOp : std::uint8_t {
    Negate,
    Invert,
};

export class Value;

namespace value {

export using Number = double;
export using Boolean = bool;
export using Nil = std::monostate;
export using String = std::string;

export struct Path
{
    std::string text;
};

export using Array = std::vector<Value>;

export using ArrayPtr = std::shared_ptr<Array>;
export using FunctionPtr = std::shared_ptr<Function>;
export using NativeFunctionPtr = std::shared_ptr<NativeFunction>;
export using GeneratorPtr = std::shared_ptr<Generator>;
export using IteratorPtr = std::shared_ptr<Iterator>;
export using NativeIteratorPtr = std::shared_ptr<NativeIterator>;
export using EnumPtr = std::shared_ptr<Enum>;
export using NativeEnumPtr = std::shared_ptr<NativeEnum>;
export using NativeObjectPtr = std::shared_ptr<NativeObject>;

} // namespace value

export class Value
{
public:
    // Alternatives are listed in ValueType order.
    enum class ValueType : std::uint8_t
    {
        Number,
        Bool,
        Nil,
        String,
        Path,
        Correction,
        Algorithm,
        Array,
        Function,
        NativeFunction,
        Generator,
        Iterator,
        NativeIterator,
        Enum,
        NativeEnum,
        NativeObject,
    };

    using Storage = std::variant<
            value::Number,
            value::Boolean,
            value::Nil,
            value::String,
            value::Path,
            Correction,
            Algorithm,
            value::ArrayPtr,
            value::FunctionPtr,
            value::NativeFunctionPtr,
            value::GeneratorPtr,
            value::IteratorPtr,
            value::NativeIteratorPtr,
            value::EnumPtr,
            value::NativeEnumPtr,
            value::NativeObjectPtr>;

    Value() = default;

    template <typename T>
        requires std::constructible_from<Storage, T &&>
    Value(T && data) // NOLINT(google-explicit-constructor,bugprone-forwarding-reference-overload)
        : m_data(std::forward<T>(data))
    {
    }

    // Initializers

    static auto number(double value) -> Value { return Value{value::Number{value}}; }
    static auto boolean(bool value) -> Value { return Value{value::Boolean{value}}; }
    static auto nil() -> Value { return Value{value::Nil{}}; }
    static auto string(std::string value) -> Value { return Value{value::String{std::move(value)}}; }
    static auto path(std::string value) -> Value { return Value{value::Path{std::move(value)}}; }
    static auto array(value::Array elements = {}) -> Value
    {
        return Value{std::make_shared<value::Array>(std::move(elements))};
    }

    [[nodiscard]] constexpr auto get_type() const -> ValueType
    {
        return static_cast<ValueType>(m_data.index());
    }

    [[nodiscard]] auto is(ValueType type) const -> bool { return get_type() == type; }

    template <typename T> [[nodiscard]] auto holds() const -> bool
    {
        return std::holds_alternative<T>(m_data);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T & { return std::get<T>(m_data); }

    // Operator protocol. Every handler answers std::nullopt when it declines the operands.

    [[nodiscard]] auto is_true() const -> bool;
    [[nodiscard]] auto negate() const -> std::optional<Value>;
    [[nodiscard]] auto invert() const -> std::optional<Value>;

    [[nodiscard]] auto add(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto r_add(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto sub(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto r_sub(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto power(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto r_power(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto mix(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto r_mix(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto equal(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto less(const Value & other) const -> std::optional<Value>;
    [[nodiscard]] auto more(const Value & other) const -> std::optional<Value>;

    // Pushes a frame, calls into the host or primes a generator for the callee sitting
    // `arg_count` slots below the top of the stack. Returns false if the value isn't callable.
    [[nodiscard]] auto call(CallContext & context, std::size_t arg_count) const -> bool;

private:
    Storage m_data;
};

// Tries the left operand's handler, then the mirrored handler of the right one.
export [[nodiscard]] auto apply(BinaryOp op, const Value & lhs, const Value & rhs)
        -> std::optional<Value>;
export [[nodiscard]] auto apply(UnaryOp op, const Value & operand) -> std::optional<Value>;

export auto correction_name(Correction correction) -> std::string_view;
export auto algorithm_name(Algorithm algorithm) -> std::string_view;

} // namespace pal

template <>
struct std::formatter<pal::Value::ValueType> : pal::EnumFormatter<pal::Value::ValueType>
{
};

template <> struct std::formatter<pal::BinaryOp> : pal::EnumFormatter<pal::BinaryOp>
{
};

template <> struct std::formatter<pal::UnaryOp> : pal::EnumFormatter<pal::UnaryOp>
{
};

template <> struct std::formatter<pal::Value> : std::formatter<std::string_view>
{
    auto format(const pal::Value & value, std::format_context & ctx) const
            -> std::format_context::iterator;
};
