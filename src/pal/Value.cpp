module pal;

import std;

import magic_enum;

import :Object;
import :Value;

namespace pal {

namespace {

using Binary = auto (*)(const Value & self, const Value & other) -> std::optional<Value>;
using Unary = auto (*)(const Value & self) -> std::optional<Value>;
using Truth = auto (*)(const Value & self) -> bool;

// Reflected handlers (r_*) receive the right operand as `self`, i.e. they compute `other OP self`.
struct OperatorRules
{
    Truth is_true = nullptr;
    Unary negate = nullptr;
    Unary invert = nullptr;
    Binary add = nullptr;
    Binary r_add = nullptr;
    Binary sub = nullptr;
    Binary r_sub = nullptr;
    Binary power = nullptr;
    Binary r_power = nullptr;
    Binary mix = nullptr;
    Binary r_mix = nullptr;
    Binary equal = nullptr;
    Binary less = nullptr;
    Binary more = nullptr;
};

auto is_integer(double number) -> bool { return std::isfinite(number) && std::trunc(number) == number; }

// Integral and within [-2^63, 2^63), so the cast to int64 is exact.
auto fits_int64(double number) -> bool
{
    constexpr double LIMIT = 0x1p63;
    return is_integer(number) && number >= -LIMIT && number < LIMIT;
}

template <typename F>
auto with_numbers(const Value & self, const Value & other, F && func) -> std::optional<Value>
{
    if (!self.holds<value::Number>() || !other.holds<value::Number>()) {
        return std::nullopt;
    }
    return std::invoke(std::forward<F>(func), self.as<value::Number>(), other.as<value::Number>());
}

// *** Number ***

auto number_add(const Value & self, const Value & other) -> std::optional<Value>
{
    return with_numbers(self, other, [](double a, double b) { return Value::number(a + b); });
}

auto number_sub(const Value & self, const Value & other) -> std::optional<Value>
{
    return with_numbers(self, other, [](double a, double b) { return Value::number(a - b); });
}

// Scientific shorthand: `x ^ y` is x * 10^y, defined for integral exponents only.
auto number_power(const Value & self, const Value & other) -> std::optional<Value>
{
    return with_numbers(self, other, [](double a, double b) -> std::optional<Value> {
        if (!is_integer(b)) {
            return std::nullopt;
        }
        return Value::number(a * std::pow(10.0, b)); // NOLINT(readability-magic-numbers)
    });
}

auto number_mix(const Value & self, const Value & other) -> std::optional<Value>
{
    return with_numbers(self, other, [](double a, double b) -> std::optional<Value> {
        if (!fits_int64(a) || !fits_int64(b)) {
            return std::nullopt;
        }
        auto bits = static_cast<std::int64_t>(a) | static_cast<std::int64_t>(b);
        return Value::number(static_cast<double>(bits));
    });
}

auto number_equal(const Value & self, const Value & other) -> std::optional<Value>
{
    return with_numbers(self, other, [](double a, double b) { return Value::boolean(a == b); });
}

auto number_less(const Value & self, const Value & other) -> std::optional<Value>
{
    return with_numbers(self, other, [](double a, double b) { return Value::boolean(a < b); });
}

auto number_more(const Value & self, const Value & other) -> std::optional<Value>
{
    return with_numbers(self, other, [](double a, double b) { return Value::boolean(a > b); });
}

// *** Bool ***

auto bool_equal(const Value & self, const Value & other) -> std::optional<Value>
{
    bool flag = self.as<value::Boolean>();
    if (other.holds<value::Boolean>()) {
        return Value::boolean(flag == other.as<value::Boolean>());
    }
    if (other.holds<value::Number>()) {
        return Value::boolean(flag == (other.as<value::Number>() == 1));
    }
    return std::nullopt;
}

// *** String ***

auto string_add(const Value & self, const Value & other) -> std::optional<Value>
{
    if (!other.holds<value::String>()) {
        return std::nullopt;
    }
    return Value::string(self.as<value::String>() + other.as<value::String>());
}

auto string_equal(const Value & self, const Value & other) -> std::optional<Value>
{
    if (!other.holds<value::String>()) {
        return std::nullopt;
    }
    return Value::boolean(self.as<value::String>() == other.as<value::String>());
}

// *** Path ***

auto path_text(const Value & value) -> std::optional<std::string_view>
{
    if (value.holds<value::Path>()) {
        return value.as<value::Path>().text;
    }
    if (value.holds<value::String>()) {
        return value.as<value::String>();
    }
    return std::nullopt;
}

auto join_paths(std::string_view head, std::string_view tail) -> Value
{
    return Value::path((std::filesystem::path{head} / std::filesystem::path{tail}).generic_string());
}

auto path_add(const Value & self, const Value & other) -> std::optional<Value>
{
    auto tail = path_text(other);
    if (!tail.has_value()) {
        return std::nullopt;
    }
    return join_paths(self.as<value::Path>().text, tail.value());
}

auto path_r_add(const Value & self, const Value & other) -> std::optional<Value>
{
    auto head = path_text(other);
    if (!head.has_value()) {
        return std::nullopt;
    }
    return join_paths(head.value(), self.as<value::Path>().text);
}

auto path_equal(const Value & self, const Value & other) -> std::optional<Value>
{
    if (!other.holds<value::Path>()) {
        return std::nullopt;
    }
    return Value::boolean(self.as<value::Path>().text == other.as<value::Path>().text);
}

// *** Array ***

auto array_mix(const Value & self, const Value & other) -> std::optional<Value>
{
    if (!other.holds<value::ArrayPtr>()) {
        return std::nullopt;
    }
    value::Array elements = *self.as<value::ArrayPtr>();
    std::ranges::copy(*other.as<value::ArrayPtr>(), std::back_inserter(elements));
    return Value::array(std::move(elements));
}

auto array_equal(const Value & self, const Value & other) -> std::optional<Value>
{
    if (!other.holds<value::ArrayPtr>()) {
        return std::nullopt;
    }

    const auto & lhs = *self.as<value::ArrayPtr>();
    const auto & rhs = *other.as<value::ArrayPtr>();
    if (lhs.size() != rhs.size()) {
        return Value::boolean(false);
    }

    for (const auto & [left, right] : std::views::zip(lhs, rhs)) {
        auto same = apply(BinaryOp::Equal, left, right);
        if (!same.has_value()) {
            return std::nullopt;
        }
        if (!same->is_true()) {
            return Value::boolean(false);
        }
    }
    return Value::boolean(true);
}

auto array_invert(const Value & self) -> std::optional<Value>
{
    value::Array elements = *self.as<value::ArrayPtr>();
    std::ranges::reverse(elements);
    return Value::array(std::move(elements));
}

// *** Tags ***

template <typename Tag> auto tag_equal(const Value & self, const Value & other) -> std::optional<Value>
{
    if (!other.holds<Tag>()) {
        return std::nullopt;
    }
    return Value::boolean(self.as<Tag>() == other.as<Tag>());
}

consteval auto generate_operator_table()
{
    using enum Value::ValueType;

    std::array<OperatorRules, magic_enum::enum_count<Value::ValueType>()> rules{};
    for (auto & rule : rules) {
        rule.is_true = [](const Value &) { return true; };
    }

    rules[std::to_underlying(Number)] = {
            .is_true = [](const Value & self) { return self.as<value::Number>() != 0; },
            .negate = [](const Value & self) -> std::optional<Value> {
                return Value::number(-self.as<value::Number>());
            },
            .add = number_add,
            .sub = number_sub,
            .power = number_power,
            .mix = number_mix,
            .equal = number_equal,
            .less = number_less,
            .more = number_more,
    };
    rules[std::to_underlying(Bool)] = {
            .is_true = [](const Value & self) { return self.as<value::Boolean>(); },
            .invert = [](const Value & self) -> std::optional<Value> {
                return Value::boolean(!self.as<value::Boolean>());
            },
            .equal = bool_equal,
    };
    rules[std::to_underlying(Nil)] = {
            .is_true = [](const Value &) { return false; },
            .equal = [](const Value &, const Value & other) -> std::optional<Value> {
                return Value::boolean(other.holds<value::Nil>());
            },
    };
    rules[std::to_underlying(String)] = {
            .is_true = [](const Value & self) { return !self.as<value::String>().empty(); },
            .add = string_add,
            .equal = string_equal,
    };
    rules[std::to_underlying(Path)] = {
            .is_true = [](const Value & self) { return !self.as<value::Path>().text.empty(); },
            .add = path_add,
            .r_add = path_r_add,
            .equal = path_equal,
    };
    rules[std::to_underlying(Correction)].equal = tag_equal<pal::Correction>;
    rules[std::to_underlying(Algorithm)].equal = tag_equal<pal::Algorithm>;
    rules[std::to_underlying(Array)] = {
            .is_true = [](const Value & self) { return !self.as<value::ArrayPtr>()->empty(); },
            .invert = array_invert,
            .mix = array_mix,
            .equal = array_equal,
    };

    return rules;
}

constexpr auto OPERATOR_TABLE = generate_operator_table();

auto rules_for(const Value & value) -> const OperatorRules &
{
    return OPERATOR_TABLE[std::to_underlying(value.get_type())];
}

auto dispatch(Binary OperatorRules::*handler, const Value & self, const Value & other)
        -> std::optional<Value>
{
    auto func = rules_for(self).*handler;
    if (func == nullptr) {
        return std::nullopt;
    }
    return func(self, other);
}

auto dispatch(Unary OperatorRules::*handler, const Value & self) -> std::optional<Value>
{
    auto func = rules_for(self).*handler;
    if (func == nullptr) {
        return std::nullopt;
    }
    return func(self);
}

} // namespace

auto Value::is_true() const -> bool { return rules_for(*this).is_true(*this); }
auto Value::negate() const -> std::optional<Value> { return dispatch(&OperatorRules::negate, *this); }
auto Value::invert() const -> std::optional<Value> { return dispatch(&OperatorRules::invert, *this); }

auto Value::add(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::add, *this, other);
}

auto Value::r_add(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::r_add, *this, other);
}

auto Value::sub(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::sub, *this, other);
}

auto Value::r_sub(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::r_sub, *this, other);
}

auto Value::power(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::power, *this, other);
}

auto Value::r_power(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::r_power, *this, other);
}

auto Value::mix(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::mix, *this, other);
}

auto Value::r_mix(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::r_mix, *this, other);
}

auto Value::equal(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::equal, *this, other);
}

auto Value::less(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::less, *this, other);
}

auto Value::more(const Value & other) const -> std::optional<Value>
{
    return dispatch(&OperatorRules::more, *this, other);
}

auto apply(BinaryOp op, const Value & lhs, const Value & rhs) -> std::optional<Value>
{
    using enum BinaryOp;

    std::optional<Value> result;
    switch (op) {
    case Add: result = lhs.add(rhs); return result.has_value() ? result : rhs.r_add(lhs);
    case Subtract: result = lhs.sub(rhs); return result.has_value() ? result : rhs.r_sub(lhs);
    case Power: result = lhs.power(rhs); return result.has_value() ? result : rhs.r_power(lhs);
    case Mix: result = lhs.mix(rhs); return result.has_value() ? result : rhs.r_mix(lhs);
    case Equal: result = lhs.equal(rhs); return result.has_value() ? result : rhs.equal(lhs);
    case Less: result = lhs.less(rhs); return result.has_value() ? result : rhs.more(lhs);
    case More: result = lhs.more(rhs); return result.has_value() ? result : rhs.less(lhs);
    }
    return std::nullopt;
}

auto apply(UnaryOp op, const Value & operand) -> std::optional<Value>
{
    switch (op) {
    case UnaryOp::Negate: return operand.negate();
    case UnaryOp::Invert: return operand.invert();
    }
    return std::nullopt;
}

auto correction_name(Correction correction) -> std::string_view
{
    switch (correction) {
    case Correction::Drift: return "drift";
    case Correction::Emission: return "emission";
    case Correction::Focus: return "focus";
    }
    return "?";
}

auto algorithm_name(Algorithm algorithm) -> std::string_view
{
    // Tag names match their enumerators
    return magic_enum::enum_name(algorithm);
}

} // namespace pal

auto std::formatter<pal::Value>::format(const pal::Value & value, std::format_context & ctx) const
        -> std::format_context::iterator
{
    using enum pal::Value::ValueType;
    namespace value_t = pal::value;

    switch (value.get_type()) {
    case Number: return std::format_to(ctx.out(), "{}", value.as<value_t::Number>());
    case Bool: return std::format_to(ctx.out(), "{}", value.as<value_t::Boolean>());
    case Nil: return std::format_to(ctx.out(), "void");
    case String: return std::format_to(ctx.out(), "{}", value.as<value_t::String>());
    case Path: return std::format_to(ctx.out(), "'{}'", value.as<value_t::Path>().text);
    case Correction:
        return std::format_to(ctx.out(), "{}", pal::correction_name(value.as<pal::Correction>()));
    case Algorithm:
        return std::format_to(ctx.out(), "{}", pal::algorithm_name(value.as<pal::Algorithm>()));
    case Array: {
        auto out = std::format_to(ctx.out(), "[");
        bool first = true;
        for (const auto & element : *value.as<value_t::ArrayPtr>()) {
            out = std::format_to(out, "{}{}", first ? "" : ", ", element);
            first = false;
        }
        return std::format_to(out, "]");
    }
    case Function: {
        const auto & function = *value.as<value_t::FunctionPtr>();
        if (function.get_kind() == pal::FunctionKind::Script) {
            return std::format_to(ctx.out(), "<script>");
        }
        return std::format_to(ctx.out(), "<func {}>", function.get_name());
    }
    case NativeFunction:
        return std::format_to(
                ctx.out(), "<native func {}>", value.as<value_t::NativeFunctionPtr>()->get_name()
        );
    case Generator:
        return std::format_to(ctx.out(), "<iter {}>", value.as<value_t::GeneratorPtr>()->get_name());
    case Iterator:
        return std::format_to(
                ctx.out(), "<iterator {}>", value.as<value_t::IteratorPtr>()->get_generator().get_name()
        );
    case NativeIterator:
        return std::format_to(
                ctx.out(), "<native iterator {}>", value.as<value_t::NativeIteratorPtr>()->get_name()
        );
    case Enum:
        return std::format_to(ctx.out(), "<namespace {}>", value.as<value_t::EnumPtr>()->get_name());
    case NativeEnum:
        return std::format_to(
                ctx.out(), "<native namespace {}>", value.as<value_t::NativeEnumPtr>()->get_name()
        );
    case NativeObject:
        return std::format_to(
                ctx.out(), "<native object {}>", value.as<value_t::NativeObjectPtr>()->get_name()
        );
    }
    return ctx.out();
}
