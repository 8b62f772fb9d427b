module pal;

import std;

import yaml_cpp;

import :Config;
import :Object;
import :Value;
import :VirtualMachine;

namespace pal {

namespace {

constexpr const std::string_view PATH_TAG = "!path";
constexpr const std::string_view NAMESPACE_TAG = "!namespace";

auto error_at(const YAML::Node & node, std::string_view message) -> ConfigError
{
    auto mark = node.Mark();
    return ConfigError(std::format("line {}, column {}: {}", mark.line + 1, mark.column + 1, message));
}

// NOLINTNEXTLINE(misc-no-recursion)
auto to_value(const std::string & name, const YAML::Node & node) -> Value
{
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null: return Value::nil();
    case YAML::NodeType::Map: throw error_at(node, std::format("'{}': mappings can't be script values", name));
    case YAML::NodeType::Sequence: {
        if (node.Tag() == NAMESPACE_TAG) {
            NativeEnum::Members members;
            for (const auto & member : node) {
                members.emplace_back(member.as<std::string>(), static_cast<double>(members.size()));
            }
            return Value{std::make_shared<NativeEnum>(name, std::move(members))};
        }

        value::Array elements;
        for (const auto & element : node) {
            elements.push_back(to_value(name, element));
        }
        return Value::array(std::move(elements));
    }
    case YAML::NodeType::Scalar: break;
    }

    const auto & scalar = node.Scalar();
    if (node.Tag() == PATH_TAG) {
        return Value::path(scalar);
    }
    // quoted scalars are always strings
    if (node.Tag() == "!") {
        return Value::string(scalar);
    }

    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
        return Value::boolean(flag);
    }
    double number = 0;
    if (YAML::convert<double>::decode(node, number)) {
        return Value::number(number);
    }
    return Value::string(scalar);
}

auto to_config(const YAML::Node & root) -> Config
{
    Config config;
    if (!root.IsDefined() || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw error_at(root, "expected a mapping at the top level");
    }

    if (auto options = root["options"]; options.IsDefined()) {
        if (!options.IsMap()) {
            throw error_at(options, "'options' must be a mapping");
        }
        config.options.print_code = options["print_code"].as<bool>(false);
        config.options.trace_execution = options["trace_execution"].as<bool>(false);
    }

    if (auto globals = root["globals"]; globals.IsDefined()) {
        if (!globals.IsMap()) {
            throw error_at(globals, "'globals' must be a mapping");
        }
        for (const auto & item : globals) {
            auto name = item.first.as<std::string>();
            config.globals.insert_or_assign(name, to_value(name, item.second));
        }
    }

    return config;
}

} // namespace

auto load_config(const std::filesystem::path & path) -> Config
{
    try {
        return to_config(YAML::LoadFile(path.string()));
    }
    catch (const YAML::Exception & e) {
        throw ConfigError(std::format("{}: {}", path.string(), e.what()));
    }
}

auto parse_config(std::string_view text) -> Config
{
    try {
        return to_config(YAML::Load(std::string{text}));
    }
    catch (const YAML::Exception & e) {
        throw ConfigError(e.what());
    }
}

} // namespace pal
