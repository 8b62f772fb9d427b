module;

#include <jinja2cpp/value.h>
#include <yaml-cpp/yaml.h>

export module jinja2_yaml_binding;

namespace pal::grammar {

// Copies a YAML document into template values: maps become jinja2 maps, sequences become lists and
// every scalar is handed over as a string. Null and undefined nodes become empty values.
export auto to_template_value(const YAML::Node & node) -> jinja2::Value
{
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null: return {};
    case YAML::NodeType::Scalar: return node.Scalar();
    case YAML::NodeType::Sequence: {
        jinja2::ValuesList items;
        items.reserve(node.size());
        for (const auto & item : node) {
            items.push_back(to_template_value(item));
        }
        return items;
    }
    case YAML::NodeType::Map: {
        jinja2::ValuesMap fields;
        for (const auto & field : node) {
            fields.emplace(field.first.as<std::string>(), to_template_value(field.second));
        }
        return fields;
    }
    }
    return {};
}

} // namespace pal::grammar
