module;

#include <yaml-cpp/yaml.h>

export module yaml_cpp;

export namespace YAML {

// Parser API
using YAML::Load;
using YAML::LoadFile;
using YAML::Mark;
using YAML::Node;
using YAML::NodeType;

// Conversions
using YAML::convert;

// Errors
using YAML::BadConversion;
using YAML::BadFile;
using YAML::Exception;
using YAML::ParserException;

} // namespace YAML
