export module pal:Config;

import std;

import :VirtualMachine;

namespace pal {

export class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string & what)
        : std::runtime_error(what)
    {
    }
};

// Settings and pre-seeded globals for a machine, loaded from YAML:
//
//   options:
//     print_code: false
//     trace_execution: false
//   globals:
//     exposure: 0.25
//     output: !path 'C:/captures'
//     Detector: !namespace [Secondary, Backscatter]
export struct Config
{
    Options options;
    Globals globals;
};

export [[nodiscard]] auto load_config(const std::filesystem::path & path) -> Config;
export [[nodiscard]] auto parse_config(std::string_view text) -> Config;

} // namespace pal
