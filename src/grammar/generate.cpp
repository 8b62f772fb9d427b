import jinja2_yaml_binding;
import jinja2cpp;
import yaml_cpp;

import std;

namespace {

auto read_file(const std::filesystem::path & path) -> std::optional<std::string>
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

auto main(int argc, char * argv[]) -> int
{
    if (argc != 4) {
        std::println(std::cerr, "Usage: opcode_generator <opcodes_yaml> <template> <output>");
        return EXIT_FAILURE;
    }

    YAML::Node opcodes;
    try {
        opcodes = YAML::LoadFile(argv[1]);
    }
    catch (const YAML::Exception & e) {
        std::println(std::cerr, "{}: {}", argv[1], e.what());
        return EXIT_FAILURE;
    }

    auto source = read_file(argv[2]);
    if (!source.has_value()) {
        std::println(std::cerr, "Failed to open {}", argv[2]);
        return EXIT_FAILURE;
    }

    jinja2::Template tmpl;
    if (auto loaded = tmpl.Load(source.value(), argv[2]); !loaded) {
        std::println(std::cerr, "{}", loaded.error().ToString());
        return EXIT_FAILURE;
    }

    jinja2::ValuesMap params{{"data", pal::grammar::to_template_value(opcodes)}};

    std::ofstream output(argv[3]);
    if (!output.is_open()) {
        std::println(std::cerr, "Failed to open {} for writing", argv[3]);
        return EXIT_FAILURE;
    }

    if (auto rendered = tmpl.Render(output, params); !rendered) {
        std::println(std::cerr, "{}", rendered.error().ToString());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
