import std;
import pal;

namespace {

struct Arguments
{
    std::optional<std::filesystem::path> config;
    std::optional<std::filesystem::path> script;
};

auto usage() -> void
{
    std::println(std::cerr, "Usage: pal [--config <file.yaml>] [script.guias]");
    pal::exit_program(pal::ExitCode::IncorrectUsage);
}

auto parse_arguments(const std::vector<std::string_view> & args) -> Arguments
{
    Arguments arguments;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size() || arguments.config.has_value()) {
                usage();
            }
            arguments.config = args[++i];
        }
        else if (!arguments.script.has_value() && !args[i].starts_with("-")) {
            arguments.script = args[i];
        }
        else {
            usage();
        }
    }
    return arguments;
}

auto load_config(const Arguments & arguments) -> pal::Config
{
    pal::Config config;
    if (arguments.config.has_value()) {
        try {
            config = pal::load_config(arguments.config.value());
        }
        catch (const pal::ConfigError & e) {
            std::println(std::cerr, "Invalid configuration: {}", e.what());
            pal::exit_program(pal::ExitCode::ConfigError);
        }
    }

    // configured globals win over the built-in ones
    config.globals.merge(pal::standard_globals());
    return config;
}

auto make_hooks() -> pal::Hooks
{
    auto output = [](std::string_view text) { std::println("{}", text); };
    return {
            .on_action = [output](pal::Action action) { output(std::format("[action] {}", action)); },
            .output = output,
    };
}

auto repl(pal::VirtualMachine & vm) -> void
{
    for (std::string line; std::print("> "), std::getline(std::cin, line);) {
        [[maybe_unused]] auto result = vm.run(line);
    }
    std::println("\nexit");
}

auto run_file(pal::VirtualMachine & vm, const std::filesystem::path & filename) -> void
{
    std::ifstream script(filename);
    if (!script.is_open()) {
        std::println(std::cerr, "Failed to open {}", filename.string());
        pal::exit_program(pal::ExitCode::IOError);
    }

    std::stringstream buffer;
    buffer << script.rdbuf();
    script.close();

    auto result = vm.run(buffer.str());

    if (result == pal::InterpretResult::CompileError) {
        pal::exit_program(pal::ExitCode::IncorrectInput);
    }
    if (result == pal::InterpretResult::RuntimeError) {
        pal::exit_program(pal::ExitCode::SoftwareError);
    }
}

} // namespace

auto main(int argc, char ** argv) -> int
{
    auto args = std::span(argv, static_cast<std::size_t>(argc))
            | std::views::drop(1) // drop argv[0], it's executable name
            | std::views::transform([](char const * arg) { return std::string_view{arg}; })
            | std::ranges::to<std::vector>();

    auto arguments = parse_arguments(args);
    auto config = load_config(arguments);

    pal::VirtualMachine vm(make_hooks(), std::move(config.globals), config.options);

    if (arguments.script.has_value()) {
        run_file(vm, arguments.script.value());
    }
    else {
        repl(vm);
    }
}
