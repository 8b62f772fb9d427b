export module pal:VirtualMachine;

import std;

import :Chunk;
import :EnumFormatter;
import :Object;
import :OpCode;
import :Stack;
import :Value;

namespace pal {

// Instrument operations bound to the six action keywords.
export enum class Action : std::uint8_t {
    Survey,
    Segment,
    Filter,
    Interact,
    Manage,
    Scan,
};

export enum class [[nodiscard]] InterpretResult : std::uint8_t {
    Ok,
    CompileError,
    RuntimeError,
};

export using Globals = std::unordered_map<std::string, Value>;

// Every hook left empty gets a default when the machine is constructed.
export struct Hooks
{
    // Called whenever a global is defined or assigned.
    std::function<void(std::string_view, const Value &)> on_variable_changed;
    // Default: throws RuntimeError, aborting the run.
    std::function<void(Byte)> on_unknown_opcode;
    // Default: forwards the action's opcode to on_unknown_opcode.
    std::function<void(Action)> on_action;
    // Default: blocks the calling thread.
    std::function<void(std::chrono::duration<double>)> wait;
    // Default: one line per call on stdout.
    std::function<void(std::string_view)> output;
    // Compile errors and runtime error reports. Default: stderr.
    std::function<void(std::string_view)> error;
};

export struct Options
{
    bool print_code = false;
    bool trace_execution = false;
};

export struct CallFrame
{
    value::FunctionPtr function;
    InstructionPointer ip;
    std::size_t bottom; // absolute stack slot of the callee
    value::GeneratorPtr generator = nullptr; // set while resumed by a foreach loop
    std::size_t advance_offset = 0;          // caller offset of the Advance that resumed `generator`
    std::optional<std::size_t> skip_to;      // fast-forwarding to the Loop that targets this offset
};

// Not thread-safe: one run at a time.
export class VirtualMachine : public CallContext
{
public:
    explicit VirtualMachine(Hooks hooks = {}, Globals globals = {}, Options options = {});
    VirtualMachine(const VirtualMachine &) = delete;
    auto operator=(const VirtualMachine &) -> VirtualMachine & = delete;
    ~VirtualMachine() override;

    // Compiles and executes `source`. Globals survive between runs.
    auto run(std::string_view source) -> InterpretResult;

    [[nodiscard]] auto global(const std::string & name) const -> std::optional<Value>;
    auto define_global(std::string name, Value value) -> void;

    auto stack() -> Stack & override { return m_stack; }
    auto push_frame(value::FunctionPtr function, std::size_t arg_count) -> void override;

private:
    auto execute() -> InterpretResult;

    auto read_constant(CallFrame & frame) -> const Value &;
    auto read_string(CallFrame & frame) -> const std::string &;

    auto binary_op(BinaryOp op) -> void;
    auto unary_op(UnaryOp op) -> void;

    auto call_value(std::size_t arg_count) -> void;
    auto return_from_frame() -> bool;
    auto yield_from_frame() -> void;
    auto advance_iterator(CallFrame & frame) -> void;
    auto skip_instruction(CallFrame & frame) -> void;

    auto get_field(const std::string & name) -> void;
    auto set_global(const std::string & name, bool define) -> void;
    auto perform(Action action, Byte instruction) -> void;

    auto trace(const CallFrame & frame) -> void;
    auto report_runtime_error(std::string_view message) -> void;
    auto reset() -> void;

    Hooks m_hooks;
    Options m_options;
    Globals m_globals;
    Stack m_stack;
    std::vector<CallFrame> m_frames;
    std::vector<std::weak_ptr<Generator>> m_generators; // every generator started by this machine
};

} // namespace pal

template <> struct std::formatter<pal::Action> : pal::EnumFormatter<pal::Action>
{
};

template <> struct std::formatter<pal::InterpretResult> : pal::EnumFormatter<pal::InterpretResult>
{
};
