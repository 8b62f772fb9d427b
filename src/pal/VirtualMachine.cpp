module pal;

import std;

import :Chunk;
import :Compiler;
import :Debug;
import :Diagnostics;
import :Object;
import :RuntimeError;
import :Stack;
import :Value;
import :VirtualMachine;

namespace pal {

namespace {

constexpr const std::size_t MAX_FRAMES = 64;

auto emit_lines(const std::function<void(std::string_view)> & sink, std::string_view text) -> void
{
    while (!text.empty()) {
        auto end = text.find('\n');
        sink(text.substr(0, end));
        if (end == std::string_view::npos) {
            return;
        }
        text.remove_prefix(end + 1);
    }
}

auto operator_name(BinaryOp op) -> std::string_view
{
    switch (op) {
    case BinaryOp::Add: return "add";
    case BinaryOp::Subtract: return "sub";
    case BinaryOp::Power: return "power";
    case BinaryOp::Mix: return "mix";
    case BinaryOp::Equal: return "equal";
    case BinaryOp::Less: return "less";
    case BinaryOp::More: return "more";
    }
    return "?";
}

auto operator_name(UnaryOp op) -> std::string_view
{
    return op == UnaryOp::Negate ? "negate" : "invert";
}

auto frame_name(const CallFrame & frame) -> std::string_view
{
    return frame.function->get_kind() == FunctionKind::Script ? "script" : frame.function->get_name();
}

} // namespace

VirtualMachine::VirtualMachine(Hooks hooks, Globals globals, Options options)
    : m_hooks(std::move(hooks))
    , m_options(options)
    , m_globals(std::move(globals))
{
    if (!m_hooks.on_unknown_opcode) {
        m_hooks.on_unknown_opcode = [](Byte instruction) {
            auto name = is_opcode(instruction) ? opcode_label(static_cast<OpCode>(instruction)) : "unknown";
            throw RuntimeError(std::format("Unhandled opcode {} ({})", instruction, name));
        };
    }
    if (!m_hooks.wait) {
        m_hooks.wait = [](std::chrono::duration<double> delay) { std::this_thread::sleep_for(delay); };
    }
    if (!m_hooks.output) {
        m_hooks.output = [](std::string_view line) { std::println("{}", line); };
    }
    if (!m_hooks.error) {
        m_hooks.error = [](std::string_view line) { std::println(std::cerr, "{}", line); };
    }
}

// A suspended generator can hold an iterator over itself in its saved window. Finishing every
// generator still alive drops those windows, so such cycles don't outlive the machine.
VirtualMachine::~VirtualMachine()
{
    for (const auto & started : m_generators) {
        if (auto generator = started.lock(); generator != nullptr) {
            generator->finish();
        }
    }
}

auto VirtualMachine::run(std::string_view source) -> InterpretResult
{
    Diagnostics diagnostics(m_hooks.error);
    auto script = compile(source, diagnostics);
    if (script == nullptr) {
        return InterpretResult::CompileError;
    }

    if (m_options.print_code) {
        std::ostringstream listing;
        disassemble_function(listing, script);
        emit_lines(m_hooks.output, listing.str());
    }

    reset();
    m_stack.push(Value{script});
    push_frame(script, 0);

    return execute();
}

auto VirtualMachine::global(const std::string & name) const -> std::optional<Value>
{
    if (auto it = m_globals.find(name); it != m_globals.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto VirtualMachine::define_global(std::string name, Value value) -> void
{
    m_globals.insert_or_assign(std::move(name), std::move(value));
}

auto VirtualMachine::push_frame(value::FunctionPtr function, std::size_t arg_count) -> void
{
    if (m_frames.size() >= MAX_FRAMES) {
        throw RuntimeError("Stack overflow.");
    }

    std::size_t bottom = m_stack.size() - arg_count - 1;
    const Chunk & chunk = function->get_chunk();
    m_frames.push_back({
            .function = std::move(function),
            .ip = InstructionPointer{chunk},
            .bottom = bottom,
    });
    m_stack.set_floor(bottom);
}

auto VirtualMachine::execute() -> InterpretResult
{
    try {
        for (;;) {
            CallFrame & frame = m_frames.back();

            if (frame.skip_to.has_value()) {
                skip_instruction(frame);
                continue;
            }

            if (m_options.trace_execution) {
                trace(frame);
            }

            Byte instruction = frame.ip.advance();
            if (!is_opcode(instruction)) {
                m_hooks.on_unknown_opcode(instruction);
                continue;
            }

            switch (static_cast<OpCode>(instruction)) {
            // Values
            case OpCode::Constant: m_stack.push(read_constant(frame)); break;
            case OpCode::Nil: m_stack.push(Value::nil()); break;
            case OpCode::True: m_stack.push(Value::boolean(true)); break;
            case OpCode::False: m_stack.push(Value::boolean(false)); break;
            case OpCode::Array: m_stack.push(Value::array()); break;
            case OpCode::AppendElement: {
                Value element = m_stack.pop();
                const Value & target = m_stack.peek();
                if (!target.holds<value::ArrayPtr>()) {
                    throw RuntimeError("Can only append elements to arrays.");
                }
                target.as<value::ArrayPtr>()->push_back(std::move(element));
                break;
            }
            // Value manipulators
            case OpCode::Pop: std::ignore = m_stack.pop(); break;
            case OpCode::DefineGlobal: set_global(read_string(frame), /* define = */ true); break;
            case OpCode::GetGlobal: {
                const auto & name = read_string(frame);
                auto it = m_globals.find(name);
                if (it == m_globals.end()) {
                    throw RuntimeError(std::format("Undefined variable '{}'.", name));
                }
                m_stack.push(it->second);
                break;
            }
            case OpCode::SetGlobal: set_global(read_string(frame), /* define = */ false); break;
            case OpCode::GetLocal: {
                Byte slot = frame.ip.advance();
                m_stack.push(m_stack.slot(frame.bottom + slot));
                break;
            }
            case OpCode::SetLocal: {
                Byte slot = frame.ip.advance();
                m_stack.slot(frame.bottom + slot) = m_stack.peek();
                break;
            }
            case OpCode::Enum: m_stack.push(Value{std::make_shared<Enum>(read_string(frame))}); break;
            case OpCode::DefineField: {
                const auto & name = read_string(frame);
                const Value & target = m_stack.peek();
                if (!target.holds<value::EnumPtr>()) {
                    throw RuntimeError("Can only define members on namespaces.");
                }
                target.as<value::EnumPtr>()->define(name);
                break;
            }
            case OpCode::GetField: get_field(read_string(frame)); break;
            // Comparison ops
            case OpCode::Equal: binary_op(BinaryOp::Equal); break;
            case OpCode::Less: binary_op(BinaryOp::Less); break;
            case OpCode::More: binary_op(BinaryOp::More); break;
            // Binary ops
            case OpCode::Add: binary_op(BinaryOp::Add); break;
            case OpCode::Subtract: binary_op(BinaryOp::Subtract); break;
            case OpCode::Power: binary_op(BinaryOp::Power); break;
            case OpCode::Mix: binary_op(BinaryOp::Mix); break;
            // Unary ops
            case OpCode::Negate: unary_op(UnaryOp::Negate); break;
            case OpCode::Invert: unary_op(UnaryOp::Invert); break;
            // Aux
            case OpCode::Print: m_hooks.output(std::format("{}", m_stack.peek())); break;
            case OpCode::Jump: {
                DoubleByte offset = frame.ip.advance_double();
                frame.ip.jump(offset);
                break;
            }
            case OpCode::JumpIfFalse: {
                DoubleByte offset = frame.ip.advance_double();
                if (!m_stack.peek().is_true()) {
                    frame.ip.jump(offset);
                }
                break;
            }
            case OpCode::Loop: {
                DoubleByte offset = frame.ip.advance_double();
                frame.ip.jump(-static_cast<std::ptrdiff_t>(offset));
                break;
            }
            case OpCode::Call: call_value(frame.ip.advance()); break;
            case OpCode::Return:
                if (return_from_frame()) {
                    return InterpretResult::Ok;
                }
                break;
            case OpCode::Yield: yield_from_frame(); break;
            case OpCode::Advance: advance_iterator(frame); break;
            case OpCode::Wait: {
                Value delay = m_stack.pop();
                if (!delay.holds<value::Number>()) {
                    throw RuntimeError(
                            std::format("Wait expects a number of seconds, got '{}'.", delay.get_type())
                    );
                }
                std::chrono::duration<double> seconds(delay.as<value::Number>());
                // NaN fails both comparisons
                if (!(seconds >= seconds.zero() && seconds < std::chrono::nanoseconds::max())) {
                    throw RuntimeError(
                            std::format("Wait expects a non-negative number of seconds, got '{}'.", delay)
                    );
                }
                m_hooks.wait(seconds);
                break;
            }
            // Domain actions
            case OpCode::Survey: perform(Action::Survey, instruction); break;
            case OpCode::Segment: perform(Action::Segment, instruction); break;
            case OpCode::Filter: perform(Action::Filter, instruction); break;
            case OpCode::Interact: perform(Action::Interact, instruction); break;
            case OpCode::Manage: perform(Action::Manage, instruction); break;
            case OpCode::Scan: perform(Action::Scan, instruction); break;
            }
        }
    }
    catch (const RuntimeError & e) {
        report_runtime_error(e.what());
    }
    catch (const std::exception & e) {
        // thrown by a host callback
        report_runtime_error(std::format("Host error: {}", e.what()));
    }

    return InterpretResult::RuntimeError;
}

auto VirtualMachine::read_constant(CallFrame & frame) -> const Value &
{
    Byte index = frame.ip.advance();
    const auto & constants = frame.ip.chunk().constants;
    if (index >= constants.size()) {
        throw RuntimeError(std::format("Constant {} is out of range.", index));
    }
    return constants[index];
}

auto VirtualMachine::read_string(CallFrame & frame) -> const std::string &
{
    const Value & constant = read_constant(frame);
    if (!constant.holds<value::String>()) {
        throw RuntimeError("Expected a name constant.");
    }
    return constant.as<value::String>();
}

auto VirtualMachine::binary_op(BinaryOp op) -> void
{
    Value rhs = m_stack.pop();
    Value lhs = m_stack.pop();

    auto result = apply(op, lhs, rhs);
    if (!result.has_value()) {
        throw RuntimeError(std::format(
                "Unsupported operand types for {}: '{}' and '{}'.",
                operator_name(op),
                lhs.get_type(),
                rhs.get_type()
        ));
    }
    m_stack.push(std::move(result.value()));
}

auto VirtualMachine::unary_op(UnaryOp op) -> void
{
    Value operand = m_stack.pop();

    auto result = apply(op, operand);
    if (!result.has_value()) {
        throw RuntimeError(
                std::format("Unsupported operand type for {}: '{}'.", operator_name(op), operand.get_type())
        );
    }
    m_stack.push(std::move(result.value()));
}

auto VirtualMachine::call_value(std::size_t arg_count) -> void
{
    Value callee = m_stack.peek(arg_count);
    if (!callee.call(*this, arg_count)) {
        throw RuntimeError(
                std::format("Can only call functions and generators, got '{}'.", callee.get_type())
        );
    }
}

// Returns true once the script frame itself has returned.
auto VirtualMachine::return_from_frame() -> bool
{
    Value result = m_stack.pop();
    CallFrame finished = std::move(m_frames.back());
    m_frames.pop_back();
    m_stack.truncate(finished.bottom);

    if (m_frames.empty()) {
        return true;
    }

    m_stack.set_floor(m_frames.back().bottom);

    if (finished.generator != nullptr) {
        // The generator ran off its end: the foreach driving it is done.
        finished.generator->finish();
        m_frames.back().skip_to = finished.advance_offset;
        return false;
    }

    m_stack.push(std::move(result));
    return false;
}

auto VirtualMachine::yield_from_frame() -> void
{
    Value result = m_stack.pop();
    CallFrame & frame = m_frames.back();
    if (frame.generator == nullptr) {
        throw RuntimeError("Can only yield from a generator.");
    }

    frame.generator->suspend({
            .window = m_stack.take_window(frame.bottom),
            .ip = frame.ip.at(),
    });
    m_frames.pop_back();

    m_stack.set_floor(m_frames.back().bottom);
    m_stack.push(std::move(result));
}

auto VirtualMachine::advance_iterator(CallFrame & frame) -> void
{
    std::size_t advance_offset = frame.ip.at() - 1;
    Byte slot = frame.ip.advance();
    Value iterable = m_stack.slot(frame.bottom + slot);

    if (iterable.holds<value::NativeIteratorPtr>()) {
        auto next = iterable.as<value::NativeIteratorPtr>()->next();
        if (next.has_value()) {
            m_stack.push(std::move(next.value()));
        }
        else {
            frame.skip_to = advance_offset;
        }
        return;
    }

    if (!iterable.holds<value::IteratorPtr>()) {
        throw RuntimeError(
                std::format("Can only iterate over iterators, got '{}'.", iterable.get_type())
        );
    }

    const auto & generator = iterable.as<value::IteratorPtr>()->get_generator_ptr();
    if (generator->is_finished()) {
        frame.skip_to = advance_offset;
        return;
    }

    if (m_frames.size() >= MAX_FRAMES) {
        throw RuntimeError("Stack overflow.");
    }

    // A fresh generator resumes at offset 0 with only its arguments saved.
    SavedFrame saved = generator->resume();
    if (saved.ip == 0) {
        std::erase_if(m_generators, [](const auto & started) { return started.expired(); });
        m_generators.emplace_back(generator);
    }
    std::size_t bottom = m_stack.size();
    m_stack.splice(saved.window);

    const auto & function = generator->get_function();
    m_frames.push_back({
            .function = function,
            .ip = InstructionPointer{function->get_chunk(), saved.ip},
            .bottom = bottom,
            .generator = generator,
            .advance_offset = advance_offset,
    });
    m_stack.set_floor(bottom);
}

// Walks over one instruction without executing it, until the loop jumping back to the exhausted
// Advance has been passed.
auto VirtualMachine::skip_instruction(CallFrame & frame) -> void
{
    if (frame.ip.is_at_end()) {
        throw RuntimeError("Reached the end of the chunk while leaving a loop.");
    }

    Byte instruction = frame.ip.advance();
    if (!is_opcode(instruction)) {
        return;
    }

    auto op = static_cast<OpCode>(instruction);
    if (op == OpCode::Loop) {
        DoubleByte offset = frame.ip.advance_double();
        if (frame.ip.at() - offset == frame.skip_to.value()) {
            frame.skip_to.reset();
        }
        return;
    }

    for (auto _ : std::views::iota(0UZ, operand_width(operand_kind(op)))) {
        std::ignore = frame.ip.advance();
    }
}

auto VirtualMachine::get_field(const std::string & name) -> void
{
    Value target = m_stack.pop();

    std::optional<double> member;
    if (target.holds<value::EnumPtr>()) {
        member = target.as<value::EnumPtr>()->find(name);
    }
    else if (target.holds<value::NativeEnumPtr>()) {
        member = target.as<value::NativeEnumPtr>()->find(name);
    }
    else {
        throw RuntimeError(std::format("Can only read members from namespaces, got '{}'.", target.get_type()));
    }

    if (!member.has_value()) {
        throw RuntimeError(std::format("{} has no member '{}'.", target, name));
    }
    m_stack.push(Value::number(member.value()));
}

auto VirtualMachine::set_global(const std::string & name, bool define) -> void
{
    auto it = m_globals.find(name);
    if (define) {
        it = m_globals.insert_or_assign(name, m_stack.pop()).first;
    }
    else {
        if (it == m_globals.end()) {
            throw RuntimeError(std::format("Undefined variable '{}'.", name));
        }
        it->second = m_stack.peek();
    }

    if (m_hooks.on_variable_changed) {
        m_hooks.on_variable_changed(name, it->second);
    }
}

auto VirtualMachine::perform(Action action, Byte instruction) -> void
{
    if (m_hooks.on_action) {
        m_hooks.on_action(action);
    }
    else {
        m_hooks.on_unknown_opcode(instruction);
    }
}

auto VirtualMachine::trace(const CallFrame & frame) -> void
{
    std::ostringstream out;
    print_stack(out, m_stack.window(frame.bottom));
    disassemble_instruction(out, frame.ip.chunk(), frame.ip.at());
    emit_lines(m_hooks.output, out.str());
}

auto VirtualMachine::report_runtime_error(std::string_view message) -> void
{
    m_hooks.error(message);

    for (const auto & frame : std::views::reverse(m_frames)) {
        m_hooks.error(std::format("[line {} in {}]", frame.ip.location().line, frame_name(frame)));
    }

    reset();
}

auto VirtualMachine::reset() -> void
{
    m_frames.clear();
    m_stack.clear();
}

} // namespace pal
