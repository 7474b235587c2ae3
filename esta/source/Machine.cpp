#include <esta/Machine.hpp>

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <liberror/Try.hpp>

#include <cstdio>
#include <limits>
#include <new>

using namespace liberror;

namespace {

constexpr bool to_bool(Word value)
{
    return value == 1;
}

constexpr Word to_word(bool condition)
{
    return condition ? 1 : 0;
}

}

template <class T>
Result<T> Machine::raise(Fault fault, std::string_view detail)
{
    state_ = State::FAULTED;
    fault_ = fault;

    return make_error("{} at instruction {}: {}", magic_enum::enum_name(fault), programCounter_ - 1, detail);
}

Result<Instruction> Machine::fetch()
{
    if (programCounter_ >= program_.size())
    {
        state_ = State::FAULTED;
        fault_ = Fault::OUT_OF_RANGE_FETCH;

        return make_error("{}: tried to fetch instruction {} of a {} instruction program",
            magic_enum::enum_name(Fault::OUT_OF_RANGE_FETCH), programCounter_, program_.size());
    }

    return program_.at(programCounter_++);
}

void Machine::push(Word value)
{
    stack_.push_back(value);
}

Result<Word> Machine::pop()
{
    if (stack_.empty())
    {
        return raise<Word>(Fault::STACK_UNDERFLOW, "operand stack was empty");
    }

    auto value = stack_.back();
    stack_.pop_back();

    return value;
}

Result<size_t> Machine::address(Word value)
{
    if (value < 0 || static_cast<size_t>(value) >= memory_.max_size())
    {
        return raise<size_t>(Fault::INVALID_ADDRESS, fmt::format("{} is not a valid address", value));
    }

    return static_cast<size_t>(value);
}

Result<void> Machine::grow(std::vector<Word>& region, size_t size)
{
    try
    {
        region.resize(size, 0);
    }
    catch (std::bad_alloc const&)
    {
        return raise(Fault::OUT_OF_MEMORY, fmt::format("cannot grow to {} words", size));
    }

    return {};
}

Result<void> Machine::load()
{
    auto location = TRY(address(TRY(pop())));

    if (location >= memory_.size())
    {
        TRY(grow(memory_, location + 1));
    }

    push(memory_.at(location));

    return {};
}

Result<void> Machine::store()
{
    auto location = TRY(address(TRY(pop())));

    if (stack_.empty())
    {
        return raise(Fault::STACK_UNDERFLOW, "nothing left to store");
    }

    if (location >= memory_.size())
    {
        TRY(grow(memory_, location + 1));
    }

    memory_.at(location) = stack_.back();

    return {};
}

Result<void> Machine::allocate()
{
    auto length = TRY(pop());

    if (length < 0 || static_cast<size_t>(length) > heap_.max_size() - heap_.size())
    {
        return raise(Fault::INVALID_ADDRESS, fmt::format("cannot allocate {} words", length));
    }

    auto base = heap_.size();
    TRY(grow(heap_, base + static_cast<size_t>(length)));
    push(static_cast<Word>(base));

    return {};
}

Result<void> Machine::jump(Word target)
{
    if (target < 0)
    {
        return raise(Fault::OUT_OF_RANGE_FETCH, fmt::format("jump to negative target {}", target));
    }

    programCounter_ = static_cast<size_t>(target);

    return {};
}

Result<void> Machine::arithmetic(Opcode opcode)
{
    auto rhs = TRY(pop());
    auto lhs = TRY(pop());

    Word result {};

    switch (opcode)
    {
    case Opcode::ADD: {
        if (__builtin_add_overflow(lhs, rhs, &result))
            return raise(Fault::ARITHMETIC_OVERFLOW, fmt::format("{} + {}", lhs, rhs));
        break;
    }
    case Opcode::SUB: {
        if (__builtin_sub_overflow(lhs, rhs, &result))
            return raise(Fault::ARITHMETIC_OVERFLOW, fmt::format("{} - {}", lhs, rhs));
        break;
    }
    case Opcode::MUL: {
        if (__builtin_mul_overflow(lhs, rhs, &result))
            return raise(Fault::ARITHMETIC_OVERFLOW, fmt::format("{} * {}", lhs, rhs));
        break;
    }
    case Opcode::DIV:
    case Opcode::MOD: {
        if (rhs == 0)
        {
            return raise(Fault::DIVISION_BY_ZERO, fmt::format("{} {} 0", lhs, opcode == Opcode::DIV ? '/' : '%'));
        }

        if (lhs == std::numeric_limits<Word>::min() && rhs == -1)
        {
            return raise(Fault::ARITHMETIC_OVERFLOW, fmt::format("{} {} -1", lhs, opcode == Opcode::DIV ? '/' : '%'));
        }

        result = opcode == Opcode::DIV ? lhs / rhs : lhs % rhs;
        break;
    }
    default:
        return make_error("{} is not an arithmetic instruction", magic_enum::enum_name(opcode));
    }

    push(result);

    return {};
}

Result<void> Machine::logical(Opcode opcode)
{
    auto rhs = to_bool(TRY(pop()));
    auto lhs = to_bool(TRY(pop()));

    switch (opcode)
    {
    case Opcode::AND: push(to_word(lhs && rhs)); return {};
    case Opcode::OR:  push(to_word(lhs || rhs)); return {};
    default: break;
    }

    return make_error("{} is not a logical instruction", magic_enum::enum_name(opcode));
}

Result<void> Machine::compare(Opcode opcode)
{
    auto rhs = TRY(pop());
    auto lhs = TRY(pop());

    switch (opcode)
    {
    case Opcode::EQ:  push(to_word(lhs == rhs)); return {};
    case Opcode::NEQ: push(to_word(lhs != rhs)); return {};
    case Opcode::LE:  push(to_word(lhs < rhs));  return {};
    case Opcode::LEQ: push(to_word(lhs <= rhs)); return {};
    case Opcode::GE:  push(to_word(lhs > rhs));  return {};
    case Opcode::GEQ: push(to_word(lhs >= rhs)); return {};
    default: break;
    }

    return make_error("{} is not a comparison instruction", magic_enum::enum_name(opcode));
}

Result<void> Machine::negate()
{
    auto value = TRY(pop());

    if (value == std::numeric_limits<Word>::min())
    {
        return raise(Fault::ARITHMETIC_OVERFLOW, fmt::format("-({})", value));
    }

    push(-value);

    return {};
}

Result<void> Machine::invert()
{
    push(to_word(!to_bool(TRY(pop()))));
    return {};
}

void Machine::dump(Instruction const& instruction) const
{
    fmt::print(stderr, "{:>3} {:<8} [{}]\t[{}]\n",
        programCounter_, fmt::format("{}", instruction), fmt::join(stack_, ", "), fmt::join(memory_, ", "));
}

Result<void> Machine::execute(Instruction const& instruction)
{
    if (!well_formed(instruction))
    {
        return raise(Fault::MALFORMED_INSTRUCTION,
            fmt::format("{} {} an immediate operand", magic_enum::enum_name(instruction.opcode),
                traits(instruction.opcode).immediate ? "requires" : "does not take"));
    }

    if (auto depth = static_cast<size_t>(traits(instruction.opcode).depth); stack_.size() < depth)
    {
        return raise(Fault::STACK_UNDERFLOW,
            fmt::format("{} needs {} operands but the stack holds {}", magic_enum::enum_name(instruction.opcode), depth, stack_.size()));
    }

    switch (instruction.opcode)
    {
    case Opcode::LOADC: {
        push(instruction.immediate.value());
        break;
    }
    case Opcode::LOAD: {
        TRY(load());
        break;
    }
    case Opcode::STORE: {
        TRY(store());
        break;
    }
    case Opcode::POP: {
        TRY(pop());
        break;
    }
    case Opcode::NEW: {
        TRY(allocate());
        break;
    }
    case Opcode::JUMP: {
        TRY(jump(instruction.immediate.value()));
        break;
    }
    case Opcode::JUMPZ: {
        if (TRY(pop()) == 0)
        {
            TRY(jump(instruction.immediate.value()));
        }
        break;
    }
    case Opcode::HALT: {
        state_ = State::HALTED;
        break;
    }
    case Opcode::ADD:
    case Opcode::SUB:
    case Opcode::MUL:
    case Opcode::DIV:
    case Opcode::MOD: {
        TRY(arithmetic(instruction.opcode));
        break;
    }
    case Opcode::AND:
    case Opcode::OR: {
        TRY(logical(instruction.opcode));
        break;
    }
    case Opcode::EQ:
    case Opcode::NEQ:
    case Opcode::LE:
    case Opcode::LEQ:
    case Opcode::GE:
    case Opcode::GEQ: {
        TRY(compare(instruction.opcode));
        break;
    }
    case Opcode::NEG: {
        TRY(negate());
        break;
    }
    case Opcode::NOT: {
        TRY(invert());
        break;
    }
    }

    return {};
}

Result<void> Machine::run()
{
    if (state_ != State::RUNNING)
    {
        return make_error("Machine already {}", state_ == State::HALTED ? "halted" : "faulted");
    }

    while (state_ == State::RUNNING)
    {
        auto instruction = TRY(fetch());

        if (trace_)
        {
            dump(instruction);
        }

        TRY(execute(instruction));
    }

    return {};
}

std::string format_state(Machine const& machine)
{
    return fmt::format("stack:  [{}]\nmemory: [{}]\nheap:   [{}]\n",
        fmt::join(machine.stack(), ", "), fmt::join(machine.memory(), ", "), fmt::join(machine.heap(), ", "));
}
