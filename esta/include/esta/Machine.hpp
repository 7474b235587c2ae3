#pragma once

#include <esta/Instruction.hpp>

#include <liberror/Result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Fault
{
    STACK_UNDERFLOW,
    OUT_OF_RANGE_FETCH,
    DIVISION_BY_ZERO,
    ARITHMETIC_OVERFLOW,
    INVALID_ADDRESS,
    OUT_OF_MEMORY,
    MALFORMED_INSTRUCTION
};

enum class State { RUNNING, HALTED, FAULTED };

class Machine
{
public:
    explicit Machine(std::vector<Instruction> program)
        : program_(std::move(program))
        , programCounter_()
        , stack_()
        , memory_()
        , heap_()
        , state_(State::RUNNING)
        , fault_()
        , trace_()
    {}

public:
    /*
     * Runs until HALT or the first fault. A machine runs once; calling this
     * again after it stopped returns an error and leaves the state as is.
     */
    liberror::Result<void> run();

    void trace(bool enabled) { trace_ = enabled; }

    std::vector<Word> const& stack() const { return stack_; }
    std::vector<Word> const& memory() const { return memory_; }
    std::vector<Word> const& heap() const { return heap_; }
    std::vector<Instruction> const& program() const { return program_; }
    size_t programCounter() const { return programCounter_; }
    State state() const { return state_; }
    std::optional<Fault> fault() const { return fault_; }

private:
    liberror::Result<Instruction> fetch();
    liberror::Result<void> execute(Instruction const& instruction);

    liberror::Result<void> load();
    liberror::Result<void> store();
    liberror::Result<void> allocate();
    liberror::Result<void> jump(Word target);
    liberror::Result<void> arithmetic(Opcode opcode);
    liberror::Result<void> logical(Opcode opcode);
    liberror::Result<void> compare(Opcode opcode);
    liberror::Result<void> negate();
    liberror::Result<void> invert();

    liberror::Result<Word> pop();
    liberror::Result<size_t> address(Word value);
    liberror::Result<void> grow(std::vector<Word>& region, size_t size);
    void push(Word value);

    template <class T = void>
    liberror::Result<T> raise(Fault fault, std::string_view detail);

    void dump(Instruction const& instruction) const;

private:
    std::vector<Instruction> program_;
    size_t programCounter_;

    std::vector<Word> stack_;
    std::vector<Word> memory_;
    std::vector<Word> heap_;

    State state_;
    std::optional<Fault> fault_;
    bool trace_;
};

// stack, memory and heap, one per line
std::string format_state(Machine const& machine);
