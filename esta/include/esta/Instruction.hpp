#pragma once

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

#include <cstdint>
#include <optional>
#include <vector>

using Word = int64_t;

enum class Opcode
{
    LOADC,
    LOAD,
    STORE,
    POP,
    NEW,
    JUMP,
    JUMPZ,
    HALT,
    ADD,
    SUB,
    MUL,
    DIV,
    MOD,
    AND,
    OR,
    EQ,
    NEQ,
    LE,
    LEQ,
    GE,
    GEQ,
    NEG,
    NOT
};

/*
 * depth: operands that must be on the stack before execution
 * pops/pushes: net effect on the stack
 * immediate: whether the instruction carries an embedded operand
 *
 * STORE requires two operands but pops only the address, the value stays.
 */
struct OpcodeTraits
{
    int depth;
    int pops;
    int pushes;
    bool immediate;
};

constexpr OpcodeTraits traits(Opcode opcode)
{
    switch (opcode)
    {
    case Opcode::LOADC: return { 0, 0, 1, true };
    case Opcode::LOAD:  return { 1, 1, 1, false };
    case Opcode::STORE: return { 2, 1, 0, false };
    case Opcode::POP:   return { 1, 1, 0, false };
    case Opcode::NEW:   return { 1, 1, 1, false };
    case Opcode::JUMP:  return { 0, 0, 0, true };
    case Opcode::JUMPZ: return { 1, 1, 0, true };
    case Opcode::HALT:  return { 0, 0, 0, false };
    case Opcode::NEG:
    case Opcode::NOT:   return { 1, 1, 1, false };
    case Opcode::ADD:
    case Opcode::SUB:
    case Opcode::MUL:
    case Opcode::DIV:
    case Opcode::MOD:
    case Opcode::AND:
    case Opcode::OR:
    case Opcode::EQ:
    case Opcode::NEQ:
    case Opcode::LE:
    case Opcode::LEQ:
    case Opcode::GE:
    case Opcode::GEQ:   return { 2, 2, 1, false };
    }

    return {};
}

struct Instruction
{
    Opcode opcode;
    std::optional<Word> immediate;

    bool operator==(Instruction const&) const = default;
};

inline Instruction make_instruction(Opcode opcode)
{
    return { opcode, std::nullopt };
}

inline Instruction make_instruction(Opcode opcode, Word immediate)
{
    return { opcode, immediate };
}

constexpr bool well_formed(Instruction const& instruction)
{
    return traits(instruction.opcode).immediate == instruction.immediate.has_value();
}

template <>
struct fmt::formatter<Instruction> : fmt::formatter<std::string_view>
{
    auto format(Instruction const& instruction, fmt::format_context& context) const
    {
        auto name = magic_enum::enum_name(instruction.opcode);

        if (instruction.immediate.has_value())
        {
            return fmt::format_to(context.out(), "{} {}", name, instruction.immediate.value());
        }

        return fmt::format_to(context.out(), "{}", name);
    }
};
