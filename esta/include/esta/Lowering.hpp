#pragma once

#include <esta/Instruction.hpp>
#include <esta/Visitor.hpp>

#include <liberror/Result.hpp>

#include <map>
#include <string>
#include <vector>

/*
 * Lowers a statement tree into a program for Machine.
 *
 * Every declared variable gets its own memory address, in declaration order,
 * before any code is emitted. Return leaves its value on the stack and halts,
 * and the program always ends in HALT. Functions, calls and For loops have no
 * lowering and are reported as errors.
 */
class Lowering : public Visitor
{
public:
    liberror::Result<std::vector<Instruction>> lower(Stmt const& root);

    void visit_stmt(Stmt const& stmt) override;
    void visit_expr(ExprNode const& expr) override;

private:
    size_t emit(Opcode opcode);
    size_t emit(Opcode opcode, Word immediate);
    void patch(size_t at, size_t target);
    void fail(std::string message);

    void store(std::string const& name);

private:
    std::vector<Instruction> program_;
    std::map<std::string, Word> addresses_;
    std::string error_;
};
