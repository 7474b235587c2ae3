#include <esta/Lowering.hpp>

#include <fmt/format.h>

using namespace liberror;

namespace {

class Declarations : public Visitor
{
public:
    void visit_stmt(Stmt const& stmt) override
    {
        if (auto declaration = std::get_if<Declaration>(&stmt.stmt))
        {
            if (!addresses.emplace(declaration->name, static_cast<Word>(addresses.size())).second)
            {
                duplicates.push_back(declaration->name);
            }
        }

        walk_stmt(*this, stmt);
    }

    std::map<std::string, Word> addresses;
    std::vector<std::string> duplicates;
};

constexpr Opcode to_opcode(BinaryOperator op)
{
    switch (op)
    {
    case BinaryOperator::ADD: return Opcode::ADD;
    case BinaryOperator::SUB: return Opcode::SUB;
    case BinaryOperator::MUL: return Opcode::MUL;
    case BinaryOperator::DIV: return Opcode::DIV;
    case BinaryOperator::MOD: return Opcode::MOD;
    case BinaryOperator::AND: return Opcode::AND;
    case BinaryOperator::OR:  return Opcode::OR;
    case BinaryOperator::EQ:  return Opcode::EQ;
    case BinaryOperator::NEQ: return Opcode::NEQ;
    case BinaryOperator::LT:  return Opcode::LE;
    case BinaryOperator::LEQ: return Opcode::LEQ;
    case BinaryOperator::GT:  return Opcode::GE;
    case BinaryOperator::GEQ: return Opcode::GEQ;
    }

    return Opcode::HALT;
}

constexpr Opcode to_opcode(UnaryOperator op)
{
    switch (op)
    {
    case UnaryOperator::NEG: return Opcode::NEG;
    case UnaryOperator::NOT: return Opcode::NOT;
    }

    return Opcode::HALT;
}

}

size_t Lowering::emit(Opcode opcode)
{
    program_.push_back(make_instruction(opcode));
    return program_.size() - 1;
}

size_t Lowering::emit(Opcode opcode, Word immediate)
{
    program_.push_back(make_instruction(opcode, immediate));
    return program_.size() - 1;
}

void Lowering::patch(size_t at, size_t target)
{
    program_.at(at).immediate = static_cast<Word>(target);
}

void Lowering::fail(std::string message)
{
    if (error_.empty())
    {
        error_ = std::move(message);
    }
}

void Lowering::store(std::string const& name)
{
    auto address = addresses_.find(name);

    if (address == addresses_.end())
    {
        fail(fmt::format("assignment to undeclared variable '{}'", name));
        return;
    }

    emit(Opcode::LOADC, address->second);
    emit(Opcode::STORE);
    emit(Opcode::POP);
}

void Lowering::visit_stmt(Stmt const& stmt)
{
    if (!error_.empty()) return;

    std::visit(Overload {
        [&] (Block const&) {
            walk_stmt(*this, stmt);
        },
        [&] (While const& loop) {
            auto begin = program_.size();
            visit_expr(*loop.test);
            auto exit = emit(Opcode::JUMPZ, 0);
            visit_stmt(*loop.body);
            emit(Opcode::JUMP, static_cast<Word>(begin));
            patch(exit, program_.size());
        },
        [&] (If const& branch) {
            visit_expr(*branch.test);
            auto otherwise = emit(Opcode::JUMPZ, 0);
            visit_stmt(*branch.body);

            if (!branch.alternative)
            {
                patch(otherwise, program_.size());
                return;
            }

            auto end = emit(Opcode::JUMP, 0);
            patch(otherwise, program_.size());
            visit_stmt(*branch.alternative);
            patch(end, program_.size());
        },
        [&] (Return const& ret) {
            if (ret.value) visit_expr(*ret.value);
            emit(Opcode::HALT);
        },
        [&] (Declaration const& declaration) {
            visit_expr(*declaration.value);
            store(declaration.name);
        },
        [&] (FunDecl const& function) {
            fail(fmt::format("function '{}' cannot be lowered", function.name));
        },
        [&] (Assignment const& assignment) {
            auto target = std::get_if<Identifier>(&assignment.target->expr);

            if (target == nullptr)
            {
                fail("only variables can be assigned to");
                return;
            }

            visit_expr(*assignment.value);
            store(target->name);
        },
        [&] (For const&) {
            fail("for loops cannot be lowered");
        }
    }, stmt.stmt);
}

void Lowering::visit_expr(ExprNode const& expr)
{
    if (!error_.empty()) return;

    std::visit(Overload {
        [&] (Identifier const& identifier) {
            auto address = addresses_.find(identifier.name);

            if (address == addresses_.end())
            {
                fail(fmt::format("use of undeclared variable '{}'", identifier.name));
                return;
            }

            emit(Opcode::LOADC, address->second);
            emit(Opcode::LOAD);
        },
        [&] (Literal const& literal) {
            emit(Opcode::LOADC, literal.value);
        },
        [&] (BinaryOp const& binary) {
            walk_expr(*this, expr);
            emit(to_opcode(binary.op));
        },
        [&] (UnaryOp const& unary) {
            walk_expr(*this, expr);
            emit(to_opcode(unary.op));
        },
        [&] (FunCall const& call) {
            fail(fmt::format("call to '{}' cannot be lowered", call.name));
        }
    }, expr.expr);
}

Result<std::vector<Instruction>> Lowering::lower(Stmt const& root)
{
    program_.clear();
    error_.clear();

    Declarations declarations;
    declarations.visit_stmt(root);

    if (!declarations.duplicates.empty())
    {
        return make_error("variable '{}' was declared twice", declarations.duplicates.front());
    }

    addresses_ = std::move(declarations.addresses);

    visit_stmt(root);
    emit(Opcode::HALT);

    if (!error_.empty())
    {
        return make_error("{}", error_);
    }

    return std::move(program_);
}
