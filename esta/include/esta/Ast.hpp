#pragma once

#include <esta/Instruction.hpp>

#include <memory>
#include <string>
#include <variant>
#include <vector>

enum class BinaryOperator { ADD, SUB, MUL, DIV, MOD, AND, OR, EQ, NEQ, LT, LEQ, GT, GEQ };
enum class UnaryOperator { NEG, NOT };

struct ExprNode;
struct Stmt;

using ExprPtr = std::unique_ptr<ExprNode>;
using StmtPtr = std::unique_ptr<Stmt>;

struct Identifier { std::string name; };
struct Literal { Word value; };
struct BinaryOp { ExprPtr lhs; BinaryOperator op; ExprPtr rhs; };
struct UnaryOp { UnaryOperator op; ExprPtr rhs; };
struct FunCall { std::string name; std::vector<ExprPtr> arguments; };

using Expr = std::variant<Identifier, Literal, BinaryOp, UnaryOp, FunCall>;

struct ExprNode
{
    Expr expr;
};

struct Block { std::vector<StmtPtr> statements; };
struct While { ExprPtr test; StmtPtr body; };
struct If { ExprPtr test; StmtPtr body; StmtPtr alternative; };
struct Return { ExprPtr value; };
struct Declaration { std::string name; ExprPtr value; };
struct FunDecl { std::string name; std::vector<ExprPtr> parameters; std::string returns; StmtPtr body; };
struct Assignment { ExprPtr target; ExprPtr value; };
struct For { std::string variable; ExprPtr from; ExprPtr to; StmtPtr body; };

struct Stmt
{
    std::variant<Block, While, If, Return, Declaration, FunDecl, Assignment, For> stmt;
};

// builders, mostly for tests and hand written trees

inline ExprPtr make_literal(Word value)
{
    return std::make_unique<ExprNode>(ExprNode { Literal { value } });
}

inline ExprPtr make_identifier(std::string name)
{
    return std::make_unique<ExprNode>(ExprNode { Identifier { std::move(name) } });
}

inline ExprPtr make_binary(ExprPtr lhs, BinaryOperator op, ExprPtr rhs)
{
    return std::make_unique<ExprNode>(ExprNode { BinaryOp { std::move(lhs), op, std::move(rhs) } });
}

inline ExprPtr make_unary(UnaryOperator op, ExprPtr rhs)
{
    return std::make_unique<ExprNode>(ExprNode { UnaryOp { op, std::move(rhs) } });
}

template <class ... Args>
ExprPtr make_call(std::string name, Args&& ... arguments)
{
    FunCall call { std::move(name), {} };
    (call.arguments.push_back(std::forward<Args>(arguments)), ...);
    return std::make_unique<ExprNode>(ExprNode { std::move(call) });
}

template <class T>
StmtPtr make_stmt(T&& stmt)
{
    return std::make_unique<Stmt>(Stmt { std::forward<T>(stmt) });
}

template <class ... Args>
StmtPtr make_block(Args&& ... statements)
{
    Block block {};
    (block.statements.push_back(std::forward<Args>(statements)), ...);
    return make_stmt(std::move(block));
}
