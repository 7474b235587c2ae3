#pragma once

#include <esta/Ast.hpp>

template <class ... T>
struct Overload : T ... { using T::operator()...; };

class Visitor;

void walk_stmt(Visitor& visitor, Stmt const& stmt);
void walk_expr(Visitor& visitor, ExprNode const& expr);

/*
 * Walks the tree. The defaults recurse into every child through walk_stmt and
 * walk_expr, so a pass only overrides the nodes it cares about and hands the
 * rest back to the walk functions.
 */
class Visitor
{
public:
    virtual ~Visitor() = default;

    virtual void visit_stmt(Stmt const& stmt) { walk_stmt(*this, stmt); }
    virtual void visit_expr(ExprNode const& expr) { walk_expr(*this, expr); }
};
