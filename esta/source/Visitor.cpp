#include <esta/Visitor.hpp>

void walk_stmt(Visitor& visitor, Stmt const& stmt)
{
    std::visit(Overload {
        [&] (Block const& block) {
            for (auto const& statement : block.statements)
                visitor.visit_stmt(*statement);
        },
        [&] (While const& loop) {
            visitor.visit_expr(*loop.test);
            visitor.visit_stmt(*loop.body);
        },
        [&] (If const& branch) {
            visitor.visit_expr(*branch.test);
            visitor.visit_stmt(*branch.body);
            if (branch.alternative) visitor.visit_stmt(*branch.alternative);
        },
        [&] (Return const& ret) {
            if (ret.value) visitor.visit_expr(*ret.value);
        },
        [&] (Declaration const& declaration) {
            visitor.visit_expr(*declaration.value);
        },
        [&] (FunDecl const& function) {
            for (auto const& parameter : function.parameters)
                visitor.visit_expr(*parameter);
            visitor.visit_stmt(*function.body);
        },
        [&] (Assignment const& assignment) {
            visitor.visit_expr(*assignment.target);
            visitor.visit_expr(*assignment.value);
        },
        // TODO: desugar into a While once the loop bounds have settled semantics
        [&] (For const&) {}
    }, stmt.stmt);
}

void walk_expr(Visitor& visitor, ExprNode const& expr)
{
    std::visit(Overload {
        [&] (Identifier const&) {},
        [&] (Literal const&) {},
        [&] (BinaryOp const& binary) {
            visitor.visit_expr(*binary.lhs);
            visitor.visit_expr(*binary.rhs);
        },
        [&] (UnaryOp const& unary) {
            visitor.visit_expr(*unary.rhs);
        },
        // arguments are left to the pass, calls have no lowering yet
        [&] (FunCall const&) {}
    }, expr.expr);
}
