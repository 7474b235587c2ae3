#include <gtest/gtest.h>

#include <esta/Lowering.hpp>
#include <esta/Machine.hpp>

#include <vector>

namespace {

liberror::Result<std::vector<Instruction>> lower(StmtPtr const& tree)
{
    Lowering lowering;
    return lowering.lower(*tree);
}

ExprPtr var(char const* name) { return make_identifier(name); }
ExprPtr lit(Word value) { return make_literal(value); }

}

TEST(LoweringTests, ExpressionKeepsOperandOrder)
{
    // return 10 - 4 * 2
    auto tree = make_stmt(Return {
        make_binary(lit(10), BinaryOperator::SUB, make_binary(lit(4), BinaryOperator::MUL, lit(2)))
    });

    auto program = lower(tree);
    ASSERT_TRUE(program.has_value()) << program.error().message();

    std::vector<Instruction> expected {
        make_instruction(Opcode::LOADC, 10),
        make_instruction(Opcode::LOADC, 4),
        make_instruction(Opcode::LOADC, 2),
        make_instruction(Opcode::MUL),
        make_instruction(Opcode::SUB),
        make_instruction(Opcode::HALT),
        make_instruction(Opcode::HALT),
    };

    EXPECT_EQ(program.value(), expected);

    Machine machine(program.value());
    ASSERT_TRUE(machine.run().has_value());
    EXPECT_EQ(machine.stack(), std::vector<Word>({ 2 }));
}

TEST(LoweringTests, WhileLoopSumsToTen)
{
    // i = 1; sum = 0; while (i <= 4) { sum = sum + i; i = i + 1; } return sum;
    auto tree = make_block(
        make_stmt(Declaration { "i", lit(1) }),
        make_stmt(Declaration { "sum", lit(0) }),
        make_stmt(While {
            make_binary(var("i"), BinaryOperator::LEQ, lit(4)),
            make_block(
                make_stmt(Assignment { var("sum"), make_binary(var("sum"), BinaryOperator::ADD, var("i")) }),
                make_stmt(Assignment { var("i"), make_binary(var("i"), BinaryOperator::ADD, lit(1)) })
            )
        }),
        make_stmt(Return { var("sum") })
    );

    auto program = lower(tree);
    ASSERT_TRUE(program.has_value()) << program.error().message();

    Machine machine(program.value());
    ASSERT_TRUE(machine.run().has_value());
    EXPECT_EQ(machine.stack(), std::vector<Word>({ 10 }));
    EXPECT_EQ(machine.memory(), std::vector<Word>({ 5, 10 }));
}

TEST(LoweringTests, IfTakesEitherBranch)
{
    for (auto const& [condition, expected] : { std::pair<Word, Word> { 1, 7 }, std::pair<Word, Word> { 0, 3 } })
    {
        auto tree = make_stmt(If {
            make_binary(lit(condition), BinaryOperator::EQ, lit(1)),
            make_stmt(Return { lit(7) }),
            make_stmt(Return { lit(3) })
        });

        auto program = lower(tree);
        ASSERT_TRUE(program.has_value()) << program.error().message();

        Machine machine(program.value());
        ASSERT_TRUE(machine.run().has_value());
        EXPECT_EQ(machine.stack(), std::vector<Word>({ expected }));
    }
}

TEST(LoweringTests, IfWithoutAlternativeFallsThrough)
{
    auto tree = make_block(
        make_stmt(Declaration { "x", lit(5) }),
        make_stmt(If {
            make_binary(var("x"), BinaryOperator::GT, lit(10)),
            make_stmt(Assignment { var("x"), lit(0) }),
            nullptr
        }),
        make_stmt(Return { make_unary(UnaryOperator::NEG, var("x")) })
    );

    auto program = lower(tree);
    ASSERT_TRUE(program.has_value()) << program.error().message();

    Machine machine(program.value());
    ASSERT_TRUE(machine.run().has_value());
    EXPECT_EQ(machine.stack(), std::vector<Word>({ -5 }));
}

TEST(LoweringTests, RejectsWhatItCannotLower)
{
    EXPECT_FALSE(lower(make_stmt(Return { var("missing") })).has_value());
    EXPECT_FALSE(lower(make_stmt(Assignment { var("missing"), lit(1) })).has_value());
    EXPECT_FALSE(lower(make_stmt(Assignment { lit(1), lit(1) })).has_value());
    EXPECT_FALSE(lower(make_stmt(Return { make_call("f") })).has_value());
    EXPECT_FALSE(lower(make_stmt(For { "i", lit(0), lit(1), make_block() })).has_value());
    EXPECT_FALSE(lower(make_stmt(FunDecl { "f", {}, "int", make_block() })).has_value());
    EXPECT_FALSE(lower(make_block(
        make_stmt(Declaration { "x", lit(1) }),
        make_stmt(Declaration { "x", lit(2) })
    )).has_value());
}

TEST(LoweringTests, FaultsSurfaceAtRunTime)
{
    auto tree = make_stmt(Return { make_binary(lit(1), BinaryOperator::DIV, lit(0)) });

    auto program = lower(tree);
    ASSERT_TRUE(program.has_value());

    Machine machine(program.value());
    EXPECT_FALSE(machine.run().has_value());
    EXPECT_EQ(machine.fault(), Fault::DIVISION_BY_ZERO);
}
