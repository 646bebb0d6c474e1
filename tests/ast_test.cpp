#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "imp/ast.hpp"

using namespace imp;

TEST(Ast, StructuralEquality){
    auto a = make_binop("+", make_int(1), make_var("x"));
    auto b = make_binop("+", make_int(1), make_var("x"));
    auto c = make_binop("-", make_int(1), make_var("x"));
    EXPECT_TRUE(equal(a, b));
    EXPECT_FALSE(equal(a, c));
    EXPECT_FALSE(equal(make_int(1), make_var("x")));
    EXPECT_TRUE(equal(aexp_ptr{}, aexp_ptr{}));
    EXPECT_FALSE(equal(a, aexp_ptr{}));
}

TEST(Ast, IfWithAndWithoutElseDiffer){
    auto cond = make_relop("<", make_var("x"), make_int(2));
    auto thenS = make_assign("y", make_int(1));
    auto withElse = make_if(cond, thenS, make_assign("y", make_int(0)));
    auto noElse = make_if(cond, thenS);
    EXPECT_FALSE(equal(withElse, noElse));
    EXPECT_TRUE(equal(noElse, make_if(make_relop("<", make_var("x"), make_int(2)), make_assign("y", make_int(1)))));
}

TEST(Ast, BooleanNodes){
    auto r = make_relop("=", make_var("a"), make_int(0));
    EXPECT_TRUE(equal(make_not(r), make_not(make_relop("=", make_var("a"), make_int(0)))));
    EXPECT_FALSE(equal(make_and(r, r), make_or(r, r)));
    EXPECT_FALSE(equal(make_relop("<", make_var("a"), make_int(0)), make_relop("<=", make_var("a"), make_int(0))));
}

TEST(Ast, RendersSExpressions){
    EXPECT_EQ(to_string(make_binop("+", make_binop("*", make_int(2), make_int(3)), make_int(4))), "(+ (* 2 3) 4)");
    EXPECT_EQ(to_string(make_int(-5)), "-5");
    auto cond = make_and(make_relop("<", make_var("x"), make_int(2)), make_not(make_relop("=", make_var("y"), make_int(0))));
    EXPECT_EQ(to_string(cond), "(and (< x 2) (not (= y 0)))");
    auto prog = make_compound(make_assign("x", make_int(1)),
                              make_while(make_relop(">", make_var("x"), make_int(0)), make_assign("x", make_int(0))));
    EXPECT_EQ(to_string(prog), "(do (:= x 1) (while (> x 0) (:= x 0)))");
    EXPECT_EQ(to_string(make_if(make_relop("!=", make_var("x"), make_int(1)), make_assign("x", make_int(1)))),
              "(if (!= x 1) (:= x 1) nil)");
    EXPECT_EQ(to_string(stmt_ptr{}), "nil");
}

namespace {

// x := 1; x := 1; ... folded left, the shape the parser produces for a flat program.
stmt_ptr long_sequence(std::size_t n){
    stmt_ptr acc = make_assign("x", make_int(1));
    for(std::size_t i = 1; i < n; ++i)
        acc = make_compound(std::move(acc), make_assign("x", make_int(1)));
    return acc;
}

} // namespace

TEST(Ast, FlattenSequenceFollowsExecutionOrder){
    auto prog = make_compound(make_compound(make_assign("a", make_int(1)), make_assign("b", make_int(2))),
                              make_compound(make_assign("c", make_int(3)), make_assign("d", make_int(4))));
    auto parts = flatten_sequence(prog);
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(to_string(parts[0]), "(:= a 1)");
    EXPECT_EQ(to_string(parts[3]), "(:= d 4)");
    auto single = make_assign("x", make_int(1));
    auto one = flatten_sequence(single);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0].get(), single.get());
}

TEST(Ast, LongStatementChainsPrintCompareAndRelease){
    const std::size_t n = 100000;
    auto a = long_sequence(n);
    auto b = long_sequence(n);
    EXPECT_TRUE(equal(a, b));
    EXPECT_FALSE(equal(a, long_sequence(n - 1)));
    auto text = to_string(a);
    EXPECT_EQ(text.compare(0, 12, "(do (do (do "), 0);
    EXPECT_EQ(text.size(), (n - 1) * std::string("(do  )").size() + n * std::string("(:= x 1)").size());
    EXPECT_EQ(flatten_sequence(a).size(), n);
    a.reset();
    b.reset();
}

TEST(Ast, SharedSubtreesSurviveRelease){
    auto tail = make_compound(make_assign("y", make_int(2)), make_assign("z", make_int(3)));
    {
        auto prog = make_compound(make_assign("x", make_int(1)), tail);
        auto loop = make_while(make_relop("<", make_var("x"), make_int(2)), tail);
    }
    EXPECT_EQ(to_string(tail), "(do (:= y 2) (:= z 3))");
}
