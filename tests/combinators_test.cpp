#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <vector>

#include "imp/combinators.hpp"

using namespace imp;
using namespace imp::pc;

namespace {

token_list toks(std::initializer_list<token> ts){ return token_list(ts); }

token kw(const char* t){ return make_token(token_tag::reserved, t); }
token num(const char* t){ return make_token(token_tag::integer, t); }
token ident(const char* t){ return make_token(token_tag::identifier, t); }

// nested := '(' nested ')' | 'x' ; yields nesting depth
parser<int> nested(){
    auto wrapped = map(sequence(sequence(keyword("("), lazy(&nested)), keyword(")")),
                       [](const std::pair<std::pair<std::string, int>, std::string>& parsed){ return parsed.first.second + 1; });
    auto leaf = map(keyword("x"), [](const std::string&){ return 0; });
    return alternate(wrapped, leaf);
}

} // namespace

TEST(Combinators, LiteralMatchesTextAndTag){
    auto tokens = toks({kw("if"), ident("if")});
    auto p = literal("if", token_tag::reserved);
    auto r = p(tokens, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->value, "if");
    EXPECT_EQ(r->pos, 1u);
    // same text, different tag
    EXPECT_FALSE(p(tokens, 1));
    // end of input
    EXPECT_FALSE(p(tokens, 2));
}

TEST(Combinators, TagMatchesCategory){
    auto tokens = toks({num("42"), ident("x")});
    auto p = tag(token_tag::integer);
    auto r = p(tokens, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->value, "42");
    EXPECT_FALSE(p(tokens, 1));
    EXPECT_FALSE(p(token_list{}, 0));
}

TEST(Combinators, SequencePairsValuesAndFailsAsAWhole){
    auto tokens = toks({ident("x"), kw(":="), num("1")});
    auto p = sequence(tag(token_tag::identifier), keyword(":="));
    auto r = p(tokens, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->value.first, "x");
    EXPECT_EQ(r->value.second, ":=");
    EXPECT_EQ(r->pos, 2u);

    auto bad = sequence(tag(token_tag::identifier), keyword(";"));
    EXPECT_FALSE(bad(tokens, 0));
}

TEST(Combinators, AlternateIsOrderedChoice){
    auto tokens = toks({kw("<"), kw("=")});
    auto first = map(keyword("<"), [](const std::string&){ return 1; });
    auto second = map(keyword("<"), [](const std::string&){ return 2; });
    auto r = alternate(first, second)(tokens, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->value, 1);

    // second alternative restarts at the original position
    auto p = alternate(map(sequence(keyword("<"), keyword("<")), [](const auto&){ return 1; }),
                       map(keyword("<"), [](const std::string&){ return 2; }));
    auto r2 = p(tokens, 0);
    ASSERT_TRUE(r2);
    EXPECT_EQ(r2->value, 2);
    EXPECT_EQ(r2->pos, 1u);
}

TEST(Combinators, MapTransformsWithoutMovingPosition){
    auto tokens = toks({num("7")});
    auto p = map(tag(token_tag::integer), [](const std::string& s){ return std::stoi(s) * 2; });
    auto r = p(tokens, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->value, 14);
    EXPECT_EQ(r->pos, 1u);
}

TEST(Combinators, TryMapRejectsWithEmptyOptional){
    auto tokens = toks({num("7"), num("8")});
    auto evenOnly = try_map(tag(token_tag::integer), [](const std::string& s) -> std::optional<int> {
        int v = std::stoi(s);
        if(v % 2) return std::nullopt;
        return v;
    });
    EXPECT_FALSE(evenOnly(tokens, 0));
    auto r = evenOnly(tokens, 1);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->value, 8);
}

TEST(Combinators, RepeatCollectsZeroOrMore){
    auto tokens = toks({ident("a"), ident("b"), num("1")});
    auto p = repeat(tag(token_tag::identifier));
    auto r = p(tokens, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->value, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(r->pos, 2u);

    auto none = p(tokens, 2);
    ASSERT_TRUE(none);
    EXPECT_TRUE(none->value.empty());
    EXPECT_EQ(none->pos, 2u);
}

TEST(Combinators, RepeatStopsOnZeroWidthMatch){
    auto tokens = toks({ident("a")});
    // optional(...) always succeeds; at a non-matching token it consumes nothing.
    auto p = repeat(pc::optional(keyword(";")));
    auto r = p(tokens, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->value.size(), 1u);
    EXPECT_EQ(r->pos, 0u);
}

TEST(Combinators, OptionalNeverFails){
    auto tokens = toks({kw("else")});
    auto p = pc::optional(keyword("else"));
    auto hit = p(tokens, 0);
    ASSERT_TRUE(hit);
    ASSERT_TRUE(hit->value);
    EXPECT_EQ(*hit->value, "else");
    EXPECT_EQ(hit->pos, 1u);

    auto miss = p(tokens, 1);
    ASSERT_TRUE(miss);
    EXPECT_FALSE(miss->value);
    EXPECT_EQ(miss->pos, 1u);
}

TEST(Combinators, PhraseRequiresFullConsumption){
    auto tokens = toks({num("1"), num("2")});
    auto one = phrase(tag(token_tag::integer));
    EXPECT_FALSE(one(tokens, 0));
    EXPECT_TRUE(one(tokens, 1));
    auto both = phrase(repeat(tag(token_tag::integer)));
    EXPECT_TRUE(both(tokens, 0));
}

TEST(Combinators, LazyResolvesOnceOnFirstUse){
    std::atomic<int> builds{0};
    auto p = lazy([&builds]{ ++builds; return tag(token_tag::integer); });
    EXPECT_EQ(builds.load(), 0);
    auto tokens = toks({num("1"), num("2")});
    EXPECT_TRUE(p(tokens, 0));
    EXPECT_TRUE(p(tokens, 1));
    EXPECT_FALSE(p(tokens, 2));
    EXPECT_EQ(builds.load(), 1);
}

TEST(Combinators, LazyAllowsRecursiveRules){
    auto tokens = toks({kw("("), kw("("), kw("x"), kw(")"), kw(")")});
    auto r = phrase(nested())(tokens, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->value, 2);
    auto unbalanced = toks({kw("("), kw("x")});
    EXPECT_FALSE(phrase(nested())(unbalanced, 0));
}

TEST(Combinators, FailureLeavesCallerPositionUsable){
    // A failed parser reports nothing; the same object can be retried at any position.
    auto tokens = toks({ident("a"), kw(":="), num("1")});
    auto p = sequence(sequence(tag(token_tag::identifier), keyword(":=")), tag(token_tag::integer));
    EXPECT_FALSE(p(tokens, 1));
    auto r = p(tokens, 0);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->pos, 3u);
}

TEST(Combinators, EmptyParserThrows){
    parser<int> empty;
    EXPECT_FALSE(static_cast<bool>(empty));
    EXPECT_THROW(empty(token_list{}, 0), std::logic_error);
}
