// Map-stage predicate: compiled conjunction over JSON documents

#include <gtest/gtest.h>
#include <cmath>
#include <nlohmann/json.hpp>

#include "query/predicate.h"

using namespace multiquery;
using json = nlohmann::json;

TEST(PredicateTest, EmptyPredicateMatchesEverything) {
    Predicate p = Predicate::compile({});
    EXPECT_TRUE(p.alwaysTrue());
    EXPECT_EQ(p.toString(), "true");
    EXPECT_TRUE(p.matches(json::object()));
    EXPECT_TRUE(p(json{{"anything", 1}}));
}

TEST(PredicateTest, ConditionsAreAndCombined) {
    Predicate p = Predicate::compile({
        Filter{"name", "==", std::string("Sreejith")},
        Filter{"age", "<", int64_t{50}},
    });
    EXPECT_EQ(p.toString(), "data.name == 'Sreejith' && data.age < 50");

    EXPECT_TRUE(p.matches(json{{"name", "Sreejith"}, {"age", 25}}));
    EXPECT_FALSE(p.matches(json{{"name", "Sreejith"}, {"age", 51}}));
    EXPECT_FALSE(p.matches(json{{"name", "Vishnu"}, {"age", 31}}));
}

TEST(PredicateTest, StrictOperatorsAreExact) {
    json doc{{"age", 30}};
    EXPECT_FALSE(Predicate::compile({Filter{"age", ">", int64_t{30}}}).matches(doc));
    EXPECT_TRUE(Predicate::compile({Filter{"age", ">=", int64_t{30}}}).matches(doc));
    EXPECT_FALSE(Predicate::compile({Filter{"age", "<", int64_t{30}}}).matches(doc));
    EXPECT_TRUE(Predicate::compile({Filter{"age", "<=", int64_t{30}}}).matches(doc));
}

TEST(PredicateTest, MissingFieldNeverMatches) {
    json doc{{"name", "Vishnu"}};
    EXPECT_FALSE(Predicate::compile({Filter{"age", "<", int64_t{50}}}).matches(doc));
    EXPECT_FALSE(Predicate::compile({Filter{"age", ">=", int64_t{0}}}).matches(doc));
}

TEST(PredicateTest, TextComparesLexicographically) {
    json doc{{"name", "Sreejith"}};
    EXPECT_TRUE(Predicate::compile({Filter{"name", ">", std::string("M")}}).matches(doc));
    EXPECT_FALSE(Predicate::compile({Filter{"name", "<", std::string("M")}}).matches(doc));
    EXPECT_FALSE(Predicate::compile({Filter{"name", "==", std::string("sreejith")}}).matches(doc));
}

TEST(PredicateTest, NumericStringsCompareAsNumbers) {
    EXPECT_TRUE(Predicate::compile({Filter{"age", "==", int64_t{25}}}).matches(json{{"age", "25"}}));
    EXPECT_TRUE(Predicate::compile({Filter{"age", "<", int64_t{50}}}).matches(json{{"age", " 7 "}}));
    EXPECT_FALSE(Predicate::compile({Filter{"age", "<", int64_t{50}}}).matches(json{{"age", "abc"}}));
}

TEST(PredicateTest, NullIsNeverEqual) {
    json doc{{"age", nullptr}};
    EXPECT_FALSE(Predicate::compile({Filter{"age", "==", int64_t{0}}}).matches(doc));
    EXPECT_TRUE(Predicate::compile({Filter{"age", "<", int64_t{1}}}).matches(doc));
}

TEST(PredicateTest, DottedPathsResolveNestedFields) {
    json doc{{"address", {{"city", "Kochi"}, {"zip", 682001}}}};
    EXPECT_TRUE(Predicate::compile({Filter{"address.city", "==", std::string("Kochi")}}).matches(doc));
    EXPECT_TRUE(Predicate::compile({Filter{"address.zip", ">", int64_t{600000}}}).matches(doc));
    EXPECT_FALSE(Predicate::compile({Filter{"address.street", "==", std::string("x")}}).matches(doc));

    EXPECT_EQ(Predicate::resolveField(doc, "address.city.name"), nullptr);
    ASSERT_NE(Predicate::resolveField(doc, "address"), nullptr);
}

TEST(PredicateTest, LiteralsCannotInjectIntoExpression) {
    const std::string hostile = "x' || true || '";
    Predicate p = Predicate::compile({Filter{"name", "==", hostile}});
    EXPECT_FALSE(p.matches(json{{"name", "Sreejith"}}));
    EXPECT_TRUE(p.matches(json{{"name", hostile}}));
    EXPECT_EQ(p.toString(), "data.name == 'x\\' || true || \\''");
}

TEST(PredicateTest, CompileRejectsUnsupportedOperator) {
    try {
        Predicate::compile({Filter{"age", "<", int64_t{1}}, Filter{"age", "<>", int64_t{2}}});
        FAIL() << "expected InvalidOperatorException";
    } catch (const InvalidOperatorException& e) {
        EXPECT_EQ(e.op(), "<>");
    }
}

TEST(PredicateTest, ToNumberCoercion) {
    EXPECT_DOUBLE_EQ(Predicate::toNumber(json(3.5)), 3.5);
    EXPECT_DOUBLE_EQ(Predicate::toNumber(json(true)), 1.0);
    EXPECT_DOUBLE_EQ(Predicate::toNumber(json(nullptr)), 0.0);
    EXPECT_DOUBLE_EQ(Predicate::toNumber(json("")), 0.0);
    EXPECT_DOUBLE_EQ(Predicate::toNumber(json("-12")), -12.0);
    EXPECT_TRUE(std::isnan(Predicate::toNumber(json::array())));
    EXPECT_TRUE(std::isnan(Predicate::toNumber(json("12abc"))));
}

TEST(PredicateTest, FractionalLiteralsCompareNumerically) {
    Predicate p = Predicate::compile({Filter{"score", ">", 2.5}});
    EXPECT_EQ(p.toString(), "data.score > 2.5");
    EXPECT_TRUE(p.matches(json{{"score", 3}}));
    EXPECT_TRUE(p.matches(json{{"score", 2.75}}));
    EXPECT_TRUE(p.matches(json{{"score", "2.6"}}));
    EXPECT_FALSE(p.matches(json{{"score", 2}}));
    EXPECT_FALSE(p.matches(json{{"score", 2.5}}));

    EXPECT_TRUE(Predicate::compile({Filter{"score", "==", 2.0}}).matches(json{{"score", 2}}));
}
