// Filter -> secondary index lookup translation

#include <gtest/gtest.h>
#include "query/index_lookup_translator.h"

using namespace multiquery;

namespace {
constexpr int64_t kBound = IndexLookupTranslator::DEFAULT_INT_BOUND;
}

TEST(IndexLookupTranslatorTest, TextValuesUseBinIndex) {
    IndexLookupTranslator t;
    auto lookup = t.translate("people", Filter{"name", "==", std::string("Sreejith")});
    EXPECT_EQ(lookup.bucket, "people");
    EXPECT_EQ(lookup.kind, IndexKind::BIN);
    EXPECT_EQ(lookup.index, "name_bin");
    EXPECT_FALSE(lookup.isRange());
    EXPECT_EQ(lookup.start, FilterValue{std::string("Sreejith")});
}

TEST(IndexLookupTranslatorTest, IntegerValuesUseIntIndex) {
    IndexLookupTranslator t;
    auto lookup = t.translate("people", Filter{"age", "==", int64_t{25}});
    EXPECT_EQ(lookup.kind, IndexKind::INT);
    EXPECT_EQ(lookup.index, "age_int");
    EXPECT_EQ(lookup.start, FilterValue{int64_t{25}});
    EXPECT_FALSE(lookup.end.has_value());
}

TEST(IndexLookupTranslatorTest, GreaterOperatorsRangeUpToPositiveBound) {
    IndexLookupTranslator t;
    for (const char* op : {">", ">="}) {
        auto lookup = t.translate("b", Filter{"age", op, int64_t{30}});
        ASSERT_TRUE(lookup.isRange()) << op;
        EXPECT_EQ(lookup.start, FilterValue{int64_t{30}});
        EXPECT_EQ(*lookup.end, FilterValue{kBound});
    }
}

TEST(IndexLookupTranslatorTest, LessOperatorsRangeFromNegativeBound) {
    IndexLookupTranslator t;
    for (const char* op : {"<", "<="}) {
        auto lookup = t.translate("b", Filter{"age", op, int64_t{50}});
        ASSERT_TRUE(lookup.isRange()) << op;
        EXPECT_EQ(lookup.start, FilterValue{-kBound});
        EXPECT_EQ(*lookup.end, FilterValue{int64_t{50}});
    }
}

TEST(IndexLookupTranslatorTest, StrictAndNonStrictCollapse) {
    IndexLookupTranslator t;
    EXPECT_EQ(t.translate("b", Filter{"age", ">", int64_t{1}}), t.translate("b", Filter{"age", ">=", int64_t{1}}));
    EXPECT_EQ(t.translate("b", Filter{"n", "<", std::string("m")}), t.translate("b", Filter{"n", "<=", std::string("m")}));
}

TEST(IndexLookupTranslatorTest, TextRangesUseEmptyStringSentinels) {
    IndexLookupTranslator t;
    auto gt = t.translate("b", Filter{"name", ">", std::string("M")});
    EXPECT_EQ(gt.start, FilterValue{std::string("M")});
    EXPECT_EQ(*gt.end, FilterValue{std::string()});

    auto lt = t.translate("b", Filter{"name", "<", std::string("M")});
    EXPECT_EQ(lt.start, FilterValue{std::string()});
    EXPECT_EQ(*lt.end, FilterValue{std::string("M")});
}

TEST(IndexLookupTranslatorTest, CustomBound) {
    IndexLookupTranslator t(1000);
    auto lookup = t.translate("b", Filter{"age", "<=", int64_t{5}});
    EXPECT_EQ(lookup.start, FilterValue{int64_t{-1000}});
}

TEST(IndexLookupTranslatorTest, InvalidOperatorCarriesOperator) {
    IndexLookupTranslator t;
    try {
        t.translate("b", Filter{"age", "!=", int64_t{5}});
        FAIL() << "expected InvalidOperatorException";
    } catch (const InvalidOperatorException& e) {
        EXPECT_EQ(e.op(), "!=");
        EXPECT_NE(std::string(e.what()).find("!="), std::string::npos);
    }
}

TEST(IndexLookupTranslatorTest, ToStringForDiagnostics) {
    IndexLookupTranslator t(100);
    EXPECT_EQ(t.translate("b", Filter{"name", "==", std::string("Vishnu")}).toString(), "name_bin=='Vishnu'");
    EXPECT_EQ(t.translate("b", Filter{"age", "<", int64_t{50}}).toString(), "age_int[-100..50]");
}

TEST(IndexLookupTranslatorTest, FractionalValuesUseIntIndex) {
    IndexLookupTranslator t(1000);
    EXPECT_EQ(t.intBound(), 1000);

    auto gt = t.translate("b", Filter{"score", ">", 2.5});
    EXPECT_EQ(gt.kind, IndexKind::INT);
    EXPECT_EQ(gt.index, "score_int");
    EXPECT_EQ(gt.start, FilterValue{2.5});
    EXPECT_EQ(*gt.end, FilterValue{int64_t{1000}});
    EXPECT_EQ(gt.toString(), "score_int[2.5..1000]");

    auto lt = t.translate("b", Filter{"score", "<=", -1.5});
    EXPECT_EQ(lt.start, FilterValue{int64_t{-1000}});
    EXPECT_EQ(*lt.end, FilterValue{-1.5});
}
