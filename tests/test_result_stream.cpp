// ResultStream: lazy single-pass consumption

#include <gtest/gtest.h>
#include <stdexcept>

#include "store/result_stream.h"

using namespace multiquery;

namespace {

// Produces `total` rows, counts pulls, optionally throws at a position
class CountingSource : public ResultSource {
public:
    CountingSource(int total, int* pulls, int throwAt = -1)
        : total_(total), pulls_(pulls), throwAt_(throwAt) {}

    std::optional<ResultRow> next() override {
        ++*pulls_;
        if (pos_ == throwAt_) throw std::runtime_error("source failed");
        if (pos_ >= total_) return std::nullopt;
        ++pos_;
        return ResultRow{"k" + std::to_string(pos_), nlohmann::json{{"n", pos_}}};
    }

private:
    int total_;
    int* pulls_;
    int throwAt_;
    int pos_ = 0;
};

} // namespace

TEST(ResultStreamTest, PullsOnlyOnDemand) {
    int pulls = 0;
    ResultStream stream(std::make_unique<CountingSource>(3, &pulls));
    EXPECT_EQ(pulls, 0);

    auto first = stream.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->key, "k1");
    EXPECT_EQ(pulls, 1);
    EXPECT_EQ(stream.consumed(), 1u);
    EXPECT_FALSE(stream.exhausted());
}

TEST(ResultStreamTest, RangeForVisitsAllRows) {
    int pulls = 0;
    ResultStream stream(std::make_unique<CountingSource>(3, &pulls));
    std::vector<std::string> keys;
    for (const auto& row : stream) {
        keys.push_back(row.key);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"k1", "k2", "k3"}));
    EXPECT_TRUE(stream.exhausted());
    EXPECT_EQ(stream.begin(), stream.end());
}

TEST(ResultStreamTest, SecondPassContinuesWhereFirstStopped) {
    int pulls = 0;
    ResultStream stream(std::make_unique<CountingSource>(3, &pulls));
    for (const auto& row : stream) {
        EXPECT_EQ(row.key, "k1");
        break;
    }
    auto rest = stream.drain();
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0].key, "k2");
    EXPECT_FALSE(stream.next().has_value());
}

TEST(ResultStreamTest, DefaultStreamIsEmpty) {
    ResultStream stream;
    EXPECT_TRUE(stream.exhausted());
    EXPECT_TRUE(stream.drain().empty());
}

TEST(ResultStreamTest, SourceErrorsSurfaceDuringIteration) {
    int pulls = 0;
    ResultStream stream(std::make_unique<CountingSource>(5, &pulls, 1));
    EXPECT_TRUE(stream.next().has_value());
    EXPECT_THROW(stream.next(), std::runtime_error);
}

TEST(ResultStreamTest, DefaultStreamIteratesNothing) {
    ResultStream stream;
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(stream.begin(), stream.end());
    EXPECT_EQ(stream.consumed(), 0u);
}

TEST(ResultStreamTest, MoveTransfersSource) {
    int pulls = 0;
    ResultStream a(std::make_unique<CountingSource>(2, &pulls));
    ASSERT_TRUE(a.next().has_value());
    ResultStream b(std::move(a));
    EXPECT_EQ(b.consumed(), 1u);
    EXPECT_EQ(b.drain().size(), 1u);
}

TEST(ResultStreamTest, MovedFromStreamIsExhausted) {
    int pulls = 0;
    ResultStream a(std::make_unique<CountingSource>(3, &pulls));
    ResultStream b(std::move(a));
    EXPECT_TRUE(a.exhausted());
    EXPECT_FALSE(a.next().has_value());
    EXPECT_TRUE(a.drain().empty());

    ResultStream c;
    c = std::move(b);
    EXPECT_TRUE(b.exhausted());
    EXPECT_FALSE(b.next().has_value());
    EXPECT_EQ(c.drain().size(), 3u);
    EXPECT_EQ(pulls, 4);
}
