#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "FrequencyAggregator.hpp"
#include "TopicModelSweep.hpp"
#include "errors.hpp"
#include "test_fixtures.hpp"

class TopicSweepTest : public ::testing::Test {
protected:
    DocumentTermMatrix train;
    DocumentTermMatrix test;

    void SetUp() override {
        auto tokens = make_tokens({
            {"d1", "salmon trout river"},
            {"d2", "salmon kelp river"},
            {"d3", "trout kelp estuary"},
            {"d4", "salmon trout lagoon"},
        });
        auto table = FrequencyAggregator().aggregate(tokens);
        DocumentTermMatrixBuilder builder;
        train = builder.build(table, {"d1", "d2", "d3"});
        test = builder.build(table, {"d4"});
    }

    static SweepOptions options(std::vector<int> ks, size_t workers = 3) {
        SweepOptions opts;
        opts.k_values = std::move(ks);
        opts.workers = workers;
        return opts;
    }
};

TEST_F(TopicSweepTest, CurveIsAscendingInKRegardlessOfCompletionOrder) {
    FakeFitter fitter;
    // Smallest K finishes last
    fitter.delay_ms = {{2, 120}, {3, 60}, {4, 0}};

    auto curve = TopicModelSweep(fitter, options({2, 3, 4})).run(train, test);

    ASSERT_EQ(curve.points.size(), 3u);
    EXPECT_EQ(curve.points[0].k, 2);
    EXPECT_EQ(curve.points[1].k, 3);
    EXPECT_EQ(curve.points[2].k, 4);
    EXPECT_TRUE(curve.failures.empty());
}

TEST_F(TopicSweepTest, TestMatrixIsAlignedToTrainingVocabulary) {
    FakeFitter fitter;
    auto curve = TopicModelSweep(fitter, options({2}, 1)).run(train, test);

    EXPECT_EQ(fitter.test_terms_seen(), train.terms);
    EXPECT_TRUE(curve.alignment.mismatch());
    EXPECT_EQ(curve.alignment.dropped_terms, (std::vector<std::string>{"lagoon"}));
}

TEST_F(TopicSweepTest, FailedKIsRecordedAndSweepContinues) {
    FakeFitter fitter;
    fitter.failing_k = {3};
    fitter.raw_scores = {{5, std::numeric_limits<double>::quiet_NaN()}, {6, -1.0}};

    auto curve = TopicModelSweep(fitter, options({2, 3, 4, 5, 6})).run(train, test);

    ASSERT_EQ(curve.points.size(), 2u);
    EXPECT_EQ(curve.points[0].k, 2);
    EXPECT_EQ(curve.points[1].k, 4);

    ASSERT_EQ(curve.failures.size(), 3u);
    EXPECT_EQ(curve.failures[0].k, 3);
    EXPECT_EQ(curve.failures[0].error, "model diverged");
    EXPECT_EQ(curve.failures[1].k, 5);
    EXPECT_EQ(curve.failures[2].k, 6);
    EXPECT_EQ(fitter.fit_calls().size(), 5u);
}

TEST_F(TopicSweepTest, EveryKFailingIsAHardFailure) {
    FakeFitter fitter;
    fitter.failing_k = {2, 3};
    EXPECT_THROW(TopicModelSweep(fitter, options({2, 3})).run(train, test), SweepFailedError);
}

TEST_F(TopicSweepTest, TestMatrixWithNoSharedTermsIsAHardFailure) {
    auto tokens = make_tokens({{"x1", "alpha beta"}, {"x2", "gamma delta"}});
    auto table = FrequencyAggregator().aggregate(tokens);
    DocumentTermMatrixBuilder builder;

    FakeFitter fitter;
    EXPECT_THROW(TopicModelSweep(fitter, options({2})).run(builder.build(table, {"x1"}), builder.build(table, {"x2"})),
                 SweepFailedError);
    EXPECT_TRUE(fitter.fit_calls().empty());
}

TEST(TopicSweepValidationTest, KListMustBeAscendingUniqueAndPositive) {
    EXPECT_NO_THROW(TopicModelSweep::validate_k_values({1, 2, 5}));
    EXPECT_THROW(TopicModelSweep::validate_k_values({}), std::invalid_argument);
    EXPECT_THROW(TopicModelSweep::validate_k_values({0, 2}), std::invalid_argument);
    EXPECT_THROW(TopicModelSweep::validate_k_values({2, 2, 3}), std::invalid_argument);
    EXPECT_THROW(TopicModelSweep::validate_k_values({4, 3}), std::invalid_argument);

    FakeFitter fitter;
    SweepOptions bad;
    bad.k_values = {3, 2};
    EXPECT_THROW(TopicModelSweep(fitter, bad), std::invalid_argument);
}

TEST(ModelSelectorTest, PicksMinimumPerplexity) {
    std::vector<CurvePoint> curve{{2, 500.0}, {3, 420.0}, {4, 460.0}};
    EXPECT_EQ(ModelSelector::select_k(curve), 3);
}

TEST(ModelSelectorTest, TiesGoToSmallestK) {
    std::vector<CurvePoint> curve{{2, 500.0}, {5, 410.0}, {3, 410.0}};
    EXPECT_EQ(ModelSelector::select_k(curve), 3);
}

TEST(ModelSelectorTest, RankedCurveOrdersByScore) {
    auto ranked = ModelSelector::ranked({{2, 500.0}, {3, 420.0}, {4, 460.0}});
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].k, 3);
    EXPECT_EQ(ranked[1].k, 4);
    EXPECT_EQ(ranked[2].k, 2);
}

TEST(ModelSelectorTest, EmptyCurveThrows) {
    EXPECT_THROW(ModelSelector::select_k(std::vector<CurvePoint>{}), SweepFailedError);
    EXPECT_THROW(ModelSelector::select_k(PerplexityCurve{}), SweepFailedError);
}
