#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "textcat_estimator.hpp"
#include "textcat_model.hpp"

using namespace textcat;

// a: 2 train events, "x" seen 3 times; b: 1 event, "x" seen once, "y" twice
static void fill(FrequencyModel& m) {
    auto w = m.write();
    for (int i = 0; i < 3; i++) w.record("x", "a");
    w.record("x", "b");
    w.record("y", "b");
    w.record("y", "b");
    w.record_category("a");
    w.record_category("a");
    w.record_category("b");
}

TEST(Estimator, TokenProbUsesTrainingEvents) {
    FrequencyModel m;
    fill(m);
    auto r = m.read();
    Estimator e(r);

    EXPECT_DOUBLE_EQ(e.token_prob("x", "a"), 1.5);
    EXPECT_DOUBLE_EQ(e.token_prob("x", "b"), 1.0);
    EXPECT_DOUBLE_EQ(e.token_prob("y", "a"), 0.0);
    EXPECT_DOUBLE_EQ(e.token_prob("x", "untrained"), 0.0);
}

TEST(Estimator, WeightedProbBlendsWeightAndRate) {
    FrequencyModel m;
    fill(m);
    auto r = m.read();
    Estimator e(r);

    // (4 * 0.5 + 4 * 1.5) / 5
    EXPECT_DOUBLE_EQ(e.weighted_prob("x", "a"), 1.6);
    // (4 * 0.5 + 4 * 1.0) / 5
    EXPECT_DOUBLE_EQ(e.weighted_prob("x", "b"), 1.2);
    // (2 * 0.5 + 2 * 0.0) / 3
    EXPECT_DOUBLE_EQ(e.weighted_prob("y", "a"), 1.0 / 3.0);
    // unseen token: floor weight only
    EXPECT_DOUBLE_EQ(e.weighted_prob("zz", "a"), MIN_TOKEN_WEIGHT * 0.5);
}

TEST(Estimator, TextProbIsProductAndOneForEmpty) {
    FrequencyModel m;
    fill(m);
    auto r = m.read();
    Estimator e(r);

    EXPECT_DOUBLE_EQ(e.text_prob({}, "a"), 1.0);
    EXPECT_DOUBLE_EQ(e.text_prob({"x", "y"}, "a"), 1.6 * (1.0 / 3.0));
    EXPECT_DOUBLE_EQ(e.score({"x", "y"}, "a"), 1.6 * (1.0 / 3.0) * 0.5);
}

TEST(Estimator, SingleCategoryScoreEqualsTextProb) {
    FrequencyModel m;
    {
        auto w = m.write();
        w.record("x", "only");
        w.record("y", "only");
        w.record_category("only");
    }
    auto r = m.read();
    Estimator e(r);

    std::vector<Token> doc = {"x", "y", "unknown"};
    EXPECT_EQ(e.score(doc, "only"), e.text_prob(doc, "only"));
}

TEST(Estimator, ClassifyPicksHighestScore) {
    FrequencyModel m;
    fill(m);
    auto r = m.read();
    Estimator e(r);

    ClassifyResult res = e.classify({"y", "y"});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.category, "b");
    EXPECT_DOUBLE_EQ(res.confidence, e.score({"y", "y"}, "b"));

    res = e.classify({"x"});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.category, "a");
}

TEST(Estimator, TiesGoToSmallestLabel) {
    FrequencyModel m;
    {
        auto w = m.write();
        w.record("x", "beta");
        w.record("x", "alpha");
        w.record_category("beta");
        w.record_category("alpha");
    }
    auto r = m.read();
    Estimator e(r);

    ClassifyResult res = e.classify({"x"});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.category, "alpha");

    ProbResult p = e.get_prob({"x"});
    EXPECT_EQ(p.best, "alpha");
    EXPECT_EQ(p.probs.size(), 2u);
    EXPECT_DOUBLE_EQ(p.probs["alpha"], p.probs["beta"]);
}

TEST(Estimator, EmptyModelScoresNothing) {
    FrequencyModel m;
    auto r = m.read();
    Estimator e(r);

    EXPECT_DOUBLE_EQ(e.weighted_prob("x", "a"), 0.0);
    EXPECT_DOUBLE_EQ(e.score({"x"}, "a"), 0.0);

    ClassifyResult res = e.classify({"x"});
    EXPECT_EQ(res.error, ErrorCode::NoMatch);
    EXPECT_TRUE(res.category.empty());

    ProbResult p = e.get_prob({"x"});
    EXPECT_TRUE(p.probs.empty());
    EXPECT_TRUE(p.best.empty());
}

TEST(Estimator, EmptyLabelCanWin) {
    FrequencyModel m;
    {
        auto w = m.write();
        w.record("x", "");
        w.record_category("");
    }
    auto r = m.read();
    Estimator e(r);

    ClassifyResult res = e.classify({"x"});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.category, "");
    EXPECT_GT(res.confidence, 0.0);
}
