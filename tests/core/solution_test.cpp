// File: tests/core/solution_test.cpp
#include "core/solution.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

namespace motionrank {
namespace {

// ============================================================================
// SolutionMetrics Tests
// ============================================================================

TEST(SolutionMetricsTest, DefaultIsZero) {
    SolutionMetrics metrics;
    EXPECT_FLOAT_EQ(0.0f, metrics.GetOverall());
}

TEST(SolutionMetricsTest, OverallIsWeightedSum) {
    SolutionMetrics metrics(80.0f, 60.0f, 40.0f, 100.0f, 20.0f);
    // 24 + 15 + 8 + 15 + 2
    EXPECT_NEAR(64.0f, metrics.GetOverall(), 1e-4f);
}

TEST(SolutionMetricsTest, SettersClampAndRecompute) {
    SolutionMetrics metrics(50.0f, 50.0f, 50.0f, 50.0f, 50.0f);
    EXPECT_NEAR(50.0f, metrics.GetOverall(), 1e-4f);

    metrics.SetQuality(150.0f);
    EXPECT_FLOAT_EQ(100.0f, metrics.GetQuality());
    EXPECT_NEAR(65.0f, metrics.GetOverall(), 1e-4f);

    metrics.SetCompatibility(-20.0f);
    EXPECT_FLOAT_EQ(0.0f, metrics.GetCompatibility());
    EXPECT_NEAR(60.0f, metrics.GetOverall(), 1e-4f);
}

TEST(SolutionMetricsTest, OverallAlwaysMatchesDimensions) {
    SolutionMetrics metrics;
    metrics.SetQuality(91.0f);
    metrics.SetPerformance(13.0f);
    metrics.SetCreativity(77.0f);
    metrics.SetUsability(42.0f);
    metrics.SetCompatibility(8.0f);

    float expected = SolutionMetrics::CalculateOverallScore(91.0f, 13.0f, 77.0f, 42.0f, 8.0f);
    EXPECT_FLOAT_EQ(expected, metrics.GetOverall());
}

TEST(QualityTierTest, Thresholds) {
    EXPECT_EQ(QualityTier::EXCELLENT, DetermineQualityTier(85.0f));
    EXPECT_EQ(QualityTier::GOOD, DetermineQualityTier(84.9f));
    EXPECT_EQ(QualityTier::GOOD, DetermineQualityTier(70.0f));
    EXPECT_EQ(QualityTier::AVERAGE, DetermineQualityTier(50.0f));
    EXPECT_EQ(QualityTier::POOR, DetermineQualityTier(49.99f));
}

// ============================================================================
// Solution Tests
// ============================================================================

TEST(SolutionTest, DefaultsAreSet) {
    Solution solution;
    EXPECT_TRUE(solution.GetID().IsValid());
    EXPECT_EQ("1.0.0", solution.GetVersion());
    EXPECT_EQ(SolutionCategory::EFFECT, solution.GetCategory());
    EXPECT_EQ(TechStack::CSS_ANIMATION, solution.GetTechStack());
    EXPECT_EQ(0u, solution.GetUsageCount());
    EXPECT_FALSE(solution.GetParentID().has_value());
    EXPECT_EQ(solution.GetCreatedAt(), solution.GetUpdatedAt());
}

TEST(SolutionTest, SetMetricsUpdatesTier) {
    Solution solution;
    solution.SetMetrics(SolutionMetrics(90.0f, 90.0f, 90.0f, 90.0f, 90.0f));
    EXPECT_EQ(QualityTier::EXCELLENT, solution.GetQualityTier());

    solution.SetMetrics(SolutionMetrics(10.0f, 10.0f, 10.0f, 10.0f, 10.0f));
    EXPECT_EQ(QualityTier::POOR, solution.GetQualityTier());
}

TEST(SolutionTest, RatingIsRunningMean) {
    Solution solution;
    solution.AddUserRating(4.0f);
    solution.AddUserRating(5.0f);
    solution.AddUserRating(3.0f);

    EXPECT_EQ(3u, solution.GetRatingCount());
    EXPECT_NEAR(4.0f, solution.GetUserRating(), 1e-5f);
}

TEST(SolutionTest, OutOfRangeRatingLeavesCountersUnchanged) {
    Solution solution;
    solution.AddUserRating(2.0f);

    EXPECT_THROW(solution.AddUserRating(5.5f), std::invalid_argument);
    EXPECT_THROW(solution.AddUserRating(-0.1f), std::invalid_argument);

    EXPECT_EQ(1u, solution.GetRatingCount());
    EXPECT_FLOAT_EQ(2.0f, solution.GetUserRating());
}

TEST(SolutionTest, FavoriteCountNeverNegative) {
    Solution solution;
    solution.RemoveFavorite();
    EXPECT_EQ(0u, solution.GetFavoriteCount());

    solution.AddFavorite();
    solution.AddFavorite();
    solution.RemoveFavorite();
    EXPECT_EQ(1u, solution.GetFavoriteCount());
}

TEST(SolutionTest, MutationsRefreshUpdatedAt) {
    Solution solution;
    Timestamp before = solution.GetUpdatedAt();

    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    solution.IncrementUsage();

    EXPECT_GT(solution.GetUpdatedAt(), before);
    EXPECT_EQ(1u, solution.GetUsageCount());
}

TEST(SolutionTest, TagsAreDeduplicated) {
    Solution solution;
    EXPECT_TRUE(solution.AddTag("fade"));
    EXPECT_FALSE(solution.AddTag("fade"));
    solution.SetTags({"a", "b", "a"});
    EXPECT_EQ(2u, solution.GetTags().size());
    EXPECT_TRUE(solution.HasTag("b"));
}

TEST(SolutionTest, CloneHasNewIdentityAndSameContent) {
    Solution original;
    original.SetHtmlCode("<div></div>");
    original.SetCssCode(".a { opacity: 1; }");
    original.SetCategory(SolutionCategory::ENTRANCE);
    original.IncrementUsage();

    Solution copy = original.Clone();

    EXPECT_NE(original.GetID(), copy.GetID());
    EXPECT_TRUE(copy.HasSameContent(original));
    EXPECT_EQ(1u, copy.GetUsageCount());
    EXPECT_EQ(copy.GetCreatedAt(), copy.GetUpdatedAt());
}

TEST(SolutionTest, ChildIDsAreUnique) {
    Solution parent;
    SolutionID child = SolutionID::Generate();
    EXPECT_TRUE(parent.AddChildID(child));
    EXPECT_FALSE(parent.AddChildID(child));
    EXPECT_EQ(1u, parent.GetChildIDs().size());
}

TEST(SolutionTest, RestoreRejectsBadRating) {
    Solution solution;
    InteractionStats stats;
    stats.user_rating = 7.0f;
    stats.rating_count = 1;
    EXPECT_THROW(solution.RestoreInteractionStats(stats), std::invalid_argument);
}

} // namespace
} // namespace motionrank
