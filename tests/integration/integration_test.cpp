// File: tests/integration/integration_test.cpp
//
// End-to-end tests: config -> store -> repository -> versions -> behavior -> recommendations

#include "config/engine_config.hpp"
#include "core/solution_producer.hpp"
#include "repository/solution_repository.hpp"
#include "storage/memory_store.hpp"
#include "versioning/version_manager.hpp"
#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>

namespace motionrank {
namespace {

// ============================================================================
// Test Producer
// ============================================================================

class FixtureProducer : public SolutionProducer {
public:
    Solution Produce(const std::string& description,
                     const std::map<std::string, std::string>& constraints) override {
        ++produced_;

        Solution solution;
        solution.SetName(description);
        solution.SetDescription(description);

        auto stack = constraints.find("tech_stack");
        if (stack != constraints.end()) {
            solution.SetTechStack(ParseTechStack(stack->second));
        }
        auto category = constraints.find("category");
        if (category != constraints.end()) {
            solution.SetCategory(ParseSolutionCategory(category->second));
        }

        solution.SetHtmlCode("<div class=\"box\" id=\"item\"></div>");
        solution.SetCssCode(".box { transform: scale(1); opacity: 1; transition: transform 300ms ease-out;"
                            " transition-duration: 300ms; }");
        return solution;
    }

    std::string GetName() const override { return "fixture"; }

    int GetProducedCount() const { return produced_; }

private:
    int produced_ = 0;
};

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = "/tmp/test_motionrank_integration_" +
                   std::to_string(std::time(nullptr)) + ".db";
    }

    void TearDown() override {
        std::filesystem::remove(db_path_);
        std::filesystem::remove(db_path_ + "-wal");
        std::filesystem::remove(db_path_ + "-shm");
    }

    std::string db_path_;
};

// ============================================================================
// Integration Tests
// ============================================================================

TEST_F(IntegrationTest, EndToEndSession) {
    auto config_opt = EngineConfig::LoadFromString(
        "storage:\n  backend: \"memory\"\nrecommendation:\n  default_limit: 2\n");
    ASSERT_TRUE(config_opt.has_value());
    EngineConfig config = *config_opt;

    auto store = CreateSolutionStore(config);
    SolutionEvaluator evaluator(config.GetEvaluatorConfig());
    SolutionRepository repository(*store, evaluator);
    BehaviorTracker tracker(*store);
    PreferenceModel preferences(tracker, config.GetPreferenceConfig());
    RecommendationEngine engine(tracker, preferences, config.GetRecommendationConfig());

    FixtureProducer producer;
    SolutionID fade = repository.Add(producer.Produce(
        "Fade in hero", {{"category", "entrance"}, {"tech_stack", "css_animation"}}));
    SolutionID spin = repository.Add(producer.Produce(
        "Spinning logo", {{"category", "effect"}, {"tech_stack", "three_js"}}));
    SolutionID slide = repository.Add(producer.Produce(
        "Slide out menu", {{"category", "exit"}, {"tech_stack", "gsap"}}));

    EXPECT_EQ(3, producer.GetProducedCount());
    EXPECT_EQ(3u, repository.Size());
    for (const auto& solution : repository.All()) {
        EXPECT_GT(solution.GetMetrics().GetOverall(), 0.0f);
    }

    // Interactions through both the engine and the repository
    Solution hero = *repository.Get(fade);
    engine.RecordInteraction(ActionKind::APPLY, hero);
    engine.RecordInteraction(ActionKind::RATE, hero, 5.0f);
    repository.RecordUsage(fade);
    repository.RateSolution(fade, 5.0f);
    repository.AddToFavorites(fade);

    PreferenceVector prefs = preferences.Derive();
    EXPECT_FLOAT_EQ(1.0f, prefs.CategoryWeight(SolutionCategory::ENTRANCE));
    EXPECT_FLOAT_EQ(0.7f, prefs.quality_threshold);

    RecommendationContext context;
    context.target_category = SolutionCategory::ENTRANCE;
    context.keywords = {"hero"};

    auto results = engine.Recommend(repository.All(), context);
    ASSERT_EQ(2u, results.size());
    EXPECT_EQ(fade, results[0].solution_id);

    auto similar = engine.GetSimilarSolutions(*repository.Get(spin), repository.All(), 5);
    EXPECT_EQ(2u, similar.size());

    auto trending = engine.GetTrendingSolutions(repository.All(), 7, 1);
    ASSERT_EQ(1u, trending.size());
    EXPECT_EQ(fade, trending[0].GetID());

    RepositoryStatistics stats = repository.GetStatistics();
    EXPECT_EQ(3u, stats.total_solutions);
    EXPECT_EQ(1u, stats.total_favorites);
    EXPECT_EQ(1u, stats.total_usage);
    EXPECT_TRUE(repository.Contains(slide));

    EXPECT_EQ(2u, store->LoadEvents().size());
}

TEST_F(IntegrationTest, VersionRollbackRejoinsRepository) {
    MemoryStore store;
    SolutionEvaluator evaluator;
    SolutionRepository repository(store, evaluator);
    VersionManager versions;

    Solution original;
    original.SetName("Pulse");
    original.SetCssCode(".a { animation-duration: 1s; }");
    SolutionID id = repository.Add(original);

    Solution working = *repository.Get(id);
    versions.CreateVersion(working, "initial");
    working.SetCssCode(".a { animation-duration: 2s; transform: scale(1.2); }");
    repository.Update(working);
    versions.CreateVersion(working, "bigger pulse");

    auto restored = versions.RollbackToVersion(id, "1.0.0");
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(".a { animation-duration: 1s; }", restored->GetCssCode());

    SolutionID restored_id = repository.Add(*restored);
    EXPECT_NE(id, restored_id);
    EXPECT_EQ(2u, repository.Size());
    EXPECT_EQ(id, *repository.Get(restored_id)->GetParentID());
}

TEST_F(IntegrationTest, SqliteSessionSurvivesRestart) {
    EngineConfig config = EngineConfig::Default();
    config.storage.db_path = db_path_;

    SolutionID id;
    {
        auto store = CreateSolutionStore(config);
        SolutionEvaluator evaluator(config.GetEvaluatorConfig());
        SolutionRepository repository(*store, evaluator);
        BehaviorTracker tracker(*store);

        FixtureProducer producer;
        Solution solution = producer.Produce("Bounce", {{"category", "interaction"}});
        id = repository.Add(solution);
        repository.AddToFavorites(id);
        tracker.TrackFavorite(*repository.Get(id));
    }

    auto store = CreateSolutionStore(config);
    SolutionEvaluator evaluator(config.GetEvaluatorConfig());
    SolutionRepository repository(*store, evaluator);
    BehaviorTracker tracker(*store);
    PreferenceModel preferences(tracker);

    ASSERT_TRUE(repository.Contains(id));
    EXPECT_TRUE(repository.IsFavorite(id));
    EXPECT_EQ(1u, tracker.GetEventCount());
    EXPECT_FLOAT_EQ(1.0f, preferences.Derive().CategoryWeight(SolutionCategory::INTERACTION));
}

} // namespace
} // namespace motionrank
