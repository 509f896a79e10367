// File: examples/recommendation_demo.cpp
//
// End-to-end walkthrough of a motionrank session.
// Demonstrates:
// - Loading configuration (optional YAML path as first argument)
// - Producing, evaluating and storing solutions
// - Branching versions and rolling back
// - Tracking behavior and deriving preferences
// - Ranked, similar and trending recommendations

#include "config/engine_config.hpp"
#include "core/solution_producer.hpp"
#include "repository/solution_repository.hpp"
#include "versioning/version_manager.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>

using namespace motionrank;

/// Producer that fills a fixed snippet per tech stack
class SnippetProducer : public SolutionProducer {
public:
    Solution Produce(const std::string& description,
                     const std::map<std::string, std::string>& constraints) override {
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

        solution.SetHtmlCode("<!-- demo -->\n<div class=\"box\" id=\"target\"></div>");
        solution.SetCssCode(
            "/* " + description + " */\n"
            ".box { width: 80px; height: 80px; border-radius: 8px;\n"
            "  background: linear-gradient(#f06, #48f);\n"
            "  animation: move 1s ease-in-out infinite;\n"
            "  animation-duration: 1.2s; will-change: transform; }\n"
            "@keyframes move { from { transform: translateX(0); opacity: 0; }\n"
            "  to { transform: translateX(200px); opacity: 1; } }\n");

        if (solution.GetTechStack() != TechStack::CSS_ANIMATION) {
            solution.SetJsCode("// start\nconst box = document.querySelector('.box');\n");
        }
        return solution;
    }

    std::string GetName() const override { return "snippet"; }
};

int main(int argc, char** argv) {
    std::cout << "=== motionrank Recommendation Example ===\n\n";

    // Step 1: Configuration
    std::cout << "Step 1: Loading configuration...\n";

    EngineConfig config = EngineConfig::Default();
    config.storage.backend = "memory";
    if (argc > 1) {
        auto loaded = EngineConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Invalid configuration: " << argv[1] << std::endl;
            return 1;
        }
        config = *loaded;
    }
    std::cout << "  ✓ backend=" << config.storage.backend << "\n\n";

    std::unique_ptr<SolutionStore> store;
    try {
        store = CreateSolutionStore(config);
    } catch (const std::runtime_error& e) {
        std::cerr << "Failed to open store: " << e.what() << std::endl;
        return 1;
    }

    SolutionEvaluator evaluator(config.GetEvaluatorConfig());
    SolutionRepository repository(*store, evaluator);
    VersionManager versions;
    BehaviorTracker tracker(*store);
    PreferenceModel preferences(tracker, config.GetPreferenceConfig());
    RecommendationEngine engine(tracker, preferences, config.GetRecommendationConfig());

    // Step 2: Produce solutions
    std::cout << "Step 2: Producing solutions...\n";

    SnippetProducer producer;
    std::vector<std::pair<std::string, std::map<std::string, std::string>>> requests = {
        {"Fade in hero banner", {{"tech_stack", "css_animation"}, {"category", "entrance"}}},
        {"Bouncing cart icon", {{"tech_stack", "javascript"}, {"category", "interaction"}}},
        {"Slide out drawer", {{"tech_stack", "gsap"}, {"category", "exit"}}},
        {"Rotating globe", {{"tech_stack", "three_js"}, {"category", "effect"}}},
    };

    std::vector<SolutionID> ids;
    for (const auto& [description, constraints] : requests) {
        SolutionID id = repository.Add(producer.Produce(description, constraints),
                                       config.evaluation.auto_evaluate);
        ids.push_back(id);
        auto stored = repository.Get(id);
        std::cout << "  " << std::left << std::setw(22) << description
                  << " overall=" << std::fixed << std::setprecision(1)
                  << stored->GetMetrics().GetOverall()
                  << " tier=" << ToString(stored->GetQualityTier()) << "\n";
    }
    std::cout << "\n";

    // Step 3: Versions
    std::cout << "Step 3: Branching versions...\n";

    Solution base = *repository.Get(ids[0]);
    for (int i = 0; i < 3; ++i) {
        std::cout << "  created " << versions.CreateVersion(base, "tweak " + std::to_string(i)) << "\n";
    }
    if (auto restored = versions.RollbackToVersion(base.GetID(), "1.0.1")) {
        std::cout << "  rolled back to " << restored->GetVersion()
                  << " as " << restored->GetID().value() << "\n";
    }
    std::cout << "\n";

    // Step 4: Interactions
    std::cout << "Step 4: Recording interactions...\n";

    Solution hero = *repository.Get(ids[0]);
    engine.RecordInteraction(ActionKind::VIEW, hero);
    engine.RecordInteraction(ActionKind::APPLY, hero);
    repository.RecordUsage(hero.GetID());
    engine.RecordInteraction(ActionKind::RATE, hero, 4.5f);
    repository.RateSolution(hero.GetID(), 4.5f);
    repository.AddToFavorites(ids[1]);

    std::cout << "  " << preferences.Derive().ToString() << "\n\n";

    // Step 5: Recommendations
    std::cout << "Step 5: Recommendations...\n";

    RecommendationContext context;
    context.target_category = SolutionCategory::ENTRANCE;
    context.keywords = {"fade", "hero"};

    for (const auto& result : engine.Recommend(repository.All(), context)) {
        std::cout << "  " << std::setprecision(3) << result.total_score << "  "
                  << repository.Get(result.solution_id)->GetName()
                  << "  (" << result.explanation << ")\n";
    }

    std::cout << "\n  Similar to \"" << hero.GetName() << "\":\n";
    for (const auto& [solution, similarity] :
         engine.GetSimilarSolutions(hero, repository.All())) {
        std::cout << "    " << similarity << "  " << solution.GetName() << "\n";
    }

    std::cout << "\n  Trending:\n";
    for (const auto& solution : engine.GetTrendingSolutions(repository.All())) {
        std::cout << "    " << solution.GetName() << "\n";
    }

    // Step 6: Statistics
    RepositoryStatistics stats = repository.GetStatistics();
    std::cout << "\nStep 6: Statistics\n";
    std::cout << "  solutions=" << stats.total_solutions
              << " favorites=" << stats.total_favorites
              << " usage=" << stats.total_usage
              << " avg_overall=" << stats.average_overall_score
              << " avg_rating=" << stats.average_rating << "\n";

    EngineStatistics engine_stats = engine.GetStatistics();
    std::cout << "  actions=" << engine_stats.total_actions
              << " cache_size=" << engine_stats.cache_size << "\n";

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
