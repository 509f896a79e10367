// File: tests/evaluation/solution_evaluator_test.cpp
#include "evaluation/solution_evaluator.hpp"
#include <gtest/gtest.h>

namespace motionrank {
namespace {

Solution MakeMinimalSolution() {
    Solution solution;
    solution.SetHtmlCode("<div class=\"box\" id=\"hero\"></div>");
    solution.SetTechStack(TechStack::CSS_ANIMATION);
    return solution;
}

TEST(SolutionEvaluatorTest, ScoresMinimalMarkup) {
    SolutionEvaluator evaluator;
    SolutionMetrics metrics = evaluator.Evaluate(MakeMinimalSolution());

    EXPECT_NEAR(57.5f, metrics.GetQuality(), 1e-3f);
    EXPECT_NEAR(77.5f, metrics.GetPerformance(), 1e-3f);
    EXPECT_NEAR(51.5f, metrics.GetCreativity(), 1e-3f);
    EXPECT_NEAR(80.0f, metrics.GetUsability(), 1e-3f);
    EXPECT_NEAR(62.0f, metrics.GetCompatibility(), 1e-3f);
    EXPECT_NEAR(65.125f, metrics.GetOverall(), 1e-3f);
}

TEST(SolutionEvaluatorTest, ScoresStayInRange) {
    Solution solution;
    solution.SetTechStack(TechStack::THREE_JS);
    solution.SetCssCode(std::string(4000, 'a') +
                        " left: top: width: height: -webkit- -moz- -ms- -o- grid flex");
    solution.SetJsCode("const scene = new THREE.Scene(); // setup");

    SolutionMetrics metrics = SolutionEvaluator().Evaluate(solution);
    for (float score : {metrics.GetQuality(), metrics.GetPerformance(),
                        metrics.GetCreativity(), metrics.GetUsability(),
                        metrics.GetCompatibility(), metrics.GetOverall()}) {
        EXPECT_GE(score, 0.0f);
        EXPECT_LE(score, 100.0f);
    }
}

TEST(SolutionEvaluatorTest, DeterministicForSameContent) {
    SolutionEvaluator evaluator;
    Solution a = MakeMinimalSolution();
    Solution b = a.Clone();
    EXPECT_EQ(evaluator.Evaluate(a), evaluator.Evaluate(b));
}

TEST(SolutionEvaluatorTest, FailedHeuristicZeroesOnlyItsDimension) {
    SolutionEvaluator::Config config;
    config.max_analyzed_bytes = 16;
    config.log_failures = false;
    SolutionEvaluator evaluator(config);

    Solution solution;
    solution.SetHtmlCode("<div></div>");
    solution.SetJsCode("document.querySelector('.box').animate([]);");

    EvaluationReport report = evaluator.EvaluateWithReport(solution);

    // Script is read by readability and js_standards only
    EXPECT_FLOAT_EQ(0.0f, report.metrics.GetUsability());
    EXPECT_FLOAT_EQ(0.0f, report.metrics.GetCompatibility());
    EXPECT_GT(report.metrics.GetQuality(), 0.0f);
    EXPECT_GT(report.metrics.GetPerformance(), 0.0f);
    EXPECT_GT(report.metrics.GetCreativity(), 0.0f);

    ASSERT_EQ(2u, report.failures.size());
    EXPECT_EQ(0u, report.failures[0].find("usability/readability"));
    EXPECT_EQ(0u, report.failures[1].find("compatibility/js_standards"));
}

TEST(SolutionEvaluatorTest, EvaluateMatchesReport) {
    SolutionEvaluator evaluator;
    Solution solution = MakeMinimalSolution();
    EvaluationReport report = evaluator.EvaluateWithReport(solution);
    EXPECT_TRUE(report.failures.empty());
    EXPECT_EQ(report.metrics, evaluator.Evaluate(solution));
}

} // namespace
} // namespace motionrank
