// File: src/evaluation/solution_evaluator.hpp
#pragma once

#include "core/solution.hpp"
#include "evaluation/code_heuristics.hpp"
#include <string>
#include <vector>

namespace motionrank {

/// Per-dimension breakdown of one evaluation
struct EvaluationReport {
    SolutionMetrics metrics;

    /// "dimension/heuristic: reason" for each heuristic that could not run
    std::vector<std::string> failures;
};

/// Multi-dimension quality evaluator
///
/// Each dimension is a weighted sum of sub-heuristics, clamped to [0, 100].
/// When any sub-heuristic of a dimension fails, that dimension scores
/// kNeutralScore and the failure is logged; the other dimensions are
/// still evaluated. Evaluation is deterministic and keeps no state.
class SolutionEvaluator {
public:
    /// Score assigned to a dimension whose analysis failed
    static constexpr float kNeutralScore = 0.0f;

    struct Config {
        /// Largest code blob a heuristic will scan
        size_t max_analyzed_bytes{1 << 20};

        /// Log heuristic failures to stderr
        bool log_failures{true};
    };

    SolutionEvaluator();
    explicit SolutionEvaluator(const Config& config);

    /// Evaluate a solution
    /// @param solution Solution whose code is inspected
    /// @return Metrics with the overall score already computed
    SolutionMetrics Evaluate(const Solution& solution) const;

    /// Evaluate and report which heuristics failed
    EvaluationReport EvaluateWithReport(const Solution& solution) const;

    const Config& GetConfig() const { return config_; }

private:
    struct WeightedResult {
        const char* name;
        float weight;
        HeuristicResult result;
    };

    /// Combine sub-heuristics into one dimension score
    float CombineDimension(const char* dimension,
                           const std::vector<WeightedResult>& parts,
                           std::vector<std::string>& failures) const;

    Config config_;
    CodeHeuristics heuristics_;
};

} // namespace motionrank
