// File: src/evaluation/solution_evaluator.cpp
#include "evaluation/solution_evaluator.hpp"
#include <algorithm>
#include <iostream>

namespace motionrank {

SolutionEvaluator::SolutionEvaluator()
    : SolutionEvaluator(Config{}) {
}

SolutionEvaluator::SolutionEvaluator(const Config& config)
    : config_(config),
      heuristics_(config.max_analyzed_bytes) {
}

SolutionMetrics SolutionEvaluator::Evaluate(const Solution& solution) const {
    return EvaluateWithReport(solution).metrics;
}

EvaluationReport SolutionEvaluator::EvaluateWithReport(const Solution& solution) const {
    const CodeView code{solution.GetHtmlCode(), solution.GetCssCode(),
                        solution.GetJsCode(), solution.GetTechStack()};
    const CodeHeuristics& h = heuristics_;

    EvaluationReport report;

    float quality = CombineDimension("quality", {
        {"code_structure", 0.3f, h.CodeStructure(code)},
        {"animation_smoothness", 0.3f, h.AnimationSmoothness(code)},
        {"visual_appeal", 0.4f, h.VisualAppeal(code)},
    }, report.failures);

    float performance = CombineDimension("performance", {
        {"code_efficiency", 0.4f, h.CodeEfficiency(code)},
        {"resource_usage", 0.3f, h.ResourceUsage(code)},
        {"browser_support", 0.3f, h.BrowserSupport(code)},
    }, report.failures);

    float creativity = CombineDimension("creativity", {
        {"uniqueness", 0.5f, h.Uniqueness(code)},
        {"innovation", 0.3f, h.Innovation(code)},
        {"artistic_value", 0.2f, h.ArtisticValue(code)},
    }, report.failures);

    float usability = CombineDimension("usability", {
        {"readability", 0.3f, h.Readability(code)},
        {"length_band", 0.4f, h.LengthBand(code)},
        {"stack_simplicity", 0.3f, h.StackSimplicity(code)},
    }, report.failures);

    float compatibility = CombineDimension("compatibility", {
        {"modern_css", 0.4f, h.ModernCss(code)},
        {"vendor_prefixes", 0.3f, h.VendorPrefixes(code)},
        {"js_standards", 0.3f, h.JsStandards(code)},
    }, report.failures);

    report.metrics = SolutionMetrics(quality, performance, creativity,
                                     usability, compatibility);

    if (config_.log_failures) {
        for (const auto& failure : report.failures) {
            std::cerr << "[evaluator] " << solution.GetID().value()
                      << " " << failure << std::endl;
        }
    }

    return report;
}

float SolutionEvaluator::CombineDimension(const char* dimension,
                                          const std::vector<WeightedResult>& parts,
                                          std::vector<std::string>& failures) const {
    float score = 0.0f;
    bool failed = false;

    for (const auto& part : parts) {
        if (!part.result.IsOk()) {
            failures.push_back(std::string(dimension) + "/" + part.name + ": " +
                               part.result.error);
            failed = true;
            continue;
        }
        score += *part.result.score * part.weight;
    }

    if (failed) {
        return kNeutralScore;
    }

    return std::max(0.0f, std::min(100.0f, score));
}

} // namespace motionrank
