// File: src/similarity/similarity_calculator.hpp
#pragma once

#include "core/solution.hpp"
#include <optional>
#include <set>
#include <string>

namespace motionrank {

/// Per-feature similarity terms, each in [0, 1]
struct SimilarityBreakdown {
    float category{0.0f};
    float tech_stack{0.0f};
    float score_closeness{0.0f};
    float style{0.0f};
    float duration{0.0f};

    /// Weighted total
    float total{0.0f};
};

/// Weighted feature-overlap similarity between two solutions
///
/// Features and weights:
/// - category equality (0.30)
/// - tech stack equality, 0.3 partial credit when different (0.25)
/// - overall-score closeness, 1 - |a - b| / 100 (0.20)
/// - Jaccard overlap of style tokens found in the CSS (0.15)
/// - animation duration closeness, 0.5 when either side has none (0.10)
///
/// Symmetric: Compute(a, b) == Compute(b, a).
class SimilarityCalculator {
public:
    static constexpr float kCategoryWeight = 0.30f;
    static constexpr float kTechStackWeight = 0.25f;
    static constexpr float kScoreWeight = 0.20f;
    static constexpr float kStyleWeight = 0.15f;
    static constexpr float kDurationWeight = 0.10f;

    /// Credit given to different tech stacks
    static constexpr float kTechStackPartialCredit = 0.3f;

    /// Duration term when a duration is missing on either side
    static constexpr float kNeutralDuration = 0.5f;

    SimilarityCalculator() = default;

    /// Similarity in [0, 1]
    float Compute(const Solution& a, const Solution& b) const;

    /// Similarity with its per-feature terms
    SimilarityBreakdown ComputeBreakdown(const Solution& a, const Solution& b) const;

    std::string GetName() const { return "SolutionFeatureOverlap"; }
    bool IsSymmetric() const { return true; }

    /// Style tokens present in a stylesheet (transform, opacity, scale,
    /// rotate, translate, shadow, gradient, blur, brightness, easing family)
    static std::set<std::string> ExtractStyleFeatures(const std::string& css);

    /// Jaccard overlap of two feature sets; 0 when both are empty
    static float StyleSimilarity(const std::set<std::string>& a, const std::set<std::string>& b);

    /// First animation-duration or transition-duration, in seconds
    static std::optional<float> ExtractDuration(const std::string& css);

    /// 1 - |a - b| / max(a, b); 1 when both are zero
    static float DurationSimilarity(std::optional<float> a, std::optional<float> b);
};

} // namespace motionrank
