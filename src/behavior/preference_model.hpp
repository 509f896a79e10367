// File: src/behavior/preference_model.hpp
#pragma once

#include "behavior/behavior_tracker.hpp"
#include <map>
#include <string>

namespace motionrank {

/// Derived model of what a user tends to favor; all values in [0, 1]
struct PreferenceVector {
    std::map<SolutionCategory, float> category_weights;
    std::map<TechStack, float> tech_stack_weights;
    float quality_threshold{0.6f};
    float complexity_appetite{0.0f};
    float novelty_appetite{0.4f};

    /// Weight of a category, 0 if absent
    float CategoryWeight(SolutionCategory category) const;

    /// Weight of a tech stack, 0 if absent
    float TechStackWeight(TechStack stack) const;

    std::string ToString() const;
};

/// Derives a PreferenceVector from the behavior log
///
/// Derive() recomputes everything from the tracker's events on each call.
class PreferenceModel {
public:
    static constexpr float kDefaultQualityThreshold = 0.6f;
    static constexpr float kAppliedQualityThreshold = 0.7f;
    static constexpr float kHighNovelty = 0.8f;
    static constexpr float kLowNovelty = 0.4f;

    struct Config {
        /// Events younger than this count as recent
        int recent_window_days{7};

        /// Share of recent events above which novelty appetite is high
        float recent_share_threshold{0.7f};
    };

    explicit PreferenceModel(const BehaviorTracker& tracker);
    PreferenceModel(const BehaviorTracker& tracker, const Config& config, Clock clock = SystemClock());

    PreferenceVector Derive() const;

    /// Complexity constant of a tech stack
    static float StackComplexity(TechStack stack);

private:
    float DeriveQualityThreshold() const;
    float DeriveComplexityAppetite(const std::map<TechStack, uint32_t>& counters) const;
    float DeriveNoveltyAppetite() const;

    const BehaviorTracker& tracker_;
    Config config_;
    Clock clock_;
};

} // namespace motionrank
