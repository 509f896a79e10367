// File: src/behavior/preference_model.cpp
#include "behavior/preference_model.hpp"
#include <algorithm>
#include <sstream>

namespace motionrank {

namespace {

template<typename Key>
std::map<Key, float> Normalize(const std::map<Key, uint32_t>& counters) {
    uint64_t total = 0;
    for (const auto& [key, count] : counters) {
        total += count;
    }

    std::map<Key, float> weights;
    for (const auto& [key, count] : counters) {
        weights[key] = static_cast<float>(count) /
                       static_cast<float>(std::max<uint64_t>(1, total));
    }
    return weights;
}

} // anonymous namespace

// ============================================================================
// PreferenceVector
// ============================================================================

float PreferenceVector::CategoryWeight(SolutionCategory category) const {
    auto it = category_weights.find(category);
    return it != category_weights.end() ? it->second : 0.0f;
}

float PreferenceVector::TechStackWeight(TechStack stack) const {
    auto it = tech_stack_weights.find(stack);
    return it != tech_stack_weights.end() ? it->second : 0.0f;
}

std::string PreferenceVector::ToString() const {
    std::ostringstream oss;
    oss << "PreferenceVector(categories={";
    bool first = true;
    for (const auto& [category, weight] : category_weights) {
        oss << (first ? "" : ", ") << motionrank::ToString(category) << "=" << weight;
        first = false;
    }
    oss << "}, tech_stacks={";
    first = true;
    for (const auto& [stack, weight] : tech_stack_weights) {
        oss << (first ? "" : ", ") << motionrank::ToString(stack) << "=" << weight;
        first = false;
    }
    oss << "}, quality_threshold=" << quality_threshold
        << ", complexity=" << complexity_appetite
        << ", novelty=" << novelty_appetite << ")";
    return oss.str();
}

// ============================================================================
// PreferenceModel
// ============================================================================

PreferenceModel::PreferenceModel(const BehaviorTracker& tracker)
    : PreferenceModel(tracker, Config(), tracker.GetClock()) {
}

PreferenceModel::PreferenceModel(const BehaviorTracker& tracker, const Config& config, Clock clock)
    : tracker_(tracker), config_(config), clock_(std::move(clock)) {
}

PreferenceVector PreferenceModel::Derive() const {
    auto tech_counters = tracker_.TechStackCounters();

    PreferenceVector vector;
    vector.category_weights = Normalize(tracker_.CategoryCounters());
    vector.tech_stack_weights = Normalize(tech_counters);
    vector.quality_threshold = DeriveQualityThreshold();
    vector.complexity_appetite = DeriveComplexityAppetite(tech_counters);
    vector.novelty_appetite = DeriveNoveltyAppetite();
    return vector;
}

float PreferenceModel::StackComplexity(TechStack stack) {
    switch (stack) {
        case TechStack::CSS_ANIMATION: return 0.3f;
        case TechStack::JAVASCRIPT: return 0.5f;
        case TechStack::GSAP: return 0.7f;
        case TechStack::THREE_JS: return 0.9f;
        case TechStack::SVG_ANIMATION: return 0.6f;
        default: return 0.5f;
    }
}

float PreferenceModel::DeriveQualityThreshold() const {
    // Placeholder rule: any applied solution raises the bar
    const auto& events = tracker_.GetEvents();
    bool applied = std::any_of(events.begin(), events.end(),
        [](const BehaviorEvent& e) { return e.action == ActionKind::APPLY; });
    return applied ? kAppliedQualityThreshold : kDefaultQualityThreshold;
}

float PreferenceModel::DeriveComplexityAppetite(const std::map<TechStack, uint32_t>& counters) const {
    uint64_t total = 0;
    float weighted = 0.0f;

    for (const auto& [stack, count] : counters) {
        total += count;
        weighted += StackComplexity(stack) * static_cast<float>(count);
    }

    return weighted / static_cast<float>(std::max<uint64_t>(1, total));
}

float PreferenceModel::DeriveNoveltyAppetite() const {
    const auto& events = tracker_.GetEvents();
    Timestamp now = clock_();

    size_t recent = std::count_if(events.begin(), events.end(),
        [&](const BehaviorEvent& e) {
            return DaysBetween(e.timestamp, now) <= config_.recent_window_days;
        });

    if (static_cast<float>(recent) >
        static_cast<float>(events.size()) * config_.recent_share_threshold) {
        return kHighNovelty;
    }
    return kLowNovelty;
}

} // namespace motionrank
