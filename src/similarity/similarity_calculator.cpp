// File: src/similarity/similarity_calculator.cpp
#include "similarity/similarity_calculator.hpp"
#include "evaluation/code_heuristics.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <regex>

namespace motionrank {

float SimilarityCalculator::Compute(const Solution& a, const Solution& b) const {
    return ComputeBreakdown(a, b).total;
}

SimilarityBreakdown SimilarityCalculator::ComputeBreakdown(const Solution& a, const Solution& b) const {
    SimilarityBreakdown result;

    result.category = a.GetCategory() == b.GetCategory() ? 1.0f : 0.0f;
    result.tech_stack = a.GetTechStack() == b.GetTechStack() ? 1.0f : kTechStackPartialCredit;

    float score_diff = std::abs(a.GetMetrics().GetOverall() - b.GetMetrics().GetOverall());
    result.score_closeness = 1.0f - score_diff / 100.0f;

    result.style = StyleSimilarity(ExtractStyleFeatures(a.GetCssCode()),
                                   ExtractStyleFeatures(b.GetCssCode()));
    result.duration = DurationSimilarity(ExtractDuration(a.GetCssCode()),
                                         ExtractDuration(b.GetCssCode()));

    result.total = result.category * kCategoryWeight +
                   result.tech_stack * kTechStackWeight +
                   result.score_closeness * kScoreWeight +
                   result.style * kStyleWeight +
                   result.duration * kDurationWeight;

    result.total = std::max(0.0f, std::min(1.0f, result.total));
    return result;
}

std::set<std::string> SimilarityCalculator::ExtractStyleFeatures(const std::string& css) {
    std::set<std::string> features;
    if (css.empty()) {
        return features;
    }

    const std::string lowered = ToLowerAscii(css);

    for (const char* prop : {"transform", "opacity", "scale", "rotate", "translate"}) {
        if (lowered.find(prop) != std::string::npos) {
            features.insert(std::string("uses_") + prop);
        }
    }

    for (const char* effect : {"shadow", "gradient", "blur", "brightness"}) {
        if (lowered.find(effect) != std::string::npos) {
            features.insert(std::string("has_") + effect);
        }
    }

    // One easing family; ease-in-out first since it contains ease-in
    if (lowered.find("ease-in-out") != std::string::npos) {
        features.insert("easing_ease_in_out");
    } else if (lowered.find("ease-in") != std::string::npos) {
        features.insert("easing_ease_in");
    } else if (lowered.find("ease-out") != std::string::npos) {
        features.insert("easing_ease_out");
    }

    return features;
}

float SimilarityCalculator::StyleSimilarity(const std::set<std::string>& a,
                                            const std::set<std::string>& b) {
    size_t common = 0;
    for (const auto& feature : a) {
        if (b.count(feature) > 0) {
            ++common;
        }
    }

    size_t total = a.size() + b.size() - common;
    if (total == 0) {
        return 0.0f;
    }

    return static_cast<float>(common) / static_cast<float>(total);
}

std::optional<float> SimilarityCalculator::ExtractDuration(const std::string& css) {
    if (css.empty()) {
        return std::nullopt;
    }

    const std::string lowered = ToLowerAscii(css);

    // Quantifiers and the scanned window are bounded so that long runs of
    // whitespace or digits cannot exhaust the regex executor's stack
    static const size_t kValueWindow = 96;
    static const char* const kProperties[] = {"animation-duration", "transition-duration"};

    try {
        static const std::regex value_pattern(
            R"(^\s{0,32}:\s{0,32}(\d{1,9}(?:\.\d{1,9})?)(ms|s))");

        for (const char* property : kProperties) {
            const size_t property_length = std::char_traits<char>::length(property);
            for (size_t pos = lowered.find(property); pos != std::string::npos;
                 pos = lowered.find(property, pos + property_length)) {
                const std::string window = lowered.substr(pos + property_length, kValueWindow);
                std::smatch match;
                if (std::regex_search(window, match, value_pattern)) {
                    float value = std::stof(match[1].str());
                    if (match[2].str() == "ms") {
                        value /= 1000.0f;
                    }
                    return value;
                }
            }
        }
    } catch (const std::regex_error& e) {
        std::cerr << "[similarity] Duration pattern failed: " << e.what() << std::endl;
    }

    return std::nullopt;
}

float SimilarityCalculator::DurationSimilarity(std::optional<float> a, std::optional<float> b) {
    if (!a || !b) {
        return kNeutralDuration;
    }

    float max_duration = std::max(*a, *b);
    if (max_duration == 0.0f) {
        return 1.0f;
    }

    return std::max(0.0f, 1.0f - std::abs(*a - *b) / max_duration);
}

} // namespace motionrank
