// File: src/core/solution.cpp
#include "core/solution.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace motionrank {

namespace {

float ClampScore(float score) {
    return std::max(0.0f, std::min(100.0f, score));
}

} // anonymous namespace

// ============================================================================
// SolutionMetrics
// ============================================================================

SolutionMetrics::SolutionMetrics(float quality, float performance, float creativity,
                                 float usability, float compatibility)
    : quality_(ClampScore(quality)),
      performance_(ClampScore(performance)),
      creativity_(ClampScore(creativity)),
      usability_(ClampScore(usability)),
      compatibility_(ClampScore(compatibility)) {
    Recalculate();
}

void SolutionMetrics::SetQuality(float score) {
    quality_ = ClampScore(score);
    Recalculate();
}

void SolutionMetrics::SetPerformance(float score) {
    performance_ = ClampScore(score);
    Recalculate();
}

void SolutionMetrics::SetCreativity(float score) {
    creativity_ = ClampScore(score);
    Recalculate();
}

void SolutionMetrics::SetUsability(float score) {
    usability_ = ClampScore(score);
    Recalculate();
}

void SolutionMetrics::SetCompatibility(float score) {
    compatibility_ = ClampScore(score);
    Recalculate();
}

float SolutionMetrics::CalculateOverallScore(float quality, float performance, float creativity,
                                             float usability, float compatibility) {
    return quality * kQualityWeight +
           performance * kPerformanceWeight +
           creativity * kCreativityWeight +
           usability * kUsabilityWeight +
           compatibility * kCompatibilityWeight;
}

void SolutionMetrics::Recalculate() {
    overall_ = CalculateOverallScore(quality_, performance_, creativity_,
                                     usability_, compatibility_);
}

bool SolutionMetrics::operator==(const SolutionMetrics& other) const {
    return quality_ == other.quality_ &&
           performance_ == other.performance_ &&
           creativity_ == other.creativity_ &&
           usability_ == other.usability_ &&
           compatibility_ == other.compatibility_;
}

std::string SolutionMetrics::ToString() const {
    std::ostringstream oss;
    oss << "SolutionMetrics(quality=" << quality_
        << ", performance=" << performance_
        << ", creativity=" << creativity_
        << ", usability=" << usability_
        << ", compatibility=" << compatibility_
        << ", overall=" << overall_ << ")";
    return oss.str();
}

// ============================================================================
// Solution
// ============================================================================

Solution::Solution()
    : Solution(SolutionID::Generate()) {
}

Solution::Solution(SolutionID id)
    : id_(std::move(id)),
      created_at_(Timestamp::Now()),
      updated_at_(created_at_) {
}

void Solution::Touch() {
    updated_at_ = Timestamp::Now();
}

void Solution::SetHtmlCode(std::string code) {
    html_code_ = std::move(code);
    Touch();
}

void Solution::SetCssCode(std::string code) {
    css_code_ = std::move(code);
    Touch();
}

void Solution::SetJsCode(std::string code) {
    js_code_ = std::move(code);
    Touch();
}

void Solution::SetTechStack(TechStack stack) {
    tech_stack_ = stack;
    Touch();
}

void Solution::SetCategory(SolutionCategory category) {
    category_ = category;
    Touch();
}

void Solution::SetName(std::string name) {
    name_ = std::move(name);
    Touch();
}

void Solution::SetDescription(std::string description) {
    description_ = std::move(description);
    Touch();
}

void Solution::SetAuthor(std::string author) {
    author_ = std::move(author);
}

void Solution::SetTags(const std::vector<std::string>& tags) {
    tags_.clear();
    for (const auto& tag : tags) {
        AddTag(tag);
    }
}

bool Solution::AddTag(const std::string& tag) {
    if (HasTag(tag)) {
        return false;
    }
    tags_.push_back(tag);
    return true;
}

bool Solution::HasTag(const std::string& tag) const {
    return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
}

void Solution::SetMetrics(const SolutionMetrics& metrics) {
    metrics_ = metrics;
    quality_tier_ = DetermineQualityTier(metrics_.GetOverall());
    Touch();
}

void Solution::AddUserRating(float rating) {
    if (!(rating >= kMinRating && rating <= kMaxRating)) {
        throw std::invalid_argument("Rating must be between 0 and 5");
    }

    float total = stats_.user_rating * static_cast<float>(stats_.rating_count);
    stats_.rating_count += 1;
    stats_.user_rating = (total + rating) / static_cast<float>(stats_.rating_count);
    Touch();
}

void Solution::IncrementUsage() {
    stats_.usage_count += 1;
    Touch();
}

void Solution::AddFavorite() {
    stats_.favorite_count += 1;
    Touch();
}

void Solution::RemoveFavorite() {
    if (stats_.favorite_count > 0) {
        stats_.favorite_count -= 1;
    }
    Touch();
}

void Solution::RestoreInteractionStats(const InteractionStats& stats) {
    if (!(stats.user_rating >= kMinRating && stats.user_rating <= kMaxRating)) {
        throw std::invalid_argument("Stored rating out of range");
    }
    stats_ = stats;
}

bool Solution::AddChildID(const SolutionID& child) {
    if (std::find(child_ids_.begin(), child_ids_.end(), child) != child_ids_.end()) {
        return false;
    }
    child_ids_.push_back(child);
    return true;
}

Solution Solution::Clone() const {
    Solution copy(*this);
    copy.id_ = SolutionID::Generate();
    copy.created_at_ = Timestamp::Now();
    copy.updated_at_ = copy.created_at_;
    return copy;
}

bool Solution::HasSameContent(const Solution& other) const {
    return html_code_ == other.html_code_ &&
           css_code_ == other.css_code_ &&
           js_code_ == other.js_code_ &&
           tech_stack_ == other.tech_stack_ &&
           category_ == other.category_;
}

std::string Solution::ToString() const {
    std::ostringstream oss;
    oss << "Solution(" << id_.value() << ", \"" << name_ << "\", "
        << motionrank::ToString(category_) << ", "
        << motionrank::ToString(tech_stack_) << ", v" << version_
        << ", overall=" << metrics_.GetOverall() << ")";
    return oss.str();
}

QualityTier DetermineQualityTier(float overall_score) {
    if (overall_score >= 85.0f) {
        return QualityTier::EXCELLENT;
    }
    if (overall_score >= 70.0f) {
        return QualityTier::GOOD;
    }
    if (overall_score >= 50.0f) {
        return QualityTier::AVERAGE;
    }
    return QualityTier::POOR;
}

} // namespace motionrank
