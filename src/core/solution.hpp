// File: src/core/solution.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace motionrank {

// SolutionMetrics: Five dimension scores in [0, 100] plus the derived overall score
//
// The overall score is never set directly; every dimension setter recomputes it.
class SolutionMetrics {
public:
    // Fixed top-level weights
    static constexpr float kQualityWeight = 0.30f;
    static constexpr float kPerformanceWeight = 0.25f;
    static constexpr float kCreativityWeight = 0.20f;
    static constexpr float kUsabilityWeight = 0.15f;
    static constexpr float kCompatibilityWeight = 0.10f;

    SolutionMetrics() = default;
    SolutionMetrics(float quality, float performance, float creativity,
                    float usability, float compatibility);

    // Getters
    float GetQuality() const { return quality_; }
    float GetPerformance() const { return performance_; }
    float GetCreativity() const { return creativity_; }
    float GetUsability() const { return usability_; }
    float GetCompatibility() const { return compatibility_; }
    float GetOverall() const { return overall_; }

    // Setters clamp to [0, 100] and recompute the overall score
    void SetQuality(float score);
    void SetPerformance(float score);
    void SetCreativity(float score);
    void SetUsability(float score);
    void SetCompatibility(float score);

    // Weighted combination of the five dimensions
    static float CalculateOverallScore(float quality, float performance, float creativity,
                                       float usability, float compatibility);

    bool operator==(const SolutionMetrics& other) const;
    bool operator!=(const SolutionMetrics& other) const { return !(*this == other); }

    std::string ToString() const;

private:
    void Recalculate();

    float quality_{0.0f};
    float performance_{0.0f};
    float creativity_{0.0f};
    float usability_{0.0f};
    float compatibility_{0.0f};
    float overall_{0.0f};
};

// InteractionStats: User-driven counters of a solution
struct InteractionStats {
    /// Running mean of all ratings, in [0, 5]
    float user_rating{0.0f};

    /// Number of ratings folded into user_rating
    uint32_t rating_count{0};

    /// Number of times the solution was favorited
    uint32_t favorite_count{0};

    /// Number of times the solution was applied
    uint32_t usage_count{0};
};

// Solution: A generated animation artifact (markup + style + behavior code)
// with its metadata, quality metrics and version lineage
class Solution {
public:
    static constexpr float kMinRating = 0.0f;
    static constexpr float kMaxRating = 5.0f;

    // Constructors
    Solution();
    explicit Solution(SolutionID id);

    // Identity
    const SolutionID& GetID() const { return id_; }

    // Content
    const std::string& GetHtmlCode() const { return html_code_; }
    const std::string& GetCssCode() const { return css_code_; }
    const std::string& GetJsCode() const { return js_code_; }
    TechStack GetTechStack() const { return tech_stack_; }
    SolutionCategory GetCategory() const { return category_; }

    void SetHtmlCode(std::string code);
    void SetCssCode(std::string code);
    void SetJsCode(std::string code);
    void SetTechStack(TechStack stack);
    void SetCategory(SolutionCategory category);

    // Descriptive metadata
    const std::string& GetName() const { return name_; }
    const std::string& GetDescription() const { return description_; }
    const std::vector<std::string>& GetTags() const { return tags_; }
    const std::string& GetAuthor() const { return author_; }
    Timestamp GetCreatedAt() const { return created_at_; }
    Timestamp GetUpdatedAt() const { return updated_at_; }

    void SetName(std::string name);
    void SetDescription(std::string description);
    void SetAuthor(std::string author);

    /// Replace all tags; duplicates are dropped, first occurrence wins
    void SetTags(const std::vector<std::string>& tags);

    /// Add a tag
    /// @return false if the tag was already present
    bool AddTag(const std::string& tag);

    bool HasTag(const std::string& tag) const;

    void SetCreatedAt(Timestamp t) { created_at_ = t; }
    void SetUpdatedAt(Timestamp t) { updated_at_ = t; }

    // Preview references
    const std::optional<std::string>& GetThumbnailPath() const { return thumbnail_path_; }
    const std::optional<std::string>& GetPreviewPath() const { return preview_path_; }
    void SetThumbnailPath(std::optional<std::string> path) { thumbnail_path_ = std::move(path); }
    void SetPreviewPath(std::optional<std::string> path) { preview_path_ = std::move(path); }

    // Metrics
    const SolutionMetrics& GetMetrics() const { return metrics_; }
    QualityTier GetQualityTier() const { return quality_tier_; }

    /// Replace metrics and re-derive the quality tier from the overall score
    void SetMetrics(const SolutionMetrics& metrics);

    /// Override the stored tier (used when restoring persisted records)
    void SetQualityTier(QualityTier tier) { quality_tier_ = tier; }

    // User interaction
    float GetUserRating() const { return stats_.user_rating; }
    uint32_t GetRatingCount() const { return stats_.rating_count; }
    uint32_t GetFavoriteCount() const { return stats_.favorite_count; }
    uint32_t GetUsageCount() const { return stats_.usage_count; }
    const InteractionStats& GetInteractionStats() const { return stats_; }

    /// Fold a rating into the running mean
    /// @param rating Rating in [0, 5]
    /// @throws std::invalid_argument if rating is out of range; counters are unchanged
    void AddUserRating(float rating);

    void IncrementUsage();
    void AddFavorite();

    /// Decrement the favorite counter, never below zero
    void RemoveFavorite();

    /// Restore counters from a persisted record
    /// @throws std::invalid_argument if the stored rating is out of range
    void RestoreInteractionStats(const InteractionStats& stats);

    // Versioning
    const std::string& GetVersion() const { return version_; }
    const std::optional<SolutionID>& GetParentID() const { return parent_id_; }
    const std::vector<SolutionID>& GetChildIDs() const { return child_ids_; }

    void SetVersion(std::string version) { version_ = std::move(version); }
    void SetParentID(std::optional<SolutionID> parent) { parent_id_ = std::move(parent); }

    /// Add a child id
    /// @return false if it was already present
    bool AddChildID(const SolutionID& child);

    /// Copy of this solution with a fresh id and fresh timestamps
    Solution Clone() const;

    /// True if code, stack and category are identical
    bool HasSameContent(const Solution& other) const;

    std::string ToString() const;

private:
    void Touch();

    SolutionID id_;

    std::string html_code_;
    std::string css_code_;
    std::string js_code_;
    TechStack tech_stack_{TechStack::CSS_ANIMATION};
    SolutionCategory category_{SolutionCategory::EFFECT};

    std::string name_{"Untitled solution"};
    std::string description_;
    std::vector<std::string> tags_;
    std::string author_{"AI generated"};
    Timestamp created_at_;
    Timestamp updated_at_;

    std::optional<std::string> thumbnail_path_;
    std::optional<std::string> preview_path_;

    SolutionMetrics metrics_;
    QualityTier quality_tier_{QualityTier::AVERAGE};
    InteractionStats stats_;

    std::string version_{"1.0.0"};
    std::optional<SolutionID> parent_id_;
    std::vector<SolutionID> child_ids_;
};

/// Map an overall score onto its quality tier
QualityTier DetermineQualityTier(float overall_score);

} // namespace motionrank
