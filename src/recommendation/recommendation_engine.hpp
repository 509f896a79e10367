// File: src/recommendation/recommendation_engine.hpp
#pragma once

#include "behavior/behavior_tracker.hpp"
#include "behavior/preference_model.hpp"
#include "similarity/similarity_calculator.hpp"
#include "storage/ttl_cache.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace motionrank {

/// Optional hints about what the user is working on
struct RecommendationContext {
    std::optional<SolutionCategory> target_category;
    std::optional<TechStack> preferred_tech;
    std::vector<std::string> keywords;

    /// True when no hint is set
    bool IsEmpty() const;

    /// Canonical text form, used in cache keys
    std::string ToString() const;
};

/// One ranked recommendation with its sub-scores, all in [0, 1]
struct RecommendationResult {
    SolutionID solution_id;
    float total_score{0.0f};
    float quality_score{0.0f};
    float preference_score{0.0f};
    float popularity_score{0.0f};
    float novelty_score{0.0f};
    float context_score{0.0f};

    /// Advisory text for display; not used in ranking
    std::string explanation;

    bool operator==(const RecommendationResult& other) const;
    bool operator!=(const RecommendationResult& other) const { return !(*this == other); }
};

/// Engine state for monitoring
struct EngineStatistics {
    size_t total_actions{0};
    PreferenceVector preferences;
    size_t cache_size{0};
    uint64_t cache_hits{0};
    uint64_t cache_misses{0};
};

/// Ranks candidate solutions for the current user
///
/// Score = 0.30 quality + 0.25 preference match + 0.20 popularity
///       + 0.15 novelty + 0.10 context match.
///
/// Results of Recommend() are cached by (sorted candidate ids, context,
/// limit) for the configured TTL. A cache hit returns the stored list even
/// if the candidates changed since; recording an interaction through the
/// engine clears the cache.
class RecommendationEngine {
public:
    static constexpr float kQualityWeight = 0.30f;
    static constexpr float kPreferenceWeight = 0.25f;
    static constexpr float kPopularityWeight = 0.20f;
    static constexpr float kNoveltyWeight = 0.15f;
    static constexpr float kContextWeight = 0.10f;

    struct Config {
        /// Lifetime of a cached recommendation list
        int64_t cache_ttl_seconds{3600};

        /// Maximum number of cached lists
        size_t cache_capacity{128};

        size_t default_limit{10};

        /// Window and limit used by the trending and similar overloads
        /// that take none
        int trending_window_days{7};
        size_t similar_limit{5};
    };

    /// Corpus-wide maxima used to normalize popularity
    struct PopularityBasis {
        uint32_t max_usage{0};
        uint32_t max_favorites{0};

        /// Highest rating among rated candidates; 5 when none is rated
        float max_rating{Solution::kMaxRating};

        static PopularityBasis From(const std::vector<Solution>& candidates);
    };

    /// @param tracker Behavior log (must outlive the engine)
    /// @param model Preference model over the same tracker (must outlive the engine)
    RecommendationEngine(BehaviorTracker& tracker, const PreferenceModel& model);
    RecommendationEngine(BehaviorTracker& tracker, const PreferenceModel& model,
                         const Config& config, Clock clock = SystemClock());

    /// Ranked recommendations, best first; ties keep candidate order
    /// @return At most limit results; empty for an empty candidate list
    std::vector<RecommendationResult> Recommend(const std::vector<Solution>& candidates,
                                                const RecommendationContext& context,
                                                size_t limit);

    /// Recommend with the configured default limit
    std::vector<RecommendationResult> Recommend(const std::vector<Solution>& candidates,
                                                const RecommendationContext& context = RecommendationContext());

    /// Recommend over candidates that clear the quality threshold and have a
    /// category weight above 0.3; all candidates are used when fewer than
    /// limit pass
    std::vector<RecommendationResult> GetPersonalizedRecommendations(
        const std::vector<Solution>& candidates, size_t limit);

    /// Most similar candidates to target, excluding target itself; uncached
    std::vector<std::pair<Solution, float>> GetSimilarSolutions(
        const Solution& target, const std::vector<Solution>& candidates, size_t limit) const;

    /// GetSimilarSolutions with the configured similar_limit
    std::vector<std::pair<Solution, float>> GetSimilarSolutions(
        const Solution& target, const std::vector<Solution>& candidates) const;

    /// Candidates ranked by recent usage, rating volume and favorites; uncached
    /// @param window_days Usage counts only if updated within this many days
    std::vector<Solution> GetTrendingSolutions(const std::vector<Solution>& candidates,
                                               int window_days, size_t limit) const;

    /// GetTrendingSolutions over the configured window, limited to default_limit
    std::vector<Solution> GetTrendingSolutions(const std::vector<Solution>& candidates) const;

    /// Record an interaction in the tracker and clear the cache
    /// @param rating Used only for ActionKind::RATE (0 when absent)
    /// @throws std::invalid_argument if a rating is outside [0, 5]
    void RecordInteraction(ActionKind action, const Solution& solution,
                           std::optional<float> rating = std::nullopt);

    void ClearCache();

    EngineStatistics GetStatistics() const;

    const Config& GetConfig() const { return config_; }

    // ========================================================================
    // Scoring components
    // ========================================================================

    /// Full score of one candidate
    RecommendationResult ScoreCandidate(const Solution& solution,
                                        const PreferenceVector& preferences,
                                        const PopularityBasis& basis,
                                        const RecommendationContext& context) const;

    static float PreferenceScore(const Solution& solution, const PreferenceVector& preferences);
    static float PopularityScore(const Solution& solution, const PopularityBasis& basis);

    /// 70% creation-age step, 30% inverse-log usage
    static float NoveltyScore(const Solution& solution, Timestamp now);

    /// 0.5 baseline plus category, tech stack and keyword bonuses, capped at 1
    static float ContextScore(const Solution& solution, const RecommendationContext& context);

    static std::string Explain(const Solution& solution, float quality, float preference,
                               float popularity, float novelty);

    /// Cache key of a Recommend call
    static std::string CacheKey(const std::vector<Solution>& candidates,
                                const RecommendationContext& context, size_t limit);

private:
    BehaviorTracker& tracker_;
    const PreferenceModel& model_;
    SimilarityCalculator similarity_;
    Config config_;
    Clock clock_;

    TtlCache<std::string, std::vector<RecommendationResult>> cache_;
};

} // namespace motionrank
