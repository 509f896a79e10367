// File: src/recommendation/recommendation_engine.cpp
#include "recommendation/recommendation_engine.hpp"
#include "evaluation/code_heuristics.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace motionrank {

namespace {

const char* DescribeTechStack(TechStack stack) {
    switch (stack) {
        case TechStack::CSS_ANIMATION: return "pure CSS, simple to drop in";
        case TechStack::JAVASCRIPT: return "JavaScript-driven, feature rich";
        case TechStack::GSAP: return "GSAP timeline, professional motion";
        case TechStack::THREE_JS: return "3D scene, visually striking";
        case TechStack::SVG_ANIMATION: return "vector animation, scales without loss";
        default: return "";
    }
}

float AgeStep(int64_t age_days) {
    if (age_days <= 7) return 1.0f;
    if (age_days <= 30) return 0.8f;
    if (age_days <= 90) return 0.5f;
    return 0.2f;
}

} // anonymous namespace

// ============================================================================
// RecommendationContext / RecommendationResult
// ============================================================================

bool RecommendationContext::IsEmpty() const {
    return !target_category && !preferred_tech && keywords.empty();
}

std::string RecommendationContext::ToString() const {
    std::ostringstream oss;
    oss << "category=" << (target_category ? motionrank::ToString(*target_category) : "")
        << ";tech=" << (preferred_tech ? motionrank::ToString(*preferred_tech) : "")
        << ";keywords=";
    // Length-prefixed so separators inside a keyword cannot alias
    for (const auto& keyword : keywords) {
        oss << keyword.size() << ':' << keyword;
    }
    return oss.str();
}

bool RecommendationResult::operator==(const RecommendationResult& other) const {
    return solution_id == other.solution_id &&
           total_score == other.total_score &&
           quality_score == other.quality_score &&
           preference_score == other.preference_score &&
           popularity_score == other.popularity_score &&
           novelty_score == other.novelty_score &&
           context_score == other.context_score &&
           explanation == other.explanation;
}

RecommendationEngine::PopularityBasis
RecommendationEngine::PopularityBasis::From(const std::vector<Solution>& candidates) {
    PopularityBasis basis;
    bool any_rated = false;
    float max_rating = 0.0f;

    for (const auto& solution : candidates) {
        basis.max_usage = std::max(basis.max_usage, solution.GetUsageCount());
        basis.max_favorites = std::max(basis.max_favorites, solution.GetFavoriteCount());
        if (solution.GetRatingCount() > 0) {
            max_rating = any_rated ? std::max(max_rating, solution.GetUserRating())
                                   : solution.GetUserRating();
            any_rated = true;
        }
    }

    if (any_rated) {
        basis.max_rating = max_rating;
    }
    return basis;
}

// ============================================================================
// Construction
// ============================================================================

RecommendationEngine::RecommendationEngine(BehaviorTracker& tracker, const PreferenceModel& model)
    : RecommendationEngine(tracker, model, Config(), tracker.GetClock()) {
}

RecommendationEngine::RecommendationEngine(BehaviorTracker& tracker, const PreferenceModel& model,
                                           const Config& config, Clock clock)
    : tracker_(tracker),
      model_(model),
      config_(config),
      clock_(std::move(clock)),
      cache_(config_.cache_capacity, std::chrono::seconds(config_.cache_ttl_seconds), clock_) {
}

// ============================================================================
// Recommendation
// ============================================================================

std::vector<RecommendationResult> RecommendationEngine::Recommend(
    const std::vector<Solution>& candidates, const RecommendationContext& context) {
    return Recommend(candidates, context, config_.default_limit);
}

std::vector<RecommendationResult> RecommendationEngine::Recommend(
    const std::vector<Solution>& candidates, const RecommendationContext& context, size_t limit) {

    if (candidates.empty() || limit == 0) {
        return {};
    }

    const std::string key = CacheKey(candidates, context, limit);
    if (auto cached = cache_.Get(key)) {
        return *cached;
    }

    const PreferenceVector preferences = model_.Derive();
    const PopularityBasis basis = PopularityBasis::From(candidates);

    std::vector<RecommendationResult> results;
    results.reserve(candidates.size());
    for (const auto& solution : candidates) {
        results.push_back(ScoreCandidate(solution, preferences, basis, context));
    }

    std::stable_sort(results.begin(), results.end(),
        [](const RecommendationResult& a, const RecommendationResult& b) {
            return a.total_score > b.total_score;
        });

    if (results.size() > limit) {
        results.resize(limit);
    }

    cache_.Put(key, results);
    return results;
}

std::vector<RecommendationResult> RecommendationEngine::GetPersonalizedRecommendations(
    const std::vector<Solution>& candidates, size_t limit) {

    const PreferenceVector preferences = model_.Derive();

    std::vector<Solution> filtered;
    for (const auto& solution : candidates) {
        if (solution.GetMetrics().GetOverall() >= preferences.quality_threshold * 100.0f &&
            preferences.CategoryWeight(solution.GetCategory()) > 0.3f) {
            filtered.push_back(solution);
        }
    }

    // Too few matches: fall back to the whole candidate list
    if (filtered.size() < limit) {
        return Recommend(candidates, RecommendationContext(), limit);
    }

    return Recommend(filtered, RecommendationContext(), limit);
}

std::vector<std::pair<Solution, float>> RecommendationEngine::GetSimilarSolutions(
    const Solution& target, const std::vector<Solution>& candidates, size_t limit) const {

    std::vector<std::pair<Solution, float>> similar;
    for (const auto& candidate : candidates) {
        if (candidate.GetID() == target.GetID()) {
            continue;
        }
        similar.emplace_back(candidate, similarity_.Compute(target, candidate));
    }

    std::stable_sort(similar.begin(), similar.end(),
        [](const std::pair<Solution, float>& a, const std::pair<Solution, float>& b) {
            return a.second > b.second;
        });

    if (similar.size() > limit) {
        similar.resize(limit);
    }
    return similar;
}

std::vector<std::pair<Solution, float>> RecommendationEngine::GetSimilarSolutions(
    const Solution& target, const std::vector<Solution>& candidates) const {
    return GetSimilarSolutions(target, candidates, config_.similar_limit);
}

std::vector<Solution> RecommendationEngine::GetTrendingSolutions(
    const std::vector<Solution>& candidates) const {
    return GetTrendingSolutions(candidates, config_.trending_window_days, config_.default_limit);
}

std::vector<Solution> RecommendationEngine::GetTrendingSolutions(
    const std::vector<Solution>& candidates, int window_days, size_t limit) const {

    const Timestamp cutoff = clock_() - std::chrono::hours(24) * window_days;

    std::vector<std::pair<float, size_t>> trend;
    trend.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        const Solution& solution = candidates[i];

        float recent_usage = solution.GetUpdatedAt() >= cutoff
            ? static_cast<float>(solution.GetUsageCount()) : 0.0f;
        float rating_volume = solution.GetUserRating() * static_cast<float>(solution.GetRatingCount());
        float favorites = static_cast<float>(solution.GetFavoriteCount());

        trend.emplace_back(recent_usage * 0.5f + rating_volume * 0.3f + favorites * 0.2f, i);
    }

    std::stable_sort(trend.begin(), trend.end(),
        [](const std::pair<float, size_t>& a, const std::pair<float, size_t>& b) {
            return a.first > b.first;
        });

    std::vector<Solution> results;
    for (size_t i = 0; i < trend.size() && i < limit; ++i) {
        results.push_back(candidates[trend[i].second]);
    }
    return results;
}

// ============================================================================
// Interaction and maintenance
// ============================================================================

void RecommendationEngine::RecordInteraction(ActionKind action, const Solution& solution,
                                             std::optional<float> rating) {
    switch (action) {
        case ActionKind::VIEW:
            tracker_.TrackView(solution);
            break;
        case ActionKind::APPLY:
            tracker_.TrackApply(solution);
            break;
        case ActionKind::FAVORITE:
            tracker_.TrackFavorite(solution);
            break;
        case ActionKind::RATE:
            tracker_.TrackRating(solution, rating.value_or(0.0f));
            break;
    }

    cache_.Clear();
}

void RecommendationEngine::ClearCache() {
    cache_.Clear();
}

EngineStatistics RecommendationEngine::GetStatistics() const {
    EngineStatistics stats;
    stats.total_actions = tracker_.GetEventCount();
    stats.preferences = model_.Derive();
    stats.cache_size = cache_.Size();
    stats.cache_hits = cache_.Hits();
    stats.cache_misses = cache_.Misses();
    return stats;
}

// ============================================================================
// Scoring components
// ============================================================================

RecommendationResult RecommendationEngine::ScoreCandidate(const Solution& solution,
                                                          const PreferenceVector& preferences,
                                                          const PopularityBasis& basis,
                                                          const RecommendationContext& context) const {
    RecommendationResult result;
    result.solution_id = solution.GetID();
    result.quality_score = solution.GetMetrics().GetOverall() / 100.0f;
    result.preference_score = PreferenceScore(solution, preferences);
    result.popularity_score = PopularityScore(solution, basis);
    result.novelty_score = NoveltyScore(solution, clock_());
    result.context_score = ContextScore(solution, context);

    result.total_score = result.quality_score * kQualityWeight +
                         result.preference_score * kPreferenceWeight +
                         result.popularity_score * kPopularityWeight +
                         result.novelty_score * kNoveltyWeight +
                         result.context_score * kContextWeight;

    result.explanation = Explain(solution, result.quality_score, result.preference_score,
                                 result.popularity_score, result.novelty_score);
    return result;
}

float RecommendationEngine::PreferenceScore(const Solution& solution,
                                            const PreferenceVector& preferences) {
    float overall = solution.GetMetrics().GetOverall();

    float category = preferences.CategoryWeight(solution.GetCategory());
    float tech = preferences.TechStackWeight(solution.GetTechStack());
    float quality_match = overall >= preferences.quality_threshold * 100.0f ? 1.0f : 0.5f;
    float complexity_match = 1.0f - std::abs(overall / 100.0f - preferences.complexity_appetite);

    return category * 0.4f + tech * 0.3f + quality_match * 0.2f + complexity_match * 0.1f;
}

float RecommendationEngine::PopularityScore(const Solution& solution, const PopularityBasis& basis) {
    float usage = static_cast<float>(solution.GetUsageCount()) /
                  static_cast<float>(std::max<uint32_t>(1, basis.max_usage));

    float rating = 0.5f;  // unrated
    if (solution.GetRatingCount() > 0) {
        rating = basis.max_rating > 0.0f ? solution.GetUserRating() / basis.max_rating : 0.0f;
    }

    float favorites = static_cast<float>(solution.GetFavoriteCount()) /
                      static_cast<float>(std::max<uint32_t>(1, basis.max_favorites));

    return usage * 0.5f + rating * 0.3f + favorites * 0.2f;
}

float RecommendationEngine::NoveltyScore(const Solution& solution, Timestamp now) {
    float time_novelty = AgeStep(DaysBetween(solution.GetCreatedAt(), now));
    float usage_novelty = 1.0f / (1.0f + std::log(static_cast<float>(solution.GetUsageCount()) + 1.0f));
    return time_novelty * 0.7f + usage_novelty * 0.3f;
}

float RecommendationEngine::ContextScore(const Solution& solution,
                                         const RecommendationContext& context) {
    if (context.IsEmpty()) {
        return 0.5f;
    }

    float score = 0.5f;

    if (context.target_category && solution.GetCategory() == *context.target_category) {
        score += 0.3f;
    }

    if (context.preferred_tech && solution.GetTechStack() == *context.preferred_tech) {
        score += 0.2f;
    }

    if (!context.keywords.empty()) {
        const std::string description = ToLowerAscii(solution.GetDescription());
        size_t matched = std::count_if(context.keywords.begin(), context.keywords.end(),
            [&](const std::string& kw) {
                return description.find(ToLowerAscii(kw)) != std::string::npos;
            });
        score += 0.3f * static_cast<float>(matched) / static_cast<float>(context.keywords.size());
    }

    return std::min(1.0f, score);
}

std::string RecommendationEngine::Explain(const Solution& solution, float quality, float preference,
                                          float popularity, float novelty) {
    std::vector<std::string> parts;

    if (quality > 0.8f) {
        parts.push_back("high-quality solution");
    } else if (quality > 0.6f) {
        parts.push_back("good quality");
    }

    if (preference > 0.7f) {
        parts.push_back("matches your preferences");
    }

    if (popularity > 0.7f) {
        parts.push_back("popular choice");
    } else if (solution.GetUsageCount() > 10) {
        parts.push_back("proven solution");
    }

    if (novelty > 0.8f) {
        parts.push_back("fresh idea");
    }

    std::string tech = DescribeTechStack(solution.GetTechStack());
    if (!tech.empty()) {
        parts.push_back(tech);
    }

    if (parts.empty()) {
        return "recommended solution";
    }

    std::string text = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        text += ", " + parts[i];
    }
    return text;
}

std::string RecommendationEngine::CacheKey(const std::vector<Solution>& candidates,
                                           const RecommendationContext& context, size_t limit) {
    std::vector<std::string> ids;
    ids.reserve(candidates.size());
    for (const auto& solution : candidates) {
        ids.push_back(solution.GetID().value());
    }
    std::sort(ids.begin(), ids.end());

    std::ostringstream oss;
    for (const auto& id : ids) {
        oss << id << ',';
    }
    oss << '|' << context.ToString() << '|' << limit;
    return oss.str();
}

} // namespace motionrank
