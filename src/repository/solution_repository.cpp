// File: src/repository/solution_repository.cpp
#include "repository/solution_repository.hpp"
#include <algorithm>
#include <iostream>

namespace motionrank {

namespace {

bool ContainsIgnoreCase(const std::string& text, const std::string& lowered_query) {
    return ToLowerAscii(text).find(lowered_query) != std::string::npos;
}

std::vector<Solution> Truncate(std::vector<Solution> solutions, size_t limit) {
    if (solutions.size() > limit) {
        solutions.resize(limit);
    }
    return solutions;
}

} // anonymous namespace

SolutionRepository::SolutionRepository(SolutionStore& store, const SolutionEvaluator& evaluator)
    : store_(store), evaluator_(evaluator) {

    for (auto& solution : store_.LoadAll()) {
        SolutionID id = solution.GetID();
        if (solutions_.count(id) > 0) {
            std::cerr << "[repository] Duplicate record " << id.value() << " ignored" << std::endl;
            continue;
        }
        solutions_.emplace(id, std::move(solution));
        order_.push_back(id);
    }

    for (const auto& id : store_.LoadFavorites()) {
        if (std::find(favorites_.begin(), favorites_.end(), id) == favorites_.end()) {
            favorites_.push_back(id);
        }
    }
}

template<typename Predicate>
std::vector<Solution> SolutionRepository::Collect(Predicate predicate) const {
    std::vector<Solution> results;
    for (const auto& id : order_) {
        const Solution& solution = solutions_.at(id);
        if (predicate(solution)) {
            results.push_back(solution);
        }
    }
    return results;
}

// ============================================================================
// CRUD
// ============================================================================

SolutionID SolutionRepository::Add(Solution solution, bool auto_evaluate) {
    if (auto_evaluate) {
        solution.SetMetrics(evaluator_.Evaluate(solution));
    }

    SolutionID id = solution.GetID();

    auto it = solutions_.find(id);
    if (it != solutions_.end()) {
        it->second = std::move(solution);
    } else {
        it = solutions_.emplace(id, std::move(solution)).first;
        order_.push_back(id);
    }

    Persist(it->second);
    return id;
}

bool SolutionRepository::Update(const Solution& solution) {
    auto it = solutions_.find(solution.GetID());
    if (it == solutions_.end()) {
        return false;
    }

    it->second = solution;
    Persist(it->second);
    return true;
}

bool SolutionRepository::Remove(const SolutionID& id) {
    if (solutions_.erase(id) == 0) {
        return false;
    }

    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());

    if (!store_.Remove(id)) {
        std::cerr << "[repository] Failed to remove " << id.value() << " from store" << std::endl;
    }

    auto fav = std::find(favorites_.begin(), favorites_.end(), id);
    if (fav != favorites_.end()) {
        favorites_.erase(fav);
        PersistFavorites();
    }

    return true;
}

std::optional<Solution> SolutionRepository::Get(const SolutionID& id) const {
    auto it = solutions_.find(id);
    if (it == solutions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SolutionRepository::Contains(const SolutionID& id) const {
    return solutions_.find(id) != solutions_.end();
}

std::vector<Solution> SolutionRepository::All() const {
    return Collect([](const Solution&) { return true; });
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Solution> SolutionRepository::Search(const std::string& query,
                                                 const SearchFilters& filters) const {
    const std::string lowered = ToLowerAscii(query);

    struct Scored {
        float relevance;
        Solution solution;
    };
    std::vector<Scored> scored;

    for (const auto& id : order_) {
        const Solution& solution = solutions_.at(id);

        if (filters.category && solution.GetCategory() != *filters.category) continue;
        if (filters.tech_stack && solution.GetTechStack() != *filters.tech_stack) continue;
        if (filters.min_quality && solution.GetMetrics().GetOverall() < *filters.min_quality) continue;
        if (filters.min_rating && solution.GetUserRating() < *filters.min_rating) continue;

        bool name_match = ContainsIgnoreCase(solution.GetName(), lowered);
        bool description_match = ContainsIgnoreCase(solution.GetDescription(), lowered);
        size_t tag_matches = 0;
        for (const auto& tag : solution.GetTags()) {
            if (ContainsIgnoreCase(tag, lowered)) {
                ++tag_matches;
            }
        }

        if (!name_match && !description_match && tag_matches == 0) {
            continue;
        }

        float relevance = (name_match ? 10.0f : 0.0f) +
                          (description_match ? 5.0f : 0.0f) +
                          3.0f * static_cast<float>(tag_matches);
        relevance *= 1.0f + solution.GetMetrics().GetOverall() / 100.0f;

        scored.push_back({relevance, solution});
    }

    std::stable_sort(scored.begin(), scored.end(),
        [](const Scored& a, const Scored& b) { return a.relevance > b.relevance; });

    std::vector<Solution> results;
    results.reserve(scored.size());
    for (auto& entry : scored) {
        results.push_back(std::move(entry.solution));
    }
    return results;
}

std::vector<Solution> SolutionRepository::GetByCategory(SolutionCategory category) const {
    return Collect([category](const Solution& s) { return s.GetCategory() == category; });
}

std::vector<Solution> SolutionRepository::GetByQualityTier(QualityTier tier) const {
    return Collect([tier](const Solution& s) { return s.GetQualityTier() == tier; });
}

std::vector<Solution> SolutionRepository::TopRated(size_t limit) const {
    std::vector<Solution> results = All();
    std::stable_sort(results.begin(), results.end(),
        [](const Solution& a, const Solution& b) { return a.GetUserRating() > b.GetUserRating(); });
    return Truncate(std::move(results), limit);
}

std::vector<Solution> SolutionRepository::MostUsed(size_t limit) const {
    std::vector<Solution> results = All();
    std::stable_sort(results.begin(), results.end(),
        [](const Solution& a, const Solution& b) { return a.GetUsageCount() > b.GetUsageCount(); });
    return Truncate(std::move(results), limit);
}

// ============================================================================
// Favorites
// ============================================================================

bool SolutionRepository::AddToFavorites(const SolutionID& id) {
    auto it = solutions_.find(id);
    if (it == solutions_.end()) {
        return false;
    }

    if (IsFavorite(id)) {
        return true;
    }

    favorites_.push_back(id);
    it->second.AddFavorite();

    Persist(it->second);
    PersistFavorites();
    return true;
}

bool SolutionRepository::RemoveFromFavorites(const SolutionID& id) {
    auto fav = std::find(favorites_.begin(), favorites_.end(), id);
    if (fav == favorites_.end()) {
        return false;
    }

    favorites_.erase(fav);

    auto it = solutions_.find(id);
    if (it != solutions_.end()) {
        it->second.RemoveFavorite();
        Persist(it->second);
    }

    PersistFavorites();
    return true;
}

std::vector<Solution> SolutionRepository::GetFavorites() const {
    std::vector<Solution> results;
    for (const auto& id : favorites_) {
        auto it = solutions_.find(id);
        if (it != solutions_.end()) {
            results.push_back(it->second);
        }
    }
    return results;
}

bool SolutionRepository::IsFavorite(const SolutionID& id) const {
    return std::find(favorites_.begin(), favorites_.end(), id) != favorites_.end();
}

// ============================================================================
// Interaction updates
// ============================================================================

bool SolutionRepository::RateSolution(const SolutionID& id, float rating) {
    auto it = solutions_.find(id);
    if (it == solutions_.end()) {
        return false;
    }

    it->second.AddUserRating(rating);
    Persist(it->second);
    return true;
}

bool SolutionRepository::RecordUsage(const SolutionID& id) {
    auto it = solutions_.find(id);
    if (it == solutions_.end()) {
        return false;
    }

    it->second.IncrementUsage();
    Persist(it->second);
    return true;
}

bool SolutionRepository::Reevaluate(const SolutionID& id) {
    auto it = solutions_.find(id);
    if (it == solutions_.end()) {
        return false;
    }

    it->second.SetMetrics(evaluator_.Evaluate(it->second));
    Persist(it->second);
    return true;
}

// ============================================================================
// Statistics
// ============================================================================

RepositoryStatistics SolutionRepository::GetStatistics() const {
    RepositoryStatistics stats;
    stats.total_solutions = solutions_.size();
    stats.total_favorites = favorites_.size();

    for (auto category : AllCategories()) stats.category_distribution[category] = 0;
    for (auto stack : AllTechStacks()) stats.tech_stack_distribution[stack] = 0;
    for (auto tier : AllQualityTiers()) stats.quality_distribution[tier] = 0;

    if (solutions_.empty()) {
        return stats;
    }

    double overall_sum = 0.0;
    double rating_sum = 0.0;
    size_t rated = 0;
    const Solution* top = nullptr;

    for (const auto& id : order_) {
        const Solution& solution = solutions_.at(id);

        stats.total_usage += solution.GetUsageCount();
        ++stats.category_distribution[solution.GetCategory()];
        ++stats.tech_stack_distribution[solution.GetTechStack()];
        ++stats.quality_distribution[solution.GetQualityTier()];

        overall_sum += solution.GetMetrics().GetOverall();
        if (solution.GetRatingCount() > 0) {
            rating_sum += solution.GetUserRating();
            ++rated;
        }

        if (!top || solution.GetMetrics().GetOverall() > top->GetMetrics().GetOverall()) {
            top = &solution;
        }
    }

    stats.average_overall_score = static_cast<float>(overall_sum / stats.total_solutions);
    stats.average_rating = static_cast<float>(rating_sum / std::max<size_t>(1, rated));
    stats.top_solution = top->GetID();

    return stats;
}

// ============================================================================
// Persistence
// ============================================================================

void SolutionRepository::Persist(const Solution& solution) {
    if (!store_.Save(solution)) {
        std::cerr << "[repository] Failed to persist " << solution.GetID().value() << std::endl;
    }
}

void SolutionRepository::PersistFavorites() {
    if (!store_.SaveFavorites(favorites_)) {
        std::cerr << "[repository] Failed to persist favorites" << std::endl;
    }
}

} // namespace motionrank
