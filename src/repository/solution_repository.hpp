// File: src/repository/solution_repository.hpp
#pragma once

#include "core/solution.hpp"
#include "evaluation/solution_evaluator.hpp"
#include "storage/solution_store.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace motionrank {

/// Search filters; every set field must match (AND)
struct SearchFilters {
    std::optional<SolutionCategory> category;
    std::optional<TechStack> tech_stack;

    /// Minimum overall score in [0, 100]
    std::optional<float> min_quality;

    /// Minimum user rating in [0, 5]
    std::optional<float> min_rating;
};

/// Aggregate view of the corpus
struct RepositoryStatistics {
    size_t total_solutions{0};
    size_t total_favorites{0};
    uint64_t total_usage{0};

    std::map<SolutionCategory, size_t> category_distribution;
    std::map<TechStack, size_t> tech_stack_distribution;
    std::map<QualityTier, size_t> quality_distribution;

    /// Mean overall score over all solutions
    float average_overall_score{0.0f};

    /// Mean rating over solutions with at least one rating
    float average_rating{0.0f};

    /// Highest overall score; empty for an empty corpus
    std::optional<SolutionID> top_solution;
};

/// SolutionRepository: Authoritative owner of the solution corpus
///
/// Holds every solution in memory, keyed by id, and mirrors each write to
/// the backing SolutionStore immediately. A failed store write is logged and
/// the in-memory state is kept. Projections return copies; callers mutate
/// solutions only through the operations below.
///
/// Sorting projections are stable, ties keep insertion order.
class SolutionRepository {
public:
    /// Load the corpus and favorites from the store
    /// @param store Backing store (must outlive the repository)
    /// @param evaluator Evaluator used by Add and Reevaluate
    SolutionRepository(SolutionStore& store, const SolutionEvaluator& evaluator);

    // ========================================================================
    // CRUD
    // ========================================================================

    /// Store a solution under its own id, replacing any previous record
    /// @param solution Solution to store
    /// @param auto_evaluate Compute metrics and quality tier before storing
    /// @return The solution id
    SolutionID Add(Solution solution, bool auto_evaluate = true);

    /// Replace an existing solution
    /// @return false if the id is unknown
    bool Update(const Solution& solution);

    /// Delete a solution and drop it from the favorites
    /// @return false if the id is unknown
    bool Remove(const SolutionID& id);

    std::optional<Solution> Get(const SolutionID& id) const;
    bool Contains(const SolutionID& id) const;

    /// All solutions in insertion order
    std::vector<Solution> All() const;

    size_t Size() const { return solutions_.size(); }

    // ========================================================================
    // Queries
    // ========================================================================

    /// Case-insensitive substring search over name, description and tags
    ///
    /// Filters are applied before ranking. Results are ordered by
    /// (10 name + 5 description + 3 per tag) x (1 + overall / 100).
    std::vector<Solution> Search(const std::string& query,
                                 const SearchFilters& filters = SearchFilters()) const;

    std::vector<Solution> GetByCategory(SolutionCategory category) const;
    std::vector<Solution> GetByQualityTier(QualityTier tier) const;

    /// Highest user rating first
    std::vector<Solution> TopRated(size_t limit = 10) const;

    /// Highest usage count first
    std::vector<Solution> MostUsed(size_t limit = 10) const;

    // ========================================================================
    // Favorites
    // ========================================================================

    /// Mark as favorite; a second call is a no-op
    /// @return false if the id is unknown
    bool AddToFavorites(const SolutionID& id);

    /// Unmark; the favorite counter never drops below zero
    /// @return false if the id was not a favorite
    bool RemoveFromFavorites(const SolutionID& id);

    /// Favorite solutions in the order they were marked
    std::vector<Solution> GetFavorites() const;

    bool IsFavorite(const SolutionID& id) const;

    // ========================================================================
    // Interaction updates
    // ========================================================================

    /// Fold a user rating into the solution
    /// @return false if the id is unknown
    /// @throws std::invalid_argument if rating is outside [0, 5]
    bool RateSolution(const SolutionID& id, float rating);

    /// Count one application of the solution
    /// @return false if the id is unknown
    bool RecordUsage(const SolutionID& id);

    /// Recompute metrics and quality tier
    /// @return false if the id is unknown
    bool Reevaluate(const SolutionID& id);

    RepositoryStatistics GetStatistics() const;

private:
    /// Write one solution through to the store, logging failures
    void Persist(const Solution& solution);

    /// Write the favorites list through to the store, logging failures
    void PersistFavorites();

    /// Copies of solutions matching a predicate, in insertion order
    template<typename Predicate>
    std::vector<Solution> Collect(Predicate predicate) const;

    SolutionStore& store_;
    const SolutionEvaluator& evaluator_;

    std::unordered_map<SolutionID, Solution, SolutionID::Hash> solutions_;

    /// Insertion order of ids in solutions_
    std::vector<SolutionID> order_;

    std::vector<SolutionID> favorites_;
};

} // namespace motionrank
