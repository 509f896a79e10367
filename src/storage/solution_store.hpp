// File: src/storage/solution_store.hpp
#pragma once

#include "core/solution.hpp"
#include "core/behavior_event.hpp"
#include <optional>
#include <string>
#include <vector>

namespace motionrank {

/// Storage statistics for monitoring
struct StoreStats {
    /// Number of solution records
    size_t total_solutions{0};

    /// Number of favorite entries
    size_t total_favorites{0};

    /// Number of journaled behavior events
    size_t total_events{0};

    /// Records skipped on the last LoadAll because they could not be decoded
    size_t skipped_records{0};

    /// Disk usage in bytes (persistent stores only)
    size_t disk_usage_bytes{0};
};

/// Abstract persistence boundary for solutions, favorites and behavior events
///
/// Repositories load everything once at startup and save one record per
/// write. LoadAll never fails as a whole: records that cannot be decoded are
/// skipped and counted.
class SolutionStore {
public:
    virtual ~SolutionStore() = default;

    // ========================================================================
    // Solutions
    // ========================================================================

    /// Load every decodable solution, in the order they were first saved
    /// @return Solutions; malformed records are skipped with a warning
    virtual std::vector<Solution> LoadAll() = 0;

    /// Insert or replace one solution
    /// @return true if persisted
    virtual bool Save(const Solution& solution) = 0;

    /// Delete one solution
    /// @return true if a record was removed
    virtual bool Remove(const SolutionID& id) = 0;

    // ========================================================================
    // Favorites
    // ========================================================================

    /// Ordered favorites list
    virtual std::vector<SolutionID> LoadFavorites() = 0;

    /// Replace the favorites list
    /// @return true if persisted
    virtual bool SaveFavorites(const std::vector<SolutionID>& favorites) = 0;

    // ========================================================================
    // Behavior journal
    // ========================================================================

    /// Append one behavior event
    /// @return true if persisted
    virtual bool AppendEvent(const BehaviorEvent& event) = 0;

    /// All journaled events, oldest first
    virtual std::vector<BehaviorEvent> LoadEvents() = 0;

    // ========================================================================
    // Maintenance
    // ========================================================================

    virtual StoreStats GetStats() const = 0;

    /// Remove everything
    virtual void Clear() = 0;
};

} // namespace motionrank
