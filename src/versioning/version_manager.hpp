// File: src/versioning/version_manager.hpp
#pragma once

#include "core/solution.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace motionrank {

/// One recorded version of a solution lineage
struct VersionEntry {
    /// Snapshot of the solution at this version (own id, parent = lineage root)
    Solution snapshot;

    /// Free-text description of what changed
    std::string change_description;

    /// When the version was recorded
    Timestamp recorded_at;
};

/// Version lineage manager
///
/// Every CreateVersion call snapshots a clone of the solution into the
/// lineage keyed by the solution's id. The first version is 1.0.0; each
/// following one bumps the patch component. History is append-only.
class VersionManager {
public:
    /// Version assigned to the first entry of a lineage
    static constexpr const char* kInitialVersion = "1.0.0";

    /// Version used when the previous one cannot be parsed
    static constexpr const char* kFallbackVersion = "1.0.1";

    VersionManager() = default;

    /// Record a new version of a solution
    /// @param solution Live solution; it is cloned, never stored by reference
    /// @param change_description What changed in this version
    /// @return The version string assigned to the new entry
    std::string CreateVersion(const Solution& solution,
                              const std::string& change_description = "");

    /// Ordered history of a lineage (oldest first); empty if unknown
    std::vector<VersionEntry> GetVersionHistory(const SolutionID& id) const;

    /// Latest snapshot of a lineage
    std::optional<Solution> GetLatestVersion(const SolutionID& id) const;

    /// Fresh clone of a historical version
    /// @return Clone with a new id, or std::nullopt if the version is not recorded
    std::optional<Solution> RollbackToVersion(const SolutionID& id,
                                              const std::string& version) const;

    /// Number of versions recorded for a lineage
    size_t GetVersionCount(const SolutionID& id) const;

    /// Bump the patch component of "M.N.P"
    /// @return Next version, or kFallbackVersion when version is malformed
    static std::string IncrementVersion(const std::string& version);

private:
    std::unordered_map<SolutionID, std::vector<VersionEntry>, SolutionID::Hash> history_;
};

} // namespace motionrank
