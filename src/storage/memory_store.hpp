// File: src/storage/memory_store.hpp
#pragma once

#include "storage/solution_store.hpp"
#include <unordered_map>

namespace motionrank {

/// In-memory solution store
///
/// Keeps records in a hash map plus insertion order. Nothing survives the
/// process; used for tests and throwaway sessions.
class MemoryStore : public SolutionStore {
public:
    MemoryStore() = default;
    ~MemoryStore() override = default;

    std::vector<Solution> LoadAll() override;
    bool Save(const Solution& solution) override;
    bool Remove(const SolutionID& id) override;

    std::vector<SolutionID> LoadFavorites() override;
    bool SaveFavorites(const std::vector<SolutionID>& favorites) override;

    bool AppendEvent(const BehaviorEvent& event) override;
    std::vector<BehaviorEvent> LoadEvents() override;

    StoreStats GetStats() const override;
    void Clear() override;

    /// Number of Save calls (including replacements)
    size_t GetWriteCount() const { return write_count_; }

private:
    std::unordered_map<SolutionID, Solution, SolutionID::Hash> solutions_;
    std::vector<SolutionID> order_;
    std::vector<SolutionID> favorites_;
    std::vector<BehaviorEvent> events_;
    size_t write_count_{0};
};

} // namespace motionrank
