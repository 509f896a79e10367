// File: src/storage/memory_store.cpp
#include "storage/memory_store.hpp"
#include <algorithm>

namespace motionrank {

std::vector<Solution> MemoryStore::LoadAll() {
    std::vector<Solution> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(solutions_.at(id));
    }
    return result;
}

bool MemoryStore::Save(const Solution& solution) {
    ++write_count_;

    auto it = solutions_.find(solution.GetID());
    if (it != solutions_.end()) {
        it->second = solution;
        return true;
    }

    solutions_.emplace(solution.GetID(), solution);
    order_.push_back(solution.GetID());
    return true;
}

bool MemoryStore::Remove(const SolutionID& id) {
    if (solutions_.erase(id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

std::vector<SolutionID> MemoryStore::LoadFavorites() {
    return favorites_;
}

bool MemoryStore::SaveFavorites(const std::vector<SolutionID>& favorites) {
    favorites_ = favorites;
    return true;
}

bool MemoryStore::AppendEvent(const BehaviorEvent& event) {
    events_.push_back(event);
    return true;
}

std::vector<BehaviorEvent> MemoryStore::LoadEvents() {
    return events_;
}

StoreStats MemoryStore::GetStats() const {
    StoreStats stats;
    stats.total_solutions = solutions_.size();
    stats.total_favorites = favorites_.size();
    stats.total_events = events_.size();
    return stats;
}

void MemoryStore::Clear() {
    solutions_.clear();
    order_.clear();
    favorites_.clear();
    events_.clear();
    write_count_ = 0;
}

} // namespace motionrank
