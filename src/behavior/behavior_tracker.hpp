// File: src/behavior/behavior_tracker.hpp
#pragma once

#include "core/behavior_event.hpp"
#include "core/solution.hpp"
#include "storage/solution_store.hpp"
#include <map>
#include <vector>

namespace motionrank {

/// Append-only log of user interactions with solutions
///
/// The per-category and per-tech-stack counters are derived from the log on
/// every call; nothing is updated incrementally. Counter contributions:
/// view 1, apply 3, favorite 2, rate round(rating).
class BehaviorTracker {
public:
    static constexpr uint32_t kViewWeight = 1;
    static constexpr uint32_t kApplyWeight = 3;
    static constexpr uint32_t kFavoriteWeight = 2;

    /// In-memory tracker
    explicit BehaviorTracker(Clock clock = SystemClock());

    /// Tracker journaling every event to a store
    ///
    /// Events already in the journal are loaded into the log.
    /// @param journal Store receiving events (must outlive the tracker)
    BehaviorTracker(SolutionStore& journal, Clock clock = SystemClock());

    void TrackView(const Solution& solution);
    void TrackApply(const Solution& solution);
    void TrackFavorite(const Solution& solution);

    /// @param rating Rating in [0, 5]
    /// @throws std::invalid_argument if rating is out of range; nothing is recorded
    void TrackRating(const Solution& solution, float rating);

    /// Full event log, oldest first
    const std::vector<BehaviorEvent>& GetEvents() const { return events_; }

    size_t GetEventCount() const { return events_.size(); }

    /// Action kinds recorded for one solution, oldest first
    std::vector<ActionKind> GetInteractions(const SolutionID& id) const;

    /// Weighted counter per category (every category present)
    std::map<SolutionCategory, uint32_t> CategoryCounters() const;

    /// Weighted counter per tech stack (every stack present)
    std::map<TechStack, uint32_t> TechStackCounters() const;

    /// Counter contribution of one event
    static uint32_t EventWeight(const BehaviorEvent& event);

    /// Time source used for event timestamps
    const Clock& GetClock() const { return clock_; }

private:
    void Record(ActionKind action, const Solution& solution, std::optional<float> rating);

    Clock clock_;
    SolutionStore* journal_{nullptr};
    std::vector<BehaviorEvent> events_;
};

} // namespace motionrank
