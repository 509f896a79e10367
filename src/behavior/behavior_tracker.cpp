// File: src/behavior/behavior_tracker.cpp
#include "behavior/behavior_tracker.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace motionrank {

BehaviorTracker::BehaviorTracker(Clock clock)
    : clock_(std::move(clock)) {
}

BehaviorTracker::BehaviorTracker(SolutionStore& journal, Clock clock)
    : clock_(std::move(clock)), journal_(&journal), events_(journal.LoadEvents()) {
}

void BehaviorTracker::TrackView(const Solution& solution) {
    Record(ActionKind::VIEW, solution, std::nullopt);
}

void BehaviorTracker::TrackApply(const Solution& solution) {
    Record(ActionKind::APPLY, solution, std::nullopt);
}

void BehaviorTracker::TrackFavorite(const Solution& solution) {
    Record(ActionKind::FAVORITE, solution, std::nullopt);
}

void BehaviorTracker::TrackRating(const Solution& solution, float rating) {
    if (!(rating >= Solution::kMinRating && rating <= Solution::kMaxRating)) {
        throw std::invalid_argument("Rating must be within [0, 5]");
    }
    Record(ActionKind::RATE, solution, rating);
}

void BehaviorTracker::Record(ActionKind action, const Solution& solution,
                             std::optional<float> rating) {
    BehaviorEvent event;
    event.action = action;
    event.solution_id = solution.GetID();
    event.category = solution.GetCategory();
    event.tech_stack = solution.GetTechStack();
    event.rating = rating;
    event.timestamp = clock_();

    events_.push_back(event);

    if (journal_ && !journal_->AppendEvent(event)) {
        std::cerr << "[behavior] Failed to journal " << ToString(action)
                  << " event for " << event.solution_id.value() << std::endl;
    }
}

std::vector<ActionKind> BehaviorTracker::GetInteractions(const SolutionID& id) const {
    std::vector<ActionKind> actions;
    for (const auto& event : events_) {
        if (event.solution_id == id) {
            actions.push_back(event.action);
        }
    }
    return actions;
}

uint32_t BehaviorTracker::EventWeight(const BehaviorEvent& event) {
    switch (event.action) {
        case ActionKind::VIEW: return kViewWeight;
        case ActionKind::APPLY: return kApplyWeight;
        case ActionKind::FAVORITE: return kFavoriteWeight;
        case ActionKind::RATE:
            // rating / 5 * 5, rounded to the nearest point
            return event.rating ? static_cast<uint32_t>(std::lround(*event.rating)) : 0;
        default: return 0;
    }
}

std::map<SolutionCategory, uint32_t> BehaviorTracker::CategoryCounters() const {
    std::map<SolutionCategory, uint32_t> counters;
    for (auto category : AllCategories()) {
        counters[category] = 0;
    }
    for (const auto& event : events_) {
        counters[event.category] += EventWeight(event);
    }
    return counters;
}

std::map<TechStack, uint32_t> BehaviorTracker::TechStackCounters() const {
    std::map<TechStack, uint32_t> counters;
    for (auto stack : AllTechStacks()) {
        counters[stack] = 0;
    }
    for (const auto& event : events_) {
        counters[event.tech_stack] += EventWeight(event);
    }
    return counters;
}

} // namespace motionrank
