// File: src/core/behavior_event.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace motionrank {

// ActionKind: What the user did with a solution
enum class ActionKind : uint8_t {
    VIEW = 0,
    APPLY = 1,
    FAVORITE = 2,
    RATE = 3,
};

// Convert ActionKind to its wire name
const char* ToString(ActionKind kind);

// Parse ActionKind from its wire name
ActionKind ParseActionKind(const std::string& str);

// BehaviorEvent: One user interaction, immutable once recorded
struct BehaviorEvent {
    ActionKind action{ActionKind::VIEW};
    SolutionID solution_id;

    /// Category and tech stack of the solution at event time
    SolutionCategory category{SolutionCategory::EFFECT};
    TechStack tech_stack{TechStack::CSS_ANIMATION};

    /// Present only for RATE events
    std::optional<float> rating;

    Timestamp timestamp;
};

} // namespace motionrank
