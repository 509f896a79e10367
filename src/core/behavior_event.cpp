// File: src/core/behavior_event.cpp
#include "core/behavior_event.hpp"
#include <stdexcept>

namespace motionrank {

const char* ToString(ActionKind kind) {
    switch (kind) {
        case ActionKind::VIEW: return "view";
        case ActionKind::APPLY: return "apply";
        case ActionKind::FAVORITE: return "favorite";
        case ActionKind::RATE: return "rate";
        default: return "unknown";
    }
}

ActionKind ParseActionKind(const std::string& str) {
    if (str == "view") return ActionKind::VIEW;
    if (str == "apply") return ActionKind::APPLY;
    if (str == "favorite") return ActionKind::FAVORITE;
    if (str == "rate") return ActionKind::RATE;
    throw std::invalid_argument("Unknown ActionKind: " + str);
}

} // namespace motionrank
