// File: src/core/solution_producer.hpp
#pragma once

#include "core/solution.hpp"
#include <map>
#include <string>

namespace motionrank {

/// Upstream source of new solutions (code generators, template expanders)
///
/// Produced solutions carry code blobs plus a declared tech stack and
/// category. Their code is only ever inspected structurally, by the
/// evaluator.
class SolutionProducer {
public:
    virtual ~SolutionProducer() = default;

    /// Produce a solution for a free-text description
    /// @param description What the animation should do
    /// @param constraints Named constraints such as "tech_stack" or "category"
    virtual Solution Produce(const std::string& description,
                             const std::map<std::string, std::string>& constraints) = 0;

    virtual std::string GetName() const = 0;
};

} // namespace motionrank
