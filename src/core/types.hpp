// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <chrono>
#include <optional>
#include <vector>

namespace motionrank {

// SolutionID: Globally unique identifier for solutions
// Text form of a random (version 4) UUID
class SolutionID {
public:
    // Default constructor creates invalid ID
    SolutionID() = default;

    // Explicit constructor from text form
    explicit SolutionID(std::string value) : value_(std::move(value)) {}

    // Generate new random ID
    static SolutionID Generate();

    // Check if ID is valid
    bool IsValid() const { return !value_.empty(); }

    // Get underlying value
    const std::string& value() const { return value_; }

    // Comparison operators
    bool operator==(const SolutionID& other) const { return value_ == other.value_; }
    bool operator!=(const SolutionID& other) const { return value_ != other.value_; }
    bool operator<(const SolutionID& other) const { return value_ < other.value_; }

    // String conversion for debugging
    std::string ToString() const;

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const SolutionID& id) const {
            return std::hash<std::string>()(id.value_);
        }
    };

private:
    std::string value_;
};

// TechStack: Declared implementation technology of a solution
enum class TechStack : uint8_t {
    CSS_ANIMATION = 0,   // Style-only animation
    JAVASCRIPT = 1,      // Scripted animation
    GSAP = 2,            // High-performance animation library
    THREE_JS = 3,        // 3D library
    SVG_ANIMATION = 4,   // Vector graphics
};

// All tech stacks in declaration order
const std::vector<TechStack>& AllTechStacks();

// Convert TechStack to its wire name
const char* ToString(TechStack stack);

// Parse TechStack from its wire name
TechStack ParseTechStack(const std::string& str);

// SolutionCategory: What kind of animation a solution is
enum class SolutionCategory : uint8_t {
    ENTRANCE = 0,
    EXIT = 1,
    TRANSITION = 2,
    INTERACTION = 3,
    EFFECT = 4,
    COMPOSITE = 5,
};

// All categories in declaration order
const std::vector<SolutionCategory>& AllCategories();

// Convert SolutionCategory to its wire name
const char* ToString(SolutionCategory category);

// Parse SolutionCategory from its wire name
SolutionCategory ParseSolutionCategory(const std::string& str);

// QualityTier: Coarse bucket derived from the overall score
enum class QualityTier : uint8_t {
    EXCELLENT = 0,   // overall >= 85
    GOOD = 1,        // overall >= 70
    AVERAGE = 2,     // overall >= 50
    POOR = 3,
};

// All tiers from best to worst
const std::vector<QualityTier>& AllQualityTiers();

// Convert QualityTier to its wire name
const char* ToString(QualityTier tier);

// Parse QualityTier from its wire name
QualityTier ParseQualityTier(const std::string& str);

// Timestamp: Microsecond-precision wall clock time point
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since epoch
    static Timestamp FromMicros(int64_t micros);

    // Parse an ISO-8601 timestamp ("2024-05-01T10:20:30[.ffffff][Z]", read as UTC)
    static std::optional<Timestamp> FromIso8601(const std::string& text);

    // Default constructor creates zero timestamp
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    // Format as ISO-8601 UTC with microseconds
    std::string ToIso8601() const;

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    // Shift by a duration
    Timestamp operator+(Duration d) const { return Timestamp(time_point_ + d); }
    Timestamp operator-(Duration d) const { return Timestamp(time_point_ - d); }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // String conversion
    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// Clock: Source of the current time, injectable for tests
using Clock = std::function<Timestamp()>;

// Default clock reading the system time
Clock SystemClock();

// Whole days elapsed between two timestamps (floor, never negative)
int64_t DaysBetween(const Timestamp& earlier, const Timestamp& later);

} // namespace motionrank
