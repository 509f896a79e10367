// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <random>
#include <cstdio>
#include <ctime>
#include <cctype>

namespace motionrank {

// SolutionID implementations

SolutionID SolutionID::Generate() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t high = dist(rng);
    uint64_t low = dist(rng);

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (high & 0xFFFF) << '-'
        << std::setw(4) << (low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return SolutionID(oss.str());
}

std::string SolutionID::ToString() const {
    if (!IsValid()) {
        return "SolutionID(INVALID)";
    }
    return "SolutionID(" + value_ + ")";
}

// Enum implementations

const std::vector<TechStack>& AllTechStacks() {
    static const std::vector<TechStack> stacks = {
        TechStack::CSS_ANIMATION, TechStack::JAVASCRIPT, TechStack::GSAP,
        TechStack::THREE_JS, TechStack::SVG_ANIMATION,
    };
    return stacks;
}

const char* ToString(TechStack stack) {
    switch (stack) {
        case TechStack::CSS_ANIMATION: return "css_animation";
        case TechStack::JAVASCRIPT: return "javascript";
        case TechStack::GSAP: return "gsap";
        case TechStack::THREE_JS: return "three_js";
        case TechStack::SVG_ANIMATION: return "svg_animation";
        default: return "unknown";
    }
}

TechStack ParseTechStack(const std::string& str) {
    if (str == "css_animation") return TechStack::CSS_ANIMATION;
    if (str == "javascript") return TechStack::JAVASCRIPT;
    if (str == "gsap") return TechStack::GSAP;
    if (str == "three_js") return TechStack::THREE_JS;
    if (str == "svg_animation") return TechStack::SVG_ANIMATION;
    throw std::invalid_argument("Unknown TechStack: " + str);
}

const std::vector<SolutionCategory>& AllCategories() {
    static const std::vector<SolutionCategory> categories = {
        SolutionCategory::ENTRANCE, SolutionCategory::EXIT,
        SolutionCategory::TRANSITION, SolutionCategory::INTERACTION,
        SolutionCategory::EFFECT, SolutionCategory::COMPOSITE,
    };
    return categories;
}

const char* ToString(SolutionCategory category) {
    switch (category) {
        case SolutionCategory::ENTRANCE: return "entrance";
        case SolutionCategory::EXIT: return "exit";
        case SolutionCategory::TRANSITION: return "transition";
        case SolutionCategory::INTERACTION: return "interaction";
        case SolutionCategory::EFFECT: return "effect";
        case SolutionCategory::COMPOSITE: return "composite";
        default: return "unknown";
    }
}

SolutionCategory ParseSolutionCategory(const std::string& str) {
    if (str == "entrance") return SolutionCategory::ENTRANCE;
    if (str == "exit") return SolutionCategory::EXIT;
    if (str == "transition") return SolutionCategory::TRANSITION;
    if (str == "interaction") return SolutionCategory::INTERACTION;
    if (str == "effect") return SolutionCategory::EFFECT;
    if (str == "composite") return SolutionCategory::COMPOSITE;
    throw std::invalid_argument("Unknown SolutionCategory: " + str);
}

const std::vector<QualityTier>& AllQualityTiers() {
    static const std::vector<QualityTier> tiers = {
        QualityTier::EXCELLENT, QualityTier::GOOD,
        QualityTier::AVERAGE, QualityTier::POOR,
    };
    return tiers;
}

const char* ToString(QualityTier tier) {
    switch (tier) {
        case QualityTier::EXCELLENT: return "excellent";
        case QualityTier::GOOD: return "good";
        case QualityTier::AVERAGE: return "average";
        case QualityTier::POOR: return "poor";
        default: return "unknown";
    }
}

QualityTier ParseQualityTier(const std::string& str) {
    if (str == "excellent") return QualityTier::EXCELLENT;
    if (str == "good") return QualityTier::GOOD;
    if (str == "average") return QualityTier::AVERAGE;
    if (str == "poor") return QualityTier::POOR;
    throw std::invalid_argument("Unknown QualityTier: " + str);
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    // Truncate to the stored precision so persisted values compare equal
    auto since_epoch = ClockType::now().time_since_epoch();
    return FromMicros(std::chrono::duration_cast<Duration>(since_epoch).count());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

std::optional<Timestamp> Timestamp::FromIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60 ||
        hour < 0 || minute < 0 || second < 0) {
        return std::nullopt;
    }

    // Optional fractional seconds, padded or truncated to microseconds
    size_t pos = static_cast<size_t>(consumed);
    int64_t micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    time_t seconds = timegm(&tm);
    return FromMicros(static_cast<int64_t>(seconds) * 1000000 + micros);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::string Timestamp::ToIso8601() const {
    int64_t micros = ToMicros();
    int64_t seconds = micros / 1000000;
    int64_t remaining_micros = micros % 1000000;
    if (remaining_micros < 0) {
        remaining_micros += 1000000;
        --seconds;
    }

    time_t t = static_cast<time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << remaining_micros << 'Z';
    return oss.str();
}

std::string Timestamp::ToString() const {
    return "Timestamp(" + ToIso8601() + ")";
}

Clock SystemClock() {
    return [] { return Timestamp::Now(); };
}

int64_t DaysBetween(const Timestamp& earlier, const Timestamp& later) {
    auto elapsed = later - earlier;
    if (elapsed.count() <= 0) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::hours>(elapsed).count() / 24;
}

} // namespace motionrank
