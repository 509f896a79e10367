// File: src/evaluation/code_heuristics.cpp
#include "evaluation/code_heuristics.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace motionrank {

namespace {

float Clamp100(float score) {
    return std::max(0.0f, std::min(100.0f, score));
}

} // anonymous namespace

HeuristicResult HeuristicResult::Ok(float value) {
    HeuristicResult result;
    result.score = Clamp100(value);
    return result;
}

HeuristicResult HeuristicResult::Failure(std::string message) {
    HeuristicResult result;
    result.error = std::move(message);
    return result;
}

std::string ToLowerAscii(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool ContainsToken(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

CodeHeuristics::CodeHeuristics(size_t max_analyzed_bytes)
    : max_analyzed_bytes_(max_analyzed_bytes) {
}

std::optional<std::string> CodeHeuristics::CheckSize(const char* label,
                                                     const std::string& blob) const {
    if (blob.size() > max_analyzed_bytes_) {
        return std::string(label) + " code exceeds analysis limit (" +
               std::to_string(blob.size()) + " > " +
               std::to_string(max_analyzed_bytes_) + " bytes)";
    }
    return std::nullopt;
}

// ============================================================================
// Quality
// ============================================================================

HeuristicResult CodeHeuristics::CodeStructure(const CodeView& code) const {
    if (auto err = CheckSize("html", code.html)) return HeuristicResult::Failure(*err);
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    float score = 50.0f;

    if (!code.html.empty()) {
        if (ContainsToken(code.html, "<div") && ContainsToken(code.html, "class=")) {
            score += 10.0f;
        }
        if (ContainsToken(code.html, "id=")) {
            score += 5.0f;
        }
    }

    if (!code.css.empty()) {
        if (ContainsToken(code.css, "@keyframes")) {
            score += 15.0f;
        }
        if (ContainsToken(code.css, "transition")) {
            score += 10.0f;
        }
        if (ContainsToken(code.css, "{") && ContainsToken(code.css, "}")) {
            score += 5.0f;
        }
    }

    return HeuristicResult::Ok(score);
}

HeuristicResult CodeHeuristics::AnimationSmoothness(const CodeView& code) const {
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    const std::string css = ToLowerAscii(code.css);
    float score = 60.0f;

    // "ease" also covers ease-in, ease-out and ease-in-out
    if (ContainsToken(css, "ease") || ContainsToken(css, "cubic-bezier")) {
        score += 8.0f;
    }
    if (ContainsToken(css, "transform")) {
        score += 15.0f;
    }
    if (ContainsToken(css, "will-change")) {
        score += 10.0f;
    }

    return HeuristicResult::Ok(score);
}

HeuristicResult CodeHeuristics::VisualAppeal(const CodeView& code) const {
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    const std::string css = ToLowerAscii(code.css);
    float score = 50.0f;

    for (const char* keyword : {"color", "background", "gradient", "shadow"}) {
        if (ContainsToken(css, keyword)) {
            score += 5.0f;
        }
    }
    for (const char* effect : {"shadow", "gradient", "opacity", "blur", "scale"}) {
        if (ContainsToken(css, effect)) {
            score += 6.0f;
        }
    }

    return HeuristicResult::Ok(score);
}

// ============================================================================
// Performance
// ============================================================================

HeuristicResult CodeHeuristics::CodeEfficiency(const CodeView& code) const {
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    float score = 70.0f;

    if (!code.css.empty()) {
        const std::string css = ToLowerAscii(code.css);

        for (const char* prop : {"transform", "opacity", "filter"}) {
            if (ContainsToken(css, prop)) {
                score += 5.0f;
            }
        }
        // Animating these forces layout
        for (const char* prop : {"left:", "top:", "width:", "height:"}) {
            if (ContainsToken(css, prop)) {
                score -= 3.0f;
            }
        }
    }

    return HeuristicResult::Ok(score);
}

HeuristicResult CodeHeuristics::ResourceUsage(const CodeView& code) const {
    if (auto err = CheckSize("html", code.html)) return HeuristicResult::Failure(*err);
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    float score = 80.0f;
    size_t total_size = code.html.size() + code.css.size();

    if (total_size < 1000) {
        score += 10.0f;
    } else if (total_size > 5000) {
        score -= 10.0f;
    }

    if (ContainsToken(code.html, "http://") || ContainsToken(code.html, "https://")) {
        score -= 5.0f;
    }

    return HeuristicResult::Ok(score);
}

HeuristicResult CodeHeuristics::BrowserSupport(const CodeView& code) const {
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    float score = 75.0f;

    if (!code.css.empty()) {
        const std::string css = ToLowerAscii(code.css);
        for (const char* feature : {"grid", "flexbox", "calc("}) {
            if (ContainsToken(css, feature)) {
                score += 3.0f;
            }
        }
        if (ContainsToken(css, "-webkit-") || ContainsToken(css, "-moz-")) {
            score += 5.0f;
        }
    }

    return HeuristicResult::Ok(score);
}

// ============================================================================
// Creativity
// ============================================================================

HeuristicResult CodeHeuristics::Uniqueness(const CodeView& code) const {
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    const std::string css = ToLowerAscii(code.css);
    float score = 50.0f;

    for (const char* feature : {"clip-path", "mask", "filter", "backdrop-filter"}) {
        if (ContainsToken(css, feature)) {
            score += 10.0f;
        }
    }

    return HeuristicResult::Ok(score);
}

HeuristicResult CodeHeuristics::Innovation(const CodeView& code) const {
    float score = 50.0f;

    switch (code.tech_stack) {
        case TechStack::THREE_JS: score += 20.0f; break;
        case TechStack::GSAP: score += 15.0f; break;
        case TechStack::SVG_ANIMATION: score += 10.0f; break;
        case TechStack::CSS_ANIMATION: score += 5.0f; break;
        case TechStack::JAVASCRIPT: break;
    }

    return HeuristicResult::Ok(score);
}

HeuristicResult CodeHeuristics::ArtisticValue(const CodeView& code) const {
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    const std::string css = ToLowerAscii(code.css);
    float score = 50.0f;

    for (const char* element : {"gradient", "shadow", "border-radius", "opacity"}) {
        if (ContainsToken(css, element)) {
            score += 5.0f;
        }
    }

    return HeuristicResult::Ok(score);
}

// ============================================================================
// Usability
// ============================================================================

HeuristicResult CodeHeuristics::Readability(const CodeView& code) const {
    if (auto err = CheckSize("html", code.html)) return HeuristicResult::Failure(*err);
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);
    if (auto err = CheckSize("js", code.js)) return HeuristicResult::Failure(*err);

    float score = 60.0f;

    if (ContainsToken(code.html, "<!--")) {
        score += 20.0f;
    }
    if (ContainsToken(code.css, "/*")) {
        score += 10.0f;
    }
    if (ContainsToken(code.js, "//") || ContainsToken(code.js, "/*")) {
        score += 10.0f;
    }

    return HeuristicResult::Ok(score);
}

HeuristicResult CodeHeuristics::LengthBand(const CodeView& code) const {
    size_t total_length = code.html.size() + code.css.size() + code.js.size();

    if (total_length >= 500 && total_length <= 2000) {
        return HeuristicResult::Ok(100.0f);
    }
    if (total_length < 500) {
        return HeuristicResult::Ok(80.0f);
    }
    if (total_length <= 3000) {
        return HeuristicResult::Ok(70.0f);
    }
    return HeuristicResult::Ok(50.0f);
}

HeuristicResult CodeHeuristics::StackSimplicity(const CodeView& code) const {
    switch (code.tech_stack) {
        case TechStack::CSS_ANIMATION: return HeuristicResult::Ok(100.0f);
        case TechStack::SVG_ANIMATION: return HeuristicResult::Ok(80.0f);
        case TechStack::JAVASCRIPT: return HeuristicResult::Ok(70.0f);
        case TechStack::GSAP: return HeuristicResult::Ok(60.0f);
        case TechStack::THREE_JS: return HeuristicResult::Ok(40.0f);
    }
    return HeuristicResult::Failure("unknown tech stack");
}

// ============================================================================
// Compatibility
// ============================================================================

HeuristicResult CodeHeuristics::ModernCss(const CodeView& code) const {
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    const std::string css = ToLowerAscii(code.css);
    float score = 50.0f;

    for (const char* feature : {"grid", "flex", "transform", "transition", "animation"}) {
        if (ContainsToken(css, feature)) {
            score += 10.0f;
        }
    }

    return HeuristicResult::Ok(score);
}

HeuristicResult CodeHeuristics::VendorPrefixes(const CodeView& code) const {
    if (auto err = CheckSize("css", code.css)) return HeuristicResult::Failure(*err);

    const std::string css = ToLowerAscii(code.css);
    float score = 60.0f;

    for (const char* prefix : {"-webkit-", "-moz-", "-ms-", "-o-"}) {
        if (ContainsToken(css, prefix)) {
            score += 10.0f;
        }
    }

    return HeuristicResult::Ok(score);
}

HeuristicResult CodeHeuristics::JsStandards(const CodeView& code) const {
    if (auto err = CheckSize("js", code.js)) return HeuristicResult::Failure(*err);

    // Nothing scripted, nothing to break
    if (code.js.empty()) {
        return HeuristicResult::Ok(80.0f);
    }

    float score = 60.0f;
    if (ContainsToken(code.js, "const ") || ContainsToken(code.js, "let ")) {
        score += 20.0f;
    }
    if (ContainsToken(code.js, "querySelector")) {
        score += 20.0f;
    }

    return HeuristicResult::Ok(score);
}

} // namespace motionrank
