// File: src/evaluation/code_heuristics.hpp
//
// Structural code heuristics used by the solution evaluator.
//
// Each heuristic inspects one or more code blobs for syntactic signals
// (token presence, construct counts, length bands) and returns a score
// in [0, 100], or an error when the blob cannot be analyzed.

#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace motionrank {

/// Outcome of a single heuristic
struct HeuristicResult {
    /// Score in [0, 100] when analysis succeeded
    std::optional<float> score;

    /// Reason for failure (empty on success)
    std::string error;

    static HeuristicResult Ok(float value);
    static HeuristicResult Failure(std::string message);

    bool IsOk() const { return score.has_value(); }
};

/// Read-only view of the code a heuristic may inspect
struct CodeView {
    const std::string& html;
    const std::string& css;
    const std::string& js;
    TechStack tech_stack;
};

/// Stateless collection of code heuristics
///
/// Blobs larger than max_analyzed_bytes are refused rather than scanned.
class CodeHeuristics {
public:
    explicit CodeHeuristics(size_t max_analyzed_bytes = 1 << 20);

    size_t GetMaxAnalyzedBytes() const { return max_analyzed_bytes_; }

    // ------------------------------------------------------------------
    // Quality
    // ------------------------------------------------------------------

    /// Markup structure (classes, ids) and stylesheet structure (keyframes, transitions)
    HeuristicResult CodeStructure(const CodeView& code) const;

    /// Easing functions, transform-based motion, will-change hints
    HeuristicResult AnimationSmoothness(const CodeView& code) const;

    /// Use of colour and visual effect properties
    HeuristicResult VisualAppeal(const CodeView& code) const;

    // ------------------------------------------------------------------
    // Performance
    // ------------------------------------------------------------------

    /// Compositor-friendly properties vs. layout-triggering ones
    HeuristicResult CodeEfficiency(const CodeView& code) const;

    /// Code size bands and external resource references
    HeuristicResult ResourceUsage(const CodeView& code) const;

    /// Modern layout features and vendor prefixes
    HeuristicResult BrowserSupport(const CodeView& code) const;

    // ------------------------------------------------------------------
    // Creativity
    // ------------------------------------------------------------------

    HeuristicResult Uniqueness(const CodeView& code) const;
    HeuristicResult Innovation(const CodeView& code) const;
    HeuristicResult ArtisticValue(const CodeView& code) const;

    // ------------------------------------------------------------------
    // Usability
    // ------------------------------------------------------------------

    /// Comments in any of the three blobs
    HeuristicResult Readability(const CodeView& code) const;

    /// Total code length band (500-2000 characters is ideal)
    HeuristicResult LengthBand(const CodeView& code) const;

    /// How simple the declared tech stack is to adopt
    HeuristicResult StackSimplicity(const CodeView& code) const;

    // ------------------------------------------------------------------
    // Compatibility
    // ------------------------------------------------------------------

    HeuristicResult ModernCss(const CodeView& code) const;
    HeuristicResult VendorPrefixes(const CodeView& code) const;
    HeuristicResult JsStandards(const CodeView& code) const;

private:
    /// Fails when a blob exceeds the analysis limit
    std::optional<std::string> CheckSize(const char* label, const std::string& blob) const;

    size_t max_analyzed_bytes_;
};

/// Lower-case ASCII copy of text
std::string ToLowerAscii(const std::string& text);

/// True if needle occurs in haystack
bool ContainsToken(const std::string& haystack, const std::string& needle);

} // namespace motionrank
