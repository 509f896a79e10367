// File: tests/evaluation/code_heuristics_test.cpp
#include "evaluation/code_heuristics.hpp"
#include <gtest/gtest.h>

namespace motionrank {
namespace {

class CodeHeuristicsTest : public ::testing::Test {
protected:
    CodeView View(TechStack stack = TechStack::CSS_ANIMATION) const {
        return CodeView{html_, css_, js_, stack};
    }

    CodeHeuristics heuristics_;
    std::string html_;
    std::string css_;
    std::string js_;
};

// ============================================================================
// Helper Tests
// ============================================================================

TEST(CodeHelpersTest, LowerCasesAscii) {
    EXPECT_EQ("clip-path: url(#a)", ToLowerAscii("Clip-Path: URL(#a)"));
}

TEST(CodeHelpersTest, ContainsTokenIsSubstringMatch) {
    EXPECT_TRUE(ContainsToken("transform: scale(2)", "scale"));
    EXPECT_FALSE(ContainsToken("opacity: 1", "scale"));
}

// ============================================================================
// Quality
// ============================================================================

TEST_F(CodeHeuristicsTest, CodeStructureRewardsClassesAndKeyframes) {
    html_ = "<div class=\"box\" id=\"hero\"></div>";
    EXPECT_FLOAT_EQ(65.0f, *heuristics_.CodeStructure(View()).score);

    css_ = "@keyframes spin { to { transform: rotate(1turn); } } .box { transition: all 1s; }";
    EXPECT_FLOAT_EQ(95.0f, *heuristics_.CodeStructure(View()).score);
}

TEST_F(CodeHeuristicsTest, AnimationSmoothnessSignals) {
    EXPECT_FLOAT_EQ(60.0f, *heuristics_.AnimationSmoothness(View()).score);

    css_ = ".a { transition: transform 1s cubic-bezier(.2,.8,.2,1); will-change: transform; }";
    EXPECT_FLOAT_EQ(93.0f, *heuristics_.AnimationSmoothness(View()).score);
}

TEST_F(CodeHeuristicsTest, VisualAppealIsClamped) {
    css_ = ".a { color: red; background: linear-gradient(red, blue); box-shadow: 0 0 4px;"
           " opacity: .5; filter: blur(2px); transform: scale(1.1); }";
    EXPECT_FLOAT_EQ(100.0f, *heuristics_.VisualAppeal(View()).score);
}

// ============================================================================
// Performance
// ============================================================================

TEST_F(CodeHeuristicsTest, CodeEfficiencyPenalizesLayoutProperties) {
    css_ = ".a { left: 0; top: 0; width: 10px; height: 10px; }";
    EXPECT_FLOAT_EQ(58.0f, *heuristics_.CodeEfficiency(View()).score);

    css_ = ".a { transform: translateX(0); opacity: 0; }";
    EXPECT_FLOAT_EQ(80.0f, *heuristics_.CodeEfficiency(View()).score);
}

TEST_F(CodeHeuristicsTest, ResourceUsageBands) {
    EXPECT_FLOAT_EQ(90.0f, *heuristics_.ResourceUsage(View()).score);

    html_ = std::string(6000, 'x') + "<img src=\"https://cdn.example.com/a.png\">";
    EXPECT_FLOAT_EQ(65.0f, *heuristics_.ResourceUsage(View()).score);
}

// ============================================================================
// Creativity
// ============================================================================

TEST_F(CodeHeuristicsTest, InnovationFollowsTechStack) {
    EXPECT_FLOAT_EQ(70.0f, *heuristics_.Innovation(View(TechStack::THREE_JS)).score);
    EXPECT_FLOAT_EQ(65.0f, *heuristics_.Innovation(View(TechStack::GSAP)).score);
    EXPECT_FLOAT_EQ(60.0f, *heuristics_.Innovation(View(TechStack::SVG_ANIMATION)).score);
    EXPECT_FLOAT_EQ(55.0f, *heuristics_.Innovation(View(TechStack::CSS_ANIMATION)).score);
    EXPECT_FLOAT_EQ(50.0f, *heuristics_.Innovation(View(TechStack::JAVASCRIPT)).score);
}

TEST_F(CodeHeuristicsTest, UniquenessCountsRareProperties) {
    css_ = ".a { clip-path: circle(50%); backdrop-filter: blur(4px); }";
    // clip-path, filter (inside backdrop-filter) and backdrop-filter
    EXPECT_FLOAT_EQ(80.0f, *heuristics_.Uniqueness(View()).score);
}

// ============================================================================
// Usability
// ============================================================================

TEST_F(CodeHeuristicsTest, LengthBandBoundaries) {
    html_ = std::string(499, 'a');
    EXPECT_FLOAT_EQ(80.0f, *heuristics_.LengthBand(View()).score);

    html_ = std::string(500, 'a');
    EXPECT_FLOAT_EQ(100.0f, *heuristics_.LengthBand(View()).score);

    html_ = std::string(2001, 'a');
    EXPECT_FLOAT_EQ(70.0f, *heuristics_.LengthBand(View()).score);

    html_ = std::string(3001, 'a');
    EXPECT_FLOAT_EQ(50.0f, *heuristics_.LengthBand(View()).score);
}

TEST_F(CodeHeuristicsTest, ReadabilityRewardsComments) {
    html_ = "<!-- hero -->";
    css_ = "/* fade */";
    js_ = "// go";
    EXPECT_FLOAT_EQ(100.0f, *heuristics_.Readability(View()).score);
}

TEST_F(CodeHeuristicsTest, StackSimplicityOrdering) {
    EXPECT_FLOAT_EQ(100.0f, *heuristics_.StackSimplicity(View(TechStack::CSS_ANIMATION)).score);
    EXPECT_FLOAT_EQ(40.0f, *heuristics_.StackSimplicity(View(TechStack::THREE_JS)).score);
}

// ============================================================================
// Compatibility
// ============================================================================

TEST_F(CodeHeuristicsTest, JsStandardsEmptyScriptIsSafe) {
    EXPECT_FLOAT_EQ(80.0f, *heuristics_.JsStandards(View()).score);

    js_ = "var x = 1;";
    EXPECT_FLOAT_EQ(60.0f, *heuristics_.JsStandards(View()).score);

    js_ = "const el = document.querySelector('.a');";
    EXPECT_FLOAT_EQ(100.0f, *heuristics_.JsStandards(View()).score);
}

TEST_F(CodeHeuristicsTest, VendorPrefixesCounted) {
    css_ = ".a { -webkit-transform: none; -moz-transform: none; }";
    EXPECT_FLOAT_EQ(80.0f, *heuristics_.VendorPrefixes(View()).score);
}

// ============================================================================
// Failure Tests
// ============================================================================

TEST(CodeHeuristicsLimitTest, OversizedBlobFails) {
    CodeHeuristics heuristics(8);
    std::string html;
    std::string css = ".box { opacity: 0; }";
    std::string js;
    CodeView view{html, css, js, TechStack::CSS_ANIMATION};

    HeuristicResult result = heuristics.ModernCss(view);
    EXPECT_FALSE(result.IsOk());
    EXPECT_NE(std::string::npos, result.error.find("css"));

    // Stack-only heuristics never read the blobs
    EXPECT_TRUE(heuristics.Innovation(view).IsOk());
}

} // namespace
} // namespace motionrank
