#include <gtest/gtest.h>
#include <prettifier/format_registry.hpp>
#include <prettifier/regex_detector.hpp>
#include "test_helpers.hpp"

// ── FormatRegistry ─────────────────────────────────────────

TEST(FormatRegistryTest, HighestConfidenceWins) {
    FormatRegistry registry(0.5f);
    registry.register_detector(90, std::make_unique<StubDetector>("low", 0.6f));
    registry.register_detector(10, std::make_unique<StubDetector>("high", 0.8f));

    auto result = registry.detect(make_content_block({"anything"}, 0));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->format_id, "high");
    EXPECT_EQ(registry.detector_count(), 2u);
}

TEST(FormatRegistryTest, TiesGoToHigherPriority) {
    FormatRegistry registry(0.5f);
    registry.register_detector(10, std::make_unique<StubDetector>("late", 0.7f));
    registry.register_detector(60, std::make_unique<StubDetector>("early", 0.7f));

    auto result = registry.detect(make_content_block({"x"}, 0));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->format_id, "early");
}

TEST(FormatRegistryTest, EqualPriorityKeepsRegistrationOrder) {
    FormatRegistry registry(0.5f);
    registry.register_detector(50, std::make_unique<StubDetector>("first", 0.7f));
    registry.register_detector(50, std::make_unique<StubDetector>("second", 0.7f));

    EXPECT_EQ(registry.detect(make_content_block({"x"}, 0))->format_id, "first");
}

TEST(FormatRegistryTest, ThresholdGatesResult) {
    FormatRegistry registry(0.7f);
    registry.register_detector(50, std::make_unique<StubDetector>("json", 0.65f));

    auto block = make_content_block({"x"}, 0);
    EXPECT_FALSE(registry.detect(block).has_value());

    registry.set_confidence_threshold(0.65f);
    EXPECT_TRUE(registry.detect(block).has_value());
}

TEST(FormatRegistryTest, QuickMatchFailureSkipsDetector) {
    FormatRegistry registry(0.5f);
    registry.register_detector(50, std::make_unique<StubDetector>("skip", 1.0f, "", false));
    registry.register_detector(10, std::make_unique<StubDetector>("kept", 0.6f));

    EXPECT_EQ(registry.detect(make_content_block({"x"}, 0))->format_id, "kept");
}

TEST(FormatRegistryTest, RendererLookup) {
    FormatRegistry registry;
    auto calls = std::make_shared<int>(0);
    registry.register_renderer("json", std::make_unique<CountingRenderer>("json", calls));
    registry.register_renderer("diff", std::make_unique<CountingRenderer>("diff", calls));

    ASSERT_NE(registry.get_renderer("json"), nullptr);
    EXPECT_EQ(registry.get_renderer("json")->format_badge(), "[json]");
    EXPECT_EQ(registry.get_renderer("yaml"), nullptr);

    auto formats = registry.registered_formats();
    ASSERT_EQ(formats.size(), 2u);
    EXPECT_EQ(formats[0].first, "diff");
    EXPECT_EQ(formats[1].first, "json");
    EXPECT_EQ(registry.renderer_count(), 2u);
}

// ── RegexDetector ──────────────────────────────────────────

TEST(RegexDetectorTest, WeightsSumAndCap) {
    auto detector = RegexDetectorBuilder("toy", "Toy")
        .rule(DetectionRule("a", "^alpha", 0.5f, RuleScope::any_line(), RuleStrength::Strong))
        .rule(DetectionRule("b", "beta", 0.4f, RuleScope::any_line()))
        .rule(DetectionRule("c", "gamma", 0.4f, RuleScope::any_line()))
        .confidence_threshold(0.6f)
        .build();

    auto none = detector->detect(make_content_block({"alpha"}, 0));
    EXPECT_FALSE(none.has_value());

    auto two = detector->detect(make_content_block({"alpha", "beta"}, 0));
    ASSERT_TRUE(two.has_value());
    EXPECT_NEAR(two->confidence, 0.9f, 1e-5);
    EXPECT_EQ(two->matched_rules, (std::vector<std::string>{"a", "b"}));

    auto all = detector->detect(make_content_block({"alpha", "beta", "gamma"}, 0));
    ASSERT_TRUE(all.has_value());
    EXPECT_FLOAT_EQ(all->confidence, 1.0f);
}

TEST(RegexDetectorTest, MinMatchingRules) {
    auto detector = RegexDetectorBuilder("toy", "Toy")
        .rule(DetectionRule("big", "big", 0.9f, RuleScope::any_line()))
        .rule(DetectionRule("small", "small", 0.1f, RuleScope::any_line()))
        .min_matching_rules(2)
        .build();

    EXPECT_FALSE(detector->detect(make_content_block({"big"}, 0)).has_value());
    EXPECT_TRUE(detector->detect(make_content_block({"big small"}, 0)).has_value());
}

TEST(RegexDetectorTest, DefinitiveShortCircuit) {
    auto build = [](bool shortcircuit) {
        return RegexDetectorBuilder("toy", "Toy")
            .rule(DetectionRule("def", "^@@", 0.3f, RuleScope::any_line(), RuleStrength::Definitive))
            .rule(DetectionRule("extra", "x", 0.1f, RuleScope::any_line()))
            .confidence_threshold(0.6f)
            .definitive_rule_shortcircuit(shortcircuit)
            .build();
    };

    auto on = build(true)->detect(make_content_block({"x", "@@ -1 +1 @@"}, 0));
    ASSERT_TRUE(on.has_value());
    EXPECT_FLOAT_EQ(on->confidence, 1.0f);
    EXPECT_EQ(on->matched_rules, (std::vector<std::string>{"def"}));

    EXPECT_FALSE(build(false)->detect(make_content_block({"x", "@@ -1 +1 @@"}, 0)).has_value());
}

TEST(RegexDetectorTest, ScopesSelectLines) {
    auto detector = RegexDetectorBuilder("toy", "Toy")
        .rule(DetectionRule("head", "HEAD", 0.5f, RuleScope::first_lines(2)))
        .rule(DetectionRule("tail", "TAIL", 0.5f, RuleScope::last_lines(1)))
        .confidence_threshold(1.0f)
        .build();

    EXPECT_TRUE(detector->detect(make_content_block({"x", "HEAD", "y", "TAIL"}, 0)).has_value());
    EXPECT_FALSE(detector->detect(make_content_block({"x", "y", "HEAD", "TAIL"}, 0)).has_value());
    EXPECT_FALSE(detector->detect(make_content_block({"HEAD", "TAIL", "z"}, 0)).has_value());
}

TEST(RegexDetectorTest, FullBlockSpansLines) {
    auto detector = RegexDetectorBuilder("toy", "Toy")
        .rule(DetectionRule("pair", "open\\nclose", 1.0f, RuleScope::full_block()))
        .build();

    EXPECT_TRUE(detector->detect(make_content_block({"open", "close"}, 0)).has_value());
    EXPECT_FALSE(detector->detect(make_content_block({"open", "x", "close"}, 0)).has_value());
}

TEST(RegexDetectorTest, CommandContextGatesRule) {
    auto detector = RegexDetectorBuilder("toy", "Toy")
        .rule(DetectionRule("line", "value", 1.0f, RuleScope::any_line())
                  .with_command_context("^curl"))
        .rule(DetectionRule("cmd", "jq", 1.0f, RuleScope::preceding_command()))
        .build();

    EXPECT_FALSE(detector->detect(make_content_block({"value"}, 0)).has_value());
    EXPECT_FALSE(detector->detect(make_content_block({"value"}, 0, std::string("wget x"))).has_value());
    EXPECT_TRUE(detector->detect(make_content_block({"value"}, 0, std::string("curl x"))).has_value());
    EXPECT_TRUE(detector->detect(make_content_block({"nothing"}, 0, std::string("cat f | jq ."))).has_value());
}

TEST(RegexDetectorTest, DisabledRulesAreSkipped) {
    auto detector = RegexDetectorBuilder("toy", "Toy")
        .rule(DetectionRule("off", "hit", 1.0f, RuleScope::any_line(), RuleStrength::Strong).disabled())
        .build();

    auto block = make_content_block({"hit"}, 0);
    EXPECT_FALSE(detector->detect(block).has_value());
    EXPECT_FALSE(detector->quick_match(block.lines));

    EXPECT_TRUE(detector->set_rule_enabled("off", true));
    EXPECT_TRUE(detector->detect(block).has_value());
    EXPECT_FALSE(detector->set_rule_enabled("missing", true));
}

TEST(RegexDetectorTest, QuickMatchUsesStrongLineRulesOnly) {
    auto detector = RegexDetectorBuilder("toy", "Toy")
        .rule(DetectionRule("weak", "weak", 1.0f, RuleScope::any_line()))
        .rule(DetectionRule("whole", "whole", 1.0f, RuleScope::full_block(), RuleStrength::Strong))
        .rule(DetectionRule("strong", "^strong", 1.0f, RuleScope::first_lines(3), RuleStrength::Strong))
        .build();

    EXPECT_FALSE(detector->quick_match({"weak", "whole"}));
    EXPECT_TRUE(detector->quick_match({"x", "strong"}));

    std::vector<std::string> late(QUICK_MATCH_LINES, "x");
    late.push_back("strong");
    EXPECT_FALSE(detector->quick_match(late));
}
