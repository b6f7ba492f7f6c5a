#pragma once

#include <string>
#include <vector>
#include <regex>
#include <optional>
#include "format_registry.hpp"

// Which part of a block a rule is matched against.
struct RuleScope {
    enum Kind {
        AnyLine,
        FirstLines,
        LastLines,
        FullBlock,          // lines joined with '\n'
        PrecedingCommand,
    };

    Kind kind = AnyLine;
    size_t count = 0;       // FirstLines / LastLines only

    static RuleScope any_line() { return {AnyLine, 0}; }
    static RuleScope first_lines(size_t n) { return {FirstLines, n}; }
    static RuleScope last_lines(size_t n) { return {LastLines, n}; }
    static RuleScope full_block() { return {FullBlock, 0}; }
    static RuleScope preceding_command() { return {PrecedingCommand, 0}; }
};

enum class RuleStrength {
    Supporting,     // adds weight, never used by quick_match
    Strong,
    Definitive,     // may short-circuit detection at confidence 1.0
};

struct DetectionRule {
    std::string id;
    std::string pattern_source;
    std::regex pattern;
    float weight = 0.0f;
    RuleScope scope;
    RuleStrength strength = RuleStrength::Supporting;
    std::optional<std::regex> command_context;  // rule only counts after a matching command
    bool enabled = true;

    DetectionRule(std::string id, const std::string& pattern, float weight,
                  RuleScope scope, RuleStrength strength = RuleStrength::Supporting);

    DetectionRule& with_command_context(const std::string& pattern);
    DetectionRule& disabled();
};

// Weighted-rule detector. Confidence is the sum of matched weights capped
// at 1.0.
class RegexDetector : public ContentDetector {
public:
    RegexDetector(std::string format_id, std::string display_name,
                  std::vector<DetectionRule> rules, float confidence_threshold,
                  size_t min_matching_rules, bool definitive_shortcircuit);

    const std::string& format_id() const override { return format_id_; }
    const std::string& display_name() const override { return display_name_; }

    std::optional<DetectionResult> detect(const ContentBlock& block) const override;

    // Strong/Definitive rules scoped to AnyLine or FirstLines only.
    bool quick_match(const std::vector<std::string>& first_lines) const override;

    const std::vector<DetectionRule>& rules() const { return rules_; }
    float confidence_threshold() const { return confidence_threshold_; }

    // Enable or disable a rule by id. False if no such rule.
    bool set_rule_enabled(const std::string& rule_id, bool enabled);

private:
    std::string format_id_;
    std::string display_name_;
    std::vector<DetectionRule> rules_;
    float confidence_threshold_;
    size_t min_matching_rules_;
    bool definitive_shortcircuit_;

    bool rule_matches(const DetectionRule& rule, const ContentBlock& block,
                      const std::string& full_text) const;
};

class RegexDetectorBuilder {
public:
    RegexDetectorBuilder(std::string format_id, std::string display_name);

    RegexDetectorBuilder& rule(DetectionRule rule);
    RegexDetectorBuilder& confidence_threshold(float threshold);
    RegexDetectorBuilder& min_matching_rules(size_t min);
    RegexDetectorBuilder& definitive_rule_shortcircuit(bool enabled);

    std::unique_ptr<RegexDetector> build();

private:
    std::string format_id_;
    std::string display_name_;
    std::vector<DetectionRule> rules_;
    float confidence_threshold_ = 0.6f;
    size_t min_matching_rules_ = 1;
    bool definitive_shortcircuit_ = true;
};
