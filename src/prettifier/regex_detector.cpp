#include "regex_detector.hpp"
#include <core/log.hpp>
#include <algorithm>

DetectionRule::DetectionRule(std::string rule_id, const std::string& pattern_str, float w,
                             RuleScope s, RuleStrength st)
    : id(std::move(rule_id)),
      pattern_source(pattern_str),
      pattern(pattern_str),
      weight(w),
      scope(s),
      strength(st) {}

DetectionRule& DetectionRule::with_command_context(const std::string& pattern_str) {
    command_context = std::regex(pattern_str);
    return *this;
}

DetectionRule& DetectionRule::disabled() {
    enabled = false;
    return *this;
}

// ── RegexDetector ───────────────────────────────────────────

RegexDetector::RegexDetector(std::string format_id, std::string display_name,
                             std::vector<DetectionRule> rules, float confidence_threshold,
                             size_t min_matching_rules, bool definitive_shortcircuit)
    : format_id_(std::move(format_id)),
      display_name_(std::move(display_name)),
      rules_(std::move(rules)),
      confidence_threshold_(confidence_threshold),
      min_matching_rules_(min_matching_rules),
      definitive_shortcircuit_(definitive_shortcircuit) {}

static bool any_line_matches(const std::regex& re, const std::vector<std::string>& lines) {
    return std::any_of(lines.begin(), lines.end(),
                       [&re](const std::string& l) { return std::regex_search(l, re); });
}

bool RegexDetector::rule_matches(const DetectionRule& rule, const ContentBlock& block,
                                 const std::string& full_text) const {
    switch (rule.scope.kind) {
        case RuleScope::AnyLine:
            return any_line_matches(rule.pattern, block.lines);
        case RuleScope::FirstLines:
            return any_line_matches(rule.pattern, block.first_lines(rule.scope.count));
        case RuleScope::LastLines:
            return any_line_matches(rule.pattern, block.last_lines(rule.scope.count));
        case RuleScope::FullBlock:
            return std::regex_search(full_text, rule.pattern);
        case RuleScope::PrecedingCommand:
            return block.preceding_command &&
                   std::regex_search(*block.preceding_command, rule.pattern);
    }
    return false;
}

std::optional<DetectionResult> RegexDetector::detect(const ContentBlock& block) const {
    float total_weight = 0.0f;
    std::vector<std::string> matched;
    std::string full_text = block.full_text();

    for (const auto& rule : rules_) {
        if (!rule.enabled) continue;

        if (rule.command_context) {
            if (!block.preceding_command) continue;
            if (!std::regex_search(*block.preceding_command, *rule.command_context)) continue;
        }

        if (!rule_matches(rule, block, full_text)) continue;

        total_weight += rule.weight;
        matched.push_back(rule.id);

        if (definitive_shortcircuit_ && rule.strength == RuleStrength::Definitive) {
            DetectionResult result;
            result.format_id = format_id_;
            result.confidence = 1.0f;
            result.matched_rules = {rule.id};
            return result;
        }
    }

    if (matched.size() < min_matching_rules_) {
        return std::nullopt;
    }

    float confidence = std::min(total_weight, 1.0f);
    if (confidence < confidence_threshold_) {
        prettify_log(fmt::format("detect {}: conf={:.2} < thresh={:.2}, matched={}",
                                 format_id_, confidence, confidence_threshold_, matched.size()));
        return std::nullopt;
    }

    DetectionResult result;
    result.format_id = format_id_;
    result.confidence = confidence;
    result.matched_rules = std::move(matched);
    return result;
}

bool RegexDetector::quick_match(const std::vector<std::string>& first_lines) const {
    size_t limit = std::min(first_lines.size(), QUICK_MATCH_LINES);
    std::vector<std::string> sample(first_lines.begin(), first_lines.begin() + limit);

    for (const auto& rule : rules_) {
        if (!rule.enabled) continue;
        if (rule.strength == RuleStrength::Supporting) continue;
        if (rule.scope.kind != RuleScope::AnyLine && rule.scope.kind != RuleScope::FirstLines) continue;
        if (any_line_matches(rule.pattern, sample)) return true;
    }
    return false;
}

bool RegexDetector::set_rule_enabled(const std::string& rule_id, bool enabled) {
    for (auto& rule : rules_) {
        if (rule.id == rule_id) {
            rule.enabled = enabled;
            return true;
        }
    }
    return false;
}

// ── RegexDetectorBuilder ────────────────────────────────────

RegexDetectorBuilder::RegexDetectorBuilder(std::string format_id, std::string display_name)
    : format_id_(std::move(format_id)), display_name_(std::move(display_name)) {}

RegexDetectorBuilder& RegexDetectorBuilder::rule(DetectionRule rule) {
    rules_.push_back(std::move(rule));
    return *this;
}

RegexDetectorBuilder& RegexDetectorBuilder::confidence_threshold(float threshold) {
    confidence_threshold_ = threshold;
    return *this;
}

RegexDetectorBuilder& RegexDetectorBuilder::min_matching_rules(size_t min) {
    min_matching_rules_ = min;
    return *this;
}

RegexDetectorBuilder& RegexDetectorBuilder::definitive_rule_shortcircuit(bool enabled) {
    definitive_shortcircuit_ = enabled;
    return *this;
}

std::unique_ptr<RegexDetector> RegexDetectorBuilder::build() {
    return std::make_unique<RegexDetector>(std::move(format_id_), std::move(display_name_),
                                           std::move(rules_), confidence_threshold_,
                                           min_matching_rules_, definitive_shortcircuit_);
}
