#pragma once

#include "classifier/output_classifier.hpp"
#include "config.hpp"

#include <optional>
#include <regex>
#include <vector>

// Regex catalog classifier built from an AgentProfile.
// Blocked rules win over ready/turn-complete detection; only the bottom of
// the screen is inspected.
class RuleClassifier : public OutputClassifier {
public:
    explicit RuleClassifier(const AgentProfile& profile);

    Classification classify(const std::string& screen) const override;

    // Number of blocked rules that compiled.
    size_t rule_count() const { return blocked_.size(); }

private:
    struct Rule {
        std::regex re;
        AgentProfile::BlockedRule rule;
    };

    std::vector<Rule> blocked_;
    std::optional<std::regex> ready_;
    std::optional<std::regex> turn_complete_;
    std::optional<std::regex> tool_running_;
};
