#pragma once

#include <string>
#include <vector>
#include "policy/classifier.hpp"

namespace cmdgate::policy {

// A flag that only one dialect's tool understands (or understands the same way).
struct DialectFlagRule {
    std::string verb;
    std::string flag;  // single-letter short flags also match inside clusters ("-rP")
    core::config::TargetPlatform only_on;
    std::string note;
};

const std::vector<DialectFlagRule>& dialect_flag_rules();

// Rejects flag syntax the target platform's tools do not accept. Reported
// as a portability rejection, not a safety one.
class PlatformCompatClassifier : public Classifier {
public:
    std::string name() const override;
    std::optional<Rejection> evaluate(const CommandAnalysis& analysis,
                                      const PolicyContext& context) const override;
};

}  // namespace cmdgate::policy
