#pragma once

#include "policy/classifier.hpp"

namespace cmdgate::policy {

// Rejects writes outside the sandbox that land in protected system
// locations or shell run-control files.
class SystemFileClassifier : public Classifier {
public:
    std::string name() const override;
    std::optional<Rejection> evaluate(const CommandAnalysis& analysis,
                                      const PolicyContext& context) const override;
};

}  // namespace cmdgate::policy
