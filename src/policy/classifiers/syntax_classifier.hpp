#pragma once

#include "policy/classifier.hpp"

namespace cmdgate::policy {

// Rejects commands that would not parse as one well-formed shell invocation.
class SyntaxClassifier : public Classifier {
public:
    std::string name() const override;
    std::optional<Rejection> evaluate(const CommandAnalysis& analysis,
                                      const PolicyContext& context) const override;
};

}  // namespace cmdgate::policy
