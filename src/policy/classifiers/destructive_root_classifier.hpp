#pragma once

#include "policy/classifier.hpp"

namespace cmdgate::policy {

// Rejects recursive deletes aimed at the filesystem root, the sandbox root
// (or an ancestor of it), ".", "~" or a bare wildcard at the sandbox root.
class DestructiveRootClassifier : public Classifier {
public:
    std::string name() const override;
    std::optional<Rejection> evaluate(const CommandAnalysis& analysis,
                                      const PolicyContext& context) const override;
};

}  // namespace cmdgate::policy
