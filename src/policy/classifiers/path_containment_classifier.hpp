#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "policy/classifier.hpp"

namespace cmdgate::policy {

struct ContainmentViolation {
    std::string message;
    bool unresolvable = false;  // the location could not be determined statically
};

// First command or path word that cannot be shown to stay inside
// `context.sandbox_root` when the command line starts in `start_dir`.
// Every scoped command must run inside the root, and every path word must
// resolve inside it after "~" expansion, ".." folding and symlink following.
// Program words may also resolve into a trusted program directory.
std::optional<ContainmentViolation> find_containment_violation(
    const CommandAnalysis& analysis, const PolicyContext& context,
    const std::filesystem::path& start_dir);

// Rejects any command the check above flags, whatever the verb.
class PathContainmentClassifier : public Classifier {
public:
    std::string name() const override;
    std::optional<Rejection> evaluate(const CommandAnalysis& analysis,
                                      const PolicyContext& context) const override;
};

}  // namespace cmdgate::policy
