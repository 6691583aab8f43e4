#pragma once

#include "fixpoint/core/Rule.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/Error.h>

#include <array>
#include <string_view>
#include <vector>

namespace fixpoint {

// Ordered rule set, indexed by node kind. Filled once at startup and then
// shared read-only by every analysis; it carries no per-run state.
class RuleRegistry {
public:
    llvm::Error registerRule(RuleDescriptor rule);

    const std::vector<RuleDescriptor> &rules() const { return rules_; }

    const RuleDescriptor *findByCode(std::string_view code) const;

    // Indices into rules() of the rules that apply to `kind`.
    llvm::ArrayRef<size_t> rulesFor(NodeKind kind) const {
        return byKind_[static_cast<size_t>(kind)];
    }

    // Registry holding every built-in rule.
    static RuleRegistry builtin();

private:
    std::vector<RuleDescriptor> rules_;
    std::array<std::vector<size_t>, kNodeKindCount> byKind_;
};

} // namespace fixpoint
