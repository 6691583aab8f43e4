#pragma once

#include "fixpoint/core/Config.h"
#include "fixpoint/core/Diagnostic.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <map>
#include <string>
#include <vector>

namespace fixpoint {

// Terminal state of one diagnostic in a fix pass.
enum class FixOutcome : uint8_t {
    Applied,
    RejectedOverlap,   // Conflicts with an edit accepted earlier in the pass
    RejectedUnsafe,    // Applicability not allowed by the fix mode
    RejectedIsolation, // Its isolation group already had a fix this pass
    NotFixable,        // No fix, display-only fix, or internal error
};

// Applied fixes per rule code.
using FixTable = std::map<std::string, unsigned>;

struct FixResult {
    std::string source;
    // Both lists keep the input order.
    std::vector<Diagnostic> applied;
    std::vector<Diagnostic> unapplied;
    FixTable fixed;
    // Parallel to the input diagnostics.
    std::vector<FixOutcome> outcomes;

    size_t appliedCount() const { return applied.size(); }
};

// One greedy pass: pick a conflict-free subset of eligible fixes and
// rewrite the source once. Re-analysis is the caller's business.
class FixApplicator {
public:
    explicit FixApplicator(FixMode mode) : mode_(mode) {}

    bool allows(Applicability applicability) const;

    // Fails only if an accepted edit lies outside `source`.
    llvm::Expected<FixResult> apply(llvm::StringRef source,
                                    std::vector<Diagnostic> diagnostics) const;

private:
    FixMode mode_;
};

// Rewrites `source` with pairwise non-conflicting edits, last offset first.
llvm::Expected<std::string> applyEdits(llvm::StringRef source, std::vector<Edit> edits);

} // namespace fixpoint
