#pragma once

#include "fixpoint/analysis/AnalysisDriver.h"
#include "fixpoint/core/Config.h"
#include "fixpoint/fix/FixApplicator.h"
#include "fixpoint/syntax/TreeProvider.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

namespace fixpoint {

struct FixLoopResult {
    std::string source;                   // Final text, fixed or not
    std::vector<Diagnostic> diagnostics;  // Last analysis, unfixed findings
    FixTable fixed;                       // Totals across every pass
    unsigned iterations = 0;              // Passes that applied fixes
    bool converged = true;
    // Codes still offering accepted fixes when the pass limit was hit.
    std::vector<std::string> pendingCodes;
    unsigned suppressed = 0;
    unsigned internalErrors = 0;
};

// Parse, analyze and apply until a pass accepts nothing or
// cfg.maxFixIterations passes have run. With FixMode::Off this is a single
// lint-only analysis.
//
// A parse failure of the unfixed source is returned as is. A parse failure
// after fixes were applied becomes a FixSyntaxError naming the applied codes.
llvm::Expected<FixLoopResult> runFixLoop(llvm::StringRef source,
                                         llvm::StringRef path,
                                         TreeProvider &provider,
                                         const AnalysisDriver &driver,
                                         const Config &cfg);

} // namespace fixpoint
