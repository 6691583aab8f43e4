#pragma once

#include "fixpoint/analysis/SourceMap.h"
#include "fixpoint/analysis/SuppressionIndex.h"
#include "fixpoint/core/Config.h"
#include "fixpoint/core/Diagnostic.h"
#include "fixpoint/core/RuleRegistry.h"
#include "fixpoint/syntax/SymbolTable.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fixpoint {

// Code of the driver-level check for directives that suppress nothing.
inline constexpr std::string_view kUnusedNoqaCode = "RUF100";

struct AnalysisResult {
    // Lint findings and internal errors, ordered by source position.
    std::vector<Diagnostic> diagnostics;
    unsigned suppressed = 0;
    unsigned internalErrors = 0;
};

// Walks one tree once, dispatching every enabled rule by node kind.
class AnalysisDriver {
public:
    AnalysisDriver(const RuleRegistry &registry, const Config &cfg);

    // Fails only on input inconsistency (tree or trivia outside the source).
    // Rule failures are recorded as InternalError diagnostics instead.
    llvm::Expected<AnalysisResult> analyze(const ParsedModule &module,
                                           llvm::StringRef source,
                                           llvm::StringRef path = "") const;

    bool isRuleEnabled(size_t index) const { return enabled_[index]; }

private:
    // (directive line, code) pairs that suppressed something.
    using UsedCodes = std::set<std::pair<unsigned, std::string>>;

    void runRule(size_t ruleIndex, const Node &node, const RuleContext &ctx,
                 const SourceMap &map, const SuppressionIndex &suppressions,
                 llvm::StringRef path, std::vector<Diagnostic> &out,
                 UsedCodes &used, AnalysisResult &result) const;

    void reportUnusedDirectives(const SuppressionIndex &suppressions,
                                llvm::StringRef source, const SourceMap &map,
                                llvm::StringRef path,
                                const UsedCodes &used,
                                std::vector<Diagnostic> &out) const;

    const RuleRegistry &registry_;
    const Config &config_;
    std::vector<bool> enabled_;
    bool unusedNoqaEnabled_;
};

// Fills `diag.location` from its range. Fails if the range lies outside the
// mapped source.
llvm::Error resolveLocation(Diagnostic &diag, const SourceMap &map, llvm::StringRef path);

} // namespace fixpoint
