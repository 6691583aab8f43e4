#include "fixpoint/fix/FixLoop.h"
#include "fixpoint/core/Errors.h"

#include <llvm/ADT/StringExtras.h>

#include <algorithm>
#include <set>

namespace fixpoint {

namespace {

std::string joinCodes(const FixTable &fixed) {
    std::vector<std::string> codes;
    for (const auto &entry : fixed)
        codes.push_back(entry.first);
    return llvm::join(codes, ", ");
}

} // anonymous namespace

llvm::Expected<FixLoopResult> runFixLoop(llvm::StringRef source,
                                         llvm::StringRef path,
                                         TreeProvider &provider,
                                         const AnalysisDriver &driver,
                                         const Config &cfg) {
    FixLoopResult result;
    result.source = source.str();

    FixApplicator applicator(cfg.fixMode);
    const unsigned maxIterations = std::max(cfg.maxFixIterations, 1u);

    while (true) {
        auto module = provider.parse(result.source);
        if (!module) {
            if (result.iterations == 0)
                return module.takeError();
            return makeError(ErrorKind::FixSyntaxError,
                             "fixes for " + joinCodes(result.fixed) +
                                 " introduced a syntax error: " +
                                 llvm::toString(module.takeError()));
        }

        auto analysis = driver.analyze(*module, result.source, path);
        if (!analysis)
            return analysis.takeError();
        result.suppressed     = analysis->suppressed;
        result.internalErrors = analysis->internalErrors;

        if (cfg.fixMode == FixMode::Off) {
            result.diagnostics = std::move(analysis->diagnostics);
            return std::move(result);
        }

        // Keep the unfixed stream: a pass that stops here reports it whole.
        std::vector<Diagnostic> found = analysis->diagnostics;
        auto pass = applicator.apply(result.source, std::move(analysis->diagnostics));
        if (!pass)
            return pass.takeError();

        if (pass->appliedCount() == 0) {
            result.diagnostics = std::move(pass->unapplied);
            return std::move(result);
        }

        if (result.iterations >= maxIterations) {
            result.converged = false;
            std::set<std::string> pending;
            for (const auto &d : pass->applied)
                pending.insert(d.code);
            result.pendingCodes.assign(pending.begin(), pending.end());
            result.diagnostics = std::move(found);
            return std::move(result);
        }

        result.source = std::move(pass->source);
        for (const auto &entry : pass->fixed)
            result.fixed[entry.first] += entry.second;
        ++result.iterations;
    }
}

} // namespace fixpoint
