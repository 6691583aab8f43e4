#include "fixpoint/fix/AddNoqa.h"
#include "fixpoint/analysis/AnalysisDriver.h"
#include "fixpoint/analysis/SourceMap.h"
#include "fixpoint/analysis/SuppressionIndex.h"
#include "fixpoint/fix/FixApplicator.h"

#include <llvm/ADT/StringExtras.h>

#include <map>
#include <set>

namespace fixpoint {

llvm::Expected<NoqaEditResult> addNoqaDirectives(llvm::StringRef source,
                                                 const ParsedModule &module,
                                                 llvm::ArrayRef<Diagnostic> diagnostics) {
    SourceMap map(source);
    auto suppressions = SuppressionIndex::build(source, module.tree.comments(),
                                                module.tree.multilineStrings(), map);
    if (!suppressions)
        return suppressions.takeError();

    // Directive line -> codes it must gain.
    std::map<unsigned, std::set<std::string>> missing;
    for (const auto &d : diagnostics) {
        if (d.isInternalError() || d.code == kUnusedNoqaCode)
            continue;
        auto pos = map.offsetToPosition(d.range.start());
        if (!pos)
            return pos.takeError();
        if (suppressions->isSuppressed(pos->line, d.code))
            continue;
        missing[suppressions->directiveLine(pos->line)].insert(d.code);
    }

    std::vector<Edit> edits;
    for (const auto &entry : missing) {
        unsigned line = entry.first;

        if (const NoqaDirective *existing = suppressions->directiveAt(line)) {
            std::set<std::string> codes(existing->codes.begin(), existing->codes.end());
            codes.insert(entry.second.begin(), entry.second.end());
            edits.push_back(Edit::replacement(
                "# noqa: " + llvm::join(codes.begin(), codes.end(), ", "), existing->range));
            continue;
        }

        auto start = map.lineStart(line);
        if (!start)
            return start.takeError();
        auto end = map.lineEnd(line);
        if (!end)
            return end.takeError();

        // Trailing blanks are replaced, not kept in front of the comment.
        uint32_t trimmed = *end;
        while (trimmed > *start && (source[trimmed - 1] == ' ' || source[trimmed - 1] == '\t'))
            --trimmed;

        edits.push_back(Edit::replacement(
            "  # noqa: " + llvm::join(entry.second.begin(), entry.second.end(), ", "),
            TextRange(trimmed, *end)));
    }

    NoqaEditResult result;
    result.linesChanged = static_cast<unsigned>(edits.size());
    auto rewritten = applyEdits(source, std::move(edits));
    if (!rewritten)
        return rewritten.takeError();
    result.source = std::move(*rewritten);
    return std::move(result);
}

} // namespace fixpoint
