#include "fixpoint/core/Diagnostic.h"
#include "fixpoint/core/Errors.h"

#include <algorithm>

namespace fixpoint {

llvm::Expected<Fix> Fix::create(std::vector<Edit> edits,
                                Applicability applicability) {
    if (edits.empty())
        return makeError(ErrorKind::InvalidFix, "fix has no edits");

    std::stable_sort(edits.begin(), edits.end(),
                     [](const Edit &a, const Edit &b) { return a.range < b.range; });

    for (size_t i = 1; i < edits.size(); ++i) {
        const TextRange prev = edits[i - 1].range;
        const TextRange cur = edits[i].range;
        if (prev.conflictsWith(cur)) {
            return makeError(ErrorKind::InvalidFix,
                             "fix edits overlap at [" + llvm::Twine(prev.start()) +
                                 ", " + llvm::Twine(prev.end()) + ") and [" +
                                 llvm::Twine(cur.start()) + ", " +
                                 llvm::Twine(cur.end()) + ")");
        }
    }

    bool changesSomething = std::any_of(edits.begin(), edits.end(), [](const Edit &e) {
        return !e.range.isEmpty() || !e.content.empty();
    });
    if (!changesSomething)
        return makeError(ErrorKind::InvalidFix, "fix edits change nothing");

    return Fix(std::move(edits), applicability);
}

uint32_t Fix::maxEnd() const {
    uint32_t end = 0;
    for (const auto &e : edits_)
        end = std::max(end, e.range.end());
    return end;
}

} // namespace fixpoint
