#include "fixpoint/fix/FixApplicator.h"
#include "fixpoint/core/Errors.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <tuple>

namespace fixpoint {

namespace {

// Accepted edits keyed by start offset. Accepted edits never share a start.
using AcceptedEdits = std::map<uint32_t, const Edit *>;

bool conflictsWithAccepted(const AcceptedEdits &accepted, TextRange range) {
    auto next = accepted.lower_bound(range.start());
    if (next != accepted.end() && next->second->range.conflictsWith(range))
        return true;
    if (next != accepted.begin() && std::prev(next)->second->range.conflictsWith(range))
        return true;
    return false;
}

bool alreadyAccepted(const AcceptedEdits &accepted, const Edit &edit) {
    auto it = accepted.find(edit.range.start());
    return it != accepted.end() && *it->second == edit;
}

} // anonymous namespace

bool FixApplicator::allows(Applicability applicability) const {
    switch (mode_) {
        case FixMode::Off:
            return false;
        case FixMode::SafeOnly:
            return applicability == Applicability::Safe;
        case FixMode::SafeAndUnsafe:
            return applicability != Applicability::DisplayOnly;
    }
    return false;
}

llvm::Expected<FixResult> FixApplicator::apply(llvm::StringRef source,
                                               std::vector<Diagnostic> diagnostics) const {
    FixResult result;
    result.outcomes.assign(diagnostics.size(), FixOutcome::NotFixable);

    std::vector<size_t> candidates;
    for (size_t i = 0; i < diagnostics.size(); ++i) {
        const Diagnostic &d = diagnostics[i];
        if (d.isInternalError() || !d.fix ||
            d.fix->applicability() == Applicability::DisplayOnly)
            continue;
        if (!allows(d.fix->applicability())) {
            result.outcomes[i] = FixOutcome::RejectedUnsafe;
            continue;
        }
        candidates.push_back(i);
    }

    std::stable_sort(candidates.begin(), candidates.end(), [&](size_t a, size_t b) {
        const Diagnostic &da = diagnostics[a];
        const Diagnostic &db = diagnostics[b];
        return std::make_tuple(da.fix->minStart(), da.fix->span(), std::cref(da.code), a) <
               std::make_tuple(db.fix->minStart(), db.fix->span(), std::cref(db.code), b);
    });

    AcceptedEdits accepted;
    std::set<uint32_t> isolatedGroups;

    for (size_t index : candidates) {
        const Diagnostic &d = diagnostics[index];
        const Fix &fix = *d.fix;

        // Another rule already asked for exactly these edits.
        bool duplicate = std::all_of(fix.edits().begin(), fix.edits().end(),
                                     [&](const Edit &e) { return alreadyAccepted(accepted, e); });
        if (duplicate) {
            result.outcomes[index] = FixOutcome::Applied;
            ++result.fixed[d.code];
            continue;
        }

        bool overlaps = std::any_of(fix.edits().begin(), fix.edits().end(),
                                    [&](const Edit &e) {
                                        return conflictsWithAccepted(accepted, e.range);
                                    });
        if (overlaps) {
            result.outcomes[index] = FixOutcome::RejectedOverlap;
            continue;
        }

        if (auto group = fix.isolationGroup()) {
            if (!isolatedGroups.insert(*group).second) {
                result.outcomes[index] = FixOutcome::RejectedIsolation;
                continue;
            }
        }

        for (const Edit &e : fix.edits())
            accepted.emplace(e.range.start(), &e);
        result.outcomes[index] = FixOutcome::Applied;
        ++result.fixed[d.code];
    }

    std::vector<Edit> edits;
    edits.reserve(accepted.size());
    for (const auto &entry : accepted)
        edits.push_back(*entry.second);

    auto rewritten = applyEdits(source, std::move(edits));
    if (!rewritten)
        return rewritten.takeError();
    result.source = std::move(*rewritten);

    for (size_t i = 0; i < diagnostics.size(); ++i) {
        if (result.outcomes[i] == FixOutcome::Applied)
            result.applied.push_back(std::move(diagnostics[i]));
        else
            result.unapplied.push_back(std::move(diagnostics[i]));
    }
    return std::move(result);
}

llvm::Expected<std::string> applyEdits(llvm::StringRef source, std::vector<Edit> edits) {
    std::sort(edits.begin(), edits.end(),
              [](const Edit &a, const Edit &b) { return b.range < a.range; });

    for (size_t i = 0; i < edits.size(); ++i) {
        const TextRange range = edits[i].range;
        if (range.end() > source.size())
            return makeError(ErrorKind::OutOfRange,
                             "edit [" + llvm::Twine(range.start()) + ", " +
                                 llvm::Twine(range.end()) + ") is past the end of a " +
                                 llvm::Twine(source.size()) + "-byte source");
        if (i > 0 && edits[i - 1].range.conflictsWith(range))
            return makeError(ErrorKind::InvalidFix,
                             "edits at offsets " + llvm::Twine(range.start()) + " and " +
                                 llvm::Twine(edits[i - 1].range.start()) + " conflict");
    }

    std::string out = source.str();
    for (const Edit &e : edits)
        out.replace(e.range.start(), e.range.length(), e.content);
    return std::move(out);
}

} // namespace fixpoint
