#include "fixpoint/analysis/SuppressionIndex.h"
#include "fixpoint/core/Errors.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/Regex.h>

#include <algorithm>

namespace fixpoint {

bool NoqaDirective::covers(llvm::StringRef code) const {
    if (blanket)
        return true;
    return std::find(codes.begin(), codes.end(), code) != codes.end();
}

bool parseNoqa(llvm::StringRef comment, uint32_t commentStart, NoqaDirective &out) {
    // "# noqa", "#noqa", "# NOQA: A100, B200", "# noqa:A100 B200". Only the
    // keyword ignores case; "# noqa: a100" is a blanket directive.
    static const llvm::Regex noqaRe(
        "#[[:space:]]*[Nn][Oo][Qq][Aa]"
        "([[:space:]]*:[[:space:]]*"
        "([A-Z]+[0-9]+([[:space:]]*,[[:space:]]*[A-Z]+[0-9]+|[[:space:]]+[A-Z]+[0-9]+)*))?");

    llvm::SmallVector<llvm::StringRef, 4> matches;
    if (!noqaRe.match(comment, &matches))
        return false;

    const llvm::StringRef whole = matches[0];
    const llvm::StringRef codes = matches.size() > 2 ? matches[2] : llvm::StringRef();
    const size_t begin = static_cast<size_t>(whole.data() - comment.data());
    const size_t end = begin + whole.size();

    // "# noqafoo" is not a directive.
    if (codes.empty() && end < comment.size()) {
        char next = comment[end];
        if (!llvm::isSpace(next) && next != ':' && next != '#')
            return false;
    }

    out.comment = TextRange(commentStart, commentStart + static_cast<uint32_t>(comment.size()));
    out.range = TextRange(commentStart + static_cast<uint32_t>(begin),
                          commentStart + static_cast<uint32_t>(end));
    out.codes.clear();
    out.blanket = codes.empty();

    llvm::SmallVector<llvm::StringRef, 4> parts;
    llvm::SplitString(codes, parts, ", \t");
    for (auto p : parts)
        out.codes.push_back(p.str());
    return true;
}

llvm::Expected<SuppressionIndex> SuppressionIndex::build(
    llvm::StringRef source, llvm::ArrayRef<TextRange> comments,
    llvm::ArrayRef<TextRange> multilineStrings, const SourceMap &map) {

    SuppressionIndex index;

    for (TextRange c : comments) {
        if (c.end() > source.size())
            return makeError(ErrorKind::OutOfRange,
                             "comment [" + llvm::Twine(c.start()) + ", " +
                                 llvm::Twine(c.end()) + ") is past the end of the source");
        NoqaDirective d;
        if (!parseNoqa(source.substr(c.start(), c.length()), c.start(), d))
            continue;

        auto pos = map.offsetToPosition(c.start());
        if (!pos)
            return pos.takeError();
        d.line = pos->line;

        // One comment per physical line; keep the first if the trivia repeats.
        if (index.byLine_.count(d.line))
            continue;
        index.byLine_[d.line] = index.directives_.size();
        index.directives_.push_back(std::move(d));
    }

    for (TextRange s : multilineStrings) {
        auto first = map.offsetToPosition(s.start());
        if (!first)
            return first.takeError();
        auto last = map.offsetToPosition(s.end());
        if (!last)
            return last.takeError();
        for (unsigned l = first->line; l < last->line; ++l)
            index.lineRemap_[l] = last->line;
    }

    return std::move(index);
}

unsigned SuppressionIndex::directiveLine(unsigned line) const {
    auto it = lineRemap_.find(line);
    return it != lineRemap_.end() ? it->second : line;
}

const NoqaDirective *SuppressionIndex::directiveAt(unsigned line) const {
    auto it = byLine_.find(line);
    return it != byLine_.end() ? &directives_[it->second] : nullptr;
}

bool SuppressionIndex::isSuppressed(unsigned line, llvm::StringRef code) const {
    const NoqaDirective *d = directiveAt(directiveLine(line));
    return d && d->covers(code);
}

} // namespace fixpoint
