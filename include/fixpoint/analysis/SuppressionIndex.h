#pragma once

#include "fixpoint/analysis/SourceMap.h"
#include "fixpoint/core/TextRange.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <unordered_map>
#include <vector>

namespace fixpoint {

// One `# noqa` or `# noqa: A100, B200` directive found in a comment.
struct NoqaDirective {
    unsigned line = 0;
    TextRange comment;          // The whole comment token
    TextRange range;            // From '#' of "# noqa" to the last code
    bool blanket = false;       // No codes: suppresses everything
    std::vector<std::string> codes;

    bool covers(llvm::StringRef code) const;
};

// Per-line suppression directives, built once from comment trivia.
class SuppressionIndex {
public:
    static llvm::Expected<SuppressionIndex> build(llvm::StringRef source,
                                                  llvm::ArrayRef<TextRange> comments,
                                                  llvm::ArrayRef<TextRange> multilineStrings,
                                                  const SourceMap &map);

    bool isSuppressed(unsigned line, llvm::StringRef code) const;

    // Line whose directive governs diagnostics anchored on `line`: the last
    // line of an enclosing multi-line string, else `line` itself.
    unsigned directiveLine(unsigned line) const;

    const NoqaDirective *directiveAt(unsigned line) const;
    const std::vector<NoqaDirective> &directives() const { return directives_; }

private:
    std::vector<NoqaDirective> directives_;
    std::unordered_map<unsigned, size_t> byLine_;
    std::unordered_map<unsigned, unsigned> lineRemap_;
};

// Parses one comment's text. `commentStart` is its absolute offset.
bool parseNoqa(llvm::StringRef comment, uint32_t commentStart, NoqaDirective &out);

} // namespace fixpoint
