#pragma once

#include "fixpoint/core/Diagnostic.h"
#include "fixpoint/syntax/SymbolTable.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>

namespace fixpoint {

struct NoqaEditResult {
    std::string source;
    unsigned linesChanged = 0;
};

// Suppresses every remaining lint finding in place: appends
// `  # noqa: CODES` to each affected line, or widens the scoped directive
// already there. Blanket directives are left alone. `module` must be the
// tree of `source`.
llvm::Expected<NoqaEditResult> addNoqaDirectives(llvm::StringRef source,
                                                 const ParsedModule &module,
                                                 llvm::ArrayRef<Diagnostic> diagnostics);

} // namespace fixpoint
