#pragma once

#include "fixpoint/syntax/SymbolTable.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>

namespace fixpoint {

// Upstream parser seam. The fix loop re-parses every rewritten source
// through this interface.
class TreeProvider {
public:
    virtual ~TreeProvider() = default;
    virtual llvm::Expected<ParsedModule> parse(llvm::StringRef source) = 0;
};

// Reads a tree in the JSON interchange format:
//   {"root": {...}, "comments": [[s, e]], "multiline_strings": [[s, e]],
//    "bindings": [{"name": "x", "site": 3, "references": [7]}]}
// Node ids are assigned in pre-order, which is what "site" and
// "references" refer to.
llvm::Expected<ParsedModule> readTreeJSON(llvm::StringRef json);

// Runs `<command> --output <json> <source-file>` for every parse.
class ExternalParser : public TreeProvider {
public:
    explicit ExternalParser(std::string command, unsigned timeoutSeconds = 60);

    llvm::Expected<ParsedModule> parse(llvm::StringRef source) override;

private:
    std::string command_;
    unsigned timeoutSeconds_;
};

} // namespace fixpoint
