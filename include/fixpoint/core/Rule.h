#pragma once

#include "fixpoint/core/Diagnostic.h"
#include "fixpoint/core/Severity.h"
#include "fixpoint/syntax/SymbolTable.h"
#include "fixpoint/syntax/SyntaxTree.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <functional>
#include <string>
#include <vector>

namespace fixpoint {

enum class FixAvailability : uint8_t {
    None,      // Diagnostic only, permanently
    Sometimes, // Fix offered when the pattern allows it
    Always,
};

// Read-only view a rule gets of the node it is checking.
class RuleContext {
public:
    RuleContext(const SyntaxTree &tree, llvm::StringRef source, const SymbolTable *symbols)
        : tree_(tree), source_(source), symbols_(symbols) {}

    const SyntaxTree &tree() const { return tree_; }
    llvm::StringRef source() const { return source_; }
    // Null when the upstream parser did not resolve bindings.
    const SymbolTable *symbols() const { return symbols_; }

    // Ancestors of the current node, root first.
    llvm::ArrayRef<NodeId> ancestors() const { return ancestors_; }
    const Node *parent() const;
    // Nearest ancestor of `kind`, or nullptr.
    const Node *enclosing(NodeKind kind) const;

    llvm::StringRef text(TextRange range) const {
        return source_.substr(range.start(), range.length());
    }
    llvm::StringRef text(const Node &n) const { return text(n.range); }

private:
    friend class AnalysisDriver;

    const SyntaxTree &tree_;
    llvm::StringRef source_;
    const SymbolTable *symbols_;
    std::vector<NodeId> ancestors_;
};

// Collects one rule invocation's output, pre-filled with the rule's code
// and severity.
class DiagnosticSink {
public:
    DiagnosticSink(llvm::StringRef code, Severity severity, std::vector<Diagnostic> &out)
        : code_(code), severity_(severity), out_(out) {}

    // The returned reference is valid until the next report().
    Diagnostic &report(TextRange range, std::string message);

private:
    llvm::StringRef code_;
    Severity severity_;
    std::vector<Diagnostic> &out_;
};

using RuleCheck =
    std::function<llvm::Error(const Node &, const RuleContext &, DiagnosticSink &)>;

struct RuleDescriptor {
    std::string code;   // "PERF102"
    std::string name;   // "incorrect-dict-iterator"
    Severity severity = Severity::Warning;
    FixAvailability fixAvailability = FixAvailability::None;
    std::vector<NodeKind> appliesTo;
    RuleCheck check;
};

} // namespace fixpoint
