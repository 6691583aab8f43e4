#include "fixpoint/core/Rule.h"

namespace fixpoint {

const Node *RuleContext::parent() const {
    return ancestors_.empty() ? nullptr : &tree_.node(ancestors_.back());
}

const Node *RuleContext::enclosing(NodeKind kind) const {
    for (auto it = ancestors_.rbegin(); it != ancestors_.rend(); ++it) {
        const Node &n = tree_.node(*it);
        if (n.kind == kind)
            return &n;
    }
    return nullptr;
}

Diagnostic &DiagnosticSink::report(TextRange range, std::string message) {
    Diagnostic diag;
    diag.code     = code_.str();
    diag.message  = std::move(message);
    diag.range    = range;
    diag.severity = severity_;
    out_.push_back(std::move(diag));
    return out_.back();
}

} // namespace fixpoint
