#include "fixpoint/rules/BuiltinRules.h"

#include <llvm/ADT/StringExtras.h>

namespace fixpoint {

namespace {

// Optional[X]  ->  X | None
// Union[A, B]  ->  A | B
llvm::Error check(const Node &subscript, const RuleContext &ctx, DiagnosticSink &sink) {
    const SyntaxTree &tree = ctx.tree();

    const Node *value = tree.child(subscript, Field::Value);
    const Node *slice = tree.child(subscript, Field::Slice);
    if (!value || !slice)
        return llvm::Error::success();

    llvm::StringRef name = rules::referencedName(*value, ctx);
    std::vector<std::string> members;

    if (name == "Optional") {
        // Optional takes exactly one argument.
        if (slice->kind == NodeKind::Tuple)
            return llvm::Error::success();
        members = {ctx.text(*slice).str(), "None"};
    } else if (name == "Union") {
        if (slice->kind == NodeKind::Tuple) {
            for (const Node *elt : tree.children(*slice, Field::Elts))
                members.push_back(ctx.text(*elt).str());
        } else {
            members.push_back(ctx.text(*slice).str());
        }
        if (members.empty())
            return llvm::Error::success();
    } else {
        return llvm::Error::success();
    }

    Diagnostic &d = sink.report(subscript.range, "Use `X | Y` for type annotations");
    d.fix = Fix::safe(Edit::replacement(llvm::join(members, " | "), subscript.range));
    d.fixTitle = "Convert to `X | Y`";
    return llvm::Error::success();
}

} // anonymous namespace

RuleDescriptor nonPEP604AnnotationRule() {
    RuleDescriptor rule;
    rule.code = "UP007";
    rule.name = "non-pep604-annotation";
    rule.severity = Severity::Warning;
    rule.fixAvailability = FixAvailability::Always;
    rule.appliesTo = {NodeKind::Subscript};
    rule.check = check;
    return rule;
}

} // namespace fixpoint
