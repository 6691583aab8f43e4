#include "fixpoint/rules/BuiltinRules.h"

namespace fixpoint {

namespace {

// A dummy name, or a nested unpacking made only of dummies: `(_, _)`.
bool isUnusedElement(const Node &n, const SyntaxTree &tree) {
    switch (n.kind) {
        case NodeKind::Name:
            return rules::isDummyName(n.value);
        case NodeKind::Tuple:
        case NodeKind::List:
            for (const Node *elt : tree.children(n, Field::Elts)) {
                if (!isUnusedElement(*elt, tree))
                    return false;
            }
            return true;
        default:
            return false;
    }
}

// for _, value in d.items():  ->  for value in d.values():
llvm::Error check(const Node &loop, const RuleContext &ctx, DiagnosticSink &sink) {
    const SyntaxTree &tree = ctx.tree();

    const Node *target = tree.child(loop, Field::Target);
    if (!target || target->kind != NodeKind::Tuple)
        return llvm::Error::success();
    auto elts = tree.children(*target, Field::Elts);
    if (elts.size() != 2)
        return llvm::Error::success();

    const Node *call = tree.child(loop, Field::Iter);
    if (!call || call->kind != NodeKind::Call)
        return llvm::Error::success();
    if (!tree.children(*call, Field::Args).empty() ||
        !tree.children(*call, Field::Keywords).empty())
        return llvm::Error::success();

    const Node *func = tree.child(*call, Field::Func);
    if (!func || func->kind != NodeKind::Attribute)
        return llvm::Error::success();
    const Node *attr = tree.child(*func, Field::Attr);
    if (!attr || attr->value != "items")
        return llvm::Error::success();

    bool keyUnused   = isUnusedElement(*elts[0], tree);
    bool valueUnused = isUnusedElement(*elts[1], tree);
    if (keyUnused == valueUnused)
        return llvm::Error::success();

    const Node &kept = keyUnused ? *elts[1] : *elts[0];
    llvm::StringRef method = keyUnused ? "values" : "keys";

    auto fix = Fix::create({Edit::replacement(ctx.text(kept).str(), target->range),
                            Edit::replacement(method.str(), attr->range)},
                           Applicability::Safe);
    if (!fix)
        return fix.takeError();

    Diagnostic &d = sink.report(loop.range,
                                "When using only the " + method.str() +
                                    " of a dict use the `" + method.str() + "()` method");
    d.fix = std::move(*fix);
    d.fixTitle = "Replace `.items()` with `." + method.str() + "()`";
    return llvm::Error::success();
}

} // anonymous namespace

RuleDescriptor incorrectDictIteratorRule() {
    RuleDescriptor rule;
    rule.code = "PERF102";
    rule.name = "incorrect-dict-iterator";
    rule.severity = Severity::Warning;
    rule.fixAvailability = FixAvailability::Always;
    rule.appliesTo = {NodeKind::For};
    rule.check = check;
    return rule;
}

} // namespace fixpoint
