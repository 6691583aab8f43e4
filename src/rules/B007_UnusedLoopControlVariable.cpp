#include "fixpoint/rules/BuiltinRules.h"

namespace fixpoint {

namespace {

// Names bound by a loop target, descending into tuple unpacking.
void collectBoundNames(const Node &target, const SyntaxTree &tree,
                       std::vector<const Node *> &out) {
    if (target.kind == NodeKind::Name) {
        out.push_back(&target);
        return;
    }
    if (target.kind == NodeKind::Tuple || target.kind == NodeKind::List) {
        for (const Node *elt : tree.children(target, Field::Elts))
            collectBoundNames(*elt, tree, out);
    }
}

llvm::Error check(const Node &loop, const RuleContext &ctx, DiagnosticSink &sink) {
    // Needs binding resolution from the parser.
    const SymbolTable *symbols = ctx.symbols();
    if (!symbols)
        return llvm::Error::success();

    const Node *target = ctx.tree().child(loop, Field::Target);
    if (!target)
        return llvm::Error::success();

    std::vector<const Node *> names;
    collectBoundNames(*target, ctx.tree(), names);

    for (const Node *name : names) {
        if (rules::isDummyName(name->value))
            continue;
        if (!symbols->bindingAt(name->id) || symbols->isUsed(name->id))
            continue;

        Diagnostic &d = sink.report(name->range,
                                    "Loop control variable `" + name->value +
                                        "` not used within loop body");
        d.fix = Fix::unsafe(Edit::replacement("_" + name->value, name->range));
        d.fixTitle = "Rename unused `" + name->value + "` to `_" + name->value + "`";
    }
    return llvm::Error::success();
}

} // anonymous namespace

RuleDescriptor unusedLoopControlVariableRule() {
    RuleDescriptor rule;
    rule.code = "B007";
    rule.name = "unused-loop-control-variable";
    rule.severity = Severity::Warning;
    rule.fixAvailability = FixAvailability::Sometimes;
    rule.appliesTo = {NodeKind::For};
    rule.check = check;
    return rule;
}

} // namespace fixpoint
