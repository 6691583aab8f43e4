#include "fixpoint/rules/BuiltinRules.h"

namespace fixpoint {

namespace {

llvm::Error check(const Node &call, const RuleContext &ctx, DiagnosticSink &sink) {
    const Node *func = ctx.tree().child(call, Field::Func);
    if (!func || rules::referencedName(*func, ctx, "collections") != "namedtuple")
        return llvm::Error::success();

    // The field list has to become a class body, so the suggested edit is
    // only a pointer and is never applied.
    Diagnostic &d = sink.report(func->range,
                                "Use `typing.NamedTuple` instead of `collections.namedtuple`");
    d.fix = Fix::displayOnly(Edit::replacement("typing.NamedTuple", func->range));
    d.fixTitle = "Replace with `typing.NamedTuple`";
    return llvm::Error::success();
}

} // anonymous namespace

RuleDescriptor collectionsNamedTupleRule() {
    RuleDescriptor rule;
    rule.code = "PYI024";
    rule.name = "collections-named-tuple";
    rule.severity = Severity::Info;
    rule.fixAvailability = FixAvailability::Sometimes;
    rule.appliesTo = {NodeKind::Call};
    rule.check = check;
    return rule;
}

} // namespace fixpoint
