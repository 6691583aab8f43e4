#include "fixpoint/rules/BuiltinRules.h"

#include <llvm/ADT/StringSwitch.h>

namespace fixpoint {

namespace {

llvm::StringRef builtinFor(llvm::StringRef typingName) {
    return llvm::StringSwitch<llvm::StringRef>(typingName)
        .Case("List", "list")
        .Case("Dict", "dict")
        .Case("Set", "set")
        .Case("FrozenSet", "frozenset")
        .Case("Tuple", "tuple")
        .Case("Type", "type")
        .Default("");
}

// List[int]  ->  list[int]
llvm::Error check(const Node &subscript, const RuleContext &ctx, DiagnosticSink &sink) {
    const Node *value = ctx.tree().child(subscript, Field::Value);
    if (!value)
        return llvm::Error::success();

    llvm::StringRef typingName = rules::referencedName(*value, ctx);
    llvm::StringRef builtin = builtinFor(typingName);
    if (builtin.empty())
        return llvm::Error::success();

    Diagnostic &d = sink.report(value->range, "Use `" + builtin.str() + "` instead of `" +
                                                  typingName.str() + "` for type annotation");
    d.fix = Fix::safe(Edit::replacement(builtin.str(), value->range));
    d.fixTitle = "Replace with `" + builtin.str() + "`";
    return llvm::Error::success();
}

} // anonymous namespace

RuleDescriptor nonPEP585AnnotationRule() {
    RuleDescriptor rule;
    rule.code = "UP006";
    rule.name = "non-pep585-annotation";
    rule.severity = Severity::Warning;
    rule.fixAvailability = FixAvailability::Always;
    rule.appliesTo = {NodeKind::Subscript};
    rule.check = check;
    return rule;
}

} // namespace fixpoint
