#include "fixpoint/rules/BuiltinRules.h"

namespace fixpoint {

namespace {

char conversionFor(llvm::StringRef builtin) {
    if (builtin == "str")
        return 's';
    if (builtin == "repr")
        return 'r';
    if (builtin == "ascii")
        return 'a';
    return 0;
}

// True when `name` is rebound somewhere before `use`, e.g. by
// `def ascii(arg): ...` ahead of f"{ascii(x)}".
bool isShadowed(llvm::StringRef name, const Node &use, const RuleContext &ctx) {
    const SymbolTable *symbols = ctx.symbols();
    if (!symbols)
        return false;
    for (const Binding *b : symbols->bindingsOf(name)) {
        if (ctx.tree().node(b->site).range.start() < use.range.start())
            return true;
    }
    return false;
}

// f"{str(x)}"  ->  f"{x!s}"
llvm::Error check(const Node &element, const RuleContext &ctx, DiagnosticSink &sink) {
    const SyntaxTree &tree = ctx.tree();

    // Already has an explicit conversion.
    if (!element.value.empty())
        return llvm::Error::success();

    const Node *call = tree.child(element, Field::Value);
    if (!call || call->kind != NodeKind::Call)
        return llvm::Error::success();
    const Node *func = tree.child(*call, Field::Func);
    if (!func || func->kind != NodeKind::Name)
        return llvm::Error::success();
    char conversion = conversionFor(func->value);
    if (!conversion || isShadowed(func->value, *func, ctx))
        return llvm::Error::success();

    auto args = tree.children(*call, Field::Args);
    if (args.size() != 1 || !tree.children(*call, Field::Keywords).empty())
        return llvm::Error::success();
    const Node &arg = *args.front();
    // A leading brace would read as an escaped `{{`.
    if (arg.kind == NodeKind::Dict || arg.kind == NodeKind::Set)
        return llvm::Error::success();

    // Only a closing brace or a format spec may follow; `=` debug text and
    // anything else are left alone.
    llvm::StringRef rest = ctx.source().substr(call->range.end()).ltrim();
    if (rest.empty() || (rest.front() != '}' && rest.front() != ':'))
        return llvm::Error::success();

    std::string replacement = ctx.text(arg).str() + "!" + conversion;
    Diagnostic &d = sink.report(call->range, "Use explicit conversion flag");
    d.fix = Fix::safe(Edit::replacement(std::move(replacement), call->range));
    d.fixTitle = "Replace with conversion flag";
    return llvm::Error::success();
}

} // anonymous namespace

RuleDescriptor explicitFStringConversionRule() {
    RuleDescriptor rule;
    rule.code = "RUF010";
    rule.name = "explicit-f-string-type-conversion";
    rule.severity = Severity::Info;
    rule.fixAvailability = FixAvailability::Always;
    rule.appliesTo = {NodeKind::FormattedValue};
    rule.check = check;
    return rule;
}

} // namespace fixpoint
