#include "fixpoint/rules/BuiltinRules.h"
#include "fixpoint/core/RuleRegistry.h"

namespace fixpoint {

namespace rules {

namespace {

bool importsMember(const SyntaxTree &tree, llvm::StringRef module, llvm::StringRef name) {
    for (const Node &n : tree.nodes()) {
        if (n.kind != NodeKind::ImportFrom || n.value != module)
            continue;
        for (const Node *alias : tree.children(n, Field::Names)) {
            // `from typing import List as L` binds L, not List.
            if (alias->value == name && tree.children(*alias, Field::Name).empty())
                return true;
        }
    }
    return false;
}

} // anonymous namespace

llvm::StringRef referencedName(const Node &n, const RuleContext &ctx,
                               llvm::StringRef module) {
    if (n.kind == NodeKind::Name)
        return importsMember(ctx.tree(), module, n.value) ? llvm::StringRef(n.value)
                                                          : llvm::StringRef();
    if (n.kind != NodeKind::Attribute)
        return {};

    const Node *value = ctx.tree().child(n, Field::Value);
    const Node *attr  = ctx.tree().child(n, Field::Attr);
    if (!value || !attr || value->kind != NodeKind::Name || value->value != module)
        return {};
    return attr->value;
}

bool isDummyName(llvm::StringRef name) {
    return name.starts_with("_");
}

} // namespace rules

llvm::Error registerBuiltinRules(RuleRegistry &registry) {
    for (auto make : {mutableArgumentDefaultRule,
                      unusedLoopControlVariableRule,
                      incorrectDictIteratorRule,
                      collectionsNamedTupleRule,
                      explicitFStringConversionRule,
                      nonPEP585AnnotationRule,
                      nonPEP604AnnotationRule}) {
        if (auto err = registry.registerRule(make()))
            return err;
    }
    return llvm::Error::success();
}

} // namespace fixpoint
