#pragma once

#include "fixpoint/core/Rule.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

namespace fixpoint {

class RuleRegistry;

RuleDescriptor incorrectDictIteratorRule();     // PERF102
RuleDescriptor mutableArgumentDefaultRule();    // B006
RuleDescriptor unusedLoopControlVariableRule(); // B007
RuleDescriptor explicitFStringConversionRule(); // RUF010
RuleDescriptor nonPEP585AnnotationRule();       // UP006
RuleDescriptor nonPEP604AnnotationRule();       // UP007
RuleDescriptor collectionsNamedTupleRule();     // PYI024

// Registers every rule above, in code order.
llvm::Error registerBuiltinRules(RuleRegistry &registry);

namespace rules {

// Member of `module` that `n` refers to: `typing.List` as an attribute, or a
// bare `List` when the module holds `from typing import List`. Empty when
// `n` refers to anything else.
llvm::StringRef referencedName(const Node &n, const RuleContext &ctx,
                               llvm::StringRef module = "typing");

// `_`, `__` and `_value` are placeholders the author does not intend to read.
bool isDummyName(llvm::StringRef name);

} // namespace rules

} // namespace fixpoint
