#include "fixpoint/core/RuleRegistry.h"
#include "fixpoint/core/Errors.h"
#include "fixpoint/rules/BuiltinRules.h"

#include <algorithm>

namespace fixpoint {

llvm::Error RuleRegistry::registerRule(RuleDescriptor rule) {
    if (findByCode(rule.code))
        return makeError(ErrorKind::DuplicateRule,
                         "rule '" + rule.code + "' is already registered");

    size_t index = rules_.size();
    for (NodeKind kind : rule.appliesTo) {
        auto &slot = byKind_[static_cast<size_t>(kind)];
        if (std::find(slot.begin(), slot.end(), index) == slot.end())
            slot.push_back(index);
    }
    rules_.push_back(std::move(rule));
    return llvm::Error::success();
}

const RuleDescriptor *RuleRegistry::findByCode(std::string_view code) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [code](const auto &r) { return r.code == code; });
    return (it != rules_.end()) ? &*it : nullptr;
}

RuleRegistry RuleRegistry::builtin() {
    RuleRegistry registry;
    llvm::cantFail(registerBuiltinRules(registry));
    return registry;
}

} // namespace fixpoint
