#include "fixpoint/syntax/SymbolTable.h"

namespace fixpoint {

void SymbolTable::addBinding(NodeId site, std::string name) {
    auto &b = bindings_[site];
    b.site = site;
    b.name = std::move(name);
}

void SymbolTable::addReference(NodeId site, NodeId reference) {
    auto it = bindings_.find(site);
    if (it != bindings_.end())
        it->second.references.push_back(reference);
}

const Binding *SymbolTable::bindingAt(NodeId site) const {
    auto it = bindings_.find(site);
    return it != bindings_.end() ? &it->second : nullptr;
}

bool SymbolTable::isUsed(NodeId site) const {
    const Binding *b = bindingAt(site);
    return b && !b->references.empty();
}

std::vector<const Binding *> SymbolTable::bindingsOf(llvm::StringRef name) const {
    std::vector<const Binding *> out;
    for (const auto &[site, binding] : bindings_) {
        if (binding.name == name)
            out.push_back(&binding);
    }
    return out;
}

} // namespace fixpoint
