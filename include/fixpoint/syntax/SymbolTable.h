#pragma once

#include "fixpoint/syntax/SyntaxTree.h"

#include <llvm/ADT/StringRef.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fixpoint {

struct Binding {
    std::string name;
    NodeId site = kNoNode;           // Node that introduces the name
    std::vector<NodeId> references;  // Nodes that read it
};

// Scope/binding resolution produced upstream, keyed by binding site.
class SymbolTable {
public:
    void addBinding(NodeId site, std::string name);
    void addReference(NodeId site, NodeId reference);

    const Binding *bindingAt(NodeId site) const;
    bool isUsed(NodeId site) const;
    // Every binding of `name`, in no particular order.
    std::vector<const Binding *> bindingsOf(llvm::StringRef name) const;

    size_t size() const { return bindings_.size(); }

private:
    std::unordered_map<NodeId, Binding> bindings_;
};

// What a TreeProvider hands to the analysis driver.
struct ParsedModule {
    SyntaxTree tree;
    std::optional<SymbolTable> symbols;
};

} // namespace fixpoint
