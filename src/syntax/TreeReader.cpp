#include "fixpoint/syntax/TreeProvider.h"
#include "fixpoint/core/Errors.h"

#include <llvm/Support/JSON.h>

namespace fixpoint {

namespace {

llvm::Error malformed(const llvm::Twine &what) {
    return makeError(ErrorKind::MalformedTree, what);
}

llvm::Expected<TextRange> readRange(const llvm::json::Value *v, const llvm::Twine &what) {
    const llvm::json::Array *arr = v ? v->getAsArray() : nullptr;
    if (!arr || arr->size() != 2)
        return malformed(what + " needs a [start, end] range");

    auto start = (*arr)[0].getAsInteger();
    auto end = (*arr)[1].getAsInteger();
    if (!start || !end || *start < 0 || *end < *start ||
        *end > std::numeric_limits<uint32_t>::max())
        return malformed(what + " has an invalid range");

    return TextRange(static_cast<uint32_t>(*start), static_cast<uint32_t>(*end));
}

llvm::Error readNode(const llvm::json::Object &obj, TreeBuilder &builder, NodeId parent,
                     unsigned depth) {
    // Guards the recursion against hostile input.
    if (depth > 1000)
        return malformed("tree nesting exceeds 1000 levels");

    auto kindName = obj.getString("kind");
    if (!kindName)
        return malformed("node without \"kind\"");
    auto kind = nodeKindFromName(*kindName);
    if (!kind)
        return malformed("unknown node kind '" + *kindName + "'");

    auto range = readRange(obj.get("range"), "node '" + *kindName + "'");
    if (!range)
        return range.takeError();

    Field field = Field::None;
    if (auto f = obj.getString("field")) {
        auto parsed = fieldFromName(*f);
        if (!parsed)
            return malformed("unknown field '" + *f + "'");
        field = *parsed;
    }

    std::string value;
    if (auto v = obj.getString("value"))
        value = v->str();

    NodeId id = parent == kNoNode
        ? builder.addRoot(*kind, *range)
        : builder.add(parent, *kind, field, *range, std::move(value));

    if (const auto *children = obj.getArray("children")) {
        for (const auto &c : *children) {
            const auto *childObj = c.getAsObject();
            if (!childObj)
                return malformed("child of node " + llvm::Twine(id) + " is not an object");
            if (auto err = readNode(*childObj, builder, id, depth + 1))
                return err;
        }
    }

    return llvm::Error::success();
}

llvm::Error readRanges(const llvm::json::Object &top, llvm::StringRef key,
                       std::vector<TextRange> &out) {
    const auto *arr = top.getArray(key);
    if (!arr)
        return llvm::Error::success();
    for (const auto &v : *arr) {
        auto range = readRange(&v, key);
        if (!range)
            return range.takeError();
        out.push_back(*range);
    }
    return llvm::Error::success();
}

llvm::Expected<SymbolTable> readBindings(const llvm::json::Array &arr, size_t nodeCount) {
    SymbolTable symbols;
    for (const auto &v : arr) {
        const auto *obj = v.getAsObject();
        if (!obj)
            return malformed("binding is not an object");

        auto name = obj->getString("name");
        auto site = obj->getInteger("site");
        if (!name || !site || *site < 0 || static_cast<size_t>(*site) >= nodeCount)
            return malformed("binding needs a name and a valid site");

        NodeId siteId = static_cast<NodeId>(*site);
        symbols.addBinding(siteId, name->str());

        if (const auto *refs = obj->getArray("references")) {
            for (const auto &r : *refs) {
                auto ref = r.getAsInteger();
                if (!ref || *ref < 0 || static_cast<size_t>(*ref) >= nodeCount)
                    return malformed("binding '" + *name + "' has an invalid reference");
                symbols.addReference(siteId, static_cast<NodeId>(*ref));
            }
        }
    }
    return symbols;
}

} // anonymous namespace

llvm::Expected<ParsedModule> readTreeJSON(llvm::StringRef json) {
    auto parsed = llvm::json::parse(json);
    if (!parsed)
        return malformed("invalid JSON: " + llvm::toString(parsed.takeError()));

    const auto *top = parsed->getAsObject();
    if (!top)
        return malformed("top-level JSON value is not an object");

    const auto *root = top->getObject("root");
    if (!root)
        return malformed("missing \"root\" node");

    TreeBuilder builder;
    std::vector<TextRange> comments, strings;
    if (auto err = readNode(*root, builder, kNoNode, 0))
        return std::move(err);
    if (auto err = readRanges(*top, "comments", comments))
        return std::move(err);
    if (auto err = readRanges(*top, "multiline_strings", strings))
        return std::move(err);

    for (auto r : comments)
        builder.addComment(r);
    for (auto r : strings)
        builder.addMultilineString(r);

    ParsedModule module;
    module.tree = builder.build();

    if (const auto *bindings = top->getArray("bindings")) {
        auto symbols = readBindings(*bindings, module.tree.size());
        if (!symbols)
            return symbols.takeError();
        module.symbols = std::move(*symbols);
    }

    return std::move(module);
}

} // namespace fixpoint
