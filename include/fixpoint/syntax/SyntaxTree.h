#pragma once

#include "fixpoint/core/TextRange.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fixpoint {

using NodeId = uint32_t;
constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

// Node vocabulary of the upstream parser.
enum class NodeKind : uint8_t {
    Module,
    FunctionDef,
    ClassDef,
    Decorator,
    Parameters,
    Parameter,
    For,
    While,
    If,
    With,
    Assign,
    AnnAssign,
    ExprStmt,
    Return,
    Pass,
    Import,
    ImportFrom,
    Alias,
    Call,
    Keyword,
    Attribute,
    Name,
    Identifier,
    Subscript,
    Tuple,
    List,
    Dict,
    Set,
    Constant,
    FString,
    FormattedValue,
    BinOp,
    Comprehension,  // List, set and dict comprehensions
    Other,
};

constexpr size_t kNodeKindCount = static_cast<size_t>(NodeKind::Other) + 1;

std::string_view nodeKindName(NodeKind kind);
std::optional<NodeKind> nodeKindFromName(std::string_view name);

// Role of a node inside its parent.
enum class Field : uint8_t {
    None,
    Body,
    OrElse,
    Target,
    Iter,
    Test,
    Value,
    Func,
    Args,
    Keywords,
    Attr,
    Slice,
    Elts,
    Name,
    Decorators,
    Params,
    Default,
    Annotation,
    Returns,
    Bases,
    Names,
};

std::string_view fieldName(Field field);
std::optional<Field> fieldFromName(std::string_view name);

struct Node {
    NodeId id        = kNoNode;
    NodeKind kind    = NodeKind::Other;
    Field field      = Field::None;
    TextRange range;
    NodeId parent    = kNoNode;
    std::vector<NodeId> children;
    // Identifier text for Name/Identifier/Parameter/Alias nodes, literal
    // text for Constant, conversion character for FormattedValue.
    std::string value;
};

// Immutable tree handed over by the upstream parser, plus the comment and
// multi-line string trivia the parser saw. Node ids index nodes().
class SyntaxTree {
public:
    SyntaxTree() = default;

    bool empty() const { return nodes_.empty(); }
    size_t size() const { return nodes_.size(); }

    const Node &root() const { return nodes_.front(); }
    const Node &node(NodeId id) const { return nodes_[id]; }
    const std::vector<Node> &nodes() const { return nodes_; }

    const Node *parent(const Node &n) const {
        return n.parent == kNoNode ? nullptr : &nodes_[n.parent];
    }

    // First child playing `field`, or nullptr.
    const Node *child(const Node &n, Field field) const;
    // Every child playing `field`, in source order.
    std::vector<const Node *> children(const Node &n, Field field) const;

    llvm::ArrayRef<TextRange> comments() const { return comments_; }
    llvm::ArrayRef<TextRange> multilineStrings() const { return multilineStrings_; }

    // Every node and trivia range must lie inside the source, and every
    // child inside its parent.
    llvm::Error validate(llvm::StringRef source) const;

private:
    friend class TreeBuilder;

    std::vector<Node> nodes_;
    std::vector<TextRange> comments_;
    std::vector<TextRange> multilineStrings_;
};

// Assembles a SyntaxTree. Ids are handed out in creation order; a child is
// added after its parent, and siblings in source order.
class TreeBuilder {
public:
    NodeId addRoot(NodeKind kind, TextRange range);
    NodeId add(NodeId parent, NodeKind kind, Field field, TextRange range,
               std::string value = {});

    void addComment(TextRange range) { tree_.comments_.push_back(range); }
    void addMultilineString(TextRange range) { tree_.multilineStrings_.push_back(range); }

    SyntaxTree build() { return std::move(tree_); }

private:
    SyntaxTree tree_;
};

} // namespace fixpoint
