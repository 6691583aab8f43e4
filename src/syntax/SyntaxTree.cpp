#include "fixpoint/syntax/SyntaxTree.h"
#include "fixpoint/core/Errors.h"

#include <array>
#include <utility>

namespace fixpoint {

namespace {

constexpr std::array<std::pair<NodeKind, std::string_view>, kNodeKindCount> kKindNames = {{
    {NodeKind::Module,         "Module"},
    {NodeKind::FunctionDef,    "FunctionDef"},
    {NodeKind::ClassDef,       "ClassDef"},
    {NodeKind::Decorator,      "Decorator"},
    {NodeKind::Parameters,     "Parameters"},
    {NodeKind::Parameter,      "Parameter"},
    {NodeKind::For,            "For"},
    {NodeKind::While,          "While"},
    {NodeKind::If,             "If"},
    {NodeKind::With,           "With"},
    {NodeKind::Assign,         "Assign"},
    {NodeKind::AnnAssign,      "AnnAssign"},
    {NodeKind::ExprStmt,       "ExprStmt"},
    {NodeKind::Return,         "Return"},
    {NodeKind::Pass,           "Pass"},
    {NodeKind::Import,         "Import"},
    {NodeKind::ImportFrom,     "ImportFrom"},
    {NodeKind::Alias,          "Alias"},
    {NodeKind::Call,           "Call"},
    {NodeKind::Keyword,        "Keyword"},
    {NodeKind::Attribute,      "Attribute"},
    {NodeKind::Name,           "Name"},
    {NodeKind::Identifier,     "Identifier"},
    {NodeKind::Subscript,      "Subscript"},
    {NodeKind::Tuple,          "Tuple"},
    {NodeKind::List,           "List"},
    {NodeKind::Dict,           "Dict"},
    {NodeKind::Set,            "Set"},
    {NodeKind::Constant,       "Constant"},
    {NodeKind::FString,        "FString"},
    {NodeKind::FormattedValue, "FormattedValue"},
    {NodeKind::BinOp,          "BinOp"},
    {NodeKind::Comprehension,  "Comprehension"},
    {NodeKind::Other,          "Other"},
}};

constexpr std::array<std::pair<Field, std::string_view>, 21> kFieldNames = {{
    {Field::None,       ""},
    {Field::Body,       "body"},
    {Field::OrElse,     "orelse"},
    {Field::Target,     "target"},
    {Field::Iter,       "iter"},
    {Field::Test,       "test"},
    {Field::Value,      "value"},
    {Field::Func,       "func"},
    {Field::Args,       "args"},
    {Field::Keywords,   "keywords"},
    {Field::Attr,       "attr"},
    {Field::Slice,      "slice"},
    {Field::Elts,       "elts"},
    {Field::Name,       "name"},
    {Field::Decorators, "decorators"},
    {Field::Params,     "params"},
    {Field::Default,    "default"},
    {Field::Annotation, "annotation"},
    {Field::Returns,    "returns"},
    {Field::Bases,      "bases"},
    {Field::Names,      "names"},
}};

llvm::Error outside(const char *what, NodeId id, TextRange inner, TextRange outer) {
    return makeError(ErrorKind::MalformedTree,
                     llvm::Twine(what) + " " + llvm::Twine(id) + " range [" +
                         llvm::Twine(inner.start()) + ", " + llvm::Twine(inner.end()) +
                         ") lies outside [" + llvm::Twine(outer.start()) + ", " +
                         llvm::Twine(outer.end()) + ")");
}

} // anonymous namespace

std::string_view nodeKindName(NodeKind kind) {
    return kKindNames[static_cast<size_t>(kind)].second;
}

std::optional<NodeKind> nodeKindFromName(std::string_view name) {
    for (const auto &[kind, n] : kKindNames) {
        if (n == name)
            return kind;
    }
    return std::nullopt;
}

std::string_view fieldName(Field field) {
    return kFieldNames[static_cast<size_t>(field)].second;
}

std::optional<Field> fieldFromName(std::string_view name) {
    for (const auto &[field, n] : kFieldNames) {
        if (n == name)
            return field;
    }
    return std::nullopt;
}

const Node *SyntaxTree::child(const Node &n, Field field) const {
    for (NodeId c : n.children) {
        if (nodes_[c].field == field)
            return &nodes_[c];
    }
    return nullptr;
}

std::vector<const Node *> SyntaxTree::children(const Node &n, Field field) const {
    std::vector<const Node *> out;
    for (NodeId c : n.children) {
        if (nodes_[c].field == field)
            out.push_back(&nodes_[c]);
    }
    return out;
}

llvm::Error SyntaxTree::validate(llvm::StringRef source) const {
    if (source.size() > std::numeric_limits<uint32_t>::max())
        return makeError(ErrorKind::OutOfRange, "source exceeds 4 GiB");

    const TextRange whole(0, static_cast<uint32_t>(source.size()));

    for (const auto &n : nodes_) {
        if (!whole.contains(n.range))
            return outside("node", n.id, n.range, whole);
        if (n.parent != kNoNode && !nodes_[n.parent].range.contains(n.range))
            return outside("node", n.id, n.range, nodes_[n.parent].range);
    }

    for (size_t i = 0; i < comments_.size(); ++i) {
        if (!whole.contains(comments_[i]))
            return outside("comment", static_cast<NodeId>(i), comments_[i], whole);
    }
    for (size_t i = 0; i < multilineStrings_.size(); ++i) {
        if (!whole.contains(multilineStrings_[i]))
            return outside("string", static_cast<NodeId>(i), multilineStrings_[i], whole);
    }

    return llvm::Error::success();
}

NodeId TreeBuilder::addRoot(NodeKind kind, TextRange range) {
    Node n;
    n.id = static_cast<NodeId>(tree_.nodes_.size());
    n.kind = kind;
    n.range = range;
    tree_.nodes_.push_back(std::move(n));
    return tree_.nodes_.back().id;
}

NodeId TreeBuilder::add(NodeId parent, NodeKind kind, Field field, TextRange range,
                        std::string value) {
    Node n;
    n.id = static_cast<NodeId>(tree_.nodes_.size());
    n.kind = kind;
    n.field = field;
    n.range = range;
    n.parent = parent;
    n.value = std::move(value);
    tree_.nodes_.push_back(std::move(n));
    tree_.nodes_[parent].children.push_back(tree_.nodes_.back().id);
    return tree_.nodes_.back().id;
}

} // namespace fixpoint
