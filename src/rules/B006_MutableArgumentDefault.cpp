#include "fixpoint/rules/BuiltinRules.h"

#include <llvm/ADT/StringSwitch.h>

#include <optional>

namespace fixpoint {

namespace {

bool isMutableDefault(const Node &value, const RuleContext &ctx) {
    switch (value.kind) {
        case NodeKind::List:
        case NodeKind::Dict:
        case NodeKind::Set:
        case NodeKind::Comprehension:
            return true;
        case NodeKind::Call: {
            const Node *func = ctx.tree().child(value, Field::Func);
            if (!func || func->kind != NodeKind::Name)
                return false;
            llvm::StringRef name = func->value;
            return name == "list" || name == "dict" || name == "set" ||
                   name == "bytearray";
        }
        default:
            return false;
    }
}

bool isImmutableTypeName(llvm::StringRef name) {
    return llvm::StringSwitch<bool>(name)
        .Cases("bool", "bytes", "complex", "float", "frozenset", true)
        .Cases("int", "object", "range", "str", "tuple", true)
        .Cases("AbstractSet", "Collection", "Container", "FrozenSet", "Hashable", true)
        .Cases("Iterable", "Mapping", "Reversible", "Sequence", "Tuple", true)
        .Default(false);
}

// `Sequence` or `typing.Sequence` / `collections.abc.Sequence`.
llvm::StringRef typeName(const Node &n, const SyntaxTree &tree) {
    if (n.kind == NodeKind::Name)
        return n.value;
    if (n.kind == NodeKind::Attribute) {
        if (const Node *attr = tree.child(n, Field::Attr))
            return attr->value;
    }
    return {};
}

// An annotation promising the function never mutates the argument:
// `x: Sequence[int] = []`, `x: Optional[Mapping] = {}`, `x: tuple | None`.
bool isImmutableAnnotation(const Node &ann, const SyntaxTree &tree) {
    switch (ann.kind) {
        case NodeKind::Name:
        case NodeKind::Attribute:
            return isImmutableTypeName(typeName(ann, tree));
        case NodeKind::Subscript: {
            const Node *value = tree.child(ann, Field::Value);
            if (!value)
                return false;
            if (typeName(*value, tree) == "Optional") {
                const Node *slice = tree.child(ann, Field::Slice);
                return slice && isImmutableAnnotation(*slice, tree);
            }
            return isImmutableAnnotation(*value, tree);
        }
        case NodeKind::BinOp: {
            bool any = false;
            for (NodeId id : ann.children) {
                const Node &operand = tree.node(id);
                if (operand.kind == NodeKind::Constant && operand.value == "None")
                    continue;
                if (!isImmutableAnnotation(operand, tree))
                    return false;
                any = true;
            }
            return any;
        }
        default:
            return false;
    }
}

size_t lineStartOf(llvm::StringRef source, size_t offset) {
    size_t nl = source.rfind('\n', offset);
    return nl == llvm::StringRef::npos ? 0 : nl + 1;
}

// Offset just past the newline ending the line that holds `offset`.
std::optional<size_t> fullLineEnd(llvm::StringRef source, size_t offset) {
    size_t nl = source.find('\n', offset);
    if (nl == llvm::StringRef::npos)
        return std::nullopt;
    return nl + 1;
}

// Whitespace in front of `n` on its line; nullopt when code precedes it.
std::optional<llvm::StringRef> leadingIndent(const Node &n, llvm::StringRef source) {
    size_t start = lineStartOf(source, n.range.start());
    llvm::StringRef indent = source.slice(start, n.range.start());
    if (indent.find_first_not_of(" \t") != llvm::StringRef::npos)
        return std::nullopt;
    return indent;
}

bool isDocstring(const Node &stmt, const SyntaxTree &tree) {
    if (stmt.kind != NodeKind::ExprStmt)
        return false;
    const Node *value = tree.child(stmt, Field::Value);
    return value && value->kind == NodeKind::Constant &&
           (llvm::StringRef(value->value).starts_with("'") ||
            llvm::StringRef(value->value).starts_with("\""));
}

// def f(x=[]):            def f(x=None):
//     """Doc."""    ->        """Doc."""
//     use(x)                  if x is None:
//                                 x = []
//                             use(x)
//
// None when the body shares a line with other code.
std::optional<llvm::Expected<Fix>> moveInitialization(const Node &def, const Node &param,
                                                      const Node &value,
                                                      const RuleContext &ctx) {
    const SyntaxTree &tree = ctx.tree();
    llvm::StringRef source = ctx.source();

    auto body = tree.children(def, Field::Body);
    if (body.empty())
        return std::nullopt;
    auto indent = leadingIndent(*body.front(), source);
    if (!indent)
        return std::nullopt;
    llvm::StringRef initializer = ctx.text(value);
    if (initializer.contains('\n'))
        return std::nullopt;

    size_t pos = lineStartOf(source, body.front()->range.start());
    for (size_t i = 0; i < body.size(); ++i) {
        const Node &stmt = *body[i];
        if (isDocstring(stmt, tree)) {
            if (i + 1 < body.size()) {
                if (!leadingIndent(*body[i + 1], source))
                    return std::nullopt;
                pos = lineStartOf(source, body[i + 1]->range.start());
            } else {
                auto end = fullLineEnd(source, stmt.range.end());
                if (!end)
                    return std::nullopt;
                pos = *end;
            }
        } else if (stmt.kind == NodeKind::Import || stmt.kind == NodeKind::ImportFrom) {
            auto end = fullLineEnd(source, stmt.range.end());
            if (!end)
                return std::nullopt;
            pos = *end;
        } else {
            break;
        }
    }

    // One indentation step is whatever the body adds on top of the def.
    llvm::StringRef defIndent =
        source.slice(lineStartOf(source, def.range.start()), def.range.start());
    std::string step = "    ";
    if (indent->starts_with(defIndent) && indent->size() > defIndent.size())
        step = indent->drop_front(defIndent.size()).str();

    std::string content = indent->str() + "if " + param.value + " is None:\n" +
                          indent->str() + step + param.value + " = " + initializer.str() +
                          "\n";
    return Fix::create({Edit::replacement("None", value.range),
                        Edit::insertion(std::move(content), static_cast<uint32_t>(pos))},
                       Applicability::Unsafe);
}

llvm::Error check(const Node &param, const RuleContext &ctx, DiagnosticSink &sink) {
    const SyntaxTree &tree = ctx.tree();

    // Lambda parameters are left alone.
    const Node *params = ctx.parent();
    const Node *def = params ? tree.parent(*params) : nullptr;
    if (!def || def->kind != NodeKind::FunctionDef)
        return llvm::Error::success();

    const Node *value = tree.child(param, Field::Default);
    if (!value || !isMutableDefault(*value, ctx))
        return llvm::Error::success();
    if (const Node *ann = tree.child(param, Field::Annotation)) {
        if (isImmutableAnnotation(*ann, tree))
            return llvm::Error::success();
    }

    auto fix = moveInitialization(*def, param, *value, ctx);
    if (fix && !*fix)
        return fix->takeError();

    Diagnostic &d = sink.report(value->range,
                                "Do not use mutable data structures for argument defaults");
    if (fix) {
        d.fix = std::move(**fix);
        d.fixTitle = "Replace with `None`; initialize within function";
    }
    return llvm::Error::success();
}

} // anonymous namespace

RuleDescriptor mutableArgumentDefaultRule() {
    RuleDescriptor rule;
    rule.code = "B006";
    rule.name = "mutable-argument-default";
    rule.severity = Severity::Warning;
    rule.fixAvailability = FixAvailability::Sometimes;
    rule.appliesTo = {NodeKind::Parameter};
    rule.check = check;
    return rule;
}

} // namespace fixpoint
