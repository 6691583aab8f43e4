#include "fixpoint/analysis/AnalysisDriver.h"
#include "fixpoint/core/Errors.h"

#include <llvm/ADT/StringExtras.h>

#include <algorithm>
#include <exception>

namespace fixpoint {

namespace {

llvm::Error checkInside(TextRange range, llvm::StringRef source, llvm::StringRef what) {
    if (range.end() <= source.size())
        return llvm::Error::success();
    return makeError(ErrorKind::OutOfRange,
                     what + " [" + llvm::Twine(range.start()) + ", " +
                         llvm::Twine(range.end()) + ") is past the end of a " +
                         llvm::Twine(source.size()) + "-byte source");
}

// Every range a rule hands back must address the analyzed source.
llvm::Error checkProduced(const std::vector<Diagnostic> &produced, llvm::StringRef source) {
    for (const auto &d : produced) {
        if (auto err = checkInside(d.range, source, "diagnostic range"))
            return err;
        if (!d.fix)
            continue;
        for (const auto &e : d.fix->edits()) {
            if (auto err = checkInside(e.range, source, "fix edit"))
                return err;
        }
    }
    return llvm::Error::success();
}

bool sourceOrder(const Diagnostic &a, const Diagnostic &b) {
    if (a.range.start() != b.range.start())
        return a.range.start() < b.range.start();
    if (a.range.end() != b.range.end())
        return a.range.end() < b.range.end();
    if (a.code != b.code)
        return a.code < b.code;
    return a.message < b.message;
}

} // anonymous namespace

llvm::Error resolveLocation(Diagnostic &diag, const SourceMap &map, llvm::StringRef path) {
    auto start = map.offsetToPosition(diag.range.start());
    if (!start)
        return start.takeError();
    auto end = map.offsetToPosition(diag.range.end());
    if (!end)
        return end.takeError();

    diag.location.file      = path.str();
    diag.location.line      = start->line;
    diag.location.column    = start->column;
    diag.location.endLine   = end->line;
    diag.location.endColumn = end->column;
    return llvm::Error::success();
}

AnalysisDriver::AnalysisDriver(const RuleRegistry &registry, const Config &cfg)
    : registry_(registry), config_(cfg) {
    enabled_.reserve(registry_.rules().size());
    for (const auto &rule : registry_.rules())
        enabled_.push_back(config_.isEnabled(rule.code));

    // Opt-in only: an empty selection means "every registered rule", and
    // RUF100 is not a registered rule.
    unusedNoqaEnabled_ = !config_.enabledCodes.empty() && config_.isEnabled(kUnusedNoqaCode);
}

llvm::Expected<AnalysisResult> AnalysisDriver::analyze(const ParsedModule &module,
                                                       llvm::StringRef source,
                                                       llvm::StringRef path) const {
    const SyntaxTree &tree = module.tree;
    if (tree.empty())
        return makeError(ErrorKind::MalformedTree, "tree has no root node");
    if (auto err = tree.validate(source))
        return std::move(err);

    SourceMap map(source);
    auto suppressions = SuppressionIndex::build(source, tree.comments(),
                                                tree.multilineStrings(), map);
    if (!suppressions)
        return suppressions.takeError();

    RuleContext ctx(tree, source, module.symbols ? &*module.symbols : nullptr);
    AnalysisResult result;
    UsedCodes used;

    // Pre-order walk; ctx.ancestors_ always holds the path to the current node.
    struct Frame {
        NodeId id;
        size_t depth;
    };
    std::vector<Frame> stack{{tree.root().id, 0}};

    while (!stack.empty()) {
        Frame frame = stack.back();
        stack.pop_back();

        ctx.ancestors_.resize(frame.depth);
        const Node &node = tree.node(frame.id);

        for (size_t index : registry_.rulesFor(node.kind)) {
            if (enabled_[index])
                runRule(index, node, ctx, map, *suppressions, path,
                        result.diagnostics, used, result);
        }

        ctx.ancestors_.push_back(node.id);
        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it)
            stack.push_back({*it, frame.depth + 1});
    }

    if (unusedNoqaEnabled_)
        reportUnusedDirectives(*suppressions, source, map, path, used, result.diagnostics);

    std::stable_sort(result.diagnostics.begin(), result.diagnostics.end(), sourceOrder);
    return std::move(result);
}

void AnalysisDriver::runRule(size_t ruleIndex, const Node &node, const RuleContext &ctx,
                             const SourceMap &map, const SuppressionIndex &suppressions,
                             llvm::StringRef path, std::vector<Diagnostic> &out,
                             UsedCodes &used, AnalysisResult &result) const {
    const RuleDescriptor &rule = registry_.rules()[ruleIndex];

    std::vector<Diagnostic> produced;
    DiagnosticSink sink(rule.code, rule.severity, produced);

    auto invoke = [&]() -> llvm::Error {
        try {
            return rule.check(node, ctx, sink);
        } catch (const std::exception &e) {
            return makeError(ErrorKind::RuleFailure, e.what());
        }
    };

    llvm::Error err = invoke();
    if (!err)
        err = checkProduced(produced, ctx.source());
    if (!err) {
        for (auto &d : produced) {
            if (auto locErr = resolveLocation(d, map, path)) {
                err = std::move(locErr);
                break;
            }
        }
    }

    if (err) {
        // Isolate the failure to this rule/node pair and keep walking.
        Diagnostic diag;
        diag.code     = rule.code;
        diag.kind     = DiagnosticKind::InternalError;
        diag.severity = Severity::Error;
        diag.range    = node.range;
        diag.message  = "rule " + rule.code + " (" + rule.name + ") failed on " +
                        std::string(nodeKindName(node.kind)) + " node: " +
                        llvm::toString(std::move(err));
        // The tree was validated against this source, so node ranges map.
        llvm::cantFail(resolveLocation(diag, map, path));
        out.push_back(std::move(diag));
        ++result.internalErrors;
        return;
    }

    for (auto &d : produced) {
        unsigned line = suppressions.directiveLine(d.location.line);
        if (suppressions.isSuppressed(d.location.line, d.code)) {
            used.emplace(line, d.code);
            ++result.suppressed;
            continue;
        }
        out.push_back(std::move(d));
    }
}

void AnalysisDriver::reportUnusedDirectives(const SuppressionIndex &suppressions,
                                            llvm::StringRef source, const SourceMap &map,
                                            llvm::StringRef path, const UsedCodes &used,
                                            std::vector<Diagnostic> &out) const {
    for (const auto &d : suppressions.directives()) {
        std::vector<std::string> kept, unused;
        if (d.blanket) {
            bool anyUsed = std::any_of(used.begin(), used.end(),
                                       [&](const auto &u) { return u.first == d.line; });
            if (anyUsed)
                continue;
        } else {
            for (const auto &code : d.codes) {
                if (used.count({d.line, code}))
                    kept.push_back(code);
                else
                    unused.push_back(code);
            }
            if (unused.empty())
                continue;
        }

        Diagnostic diag;
        diag.code     = std::string(kUnusedNoqaCode);
        diag.severity = Severity::Warning;
        diag.range    = d.range;
        if (d.blanket) {
            diag.message = "Unused blanket `noqa` directive";
        } else {
            diag.message = "Unused `noqa` directive (unused: ";
            for (size_t i = 0; i < unused.size(); ++i) {
                diag.message += "`" + unused[i] + "`";
                if (i + 1 < unused.size())
                    diag.message += ", ";
            }
            diag.message += ")";
        }

        if (kept.empty()) {
            // Drop the directive together with the whitespace before it.
            uint32_t start = d.range.start();
            uint32_t lineStart = llvm::cantFail(map.lineStart(d.line));
            while (start > lineStart && llvm::isSpace(source[start - 1]))
                --start;
            diag.fix = Fix::safe(Edit::deletion(TextRange(start, d.range.end())));
            diag.fixTitle = "Remove unused `noqa` directive";
        } else {
            diag.fix = Fix::safe(Edit::replacement(
                "# noqa: " + llvm::join(kept, ", "), d.range));
            diag.fixTitle = "Remove unused codes from `noqa` directive";
        }

        llvm::cantFail(resolveLocation(diag, map, path));
        out.push_back(std::move(diag));
    }
}

} // namespace fixpoint
