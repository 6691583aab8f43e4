#include "fixpoint/analysis/AnalysisDriver.h"
#include "fixpoint/core/Errors.h"
#include "fixpoint/fix/FixLoop.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace fixpoint;
using fixpoint::test::MapTreeProvider;
using fixpoint::test::SourceTree;

namespace {

// Reports every Name node as "name <value>".
RuleDescriptor nameRule(std::string code = "X100") {
    RuleDescriptor rule;
    rule.code = std::move(code);
    rule.name = "report-names";
    rule.appliesTo = {NodeKind::Name};
    rule.check = [](const Node &n, const RuleContext &, DiagnosticSink &sink) {
        sink.report(n.range, "name " + n.value);
        return llvm::Error::success();
    };
    return rule;
}

RuleRegistry registryOf(std::vector<RuleDescriptor> rules) {
    RuleRegistry registry;
    for (auto &r : rules)
        llvm::cantFail(registry.registerRule(std::move(r)));
    return registry;
}

// a = b  # noqa: X100
// c = d
ParsedModule assignments(SourceTree &t, llvm::StringRef last = "d") {
    NodeId first = t.add(t.root(), NodeKind::Assign, Field::Body, "a = b");
    t.name(first, Field::Target, "a");
    t.name(first, Field::Value, "b");
    NodeId second = t.add(t.root(), NodeKind::Assign, Field::Body, ("c = " + last).str());
    t.name(second, Field::Target, "c");
    t.name(second, Field::Value, last);
    t.comment("# noqa");
    return t.build();
}

AnalysisResult analyze(const RuleRegistry &registry, const Config &cfg,
                       const ParsedModule &module, llvm::StringRef source) {
    AnalysisDriver driver(registry, cfg);
    auto result = driver.analyze(module, source, "test.py");
    if (!result) {
        ADD_FAILURE() << llvm::toString(result.takeError());
        return {};
    }
    return std::move(*result);
}

std::vector<std::string> messages(const AnalysisResult &result) {
    std::vector<std::string> out;
    for (const auto &d : result.diagnostics)
        out.push_back(d.message);
    return out;
}

} // anonymous namespace

TEST(AnalysisDriverTest, VisitsNodesAndResolvesLocations) {
    SourceTree t("a = b\nc = d\n");
    NodeId first = t.add(t.root(), NodeKind::Assign, Field::Body, "a = b");
    t.name(first, Field::Target, "a");
    t.name(first, Field::Value, "b");
    ParsedModule module = t.build();

    RuleRegistry registry = registryOf({nameRule()});
    AnalysisResult result = analyze(registry, Config::defaults(), module, t.source());

    ASSERT_EQ(result.diagnostics.size(), 2u);
    const Diagnostic &b = result.diagnostics[1];
    EXPECT_EQ(b.message, "name b");
    EXPECT_EQ(b.location.file, "test.py");
    EXPECT_EQ(b.location.line, 1u);
    EXPECT_EQ(b.location.column, 5u);
    EXPECT_EQ(b.location.endColumn, 6u);
    EXPECT_EQ(b.severity, Severity::Warning);
}

TEST(AnalysisDriverTest, DiagnosticsComeOutInSourceOrder) {
    SourceTree t("x = y\n");
    NodeId assign = t.add(t.root(), NodeKind::Assign, Field::Body, "x = y");
    // Children added out of order; output must still be sorted.
    t.name(assign, Field::Value, "y");
    t.name(assign, Field::Target, "x");
    ParsedModule module = t.build();

    RuleRegistry registry = registryOf({nameRule("X200"), nameRule("X100")});
    AnalysisResult result = analyze(registry, Config::defaults(), module, t.source());

    ASSERT_EQ(result.diagnostics.size(), 4u);
    EXPECT_EQ(result.diagnostics[0].code, "X100");
    EXPECT_EQ(result.diagnostics[0].message, "name x");
    EXPECT_EQ(result.diagnostics[1].code, "X200");
    EXPECT_EQ(result.diagnostics[2].code, "X100");
    EXPECT_EQ(result.diagnostics[2].message, "name y");
}

TEST(AnalysisDriverTest, DisabledRulesDoNotRun) {
    SourceTree t("x = y\n");
    NodeId assign = t.add(t.root(), NodeKind::Assign, Field::Body, "x = y");
    t.name(assign, Field::Target, "x");
    ParsedModule module = t.build();

    RuleRegistry registry = registryOf({nameRule("X100"), nameRule("Y100")});
    Config cfg;
    cfg.enabledCodes = {"X"};
    AnalysisResult result = analyze(registry, cfg, module, t.source());

    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, "X100");

    AnalysisDriver driver(registry, cfg);
    EXPECT_TRUE(driver.isRuleEnabled(0));
    EXPECT_FALSE(driver.isRuleEnabled(1));
}

TEST(AnalysisDriverTest, RulesSeeTheirAncestors) {
    SourceTree t("for x in y:\n    pass\n");
    NodeId loop = t.add(t.root(), NodeKind::For, Field::Body, "for x in y:\n    pass");
    t.name(loop, Field::Target, "x");
    t.add(loop, NodeKind::Pass, Field::Body, "pass");
    ParsedModule module = t.build();

    std::vector<std::vector<NodeId>> seen;
    RuleDescriptor rule;
    rule.code = "X100";
    rule.name = "inside-loop";
    rule.appliesTo = {NodeKind::Name, NodeKind::Pass};
    rule.check = [&seen](const Node &n, const RuleContext &ctx, DiagnosticSink &sink) {
        seen.push_back(ctx.ancestors().vec());
        if (ctx.enclosing(NodeKind::For) && ctx.parent()->kind == NodeKind::For)
            sink.report(n.range, std::string(nodeKindName(n.kind)));
        return llvm::Error::success();
    };
    RuleRegistry registry = registryOf({std::move(rule)});

    AnalysisResult result = analyze(registry, Config::defaults(), module, t.source());
    EXPECT_EQ(messages(result), (std::vector<std::string>{"Name", "Pass"}));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], (std::vector<NodeId>{t.root(), loop}));
    EXPECT_EQ(seen[1], (std::vector<NodeId>{t.root(), loop}));
}

TEST(AnalysisDriverTest, RuleFailuresBecomeInternalErrors) {
    SourceTree t("a = b\nc = d\n");
    NodeId first = t.add(t.root(), NodeKind::Assign, Field::Body, "a = b");
    t.name(first, Field::Target, "a");
    NodeId second = t.add(t.root(), NodeKind::Assign, Field::Body, "c = d");
    t.name(second, Field::Target, "c");
    ParsedModule module = t.build();

    RuleDescriptor throwing;
    throwing.code = "X900";
    throwing.name = "throws-on-a";
    throwing.appliesTo = {NodeKind::Name};
    throwing.check = [](const Node &n, const RuleContext &, DiagnosticSink &sink) {
        if (n.value == "a")
            throw std::runtime_error("boom");
        sink.report(n.range, "ok " + n.value);
        return llvm::Error::success();
    };

    RuleDescriptor failing;
    failing.code = "X901";
    failing.name = "fails-on-c";
    failing.appliesTo = {NodeKind::Name};
    failing.check = [](const Node &n, const RuleContext &, DiagnosticSink &) -> llvm::Error {
        if (n.value == "c")
            return makeError(ErrorKind::RuleFailure, "cannot handle c");
        return llvm::Error::success();
    };

    RuleRegistry registry = registryOf({std::move(throwing), std::move(failing), nameRule()});
    AnalysisResult result = analyze(registry, Config::defaults(), module, t.source());

    EXPECT_EQ(result.internalErrors, 2u);
    ASSERT_EQ(result.diagnostics.size(), 5u);
    EXPECT_EQ(result.diagnostics[0].message, "name a");

    const Diagnostic &thrown = result.diagnostics[1];
    EXPECT_TRUE(thrown.isInternalError());
    EXPECT_EQ(thrown.code, "X900");
    EXPECT_EQ(thrown.severity, Severity::Error);
    EXPECT_EQ(thrown.message, "rule X900 (throws-on-a) failed on Name node: rule-failure: boom");

    // Traversal continued past both failures.
    EXPECT_EQ(result.diagnostics[2].message, "name c");
    EXPECT_EQ(result.diagnostics[3].message, "ok c");

    const Diagnostic &returned = result.diagnostics[4];
    EXPECT_TRUE(returned.isInternalError());
    EXPECT_EQ(returned.code, "X901");
    EXPECT_EQ(returned.location.line, 2u);
}

TEST(AnalysisDriverTest, OutOfRangeRuleOutputIsAnInternalError) {
    SourceTree t("x\n");
    t.name(t.root(), Field::Body, "x");
    ParsedModule module = t.build();

    RuleDescriptor rule;
    rule.code = "X100";
    rule.name = "runs-off-the-end";
    rule.appliesTo = {NodeKind::Name};
    rule.check = [](const Node &n, const RuleContext &, DiagnosticSink &sink) {
        Diagnostic &d = sink.report(n.range, "bad fix");
        d.fix = Fix::safe(Edit::replacement("y", TextRange(0, 40)));
        return llvm::Error::success();
    };
    RuleRegistry registry = registryOf({std::move(rule)});

    AnalysisResult result = analyze(registry, Config::defaults(), module, t.source());
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_TRUE(result.diagnostics[0].isInternalError());
    EXPECT_FALSE(result.diagnostics[0].fix.has_value());
}

TEST(AnalysisDriverTest, NoqaSuppressesMatchingCodes) {
    SourceTree t("a = b  # noqa: X100\nc = d\n");
    ParsedModule module = assignments(t);

    RuleRegistry registry = registryOf({nameRule("X100"), nameRule("X200")});
    AnalysisResult result = analyze(registry, Config::defaults(), module, t.source());

    EXPECT_EQ(result.suppressed, 2u);
    ASSERT_EQ(result.diagnostics.size(), 6u);
    for (const auto &d : result.diagnostics)
        EXPECT_FALSE(d.code == "X100" && d.location.line == 1) << d.message;
}

TEST(AnalysisDriverTest, SuppressionInsideMultilineStringUsesLastLine) {
    std::string source = "s = f\"\"\"\n{x}\n\"\"\"  # noqa\n";
    SourceTree t(source);
    NodeId assign = t.add(t.root(), NodeKind::Assign, Field::Body, "s = f\"\"\"\n{x}\n\"\"\"");
    t.name(assign, Field::Target, "s");
    t.name(assign, Field::Value, "x");
    t.comment("# noqa");
    t.multilineString("f\"\"\"\n{x}\n\"\"\"");
    ParsedModule module = t.build();

    RuleRegistry registry = registryOf({nameRule()});
    AnalysisResult result = analyze(registry, Config::defaults(), module, source);

    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_EQ(result.suppressed, 2u);
}

TEST(AnalysisDriverTest, ReportsUnusedDirectivesWhenSelected) {
    std::string source = "a = b  # noqa: X100, Y100\n"
                         "c = 1  # noqa\n"
                         "e = 2  # noqa: Z100\n";
    SourceTree t(source);
    NodeId first = t.add(t.root(), NodeKind::Assign, Field::Body, "a = b");
    t.name(first, Field::Target, "a");
    t.add(t.root(), NodeKind::Assign, Field::Body, "c = 1");
    t.add(t.root(), NodeKind::Assign, Field::Body, "e = 2");
    t.comment("# noqa: X100");
    t.comment("# noqa\n");
    t.comment("# noqa: Z100");
    ParsedModule module = t.build();

    RuleRegistry registry = registryOf({nameRule()});
    Config cfg;
    cfg.enabledCodes = {"X100", "RUF100"};
    AnalysisResult result = analyze(registry, cfg, module, source);

    ASSERT_EQ(result.diagnostics.size(), 3u);

    const Diagnostic &partial = result.diagnostics[0];
    EXPECT_EQ(partial.code, "RUF100");
    EXPECT_EQ(partial.message, "Unused `noqa` directive (unused: `Y100`)");
    ASSERT_TRUE(partial.fix.has_value());
    EXPECT_EQ(partial.fix->applicability(), Applicability::Safe);
    EXPECT_EQ(partial.fix->edits()[0].content, "# noqa: X100");
    EXPECT_EQ(partial.fix->edits()[0].range, test::rangeOf(source, "# noqa: X100, Y100"));

    const Diagnostic &blanket = result.diagnostics[1];
    EXPECT_EQ(blanket.message, "Unused blanket `noqa` directive");
    EXPECT_EQ(blanket.location.line, 2u);
    ASSERT_TRUE(blanket.fix.has_value());
    // Deletion reaches back over the whitespace before the comment.
    TextRange spaced = test::rangeOf(source, "  # noqa\n");
    EXPECT_EQ(blanket.fix->edits()[0].range, TextRange(spaced.start(), spaced.end() - 1));
    EXPECT_TRUE(blanket.fix->edits()[0].isDeletion());

    const Diagnostic &scoped = result.diagnostics[2];
    EXPECT_EQ(scoped.message, "Unused `noqa` directive (unused: `Z100`)");
    EXPECT_EQ(scoped.fixTitle, "Remove unused `noqa` directive");
}

TEST(AnalysisDriverTest, UnusedDirectivesAreOptIn) {
    SourceTree t("a = 1  # noqa\n");
    t.add(t.root(), NodeKind::Assign, Field::Body, "a = 1");
    t.comment("# noqa");
    ParsedModule module = t.build();

    RuleRegistry registry = registryOf({nameRule()});
    AnalysisResult result = analyze(registry, Config::defaults(), module, t.source());
    EXPECT_TRUE(result.diagnostics.empty());

    Config cfg;
    cfg.enabledCodes = {"ALL"};
    result = analyze(registry, cfg, module, t.source());
    EXPECT_EQ(result.diagnostics.size(), 1u);
}

TEST(AnalysisDriverTest, RejectsInconsistentInput) {
    RuleRegistry registry = registryOf({nameRule()});
    AnalysisDriver driver(registry, Config::defaults());

    ParsedModule empty;
    auto none = driver.analyze(empty, "x = 1\n");
    ASSERT_FALSE(static_cast<bool>(none));
    EXPECT_EQ(consumeErrorKind(none.takeError()), ErrorKind::MalformedTree);

    SourceTree t("x = 1\n");
    t.name(t.root(), Field::Body, "x");
    ParsedModule module = t.build();
    auto shorter = driver.analyze(module, "x");
    ASSERT_FALSE(static_cast<bool>(shorter));
    EXPECT_EQ(consumeErrorKind(shorter.takeError()), ErrorKind::MalformedTree);
}

TEST(AnalysisDriverTest, SuppressionFollowsTheAnchorLineOnly) {
    // Anchored on `a` (line 1), fixing `d` on line 2 where the directive is.
    RuleDescriptor rule;
    rule.code = "X300";
    rule.name = "anchor-elsewhere";
    rule.fixAvailability = FixAvailability::Always;
    rule.appliesTo = {NodeKind::Name};
    rule.check = [](const Node &n, const RuleContext &ctx, DiagnosticSink &sink) {
        if (n.value != "a")
            return llvm::Error::success();
        auto target = static_cast<uint32_t>(ctx.source().find('d'));
        Diagnostic &d = sink.report(n.range, "fix lives on the next line");
        d.fix = Fix::safe(Edit::replacement("e", TextRange(target, target + 1)));
        return llvm::Error::success();
    };
    RuleRegistry registry = registryOf({std::move(rule)});

    SourceTree t("a = b\nc = d  # noqa\n");
    ParsedModule module = assignments(t);
    AnalysisResult result = analyze(registry, Config::defaults(), module, t.source());

    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].location.line, 1u);
    EXPECT_EQ(result.suppressed, 0u);
}

TEST(AnalysisDriverTest, SuppressedFindingsAreNeverFixed) {
    // Upper-cases every lowercase assigned value.
    RuleDescriptor rule;
    rule.code = "X300";
    rule.name = "upper-values";
    rule.fixAvailability = FixAvailability::Always;
    rule.appliesTo = {NodeKind::Name};
    rule.check = [](const Node &n, const RuleContext &, DiagnosticSink &sink) {
        llvm::StringRef value = n.value;
        if (n.field != Field::Value || value != value.lower())
            return llvm::Error::success();
        Diagnostic &d = sink.report(n.range, "lowercase " + n.value);
        d.fix = Fix::safe(Edit::replacement(value.upper(), n.range));
        return llvm::Error::success();
    };
    RuleRegistry registry = registryOf({std::move(rule)});

    const std::string before = "a = b  # noqa\nc = d\n";
    const std::string after  = "a = b  # noqa\nc = D\n";
    MapTreeProvider provider;
    provider.add(before, [&before] {
        SourceTree t(before);
        return assignments(t, "d");
    });
    provider.add(after, [&after] {
        SourceTree t(after);
        return assignments(t, "D");
    });

    Config cfg;
    cfg.fixMode = FixMode::SafeOnly;
    AnalysisDriver driver(registry, cfg);
    auto result = runFixLoop(before, "test.py", provider, driver, cfg);
    ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
    EXPECT_EQ(result->source, after);
    EXPECT_EQ(result->fixed, (FixTable{{"X300", 1}}));
    EXPECT_TRUE(result->diagnostics.empty());
    EXPECT_TRUE(result->converged);
}
