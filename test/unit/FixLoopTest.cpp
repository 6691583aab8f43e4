#include "fixpoint/core/Errors.h"
#include "fixpoint/fix/FixLoop.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

using namespace fixpoint;
using fixpoint::test::MapTreeProvider;
using fixpoint::test::SourceTree;

namespace {

const char *const kNested  = "x: typing.Optional[typing.List[str]]\n";
const char *const kUnioned = "x: typing.List[str] | None\n";
const char *const kFixed   = "x: list[str] | None\n";

// `typing.<member>` as an attribute under `parent`.
void typingAttr(SourceTree &t, NodeId parent, Field field, llvm::StringRef member,
                unsigned occurrence) {
    NodeId attr = t.add(parent, NodeKind::Attribute, field, ("typing." + member).str());
    t.name(attr, Field::Value, "typing", occurrence);
    t.name(attr, Field::Attr, member, 0, NodeKind::Identifier);
}

ParsedModule nestedTree() {
    SourceTree t(kNested);
    NodeId ann = t.add(t.root(), NodeKind::AnnAssign, Field::Body,
                       "x: typing.Optional[typing.List[str]]");
    t.name(ann, Field::Target, "x");
    NodeId outer = t.add(ann, NodeKind::Subscript, Field::Annotation,
                         "typing.Optional[typing.List[str]]");
    typingAttr(t, outer, Field::Value, "Optional", 0);
    NodeId inner = t.add(outer, NodeKind::Subscript, Field::Slice, "typing.List[str]");
    typingAttr(t, inner, Field::Value, "List", 1);
    t.name(inner, Field::Slice, "str");
    return t.build();
}

ParsedModule unionedTree() {
    SourceTree t(kUnioned);
    NodeId ann = t.add(t.root(), NodeKind::AnnAssign, Field::Body, "x: typing.List[str] | None");
    t.name(ann, Field::Target, "x");
    NodeId op = t.add(ann, NodeKind::BinOp, Field::Annotation, "typing.List[str] | None");
    NodeId sub = t.add(op, NodeKind::Subscript, Field::None, "typing.List[str]");
    typingAttr(t, sub, Field::Value, "List", 0);
    t.name(sub, Field::Slice, "str");
    t.add(op, NodeKind::Constant, Field::None, "None", 0, "None");
    return t.build();
}

ParsedModule fixedTree() {
    SourceTree t(kFixed);
    NodeId ann = t.add(t.root(), NodeKind::AnnAssign, Field::Body, "x: list[str] | None");
    t.name(ann, Field::Target, "x");
    NodeId op = t.add(ann, NodeKind::BinOp, Field::Annotation, "list[str] | None");
    NodeId sub = t.add(op, NodeKind::Subscript, Field::None, "list[str]");
    t.name(sub, Field::Value, "list");
    t.name(sub, Field::Slice, "str");
    t.add(op, NodeKind::Constant, Field::None, "None", 0, "None");
    return t.build();
}

class FixLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider.add(kNested, nestedTree);
        provider.add(kUnioned, unionedTree);
        provider.add(kFixed, fixedTree);
        cfg.fixMode = FixMode::SafeOnly;
    }

    FixLoopResult run(llvm::StringRef source) {
        AnalysisDriver driver(registry, cfg);
        auto result = runFixLoop(source, "nested.py", provider, driver, cfg);
        if (!result) {
            ADD_FAILURE() << llvm::toString(result.takeError());
            return {};
        }
        return std::move(*result);
    }

    RuleRegistry registry = RuleRegistry::builtin();
    Config cfg;
    MapTreeProvider provider;
};

} // anonymous namespace

TEST_F(FixLoopTest, ReanalyzesUntilNothingApplies) {
    FixLoopResult result = run(kNested);

    EXPECT_EQ(result.source, kFixed);
    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.iterations, 2u);
    EXPECT_EQ(result.fixed, (FixTable{{"UP006", 1}, {"UP007", 1}}));
    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_EQ(provider.calls(), 3u);
}

TEST_F(FixLoopTest, OverlappingFixIsDeferredToTheNextPass) {
    FixApplicator applicator(FixMode::SafeOnly);
    AnalysisDriver driver(registry, cfg);
    auto analysis = driver.analyze(nestedTree(), kNested);
    ASSERT_TRUE(static_cast<bool>(analysis));
    ASSERT_EQ(analysis->diagnostics.size(), 2u);

    auto pass = applicator.apply(kNested, analysis->diagnostics);
    ASSERT_TRUE(static_cast<bool>(pass));
    EXPECT_EQ(pass->source, kUnioned);
    ASSERT_EQ(pass->unapplied.size(), 1u);
    EXPECT_EQ(pass->unapplied[0].code, "UP006");
}

TEST_F(FixLoopTest, IterationLimitLeavesPendingFixes) {
    cfg.maxFixIterations = 1;
    FixLoopResult result = run(kNested);

    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.iterations, 1u);
    EXPECT_EQ(result.source, kUnioned);
    EXPECT_EQ(result.pendingCodes, (std::vector<std::string>{"UP006"}));
    EXPECT_EQ(result.fixed, (FixTable{{"UP007", 1}}));
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, "UP006");
    EXPECT_EQ(result.diagnostics[0].location.file, "nested.py");
}

TEST_F(FixLoopTest, LintOnlyModeLeavesSourceAlone) {
    cfg.fixMode = FixMode::Off;
    FixLoopResult result = run(kNested);

    EXPECT_EQ(result.source, kNested);
    EXPECT_EQ(result.iterations, 0u);
    EXPECT_TRUE(result.fixed.empty());
    ASSERT_EQ(result.diagnostics.size(), 2u);
    EXPECT_EQ(result.diagnostics[0].code, "UP007");
    EXPECT_EQ(result.diagnostics[1].code, "UP006");
    EXPECT_EQ(provider.calls(), 1u);
}

TEST_F(FixLoopTest, FixedOutputIsStable) {
    std::string once = run(kNested).source;
    FixLoopResult again = run(once);
    EXPECT_EQ(again.source, once);
    EXPECT_EQ(again.iterations, 0u);
    EXPECT_TRUE(again.diagnostics.empty());
}

TEST_F(FixLoopTest, UnparseableFixIsReportedWithItsCodes) {
    MapTreeProvider partial;
    partial.add(kNested, nestedTree);
    AnalysisDriver driver(registry, cfg);

    auto result = runFixLoop(kNested, "nested.py", partial, driver, cfg);
    ASSERT_FALSE(static_cast<bool>(result));

    std::string message;
    llvm::handleAllErrors(result.takeError(), [&](const EngineError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::FixSyntaxError);
        message = e.detail();
    });
    EXPECT_NE(message.find("fixes for UP007 introduced a syntax error"), std::string::npos)
        << message;
}

TEST_F(FixLoopTest, UnparseableInputIsReturnedAsIs) {
    AnalysisDriver driver(registry, cfg);
    auto result = runFixLoop("x: = \n", "broken.py", provider, driver, cfg);
    ASSERT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(consumeErrorKind(result.takeError()), ErrorKind::ParserFailed);
}

TEST(FixLoopScenarioTest, ReplacesItemsWithValues) {
    const std::string before = "for _, value in d.items(): print(value)\n";
    const std::string after  = "for value in d.values(): print(value)\n";

    MapTreeProvider provider;
    provider.add(before, [&] {
        SourceTree t(before);
        NodeId loop = t.add(t.root(), NodeKind::For, Field::Body,
                            "for _, value in d.items(): print(value)");
        NodeId target = t.add(loop, NodeKind::Tuple, Field::Target, "_, value");
        t.name(target, Field::Elts, "_");
        t.name(target, Field::Elts, "value");
        NodeId call = t.add(loop, NodeKind::Call, Field::Iter, "d.items()");
        NodeId func = t.add(call, NodeKind::Attribute, Field::Func, "d.items");
        t.name(func, Field::Value, "d");
        t.name(func, Field::Attr, "items", 0, NodeKind::Identifier);
        NodeId body = t.add(loop, NodeKind::ExprStmt, Field::Body, "print(value)");
        NodeId print = t.add(body, NodeKind::Call, Field::Value, "print(value)");
        t.name(print, Field::Func, "print");
        t.name(print, Field::Args, "value", 1);
        return t.build();
    });
    provider.add(after, [&] {
        SourceTree t(after);
        NodeId loop = t.add(t.root(), NodeKind::For, Field::Body,
                            "for value in d.values(): print(value)");
        t.name(loop, Field::Target, "value");
        NodeId call = t.add(loop, NodeKind::Call, Field::Iter, "d.values()");
        NodeId func = t.add(call, NodeKind::Attribute, Field::Func, "d.values");
        t.name(func, Field::Value, "d");
        t.name(func, Field::Attr, "values", 0, NodeKind::Identifier);
        NodeId body = t.add(loop, NodeKind::ExprStmt, Field::Body, "print(value)");
        NodeId print = t.add(body, NodeKind::Call, Field::Value, "print(value)");
        t.name(print, Field::Func, "print");
        t.name(print, Field::Args, "value", 2);
        return t.build();
    });

    RuleRegistry registry = RuleRegistry::builtin();
    Config cfg;
    cfg.fixMode = FixMode::SafeOnly;
    AnalysisDriver driver(registry, cfg);

    auto result = runFixLoop(before, "loop.py", provider, driver, cfg);
    ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
    EXPECT_EQ(result->source, after);
    EXPECT_EQ(result->fixed, (FixTable{{"PERF102", 1}}));
    EXPECT_TRUE(result->diagnostics.empty());
    EXPECT_TRUE(result->converged);
}
