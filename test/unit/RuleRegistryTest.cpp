#include "fixpoint/core/Errors.h"
#include "fixpoint/core/RuleRegistry.h"

#include <gtest/gtest.h>

using namespace fixpoint;

namespace {

RuleDescriptor makeRule(std::string code, std::vector<NodeKind> kinds) {
    RuleDescriptor rule;
    rule.code = std::move(code);
    rule.name = "test-rule";
    rule.appliesTo = std::move(kinds);
    rule.check = [](const Node &, const RuleContext &, DiagnosticSink &) {
        return llvm::Error::success();
    };
    return rule;
}

} // anonymous namespace

TEST(RuleRegistryTest, IndexesRulesByNodeKind) {
    RuleRegistry registry;
    ASSERT_FALSE(static_cast<bool>(
        registry.registerRule(makeRule("X100", {NodeKind::For, NodeKind::Call}))));
    ASSERT_FALSE(static_cast<bool>(registry.registerRule(makeRule("X200", {NodeKind::Call}))));

    EXPECT_EQ(registry.rulesFor(NodeKind::For).vec(), (std::vector<size_t>{0}));
    EXPECT_EQ(registry.rulesFor(NodeKind::Call).vec(), (std::vector<size_t>{0, 1}));
    EXPECT_TRUE(registry.rulesFor(NodeKind::Name).empty());
}

TEST(RuleRegistryTest, RepeatedKindIsIndexedOnce) {
    RuleRegistry registry;
    ASSERT_FALSE(static_cast<bool>(
        registry.registerRule(makeRule("X100", {NodeKind::For, NodeKind::For}))));
    EXPECT_EQ(registry.rulesFor(NodeKind::For).size(), 1u);
}

TEST(RuleRegistryTest, RejectsDuplicateCode) {
    RuleRegistry registry;
    ASSERT_FALSE(static_cast<bool>(registry.registerRule(makeRule("X100", {NodeKind::For}))));

    llvm::Error err = registry.registerRule(makeRule("X100", {NodeKind::Call}));
    EXPECT_EQ(consumeErrorKind(std::move(err)), ErrorKind::DuplicateRule);
    EXPECT_EQ(registry.rules().size(), 1u);
    EXPECT_TRUE(registry.rulesFor(NodeKind::Call).empty());
}

TEST(RuleRegistryTest, FindsRulesByCode) {
    RuleRegistry registry;
    ASSERT_FALSE(static_cast<bool>(registry.registerRule(makeRule("X100", {NodeKind::For}))));
    ASSERT_NE(registry.findByCode("X100"), nullptr);
    EXPECT_EQ(registry.findByCode("X100")->name, "test-rule");
    EXPECT_EQ(registry.findByCode("X10"), nullptr);
}

TEST(RuleRegistryTest, BuiltinRegistryHoldsEveryRule) {
    RuleRegistry registry = RuleRegistry::builtin();
    for (const char *code : {"B006", "B007", "PERF102", "PYI024", "RUF010", "UP006", "UP007"})
        EXPECT_NE(registry.findByCode(code), nullptr) << code;
    EXPECT_EQ(registry.rules().size(), 7u);

    // Unused-directive reporting lives in the driver, not in the registry.
    EXPECT_EQ(registry.findByCode("RUF100"), nullptr);

    const RuleDescriptor *perf = registry.findByCode("PERF102");
    EXPECT_EQ(perf->fixAvailability, FixAvailability::Always);
    EXPECT_EQ(perf->appliesTo, (std::vector<NodeKind>{NodeKind::For}));
}
