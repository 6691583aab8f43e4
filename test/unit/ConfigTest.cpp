#include "fixpoint/core/Config.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/raw_ostream.h>

#include <gtest/gtest.h>

#include <memory>

using namespace fixpoint;

namespace {

// Writes `yaml` to a temp file that lives as long as the returned remover.
struct TempConfig {
    llvm::SmallString<128> path;
    std::unique_ptr<llvm::FileRemover> remover;

    explicit TempConfig(llvm::StringRef yaml) {
        int fd = -1;
        EXPECT_FALSE(llvm::sys::fs::createTemporaryFile("fixpoint-config", "yaml", fd, path));
        remover = std::make_unique<llvm::FileRemover>(path);
        llvm::raw_fd_ostream os(fd, /*shouldClose=*/true);
        os << yaml;
    }
};

} // anonymous namespace

TEST(ConfigTest, DefaultsEnableEverythingWithoutFixing) {
    Config cfg = Config::defaults();
    EXPECT_TRUE(cfg.isEnabled("PERF102"));
    EXPECT_TRUE(cfg.isEnabled("UP006"));
    EXPECT_EQ(cfg.fixMode, FixMode::Off);
    EXPECT_EQ(cfg.maxFixIterations, 100u);
    EXPECT_EQ(cfg.minSeverity, Severity::Info);
}

TEST(ConfigTest, SelectionMatchesPrefixes) {
    Config cfg;
    cfg.enabledCodes = {"UP", "B006"};
    cfg.disabledCodes = {"UP007"};
    EXPECT_TRUE(cfg.isEnabled("UP006"));
    EXPECT_FALSE(cfg.isEnabled("UP007"));
    EXPECT_TRUE(cfg.isEnabled("B006"));
    EXPECT_FALSE(cfg.isEnabled("B007"));
    EXPECT_FALSE(cfg.isEnabled("PERF102"));
}

TEST(ConfigTest, AllSelectsEveryCode) {
    Config cfg;
    cfg.enabledCodes = {"ALL"};
    cfg.disabledCodes = {"RUF"};
    EXPECT_TRUE(cfg.isEnabled("PYI024"));
    EXPECT_FALSE(cfg.isEnabled("RUF100"));
}

TEST(ConfigTest, LoadsYamlFile) {
    TempConfig file("select: [UP, PERF]\n"
                    "ignore: [UP007]\n"
                    "fix_mode: unsafe\n"
                    "max_fix_iterations: 5\n"
                    "min_severity: warning\n"
                    "json_output: true\n"
                    "parser_command: python3 pytree.py\n");

    Config cfg = Config::loadFromFile(file.path.str().str());
    EXPECT_EQ(cfg.enabledCodes, (std::vector<std::string>{"UP", "PERF"}));
    EXPECT_EQ(cfg.disabledCodes, (std::vector<std::string>{"UP007"}));
    EXPECT_EQ(cfg.fixMode, FixMode::SafeAndUnsafe);
    EXPECT_EQ(cfg.maxFixIterations, 5u);
    EXPECT_EQ(cfg.minSeverity, Severity::Warning);
    EXPECT_TRUE(cfg.jsonOutput);
    EXPECT_EQ(cfg.parserCommand, "python3 pytree.py");
}

TEST(ConfigTest, ZeroIterationsFallsBackToDefaults) {
    TempConfig file("fix_mode: safe\nmax_fix_iterations: 0\n");
    Config cfg = Config::loadFromFile(file.path.str().str());
    EXPECT_EQ(cfg.fixMode, FixMode::Off);
    EXPECT_EQ(cfg.maxFixIterations, 100u);
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    Config cfg = Config::loadFromFile("/nonexistent/fixpoint.config.yaml");
    EXPECT_TRUE(cfg.enabledCodes.empty());
    EXPECT_EQ(cfg.fixMode, FixMode::Off);
}
