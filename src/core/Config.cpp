#include "fixpoint/core/Config.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLParser.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

// YAML mapping for Config via llvm::yaml.

namespace llvm {
namespace yaml {

template <>
struct ScalarEnumerationTraits<fixpoint::FixMode> {
    static void enumeration(IO &io, fixpoint::FixMode &mode) {
        io.enumCase(mode, "off",    fixpoint::FixMode::Off);
        io.enumCase(mode, "safe",   fixpoint::FixMode::SafeOnly);
        io.enumCase(mode, "unsafe", fixpoint::FixMode::SafeAndUnsafe);
    }
};

template <>
struct ScalarEnumerationTraits<fixpoint::Severity> {
    static void enumeration(IO &io, fixpoint::Severity &sev) {
        io.enumCase(sev, "info",    fixpoint::Severity::Info);
        io.enumCase(sev, "warning", fixpoint::Severity::Warning);
        io.enumCase(sev, "error",   fixpoint::Severity::Error);
    }
};

template <>
struct MappingTraits<fixpoint::Config> {
    static void mapping(IO &io, fixpoint::Config &cfg) {
        io.mapOptional("select",             cfg.enabledCodes);
        io.mapOptional("ignore",             cfg.disabledCodes);
        io.mapOptional("fix_mode",           cfg.fixMode);
        io.mapOptional("max_fix_iterations", cfg.maxFixIterations);
        io.mapOptional("min_severity",       cfg.minSeverity);
        io.mapOptional("json_output",        cfg.jsonOutput);
        io.mapOptional("output_file",        cfg.outputFile);
        io.mapOptional("parser_command",     cfg.parserCommand);
    }

    static std::string validate(IO &, fixpoint::Config &cfg) {
        if (cfg.maxFixIterations < 1)
            return "max_fix_iterations must be at least 1";
        return {};
    }
};

} // namespace yaml
} // namespace llvm

namespace fixpoint {

namespace {

bool matchesSelector(std::string_view code, const std::vector<std::string> &selectors) {
    return std::any_of(selectors.begin(), selectors.end(), [code](const std::string &sel) {
        return sel == "ALL" || code.substr(0, sel.size()) == sel;
    });
}

} // anonymous namespace

bool Config::isEnabled(std::string_view code) const {
    if (!enabledCodes.empty() && !matchesSelector(code, enabledCodes))
        return false;
    return !matchesSelector(code, disabledCodes);
}

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "fixpoint: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    Config cfg = defaults();
    llvm::yaml::Input yin(bufOrErr.get()->getBuffer());
    yin >> cfg;

    if (yin.error()) {
        llvm::errs() << "fixpoint: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    return cfg;
}

} // namespace fixpoint
