#pragma once

#include "fixpoint/core/Severity.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fixpoint {

enum class FixMode : uint8_t {
    Off,
    SafeOnly,
    SafeAndUnsafe,
};

constexpr std::string_view fixModeName(FixMode m) {
    switch (m) {
        case FixMode::Off:           return "off";
        case FixMode::SafeOnly:      return "safe";
        case FixMode::SafeAndUnsafe: return "unsafe";
    }
    return "off";
}

struct Config {
    // Rule selection. Entries match a code exactly or as a prefix; "ALL"
    // matches every code. An empty selection enables every registered rule.
    std::vector<std::string> enabledCodes;
    std::vector<std::string> disabledCodes;

    // Fixing
    FixMode fixMode             = FixMode::Off;
    unsigned maxFixIterations   = 100;

    // Minimum severity to emit
    Severity minSeverity        = Severity::Info;

    // Output
    bool jsonOutput             = false;
    std::string outputFile;             // empty = stdout

    // Upstream parser invoked as `<cmd> --output <json> <source>`
    std::string parserCommand;

    bool isEnabled(std::string_view code) const;

    static Config loadFromFile(const std::string &path);
    static Config defaults();
};

} // namespace fixpoint
