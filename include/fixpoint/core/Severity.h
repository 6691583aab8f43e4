#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fixpoint {

enum class Severity : uint8_t {
    Info    = 0,
    Warning = 1,
    Error   = 2,
};

constexpr std::string_view severityToString(Severity s) {
    switch (s) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

constexpr std::optional<Severity> severityFromString(std::string_view s) {
    if (s == "info")    return Severity::Info;
    if (s == "warning") return Severity::Warning;
    if (s == "error")   return Severity::Error;
    return std::nullopt;
}

constexpr bool operator>=(Severity a, Severity b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b);
}

} // namespace fixpoint
