#pragma once

#include "fixpoint/core/Severity.h"
#include "fixpoint/core/TextRange.h"

#include <llvm/Support/Error.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fixpoint {

enum class Applicability : uint8_t {
    DisplayOnly, // Shown to the user, never applied
    Unsafe,      // May change behaviour; applied on opt-in only
    Safe,        // Eligible for unattended application
};

constexpr std::string_view applicabilityName(Applicability a) {
    switch (a) {
        case Applicability::DisplayOnly: return "display-only";
        case Applicability::Unsafe:      return "unsafe";
        case Applicability::Safe:        return "safe";
    }
    return "display-only";
}

struct Edit {
    TextRange range;
    std::string content;

    static Edit replacement(std::string content, TextRange range) {
        return Edit{range, std::move(content)};
    }
    static Edit insertion(std::string content, uint32_t offset) {
        return Edit{TextRange::empty(offset), std::move(content)};
    }
    static Edit deletion(TextRange range) { return Edit{range, {}}; }

    bool isInsertion() const { return range.isEmpty(); }
    bool isDeletion() const { return content.empty() && !range.isEmpty(); }

    friend bool operator==(const Edit &a, const Edit &b) {
        return a.range == b.range && a.content == b.content;
    }
    friend bool operator!=(const Edit &a, const Edit &b) { return !(a == b); }
};

// Non-empty set of pairwise non-conflicting edits sorted by start offset.
class Fix {
public:
    static llvm::Expected<Fix> create(std::vector<Edit> edits,
                                      Applicability applicability);

    static Fix safe(Edit edit) { return Fix({std::move(edit)}, Applicability::Safe); }
    static Fix unsafe(Edit edit) { return Fix({std::move(edit)}, Applicability::Unsafe); }
    static Fix displayOnly(Edit edit) {
        return Fix({std::move(edit)}, Applicability::DisplayOnly);
    }

    const std::vector<Edit> &edits() const { return edits_; }
    Applicability applicability() const { return applicability_; }

    uint32_t minStart() const { return edits_.front().range.start(); }
    uint32_t maxEnd() const;
    // Distance from the first edit's start to the furthest edit end.
    uint32_t span() const { return maxEnd() - minStart(); }

    // Fixes sharing an isolation group are never applied in the same pass.
    std::optional<uint32_t> isolationGroup() const { return isolation_; }
    Fix &isolate(uint32_t group) {
        isolation_ = group;
        return *this;
    }

private:
    Fix(std::vector<Edit> edits, Applicability applicability)
        : edits_(std::move(edits)), applicability_(applicability) {}

    std::vector<Edit> edits_;
    Applicability applicability_;
    std::optional<uint32_t> isolation_;
};

enum class DiagnosticKind : uint8_t {
    Lint,
    InternalError, // A rule failed; not a finding about the code
};

struct SourceLocation {
    std::string file;
    unsigned line      = 0;
    unsigned column    = 0;
    unsigned endLine   = 0;
    unsigned endColumn = 0;
};

struct Diagnostic {
    std::string         code;
    std::string         message;
    TextRange           range;
    Severity            severity = Severity::Warning;
    DiagnosticKind      kind     = DiagnosticKind::Lint;
    SourceLocation      location; // Resolved by the analysis driver
    std::optional<Fix>  fix;
    std::string         fixTitle; // e.g. "Replace `.items()` with `.values()`"

    bool isInternalError() const { return kind == DiagnosticKind::InternalError; }
};

} // namespace fixpoint
