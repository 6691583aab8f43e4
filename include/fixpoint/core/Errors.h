#pragma once

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fixpoint {

enum class ErrorKind : uint8_t {
    OutOfRange,      // Offset or line outside the source: parser/core mismatch
    MalformedTree,   // Tree ranges not nested or tree unreadable
    InvalidFix,      // Fix with no edits or overlapping edits
    RuleFailure,     // A rule's check reported an internal error
    ParserFailed,    // External parser could not produce a tree
    FixSyntaxError,  // Applied fixes made the source unparseable
    DuplicateRule,   // Two rules registered under one code
};

constexpr std::string_view errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::OutOfRange:     return "out-of-range";
        case ErrorKind::MalformedTree:  return "malformed-tree";
        case ErrorKind::InvalidFix:     return "invalid-fix";
        case ErrorKind::RuleFailure:    return "rule-failure";
        case ErrorKind::ParserFailed:   return "parser-failed";
        case ErrorKind::FixSyntaxError: return "fix-syntax-error";
        case ErrorKind::DuplicateRule:  return "duplicate-rule";
    }
    return "unknown";
}

class EngineError : public llvm::ErrorInfo<EngineError> {
public:
    static char ID;

    EngineError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    ErrorKind kind() const { return kind_; }
    const std::string &detail() const { return message_; }

    void log(llvm::raw_ostream &os) const override {
        os << errorKindName(kind_) << ": " << message_;
    }

    std::error_code convertToErrorCode() const override {
        return llvm::inconvertibleErrorCode();
    }

private:
    ErrorKind kind_;
    std::string message_;
};

inline llvm::Error makeError(ErrorKind kind, const llvm::Twine &message) {
    return llvm::make_error<EngineError>(kind, message.str());
}

// Kind of the first EngineError in `err`. Consumes `err`; foreign error
// types yield std::nullopt.
std::optional<ErrorKind> consumeErrorKind(llvm::Error err);

} // namespace fixpoint
