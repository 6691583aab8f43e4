#pragma once

#include "fixpoint/core/Diagnostic.h"
#include "fixpoint/core/ExecutionMetadata.h"

#include <string>
#include <vector>

namespace fixpoint {

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;
    virtual std::string format(const std::vector<Diagnostic> &diagnostics) = 0;
    virtual std::string format(const std::vector<Diagnostic> &diagnostics,
                               const ExecutionMetadata &meta) {
        return format(diagnostics);
    }
};

// path:line:col: CODE [severity] message
class CLIOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Diagnostic> &diagnostics) override;
    std::string format(const std::vector<Diagnostic> &diagnostics,
                       const ExecutionMetadata &meta) override;
};

class JSONOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Diagnostic> &diagnostics) override;
    std::string format(const std::vector<Diagnostic> &diagnostics,
                       const ExecutionMetadata &meta) override;
};

} // namespace fixpoint
