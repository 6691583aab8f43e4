#include "fixpoint/output/OutputFormatter.h"

#include <sstream>

namespace fixpoint {

namespace {

void writeDiagnostic(std::ostringstream &os, const Diagnostic &d) {
    os << d.location.file << ":" << d.location.line << ":"
       << d.location.column << ": ";

    if (d.isInternalError()) {
        os << d.code << " [internal error] " << d.message << "\n";
        return;
    }

    os << d.code << " [" << severityToString(d.severity) << "] " << d.message << "\n";

    if (d.fix && !d.fixTitle.empty())
        os << "  fix (" << applicabilityName(d.fix->applicability()) << "): "
           << d.fixTitle << "\n";
}

void writeFixableHint(std::ostringstream &os, const std::vector<Diagnostic> &diagnostics) {
    unsigned safe = 0, unsafe = 0;
    for (const auto &d : diagnostics) {
        if (!d.fix || d.isInternalError())
            continue;
        if (d.fix->applicability() == Applicability::Safe)
            ++safe;
        else if (d.fix->applicability() == Applicability::Unsafe)
            ++unsafe;
    }
    if (safe)
        os << "fixpoint: " << safe << " fixable with --fix.\n";
    if (unsafe)
        os << "fixpoint: " << unsafe << " more fixable with --unsafe-fixes.\n";
}

} // anonymous namespace

std::string CLIOutputFormatter::format(const std::vector<Diagnostic> &diagnostics) {
    std::ostringstream os;

    for (const auto &d : diagnostics)
        writeDiagnostic(os, d);

    if (diagnostics.empty()) {
        os << "fixpoint: all checks passed.\n";
    } else {
        os << "\nfixpoint: " << diagnostics.size() << " diagnostic(s) found.\n";
        writeFixableHint(os, diagnostics);
    }

    return os.str();
}

std::string CLIOutputFormatter::format(const std::vector<Diagnostic> &diagnostics,
                                       const ExecutionMetadata &meta) {
    std::ostringstream os;
    os << format(diagnostics);

    unsigned fixedTotal = 0;
    for (const auto &entry : meta.fixed)
        fixedTotal += entry.second;
    if (fixedTotal > 0) {
        os << "fixpoint: fixed " << fixedTotal << " issue(s) (";
        bool first = true;
        for (const auto &entry : meta.fixed) {
            if (!first)
                os << ", ";
            os << entry.first << ": " << entry.second;
            first = false;
        }
        os << ").\n";
    }

    if (meta.suppressed > 0)
        os << "fixpoint: " << meta.suppressed << " diagnostic(s) suppressed by noqa.\n";

    return os.str();
}

} // namespace fixpoint
