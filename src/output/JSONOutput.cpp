#include "fixpoint/output/OutputFormatter.h"
#include "fixpoint/core/Version.h"

#include <cstdio>
#include <sstream>

namespace fixpoint {

namespace {

std::string escape(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x",
                             static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

void writeFix(std::ostringstream &os, const Diagnostic &d) {
    if (!d.fix) {
        os << "null";
        return;
    }
    const Fix &fix = *d.fix;
    os << "{\n";
    os << "        \"applicability\": \"" << applicabilityName(fix.applicability()) << "\",\n";
    os << "        \"title\": \"" << escape(d.fixTitle) << "\",\n";
    os << "        \"edits\": [";
    for (size_t j = 0; j < fix.edits().size(); ++j) {
        const Edit &e = fix.edits()[j];
        os << "{\"range\": [" << e.range.start() << ", " << e.range.end() << "], "
           << "\"content\": \"" << escape(e.content) << "\"}";
        if (j + 1 < fix.edits().size()) os << ", ";
    }
    os << "]\n";
    os << "      }";
}

void writeDiagnostics(std::ostringstream &os, const std::vector<Diagnostic> &diagnostics) {
    os << "  \"diagnostics\": [\n";

    for (size_t i = 0; i < diagnostics.size(); ++i) {
        const auto &d = diagnostics[i];
        os << "    {\n";
        os << "      \"code\": \"" << escape(d.code) << "\",\n";
        os << "      \"message\": \"" << escape(d.message) << "\",\n";
        os << "      \"severity\": \"" << severityToString(d.severity) << "\",\n";
        os << "      \"kind\": \"" << (d.isInternalError() ? "internal-error" : "lint") << "\",\n";
        os << "      \"range\": [" << d.range.start() << ", " << d.range.end() << "],\n";
        os << "      \"location\": {\n";
        os << "        \"file\": \"" << escape(d.location.file) << "\",\n";
        os << "        \"line\": " << d.location.line << ",\n";
        os << "        \"column\": " << d.location.column << ",\n";
        os << "        \"endLine\": " << d.location.endLine << ",\n";
        os << "        \"endColumn\": " << d.location.endColumn << "\n";
        os << "      },\n";
        os << "      \"fix\": ";
        writeFix(os, d);
        os << "\n";

        os << "    }";
        if (i + 1 < diagnostics.size()) os << ",";
        os << "\n";
    }

    os << "  ]";
}

} // anonymous namespace

std::string JSONOutputFormatter::format(const std::vector<Diagnostic> &diagnostics) {
    std::ostringstream os;
    os << "{\n  \"version\": \"" << kToolVersion << "\",\n";
    writeDiagnostics(os, diagnostics);
    os << "\n}\n";
    return os.str();
}

std::string JSONOutputFormatter::format(const std::vector<Diagnostic> &diagnostics,
                                        const ExecutionMetadata &meta) {
    std::ostringstream os;
    os << "{\n  \"version\": \"" << escape(meta.toolVersion) << "\",\n";

    os << "  \"metadata\": {\n";
    os << "    \"configPath\": \"" << escape(meta.configPath) << "\",\n";
    os << "    \"fixMode\": \"" << escape(meta.fixMode) << "\",\n";
    os << "    \"timestamp\": " << meta.timestampEpochSec << ",\n";
    os << "    \"sourceFiles\": [";
    for (size_t i = 0; i < meta.sourceFiles.size(); ++i) {
        os << "\"" << escape(meta.sourceFiles[i]) << "\"";
        if (i + 1 < meta.sourceFiles.size()) os << ", ";
    }
    os << "],\n";
    os << "    \"fixed\": {";
    size_t n = 0;
    for (const auto &entry : meta.fixed) {
        os << "\"" << escape(entry.first) << "\": " << entry.second;
        if (++n < meta.fixed.size()) os << ", ";
    }
    os << "},\n";
    os << "    \"suppressed\": " << meta.suppressed << ",\n";
    os << "    \"filesFailed\": " << meta.filesFailed << ",\n";
    os << "    \"unconvergedFiles\": [";
    for (size_t i = 0; i < meta.unconvergedFiles.size(); ++i) {
        os << "\"" << escape(meta.unconvergedFiles[i]) << "\"";
        if (i + 1 < meta.unconvergedFiles.size()) os << ", ";
    }
    os << "]\n";
    os << "  },\n";

    writeDiagnostics(os, diagnostics);
    os << "\n}\n";
    return os.str();
}

} // namespace fixpoint
