#include "fixpoint/analysis/AnalysisDriver.h"
#include "fixpoint/core/BoundedTasks.h"
#include "fixpoint/core/Config.h"
#include "fixpoint/core/Diagnostic.h"
#include "fixpoint/core/Errors.h"
#include "fixpoint/core/ExecutionMetadata.h"
#include "fixpoint/core/RuleRegistry.h"
#include "fixpoint/core/Severity.h"
#include "fixpoint/core/Version.h"
#include "fixpoint/fix/AddNoqa.h"
#include "fixpoint/fix/FixLoop.h"
#include "fixpoint/output/OutputFormatter.h"
#include "fixpoint/syntax/TreeProvider.h"

#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static llvm::cl::OptionCategory FixpointCat("fixpoint options");

static llvm::cl::list<std::string> InputFiles(
    llvm::cl::Positional,
    llvm::cl::desc("<source files>"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to fixpoint.config.yaml"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::list<std::string> Select(
    "select",
    llvm::cl::desc("Rule codes or prefixes to enable (comma separated, ALL for every rule)"),
    llvm::cl::CommaSeparated,
    llvm::cl::cat(FixpointCat));

static llvm::cl::list<std::string> Ignore(
    "ignore",
    llvm::cl::desc("Rule codes or prefixes to disable (comma separated)"),
    llvm::cl::CommaSeparated,
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<bool> Fix(
    "fix",
    llvm::cl::desc("Apply safe fixes"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<bool> UnsafeFixes(
    "unsafe-fixes",
    llvm::cl::desc("Apply unsafe fixes as well (implies --fix)"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<bool> NoFix(
    "no-fix",
    llvm::cl::desc("Report only, overriding fix_mode from the config file"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<unsigned> MaxFixIterations(
    "max-fix-iterations",
    llvm::cl::desc("Maximum fix passes per file (0 = config value)"),
    llvm::cl::init(0),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (cli|json)"),
    llvm::cl::init("cli"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write the report to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<std::string> ParserCommand(
    "parser",
    llvm::cl::desc("Parser invoked as '<cmd> --output <json> <source>'"),
    llvm::cl::value_desc("command"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<std::string> TreeFile(
    "tree",
    llvm::cl::desc("Pre-parsed JSON tree for a single source file (lint only)"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<bool> AddNoqa(
    "add-noqa",
    llvm::cl::desc("Append noqa directives for every remaining diagnostic"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<unsigned> Jobs(
    "jobs",
    llvm::cl::desc("Files analyzed in parallel (0 = hardware concurrency)"),
    llvm::cl::init(0),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<std::string> MinSev(
    "min-severity",
    llvm::cl::desc("Minimum severity to report (info|warning|error)"),
    llvm::cl::cat(FixpointCat));

static llvm::cl::opt<bool> ToStdout(
    "stdout",
    llvm::cl::desc("Print fixed sources to stdout instead of rewriting files"),
    llvm::cl::cat(FixpointCat));

namespace {

// Serves one pre-parsed tree. Fixing is disabled in this mode, so the tree
// is only ever asked for once.
class TreeFileProvider : public fixpoint::TreeProvider {
public:
    explicit TreeFileProvider(std::string path) : path_(std::move(path)) {}

    llvm::Expected<fixpoint::ParsedModule> parse(llvm::StringRef) override {
        auto buf = llvm::MemoryBuffer::getFile(path_);
        if (!buf)
            return fixpoint::makeError(fixpoint::ErrorKind::ParserFailed,
                                       "cannot read tree '" + path_ + "': " +
                                           buf.getError().message());
        return fixpoint::readTreeJSON((*buf)->getBuffer());
    }

private:
    std::string path_;
};

struct FileOutcome {
    std::string path;
    bool failed = false;
    std::string error;
    std::string originalSource;
    fixpoint::FixLoopResult result;
    unsigned noqaAdded = 0;
};

std::unique_ptr<fixpoint::TreeProvider> makeProvider(const fixpoint::Config &cfg) {
    if (!TreeFile.empty())
        return std::make_unique<TreeFileProvider>(TreeFile.getValue());
    return std::make_unique<fixpoint::ExternalParser>(cfg.parserCommand);
}

// Splits an error into its message and, for engine errors, its kind.
std::string describe(llvm::Error err, fixpoint::ErrorKind *kind = nullptr) {
    std::string message;
    llvm::handleAllErrors(
        std::move(err),
        [&](const fixpoint::EngineError &e) {
            if (kind)
                *kind = e.kind();
            message = e.detail();
        },
        [&](const llvm::ErrorInfoBase &e) { message = e.message(); });
    return message;
}

FileOutcome processFile(const std::string &path, const fixpoint::AnalysisDriver &driver,
                        const fixpoint::Config &cfg) {
    FileOutcome out;
    out.path = path;

    auto buf = llvm::MemoryBuffer::getFile(path);
    if (!buf) {
        out.failed = true;
        out.error = "cannot read source: " + buf.getError().message();
        return out;
    }
    out.originalSource = (*buf)->getBuffer().str();

    auto provider = makeProvider(cfg);

    if (AddNoqa) {
        auto module = provider->parse(out.originalSource);
        if (!module) {
            out.failed = true;
            out.error = describe(module.takeError());
            return out;
        }
        auto analysis = driver.analyze(*module, out.originalSource, path);
        if (!analysis) {
            out.failed = true;
            out.error = describe(analysis.takeError());
            return out;
        }
        auto edited = fixpoint::addNoqaDirectives(out.originalSource, *module,
                                                  analysis->diagnostics);
        if (!edited) {
            out.failed = true;
            out.error = describe(edited.takeError());
            return out;
        }
        out.result.source = std::move(edited->source);
        out.noqaAdded = edited->linesChanged;
        return out;
    }

    auto loop = fixpoint::runFixLoop(out.originalSource, path, *provider, driver, cfg);
    if (loop) {
        out.result = std::move(*loop);
        return out;
    }

    fixpoint::ErrorKind kind = fixpoint::ErrorKind::ParserFailed;
    std::string message = describe(loop.takeError(), &kind);
    if (kind != fixpoint::ErrorKind::FixSyntaxError) {
        out.failed = true;
        out.error = message;
        return out;
    }

    // Report against the unfixed source instead.
    llvm::errs() << "fixpoint: warning: " << path << ": " << message
                 << "; leaving the file unfixed\n";
    fixpoint::Config lintOnly = cfg;
    lintOnly.fixMode = fixpoint::FixMode::Off;
    auto retry = fixpoint::runFixLoop(out.originalSource, path, *provider, driver, lintOnly);
    if (!retry) {
        out.failed = true;
        out.error = describe(retry.takeError());
        return out;
    }
    out.result = std::move(*retry);
    return out;
}

bool writeFile(const std::string &path, llvm::StringRef contents) {
    std::error_code EC;
    llvm::raw_fd_ostream file(path, EC, llvm::sys::fs::OF_None);
    if (EC) {
        llvm::errs() << "fixpoint: error: cannot write '" << path << "': "
                     << EC.message() << "\n";
        return false;
    }
    file << contents;
    return true;
}

} // anonymous namespace

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(FixpointCat);
    llvm::cl::ParseCommandLineOptions(argc, argv,
                                      "fixpoint: lint rules and fixed-point autofix\n");

    // Load config.
    fixpoint::Config cfg = ConfigPath.empty()
        ? fixpoint::Config::defaults()
        : fixpoint::Config::loadFromFile(ConfigPath);

    // CLI overrides.
    if (!Select.empty())
        cfg.enabledCodes.assign(Select.begin(), Select.end());
    if (!Ignore.empty())
        cfg.disabledCodes.insert(cfg.disabledCodes.end(), Ignore.begin(), Ignore.end());
    if (UnsafeFixes)
        cfg.fixMode = fixpoint::FixMode::SafeAndUnsafe;
    else if (Fix)
        cfg.fixMode = fixpoint::FixMode::SafeOnly;
    if (NoFix)
        cfg.fixMode = fixpoint::FixMode::Off;
    if (MaxFixIterations > 0)
        cfg.maxFixIterations = MaxFixIterations;
    if (!OutputFile.empty())
        cfg.outputFile = OutputFile;
    if (OutputFormat == "json")
        cfg.jsonOutput = true;
    if (!ParserCommand.empty())
        cfg.parserCommand = ParserCommand;
    if (!MinSev.empty()) {
        auto sev = fixpoint::severityFromString(MinSev.getValue());
        if (!sev) {
            llvm::errs() << "fixpoint: error: unknown severity '" << MinSev << "'\n";
            return 2;
        }
        cfg.minSeverity = *sev;
    }

    if (InputFiles.empty()) {
        llvm::errs() << "fixpoint: error: no input files\n";
        return 2;
    }
    if (!TreeFile.empty()) {
        if (InputFiles.size() != 1) {
            llvm::errs() << "fixpoint: error: --tree takes exactly one source file\n";
            return 2;
        }
        if (cfg.fixMode != fixpoint::FixMode::Off) {
            llvm::errs() << "fixpoint: warning: fixes need a parser; --tree runs lint only\n";
            cfg.fixMode = fixpoint::FixMode::Off;
        }
    } else if (cfg.parserCommand.empty()) {
        llvm::errs() << "fixpoint: error: no parser configured (use --parser or "
                     << "parser_command, or --tree)\n";
        return 2;
    }

    // Build execution metadata for output provenance.
    fixpoint::ExecutionMetadata execMeta;
    execMeta.toolVersion = fixpoint::kToolVersion;
    execMeta.configPath = ConfigPath.getValue();
    execMeta.fixMode = std::string(fixpoint::fixModeName(cfg.fixMode));
    execMeta.timestampEpochSec = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    execMeta.sourceFiles.assign(InputFiles.begin(), InputFiles.end());

    const fixpoint::RuleRegistry registry = fixpoint::RuleRegistry::builtin();
    const fixpoint::AnalysisDriver driver(registry, cfg);

    // Bounded parallel analysis, one task per file.
    unsigned maxWorkers = Jobs > 0 ? Jobs.getValue()
                                   : std::max(1u, std::thread::hardware_concurrency());
    maxWorkers = std::min(maxWorkers, static_cast<unsigned>(InputFiles.size()));

    auto futures = fixpoint::runBounded(
        execMeta.sourceFiles, maxWorkers,
        [&driver, &cfg](const std::string &file) { return processFile(file, driver, cfg); });

    // Collect in command-line order.
    std::vector<fixpoint::Diagnostic> diagnostics;
    for (auto &future : futures) {
        FileOutcome outcome = future.get();

        if (outcome.failed) {
            llvm::errs() << "fixpoint: error: " << outcome.path << ": "
                         << outcome.error << "\n";
            ++execMeta.filesFailed;
            continue;
        }

        const auto &result = outcome.result;
        if (AddNoqa) {
            if (outcome.noqaAdded > 0 && !writeFile(outcome.path, result.source))
                ++execMeta.filesFailed;
            else if (outcome.noqaAdded > 0)
                llvm::errs() << "fixpoint: added noqa directives to " << outcome.noqaAdded
                             << " line(s) in " << outcome.path << "\n";
            continue;
        }

        if (!result.converged) {
            llvm::errs() << "fixpoint: warning: " << outcome.path
                         << ": fixes did not converge after " << result.iterations
                         << " iteration(s); still fixable: "
                         << llvm::join(result.pendingCodes, ", ") << "\n";
            execMeta.unconvergedFiles.push_back(outcome.path);
        }
        if (result.internalErrors > 0)
            llvm::errs() << "fixpoint: warning: " << outcome.path << ": "
                         << result.internalErrors << " rule failure(s)\n";

        if (ToStdout && cfg.fixMode != fixpoint::FixMode::Off) {
            llvm::outs() << result.source;
        } else if (result.source != outcome.originalSource) {
            if (!writeFile(outcome.path, result.source)) {
                ++execMeta.filesFailed;
                continue;
            }
        }

        for (const auto &entry : result.fixed)
            execMeta.fixed[entry.first] += entry.second;
        execMeta.suppressed += result.suppressed;

        for (const auto &d : result.diagnostics) {
            if (d.isInternalError() || d.severity >= cfg.minSeverity)
                diagnostics.push_back(d);
        }
    }

    if (AddNoqa)
        return execMeta.filesFailed > 0 ? 2 : 0;

    // Format output.
    std::unique_ptr<fixpoint::OutputFormatter> formatter;
    if (cfg.jsonOutput)
        formatter = std::make_unique<fixpoint::JSONOutputFormatter>();
    else
        formatter = std::make_unique<fixpoint::CLIOutputFormatter>();

    std::string output = formatter->format(diagnostics, execMeta);

    // Emit. Fixed sources own stdout under --stdout.
    if (cfg.outputFile.empty()) {
        if (ToStdout && cfg.fixMode != fixpoint::FixMode::Off)
            llvm::errs() << output;
        else
            llvm::outs() << output;
    } else {
        std::error_code EC;
        llvm::raw_fd_ostream file(cfg.outputFile, EC, llvm::sys::fs::OF_Text);
        if (EC) {
            llvm::errs() << "fixpoint: error: cannot open output file '"
                         << cfg.outputFile << "': " << EC.message() << "\n";
            return 2;
        }
        file << output;
    }

    if (execMeta.filesFailed > 0)
        return 2;
    return diagnostics.empty() ? 0 : 1;
}
