#include "fixpoint/syntax/TreeProvider.h"
#include "fixpoint/core/Errors.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/MD5.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Program.h>
#include <llvm/Support/raw_ostream.h>

#include <optional>

namespace fixpoint {

namespace {

llvm::Error parserFailed(const llvm::Twine &what) {
    return makeError(ErrorKind::ParserFailed, what);
}

} // anonymous namespace

ExternalParser::ExternalParser(std::string command, unsigned timeoutSeconds)
    : command_(std::move(command)), timeoutSeconds_(timeoutSeconds) {}

llvm::Expected<ParsedModule> ExternalParser::parse(llvm::StringRef source) {
    llvm::SmallVector<llvm::StringRef, 8> words;
    llvm::StringRef(command_).split(words, ' ', /*MaxSplit=*/-1, /*KeepEmpty=*/false);
    if (words.empty())
        return parserFailed("no parser command configured");

    // Resolve bare program names against PATH.
    std::string program = words.front().str();
    if (!words.front().contains('/')) {
        auto resolved = llvm::sys::findProgramByName(words.front());
        if (!resolved)
            return parserFailed("cannot find parser '" + words.front() + "' on PATH");
        program = *resolved;
    }

    // Temp names carry the MD5 of the source.
    llvm::MD5 hasher;
    hasher.update(source);
    llvm::MD5::MD5Result hashResult;
    hasher.final(hashResult);
    llvm::SmallString<32> hashStr;
    llvm::MD5::stringifyResult(hashResult, hashStr);
    const std::string prefix = "fixpoint-" + hashStr.str().str();

    // Source goes to a temp file; the parser writes JSON beside it.
    int srcFD = -1;
    llvm::SmallString<128> srcPath, jsonPath, errPath;
    if (auto ec = llvm::sys::fs::createTemporaryFile(prefix, "py", srcFD, srcPath))
        return parserFailed("cannot create temp file: " + ec.message());
    llvm::FileRemover srcRemover(srcPath);
    {
        llvm::raw_fd_ostream os(srcFD, /*shouldClose=*/true);
        os << source;
        os.flush();
        if (os.has_error()) {
            os.clear_error();
            return parserFailed("cannot write temp source '" + srcPath.str() + "'");
        }
    }

    if (auto ec = llvm::sys::fs::createTemporaryFile(prefix, "json", jsonPath))
        return parserFailed("cannot create temp file: " + ec.message());
    llvm::FileRemover jsonRemover(jsonPath);
    if (auto ec = llvm::sys::fs::createTemporaryFile(prefix, "err", errPath))
        return parserFailed("cannot create temp file: " + ec.message());
    llvm::FileRemover errRemover(errPath);

    // Build structured argv: program + configured flags + --output <json> <src>
    std::vector<llvm::StringRef> argv;
    argv.push_back(program);
    for (size_t i = 1; i < words.size(); ++i)
        argv.push_back(words[i]);
    argv.push_back("--output");
    argv.push_back(jsonPath);
    argv.push_back(srcPath);

    // Redirect: stdin=none, stdout=none, stderr=errFile.
    llvm::StringRef errRedirect(errPath);
    std::optional<llvm::StringRef> redirects[] = {
        std::nullopt,   // stdin
        std::nullopt,   // stdout
        errRedirect     // stderr
    };

    std::string errMsg;
    bool failed = false;
    int exitCode = llvm::sys::ExecuteAndWait(
        program, argv,
        /*Env=*/std::nullopt, redirects,
        /*SecondsToWait=*/timeoutSeconds_, /*MemoryLimit=*/0,
        &errMsg, &failed);

    if (failed || exitCode != 0) {
        std::string detail = errMsg;
        auto errBuf = llvm::MemoryBuffer::getFile(errPath);
        if (errBuf && !(*errBuf)->getBuffer().empty())
            detail = (*errBuf)->getBuffer().rtrim().str();
        return parserFailed("'" + llvm::Twine(program) + "' exited with " +
                            llvm::Twine(exitCode) + (detail.empty() ? "" : ": ") + detail);
    }

    auto jsonBuf = llvm::MemoryBuffer::getFile(jsonPath);
    if (!jsonBuf)
        return parserFailed("cannot read parser output '" + jsonPath.str() + "': " +
                            jsonBuf.getError().message());

    return readTreeJSON((*jsonBuf)->getBuffer());
}

} // namespace fixpoint
