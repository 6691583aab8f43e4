#include "fixpoint/analysis/SourceMap.h"
#include "fixpoint/core/Errors.h"

#include <algorithm>

namespace fixpoint {

SourceMap::SourceMap(llvm::StringRef source) : source_(source) {
    lineStarts_.push_back(0);
    for (size_t i = 0; i < source_.size(); ++i) {
        char c = source_[i];
        if (c == '\r' && i + 1 < source_.size() && source_[i + 1] == '\n')
            ++i;
        if (c == '\n' || c == '\r')
            lineStarts_.push_back(static_cast<uint32_t>(i + 1));
    }
}

llvm::Expected<Position> SourceMap::offsetToPosition(uint32_t offset) const {
    if (offset > source_.size()) {
        return makeError(ErrorKind::OutOfRange,
                         "offset " + llvm::Twine(offset) + " is past the end of a " +
                             llvm::Twine(source_.size()) + "-byte source");
    }

    // Last line start not after `offset`.
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
    size_t lineIndex = static_cast<size_t>(it - lineStarts_.begin()) - 1;

    unsigned column = 1;
    for (uint32_t i = lineStarts_[lineIndex]; i < offset; ++i) {
        // Count lead bytes only; continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(source_[i]) & 0xC0) != 0x80)
            ++column;
    }

    return Position{static_cast<unsigned>(lineIndex + 1), column};
}

llvm::Expected<uint32_t> SourceMap::lineStart(unsigned line) const {
    if (line == 0 || line > lineStarts_.size()) {
        return makeError(ErrorKind::OutOfRange,
                         "line " + llvm::Twine(line) + " is outside 1.." +
                             llvm::Twine(lineStarts_.size()));
    }
    return lineStarts_[line - 1];
}

llvm::Expected<uint32_t> SourceMap::lineEnd(unsigned line) const {
    auto start = lineStart(line);
    if (!start)
        return start.takeError();

    uint32_t end = line < lineStarts_.size() ? lineStarts_[line] : length();
    // Back off the terminator: "\n", "\r" or "\r\n".
    if (end > *start && source_[end - 1] == '\n')
        --end;
    if (end > *start && source_[end - 1] == '\r')
        --end;
    return end;
}

} // namespace fixpoint
