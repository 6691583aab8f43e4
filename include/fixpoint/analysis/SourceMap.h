#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <vector>

namespace fixpoint {

struct Position {
    unsigned line   = 0; // 1-based
    unsigned column = 0; // 1-based, in UTF-8 code points
};

// Offset <-> line/column translation over one source buffer. The buffer
// must outlive the map.
class SourceMap {
public:
    explicit SourceMap(llvm::StringRef source);

    llvm::Expected<Position> offsetToPosition(uint32_t offset) const;
    llvm::Expected<uint32_t> lineStart(unsigned line) const;
    // Offset of the line terminator of `line` (or of EOF on the last line).
    llvm::Expected<uint32_t> lineEnd(unsigned line) const;

    unsigned lineCount() const { return static_cast<unsigned>(lineStarts_.size()); }
    uint32_t length() const { return static_cast<uint32_t>(source_.size()); }
    llvm::StringRef source() const { return source_; }

private:
    llvm::StringRef source_;
    std::vector<uint32_t> lineStarts_;
};

} // namespace fixpoint
