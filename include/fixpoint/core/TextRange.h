#pragma once

#include <cassert>
#include <cstdint>

namespace fixpoint {

// Half-open span [start, end) of absolute byte offsets.
class TextRange {
public:
    constexpr TextRange() = default;
    constexpr TextRange(uint32_t start, uint32_t end) : start_(start), end_(end) {
        assert(start <= end && "TextRange start must not exceed end");
    }

    static constexpr TextRange empty(uint32_t offset) { return {offset, offset}; }

    constexpr uint32_t start() const { return start_; }
    constexpr uint32_t end() const { return end_; }
    constexpr uint32_t length() const { return end_ - start_; }
    constexpr bool isEmpty() const { return start_ == end_; }

    constexpr bool contains(TextRange other) const {
        return start_ <= other.start_ && other.end_ <= end_;
    }

    // Shared bytes. Empty ranges never intersect anything by this test;
    // see conflictsWith() for the edit-level rule.
    constexpr bool intersects(TextRange other) const {
        return start_ < other.end_ && other.start_ < end_;
    }

    // Two edits over these ranges cannot both be applied: they share bytes,
    // or they start at the same offset (no defined order at one point).
    constexpr bool conflictsWith(TextRange other) const {
        return intersects(other) || start_ == other.start_;
    }

    friend constexpr bool operator==(TextRange a, TextRange b) {
        return a.start_ == b.start_ && a.end_ == b.end_;
    }
    friend constexpr bool operator!=(TextRange a, TextRange b) { return !(a == b); }
    friend constexpr bool operator<(TextRange a, TextRange b) {
        return a.start_ != b.start_ ? a.start_ < b.start_ : a.end_ < b.end_;
    }

private:
    uint32_t start_ = 0;
    uint32_t end_   = 0;
};

} // namespace fixpoint
