#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace scopefix {

struct StackFrame {
    void       *address = nullptr;
    std::string symbol; // demangled where possible, raw backtrace text otherwise
};

// Call stack captured at a single point in time. Captured once when a
// scopefix assertion exception is constructed and never re-captured, so a
// cached failure keeps reporting the frames of its first throw.
class stack_trace {
  public:
    stack_trace() = default;
    explicit stack_trace(std::vector<StackFrame> frames) : frames_(std::move(frames)) {}

    static stack_trace capture(std::size_t skip = 0, std::size_t max_frames = 64);

    const std::vector<StackFrame> &frames() const { return frames_; }
    bool                           empty() const { return frames_.empty(); }

    // One "   at <symbol>" line per frame.
    std::string to_string() const;

  private:
    std::vector<StackFrame> frames_;
};

} // namespace scopefix
