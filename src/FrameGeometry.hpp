#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

// Integer rectangle helpers shared by the frame and crop resolvers
// No Hyprland dependencies - these are purely geometric

struct FrameRect {
    int left   = 0;
    int top    = 0;
    int right  = 0;
    int bottom = 0;

    // 64 bit, a rect spanning the whole int range is wider than INT_MAX
    int64_t width() const {
        return (int64_t)right - left;
    }
    int64_t height() const {
        return (int64_t)bottom - top;
    }

    bool empty() const {
        return left >= right || top >= bottom;
    }
    bool wellFormed() const {
        return left <= right && top <= bottom;
    }

    bool contains(const FrameRect& other) const;

    bool operator==(const FrameRect&) const = default;
};

// Per-edge magnitudes, always >= 0
struct FrameInsets {
    int left   = 0;
    int top    = 0;
    int right  = 0;
    int bottom = 0;

    bool isZero() const {
        return left == 0 && top == 0 && right == 0 && bottom == 0;
    }

    bool operator==(const FrameInsets&) const = default;
};

// Raised when a caller hands us an inverted rectangle. Empty rectangles are
// valid input, this is only for left > right or top > bottom.
class FrameContractError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

// Edges in 64 bit, for placement arithmetic that may leave the int range
// before it is clamped back into a containing frame
struct WideRect {
    int64_t left   = 0;
    int64_t top    = 0;
    int64_t right  = 0;
    int64_t bottom = 0;
};

// Saturates into the int range
int         narrowEdge(int64_t value);

// Disjoint inputs collapse to an empty rect, edges never invert.
FrameRect   intersectRects(const FrameRect& a, const FrameRect& b);

// How far frame extends beyond reference on each edge.
FrameInsets insetsBeyond(const FrameRect& frame, const FrameRect& reference);

// Shift rect inside container along each axis where it fits, clip it where it doesn't.
FrameRect   clampInto(const FrameRect& rect, const FrameRect& container);
FrameRect   clampWideInto(const WideRect& rect, const FrameRect& container);

// rect in the coordinate space whose origin is origin's top-left corner
FrameRect   toLocal(const FrameRect& rect, const FrameRect& origin);

void        requireWellFormed(const FrameRect& rect, std::string_view name);

std::string toString(const FrameRect& rect);
std::string toString(const FrameInsets& insets);
