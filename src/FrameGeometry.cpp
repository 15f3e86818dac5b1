#include "FrameGeometry.hpp"
#include <algorithm>
#include <format>
#include <limits>

bool FrameRect::contains(const FrameRect& other) const {
    return other.left >= left && other.top >= top && other.right <= right && other.bottom <= bottom;
}

int narrowEdge(int64_t value) {
    return (int)std::clamp<int64_t>(value, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
}

FrameRect intersectRects(const FrameRect& a, const FrameRect& b) {
    FrameRect result;

    result.left   = std::max(a.left, b.left);
    result.top    = std::max(a.top, b.top);
    result.right  = std::max(result.left, std::min(a.right, b.right));
    result.bottom = std::max(result.top, std::min(a.bottom, b.bottom));

    return result;
}

FrameInsets insetsBeyond(const FrameRect& frame, const FrameRect& reference) {
    return {
        narrowEdge(std::max<int64_t>(0, (int64_t)reference.left - frame.left)),
        narrowEdge(std::max<int64_t>(0, (int64_t)reference.top - frame.top)),
        narrowEdge(std::max<int64_t>(0, (int64_t)frame.right - reference.right)),
        narrowEdge(std::max<int64_t>(0, (int64_t)frame.bottom - reference.bottom)),
    };
}

// One axis of clampInto: [lo, hi) against [minEdge, maxEdge). The result
// always lies inside the container so it narrows back to int losslessly.
static void clampAxis(int64_t& lo, int64_t& hi, int64_t minEdge, int64_t maxEdge) {
    const int64_t length = std::max<int64_t>(0, hi - lo);

    if (length > maxEdge - minEdge) {
        lo = minEdge;
        hi = std::max(minEdge, maxEdge);
        return;
    }

    if (hi > maxEdge) {
        lo = maxEdge - length;
        hi = maxEdge;
    }
    if (lo < minEdge) {
        lo = minEdge;
        hi = minEdge + length;
    }
}

FrameRect clampWideInto(const WideRect& rect, const FrameRect& container) {
    WideRect result = rect;

    clampAxis(result.left, result.right, container.left, container.right);
    clampAxis(result.top, result.bottom, container.top, container.bottom);

    return {narrowEdge(result.left), narrowEdge(result.top), narrowEdge(result.right), narrowEdge(result.bottom)};
}

FrameRect clampInto(const FrameRect& rect, const FrameRect& container) {
    return clampWideInto(WideRect{rect.left, rect.top, rect.right, rect.bottom}, container);
}

FrameRect toLocal(const FrameRect& rect, const FrameRect& origin) {
    // saturation is monotonic, so a well formed rect stays well formed
    return {
        narrowEdge((int64_t)rect.left - origin.left),
        narrowEdge((int64_t)rect.top - origin.top),
        narrowEdge((int64_t)rect.right - origin.left),
        narrowEdge((int64_t)rect.bottom - origin.top),
    };
}

void requireWellFormed(const FrameRect& rect, std::string_view name) {
    if (!rect.wellFormed())
        throw FrameContractError(std::format("{} frame is inverted: {}", name, toString(rect)));
}

std::string toString(const FrameRect& rect) {
    return std::format("({}, {}, {}, {})", rect.left, rect.top, rect.right, rect.bottom);
}

std::string toString(const FrameInsets& insets) {
    return std::format("({}, {}, {}, {})", insets.left, insets.top, insets.right, insets.bottom);
}
