#include "FrameResolver.hpp"
#include <algorithm>
#include <cstdint>

namespace {

// Placement runs in 64 bit: offsets and sizes near the int limits leave the
// int range before the clamp brings them back
struct AxisSpan {
    int64_t lo = 0;
    int64_t hi = 0;
};

// Length along one axis for the active size source
int64_t resolveLength(ESizeSource source, int measured, int declared, int64_t containingLength) {
    switch (source) {
        case ESizeSource::MEASURED:
            if (measured > 0)
                return measured;
            // An explicit declared size without a measurement lays out as nothing
            return declared == MATCH_CONTAINER ? containingLength : 0;
        case ESizeSource::DECLARED:
            if (declared == MATCH_CONTAINER)
                return containingLength;
            return std::max(0, declared);
    }
    return 0;
}

AxisSpan placeAxis(EAnchor anchor, int64_t minEdge, int64_t maxEdge, int64_t length, int64_t offset) {
    switch (anchor) {
        case EAnchor::FILL: return {minEdge, maxEdge};
        case EAnchor::START: return {minEdge + offset, minEdge + offset + length};
        case EAnchor::END: return {maxEdge - offset - length, maxEdge - offset};
    }
    return {minEdge, minEdge};
}

void retainAgainst(const FrameRect& frame, const FrameRect& reference, FrameInsets& insets, FrameRect& retained) {
    insets   = insetsBeyond(frame, reference);
    retained = intersectRects(reference, frame);
}

void validateInputs(const ReferenceFrames& frames, const std::optional<ContainerBounds>& container) {
    requireWellFormed(frames.parent, "parent");
    requireWellFormed(frames.display, "display");
    requireWellFormed(frames.overscan, "overscan");
    requireWellFormed(frames.content, "content");
    requireWellFormed(frames.visible, "visible");
    requireWellFormed(frames.stable, "stable");
    if (frames.decor)
        requireWellFormed(*frames.decor, "decor");

    if (container) {
        requireWellFormed(container->bounds, "container");
        requireWellFormed(container->tempInsetBounds, "temp inset");
    }
}

} // namespace

ESizeSource sizeSourceFor(const WindowAttributes& attrs) {
    return attrs.scaledSurface ? ESizeSource::DECLARED : ESizeSource::MEASURED;
}

FrameRect containingFrameFor(const FrameRect& parent, const std::optional<ContainerBounds>& container) {
    if (!container || container->fullscreen)
        return parent;

    return container->bounds;
}

FrameResult resolveFrame(const WindowAttributes& attrs, const MeasuredSize& measured, const ReferenceFrames& frames,
                         const std::optional<ContainerBounds>& container) {
    validateInputs(frames, container);

    FrameResult result;

    // Step 1: the rectangle we lay out and clamp in
    const FrameRect CONTAINING = containingFrameFor(frames.parent, container);
    result.containingFrame     = CONTAINING;

    // Step 2: size
    const ESizeSource SOURCE = sizeSourceFor(attrs);
    const int64_t     WIDTH  = resolveLength(SOURCE, measured.width, attrs.width, CONTAINING.width());
    const int64_t     HEIGHT = resolveLength(SOURCE, measured.height, attrs.height, CONTAINING.height());

    // Step 3: anchor placement, offsets point away from the anchored edge
    const AxisSpan H = placeAxis(attrs.horizontal, CONTAINING.left, CONTAINING.right, WIDTH, attrs.x);
    const AxisSpan V = placeAxis(attrs.vertical, CONTAINING.top, CONTAINING.bottom, HEIGHT, attrs.y);

    // Step 4: keep it inside the containing frame
    result.frame = clampWideInto(WideRect{H.lo, V.lo, H.hi, V.hi}, CONTAINING);

    result.decorFrame = frames.decor.value_or(FrameRect{});

    // Step 5: insets and retained frames. Temp inset bounds stand in for all
    // three references, placement above is untouched by them.
    const bool       REDIRECT = container && !container->tempInsetBounds.empty();
    const FrameRect& CONTENT  = REDIRECT ? container->tempInsetBounds : frames.content;
    const FrameRect& VISIBLE  = REDIRECT ? container->tempInsetBounds : frames.visible;
    const FrameRect& STABLE   = REDIRECT ? container->tempInsetBounds : frames.stable;

    retainAgainst(result.frame, CONTENT, result.contentInsets, result.contentFrame);
    retainAgainst(result.frame, VISIBLE, result.visibleInsets, result.visibleFrame);
    retainAgainst(result.frame, STABLE, result.stableInsets, result.stableFrame);

    result.overscanInsets = insetsBeyond(result.frame, frames.overscan);

    return result;
}
