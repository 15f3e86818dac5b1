#pragma once
#include "FrameGeometry.hpp"
#include <optional>

// Window frame computation: where a window ends up inside the rectangles
// handed to it by layout policy, and how much of it system chrome eats.
// No Hyprland dependencies - these are purely mathematical

// Declared width/height that fills the containing frame
constexpr int MATCH_CONTAINER = -1;

// Per-axis alignment against the containing frame
enum class EAnchor {
    START, // left / top edge, offset pushes towards end
    END,   // right / bottom edge, offset pushes towards start
    FILL   // spans the containing frame, size and offset ignored
};

// Which size governs the layout rectangle
enum class ESizeSource {
    MEASURED, // size picked by the client's measurement pass
    DECLARED  // size declared in the window attributes (scaled surfaces)
};

struct WindowAttributes {
    int     width      = MATCH_CONTAINER;
    int     height     = MATCH_CONTAINER;
    EAnchor horizontal = EAnchor::START;
    EAnchor vertical   = EAnchor::START;
    int     x          = 0; // offset away from the anchored edge
    int     y          = 0;
    bool    scaledSurface = false;
};

struct MeasuredSize {
    int width  = 0; // <= 0 means nothing measured
    int height = 0;
};

struct ContainerBounds {
    FrameRect bounds;
    bool      fullscreen = true;
    FrameRect tempInsetBounds; // empty when unset
};

// Rectangles supplied by layout policy for one pass
struct ReferenceFrames {
    FrameRect                parent;
    FrameRect                display;
    FrameRect                overscan;
    FrameRect                content;
    FrameRect                visible;
    FrameRect                stable;
    std::optional<FrameRect> decor;
};

struct FrameResult {
    FrameRect   frame;
    FrameRect   containingFrame;
    FrameRect   decorFrame; // empty when policy gave none

    FrameInsets overscanInsets;
    FrameInsets contentInsets;
    FrameInsets visibleInsets;
    FrameInsets stableInsets;

    // reference rects shrunk to the window frame
    FrameRect   contentFrame;
    FrameRect   visibleFrame;
    FrameRect   stableFrame;
};

ESizeSource sizeSourceFor(const WindowAttributes& attrs);

FrameRect   containingFrameFor(const FrameRect& parent, const std::optional<ContainerBounds>& container);

// Throws FrameContractError if any input rectangle is inverted.
FrameResult resolveFrame(const WindowAttributes& attrs, const MeasuredSize& measured, const ReferenceFrames& frames,
                         const std::optional<ContainerBounds>& container = std::nullopt);
