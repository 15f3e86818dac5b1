#pragma once
#include "CropResolver.hpp"
#include "FrameResolver.hpp"
#include <optional>

// Everything one layout pass needs for a single window
struct LayoutRequest {
    WindowAttributes               attrs;
    MeasuredSize                   measured;
    ReferenceFrames                frames;
    std::optional<ContainerBounds> container;

    int                            windowLayer        = 0;
    int                            systemDecorLayer   = 0;
    bool                           transitionResizing = false;
    bool                           defaultDisplay     = true;
};

// What moved between the previous pass and the current one
struct FrameChanges {
    bool moved          = false;
    bool resized        = false;
    bool overscanInsets = false;
    bool contentInsets  = false;
    bool visibleInsets  = false;
    bool stableInsets   = false;
    bool crop           = false;

    bool any() const {
        return moved || resized || overscanInsets || contentInsets || visibleInsets || stableInsets || crop;
    }
};

// Owns a window's last two layout outputs. The previous pass stays readable
// until the next layout() overwrites it.
class CWindowFrameState {
  public:
    // Frame first, then crop against the new frame.
    FrameChanges                      layout(const LayoutRequest& request);

    bool                              hasLayout() const;
    // Whether actual (the window's real geometry) is not where the last pass
    // put it. Something else may have moved the window since then.
    bool                              frameDiffersFrom(const FrameRect& actual) const;
    const FrameResult&                current() const;
    const CropResult&                 crop() const;
    const std::optional<FrameResult>& previous() const;
    const std::optional<CropResult>&  previousCrop() const;

  private:
    std::optional<FrameResult> m_current;
    std::optional<CropResult>  m_currentCrop;
    std::optional<FrameResult> m_previous;
    std::optional<CropResult>  m_previousCrop;
};
