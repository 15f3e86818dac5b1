#pragma once
#include "FrameGeometry.hpp"

// Surface crop for compositing, in window-local coordinates
// No Hyprland dependencies - these are purely mathematical

struct CropInputs {
    FrameRect frame;        // final window frame from resolveFrame
    FrameRect decorFrame;   // empty means no policy decor
    FrameRect displayFrame; // bounds of the display the window is on
    int       windowLayer      = 0;
    int       systemDecorLayer = 0;
    bool      transitionResizing = false;
    bool      defaultDisplay     = true; // secondary displays carry no system decor
};

struct CropResult {
    FrameRect crop;

    bool operator==(const CropResult&) const = default;
};

CropResult resolveCrop(const CropInputs& inputs);

// Whether a display whose decor frame is decor hosts system decor. A decor
// frame equal to the display means nothing is reserved (no bar); with
// barlessIsSecondary such a display is treated as secondary.
bool hostsSystemDecor(const FrameRect& display, const FrameRect& decor, bool barlessIsSecondary);
