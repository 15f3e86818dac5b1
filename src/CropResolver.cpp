#include "CropResolver.hpp"

static FrameRect fullDisplay(const FrameRect& display) {
    return {0, 0, narrowEdge(display.width()), narrowEdge(display.height())};
}

CropResult resolveCrop(const CropInputs& inputs) {
    requireWellFormed(inputs.frame, "window");
    requireWellFormed(inputs.decorFrame, "decor");
    requireWellFormed(inputs.displayFrame, "display");

    CropResult result;

    if (!inputs.defaultDisplay) {
        // No system decor here, only the screen edges cut the window
        const FrameRect OWN = {0, 0, narrowEdge(inputs.frame.width()), narrowEdge(inputs.frame.height())};
        result.crop         = intersectRects(OWN, toLocal(inputs.displayFrame, inputs.frame));
        return result;
    }

    // The surface stays display sized while a resize transition runs
    if (inputs.decorFrame.empty() || inputs.windowLayer > inputs.systemDecorLayer || inputs.transitionResizing) {
        result.crop = fullDisplay(inputs.displayFrame);
        return result;
    }

    result.crop = toLocal(intersectRects(inputs.decorFrame, inputs.frame), inputs.frame);
    return result;
}

bool hostsSystemDecor(const FrameRect& display, const FrameRect& decor, bool barlessIsSecondary) {
    return !barlessIsSecondary || decor != display;
}
