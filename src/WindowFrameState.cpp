#include "WindowFrameState.hpp"
#include <utility>

static FrameChanges diffResults(const std::optional<FrameResult>& before, const FrameResult& after, const std::optional<CropResult>& cropBefore,
                                const CropResult& cropAfter) {
    FrameChanges changes;

    if (!before || !cropBefore) {
        // nothing to compare against, the client has never seen a frame
        changes.moved          = true;
        changes.resized        = true;
        changes.overscanInsets = true;
        changes.contentInsets  = true;
        changes.visibleInsets  = true;
        changes.stableInsets   = true;
        changes.crop           = true;
        return changes;
    }

    changes.moved          = before->frame.left != after.frame.left || before->frame.top != after.frame.top;
    changes.resized        = before->frame.width() != after.frame.width() || before->frame.height() != after.frame.height();
    changes.overscanInsets = before->overscanInsets != after.overscanInsets;
    changes.contentInsets  = before->contentInsets != after.contentInsets;
    changes.visibleInsets  = before->visibleInsets != after.visibleInsets;
    changes.stableInsets   = before->stableInsets != after.stableInsets;
    changes.crop           = *cropBefore != cropAfter;

    return changes;
}

FrameChanges CWindowFrameState::layout(const LayoutRequest& request) {
    // resolve both before touching state so a contract error leaves the last pass intact
    FrameResult frame = resolveFrame(request.attrs, request.measured, request.frames, request.container);

    CropInputs  cropInputs;
    cropInputs.frame              = frame.frame;
    cropInputs.decorFrame         = frame.decorFrame;
    cropInputs.displayFrame       = request.frames.display;
    cropInputs.windowLayer        = request.windowLayer;
    cropInputs.systemDecorLayer   = request.systemDecorLayer;
    cropInputs.transitionResizing = request.transitionResizing;
    cropInputs.defaultDisplay     = request.defaultDisplay;

    CropResult   crop    = resolveCrop(cropInputs);

    FrameChanges changes = diffResults(m_current, frame, m_currentCrop, crop);

    m_previous     = std::move(m_current);
    m_previousCrop = std::move(m_currentCrop);
    m_current      = std::move(frame);
    m_currentCrop  = std::move(crop);

    return changes;
}

bool CWindowFrameState::hasLayout() const {
    return m_current.has_value();
}

bool CWindowFrameState::frameDiffersFrom(const FrameRect& actual) const {
    return !m_current || m_current->frame != actual;
}

const FrameResult& CWindowFrameState::current() const {
    if (!m_current)
        throw std::logic_error("CWindowFrameState::current() before the first layout pass");
    return *m_current;
}

const CropResult& CWindowFrameState::crop() const {
    if (!m_currentCrop)
        throw std::logic_error("CWindowFrameState::crop() before the first layout pass");
    return *m_currentCrop;
}

const std::optional<FrameResult>& CWindowFrameState::previous() const {
    return m_previous;
}

const std::optional<CropResult>& CWindowFrameState::previousCrop() const {
    return m_previousCrop;
}
