#include "hyprframe.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <hyprland/src/Compositor.hpp>
#include <hyprland/src/debug/Log.hpp>
#include <hyprland/src/desktop/Window.hpp>
#include <hyprland/src/helpers/Monitor.hpp>
#include <hyprland/src/managers/input/InputManager.hpp>

static FrameRect frameFromBox(const CBox &box) {
  const int LEFT = (int)std::round(box.x);
  const int TOP = (int)std::round(box.y);
  return {LEFT, TOP, LEFT + std::max(0, (int)std::round(box.w)), TOP + std::max(0, (int)std::round(box.h))};
}

static FrameRect shifted(const FrameRect &rect, int dx, int dy) {
  return {narrowEdge((int64_t)rect.left + dx), narrowEdge((int64_t)rect.top + dy), narrowEdge((int64_t)rect.right + dx), narrowEdge((int64_t)rect.bottom + dy)};
}

static const char *anchorName(EAnchor anchor) {
  switch (anchor) {
  case EAnchor::START:
    return "start";
  case EAnchor::END:
    return "end";
  case EAnchor::FILL:
    return "fill";
  }
  return "?";
}

ReferenceFrames referenceFramesForMonitor(PHLMONITOR pMonitor, bool respectReserved) {
  const FrameRect MONITOR = frameFromBox(CBox{pMonitor->m_position, pMonitor->m_size});

  FrameRect usable = MONITOR;
  if (respectReserved) {
    const Vector2D reservedTopLeft = pMonitor->m_reservedTopLeft;
    const Vector2D reservedBottomRight = pMonitor->m_reservedBottomRight;

    usable.left += (int)std::round(reservedTopLeft.x);
    usable.top += (int)std::round(reservedTopLeft.y);
    usable.right = std::max(usable.left, usable.right - (int)std::round(reservedBottomRight.x));
    usable.bottom = std::max(usable.top, usable.bottom - (int)std::round(reservedBottomRight.y));
  }

  ReferenceFrames frames;
  frames.parent = MONITOR;
  frames.display = MONITOR;
  frames.overscan = MONITOR;
  frames.content = usable;
  frames.visible = usable;
  frames.stable = usable;
  frames.decor = usable;
  return frames;
}

bool isDefaultDisplay(PHLMONITOR pMonitor) {
  static auto *const *PBARLESS = (Hyprlang::INT *const *)HyprlandAPI::getConfigValue(PHANDLE, "plugin:hyprframe:barless_is_secondary")->getDataStaticPtr();

  const ReferenceFrames FRAMES = referenceFramesForMonitor(pMonitor, true);
  return hostsSystemDecor(FRAMES.display, FRAMES.decor.value_or(FRAMES.display), **PBARLESS);
}

FrameRect currentWindowFrame(PHLWINDOW pWindow) { return frameFromBox(CBox{pWindow->m_realPosition->goal(), pWindow->m_realSize->goal()}); }

LayoutRequest buildLayoutRequest(PHLWINDOW pWindow, PHLMONITOR pMonitor, const DispatcherArgs &args) {
  static auto *const *PRESPECTRESERVED = (Hyprlang::INT *const *)HyprlandAPI::getConfigValue(PHANDLE, "plugin:hyprframe:respect_reserved")->getDataStaticPtr();
  static auto *const *PDECORLAYER = (Hyprlang::INT *const *)HyprlandAPI::getConfigValue(PHANDLE, "plugin:hyprframe:system_decor_layer")->getDataStaticPtr();

  LayoutRequest request;
  request.attrs = args.attrs;
  request.frames = referenceFramesForMonitor(pMonitor, **PRESPECTRESERVED);

  if (args.measured) {
    request.measured = *args.measured;
  } else {
    const Vector2D currentSize = pWindow->m_realSize->value();
    request.measured = {(int)std::round(currentSize.x), (int)std::round(currentSize.y)};
  }

  // Container bounds arrive monitor-local
  if (args.container) {
    const int DX = request.frames.display.left;
    const int DY = request.frames.display.top;
    ContainerBounds container = *args.container;
    container.bounds = shifted(container.bounds, DX, DY);
    if (!container.tempInsetBounds.empty())
      container.tempInsetBounds = shifted(container.tempInsetBounds, DX, DY);
    request.container = container;
  }

  // Fullscreen windows sit above bars, everything else below
  request.systemDecorLayer = (int)**PDECORLAYER;
  request.windowLayer = pWindow->isFullscreen() ? request.systemDecorLayer + 1 : 1;

  request.transitionResizing = g_pInputManager->m_currentlyDraggedWindow.lock() == pWindow && g_pInputManager->m_dragMode == MBIND_RESIZE;
  request.defaultDisplay = isDefaultDisplay(pMonitor);

  return request;
}

void applyFrame(PHLWINDOW pWindow, const FrameResult &result) {
  const Vector2D POS = {(double)result.frame.left, (double)result.frame.top};
  const Vector2D SIZE = {(double)result.frame.width(), (double)result.frame.height()};

  Debug::log(LOG, "[hyprframe] Applying frame {} to window '{}'", toString(result.frame), pWindow->m_title);

  *pWindow->m_realPosition = POS;
  *pWindow->m_realSize = SIZE;
  pWindow->sendWindowSize();
}

std::string describeLayout(PHLWINDOW pWindow, const LayoutRequest &request, const CWindowFrameState &state, const FrameChanges &changes) {
  const FrameResult &result = state.current();

  std::string out;
  out += "\n========== HYPRFRAME DEBUG MODE ==========\n";
  out += std::format("Window: \"{}\"\n", pWindow->m_title);

  out += "\nAttributes:\n";
  out += std::format("  Anchor: {},{}\n", anchorName(request.attrs.horizontal), anchorName(request.attrs.vertical));
  out += std::format("  Offset: {},{}\n", request.attrs.x, request.attrs.y);
  out += std::format("  Declared: {}x{}{}\n", request.attrs.width, request.attrs.height, request.attrs.scaledSurface ? " (scaled surface)" : "");
  out += std::format("  Measured: {}x{}\n", request.measured.width, request.measured.height);

  out += "\nReference frames:\n";
  out += std::format("  Parent:   {}\n", toString(request.frames.parent));
  out += std::format("  Display:  {}\n", toString(request.frames.display));
  out += std::format("  Overscan: {}\n", toString(request.frames.overscan));
  out += std::format("  Content:  {}\n", toString(request.frames.content));
  out += std::format("  Visible:  {}\n", toString(request.frames.visible));
  out += std::format("  Stable:   {}\n", toString(request.frames.stable));
  out += std::format("  Decor:    {}\n", request.frames.decor ? toString(*request.frames.decor) : "none");
  if (request.container) {
    out += std::format("  Container: {}{}\n", toString(request.container->bounds), request.container->fullscreen ? " (fullscreen)" : "");
    out += std::format("  Temp inset bounds: {}\n", toString(request.container->tempInsetBounds));
  }

  out += "\nResult:\n";
  out += std::format("  Containing frame: {}\n", toString(result.containingFrame));
  out += std::format("  Frame:            {}\n", toString(result.frame));
  out += std::format("  Overscan insets:  {}\n", toString(result.overscanInsets));
  out += std::format("  Content insets:   {} frame {}\n", toString(result.contentInsets), toString(result.contentFrame));
  out += std::format("  Visible insets:   {} frame {}\n", toString(result.visibleInsets), toString(result.visibleFrame));
  out += std::format("  Stable insets:    {} frame {}\n", toString(result.stableInsets), toString(result.stableFrame));
  out += std::format("  Crop:             {} (layer {} / decor layer {}{})\n", toString(state.crop().crop), request.windowLayer, request.systemDecorLayer,
                     request.transitionResizing ? ", resizing" : "");
  out += std::format("  Display kind:     {}\n", request.defaultDisplay ? "default" : "secondary (no reserved area, see barless_is_secondary)");

  out += std::format("\nChanged since last pass: moved={} resized={} insets={}/{}/{}/{} crop={}\n", changes.moved, changes.resized, changes.overscanInsets,
                     changes.contentInsets, changes.visibleInsets, changes.stableInsets, changes.crop);
  out += "========== END DEBUG ==========\n\n";

  return out;
}
