#pragma once
#define WLR_USE_UNSTABLE

#include "DispatcherArgs.hpp"
#include "WindowFrameState.hpp"
#include "globals.hpp"
#include <hyprland/src/desktop/DesktopTypes.hpp>
#include <string>
#include <unordered_map>

// Default layer threshold for system decor (bars, panels)
constexpr int DEFAULT_SYSTEM_DECOR_LAYER = 10000;

// Frames layout policy gives a window on this monitor, in layout coordinates.
// With respectReserved the content, visible, stable and decor frames leave out
// the reserved areas (bars), otherwise every frame is the monitor box.
ReferenceFrames referenceFramesForMonitor(PHLMONITOR pMonitor, bool respectReserved);

// With plugin:hyprframe:barless_is_secondary set, monitors with nothing
// reserved carry no system decor
bool isDefaultDisplay(PHLMONITOR pMonitor);

// Where the window is right now, which may differ from the last frame we applied
FrameRect currentWindowFrame(PHLWINDOW pWindow);

LayoutRequest buildLayoutRequest(PHLWINDOW pWindow, PHLMONITOR pMonitor, const DispatcherArgs &args);

void applyFrame(PHLWINDOW pWindow, const FrameResult &result);

std::string describeLayout(PHLWINDOW pWindow, const LayoutRequest &request, const CWindowFrameState &state, const FrameChanges &changes);

// Frame state per laid out window, dropped when the window closes
inline std::unordered_map<PHLWINDOW, CWindowFrameState> g_windowFrameStates;
