#define WLR_USE_UNSTABLE

#include "DispatcherArgs.hpp"
#include "globals.hpp"
#include "hyprframe.hpp"
#include <hyprland/src/Compositor.hpp>
#include <hyprland/src/config/ConfigManager.hpp>
#include <hyprland/src/debug/Log.hpp>
#include <hyprland/src/desktop/DesktopTypes.hpp>
#include <hyprland/src/desktop/Window.hpp>
#include <any>
#include <fstream>

// Do NOT change this function.
APICALL EXPORT std::string PLUGIN_API_VERSION() { return HYPRLAND_API_VERSION; }

static SDispatchResult writeDebugDump(const std::string &text) {
  static auto *const *PDEBUGFILE = (Hyprlang::STRING const *)HyprlandAPI::getConfigValue(PHANDLE, "plugin:hyprframe:debug_file")->getDataStaticPtr();
  const std::string debugFile = *PDEBUGFILE;

  // Write to a file instead of stdout since Hyprland doesn't have terminal attached
  std::ofstream out(debugFile);
  if (!out.is_open())
    return {.success = false, .error = "Failed to open debug file " + debugFile};

  out << text;
  Debug::log(LOG, "[hyprframe] Debug output written to {}", debugFile);
  return {};
}

static SDispatchResult onPlaceDispatcher(std::string arg) {
  Debug::log(LOG, "[hyprframe] Dispatcher called with arg='{}'", arg);

  DispatcherArgs parsedArgs = parseDispatcherArgs(arg);
  if (!parsedArgs.error.empty())
    return {.success = false, .error = parsedArgs.error};

  auto PWINDOW = g_pCompositor->m_lastWindow.lock();
  if (!PWINDOW)
    return {.success = false, .error = "No focused window"};

  if (!PWINDOW->m_isFloating)
    return {.success = false, .error = "Focused window is not floating"};

  auto PMONITOR = PWINDOW->m_monitor.lock();
  if (!PMONITOR)
    return {.success = false, .error = "Focused window has no monitor"};

  const LayoutRequest request = buildLayoutRequest(PWINDOW, PMONITOR, parsedArgs);

  // Debug is a dry run, the window keeps its real frame state
  const bool DRYRUN = parsedArgs.action == DispatcherArgs::Action::DEBUG;
  CWindowFrameState scratch;
  if (DRYRUN) {
    auto it = g_windowFrameStates.find(PWINDOW);
    if (it != g_windowFrameStates.end())
      scratch = it->second;
  }
  CWindowFrameState &state = DRYRUN ? scratch : g_windowFrameStates[PWINDOW];

  FrameChanges changes;
  try {
    changes = state.layout(request);
  } catch (const FrameContractError &e) {
    Debug::log(ERR, "[hyprframe] Layout of '{}' rejected: {}", PWINDOW->m_title, e.what());
    return {.success = false, .error = e.what()};
  }

  if (DRYRUN)
    return writeDebugDump(describeLayout(PWINDOW, request, state, changes));

  if (debugLogEnabled())
    LOG_FILE("{}", describeLayout(PWINDOW, request, state, changes));

  // Diff against the real geometry, the window may have been moved or resized
  // by something else since our last pass
  const bool OFFFRAME = state.frameDiffersFrom(currentWindowFrame(PWINDOW));

  if (!changes.any() && !OFFFRAME) {
    Debug::log(LOG, "[hyprframe] '{}' already at {}", PWINDOW->m_title, toString(state.current().frame));
    return {};
  }

  if (OFFFRAME)
    applyFrame(PWINDOW, state.current());

  if (changes.crop) {
    Debug::log(LOG, "[hyprframe] Crop for '{}' is now {}", PWINDOW->m_title, toString(state.crop().crop));
    LOG_FILE("crop {} -> {}", state.previousCrop() ? toString(state.previousCrop()->crop) : "none", toString(state.crop().crop));
  }

  return {};
}

static void failNotif(const std::string &reason) { HyprlandAPI::addNotification(PHANDLE, "[hyprframe] Failure in initialization: " + reason, CHyprColor{1.0, 0.2, 0.2, 1.0}, 5000); }

APICALL EXPORT PLUGIN_DESCRIPTION_INFO PLUGIN_INIT(HANDLE handle) {
  PHANDLE = handle;

  const std::string HASH = __hyprland_api_get_hash();

  if (HASH != GIT_COMMIT_HASH) {
    failNotif("Version mismatch (headers ver is not equal to running hyprland ver)");
    throw std::runtime_error("[hyprframe] Version mismatch");
  }

  static auto closeWindowHook = HyprlandAPI::registerCallbackDynamic(PHANDLE, "closeWindow", [](void *self, SCallbackInfo &info, std::any param) {
    auto PWINDOW = std::any_cast<PHLWINDOW>(param);
    if (g_windowFrameStates.erase(PWINDOW))
      Debug::log(LOG, "[hyprframe] Dropped frame state for '{}'", PWINDOW->m_title);
  });

  HyprlandAPI::addDispatcherV2(PHANDLE, "hyprframe:place", ::onPlaceDispatcher);

  Debug::log(LOG, "[hyprframe] Plugin initialized, dispatcher 'hyprframe:place' registered");

  HyprlandAPI::addConfigValue(PHANDLE, "plugin:hyprframe:debug_log", Hyprlang::INT{0});
  HyprlandAPI::addConfigValue(PHANDLE, "plugin:hyprframe:system_decor_layer", Hyprlang::INT{DEFAULT_SYSTEM_DECOR_LAYER});
  HyprlandAPI::addConfigValue(PHANDLE, "plugin:hyprframe:respect_reserved", Hyprlang::INT{1});
  HyprlandAPI::addConfigValue(PHANDLE, "plugin:hyprframe:barless_is_secondary", Hyprlang::INT{1});
  HyprlandAPI::addConfigValue(PHANDLE, "plugin:hyprframe:debug_file", Hyprlang::STRING{"/tmp/hyprframe_debug.txt"});
  HyprlandAPI::reloadConfig();

  return {"hyprframe", "Anchor based window frame layout with inset and crop resolution", "yz778", "0.1.0"};
}

APICALL EXPORT void PLUGIN_EXIT() {
  g_windowFrameStates.clear();
  g_pConfigManager->reload();
}
