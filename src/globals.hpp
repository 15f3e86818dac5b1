#pragma once
#include <chrono>
#include <format>
#include <fstream>
#include <hyprland/src/plugins/PluginAPI.hpp>
#include <string>
#include <utility>

inline HANDLE PHANDLE = nullptr;

inline bool debugLogEnabled() {
  static auto *const *PDEBUG = (Hyprlang::INT *const *)HyprlandAPI::getConfigValue(PHANDLE, "plugin:hyprframe:debug_log")->getDataStaticPtr();
  return PDEBUG && **PDEBUG;
}

// Appends to /tmp/hyprframe.log when plugin:hyprframe:debug_log is set, UTC timestamps
template <typename... Args>
void LOG_FILE(std::format_string<Args...> fmt, Args &&...args) {
  if (!debugLogEnabled())
    return;

  std::ofstream logFile("/tmp/hyprframe.log", std::ios::app);
  if (!logFile.is_open())
    return;

  const auto NOW = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
  logFile << std::format("[{:%T}] ", NOW) << std::format(fmt, std::forward<Args>(args)...) << std::endl;
}
