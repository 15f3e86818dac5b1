#pragma once
#include "FrameResolver.hpp"
#include <optional>
#include <string>

// Parsed argument of the hyprframe:place dispatcher, e.g.
//   "anchor:end,start offset:20,40 size:800x600"
//   "debug anchor:fill,fill container:0,0,1280,720 inset:0,0,1280,600"
struct DispatcherArgs {
    enum class Action { PLACE,
                        DEBUG } action = Action::PLACE;

    WindowAttributes               attrs;
    std::optional<MeasuredSize>    measured; // empty = use the window's current size
    std::optional<ContainerBounds> container;
    std::string                    error;
};

DispatcherArgs parseDispatcherArgs(const std::string& arg);
