#pragma once
/*
 * Capability
 *
 * Purpose: pick the richest image protocol the host terminal supports, once at startup.
 * Order: iTerm2 inline > Kitty graphics > Sixel > half-block fallback (always succeeds).
 * Testing: TerminalProbe carries the environment lookup and DA1 query so fakes can stand in.
 */
#include <functional>
#include <optional>
#include <string>
#include "types.hpp"

struct TerminalProbe {
  std::function<std::optional<std::string>(const char*)> env;
  // raw Primary Device Attributes reply, empty when the terminal stays silent
  std::function<std::string()> device_attributes;
};

TerminalProbe system_probe();
RenderMode detect_render_mode(const TerminalProbe& probe);
bool reports_sixel(const std::string& da1_reply);
CellGeometry query_cell_geometry();

const char* render_mode_name(RenderMode mode);
std::optional<RenderMode> parse_render_mode(const std::string& name);
