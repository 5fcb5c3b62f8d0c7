#include "capability.hpp"
#include "config.hpp"
#include "tty_session.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <sys/ioctl.h>
#include <unistd.h>

static bool contains(const std::optional<std::string>& v, const char* needle) {
  return v && v->find(needle) != std::string::npos;
}

static bool equals(const std::optional<std::string>& v, const char* s) {
  return v && *v == s;
}

static std::string query_da1_on_tty() {
  TtySession tty;
  if (!tty.open() || !tty.send("\033[c")) return "";
  // answer looks like ESC [ ? 62 ; 4 ; 22 c
  return tty.read_until('c', TV_DA1_TIMEOUT_MS);
}

TerminalProbe system_probe() {
  TerminalProbe p;
  p.env = [](const char* name) -> std::optional<std::string> {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
  };
  p.device_attributes = [] {
    if (!::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO)) return std::string();
    return query_da1_on_tty();
  };
  return p;
}

bool reports_sixel(const std::string& da1_reply) {
  auto start = da1_reply.find("[?");
  if (start == std::string::npos) return false;
  auto end = da1_reply.find('c', start);
  if (end == std::string::npos) return false;
  std::string params = da1_reply.substr(start + 2, end - start - 2);
  size_t pos = 0;
  while (pos <= params.size()) {
    size_t semi = params.find(';', pos);
    if (semi == std::string::npos) semi = params.size();
    if (params.compare(pos, semi - pos, "4") == 0) return true;
    pos = semi + 1;
  }
  return false;
}

RenderMode detect_render_mode(const TerminalProbe& probe) {
  auto env = [&](const char* name) { return probe.env ? probe.env(name) : std::nullopt; };
  auto term_program = env("TERM_PROGRAM");
  auto term = env("TERM");

  if (equals(term_program, "iTerm.app") || equals(term_program, "WezTerm") || equals(env("LC_TERMINAL"), "iTerm2")) {
    spdlog::info("capability: inline images via TERM_PROGRAM/LC_TERMINAL");
    return RenderMode::InlineProtocol;
  }
  if (env("KITTY_WINDOW_ID") || contains(term, "kitty") || contains(term, "ghostty") || equals(term_program, "ghostty")) {
    spdlog::info("capability: kitty graphics via environment");
    return RenderMode::CellGraphicsProtocol;
  }
  std::string da1 = probe.device_attributes ? probe.device_attributes() : std::string();
  if (reports_sixel(da1)) {
    spdlog::info("capability: sixel advertised in device attributes");
    return RenderMode::PixelApproximation;
  }
  spdlog::info("capability: no graphics protocol, using half blocks");
  return RenderMode::BlockFallback;
}

CellGeometry query_cell_geometry() {
  CellGeometry cell;
  struct winsize w{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0 && w.ws_row > 0 &&
      w.ws_xpixel > 0 && w.ws_ypixel > 0) {
    cell.width_px = w.ws_xpixel / w.ws_col;
    cell.height_px = w.ws_ypixel / w.ws_row;
  }
  if (cell.width_px <= 0 || cell.height_px <= 0) cell = CellGeometry{};
  spdlog::info("capability: cell geometry {}x{} px", cell.width_px, cell.height_px);
  return cell;
}

const char* render_mode_name(RenderMode mode) {
  switch (mode) {
    case RenderMode::InlineProtocol: return "iterm2";
    case RenderMode::CellGraphicsProtocol: return "kitty";
    case RenderMode::PixelApproximation: return "sixel";
    case RenderMode::BlockFallback: return "blocks";
  }
  return "unknown";
}

std::optional<RenderMode> parse_render_mode(const std::string& name) {
  if (name == "iterm2") return RenderMode::InlineProtocol;
  if (name == "kitty") return RenderMode::CellGraphicsProtocol;
  if (name == "sixel") return RenderMode::PixelApproximation;
  if (name == "blocks") return RenderMode::BlockFallback;
  return std::nullopt;
}
