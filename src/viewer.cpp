#include <ncurses.h>
#include "viewer.hpp"
#include "capability.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

static constexpr int CTRL_c = 'C'-64;
static constexpr int ESC = 27;
static constexpr const char* kHelp =
    "[Left/Right] Page  [Up/Down] Sub-page  [0-9] Jump to page  [q] Quit  [c] Clear cache";

KeyEvent translate_key(int ch) {
  if (ch >= '0' && ch <= '9') return {Key::Digit, static_cast<char>(ch)};
  switch (ch) {
    case KEY_BACKSPACE: case 127: case 8: return {Key::Backspace};
    case ESC: return {Key::Escape};
    case '\n': case '\r': case KEY_ENTER: return {Key::Enter};
    case KEY_LEFT: return {Key::Left};
    case KEY_RIGHT: return {Key::Right};
    case KEY_UP: return {Key::Up};
    case KEY_DOWN: return {Key::Down};
    case 'c': return {Key::ClearCache};
    case 'q': case CTRL_c: return {Key::Quit};
    default: break;
  }
  return {};
}

std::string make_bar(const std::string& left, const std::string& right, int width) {
  if (width <= 0) return "";
  size_t w = static_cast<size_t>(width);
  if (left.size() + right.size() <= w) return left + std::string(w - left.size() - right.size(), ' ') + right;
  if (left.size() >= w) return left.substr(0, w);
  return left + right.substr(0, w - left.size());
}

Viewer::Viewer(ITerminal& term, IPageSource& source, RenderMode mode, CellGeometry cell,
               PageAddress start, PageCache cache)
    : term(term), source(source), mode(mode), renderer(cell), cache(std::move(cache)), nav(start) {}

int Viewer::run(const std::atomic<bool>* interrupted) {
  spdlog::info("viewer: start at page {} in {} mode", format_address(nav.current()), render_mode_name(mode));
  while (!should_quit) {
    if (interrupted && interrupted->load()) {
      spdlog::info("viewer: interrupted");
      break;
    }
    resolve();
    draw();
    int ch = term.poll_key(TV_POLL_INTERVAL_MS);
    if (ch != kNoKey) handle_key(ch);
  }
  std::string bye = renderer.teardown(mode);
  if (!bye.empty()) term.write_raw(0, 0, bye);
  spdlog::info("viewer: quit");
  return 0;
}

void Viewer::resolve() {
  const PageAddress target = nav.current();
  if (auto hit = cache.get(target)) {
    if (hit != picture) picture_dirty = true;
    picture = hit;
    shown = target;
    return;
  }
  // a failed page waits for navigation or a cache clear before it is tried again
  if (failed && *failed == target) return;

  loading = true;
  draw();
  PixelGrid grid;
  FetchError err;
  bool ok = source.fetch(target, grid, err);
  loading = false;
  if (!ok) {
    failed = target;
    message = err.message;
    message_is_error = true;
    nav.clear_error();
    spdlog::warn("page {}: {} [{}]", format_address(target), err.message, fetch_error_kind_name(err.kind));
    if (err.kind == FetchError::Kind::HttpStatus && err.http_status == 404) nav.note_missing_subpage(target);
    return;
  }
  failed.reset();
  if (message_is_error) { message.clear(); message_is_error = false; }
  picture = cache.put(target, std::move(grid));
  shown = target;
  picture_dirty = true;
}

void Viewer::draw() {
  TermSize sz = term.getSize();
  FrameRects fr = compute_frame(sz.rows, sz.cols);
  term.clear();
  draw_bars(fr);
  if (!picture) {
    if (loading) draw_placeholder(fr.viewport, "Loading page...");
    else if (failed) draw_placeholder(fr.viewport, "Page unavailable");
  }
  term.refresh();
  if (picture) emit_picture(fr.viewport);
}

void Viewer::draw_bars(const FrameRects& fr) {
  std::string left = "  TELEVIDEO RAI - Page " + format_address(nav.current());
  std::string right = loading ? "Loading...  " : std::string("[") + render_mode_name(mode) + "]  ";
  for (int r = 0; r < fr.header.height; ++r) {
    term.draw_colored(fr.header.row + r, fr.header.col, make_bar(r == 0 ? left : "", r == 0 ? right : "", fr.header.width), kPairBar);
  }
  std::string foot = "  " + footer_text();
  for (int r = 0; r < fr.footer.height; ++r) {
    term.draw_colored(fr.footer.row + r, fr.footer.col, make_bar(r == 0 ? foot : "", "", fr.footer.width), kPairBar);
  }
}

std::string Viewer::footer_text() const {
  const NavigationState& st = nav.state();
  if (!st.pending_digits.empty()) return "Go to page: " + st.pending_digits + "_";
  if (st.last_error) return *st.last_error;
  if (!message.empty()) return message;
  return kHelp;
}

void Viewer::draw_placeholder(const Rect& viewport, const std::string& text) {
  if (viewport.empty()) return;
  std::string shown_text = text.substr(0, static_cast<size_t>(viewport.width));
  int row = viewport.row + viewport.height / 2;
  int col = viewport.col + (viewport.width - static_cast<int>(shown_text.size())) / 2;
  term.draw_colored(row, col, shown_text, message_is_error ? kPairAlert : kPairText);
}

void Viewer::emit_picture(const Rect& viewport) {
  std::string signature = format_address(*shown) + "@" + std::to_string(viewport.row) + "," +
                          std::to_string(viewport.col) + "," + std::to_string(viewport.height) + "x" +
                          std::to_string(viewport.width);
  if (!picture_dirty && signature == last_signature) return;
  RenderOutput out = renderer.render(*picture, mode, viewport);
  for (const auto& op : out.ops) term.write_raw(op.row, op.col, op.bytes);
  spdlog::debug("viewer: drew {} into {}x{} cells at {},{}", format_address(*shown), out.image_area.width,
                out.image_area.height, out.image_area.row, out.image_area.col);
  last_signature = signature;
  picture_dirty = false;
}

void Viewer::handle_key(int ch) {
  if (ch == KEY_RESIZE) { picture_dirty = true; return; }
  switch (nav.handle(translate_key(ch))) {
    case NavAction::Navigated:
      failed.reset();
      message.clear();
      message_is_error = false;
      break;
    case NavAction::ClearCache:
      cache.clear();
      failed.reset();
      message = "Cache cleared!";
      message_is_error = false;
      nav.clear_error();
      break;
    case NavAction::Quit:
      should_quit = true;
      break;
    case NavAction::None:
      break;
  }
}
