#include <ncurses.h>
#include "viewer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <map>
#include <string>
#include <vector>

// scripted page source; records what the screen looked like while "blocking"
class FakeSource : public IPageSource {
public:
  explicit FakeSource(HeadlessTerminal& term) : term(term) {}
  bool fetch(const PageAddress& address, PixelGrid& out, FetchError& err) override {
    requests.push_back(address);
    header_during_fetch = term.line(0);
    auto it = failures.find(address.page * 100 + address.sub_page.value_or(0));
    if (it != failures.end()) { err = it->second; return false; }
    out = PixelGrid(16, 9);
    for (int y = 0; y < 9; ++y)
      for (int x = 0; x < 16; ++x) out.set(x, y, Rgb{static_cast<uint8_t>(address.page % 256), 0, 0});
    return true;
  }
  void fail(const PageAddress& a, FetchError e) { failures[a.page * 100 + a.sub_page.value_or(0)] = std::move(e); }
  void heal(const PageAddress& a) { failures.erase(a.page * 100 + a.sub_page.value_or(0)); }

  HeadlessTerminal& term;
  std::vector<PageAddress> requests;
  std::string header_during_fetch;
  std::map<int, FetchError> failures;
};

static bool has(const std::string& line, const std::string& text) { return line.find(text) != std::string::npos; }

static void tick(Viewer& v) { v.resolve(); v.draw(); }

static void assert_writes_inside_viewport(const HeadlessTerminal& term) {
  for (const auto& w : term.raw_writes()) {
    assert(w.row >= 1 && w.row <= 22);
    assert(w.col >= 0 && w.col < 80);
  }
}

static void test_timeout_on_empty_cache() {
  HeadlessTerminal term(24, 80);
  FakeSource src(term);
  src.fail(PageAddress{100, std::nullopt}, FetchError{FetchError::Kind::Timeout, 0, "fetch failed: timed out after 10s"});
  Viewer v(term, src, RenderMode::BlockFallback, CellGeometry{8, 16}, PageAddress{100, std::nullopt});

  tick(v);
  assert(src.requests.size() == 1);
  assert(has(src.header_during_fetch, "Loading..."));
  assert(has(term.line(23), "fetch failed"));
  assert(has(term.line(12), "Page unavailable"));
  assert(v.navigation().current == (PageAddress{100, std::nullopt}));
  assert(!v.picture_address());
  assert(term.raw_writes().empty());

  // the failed page is not refetched every tick
  tick(v);
  tick(v);
  assert(src.requests.size() == 1);

  // clearing the cache retries
  src.heal(PageAddress{100, std::nullopt});
  v.handle_key('c');
  tick(v);
  assert(src.requests.size() == 2);
  assert(v.picture_address() && v.picture_address()->page == 100);
  assert(has(term.line(23), "Cache cleared!"));
}

static void test_fetch_cache_and_redraw() {
  HeadlessTerminal term(24, 80);
  FakeSource src(term);
  Viewer v(term, src, RenderMode::BlockFallback, CellGeometry{8, 16}, PageAddress{100, std::nullopt});

  tick(v);
  assert(src.requests.size() == 1);
  assert(has(term.line(0), "TELEVIDEO RAI - Page 100"));
  assert(has(term.line(0), "[blocks]"));
  assert(has(term.line(23), "[q] Quit"));
  assert(term.raw_writes().size() == 22);
  assert_writes_inside_viewport(term);

  // unchanged frame: ncurses keeps the text, image bytes are not resent
  term.take_raw_writes();
  tick(v);
  assert(term.raw_writes().empty());
  assert(src.requests.size() == 1);

  // resize forces the picture out again
  v.handle_key(KEY_RESIZE);
  tick(v);
  assert(term.raw_writes().size() == 22);

  // next page, then back: the second visit is a cache hit
  v.handle_key(KEY_RIGHT);
  tick(v);
  assert(src.requests.size() == 2);
  assert(has(term.line(0), "Page 101"));
  v.handle_key(KEY_LEFT);
  tick(v);
  assert(src.requests.size() == 2);
  assert(v.picture_address()->page == 100);
}

static void test_failure_keeps_previous_picture() {
  HeadlessTerminal term(24, 80);
  FakeSource src(term);
  Viewer v(term, src, RenderMode::BlockFallback, CellGeometry{8, 16}, PageAddress{100, std::nullopt});
  tick(v);
  src.fail(PageAddress{101, std::nullopt}, FetchError{FetchError::Kind::HttpStatus, 500, "fetch failed: HTTP 500"});
  v.handle_key(KEY_RIGHT);
  term.take_raw_writes();
  tick(v);
  assert(v.navigation().current.page == 101);
  assert(v.picture_address()->page == 100);
  assert(has(term.line(0), "Page 101"));
  assert(has(term.line(23), "fetch failed: HTTP 500"));
  assert(!has(term.line(12), "Page unavailable"));

  // navigating away drops the error
  v.handle_key(KEY_RIGHT);
  tick(v);
  assert(v.picture_address()->page == 102);
  assert(has(term.line(23), "[q] Quit"));
}

static void test_missing_subpage() {
  HeadlessTerminal term(24, 80);
  FakeSource src(term);
  Viewer v(term, src, RenderMode::BlockFallback, CellGeometry{8, 16}, PageAddress{200, std::nullopt});
  src.fail(PageAddress{200, 3}, FetchError{FetchError::Kind::HttpStatus, 404, "fetch failed: HTTP 404"});
  tick(v);
  v.handle_key(KEY_DOWN);
  tick(v);
  assert(v.picture_address() == (PageAddress{200, 2}));
  v.handle_key(KEY_DOWN);
  tick(v);
  assert(v.navigation().current == (PageAddress{200, 3}));
  assert(has(term.line(23), "HTTP 404"));
  // part 3 is known missing now, so Down stops at part 2
  v.handle_key(KEY_UP);
  assert(v.navigation().current == (PageAddress{200, 2}));
  v.handle_key(KEY_DOWN);
  assert(v.navigation().current == (PageAddress{200, 2}));
  v.handle_key(KEY_UP);
  assert(v.navigation().current == (PageAddress{200, std::nullopt}));
}

static void test_digit_entry_and_errors() {
  HeadlessTerminal term(24, 80);
  FakeSource src(term);
  Viewer v(term, src, RenderMode::BlockFallback, CellGeometry{8, 16});
  tick(v);
  v.handle_key('9');
  v.handle_key('9');
  tick(v);
  assert(has(term.line(23), "Go to page: 99_"));
  v.handle_key('9');
  v.handle_key('\n');
  tick(v);
  assert(v.navigation().current.page == 100);
  assert(has(term.line(23), "Page must be between 100-899"));
  assert(src.requests.size() == 1);
}

static void test_newest_status_wins() {
  HeadlessTerminal term(24, 80);
  FakeSource src(term);
  Viewer v(term, src, RenderMode::BlockFallback, CellGeometry{8, 16});
  tick(v);
  for (int ch : {'9', '9', '9', '\n'}) v.handle_key(ch);
  tick(v);
  assert(has(term.line(23), "Page must be between 100-899"));
  v.handle_key('c');
  tick(v);
  assert(has(term.line(23), "Cache cleared!"));
  assert(!v.navigation().last_error);

  for (int ch : {'9', '9', '9', '\n'}) v.handle_key(ch);
  tick(v);
  assert(has(term.line(23), "Page must be between 100-899"));
  src.fail(PageAddress{100, std::nullopt}, FetchError{FetchError::Kind::Timeout, 0, "fetch failed: timed out after 10s"});
  v.handle_key('c');
  tick(v);
  assert(has(term.line(23), "fetch failed: timed out"));
  assert(!v.navigation().last_error);
}

static void test_resize_moves_picture() {
  HeadlessTerminal term(24, 80);
  FakeSource src(term);
  Viewer v(term, src, RenderMode::BlockFallback, CellGeometry{8, 16});
  tick(v);
  int frames = term.frames();
  assert(frames >= 2); // loading frame plus the picture frame
  term.take_raw_writes();

  term.resize(12, 40);
  v.handle_key(KEY_RESIZE);
  tick(v);
  assert(term.frames() == frames + 1);
  assert(src.requests.size() == 1);
  assert(term.raw_writes().size() == 10);
  for (const auto& w : term.raw_writes()) assert(w.row >= 1 && w.row <= 10);
  assert(has(term.line(0), "TELEVIDEO"));
  assert(has(term.line(11), "[Left/Right] Page"));
}

static void test_run_loop() {
  HeadlessTerminal term(24, 80);
  FakeSource src(term);
  Viewer v(term, src, RenderMode::CellGraphicsProtocol, CellGeometry{8, 16});
  for (int ch : {'1', '0', '2', '\n', 'q'}) term.push_key(ch);
  assert(v.run() == 0);
  assert(v.quit_requested());
  assert(v.navigation().current.page == 102);
  assert(src.requests.size() == 2);
  // kitty placements are removed on the way out
  assert(term.raw_writes().back().bytes == Renderer().teardown(RenderMode::CellGraphicsProtocol));

  std::atomic<bool> stop{true};
  HeadlessTerminal term2(24, 80);
  FakeSource src2(term2);
  Viewer v2(term2, src2, RenderMode::BlockFallback, CellGeometry{8, 16});
  assert(v2.run(&stop) == 0);
  assert(src2.requests.empty());
}

static void test_tiny_screen() {
  HeadlessTerminal term(2, 20);
  FakeSource src(term);
  Viewer v(term, src, RenderMode::BlockFallback, CellGeometry{8, 16});
  tick(v);
  assert(term.raw_writes().empty());
  assert(has(term.line(0), "TELEVIDEO"));
}

int main() {
  test_timeout_on_empty_cache();
  test_fetch_cache_and_redraw();
  test_failure_keeps_previous_picture();
  test_missing_subpage();
  test_digit_entry_and_errors();
  test_newest_status_wins();
  test_resize_moves_picture();
  test_run_loop();
  test_tiny_screen();
  assert(make_bar("ab", "cd", 6) == "ab  cd");
  assert(make_bar("abcdef", "x", 4) == "abcd");
  assert(translate_key(KEY_ENTER).key == Key::Enter);
  assert(translate_key(3).key == Key::Quit);
  assert(translate_key('x').key == Key::Other);
  return 0;
}
