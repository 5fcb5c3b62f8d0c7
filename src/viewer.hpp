#pragma once
/*
 * Viewer
 *
 * Purpose: frame driver; owns the page cache and navigation state, resolves the page the
 * user wants and composes header / picture / footer into one frame per loop iteration.
 * Loop: resolve (cache, then a blocking fetch on miss) -> draw -> poll one key.
 * Failure: a failed fetch keeps the last picture (or a placeholder) and shows the cause.
 */
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include "frame_layout.hpp"
#include "image.hpp"
#include "iterminal.hpp"
#include "navigation.hpp"
#include "page_cache.hpp"
#include "page_fetcher.hpp"
#include "renderer.hpp"
#include "types.hpp"

KeyEvent translate_key(int ch);

class Viewer {
public:
  Viewer(ITerminal& term, IPageSource& source, RenderMode mode, CellGeometry cell,
         PageAddress start = PageAddress{}, PageCache cache = PageCache());
  int run(const std::atomic<bool>* interrupted = nullptr);

  // the two phases of one tick; resolve() may block on the network
  void resolve();
  void draw();
  void handle_key(int ch);

  bool quit_requested() const { return should_quit; }
  const NavigationState& navigation() const { return nav.state(); }
  const std::optional<PageAddress>& picture_address() const { return shown; }

private:
  void draw_bars(const FrameRects& fr);
  void draw_placeholder(const Rect& viewport, const std::string& text);
  void emit_picture(const Rect& viewport);
  std::string footer_text() const;

  ITerminal& term;
  IPageSource& source;
  RenderMode mode;
  Renderer renderer;
  PageCache cache;
  NavigationController nav;
  std::shared_ptr<const PixelGrid> picture;
  std::optional<PageAddress> shown;
  std::optional<PageAddress> failed;
  std::string message;
  bool message_is_error = false;
  bool loading = false;
  bool should_quit = false;
  bool picture_dirty = true;
  std::string last_signature;
};

// left text, padding, right text; clipped to width
std::string make_bar(const std::string& left, const std::string& right, int width);
