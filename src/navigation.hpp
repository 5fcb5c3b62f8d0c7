#pragma once
/*
 * Navigation
 *
 * Purpose: page/sub-page state machine driven by key events (digit entry, arrows, cancel).
 * Constraint: never fetches; handle() reports an action and the frame driver reacts on the
 * next redraw.
 */
#include <optional>
#include <string>
#include "types.hpp"

enum class Key { Digit, Backspace, Escape, Enter, Left, Right, Up, Down, ClearCache, Quit, Other };

struct KeyEvent {
  Key key = Key::Other;
  char digit = 0; // '0'..'9' when key == Key::Digit
};

enum class NavAction { None, Navigated, ClearCache, Quit };

constexpr size_t kMaxPendingDigits = 3;

struct NavigationState {
  PageAddress current;
  std::string pending_digits;
  std::optional<std::string> last_error;
};

class NavigationController {
public:
  explicit NavigationController(PageAddress start = PageAddress{});
  NavAction handle(const KeyEvent& ev);
  const NavigationState& state() const { return state_; }
  const PageAddress& current() const { return state_.current; }
  std::optional<int> subpage_count() const { return subpage_count_; }
  void set_subpage_count(std::optional<int> count) { subpage_count_ = count; }
  // a newer status (fetch failure, cache clear) replaces a stale entry error
  void clear_error() { state_.last_error.reset(); }
  // a sub-page that does not exist bounds the count for the current page
  void note_missing_subpage(const PageAddress& address);

private:
  NavAction submit();
  NavAction step_page(int delta);
  NavAction step_subpage(int delta);
  NavigationState state_;
  std::optional<int> subpage_count_;
};
