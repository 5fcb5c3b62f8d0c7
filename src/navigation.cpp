#include "navigation.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

NavigationController::NavigationController(PageAddress start) {
  if (!is_valid_page(start.page)) start = PageAddress{};
  state_.current = start;
}

NavAction NavigationController::handle(const KeyEvent& ev) {
  switch (ev.key) {
    case Key::Digit:
      if (ev.digit >= '0' && ev.digit <= '9' && state_.pending_digits.size() < kMaxPendingDigits) {
        state_.pending_digits.push_back(ev.digit);
      }
      return NavAction::None;
    case Key::Backspace:
      if (!state_.pending_digits.empty()) state_.pending_digits.pop_back();
      return NavAction::None;
    case Key::Escape:
      state_.pending_digits.clear();
      return NavAction::None;
    case Key::Enter: return submit();
    case Key::Left: return step_page(-1);
    case Key::Right: return step_page(+1);
    case Key::Up: return step_subpage(-1);
    case Key::Down: return step_subpage(+1);
    case Key::ClearCache: return NavAction::ClearCache;
    case Key::Quit: return NavAction::Quit;
    case Key::Other: break;
  }
  return NavAction::None;
}

NavAction NavigationController::submit() {
  if (state_.pending_digits.empty()) return NavAction::None;
  int value = std::stoi(state_.pending_digits);
  state_.pending_digits.clear();
  if (!is_valid_page(value)) {
    state_.last_error = "Page must be between " + std::to_string(kFirstPage) + "-" + std::to_string(kLastPage);
    spdlog::info("navigation: rejected page {}", value);
    return NavAction::None;
  }
  state_.last_error.reset();
  if (value != state_.current.page) subpage_count_.reset();
  // re-entering the current page counts as navigation so a failed fetch is retried
  state_.current = PageAddress{value, std::nullopt};
  return NavAction::Navigated;
}

NavAction NavigationController::step_page(int delta) {
  int page = std::clamp(state_.current.page + delta, kFirstPage, kLastPage);
  if (page == state_.current.page && !state_.current.sub_page) return NavAction::None;
  if (page != state_.current.page) subpage_count_.reset();
  state_.current = PageAddress{page, std::nullopt};
  state_.last_error.reset();
  return NavAction::Navigated;
}

NavAction NavigationController::step_subpage(int delta) {
  int part = state_.current.sub_page.value_or(1);
  int next = part + delta;
  if (next < 1) return NavAction::None;
  if (delta > 0 && subpage_count_ && next > *subpage_count_) return NavAction::None;
  state_.current.sub_page = next > 1 ? std::optional<int>(next) : std::nullopt;
  state_.last_error.reset();
  return NavAction::Navigated;
}

void NavigationController::note_missing_subpage(const PageAddress& address) {
  if (!address.sub_page || address.page != state_.current.page) return;
  int known = *address.sub_page - 1;
  if (!subpage_count_ || *subpage_count_ > known) subpage_count_ = known;
}
