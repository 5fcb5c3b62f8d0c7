#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight value types (PageAddress/RenderMode/CellGeometry).
 * Principle: carry simple state; no fetching or drawing here.
 */
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

constexpr int kFirstPage = 100;
constexpr int kLastPage = 899;

inline bool is_valid_page(int page) { return page >= kFirstPage && page <= kLastPage; }

struct PageAddress {
  int page = kFirstPage;
  std::optional<int> sub_page; // absent means the first part

  bool operator==(const PageAddress& o) const { return page == o.page && sub_page == o.sub_page; }
  bool operator!=(const PageAddress& o) const { return !(*this == o); }
};

struct PageAddressHash {
  std::size_t operator()(const PageAddress& a) const {
    return std::hash<int>()(a.page) ^ (std::hash<int>()(a.sub_page.value_or(0)) << 1);
  }
};

// "100" or "100.2"
inline std::string format_address(const PageAddress& a) {
  std::string s = std::to_string(a.page);
  if (a.sub_page) s += "." + std::to_string(*a.sub_page);
  return s;
}

enum class RenderMode { InlineProtocol, CellGraphicsProtocol, PixelApproximation, BlockFallback };

// pixel size of one terminal cell
struct CellGeometry { int width_px = 8; int height_px = 16; };
