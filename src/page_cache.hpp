#pragma once
/*
 * PageCache
 *
 * Purpose: decoded page images keyed by PageAddress, valid for a fixed TTL.
 * Expiry: lazy; an entry past its TTL is dropped by the read that finds it.
 * Entries are immutable; put() replaces, never updates in place.
 */
#include <chrono>
#include <functional>
#include <memory>
#include <unordered_map>
#include "config.hpp"
#include "image.hpp"
#include "types.hpp"

class PageCache {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit PageCache(Clock::duration ttl = std::chrono::seconds(TV_CACHE_TTL_SECONDS),
                     NowFn now = &Clock::now);

  // nullptr on miss or expiry
  std::shared_ptr<const PixelGrid> get(const PageAddress& address);
  std::shared_ptr<const PixelGrid> put(const PageAddress& address, PixelGrid image);
  void clear();
  size_t size() const { return entries_.size(); }

private:
  struct Entry {
    PageAddress address;
    std::shared_ptr<const PixelGrid> image;
    Clock::time_point fetched_at;
  };
  Clock::duration ttl_;
  NowFn now_;
  std::unordered_map<PageAddress, Entry, PageAddressHash> entries_;
};
