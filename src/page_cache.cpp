#include "page_cache.hpp"
#include <spdlog/spdlog.h>

PageCache::PageCache(Clock::duration ttl, NowFn now) : ttl_(ttl), now_(std::move(now)) {}

std::shared_ptr<const PixelGrid> PageCache::get(const PageAddress& address) {
  auto it = entries_.find(address);
  if (it == entries_.end()) {
    spdlog::debug("cache miss {}", format_address(address));
    return nullptr;
  }
  if (now_() - it->second.fetched_at >= ttl_) {
    spdlog::debug("cache expired {}", format_address(address));
    entries_.erase(it);
    return nullptr;
  }
  spdlog::debug("cache hit {}", format_address(address));
  return it->second.image;
}

std::shared_ptr<const PixelGrid> PageCache::put(const PageAddress& address, PixelGrid image) {
  auto img = std::make_shared<const PixelGrid>(std::move(image));
  entries_[address] = Entry{address, img, now_()};
  return img;
}

void PageCache::clear() {
  spdlog::info("cache cleared ({} entries)", entries_.size());
  entries_.clear();
}
