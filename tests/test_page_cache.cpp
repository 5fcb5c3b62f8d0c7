#include "page_cache.hpp"
#include <cassert>
#include <chrono>

static PixelGrid solid(int w, int h, Rgb c) {
  PixelGrid g(w, h);
  for (int y = 0; y < h; ++y) for (int x = 0; x < w; ++x) g.set(x, y, c);
  return g;
}

int main() {
  using namespace std::chrono;
  PageCache::Clock::time_point now{};
  PageCache cache(minutes(5), [&] { return now; });

  PageAddress a{100, std::nullopt};
  PageAddress a2{100, 2};
  assert(!cache.get(a));

  cache.put(a, solid(4, 2, Rgb{255, 0, 0}));
  auto hit = cache.get(a);
  assert(hit);
  assert(hit->width == 4 && hit->height == 2);
  assert(hit->at(3, 1).r == 255);
  assert(!cache.get(a2)); // sub-pages are separate entries

  // still valid one second before the TTL, gone at the TTL
  now += minutes(4) + seconds(59);
  assert(cache.get(a));
  now += seconds(1);
  assert(!cache.get(a));
  assert(cache.size() == 0);

  // put replaces and restamps
  cache.put(a, solid(1, 1, Rgb{0, 0, 0}));
  now += minutes(3);
  cache.put(a, solid(1, 1, Rgb{0, 255, 0}));
  assert(cache.size() == 1);
  now += minutes(3);
  auto fresh = cache.get(a);
  assert(fresh && fresh->at(0, 0).g == 255);

  // images handed out survive replacement
  auto before = cache.get(a);
  cache.put(a, solid(1, 1, Rgb{0, 0, 9}));
  assert(before->at(0, 0).g == 255);

  // clear drops everything
  cache.put(a2, solid(1, 1, Rgb{1, 1, 1}));
  cache.put(PageAddress{899, std::nullopt}, solid(1, 1, Rgb{2, 2, 2}));
  cache.clear();
  assert(cache.size() == 0);
  assert(!cache.get(a));
  assert(!cache.get(a2));
  assert(!cache.get(PageAddress{899, std::nullopt}));
  return 0;
}
