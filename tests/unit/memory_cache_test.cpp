#include "internal/cache/memory_cache.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using hsm::cache::MemoryCache;
using namespace std::chrono_literals;

void TestAddOnlyStoresMissingKeys() {
  MemoryCache cache;
  assert(cache.Add("lock-1", "owner-a", 30s));
  assert(!cache.Add("lock-1", "owner-b", 30s));
  assert(cache.Get("lock-1") == "owner-a");

  cache.Delete("lock-1");
  assert(!cache.Get("lock-1").has_value());
  assert(cache.Add("lock-1", "owner-b", 30s));
  assert(cache.Get("lock-1") == "owner-b");
}

void TestExpiredEntriesAreReplaceable() {
  MemoryCache cache;
  assert(cache.Add("lock-2", "owner-a", 1s));
  std::this_thread::sleep_for(1100ms);

  assert(!cache.Get("lock-2").has_value());
  assert(cache.Size() == 0);
  assert(cache.Add("lock-2", "owner-b", 30s));
}

void TestConcurrentAddHasOneWinner() {
  MemoryCache              cache;
  std::atomic<int>         winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&, i] {
      if (cache.Add("lock-3", "owner-" + std::to_string(i), 30s)) ++winners;
    });
  }
  for (auto& t : threads) t.join();

  assert(winners == 1);
}

} // namespace

int main() {
  TestAddOnlyStoresMissingKeys();
  TestExpiredEntriesAreReplaceable();
  TestConcurrentAddHasOneWinner();

  std::cout << "hsm_status_unit_memory_cache: pass\n";
  return 0;
}
