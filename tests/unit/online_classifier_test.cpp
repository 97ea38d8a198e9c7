#include "internal/probe/online_classifier.hpp"

#include <cassert>
#include <iostream>
#include <random>

namespace {

using hsm::probe::Classify;
using hsm::probe::IsOnline;
using hsm::probe::kDefaultMinFileSizeBytes;
using hsm::probe::ProbeResult;

static_assert(Classify(1000, 0, 350) == false);
static_assert(Classify(350, 0, 350) == true);
static_assert(Classify(1000, 8, 350) == true);

void TestOfflineIffLargeWithoutBlocks() {
  const uint64_t sizes[]      = {0, 1, 349, 350, 351, 500, 4096, 1ULL << 40};
  const uint64_t blocks[]     = {0, 1, 8, 1024};
  const uint64_t thresholds[] = {0, 350, 500, 4096};

  for (auto threshold : thresholds) {
    for (auto size : sizes) {
      for (auto block_count : blocks) {
        const bool expected_offline = size > threshold && block_count == 0;
        assert(Classify(size, block_count, threshold) == !expected_offline);
      }
    }
  }
}

void TestRandomTriplesMatchRule() {
  std::mt19937_64                         rng(0x5eed);
  std::uniform_int_distribution<uint64_t> small(0, 4096);
  std::uniform_int_distribution<uint64_t> any;
  std::bernoulli_distribution             zero_blocks(0.5);
  std::bernoulli_distribution             at_threshold(0.1);

  for (int i = 0; i < 100000; ++i) {
    const uint64_t threshold   = (i % 2 == 0) ? small(rng) : any(rng);
    const uint64_t size        = at_threshold(rng) ? threshold : ((i % 3 == 0) ? any(rng) : small(rng));
    const uint64_t block_count = zero_blocks(rng) ? 0 : 1 + small(rng);

    const bool online = Classify(size, block_count, threshold);
    assert(online == !(size > threshold && block_count == 0));
    if (size <= threshold) assert(online);
    if (block_count > 0) assert(online);
  }
}

void TestReferenceScenarios() {
  // resident file
  assert(Classify(1048575, 100, 350));
  // migrated to tape
  assert(!Classify(10000, 0, 350));
  // small file stored inline
  assert(Classify(20, 0, 350));
}

void TestLargeFileWithZeroBlocksIsOffline() {
  assert(!IsOnline(ProbeResult{1000, 0}, 350));
}

void TestSmallFileWithZeroBlocksIsOnline() {
  assert(IsOnline(ProbeResult{100, 0}, 350));
}

void TestLargeFileWithBlocksIsOnline() {
  assert(IsOnline(ProbeResult{1000, 8}, 350));
}

void TestThresholdIsConfigurable() {
  assert(kDefaultMinFileSizeBytes == 350);
  assert(IsOnline(ProbeResult{400, 0}, 500));
  assert(!IsOnline(ProbeResult{400, 0}, 350));
}

} // namespace

int main() {
  TestOfflineIffLargeWithoutBlocks();
  TestRandomTriplesMatchRule();
  TestReferenceScenarios();
  TestLargeFileWithZeroBlocksIsOffline();
  TestSmallFileWithZeroBlocksIsOnline();
  TestLargeFileWithBlocksIsOnline();
  TestThresholdIsConfigurable();

  std::cout << "hsm_status_unit_online_classifier: pass\n";
  return 0;
}
