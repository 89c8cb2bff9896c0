#include "trid/core/seed_source.h"

#include <algorithm>

namespace trid::core {

namespace {

constexpr std::uint64_t kSeqSpan = static_cast<std::uint64_t>(kSeqMax) - kSeqMin + 1;

}  // namespace

RandomSeedSource::RandomSeedSource() : engine_(std::random_device{}()) {}

RandomSeedSource::RandomSeedSource(std::uint32_t prng_seed) : engine_(prng_seed) {}

std::uint32_t RandomSeedSource::next_seed() {
  std::lock_guard<std::mutex> lock(mutex_);
  return distribution_(engine_);
}

DeterministicSeedSource::DeterministicSeedSource(std::uint32_t start)
    : start_offset_(std::clamp(start, kSeqMin, kSeqMax) - kSeqMin) {}

std::uint32_t DeterministicSeedSource::next_seed() {
  // Deterministic: counter only for reproducible output
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return kSeqMin + static_cast<std::uint32_t>((start_offset_ + c) % kSeqSpan);
}

Result<TurkishId, IdError> generate(ISeedSource& source) {
  return TurkishId::from_seq(source.next_seed());
}

}  // namespace trid::core
