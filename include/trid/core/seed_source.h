#pragma once

#include "trid/core/id_error.h"
#include "trid/core/result.h"
#include "trid/core/turkish_id.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>

namespace trid::core {

// Abstract seed source interface for dependency injection.
// Allows the generator to draw random seeds in production while tests use deterministic seeds.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class ISeedSource {
 public:
  virtual ~ISeedSource() = default;

  // Produce the next seed.
  // Contract: returned seed lies in [kSeqMin, kSeqMax].
  virtual std::uint32_t next_seed() = 0;

 protected:
  ISeedSource() = default;
  ISeedSource(const ISeedSource&) = default;
  ISeedSource& operator=(const ISeedSource&) = default;
  ISeedSource(ISeedSource&&) = default;
  ISeedSource& operator=(ISeedSource&&) = default;
};

// Production seed source: uniform distribution over the seed range.
// Thread-safe. Seeded from std::random_device unless an explicit seed is given,
// in which case the produced sequence is reproducible.
class RandomSeedSource final : public ISeedSource {
 public:
  RandomSeedSource();
  explicit RandomSeedSource(std::uint32_t prng_seed);
  ~RandomSeedSource() override = default;

  // Not copyable or movable (contains mutex)
  RandomSeedSource(const RandomSeedSource&) = delete;
  RandomSeedSource& operator=(const RandomSeedSource&) = delete;
  RandomSeedSource(RandomSeedSource&&) = delete;
  RandomSeedSource& operator=(RandomSeedSource&&) = delete;

  std::uint32_t next_seed() override;

 private:
  std::mutex mutex_;
  std::mt19937 engine_;
  std::uniform_int_distribution<std::uint32_t> distribution_{kSeqMin, kSeqMax};
};

// Deterministic seed source: consecutive seeds starting at start, wrapping from
// kSeqMax back to kSeqMin. For tests and demos where reproducible output is required.
// Thread-safe.
class DeterministicSeedSource final : public ISeedSource {
 public:
  // start is clamped into [kSeqMin, kSeqMax].
  explicit DeterministicSeedSource(std::uint32_t start = kSeqMin);
  ~DeterministicSeedSource() override = default;

  // Not copyable or movable (contains atomic counter)
  DeterministicSeedSource(const DeterministicSeedSource&) = delete;
  DeterministicSeedSource& operator=(const DeterministicSeedSource&) = delete;
  DeterministicSeedSource(DeterministicSeedSource&&) = delete;
  DeterministicSeedSource& operator=(DeterministicSeedSource&&) = delete;

  std::uint32_t next_seed() override;

 private:
  std::uint32_t start_offset_;
  std::atomic<std::uint64_t> counter_{0};
};

// generate draws one seed and builds an identifier from it.
// Fails with kSequenceOutOfRange only if source breaks its range contract.
[[nodiscard]] Result<TurkishId, IdError> generate(ISeedSource& source);

}  // namespace trid::core
