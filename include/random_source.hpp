#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace loadplus {

/**
 * Source of the randomness used for simulated latency, failure draws,
 * inter-request jitter and snapshot sampling. Tests substitute scripted
 * implementations to get deterministic runs.
 */
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform value in [min, max]; returns min when max <= min
  virtual double uniform(double min, double max) = 0;

  // True with the given probability; p <= 0 never, p >= 1 always
  virtual bool chance(double probability) = 0;
};

// Mersenne Twister, safe to share between concurrently running engines
class MersenneRandomSource : public RandomSource {
public:
  MersenneRandomSource();
  explicit MersenneRandomSource(std::uint32_t seed);

  double uniform(double min, double max) override;
  bool chance(double probability) override;

private:
  std::mutex mutex_;
  std::mt19937 generator_;
};

} // namespace loadplus
