#pragma once
/** @file  NoiseProducer.hpp
 *  @brief Seeded normal-distribution source for the dummy devices.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <random>

namespace labcomm::core {

  struct NoiseParameters {
    double mean{ 0.0 };
    double standardDeviation{ 1.0 };
    std::uint32_t seed{ 42 };
  };

  class NoiseProducer {
  public:
    explicit NoiseProducer(const NoiseParameters& params = {})
        : rng_(params.seed), dist_(params.mean, params.standardDeviation) {}

    double operator()() { return dist_(rng_); }

  private:
    std::mt19937 rng_;
    std::normal_distribution<double> dist_;
  };

} // namespace labcomm::core
