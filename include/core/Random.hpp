/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RANDOM_HPP
#define RANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace Realmforge {

/**
 * @brief Seeded random source shared by every generation call
 *
 * Wraps std::mt19937, whose output sequence is fixed by the standard. The
 * mapping from raw output to ranges is done here instead of through
 * std::uniform_*_distribution (implementation-defined), so the same seed
 * yields the same content on every platform and standard library.
 */
class Random {
public:
  explicit Random(uint64_t seed = 0);

  void reseed(uint64_t seed);
  uint64_t getSeed() const { return m_seed; }

  // Uniform integer in [min, max]; returns min when max < min
  int uniformInt(int min, int max);

  // Uniform real in [min, max)
  double uniformReal(double min, double max);

  // Uniform real in [0, 1)
  double unit();

  // True with the given probability (clamped to [0, 1])
  bool chance(double probability);

  /**
   * @brief Picks an index with probability weight/sum(weights)
   *
   * Negative weights count as zero; when every weight is zero the pick is
   * uniform. Throws std::invalid_argument on an empty list.
   */
  size_t weightedIndex(const std::vector<double> &weights);

  // Uniform index into a container of the given size (size must be > 0)
  size_t index(size_t size);

  template <typename T> const T &choice(const std::vector<T> &items) {
    return items[index(items.size())];
  }

  /**
   * @brief Picks k distinct elements, in draw order
   *
   * k is clamped to the population size.
   */
  template <typename T>
  std::vector<T> sample(const std::vector<T> &items, size_t k) {
    std::vector<size_t> picked = sampleIndices(items.size(), k);
    std::vector<T> result;
    result.reserve(picked.size());
    for (size_t i : picked) {
      result.push_back(items[i]);
    }
    return result;
  }

  std::vector<size_t> sampleIndices(size_t population, size_t k);

private:
  uint32_t next() { return static_cast<uint32_t>(m_engine()); }

  uint64_t m_seed;
  std::mt19937 m_engine;
};

} // namespace Realmforge

#endif // RANDOM_HPP
