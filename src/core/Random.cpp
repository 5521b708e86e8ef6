/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Random.hpp"

#include <numeric>
#include <stdexcept>

namespace Realmforge {

Random::Random(uint64_t seed) : m_seed(seed) { reseed(seed); }

void Random::reseed(uint64_t seed) {
  m_seed = seed;
  // Fold both halves in so seeds differing only above bit 31 diverge
  std::seed_seq seq{static_cast<uint32_t>(seed & 0xffffffffu),
                    static_cast<uint32_t>(seed >> 32)};
  m_engine.seed(seq);
}

int Random::uniformInt(int min, int max) {
  if (max <= min) {
    return min;
  }
  const uint64_t span =
      static_cast<uint64_t>(static_cast<int64_t>(max) - min) + 1;
  if (span > 0xffffffffull) {
    return static_cast<int>(static_cast<int64_t>(min) + next());
  }
  // Rejection sampling removes modulo bias
  const uint64_t range = 0x100000000ull;
  const uint64_t limit = range - (range % span);
  uint64_t value;
  do {
    value = next();
  } while (value >= limit);
  return static_cast<int>(static_cast<int64_t>(min) +
                          static_cast<int64_t>(value % span));
}

double Random::unit() {
  // 53 random bits mapped onto [0, 1)
  const uint64_t hi = next() >> 5;
  const uint64_t lo = next() >> 6;
  return static_cast<double>((hi << 26) | lo) * (1.0 / 9007199254740992.0);
}

double Random::uniformReal(double min, double max) {
  if (max <= min) {
    return min;
  }
  return min + (max - min) * unit();
}

bool Random::chance(double probability) {
  if (probability <= 0.0) {
    return false;
  }
  if (probability >= 1.0) {
    return true;
  }
  return unit() < probability;
}

size_t Random::index(size_t size) {
  if (size == 0) {
    throw std::invalid_argument("Random::index - empty range");
  }
  return static_cast<size_t>(uniformInt(0, static_cast<int>(size) - 1));
}

size_t Random::weightedIndex(const std::vector<double> &weights) {
  if (weights.empty()) {
    throw std::invalid_argument("Random::weightedIndex - no alternatives");
  }

  double total = 0.0;
  for (double w : weights) {
    if (w > 0.0) {
      total += w;
    }
  }
  if (total <= 0.0) {
    return index(weights.size());
  }

  const double roll = unit() * total;
  double cumulative = 0.0;
  size_t lastPositive = 0;
  for (size_t i = 0; i < weights.size(); ++i) {
    if (weights[i] <= 0.0) {
      continue;
    }
    cumulative += weights[i];
    lastPositive = i;
    if (roll < cumulative) {
      return i;
    }
  }
  // Floating point rounding can leave roll == total
  return lastPositive;
}

std::vector<size_t> Random::sampleIndices(size_t population, size_t k) {
  if (k > population) {
    k = population;
  }
  std::vector<size_t> pool(population);
  std::iota(pool.begin(), pool.end(), size_t{0});

  // Partial Fisher-Yates: the first k slots become the sample
  for (size_t i = 0; i < k; ++i) {
    size_t j = i + static_cast<size_t>(
                       uniformInt(0, static_cast<int>(population - i) - 1));
    std::swap(pool[i], pool[j]);
  }
  pool.resize(k);
  return pool;
}

} // namespace Realmforge
