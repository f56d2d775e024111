#ifndef QRFOUNTAIN_SEEDED_RANDOM_HPP
#define QRFOUNTAIN_SEEDED_RANDOM_HPP

#include <cstdint>
#include <random>

namespace qrfountain {

// Deterministic random source. Seeded with a single value, it produces the
// same sequence on every platform and in every process - std::mt19937 is
// fully specified by the standard, and we do the range reduction ourselves
// instead of relying on the (implementation defined) std distributions.
class SeededRandom {
 public:
  explicit SeededRandom(uint32_t seed) : m_engine(scramble(seed)) {}
  void reseed(uint32_t seed) { m_engine.seed(scramble(seed)); }
  uint32_t next_u32() { return static_cast<uint32_t>(m_engine()); }
  // uniform in [0,n[, n must be > 0
  uint32_t next_below(uint32_t n) {
    return static_cast<uint32_t>((static_cast<uint64_t>(next_u32()) * n) >>
                                 32);
  }
  // uniform in [0,1[
  double next_unit() {
    return static_cast<double>(next_u32()) / 4294967296.0;
  }

 private:
  // mt19937 seeded with small consecutive values gives strongly correlated
  // first outputs, and we only ever use the first few. murmur3 finalizer.
  static constexpr uint32_t scramble(uint32_t h) {
    h ^= h >> 16;
    h *= 0x85ebca6bU;
    h ^= h >> 13;
    h *= 0xc2b2ae35U;
    h ^= h >> 16;
    return h;
  }
  std::mt19937 m_engine;
};

}  // namespace qrfountain

#endif  // QRFOUNTAIN_SEEDED_RANDOM_HPP
