#ifndef QRFOUNTAIN_CHUNK_SELECTOR_H
#define QRFOUNTAIN_CHUNK_SELECTOR_H

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "DegreeSampler.h"

namespace qrfountain {

/**
 * Picks the source chunks a droplet combines. Fully deterministic: the
 * PRNG is seeded with the droplet seed only. The first draw of a seed
 * belongs to the degree (see DropletScheme), the indices use the draws
 * after it.
 */
class ChunkSelector {
 public:
  // @return min(degree,K) distinct indices in [0,K[, sorted ascending.
  static std::vector<uint32_t> select(uint32_t seed, uint32_t degree,
                                      uint32_t num_chunks);
};

/**
 * Maps a droplet seed to its full dependency set for a transfer of K
 * chunks. Encoder and decoder of one transfer have to use equal schemes,
 * since the indices are never transmitted.
 */
class DropletScheme {
 public:
  // degree of the droplet with the given seed
  typedef std::function<uint32_t(uint32_t seed)> DEGREE_FOR_SEED;
  // Robust soliton degrees, drawn from the first PRNG output of each seed
  DropletScheme(uint32_t num_chunks, SolitonParams params);
  // Custom degree function, mostly for testing
  DropletScheme(uint32_t num_chunks, DEGREE_FOR_SEED degree_for_seed);
  std::vector<uint32_t> indices_for_seed(uint32_t seed) const;
  uint32_t degree_for_seed(uint32_t seed) const;
  [[nodiscard]] uint32_t num_chunks() const { return m_num_chunks; }

 private:
  const uint32_t m_num_chunks;
  std::shared_ptr<const DegreeSampler> m_sampler;
  DEGREE_FOR_SEED m_degree_for_seed;
};

// Creates a scheme for the given K - the decoder learns K only from the
// first droplet, therefore it gets a factory instead of a scheme.
typedef std::function<std::shared_ptr<const DropletScheme>(uint32_t num_chunks)>
    SCHEME_FACTORY;
SCHEME_FACTORY make_robust_soliton_scheme_factory(SolitonParams params = {});

}  // namespace qrfountain

#endif  // QRFOUNTAIN_CHUNK_SELECTOR_H
