#ifndef QRFOUNTAIN_FOUNTAIN_ENCODER_H
#define QRFOUNTAIN_FOUNTAIN_ENCODER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "../HelperSources/TimeHelper.hpp"
#include "ChunkSelector.h"
#include "Droplet.h"
#include "SeededRandom.hpp"

namespace qrfountain {

/**
 * Splits a buffer into K equally sized chunks (the last one zero padded) and
 * produces an endless stream of droplets from them. Each droplet combines
 * a pseudo random subset of chunks, given by (seed,K), via XOR.
 * The source buffer is copied on construction and never modified.
 */
class FountainEncoder {
 public:
  typedef std::function<uint32_t()> SEED_SOURCE;
  struct Options {
    uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    SolitonParams soliton_params{};
    // start value of the default seed source
    uint32_t start_seed = DEFAULT_START_SEED;
    // Goes into the top bits of every seed of the default seed source. Files
    // sent in the same session need different tags.
    uint8_t transfer_tag = 0;
    // Overrides the default (PRNG) seed source. Must never return
    // MANIFEST_SEED
    SEED_SOURCE opt_seed_source = nullptr;
    // Overrides the robust soliton scheme, needs to match the decoder
    std::shared_ptr<const DropletScheme> opt_scheme = nullptr;
  };
  // throws std::invalid_argument if data is empty, chunk_size is 0 or the
  // buffer would need more than MAX_NUM_CHUNKS chunks / MAX_TRANSFER_SIZE
  // bytes
  FountainEncoder(std::vector<uint8_t> data, Options options);
  FountainEncoder(const FountainEncoder& other) = delete;
  FountainEncoder& operator=(const FountainEncoder&) = delete;

  // Draws the next seed and builds its droplet
  Droplet next_droplet();
  // Builds the droplet for a given seed, does not advance the seed source
  Droplet droplet_for_seed(uint32_t seed) const;
  // Restarts the default seed source, the droplet stream repeats.
  // Has no effect on a custom seed source.
  void reset();

  [[nodiscard]] uint32_t num_chunks() const { return m_num_chunks; }
  [[nodiscard]] uint32_t padding() const { return m_padding; }
  [[nodiscard]] uint32_t chunk_size() const { return m_chunk_size; }
  const uint8_t* chunk_data(uint32_t index) const;
  const DropletScheme& scheme() const { return *m_scheme; }

  struct Statistics {
    uint64_t n_droplets = 0;
    MinMaxAvg<std::size_t> curr_degree{};
  };
  Statistics get_latest_stats() const;

 private:
  const Options m_options;
  const uint32_t m_chunk_size;
  uint32_t m_num_chunks = 0;
  uint32_t m_padding = 0;
  // padded source, m_num_chunks * m_chunk_size bytes
  std::vector<uint8_t> m_source;
  std::shared_ptr<const DropletScheme> m_scheme;
  SeededRandom m_seed_rng;
  uint64_t m_n_droplets = 0;
  AvgCalculatorSize m_degree_calculator{};
  MinMaxAvg<std::size_t> m_curr_degree{};
  uint32_t draw_seed();
};

}  // namespace qrfountain

#endif  // QRFOUNTAIN_FOUNTAIN_ENCODER_H
