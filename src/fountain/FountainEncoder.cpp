#include "FountainEncoder.h"

#include <cassert>
#include <cstring>
#include <stdexcept>
#include <utility>

#include "../qrfountain_spdlog.h"

namespace qrfountain {

static void xor_into(uint8_t* dst, const uint8_t* src, std::size_t len) {
  for (std::size_t i = 0; i < len; i++) {
    dst[i] ^= src[i];
  }
}

FountainEncoder::FountainEncoder(std::vector<uint8_t> data, Options options)
    : m_options(std::move(options)),
      m_chunk_size(m_options.chunk_size),
      m_source(std::move(data)),
      m_seed_rng(m_options.start_seed) {
  if (m_chunk_size == 0) {
    throw std::invalid_argument("FountainEncoder: chunk_size must be > 0");
  }
  if (m_source.empty()) {
    throw std::invalid_argument("FountainEncoder: nothing to encode");
  }
  const uint64_t n_chunks =
      (m_source.size() + m_chunk_size - 1) / m_chunk_size;
  if (n_chunks > MAX_NUM_CHUNKS) {
    throw std::invalid_argument(
        "FountainEncoder: too many chunks, increase chunk_size");
  }
  if (n_chunks * m_chunk_size > MAX_TRANSFER_SIZE) {
    throw std::invalid_argument("FountainEncoder: transfer too big");
  }
  m_num_chunks = static_cast<uint32_t>(n_chunks);
  m_padding = static_cast<uint32_t>(n_chunks * m_chunk_size - m_source.size());
  m_source.resize(static_cast<std::size_t>(n_chunks) * m_chunk_size, 0);
  if (m_options.opt_scheme) {
    if (m_options.opt_scheme->num_chunks() != m_num_chunks) {
      throw std::invalid_argument("FountainEncoder: scheme does not match K");
    }
    m_scheme = m_options.opt_scheme;
  } else {
    m_scheme =
        std::make_shared<const DropletScheme>(m_num_chunks, m_options.soliton_params);
  }
  log::get_default()->debug("FountainEncoder K:{} P:{} chunk_size:{} tag:{}",
                            m_num_chunks, m_padding, m_chunk_size,
                            m_options.transfer_tag);
}

uint32_t FountainEncoder::draw_seed() {
  if (m_options.opt_seed_source) {
    const auto seed = m_options.opt_seed_source();
    assert(seed != MANIFEST_SEED);
    return seed;
  }
  const uint32_t tag = static_cast<uint32_t>(m_options.transfer_tag)
                       << SEED_TAG_SHIFT;
  while (true) {
    const uint32_t seed = tag | (m_seed_rng.next_u32() & SEED_VALUE_MASK);
    if (seed != MANIFEST_SEED) return seed;
  }
}

Droplet FountainEncoder::next_droplet() {
  auto droplet = droplet_for_seed(draw_seed());
  m_n_droplets++;
  m_degree_calculator.add(m_scheme->degree_for_seed(droplet.seed));
  if (m_degree_calculator.get_delta_since_last_reset() >=
      std::chrono::seconds(1)) {
    m_curr_degree = m_degree_calculator.getMinMaxAvg();
    log::get_default()->debug("Droplet degree {}",
                              m_degree_calculator.getAvgReadable());
    m_degree_calculator.reset();
  }
  return droplet;
}

Droplet FountainEncoder::droplet_for_seed(const uint32_t seed) const {
  Droplet ret;
  ret.seed = seed;
  ret.num_chunks = m_num_chunks;
  ret.padding = m_padding;
  ret.payload.assign(m_chunk_size, 0);
  const auto indices = m_scheme->indices_for_seed(seed);
  for (const auto idx : indices) {
    xor_into(ret.payload.data(), chunk_data(idx), m_chunk_size);
  }
  return ret;
}

void FountainEncoder::reset() {
  m_seed_rng.reseed(m_options.start_seed);
  m_n_droplets = 0;
  m_degree_calculator.reset();
}

const uint8_t* FountainEncoder::chunk_data(const uint32_t index) const {
  assert(index < m_num_chunks);
  return m_source.data() + static_cast<std::size_t>(index) * m_chunk_size;
}

FountainEncoder::Statistics FountainEncoder::get_latest_stats() const {
  Statistics ret;
  ret.n_droplets = m_n_droplets;
  ret.curr_degree = m_curr_degree;
  return ret;
}

}  // namespace qrfountain
