#include "ChunkSelector.h"

#include <algorithm>
#include <cassert>
#include <unordered_set>
#include <utility>

#include "SeededRandom.hpp"

namespace qrfountain {

std::vector<uint32_t> ChunkSelector::select(const uint32_t seed,
                                            uint32_t degree,
                                            const uint32_t num_chunks) {
  degree = std::min(degree, num_chunks);
  std::vector<uint32_t> ret;
  if (degree == 0) {
    return ret;
  }
  ret.reserve(degree);
  SeededRandom rng{seed};
  // first draw is the degree
  rng.next_u32();
  if (degree == num_chunks) {
    for (uint32_t i = 0; i < num_chunks; i++) ret.push_back(i);
    return ret;
  }
  std::unordered_set<uint32_t> taken;
  while (ret.size() < degree) {
    const uint32_t idx = rng.next_below(num_chunks);
    if (taken.insert(idx).second) {
      ret.push_back(idx);
    }
  }
  std::sort(ret.begin(), ret.end());
  return ret;
}

DropletScheme::DropletScheme(const uint32_t num_chunks, SolitonParams params)
    : m_num_chunks(num_chunks),
      m_sampler(std::make_shared<const DegreeSampler>(num_chunks, params)) {
  auto sampler = m_sampler;
  m_degree_for_seed = [sampler](uint32_t seed) {
    SeededRandom rng{seed};
    return sampler->sample(rng);
  };
}

DropletScheme::DropletScheme(const uint32_t num_chunks,
                             DEGREE_FOR_SEED degree_for_seed)
    : m_num_chunks(num_chunks),
      m_degree_for_seed(std::move(degree_for_seed)) {
  assert(m_degree_for_seed);
}

uint32_t DropletScheme::degree_for_seed(const uint32_t seed) const {
  if (m_num_chunks <= 1) return m_num_chunks;
  return m_degree_for_seed(seed);
}

std::vector<uint32_t> DropletScheme::indices_for_seed(
    const uint32_t seed) const {
  return ChunkSelector::select(seed, degree_for_seed(seed), m_num_chunks);
}

SCHEME_FACTORY make_robust_soliton_scheme_factory(SolitonParams params) {
  return [params](uint32_t num_chunks) {
    return std::make_shared<const DropletScheme>(num_chunks, params);
  };
}

}  // namespace qrfountain
