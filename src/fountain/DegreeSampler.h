#ifndef QRFOUNTAIN_DEGREE_SAMPLER_H
#define QRFOUNTAIN_DEGREE_SAMPLER_H

#include <cstdint>
#include <vector>

#include "FountainConstants.hpp"
#include "SeededRandom.hpp"

namespace qrfountain {

struct SolitonParams {
  // redundancy constant, > 0
  double c = DEFAULT_SOLITON_C;
  // decode failure bound, in ]0,1[
  double delta = DEFAULT_SOLITON_DELTA;
};

/**
 * Robust soliton degree distribution for K source chunks.
 * The distribution is computed once on construction, sample() then draws a
 * degree in [1,max_degree()] from the normalized CDF.
 * Throws std::invalid_argument on K==0 or invalid parameters.
 */
class DegreeSampler {
 public:
  explicit DegreeSampler(uint32_t num_chunks, SolitonParams params = {});
  // Smallest d with cdf[d-1] >= u, where u is drawn from @param rng
  uint32_t sample(SeededRandom& rng) const;
  // Same, but for an already drawn u in [0,1[
  uint32_t degree_for_unit(double u) const;
  [[nodiscard]] uint32_t max_degree() const {
    return static_cast<uint32_t>(m_cdf.size());
  }
  [[nodiscard]] const std::vector<double>& cdf() const { return m_cdf; }
  // probability of degree d (1-based), 0 for d > max_degree()
  double probability(uint32_t d) const;
  [[nodiscard]] uint32_t num_chunks() const { return m_num_chunks; }

 private:
  const uint32_t m_num_chunks;
  // m_cdf[d-1] == P(degree <= d), last element is exactly 1
  std::vector<double> m_cdf;
};

}  // namespace qrfountain

#endif  // QRFOUNTAIN_DEGREE_SAMPLER_H
