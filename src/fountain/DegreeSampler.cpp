#include "DegreeSampler.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace qrfountain {

DegreeSampler::DegreeSampler(const uint32_t num_chunks, SolitonParams params)
    : m_num_chunks(num_chunks) {
  if (num_chunks == 0) {
    throw std::invalid_argument("DegreeSampler: num_chunks must be > 0");
  }
  if (!(params.c > 0) || !(params.delta > 0) || !(params.delta < 1)) {
    throw std::invalid_argument("DegreeSampler: invalid soliton parameters");
  }
  const double K = num_chunks;
  // ideal soliton
  std::vector<double> mu(num_chunks, 0.0);
  mu[0] = 1.0 / K;
  for (uint32_t d = 2; d <= num_chunks; d++) {
    mu[d - 1] = 1.0 / (static_cast<double>(d) * (d - 1));
  }
  // robust part, spike at K/R
  const double R = params.c * std::log(K / params.delta) * std::sqrt(K);
  const auto spike = static_cast<uint32_t>(std::min<double>(
      std::max<double>(std::round(K / R), 2.0), num_chunks));
  for (uint32_t d = 1; d < spike; d++) {
    mu[d - 1] += R / (d * K);
  }
  mu[spike - 1] += std::max(0.0, R * std::log(R / params.delta) / K);
  double sum = std::accumulate(mu.begin(), mu.end(), 0.0);
  for (auto& p : mu) p /= sum;
  // cut the long tail of (practically) never drawn high degrees
  uint32_t max_degree = 1;
  for (uint32_t d = num_chunks; d >= 1; d--) {
    if (mu[d - 1] > 0.1 / K) {
      max_degree = d;
      break;
    }
  }
  mu.resize(max_degree);
  sum = std::accumulate(mu.begin(), mu.end(), 0.0);
  m_cdf.resize(max_degree);
  double acc = 0;
  for (uint32_t i = 0; i < max_degree; i++) {
    acc += mu[i] / sum;
    m_cdf[i] = acc;
  }
  // rounding must never leave a gap at the top
  m_cdf.back() = 1.0;
}

uint32_t DegreeSampler::sample(SeededRandom& rng) const {
  return degree_for_unit(rng.next_unit());
}

uint32_t DegreeSampler::degree_for_unit(const double u) const {
  const auto it = std::lower_bound(m_cdf.begin(), m_cdf.end(), u);
  if (it == m_cdf.end()) {
    return max_degree();
  }
  return static_cast<uint32_t>(std::distance(m_cdf.begin(), it)) + 1;
}

double DegreeSampler::probability(const uint32_t d) const {
  if (d == 0 || d > max_degree()) return 0;
  if (d == 1) return m_cdf[0];
  return m_cdf[d - 1] - m_cdf[d - 2];
}

}  // namespace qrfountain
