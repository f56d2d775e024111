#ifndef QRFOUNTAIN_HELPER_H
#define QRFOUNTAIN_HELPER_H

#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>
#include <random>
#include <utility>
#include <vector>

#include "StringHelper.hpp"

// Generic helper code for tests and the example(s) that does not depend on
// anything else other than the std libraries. Everything random is seeded,
// such that a failing test can be reproduced.

namespace GenericHelper {
// Create a buffer filled with (seeded) random data of size sizeBytes
static std::vector<uint8_t> createRandomDataBuffer(const std::size_t sizeBytes,
                                                   const uint32_t seed) {
  std::vector<uint8_t> buf(sizeBytes);
  std::mt19937 random_engine(seed);
  for (auto &b : buf) {
    b = static_cast<uint8_t>(random_engine() & 0xFF);
  }
  return buf;
}
template <typename T>
static void shuffle(std::vector<T> &values, const uint32_t seed) {
  std::mt19937 random_engine(seed);
  // std::shuffle is implementation defined, Fisher-Yates is not
  for (std::size_t i = values.size(); i > 1; i--) {
    const auto j = random_engine() % i;
    std::swap(values[i - 1], values[j]);
  }
}
static bool compareVectors(const std::vector<uint8_t> &sb,
                           const std::vector<uint8_t> &rb) {
  if (sb.size() != rb.size()) {
    return false;
  }
  if (sb.empty()) return true;
  return memcmp(sb.data(), rb.data(), sb.size()) == 0;
}
static void assertVectorsEqual(const std::vector<uint8_t> &sb,
                               const std::vector<uint8_t> &rb) {
  assert(compareVectors(sb, rb));
}
}  // namespace GenericHelper

#endif  // QRFOUNTAIN_HELPER_H
