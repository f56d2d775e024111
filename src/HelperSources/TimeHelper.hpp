#ifndef QRFOUNTAIN_TIMEHELPER_HPP
#define QRFOUNTAIN_TIMEHELPER_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>

// Measuring and comparing latency samples (droplet ingest / encode times)

namespace MyTimeHelper {
// R stands for readable. Convert a std::chrono::duration into a readable format
// Readable format is somewhat arbitrary, in this case readable means that for
// example 1second has 'ms' resolution since for values that big ns resolution
// probably isn't needed
static std::string R(const std::chrono::steady_clock::duration &dur) {
  const auto durAbsolute = std::chrono::abs(dur);
  if (durAbsolute >= std::chrono::seconds(1)) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(dur).count();
    return std::to_string(static_cast<float>(ms) / 1000.0f) + "s";
  }
  if (durAbsolute >= std::chrono::milliseconds(1)) {
    const auto us =
        std::chrono::duration_cast<std::chrono::microseconds>(dur).count();
    return std::to_string(static_cast<float>(us) / 1000.0f) + "ms";
  }
  if (durAbsolute >= std::chrono::microseconds(1)) {
    const auto ns =
        std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count();
    return std::to_string(static_cast<float>(ns) / 1000.0f) + "us";
  }
  const auto ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count();
  return std::to_string(ns) + "ns";
}
}  // namespace MyTimeHelper

template <typename T>
struct MinMaxAvg {
  T min{};
  T max{};
  T avg{};
};
template <typename T>
static std::string min_max_avg_as_string(const MinMaxAvg<T> &minMaxAvg,
                                         bool average_only) {
  std::stringstream ss;
  if constexpr (std::is_same_v<T, std::chrono::nanoseconds>) {
    if (!average_only) {
      ss << "min=" << MyTimeHelper::R(minMaxAvg.min)
         << " max=" << MyTimeHelper::R(minMaxAvg.max) << " ";
    }
    ss << "avg=" << MyTimeHelper::R(minMaxAvg.avg);
  } else {
    if (!average_only) {
      ss << "min=" << minMaxAvg.min << " max=" << minMaxAvg.max << " ";
    }
    ss << "avg=" << minMaxAvg.avg;
  }
  return ss.str();
}

// Saves the minimum,maximum and average of all the samples added since the
// last reset. Negative values are not supported.
template <typename T>
class BaseAvgCalculator {
 private:
  T sum{};
  long nSamples = 0;
  T min{};
  T max{};
  std::chrono::steady_clock::time_point m_last_reset =
      std::chrono::steady_clock::now();

 public:
  BaseAvgCalculator() { reset(); };
  void add(const T &value) {
    if constexpr (std::is_signed_v<T> ||
                  std::is_same_v<T, std::chrono::nanoseconds>) {
      if (value < T(0)) {
        std::cout << "Cannot add negative value:" << std::endl;
        return;
      }
    }
    sum += value;
    nSamples++;
    if (value < min) {
      min = value;
    }
    if (value > max) {
      max = value;
    }
  }
  // If 0 samples were recorded, return 0
  T getAvg() const {
    if (nSamples == 0) return T(0);
    return sum / nSamples;
  }
  T getMin() const { return nSamples == 0 ? T(0) : min; }
  T getMax() const { return max; }
  long getNSamples() const { return nSamples; }
  void reset() {
    sum = {};
    nSamples = 0;
    // std::numeric_limits returns 0 for std::chrono::nanoseconds
    if constexpr (std::is_same_v<T, std::chrono::nanoseconds>) {
      min = std::chrono::nanoseconds::max();
    } else {
      min = std::numeric_limits<T>::max();
    }
    max = {};
    m_last_reset = std::chrono::steady_clock::now();
  }
  MinMaxAvg<T> getMinMaxAvg() const { return {getMin(), getMax(), getAvg()}; }
  std::string getAvgReadable(const bool averageOnly = false) const {
    return min_max_avg_as_string(getMinMaxAvg(), averageOnly);
  }
  auto get_delta_since_last_reset() const {
    return std::chrono::steady_clock::now() - m_last_reset;
  }
};
using AvgCalculator = BaseAvgCalculator<std::chrono::nanoseconds>;
using AvgCalculatorSize = BaseAvgCalculator<std::size_t>;

// droplets (or any other "packets") per second, recalculated in intervals
class PacketsPerSecondCalculator {
 private:
  uint64_t recalculateSinceLast(uint64_t curr_packets) {
    const auto now = std::chrono::steady_clock::now();
    const auto deltaTime = now - last_time;
    const auto deltaPackets = curr_packets - packets_last_time;
    last_time = now;
    packets_last_time = curr_packets;
    const auto delta_time_us =
        std::chrono::duration_cast<std::chrono::microseconds>(deltaTime)
            .count();
    if (delta_time_us > 0 && deltaPackets > 0) {
      return deltaPackets * 1000 * 1000 / delta_time_us;
    }
    return 0;
  }

 public:
  uint64_t get_last_or_recalculate(
      uint64_t curr_packets,
      const std::chrono::steady_clock::duration &time_between_recalculations =
          std::chrono::seconds(2)) {
    if (std::chrono::steady_clock::now() - last_time >=
        time_between_recalculations) {
      curr_packets_per_second = recalculateSinceLast(curr_packets);
    }
    return curr_packets_per_second;
  }
  void reset() {
    packets_last_time = 0;
    last_time = std::chrono::steady_clock::now();
    curr_packets_per_second = 0;
  }

 private:
  uint64_t packets_last_time = 0;
  std::chrono::steady_clock::time_point last_time =
      std::chrono::steady_clock::now();
  uint64_t curr_packets_per_second = 0;
};

#endif  // QRFOUNTAIN_TIMEHELPER_HPP
