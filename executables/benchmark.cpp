#include <fmt/core.h>
#include <sodium/core.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../src/HelperSources/Helper.hpp"
#include "../src/HelperSources/TimeHelper.hpp"
#include "../src/fountain/Droplet.h"
#include "../src/fountain/FountainEncoder.h"
#include "../src/fountain/GlassDecoder.h"

// Encode / decode / wire throughput of the fountain code on this platform.
// Gives a hint on how many droplets per second the receiver can take, which
// is an upper limit for the useful QR frame rate.
// NOTE: Does not take QR rendering / detection into account

static constexpr auto BENCHMARK_ENCODE = 0;
static constexpr auto BENCHMARK_DECODE = 1;
static constexpr auto BENCHMARK_WIRE = 2;
static std::string benchmarkTypeReadable(const int value) {
  switch (value) {
    case BENCHMARK_ENCODE:
      return "ENCODE";
    case BENCHMARK_DECODE:
      return "DECODE";
    case BENCHMARK_WIRE:
      return "WIRE";
    default:
      return "ERROR";
  }
}

struct Options {
  int CHUNK_SIZE = 1024;
  int N_CHUNKS = 1000;
  int benchmarkType = BENCHMARK_ENCODE;
  // How long the benchmark will run
  int benchmarkTimeSeconds = 10;
};

static std::unique_ptr<qrfountain::FountainEncoder> make_encoder(
    const Options& options) {
  const auto data = GenericHelper::createRandomDataBuffer(
      static_cast<std::size_t>(options.CHUNK_SIZE) * options.N_CHUNKS, 0);
  qrfountain::FountainEncoder::Options encoder_options{};
  encoder_options.chunk_size = options.CHUNK_SIZE;
  return std::make_unique<qrfountain::FountainEncoder>(data, encoder_options);
}

static void print_result(const std::string& tag, uint64_t n_droplets,
                         const AvgCalculator& duration,
                         std::chrono::steady_clock::duration total,
                         const Options& options) {
  const auto total_us =
      std::chrono::duration_cast<std::chrono::microseconds>(total).count();
  const double droplets_per_second =
      total_us > 0 ? n_droplets * 1000.0 * 1000.0 / total_us : 0;
  fmt::print("{}: {} droplets, {:.1f} droplets/s, {}/s, per droplet {}\n", tag,
             n_droplets, droplets_per_second,
             StringHelper::memorySizeReadable(
                 static_cast<std::size_t>(droplets_per_second *
                                          options.CHUNK_SIZE)),
             duration.getAvgReadable());
}

void benchmark_encode(const Options& options) {
  auto encoder = make_encoder(options);
  AvgCalculator duration{};
  uint64_t n_droplets = 0;
  const auto testBegin = std::chrono::steady_clock::now();
  while ((std::chrono::steady_clock::now() - testBegin) <
         std::chrono::seconds(options.benchmarkTimeSeconds)) {
    const auto before = std::chrono::steady_clock::now();
    const auto droplet = encoder->next_droplet();
    duration.add(std::chrono::steady_clock::now() - before);
    assert(droplet.chunk_size() == static_cast<uint32_t>(options.CHUNK_SIZE));
    n_droplets++;
  }
  print_result("ENCODE", n_droplets, duration,
               std::chrono::steady_clock::now() - testBegin, options);
  const auto stats = encoder->get_latest_stats();
  fmt::print("Degree {}\n", min_max_avg_as_string(stats.curr_degree, false));
}

// Decodes the same transfer over and over again, from a pool of pre computed
// droplets
void benchmark_decode(const Options& options) {
  auto encoder = make_encoder(options);
  std::vector<qrfountain::Droplet> droplets;
  for (int i = 0; i < 3 * options.N_CHUNKS + 100; i++) {
    droplets.push_back(encoder->next_droplet());
  }
  AvgCalculator duration{};
  AvgCalculator transfer_duration{};
  AvgCalculatorSize droplets_needed{};
  uint64_t n_droplets = 0;
  int n_failed = 0;
  const auto testBegin = std::chrono::steady_clock::now();
  while ((std::chrono::steady_clock::now() - testBegin) <
         std::chrono::seconds(options.benchmarkTimeSeconds)) {
    qrfountain::GlassDecoder decoder{};
    const auto transfer_begin = std::chrono::steady_clock::now();
    std::size_t n = 0;
    for (const auto& droplet : droplets) {
      const auto before = std::chrono::steady_clock::now();
      decoder.ingest(droplet);
      duration.add(std::chrono::steady_clock::now() - before);
      n++;
      if (decoder.is_complete()) break;
    }
    n_droplets += n;
    if (decoder.is_complete()) {
      transfer_duration.add(std::chrono::steady_clock::now() - transfer_begin);
      droplets_needed.add(n);
    } else {
      n_failed++;
    }
  }
  print_result("DECODE", n_droplets, duration,
               std::chrono::steady_clock::now() - testBegin, options);
  fmt::print("Transfer of {} chunks: {}, droplets needed {}, failed {}\n",
             options.N_CHUNKS, transfer_duration.getAvgReadable(),
             droplets_needed.getAvgReadable(), n_failed);
}

void benchmark_wire(const Options& options) {
  auto encoder = make_encoder(options);
  std::vector<qrfountain::Droplet> droplets;
  for (int i = 0; i < 1000; i++) {
    droplets.push_back(encoder->next_droplet());
  }
  AvgCalculator duration{};
  uint64_t n_droplets = 0;
  const auto testBegin = std::chrono::steady_clock::now();
  while ((std::chrono::steady_clock::now() - testBegin) <
         std::chrono::seconds(options.benchmarkTimeSeconds)) {
    for (const auto& droplet : droplets) {
      const auto before = std::chrono::steady_clock::now();
      const auto wire = qrfountain::droplet_to_wire(droplet);
      const auto parsed = qrfountain::droplet_from_wire(wire);
      duration.add(std::chrono::steady_clock::now() - before);
      assert(parsed.ok());
      n_droplets++;
    }
  }
  print_result("WIRE", n_droplets, duration,
               std::chrono::steady_clock::now() - testBegin, options);
}

int main(int argc, char* const* argv) {
  int opt;
  Options options{};
  while ((opt = getopt(argc, argv, "s:k:x:t:")) != -1) {
    switch (opt) {
      case 's':
        options.CHUNK_SIZE = atoi(optarg);
        break;
      case 'k':
        options.N_CHUNKS = atoi(optarg);
        break;
      case 'x':
        options.benchmarkType = atoi(optarg);
        break;
      case 't':
        options.benchmarkTimeSeconds = atoi(optarg);
        break;
      default: /* '?' */
        std::cout << "Usage: [-s=chunk size in bytes] [-k=n of chunks] "
                     "[-x Benchmark type. 0=ENCODE 1=DECODE 2=WIRE] "
                     "[-t benchmark time in seconds]\n";
        return 1;
    }
  }
  if (options.CHUNK_SIZE <= 0 || options.N_CHUNKS <= 0) {
    std::cerr << "chunk size and n of chunks must be > 0\n";
    return 1;
  }
  if (sodium_init() < 0) {
    std::cerr << "Cannot init libsodium\n";
    return 1;
  }
  std::cout << "Benchmark type: " << options.benchmarkType << "("
            << benchmarkTypeReadable(options.benchmarkType) << ")\n";
  std::cout << "Chunk size: " << options.CHUNK_SIZE << " B\n";
  std::cout << "N chunks: " << options.N_CHUNKS << "\n";
  std::cout << "Benchmark time: " << options.benchmarkTimeSeconds << " s\n";
  switch (options.benchmarkType) {
    case BENCHMARK_ENCODE:
      benchmark_encode(options);
      break;
    case BENCHMARK_DECODE:
      benchmark_decode(options);
      break;
    case BENCHMARK_WIRE:
      benchmark_wire(options);
      break;
    default:
      std::cout << "Unknown benchmark type" << std::endl;
      return 1;
  }
  return 0;
}
