#include <sodium/core.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../src/FountainSessionRx.h"
#include "../src/HelperSources/Helper.hpp"
#include "../src/HelperSources/StringHelper.hpp"
#include "../src/dummy_channel/DummyChannel.h"
#include "../src/fountain/FileFraming.h"
#include "../src/fountain/FountainEncoder.h"
#include "../src/qrfountain_spdlog.h"

// Sends one or more files through the whole pipeline in process:
// files -> encoders -> droplet strings -> lossy dummy channel -> session ->
// files. Nice for playing around with chunk sizes / loss rates.
// Without input files, a random buffer is sent.

struct Options {
  int chunk_size = qrfountain::DEFAULT_CHUNK_SIZE;
  int loss_percentage = 20;
  int duplicate_percentage = 10;
  int garble_percentage = 5;
  int reorder_window = 8;
  // 0 == no limit
  int max_droplets = 0;
  std::string output_directory;
};

static std::vector<uint8_t> read_file(const std::string& filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open " + filename);
  }
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), {});
}

static void write_file(const std::string& filename,
                       const std::vector<uint8_t>& data) {
  std::ofstream file(filename, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot write " + filename);
  }
  file.write(reinterpret_cast<const char*>(data.data()),
             static_cast<std::streamsize>(data.size()));
}

int main(int argc, char* const* argv) {
  int opt;
  Options options{};
  while ((opt = getopt(argc, argv, "c:l:d:g:r:n:o:")) != -1) {
    switch (opt) {
      case 'c':
        options.chunk_size = atoi(optarg);
        break;
      case 'l':
        options.loss_percentage = atoi(optarg);
        break;
      case 'd':
        options.duplicate_percentage = atoi(optarg);
        break;
      case 'g':
        options.garble_percentage = atoi(optarg);
        break;
      case 'r':
        options.reorder_window = atoi(optarg);
        break;
      case 'n':
        options.max_droplets = atoi(optarg);
        break;
      case 'o':
        options.output_directory = optarg;
        break;
      default: /* '?' */
        std::cout << "Usage: [-c chunk size] [-l loss %] [-d duplicate %] "
                     "[-g garble %] [-r reorder window] [-n max droplets] "
                     "[-o output directory] [files...]\n";
        return 1;
    }
  }
  auto console = qrfountain::log::create_or_get("loopback");
  console->set_level(spdlog::level::info);
  if (sodium_init() < 0) {
    console->error("Cannot init libsodium");
    return 1;
  }
  std::vector<std::string> filenames;
  for (int i = optind; i < argc; i++) {
    filenames.emplace_back(argv[i]);
  }
  try {
    std::vector<std::vector<uint8_t>> files;
    if (filenames.empty()) {
      filenames.emplace_back("random.bin");
      files.push_back(GenericHelper::createRandomDataBuffer(100 * 1024, 0));
    } else {
      for (const auto& filename : filenames) {
        files.push_back(read_file(filename));
      }
    }
    const auto n_files = static_cast<uint32_t>(files.size());
    std::vector<std::unique_ptr<qrfountain::FountainEncoder>> encoders;
    for (uint32_t i = 0; i < n_files; i++) {
      const auto name = qrfountain::sanitize_file_name(filenames[i], "file");
      qrfountain::FountainEncoder::Options encoder_options{};
      encoder_options.chunk_size = options.chunk_size;
      encoder_options.start_seed = qrfountain::DEFAULT_START_SEED + i;
      encoder_options.transfer_tag = static_cast<uint8_t>(i);
      encoders.push_back(std::make_unique<qrfountain::FountainEncoder>(
          qrfountain::build_framed_payload(name, i + 1, n_files, files[i]),
          encoder_options));
      console->info("{}: {}, K:{}", name,
                    StringHelper::memorySizeReadable(files[i].size()),
                    encoders.back()->num_chunks());
    }
    qrfountain::DummyChannel::Options channel_options{};
    channel_options.loss_percentage = options.loss_percentage;
    channel_options.duplicate_percentage = options.duplicate_percentage;
    channel_options.garble_percentage = options.garble_percentage;
    channel_options.reorder_window = options.reorder_window;
    qrfountain::DummyChannel channel{channel_options};

    qrfountain::FountainSessionRx::Options rx_options{};
    rx_options.enable_threading = true;
    rx_options.opt_console = console;
    qrfountain::FountainSessionRx rx{rx_options};
    std::atomic<bool> done{false};
    rx.set_file_callback([&options, &console](
                             const qrfountain::ReceivedFile& file) {
      console->info("Got {} ({})", file.name,
                    StringHelper::memorySizeReadable(file.data.size()));
      if (options.output_directory.empty()) {
        return;
      }
      try {
        write_file(options.output_directory + "/" + file.name, file.data);
      } catch (std::runtime_error& e) {
        console->error("{}", e.what());
      }
    });
    rx.set_session_complete_callback([&done](uint32_t) { done = true; });

    const auto begin = std::chrono::steady_clock::now();
    auto last_log = begin;
    uint64_t n_droplets = 0;
    while (!done) {
      if (options.max_droplets > 0 &&
          n_droplets >= static_cast<uint64_t>(options.max_droplets)) {
        break;
      }
      // like the transmitter, the manifest every few frames
      if (n_droplets % 10 == 0) {
        channel.tx(qrfountain::droplet_to_wire(
            qrfountain::make_manifest_droplet(n_files)));
      }
      auto& encoder = encoders[n_droplets % encoders.size()];
      channel.tx(qrfountain::droplet_to_wire(encoder->next_droplet()));
      n_droplets++;
      while (auto frame = channel.rx()) {
        rx.process_droplet_string(std::move(frame.value()));
      }
      if (std::chrono::steady_clock::now() - last_log >
          std::chrono::seconds(1)) {
        last_log = std::chrono::steady_clock::now();
        for (const auto& progress : rx.get_progress()) {
          console->info("{} {}", progress.name,
                        StringHelper::progress_bar(progress.resolved,
                                                   progress.num_chunks));
        }
      }
      // give the processing thread some air, like a real frame rate would
      if (n_droplets % 100 == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    }
    for (auto& frame : channel.flush()) {
      rx.process_droplet_string(std::move(frame));
    }
    const auto channel_stats = channel.get_stats();
    const auto rx_stats = rx.get_latest_stats();
    console->info(
        "Sent {} droplets in {}, channel dropped:{} duplicated:{} garbled:{}",
        n_droplets,
        MyTimeHelper::R(std::chrono::steady_clock::now() - begin),
        channel_stats.n_dropped, channel_stats.n_duplicated,
        channel_stats.n_garbled);
    console->info(
        "rx candidates:{} malformed:{} duplicates:{} queue dropped:{} "
        "files:{}",
        rx_stats.n_input_candidates, rx_stats.n_malformed,
        rx_stats.n_duplicates_skipped, rx_stats.n_queue_dropped,
        rx_stats.n_files_delivered);
    if (!done) {
      console->warn("Gave up after {} droplets", n_droplets);
      return 1;
    }
  } catch (std::exception& e) {
    console->error("Error: {}", e.what());
    return 1;
  }
  return 0;
}
