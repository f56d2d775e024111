#ifndef QRFOUNTAIN_DUMMYCHANNEL_H
#define QRFOUNTAIN_DUMMYCHANNEL_H

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace qrfountain {

// Emulates the screen -> camera path in process. Frames are lost, read twice,
// garbled or reordered, driven by a seeded PRNG so runs are reproducible.
class DummyChannel {
 public:
  struct Options {
    // all in percent [0..100]
    int loss_percentage = 0;
    int duplicate_percentage = 0;
    // garbled frames never parse as a droplet (like a misread QR code that
    // passed the QR error correction by accident, but not our parser)
    int garble_percentage = 0;
    // frames are held back until more than this many are in flight, then a
    // random one is released. 1 means in order.
    int reorder_window = 1;
    uint32_t seed = 0;
  };
  explicit DummyChannel(Options options);
  void tx(std::string frame);
  // Next received frame, nullopt if there is none (yet)
  std::optional<std::string> rx();
  // Releases the frames still held back by the reorder window and returns
  // everything not yet received
  std::vector<std::string> flush();
  struct Statistics {
    uint64_t n_tx = 0;
    uint64_t n_dropped = 0;
    uint64_t n_duplicated = 0;
    uint64_t n_garbled = 0;
  };
  Statistics get_stats();

 private:
  const Options m_options;
  std::mutex m_mutex;
  std::deque<std::string> m_in_flight;
  std::deque<std::string> m_rx_queue;
  Statistics m_stats{};
  std::mt19937 m_mt;
  std::uniform_int_distribution<> m_dist100{0, 99};
  bool should(int percentage) { return m_dist100(m_mt) < percentage; }
  void release_random_in_flight();
};

}  // namespace qrfountain

#endif  // QRFOUNTAIN_DUMMYCHANNEL_H
