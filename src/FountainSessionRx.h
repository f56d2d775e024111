#ifndef QRFOUNTAIN_FOUNTAINSESSIONRX_H
#define QRFOUNTAIN_FOUNTAINSESSIONRX_H

#include <sodium/crypto_generichash.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <unordered_set>
#include <vector>

#include "FunkyQueue.h"
#include "HelperSources/TimeHelper.hpp"
#include "fountain/ChunkSelector.h"
#include "fountain/Droplet.h"
#include "fountain/FileFraming.h"
#include "fountain/GlassDecoder.h"
#include "qrfountain_spdlog.h"

namespace qrfountain {

// Droplets with an equal key belong to the same transfer (file)
struct TransferKey {
  uint32_t num_chunks = 0;
  uint32_t padding = 0;
  uint32_t chunk_size = 0;
  // top bits of the seed, see SEED_TAG_SHIFT
  uint8_t tag = 0;
  static TransferKey from_droplet(const Droplet& droplet) {
    return {droplet.num_chunks, droplet.padding, droplet.chunk_size(),
            droplet.transfer_tag()};
  }
  bool operator<(const TransferKey& other) const {
    return std::tie(num_chunks, padding, chunk_size, tag) <
           std::tie(other.num_chunks, other.padding, other.chunk_size,
                    other.tag);
  }
  bool operator==(const TransferKey& other) const {
    return num_chunks == other.num_chunks && padding == other.padding &&
           chunk_size == other.chunk_size && tag == other.tag;
  }
};

struct ReceivedFile {
  // taken from the file header, or fountain_output_<n>
  std::string name;
  std::optional<uint32_t> index;
  std::optional<uint32_t> total;
  // file bytes without the header (still compressed, if the tx compressed)
  std::vector<uint8_t> data;
};

struct TransferProgress {
  TransferKey key;
  uint32_t resolved = 0;
  uint32_t num_chunks = 0;
  // empty until the header (in chunk 0) has been resolved
  std::string name;
  std::optional<uint32_t> index;
};

/**
 * Receiver side of a droplet session. Takes a continuous stream of droplet
 * candidate strings (as read from the screen by the QR decoder, unordered,
 * duplicated, partially garbage) and turns them into files.
 * - one GlassDecoder per in-flight transfer, demultiplexed by TransferKey
 * - a transfer whose droplets contradict each other (two files with the same
 *   key) or whose file digest does not match is dropped, never delivered
 * - per transfer seed deduplication (optional)
 * - manifest droplet(s) announce the n of files of the session
 * - complete transfers are reconstructed, stripped of their header and
 *   forwarded via the file callback right away
 * Optionally decouples parsing / decoding from the thread that provides the
 * candidates via a bounded queue that drops instead of blocking.
 */
class FountainSessionRx {
 public:
  typedef std::function<void(const ReceivedFile& file)> OUTPUT_FILE_CALLBACK;
  typedef std::function<void(uint32_t n_files)> SESSION_COMPLETE_CALLBACK;
  using CandidateQueueType = FunkyQueue<std::string>;
  struct Options {
    // skip droplets whose seed was already seen for the same transfer
    bool enable_dedup = true;
    // max n of remembered seeds per transfer, oldest are forgotten first
    std::size_t dedup_max_entries = 100000;
    // Garbage droplets with random K can open new transfers - if there are
    // more than this, the least recently updated transfer is dropped
    std::size_t max_active_transfers = 8;
    // The tx loops its files endlessly - don't output the same file twice
    bool skip_duplicate_files = true;
    // needs to match the tx
    SolitonParams soliton_params{};
    // overrides soliton_params, mostly for testing
    SCHEME_FACTORY opt_scheme_factory = nullptr;
    // decouple the caller of process_droplet_string from the processing
    bool enable_threading = false;
    // only if threading is enabled
    int n_process_threads = 1;
    int candidate_queue_size = 64;
    CandidateQueueType::DropPolicy queue_drop_policy =
        CandidateQueueType::DropPolicy::DROP_OLDEST;
    // overwrite the console used for logging
    std::shared_ptr<spdlog::logger> opt_console = nullptr;
  };
  explicit FountainSessionRx(Options options);
  ~FountainSessionRx();
  FountainSessionRx(const FountainSessionRx&) = delete;
  FountainSessionRx& operator=(const FountainSessionRx&) = delete;
  // The callbacks are invoked from the processing thread(s), set them before
  // feeding data. With more than one processing thread, they might be called
  // concurrently.
  void set_file_callback(OUTPUT_FILE_CALLBACK cb);
  void set_session_complete_callback(SESSION_COMPLETE_CALLBACK cb);
  /**
   * Feed a droplet candidate string. If threading is enabled, it is only
   * enqueued and this method is guaranteed to return immediately.
   */
  void process_droplet_string(std::string candidate);
  // Processes an already parsed droplet in the calling thread
  void process_droplet(const Droplet& droplet);
  // Discards all decoders, remembered seeds, the manifest and not yet
  // processed candidates
  void reset();

  std::vector<TransferProgress> get_progress();
  std::optional<uint32_t> get_expected_file_count();
  uint32_t get_n_files_received();
  bool is_session_complete();
  struct Statistics {
    uint64_t n_input_candidates = 0;
    uint64_t n_malformed = 0;
    uint64_t n_duplicates_skipped = 0;
    uint64_t n_inconsistent = 0;
    uint64_t n_queue_dropped = 0;
    uint64_t n_ingested = 0;
    uint64_t n_files_delivered = 0;
    uint64_t n_duplicate_files = 0;
    uint64_t n_evicted_transfers = 0;
    // transfers dropped because they mixed up different files
    uint64_t n_conflicts = 0;
    uint64_t curr_droplets_per_second = 0;
    MinMaxAvg<std::chrono::nanoseconds> curr_ingest_time{};
  };
  Statistics get_latest_stats();

 private:
  using ContentHash = std::array<uint8_t, crypto_generichash_BYTES>;
  struct ActiveTransfer {
    ActiveTransfer(TransferKey key1, SCHEME_FACTORY factory)
        : key(key1), decoder(std::move(factory)) {}
    const TransferKey key;
    // guards decoder, retired
    std::mutex decoder_mutex;
    GlassDecoder decoder;
    bool retired = false;
    // readable without taking decoder_mutex
    std::atomic<uint32_t> resolved{0};
    std::atomic<bool> header_known{false};
    // guards header
    std::mutex header_mutex;
    std::optional<FileHeader> header;
    // guarded by the session mutex
    uint64_t last_used = 0;
    std::unordered_set<uint32_t> seen_seeds;
    std::deque<uint32_t> seen_seeds_order;
  };
  const Options m_options;
  std::shared_ptr<spdlog::logger> m_console;
  SCHEME_FACTORY m_scheme_factory;
  OUTPUT_FILE_CALLBACK m_out_cb = nullptr;
  SESSION_COMPLETE_CALLBACK m_session_complete_cb = nullptr;
  // guards everything below (but not the decoders themselves)
  std::mutex m_session_mutex;
  std::map<TransferKey, std::shared_ptr<ActiveTransfer>> m_transfers;
  // increased on reset, work started before a reset is discarded
  uint64_t m_generation = 0;
  uint64_t m_use_counter = 0;
  std::optional<uint32_t> m_expected_files;
  uint32_t m_n_files_received = 0;
  bool m_session_complete = false;
  std::set<ContentHash> m_delivered_files;
  // statistics
  std::atomic<uint64_t> m_n_input_candidates{0};
  std::atomic<uint64_t> m_n_malformed{0};
  std::atomic<uint64_t> m_n_duplicates_skipped{0};
  std::atomic<uint64_t> m_n_inconsistent{0};
  std::atomic<uint64_t> m_n_ingested{0};
  std::atomic<uint64_t> m_n_duplicate_files{0};
  std::atomic<uint64_t> m_n_files_delivered{0};
  std::atomic<uint64_t> m_n_evicted_transfers{0};
  std::atomic<uint64_t> m_n_conflicts{0};
  std::mutex m_stats_mutex;
  AvgCalculator m_ingest_time{};
  MinMaxAvg<std::chrono::nanoseconds> m_curr_ingest_time{};
  PacketsPerSecondCalculator m_droplets_per_second_calculator{};
  // used only if threading is enabled
  std::unique_ptr<CandidateQueueType> m_candidate_queue;
  std::atomic<bool> m_process_data_thread_run{true};
  std::vector<std::unique_ptr<std::thread>> m_process_data_threads;
  void loop_process_data();
  void internal_process_string(const std::string& candidate);
  // The following require m_session_mutex. Return true if the session got
  // complete by this call.
  bool set_expected_files_locked(uint32_t n_files, const char* source);
  bool check_session_complete_locked();
  void evict_least_recently_used_locked();
  // nullptr if the droplet is a duplicate or the session is complete
  std::shared_ptr<ActiveTransfer> find_or_create_transfer(
      const Droplet& droplet, uint64_t& generation);
  // requires the decoder_mutex of transfer. Returns true if the header was
  // parsed by this call
  bool try_parse_header(ActiveTransfer& transfer);
  void on_header_parsed(ActiveTransfer& transfer, uint64_t generation);
  void on_transfer_conflict(const std::shared_ptr<ActiveTransfer>& transfer,
                            uint64_t generation);
  void on_transfer_complete(const std::shared_ptr<ActiveTransfer>& transfer,
                            std::vector<uint8_t> data, uint64_t generation);
  void add_ingest_time(std::chrono::nanoseconds delta);
};

}  // namespace qrfountain

#endif  // QRFOUNTAIN_FOUNTAINSESSIONRX_H
