#include "FountainSessionRx.h"

#include <sodium/core.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "HelperSources/StringHelper.hpp"

namespace qrfountain {

FountainSessionRx::FountainSessionRx(Options options)
    : m_options(std::move(options)) {
  if (m_options.opt_console) {
    m_console = m_options.opt_console;
  } else {
    m_console = qrfountain::log::create_or_get("session_rx");
  }
  if (sodium_init() < 0) {
    m_console->error("Cannot init libsodium");
    throw std::runtime_error("Cannot init libsodium");
  }
  if (m_options.max_active_transfers < 1) {
    throw std::invalid_argument("max_active_transfers must be >= 1");
  }
  if (m_options.enable_dedup && m_options.dedup_max_entries < 1) {
    throw std::invalid_argument("dedup_max_entries must be >= 1");
  }
  if (m_options.opt_scheme_factory) {
    m_scheme_factory = m_options.opt_scheme_factory;
  } else {
    m_scheme_factory =
        make_robust_soliton_scheme_factory(m_options.soliton_params);
  }
  if (m_options.enable_threading) {
    if (m_options.n_process_threads < 1 ||
        m_options.candidate_queue_size < 1) {
      throw std::invalid_argument(
          "n_process_threads and candidate_queue_size must be >= 1");
    }
    m_candidate_queue =
        std::make_unique<CandidateQueueType>(m_options.candidate_queue_size);
    m_process_data_thread_run = true;
    for (int i = 0; i < m_options.n_process_threads; i++) {
      m_process_data_threads.push_back(std::make_unique<std::thread>(
          &FountainSessionRx::loop_process_data, this));
    }
  }
}

FountainSessionRx::~FountainSessionRx() {
  if (m_options.enable_threading) {
    m_process_data_thread_run = false;
    for (auto& thread : m_process_data_threads) {
      if (thread->joinable()) {
        thread->join();
      }
    }
  }
}

void FountainSessionRx::set_file_callback(OUTPUT_FILE_CALLBACK cb) {
  m_out_cb = std::move(cb);
}

void FountainSessionRx::set_session_complete_callback(
    SESSION_COMPLETE_CALLBACK cb) {
  m_session_complete_cb = std::move(cb);
}

void FountainSessionRx::process_droplet_string(std::string candidate) {
  m_n_input_candidates++;
  if (m_options.enable_threading) {
    const bool enqueued = m_candidate_queue->enqueue(
        std::move(candidate), m_options.queue_drop_policy);
    if (!enqueued) {
      // would hint at too high cpu usage
      m_console->debug("Cannot enqueue candidate");
    }
  } else {
    internal_process_string(candidate);
  }
}

void FountainSessionRx::loop_process_data() {
  while (m_process_data_thread_run) {
    auto opt_candidate =
        m_candidate_queue->wait_dequeue_timed(std::chrono::milliseconds(100));
    if (opt_candidate.has_value()) {
      internal_process_string(opt_candidate.value());
    }
  }
}

void FountainSessionRx::internal_process_string(const std::string& candidate) {
  const auto res = droplet_from_wire(candidate);
  if (!res.ok()) {
    m_n_malformed++;
    m_console->debug("Malformed droplet ({}), {} bytes",
                     parse_error_as_string(res.error), candidate.size());
    return;
  }
  process_droplet(res.droplet.value());
}

void FountainSessionRx::process_droplet(const Droplet& droplet) {
  if (droplet.is_manifest()) {
    const auto n_files = manifest_file_count(droplet);
    if (!n_files.has_value()) {
      m_n_malformed++;
      m_console->debug("Manifest droplet without file count");
      return;
    }
    bool completed;
    uint32_t n_received;
    {
      std::lock_guard<std::mutex> guard(m_session_mutex);
      completed = set_expected_files_locked(n_files.value(), "manifest");
      n_received = m_n_files_received;
    }
    if (completed && m_session_complete_cb) {
      m_session_complete_cb(n_received);
    }
    return;
  }
  uint64_t generation = 0;
  auto transfer = find_or_create_transfer(droplet, generation);
  if (transfer == nullptr) {
    return;
  }
  const auto before = std::chrono::steady_clock::now();
  IngestStatus status;
  bool header_parsed = false;
  std::optional<std::vector<uint8_t>> completed_data = std::nullopt;
  {
    std::lock_guard<std::mutex> guard(transfer->decoder_mutex);
    if (transfer->retired) {
      return;
    }
    status = transfer->decoder.ingest(droplet);
    transfer->resolved = transfer->decoder.resolved_count();
    if (status == IngestStatus::CONFLICT) {
      transfer->retired = true;
    } else if (status == IngestStatus::RESOLVED) {
      if (!transfer->header_known) {
        header_parsed = try_parse_header(*transfer);
      }
      if (transfer->decoder.is_complete()) {
        transfer->retired = true;
        completed_data = transfer->decoder.reconstruct();
      }
    }
  }
  add_ingest_time(std::chrono::steady_clock::now() - before);
  if (status == IngestStatus::INCONSISTENT_PARAMETERS) {
    m_n_inconsistent++;
    m_console->debug("Inconsistent droplet seed:{} K:{}", droplet.seed,
                     droplet.num_chunks);
    return;
  }
  if (status == IngestStatus::CONFLICT) {
    on_transfer_conflict(transfer, generation);
    return;
  }
  m_n_ingested++;
  if (status == IngestStatus::RESOLVED) {
    m_console->debug("K:{} {}", transfer->key.num_chunks,
                     StringHelper::progress_bar(transfer->resolved,
                                                transfer->key.num_chunks));
  }
  if (header_parsed) {
    on_header_parsed(*transfer, generation);
  }
  if (completed_data.has_value()) {
    on_transfer_complete(transfer, std::move(completed_data.value()),
                         generation);
  }
}

std::shared_ptr<FountainSessionRx::ActiveTransfer>
FountainSessionRx::find_or_create_transfer(const Droplet& droplet,
                                           uint64_t& generation) {
  const auto key = TransferKey::from_droplet(droplet);
  std::lock_guard<std::mutex> guard(m_session_mutex);
  if (m_session_complete) {
    return nullptr;
  }
  generation = m_generation;
  std::shared_ptr<ActiveTransfer> transfer;
  auto it = m_transfers.find(key);
  if (it != m_transfers.end()) {
    transfer = it->second;
  } else {
    if (m_transfers.size() >= m_options.max_active_transfers) {
      evict_least_recently_used_locked();
    }
    transfer = std::make_shared<ActiveTransfer>(key, m_scheme_factory);
    m_transfers.emplace(key, transfer);
    m_console->debug("New transfer K:{} P:{} chunk_size:{} tag:{}",
                     key.num_chunks, key.padding, key.chunk_size, key.tag);
  }
  if (m_options.enable_dedup) {
    if (!transfer->seen_seeds.insert(droplet.seed).second) {
      m_n_duplicates_skipped++;
      return nullptr;
    }
    transfer->seen_seeds_order.push_back(droplet.seed);
    while (transfer->seen_seeds_order.size() > m_options.dedup_max_entries) {
      transfer->seen_seeds.erase(transfer->seen_seeds_order.front());
      transfer->seen_seeds_order.pop_front();
    }
  }
  transfer->last_used = ++m_use_counter;
  return transfer;
}

void FountainSessionRx::evict_least_recently_used_locked() {
  auto oldest = m_transfers.begin();
  for (auto it = m_transfers.begin(); it != m_transfers.end(); ++it) {
    if (it->second->last_used < oldest->second->last_used) {
      oldest = it;
    }
  }
  if (oldest == m_transfers.end()) {
    return;
  }
  m_console->warn("Too many active transfers, dropping K:{} ({}/{} resolved)",
                  oldest->first.num_chunks, oldest->second->resolved.load(),
                  oldest->first.num_chunks);
  m_n_evicted_transfers++;
  m_transfers.erase(oldest);
}

bool FountainSessionRx::try_parse_header(ActiveTransfer& transfer) {
  const auto& decoder = transfer.decoder;
  const std::size_t file_size =
      static_cast<std::size_t>(decoder.num_chunks()) * decoder.chunk_size() -
      decoder.padding();
  const std::size_t max_prefix = std::min(file_size, MAX_FILE_HEADER_SIZE);
  // contiguous prefix of resolved chunks
  std::vector<uint8_t> prefix;
  for (uint32_t i = 0; i < decoder.num_chunks() && prefix.size() < max_prefix;
       i++) {
    const auto chunk = decoder.get_chunk(i);
    if (!chunk.has_value()) {
      break;
    }
    prefix.insert(prefix.end(), chunk->begin(), chunk->end());
  }
  if (prefix.empty()) {
    return false;
  }
  prefix.resize(std::min(prefix.size(), max_prefix));
  auto header = parse_file_header(prefix.data(), prefix.size());
  if (!header.has_value()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> guard(transfer.header_mutex);
    transfer.header = std::move(header);
  }
  transfer.header_known = true;
  return true;
}

void FountainSessionRx::on_header_parsed(ActiveTransfer& transfer,
                                         uint64_t generation) {
  std::optional<uint32_t> total;
  {
    std::lock_guard<std::mutex> guard(transfer.header_mutex);
    const auto& header = transfer.header.value();
    m_console->info("Receiving {} {}/{} K:{}", header.name,
                    header.index.value_or(0), header.total.value_or(0),
                    transfer.key.num_chunks);
    total = header.total;
  }
  if (!total.has_value()) {
    return;
  }
  bool completed;
  uint32_t n_received;
  {
    std::lock_guard<std::mutex> guard(m_session_mutex);
    if (generation != m_generation) {
      return;
    }
    completed = set_expected_files_locked(total.value(), "file header");
    n_received = m_n_files_received;
  }
  if (completed && m_session_complete_cb) {
    m_session_complete_cb(n_received);
  }
}

void FountainSessionRx::on_transfer_conflict(
    const std::shared_ptr<ActiveTransfer>& transfer, uint64_t generation) {
  std::lock_guard<std::mutex> guard(m_session_mutex);
  if (generation != m_generation) {
    return;
  }
  auto it = m_transfers.find(transfer->key);
  if (it != m_transfers.end() && it->second == transfer) {
    m_transfers.erase(it);
  }
  m_n_conflicts++;
  m_console->warn(
      "Droplets of different files mixed in K:{} tag:{}, dropping transfer "
      "({}/{} resolved)",
      transfer->key.num_chunks, transfer->key.tag, transfer->resolved.load(),
      transfer->key.num_chunks);
}

void FountainSessionRx::on_transfer_complete(
    const std::shared_ptr<ActiveTransfer>& transfer, std::vector<uint8_t> data,
    uint64_t generation) {
  ContentHash hash{};
  crypto_generichash(hash.data(), hash.size(), data.data(), data.size(),
                     nullptr, 0);
  const auto header = parse_file_header(data.data(), data.size());
  const std::size_t header_size = header.has_value() ? header->header_size : 0;
  bool deliver = false;
  bool session_completed = false;
  uint32_t n_received = 0;
  {
    std::lock_guard<std::mutex> guard(m_session_mutex);
    if (generation != m_generation) {
      m_console->debug("Discarding file completed across a reset");
      return;
    }
    auto it = m_transfers.find(transfer->key);
    if (it != m_transfers.end() && it->second == transfer) {
      m_transfers.erase(it);
    }
    if (header.has_value() &&
        !verify_file_digest(header.value(), data.data() + header_size,
                            data.size() - header_size)) {
      m_n_conflicts++;
      m_console->warn("Digest mismatch for {} K:{} tag:{}, dropping transfer",
                      header->name, transfer->key.num_chunks,
                      transfer->key.tag);
      return;
    }
    if (m_options.skip_duplicate_files && m_delivered_files.count(hash) > 0) {
      m_n_duplicate_files++;
      m_console->debug("Skipping already received file K:{}",
                       transfer->key.num_chunks);
      return;
    }
    m_delivered_files.insert(hash);
    if (header.has_value() && header->name == LEGACY_MANIFEST_FILENAME) {
      const auto n_files =
          parse_file_count(data.data() + header_size, data.size() - header_size);
      if (!n_files.has_value()) {
        m_console->warn("Invalid {} file", LEGACY_MANIFEST_FILENAME);
        return;
      }
      session_completed =
          set_expected_files_locked(n_files.value(), "manifest file");
    } else if (m_expected_files.has_value() &&
               m_n_files_received >= m_expected_files.value()) {
      m_console->info("Already got all {} files, ignoring extra file",
                      m_expected_files.value());
      return;
    } else {
      m_n_files_received++;
      deliver = true;
      session_completed = check_session_complete_locked();
    }
    n_received = m_n_files_received;
  }
  if (deliver) {
    m_n_files_delivered++;
    ReceivedFile file;
    const std::string fallback =
        "fountain_output_" + std::to_string(n_received);
    if (header.has_value()) {
      file.name = sanitize_file_name(header->name, fallback);
      file.index = header->index;
      file.total = header->total;
    } else {
      file.name = fallback;
    }
    data.erase(data.begin(), data.begin() + header_size);
    file.data = std::move(data);
    m_console->info("Received {} ({})", file.name,
                    StringHelper::memorySizeReadable(file.data.size()));
    if (m_out_cb) {
      m_out_cb(file);
    }
  }
  if (session_completed && m_session_complete_cb) {
    m_session_complete_cb(n_received);
  }
}

bool FountainSessionRx::set_expected_files_locked(uint32_t n_files,
                                                  const char* source) {
  if (m_expected_files.has_value()) {
    if (m_expected_files.value() != n_files) {
      m_console->warn("Ignoring {} announcing {} files, expecting {}", source,
                      n_files, m_expected_files.value());
    }
    return false;
  }
  m_expected_files = n_files;
  m_console->info("Expecting {} file(s) ({})", n_files, source);
  return check_session_complete_locked();
}

bool FountainSessionRx::check_session_complete_locked() {
  if (m_session_complete || !m_expected_files.has_value()) {
    return false;
  }
  if (m_n_files_received < m_expected_files.value()) {
    return false;
  }
  m_session_complete = true;
  m_console->info("Session complete, {} file(s)", m_n_files_received);
  return true;
}

void FountainSessionRx::reset() {
  std::lock_guard<std::mutex> guard(m_session_mutex);
  m_transfers.clear();
  m_generation++;
  m_expected_files = std::nullopt;
  m_n_files_received = 0;
  m_session_complete = false;
  m_delivered_files.clear();
  int n_discarded = 0;
  if (m_candidate_queue) {
    n_discarded = m_candidate_queue->clear();
  }
  m_console->debug("Session reset, discarded {} queued candidates",
                   n_discarded);
}

std::vector<TransferProgress> FountainSessionRx::get_progress() {
  std::vector<TransferProgress> ret;
  std::lock_guard<std::mutex> guard(m_session_mutex);
  ret.reserve(m_transfers.size());
  for (const auto& [key, transfer] : m_transfers) {
    TransferProgress progress;
    progress.key = key;
    progress.resolved = transfer->resolved;
    progress.num_chunks = key.num_chunks;
    if (transfer->header_known) {
      std::lock_guard<std::mutex> header_guard(transfer->header_mutex);
      progress.name = sanitize_file_name(transfer->header->name, "");
      progress.index = transfer->header->index;
    }
    ret.push_back(std::move(progress));
  }
  return ret;
}

std::optional<uint32_t> FountainSessionRx::get_expected_file_count() {
  std::lock_guard<std::mutex> guard(m_session_mutex);
  return m_expected_files;
}

uint32_t FountainSessionRx::get_n_files_received() {
  std::lock_guard<std::mutex> guard(m_session_mutex);
  return m_n_files_received;
}

bool FountainSessionRx::is_session_complete() {
  std::lock_guard<std::mutex> guard(m_session_mutex);
  return m_session_complete;
}

void FountainSessionRx::add_ingest_time(std::chrono::nanoseconds delta) {
  std::lock_guard<std::mutex> guard(m_stats_mutex);
  m_ingest_time.add(delta);
  if (m_ingest_time.get_delta_since_last_reset() > std::chrono::seconds(1)) {
    m_curr_ingest_time = m_ingest_time.getMinMaxAvg();
    m_console->debug("Ingest time {}", m_ingest_time.getAvgReadable());
    m_ingest_time.reset();
  }
}

FountainSessionRx::Statistics FountainSessionRx::get_latest_stats() {
  FountainSessionRx::Statistics ret;
  ret.n_input_candidates = m_n_input_candidates;
  ret.n_malformed = m_n_malformed;
  ret.n_duplicates_skipped = m_n_duplicates_skipped;
  ret.n_inconsistent = m_n_inconsistent;
  ret.n_queue_dropped =
      m_candidate_queue ? m_candidate_queue->get_n_dropped() : 0;
  ret.n_ingested = m_n_ingested;
  ret.n_files_delivered = m_n_files_delivered;
  ret.n_duplicate_files = m_n_duplicate_files;
  ret.n_evicted_transfers = m_n_evicted_transfers;
  ret.n_conflicts = m_n_conflicts;
  std::lock_guard<std::mutex> guard(m_stats_mutex);
  ret.curr_droplets_per_second =
      m_droplets_per_second_calculator.get_last_or_recalculate(
          m_n_ingested, std::chrono::seconds(2));
  ret.curr_ingest_time = m_curr_ingest_time;
  return ret;
}

}  // namespace qrfountain
