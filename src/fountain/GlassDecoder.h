#ifndef QRFOUNTAIN_GLASS_DECODER_H
#define QRFOUNTAIN_GLASS_DECODER_H

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "ChunkSelector.h"
#include "Droplet.h"

namespace qrfountain {

enum class IngestStatus {
  // at least one new chunk was resolved
  RESOLVED = 0,
  // stored, more than one dependency is still unknown
  PENDING,
  // no new information (all dependencies known, duplicate, degree 0)
  REDUNDANT,
  // K, padding or chunk size disagree with this transfer, dropped
  INCONSISTENT_PARAMETERS,
  // manifest droplets carry no chunk data
  NOT_A_DATA_DROPLET,
  // the droplet contradicts the chunks known so far, it was not made from
  // the same data. The decoder is unusable from now on.
  CONFLICT,
};
std::string ingest_status_as_string(IngestStatus status);

// Thrown by reconstruct() if not all chunks are resolved yet
class ReconstructBeforeComplete : public std::logic_error {
 public:
  explicit ReconstructBeforeComplete(const std::string& what)
      : std::logic_error(what) {}
};

/**
 * LT (peeling) decoder for one transfer. Takes droplets in any order, with
 * any amount of duplicates. Every droplet is reduced by the chunks that are
 * already known; a droplet with exactly one unknown chunk left resolves that
 * chunk, which in turn can reduce other stored droplets to one unknown
 * (handled via a worklist, not recursion).
 * Droplets without unknowns left have to reduce to all zero, otherwise they
 * stem from other data (another file of the same size) and the decoder
 * reports a conflict.
 * K, padding and chunk size are learned from the first droplet. Memory grows
 * with the n of resolved chunks / stored droplets, not with K.
 * Not thread safe.
 */
class GlassDecoder {
 public:
  explicit GlassDecoder(
      SCHEME_FACTORY scheme_factory = make_robust_soliton_scheme_factory());
  GlassDecoder(const GlassDecoder&) = delete;
  GlassDecoder& operator=(const GlassDecoder&) = delete;

  IngestStatus ingest(const Droplet& droplet);
  [[nodiscard]] bool is_complete() const;
  // padded chunks concatenated in order, padding removed.
  // Throws ReconstructBeforeComplete unless is_complete()
  std::vector<uint8_t> reconstruct() const;

  [[nodiscard]] bool has_parameters() const { return m_scheme != nullptr; }
  [[nodiscard]] bool has_conflict() const { return m_conflict; }
  [[nodiscard]] uint32_t num_chunks() const { return m_num_chunks; }
  [[nodiscard]] uint32_t padding() const { return m_padding; }
  [[nodiscard]] uint32_t chunk_size() const { return m_chunk_size; }
  [[nodiscard]] uint32_t resolved_count() const {
    return static_cast<uint32_t>(m_chunks.size());
  }
  [[nodiscard]] std::size_t pending_count() const { return m_pending.size(); }
  bool is_chunk_resolved(uint32_t index) const;
  // Data of a single resolved chunk (with padding, if it is the last one)
  std::optional<std::vector<uint8_t>> get_chunk(uint32_t index) const;

  struct Statistics {
    uint64_t n_ingested = 0;
    uint64_t n_redundant = 0;
    uint64_t n_rejected = 0;
    // chunks resolved by propagation through stored droplets
    uint64_t n_chunks_resolved_by_peeling = 0;
    uint64_t n_conflicts = 0;
  };
  Statistics get_latest_stats() const { return m_stats; }

 private:
  struct PendingDroplet {
    uint32_t seed;
    // still unknown chunk indices
    std::vector<uint32_t> unknown;
    // droplet payload with all known chunks XORed out
    std::vector<uint8_t> payload;
  };
  SCHEME_FACTORY m_scheme_factory;
  std::shared_ptr<const DropletScheme> m_scheme = nullptr;
  uint32_t m_num_chunks = 0;
  uint32_t m_padding = 0;
  uint32_t m_chunk_size = 0;
  bool m_conflict = false;
  Statistics m_stats{};
  // resolved chunks only
  std::unordered_map<uint32_t, std::vector<uint8_t>> m_chunks;
  uint64_t m_next_pending_id = 0;
  std::unordered_map<uint64_t, PendingDroplet> m_pending;
  // chunk index -> ids of pending droplets depending on it. Ids of already
  // removed droplets are skipped (and dropped) lazily.
  std::unordered_map<uint32_t, std::vector<uint64_t>> m_pending_by_chunk;
  std::unordered_map<uint32_t, uint64_t> m_pending_by_seed;
  void init_parameters(const Droplet& droplet);
  bool matches_parameters(const Droplet& droplet) const;
  // resolves the chunk and peels everything that follows from it. Returns
  // false on a conflict.
  bool resolve_and_propagate(uint32_t index, std::vector<uint8_t> data);
  void mark_conflict(uint32_t seed);
};

}  // namespace qrfountain

#endif  // QRFOUNTAIN_GLASS_DECODER_H
