#include "GlassDecoder.h"

#include <algorithm>
#include <cassert>
#include <deque>
#include <utility>

#include "../qrfountain_spdlog.h"

namespace qrfountain {

static void xor_into(uint8_t* dst, const uint8_t* src, std::size_t len) {
  for (std::size_t i = 0; i < len; i++) {
    dst[i] ^= src[i];
  }
}

std::string ingest_status_as_string(const IngestStatus status) {
  switch (status) {
    case IngestStatus::RESOLVED:
      return "RESOLVED";
    case IngestStatus::PENDING:
      return "PENDING";
    case IngestStatus::REDUNDANT:
      return "REDUNDANT";
    case IngestStatus::INCONSISTENT_PARAMETERS:
      return "INCONSISTENT_PARAMETERS";
    case IngestStatus::NOT_A_DATA_DROPLET:
      return "NOT_A_DATA_DROPLET";
    case IngestStatus::CONFLICT:
      return "CONFLICT";
  }
  return "UNKNOWN";
}

GlassDecoder::GlassDecoder(SCHEME_FACTORY scheme_factory)
    : m_scheme_factory(std::move(scheme_factory)) {
  assert(m_scheme_factory);
}

static bool is_all_zero(const std::vector<uint8_t>& data) {
  return std::all_of(data.begin(), data.end(),
                     [](uint8_t b) { return b == 0; });
}

void GlassDecoder::init_parameters(const Droplet& droplet) {
  m_num_chunks = droplet.num_chunks;
  m_padding = droplet.padding;
  m_chunk_size = droplet.chunk_size();
  m_scheme = m_scheme_factory(m_num_chunks);
  assert(m_scheme && m_scheme->num_chunks() == m_num_chunks);
}

bool GlassDecoder::matches_parameters(const Droplet& droplet) const {
  return droplet.num_chunks == m_num_chunks && droplet.padding == m_padding &&
         droplet.chunk_size() == m_chunk_size;
}

void GlassDecoder::mark_conflict(const uint32_t seed) {
  if (!m_conflict) {
    log::get_default()->debug("Droplet {} contradicts K:{} ({} resolved)",
                              seed, m_num_chunks, m_chunks.size());
  }
  m_conflict = true;
  m_stats.n_conflicts++;
}

IngestStatus GlassDecoder::ingest(const Droplet& droplet) {
  if (droplet.is_manifest()) {
    m_stats.n_rejected++;
    return IngestStatus::NOT_A_DATA_DROPLET;
  }
  if (!has_parameters()) {
    if (droplet.num_chunks == 0 || droplet.num_chunks > MAX_NUM_CHUNKS ||
        droplet.payload.empty() || droplet.padding >= droplet.chunk_size() ||
        static_cast<uint64_t>(droplet.num_chunks) * droplet.chunk_size() >
            MAX_TRANSFER_SIZE) {
      m_stats.n_rejected++;
      return IngestStatus::INCONSISTENT_PARAMETERS;
    }
    init_parameters(droplet);
  } else if (!matches_parameters(droplet)) {
    log::get_default()->debug(
        "Droplet K:{} P:{} S:{} does not match transfer K:{} P:{} S:{}",
        droplet.num_chunks, droplet.padding, droplet.chunk_size(),
        m_num_chunks, m_padding, m_chunk_size);
    m_stats.n_rejected++;
    return IngestStatus::INCONSISTENT_PARAMETERS;
  }
  if (m_conflict) {
    m_stats.n_rejected++;
    return IngestStatus::CONFLICT;
  }
  m_stats.n_ingested++;
  if (m_pending_by_seed.find(droplet.seed) != m_pending_by_seed.end()) {
    // same seed, same K -> same droplet, already stored
    m_stats.n_redundant++;
    return IngestStatus::REDUNDANT;
  }
  std::vector<uint32_t> unknown;
  std::vector<uint8_t> payload = droplet.payload;
  for (const auto idx : m_scheme->indices_for_seed(droplet.seed)) {
    const auto it = m_chunks.find(idx);
    if (it != m_chunks.end()) {
      xor_into(payload.data(), it->second.data(), m_chunk_size);
    } else {
      unknown.push_back(idx);
    }
  }
  if (unknown.empty()) {
    if (!is_all_zero(payload)) {
      mark_conflict(droplet.seed);
      return IngestStatus::CONFLICT;
    }
    m_stats.n_redundant++;
    return IngestStatus::REDUNDANT;
  }
  if (unknown.size() == 1) {
    if (!resolve_and_propagate(unknown[0], std::move(payload))) {
      return IngestStatus::CONFLICT;
    }
    return IngestStatus::RESOLVED;
  }
  const uint64_t id = m_next_pending_id++;
  for (const auto idx : unknown) {
    m_pending_by_chunk[idx].push_back(id);
  }
  m_pending_by_seed.emplace(droplet.seed, id);
  m_pending.emplace(id, PendingDroplet{droplet.seed, std::move(unknown),
                                       std::move(payload)});
  return IngestStatus::PENDING;
}

bool GlassDecoder::resolve_and_propagate(const uint32_t index,
                                         std::vector<uint8_t> data) {
  // (chunk index, chunk data, seed of the droplet that resolved it)
  struct Resolved {
    uint32_t index;
    std::vector<uint8_t> data;
    uint32_t seed;
  };
  std::deque<Resolved> worklist;
  worklist.push_back(Resolved{index, std::move(data), 0});
  bool first = true;
  while (!worklist.empty()) {
    Resolved item = std::move(worklist.front());
    worklist.pop_front();
    assert(item.data.size() == m_chunk_size);
    const auto known = m_chunks.find(item.index);
    if (known != m_chunks.end()) {
      // resolved in the meantime by another droplet of the worklist, both
      // have to agree
      if (known->second != item.data) {
        mark_conflict(item.seed);
        return false;
      }
      continue;
    }
    const auto& chunk =
        m_chunks.emplace(item.index, std::move(item.data)).first->second;
    if (!first) {
      m_stats.n_chunks_resolved_by_peeling++;
    }
    first = false;
    // every pending droplet that depends on this chunk gets reduced
    const auto by_chunk = m_pending_by_chunk.find(item.index);
    if (by_chunk == m_pending_by_chunk.end()) {
      continue;
    }
    const auto dependents = std::move(by_chunk->second);
    m_pending_by_chunk.erase(by_chunk);
    for (const auto id : dependents) {
      auto it = m_pending.find(id);
      if (it == m_pending.end()) continue;
      PendingDroplet& pending = it->second;
      pending.unknown.erase(std::remove(pending.unknown.begin(),
                                        pending.unknown.end(), item.index),
                            pending.unknown.end());
      xor_into(pending.payload.data(), chunk.data(), m_chunk_size);
      if (pending.unknown.size() > 1) {
        continue;
      }
      const uint32_t seed = pending.seed;
      if (pending.unknown.size() == 1) {
        worklist.push_back(
            Resolved{pending.unknown[0], std::move(pending.payload), seed});
      } else if (!is_all_zero(pending.payload)) {
        mark_conflict(seed);
        return false;
      }
      m_pending_by_seed.erase(seed);
      m_pending.erase(it);
    }
  }
  return true;
}

bool GlassDecoder::is_complete() const {
  return has_parameters() && !m_conflict && m_chunks.size() == m_num_chunks;
}

bool GlassDecoder::is_chunk_resolved(const uint32_t index) const {
  return m_chunks.find(index) != m_chunks.end();
}

std::optional<std::vector<uint8_t>> GlassDecoder::get_chunk(
    const uint32_t index) const {
  const auto it = m_chunks.find(index);
  if (it == m_chunks.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<uint8_t> GlassDecoder::reconstruct() const {
  if (!is_complete()) {
    throw ReconstructBeforeComplete(
        "reconstruct() with " + std::to_string(m_chunks.size()) + "/" +
        std::to_string(m_num_chunks) + " chunks resolved" +
        (m_conflict ? " (conflict)" : ""));
  }
  std::vector<uint8_t> ret;
  ret.reserve(static_cast<std::size_t>(m_num_chunks) * m_chunk_size);
  for (uint32_t i = 0; i < m_num_chunks; i++) {
    const auto& chunk = m_chunks.at(i);
    ret.insert(ret.end(), chunk.begin(), chunk.end());
  }
  assert(ret.size() > m_padding);
  ret.resize(ret.size() - m_padding);
  return ret;
}

}  // namespace qrfountain
