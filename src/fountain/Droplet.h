#ifndef QRFOUNTAIN_DROPLET_H
#define QRFOUNTAIN_DROPLET_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "FountainConstants.hpp"

namespace qrfountain {

// One erasure coded packet. The payload is the XOR of all chunks the
// DropletScheme selects for (seed,num_chunks).
struct Droplet {
  uint32_t seed = 0;
  // K, the same for all droplets of one transfer
  uint32_t num_chunks = 0;
  // n of zero bytes appended to the last chunk
  uint32_t padding = 0;
  std::vector<uint8_t> payload;
  [[nodiscard]] bool is_manifest() const { return seed == MANIFEST_SEED; }
  [[nodiscard]] uint8_t transfer_tag() const {
    return static_cast<uint8_t>(seed >> SEED_TAG_SHIFT);
  }
  [[nodiscard]] uint32_t chunk_size() const {
    return static_cast<uint32_t>(payload.size());
  }
  bool operator==(const Droplet& other) const {
    return seed == other.seed && num_chunks == other.num_chunks &&
           padding == other.padding && payload == other.payload;
  }
};

enum class ParseError {
  NONE = 0,
  // not exactly seed|num_chunks|padding|payload
  WRONG_FIELD_COUNT,
  // header field empty, not decimal or out of range
  BAD_NUMBER,
  // payload is not valid base64 or empty
  BAD_PAYLOAD,
  // fields are well formed but describe an impossible (or too big) transfer
  BAD_PARAMETERS,
};
std::string parse_error_as_string(ParseError error);

struct ParseResult {
  std::optional<Droplet> droplet;
  ParseError error = ParseError::NONE;
  [[nodiscard]] bool ok() const { return droplet.has_value(); }
};

// Text safe wire representation seed|num_chunks|padding|base64(payload)
std::string droplet_to_wire(const Droplet& droplet);
// Never throws, malformed input is reported via ParseResult::error
ParseResult droplet_from_wire(const std::string& wire);

// Manifest droplet announcing @param n_files files
Droplet make_manifest_droplet(uint32_t n_files);
// n of files announced by a manifest droplet, nullopt if the payload is
// not a decimal number (trailing zero bytes / whitespace are ignored)
std::optional<uint32_t> manifest_file_count(const Droplet& droplet);
// Same for the raw text, used for the legacy manifest file as well
std::optional<uint32_t> parse_file_count(const uint8_t* data, std::size_t len);

}  // namespace qrfountain

#endif  // QRFOUNTAIN_DROPLET_H
