#include "Droplet.h"

#include <sodium.h>

#include <cctype>
#include <limits>
#include <utility>

namespace qrfountain {

// Parses a non-empty, digits only, decimal uint32_t
static std::optional<uint32_t> parse_u32(const std::string& s, std::size_t begin,
                                         std::size_t end) {
  if (begin >= end || end - begin > 10) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (std::size_t i = begin; i < end; i++) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (!std::isdigit(c)) {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  if (value > std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

static ParseResult make_error(ParseError error) {
  ParseResult ret;
  ret.error = error;
  return ret;
}

std::string parse_error_as_string(const ParseError error) {
  switch (error) {
    case ParseError::NONE:
      return "NONE";
    case ParseError::WRONG_FIELD_COUNT:
      return "WRONG_FIELD_COUNT";
    case ParseError::BAD_NUMBER:
      return "BAD_NUMBER";
    case ParseError::BAD_PAYLOAD:
      return "BAD_PAYLOAD";
    case ParseError::BAD_PARAMETERS:
      return "BAD_PARAMETERS";
  }
  return "UNKNOWN";
}

std::string droplet_to_wire(const Droplet& droplet) {
  const std::size_t b64_maxlen = sodium_base64_ENCODED_LEN(
      droplet.payload.size(), sodium_base64_VARIANT_ORIGINAL);
  std::string b64(b64_maxlen, '\0');
  sodium_bin2base64(b64.data(), b64_maxlen, droplet.payload.data(),
                    droplet.payload.size(), sodium_base64_VARIANT_ORIGINAL);
  // sodium writes a terminating 0 byte
  b64.resize(b64_maxlen - 1);
  std::string ret = std::to_string(droplet.seed);
  ret += WIRE_DELIMITER;
  ret += std::to_string(droplet.num_chunks);
  ret += WIRE_DELIMITER;
  ret += std::to_string(droplet.padding);
  ret += WIRE_DELIMITER;
  ret += b64;
  return ret;
}

ParseResult droplet_from_wire(const std::string& wire) {
  // find the 3 delimiters, the payload itself never contains one
  std::size_t pos[WIRE_N_FIELDS - 1];
  std::size_t search_from = 0;
  for (auto& p : pos) {
    p = wire.find(WIRE_DELIMITER, search_from);
    if (p == std::string::npos) {
      return make_error(ParseError::WRONG_FIELD_COUNT);
    }
    search_from = p + 1;
  }
  if (wire.find(WIRE_DELIMITER, search_from) != std::string::npos) {
    return make_error(ParseError::WRONG_FIELD_COUNT);
  }
  const auto seed = parse_u32(wire, 0, pos[0]);
  const auto num_chunks = parse_u32(wire, pos[0] + 1, pos[1]);
  const auto padding = parse_u32(wire, pos[1] + 1, pos[2]);
  if (!seed.has_value() || !num_chunks.has_value() || !padding.has_value()) {
    return make_error(ParseError::BAD_NUMBER);
  }
  const std::size_t b64_begin = pos[2] + 1;
  const std::size_t b64_len = wire.size() - b64_begin;
  if (b64_len == 0) {
    return make_error(ParseError::BAD_PAYLOAD);
  }
  std::vector<uint8_t> payload(b64_len);
  std::size_t payload_len = 0;
  if (sodium_base642bin(payload.data(), payload.size(),
                        wire.data() + b64_begin, b64_len, nullptr,
                        &payload_len, nullptr,
                        sodium_base64_VARIANT_ORIGINAL) != 0 ||
      payload_len == 0) {
    return make_error(ParseError::BAD_PAYLOAD);
  }
  payload.resize(payload_len);
  if (num_chunks.value() == 0 || num_chunks.value() > MAX_NUM_CHUNKS) {
    return make_error(ParseError::BAD_PARAMETERS);
  }
  if (seed.value() != MANIFEST_SEED &&
      (padding.value() >= payload_len ||
       static_cast<uint64_t>(num_chunks.value()) * payload_len >
           MAX_TRANSFER_SIZE)) {
    return make_error(ParseError::BAD_PARAMETERS);
  }
  ParseResult ret;
  ret.droplet = Droplet{seed.value(), num_chunks.value(), padding.value(),
                        std::move(payload)};
  return ret;
}

Droplet make_manifest_droplet(const uint32_t n_files) {
  const std::string text = std::to_string(n_files);
  Droplet ret;
  ret.seed = MANIFEST_SEED;
  ret.num_chunks = 1;
  ret.padding = 0;
  ret.payload.assign(text.begin(), text.end());
  return ret;
}

std::optional<uint32_t> parse_file_count(const uint8_t* data,
                                         const std::size_t len) {
  std::string text(reinterpret_cast<const char*>(data), len);
  while (!text.empty() &&
         (text.back() == '\0' ||
          std::isspace(static_cast<unsigned char>(text.back())))) {
    text.pop_back();
  }
  std::size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin]))) {
    begin++;
  }
  return parse_u32(text, begin, text.size());
}

std::optional<uint32_t> manifest_file_count(const Droplet& droplet) {
  if (!droplet.is_manifest()) {
    return std::nullopt;
  }
  return parse_file_count(droplet.payload.data(), droplet.payload.size());
}

}  // namespace qrfountain
