#ifndef QRFOUNTAIN_FILE_FRAMING_H
#define QRFOUNTAIN_FILE_FRAMING_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qrfountain {

// Each transferred file starts with a text header
// name|index|total|digest\n
// followed by the raw (maybe compressed) file bytes. digest is the hex
// BLAKE2b-128 of these bytes. Older transmitters write name|index|total\n
// or just name\n .
struct FileHeader {
  std::string name;
  // 1-based position in a multi file transfer, if known
  std::optional<uint32_t> index;
  std::optional<uint32_t> total;
  // lowercase hex, FILE_DIGEST_HEX_LEN characters
  std::optional<std::string> digest;
  // n of bytes including the terminating newline
  std::size_t header_size = 0;
};

// Headers longer than this are not headers
static constexpr std::size_t MAX_FILE_HEADER_SIZE = 4096;
static constexpr std::size_t FILE_DIGEST_BYTES = 16;
static constexpr std::size_t FILE_DIGEST_HEX_LEN = FILE_DIGEST_BYTES * 2;

// requires sodium_init()
std::string compute_file_digest(const uint8_t* data, std::size_t len);
std::string compute_file_digest(const std::vector<uint8_t>& body);
// True if the header carries no digest or the digest matches the body
bool verify_file_digest(const FileHeader& header, const uint8_t* body,
                        std::size_t len);

std::vector<uint8_t> build_framed_payload(const std::string& name,
                                          uint32_t index, uint32_t total,
                                          const std::vector<uint8_t>& body);
// Only the file name, as used by the single file transmitter
std::vector<uint8_t> build_framed_payload(const std::string& name,
                                          const std::vector<uint8_t>& body);

// Parses the header at the beginning of @param data. Returns nullopt if
// there is no newline within the first MAX_FILE_HEADER_SIZE bytes (or
// within len, if the data is only a prefix of the file).
std::optional<FileHeader> parse_file_header(const uint8_t* data,
                                            std::size_t len);

// Last path component only, never empty (returns fallback instead)
std::string sanitize_file_name(const std::string& name,
                               const std::string& fallback);

}  // namespace qrfountain

#endif  // QRFOUNTAIN_FILE_FRAMING_H
