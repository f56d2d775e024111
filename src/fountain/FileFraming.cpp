#include "FileFraming.h"

#include <sodium.h>

#include <algorithm>
#include <array>
#include <cctype>

#include "Droplet.h"
#include "FountainConstants.hpp"

namespace qrfountain {

static std::vector<uint8_t> concat(const std::string& header,
                                   const std::vector<uint8_t>& body) {
  std::vector<uint8_t> ret;
  ret.reserve(header.size() + body.size());
  ret.insert(ret.end(), header.begin(), header.end());
  ret.insert(ret.end(), body.begin(), body.end());
  return ret;
}

std::string compute_file_digest(const uint8_t* data, const std::size_t len) {
  std::array<uint8_t, FILE_DIGEST_BYTES> hash{};
  crypto_generichash(hash.data(), hash.size(), data, len, nullptr, 0);
  std::array<char, FILE_DIGEST_HEX_LEN + 1> hex{};
  sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
  return std::string(hex.data(), FILE_DIGEST_HEX_LEN);
}

std::string compute_file_digest(const std::vector<uint8_t>& body) {
  return compute_file_digest(body.data(), body.size());
}

bool verify_file_digest(const FileHeader& header, const uint8_t* body,
                        const std::size_t len) {
  if (!header.digest.has_value()) {
    return true;
  }
  return header.digest.value() == compute_file_digest(body, len);
}

std::vector<uint8_t> build_framed_payload(const std::string& name,
                                          const uint32_t index,
                                          const uint32_t total,
                                          const std::vector<uint8_t>& body) {
  std::string header = name;
  header += WIRE_DELIMITER;
  header += std::to_string(index);
  header += WIRE_DELIMITER;
  header += std::to_string(total);
  header += WIRE_DELIMITER;
  header += compute_file_digest(body);
  header += '\n';
  return concat(header, body);
}

std::vector<uint8_t> build_framed_payload(const std::string& name,
                                          const std::vector<uint8_t>& body) {
  return concat(name + "\n", body);
}

static std::string trim(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
    begin++;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    end--;
  }
  return s.substr(begin, end - begin);
}

static bool is_file_digest(const std::string& s) {
  return s.size() == FILE_DIGEST_HEX_LEN &&
         std::all_of(s.begin(), s.end(), [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

std::optional<FileHeader> parse_file_header(const uint8_t* data,
                                            std::size_t len) {
  len = std::min(len, MAX_FILE_HEADER_SIZE);
  const auto* end = data + len;
  const auto* newline = std::find(data, end, static_cast<uint8_t>('\n'));
  if (newline == end) {
    return std::nullopt;
  }
  FileHeader ret;
  ret.header_size = static_cast<std::size_t>(newline - data) + 1;
  const std::string text =
      trim(std::string(reinterpret_cast<const char*>(data),
                       static_cast<std::size_t>(newline - data)));
  // name|index|total[|digest], the name itself may contain the delimiter
  std::string rest = text;
  std::optional<std::string> digest;
  const auto digest_delim = rest.rfind(WIRE_DELIMITER);
  if (digest_delim != std::string::npos &&
      is_file_digest(rest.substr(digest_delim + 1))) {
    digest = rest.substr(digest_delim + 1);
    rest = rest.substr(0, digest_delim);
  }
  const auto last = rest.rfind(WIRE_DELIMITER);
  const auto second_last = last == std::string::npos || last == 0
                               ? std::string::npos
                               : rest.rfind(WIRE_DELIMITER, last - 1);
  if (second_last != std::string::npos) {
    const std::string index_str =
        rest.substr(second_last + 1, last - second_last - 1);
    const std::string total_str = rest.substr(last + 1);
    const auto index = parse_file_count(
        reinterpret_cast<const uint8_t*>(index_str.data()), index_str.size());
    const auto total = parse_file_count(
        reinterpret_cast<const uint8_t*>(total_str.data()), total_str.size());
    if (index.has_value() && total.has_value()) {
      ret.name = rest.substr(0, second_last);
      ret.index = index;
      ret.total = total;
      ret.digest = digest;
      return ret;
    }
  }
  // a digest without index and total is part of the name
  ret.name = text;
  return ret;
}

std::string sanitize_file_name(const std::string& name,
                               const std::string& fallback) {
  std::string ret = name;
  const auto slash = ret.find_last_of("/\\");
  if (slash != std::string::npos) {
    ret = ret.substr(slash + 1);
  }
  if (ret.empty() || ret == "." || ret == "..") {
    return fallback;
  }
  return ret;
}

}  // namespace qrfountain
