#ifndef QRFOUNTAIN_STRINGHELPER_H
#define QRFOUNTAIN_STRINGHELPER_H

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

class StringHelper {
 public:
  template <typename T>
  static std::string vectorAsString(const std::vector<T>& v) {
    std::stringstream ss;
    ss << "[";
    for (std::size_t i = 0; i < v.size(); i++) {
      ss << std::to_string(v[i]);
      if (i != v.size() - 1) {
        ss << ",";
      }
    }
    ss << "]";
    return ss.str();
  }

  static std::string memorySizeReadable(const size_t sizeBytes) {
    // more than one MB
    if (sizeBytes > 1024 * 1024) {
      float sizeMB = (float)sizeBytes / 1024.0 / 1024.0;
      return std::to_string(sizeMB) + "mB";
    }
    // more than one KB
    if (sizeBytes > 1024) {
      float sizeKB = (float)sizeBytes / 1024.0;
      return std::to_string(sizeKB) + "kB";
    }
    return std::to_string(sizeBytes) + "B";
  }

  // [#########.....] 64% (16/25)
  static std::string progress_bar(uint64_t done, uint64_t total,
                                  int width = 30) {
    if (total == 0) {
      return "";
    }
    if (done > total) done = total;
    const int filled = static_cast<int>(width * done / total);
    std::stringstream ss;
    ss << "[" << std::string(filled, '#') << std::string(width - filled, '.')
       << "] " << (done * 100 / total) << "% (" << done << "/" << total
       << ")";
    return ss.str();
  }
};

#endif  // QRFOUNTAIN_STRINGHELPER_H
