#ifndef QRFOUNTAIN_SRC_QRFOUNTAIN_SPDLOG_H_
#define QRFOUNTAIN_SRC_QRFOUNTAIN_SPDLOG_H_

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace qrfountain::log {

// Debug level is enabled if QRFOUNTAIN_DEBUG is set or
// /tmp/qrfountain_debug.txt exists, warn otherwise
std::shared_ptr<spdlog::logger> create_or_get(const std::string& logger_name);

std::shared_ptr<spdlog::logger> get_default();

}  // namespace qrfountain::log
#endif  // QRFOUNTAIN_SRC_QRFOUNTAIN_SPDLOG_H_
