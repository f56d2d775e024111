#include "qrfountain_spdlog.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <mutex>

static bool debug_log_requested() {
  if (std::getenv("QRFOUNTAIN_DEBUG") != nullptr) {
    return true;
  }
  std::ifstream file("/tmp/qrfountain_debug.txt");
  return file.good();
}

std::shared_ptr<spdlog::logger> qrfountain::log::create_or_get(
    const std::string& logger_name) {
  static std::mutex logger_mutex2{};
  std::lock_guard<std::mutex> guard(logger_mutex2);
  auto ret = spdlog::get(logger_name);
  if (ret == nullptr) {
    auto created = spdlog::stdout_color_mt(logger_name);
    if (debug_log_requested()) {
      created->set_level(spdlog::level::debug);
    } else {
      created->set_level(spdlog::level::warn);
    }
    assert(created);
    return created;
  }
  return ret;
}

std::shared_ptr<spdlog::logger> qrfountain::log::get_default() {
  return create_or_get("qrfountain");
}
