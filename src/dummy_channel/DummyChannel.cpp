#include "DummyChannel.h"

#include <iterator>
#include <stdexcept>
#include <utility>

#include "../fountain/FountainConstants.hpp"

namespace qrfountain {

DummyChannel::DummyChannel(Options options)
    : m_options(options), m_mt(options.seed) {
  if (m_options.reorder_window < 1) {
    throw std::invalid_argument("reorder_window must be >= 1");
  }
}

void DummyChannel::tx(std::string frame) {
  std::lock_guard<std::mutex> guard(m_mutex);
  m_stats.n_tx++;
  if (should(m_options.loss_percentage)) {
    m_stats.n_dropped++;
    return;
  }
  if (should(m_options.garble_percentage)) {
    // an extra delimiter always breaks the field count
    std::uniform_int_distribution<std::size_t> pos(0, frame.size());
    frame.insert(frame.begin() + pos(m_mt), WIRE_DELIMITER);
    m_stats.n_garbled++;
  }
  if (should(m_options.duplicate_percentage)) {
    m_in_flight.push_back(frame);
    m_stats.n_duplicated++;
  }
  m_in_flight.push_back(std::move(frame));
  while (m_in_flight.size() > static_cast<std::size_t>(m_options.reorder_window)) {
    release_random_in_flight();
  }
}

void DummyChannel::release_random_in_flight() {
  std::uniform_int_distribution<std::size_t> idx(0, m_in_flight.size() - 1);
  const auto it = m_in_flight.begin() + idx(m_mt);
  m_rx_queue.push_back(std::move(*it));
  m_in_flight.erase(it);
}

std::optional<std::string> DummyChannel::rx() {
  std::lock_guard<std::mutex> guard(m_mutex);
  if (m_rx_queue.empty()) {
    return std::nullopt;
  }
  auto ret = std::move(m_rx_queue.front());
  m_rx_queue.pop_front();
  return ret;
}

std::vector<std::string> DummyChannel::flush() {
  std::lock_guard<std::mutex> guard(m_mutex);
  while (!m_in_flight.empty()) {
    release_random_in_flight();
  }
  std::vector<std::string> ret(std::make_move_iterator(m_rx_queue.begin()),
                               std::make_move_iterator(m_rx_queue.end()));
  m_rx_queue.clear();
  return ret;
}

DummyChannel::Statistics DummyChannel::get_stats() {
  std::lock_guard<std::mutex> guard(m_mutex);
  return m_stats;
}

}  // namespace qrfountain
