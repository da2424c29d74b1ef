#include "event_sink.hpp"

#include <map>

EventFanout::EventFanout(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

EventSinkHandle EventFanout::add(std::shared_ptr<EventSink> sink) {
  if(!sink) return 0;
  std::lock_guard<std::mutex> lock(m_);
  auto handle = next_handle_++;
  sinks_.emplace(handle, std::move(sink));
  return handle;
}

void EventFanout::remove(EventSinkHandle handle) {
  std::lock_guard<std::mutex> lock(m_);
  sinks_.erase(handle);
}

std::size_t EventFanout::size() const {
  std::lock_guard<std::mutex> lock(m_);
  return sinks_.size();
}

template<typename Fn>
void EventFanout::for_each_sink(const char* event, Fn&& fn) {
  // registration order, taken as a copy so sinks may add/remove from a callback
  std::map<EventSinkHandle, std::shared_ptr<EventSink>> targets;
  {
    std::lock_guard<std::mutex> lock(m_);
    targets.insert(sinks_.begin(), sinks_.end());
  }
  for(auto& [handle, sink] : targets) {
    try {
      fn(*sink);
    } catch(const std::exception& e) {
      log_error(logger_.get(), "event sink {} failed on {}: {}", handle, event, e.what());
    }
  }
}

void EventFanout::on_peer_discovered(const PeerRecord& peer) {
  for_each_sink("peer-discovered", [&](EventSink& s){ s.on_peer_discovered(peer); });
}

void EventFanout::on_peer_lost(const PeerRecord& peer) {
  for_each_sink("peer-lost", [&](EventSink& s){ s.on_peer_lost(peer); });
}

void EventFanout::on_peer_list_updated(const std::vector<PeerRecord>& peers) {
  for_each_sink("peer-list-updated", [&](EventSink& s){ s.on_peer_list_updated(peers); });
}

void EventFanout::on_transfer_update(const TransferRecord& record) {
  for_each_sink("transfer-update", [&](EventSink& s){ s.on_transfer_update(record); });
}

void EventFanout::on_transfer_progress(const TransferRecord& record) {
  for_each_sink("transfer-progress", [&](EventSink& s){ s.on_transfer_progress(record); });
}
