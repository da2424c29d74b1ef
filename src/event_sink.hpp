#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "peer_roster.hpp"
#include "transfer_registry.hpp"

// Outward notifications. Calls arrive on worker threads; implementations
// must not block for long. Default implementations ignore the event.
class EventSink {
public:
  virtual ~EventSink() = default;

  virtual void on_peer_discovered(const PeerRecord& /*peer*/) {}
  virtual void on_peer_lost(const PeerRecord& /*peer*/) {}
  virtual void on_peer_list_updated(const std::vector<PeerRecord>& /*peers*/) {}
  virtual void on_transfer_update(const TransferRecord& /*record*/) {}
  // Partial record: id, bytes_transferred, file_size, speed_bps.
  virtual void on_transfer_progress(const TransferRecord& /*record*/) {}
};

using EventSinkHandle = std::size_t;

// Forwards every notification to the registered sinks. A sink that throws
// is logged and skipped; the remaining sinks still run.
class EventFanout : public EventSink {
public:
  explicit EventFanout(std::shared_ptr<Logger> logger = nullptr);

  EventSinkHandle add(std::shared_ptr<EventSink> sink);
  void remove(EventSinkHandle handle);
  std::size_t size() const;

  void on_peer_discovered(const PeerRecord& peer) override;
  void on_peer_lost(const PeerRecord& peer) override;
  void on_peer_list_updated(const std::vector<PeerRecord>& peers) override;
  void on_transfer_update(const TransferRecord& record) override;
  void on_transfer_progress(const TransferRecord& record) override;

private:
  template<typename Fn>
  void for_each_sink(const char* event, Fn&& fn);

  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::unordered_map<EventSinkHandle, std::shared_ptr<EventSink>> sinks_;
  EventSinkHandle next_handle_ = 1;
};
