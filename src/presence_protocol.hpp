#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "broadcast_channel.hpp"
#include "event_sink.hpp"
#include "log.hpp"
#include "peer_roster.hpp"

struct PresenceConfig {
  std::chrono::seconds announce_interval{30};
  uint64_t peer_timeout_seconds = 90;
};

// Announce/listen loop for one node. The timer and the inbound receive are
// both outstanding on one strand. Roster updates complete before any event
// is raised; events never run under a roster lock.
class PresenceProtocol : public std::enable_shared_from_this<PresenceProtocol> {
public:
  using EpochClock = std::function<uint64_t()>;

  PresenceProtocol(asio::io_context& io,
                   std::shared_ptr<BroadcastChannel> channel,
                   PeerRoster& roster,
                   EventSink& events,
                   std::string device_id,
                   std::string display_name,
                   PresenceConfig config = {},
                   std::shared_ptr<Logger> logger = nullptr,
                   EpochClock clock = nullptr);

  // First tick fires immediately.
  void start();
  // Cancels the timer and closes the channel; the receive loop then ends.
  void stop();
  bool running() const { return running_.load(); }

  // Single tick steps, also used directly by tests.
  void announce();
  std::size_t expire_stale_peers();
  void handle_payload(const std::string& payload);

  const std::string& device_id() const { return device_id_; }
  const std::string& display_name() const { return display_name_; }
  const PresenceConfig& config() const { return config_; }

private:
  void schedule_tick(std::chrono::steady_clock::duration delay);
  void on_tick();
  void do_receive();

  asio::strand<asio::io_context::executor_type> strand_;
  asio::steady_timer timer_;
  std::shared_ptr<BroadcastChannel> channel_;
  PeerRoster& roster_;
  EventSink& events_;
  std::string device_id_;
  std::string display_name_;
  PresenceConfig config_;
  std::shared_ptr<Logger> logger_;
  EpochClock clock_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
};
