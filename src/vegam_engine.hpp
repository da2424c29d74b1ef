#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "broadcast_channel.hpp"
#include "event_sink.hpp"
#include "log.hpp"
#include "peer_roster.hpp"
#include "transfer_orchestrator.hpp"
#include "transfer_registry.hpp"

class VegamCLI;
class SettingsManager;
class PresenceProtocol;
class TcpBlobEndpoint;
class MemoryContentStore;

struct EndpointStatus {
  bool listening = false;
  std::string node_id;
  uint16_t port = 0;
  std::vector<std::string> addresses;
};

class VegamEngine {
public:
  struct Options {
    bool start_cli_thread = false;
    std::filesystem::path workspace_root = std::filesystem::current_path();
    // Presence over an in-process bus instead of UDP multicast.
    std::shared_ptr<LocalBroadcastBus> presence_bus;
  };

  VegamEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~VegamEngine();

  // Binds the endpoint and wires the node(s); throws VegamError on failure.
  void start();
  // Starts, runs the interactive shell on this thread, then stops.
  void run();
  // Starts and runs the worker threads; returns immediately.
  void start_background();
  void stop();

  bool execute_command(const std::string& line);

  // Command surface
  TicketInfo send_file(const std::filesystem::path& path);
  TicketInfo send_bytes(std::vector<char> data, const std::string& original_path);
  // Empty destination means download_dir.
  TransferRecord receive(const std::string& ticket, const std::filesystem::path& destination = {});
  std::optional<TransferRecord> transfer_status(const std::string& id) const;
  std::vector<TransferRecord> list_transfers() const;
  bool cancel_transfer(const std::string& id);
  std::vector<PeerRecord> list_peers() const;
  std::string device_name() const;
  std::string node_id() const;
  TicketMetadata parse_ticket_metadata(const std::string& ticket) const;
  EndpointStatus endpoint_status() const;

  bool has_debug_node() const { return static_cast<bool>(debug_node_); }
  std::string debug_node_id() const;
  // Sends from the debug node so the main node can receive locally.
  TicketInfo debug_send_file(const std::filesystem::path& path);

  EventSinkHandle add_event_sink(std::shared_ptr<EventSink> sink);
  void remove_event_sink(EventSinkHandle handle);

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t transfers = 0;
    std::size_t active_transfers = 0;
  };

  Stats stats() const;

  uint16_t listen_port() const;
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }
  std::filesystem::path download_dir() const;

private:
  struct Node {
    std::string device_id;
    std::string display_name;
    std::shared_ptr<MemoryContentStore> store;
    std::shared_ptr<TcpBlobEndpoint> endpoint;
    std::shared_ptr<TransferOrchestrator> orchestrator;
    std::shared_ptr<PresenceProtocol> presence;
  };

  std::unique_ptr<Node> make_node(const std::string& device_id,
                                  const std::string& display_name,
                                  uint16_t listen_port,
                                  const std::string& advertise_addr);
  std::shared_ptr<BroadcastChannel> make_presence_channel();
  std::string ensure_device_id();
  void start_node(Node& node);
  void stop_node(Node& node);
  void ensure_workspace() const;
  Node& main_node() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> workers_;

  PeerRoster roster_;
  TransferRegistry registry_;
  EventFanout events_;

  std::unique_ptr<Node> node_;
  std::unique_ptr<Node> debug_node_;
  std::unique_ptr<VegamCLI> cli_;
  bool started_ = false;
};
