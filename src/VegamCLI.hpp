#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <readline/readline.h>
#include <readline/history.h>

#include "errors.hpp"
#include "event_sink.hpp"
#include "settings_manager.hpp"
#include "vegam_engine.hpp"

// Interactive shell over a VegamEngine. Notifications are printed as they
// arrive, interleaved with the prompt.
class VegamCLI {
public:
  explicit VegamCLI(VegamEngine& engine,
                    std::shared_ptr<SettingsManager> settings,
                    std::ostream& out = std::cout)
    : engine_(engine), settings_(std::move(settings)), out_(out), running_(true) {
    printer_ = std::make_shared<EventPrinter>(*this);
    printer_handle_ = engine_.add_event_sink(printer_);
  }

  ~VegamCLI() {
    engine_.remove_event_sink(printer_handle_);
    stop();
  }

  void start() {
    cli_thread_ = std::thread([this](){ run_loop(); });
  }

  void stop() {
    running_ = false;
    if(cli_thread_.joinable() && cli_thread_.get_id() != std::this_thread::get_id()) {
      cli_thread_.join();
    }
  }

  // Blocks until the shell thread started by start() exits.
  void wait() {
    if(cli_thread_.joinable()) cli_thread_.join();
  }

  void run_loop() {
    print_line("vegam ready. Type 'help' for commands.");
    while(running_) {
      auto input = read_command_line("vegam> ");
      if(!input) break;
      if(input->empty()) continue;
      if(!execute_command(*input)) break;
    }
    running_ = false;
  }

  // Returns false when the shell should exit.
  bool execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    std::string args;
    std::getline(iss, args);
    trim(args);

    try {
      if(cmd == "send") {
        send_command(args, false);
      } else if(cmd == "dsend") {
        send_command(args, true);
      } else if(cmd == "receive" || cmd == "recv") {
        receive_command(args);
      } else if(cmd == "status") {
        status_command(args);
      } else if(cmd == "transfers" || cmd == "t") {
        list_transfers();
      } else if(cmd == "cancel") {
        cancel_command(args);
      } else if(cmd == "peers") {
        list_peers();
      } else if(cmd == "name") {
        print_line("Device name: " + engine_.device_name());
      } else if(cmd == "node") {
        print_line("Node id: " + engine_.node_id());
        if(engine_.has_debug_node()) {
          print_line("Debug node id: " + engine_.debug_node_id());
        }
      } else if(cmd == "ticket") {
        ticket_command(args);
      } else if(cmd == "endpoint") {
        endpoint_command();
      } else if(cmd == "settings" || cmd == "s") {
        handle_settings_command(args.empty() ? "list" : args);
      } else if(cmd == "set") {
        handle_settings_command(args.empty() ? "list" : "set " + args);
      } else if(cmd == "get") {
        handle_settings_command(args.empty() ? "get" : "get " + args);
      } else if(cmd == "save") {
        handle_settings_command("save");
      } else if(cmd == "load") {
        handle_settings_command("load");
      } else if(cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
      } else if(cmd == "quit" || cmd == "exit") {
        print_line("Quitting...");
        return false;
      } else {
        print_help();
        print_line("Unknown command: " + cmd);
      }
    } catch(const InvalidTicket& e) {
      print_line(std::string("Invalid ticket (") + error_kind_name(e.cause()) + "): " + e.what());
    } catch(const VegamError& e) {
      print_line(std::string(error_kind_name(e.kind())) + ": " + e.what());
    }
    return true;
  }

private:
  class EventPrinter : public EventSink {
  public:
    explicit EventPrinter(VegamCLI& cli) : cli_(cli) {}

    void on_peer_discovered(const PeerRecord& peer) override {
      cli_.notify("[peer] discovered " + peer.display_name + " (" + short_id(peer.device_id) + ")");
    }
    void on_peer_lost(const PeerRecord& peer) override {
      cli_.notify("[peer] lost " + peer.display_name + " (" + short_id(peer.device_id) + ")");
    }
    void on_transfer_update(const TransferRecord& record) override {
      std::string line = "[transfer] " + short_id(record.id) + " " + record.file_name + " " + to_string(record.status);
      if(record.status == TransferStatus::Completed) {
        line += " (" + format_bytes(record.file_size) + ")";
      }
      if(record.error) line += ": " + *record.error;
      cli_.notify(line);
    }
    void on_transfer_progress(const TransferRecord& record) override {
      if(record.direction != TransferDirection::Receive) return;
      cli_.notify("[progress] " + short_id(record.id) + " " + format_progress(record));
    }

  private:
    VegamCLI& cli_;
  };

  void notify(const std::string& message) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << "\n" << message << "\n";
    out_.flush();
  }

  void print_line(const std::string& message) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << message << "\n";
  }

  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    trim(result);
    return result;
  }

  void send_command(const std::string& args, bool from_debug_node) {
    if(args.empty()) {
      print_line(from_debug_node ? "Usage: dsend <path>" : "Usage: send <path>");
      return;
    }
    auto path = normalize_cli_path(args);
    auto info = from_debug_node ? engine_.debug_send_file(path) : engine_.send_file(path);
    print_line("Shared " + info.file_name + " (" + format_bytes(info.file_size) + "), transfer " + info.transfer_id);
    print_line("Ticket:");
    print_line(info.ticket);
  }

  void receive_command(const std::string& args) {
    std::istringstream iss(args);
    std::string ticket;
    iss >> ticket;
    std::string dest;
    std::getline(iss, dest);
    trim(dest);
    if(ticket.empty()) {
      print_line("Usage: receive <ticket> [destination]");
      return;
    }
    std::filesystem::path destination;
    if(!dest.empty()) destination = normalize_cli_path(dest);
    auto record = engine_.receive(ticket, destination);
    print_line("Receiving " + record.file_name + " (" + format_bytes(record.file_size) + "), transfer " + record.id);
  }

  void status_command(const std::string& id) {
    if(id.empty()) {
      print_line("Usage: status <transfer-id>");
      return;
    }
    auto record = find_transfer(id);
    if(!record) {
      print_line("No transfer with id " + id);
      return;
    }
    print_transfer(*record);
  }

  void cancel_command(const std::string& id) {
    if(id.empty()) {
      print_line("Usage: cancel <transfer-id>");
      return;
    }
    auto record = find_transfer(id);
    if(!record) {
      print_line("No transfer with id " + id);
      return;
    }
    if(engine_.cancel_transfer(record->id)) {
      print_line("Cancelled " + record->id);
    } else {
      print_line("Transfer " + record->id + " already " + to_string(record->status));
    }
  }

  // Accepts a full id or a unique prefix.
  std::optional<TransferRecord> find_transfer(const std::string& id) const {
    if(auto exact = engine_.transfer_status(id)) return exact;
    std::optional<TransferRecord> match;
    for(const auto& record : engine_.list_transfers()) {
      if(record.id.rfind(id, 0) == 0) {
        if(match) return std::nullopt;
        match = record;
      }
    }
    return match;
  }

  void list_transfers() {
    auto transfers = engine_.list_transfers();
    if(transfers.empty()) {
      print_line("No transfers.");
      return;
    }
    for(const auto& record : transfers) {
      print_transfer(record);
    }
  }

  void print_transfer(const TransferRecord& record) {
    std::ostringstream oss;
    oss << record.id << "  " << std::left << std::setw(7) << to_string(record.direction)
        << " " << std::setw(10) << to_string(record.status) << " " << record.file_name
        << "  " << format_progress(record);
    if(record.error) oss << "  error: " << *record.error;
    print_line(oss.str());
  }

  void list_peers() {
    auto peers = engine_.list_peers();
    if(peers.empty()) {
      print_line("No peers discovered yet.");
      return;
    }
    for(const auto& p : peers) {
      std::string line = p.device_id + " (" + p.display_name + ")";
      if(p.device_id == engine_.debug_node_id()) line += " [debug]";
      print_line(line);
    }
  }

  void ticket_command(const std::string& ticket) {
    if(ticket.empty()) {
      print_line("Usage: ticket <ticket>");
      return;
    }
    auto meta = engine_.parse_ticket_metadata(ticket);
    print_line("File:   " + meta.file_name);
    print_line("Size:   " + format_bytes(meta.file_size));
    print_line("Sender: " + meta.sender_id);
    if(meta.legacy) print_line("(legacy ticket without file metadata)");
  }

  void endpoint_command() {
    auto status = engine_.endpoint_status();
    print_line(std::string("Listening: ") + (status.listening ? "yes" : "no"));
    print_line("Node id:   " + status.node_id);
    print_line("Port:      " + std::to_string(status.port));
    for(const auto& addr : status.addresses) {
      print_line("Address:   " + addr);
    }
  }

  void handle_settings_command(const std::string& args) {
    if(!settings_) {
      print_line("Settings manager unavailable.");
      return;
    }

    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      list_settings();
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      if(key.empty()) {
        print_line("Usage: settings get <key>");
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        print_line("Unknown setting '" + key + "'.");
        return;
      }
      print_line(*resolved + " = " + settings_->value_as_string(*resolved));
      print_line("  " + settings_->describe(*resolved));
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      trim(value);
      if(key.empty() || value.empty()) {
        print_line("Usage: settings set <key> <value>");
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        print_line("Unknown setting '" + key + "'.");
        return;
      }
      std::string error;
      if(settings_->set_from_string(*resolved, value, error)) {
        print_line(*resolved + " = " + settings_->value_as_string(*resolved));
        if(*resolved != "verbose" && *resolved != "log_file") {
          print_line("  (takes effect on next start)");
        } else {
          init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));
        }
      } else {
        print_line("Failed to set " + *resolved + ": " + error);
      }
      return;
    }

    if(action == "save") {
      if(settings_->save()) {
        print_line("Saved settings to " + settings_->settings_path().string());
      } else {
        print_line("Failed to save settings.");
      }
      return;
    }

    if(action == "load") {
      if(settings_->load()) {
        print_line("Loaded settings from " + settings_->settings_path().string());
      } else {
        print_line("Settings file not found or unreadable.");
      }
      return;
    }

    print_line("Unknown settings command.");
  }

  void list_settings() {
    auto keys = settings_->keys();
    std::sort(keys.begin(), keys.end());
    for(const auto& key : keys) {
      print_line(key + " = " + settings_->value_as_string(key));
    }
  }

  void print_help() {
    print_line("Available commands:");
    print_line("  help|h|?                          Show this help message");
    print_line("  quit|exit                         Exit the application");
    print_line("  send <path>                       Share a file and print its ticket");
    print_line("  dsend <path>                      Share a file from the debug node");
    print_line("  receive|recv <ticket> [dest]      Download a ticket (default download_dir)");
    print_line("  status <id>                       Show one transfer (id or unique prefix)");
    print_line("  transfers|t                       List all transfers");
    print_line("  cancel <id>                       Cancel an unfinished transfer");
    print_line("  peers                             List devices seen on the network");
    print_line("  name                              Show this device's name");
    print_line("  node                              Show this node's id");
    print_line("  ticket <ticket>                   Show file name, size and sender of a ticket");
    print_line("  endpoint                          Show listening state and advertised addresses");
    print_line("  settings [list|get|set|save|load] Manage runtime settings");
    print_line("  set [key value]                   Shortcut for settings set (lists when empty)");
    print_line("  get <key>                         Shortcut for settings get");
    print_line("  save                              Shortcut for settings save");
    print_line("  load                              Shortcut for settings load");
  }

  static std::string short_id(const std::string& id) {
    return id.size() > 8 ? id.substr(0, 8) : id;
  }

  static std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
      value /= 1024.0;
      ++unit;
    }
    std::ostringstream oss;
    if(unit == 0) {
      oss << bytes << " B";
    } else {
      oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    }
    return oss.str();
  }

  static std::string format_progress(const TransferRecord& record) {
    std::ostringstream oss;
    oss << format_bytes(record.bytes_transferred);
    if(record.file_size > 0) {
      double pct = 100.0 * static_cast<double>(record.bytes_transferred) / static_cast<double>(record.file_size);
      oss << " / " << format_bytes(record.file_size) << " (" << std::fixed << std::setprecision(0)
          << std::min(pct, 100.0) << "%)";
    }
    if(record.speed_bps > 0) {
      oss << " " << format_bytes(record.speed_bps) << "/s";
    }
    return oss.str();
  }

  static void trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), s.end());
  }

  // Strips surrounding quotes and expands a leading ~.
  static std::string normalize_cli_path(const std::string& cli_path) {
    std::string path = cli_path;
    if(path.size() >= 2 && ((path.front() == '"' && path.back() == '"') ||
                            (path.front() == '\'' && path.back() == '\''))) {
      path = path.substr(1, path.size() - 2);
    }
    if(!path.empty() && path[0] == '~') {
      if(const char* home = std::getenv("HOME")) {
        path = std::string(home) + path.substr(1);
      }
    }
    return path;
  }

  VegamEngine& engine_;
  std::shared_ptr<SettingsManager> settings_;
  std::ostream& out_;
  std::mutex out_mutex_;
  std::atomic<bool> running_;
  std::thread cli_thread_;
  std::shared_ptr<EventPrinter> printer_;
  EventSinkHandle printer_handle_ = 0;
};
