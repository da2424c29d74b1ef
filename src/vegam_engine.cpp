#include "vegam_engine.hpp"

#include <stdexcept>
#include <system_error>

#include "VegamCLI.hpp"
#include "blob_endpoint.hpp"
#include "content_store.hpp"
#include "errors.hpp"
#include "presence_protocol.hpp"
#include "settings_manager.hpp"
#include "ticket_codec.hpp"
#include "utils.hpp"

namespace {

bool is_valid_device_id(const std::string& id) {
  if(!is_valid_ticket_identity(id)) return false;
  return id.find_first_of("@#|/ \t\r\n") == std::string::npos;
}

std::string short_id(const std::string& id) {
  return id.size() > 12 ? id.substr(0, 12) : id;
}

} // namespace

VegamEngine::VegamEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("vegam")),
    events_(logger_) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

VegamEngine::~VegamEngine() {
  stop();
}

void VegamEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
}

std::filesystem::path VegamEngine::download_dir() const {
  std::filesystem::path dir = settings_->get<std::string>("download_dir");
  if(dir.empty()) dir = "downloads";
  if(dir.is_relative()) dir = options_.workspace_root / dir;
  return dir;
}

std::string VegamEngine::ensure_device_id() {
  auto id = settings_->get<std::string>("device_id");
  if(id.empty()) {
    id = random_hex_id(32);
    std::string error;
    if(!settings_->set_from_string("device_id", id, error)) {
      throw std::runtime_error("Unable to store generated device_id: " + error);
    }
    // identity must survive restarts
    if(!settings_->save()) {
      logger_->warn("Unable to persist device_id to {}", settings_->settings_path().string());
    }
    logger_->info("Generated device id {}", id);
  }
  if(!is_valid_device_id(id)) {
    throw FormatError("device_id '" + id + "' contains reserved characters");
  }
  return id;
}

std::shared_ptr<BroadcastChannel> VegamEngine::make_presence_channel() {
  if(options_.presence_bus) {
    return options_.presence_bus->subscribe(io_);
  }
  int port = settings_->get<int>("presence_port");
  auto group = settings_->get<std::string>("presence_group");
  try {
    return std::make_shared<UdpMulticastChannel>(io_, group, static_cast<uint16_t>(port), logger_);
  } catch(const std::system_error& e) {
    throw NetworkError("unable to join presence group " + group + ":" + std::to_string(port) + ": " + e.what());
  }
}

std::unique_ptr<VegamEngine::Node> VegamEngine::make_node(const std::string& device_id,
                                                          const std::string& display_name,
                                                          uint16_t listen_port,
                                                          const std::string& advertise_addr) {
  auto node = std::make_unique<Node>();
  node->device_id = device_id;
  node->display_name = display_name;
  node->store = std::make_shared<MemoryContentStore>();

  TcpBlobEndpoint::Options endpoint_options;
  endpoint_options.listen_ip = settings_->get<std::string>("listen_ip");
  endpoint_options.listen_port = listen_port;
  endpoint_options.advertise_addr = advertise_addr;
  node->endpoint = std::make_shared<TcpBlobEndpoint>(io_, node->store, device_id, endpoint_options, logger_);

  TransferOrchestrator::Options transfer_options;
  transfer_options.progress_interval = std::chrono::milliseconds(settings_->get<int>("progress_interval_ms"));
  node->orchestrator = std::make_shared<TransferOrchestrator>(node->endpoint, node->store, registry_, events_,
                                                              device_id, transfer_options, logger_);

  PresenceConfig presence_config;
  presence_config.announce_interval = std::chrono::seconds(settings_->get<int>("presence_interval"));
  presence_config.peer_timeout_seconds = static_cast<uint64_t>(settings_->get<int>("peer_timeout"));
  node->presence = std::make_shared<PresenceProtocol>(io_, make_presence_channel(), roster_, events_,
                                                      device_id, display_name, presence_config, logger_);
  return node;
}

void VegamEngine::start_node(Node& node) {
  node.endpoint->start();
  node.presence->start();
}

void VegamEngine::stop_node(Node& node) {
  if(node.presence) node.presence->stop();
  if(node.endpoint) node.endpoint->stop();
}

void VegamEngine::start() {
  if(started_) return;

  ensure_workspace();

  init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));

  auto device_id = ensure_device_id();
  auto display_name = settings_->get<std::string>("display_name");
  if(display_name.empty()) display_name = device_display_name();
  logger_->set_name(display_name);

  registry_.set_history_limit(static_cast<std::size_t>(settings_->get<int>("transfer_history")));

  int interval = settings_->get<int>("presence_interval");
  int timeout = settings_->get<int>("peer_timeout");
  if(timeout < 3 * interval) {
    logger_->warn("peer_timeout {}s is less than three presence intervals ({}s); peers may flap",
                  timeout, 3 * interval);
  }

  node_ = make_node(device_id, display_name,
                    static_cast<uint16_t>(settings_->get<int>("listen_port")),
                    settings_->get<std::string>("advertise_addr"));

  if(settings_->get<bool>("debug_node")) {
    auto debug_id = random_hex_id(32);
    debug_node_ = make_node(debug_id, display_name + " (debug)", 0, std::string());
    logger_->info("Debug node enabled: {}", debug_id);
  }

  std::error_code ec;
  std::filesystem::create_directories(download_dir(), ec);

  started_ = true;
  try {
    start_node(*node_);
    if(debug_node_) start_node(*debug_node_);
  } catch(const std::exception& e) {
    logger_->error("Failed to start node: {}", e.what());
    stop();
    throw;
  }

  logger_->info("Node {} ({}) ready on port {}", short_id(device_id), display_name, listen_port());

  cli_ = std::make_unique<VegamCLI>(*this, settings_);
  if(options_.start_cli_thread) {
    cli_->start();
  }
}

void VegamEngine::start_background() {
  if(!started_) start();
  if(!workers_.empty()) return;
  work_.emplace(asio::make_work_guard(io_));
  int threads = settings_->get<int>("worker_threads");
  if(threads < 1) threads = 1;
  for(int i = 0; i < threads; ++i) {
    workers_.emplace_back([this](){
      for(;;) {
        try {
          io_.run();
          break;
        } catch(const std::exception& e) {
          logger_->error("Worker handler threw: {}", e.what());
        }
      }
    });
  }
}

void VegamEngine::run() {
  start_background();
  if(cli_ && !options_.start_cli_thread) {
    cli_->run_loop();
  } else if(cli_) {
    cli_->wait();
  }
  stop();
}

void VegamEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
  }
  if(debug_node_) stop_node(*debug_node_);
  if(node_) stop_node(*node_);

  work_.reset();
  // let the close handlers above run before tearing the loop down
  if(!workers_.empty()) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
    while(!io_.stopped() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  io_.stop();
  for(auto& t : workers_) {
    if(t.joinable()) t.join();
  }
  workers_.clear();
  io_.restart();
  flush_logs();
}

bool VegamEngine::execute_command(const std::string& line) {
  if(!cli_) return false;
  return cli_->execute_command(line);
}

VegamEngine::Node& VegamEngine::main_node() const {
  if(!node_) throw NotInitialized("Node not initialized");
  return *node_;
}

TicketInfo VegamEngine::send_file(const std::filesystem::path& path) {
  return main_node().orchestrator->send_file(path);
}

TicketInfo VegamEngine::send_bytes(std::vector<char> data, const std::string& original_path) {
  return main_node().orchestrator->send_bytes(std::move(data), original_path);
}

TransferRecord VegamEngine::receive(const std::string& ticket, const std::filesystem::path& destination) {
  auto target = destination.empty() ? download_dir() : destination;
  if(target.is_relative() && !destination.empty()) {
    target = std::filesystem::absolute(target);
  }
  return main_node().orchestrator->receive(ticket, target);
}

std::optional<TransferRecord> VegamEngine::transfer_status(const std::string& id) const {
  return registry_.get(id);
}

std::vector<TransferRecord> VegamEngine::list_transfers() const {
  return registry_.list();
}

bool VegamEngine::cancel_transfer(const std::string& id) {
  return main_node().orchestrator->cancel(id);
}

std::vector<PeerRecord> VegamEngine::list_peers() const {
  return roster_.snapshot();
}

std::string VegamEngine::device_name() const {
  if(node_) return node_->display_name;
  return device_display_name();
}

std::string VegamEngine::node_id() const {
  return main_node().device_id;
}

TicketMetadata VegamEngine::parse_ticket_metadata(const std::string& ticket) const {
  return main_node().orchestrator->inspect_ticket(ticket);
}

EndpointStatus VegamEngine::endpoint_status() const {
  EndpointStatus status;
  if(!node_) return status;
  status.node_id = node_->device_id;
  status.listening = node_->endpoint->ready();
  status.port = node_->endpoint->listen_port();
  status.addresses = node_->endpoint->direct_addresses();
  return status;
}

std::string VegamEngine::debug_node_id() const {
  return debug_node_ ? debug_node_->device_id : std::string();
}

TicketInfo VegamEngine::debug_send_file(const std::filesystem::path& path) {
  if(!debug_node_) throw NotInitialized("debug node is not enabled (set debug_node true and restart)");
  return debug_node_->orchestrator->send_file(path);
}

EventSinkHandle VegamEngine::add_event_sink(std::shared_ptr<EventSink> sink) {
  return events_.add(std::move(sink));
}

void VegamEngine::remove_event_sink(EventSinkHandle handle) {
  events_.remove(handle);
}

LogListenerHandle VegamEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void VegamEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void VegamEngine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}

uint16_t VegamEngine::listen_port() const {
  if(!node_ || !node_->endpoint) return 0;
  return node_->endpoint->listen_port();
}

VegamEngine::Stats VegamEngine::stats() const {
  Stats s;
  s.known_peers = roster_.size();
  auto transfers = registry_.list();
  s.transfers = transfers.size();
  for(const auto& t : transfers) {
    if(!is_terminal(t.status)) ++s.active_transfers;
  }
  return s;
}
