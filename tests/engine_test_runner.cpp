#include "errors.hpp"
#include "settings_manager.hpp"
#include "vegam_engine.hpp"
#include "test_runner_utils.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using vegam::test::TestCase;
using vegam::test::TestContext;
namespace fs = std::filesystem;

struct RunnerConfig {
  fs::path root;
  fs::path peer_a_root;
  fs::path peer_b_root;
};

RunnerConfig prepare_workspace() {
  RunnerConfig cfg;
  cfg.root = fs::temp_directory_path() / "vegam_engine_runner";
  cfg.peer_a_root = cfg.root / "peerA";
  cfg.peer_b_root = cfg.root / "peerB";
  std::error_code ec;
  fs::remove_all(cfg.root, ec);
  fs::create_directories(cfg.peer_a_root, ec);
  fs::create_directories(cfg.peer_b_root, ec);
  return cfg;
}

void configure(const std::shared_ptr<SettingsManager>& settings,
               const std::string& key,
               const nlohmann::json& value) {
  std::string error;
  if(!settings->set_from_json(key, value, error)) {
    throw std::runtime_error("Failed to set setting " + key + ": " + error);
  }
}

std::shared_ptr<SettingsManager> make_settings(const fs::path& root,
                                               const std::string& id,
                                               const std::string& name) {
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(root / ".config" / "settings.json");
  configure(settings, "listen_ip", "127.0.0.1");
  configure(settings, "listen_port", 0);
  configure(settings, "device_id", id);
  configure(settings, "display_name", name);
  configure(settings, "presence_interval", 1);
  configure(settings, "peer_timeout", 5);
  configure(settings, "progress_interval_ms", 0);
  return settings;
}

std::vector<char> write_sample(const fs::path& path, std::size_t size) {
  std::vector<char> data(size);
  for(std::size_t i = 0; i < size; ++i) data[i] = static_cast<char>((i * 131 + 17) & 0xff);
  std::ofstream out(path, std::ios::binary);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  return data;
}

std::vector<char> read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool wait_for_status(VegamEngine& engine, const std::string& id, TransferStatus status) {
  using namespace std::chrono_literals;
  return vegam::test::wait_for_condition([&]{
    auto rec = engine.transfer_status(id);
    return rec && rec->status == status;
  }, 10s);
}

class CountingSink : public EventSink {
public:
  void on_peer_discovered(const PeerRecord&) override { ++discovered; }
  void on_transfer_progress(const TransferRecord&) override { ++progress; }
  std::atomic<int> discovered{0};
  std::atomic<int> progress{0};
};

bool test_peer_discovery(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bus = LocalBroadcastBus::create();

  VegamEngine::Options opt_a;
  opt_a.workspace_root = cfg.peer_a_root;
  opt_a.presence_bus = bus;
  VegamEngine engine_a(make_settings(cfg.peer_a_root, "runner-peerA", "Runner A"), opt_a);
  ctx.logs.attach(engine_a, "A");
  auto sink = std::make_shared<CountingSink>();
  engine_a.add_event_sink(sink);

  VegamEngine::Options opt_b = opt_a;
  opt_b.workspace_root = cfg.peer_b_root;
  VegamEngine engine_b(make_settings(cfg.peer_b_root, "runner-peerB", "Runner B"), opt_b);
  ctx.logs.attach(engine_b, "B");

  engine_a.start_background();
  engine_b.start_background();

  using namespace std::chrono_literals;
  bool ok = vegam::test::wait_for_condition([&]{
    return engine_a.stats().known_peers == 1 && engine_b.stats().known_peers == 1;
  }, 5s);
  if(ctx.verbose) {
    std::cout << "    A knows " << engine_a.stats().known_peers
              << ", B knows " << engine_b.stats().known_peers << "\n";
  }
  auto peers = engine_a.list_peers();
  bool named = peers.size() == 1 && peers[0].device_id == "runner-peerB" &&
               peers[0].display_name == "Runner B";
  bool saw = ctx.logs.wait_for_substring("peer discovered: Runner B", 3s);

  engine_b.stop();
  engine_a.stop();
  ctx.logs.detach_all();
  std::error_code ec;
  fs::remove_all(cfg.root, ec);
  return ok && named && saw && sink->discovered.load() >= 1;
}

bool test_send_and_receive(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bus = LocalBroadcastBus::create();

  VegamEngine::Options opt_a;
  opt_a.workspace_root = cfg.peer_a_root;
  opt_a.presence_bus = bus;
  VegamEngine engine_a(make_settings(cfg.peer_a_root, "runner-peerA", "Runner A"), opt_a);
  ctx.logs.attach(engine_a, "A");

  VegamEngine::Options opt_b = opt_a;
  opt_b.workspace_root = cfg.peer_b_root;
  VegamEngine engine_b(make_settings(cfg.peer_b_root, "runner-peerB", "Runner B"), opt_b);
  ctx.logs.attach(engine_b, "B");
  auto sink = std::make_shared<CountingSink>();
  engine_b.add_event_sink(sink);

  engine_a.start_background();
  engine_b.start_background();
  if(ctx.verbose) {
    std::cout << "    A on " << engine_a.listen_port() << ", B on " << engine_b.listen_port() << "\n";
  }

  auto source = cfg.peer_a_root / "report.pdf";
  auto data = write_sample(source, 300 * 1024 + 7);
  auto info = engine_a.send_file(source);
  bool ticket_ok = info.file_name == "report.pdf" && info.file_size == data.size();

  auto meta = engine_b.parse_ticket_metadata(info.ticket);
  bool meta_ok = meta.file_name == "report.pdf" && meta.sender_id == "runner-peerA";

  auto record = engine_b.receive(info.ticket);
  bool done = wait_for_status(engine_b, record.id, TransferStatus::Completed);
  auto received = read_file(engine_b.download_dir() / "report.pdf");
  bool same = received == data;
  auto final_record = engine_b.transfer_status(record.id);
  bool counted = final_record && final_record->bytes_transferred == data.size();

  bool listed = engine_b.execute_command("transfers") && engine_a.execute_command("endpoint");

  engine_b.stop();
  engine_a.stop();
  ctx.logs.detach_all();
  std::error_code ec;
  fs::remove_all(cfg.root, ec);
  return ticket_ok && meta_ok && done && same && counted && listed && sink->progress.load() > 0;
}

bool test_unreachable_sender(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bus = LocalBroadcastBus::create();

  VegamEngine::Options opt_a;
  opt_a.workspace_root = cfg.peer_a_root;
  opt_a.presence_bus = bus;
  VegamEngine engine_a(make_settings(cfg.peer_a_root, "runner-peerA", "Runner A"), opt_a);
  ctx.logs.attach(engine_a, "A");
  engine_a.start_background();

  auto source = cfg.peer_a_root / "gone.bin";
  write_sample(source, 1024);
  auto info = engine_a.send_file(source);
  engine_a.stop();

  VegamEngine::Options opt_b = opt_a;
  opt_b.workspace_root = cfg.peer_b_root;
  VegamEngine engine_b(make_settings(cfg.peer_b_root, "runner-peerB", "Runner B"), opt_b);
  ctx.logs.attach(engine_b, "B");
  engine_b.start_background();

  auto record = engine_b.receive(info.ticket);
  bool failed = wait_for_status(engine_b, record.id, TransferStatus::Failed);
  auto rec = engine_b.transfer_status(record.id);
  bool message = rec && rec->error && rec->error->find("Download failed") == 0;

  engine_b.stop();
  ctx.logs.detach_all();
  std::error_code ec;
  fs::remove_all(cfg.root, ec);
  return failed && message;
}

bool test_debug_node_loopback(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bus = LocalBroadcastBus::create();

  auto settings = make_settings(cfg.peer_a_root, "runner-peerA", "Runner A");
  configure(settings, "debug_node", true);
  VegamEngine::Options opt;
  opt.workspace_root = cfg.peer_a_root;
  opt.presence_bus = bus;
  VegamEngine engine(settings, opt);
  ctx.logs.attach(engine, "A");
  engine.start_background();

  using namespace std::chrono_literals;
  bool sees_debug = vegam::test::wait_for_condition([&]{
    auto peers = engine.list_peers();
    return std::any_of(peers.begin(), peers.end(),
      [&](const PeerRecord& p){ return p.device_id == engine.debug_node_id(); });
  }, 5s);

  auto source = cfg.peer_a_root / "loop.txt";
  auto data = write_sample(source, 4096);
  auto info = engine.debug_send_file(source);
  auto dest = cfg.peer_a_root / "loop-copy.txt";
  auto record = engine.receive(info.ticket, dest);
  bool done = wait_for_status(engine, record.id, TransferStatus::Completed);
  bool same = read_file(dest) == data;
  bool sender_is_debug = engine.parse_ticket_metadata(info.ticket).sender_id == engine.debug_node_id();

  engine.stop();
  ctx.logs.detach_all();
  std::error_code ec;
  fs::remove_all(cfg.root, ec);
  return engine.has_debug_node() && sees_debug && done && same && sender_is_debug;
}

bool test_commands_before_start(TestContext&) {
  auto cfg = prepare_workspace();
  VegamEngine::Options opt;
  opt.workspace_root = cfg.peer_a_root;
  VegamEngine engine(make_settings(cfg.peer_a_root, "runner-peerA", "Runner A"), opt);
  bool not_ready = vegam::test::throws_as<NotInitialized>([&]{ engine.send_file(cfg.peer_a_root / "x"); });
  bool no_status = !engine.endpoint_status().listening;
  std::error_code ec;
  fs::remove_all(cfg.root, ec);
  return not_ready && no_status && engine.list_transfers().empty();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"commands_before_start", test_commands_before_start},
    {"peer_discovery", test_peer_discovery},
    {"send_and_receive", test_send_and_receive},
    {"unreachable_sender", test_unreachable_sender},
    {"debug_node_loopback", test_debug_node_loopback}
  };
  return vegam::test::run_test_cases("engine", tests, argc, argv);
}
