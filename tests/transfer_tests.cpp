#include "content_store.hpp"
#include "errors.hpp"
#include "event_sink.hpp"
#include "progress.hpp"
#include "test_runner_utils.hpp"
#include "ticket.hpp"
#include "ticket_codec.hpp"
#include "transfer_orchestrator.hpp"
#include "transfer_registry.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace {

using vegam::test::TestCase;
using vegam::test::TestContext;
using vegam::test::throws_as;
namespace fs = std::filesystem;

// Serves fetches straight out of another node's store.
class FakeEndpoint : public NetworkEndpoint {
public:
  enum class Mode { Succeed, Fail, Defer };

  FakeEndpoint(std::string id, std::shared_ptr<ContentStore> local)
    : id_(std::move(id)), local_(std::move(local)) {}

  std::string node_id() const override { return id_; }
  bool ready() const override { return ready_; }
  std::vector<std::string> direct_addresses() const override { return {"127.0.0.1:40111"}; }
  BlobAddress local_address(const std::string& hash) const override {
    BlobAddress addr;
    addr.node_id = id_;
    addr.direct_addrs = direct_addresses();
    addr.hash = hash;
    return addr;
  }

  void async_fetch(const BlobAddress& address, FetchProgress progress, FetchCompletion completion) override {
    ++fetches;
    last_address = address;
    if(mode == Mode::Defer) {
      deferred = std::move(completion);
      return;
    }
    if(mode == Mode::Fail) {
      completion(FetchResult{false, "connection refused", 0});
      return;
    }
    auto blob = remote ? remote->read(address.hash) : nullptr;
    if(!blob) {
      completion(FetchResult{false, "blob not found", 0});
      return;
    }
    uint64_t total = blob->size();
    progress(total / 2, total);
    progress(total, total);
    local_->import_bytes(std::vector<char>(blob->begin(), blob->end()));
    completion(FetchResult{true, std::string(), total});
  }

  bool ready_ = true;
  Mode mode = Mode::Succeed;
  std::shared_ptr<ContentStore> remote;
  FetchCompletion deferred;
  BlobAddress last_address;
  int fetches = 0;

private:
  std::string id_;
  std::shared_ptr<ContentStore> local_;
};

class RecordingSink : public EventSink {
public:
  void on_transfer_update(const TransferRecord& record) override {
    updates.push_back(record);
  }
  void on_transfer_progress(const TransferRecord& record) override {
    progress.push_back(record);
  }

  std::vector<TransferRecord> updates;
  std::vector<TransferRecord> progress;
};

struct Node {
  std::shared_ptr<MemoryContentStore> store = std::make_shared<MemoryContentStore>();
  std::shared_ptr<FakeEndpoint> endpoint;
  TransferRegistry registry;
  RecordingSink sink;
  std::shared_ptr<TransferOrchestrator> orchestrator;

  explicit Node(const std::string& id) {
    endpoint = std::make_shared<FakeEndpoint>(id, store);
    TransferOrchestrator::Options options;
    options.progress_interval = std::chrono::milliseconds(0);
    orchestrator = std::make_shared<TransferOrchestrator>(endpoint, store, registry, sink, id, options);
  }
};

fs::path scratch_dir(const std::string& name) {
  auto dir = fs::temp_directory_path() / "vegam_transfer_tests" / name;
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);
  return dir;
}

std::vector<char> pattern_bytes(std::size_t n) {
  std::vector<char> data(n);
  for(std::size_t i = 0; i < n; ++i) data[i] = static_cast<char>((i * 31 + 7) & 0xff);
  return data;
}

std::vector<char> read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool test_registry_lifecycle(TestContext&) {
  TransferRegistry registry;
  TransferRecord r;
  r.id = "t1";
  r.file_name = "a.bin";
  r.file_size = 100;
  VEGAM_CHECK(registry.put(r));

  auto moved = registry.update_progress("t1", 0);
  VEGAM_CHECK(moved && moved->status == TransferStatus::Pending);
  moved = registry.update_progress("t1", 40);
  VEGAM_CHECK(moved && moved->status == TransferStatus::InProgress);
  VEGAM_CHECK(moved->bytes_transferred == 40);

  auto done = registry.complete("t1", 100);
  VEGAM_CHECK(done && done->status == TransferStatus::Completed);
  VEGAM_CHECK(done->bytes_transferred == 100);

  // terminal records stay put
  VEGAM_CHECK(!registry.fail("t1", "late"));
  VEGAM_CHECK(!registry.cancel("t1"));
  VEGAM_CHECK(!registry.update_progress("t1", 10));
  r.status = TransferStatus::Pending;
  VEGAM_CHECK(!registry.put(r));
  VEGAM_CHECK(registry.get("t1")->status == TransferStatus::Completed);

  VEGAM_CHECK(!registry.start("missing"));
  VEGAM_CHECK(!registry.get("missing"));
  return true;
}

bool test_registry_failure_and_json(TestContext&) {
  TransferRegistry registry;
  TransferRecord r;
  r.id = "t2";
  r.file_name = "b.bin";
  r.direction = TransferDirection::Receive;
  registry.put(r);
  auto failed = registry.fail("t2", "Download failed: timeout");
  VEGAM_CHECK(failed && failed->status == TransferStatus::Failed);
  VEGAM_CHECK(failed->error && *failed->error == "Download failed: timeout");

  nlohmann::json j = *failed;
  VEGAM_CHECK(j["status"] == "failed");
  VEGAM_CHECK(j["direction"] == "receive");
  VEGAM_CHECK(j["error"] == "Download failed: timeout");
  VEGAM_CHECK(std::string(to_string(TransferStatus::InProgress)) == "inprogress");
  return true;
}

bool test_registry_history_limit(TestContext&) {
  TransferRegistry registry(2);
  for(int i = 0; i < 4; ++i) {
    TransferRecord r;
    r.id = "t" + std::to_string(i);
    registry.put(r);
  }
  // nothing terminal yet, so nothing can be dropped
  VEGAM_CHECK(registry.size() == 4);
  registry.complete("t0", 1);
  registry.complete("t1", 1);
  registry.fail("t2", "x");
  VEGAM_CHECK(registry.size() == 2);
  VEGAM_CHECK(!registry.get("t0"));
  VEGAM_CHECK(!registry.get("t1"));
  VEGAM_CHECK(registry.get("t3"));
  auto list = registry.list();
  VEGAM_CHECK(list.size() == 2 && list[0].id == "t2" && list[1].id == "t3");
  return true;
}

bool test_progress_throttle(TestContext&) {
  using namespace std::chrono;
  auto base = steady_clock::now();
  milliseconds offset{0};
  std::vector<ProgressSample> samples;
  ThrottledProgressReporter reporter([&](const ProgressSample& s){ samples.push_back(s); },
                                     kProgressMinInterval,
                                     [&]{ return base + offset; });

  const int times[] = {0, 100, 250, 250, 500};
  const uint64_t bytes[] = {0, 100, 250, 260, 500};
  for(int i = 0; i < 5; ++i) {
    offset = milliseconds(times[i]);
    reporter.on_progress("t", bytes[i], 1000);
  }
  VEGAM_CHECK(samples.size() == 3);
  VEGAM_CHECK(samples[0].bytes_transferred == 0);
  VEGAM_CHECK(samples[1].bytes_transferred == 250);
  VEGAM_CHECK(samples[1].speed_bps == 1000);
  VEGAM_CHECK(samples[2].bytes_transferred == 500);

  // finish always reports, even without time passing
  reporter.finish("t", 1000, 1000);
  VEGAM_CHECK(samples.size() == 4);
  VEGAM_CHECK(samples[3].speed_bps == 0);
  VEGAM_CHECK(reporter.emitted() == 4);
  return true;
}

bool test_content_store(TestContext&) {
  MemoryContentStore store;
  auto h1 = store.import_bytes(pattern_bytes(10));
  auto h2 = store.import_bytes(pattern_bytes(10));
  VEGAM_CHECK(h1 == h2);
  VEGAM_CHECK(h1 == sha256_hex(pattern_bytes(10)));
  VEGAM_CHECK(store.blob_count() == 1);
  VEGAM_CHECK(store.contains(h1));
  VEGAM_CHECK(store.size_of(h1) && *store.size_of(h1) == 10);
  VEGAM_CHECK(!store.read(sha256_hex(std::string("other"))));
  return true;
}

bool test_send_and_receive(TestContext&) {
  Node sender("dev-A");
  Node receiver("dev-B");
  receiver.endpoint->remote = sender.store;

  auto payload = pattern_bytes(4096);
  auto info = sender.orchestrator->send_bytes(payload, "/home/a/report.pdf");
  VEGAM_CHECK(info.file_name == "report.pdf");
  VEGAM_CHECK(info.file_size == 4096);
  VEGAM_CHECK(info.ticket.rfind("vegam://dev-A:", 0) == 0);
  auto sent = sender.registry.get(info.transfer_id);
  VEGAM_CHECK(sent && sent->status == TransferStatus::Completed);
  VEGAM_CHECK(sent->direction == TransferDirection::Send);

  auto meta = receiver.orchestrator->inspect_ticket(info.ticket);
  VEGAM_CHECK(meta.file_name == "report.pdf");
  VEGAM_CHECK(meta.file_size == 4096);
  VEGAM_CHECK(meta.sender_id == "dev-A");
  VEGAM_CHECK(!meta.legacy);

  auto dir = scratch_dir("send_and_receive");
  auto record = receiver.orchestrator->receive(info.ticket, dir);
  VEGAM_CHECK(record.status == TransferStatus::Pending);
  VEGAM_CHECK(record.direction == TransferDirection::Receive);
  VEGAM_CHECK(receiver.endpoint->last_address.node_id == "dev-A");

  auto final_record = receiver.registry.get(record.id);
  VEGAM_CHECK(final_record && final_record->status == TransferStatus::Completed);
  VEGAM_CHECK(final_record->bytes_transferred == 4096);
  VEGAM_CHECK(read_file(dir / "report.pdf") == payload);

  VEGAM_CHECK(!receiver.sink.progress.empty());
  VEGAM_CHECK(receiver.sink.updates.back().status == TransferStatus::Completed);
  VEGAM_CHECK(receiver.sink.updates.front().status == TransferStatus::Pending);
  return true;
}

bool test_send_file_reads_disk(TestContext&) {
  Node sender("dev-A");
  auto dir = scratch_dir("send_file");
  auto path = dir / "notes.txt";
  {
    std::ofstream out(path, std::ios::binary);
    out << "some notes";
  }
  auto info = sender.orchestrator->send_file(path);
  VEGAM_CHECK(info.file_name == "notes.txt");
  VEGAM_CHECK(info.file_size == 10);
  auto rec = sender.registry.get(info.transfer_id);
  VEGAM_CHECK(rec && rec->status == TransferStatus::Completed && rec->file_size == 10);

  auto missing = dir / "nope.txt";
  VEGAM_CHECK(throws_as<IoError>([&]{ sender.orchestrator->send_file(missing); }));
  auto all = sender.registry.list();
  VEGAM_CHECK(all.size() == 2);
  VEGAM_CHECK(all[1].status == TransferStatus::Failed);
  VEGAM_CHECK(all[1].file_name == "nope.txt");
  return true;
}

bool test_legacy_ticket_to_file_path(TestContext&) {
  Node sender("dev-A");
  Node receiver("dev-B");
  receiver.endpoint->remote = sender.store;
  auto hash = sender.store->import_bytes(pattern_bytes(64));
  auto legacy = encrypt_ticket(sender.endpoint->local_address(hash).to_string(), "dev-A");

  auto meta = receiver.orchestrator->inspect_ticket(legacy);
  VEGAM_CHECK(meta.legacy);
  VEGAM_CHECK(meta.file_name == kLegacyTicketFileName);
  VEGAM_CHECK(meta.file_size == 0);

  auto dir = scratch_dir("legacy");
  auto record = receiver.orchestrator->receive(legacy, dir / "out.bin");
  VEGAM_CHECK(record.file_name == "out.bin");
  VEGAM_CHECK(read_file(dir / "out.bin") == pattern_bytes(64));
  auto done = receiver.registry.get(record.id);
  VEGAM_CHECK(done && done->file_size == 64);
  return true;
}

bool test_invalid_ticket(TestContext&) {
  Node receiver("dev-B");
  auto dir = scratch_dir("invalid");
  bool format = false;
  try {
    receiver.orchestrator->receive("not-a-ticket", dir);
  } catch(const InvalidTicket& e) {
    format = e.cause() == ErrorKind::Format;
  }
  VEGAM_CHECK(format);

  bool crypto = false;
  auto ticket = encrypt_ticket("x|1|blob:n@h:1#" + sha256_hex(std::string("x")), "dev-A");
  ticket[ticket.size() / 2 + 8] ^= 0x01;
  try {
    receiver.orchestrator->inspect_ticket(ticket);
  } catch(const InvalidTicket& e) {
    crypto = e.cause() == ErrorKind::Crypto || e.cause() == ErrorKind::Encoding;
  }
  VEGAM_CHECK(crypto);
  VEGAM_CHECK(receiver.registry.size() == 0);
  VEGAM_CHECK(receiver.endpoint->fetches == 0);
  return true;
}

bool test_not_initialized(TestContext&) {
  Node node("dev-A");
  node.endpoint->ready_ = false;
  VEGAM_CHECK(throws_as<NotInitialized>([&]{ node.orchestrator->send_bytes(pattern_bytes(4), "a.bin"); }));
  VEGAM_CHECK(throws_as<NotInitialized>([&]{ node.orchestrator->receive("vegam://x:AAAA", "."); }));
  VEGAM_CHECK(node.registry.size() == 0);
  return true;
}

bool test_device_id_must_fit_ticket(TestContext&) {
  VEGAM_CHECK(throws_as<FormatError>([]{ Node node("fe80::1"); }));
  VEGAM_CHECK(throws_as<FormatError>([]{ Node node(""); }));
  Node ok("dev-A");
  auto info = ok.orchestrator->send_bytes(pattern_bytes(8), "a.bin");
  VEGAM_CHECK(ticket_sender_identity(info.ticket) == "dev-A");
  return true;
}

bool test_fetch_failure(TestContext&) {
  Node sender("dev-A");
  Node receiver("dev-B");
  receiver.endpoint->mode = FakeEndpoint::Mode::Fail;
  auto info = sender.orchestrator->send_bytes(pattern_bytes(32), "data.bin");
  auto record = receiver.orchestrator->receive(info.ticket, scratch_dir("failure"));
  auto failed = receiver.registry.get(record.id);
  VEGAM_CHECK(failed && failed->status == TransferStatus::Failed);
  VEGAM_CHECK(failed->error && failed->error->find("Download failed") == 0);
  VEGAM_CHECK(receiver.sink.updates.back().status == TransferStatus::Failed);
  return true;
}

bool test_cancel_receive(TestContext&) {
  Node sender("dev-A");
  Node receiver("dev-B");
  receiver.endpoint->remote = sender.store;
  receiver.endpoint->mode = FakeEndpoint::Mode::Defer;
  auto info = sender.orchestrator->send_bytes(pattern_bytes(32), "late.bin");
  auto dir = scratch_dir("cancel");
  auto record = receiver.orchestrator->receive(info.ticket, dir);

  VEGAM_CHECK(receiver.orchestrator->cancel(record.id));
  VEGAM_CHECK(!receiver.orchestrator->cancel(record.id));
  VEGAM_CHECK(receiver.sink.updates.back().status == TransferStatus::Cancelled);

  // the fetch finishing afterwards changes nothing
  receiver.endpoint->deferred(FetchResult{true, std::string(), 32});
  auto after = receiver.registry.get(record.id);
  VEGAM_CHECK(after && after->status == TransferStatus::Cancelled);
  VEGAM_CHECK(!fs::exists(dir / "late.bin"));
  VEGAM_CHECK(!receiver.orchestrator->cancel("unknown-id"));
  return true;
}

bool test_output_path(TestContext&) {
  auto dir = scratch_dir("output_path");
  VEGAM_CHECK(resolve_output_path(dir, "report.pdf") == dir / "report.pdf");
  VEGAM_CHECK(resolve_output_path(dir, "../../etc/passwd") == dir / "passwd");
  VEGAM_CHECK(resolve_output_path(dir / "x.bin", "report.pdf") == dir / "x.bin");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"registry_lifecycle", test_registry_lifecycle},
    {"registry_failure_and_json", test_registry_failure_and_json},
    {"registry_history_limit", test_registry_history_limit},
    {"progress_throttle", test_progress_throttle},
    {"content_store", test_content_store},
    {"send_and_receive", test_send_and_receive},
    {"send_file_reads_disk", test_send_file_reads_disk},
    {"legacy_ticket_to_file_path", test_legacy_ticket_to_file_path},
    {"invalid_ticket", test_invalid_ticket},
    {"not_initialized", test_not_initialized},
    {"device_id_must_fit_ticket", test_device_id_must_fit_ticket},
    {"fetch_failure", test_fetch_failure},
    {"cancel_receive", test_cancel_receive},
    {"output_path", test_output_path}
  };
  return vegam::test::run_test_cases("transfer", tests, argc, argv);
}
