#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "blob_endpoint.hpp"
#include "content_store.hpp"
#include "event_sink.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "ticket.hpp"
#include "transfer_registry.hpp"

struct TicketInfo {
  std::string ticket;
  std::string file_name;
  uint64_t file_size = 0;
  std::string transfer_id;
};

struct TicketMetadata {
  std::string file_name;
  uint64_t file_size = 0;
  std::string sender_id;
  bool legacy = false;
};

// Drives sends and receives end to end and keeps the registry and the event
// sink informed. Sends complete synchronously; receives return once the
// record exists and finish on the endpoint's completion.
class TransferOrchestrator : public std::enable_shared_from_this<TransferOrchestrator> {
public:
  struct Options {
    std::chrono::milliseconds progress_interval = kProgressMinInterval;
  };

  TransferOrchestrator(std::shared_ptr<NetworkEndpoint> endpoint,
                       std::shared_ptr<ContentStore> store,
                       TransferRegistry& registry,
                       EventSink& events,
                       std::string device_id,
                       Options options,
                       std::shared_ptr<Logger> logger = nullptr);

  // Throws NotInitialized before the endpoint is ready, IoError when the file
  // cannot be read. The record is marked Failed for any error after creation.
  TicketInfo send_file(const std::filesystem::path& path);
  TicketInfo send_bytes(std::vector<char> data, const std::string& original_path);

  // Throws NotInitialized, or InvalidTicket for anything wrong with the
  // ticket itself. Returns the Pending record; progress and the outcome are
  // reported through the registry and the event sink.
  TransferRecord receive(const std::string& ticket, const std::filesystem::path& destination);

  // Decodes a ticket without touching the network. Throws InvalidTicket.
  TicketMetadata inspect_ticket(const std::string& ticket) const;

  std::optional<TransferRecord> status(const std::string& transfer_id) const;
  std::vector<TransferRecord> list() const;
  // Only non-terminal transfers can be cancelled.
  bool cancel(const std::string& transfer_id);

  const std::string& device_id() const { return device_id_; }
  std::shared_ptr<NetworkEndpoint> endpoint() const { return endpoint_; }

private:
  TransferRecord create_record(const std::string& file_name,
                               uint64_t file_size,
                               TransferDirection direction);
  TicketInfo publish(const std::string& transfer_id,
                     std::vector<char> data,
                     const std::string& original_path);
  void mark_failed(const std::string& transfer_id, const std::string& message);
  void emit_update(const std::optional<TransferRecord>& record);
  void on_fetch_complete(const std::string& transfer_id,
                         const std::filesystem::path& target,
                         const std::string& hash,
                         const FetchResult& result,
                         const std::shared_ptr<ThrottledProgressReporter>& reporter);
  void write_output(const std::filesystem::path& target, const BlobData& blob) const;
  void ensure_ready() const;

  std::shared_ptr<NetworkEndpoint> endpoint_;
  std::shared_ptr<ContentStore> store_;
  TransferRegistry& registry_;
  EventSink& events_;
  std::string device_id_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};

// Where a received file lands: destination itself, or destination/<bare name>
// when destination is an existing directory.
std::filesystem::path resolve_output_path(const std::filesystem::path& destination,
                                          const std::string& file_name);
