#include "transfer_orchestrator.hpp"

#include <fstream>
#include <iterator>

#include "errors.hpp"
#include "ticket_codec.hpp"
#include "utils.hpp"

namespace {

struct DecodedTicket {
  TicketPayload payload;
  std::string sender_id;
};

DecodedTicket decode_ticket(const std::string& ticket, const std::string& receiver_id) {
  try {
    DecodedTicket out{parse_ticket_plaintext(decrypt_ticket(ticket, receiver_id)),
                      ticket_sender_identity(ticket)};
    return out;
  } catch(const InvalidTicket&) {
    throw;
  } catch(const VegamError& e) {
    throw InvalidTicket(std::string("Invalid ticket: ") + e.what(), e.kind());
  }
}

std::vector<char> read_whole_file(const std::filesystem::path& path) {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) {
    throw IoError("Failed to read file: " + path.string() + " is not a regular file");
  }
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw IoError("Failed to read file: unable to open " + path.string());
  }
  std::vector<char> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if(in.bad()) {
    throw IoError("Failed to read file: read error on " + path.string());
  }
  return data;
}

} // namespace

std::filesystem::path resolve_output_path(const std::filesystem::path& destination,
                                          const std::string& file_name) {
  std::error_code ec;
  if(std::filesystem::is_directory(destination, ec)) {
    // ticket names are untrusted; only the last component is used
    return destination / file_name_from_path(file_name, kLegacyTicketFileName);
  }
  return destination;
}

TransferOrchestrator::TransferOrchestrator(std::shared_ptr<NetworkEndpoint> endpoint,
                                           std::shared_ptr<ContentStore> store,
                                           TransferRegistry& registry,
                                           EventSink& events,
                                           std::string device_id,
                                           Options options,
                                           std::shared_ptr<Logger> logger)
  : endpoint_(std::move(endpoint)),
    store_(std::move(store)),
    registry_(registry),
    events_(events),
    device_id_(std::move(device_id)),
    options_(options),
    logger_(std::move(logger)) {
  if(!endpoint_ || !store_) {
    throw std::runtime_error("TransferOrchestrator requires an endpoint and a content store");
  }
  if(device_id_.empty()) {
    throw FormatError("TransferOrchestrator requires a device id");
  }
  if(!is_valid_ticket_identity(device_id_)) {
    throw FormatError("device id '" + device_id_ + "' cannot be embedded in a ticket");
  }
}

void TransferOrchestrator::ensure_ready() const {
  if(!endpoint_->ready()) {
    throw NotInitialized("Node not initialized: endpoint is not listening");
  }
}

TransferRecord TransferOrchestrator::create_record(const std::string& file_name,
                                                   uint64_t file_size,
                                                   TransferDirection direction) {
  TransferRecord record;
  record.id = make_uuid_v4();
  record.file_name = file_name;
  record.file_size = file_size;
  record.direction = direction;
  record.status = TransferStatus::Pending;
  registry_.put(record);
  events_.on_transfer_update(record);
  return record;
}

void TransferOrchestrator::emit_update(const std::optional<TransferRecord>& record) {
  if(record) events_.on_transfer_update(*record);
}

void TransferOrchestrator::mark_failed(const std::string& transfer_id, const std::string& message) {
  log_error(logger_.get(), "transfer {} failed: {}", transfer_id, message);
  emit_update(registry_.fail(transfer_id, message));
}

TicketInfo TransferOrchestrator::send_file(const std::filesystem::path& path) {
  ensure_ready();
  auto file_name = sanitize_ticket_file_name(file_name_from_path(path.string()));
  log_info(logger_.get(), "sending file: {}", path.string());
  auto record = create_record(file_name, 0, TransferDirection::Send);

  std::vector<char> data;
  auto started = std::chrono::steady_clock::now();
  try {
    data = read_whole_file(path);
  } catch(const VegamError& e) {
    mark_failed(record.id, e.what());
    throw;
  }

  uint64_t size = data.size();
  double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  uint64_t speed = elapsed > 0.0 ? static_cast<uint64_t>(static_cast<double>(size) / elapsed) : 0;
  registry_.start(record.id);
  registry_.update_size(record.id, size);
  registry_.update_speed(record.id, speed);
  if(auto reading = registry_.update_progress(record.id, size)) {
    events_.on_transfer_progress(*reading);
  }

  return publish(record.id, std::move(data), path.string());
}

TicketInfo TransferOrchestrator::send_bytes(std::vector<char> data, const std::string& original_path) {
  ensure_ready();
  auto file_name = sanitize_ticket_file_name(file_name_from_path(original_path));
  auto record = create_record(file_name, data.size(), TransferDirection::Send);
  return publish(record.id, std::move(data), original_path);
}

TicketInfo TransferOrchestrator::publish(const std::string& transfer_id,
                                         std::vector<char> data,
                                         const std::string& original_path) {
  TicketInfo info;
  info.transfer_id = transfer_id;
  info.file_name = sanitize_ticket_file_name(file_name_from_path(original_path));
  info.file_size = data.size();
  try {
    auto hash = store_->import_bytes(std::move(data));
    TransferTicket ticket;
    ticket.file_name = info.file_name;
    ticket.file_size = info.file_size;
    ticket.address = endpoint_->local_address(hash);
    info.ticket = encrypt_ticket(compose_ticket_plaintext(ticket), device_id_);
    log_info(logger_.get(), "ticket ready for {} ({} bytes), blob {}", info.file_name, info.file_size, hash);
  } catch(const std::exception& e) {
    mark_failed(transfer_id, std::string("Failed to create ticket: ") + e.what());
    throw;
  }
  emit_update(registry_.complete(transfer_id, info.file_size));
  return info;
}

TicketMetadata TransferOrchestrator::inspect_ticket(const std::string& ticket) const {
  auto decoded = decode_ticket(ticket, device_id_);
  auto resolved = resolve_ticket(decoded.payload);
  TicketMetadata meta;
  meta.file_name = resolved.file_name;
  meta.file_size = resolved.file_size;
  meta.sender_id = decoded.sender_id;
  meta.legacy = is_legacy_ticket(decoded.payload);
  return meta;
}

TransferRecord TransferOrchestrator::receive(const std::string& ticket, const std::filesystem::path& destination) {
  ensure_ready();
  auto decoded = decode_ticket(ticket, device_id_);
  auto resolved = resolve_ticket(decoded.payload);

  std::string file_name = resolved.file_name;
  std::error_code dir_ec;
  if(is_legacy_ticket(decoded.payload) && !std::filesystem::is_directory(destination, dir_ec)) {
    file_name = file_name_from_path(destination.string(), "unknown");
  }
  auto target = resolve_output_path(destination, file_name);
  log_info(logger_.get(), "receiving {} ({} bytes) from {} to {}",
           file_name, resolved.file_size, decoded.sender_id, target.string());

  auto record = create_record(file_name, resolved.file_size, TransferDirection::Receive);
  const std::string id = record.id;

  std::weak_ptr<TransferOrchestrator> weak = shared_from_this();
  auto reporter = std::make_shared<ThrottledProgressReporter>(
    [weak](const ProgressSample& sample){
      auto self = weak.lock();
      if(!self) return;
      self->registry_.update_speed(sample.transfer_id, sample.speed_bps);
      if(sample.total > 0) self->registry_.update_size(sample.transfer_id, sample.total);
      if(auto current = self->registry_.update_progress(sample.transfer_id, sample.bytes_transferred)) {
        self->events_.on_transfer_progress(*current);
      }
    },
    options_.progress_interval);

  auto hash = resolved.address.hash;
  auto self = shared_from_this();
  try {
    endpoint_->async_fetch(resolved.address,
      [this, self, id, reporter](uint64_t received, uint64_t total){
        registry_.update_progress(id, received);
        reporter->on_progress(id, received, total);
      },
      [this, self, id, target, hash, reporter](const FetchResult& result){
        on_fetch_complete(id, target, hash, result, reporter);
      });
  } catch(const VegamError& e) {
    mark_failed(id, e.what());
    throw;
  }
  return record;
}

void TransferOrchestrator::on_fetch_complete(const std::string& transfer_id,
                                             const std::filesystem::path& target,
                                             const std::string& hash,
                                             const FetchResult& result,
                                             const std::shared_ptr<ThrottledProgressReporter>& reporter) {
  auto current = registry_.get(transfer_id);
  if(current && current->status == TransferStatus::Cancelled) {
    log_info(logger_.get(), "transfer {} was cancelled; discarding fetched content", transfer_id);
    return;
  }
  if(!result.success) {
    mark_failed(transfer_id, "Download failed: " + result.error);
    return;
  }

  auto blob = store_->read(hash);
  if(!blob) {
    mark_failed(transfer_id, "Download failed: content missing from local store");
    return;
  }
  try {
    write_output(target, blob);
  } catch(const VegamError& e) {
    mark_failed(transfer_id, e.what());
    return;
  }

  uint64_t written = blob->size();
  reporter->finish(transfer_id, written, written);
  log_info(logger_.get(), "transfer {} complete: {} bytes written to {}", transfer_id, written, target.string());
  emit_update(registry_.complete(transfer_id, written));
}

void TransferOrchestrator::write_output(const std::filesystem::path& target, const BlobData& blob) const {
  std::error_code ec;
  if(target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if(ec) {
      throw IoError("Failed to create directory " + target.parent_path().string() + ": " + ec.message());
    }
  }
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw IoError("Failed to open " + target.string() + " for writing");
  }
  out.write(blob->data(), static_cast<std::streamsize>(blob->size()));
  out.flush();
  if(!out) {
    throw IoError("Failed to write " + target.string());
  }
}

std::optional<TransferRecord> TransferOrchestrator::status(const std::string& transfer_id) const {
  return registry_.get(transfer_id);
}

std::vector<TransferRecord> TransferOrchestrator::list() const {
  return registry_.list();
}

bool TransferOrchestrator::cancel(const std::string& transfer_id) {
  auto record = registry_.cancel(transfer_id);
  if(!record) return false;
  log_info(logger_.get(), "transfer {} cancelled", transfer_id);
  events_.on_transfer_update(*record);
  return true;
}
