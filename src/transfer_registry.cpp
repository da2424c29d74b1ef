#include "transfer_registry.hpp"

#include <algorithm>
#include <mutex>

const char* to_string(TransferStatus status) {
  switch(status) {
    case TransferStatus::Pending: return "pending";
    case TransferStatus::InProgress: return "inprogress";
    case TransferStatus::Completed: return "completed";
    case TransferStatus::Failed: return "failed";
    case TransferStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* to_string(TransferDirection direction) {
  return direction == TransferDirection::Send ? "send" : "receive";
}

bool is_terminal(TransferStatus status) {
  return status == TransferStatus::Completed ||
         status == TransferStatus::Failed ||
         status == TransferStatus::Cancelled;
}

void to_json(nlohmann::json& j, const TransferRecord& record) {
  j = nlohmann::json{
    {"id", record.id},
    {"file_name", record.file_name},
    {"file_size", record.file_size},
    {"bytes_transferred", record.bytes_transferred},
    {"status", to_string(record.status)},
    {"direction", to_string(record.direction)},
    {"speed_bps", record.speed_bps}
  };
  if(record.error) {
    j["error"] = *record.error;
  } else {
    j["error"] = nullptr;
  }
}

TransferRegistry::TransferRegistry(std::size_t history_limit)
  : history_limit_(history_limit) {}

bool TransferRegistry::put(const TransferRecord& record) {
  std::unique_lock lock(m_);
  auto it = records_.find(record.id);
  if(it != records_.end()) {
    if(is_terminal(it->second.status)) return false;
    it->second = record;
    return true;
  }
  records_.emplace(record.id, record);
  order_.push_back(record.id);
  prune_locked();
  return true;
}

std::optional<TransferRecord> TransferRegistry::get(const std::string& id) const {
  std::shared_lock lock(m_);
  auto it = records_.find(id);
  if(it == records_.end()) return std::nullopt;
  return it->second;
}

std::vector<TransferRecord> TransferRegistry::list() const {
  std::shared_lock lock(m_);
  std::vector<TransferRecord> out;
  out.reserve(order_.size());
  for(const auto& id : order_) {
    auto it = records_.find(id);
    if(it != records_.end()) out.push_back(it->second);
  }
  return out;
}

template<typename Fn>
std::optional<TransferRecord> TransferRegistry::mutate(const std::string& id, Fn&& fn) {
  std::unique_lock lock(m_);
  auto it = records_.find(id);
  if(it == records_.end()) return std::nullopt;
  if(is_terminal(it->second.status)) return std::nullopt;
  fn(it->second);
  auto copy = it->second;
  if(is_terminal(copy.status)) prune_locked();
  return copy;
}

std::optional<TransferRecord> TransferRegistry::start(const std::string& id) {
  return mutate(id, [](TransferRecord& r){
    r.status = TransferStatus::InProgress;
  });
}

std::optional<TransferRecord> TransferRegistry::update_progress(const std::string& id, uint64_t bytes_transferred) {
  return mutate(id, [bytes_transferred](TransferRecord& r){
    r.bytes_transferred = bytes_transferred;
    if(bytes_transferred > 0 && r.status == TransferStatus::Pending) {
      r.status = TransferStatus::InProgress;
    }
  });
}

std::optional<TransferRecord> TransferRegistry::update_speed(const std::string& id, uint64_t speed_bps) {
  return mutate(id, [speed_bps](TransferRecord& r){
    r.speed_bps = speed_bps;
  });
}

std::optional<TransferRecord> TransferRegistry::update_size(const std::string& id, uint64_t file_size) {
  return mutate(id, [file_size](TransferRecord& r){
    r.file_size = file_size;
  });
}

std::optional<TransferRecord> TransferRegistry::complete(const std::string& id, uint64_t bytes_transferred) {
  return mutate(id, [bytes_transferred](TransferRecord& r){
    r.status = TransferStatus::Completed;
    r.bytes_transferred = bytes_transferred;
    r.file_size = bytes_transferred;
    r.error.reset();
  });
}

std::optional<TransferRecord> TransferRegistry::fail(const std::string& id, const std::string& message) {
  return mutate(id, [&message](TransferRecord& r){
    r.status = TransferStatus::Failed;
    r.error = message;
    r.speed_bps = 0;
  });
}

std::optional<TransferRecord> TransferRegistry::cancel(const std::string& id) {
  return mutate(id, [](TransferRecord& r){
    r.status = TransferStatus::Cancelled;
    r.speed_bps = 0;
  });
}

std::size_t TransferRegistry::size() const {
  std::shared_lock lock(m_);
  return records_.size();
}

void TransferRegistry::set_history_limit(std::size_t limit) {
  std::unique_lock lock(m_);
  history_limit_ = limit;
  prune_locked();
}

void TransferRegistry::prune_locked() {
  if(history_limit_ == 0) return;
  // active transfers are never dropped, so the table may stay above the limit
  auto it = order_.begin();
  while(records_.size() > history_limit_ && it != order_.end()) {
    auto rec = records_.find(*it);
    if(rec == records_.end()) {
      it = order_.erase(it);
    } else if(is_terminal(rec->second.status)) {
      records_.erase(rec);
      it = order_.erase(it);
    } else {
      ++it;
    }
  }
}
