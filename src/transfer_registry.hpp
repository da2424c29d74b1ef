#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class TransferStatus { Pending, InProgress, Completed, Failed, Cancelled };
enum class TransferDirection { Send, Receive };

const char* to_string(TransferStatus status);
const char* to_string(TransferDirection direction);
bool is_terminal(TransferStatus status);

struct TransferRecord {
  std::string id;
  std::string file_name;
  uint64_t file_size = 0;
  uint64_t bytes_transferred = 0;
  TransferStatus status = TransferStatus::Pending;
  TransferDirection direction = TransferDirection::Send;
  std::optional<std::string> error;
  uint64_t speed_bps = 0;
};

void to_json(nlohmann::json& j, const TransferRecord& record);

// Transfer records by id. Every method is atomic; callers holding a copy
// must re-query to see later changes.
//
//   Pending -> InProgress -> Completed
//   Pending|InProgress -> Failed | Cancelled
//
// Completed, Failed and Cancelled are terminal: mutators return nullopt
// and leave the record untouched.
class TransferRegistry {
public:
  // history_limit == 0 keeps every record; otherwise the oldest terminal
  // records are dropped once the table grows past the limit.
  explicit TransferRegistry(std::size_t history_limit = 0);

  // Insert or replace. Refuses (returns false) to overwrite a terminal record.
  bool put(const TransferRecord& record);

  std::optional<TransferRecord> get(const std::string& id) const;
  std::vector<TransferRecord> list() const; // creation order

  std::optional<TransferRecord> start(const std::string& id);
  // Pending records are promoted to InProgress once bytes_transferred > 0.
  std::optional<TransferRecord> update_progress(const std::string& id, uint64_t bytes_transferred);
  std::optional<TransferRecord> update_speed(const std::string& id, uint64_t speed_bps);
  std::optional<TransferRecord> update_size(const std::string& id, uint64_t file_size);
  std::optional<TransferRecord> complete(const std::string& id, uint64_t bytes_transferred);
  std::optional<TransferRecord> fail(const std::string& id, const std::string& message);
  std::optional<TransferRecord> cancel(const std::string& id);

  std::size_t size() const;
  void set_history_limit(std::size_t limit);

private:
  template<typename Fn>
  std::optional<TransferRecord> mutate(const std::string& id, Fn&& fn);
  void prune_locked();

  mutable std::shared_mutex m_;
  std::unordered_map<std::string, TransferRecord> records_;
  std::deque<std::string> order_;
  std::size_t history_limit_ = 0;
};
