#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct PeerRecord {
  std::string device_id;
  std::string display_name;
  uint64_t last_seen = 0; // epoch seconds, local clock
};

// Live set of recently seen peers. Readers get copies.
class PeerRoster {
public:
  // Returns true when device_id was not known before.
  bool upsert(const PeerRecord& record);

  // Removes and returns every record with now - last_seen > timeout_seconds.
  std::vector<PeerRecord> remove_stale(uint64_t now, uint64_t timeout_seconds);

  bool remove(const std::string& device_id);
  std::optional<PeerRecord> find(const std::string& device_id) const;
  bool contains(const std::string& device_id) const;

  // Sorted by display name, then device id.
  std::vector<PeerRecord> snapshot() const;
  std::size_t size() const;

private:
  mutable std::shared_mutex m_;
  std::unordered_map<std::string, PeerRecord> peers_;
};
