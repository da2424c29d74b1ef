#include "peer_roster.hpp"

#include <algorithm>
#include <mutex>

bool PeerRoster::upsert(const PeerRecord& record){
  std::unique_lock lock(m_);
  auto it = peers_.find(record.device_id);
  if(it == peers_.end()){
    peers_.emplace(record.device_id, record);
    return true;
  }
  it->second.display_name = record.display_name;
  it->second.last_seen = std::max(it->second.last_seen, record.last_seen);
  return false;
}

std::vector<PeerRecord> PeerRoster::remove_stale(uint64_t now, uint64_t timeout_seconds){
  std::vector<PeerRecord> removed;
  std::unique_lock lock(m_);
  for(auto it = peers_.begin(); it != peers_.end();){
    // a last_seen ahead of now counts as fresh
    uint64_t age = now > it->second.last_seen ? now - it->second.last_seen : 0;
    if(age > timeout_seconds){
      removed.push_back(it->second);
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

bool PeerRoster::remove(const std::string& device_id){
  std::unique_lock lock(m_);
  return peers_.erase(device_id) > 0;
}

std::optional<PeerRecord> PeerRoster::find(const std::string& device_id) const{
  std::shared_lock lock(m_);
  auto it = peers_.find(device_id);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

bool PeerRoster::contains(const std::string& device_id) const{
  std::shared_lock lock(m_);
  return peers_.count(device_id) > 0;
}

std::vector<PeerRecord> PeerRoster::snapshot() const{
  std::vector<PeerRecord> out;
  {
    std::shared_lock lock(m_);
    out.reserve(peers_.size());
    for(const auto& kv : peers_) out.push_back(kv.second);
  }
  std::sort(out.begin(), out.end(), [](const PeerRecord& a, const PeerRecord& b){
    if(a.display_name != b.display_name) return a.display_name < b.display_name;
    return a.device_id < b.device_id;
  });
  return out;
}

std::size_t PeerRoster::size() const{
  std::shared_lock lock(m_);
  return peers_.size();
}
