#include "content_store.hpp"

#include <mutex>

#include "utils.hpp"

std::string MemoryContentStore::import_bytes(std::vector<char> data) {
  auto hash = sha256_hex(data);
  auto blob = std::make_shared<const std::vector<char>>(std::move(data));
  std::unique_lock lock(m_);
  blobs_.emplace(hash, std::move(blob));
  return hash;
}

bool MemoryContentStore::contains(const std::string& hash) const {
  std::shared_lock lock(m_);
  return blobs_.count(hash) > 0;
}

BlobData MemoryContentStore::read(const std::string& hash) const {
  std::shared_lock lock(m_);
  auto it = blobs_.find(hash);
  if(it == blobs_.end()) return nullptr;
  return it->second;
}

std::optional<uint64_t> MemoryContentStore::size_of(const std::string& hash) const {
  std::shared_lock lock(m_);
  auto it = blobs_.find(hash);
  if(it == blobs_.end()) return std::nullopt;
  return static_cast<uint64_t>(it->second->size());
}

std::size_t MemoryContentStore::blob_count() const {
  std::shared_lock lock(m_);
  return blobs_.size();
}

uint64_t MemoryContentStore::total_bytes() const {
  std::shared_lock lock(m_);
  uint64_t total = 0;
  for(const auto& kv : blobs_) total += kv.second->size();
  return total;
}
