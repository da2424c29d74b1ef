#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

using BlobData = std::shared_ptr<const std::vector<char>>;

// Content-addressed blob storage keyed by lowercase SHA-256 hex.
class ContentStore {
public:
  virtual ~ContentStore() = default;

  // Returns the content id. Importing identical bytes twice yields the same id.
  virtual std::string import_bytes(std::vector<char> data) = 0;
  virtual bool contains(const std::string& hash) const = 0;
  virtual BlobData read(const std::string& hash) const = 0; // null when absent
  virtual std::optional<uint64_t> size_of(const std::string& hash) const = 0;
};

class MemoryContentStore : public ContentStore {
public:
  std::string import_bytes(std::vector<char> data) override;
  bool contains(const std::string& hash) const override;
  BlobData read(const std::string& hash) const override;
  std::optional<uint64_t> size_of(const std::string& hash) const override;

  std::size_t blob_count() const;
  uint64_t total_bytes() const;

private:
  mutable std::shared_mutex m_;
  std::unordered_map<std::string, BlobData> blobs_;
};
