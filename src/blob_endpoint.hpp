#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "content_store.hpp"
#include "log.hpp"
#include "ticket.hpp"

struct FetchResult {
  bool success = false;
  std::string error;
  uint64_t bytes = 0;
};

// What the transfer layer needs from the network: an identity, a way to
// describe where local content can be fetched from, and a fetch that lands
// the content in the local store.
class NetworkEndpoint {
public:
  using FetchProgress = std::function<void(uint64_t received, uint64_t total)>;
  using FetchCompletion = std::function<void(const FetchResult& result)>;

  virtual ~NetworkEndpoint() = default;

  virtual std::string node_id() const = 0;
  virtual bool ready() const = 0;
  virtual std::vector<std::string> direct_addresses() const = 0;
  virtual BlobAddress local_address(const std::string& hash) const = 0;

  // Progress samples are cumulative and non-decreasing. The completion runs
  // exactly once; on success the content is in the local store.
  virtual void async_fetch(const BlobAddress& address,
                           FetchProgress progress,
                           FetchCompletion completion) = 0;
};

// Serves blobs from a ContentStore over TCP and fetches blobs from peers.
// One request per connection:
//   -> {"type":"blob_request","hash":...}\n
//   <- {"type":"blob_header","node_id":...,"hash":...,"size":N}\n + N bytes
//   <- {"type":"blob_error","hash":...,"message":...}\n
class TcpBlobEndpoint : public NetworkEndpoint,
                        public std::enable_shared_from_this<TcpBlobEndpoint> {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 0;
    // Comma separated host:port list announced in tickets; empty derives it
    // from the bound socket.
    std::string advertise_addr;
    uint64_t max_blob_size = 4ull * 1024 * 1024 * 1024;
    std::chrono::seconds io_timeout{15};
  };

  TcpBlobEndpoint(asio::io_context& io,
                  std::shared_ptr<ContentStore> store,
                  std::string node_id,
                  Options options,
                  std::shared_ptr<Logger> logger = nullptr);
  ~TcpBlobEndpoint() override;

  // Binds and starts accepting. Throws NetworkError.
  void start();
  void stop();

  std::string node_id() const override { return node_id_; }
  bool ready() const override { return listening_.load(); }
  std::vector<std::string> direct_addresses() const override;
  BlobAddress local_address(const std::string& hash) const override;
  void async_fetch(const BlobAddress& address,
                   FetchProgress progress,
                   FetchCompletion completion) override;

  uint16_t listen_port() const { return listen_port_.load(); }
  std::shared_ptr<ContentStore> store() const { return store_; }
  const Options& options() const { return options_; }

private:
  void do_accept();
  std::vector<std::string> compute_direct_addresses() const;

  asio::io_context& io_;
  std::shared_ptr<ContentStore> store_;
  std::string node_id_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::ip::tcp::acceptor acceptor_;
  std::atomic<bool> listening_{false};
  std::atomic<uint16_t> listen_port_{0};
  mutable std::mutex addr_mutex_;
  std::vector<std::string> direct_addrs_;
};

// "host:port" or "[v6]:port". Returns false when there is no usable port.
bool split_host_port(const std::string& addr, std::string& host, uint16_t& port);
