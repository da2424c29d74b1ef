#pragma once
#include <asio.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include "log.hpp"

// Unreliable one-to-many message stream. A receive completing with an error
// means the stream is closed for good; callers stop receiving.
class BroadcastChannel {
public:
  using SendHandler = std::function<void(std::error_code)>;
  using ReceiveHandler = std::function<void(std::error_code, std::string)>;

  virtual ~BroadcastChannel() = default;

  virtual void async_broadcast(std::string payload, SendHandler handler) = 0;
  // At most one receive outstanding at a time.
  virtual void async_receive(ReceiveHandler handler) = 0;
  virtual void close() = 0;
};

// IPv4 UDP multicast. Loopback stays on so every node on the host, this one
// included, hears each announcement; the presence layer filters its own.
class UdpMulticastChannel : public BroadcastChannel {
public:
  static constexpr std::size_t kMaxDatagram = 8192;

  UdpMulticastChannel(asio::io_context& io,
                      const std::string& group,
                      uint16_t port,
                      std::shared_ptr<Logger> logger = nullptr);
  ~UdpMulticastChannel() override;

  void async_broadcast(std::string payload, SendHandler handler) override;
  void async_receive(ReceiveHandler handler) override;
  void close() override;

private:
  asio::ip::udp::socket socket_;
  asio::ip::udp::endpoint group_endpoint_;
  asio::ip::udp::endpoint sender_endpoint_;
  std::vector<char> recv_buf_;
  std::shared_ptr<Logger> logger_;
};

class LocalBroadcastChannel;

// In-process broadcast medium: everything sent on one channel is delivered to
// every open channel subscribed to the same bus, the sender included.
class LocalBroadcastBus : public std::enable_shared_from_this<LocalBroadcastBus> {
public:
  static std::shared_ptr<LocalBroadcastBus> create();

  std::shared_ptr<LocalBroadcastChannel> subscribe(asio::io_context& io);
  std::size_t subscriber_count() const;

private:
  LocalBroadcastBus() = default;
  friend class LocalBroadcastChannel;

  void publish(const std::string& payload);

  mutable std::mutex m_;
  std::vector<std::weak_ptr<LocalBroadcastChannel>> channels_;
};

class LocalBroadcastChannel : public BroadcastChannel,
                              public std::enable_shared_from_this<LocalBroadcastChannel> {
public:
  LocalBroadcastChannel(asio::io_context& io, std::shared_ptr<LocalBroadcastBus> bus);

  void async_broadcast(std::string payload, SendHandler handler) override;
  void async_receive(ReceiveHandler handler) override;
  void close() override;

  bool is_open() const;

private:
  friend class LocalBroadcastBus;
  void deliver(const std::string& payload);

  asio::io_context& io_;
  std::shared_ptr<LocalBroadcastBus> bus_;
  mutable std::mutex m_;
  std::deque<std::string> inbox_;
  ReceiveHandler pending_;
  bool closed_ = false;
};
