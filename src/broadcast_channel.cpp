#include "broadcast_channel.hpp"

UdpMulticastChannel::UdpMulticastChannel(asio::io_context& io,
                                         const std::string& group,
                                         uint16_t port,
                                         std::shared_ptr<Logger> logger)
  : socket_(io),
    recv_buf_(kMaxDatagram),
    logger_(std::move(logger)) {
  using udp = asio::ip::udp;
  auto group_address = asio::ip::make_address(group);
  group_endpoint_ = udp::endpoint(group_address, port);

  udp::endpoint listen_endpoint(asio::ip::address_v4::any(), port);
  socket_.open(listen_endpoint.protocol());
  socket_.set_option(udp::socket::reuse_address(true));
  socket_.bind(listen_endpoint);
  socket_.set_option(asio::ip::multicast::join_group(group_address));
  socket_.set_option(asio::ip::multicast::enable_loopback(true));
  socket_.set_option(asio::ip::multicast::hops(1));
  log_debug(logger_.get(), "multicast channel joined {}:{}", group, port);
}

UdpMulticastChannel::~UdpMulticastChannel() {
  std::error_code ec;
  socket_.close(ec);
}

void UdpMulticastChannel::async_broadcast(std::string payload, SendHandler handler) {
  auto data = std::make_shared<std::string>(std::move(payload));
  socket_.async_send_to(asio::buffer(*data), group_endpoint_,
    [data, handler = std::move(handler)](std::error_code ec, std::size_t){
      if(handler) handler(ec);
    });
}

void UdpMulticastChannel::async_receive(ReceiveHandler handler) {
  socket_.async_receive_from(asio::buffer(recv_buf_), sender_endpoint_,
    [this, handler = std::move(handler)](std::error_code ec, std::size_t bytes){
      if(ec) {
        handler(ec, std::string());
        return;
      }
      handler(ec, std::string(recv_buf_.data(), bytes));
    });
}

void UdpMulticastChannel::close() {
  std::error_code ec;
  socket_.close(ec);
}

std::shared_ptr<LocalBroadcastBus> LocalBroadcastBus::create() {
  return std::shared_ptr<LocalBroadcastBus>(new LocalBroadcastBus());
}

std::shared_ptr<LocalBroadcastChannel> LocalBroadcastBus::subscribe(asio::io_context& io) {
  auto channel = std::make_shared<LocalBroadcastChannel>(io, shared_from_this());
  std::lock_guard<std::mutex> lock(m_);
  channels_.push_back(channel);
  return channel;
}

std::size_t LocalBroadcastBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(m_);
  std::size_t count = 0;
  for(const auto& weak : channels_) {
    auto channel = weak.lock();
    if(channel && channel->is_open()) ++count;
  }
  return count;
}

void LocalBroadcastBus::publish(const std::string& payload) {
  std::vector<std::shared_ptr<LocalBroadcastChannel>> targets;
  {
    std::lock_guard<std::mutex> lock(m_);
    for(auto it = channels_.begin(); it != channels_.end();) {
      if(auto channel = it->lock()) {
        targets.push_back(std::move(channel));
        ++it;
      } else {
        it = channels_.erase(it);
      }
    }
  }
  for(auto& channel : targets) {
    channel->deliver(payload);
  }
}

LocalBroadcastChannel::LocalBroadcastChannel(asio::io_context& io, std::shared_ptr<LocalBroadcastBus> bus)
  : io_(io), bus_(std::move(bus)) {}

bool LocalBroadcastChannel::is_open() const {
  std::lock_guard<std::mutex> lock(m_);
  return !closed_;
}

void LocalBroadcastChannel::async_broadcast(std::string payload, SendHandler handler) {
  bool closed = !is_open();
  if(!closed) {
    bus_->publish(payload);
  }
  asio::post(io_, [handler = std::move(handler), closed](){
    if(handler) handler(closed ? std::error_code(asio::error::bad_descriptor) : std::error_code());
  });
}

void LocalBroadcastChannel::async_receive(ReceiveHandler handler) {
  std::unique_lock<std::mutex> lock(m_);
  if(closed_) {
    lock.unlock();
    asio::post(io_, [handler = std::move(handler)](){
      handler(asio::error::eof, std::string());
    });
    return;
  }
  if(!inbox_.empty()) {
    auto payload = std::move(inbox_.front());
    inbox_.pop_front();
    lock.unlock();
    asio::post(io_, [handler = std::move(handler), payload = std::move(payload)]() mutable {
      handler(std::error_code(), std::move(payload));
    });
    return;
  }
  pending_ = std::move(handler);
}

void LocalBroadcastChannel::deliver(const std::string& payload) {
  ReceiveHandler handler;
  {
    std::lock_guard<std::mutex> lock(m_);
    if(closed_) return;
    if(!pending_) {
      inbox_.push_back(payload);
      return;
    }
    handler = std::move(pending_);
    pending_ = nullptr;
  }
  asio::post(io_, [handler = std::move(handler), payload](){
    handler(std::error_code(), payload);
  });
}

void LocalBroadcastChannel::close() {
  ReceiveHandler handler;
  {
    std::lock_guard<std::mutex> lock(m_);
    if(closed_) return;
    closed_ = true;
    inbox_.clear();
    handler = std::move(pending_);
    pending_ = nullptr;
  }
  if(handler) {
    asio::post(io_, [handler = std::move(handler)](){
      handler(asio::error::eof, std::string());
    });
  }
}
