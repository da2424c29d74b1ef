#include "presence_protocol.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

PresenceProtocol::PresenceProtocol(asio::io_context& io,
                                   std::shared_ptr<BroadcastChannel> channel,
                                   PeerRoster& roster,
                                   EventSink& events,
                                   std::string device_id,
                                   std::string display_name,
                                   PresenceConfig config,
                                   std::shared_ptr<Logger> logger,
                                   EpochClock clock)
  : strand_(asio::make_strand(io)),
    timer_(strand_),
    channel_(std::move(channel)),
    roster_(roster),
    events_(events),
    device_id_(std::move(device_id)),
    display_name_(std::move(display_name)),
    config_(config),
    logger_(std::move(logger)),
    clock_(clock ? std::move(clock) : EpochClock([]{ return unix_time_seconds(); })) {
  if(device_id_.empty()) {
    throw FormatError("presence requires a device id");
  }
  if(config_.announce_interval.count() <= 0) {
    config_.announce_interval = std::chrono::seconds(30);
  }
}

void PresenceProtocol::start() {
  if(running_.exchange(true)) return;
  stopping_ = false;
  log_info(logger_.get(), "presence started for {} ({}), interval {}s, timeout {}s",
           display_name_, device_id_, config_.announce_interval.count(), config_.peer_timeout_seconds);
  auto self = shared_from_this();
  asio::dispatch(strand_, [this, self](){
    do_receive();
    schedule_tick(std::chrono::steady_clock::duration::zero());
  });
}

void PresenceProtocol::stop() {
  if(!running_.load()) return;
  stopping_ = true;
  auto self = shared_from_this();
  asio::dispatch(strand_, [this, self](){
    std::error_code ec;
    timer_.cancel(ec);
    channel_->close();
  });
}

void PresenceProtocol::schedule_tick(std::chrono::steady_clock::duration delay) {
  if(stopping_) return;
  timer_.expires_after(delay);
  auto self = shared_from_this();
  timer_.async_wait(asio::bind_executor(strand_, [this, self](const std::error_code& ec){
    if(ec || stopping_) return;
    on_tick();
    schedule_tick(config_.announce_interval);
  }));
}

void PresenceProtocol::on_tick() {
  announce();
  expire_stale_peers();
}

void PresenceProtocol::announce() {
  PresenceAnnouncement a;
  a.device_id = device_id_;
  a.display_name = display_name_;
  a.timestamp = clock_();
  std::string payload;
  try {
    payload = encode_presence_announcement(a);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "presence encode failed: {}", e.what());
    return;
  }
  auto logger = logger_;
  channel_->async_broadcast(std::move(payload), [logger](std::error_code ec){
    if(ec) {
      log_warn(logger.get(), "presence announce failed: {}", ec.message());
    }
  });
}

std::size_t PresenceProtocol::expire_stale_peers() {
  auto removed = roster_.remove_stale(clock_(), config_.peer_timeout_seconds);
  for(const auto& peer : removed) {
    log_info(logger_.get(), "peer lost: {} ({})", peer.display_name, peer.device_id);
    events_.on_peer_lost(peer);
  }
  if(!removed.empty()) {
    events_.on_peer_list_updated(roster_.snapshot());
  }
  return removed.size();
}

void PresenceProtocol::handle_payload(const std::string& payload) {
  PresenceAnnouncement a;
  try {
    a = decode_presence_announcement(payload);
  } catch(const VegamError& e) {
    log_warn(logger_.get(), "discarding presence message: {}", e.what());
    return;
  }
  if(a.device_id == device_id_) return;

  PeerRecord record;
  record.device_id = a.device_id;
  record.display_name = a.display_name;
  record.last_seen = clock_();
  bool is_new = roster_.upsert(record);
  if(is_new) {
    log_info(logger_.get(), "peer discovered: {} ({})", record.display_name, record.device_id);
    events_.on_peer_discovered(record);
  } else {
    log_debug(logger_.get(), "presence refresh from {}", record.device_id);
  }
  events_.on_peer_list_updated(roster_.snapshot());
}

void PresenceProtocol::do_receive() {
  auto self = shared_from_this();
  channel_->async_receive([this, self](std::error_code ec, std::string payload){
    asio::dispatch(strand_, [this, self, ec, payload = std::move(payload)](){
      if(ec) {
        if(stopping_) {
          log_info(logger_.get(), "presence stream closed");
        } else {
          log_error(logger_.get(), "presence stream ended: {}", ec.message());
          stopping_ = true;
          std::error_code cancel_ec;
          timer_.cancel(cancel_ec);
        }
        running_ = false;
        return;
      }
      handle_payload(payload);
      do_receive();
    });
  });
}
