#include "blob_endpoint.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <istream>
#include <sstream>

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <unistd.h>

using tcp = asio::ip::tcp;

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr std::size_t kMaxHeaderLine = 16 * 1024;
// The announced size is unverified until the bytes arrive.
constexpr std::size_t kMaxInitialReserve = 1024 * 1024;

// Serves a single blob_request, then closes.
class BlobSession : public std::enable_shared_from_this<BlobSession> {
public:
  BlobSession(tcp::socket sock,
              std::shared_ptr<ContentStore> store,
              std::string node_id,
              std::shared_ptr<Logger> logger)
    : socket_(std::move(sock)),
      read_buf_(kMaxHeaderLine),
      store_(std::move(store)),
      node_id_(std::move(node_id)),
      logger_(std::move(logger)) {}

  void start() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, '\n',
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          log_debug(logger_.get(), "blob session read error: {}", ec.message());
          close();
          return;
        }
        std::istream is(&read_buf_);
        std::string line;
        std::getline(is, line);
        handle_request(line);
      });
  }

private:
  void handle_request(const std::string& line) {
    std::string hash;
    try {
      auto j = nlohmann::json::parse(line);
      if(!j.is_object() || j.value("type", std::string()) != "blob_request") {
        send_error("", "expected blob_request");
        return;
      }
      hash = j.value("hash", std::string());
    } catch(const std::exception& ex) {
      log_warn(logger_.get(), "blob session bad request: {}", ex.what());
      send_error("", "malformed request");
      return;
    }

    blob_ = store_->read(hash);
    if(!blob_) {
      log_info(logger_.get(), "blob {} requested but not stored", hash);
      send_error(hash, "blob not found");
      return;
    }
    log_info(logger_.get(), "serving blob {} ({} bytes) to {}",
             hash, blob_->size(), remote_label());
    header_ = make_blob_header(node_id_, hash, blob_->size()).dump() + "\n";
    std::vector<asio::const_buffer> buffers;
    buffers.push_back(asio::buffer(header_));
    buffers.push_back(asio::buffer(*blob_));
    auto self = shared_from_this();
    asio::async_write(socket_, buffers,
      [this, self](std::error_code ec, std::size_t){
        if(ec) log_warn(logger_.get(), "blob send failed: {}", ec.message());
        close();
      });
  }

  void send_error(const std::string& hash, const std::string& message) {
    header_ = make_blob_error(hash, message).dump() + "\n";
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(header_),
      [this, self](std::error_code, std::size_t){
        close();
      });
  }

  std::string remote_label() const {
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if(ec) return "?";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
  }

  void close() {
    std::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }

  tcp::socket socket_;
  asio::streambuf read_buf_;
  std::shared_ptr<ContentStore> store_;
  std::string node_id_;
  std::shared_ptr<Logger> logger_;
  BlobData blob_;
  std::string header_;
};

// Pulls one blob, trying each direct address in order until one succeeds.
// All socket, resolver and timer handlers run on strand_.
class BlobFetch : public std::enable_shared_from_this<BlobFetch> {
public:
  BlobFetch(asio::io_context& io,
            std::shared_ptr<ContentStore> store,
            BlobAddress address,
            uint64_t max_size,
            std::chrono::seconds io_timeout,
            NetworkEndpoint::FetchProgress progress,
            NetworkEndpoint::FetchCompletion completion,
            std::shared_ptr<Logger> logger)
    : strand_(asio::make_strand(io)),
      resolver_(strand_),
      socket_(strand_),
      deadline_(strand_),
      store_(std::move(store)),
      address_(std::move(address)),
      max_size_(max_size),
      io_timeout_(io_timeout),
      progress_(std::move(progress)),
      completion_(std::move(completion)),
      logger_(std::move(logger)) {}

  void start() {
    auto self = shared_from_this();
    asio::post(strand_, [this, self](){
      if(address_.direct_addrs.empty()) {
        finish(false, "no direct addresses for node " + address_.node_id);
        return;
      }
      try_next();
    });
  }

private:
  void try_next() {
    if(next_index_ >= address_.direct_addrs.size()) {
      finish(false, last_error_.empty() ? "unable to reach sender" : last_error_);
      return;
    }
    current_ = address_.direct_addrs[next_index_++];
    reset_attempt();

    std::string host;
    uint16_t port = 0;
    if(!split_host_port(current_, host, port)) {
      attempt_failed("invalid address '" + current_ + "'");
      return;
    }
    log_debug(logger_.get(), "fetching {} from {}", address_.hash, current_);
    arm_deadline();
    auto self = shared_from_this();
    resolver_.async_resolve(host, std::to_string(port), asio::bind_executor(strand_,
      [this, self](std::error_code ec, tcp::resolver::results_type results){
        if(ec) {
          attempt_failed("resolve " + current_ + ": " + ec.message());
          return;
        }
        asio::async_connect(socket_, results, asio::bind_executor(strand_,
          [this, self](std::error_code ec, const tcp::endpoint&){
            if(ec) {
              attempt_failed("connect " + current_ + ": " + ec.message());
              return;
            }
            send_request();
          }));
      }));
  }

  void reset_attempt() {
    std::error_code ec;
    socket_.close(ec);
    socket_ = tcp::socket(strand_);
    read_buf_.consume(read_buf_.size());
    data_.clear();
    expected_ = 0;
  }

  void arm_deadline() {
    deadline_.expires_after(io_timeout_);
    auto self = shared_from_this();
    std::size_t attempt = next_index_;
    deadline_.async_wait(asio::bind_executor(strand_,
      [this, self, attempt](const std::error_code& ec){
        if(ec || done_ || attempt != next_index_) return;
        // re-armed after this handler was queued
        if(deadline_.expiry() > asio::steady_timer::clock_type::now()) return;
        log_warn(logger_.get(), "fetch from {} timed out", current_);
        std::error_code close_ec;
        resolver_.cancel();
        socket_.close(close_ec);
      }));
  }

  void send_request() {
    request_ = make_blob_request(address_.hash).dump() + "\n";
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(request_), asio::bind_executor(strand_,
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          attempt_failed("send request: " + ec.message());
          return;
        }
        read_header();
      }));
  }

  void read_header() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, '\n', asio::bind_executor(strand_,
      [this, self](std::error_code ec, std::size_t header_bytes){
        if(ec) {
          attempt_failed("read header: " + ec.message());
          return;
        }
        std::string line(asio::buffers_begin(read_buf_.data()),
                         asio::buffers_begin(read_buf_.data()) + header_bytes);
        read_buf_.consume(header_bytes);
        handle_header(line);
      }));
  }

  void handle_header(const std::string& line) {
    try {
      accept_header(nlohmann::json::parse(line));
    } catch(const nlohmann::json::exception& ex) {
      attempt_failed(std::string("bad header: ") + ex.what());
    }
  }

  void accept_header(const nlohmann::json& j) {
    auto type = j.is_object() ? j.value("type", std::string()) : std::string();
    if(type == "blob_error") {
      attempt_failed("sender reported: " + j.value("message", std::string("unknown error")));
      return;
    }
    if(type != "blob_header") {
      attempt_failed("unexpected reply '" + type + "'");
      return;
    }
    auto node = j.value("node_id", std::string());
    if(node != address_.node_id) {
      attempt_failed("node id mismatch at " + current_);
      return;
    }
    if(j.value("hash", std::string()) != address_.hash) {
      attempt_failed("hash mismatch at " + current_);
      return;
    }
    auto size_it = j.find("size");
    if(size_it == j.end() || !size_it->is_number_unsigned()) {
      attempt_failed("header without size");
      return;
    }
    expected_ = size_it->get<uint64_t>();
    if(expected_ > max_size_) {
      attempt_failed("blob of " + std::to_string(expected_) + " bytes exceeds limit");
      return;
    }
    data_.reserve(static_cast<std::size_t>(std::min<uint64_t>(expected_, kMaxInitialReserve)));

    // bytes that arrived together with the header line
    std::size_t leftover = std::min<std::size_t>(read_buf_.size(), static_cast<std::size_t>(expected_));
    if(leftover > 0) {
      auto begin = asio::buffers_begin(read_buf_.data());
      data_.insert(data_.end(), begin, begin + leftover);
      read_buf_.consume(leftover);
    }
    report_progress();
    read_body();
  }

  void read_body() {
    if(data_.size() >= expected_) {
      complete_body();
      return;
    }
    arm_deadline();
    std::size_t want = std::min<std::size_t>(kReadChunk, static_cast<std::size_t>(expected_ - data_.size()));
    chunk_.resize(want);
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(chunk_), asio::bind_executor(strand_,
      [this, self](std::error_code ec, std::size_t n){
        if(n > 0) {
          data_.insert(data_.end(), chunk_.begin(), chunk_.begin() + n);
          report_progress();
        }
        if(ec && data_.size() < expected_) {
          attempt_failed("download interrupted after " + std::to_string(data_.size()) +
                         " of " + std::to_string(expected_) + " bytes: " + ec.message());
          return;
        }
        read_body();
      }));
  }

  void complete_body() {
    std::error_code ec;
    socket_.close(ec);
    if(sha256_hex(data_) != address_.hash) {
      attempt_failed("content hash mismatch");
      return;
    }
    uint64_t bytes = data_.size();
    try {
      store_->import_bytes(std::move(data_));
    } catch(const std::exception& ex) {
      finish(false, std::string("import failed: ") + ex.what());
      return;
    }
    data_.clear();
    log_info(logger_.get(), "fetched blob {} ({} bytes) from {}", address_.hash, bytes, current_);
    finish(true, "", bytes);
  }

  void report_progress() {
    if(!progress_) return;
    uint64_t received = data_.size();
    if(received < last_reported_) return;
    last_reported_ = received;
    progress_(received, expected_);
  }

  void attempt_failed(const std::string& reason) {
    if(done_) return;
    log_warn(logger_.get(), "fetch attempt failed: {}", reason);
    last_error_ = reason;
    std::error_code ec;
    socket_.close(ec);
    try_next();
  }

  void finish(bool success, const std::string& error, uint64_t bytes = 0) {
    if(done_) return;
    done_ = true;
    std::error_code ec;
    deadline_.cancel(ec);
    socket_.close(ec);
    FetchResult result;
    result.success = success;
    result.error = error;
    result.bytes = bytes;
    if(completion_) completion_(result);
  }

  asio::strand<asio::io_context::executor_type> strand_;
  tcp::resolver resolver_;
  tcp::socket socket_;
  asio::steady_timer deadline_;
  std::shared_ptr<ContentStore> store_;
  BlobAddress address_;
  uint64_t max_size_;
  std::chrono::seconds io_timeout_;
  NetworkEndpoint::FetchProgress progress_;
  NetworkEndpoint::FetchCompletion completion_;
  std::shared_ptr<Logger> logger_;

  asio::streambuf read_buf_;
  std::string request_;
  std::vector<char> data_;
  std::vector<char> chunk_;
  uint64_t expected_ = 0;
  uint64_t last_reported_ = 0;
  std::size_t next_index_ = 0;
  std::string current_;
  std::string last_error_;
  bool done_ = false;
};

std::vector<std::string> split_list(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while(std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t"));
    auto last = item.find_last_not_of(" \t");
    if(last == std::string::npos) continue;
    item.erase(last + 1);
    out.push_back(item);
  }
  return out;
}

std::string join_host_port(const asio::ip::address& address, uint16_t port) {
  if(address.is_v6()) return "[" + address.to_string() + "]:" + std::to_string(port);
  return address.to_string() + ":" + std::to_string(port);
}

} // namespace

bool split_host_port(const std::string& addr, std::string& host, uint16_t& port) {
  std::string port_text;
  if(!addr.empty() && addr.front() == '[') {
    auto close = addr.find(']');
    if(close == std::string::npos || close + 1 >= addr.size() || addr[close + 1] != ':') return false;
    host = addr.substr(1, close - 1);
    port_text = addr.substr(close + 2);
  } else {
    auto colon = addr.rfind(':');
    if(colon == std::string::npos || colon == 0) return false;
    host = addr.substr(0, colon);
    port_text = addr.substr(colon + 1);
  }
  if(port_text.empty() || port_text.size() > 5 ||
     !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c){ return std::isdigit(c); })) {
    return false;
  }
  unsigned long value = std::stoul(port_text);
  if(value == 0 || value > 65535) return false;
  port = static_cast<uint16_t>(value);
  return !host.empty();
}

TcpBlobEndpoint::TcpBlobEndpoint(asio::io_context& io,
                                 std::shared_ptr<ContentStore> store,
                                 std::string node_id,
                                 Options options,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    store_(std::move(store)),
    node_id_(std::move(node_id)),
    options_(std::move(options)),
    logger_(std::move(logger)),
    acceptor_(io) {
  if(!store_) throw std::runtime_error("TcpBlobEndpoint requires a content store");
  if(node_id_.empty()) throw FormatError("TcpBlobEndpoint requires a node id");
}

TcpBlobEndpoint::~TcpBlobEndpoint() {
  std::error_code ec;
  acceptor_.close(ec);
}

void TcpBlobEndpoint::start() {
  if(listening_) return;
  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.listen_ip);
  } catch(const std::exception& e) {
    throw NetworkError("invalid listen_ip '" + options_.listen_ip + "': " + e.what());
  }

  tcp::endpoint endpoint(listen_address, options_.listen_port);
  std::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  if(!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_.bind(endpoint, ec);
  if(!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    std::error_code close_ec;
    acceptor_.close(close_ec);
    throw NetworkError("unable to listen on " + join_host_port(listen_address, options_.listen_port) +
                       ": " + ec.message());
  }
  listen_port_ = acceptor_.local_endpoint().port();

  auto addrs = compute_direct_addresses();
  {
    std::lock_guard<std::mutex> lock(addr_mutex_);
    direct_addrs_ = addrs;
  }
  listening_ = true;
  log_info(logger_.get(), "blob endpoint {} listening on {}:{}", node_id_, options_.listen_ip, listen_port_.load());
  do_accept();
}

void TcpBlobEndpoint::stop() {
  if(!listening_.exchange(false)) return;
  auto self = shared_from_this();
  asio::post(io_, [this, self](){
    std::error_code ec;
    acceptor_.close(ec);
  });
  log_info(logger_.get(), "blob endpoint {} stopped", node_id_);
}

void TcpBlobEndpoint::do_accept() {
  auto self = shared_from_this();
  acceptor_.async_accept(
    [this, self](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          log_error(logger_.get(), "accept error: {}", ec.message());
        }
      } else {
        std::make_shared<BlobSession>(std::move(socket), store_, node_id_, logger_)->start();
      }
      if(listening_ && acceptor_.is_open()) {
        do_accept();
      }
    });
}

std::vector<std::string> TcpBlobEndpoint::compute_direct_addresses() const {
  uint16_t port = listen_port_.load();
  if(!options_.advertise_addr.empty()) {
    std::vector<std::string> out;
    for(auto& item : split_list(options_.advertise_addr)) {
      // a bare host gets the bound port
      std::string host;
      uint16_t p = 0;
      if(split_host_port(item, host, p)) {
        out.push_back(item);
      } else {
        out.push_back(item + ":" + std::to_string(port));
      }
    }
    return out;
  }

  auto bound = acceptor_.local_endpoint().address();
  if(!bound.is_unspecified()) {
    return {join_host_port(bound, port)};
  }

  std::vector<std::string> out;
  std::error_code ec;
  tcp::resolver resolver(io_);
  char hostname[256] = {0};
  if(gethostname(hostname, sizeof(hostname) - 1) == 0) {
    auto results = resolver.resolve(tcp::v4(), hostname, std::to_string(port), ec);
    if(!ec) {
      for(const auto& entry : results) {
        auto addr = entry.endpoint().address();
        if(addr.is_loopback()) continue;
        auto text = join_host_port(addr, port);
        if(std::find(out.begin(), out.end(), text) == out.end()) out.push_back(text);
      }
    } else {
      log_debug(logger_.get(), "hostname lookup failed: {}", ec.message());
    }
  }
  out.push_back("127.0.0.1:" + std::to_string(port));
  return out;
}

std::vector<std::string> TcpBlobEndpoint::direct_addresses() const {
  std::lock_guard<std::mutex> lock(addr_mutex_);
  return direct_addrs_;
}

BlobAddress TcpBlobEndpoint::local_address(const std::string& hash) const {
  if(!ready()) throw NotInitialized("blob endpoint is not listening");
  BlobAddress address;
  address.node_id = node_id_;
  address.direct_addrs = direct_addresses();
  address.hash = hash;
  return address;
}

void TcpBlobEndpoint::async_fetch(const BlobAddress& address,
                                  FetchProgress progress,
                                  FetchCompletion completion) {
  if(!ready()) throw NotInitialized("blob endpoint is not listening");
  if(store_->contains(address.hash)) {
    // already local (sending to ourselves, or a repeated receive)
    auto size = store_->size_of(address.hash).value_or(0);
    asio::post(io_, [progress = std::move(progress), completion = std::move(completion), size](){
      if(progress) progress(size, size);
      FetchResult result;
      result.success = true;
      result.bytes = size;
      if(completion) completion(result);
    });
    return;
  }
  auto fetch = std::make_shared<BlobFetch>(io_, store_, address, options_.max_blob_size,
                                           options_.io_timeout, std::move(progress),
                                           std::move(completion), logger_);
  fetch->start();
}
