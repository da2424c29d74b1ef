#include "progress.hpp"

ThrottledProgressReporter::ThrottledProgressReporter(Emit emit,
                                                     std::chrono::milliseconds min_interval,
                                                     Clock clock)
  : emit_(std::move(emit)),
    min_interval_(min_interval),
    clock_(clock ? std::move(clock) : Clock([]{ return std::chrono::steady_clock::now(); })) {
  if(min_interval_.count() < 0) min_interval_ = std::chrono::milliseconds(0);
}

std::optional<ProgressSample> ThrottledProgressReporter::take_sample(const std::string& transfer_id,
                                                                     uint64_t transferred,
                                                                     uint64_t total,
                                                                     bool force) {
  auto now = clock_();
  std::lock_guard<std::mutex> lock(m_);
  ProgressSample sample;
  sample.transfer_id = transfer_id;
  sample.bytes_transferred = transferred;
  sample.total = total;

  if(!has_last_) {
    has_last_ = true;
    last_time_ = now;
    last_bytes_ = transferred;
    ++emitted_;
    return sample;
  }

  auto elapsed = now - last_time_;
  if(!force && elapsed < min_interval_) return std::nullopt;

  double seconds = std::chrono::duration<double>(elapsed).count();
  uint64_t delta = transferred > last_bytes_ ? transferred - last_bytes_ : 0;
  sample.speed_bps = seconds > 0.0 ? static_cast<uint64_t>(static_cast<double>(delta) / seconds) : 0;

  last_time_ = now;
  last_bytes_ = transferred;
  ++emitted_;
  return sample;
}

void ThrottledProgressReporter::on_progress(const std::string& transfer_id, uint64_t transferred, uint64_t total) {
  auto sample = take_sample(transfer_id, transferred, total, false);
  if(sample && emit_) emit_(*sample);
}

void ThrottledProgressReporter::finish(const std::string& transfer_id, uint64_t transferred, uint64_t total) {
  auto sample = take_sample(transfer_id, transferred, total, true);
  if(sample && emit_) emit_(*sample);
}

std::size_t ThrottledProgressReporter::emitted() const {
  std::lock_guard<std::mutex> lock(m_);
  return emitted_;
}
