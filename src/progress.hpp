#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

inline constexpr std::chrono::milliseconds kProgressMinInterval{250};

class ProgressListener {
public:
  virtual ~ProgressListener() = default;
  virtual void on_progress(const std::string& transfer_id, uint64_t transferred, uint64_t total) = 0;
};

struct ProgressSample {
  std::string transfer_id;
  uint64_t bytes_transferred = 0;
  uint64_t total = 0;
  uint64_t speed_bps = 0;
};

// Rate-limits samples for one transfer. The first sample and finish() are
// always emitted; anything else only once min_interval has passed since the
// last emission. Throughput is measured between emissions.
class ThrottledProgressReporter : public ProgressListener {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;
  using Emit = std::function<void(const ProgressSample&)>;

  ThrottledProgressReporter(Emit emit,
                            std::chrono::milliseconds min_interval = kProgressMinInterval,
                            Clock clock = nullptr);

  void on_progress(const std::string& transfer_id, uint64_t transferred, uint64_t total) override;
  void finish(const std::string& transfer_id, uint64_t transferred, uint64_t total);

  std::size_t emitted() const;

private:
  std::optional<ProgressSample> take_sample(const std::string& transfer_id,
                                            uint64_t transferred,
                                            uint64_t total,
                                            bool force);

  Emit emit_;
  std::chrono::milliseconds min_interval_;
  Clock clock_;

  mutable std::mutex m_;
  bool has_last_ = false;
  std::chrono::steady_clock::time_point last_time_{};
  uint64_t last_bytes_ = 0;
  std::size_t emitted_ = 0;
};
