#pragma once

#include "log.hpp"
#include "vegam_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vegam::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!label.empty()) {
          lines_.emplace_back(label + ": " + message);
        } else {
          lines_.emplace_back(channel + ": " + message);
        }
        cv_.notify_all();
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, nullptr, handle});
  }

  void attach(VegamEngine& engine, const std::string& label = std::string()) {
    auto handle = engine.add_log_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!label.empty()) {
          lines_.emplace_back(label + ": " + message);
        } else {
          lines_.emplace_back(channel + ": " + message);
        }
        cv_.notify_all();
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({nullptr, &engine, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
      if(attachment.engine && attachment.handle != 0) {
        attachment.engine->remove_log_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    VegamEngine* engine = nullptr;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

struct CheckFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Throws CheckFailure with the location so the runner can report it.
inline void check(bool condition, const char* expr, const char* file, int line) {
  if(!condition) {
    std::ostringstream oss;
    oss << file << ":" << line << ": check failed: " << expr;
    throw CheckFailure(oss.str());
  }
}

#define VEGAM_CHECK(expr) ::vegam::test::check(static_cast<bool>(expr), #expr, __FILE__, __LINE__)

template<typename Error, typename Fn>
bool throws_as(Fn&& fn) {
  try {
    fn();
  } catch(const Error&) {
    return true;
  } catch(const std::exception&) {
    return false;
  }
  return false;
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Runs every case, printing '.' or 'F' per case and the captured log lines of
// failures. Returns the process exit code.
inline int run_test_cases(const char* suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = (std::getenv("VEGAM_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("VEGAM_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "\nException in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace vegam::test
