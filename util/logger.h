// logger.h
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

// Anything that accepts finished log lines. Components take a
// std::shared_ptr<LogSink> so the caller decides where records go.
class LogSink {
public:
  virtual ~LogSink() = default;

  // Returns false if the line was dropped.
  virtual bool write_line(std::string line) = 0;
};

// Synchronous sink, one line per record. Used for console-only runs.
class StreamSink : public LogSink {
public:
  explicit StreamSink(std::ostream& os) : os_(os) {}

  bool write_line(std::string line) override {
    std::lock_guard<std::mutex> lk(mu_);
    os_ << line << "\n";
    return true;
  }

private:
  std::mutex mu_;
  std::ostream& os_;
};

// Asynchronous console + file logger. A single writer thread does all I/O.
class Logger : public LogSink {
public:
  // max_queue: upper bound of pending messages. When full, we drop (no blocking).
  explicit Logger(const fs::path& file_path,
                  std::size_t max_queue = 1u << 16 /* 65536 */,
                  bool echo_stdout = true)
      : max_queue_(max_queue), echo_stdout_(echo_stdout) {
    if (file_path.has_parent_path()) fs::create_directories(file_path.parent_path());
    file_.open(file_path, std::ios::out | std::ios::app);
    if (!file_) {
      throw std::runtime_error("Logger: failed to open log file: " + file_path.string());
    }

    writer_ = std::thread([this] { writer_loop_(); });
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  ~Logger() override {
    stop();
  }

  // Enqueue a line. Returns false if dropped due to full queue or stopping.
  bool write_line(std::string line) override {
    if (!accepting_.load(std::memory_order_relaxed)) return false;

    Item it{timestamp_utc_(), std::move(line)};

    {
      std::lock_guard<std::mutex> lk(mu_);
      if (!accepting_.load(std::memory_order_relaxed)) return false;

      if (queue_.size() >= max_queue_) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false; // drop instead of blocking
      }
      queue_.push_back(std::move(it));
    }
    cv_.notify_one();
    return true;
  }

  // Blocks until everything currently queued is written.
  void flush() {
    std::unique_lock<std::mutex> lk(mu_);
    flushed_cv_.wait(lk, [&] { return (queue_.empty() && !writing_.load()) || stop_; });
  }

  void stop() {
    bool expected = true;
    if (!accepting_.compare_exchange_strong(expected, false)) {
      return; // already stopped
    }

    {
      std::lock_guard<std::mutex> lk(mu_);
      stop_ = true;
    }
    cv_.notify_one();
    if (writer_.joinable()) writer_.join();
  }

  std::uint64_t dropped() const { return dropped_total_.load(std::memory_order_relaxed); }

private:
  struct Item {
    std::string ts;
    std::string msg;
  };

  static std::string timestamp_utc_() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
    return oss.str();
  }

  void writer_loop_() {
    std::deque<Item> local;

    for (;;) {
      {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return stop_ || !queue_.empty(); });

        if (queue_.empty() && stop_) break;

        local.swap(queue_);
        writing_.store(true);
      }

      const auto dropped = dropped_.exchange(0, std::memory_order_relaxed);
      if (dropped > 0) {
        dropped_total_.fetch_add(dropped, std::memory_order_relaxed);
        write_impl_(timestamp_utc_(), "[logger] dropped " + std::to_string(dropped) +
                                          " messages (queue full)");
      }

      for (auto& it : local) {
        write_impl_(it.ts, it.msg);
      }
      local.clear();

      // Flush when idle, not per line
      file_.flush();

      {
        std::lock_guard<std::mutex> lk(mu_);
        writing_.store(false);
        if (queue_.empty()) flushed_cv_.notify_all();
      }
    }

    file_.flush();
    {
      std::lock_guard<std::mutex> lk(mu_);
      writing_.store(false);
    }
    flushed_cv_.notify_all();
  }

  void write_impl_(const std::string& ts, const std::string& msg) {
    if (echo_stdout_) std::cout << ts << " " << msg << "\n";
    file_ << ts << " " << msg << "\n";
  }

  const std::size_t max_queue_;
  const bool echo_stdout_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable flushed_cv_;
  std::deque<Item> queue_;

  std::ofstream file_;
  std::thread writer_;

  std::atomic<bool> accepting_{true};
  bool stop_ = false;

  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> dropped_total_{0};
  std::atomic<bool> writing_{false};
};

// logf(sink, "step=", n, " loss=", x) -> one line
template <typename... Args>
inline void logf(LogSink& sink, Args&&... args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Args>(args));
  (void)sink.write_line(oss.str());
}
