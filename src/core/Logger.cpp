/* @file Logger.cpp
 * @brief queue + worker thread feeding io::FileLogger
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iostream>
#include <iterator>
#include <vector>

// Dahu headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

using namespace dahu::core;

const char* dahu::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Config:
    return "CONFIG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Severe:
    return "SEVERE";
  default:
    return "UNKNOWN";
  }
}

std::string dahu::core::formatLine(const LogEvent& event) {
  const std::time_t t = std::chrono::system_clock::to_time_t(event.when);
  std::tm tm{};
  localtime_r(&t, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);

  std::string line = stamp;
  line += ' ';
  line += toString(event.level);
  line += " [" + event.origin + "] " + event.message + '\n';
  return line;
}

Logger::Logger() : file_(std::make_unique<io::FileLogger>()) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& path) {
  if (running_)
    finishRun();
  if (!file_->open(path))
    return false;

  running_ = true;
  worker_ = std::thread(&Logger::drain, this);
  return true;
}

void Logger::log(LogEvent event) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    // running_ only goes false under mtx_
    if (running_) {
      queue_.push_back(std::move(event));
      cv_.notify_one();
      return;
    }
  }
  std::clog << formatLine(event);
}

void Logger::finishRun() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_.exchange(false))
      return;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();

  // whatever the worker left behind
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto& ev : queue_) {
    if (!file_->write(formatLine(ev)))
      std::clog << formatLine(ev);
  }
  queue_.clear();
  file_->close();
}

void Logger::drain() {
  std::vector<LogEvent> batch;
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      if (queue_.empty() && !running_)
        break;
      batch.assign(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
      queue_.clear();
    }

    for (const auto& ev : batch) {
      if (!file_->write(formatLine(ev)))
        std::clog << formatLine(ev);
    }
    if (!file_->flush())
      std::cerr << "[Logger] flush failed\n";
    batch.clear();
  }
}
