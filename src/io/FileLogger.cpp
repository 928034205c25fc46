/* @file FileLogger.cpp
 * @brief buffered fwrite-based log sink
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Dahu headers
#include "io/FileLogger.hpp"

using namespace dahu::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunk);
  return true;
}

bool FileLogger::write(const std::string& line) {
  if (!fp_)
    return false;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kChunk)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    const std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (written != buffer_.size()) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  if (!flush())
    std::cerr << "FileLogger: dropping unflushed log data on close\n";
  std::fclose(fp_);
  fp_ = nullptr;
  buffer_.clear();
}
