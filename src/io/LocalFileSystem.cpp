/* @file LocalFileSystem.cpp
 * @brief host disk access for projects - every failure is reported, never thrown
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

// Dahu headers
#include "io/LocalFileSystem.hpp"

using namespace dahu::io;
namespace fs = std::filesystem;

bool LocalFileSystem::exists(const std::string& path) const {
  std::error_code ec;
  return fs::exists(path, ec);
}

bool LocalFileSystem::isDirectory(const std::string& path) const {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

bool LocalFileSystem::createDirectory(const std::string& path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    std::cerr << "create_directories(" << path << "): " << ec.message() << "\n";
    return false;
  }
  return fs::is_directory(path, ec);
}

std::optional<std::string> LocalFileSystem::readText(const std::string& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "Unable to read content from " << path << "\n";
    return std::nullopt;
  }
  std::string content{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
  if (in.bad()) {
    std::cerr << "I/O error while reading " << path << "\n";
    return std::nullopt;
  }
  return content;
}

bool LocalFileSystem::writeText(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    std::cerr << "Unable to write content to " << path << "\n";
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    std::cerr << "I/O error while writing " << path << "\n";
    return false;
  }
  return true;
}

bool LocalFileSystem::copy(const std::string& src, const std::string& dst) {
  std::error_code ec;
  fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    std::cerr << "copy " << src << " -> " << dst << ": " << ec.message() << "\n";
    return false;
  }
  return true;
}

bool LocalFileSystem::remove(const std::string& path) {
  std::error_code ec;
  const bool removed = fs::remove(path, ec);
  if (ec)
    std::cerr << "remove(" << path << "): " << ec.message() << "\n";
  return removed && !ec;
}

char LocalFileSystem::separator() const { return static_cast<char>(fs::path::preferred_separator); }
