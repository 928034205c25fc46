#pragma once
/** @file  LocalFileSystem.hpp
 *  @brief FileSystem backed by the host disk (std::filesystem + fstream).
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include "io/FileSystem.hpp" // base class

namespace dahu {
  namespace io {

    class LocalFileSystem : public FileSystem {
    public:
      bool exists(const std::string& path) const override;
      bool isDirectory(const std::string& path) const override;
      bool createDirectory(const std::string& path) override;
      std::optional<std::string> readText(const std::string& path) const override;
      bool writeText(const std::string& path, const std::string& content) override;
      bool copy(const std::string& src, const std::string& dst) override;
      bool remove(const std::string& path) override;
      char separator() const override;
    };

  } // namespace io
} // namespace dahu
