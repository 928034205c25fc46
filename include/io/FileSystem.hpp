#pragma once
/** @file  FileSystem.hpp
 *  @brief Filesystem collaborator used by the project controller.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include <optional>
#include <string>

namespace dahu {
  namespace io {

    /**
 * @class FileSystem
 * @brief Synchronous file operations with explicit success/failure.
 *
 *  * No method throws for an expected failure; it returns false / nullopt.
 *  * Implementations must not talk to the user (no dialogs, no prompts).
 */
    class FileSystem {
    public:
      virtual ~FileSystem() = default;

      virtual bool exists(const std::string& path) const = 0;
      virtual bool isDirectory(const std::string& path) const = 0;

      /** Creates \p path and missing parents. @returns true if it exists afterwards. */
      virtual bool createDirectory(const std::string& path) = 0;

      /** @returns nullopt if the file cannot be read. */
      virtual std::optional<std::string> readText(const std::string& path) const = 0;

      /** Creates or truncates \p path. @returns false on any I/O error. */
      virtual bool writeText(const std::string& path, const std::string& content) = 0;

      virtual bool copy(const std::string& src, const std::string& dst) = 0;
      virtual bool remove(const std::string& path) = 0;

      virtual char separator() const { return '/'; }

      /// \p dir + separator + \p name, without doubling a trailing separator.
      std::string join(const std::string& dir, const std::string& name) const {
        if (dir.empty())
          return name;
        if (dir.back() == separator())
          return dir + name;
        return dir + separator() + name;
      }
    };

  } // namespace io
} // namespace dahu
