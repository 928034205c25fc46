#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered text writer for the editor log file.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace dahu {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Appends; an existing log is never truncated.
 *  * Buffers up to 4 kB before an implicit flush.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one line (caller includes trailing '\n'). Returns false when closed. */
      bool write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kChunk = 4096;

      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace dahu
