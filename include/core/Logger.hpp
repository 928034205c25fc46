#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous editor logger (runs its own worker thread).
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace dahu {
  namespace io {
    class FileLogger; // forward decl to avoid pulling FILE* into every TU
  } // namespace io

  namespace core {

    enum class LogLevel { Config, Info, Warning, Severe };

    const char* toString(LogLevel level);

    struct LogEvent {
      LogLevel level{ LogLevel::Info };
      std::string origin;  ///< "Component::operation"
      std::string message;
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
    };

    /// "2025-01-31T12:00:00 INFO [origin] message"
    std::string formatLine(const LogEvent& event);

    class Logger {

    public:
      Logger();
      virtual ~Logger(); ///< finishRun() if still running

      // --- public API ---
      bool startNewRun(const std::string& path); ///< open file + launch worker thread
      virtual void log(LogEvent event);          ///< enqueue event (non-blocking)
      void finishRun();                          ///< flush + join worker thread

      void config(const std::string& origin, const std::string& message) {
        log({ LogLevel::Config, origin, message });
      }
      void info(const std::string& origin, const std::string& message) {
        log({ LogLevel::Info, origin, message });
      }
      void warning(const std::string& origin, const std::string& message) {
        log({ LogLevel::Warning, origin, message });
      }
      void severe(const std::string& origin, const std::string& message) {
        log({ LogLevel::Severe, origin, message });
      }

      bool running() const { return running_; }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();

      std::unique_ptr<io::FileLogger> file_;
      std::deque<LogEvent> queue_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace dahu
