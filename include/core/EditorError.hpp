#pragma once
/** @file  EditorError.hpp
 *  @brief Recoverable error taxonomy shared by the model and controllers.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace dahu {
  namespace core {

    enum class ErrorCode : std::uint8_t {
      InvalidSlideData,
      MalformedProjectDocument,
      ProjectNotFound,
      DirectoryUnavailable,
      PersistenceFailed,
      CaptureFailed,
      NoActiveProject,
      SaveWhileCapturing,
      CaptureInProgress,
      Count
    };
    static_assert(static_cast<std::uint8_t>(ErrorCode::Count) == 9,
                  "ErrorCode count changed please update toString()");

    inline const char* toString(ErrorCode c) {
      switch (c) {
      case ErrorCode::InvalidSlideData:
        return "InvalidSlideData";
      case ErrorCode::MalformedProjectDocument:
        return "MalformedProjectDocument";
      case ErrorCode::ProjectNotFound:
        return "ProjectNotFound";
      case ErrorCode::DirectoryUnavailable:
        return "DirectoryUnavailable";
      case ErrorCode::PersistenceFailed:
        return "PersistenceFailed";
      case ErrorCode::CaptureFailed:
        return "CaptureFailed";
      case ErrorCode::NoActiveProject:
        return "NoActiveProject";
      case ErrorCode::SaveWhileCapturing:
        return "SaveWhileCapturing";
      case ErrorCode::CaptureInProgress:
        return "CaptureInProgress";
      default:
        return "Unknown";
      }
    }

    /**
 * @class EditorError
 * @brief Thrown by SlideModel, CaptureSession and ProjectController.
 *
 *  * Always recoverable: the throwing operation performed no mutation.
 *  * Carries the operation name and project path for user messaging.
 */
    class EditorError : public std::runtime_error {
    public:
      EditorError(ErrorCode code, std::string operation, std::string path, const std::string& detail)
          : std::runtime_error(format(code, operation, path, detail)), code_(code),
            operation_(std::move(operation)), path_(std::move(path)) {}

      ErrorCode code() const noexcept { return code_; }
      const std::string& operation() const noexcept { return operation_; }
      const std::string& path() const noexcept { return path_; } ///< empty if not path-related

    private:
      static std::string format(ErrorCode code, const std::string& operation, const std::string& path,
                                const std::string& detail) {
        std::string msg = "[" + operation + "] " + toString(code);
        if (!path.empty())
          msg += " (" + path + ")";
        if (!detail.empty())
          msg += ": " + detail;
        return msg;
      }

      ErrorCode code_;
      std::string operation_;
      std::string path_;
    };

  } // namespace core
} // namespace dahu
