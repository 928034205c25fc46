#pragma once
/** @file  EditorController.hpp
 *  @brief Presentation-intent dispatcher (new / open / save / capture / select / exit).
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "core/EditorError.hpp"

namespace dahu {
  namespace core { // forward decls so we don’t pull every core header in
    class CaptureSession;
    class ErrorMonitor;
    class Logger;
    class ProjectController;
    struct EditorEvents;
    struct QuitCheck;
  } // namespace core

  namespace ui {

    /**
 * @class EditorController
 * @brief Glue between the presentation layer and the editor core.
 *
 * * Every intent returns false instead of throwing; the error is logged,
 *   forwarded to the ErrorMonitor and kept in `lastError()`.
 * * Capture mode can only be toggled once a project was created or opened.
 * * Tracks the selected slide and publishes "selection changed" on change only.
 */
    class EditorController {

    public:
      EditorController(core::ProjectController& projects, core::CaptureSession& capture,
                       core::EditorEvents& events, std::shared_ptr<core::Logger> logger,
                       std::shared_ptr<core::ErrorMonitor> monitor);
      ~EditorController() = default;

      // ---- intents -------------------------------------------------------------
      bool newProject(const std::string& dir);
      bool openProject(const std::string& dir);
      bool saveProject();
      bool toggleCaptureMode();

      /// @returns true if the selection changed (and an event was published).
      bool selectSlide(const std::string& imagePath);

      /// Quit prompt; the caller decides whether to actually quit.
      core::QuitCheck requestExit() const;

      // ---- state for the view ----------------------------------------------------
      const std::optional<core::EditorError>& lastError() const { return lastError_; }
      /// Failures reported so far, key-triggered captures included.
      std::size_t failureCount() const { return failures_; }
      const std::optional<std::string>& currentSlide() const { return currentSlide_; }
      bool projectInitialized() const;

    private:
      template <typename Fn> bool guarded(const char* operation, Fn&& fn);
      void report(const core::EditorError& e);

      core::ProjectController& projects_;
      core::CaptureSession& capture_;
      core::EditorEvents& events_;
      std::shared_ptr<core::Logger> logger_;
      std::shared_ptr<core::ErrorMonitor> monitor_;

      std::optional<core::EditorError> lastError_{};
      std::size_t failures_{ 0 };
      std::optional<std::string> currentSlide_{};
    };

  } // namespace ui
} // namespace dahu
