#pragma once
/** @file  ProjectController.hpp
 *  @brief Owner of the active project: create / open / save + dirty tracking.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Dahu headers
#include "core/EditorError.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/SlideModel.hpp"
#include "io/FileSystem.hpp" // persistence collaborator

namespace dahu {
  namespace core {

    enum class ProjectStatus { Created, Opened };

    /** What the caller must do before quitting. */
    struct QuitCheck {
      bool needsConfirmation{ false };
      std::string message;
    };

    /**
 * @class ProjectController
 * @brief Exclusive owner of the single active project.
 *
 *  * create/open replace the active project wholesale; a failed call leaves it untouched.
 *  * Clean is only set by a successful create, open or save.
 *  * Every public call is serialized on one mutex, so a save never interleaves
 *    with a captured slide being appended.
 *  * Events are published after the lock is released.
 */
    class ProjectController {
    public:
      static constexpr const char* kDefaultDocumentName = "presentation.dahu";

      ProjectController(std::shared_ptr<io::FileSystem> fs, EditorEvents& events,
                        std::shared_ptr<Logger> logger,
                        std::string documentName = kDefaultDocumentName);
      ~ProjectController() = default;

      //---public API------------------------------------------------------
      void createProject(const std::string& dir); ///< throws DirectoryUnavailable
      void openProject(const std::string& dir);   ///< throws ProjectNotFound / MalformedProjectDocument
      void saveProject();                         ///< throws SaveWhileCapturing / PersistenceFailed

      void markDirty();
      bool isDirty() const;
      QuitCheck quitCheck() const;

      bool hasActiveProject() const;
      std::optional<ProjectStatus> status() const;
      std::string projectDir() const; ///< throws NoActiveProject
      std::string documentPath() const;
      SlideModel model() const;       ///< snapshot, cheap to copy
      SlidePathSequence slidePaths() const;

      //---capture bookkeeping (driven by CaptureSession)-------------------
      void beginCapture(); ///< throws NoActiveProject
      void endCapture();
      bool isCapturing() const;

      /// Appends to the active model and marks it dirty. The caller publishes.
      Slide appendCapturedSlide(const std::string& imagePath, int x, int y);

      ProjectController(const ProjectController&) = delete;
      ProjectController& operator=(const ProjectController&) = delete;

    private:
      struct Project {
        std::string dir;
        SlideModel model;
        bool hasUnsavedChanges{ false };
        ProjectStatus status{ ProjectStatus::Created };
      };

      const Project& requireProject(const char* operation) const;
      void requireNotCapturing(const char* operation, ErrorCode code, const std::string& path) const;

      std::shared_ptr<io::FileSystem> fs_;
      EditorEvents& events_;
      std::shared_ptr<Logger> logger_;
      std::string documentName_;

      std::optional<Project> active_;
      bool capturing_{ false };
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace dahu
