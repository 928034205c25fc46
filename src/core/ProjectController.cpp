/* @file ProjectController.cpp
 * @brief active project ownership, persistence through io::FileSystem
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Dahu headers
#include "core/ProjectController.hpp"

using namespace dahu::core;

namespace {

  constexpr const char* kOrigin = "ProjectController";
  constexpr const char* kWriteProbe = ".dahu-write-probe";

  // rethrow a model error with the controller operation and project path attached
  [[noreturn]] void rethrowWithContext(const EditorError& e, const char* operation, const std::string& path) {
    throw EditorError(e.code(), operation, path, e.what());
  }

} // namespace

ProjectController::ProjectController(std::shared_ptr<io::FileSystem> fs, EditorEvents& events,
                                     std::shared_ptr<Logger> logger, std::string documentName)
    : fs_(std::move(fs)), events_(events), logger_(std::move(logger)),
      documentName_(std::move(documentName)) {
  assert(fs_ && "[ProjectController] file system is nullptr");
  assert(logger_ && "[ProjectController] logger is nullptr");
}

void ProjectController::createProject(const std::string& dir) {
  static constexpr const char* op = "ProjectController::createProject";
  {
    std::lock_guard<std::mutex> lock(mtx_);
    requireNotCapturing(op, ErrorCode::CaptureInProgress, dir);

    if (dir.empty())
      throw EditorError(ErrorCode::DirectoryUnavailable, op, dir, "no directory given");
    if (!fs_->exists(dir) && !fs_->createDirectory(dir))
      throw EditorError(ErrorCode::DirectoryUnavailable, op, dir, "directory could not be created");
    if (!fs_->isDirectory(dir))
      throw EditorError(ErrorCode::DirectoryUnavailable, op, dir, "not a directory");

    const std::string probe = fs_->join(dir, kWriteProbe);
    if (!fs_->writeText(probe, ""))
      throw EditorError(ErrorCode::DirectoryUnavailable, op, dir, "directory is not writable");
    if (!fs_->remove(probe))
      logger_->warning(op, "could not remove " + probe);

    active_ = Project{ dir, SlideModel::createEmpty(), false, ProjectStatus::Created };
  }
  logger_->info(op, "project created in " + dir);
}

void ProjectController::openProject(const std::string& dir) {
  static constexpr const char* op = "ProjectController::openProject";
  std::vector<std::string> loaded;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    requireNotCapturing(op, ErrorCode::CaptureInProgress, dir);

    if (dir.empty())
      throw EditorError(ErrorCode::ProjectNotFound, op, dir, "no directory given");
    const std::string path = fs_->join(dir, documentName_);
    if (!fs_->exists(path))
      throw EditorError(ErrorCode::ProjectNotFound, op, dir, "no " + documentName_ + " found");

    auto text = fs_->readText(path);
    if (!text)
      throw EditorError(ErrorCode::ProjectNotFound, op, dir, "unable to read " + path);

    SlideModel model;
    try {
      model.fromText(*text);
    } catch (const EditorError& e) {
      rethrowWithContext(e, op, dir);
    }

    loaded = model.slidePaths().toVector();
    active_ = Project{ dir, std::move(model), false, ProjectStatus::Opened };
  }
  logger_->info(op, "project opened from " + dir + " (" + std::to_string(loaded.size()) + " slides)");

  // replay so the presentation layer rebuilds its thumbnail list
  for (const auto& img : loaded)
    events_.slideAdded.publish(img);
}

void ProjectController::saveProject() {
  static constexpr const char* op = "ProjectController::saveProject";
  std::lock_guard<std::mutex> lock(mtx_);
  const Project& project = requireProject(op);
  requireNotCapturing(op, ErrorCode::SaveWhileCapturing, project.dir);

  const std::string path = fs_->join(project.dir, documentName_);
  std::string text;
  try {
    text = project.model.toText();
  } catch (const nlohmann::json::exception& e) {
    logger_->severe(op, "failed to serialize project in " + project.dir);
    throw EditorError(ErrorCode::PersistenceFailed, op, project.dir, e.what());
  }
  if (!fs_->writeText(path, text)) {
    logger_->severe(op, "failed to save project in " + project.dir);
    throw EditorError(ErrorCode::PersistenceFailed, op, project.dir, "unable to write " + path);
  }

  active_->hasUnsavedChanges = false;
  logger_->info(op, "project saved in " + project.dir);
}

void ProjectController::markDirty() {
  std::lock_guard<std::mutex> lock(mtx_);
  requireProject("ProjectController::markDirty");
  active_->hasUnsavedChanges = true;
}

bool ProjectController::isDirty() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return active_ && active_->hasUnsavedChanges;
}

QuitCheck ProjectController::quitCheck() const {
  if (isDirty())
    return { true, "Quit without saving any changes ?" };
  return { false, "Are you sure you want to quit ?" };
}

bool ProjectController::hasActiveProject() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return active_.has_value();
}

std::optional<ProjectStatus> ProjectController::status() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!active_)
    return std::nullopt;
  return active_->status;
}

std::string ProjectController::projectDir() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return requireProject("ProjectController::projectDir").dir;
}

std::string ProjectController::documentPath() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return fs_->join(requireProject("ProjectController::documentPath").dir, documentName_);
}

SlideModel ProjectController::model() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!active_)
    return SlideModel::createEmpty();
  return active_->model;
}

SlidePathSequence ProjectController::slidePaths() const { return model().slidePaths(); }

void ProjectController::beginCapture() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    requireProject("ProjectController::beginCapture");
    capturing_ = true;
  }
  logger_->config(kOrigin, "capture mode on");
}

void ProjectController::endCapture() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!capturing_)
      return;
    capturing_ = false;
  }
  logger_->config(kOrigin, "capture mode off");
}

bool ProjectController::isCapturing() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return capturing_;
}

Slide ProjectController::appendCapturedSlide(const std::string& imagePath, int x, int y) {
  static constexpr const char* op = "ProjectController::appendCapturedSlide";
  std::lock_guard<std::mutex> lock(mtx_);
  const Project& project = requireProject(op);

  // addSlide throws before mutating, so the dirty flag only moves on success
  Slide added;
  try {
    added = active_->model.addSlide(imagePath, x, y);
  } catch (const EditorError& e) {
    rethrowWithContext(e, op, project.dir);
  }
  active_->hasUnsavedChanges = true;
  return added;
}

const ProjectController::Project& ProjectController::requireProject(const char* operation) const {
  if (!active_)
    throw EditorError(ErrorCode::NoActiveProject, operation, "", "no project created or opened");
  return *active_;
}

void ProjectController::requireNotCapturing(const char* operation, ErrorCode code,
                                            const std::string& path) const {
  if (capturing_)
    throw EditorError(code, operation, path, "capture mode is on");
}
