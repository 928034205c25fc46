/* @file EditorController.cpp
 * @brief user intents -> ProjectController / CaptureSession, failures -> log + ErrorMonitor
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <exception>

// Dahu headers
#include "core/CaptureSession.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/ProjectController.hpp"
#include "ui/EditorController.hpp"

using namespace dahu::ui;
using dahu::core::EditorError;
using dahu::core::ErrorCode;

namespace {
  constexpr const char* kOrigin = "EditorController";
}

EditorController::EditorController(core::ProjectController& projects, core::CaptureSession& capture,
                                   core::EditorEvents& events, std::shared_ptr<core::Logger> logger,
                                   std::shared_ptr<core::ErrorMonitor> monitor)
    : projects_(projects), capture_(capture), events_(events), logger_(std::move(logger)),
      monitor_(std::move(monitor)) {
  assert(logger_ && "[EditorController] logger is nullptr");
  assert(monitor_ && "[EditorController] error monitor is nullptr");

  capture_.registerFailureCallback([this](const EditorError& e) { report(e); });
  events_.setErrorSink([this](const std::string& msg) {
    logger_->warning("EventBus", msg);
    monitor_->notifyFailure(msg);
  });
}

template <typename Fn> bool EditorController::guarded(const char* operation, Fn&& fn) {
  try {
    fn();
    lastError_.reset();
    return true;
  } catch (const EditorError& e) {
    report(e);
  } catch (const std::exception& e) {
    // driver fault outside its contract: report, keep running
    lastError_.reset();
    ++failures_;
    logger_->severe(operation, e.what());
    monitor_->notifyFailure(std::string("[") + operation + "] " + e.what());
  }
  return false;
}

void EditorController::report(const EditorError& e) {
  lastError_ = e;
  ++failures_;
  if (e.code() == ErrorCode::PersistenceFailed || e.code() == ErrorCode::CaptureFailed)
    logger_->severe(e.operation(), e.what());
  else
    logger_->warning(e.operation(), e.what());
  monitor_->notifyFailure(e.what());
}

bool EditorController::newProject(const std::string& dir) {
  return guarded("EditorController::newProject", [&] {
    projects_.createProject(dir);
    currentSlide_.reset();
  });
}

bool EditorController::openProject(const std::string& dir) {
  return guarded("EditorController::openProject", [&] {
    projects_.openProject(dir);
    currentSlide_.reset();
  });
}

bool EditorController::saveProject() {
  return guarded("EditorController::saveProject", [&] { projects_.saveProject(); });
}

bool EditorController::toggleCaptureMode() {
  if (!projectInitialized()) {
    report(EditorError(ErrorCode::NoActiveProject, kOrigin, "",
                       "can't switch capture mode as there is no project selected !"));
    return false;
  }
  return guarded("EditorController::toggleCaptureMode", [&] { capture_.toggle(); });
}

bool EditorController::selectSlide(const std::string& imagePath) {
  if (imagePath.empty() || currentSlide_ == imagePath)
    return false;
  currentSlide_ = imagePath;
  events_.selectionChanged.publish(imagePath);
  return true;
}

dahu::core::QuitCheck EditorController::requestExit() const { return projects_.quitCheck(); }

bool EditorController::projectInitialized() const { return projects_.hasActiveProject(); }
