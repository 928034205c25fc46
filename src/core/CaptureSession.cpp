/* @file CaptureSession.cpp
 * @brief capture mode FSM driven by key triggers
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <exception>
#include <string>

// Dahu headers
#include "core/CaptureSession.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/ProjectController.hpp"

using namespace dahu::core;

namespace {
  constexpr const char* kOrigin = "CaptureSession";
}

CaptureSession::CaptureSession(ProjectController& controller, io::KeyInput& keys,
                               io::ScreenCapture& screen, io::PointerDevice& pointer,
                               EditorEvents& events, std::shared_ptr<Logger> logger, TriggerKeys triggers)
    : controller_(controller), keys_(keys), screen_(screen), pointer_(pointer), events_(events),
      logger_(std::move(logger)),
      triggers_{ io::KeyInput::normalize(triggers.capture), io::KeyInput::normalize(triggers.exit) } {
  assert(logger_ && "[CaptureSession] logger is nullptr");
}

CaptureSession::~CaptureSession() { exit(); }

void CaptureSession::enter() {
  if (state_ == State::Armed)
    return;

  controller_.beginCapture(); // throws NoActiveProject, state stays Disarmed
  listener_ = keys_.addKeyListener([this](const std::string& key) { onKey(key); });
  state_ = State::Armed;
}

void CaptureSession::exit() {
  if (state_ == State::Disarmed)
    return;

  if (!keys_.removeKeyListener(listener_))
    logger_->warning(kOrigin, "key listener " + std::to_string(listener_) + " was already gone");
  listener_ = 0;
  controller_.endCapture();
  state_ = State::Disarmed;
}

void CaptureSession::toggle() {
  if (state_ == State::Armed)
    exit();
  else
    enter();
}

void CaptureSession::capture() {
  static constexpr const char* op = "CaptureSession::capture";
  if (state_ != State::Armed)
    return;

  const std::string dir = controller_.projectDir();
  std::string image;
  io::CursorPosition pos;
  try {
    image = screen_.takeScreen(dir);
    pos = pointer_.cursorPosition();
  } catch (const std::exception& e) {
    throw EditorError(ErrorCode::CaptureFailed, op, dir, e.what());
  }
  if (image.empty())
    throw EditorError(ErrorCode::CaptureFailed, op, dir, "capture returned no image");

  const Slide added = controller_.appendCapturedSlide(image, pos.x, pos.y);
  events_.slideAdded.publish(added.imagePath);
}

void CaptureSession::onKey(const std::string& key) {
  const std::string name = io::KeyInput::normalize(key);
  if (name == triggers_.capture) {
    try {
      capture();
    } catch (const EditorError& e) {
      if (onFailure_)
        onFailure_(e);
      else
        logger_->severe(e.operation(), e.what());
    }
  } else if (name == triggers_.exit) {
    exit();
  }
}
