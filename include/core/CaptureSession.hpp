#pragma once
/** @file  CaptureSession.hpp
 *  @brief Capture-mode state machine (Disarmed <-> Armed).
 *
 *  © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <functional>
#include <memory>
#include <string>
#include <utility>

// Dahu headers
#include "core/EditorError.hpp"
#include "io/KeyInput.hpp"
#include "io/ScreenCapture.hpp"

namespace dahu {
  namespace core {

    class Logger;
    class ProjectController;
    struct EditorEvents;

    /** Which key names fire which trigger. Names are compared normalized. */
    struct TriggerKeys {
      std::string capture{ "f7" };
      std::string exit{ "escape" };
    };

    /**
 * @class CaptureSession
 * @brief Arms/disarms capture mode and turns capture triggers into slides.
 *
 *  * While Armed, exactly one listener is registered on the key input.
 *  * Capture trigger: screen -> pointer -> append -> dirty -> "slide added".
 *  * A failed capture keeps the session Armed.
 *  * Errors raised from inside the key listener go to the failure callback,
 *    or to the logger when none is registered.
 */
    class CaptureSession {
    public:
      enum class State { Disarmed, Armed };

      using FailureCallback = std::function<void(const EditorError&)>;

      CaptureSession(ProjectController& controller, io::KeyInput& keys, io::ScreenCapture& screen,
                     io::PointerDevice& pointer, EditorEvents& events, std::shared_ptr<Logger> logger,
                     TriggerKeys triggers = {});
      ~CaptureSession(); ///< exit() so no listener outlives the session

      // ---- public API ----------------------------------------------------------
      void enter();  ///< throws NoActiveProject; no-op while Armed
      void exit();   ///< no-op while Disarmed
      void toggle(); ///< enter() when Disarmed, exit() when Armed

      /// Perform one capture now (what the capture trigger does). Throws
      /// CaptureFailed; does nothing while Disarmed.
      void capture();

      /// Register a lambda that receives failures of key-triggered captures.
      void registerFailureCallback(FailureCallback cb) { onFailure_ = std::move(cb); }

      State state() const { return state_; }
      bool armed() const { return state_ == State::Armed; }
      const TriggerKeys& triggers() const { return triggers_; }

      CaptureSession(const CaptureSession&) = delete;
      CaptureSession& operator=(const CaptureSession&) = delete;

    private:
      void onKey(const std::string& key);

      ProjectController& controller_;
      io::KeyInput& keys_;
      io::ScreenCapture& screen_;
      io::PointerDevice& pointer_;
      EditorEvents& events_;
      std::shared_ptr<Logger> logger_;
      TriggerKeys triggers_;

      State state_{ State::Disarmed };
      io::KeyInput::ListenerId listener_{ 0 };
      FailureCallback onFailure_{};
    };

  } // namespace core
} // namespace dahu
