#pragma once
/** @file  FakeCapture.hpp
 *  @brief Scripted key input, screen capture and pointer for CaptureSession testing.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include <stdexcept>
#include <string>
#include <vector>

#include "io/KeyInput.hpp"
#include "io/ScreenCapture.hpp"

namespace dahu {
  namespace test {

    class FakeKeyInput : public dahu::io::KeyInput {
    public:
      void press(const std::string& key) { emit(key); }
    };

    /**
 * @class FakeScreenCapture
 * @brief Returns "s1.png", "s2.png", ... (or the queued names) and records target dirs.
 */
    class FakeScreenCapture : public dahu::io::ScreenCapture {
    public:
      bool fail = false;
      std::vector<std::string> next_names;
      std::vector<std::string> target_dirs;

      std::string takeScreen(const std::string& targetDir) override {
        if (fail)
          throw std::runtime_error("capture hardware unavailable");
        target_dirs.push_back(targetDir);
        if (!next_names.empty()) {
          std::string name = next_names.front();
          next_names.erase(next_names.begin());
          return name;
        }
        return "s" + std::to_string(target_dirs.size()) + ".png";
      }
    };

    class FakePointer : public dahu::io::PointerDevice {
    public:
      dahu::io::CursorPosition pos{ 0, 0 };
      dahu::io::CursorPosition cursorPosition() const override { return pos; }
    };

  } // namespace test
} // namespace dahu
