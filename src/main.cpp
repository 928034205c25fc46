/* @file main.cpp
 * @brief dahu-editor console front end: wires drivers + core, reads commands from stdin
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

// Dahu headers
#include "core/CaptureSession.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/ProjectController.hpp"
#include "io/KeyInput.hpp"
#include "io/LocalFileSystem.hpp"
#include "io/ScreenCapture.hpp"
#include "ui/EditorController.hpp"

using namespace dahu;

namespace {

  void printHelp() {
    std::cout << "commands:\n"
                 "  new <dir>        create a project\n"
                 "  open <dir>       open a project\n"
                 "  save             save the project\n"
                 "  capture          toggle capture mode\n"
                 "  key <name>       deliver a key press (capture / exit triggers)\n"
                 "  source <image>   image imported by the next capture\n"
                 "  pointer <x> <y>  set the cursor position recorded by captures\n"
                 "  select <path>    select a slide\n"
                 "  list             list slides\n"
                 "  quit             leave (asks when there are unsaved changes)\n";
  }

  bool confirm(const std::string& message) {
    std::cout << message << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer))
      return true;
    return answer == "y" || answer == "Y" || answer == "yes";
  }

  void printFailure(const ui::EditorController& editor) {
    if (const auto& err = editor.lastError())
      std::cout << "error: " << err->what() << "\n";
    else
      std::cout << "error: operation failed, see the log\n";
  }

} // namespace

int main(int argc, char** argv) {
  const std::string configPath = argc > 1 ? argv[1] : "dahu-editor.json";

  core::EditorConfig config;
  try {
    config = core::ConfigLoader(configPath).loadEditorConfig();
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  auto logger = std::make_shared<core::Logger>();
  if (!logger->startNewRun(config.logFile))
    std::cerr << "logging to " << config.logFile << " unavailable, using stderr\n";
  auto monitor = std::make_shared<core::ErrorMonitor>();
  monitor->registerEscalation(
      [logger](const std::string& msg) { logger->severe("ErrorMonitor", "escalated: " + msg); });

  auto fs = std::make_shared<io::LocalFileSystem>();
  io::ConsoleKeyInput keys;
  io::ImageImportCapture screen(fs, "");
  io::ManualPointer pointer;

  core::EditorEvents events;
  events.slideAdded.subscribe([](const std::string& img) { std::cout << "+ slide " << img << "\n"; });
  events.selectionChanged.subscribe([](const std::string& img) { std::cout << "> preview " << img << "\n"; });

  // declaration order matters: the session disarms against a live controller
  core::ProjectController projects(fs, events, logger, config.documentName);
  core::CaptureSession session(projects, keys, screen, pointer, events, logger,
                               core::TriggerKeys{ config.captureKey, config.exitKey });
  ui::EditorController editor(projects, session, events, logger, monitor);

  printHelp();
  std::string line;
  while (std::cout << "dahu> " << std::flush, std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string cmd, arg;
    in >> cmd;
    std::getline(in >> std::ws, arg);

    if (cmd.empty()) {
      continue;
    } else if (cmd == "new") {
      if (editor.newProject(arg))
        std::cout << "The project was successfully created.\n";
      else
        printFailure(editor);
    } else if (cmd == "open") {
      if (!editor.openProject(arg))
        printFailure(editor);
    } else if (cmd == "save") {
      if (editor.saveProject())
        std::cout << "The project was successfully saved\n";
      else
        printFailure(editor);
    } else if (cmd == "capture") {
      if (editor.toggleCaptureMode())
        std::cout << (session.armed() ? "capture mode on" : "capture mode off") << "\n";
      else
        printFailure(editor);
    } else if (cmd == "key") {
      const std::size_t before = editor.failureCount();
      keys.press(arg);
      if (editor.failureCount() != before)
        printFailure(editor);
    } else if (cmd == "source") {
      screen.setSource(arg);
    } else if (cmd == "pointer") {
      std::istringstream xy(arg);
      int x = 0, y = 0;
      if (xy >> x >> y)
        pointer.moveTo(x, y);
      else
        std::cout << "usage: pointer <x> <y>\n";
    } else if (cmd == "select") {
      editor.selectSlide(arg);
    } else if (cmd == "list") {
      const core::SlideModel model = projects.model();
      for (const auto& s : model.slides())
        std::cout << "  " << s.imagePath << " (" << s.cursorX << ", " << s.cursorY << ")\n";
    } else if (cmd == "quit") {
      const auto check = editor.requestExit();
      if (confirm(check.message))
        break;
    } else {
      printHelp();
    }
  }

  session.exit();
  logger->finishRun();
  return 0;
}
