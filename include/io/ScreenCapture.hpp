#pragma once
/** @file  ScreenCapture.hpp
 *  @brief Capture input collaborators: screen grabber and pointer position.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include <memory>
#include <string>
#include <utility>

namespace dahu {
  namespace io {

    class FileSystem;

    struct CursorPosition {
      int x{ 0 };
      int y{ 0 };
    };

    /**
 * @class ScreenCapture
 * @brief Produces one image file inside a target directory per call.
 *
 *  * Returns the image name relative to \p targetDir; each call yields a
 *    name not used before in that directory.
 *  * Throws `std::runtime_error` when nothing could be captured.
 */
    class ScreenCapture {
    public:
      virtual ~ScreenCapture() = default;
      virtual std::string takeScreen(const std::string& targetDir) = 0;
    };

    class PointerDevice {
    public:
      virtual ~PointerDevice() = default;
      virtual CursorPosition cursorPosition() const = 0;
    };

    /**
 * @class ImageImportCapture
 * @brief Host capture source that imports an existing image file into the
 *        project directory as `capture-<n>.png`.
 */
    class ImageImportCapture : public ScreenCapture {
    public:
      ImageImportCapture(std::shared_ptr<FileSystem> fs, std::string sourceImage);

      std::string takeScreen(const std::string& targetDir) override;

      void setSource(std::string sourceImage) { source_ = std::move(sourceImage); }
      const std::string& source() const { return source_; }

    private:
      std::shared_ptr<FileSystem> fs_;
      std::string source_;
      unsigned next_{ 1 };
    };

    /** Pointer whose position is set by the host (console `pointer x y`). */
    class ManualPointer : public PointerDevice {
    public:
      CursorPosition cursorPosition() const override { return pos_; }
      void moveTo(int x, int y) { pos_ = { x, y }; }

    private:
      CursorPosition pos_{};
    };

  } // namespace io
} // namespace dahu
