/* @file ImageImportCapture.cpp
 * @brief capture source copying a prepared image into the project dir
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <stdexcept>

// Dahu headers
#include "io/FileSystem.hpp"
#include "io/ScreenCapture.hpp"

using namespace dahu::io;

ImageImportCapture::ImageImportCapture(std::shared_ptr<FileSystem> fs, std::string sourceImage)
    : fs_(std::move(fs)), source_(std::move(sourceImage)) {
  assert(fs_ && "[ImageImportCapture] file system is nullptr");
}

std::string ImageImportCapture::takeScreen(const std::string& targetDir) {
  if (source_.empty() || !fs_->exists(source_))
    throw std::runtime_error("[ImageImportCapture] no source image: '" + source_ + "'");

  // skip names already taken by earlier runs in the same project
  std::string name;
  do {
    name = "capture-" + std::to_string(next_++) + ".png";
  } while (fs_->exists(fs_->join(targetDir, name)));

  if (!fs_->copy(source_, fs_->join(targetDir, name)))
    throw std::runtime_error("[ImageImportCapture] copy into " + targetDir + " failed");
  return name;
}
