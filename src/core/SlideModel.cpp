/* @file SlideModel.cpp
 * @brief slide sequence + project document (de)serialization
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <limits>
#include <utility>

// Dahu headers
#include "core/EditorError.hpp"
#include "core/SlideModel.hpp"

using namespace dahu::core;
using nlohmann::json;

namespace {

  constexpr const char* kSlidesKey = "slides";
  constexpr const char* kPathKey = "path";
  constexpr const char* kXKey = "x";
  constexpr const char* kYKey = "y";

  [[noreturn]] void malformed(const std::string& detail) {
    throw EditorError(ErrorCode::MalformedProjectDocument, "SlideModel::fromDocument", "", detail);
  }

  // missing coordinate reads as 0, anything but an int-sized integer is malformed
  int readCoordinate(const json& entry, const char* key, std::size_t index) {
    auto it = entry.find(key);
    if (it == entry.end())
      return 0;
    if (!it->is_number_integer())
      malformed("slide " + std::to_string(index) + ": '" + key + "' is not an integer");

    if (it->is_number_unsigned()) {
      const auto value = it->get<std::uint64_t>();
      if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
        malformed("slide " + std::to_string(index) + ": '" + key + "' out of range");
      return static_cast<int>(value);
    }
    const auto value = it->get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
      malformed("slide " + std::to_string(index) + ": '" + key + "' out of range");
    return static_cast<int>(value);
  }

  // the document is written as UTF-8 JSON, dump() refuses anything else
  bool isUtf8(const std::string& text) {
    try {
      json(text).dump();
    } catch (const json::type_error&) {
      return false;
    }
    return true;
  }

} // namespace

SlideModel::SlideModel() : slides_(std::make_shared<const std::vector<Slide>>()) {}

Slide SlideModel::addSlide(const std::string& imagePath, int x, int y) {
  if (imagePath.empty())
    throw EditorError(ErrorCode::InvalidSlideData, "SlideModel::addSlide", "",
                      "image path must not be empty");
  if (!isUtf8(imagePath))
    throw EditorError(ErrorCode::InvalidSlideData, "SlideModel::addSlide", "",
                      "image path is not valid UTF-8");

  auto next = std::make_shared<std::vector<Slide>>(*slides_);
  next->push_back(Slide{ imagePath, x, y });
  Slide added = next->back();
  slides_ = std::move(next);
  return added;
}

json SlideModel::toDocument() const {
  json list = json::array();
  for (const auto& s : *slides_) {
    json entry = json::object();
    entry[kPathKey] = s.imagePath;
    entry[kXKey] = s.cursorX;
    entry[kYKey] = s.cursorY;
    list.push_back(std::move(entry));
  }
  json doc = json::object();
  doc[kSlidesKey] = std::move(list);
  return doc;
}

std::string SlideModel::toText() const { return toDocument().dump(2); }

Slide SlideModel::parseSlide(const json& entry, std::size_t index) {
  if (!entry.is_object())
    malformed("slide " + std::to_string(index) + " is not an object");

  auto path = entry.find(kPathKey);
  if (path == entry.end() || !path->is_string())
    malformed("slide " + std::to_string(index) + " has no 'path'");
  if (path->get_ref<const std::string&>().empty())
    malformed("slide " + std::to_string(index) + " has an empty 'path'");

  return Slide{ path->get<std::string>(), readCoordinate(entry, kXKey, index),
                readCoordinate(entry, kYKey, index) };
}

void SlideModel::fromDocument(const json& doc) {
  if (!doc.is_object())
    malformed("document is not a JSON object");

  auto list = doc.find(kSlidesKey);
  if (list == doc.end())
    malformed("missing 'slides'");
  if (!list->is_array())
    malformed("'slides' is not an array");

  // parse everything first, swap only once the whole list is valid
  auto parsed = std::make_shared<std::vector<Slide>>();
  parsed->reserve(list->size());
  for (std::size_t i = 0; i < list->size(); ++i)
    parsed->push_back(parseSlide((*list)[i], i));

  slides_ = std::move(parsed);
}

void SlideModel::fromText(const std::string& text) {
  json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded())
    malformed("not valid JSON");
  fromDocument(doc);
}

void SlideModel::clear() { slides_ = std::make_shared<const std::vector<Slide>>(); }
