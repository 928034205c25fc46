/* @file ConfigLoader.cpp
 * @brief JSON config file -> EditorConfig
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Dahu headers
#include "core/ConfigLoader.hpp"

using namespace dahu::core;
using nlohmann::json;

namespace {

  void readString(const json& j, const char* key, std::string& out, bool lowerCase) {
    auto it = j.find(key);
    if (it == j.end())
      return;
    if (!it->is_string())
      throw std::invalid_argument(std::string("[EditorConfig] '") + key + "' must be a string");

    std::string value = it->get<std::string>();
    if (value.empty())
      throw std::invalid_argument(std::string("[EditorConfig] '") + key + "' must not be empty");
    if (lowerCase)
      std::transform(value.begin(), value.end(), value.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    out = std::move(value);
  }

} // namespace

EditorConfig EditorConfig::fromJson(const json& j) {
  if (!j.is_object())
    throw std::invalid_argument("[EditorConfig] configuration root must be an object");

  EditorConfig cfg;
  readString(j, "captureKey", cfg.captureKey, true);
  readString(j, "exitKey", cfg.exitKey, true);
  readString(j, "documentName", cfg.documentName, false);
  readString(j, "logFile", cfg.logFile, false);

  if (cfg.captureKey == cfg.exitKey)
    throw std::invalid_argument("[EditorConfig] captureKey and exitKey must differ");
  return cfg;
}

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] invalid JSON in " + path_ + ": " + e.what());
  }
}

EditorConfig ConfigLoader::loadEditorConfig() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec))
    return EditorConfig{};
  return EditorConfig::fromJson(load());
}
