#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads editor configuration (JSON) from the host FS.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace dahu::core {

  /**
 * @struct EditorConfig
 * @brief Validated settings; every field has a default.
 *
 *  * Key names are stored lower-case, matching io::KeyInput normalization.
 */
  struct EditorConfig {
    std::string captureKey{ "f7" };
    std::string exitKey{ "escape" };
    std::string documentName{ "presentation.dahu" };
    std::string logFile{ "dahu-editor.log" };

    /// Overlay the keys present in \p j onto the defaults. Throws
    /// `std::invalid_argument` on a non-object, a wrong type or an empty value.
    static EditorConfig fromJson(const nlohmann::json& j);
  };

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching — every call to `load()` re-reads the file (cheap, tiny file).
 *  * Schema validation lives in EditorConfig::fromJson.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// load() + EditorConfig::fromJson; a missing file yields the defaults.
    EditorConfig loadEditorConfig() const;

  private:
    std::string path_;
  };

} // namespace dahu::core
