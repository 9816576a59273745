#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Reads the runner's JSON configuration from host FS.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace anod::core {

  /**
 * @class ConfigLoader
 * @brief File or text → nlohmann::json. Line and block comments are accepted so
 *        experiment files can be annotated.
 *
 *  * Re-reads the file on every `load()`.
 *  * Schema checks live in SystemConfig::fromJson.
 */
  class ConfigLoader {
  public:
    explicit ConfigLoader(std::string configPath);

    /// Throws std::runtime_error naming the file when it is unreadable or malformed.
    nlohmann::json load() const;

    /// @param origin  name used in the error message.
    static nlohmann::json parse(const std::string& text, const std::string& origin = "<text>");

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace anod::core
