/* @file ConfigLoader.cpp
 * @brief file → nlohmann::json
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/ConfigLoader.hpp"

using namespace anod::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  std::ostringstream text;
  text << in.rdbuf();
  if (in.bad())
    throw std::runtime_error("[ConfigLoader] read error on " + path_);
  return parse(text.str(), path_);
}

nlohmann::json ConfigLoader::parse(const std::string& text, const std::string& origin) {
  try {
    return nlohmann::json::parse(text, nullptr, true, true); // allow comments
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + origin + ": " + e.what());
  }
}
