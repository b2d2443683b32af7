#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"

namespace vine::io {

// Both throw std::runtime_error naming `origin` on syntax errors or a non-object root.
nlohmann::json parseJsonObject(const std::string &text, const std::string &origin);
nlohmann::json loadJsonFile(const std::filesystem::path &path);

} // namespace vine::io
