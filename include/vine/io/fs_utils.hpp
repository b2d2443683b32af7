#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "vine/core/context.hpp"
#include "vine/vm/config.hpp"

namespace vine::io {

// Throw std::runtime_error when the file cannot be opened, read or written.
std::string readTextFile(const std::filesystem::path &path);
std::vector<uint8> readBinaryFile(const std::filesystem::path &path);
void writeBinaryFile(const std::filesystem::path &path, const std::vector<uint8> &bytes);

bool ensureParentDir(const std::filesystem::path &file, const vine::Context &ctx);
std::filesystem::path resolveRelative(const std::filesystem::path &base, const std::string &path);

} // namespace vine::io
