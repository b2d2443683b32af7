#pragma once

#include <filesystem>
#include <optional>

#include "nlohmann/json.hpp"
#include "vine/bytecode/image.hpp"
#include "vine/core/context.hpp"
#include "vine/model/program.hpp"

namespace vine::model {

std::optional<ProgramSpec> loadProgramFile(const std::filesystem::path &programFile, const vine::Context &ctx);

// Throws std::runtime_error for anything but numbers.
Value valueFromJson(const nlohmann::json &node);

// .vna files are assembled, anything else is read as a .vbc image.
std::optional<Image> loadCodeFile(const std::filesystem::path &file, const vine::Context &ctx);
std::optional<Image> loadProgramCode(const ProgramSpec &program, const vine::Context &ctx);

} // namespace vine::model
