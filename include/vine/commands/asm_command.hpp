#pragma once

#include <string>
#include <vector>

#include "vine/core/context.hpp"

namespace vine::commands {

int runAsmCommand(const vine::Context &ctx, const std::vector<std::string> &args);

} // namespace vine::commands
