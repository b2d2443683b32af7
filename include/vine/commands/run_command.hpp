#pragma once

#include <string>
#include <vector>

#include "vine/core/context.hpp"

namespace vine::commands {

// vine run <program.json> [--trace] [--quiet]
// Returns 0 when the program halts, 2 when it faults, 1 on usage or load errors.
int runRunCommand(const vine::Context &ctx, const std::vector<std::string> &args);

} // namespace vine::commands
