#pragma once

#include <string>
#include <vector>

#include "vine/vm/config.hpp"

namespace vine {

struct AssemblyError
{
    size_t line; // 1-based
    std::string message;
};

struct AssemblyResult
{
    bool ok = false;
    std::vector<uint8> code;
    size_t entry = 0;
    std::vector<AssemblyError> errors;
};

/**
 * @brief Assembles .vna text into Vine bytecode.
 *
 * One instruction per line, `;` or `#` start a comment, `name:` defines a
 * label and `.entry name` (or `.entry <offset>`) picks the entry point.
 * Every error is collected; `ok` is false when there is at least one.
 */
AssemblyResult assemble(const std::string &source);

} // namespace vine
