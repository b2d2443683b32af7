#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "vine/vm/types.hpp"
#include "vine/vm/value.hpp"

namespace vine::model {

// A run description read from <name>.json.
struct ProgramSpec {
    std::string name;
    std::filesystem::path filePath;

    // Exactly one of these is set, resolved against the JSON file's directory.
    std::filesystem::path source;
    std::filesystem::path image;

    std::optional<size_t> entry; // overrides the entry from source or image

    std::vector<size_t> sizeClasses{1, 2, 4, 8, 16};
    size_t objectsPerClass = OBJECTS_PER_CLASS;
    size_t stack = STACK_MAX;
    uint64 stepBudget = DEFAULT_STEP_BUDGET;

    std::vector<Value> a;
    std::vector<Value> b;
};

} // namespace vine::model
