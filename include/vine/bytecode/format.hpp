#pragma once

#include "vine/vm/config.hpp"

namespace vine::format {

// .vbc image: MAGIC, u64 entry, u64 code length, code bytes. All little-endian.
static constexpr uint8 MAGIC[8] = {'V', 'V', 'M', 'M', 0, 0, 0, 0};
static constexpr size_t HEADER_SIZE = sizeof(MAGIC) + 8 + 8;

} // namespace vine::format
