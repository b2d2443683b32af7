#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "vine/core/context.hpp"
#include "vine/vm/config.hpp"

namespace vine {

// A loadable program: the code buffer plus where execution starts.
struct Image
{
    size_t entry = 0;
    std::vector<uint8> code;
};

enum class ImageError : uint8
{
    NONE,
    UNEXPECTED_END_OF_INPUT,
    INVALID_MAGIC,
    ENTRY_OUT_OF_RANGE
};

const char *imageErrorToString(ImageError error);

std::vector<uint8> encodeImage(const Image &image);
ImageError decodeImage(const std::vector<uint8> &bytes, Image &out);

bool writeImage(const std::filesystem::path &path, const Image &image, const Context &ctx);
std::optional<Image> loadImage(const std::filesystem::path &path, const Context &ctx);

} // namespace vine
