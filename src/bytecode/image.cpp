#include "vine/bytecode/image.hpp"
#include "vine/bytecode/format.hpp"
#include "vine/io/fs_utils.hpp"

#include <cstring>
#include <exception>
#include <utility>

namespace vine
{

namespace
{

class ImageReader
{
public:
  explicit ImageReader(const std::vector<uint8> &bytes) : bytes_(bytes), pos_(0), ok_(true) {}

  bool ok() const { return ok_; }
  size_t remaining() const { return bytes_.size() - pos_; }

  bool readRaw(void *data, size_t size)
  {
    if (!ok_)
    {
      return false;
    }

    if (size > remaining())
    {
      ok_ = false;
      return false;
    }

    if (size > 0)
    {
      std::memcpy(data, bytes_.data() + pos_, size);
      pos_ += size;
    }
    return true;
  }

  bool readU64(uint64 *out)
  {
    uint8 data[8];
    if (!readRaw(data, sizeof(data)))
    {
      return false;
    }

    uint64 value = 0;
    for (unsigned i = 0; i < 8; i++)
    {
      value |= (uint64)data[i] << (8u * i);
    }
    *out = value;
    return true;
  }

private:
  const std::vector<uint8> &bytes_;
  size_t pos_;
  bool ok_;
};

void appendU64(std::vector<uint8> &out, uint64 value)
{
  for (unsigned i = 0; i < 8; i++)
  {
    out.push_back((uint8)((value >> (8u * i)) & 0xFFu));
  }
}

} // namespace

const char *imageErrorToString(ImageError error)
{
  switch (error)
  {
  case ImageError::NONE:
    return "ok";
  case ImageError::UNEXPECTED_END_OF_INPUT:
    return "unexpected end of input";
  case ImageError::INVALID_MAGIC:
    return "invalid magic";
  case ImageError::ENTRY_OUT_OF_RANGE:
    return "entry out of range";
  }
  return "unknown";
}

std::vector<uint8> encodeImage(const Image &image)
{
  std::vector<uint8> out;
  out.reserve(format::HEADER_SIZE + image.code.size());
  out.insert(out.end(), format::MAGIC, format::MAGIC + sizeof(format::MAGIC));
  appendU64(out, (uint64)image.entry);
  appendU64(out, (uint64)image.code.size());
  out.insert(out.end(), image.code.begin(), image.code.end());
  return out;
}

// Bytes after the declared code length are ignored.
ImageError decodeImage(const std::vector<uint8> &bytes, Image &out)
{
  ImageReader reader(bytes);

  uint8 magic[sizeof(format::MAGIC)];
  if (!reader.readRaw(magic, sizeof(magic)))
  {
    return ImageError::UNEXPECTED_END_OF_INPUT;
  }
  if (std::memcmp(magic, format::MAGIC, sizeof(magic)) != 0)
  {
    return ImageError::INVALID_MAGIC;
  }

  uint64 entry = 0;
  uint64 length = 0;
  if (!reader.readU64(&entry) || !reader.readU64(&length))
  {
    return ImageError::UNEXPECTED_END_OF_INPUT;
  }
  if (length > reader.remaining())
  {
    return ImageError::UNEXPECTED_END_OF_INPUT;
  }
  if (entry > length)
  {
    return ImageError::ENTRY_OUT_OF_RANGE;
  }

  Image image;
  image.entry = (size_t)entry;
  image.code.resize((size_t)length);
  if (!reader.readRaw(image.code.data(), image.code.size()))
  {
    return ImageError::UNEXPECTED_END_OF_INPUT;
  }

  out = std::move(image);
  return ImageError::NONE;
}

bool writeImage(const std::filesystem::path &path, const Image &image, const Context &ctx)
{
  if (!io::ensureParentDir(path, ctx))
  {
    return false;
  }

  try
  {
    io::writeBinaryFile(path, encodeImage(image));
  }
  catch (const std::exception &e)
  {
    ctx.error("Failed write image ", path.string(), " : ", e.what());
    return false;
  }

  ctx.log("Wrote ", path.string(), " (", image.code.size(), " bytes of code, entry ", image.entry, ")");
  return true;
}

std::optional<Image> loadImage(const std::filesystem::path &path, const Context &ctx)
{
  std::vector<uint8> bytes;
  try
  {
    bytes = io::readBinaryFile(path);
  }
  catch (const std::exception &e)
  {
    ctx.error("Failed read image ", path.string(), " : ", e.what());
    return std::nullopt;
  }

  Image image;
  ImageError error = decodeImage(bytes, image);
  if (error != ImageError::NONE)
  {
    ctx.error("Invalid image ", path.string(), " : ", imageErrorToString(error));
    return std::nullopt;
  }
  return image;
}

} // namespace vine
