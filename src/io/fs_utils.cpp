#include "vine/io/fs_utils.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace vine::io
{

    std::string readTextFile(const fs::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open file: " + path.string());
        }

        std::ostringstream out;
        out << in.rdbuf();
        if (in.bad())
        {
            throw std::runtime_error("Failed read file: " + path.string());
        }
        return out.str();
    }

    std::vector<uint8> readBinaryFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open file: " + path.string());
        }

        std::vector<uint8> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            throw std::runtime_error("Failed read file: " + path.string());
        }
        return bytes;
    }

    void writeBinaryFile(const fs::path &path, const std::vector<uint8> &bytes)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Could not create file: " + path.string());
        }

        out.write(reinterpret_cast<const char *>(bytes.data()), (std::streamsize)bytes.size());
        if (!out)
        {
            throw std::runtime_error("Failed write file: " + path.string());
        }
    }

    bool ensureParentDir(const fs::path &file, const vine::Context &ctx)
    {
        fs::path dir = file.parent_path();
        if (dir.empty())
        {
            return true;
        }

        std::error_code ec;
        if (fs::exists(dir, ec))
        {
            return fs::is_directory(dir, ec);
        }
        if (!fs::create_directories(dir, ec) || ec)
        {
            ctx.error("Failed create directory ", dir.string(), " : ", ec.message());
            return false;
        }
        return true;
    }

    fs::path resolveRelative(const fs::path &base, const std::string &path)
    {
        fs::path out(path);
        if (out.is_absolute())
        {
            return out;
        }
        return base / out;
    }

} // namespace vine::io
