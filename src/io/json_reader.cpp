#include "vine/io/json_reader.hpp"

#include <stdexcept>

#include "vine/io/fs_utils.hpp"

namespace vine::io
{

    nlohmann::json parseJsonObject(const std::string &text, const std::string &origin)
    {
        nlohmann::json data;
        try
        {
            data = nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error("Invalid JSON in " + origin + ": " + e.what());
        }

        if (!data.is_object())
        {
            throw std::runtime_error("JSON root is not object: " + origin);
        }
        return data;
    }

    nlohmann::json loadJsonFile(const std::filesystem::path &path)
    {
        return parseJsonObject(readTextFile(path), path.string());
    }

} // namespace vine::io
