#include "vine/model/loader.hpp"

#include <stdexcept>
#include <utility>

#include "vine/asm/assembler.hpp"
#include "vine/io/fs_utils.hpp"
#include "vine/io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace vine::model
{

    namespace
    {

        std::vector<Value> toValueList(const json &node, const char *key)
        {
            std::vector<Value> out;
            if (!node.is_array())
            {
                throw std::runtime_error(std::string("'") + key + "' must be an array");
            }

            for (const auto &item : node)
            {
                out.push_back(valueFromJson(item));
            }
            return out;
        }

        std::vector<size_t> toSizeList(const json &node, const char *key)
        {
            std::vector<size_t> out;
            if (!node.is_array())
            {
                throw std::runtime_error(std::string("'") + key + "' must be an array");
            }

            for (const auto &item : node)
            {
                if (!item.is_number_unsigned())
                {
                    throw std::runtime_error(std::string("'") + key + "' entries must be non-negative integers");
                }
                out.push_back(item.get<size_t>());
            }
            return out;
        }

        size_t readSize(const json &data, const char *key, size_t fallback)
        {
            if (!data.contains(key))
            {
                return fallback;
            }
            if (!data[key].is_number_unsigned())
            {
                throw std::runtime_error(std::string("'") + key + "' must be a non-negative integer");
            }
            return data[key].get<size_t>();
        }

    } // namespace

    Value valueFromJson(const json &node)
    {
        if (node.is_number_unsigned())
        {
            return Value::fromUnsigned(node.get<uint64>());
        }
        if (node.is_number_integer())
        {
            return Value::fromSigned(node.get<int64>());
        }
        if (node.is_number_float())
        {
            return Value::fromDouble(node.get<double>());
        }
        throw std::runtime_error("input values must be numbers, got " + node.dump());
    }

    std::optional<ProgramSpec> loadProgramFile(const fs::path &programFile, const vine::Context &ctx)
    {
        try
        {
            json data = io::loadJsonFile(programFile);

            ProgramSpec program;
            program.filePath = fs::absolute(programFile);
            fs::path dir = program.filePath.parent_path();
            program.name = data.value("name", programFile.stem().string());

            bool hasSource = data.contains("source");
            bool hasImage = data.contains("image");
            if (hasSource == hasImage)
            {
                throw std::runtime_error("exactly one of 'source' or 'image' is required");
            }
            if (hasSource)
            {
                program.source = io::resolveRelative(dir, data["source"].get<std::string>());
            }
            else
            {
                program.image = io::resolveRelative(dir, data["image"].get<std::string>());
            }

            if (data.contains("entry"))
            {
                program.entry = readSize(data, "entry", 0);
            }

            if (data.contains("sizeClasses"))
            {
                program.sizeClasses = toSizeList(data["sizeClasses"], "sizeClasses");
            }
            program.objectsPerClass = readSize(data, "objectsPerClass", program.objectsPerClass);
            program.stack = readSize(data, "stack", program.stack);
            if (program.stack > MAX_STACK_CAPACITY)
            {
                throw std::runtime_error("'stack' must be at most " + std::to_string(MAX_STACK_CAPACITY));
            }
            program.stepBudget = readSize(data, "stepBudget", (size_t)program.stepBudget);

            program.a = toValueList(data.value("a", json::array()), "a");
            program.b = toValueList(data.value("b", json::array()), "b");

            return program;
        }
        catch (const std::exception &e)
        {
            ctx.error("Failed parse program ", programFile.string(), " : ", e.what());
            return std::nullopt;
        }
    }

    std::optional<Image> loadCodeFile(const fs::path &file, const vine::Context &ctx)
    {
        if (file.extension() != ".vna")
        {
            return loadImage(file, ctx);
        }

        std::string text;
        try
        {
            text = io::readTextFile(file);
        }
        catch (const std::exception &e)
        {
            ctx.error("Failed read source ", file.string(), " : ", e.what());
            return std::nullopt;
        }

        AssemblyResult assembled = assemble(text);
        if (!assembled.ok)
        {
            for (const AssemblyError &err : assembled.errors)
            {
                ctx.error(file.string(), ":", err.line, ": ", err.message);
            }
            return std::nullopt;
        }

        Image image;
        image.entry = assembled.entry;
        image.code = std::move(assembled.code);
        return image;
    }

    std::optional<Image> loadProgramCode(const ProgramSpec &program, const vine::Context &ctx)
    {
        std::optional<Image> image = loadCodeFile(program.source.empty() ? program.image : program.source, ctx);
        if (!image.has_value())
        {
            return std::nullopt;
        }

        if (program.entry.has_value())
        {
            image->entry = *program.entry;
        }
        return image;
    }

} // namespace vine::model
