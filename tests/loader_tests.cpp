#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "vine/core/context.hpp"
#include "vine/model/loader.hpp"

namespace fs = std::filesystem;
using namespace vine;

namespace
{

    fs::path makeTempDir(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        fs::path dir = fs::temp_directory_path() / ("vine_loader_test_" + name + "_" + std::to_string(now));
        fs::create_directories(dir);
        return dir;
    }

    void writeText(const fs::path &file, const std::string &text)
    {
        std::ofstream out(file, std::ios::binary);
        out << text;
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

} // namespace

TEST(ProgramLoader, ReadsAllFields)
{
    const fs::path dir = makeTempDir("fields");
    const Context ctx(false);

    writeText(dir / "prog.json", R"({
        "name": "demo",
        "source": "code/demo.vna",
        "entry": 3,
        "sizeClasses": [2, 8],
        "objectsPerClass": 64,
        "stack": 32,
        "stepBudget": 500,
        "a": [2, -1, 1.5],
        "b": []
    })");

    std::optional<model::ProgramSpec> program = model::loadProgramFile(dir / "prog.json", ctx);
    ASSERT_TRUE(program.has_value());
    EXPECT_EQ(program->name, "demo");
    EXPECT_EQ(program->source.string(), (fs::absolute(dir) / "code" / "demo.vna").string());
    EXPECT_TRUE(program->image.empty());
    ASSERT_TRUE(program->entry.has_value());
    EXPECT_EQ(*program->entry, 3u);
    EXPECT_EQ(program->sizeClasses, (std::vector<size_t>{2, 8}));
    EXPECT_EQ(program->objectsPerClass, 64u);
    EXPECT_EQ(program->stack, 32u);
    EXPECT_EQ(program->stepBudget, 500u);

    ASSERT_EQ(program->a.size(), 3u);
    EXPECT_EQ(program->a[0], Value::makeRaw(2));
    EXPECT_EQ(program->a[1].asInt64(), -1);
    EXPECT_DOUBLE_EQ(program->a[2].asDouble(), 1.5);
    EXPECT_TRUE(program->b.empty());

    cleanupTemp(dir);
}

TEST(ProgramLoader, AppliesDefaults)
{
    const fs::path dir = makeTempDir("defaults");
    const Context ctx(false);
    writeText(dir / "minimal.json", R"({ "image": "minimal.vbc" })");

    std::optional<model::ProgramSpec> program = model::loadProgramFile(dir / "minimal.json", ctx);
    ASSERT_TRUE(program.has_value());
    EXPECT_EQ(program->name, "minimal");
    EXPECT_EQ(program->image.filename().string(), "minimal.vbc");
    EXPECT_FALSE(program->entry.has_value());
    EXPECT_EQ(program->stack, STACK_MAX);
    EXPECT_EQ(program->stepBudget, DEFAULT_STEP_BUDGET);
    EXPECT_EQ(program->objectsPerClass, OBJECTS_PER_CLASS);
    EXPECT_FALSE(program->sizeClasses.empty());

    cleanupTemp(dir);
}

TEST(ProgramLoader, RejectsInvalidDescriptions)
{
    const fs::path dir = makeTempDir("invalid");
    const Context ctx(false);

    writeText(dir / "both.json", R"({ "source": "a.vna", "image": "a.vbc" })");
    writeText(dir / "neither.json", R"({ "name": "x" })");
    writeText(dir / "badvalue.json", R"({ "source": "a.vna", "a": ["two"] })");
    writeText(dir / "badsize.json", R"({ "source": "a.vna", "sizeClasses": [-4] })");
    writeText(dir / "syntax.json", R"({ "source": )");
    writeText(dir / "array.json", R"([1, 2])");
    writeText(dir / "hugestack.json", R"({ "source": "a.vna", "stack": 4611686018427387904 })");

    for (const char *name : {"both.json", "neither.json", "badvalue.json", "badsize.json", "syntax.json", "array.json",
                             "hugestack.json"})
    {
        EXPECT_FALSE(model::loadProgramFile(dir / name, ctx).has_value()) << name;
    }
    EXPECT_FALSE(model::loadProgramFile(dir / "missing.json", ctx).has_value());

    cleanupTemp(dir);
}

TEST(ProgramLoader, LoadsCodeFromSourceWithEntryOverride)
{
    const fs::path dir = makeTempDir("code");
    const Context ctx(false);
    writeText(dir / "p.vna", "noop\nstart:\nhalt\n.entry start\n");
    writeText(dir / "p.json", R"({ "source": "p.vna" })");
    writeText(dir / "q.json", R"({ "source": "p.vna", "entry": 0 })");
    writeText(dir / "bad.vna", "bogus\n");

    std::optional<model::ProgramSpec> p = model::loadProgramFile(dir / "p.json", ctx);
    ASSERT_TRUE(p.has_value());
    std::optional<Image> image = model::loadProgramCode(*p, ctx);
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->entry, 1u);
    EXPECT_EQ(image->code.size(), 2u);

    std::optional<model::ProgramSpec> q = model::loadProgramFile(dir / "q.json", ctx);
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(model::loadProgramCode(*q, ctx)->entry, 0u);

    EXPECT_FALSE(model::loadCodeFile(dir / "bad.vna", ctx).has_value());

    cleanupTemp(dir);
}
