//! # Build Configuration Tests

#include "config/build_config.hpp"
#include "json/json_parser.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace frost;
using namespace frost::config;
namespace fs = std::filesystem;

class BuildConfigTest : public ::testing::Test {
protected:
    test_support::ScratchDir scratch;

    Result<BuildConfig, std::string> from_text(const std::string& text) {
        auto parsed = json::parse_json(text);
        EXPECT_TRUE(is_ok(parsed));
        return config_from_json(unwrap(parsed), scratch.path());
    }
};

TEST_F(BuildConfigTest, DefaultsAreRootedAtBase) {
    auto config = BuildConfig::defaults(scratch.path());
    EXPECT_EQ(config.workpath, scratch.path() / "build");
    EXPECT_EQ(config.distpath, scratch.path() / "dist");
    EXPECT_EQ(config.stub_dir, scratch.path() / "stubs");
    EXPECT_EQ(config.specpath, scratch.path());
    EXPECT_EQ(config.runtime_version, 34);
    EXPECT_FALSE(config.has_upx);
    EXPECT_TRUE(config.bootstrap.empty());
}

TEST_F(BuildConfigTest, EmptyObjectGivesDefaults) {
    auto config = from_text("{}");
    ASSERT_TRUE(is_ok(config));
    EXPECT_EQ(unwrap(config).workpath, scratch.path() / "build");
}

TEST_F(BuildConfigTest, RelativePathsResolveAgainstBase) {
    auto config = from_text(R"({"workpath": "out/work", "distpath": "/abs/dist"})");
    ASSERT_TRUE(is_ok(config));
    EXPECT_EQ(unwrap(config).workpath, (scratch.path() / "out" / "work").lexically_normal());
    EXPECT_EQ(unwrap(config).distpath, fs::path("/abs/dist"));
}

TEST_F(BuildConfigTest, PlatformSelectsStubsAndSuffix) {
    auto config = from_text(R"({"platform": "windows"})");
    ASSERT_TRUE(is_ok(config));
    EXPECT_TRUE(unwrap(config).is_windows());
    EXPECT_EQ(unwrap(config).stub_platform_dir(), "Windows-64bit");
    EXPECT_EQ(unwrap(config).extension_suffix(), ".pyd");

    auto linux_config = from_text(R"({"platform": "linux"})");
    ASSERT_TRUE(is_ok(linux_config));
    EXPECT_EQ(unwrap(linux_config).stub_platform_dir(), "Linux-64bit");
    EXPECT_EQ(unwrap(linux_config).extension_suffix(), ".so");
}

TEST_F(BuildConfigTest, RejectsUnknownPlatform) {
    auto config = from_text(R"({"platform": "plan9"})");
    ASSERT_TRUE(is_err(config));
    EXPECT_NE(unwrap_err(config).find("plan9"), std::string::npos);
}

TEST_F(BuildConfigTest, ParsesRuntimeMagic) {
    auto config = from_text(R"({"runtime_magic": "a70d0d0a", "runtime_version": 312})");
    ASSERT_TRUE(is_ok(config));
    EXPECT_EQ(unwrap(config).runtime_magic, (std::array<uint8_t, 4>{0xa7, 0x0d, 0x0d, 0x0a}));
    EXPECT_EQ(unwrap(config).runtime_version, 312);

    EXPECT_TRUE(is_err(from_text(R"({"runtime_magic": "a70d"})")));
    EXPECT_TRUE(is_err(from_text(R"({"runtime_magic": "zz0d0d0a"})")));
}

TEST_F(BuildConfigTest, RuntimeLibraryMustFitCookie) {
    std::string name(64, 'x');
    EXPECT_TRUE(is_err(from_text(R"({"runtime_library": ")" + name + R"("})")));
}

TEST_F(BuildConfigTest, TypeErrorsAreReported) {
    EXPECT_TRUE(is_err(from_text(R"({"has_upx": "yes"})")));
    EXPECT_TRUE(is_err(from_text(R"({"workpath": 3})")));
    EXPECT_TRUE(is_err(from_text("[]")));
}

TEST_F(BuildConfigTest, BootstrapSourcesAreAnchored) {
    auto config = from_text(R"({"bootstrap": [["pyimod01_archive", "boot/archive.pyc", "PYMODULE"]]})");
    ASSERT_TRUE(is_ok(config));
    const auto& boot = unwrap(config).bootstrap;
    ASSERT_EQ(boot.size(), 1u);
    EXPECT_EQ(fs::path(boot[0].path), (scratch.path() / "boot" / "archive.pyc").lexically_normal());
    EXPECT_EQ(boot[0].kind, toc::TocKind::Module);
}

TEST_F(BuildConfigTest, LoadsFromFile) {
    auto file = scratch.write("cfg/frost.json", R"({"workpath": "w", "has_upx": true})");
    auto config = load_build_config(file);
    ASSERT_TRUE(is_ok(config));
    EXPECT_EQ(unwrap(config).workpath, (fs::absolute(file).parent_path() / "w").lexically_normal());
    EXPECT_TRUE(unwrap(config).has_upx);
}

TEST_F(BuildConfigTest, MalformedFileNamesThePath) {
    auto file = scratch.write("broken.json", "{ not json");
    auto config = load_build_config(file);
    ASSERT_TRUE(is_err(config));
    EXPECT_NE(unwrap_err(config).find("broken.json"), std::string::npos);
}
