//! # CLI Driver Tests
//!
//! Build descriptions run end to end against a scratch tree, archive
//! listings, and command line exit codes.

#include "archive/carchive.hpp"
#include "cli/driver.hpp"
#include "json/json_parser.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace frost;
using namespace frost::cli;
namespace fs = std::filesystem;

class DriverTest : public ::testing::Test {
protected:
    test_support::ScratchDir scratch;
    test_support::LogCapture capture;

    void SetUp() override {
        scratch.write("src/main.pyc", "main code");
        scratch.write("src/app/__init__.pyc", "app code");
        scratch.write("lib/libshared.so", "ELF shared");
        scratch.write("data/settings.ini", "[settings]");
        scratch.write("stubs/Linux-64bit/run", "stub");
    }

    /// Wraps `body` with a Linux configuration rooted at the scratch dir.
    BuildResult<BuildSummary> run(const std::string& body) {
        std::string text = R"({"config": {"platform": "linux", "cache_dir": "cache",
                                           "strip_tool": "true"}, )" +
                           body + "}";
        auto parsed = json::parse_json(text);
        EXPECT_TRUE(is_ok(parsed)) << text;
        return run_build(unwrap(parsed), scratch.path());
    }
};

TEST_F(DriverTest, PackageFromInlineToc) {
    auto summary = run(R"("targets": [
        {"type": "PKG", "id": "pkg", "name": "app.pkg",
         "inputs": [[["main", "src/main.pyc", "PYSOURCE"], ["v", null, "OPTION"]]]}
    ])");
    ASSERT_TRUE(is_ok(summary)) << unwrap_err(summary).to_string();
    ASSERT_EQ(unwrap(summary).artifacts.size(), 1u);

    fs::path pkg = scratch.path() / "build" / "app.pkg";
    EXPECT_EQ(unwrap(summary).artifacts[0], pkg);
    auto reader = archive::CArchiveReader::open(pkg);
    ASSERT_TRUE(is_ok(reader));
    EXPECT_EQ(unwrap(unwrap(reader).extract("main")), "main code");
    EXPECT_NE(unwrap(reader).find("v"), nullptr);
}

TEST_F(DriverTest, OneFileExecutableFromGraph) {
    auto summary = run(R"(
        "graphs": [{"id": "app",
                    "scripts": [["main", "src/main.pyc", "PYSOURCE"]],
                    "pure": [["app", "src/app/__init__.py", "PYMODULE"]],
                    "binaries": [["libshared.so", "lib/libshared.so", "BINARY"]]}],
        "targets": [
            {"type": "PYZ", "id": "pyz", "inputs": ["app.pure"],
             "code": {"app": "src/app/__init__.pyc"}},
            {"type": "EXE", "id": "exe", "name": "app", "strip": true,
             "inputs": ["app.scripts", "pyz", "app.binaries"]}
        ])");
    ASSERT_TRUE(is_ok(summary)) << unwrap_err(summary).to_string();
    ASSERT_EQ(unwrap(summary).artifacts.size(), 2u);

    fs::path exe = scratch.path() / "dist" / "app";
    EXPECT_EQ(unwrap(summary).artifacts[1], exe);
    auto reader = archive::CArchiveReader::open(exe);
    ASSERT_TRUE(is_ok(reader));
    EXPECT_EQ(unwrap(reader).start_offset(), 4u);
    EXPECT_NE(unwrap(reader).find("outPYZ0.pyz"), nullptr);
    EXPECT_EQ(unwrap(unwrap(reader).extract("libshared.so")), "ELF shared");
    // Stub and library both went through the strip slot
    EXPECT_EQ(unwrap(summary).cache.misses, 2u);
}

TEST_F(DriverTest, OneDirectoryBuildWithCollect) {
    auto summary = run(R"(
        "graphs": [{"id": "app",
                    "scripts": [["main", "src/main.pyc", "PYSOURCE"]],
                    "binaries": [["libshared.so", "lib/libshared.so", "BINARY"]],
                    "datas": [["conf/settings.ini", "data/settings.ini", "DATA"]]}],
        "targets": [
            {"type": "EXE", "id": "exe", "name": "app", "exclude_binaries": true,
             "inputs": ["app.scripts", "app.binaries"]},
            {"type": "COLLECT", "name": "app", "inputs": ["exe", "app.datas"]}
        ])");
    ASSERT_TRUE(is_ok(summary)) << unwrap_err(summary).to_string();

    fs::path dist = scratch.path() / "dist" / "app";
    EXPECT_TRUE(fs::exists(dist / "app"));
    EXPECT_EQ(test_support::slurp(dist / "libshared.so"), "ELF shared");
    EXPECT_EQ(test_support::slurp(dist / "conf" / "settings.ini"), "[settings]");
}

TEST_F(DriverTest, MergeSharesBinariesBetweenGraphs) {
    scratch.write("src/second.pyc", "second");
    auto summary = run(R"(
        "graphs": [
            {"id": "first", "output_path": "first",
             "scripts": [["first", "src/first.py", "PYSOURCE"]],
             "binaries": [["libshared.so", "lib/libshared.so", "BINARY"]]},
            {"id": "second", "output_path": "second",
             "scripts": [["second", "src/second.py", "PYSOURCE"]],
             "binaries": [["libshared.so", "lib/libshared.so", "BINARY"]]}
        ],
        "merge": true,
        "targets": [
            {"type": "PKG", "name": "second.pkg",
             "inputs": [[["main", "src/second.pyc", "PYSOURCE"]], "second.binaries",
                        "second.dependencies"]}
        ])");
    ASSERT_TRUE(is_ok(summary)) << unwrap_err(summary).to_string();
    EXPECT_EQ(unwrap(summary).merged_references, 1u);

    auto reader = archive::CArchiveReader::open(unwrap(summary).artifacts[0]);
    ASSERT_TRUE(is_ok(reader));
    EXPECT_EQ(unwrap(reader).find("libshared.so"), nullptr);
    const auto* ref = unwrap(reader).find("first:libshared.so");
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->type_code, 'd');
}

TEST_F(DriverTest, DescriptionErrorsAreInvalidInput) {
    auto unknown_input = run(R"("targets": [{"type": "PKG", "inputs": ["nowhere"]}])");
    ASSERT_TRUE(is_err(unknown_input));
    EXPECT_EQ(unwrap_err(unknown_input).kind, BuildErrorKind::InvalidInput);
    EXPECT_NE(unwrap_err(unknown_input).message.find("unknown input nowhere"), std::string::npos);

    auto unknown_type = run(R"("targets": [{"type": "ZIP"}])");
    ASSERT_TRUE(is_err(unknown_type));
    EXPECT_NE(unwrap_err(unknown_type).message.find("unknown target type"), std::string::npos);

    auto bad_option = run(R"("targets": [{"type": "EXE", "name": "app", "console": "yes"}])");
    ASSERT_TRUE(is_err(bad_option));
    EXPECT_NE(unwrap_err(bad_option).message.find("'console' must be a boolean"),
              std::string::npos);

    auto no_targets = run(R"("graphs": [])");
    ASSERT_TRUE(is_err(no_targets));

    auto unnamed_collect = run(R"("targets": [{"type": "COLLECT"}])");
    ASSERT_TRUE(is_err(unnamed_collect));
}

TEST_F(DriverTest, BuildFileResolvesAgainstItsDirectory) {
    scratch.write("project/frost.json", R"({"workpath": "out", "platform": "linux"})");
    scratch.write("project/res/data.txt", "payload");
    auto file = scratch.write("project/build.json", R"({
        "config": "frost.json",
        "targets": [{"type": "PKG", "name": "data.pkg",
                     "inputs": [[["data.txt", "res/data.txt", "DATA"]]]}]
    })");

    auto summary = run_build_file(file);
    ASSERT_TRUE(is_ok(summary)) << unwrap_err(summary).to_string();
    EXPECT_TRUE(fs::exists(scratch.path() / "project" / "out" / "data.pkg"));
}

TEST_F(DriverTest, ListsPackageAndModuleArchives) {
    auto summary = run(R"(
        "targets": [
            {"type": "PYZ", "id": "pyz", "name": "mods.pyz",
             "inputs": [[["app", "src/app/__init__.py", "PYMODULE"]]],
             "code": {"app": "src/app/__init__.pyc"}},
            {"type": "PKG", "name": "app.pkg", "inputs": ["pyz"]}
        ])");
    ASSERT_TRUE(is_ok(summary)) << unwrap_err(summary).to_string();

    auto pkg_listing = list_archive(scratch.path() / "build" / "app.pkg");
    ASSERT_TRUE(is_ok(pkg_listing));
    EXPECT_EQ(unwrap(pkg_listing).rfind("PKG ", 0), 0u);
    EXPECT_NE(unwrap(pkg_listing).find("mods.pyz"), std::string::npos);

    auto pyz_listing = list_archive(scratch.path() / "build" / "mods.pyz");
    ASSERT_TRUE(is_ok(pyz_listing));
    EXPECT_EQ(unwrap(pyz_listing).rfind("PYZ ", 0), 0u);
    EXPECT_NE(unwrap(pyz_listing).find("p-  app"), std::string::npos);

    auto neither = list_archive(scratch.path() / "data" / "settings.ini");
    ASSERT_TRUE(is_err(neither));
    EXPECT_NE(unwrap_err(neither).message.find("neither a PKG nor a PYZ"), std::string::npos);
}

TEST_F(DriverTest, CommandLineExitCodes) {
    char prog[] = "frost";
    char help[] = "--help";
    char list[] = "--list";
    char verbose[] = "-v";

    char* bare[] = {prog};
    EXPECT_EQ(frost_main(1, bare), 2);

    char* only_log_options[] = {prog, verbose};
    EXPECT_EQ(frost_main(2, only_log_options), 2);

    char* with_help[] = {prog, help};
    EXPECT_EQ(frost_main(2, with_help), 0);

    char* list_without_file[] = {prog, list};
    EXPECT_EQ(frost_main(2, list_without_file), 2);

    std::string missing = (scratch.path() / "missing.json").string();
    char* missing_file[] = {prog, missing.data()};
    EXPECT_EQ(frost_main(2, missing_file), 1);
}
