//! # Filesystem Helper Tests

#include "test_support.hpp"
#include "util/fs_utils.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace frost;
using namespace frost::util;
namespace fs = std::filesystem;

class FsUtilsTest : public ::testing::Test {
protected:
    test_support::ScratchDir scratch;
};

TEST_F(FsUtilsTest, SafeLogicalNames) {
    EXPECT_TRUE(is_safe_logical_name("lib/libfoo.so"));
    EXPECT_TRUE(is_safe_logical_name("pkg/..hidden"));
    EXPECT_TRUE(is_safe_logical_name("a..b"));

    EXPECT_FALSE(is_safe_logical_name(""));
    EXPECT_FALSE(is_safe_logical_name("../escape"));
    EXPECT_FALSE(is_safe_logical_name("a/../../escape"));
    EXPECT_FALSE(is_safe_logical_name("a\\..\\escape"));
    EXPECT_FALSE(is_safe_logical_name("/abs/path"));
    EXPECT_FALSE(is_safe_logical_name("C:evil"));
}

TEST_F(FsUtilsTest, ValidateNamesReportsFirstUnsafe) {
    auto ok = validate_logical_names({"a", "b/c"}, "PKG x");
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok), 2u);

    auto bad = validate_logical_names({"a", "/abs/path", "../escape"}, "PKG x");
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).kind, BuildErrorKind::UnsafePath);
    EXPECT_NE(unwrap_err(bad).message.find("/abs/path"), std::string::npos);
}

TEST_F(FsUtilsTest, MtimeOfMissingFileIsAbsent) {
    EXPECT_FALSE(get_mtime(scratch.path() / "nope").has_value());

    auto file = scratch.write("f", "x");
    auto mtime = get_mtime(file);
    ASSERT_TRUE(mtime.has_value());
    // Unix epoch based, so a file written now is well past 2020-01-01
    EXPECT_GT(*mtime, int64_t{1577836800} * 1000000000);

    test_support::touch_later(file);
    EXPECT_GT(*get_mtime(file), *mtime);
}

TEST_F(FsUtilsTest, WriteFileCreatesParents) {
    auto written = write_file(scratch.path() / "deep" / "er" / "f.txt", "hello");
    ASSERT_TRUE(is_ok(written));
    auto back = read_file(unwrap(written));
    ASSERT_TRUE(is_ok(back));
    EXPECT_EQ(unwrap(back), "hello");
}

TEST_F(FsUtilsTest, ReadMissingFileIsIoError) {
    auto result = read_file(scratch.path() / "missing");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::Io);
}

TEST_F(FsUtilsTest, AppendFileCopiesInChunks) {
    std::string payload(100000, 'q');
    payload[99999] = 'z';
    auto src = scratch.write("big", payload);

    std::ostringstream out;
    auto copied = append_file(src, out, 4096);
    ASSERT_TRUE(is_ok(copied));
    EXPECT_EQ(unwrap(copied), payload.size());
    EXPECT_EQ(out.str(), payload);
}

TEST_F(FsUtilsTest, CopyKeepsModificationTime) {
    auto src = scratch.write("src.bin", "data");
    auto stamp = fs::last_write_time(src) - std::chrono::hours(3);
    fs::last_write_time(src, stamp);

    auto dst = copy_with_metadata(src, scratch.path() / "out" / "dst.bin");
    ASSERT_TRUE(is_ok(dst));
    EXPECT_EQ(test_support::slurp(unwrap(dst)), "data");
    EXPECT_EQ(fs::last_write_time(unwrap(dst)), stamp);
}

TEST_F(FsUtilsTest, DetectsZipContainers) {
    auto egg = scratch.write("site/pkg.egg", "PK");
    EXPECT_TRUE(is_inside_zip(egg / "pkg" / "mod.py"));
    EXPECT_FALSE(is_inside_zip(scratch.path() / "site" / "other" / "mod.py"));

    fs::create_directories(scratch.path() / "unpacked.egg");
    EXPECT_FALSE(is_inside_zip(scratch.path() / "unpacked.egg" / "mod.py"));
}

TEST_F(FsUtilsTest, GuardRefusesRoot) {
    auto result = remove_dir_guarded(scratch.path().root_path(), {});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ContainmentViolation);
}

TEST_F(FsUtilsTest, GuardRefusesAncestorOfProtectedPath) {
    fs::create_directories(scratch.path() / "dist" / "build");
    auto result = remove_dir_guarded(scratch.path() / "dist", {scratch.path() / "dist" / "build"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ContainmentViolation);
    EXPECT_TRUE(fs::exists(scratch.path() / "dist" / "build"));
}

TEST_F(FsUtilsTest, GuardRefusesCurrentDirectory) {
    auto result = remove_dir_guarded(fs::current_path(), {});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ContainmentViolation);
}

TEST_F(FsUtilsTest, GuardRemovesUnprotectedDirectory) {
    scratch.write("dist/app/file", "x");
    auto result = remove_dir_guarded(scratch.path() / "dist" / "app", {scratch.path() / "build"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(fs::exists(scratch.path() / "dist" / "app"));
    EXPECT_TRUE(fs::exists(scratch.path() / "dist"));
}

TEST_F(FsUtilsTest, GuardRefusesSymlinkedDirectory) {
    scratch.write("elsewhere/keep.txt", "keep");
    fs::create_directories(scratch.path() / "dist");
    fs::create_directory_symlink(scratch.path() / "elsewhere", scratch.path() / "dist" / "app");

    auto result = remove_dir_guarded(scratch.path() / "dist" / "app", {});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ContainmentViolation);
    EXPECT_NE(unwrap_err(result).message.find("symbolic link"), std::string::npos);
    EXPECT_TRUE(fs::exists(scratch.path() / "elsewhere" / "keep.txt"));
    EXPECT_TRUE(fs::is_symlink(scratch.path() / "dist" / "app"));
}

TEST_F(FsUtilsTest, GuardResolvesLinksAboveTheTarget) {
    scratch.write("real/app/file", "x");
    fs::create_directory_symlink(scratch.path() / "real", scratch.path() / "dist");

    auto result = remove_dir_guarded(scratch.path() / "dist" / "app" / "", {});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).filename(), "app");
    EXPECT_FALSE(fs::exists(scratch.path() / "real" / "app"));
    EXPECT_TRUE(fs::exists(scratch.path() / "real"));
}

TEST_F(FsUtilsTest, CommonPrefixIsCharacterWise) {
    EXPECT_EQ(common_prefix({"/a/b/app", "/a/b/apple", "/a/bc"}), "/a/b");
    EXPECT_EQ(common_prefix({"same"}), "same");
    EXPECT_EQ(common_prefix({}), "");
}

TEST_F(FsUtilsTest, HexEncoding) {
    EXPECT_EQ(to_hex(std::string("\x00\xff\x10", 3)), "00ff10");
}
