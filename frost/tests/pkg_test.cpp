//! # PKG Target Tests

#include "archive/carchive.hpp"
#include "build/pkg.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace frost;
using namespace frost::build;
namespace fs = std::filesystem;

class PkgTargetTest : public ::testing::Test {
protected:
    test_support::ScratchDir scratch;
    test_support::LogCapture capture;
    target::BuildContext ctx{test_support::scratch_config(scratch.path())};

    std::string file(const std::string& relative, const std::string& content) {
        return scratch.write(relative, content).string();
    }
};

TEST_F(PkgTargetTest, StoresEntriesWithTypeCodes) {
    std::vector<toc::TocEntry> entries = {
        {"main", file("src/main.pyc", "script body"), toc::TocKind::Source},
        {"base_library.pyz", file("build/base_library.pyz", "PYZ\0"), toc::TocKind::Pyz},
        {"assets/logo.txt", file("assets/logo.txt", std::string(4096, 'L')), toc::TocKind::Data},
        {"libfoo.so", file("lib/libfoo.so", "ELF"), toc::TocKind::Binary},
        {"v", "", toc::TocKind::Option},
    };
    PkgTarget pkg(ctx, {entries});
    EXPECT_EQ(pkg.artifact(), ctx.config().workpath / "outPKG0.pkg");

    auto built = target::run_target(pkg);
    ASSERT_TRUE(is_ok(built));

    auto reader = archive::CArchiveReader::open(unwrap(built));
    ASSERT_TRUE(is_ok(reader));
    const auto& archive = unwrap(reader);
    EXPECT_EQ(archive.names(), (std::vector<std::string>{"main", "base_library.pyz",
                                                         "assets/logo.txt", "libfoo.so", "v"}));
    EXPECT_EQ(archive.runtime_version(), ctx.config().runtime_version);

    EXPECT_EQ(archive.find("main")->type_code, 's');
    EXPECT_EQ(archive.find("base_library.pyz")->type_code, 'z');
    EXPECT_EQ(archive.find("base_library.pyz")->compression_flag, 0);
    EXPECT_EQ(archive.find("assets/logo.txt")->compression_flag, 1);
    EXPECT_LT(archive.find("assets/logo.txt")->compressed_len, 4096);
    EXPECT_EQ(archive.find("libfoo.so")->type_code, 'b');
    EXPECT_EQ(archive.find("v")->type_code, 'o');
    EXPECT_EQ(archive.find("v")->uncompressed_len, 0);

    EXPECT_EQ(unwrap(archive.extract("assets/logo.txt")), std::string(4096, 'L'));
}

TEST_F(PkgTargetTest, CompressionPolicyIsHonored) {
    PkgOptions options;
    options.cdict[toc::TocKind::Data] = false;
    std::vector<toc::TocEntry> entries = {
        {"data.txt", file("data.txt", std::string(1024, 'd')), toc::TocKind::Data}};
    PkgTarget pkg(ctx, {entries}, scratch.path() / "plain.pkg", options);

    ASSERT_TRUE(is_ok(target::run_target(pkg)));
    auto reader = archive::CArchiveReader::open(pkg.artifact());
    ASSERT_TRUE(is_ok(reader));
    EXPECT_EQ(unwrap(reader).find("data.txt")->compression_flag, 0);
    EXPECT_EQ(unwrap(reader).find("data.txt")->compressed_len, 1024);
}

TEST_F(PkgTargetTest, UnsafeNamesAreRejectedBeforeWriting) {
    for (const std::string name : {"../escape", "/abs/path", "a/../../b"}) {
        std::vector<toc::TocEntry> entries = {{name, file("x.txt", "x"), toc::TocKind::Data}};
        PkgTarget pkg(ctx, {entries});

        auto built = target::run_target(pkg);
        ASSERT_TRUE(is_err(built)) << name;
        EXPECT_EQ(unwrap_err(built).kind, BuildErrorKind::UnsafePath);
        EXPECT_FALSE(fs::exists(pkg.artifact()));
    }
}

TEST_F(PkgTargetTest, ZippedSourcesAreSkipped) {
    file("site/lib.egg", "PK zip bytes");
    std::vector<toc::TocEntry> entries = {
        {"lib/mod.pyc", (scratch.path() / "site/lib.egg/lib/mod.pyc").string(),
         toc::TocKind::Data},
        {"kept.txt", file("kept.txt", "k"), toc::TocKind::Data},
    };
    PkgTarget pkg(ctx, {entries});

    ASSERT_TRUE(is_ok(target::run_target(pkg)));
    auto reader = archive::CArchiveReader::open(pkg.artifact());
    ASSERT_TRUE(is_ok(reader));
    EXPECT_EQ(unwrap(reader).names(), (std::vector<std::string>{"kept.txt"}));
}

TEST_F(PkgTargetTest, MissingSourceFails) {
    std::vector<toc::TocEntry> entries = {
        {"gone.txt", (scratch.path() / "gone.txt").string(), toc::TocKind::Data}};
    PkgTarget pkg(ctx, {entries});

    auto built = target::run_target(pkg);
    ASSERT_TRUE(is_err(built));
    EXPECT_EQ(unwrap_err(built).kind, BuildErrorKind::MissingSource);
}

TEST_F(PkgTargetTest, ExcludedBinariesAreForwarded) {
    PkgOptions options;
    options.exclude_binaries = true;
    std::vector<toc::TocEntry> entries = {
        {"main", file("main.pyc", "m"), toc::TocKind::Source},
        {"libfoo.so", file("libfoo.so", "ELF"), toc::TocKind::Binary},
        {"pkg.fast", file("fast.so", "ELF"), toc::TocKind::Extension},
    };
    PkgTarget pkg(ctx, {entries}, {}, options);

    const auto& forwarded = pkg.dependencies();
    ASSERT_EQ(forwarded.size(), 2u);
    EXPECT_EQ(forwarded[0].name, "libfoo.so");
    EXPECT_EQ(forwarded[1].name, "pkg/fast.so");

    ASSERT_TRUE(is_ok(target::run_target(pkg)));
    auto reader = archive::CArchiveReader::open(pkg.artifact());
    ASSERT_TRUE(is_ok(reader));
    EXPECT_EQ(unwrap(reader).names(), (std::vector<std::string>{"main"}));
}

TEST_F(PkgTargetTest, DependencyReferencesAreMarkers) {
    std::vector<toc::TocEntry> entries = {
        {"libshared.so:other/app", "", toc::TocKind::Dependency},
        {"main", file("main.pyc", "m"), toc::TocKind::Source},
    };
    PkgTarget pkg(ctx, {entries});

    ASSERT_TRUE(is_ok(target::run_target(pkg)));
    auto reader = archive::CArchiveReader::open(pkg.artifact());
    ASSERT_TRUE(is_ok(reader));
    const auto* ref = unwrap(reader).find("libshared.so:other/app");
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->type_code, 'd');
    EXPECT_EQ(ref->compressed_len, 0);
}

TEST_F(PkgTargetTest, SameBinaryUnderTwoNamesWarns) {
    auto lib = file("lib/libfoo.so.1", "ELF");
    std::vector<toc::TocEntry> entries = {
        {"libfoo.so.1", lib, toc::TocKind::Binary},
        {"libfoo.so", lib, toc::TocKind::Binary},
    };
    PkgTarget pkg(ctx, {entries});

    ASSERT_TRUE(is_ok(target::run_target(pkg)));
    EXPECT_TRUE(capture.contains(log::LogLevel::Warn, "pkg", "One binary added with two names"));
}

TEST_F(PkgTargetTest, StrippedBinariesComeFromCache) {
    PkgOptions options;
    options.strip_binaries = true;
    std::vector<toc::TocEntry> entries = {
        {"libfoo.so", file("libfoo.so", "ELF"), toc::TocKind::Binary}};
    PkgTarget pkg(ctx, {entries}, {}, options);

    ASSERT_TRUE(is_ok(target::run_target(pkg)));
    EXPECT_EQ(ctx.bin_cache().stats().misses, 1u);
    auto reader = archive::CArchiveReader::open(pkg.artifact());
    ASSERT_TRUE(is_ok(reader));
    EXPECT_EQ(unwrap(unwrap(reader).extract("libfoo.so")), "ELF");
}

TEST_F(PkgTargetTest, TouchedSourceRebuilds) {
    auto data = file("data.txt", "one");
    std::vector<toc::TocEntry> entries = {{"data.txt", data, toc::TocKind::Data}};
    PkgTarget pkg(ctx, {entries});
    ASSERT_TRUE(is_ok(target::run_target(pkg)));
    capture.clear();

    ASSERT_TRUE(is_ok(target::run_target(pkg)));
    EXPECT_TRUE(capture.contains(log::LogLevel::Info, "build", "is up to date"));

    test_support::touch_later(data);
    ASSERT_TRUE(is_ok(target::run_target(pkg)));
    EXPECT_TRUE(capture.contains(log::LogLevel::Info, "build", "Building PKG"));
}
