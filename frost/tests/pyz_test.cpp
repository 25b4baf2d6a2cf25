//! # PYZ Target Tests

#include "archive/pyz_archive.hpp"
#include "build/pyz.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace frost;
using namespace frost::build;
namespace fs = std::filesystem;

class PyzTargetTest : public ::testing::Test {
protected:
    test_support::ScratchDir scratch;
    test_support::LogCapture capture;

    std::vector<toc::TocEntry> pure = {
        {"app", "/src/app/__init__.py", toc::TocKind::Module},
        {"app.util", "/src/app/util.py", toc::TocKind::Module},
    };
    CodeMap code = {{"app", "package code"}, {"app.util", "util code"}};

    config::BuildConfig config() {
        return test_support::scratch_config(scratch.path());
    }
};

TEST_F(PyzTargetTest, WritesPlainArchive) {
    target::BuildContext ctx(config());
    auto created = PyzTarget::create(ctx, {pure}, code);
    ASSERT_TRUE(is_ok(created));
    auto pyz = unwrap(created);
    EXPECT_EQ(pyz->artifact(), ctx.config().workpath / "outPYZ0.pyz");
    EXPECT_TRUE(pyz->dependencies().empty());

    auto built = target::run_target(*pyz);
    ASSERT_TRUE(is_ok(built));

    auto reader = archive::PyzReader::open(unwrap(built));
    ASSERT_TRUE(is_ok(reader));
    const auto& archive = unwrap(reader);
    EXPECT_EQ(archive.names(), (std::vector<std::string>{"app", "app.util"}));
    EXPECT_TRUE(archive.find("app")->is_package());
    EXPECT_FALSE(archive.find("app.util")->is_package());
    EXPECT_EQ(unwrap(archive.extract("app.util")), "util code");
}

TEST_F(PyzTargetTest, NamedArtifactLivesInWorkpath) {
    target::BuildContext ctx(config());
    PyzOptions options;
    options.name = "base_library.pyz";
    auto pyz = unwrap(PyzTarget::create(ctx, {pure}, code, options));
    EXPECT_EQ(pyz->artifact(), ctx.config().workpath / "base_library.pyz");
}

TEST_F(PyzTargetTest, EncryptionWritesKeyModule) {
    target::BuildContext ctx(config());
    PyzOptions options;
    options.cipher_key = "secret";
    auto created = PyzTarget::create(ctx, {pure}, code, options);
    ASSERT_TRUE(is_ok(created));
    auto pyz = unwrap(created);

    ASSERT_EQ(pyz->dependencies().size(), 1u);
    const auto& key_entry = pyz->dependencies()[0];
    EXPECT_EQ(key_entry.name, CRYPTO_KEY_MODULE);
    EXPECT_EQ(key_entry.kind, toc::TocKind::Module);
    EXPECT_EQ(test_support::slurp(key_entry.path), "key = '0000000000secret'\n");

    auto built = target::run_target(*pyz);
    ASSERT_TRUE(is_ok(built));
    auto reader = archive::PyzReader::open(unwrap(built));
    ASSERT_TRUE(is_ok(reader));
    EXPECT_TRUE(unwrap(reader).find("app")->is_encrypted());
    EXPECT_TRUE(is_err(unwrap(reader).extract("app")));
    EXPECT_EQ(unwrap(unwrap(reader).extract("app", "secret")), "package code");
}

TEST_F(PyzTargetTest, BootstrapModulesAreForwarded) {
    auto cfg = config();
    cfg.bootstrap.append("pyimod01_archive", "/boot/pyimod01_archive.pyc", toc::TocKind::Module);
    target::BuildContext ctx(std::move(cfg));

    auto with_boot = pure;
    with_boot.push_back({"pyimod01_archive", "/boot/pyimod01_archive.py", toc::TocKind::Module});
    auto pyz = unwrap(PyzTarget::create(ctx, {with_boot}, code));

    EXPECT_TRUE(pyz->dependencies().contains("pyimod01_archive"));
    auto built = target::run_target(*pyz);
    ASSERT_TRUE(is_ok(built));
    auto reader = archive::PyzReader::open(unwrap(built));
    ASSERT_TRUE(is_ok(reader));
    EXPECT_EQ(unwrap(reader).find("pyimod01_archive"), nullptr);
}

TEST_F(PyzTargetTest, MissingCodeFails) {
    target::BuildContext ctx(config());
    CodeMap partial = {{"app", "package code"}};
    auto pyz = unwrap(PyzTarget::create(ctx, {pure}, partial));

    auto built = target::run_target(*pyz);
    ASSERT_TRUE(is_err(built));
    EXPECT_EQ(unwrap_err(built).kind, BuildErrorKind::MissingCode);
    EXPECT_NE(unwrap_err(built).message.find("app.util"), std::string::npos);
}

TEST_F(PyzTargetTest, ReorderedModulesStayUpToDate) {
    {
        target::BuildContext ctx(config());
        auto pyz = unwrap(PyzTarget::create(ctx, {pure}, code));
        ASSERT_TRUE(is_ok(target::run_target(*pyz)));
    }
    capture.clear();

    std::vector<toc::TocEntry> reordered = {pure[1], pure[0]};
    target::BuildContext ctx(config());
    auto pyz = unwrap(PyzTarget::create(ctx, {reordered}, code));
    ASSERT_TRUE(is_ok(target::run_target(*pyz)));
    EXPECT_TRUE(capture.contains(log::LogLevel::Info, "build", "is up to date"));
}
