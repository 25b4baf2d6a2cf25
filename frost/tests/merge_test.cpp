//! # MERGE Tests

#include "build/merge.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace frost;
using namespace frost::build;

namespace {

BuildGraph graph(const std::string& id, const std::string& output_path, const std::string& script) {
    BuildGraph g;
    g.id = id;
    g.output_path = output_path;
    g.scripts.append(id, script, toc::TocKind::Source);
    return g;
}

} // namespace

TEST(RelativeReferenceTest, ClimbsOnePerDirectory) {
    EXPECT_EQ(relative_reference("app2", "app1"), "app1");
    EXPECT_EQ(relative_reference("dist/app2", "dist/app1"), "../dist/app1");
    EXPECT_EQ(relative_reference("a/b/c", "x"), "../../x");
}

class MergeTest : public ::testing::Test {
protected:
    test_support::LogCapture capture;
};

TEST_F(MergeTest, SecondGraphReferencesSharedBinary) {
    std::vector<BuildGraph> graphs = {
        graph("first", "dist/first", "/proj/first.py"),
        graph("second", "dist/second", "/proj/second.py"),
    };
    graphs[0].binaries.append("libfoo.so", "/lib/foo.so", toc::TocKind::Binary);
    graphs[1].binaries.append("lib/libfoo.so", "/lib/foo.so", toc::TocKind::Binary);
    graphs[1].binaries.append("libonly.so", "/lib/only.so", toc::TocKind::Binary);

    auto merged = merge_graphs(graphs);
    ASSERT_TRUE(is_ok(merged));
    const auto& report = unwrap(merged);
    EXPECT_EQ(report.common_prefix, "/proj/");
    EXPECT_EQ(report.references, 1u);
    EXPECT_EQ(report.owners.at("/lib/foo.so").path, "dist/first");
    EXPECT_EQ(report.owners.at("/lib/foo.so").name, "libfoo.so");

    EXPECT_TRUE(graphs[0].binaries.contains("libfoo.so"));
    EXPECT_TRUE(graphs[0].dependencies.empty());

    EXPECT_FALSE(graphs[1].binaries.contains("lib/libfoo.so"));
    EXPECT_TRUE(graphs[1].binaries.contains("libonly.so"));
    ASSERT_EQ(graphs[1].dependencies.size(), 1u);
    const auto& ref = graphs[1].dependencies[0];
    EXPECT_EQ(ref.name, "../dist/first:libfoo.so");
    EXPECT_EQ(ref.path, "/lib/foo.so");
    EXPECT_EQ(ref.kind, toc::TocKind::Dependency);
}

TEST_F(MergeTest, DatasShareOwnershipWithBinaries) {
    std::vector<BuildGraph> graphs = {
        graph("one", "one", "/proj/one.py"),
        graph("two", "two", "/proj/two.py"),
        graph("three", "three", "/proj/three.py"),
    };
    graphs[0].datas.append("share/icon.png", "/assets/icon.png", toc::TocKind::Data);
    graphs[2].datas.append("icon.png", "/assets/icon.png", toc::TocKind::Data);

    auto merged = merge_graphs(graphs);
    ASSERT_TRUE(is_ok(merged));
    EXPECT_TRUE(graphs[1].dependencies.empty());
    ASSERT_EQ(graphs[2].dependencies.size(), 1u);
    EXPECT_EQ(graphs[2].dependencies[0].name, "one:share/icon.png");
    EXPECT_TRUE(graphs[2].datas.empty());
}

TEST_F(MergeTest, ScriptsInSubdirectoriesMapThroughIds) {
    std::vector<BuildGraph> graphs = {
        graph("cli/tool", "out/tool", "/src/cli/tool.py"),
        graph("gui/viewer", "out/viewer", "/src/gui/viewer.py"),
    };
    graphs[0].binaries.append("libz.so", "/usr/lib/libz.so", toc::TocKind::Binary);
    graphs[1].binaries.append("libz.so", "/usr/lib/libz.so", toc::TocKind::Binary);

    auto merged = merge_graphs(graphs);
    ASSERT_TRUE(is_ok(merged));
    EXPECT_EQ(unwrap(merged).common_prefix, "/src/");
    EXPECT_EQ(graphs[1].dependencies[0].name, "../out/tool:libz.so");
}

TEST_F(MergeTest, SpellingsOfOneSourceShareAnOwner) {
    std::vector<BuildGraph> graphs = {
        graph("first", "first", "/proj/first.py"),
        graph("second", "second", "/proj/second.py"),
    };
    graphs[0].binaries.append("libfoo.so", "/lib/x/../foo.so", toc::TocKind::Binary);
    graphs[1].binaries.append("libfoo.so", "/lib//foo.so", toc::TocKind::Binary);

    auto merged = merge_graphs(graphs);
    ASSERT_TRUE(is_ok(merged));
    EXPECT_EQ(unwrap(merged).references, 1u);
    EXPECT_EQ(unwrap(merged).owners.count("/lib/foo.so"), 1u);
    EXPECT_TRUE(graphs[1].binaries.empty());
    ASSERT_EQ(graphs[1].dependencies.size(), 1u);
    EXPECT_EQ(graphs[1].dependencies[0].name, "first:libfoo.so");
}

TEST_F(MergeTest, GraphWithoutScriptIsRejected) {
    std::vector<BuildGraph> graphs = {graph("app", "app", "/proj/app.py"), BuildGraph{}};
    graphs[1].id = "empty";

    auto merged = merge_graphs(graphs);
    ASSERT_TRUE(is_err(merged));
    EXPECT_EQ(unwrap_err(merged).kind, BuildErrorKind::InvalidInput);
    EXPECT_NE(unwrap_err(merged).message.find("empty"), std::string::npos);
}

TEST_F(MergeTest, NoGraphsIsANoOp) {
    std::vector<BuildGraph> graphs;
    auto merged = merge_graphs(graphs);
    ASSERT_TRUE(is_ok(merged));
    EXPECT_EQ(unwrap(merged).references, 0u);
}
