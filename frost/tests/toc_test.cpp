//! # Manifest Tests
//!
//! First-wins deduplication, ordered set operations and the JSON form.

#include "json/json_parser.hpp"
#include "test_support.hpp"
#include "toc/toc.hpp"

#include <gtest/gtest.h>

using namespace frost;
using namespace frost::toc;

class TocTest : public ::testing::Test {
protected:
    static TocEntry data(const std::string& name, const std::string& path) {
        return TocEntry{name, path, TocKind::Data};
    }
};

TEST_F(TocTest, FirstOccurrenceWins) {
    test_support::LogCapture capture;
    Toc toc;
    EXPECT_TRUE(toc.append(data("a", "/x/a")));
    EXPECT_FALSE(toc.append(data("a", "/y/a")));

    ASSERT_EQ(toc.size(), 1u);
    EXPECT_EQ(toc[0].path, "/x/a");
    EXPECT_TRUE(capture.contains(log::LogLevel::Warn, "toc", "Duplicate name a"));
}

TEST_F(TocTest, IdenticalDuplicateIsSilent) {
    test_support::LogCapture capture;
    Toc toc;
    toc.append(data("a", "/x/a"));
    toc.append(data("a", "/x/a"));

    EXPECT_EQ(toc.size(), 1u);
    EXPECT_EQ(capture.warnings(), 0u);
}

TEST_F(TocTest, ExtendKeepsOrder) {
    Toc toc({data("c", "/c"), data("a", "/a")});
    Toc more({data("b", "/b"), data("a", "/other")});
    toc.extend(more);

    ASSERT_EQ(toc.size(), 3u);
    EXPECT_EQ(toc[0].name, "c");
    EXPECT_EQ(toc[1].name, "a");
    EXPECT_EQ(toc[2].name, "b");
    EXPECT_EQ(toc.find("a")->path, "/a");
}

TEST_F(TocTest, DifferenceComparesFullEntries) {
    Toc left({data("a", "/a"), data("b", "/b"), data("c", "/c")});
    Toc right({data("b", "/b"), data("c", "/changed")});

    Toc diff = left.difference(right);
    ASSERT_EQ(diff.size(), 2u);
    EXPECT_EQ(diff[0].name, "a");
    EXPECT_EQ(diff[1].name, "c");
    EXPECT_EQ(diff[1].path, "/c");
}

TEST_F(TocTest, UnionAddsOnlyNewNames) {
    Toc left({data("a", "/a")});
    Toc right({data("a", "/elsewhere"), data("b", "/b")});

    Toc merged = left.union_with(right);
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged.find("a")->path, "/a");
    EXPECT_TRUE(merged.contains("b"));
}

TEST_F(TocTest, RemoveAllowsReinsertion) {
    Toc toc({data("a", "/a")});
    EXPECT_TRUE(toc.remove("a"));
    EXPECT_FALSE(toc.remove("a"));
    EXPECT_TRUE(toc.append(data("a", "/new")));
    EXPECT_EQ(toc.find("a")->path, "/new");
}

TEST_F(TocTest, SameMembersIgnoresOrder) {
    Toc one({data("a", "/a"), data("b", "/b")});
    Toc two({data("b", "/b"), data("a", "/a")});
    Toc three({data("b", "/b"), data("a", "/moved")});

    EXPECT_TRUE(one.same_members(two));
    EXPECT_FALSE(one == two);
    EXPECT_FALSE(one.same_members(three));
}

TEST_F(TocTest, JsonFormRoundTrips) {
    Toc toc;
    toc.append("app", "/src/app.py", TocKind::Source);
    toc.append("v", "", TocKind::Option);

    std::string text = toc.to_json().to_string();
    auto parsed = json::parse_json(text);
    ASSERT_TRUE(is_ok(parsed));
    auto back = Toc::from_json(unwrap(parsed));
    ASSERT_TRUE(is_ok(back));
    EXPECT_EQ(unwrap(back), toc);
}

TEST_F(TocTest, FromJsonRejectsUnknownKind) {
    auto parsed = json::parse_json(R"([["a", "/a", "BLOB"]])");
    ASSERT_TRUE(is_ok(parsed));
    auto toc = Toc::from_json(unwrap(parsed));
    ASSERT_TRUE(is_err(toc));
    EXPECT_NE(unwrap_err(toc).find("BLOB"), std::string::npos);
}

TEST_F(TocTest, FromJsonNeedsPathExceptForOptions) {
    auto missing = json::parse_json(R"([["a", null, "DATA"]])");
    ASSERT_TRUE(is_ok(missing));
    EXPECT_TRUE(is_err(Toc::from_json(unwrap(missing))));

    auto option = json::parse_json(R"([["u", null, "OPTION"]])");
    ASSERT_TRUE(is_ok(option));
    EXPECT_TRUE(is_ok(Toc::from_json(unwrap(option))));
}

TEST_F(TocTest, KindNamesAndTypeCodes) {
    EXPECT_EQ(parse_kind("PYMODULE"), TocKind::Module);
    EXPECT_EQ(parse_kind("EXTENSION"), TocKind::Extension);
    EXPECT_FALSE(parse_kind("module").has_value());

    EXPECT_EQ(type_code(TocKind::Module), 'm');
    EXPECT_EQ(type_code(TocKind::Source), 's');
    EXPECT_EQ(type_code(TocKind::Pyz), 'z');
    EXPECT_EQ(type_code(TocKind::Binary), 'b');
    EXPECT_EQ(type_code(TocKind::Extension), 'b');
    EXPECT_EQ(type_code(TocKind::Option), 'o');
    EXPECT_EQ(type_code(TocKind::Dependency), 'd');
}

TEST_F(TocTest, ExtensionNamesGetPlatformSuffix) {
    Toc toc;
    toc.append("pkg.fast", "/build/fast.so", TocKind::Extension);
    toc.append("done.so", "/build/done.so", TocKind::Extension);
    toc.append("data.txt", "/data.txt", TocKind::Data);

    Toc named = add_suffix_to_extensions(toc, ".so");
    EXPECT_EQ(named[0].name, "pkg/fast.so");
    EXPECT_EQ(named[1].name, "done.so");
    EXPECT_EQ(named[2].name, "data.txt");
}
