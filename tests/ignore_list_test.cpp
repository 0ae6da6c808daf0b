#include <gtest/gtest.h>

#include "syncpoint/common/ignore_list.h"

using namespace syncpoint;

TEST(IgnoreListTest, DefaultsCoverMarkerAndEditorFiles) {
    const auto ignore = IgnoreList::WithDefaults();

    EXPECT_TRUE(ignore.IsIgnored("/docs/.__syncpoint"));
    EXPECT_TRUE(ignore.IsIgnored("/docs/.DS_Store"));
    EXPECT_TRUE(ignore.IsIgnored("/Thumbs.db"));
    EXPECT_TRUE(ignore.IsIgnored("/docs/.notes.txt.swp"));
    EXPECT_TRUE(ignore.IsIgnored("/docs/notes.txt~"));
    EXPECT_TRUE(ignore.IsIgnored("/docs/.~lock.report.odt#"));

    EXPECT_FALSE(ignore.IsIgnored("/docs/readme.txt"));
    EXPECT_FALSE(ignore.IsIgnored("/docs"));
    EXPECT_FALSE(ignore.IsIgnored("/"));
}

TEST(IgnoreListTest, MatchesOnlyTheLastComponent) {
    IgnoreList ignore;
    ignore.Add("build");

    EXPECT_TRUE(ignore.IsIgnored("/project/build"));
    EXPECT_TRUE(ignore.IsIgnored("/project/build/"));
    EXPECT_FALSE(ignore.IsIgnored("/project/build/output.o"));
    EXPECT_FALSE(ignore.IsIgnored("/project/builder"));
}

TEST(IgnoreListTest, GlobCharactersAndLiterals) {
    IgnoreList ignore;
    ignore.Add("*.log");
    ignore.Add("cache?");
    ignore.Add("a+b(1).txt");

    EXPECT_TRUE(ignore.IsIgnored("/x/server.log"));
    EXPECT_FALSE(ignore.IsIgnored("/x/server.log.gz"));
    EXPECT_TRUE(ignore.IsIgnored("/cache1"));
    EXPECT_FALSE(ignore.IsIgnored("/cache12"));
    EXPECT_TRUE(ignore.IsIgnored("/a+b(1).txt"));
    EXPECT_FALSE(ignore.IsIgnored("/aab(1).txt"));

    EXPECT_EQ(ignore.Patterns().size(), 3u);
}

TEST(IgnoreListTest, EmptyPatternIsSkipped) {
    IgnoreList ignore;
    ignore.Add("");
    EXPECT_TRUE(ignore.Patterns().empty());
    EXPECT_FALSE(ignore.IsIgnored("/anything"));
}
