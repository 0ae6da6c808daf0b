#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "syncpoint/common/path_normalizer.h"

using namespace syncpoint;

TEST(PathNormalizerTest, EmptyPathIsRoot) {
    EXPECT_EQ(ToCanonical(""), "/");
    EXPECT_EQ(ToCanonical("/"), "/");
}

TEST(PathNormalizerTest, CanonicalPathsRoundTrip) {
    const std::vector<std::string> paths = {
        "/",
        "/docs",
        "/docs/readme.txt",
        "/a/b/c/d.bin",
        "/with space/and-dash_underscore.txt",
        "/caf\xC3\xA9/r\xC3\xA9sum\xC3\xA9.pdf",  // precomposed e-acute
    };
    for (const auto& p : paths) {
        EXPECT_EQ(ToCanonical(ToNative(p)), p) << p;
    }
}

TEST(PathNormalizerTest, CanonicalAlwaysHasOneLeadingSeparator) {
    EXPECT_EQ(ToCanonical("docs/readme.txt")[0], '/');
    EXPECT_EQ(ToCanonical("docs/readme.txt").find("//"), std::string::npos);
}

#if !defined(_WIN32) && !defined(__APPLE__)
TEST(PathNormalizerTest, PosixIsIdentityPlusLeadingSeparator) {
    EXPECT_EQ(ToCanonical("docs/a.txt"), "/docs/a.txt");
    EXPECT_EQ(ToNative("/docs/a.txt"), "/docs/a.txt");
    EXPECT_FALSE(PlatformStoresDecomposedUnicode());
}

TEST(PathNormalizerTest, RelativeToRootStripsRoot) {
    EXPECT_EQ(RelativeToRoot("/srv/data", "/srv/data/docs/a.txt"), "/docs/a.txt");
    EXPECT_EQ(RelativeToRoot("/srv/data/", "/srv/data/docs"), "/docs");
    EXPECT_EQ(RelativeToRoot("/srv/data", "/srv/data"), "/");
}

TEST(PathNormalizerTest, RelativeToRootLeavesForeignPathsAlone) {
    EXPECT_EQ(RelativeToRoot("/srv/data", "/srv/other/a.txt"), "/srv/other/a.txt");
}
#endif

#ifdef __APPLE__
TEST(PathNormalizerTest, DecomposedNamesBecomeComposed) {
    const std::string decomposed = "/cafe\xCC\x81";  // e + combining acute
    const std::string composed = "/caf\xC3\xA9";
    EXPECT_TRUE(PlatformStoresDecomposedUnicode());
    EXPECT_EQ(ToCanonical(decomposed), composed);
    EXPECT_EQ(ToNative(composed), decomposed);
}
#endif
