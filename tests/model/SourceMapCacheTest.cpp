#include "model/SourceMapCache.h"
#include "common/TestUtils.h"
#include <gtest/gtest.h>

using namespace TEB;

class SourceMapCacheTest : public ::testing::Test {
protected:
    TEB::Test::Utils::TempDir dir;
    SourceMapCache cache;
};

TEST_F(SourceMapCacheTest, NonScriptFilesMapToThemselves) {
    EXPECT_EQ(cache.resolve("/ws/tests/a.spec.ts"), (std::vector<std::string>{"/ws/tests/a.spec.ts"}));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(SourceMapCacheTest, ResolvesSourcesRelativeToMap) {
    const std::string compiled = dir.write("dist/a.js", "x();\n//# sourceMappingURL=maps/a.js.map\n");
    dir.write("dist/maps/a.js.map", R"({"version":3,"sources":["../../src/a.ts","../../src/shared.ts"]})");

    auto sources = cache.resolve(compiled);

    EXPECT_EQ(sources, (std::vector<std::string>{dir.file("src/a.ts"), dir.file("src/shared.ts")}));
    EXPECT_EQ(cache.fileForSource(dir.file("src/a.ts")), compiled);
    ASSERT_TRUE(cache.cachedSources(compiled).has_value());
}

TEST_F(SourceMapCacheTest, MissingOrBrokenMapFallsBackToFile) {
    const std::string plain = dir.write("plain.js", "x();\n");
    const std::string broken = dir.write("broken.js", "x();\n//# sourceMappingURL=broken.js.map");
    dir.write("broken.js.map", "{ nope");

    EXPECT_EQ(cache.resolve(plain), (std::vector<std::string>{plain}));
    EXPECT_EQ(cache.resolve(broken), (std::vector<std::string>{broken}));
    EXPECT_EQ(cache.resolve(dir.file("absent.js")), (std::vector<std::string>{dir.file("absent.js")}));
}

TEST_F(SourceMapCacheTest, CachesUntilInvalidated) {
    const std::string compiled = dir.write("a.js", "//# sourceMappingURL=a.js.map\n");
    dir.write("a.js.map", R"({"sources":["a.ts"]})");
    ASSERT_EQ(cache.resolve(compiled), (std::vector<std::string>{dir.file("a.ts")}));

    dir.write("a.js.map", R"({"sources":["b.ts"]})");
    EXPECT_EQ(cache.resolve(compiled), (std::vector<std::string>{dir.file("a.ts")}));

    cache.invalidate(compiled);
    EXPECT_FALSE(cache.cachedSources(compiled).has_value());
    EXPECT_EQ(cache.resolve(compiled), (std::vector<std::string>{dir.file("b.ts")}));
}

TEST_F(SourceMapCacheTest, InvalidatingSourceForgetsCompiledFile) {
    const std::string compiled = dir.write("a.js", "//# sourceMappingURL=a.js.map\n");
    dir.write("a.js.map", R"({"sources":["a.ts"]})");
    cache.resolve(compiled);

    cache.invalidate(dir.file("a.ts"));

    EXPECT_FALSE(cache.cachedSources(compiled).has_value());
    EXPECT_FALSE(cache.fileForSource(dir.file("a.ts")).has_value());
}
