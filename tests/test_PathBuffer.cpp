#include <gtest/gtest.h>
#include "core/PathBuffer.h"
#include "core/PathBuilder.h"
#include "core/TreeError.h"

#include <string>
#include <utility>
#include <vector>

using namespace cptree;

TEST(PathBufferTest, TokenSequence) {
    PathBuffer buffer = PathBuilder::fromPaths({{"outer"}, {"outer", "a"}, {"outer", "b"}});

    std::vector<Token> expected = {
        Token{TOKEN_NAME, "outer"},
        Token{TOKEN_NAME, "a"},
        Token{TOKEN_ASCEND, ""},
        Token{TOKEN_NAME, "b"},
    };
    EXPECT_EQ(buffer.tokens(), expected);
    EXPECT_EQ(buffer.tokenCount(), 4u);
    EXPECT_EQ(buffer.itemCount(), 3u);
    EXPECT_EQ(buffer.ascendCount(), 1u);
    EXPECT_FALSE(buffer.empty());
}

TEST(PathBufferTest, CopiesShareStorage) {
    PathBuffer original = PathBuilder::fromPaths({{"x"}, {"x", "y"}});
    PathBuffer copy = original;

    EXPECT_EQ(copy.storage().get(), original.storage().get());
    EXPECT_EQ(copy.encoded(), "x/y");
}

TEST(PathBufferTest, CompactComparedToFullPaths) {
    PathBuilder builder;
    builder.enter("a-rather-long-directory-name");
    for (int i = 0; i < 100; ++i) {
        builder.leaf("f" + std::to_string(i));
    }
    PathBuffer buffer = builder.finish();

    size_t flat = 0;
    for (const auto& components : buffer) {
        for (const auto& c : components) {
            flat += c.size() + 1;
        }
    }
    EXPECT_LT(buffer.encoded().size(), flat / 3);
    EXPECT_GE(buffer.byteSize(), buffer.encoded().size());
}

TEST(PathBufferTest, FromEncodedRoundTrip) {
    PathBuffer built = PathBuilder::fromPaths(
        {{"outer"}, {"outer", "a"}, {"outer", "b"}, {"outer", "b", "c"}, {"outer", "e"}},
        "/data");
    PathBuffer loaded = PathBuffer::fromEncoded(built.encoded(), built.root());

    EXPECT_EQ(loaded.tokens(), built.tokens());
    EXPECT_EQ(loaded.itemCount(), 5u);
    EXPECT_EQ(loaded.root(), "/data");
    EXPECT_TRUE(loaded.isWellFormed());
}

TEST(PathBufferTest, FromEncodedAcceptsTrailingSeparator) {
    PathBuffer a = PathBuffer::fromEncoded("a/b/..");
    PathBuffer b = PathBuffer::fromEncoded("a/b/../");
    EXPECT_EQ(a.tokens(), b.tokens());
    EXPECT_EQ(a.encoded(), "a/b/..");
}

TEST(PathBufferTest, FromEncodedEmpty) {
    PathBuffer buffer = PathBuffer::fromEncoded("");
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.tokenCount(), 0u);
}

TEST(PathBufferTest, FromEncodedRejectsEmptyToken) {
    try {
        PathBuffer::fromEncoded("a//b");
        FAIL() << "expected CorruptBuffer";
    } catch (const TreeError& e) {
        EXPECT_EQ(e.kind(), ERR_CORRUPT_BUFFER);
    }
    EXPECT_THROW(PathBuffer::fromEncoded("/a"), TreeError);
}

TEST(PathBufferTest, WellFormedness) {
    EXPECT_TRUE(PathBuffer().isWellFormed());
    EXPECT_TRUE(PathBuffer::fromEncoded("a/../b/c").isWellFormed());
    EXPECT_FALSE(PathBuffer::fromEncoded("..").isWellFormed());
    EXPECT_FALSE(PathBuffer::fromEncoded("a/../..").isWellFormed());
}

TEST(PathBufferTest, ValidComponents) {
    EXPECT_TRUE(isValidComponent("file.txt"));
    EXPECT_TRUE(isValidComponent("."));
    EXPECT_TRUE(isValidComponent("..."));
    EXPECT_FALSE(isValidComponent(""));
    EXPECT_FALSE(isValidComponent(".."));
    EXPECT_FALSE(isValidComponent("a/b"));
}

TEST(PathBufferTest, MovedFromBufferIsEmpty) {
    PathBuffer src = PathBuilder::fromPaths({{"a"}, {"a", "b"}}, "/srv");
    PathBuffer dst = std::move(src);

    EXPECT_EQ(dst.encoded(), "a/b");
    EXPECT_EQ(dst.itemCount(), 2u);
    EXPECT_EQ(dst.root(), "/srv");

    EXPECT_TRUE(src.empty());
    EXPECT_EQ(src.itemCount(), 0u);
    EXPECT_EQ(src.tokenCount(), 0u);
    EXPECT_EQ(src.encoded(), "");
    EXPECT_TRUE(src.tokens().empty());
    EXPECT_TRUE(src.isWellFormed());
    EXPECT_TRUE(src.root().empty());
    EXPECT_FALSE(src.cursor().advance());
    EXPECT_EQ(src.begin(), src.end());
}

TEST(PathBufferTest, MoveAssignLeavesSourceEmpty) {
    PathBuffer src = PathBuilder::fromPaths({{"x"}});
    PathBuffer dst = PathBuilder::fromPaths({{"old"}, {"old", "tree"}});
    dst = std::move(src);

    EXPECT_EQ(dst.encoded(), "x");
    EXPECT_TRUE(src.empty());
    EXPECT_EQ(src.encoded(), "");

    // The emptied buffer is usable as a destination again.
    src = dst;
    EXPECT_EQ(src.encoded(), "x");
}
