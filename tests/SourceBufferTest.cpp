import jvalid.core.source_buffer;
#include <gtest/gtest.h>
#include <string>

using namespace jvalid::core;

TEST(SourceBufferTest, PeekAndConsume) {
    SourceBuffer buffer{std::string("abc")};
    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.peekAhead(0), 'a');
    EXPECT_EQ(buffer.peekAhead(2), 'c');
    EXPECT_FALSE(buffer.atEnd());
    EXPECT_TRUE(buffer.atEnd(3));

    buffer.consume(2);
    EXPECT_EQ(buffer.location().offset, 2u);
    EXPECT_EQ(buffer.remaining(), "c");
    buffer.consume();
    EXPECT_TRUE(buffer.atEnd());
    EXPECT_EQ(buffer.remaining(), "");
}

TEST(SourceBufferTest, PeekPastEndReturnsSentinel) {
    SourceBuffer buffer{std::string("x")};
    EXPECT_EQ(buffer.peekAhead(1), '\0');
    EXPECT_EQ(buffer.peekAhead(100), '\0');
}

TEST(SourceBufferTest, EmbeddedNulIsNotEndOfInput) {
    SourceBuffer buffer{std::string("a\0b", 3)};
    buffer.consume();
    EXPECT_EQ(buffer.peekAhead(0), '\0');
    EXPECT_FALSE(buffer.atEnd());
    EXPECT_EQ(buffer.remaining().size(), 2u);
}

TEST(SourceBufferTest, TracksLineAndColumn) {
    SourceBuffer buffer{std::string("ab\ncd\r\nef\rg")};
    EXPECT_EQ(buffer.location(), (SourcePosition{0, 1, 1}));
    buffer.consume(2);
    EXPECT_EQ(buffer.location(), (SourcePosition{2, 1, 3}));
    buffer.consume();   // LF
    EXPECT_EQ(buffer.location(), (SourcePosition{3, 2, 1}));
    buffer.consume(2);
    buffer.consume();   // CRLFのCR
    EXPECT_EQ(buffer.location(), (SourcePosition{6, 2, 4}));
    buffer.consume();   // CRLFのLF
    EXPECT_EQ(buffer.location(), (SourcePosition{7, 3, 1}));
    buffer.consume(3);  // "ef" と単独のCR
    EXPECT_EQ(buffer.location(), (SourcePosition{10, 4, 1}));
}

TEST(SourceBufferTest, RewindReturnsToStart) {
    SourceBuffer buffer{std::string("line1\nline2")};
    buffer.consume(8);
    buffer.rewind();
    EXPECT_EQ(buffer.location(), (SourcePosition{0, 1, 1}));
    EXPECT_EQ(buffer.peekAhead(0), 'l');
}
