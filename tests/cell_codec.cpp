#include <gtest/gtest.h>

#include <array>
#include <sstream>
#include <string>

#include "vmarray/cell_codec.hpp"

TEST(IntCodec, LittleEndian)
{
  IntCodec codec;
  std::array<std::byte, 4> slot = {};
  codec.encode(0x01020304, slot);
  EXPECT_EQ(std::byte{0x04}, slot[0]);
  EXPECT_EQ(std::byte{0x03}, slot[1]);
  EXPECT_EQ(std::byte{0x02}, slot[2]);
  EXPECT_EQ(std::byte{0x01}, slot[3]);
  EXPECT_EQ(0x01020304, codec.decode(slot));
}

TEST(IntCodec, Negative)
{
  IntCodec codec;
  std::array<std::byte, 4> slot = {};
  codec.encode(-2, slot);
  EXPECT_EQ(std::byte{0xFE}, slot[0]);
  EXPECT_EQ(std::byte{0xFF}, slot[3]);
  EXPECT_EQ(-2, codec.decode(slot));
}

TEST(IntCodec, Layout)
{
  IntCodec codec;
  EXPECT_EQ(4u, codec.width());
  EXPECT_EQ(512u, codec.regionSize());
  EXPECT_EQ(0, codec.defaultValue());
  EXPECT_EQ(ElementSpec::integer(), codec.spec());
}

/* the data region is 128 cells rounded up to a multiple of 512 bytes */
TEST(FixedTextCodec, RegionSize)
{
  EXPECT_EQ(512u, FixedTextCodec(1).regionSize());
  EXPECT_EQ(512u, FixedTextCodec(4).regionSize());
  EXPECT_EQ(1024u, FixedTextCodec(5).regionSize());
  EXPECT_EQ(1024u, FixedTextCodec(8).regionSize());
  EXPECT_EQ(1536u, FixedTextCodec(10).regionSize());
}

TEST(FixedTextCodec, ZeroLength)
{
  EXPECT_THROW(FixedTextCodec(0), std::invalid_argument);
}

TEST(FixedTextCodec, PadsWithZeros)
{
  FixedTextCodec codec(6);
  std::array<std::byte, 6> slot;
  slot.fill(std::byte{0xAA});
  codec.encode("abc", slot);
  EXPECT_EQ(std::byte{'a'}, slot[0]);
  EXPECT_EQ(std::byte{'c'}, slot[2]);
  EXPECT_EQ(std::byte{0}, slot[3]);
  EXPECT_EQ(std::byte{0}, slot[5]);
  EXPECT_EQ("abc", codec.decode(slot));
}

TEST(FixedTextCodec, FullWidth)
{
  FixedTextCodec codec(3);
  std::array<std::byte, 3> slot = {};
  codec.encode("xyz", slot);
  EXPECT_EQ("xyz", codec.decode(slot));
}

/* values longer than the cell are cut, not rejected */
TEST(FixedTextCodec, Truncates)
{
  FixedTextCodec codec(4);
  EXPECT_EQ("abcd", codec.fit("abcdefgh"));
  EXPECT_EQ("ab", codec.fit("ab"));

  std::array<std::byte, 4> slot = {};
  codec.encode("abcdefgh", slot);
  EXPECT_EQ("abcd", codec.decode(slot));
}

TEST(FixedTextCodec, FitDropsTrailingZeros)
{
  using namespace std::string_literals;
  FixedTextCodec codec(4);
  EXPECT_EQ("ab", codec.fit("ab\0"s));
  EXPECT_EQ("a\0b"s, codec.fit("a\0b\0\0x"s));
  EXPECT_EQ("", codec.fit("\0\0"s));

  std::array<std::byte, 4> slot = {};
  codec.encode("ab\0"s, slot);
  EXPECT_EQ(codec.fit("ab\0"s), codec.decode(slot));
}

TEST(FixedTextCodec, EmptyIsDefault)
{
  FixedTextCodec codec(4);
  std::array<std::byte, 4> slot = {};
  EXPECT_EQ(codec.defaultValue(), codec.decode(slot));
  EXPECT_EQ("", codec.defaultValue());
}

TEST(ElementSpec, Print)
{
  std::ostringstream ss;
  ss << ElementSpec::integer() << " " << ElementSpec::fixedText(10) << " " << ElementSpec::varText(3);
  EXPECT_EQ("int char(10) varchar(3)", ss.str());
}
