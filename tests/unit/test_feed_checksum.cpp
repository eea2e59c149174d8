#include "parse/FeedChecksum.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <string>

using feedlib::common::ChecksumFormatError;
using feedlib::parse::FeedChecksum;

TEST(FeedChecksumTest, UpdateReportsNewAndChanged) {
  FeedChecksum fc;
  EXPECT_TRUE(fc.update("story-1", "content A"));
  EXPECT_FALSE(fc.update("story-1", "content A"));
  EXPECT_TRUE(fc.update("story-1", "content B"));
  EXPECT_TRUE(fc.update("story-2", "content B"));
  EXPECT_EQ(fc.size(), 2u);
}

TEST(FeedChecksumTest, CopyIsIndependent) {
  FeedChecksum fc;
  fc.update("story-1", "A");

  FeedChecksum fcCopy = fc.copy();
  EXPECT_TRUE(fcCopy.update("story-2", "B"));
  EXPECT_EQ(fc.size(), 1u);
  EXPECT_EQ(fcCopy.size(), 2u);

  // The source checksum still sees story-2 as new.
  EXPECT_TRUE(fc.update("story-2", "B"));
}

TEST(FeedChecksumTest, DumpLoadPreservesState) {
  FeedChecksum fc;
  fc.update("a", "1");
  fc.update("b", "2");

  const std::string sData = fc.dump();
  EXPECT_EQ(sData.size(), 1u + 2u * 16u);

  FeedChecksum fcLoaded = FeedChecksum::load(sData);
  EXPECT_EQ(fcLoaded.size(), 2u);
  EXPECT_FALSE(fcLoaded.update("a", "1"));
  EXPECT_TRUE(fcLoaded.update("b", "changed"));
}

TEST(FeedChecksumTest, DumpKeepsMostRecentEntries) {
  FeedChecksum fc;
  fc.update("old", "1");
  fc.update("mid", "2");
  fc.update("new", "3");
  fc.update("old", "1");  // refreshes "old"

  FeedChecksum fcLoaded = FeedChecksum::load(fc.dump(2));
  EXPECT_EQ(fcLoaded.size(), 2u);
  EXPECT_FALSE(fcLoaded.update("old", "1"));
  EXPECT_FALSE(fcLoaded.update("new", "3"));
  EXPECT_TRUE(fcLoaded.update("mid", "2"));
}

TEST(FeedChecksumTest, EmptyChecksumRoundTrips) {
  FeedChecksum fcLoaded = FeedChecksum::load(FeedChecksum().dump());
  EXPECT_EQ(fcLoaded.size(), 0u);
}

TEST(FeedChecksumTest, LoadRejectsMalformedData) {
  EXPECT_THROW(FeedChecksum::load(""), ChecksumFormatError);
  EXPECT_THROW(FeedChecksum::load(std::string("\x02", 1)), ChecksumFormatError);
  EXPECT_THROW(FeedChecksum::load(std::string("\x01") + std::string(15, 'x')),
               ChecksumFormatError);
}

TEST(FeedChecksumTest, LongIdentsDoNotGrowDump) {
  FeedChecksum fc;
  fc.update(std::string(5000, 'i'), "content");
  EXPECT_EQ(fc.dump().size(), 17u);
}
