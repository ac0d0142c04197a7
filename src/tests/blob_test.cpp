#include <gtest/gtest.h>
#include <stdexcept>
#include <utility>
#include "blob/blob.hpp"
#include "test_utils.hpp"

using namespace hold::blob;

TEST(BlobTest, FromBytesKeepsKeySizeAndContent) {
  Blob blob = Blob::from_string("a/b.txt", "hello");

  EXPECT_EQ(blob.key(), "a/b.txt");
  EXPECT_EQ(blob.size(), 5u);
  EXPECT_FALSE(blob.consumed());
  EXPECT_EQ(as_string(std::move(blob).read_all()), "hello");
}

TEST(BlobTest, AccessorsAreRepeatable) {
  Blob blob = Blob::from_string("key", "data");

  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(blob.key(), "key");
    EXPECT_EQ(blob.size(), 4u);
  }
}

TEST(BlobTest, EmptyBlobCarriesSizeWithoutContent) {
  Blob blob = Blob::empty("stored", 1024);

  EXPECT_EQ(blob.key(), "stored");
  EXPECT_EQ(blob.size(), 1024u);
  EXPECT_TRUE(std::move(blob).read_all().empty());
}

TEST(BlobTest, DeclaredSizeIsNotCheckedAtConstruction) {
  Blob blob("key", 100, ByteStream::from_string("abc"));

  EXPECT_EQ(blob.size(), 100u);
  EXPECT_EQ(as_string(std::move(blob).read_all()), "abc");
}

TEST(BlobTest, NullContentIsTreatedAsEmpty) {
  Blob blob("key", 0, nullptr);

  EXPECT_FALSE(blob.consumed());
  EXPECT_TRUE(std::move(blob).read_all().empty());
}

TEST(BlobTest, ContentCanBeTakenOnlyOnce) {
  Blob blob = Blob::from_string("key", "payload");

  ByteStreamPtr stream = std::move(blob).into_byte_stream();
  ASSERT_TRUE(stream != nullptr);
  EXPECT_TRUE(blob.consumed());
  EXPECT_EQ(blob.key(), "key");

  EXPECT_THROW(std::move(blob).into_byte_stream(), std::logic_error);
  EXPECT_EQ(as_string(read_all(*stream)), "payload");
}

TEST(BlobTest, MoveTransfersEverything) {
  Blob source = Blob::from_string("moved", "content");
  Blob target = std::move(source);

  EXPECT_EQ(target.key(), "moved");
  EXPECT_EQ(target.size(), 7u);
  EXPECT_EQ(as_string(std::move(target).read_all()), "content");
}
