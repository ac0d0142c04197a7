#include <gtest/gtest.h>
#include <ios>
#include <memory>
#include <sstream>
#include <stdexcept>
#include "blob/byte_stream.hpp"
#include "test_utils.hpp"

using namespace hold::blob;

class ByteStreamTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  // Collects every chunk so the chunk boundaries can be checked
  static std::vector<std::string> drain_chunks(ByteStream& stream) {
    std::vector<std::string> chunks;
    Chunk chunk;
    while (stream.next(chunk)) {
      chunks.push_back(as_string(chunk));
    }
    return chunks;
  }
};

TEST_F(ByteStreamTest, EmptyStreamEndsImmediately) {
  auto stream = ByteStream::empty();
  Chunk chunk{1, 2, 3};

  EXPECT_FALSE(stream->next(chunk));
  EXPECT_TRUE(chunk.empty());
  EXPECT_TRUE(stream->exhausted());
  EXPECT_EQ(stream->bytes_read(), 0u);
}

TEST_F(ByteStreamTest, BufferIsYieldedOnce) {
  auto stream = ByteStream::from_string("hello");

  auto chunks = drain_chunks(*stream);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "hello");
  EXPECT_EQ(stream->bytes_read(), 5u);

  // Not restartable
  Chunk chunk;
  EXPECT_FALSE(stream->next(chunk));
}

TEST_F(ByteStreamTest, IstreamIsReadInChunks) {
  auto stream = chunked_stream("hello world", 4);

  auto chunks = drain_chunks(*stream);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], "hell");
  EXPECT_EQ(chunks[1], "o wo");
  EXPECT_EQ(chunks[2], "rld");
  EXPECT_EQ(stream->bytes_read(), 11u);
}

TEST_F(ByteStreamTest, BadIstreamFailsAsIoError) {
  auto input = std::make_unique<std::stringstream>("data");
  input->setstate(std::ios::badbit);
  auto stream = ByteStream::from_istream(std::move(input));

  Chunk chunk;
  EXPECT_THROW(stream->next(chunk), std::ios_base::failure);
  EXPECT_TRUE(stream->exhausted());
}

TEST_F(ByteStreamTest, EmptyChunksAreSkipped) {
  int calls = 0;
  auto stream = ByteStream::create([&calls](Chunk& chunk) {
    ++calls;
    if (calls == 4) {
      chunk = {'x', 'y'};
    }
    return calls <= 4;
  });

  auto chunks = drain_chunks(*stream);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "xy");
  EXPECT_EQ(calls, 5);
}

TEST_F(ByteStreamTest, FailureEndsTheStream) {
  auto stream = failing_stream("first");

  Chunk chunk;
  ASSERT_TRUE(stream->next(chunk));
  EXPECT_EQ(as_string(chunk), "first");

  EXPECT_THROW(stream->next(chunk), std::ios_base::failure);
  EXPECT_TRUE(stream->exhausted());

  // No further items after a failure
  EXPECT_FALSE(stream->next(chunk));
}

TEST_F(ByteStreamTest, OtherFailuresAreReportedAsIoErrors) {
  auto stream = ByteStream::create([](Chunk&) -> bool {
    throw std::runtime_error("connection reset");
  });

  Chunk chunk;
  try {
    stream->next(chunk);
    FAIL() << "Expected the read to fail";
  } catch (const std::ios_base::failure& e) {
    EXPECT_NE(std::string(e.what()).find("connection reset"), std::string::npos);
    EXPECT_THROW(std::rethrow_if_nested(e), std::runtime_error);
  }
}

TEST_F(ByteStreamTest, SizedStreamAcceptsExactLength) {
  auto stream = ByteStream::sized(chunked_stream("0123456789", 3), 10);
  EXPECT_EQ(as_string(read_all(*stream)), "0123456789");
}

TEST_F(ByteStreamTest, SizedStreamRejectsShortSource) {
  auto stream = ByteStream::sized(ByteStream::from_string("abc"), 10);
  EXPECT_THROW(read_all(*stream), std::ios_base::failure);
}

TEST_F(ByteStreamTest, SizedStreamRejectsLongSource) {
  auto stream = ByteStream::sized(ByteStream::from_string("abcdef"), 3);
  EXPECT_THROW(read_all(*stream), std::ios_base::failure);
}

TEST_F(ByteStreamTest, DroppingStreamReleasesSource) {
  auto resource = std::make_shared<int>(0);
  std::weak_ptr<int> watch = resource;

  auto stream = ByteStream::create([resource](Chunk& chunk) {
    chunk = {'a'};
    return true;
  });
  resource.reset();

  Chunk chunk;
  ASSERT_TRUE(stream->next(chunk));
  EXPECT_FALSE(watch.expired());

  // Abandoned mid-way
  stream.reset();
  EXPECT_TRUE(watch.expired());
}

TEST_F(ByteStreamTest, CopyToWritesEveryByte) {
  const std::string data = random_payload(100000);
  auto stream = chunked_stream(data, 4096);

  std::ostringstream output;
  EXPECT_EQ(copy_to(*stream, output), data.size());
  EXPECT_EQ(output.str(), data);
}

TEST_F(ByteStreamTest, CopyToFailedOutputThrows) {
  auto stream = ByteStream::from_string("payload");
  std::ostringstream output;
  output.setstate(std::ios::badbit);

  EXPECT_THROW(copy_to(*stream, output), std::ios_base::failure);
}
