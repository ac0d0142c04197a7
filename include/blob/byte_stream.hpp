#ifndef HOLD_BLOB_BYTE_STREAM_HPP
#define HOLD_BLOB_BYTE_STREAM_HPP

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace hold {
namespace blob {

using Chunk = std::vector<uint8_t>;

class ByteStream;
using ByteStreamPtr = std::unique_ptr<ByteStream>;

// Fills the chunk with the next bytes and returns true, or returns false once
// the source is exhausted. Read failures are thrown as std::ios_base::failure
using ProducerFn = std::function<bool(Chunk&)>;

// Single-pass, lazily produced sequence of byte chunks. Not restartable.
class ByteStream {
public:
  static constexpr std::size_t DEFAULT_CHUNK_SIZE = 8192;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  virtual ~ByteStream() = default;

  ByteStream(const ByteStream&) = delete;
  ByteStream& operator=(const ByteStream&) = delete;


  // ---- STREAM CONSTRUCTION METHODS ----
  // Stream that is exhausted on the first read
  static ByteStreamPtr empty();
  // Single-chunk stream over an in-memory buffer
  static ByteStreamPtr from_bytes(Chunk bytes);
  static ByteStreamPtr from_string(const std::string& data);
  // Reads the given istream in chunks of chunk_size; the stream is owned
  static ByteStreamPtr from_istream(std::unique_ptr<std::istream> input,
                                    std::size_t chunk_size = DEFAULT_CHUNK_SIZE);
  // Wraps an arbitrary producer, e.g. a backend response body reader
  static ByteStreamPtr create(ProducerFn producer);
  // Fails with std::ios_base::failure if source yields more or fewer bytes than size
  static ByteStreamPtr sized(ByteStreamPtr source, std::uint64_t size);


  // ---- STREAM CONSUMPTION ----
  // Yields the next non-empty chunk. Returns false once exhausted, and for
  // every call after a failure
  bool next(Chunk& chunk);


  // ---- GETTERS ----
  bool exhausted() const { return exhausted_; }
  std::uint64_t bytes_read() const { return bytes_read_; }

protected:
  ByteStream() = default;

  // Produces the next chunk from the underlying source
  virtual bool produce(Chunk& chunk) = 0;

private:
  bool exhausted_ = false;
  std::uint64_t bytes_read_ = 0;
};

// Drives the stream to completion and returns every byte it produced
Chunk read_all(ByteStream& stream);

// Drives the stream to completion into output, returns the number of bytes written
std::uint64_t copy_to(ByteStream& stream, std::ostream& output);

} // namespace blob
} // namespace hold

#endif // HOLD_BLOB_BYTE_STREAM_HPP
