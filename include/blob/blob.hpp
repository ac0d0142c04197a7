#ifndef HOLD_BLOB_BLOB_HPP
#define HOLD_BLOB_BLOB_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "blob/byte_stream.hpp"

namespace hold {
namespace blob {

// A keyed, sized payload that can be stored onto a provider.
// The content is a single-pass stream: extracting it spends the blob.
class Blob {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // The declared size is not checked against the stream here
  Blob(std::string key, std::uint64_t size, ByteStreamPtr content);

  Blob(Blob&&) noexcept = default;
  Blob& operator=(Blob&&) noexcept = default;
  Blob(const Blob&) = delete;
  Blob& operator=(const Blob&) = delete;


  // ---- BLOB CONSTRUCTION METHODS ----
  static Blob from_bytes(std::string key, Chunk bytes);
  static Blob from_string(std::string key, const std::string& data);
  // Placeholder carrying only key and size, used when a payload is not echoed back
  static Blob empty(std::string key, std::uint64_t size);


  // ---- GETTERS ----
  const std::string& key() const { return key_; }
  std::uint64_t size() const { return size_; }
  bool consumed() const { return content_ == nullptr; }


  // ---- CONTENT EXTRACTION ----
  // Hands the content stream over to the caller.
  // Throws std::logic_error if the content was already taken
  ByteStreamPtr into_byte_stream() &&;
  // Reads the whole content into memory
  Chunk read_all() &&;

private:
  // ---- PARAMETERS ----
  // Generic unique identifier, roughly a file path
  std::string key_;
  // Declared total size in bytes
  std::uint64_t size_;
  ByteStreamPtr content_;
};

} // namespace blob
} // namespace hold

#endif // HOLD_BLOB_BLOB_HPP
