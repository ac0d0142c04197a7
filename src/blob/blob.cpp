#include "blob/blob.hpp"
#include <stdexcept>
#include <utility>

namespace hold {
namespace blob {

Blob::Blob(std::string key, std::uint64_t size, ByteStreamPtr content)
  : key_(std::move(key))
  , size_(size)
  , content_(content ? std::move(content) : ByteStream::empty()) {}

Blob Blob::from_bytes(std::string key, Chunk bytes) {
  std::uint64_t size = bytes.size();
  return Blob(std::move(key), size, ByteStream::from_bytes(std::move(bytes)));
}

Blob Blob::from_string(std::string key, const std::string& data) {
  return Blob(std::move(key), data.size(), ByteStream::from_string(data));
}

Blob Blob::empty(std::string key, std::uint64_t size) {
  return Blob(std::move(key), size, ByteStream::empty());
}

ByteStreamPtr Blob::into_byte_stream() && {
  if (!content_) {
    throw std::logic_error("Blob: content of '" + key_ + "' was already consumed");
  }
  return std::move(content_);
}

Chunk Blob::read_all() && {
  ByteStreamPtr stream = std::move(*this).into_byte_stream();
  return blob::read_all(*stream);
}

} // namespace blob
} // namespace hold
