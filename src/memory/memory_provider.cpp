#include "memory/memory_provider.hpp"
#include <ios>
#include <utility>
#include <boost/log/trivial.hpp>

namespace hold {
namespace memory {

std::size_t MemoryProvider::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blobs_.size();
}

std::optional<blob::Blob> MemoryProvider::do_get_blob(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "MemoryProvider: Fetching blob " << key;

  Buffer buffer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(key);
    if (it == blobs_.end()) {
      BOOST_LOG_TRIVIAL(debug) << "MemoryProvider: Blob " << key << " not found";
      return std::nullopt;
    }
    buffer = it->second;
  }

  // The buffer is immutable, a later store replaces it instead of changing it
  return blob::Blob::from_bytes(key, *buffer);
}

blob::Blob MemoryProvider::do_store_blob(blob::Blob blob) {
  const std::string key = blob.key();
  const std::uint64_t size = blob.size();
  BOOST_LOG_TRIVIAL(debug) << "MemoryProvider: Storing blob " << key << " of " << size << " bytes";

  blob::Chunk bytes;
  try {
    blob::ByteStreamPtr content = blob::ByteStream::sized(std::move(blob).into_byte_stream(), size);
    bytes = blob::read_all(*content);
  } catch (const std::ios_base::failure& e) {
    BOOST_LOG_TRIVIAL(error) << "MemoryProvider: Failed to read payload of " << key << ": " << e.what();
    throw error::ProviderError(std::current_exception());
  }

  auto buffer = std::make_shared<const blob::Chunk>(std::move(bytes));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_[key] = buffer;
  }

  return blob::Blob::from_bytes(key, *buffer);
}

bool MemoryProvider::do_is_blob_present(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "MemoryProvider: Checking blob " << key << " presence";
  std::lock_guard<std::mutex> lock(mutex_);
  return blobs_.count(key) > 0;
}

void MemoryProvider::do_delete_blob(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "MemoryProvider: Deleting blob " << key;
  std::lock_guard<std::mutex> lock(mutex_);
  blobs_.erase(key);
}

} // namespace memory
} // namespace hold
