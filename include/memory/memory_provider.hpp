#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "provider/provider.hpp"

namespace hold {
namespace memory {

// Provider keeping every blob in process memory. Stores echo the payload back.
class MemoryProvider : public provider::Provider {
public:
  MemoryProvider() = default;

  std::string name() const override { return "MemoryProvider"; }

  // Number of blobs currently held
  std::size_t size() const;

protected:
  std::optional<blob::Blob> do_get_blob(const std::string& key) override;
  blob::Blob do_store_blob(blob::Blob blob) override;
  bool do_is_blob_present(const std::string& key) override;
  void do_delete_blob(const std::string& key) override;

private:
  using Buffer = std::shared_ptr<const blob::Chunk>;

  mutable std::mutex mutex_;
  std::map<std::string, Buffer> blobs_;
};

} // namespace memory
} // namespace hold
