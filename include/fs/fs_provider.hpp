#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include "provider/provider.hpp"

namespace hold {
namespace fs {

// Provider storing each blob as a file under a base directory, using a
// content-addressed layout derived from the SHA-256 of the key:
// {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
// Any key, including ones with "/" or "..", maps inside base_path.
class FilesystemProvider : public provider::Provider {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates base_path if it does not exist yet
  explicit FilesystemProvider(const std::string& base_path);


  // ---- QUERY OPERATIONS ----
  std::string name() const override;
  const std::filesystem::path& base_path() const { return base_path_; }
  // Location of the file backing the given key
  std::filesystem::path resolve_key_path(const std::string& key) const;


  // ---- MAINTENANCE ----
  // Removes all stored blobs and resets the store
  void clear();

protected:
  // ---- BACKEND OPERATIONS ----
  std::optional<blob::Blob> do_get_blob(const std::string& key) override;
  // Writes to a temporary sibling first, so readers never see a partial file
  blob::Blob do_store_blob(blob::Blob blob) override;
  bool do_is_blob_present(const std::string& key) override;
  void do_delete_blob(const std::string& key) override;

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  // Creates a directory structure using parts of the hash
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  // Unique temporary path next to the target file
  std::filesystem::path make_temp_path(const std::filesystem::path& file_path) const;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

// Failures of the filesystem backend that do not come with an error code
class FilesystemError : public std::runtime_error {
public:
  explicit FilesystemError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace fs
} // namespace hold
