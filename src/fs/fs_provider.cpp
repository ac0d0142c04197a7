#include "fs/fs_provider.hpp"
#include <atomic>
#include <fstream>
#include <functional>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace hold {
namespace fs {

namespace stdfs = std::filesystem;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize provider with base directory path and ensure it exists
FilesystemProvider::FilesystemProvider(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "FilesystemProvider: Initializing with base path: " << base_path;
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "FilesystemProvider: Directory created/verified at: " << base_path;
}


//==============================================
// BACKEND OPERATIONS
//==============================================

std::optional<blob::Blob> FilesystemProvider::do_get_blob(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "FilesystemProvider: Fetching blob " << key;

  stdfs::path file_path = resolve_key_path(key);

  std::error_code ec;
  stdfs::file_status status = stdfs::status(file_path, ec);
  if (status.type() == stdfs::file_type::not_found) {
    BOOST_LOG_TRIVIAL(debug) << "FilesystemProvider: Blob " << key << " not found";
    return std::nullopt;
  }
  if (ec) {
    throw error::ProviderError(std::make_exception_ptr(
      stdfs::filesystem_error("Failed to inspect blob", file_path, ec)));
  }
  if (!stdfs::is_regular_file(status)) {
    throw error::ProviderError(std::make_exception_ptr(
      FilesystemError("Not a blob file: " + file_path.string())));
  }

  // Open file in binary mode to handle all content correctly
  auto file = std::make_unique<std::ifstream>(file_path, std::ios::binary);
  if (!*file) {
    // The blob may have been deleted since the status lookup
    bool exists = stdfs::exists(file_path, ec);
    if (!ec && !exists) {
      BOOST_LOG_TRIVIAL(debug) << "FilesystemProvider: Blob " << key << " not found";
      return std::nullopt;
    }
    throw error::ProviderError(std::make_exception_ptr(
      FilesystemError("Failed to open file: " + file_path.string())));
  }

  // Size of the opened file, a concurrent rename cannot pair it with other content
  file->seekg(0, std::ios::end);
  const std::streamoff end = file->tellg();
  file->seekg(0, std::ios::beg);
  if (!*file || end < 0) {
    throw error::ProviderError(std::make_exception_ptr(
      FilesystemError("Failed to read blob size: " + file_path.string())));
  }
  const std::uint64_t size = static_cast<std::uint64_t>(end);

  BOOST_LOG_TRIVIAL(debug) << "FilesystemProvider: Streaming " << size << " bytes for key: " << key;
  return blob::Blob(key, size,
                    blob::ByteStream::sized(blob::ByteStream::from_istream(std::move(file)), size));
}

blob::Blob FilesystemProvider::do_store_blob(blob::Blob blob) {
  const std::string key = blob.key();
  const std::uint64_t size = blob.size();
  BOOST_LOG_TRIVIAL(info) << "FilesystemProvider: Storing blob " << key << " of " << size << " bytes";

  stdfs::path file_path = resolve_key_path(key);
  stdfs::path temp_path = make_temp_path(file_path);

  try {
    check_directory_exists(file_path.parent_path());

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw FilesystemError("Failed to create file: " + temp_path.string());
    }

    blob::ByteStreamPtr content = blob::ByteStream::sized(std::move(blob).into_byte_stream(), size);
    std::uint64_t bytes_written = blob::copy_to(*content, file);

    file.close();
    if (!file) {
      throw FilesystemError("Failed to flush file: " + temp_path.string());
    }

    // rename replaces an existing blob atomically
    stdfs::rename(temp_path, file_path);
    BOOST_LOG_TRIVIAL(info) << "FilesystemProvider: Successfully stored " << bytes_written
                            << " bytes with key: " << key;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "FilesystemProvider: Failed to store blob " << key << ": " << e.what();

    std::error_code cleanup_ec;
    stdfs::remove(temp_path, cleanup_ec);
    if (cleanup_ec) {
      BOOST_LOG_TRIVIAL(warning) << "FilesystemProvider: Could not remove temporary file "
                                 << temp_path.string() << ": " << cleanup_ec.message();
    }
    throw error::ProviderError(std::current_exception());
  }

  return blob::Blob::empty(key, size);
}

bool FilesystemProvider::do_is_blob_present(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "FilesystemProvider: Checking existence of key: " << key;

  stdfs::path file_path = resolve_key_path(key);

  // A missing file is reported as false without an error code
  std::error_code ec;
  bool exists = stdfs::exists(file_path, ec);
  if (ec) {
    throw error::ProviderError(std::make_exception_ptr(
      stdfs::filesystem_error("Failed to check blob presence", file_path, ec)));
  }

  BOOST_LOG_TRIVIAL(debug) << "FilesystemProvider: Key " << key << (exists ? " exists" : " not found")
                           << " at path: " << file_path.string();
  return exists;
}

void FilesystemProvider::do_delete_blob(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "FilesystemProvider: Removing blob with key: " << key;

  stdfs::path file_path = resolve_key_path(key);

  // remove() returns false without an error code when the file is already gone
  std::error_code ec;
  bool removed = stdfs::remove(file_path, ec);
  if (ec) {
    throw error::ProviderError(std::make_exception_ptr(
      stdfs::filesystem_error("Failed to remove blob", file_path, ec)));
  }

  if (removed) {
    BOOST_LOG_TRIVIAL(info) << "FilesystemProvider: Successfully removed blob with key: " << key;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "FilesystemProvider: Blob " << key << " was already absent";
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::string FilesystemProvider::name() const {
  return "FilesystemProvider(" + base_path_.string() + ")";
}

stdfs::path FilesystemProvider::resolve_key_path(const std::string& key) const {
  try {
    return get_path_for_hash(hash_key(key));
  } catch (const FilesystemError& e) {
    BOOST_LOG_TRIVIAL(error) << "FilesystemProvider: " << e.what();
    throw error::ProviderError(std::current_exception());
  }
}


//==============================================
// MAINTENANCE
//==============================================

void FilesystemProvider::clear() {
  BOOST_LOG_TRIVIAL(info) << "FilesystemProvider: Clearing entire store at: " << base_path_;
  try {
    stdfs::remove_all(base_path_);
    check_directory_exists(base_path_);
  } catch (const stdfs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FilesystemProvider: Failed to clear store: " << e.what();
    throw error::ProviderError(std::current_exception());
  }
  BOOST_LOG_TRIVIAL(info) << "FilesystemProvider: Store cleared successfully";
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string FilesystemProvider::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Message digest context, released on every exit path
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw FilesystemError("Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw FilesystemError("Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx.get(), key.data(), key.length())) {
    throw FilesystemError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw FilesystemError("Failed to finalize hash");
  }

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

stdfs::path FilesystemProvider::get_path_for_hash(const std::string& hash) const {
  stdfs::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

stdfs::path FilesystemProvider::make_temp_path(const stdfs::path& file_path) const {
  static std::atomic<std::uint64_t> counter{0};

  std::stringstream suffix;
  suffix << ".tmp." << ::getpid() << "." << std::hex
         << std::hash<std::thread::id>{}(std::this_thread::get_id())
         << "." << counter.fetch_add(1);

  stdfs::path temp_path = file_path;
  temp_path += suffix.str();
  return temp_path;
}


//==============================================
// UTILITY METHODS
//==============================================

void FilesystemProvider::check_directory_exists(const stdfs::path& path) const {
  if (!stdfs::exists(path)) {
    stdfs::create_directories(path);
  }
}

} // namespace fs
} // namespace hold
