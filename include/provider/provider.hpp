#ifndef HOLD_PROVIDER_PROVIDER_HPP
#define HOLD_PROVIDER_PROVIDER_HPP

#include <optional>
#include <string>
#include "blob/blob.hpp"
#include "error/error.hpp"

namespace hold {
namespace provider {

// Abstract storage provider.
//
// Every operation reports failures as hold::error::Error subclasses only.
// Absence is not a failure: get_blob returns std::nullopt, is_blob_present
// returns false and delete_blob of a missing key succeeds.
// Implementations must be safe to call from several threads at once.
class Provider {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  virtual ~Provider() = default;

  Provider(const Provider&) = delete;
  Provider& operator=(const Provider&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Fetches a blob given its key, std::nullopt if the backend has no such key
  std::optional<blob::Blob> get_blob(const std::string& key);
  // Stores the blob, consuming its content. The returned blob either echoes
  // the payload or is empty with the stored key and size, depending on the adapter
  blob::Blob store_blob(blob::Blob blob);
  // Checks if the blob exists. Some adapters may have to load the content
  // when the backend has no headless lookup
  bool is_blob_present(const std::string& key);
  // Removes the blob, succeeding when it is already gone
  void delete_blob(const std::string& key);


  // ---- GETTERS ----
  // Short description of the backend, used in logs
  virtual std::string name() const = 0;

protected:
  Provider() = default;

  // ---- BACKEND OPERATIONS ----
  // Called with a validated key; must classify every backend outcome
  virtual std::optional<blob::Blob> do_get_blob(const std::string& key) = 0;
  virtual blob::Blob do_store_blob(blob::Blob blob) = 0;
  virtual bool do_is_blob_present(const std::string& key) = 0;
  virtual void do_delete_blob(const std::string& key) = 0;
};

// Throws ProviderError wrapping std::invalid_argument for an empty key
void check_key(const std::string& key);

} // namespace provider
} // namespace hold

#endif // HOLD_PROVIDER_PROVIDER_HPP
