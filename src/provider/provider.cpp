#include "provider/provider.hpp"
#include <exception>
#include <stdexcept>
#include <utility>
#include <boost/log/trivial.hpp>

namespace hold {
namespace provider {

namespace {

// Runs a backend operation and wraps anything it failed to classify
template <typename Operation>
auto classified(const std::string& provider_name, const char* operation, const std::string& key,
                Operation&& op) -> decltype(op()) {
  try {
    return op();
  } catch (const error::Error& e) {
    BOOST_LOG_TRIVIAL(error) << provider_name << ": " << operation << " failed for key "
                             << key << ": " << e.what();
    throw;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << provider_name << ": Unclassified failure in " << operation
                             << " for key " << key << ": " << e.what();
    throw error::ProviderError(std::current_exception());
  }
}

} // namespace

void check_key(const std::string& key) {
  if (key.empty()) {
    throw error::ProviderError(
      std::make_exception_ptr(std::invalid_argument("blob key must not be empty")));
  }
}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::optional<blob::Blob> Provider::get_blob(const std::string& key) {
  check_key(key);
  return classified(name(), "get", key, [&] { return do_get_blob(key); });
}

blob::Blob Provider::store_blob(blob::Blob blob) {
  check_key(blob.key());
  if (blob.consumed()) {
    throw error::ProviderError(std::make_exception_ptr(
      std::logic_error("content of blob '" + blob.key() + "' was already consumed")));
  }

  const std::string key = blob.key();
  return classified(name(), "store", key, [&] { return do_store_blob(std::move(blob)); });
}

bool Provider::is_blob_present(const std::string& key) {
  check_key(key);
  return classified(name(), "presence check", key, [&] { return do_is_blob_present(key); });
}

void Provider::delete_blob(const std::string& key) {
  check_key(key);
  classified(name(), "delete", key, [&] { do_delete_blob(key); });
}

} // namespace provider
} // namespace hold
