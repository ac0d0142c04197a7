#include "provider/async_provider.hpp"
#include <stdexcept>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace hold {
namespace provider {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AsyncProvider::AsyncProvider(std::shared_ptr<Provider> provider, std::size_t threads)
  : provider_(std::move(provider))
  , pool_(threads == 0 ? DEFAULT_THREADS : threads) {
  if (!provider_) {
    throw std::invalid_argument("AsyncProvider: provider must not be null");
  }
  BOOST_LOG_TRIVIAL(info) << "AsyncProvider: Running " << provider_->name() << " on "
                          << (threads == 0 ? DEFAULT_THREADS : threads) << " worker threads";
}

AsyncProvider::~AsyncProvider() {
  pool_.join();
  BOOST_LOG_TRIVIAL(debug) << "AsyncProvider: Worker pool joined";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

template <typename Result, typename Task>
std::future<Result> AsyncProvider::submit(Task&& task) {
  // packaged_task is move-only, the shared_ptr keeps the posted handler copyable
  auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<Task>(task));
  std::future<Result> result = packaged->get_future();
  boost::asio::post(pool_, [packaged]() { (*packaged)(); });
  return result;
}

std::future<std::optional<blob::Blob>> AsyncProvider::get_blob(std::string key) {
  std::shared_ptr<Provider> provider = provider_;
  return submit<std::optional<blob::Blob>>([provider, key = std::move(key)]() {
    return provider->get_blob(key);
  });
}

std::future<blob::Blob> AsyncProvider::store_blob(blob::Blob blob) {
  std::shared_ptr<Provider> provider = provider_;
  return submit<blob::Blob>([provider, blob = std::move(blob)]() mutable {
    return provider->store_blob(std::move(blob));
  });
}

std::future<bool> AsyncProvider::is_blob_present(std::string key) {
  std::shared_ptr<Provider> provider = provider_;
  return submit<bool>([provider, key = std::move(key)]() {
    return provider->is_blob_present(key);
  });
}

std::future<void> AsyncProvider::delete_blob(std::string key) {
  std::shared_ptr<Provider> provider = provider_;
  return submit<void>([provider, key = std::move(key)]() {
    provider->delete_blob(key);
  });
}

} // namespace provider
} // namespace hold
