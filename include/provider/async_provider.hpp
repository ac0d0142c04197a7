#ifndef HOLD_PROVIDER_ASYNC_PROVIDER_HPP
#define HOLD_PROVIDER_ASYNC_PROVIDER_HPP

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include "provider/provider.hpp"

namespace hold {
namespace provider {

// Runs provider operations on a worker pool so that backend round trips
// never block the calling thread. Each call is an independent unit of work;
// failures are delivered through the returned future.
class AsyncProvider {
public:
  static constexpr std::size_t DEFAULT_THREADS = 4;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit AsyncProvider(std::shared_ptr<Provider> provider,
                         std::size_t threads = DEFAULT_THREADS);
  // Waits for outstanding operations to finish
  ~AsyncProvider();

  AsyncProvider(const AsyncProvider&) = delete;
  AsyncProvider& operator=(const AsyncProvider&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  std::future<std::optional<blob::Blob>> get_blob(std::string key);
  std::future<blob::Blob> store_blob(blob::Blob blob);
  std::future<bool> is_blob_present(std::string key);
  std::future<void> delete_blob(std::string key);


  // ---- GETTERS ----
  Provider& provider() { return *provider_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<Provider> provider_;
  boost::asio::thread_pool pool_;

  // Posts the task to the pool and returns its future
  template <typename Result, typename Task>
  std::future<Result> submit(Task&& task);
};

} // namespace provider
} // namespace hold

#endif // HOLD_PROVIDER_ASYNC_PROVIDER_HPP
