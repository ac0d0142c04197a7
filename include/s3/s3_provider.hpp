#ifndef HOLD_S3_PROVIDER_HPP
#define HOLD_S3_PROVIDER_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "provider/provider.hpp"
#include "s3/http_transport.hpp"
#include "s3/s3_config.hpp"
#include "s3/signer.hpp"

namespace hold {
namespace s3 {

// Non-2xx answer of the storage service, chained as the cause of taxonomy errors
class S3ServiceError : public std::runtime_error {
public:
  S3ServiceError(unsigned status, std::string code, std::string message, std::string request_id);

  unsigned status() const { return status_; }
  // S3 error code such as "NoSuchKey", empty when the response carried none
  const std::string& code() const { return code_; }
  const std::string& service_message() const { return message_; }
  const std::string& request_id() const { return request_id_; }

private:
  unsigned status_;
  std::string code_;
  std::string message_;
  std::string request_id_;
};

// ---- RESPONSE CLASSIFICATION ----
// One table per operation; S3 signals absence differently depending on the call.
enum class Outcome {
  SUCCESS,
  ABSENT,
  FAILURE
};

// GET:    2xx success, 404 + NoSuchKey absent
Outcome classify_get(unsigned status, const std::string& code);
// PUT:    2xx success
Outcome classify_put(unsigned status, const std::string& code);
// HEAD:   2xx success, any 404 or NoSuchKey absent (HEAD answers carry no error body)
Outcome classify_head(unsigned status, const std::string& code);
// DELETE: 2xx success, 404 + NoSuchKey counts as success
Outcome classify_delete(unsigned status, const std::string& code);

constexpr const char* NO_SUCH_KEY = "NoSuchKey";


// Provider for S3-compatible object storage services
class S3Provider : public provider::Provider {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Everything except the bucket resolved from the environment
  explicit S3Provider(const std::string& bucket);
  explicit S3Provider(const S3Config& config);
  // Uses the given transport instead of connecting with Boost.Beast
  S3Provider(const S3Config& config, std::shared_ptr<HttpTransport> transport);


  // ---- GETTERS ----
  std::string name() const override;
  const ResolvedS3Config& config() const { return config_; }

protected:
  // ---- BACKEND OPERATIONS ----
  std::optional<blob::Blob> do_get_blob(const std::string& key) override;
  // Returns an empty blob with the stored key and size
  blob::Blob do_store_blob(blob::Blob blob) override;
  bool do_is_blob_present(const std::string& key) override;
  void do_delete_blob(const std::string& key) override;

private:
  // ---- PARAMETERS ----
  ResolvedS3Config config_;
  std::shared_ptr<HttpTransport> transport_;
  // Unset for anonymous access
  std::optional<SigV4Signer> signer_;


  // ---- REQUEST HANDLING ----
  // Request addressing the object stored under key
  HttpRequest make_request(const std::string& method, const std::string& key) const;
  // Signs and sends; transport and payload failures become ProviderError
  HttpResponse send(HttpRequest request) const;
  // Builds the service error from a non-2xx response, reading its XML body
  S3ServiceError service_error(HttpResponse& response) const;
};

} // namespace s3
} // namespace hold

#endif // HOLD_S3_PROVIDER_HPP
