#ifndef HOLD_S3_CONFIG_HPP
#define HOLD_S3_CONFIG_HPP

#include <optional>
#include <string>

namespace hold {
namespace s3 {

struct S3Credentials {
  std::string access_key_id;
  std::string secret_access_key;
  std::optional<std::string> session_token;
};

// Settings of an S3-compatible provider. Anything left unset is resolved
// from the environment the way AWS tooling does, see resolve_config()
struct S3Config {
  std::string bucket;
  // e.g. "http://127.0.0.1:9000" for a local MinIO
  std::optional<std::string> endpoint;
  std::optional<std::string> region;
  std::optional<S3Credentials> credentials;
  // Addressing style, defaults to path-style for custom endpoints
  std::optional<bool> path_style;
};

// Scheme, host and port of an HTTP(S) service
struct Endpoint {
  std::string scheme;
  std::string host;
  std::string port;

  bool tls() const { return scheme == "https"; }
  // Value of the Host header, the port is omitted when it is the scheme default
  std::string host_header() const;

  // Accepts "scheme://host[:port][/]" or a bare "host[:port]" (https).
  // Throws std::invalid_argument on malformed input
  static Endpoint parse(const std::string& url);
};

struct ResolvedS3Config {
  std::string bucket;
  std::string region;
  // Endpoint of the storage service, before any bucket prefix
  Endpoint endpoint;
  std::optional<S3Credentials> credentials;
  bool path_style = false;

  // Endpoint requests are actually sent to: virtual-hosted style prefixes the bucket
  Endpoint service_endpoint() const;
};

constexpr const char* DEFAULT_REGION = "us-east-1";

// Fills unset fields:
//   region      <- AWS_REGION, AWS_DEFAULT_REGION, then us-east-1
//   endpoint    <- AWS_ENDPOINT_URL, then https://s3.<region>.amazonaws.com
//   credentials <- AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY / AWS_SESSION_TOKEN,
//                  requests stay anonymous when those are not set
// Throws std::invalid_argument for an empty bucket or a malformed endpoint
ResolvedS3Config resolve_config(const S3Config& config);

} // namespace s3
} // namespace hold

#endif // HOLD_S3_CONFIG_HPP
