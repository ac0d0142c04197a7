#include "s3/s3_config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace hold {
namespace s3 {

namespace {

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::string default_port(const std::string& scheme) {
  return scheme == "https" ? "443" : "80";
}

} // namespace

//==============================================
// ENDPOINT
//==============================================

std::string Endpoint::host_header() const {
  if (port.empty() || port == default_port(scheme)) {
    return host;
  }
  return host + ":" + port;
}

Endpoint Endpoint::parse(const std::string& url) {
  Endpoint endpoint;
  std::string rest = url;

  std::size_t scheme_end = rest.find("://");
  if (scheme_end == std::string::npos) {
    endpoint.scheme = "https";
  } else {
    endpoint.scheme = rest.substr(0, scheme_end);
    rest = rest.substr(scheme_end + 3);
  }
  if (endpoint.scheme != "http" && endpoint.scheme != "https") {
    throw std::invalid_argument("Unsupported endpoint scheme in: " + url);
  }

  // Only a trailing "/" may follow the authority
  std::size_t path_start = rest.find('/');
  if (path_start != std::string::npos) {
    if (path_start + 1 != rest.size()) {
      throw std::invalid_argument("Endpoint must not contain a path: " + url);
    }
    rest = rest.substr(0, path_start);
  }

  std::size_t port_start = std::string::npos;
  if (!rest.empty() && rest.front() == '[') {
    // IPv6 literal, keep the brackets in the host
    std::size_t bracket_end = rest.find(']');
    if (bracket_end == std::string::npos) {
      throw std::invalid_argument("Malformed IPv6 endpoint: " + url);
    }
    if (bracket_end + 1 < rest.size()) {
      if (rest[bracket_end + 1] != ':') {
        throw std::invalid_argument("Malformed endpoint: " + url);
      }
      port_start = bracket_end + 1;
    }
  } else {
    port_start = rest.find(':');
  }

  if (port_start == std::string::npos) {
    endpoint.host = rest;
    endpoint.port = default_port(endpoint.scheme);
  } else {
    endpoint.host = rest.substr(0, port_start);
    endpoint.port = rest.substr(port_start + 1);
    if (endpoint.port.empty() ||
        endpoint.port.find_first_not_of("0123456789") != std::string::npos) {
      throw std::invalid_argument("Invalid endpoint port in: " + url);
    }
  }

  if (endpoint.host.empty()) {
    throw std::invalid_argument("Endpoint has no host: " + url);
  }
  return endpoint;
}


//==============================================
// CONFIGURATION RESOLUTION
//==============================================

Endpoint ResolvedS3Config::service_endpoint() const {
  if (path_style) {
    return endpoint;
  }
  Endpoint virtual_host = endpoint;
  virtual_host.host = bucket + "." + endpoint.host;
  return virtual_host;
}

ResolvedS3Config resolve_config(const S3Config& config) {
  if (config.bucket.empty()) {
    throw std::invalid_argument("S3 bucket name must not be empty");
  }

  ResolvedS3Config resolved;
  resolved.bucket = config.bucket;

  if (config.region) {
    resolved.region = *config.region;
  } else if (auto region = get_env("AWS_REGION")) {
    resolved.region = *region;
  } else if (auto default_region = get_env("AWS_DEFAULT_REGION")) {
    resolved.region = *default_region;
  } else {
    resolved.region = DEFAULT_REGION;
  }

  std::optional<std::string> custom_endpoint = config.endpoint;
  if (!custom_endpoint) {
    custom_endpoint = get_env("AWS_ENDPOINT_URL");
  }
  if (custom_endpoint) {
    resolved.endpoint = Endpoint::parse(*custom_endpoint);
  } else {
    resolved.endpoint = Endpoint::parse("https://s3." + resolved.region + ".amazonaws.com");
  }
  resolved.path_style = config.path_style.value_or(custom_endpoint.has_value());

  if (config.credentials) {
    resolved.credentials = config.credentials;
  } else {
    auto access_key_id = get_env("AWS_ACCESS_KEY_ID");
    auto secret_access_key = get_env("AWS_SECRET_ACCESS_KEY");
    if (access_key_id && secret_access_key) {
      resolved.credentials = S3Credentials{*access_key_id, *secret_access_key,
                                           get_env("AWS_SESSION_TOKEN")};
    } else {
      BOOST_LOG_TRIVIAL(warning) << "S3Config: No credentials configured, requests will be anonymous";
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "S3Config: Bucket " << resolved.bucket << " in region " << resolved.region
                           << " via " << resolved.endpoint.scheme << "://" << resolved.endpoint.host_header()
                           << (resolved.path_style ? " (path-style)" : " (virtual-hosted)");
  return resolved;
}

} // namespace s3
} // namespace hold
