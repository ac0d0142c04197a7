#ifndef HOLD_S3_SIGNER_HPP
#define HOLD_S3_SIGNER_HPP

#include <chrono>
#include <string>
#include <vector>
#include "s3/http_transport.hpp"
#include "s3/s3_config.hpp"

namespace hold {
namespace s3 {

// Payload hash announced for streamed uploads whose body is not hashed up front
constexpr const char* UNSIGNED_PAYLOAD = "UNSIGNED-PAYLOAD";
// SHA-256 of the empty string
constexpr const char* EMPTY_PAYLOAD_SHA256 =
  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

// AWS Signature Version 4 over the request headers
class SigV4Signer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SigV4Signer(S3Credentials credentials, std::string region, std::string service = "s3");


  // ---- SIGNING ----
  // Adds x-amz-date, x-amz-security-token (with a session token) and the
  // Authorization header. amz_date is formatted as YYYYMMDD'T'HHMMSS'Z'.
  // Every header already present in the request is signed
  void sign(HttpRequest& request, const std::string& amz_date) const;

  // Canonical request as defined by SigV4, for the headers currently in request
  std::string canonical_request(const HttpRequest& request) const;
  // Semicolon separated list of the signed header names
  std::string signed_headers(const HttpRequest& request) const;

private:
  // ---- PARAMETERS ----
  S3Credentials credentials_;
  std::string region_;
  std::string service_;

  // Derives the signing key for the given YYYYMMDD date
  std::vector<unsigned char> signing_key(const std::string& date_stamp) const;
};


// ---- HASHING AND ENCODING HELPERS ----
std::string sha256_hex(const std::string& data);
std::vector<unsigned char> hmac_sha256(const std::vector<unsigned char>& key, const std::string& data);
std::string to_hex(const std::vector<unsigned char>& bytes);
// RFC 3986 percent-encoding with upper-case hex digits, "/" kept when encode_slash is false
std::string uri_encode(const std::string& value, bool encode_slash = true);
// YYYYMMDD'T'HHMMSS'Z' in UTC
std::string format_amz_date(std::chrono::system_clock::time_point time);

} // namespace s3
} // namespace hold

#endif // HOLD_S3_SIGNER_HPP
