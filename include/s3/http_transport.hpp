#ifndef HOLD_S3_HTTP_TRANSPORT_HPP
#define HOLD_S3_HTTP_TRANSPORT_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "blob/byte_stream.hpp"

namespace hold {
namespace s3 {

struct HttpRequest {
  std::string method;
  // Origin-form target, already percent-encoded
  std::string target;
  // Lower-case header names; all of them are signed
  std::map<std::string, std::string> headers;
  std::optional<std::uint64_t> content_length;
  // Streamed out as the request body when set
  blob::ByteStreamPtr body;
};

struct HttpResponse {
  unsigned status = 0;
  // Lower-case header names
  std::map<std::string, std::string> headers;
  std::optional<std::uint64_t> content_length;
  // Lazily read body; owns the connection until destroyed. Null for HEAD
  blob::ByteStreamPtr body;

  // Header value, empty if the header is missing
  std::string header(const std::string& name) const;
};

// Sends one HTTP exchange. Connection and protocol failures are thrown as
// boost::system::system_error; a failing request body stream propagates its
// std::ios_base::failure. Any status code is a successful exchange.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse send(HttpRequest request) = 0;
};

} // namespace s3
} // namespace hold

#endif // HOLD_S3_HTTP_TRANSPORT_HPP
