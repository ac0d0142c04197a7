#ifndef HOLD_S3_BEAST_TRANSPORT_HPP
#define HOLD_S3_BEAST_TRANSPORT_HPP

#include "s3/http_transport.hpp"
#include "s3/s3_config.hpp"

namespace hold {
namespace s3 {

// HTTP/1.1 transport over Boost.Beast, plain TCP or TLS depending on the
// endpoint scheme. Every exchange opens its own connection, which lives as
// long as the response body stream.
class BeastTransport : public HttpTransport {
public:
  explicit BeastTransport(Endpoint endpoint);

  HttpResponse send(HttpRequest request) override;

  const Endpoint& endpoint() const { return endpoint_; }

private:
  Endpoint endpoint_;
};

} // namespace s3
} // namespace hold

#endif // HOLD_S3_BEAST_TRANSPORT_HPP
