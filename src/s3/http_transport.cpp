#include "s3/http_transport.hpp"

namespace hold {
namespace s3 {

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(name);
  return it == headers.end() ? std::string() : it->second;
}

} // namespace s3
} // namespace hold
