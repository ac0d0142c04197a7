#include "s3/beast_transport.hpp"
#include <algorithm>
#include <cctype>
#include <ios>
#include <limits>
#include <memory>
#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace hold {
namespace s3 {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

void check(const beast::error_code& ec, const char* what) {
  if (ec) {
    throw boost::system::system_error(ec, what);
  }
}

// The resolver wants IPv6 literals without their brackets
std::string resolvable_host(const std::string& host) {
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    return host.substr(1, host.size() - 2);
  }
  return host;
}

ssl::context make_client_context() {
  ssl::context context(ssl::context::tls_client);
  context.set_default_verify_paths();
  context.set_verify_mode(ssl::verify_peer);
  return context;
}

// ---- CONNECTIONS ----
// Each connection owns its io_context, socket, read buffer and response parser,
// so a response body can keep reading after send() returned.

struct PlainConnection {
  asio::io_context io_context;
  beast::tcp_stream stream{io_context};
  beast::flat_buffer buffer;
  http::response_parser<http::buffer_body> parser;

  void connect(const Endpoint& endpoint) {
    tcp::resolver resolver(io_context);
    stream.connect(resolver.resolve(resolvable_host(endpoint.host), endpoint.port));
  }
};

struct TlsConnection {
  asio::io_context io_context;
  ssl::context ssl_context{make_client_context()};
  beast::ssl_stream<beast::tcp_stream> stream{io_context, ssl_context};
  beast::flat_buffer buffer;
  http::response_parser<http::buffer_body> parser;

  void connect(const Endpoint& endpoint) {
    // SNI, required by most virtual-hosted services
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
      throw boost::system::system_error(
        beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
        "TLS server name");
    }
    stream.set_verify_callback(ssl::host_name_verification(endpoint.host));

    tcp::resolver resolver(io_context);
    beast::get_lowest_layer(stream).connect(resolver.resolve(resolvable_host(endpoint.host), endpoint.port));
    stream.handshake(ssl::stream_base::client);
  }
};

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// ---- OUTGOING REQUEST ----

template <typename Stream>
void write_request(Stream& stream, HttpRequest& request) {
  http::request<http::buffer_body> message;
  message.method_string(request.method);
  message.target(request.target);
  message.version(11);
  for (const auto& [name, value] : request.headers) {
    message.set(name, value);
  }
  if (request.content_length) {
    message.content_length(*request.content_length);
  }
  message.body().data = nullptr;
  message.body().size = 0;
  message.body().more = static_cast<bool>(request.body);

  http::request_serializer<http::buffer_body> serializer{message};
  beast::error_code ec;
  http::write_header(stream, serializer, ec);
  check(ec, "HTTP write header");

  if (request.body) {
    blob::Chunk chunk;
    while (request.body->next(chunk)) {
      message.body().data = chunk.data();
      message.body().size = chunk.size();
      message.body().more = true;
      http::write(stream, serializer, ec);
      // need_buffer only means the serializer consumed the whole chunk
      if (ec == http::error::need_buffer) {
        ec = {};
      }
      check(ec, "HTTP write body");
    }
    message.body().data = nullptr;
    message.body().size = 0;
    message.body().more = false;
  }

  if (!serializer.is_done()) {
    http::write(stream, serializer, ec);
    check(ec, "HTTP write");
  }
}

// ---- INCOMING RESPONSE ----

template <typename Connection>
bool read_body_chunk(Connection& connection, blob::Chunk& chunk) {
  auto& parser = connection.parser;
  if (parser.is_done()) {
    return false;
  }

  chunk.resize(blob::ByteStream::DEFAULT_CHUNK_SIZE);
  parser.get().body().data = chunk.data();
  parser.get().body().size = chunk.size();

  beast::error_code ec;
  http::read(connection.stream, connection.buffer, parser, ec);
  if (ec == http::error::need_buffer) {
    ec = {};
  }
  if (ec) {
    throw std::ios_base::failure("HTTP body read failed: " + ec.message());
  }

  chunk.resize(chunk.size() - parser.get().body().size);
  return true;
}

template <typename Connection>
HttpResponse exchange(std::shared_ptr<Connection> connection, const Endpoint& endpoint,
                      HttpRequest request) {
  connection->connect(endpoint);
  write_request(connection->stream, request);

  const bool head = request.method == "HEAD";
  auto& parser = connection->parser;
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
  // HEAD responses announce a Content-Length without sending a body
  parser.skip(head);

  beast::error_code ec;
  http::read_header(connection->stream, connection->buffer, parser, ec);
  check(ec, "HTTP read header");

  HttpResponse response;
  const auto& message = parser.get();
  response.status = message.result_int();
  for (const auto& field : message) {
    auto name = field.name_string();
    auto value = field.value();
    response.headers[to_lower(std::string(name.data(), name.size()))] = std::string(value.data(), value.size());
  }
  if (auto length = parser.content_length()) {
    response.content_length = *length;
  }

  if (!head) {
    response.body = blob::ByteStream::create([connection](blob::Chunk& chunk) {
      return read_body_chunk(*connection, chunk);
    });
  }
  return response;
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BeastTransport::BeastTransport(Endpoint endpoint) : endpoint_(std::move(endpoint)) {
  BOOST_LOG_TRIVIAL(debug) << "BeastTransport: Using " << endpoint_.scheme << "://"
                           << endpoint_.host << ":" << endpoint_.port;
}


//==============================================
// HTTP EXCHANGE
//==============================================

HttpResponse BeastTransport::send(HttpRequest request) {
  BOOST_LOG_TRIVIAL(trace) << "BeastTransport: " << request.method << " " << request.target;

  HttpResponse response;
  if (endpoint_.tls()) {
    response = exchange(std::make_shared<TlsConnection>(), endpoint_, std::move(request));
  } else {
    response = exchange(std::make_shared<PlainConnection>(), endpoint_, std::move(request));
  }

  BOOST_LOG_TRIVIAL(trace) << "BeastTransport: Response status " << response.status;
  return response;
}

} // namespace s3
} // namespace hold
