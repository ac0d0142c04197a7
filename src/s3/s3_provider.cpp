#include "s3/s3_provider.hpp"
#include <chrono>
#include <exception>
#include <ios>
#include <sstream>
#include <utility>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/system/system_error.hpp>
#include "s3/beast_transport.hpp"

namespace hold {
namespace s3 {

namespace {

// Error documents are small, anything beyond this is not worth reading
constexpr std::size_t MAX_ERROR_BODY = 64 * 1024;

bool is_success(unsigned status) {
  return status >= 200 && status < 300;
}

std::string describe_service_error(unsigned status, const std::string& code,
                                   const std::string& message, const std::string& request_id) {
  std::ostringstream oss;
  oss << "S3 responded with status " << status;
  if (!code.empty()) {
    oss << " (" << code << ")";
  }
  if (!message.empty()) {
    oss << ": " << message;
  }
  if (!request_id.empty()) {
    oss << " [request id " << request_id << "]";
  }
  return oss.str();
}

} // namespace

//==============================================
// SERVICE ERROR
//==============================================

S3ServiceError::S3ServiceError(unsigned status, std::string code, std::string message,
                               std::string request_id)
  : std::runtime_error(describe_service_error(status, code, message, request_id))
  , status_(status)
  , code_(std::move(code))
  , message_(std::move(message))
  , request_id_(std::move(request_id)) {}


//==============================================
// RESPONSE CLASSIFICATION
//==============================================

Outcome classify_get(unsigned status, const std::string& code) {
  if (is_success(status)) {
    return Outcome::SUCCESS;
  }
  if (status == 404 && code == NO_SUCH_KEY) {
    return Outcome::ABSENT;
  }
  return Outcome::FAILURE;
}

Outcome classify_put(unsigned status, const std::string& /*code*/) {
  return is_success(status) ? Outcome::SUCCESS : Outcome::FAILURE;
}

Outcome classify_head(unsigned status, const std::string& code) {
  if (is_success(status)) {
    return Outcome::SUCCESS;
  }
  if (status == 404 || code == NO_SUCH_KEY) {
    return Outcome::ABSENT;
  }
  return Outcome::FAILURE;
}

Outcome classify_delete(unsigned status, const std::string& code) {
  if (is_success(status)) {
    return Outcome::SUCCESS;
  }
  if (status == 404 && code == NO_SUCH_KEY) {
    return Outcome::SUCCESS;
  }
  return Outcome::FAILURE;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

S3Provider::S3Provider(const std::string& bucket) : S3Provider([&bucket] {
    S3Config config;
    config.bucket = bucket;
    return config;
  }()) {}

S3Provider::S3Provider(const S3Config& config) : S3Provider(config, nullptr) {}

S3Provider::S3Provider(const S3Config& config, std::shared_ptr<HttpTransport> transport)
  : config_(resolve_config(config))
  , transport_(std::move(transport)) {
  if (!transport_) {
    transport_ = std::make_shared<BeastTransport>(config_.service_endpoint());
  }
  if (config_.credentials) {
    signer_.emplace(*config_.credentials, config_.region);
  }
  BOOST_LOG_TRIVIAL(info) << "S3Provider: Initialized for bucket " << config_.bucket
                          << " in region " << config_.region;
}

std::string S3Provider::name() const {
  return "S3Provider(" + config_.bucket + ")";
}


//==============================================
// BACKEND OPERATIONS
//==============================================

std::optional<blob::Blob> S3Provider::do_get_blob(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "S3Provider: Fetching blob " << key;

  HttpResponse response = send(make_request("GET", key));

  std::optional<S3ServiceError> failure;
  if (!is_success(response.status)) {
    failure = service_error(response);
  }

  switch (classify_get(response.status, failure ? failure->code() : std::string())) {
    case Outcome::ABSENT:
      BOOST_LOG_TRIVIAL(debug) << "S3Provider: Blob " << key << " not found";
      return std::nullopt;
    case Outcome::FAILURE:
      throw error::ProviderError(std::make_exception_ptr(*failure));
    case Outcome::SUCCESS:
      break;
  }

  if (!response.body) {
    throw error::BodyError("no body found in S3 response");
  }
  // A blob declares its size up front, chunked transfer encoding cannot provide it
  if (!response.content_length) {
    throw error::BodyError("no content length in S3 response");
  }

  const std::uint64_t size = *response.content_length;
  BOOST_LOG_TRIVIAL(debug) << "S3Provider: Streaming " << size << " bytes of blob " << key;
  return blob::Blob(key, size, blob::ByteStream::sized(std::move(response.body), size));
}

blob::Blob S3Provider::do_store_blob(blob::Blob blob) {
  const std::string key = blob.key();
  const std::uint64_t size = blob.size();
  BOOST_LOG_TRIVIAL(debug) << "S3Provider: Storing blob " << key << " of " << size << " bytes";

  HttpRequest request = make_request("PUT", key);
  request.headers["content-type"] = "application/octet-stream";
  // The body is streamed, so it cannot be hashed before the headers go out
  request.headers["x-amz-content-sha256"] = UNSIGNED_PAYLOAD;
  request.content_length = size;
  request.body = blob::ByteStream::sized(std::move(blob).into_byte_stream(), size);

  HttpResponse response = send(std::move(request));

  std::optional<S3ServiceError> failure;
  if (!is_success(response.status)) {
    failure = service_error(response);
  }
  if (classify_put(response.status, failure ? failure->code() : std::string()) != Outcome::SUCCESS) {
    throw error::ProviderError(std::make_exception_ptr(*failure));
  }

  return blob::Blob::empty(key, size);
}

bool S3Provider::do_is_blob_present(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "S3Provider: Checking blob " << key << " presence";

  HttpResponse response = send(make_request("HEAD", key));

  std::optional<S3ServiceError> failure;
  if (!is_success(response.status)) {
    failure = service_error(response);
  }

  switch (classify_head(response.status, failure ? failure->code() : std::string())) {
    case Outcome::ABSENT:
      BOOST_LOG_TRIVIAL(debug) << "S3Provider: Blob " << key << " not found";
      return false;
    case Outcome::FAILURE:
      throw error::ProviderError(std::make_exception_ptr(*failure));
    case Outcome::SUCCESS:
      break;
  }

  BOOST_LOG_TRIVIAL(debug) << "S3Provider: Blob " << key << " found";
  return true;
}

void S3Provider::do_delete_blob(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "S3Provider: Deleting blob " << key;

  HttpResponse response = send(make_request("DELETE", key));

  std::optional<S3ServiceError> failure;
  if (!is_success(response.status)) {
    failure = service_error(response);
  }
  if (classify_delete(response.status, failure ? failure->code() : std::string()) != Outcome::SUCCESS) {
    throw error::ProviderError(std::make_exception_ptr(*failure));
  }
}


//==============================================
// REQUEST HANDLING
//==============================================

HttpRequest S3Provider::make_request(const std::string& method, const std::string& key) const {
  HttpRequest request;
  request.method = method;
  if (config_.path_style) {
    request.target = "/" + uri_encode(config_.bucket) + "/" + uri_encode(key, false);
  } else {
    request.target = "/" + uri_encode(key, false);
  }
  request.headers["host"] = config_.service_endpoint().host_header();
  request.headers["x-amz-content-sha256"] = EMPTY_PAYLOAD_SHA256;
  return request;
}

HttpResponse S3Provider::send(HttpRequest request) const {
  if (signer_) {
    signer_->sign(request, format_amz_date(std::chrono::system_clock::now()));
  }

  const std::string description = request.method + " " + request.target;
  try {
    return transport_->send(std::move(request));
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "S3Provider: Transport failure on " << description << ": " << e.what();
    throw error::ProviderError(std::current_exception());
  } catch (const std::ios_base::failure& e) {
    BOOST_LOG_TRIVIAL(error) << "S3Provider: Payload stream failed during " << description << ": " << e.what();
    throw error::ProviderError(std::current_exception());
  }
}

S3ServiceError S3Provider::service_error(HttpResponse& response) const {
  std::string code = response.header("x-amz-error-code");
  std::string message;
  std::string request_id = response.header("x-amz-request-id");

  std::string body;
  if (response.body) {
    try {
      blob::Chunk chunk;
      while (body.size() < MAX_ERROR_BODY && response.body->next(chunk)) {
        body.append(chunk.begin(), chunk.end());
      }
    } catch (const std::ios_base::failure& e) {
      BOOST_LOG_TRIVIAL(warning) << "S3Provider: Error body of status " << response.status
                                 << " could not be read completely: " << e.what();
    }
  }

  if (!body.empty()) {
    try {
      boost::property_tree::ptree tree;
      std::istringstream input(body);
      boost::property_tree::read_xml(input, tree);
      code = tree.get<std::string>("Error.Code", code);
      message = tree.get<std::string>("Error.Message", "");
      request_id = tree.get<std::string>("Error.RequestId", request_id);
    } catch (const boost::property_tree::ptree_error& e) {
      BOOST_LOG_TRIVIAL(debug) << "S3Provider: Error body is not an S3 error document: " << e.what();
      message = body;
    }
  }

  return S3ServiceError(response.status, code, message, request_id);
}

} // namespace s3
} // namespace hold
