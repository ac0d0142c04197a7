#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstdlib>
#include <ios>
#include <map>
#include <memory>
#include <string>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include "s3/s3_provider.hpp"
#include "test_utils.hpp"

using namespace hold;
using namespace hold::s3;
using hold::blob::Blob;
using hold::blob::ByteStream;
using ::testing::_;

namespace {

class MockTransport : public HttpTransport {
public:
  MOCK_METHOD(HttpResponse, send, (HttpRequest request), (override));
};

HttpResponse make_response(unsigned status, const std::string& body = "",
                           const std::map<std::string, std::string>& headers = {}) {
  HttpResponse response;
  response.status = status;
  response.headers = headers;
  response.content_length = body.size();
  response.body = ByteStream::from_string(body);
  return response;
}

std::string error_document(const std::string& code, const std::string& message) {
  return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
         "<Error><Code>" + code + "</Code><Message>" + message + "</Message>"
         "<RequestId>4442587FB7D0A2F9</RequestId></Error>";
}

// What the transport saw, with the body drained
struct RecordedRequest {
  std::string method;
  std::string target;
  std::map<std::string, std::string> headers;
  std::optional<std::uint64_t> content_length;
  std::string body;
  bool has_body = false;
};

} // namespace

class S3ProviderTest : public ::testing::Test {
protected:
  std::shared_ptr<MockTransport> transport;
  std::unique_ptr<S3Provider> provider;
  RecordedRequest recorded;

  void SetUp() override {
    init_logging();
    transport = std::make_shared<MockTransport>();
    provider = std::make_unique<S3Provider>(make_config(), transport);
  }

  static S3Config make_config() {
    S3Config config;
    config.bucket = "test-bucket";
    config.endpoint = "http://127.0.0.1:9000";
    config.region = "us-east-1";
    config.credentials = S3Credentials{"AKIDEXAMPLE", "secret", std::nullopt};
    return config;
  }

  // Expects exactly one exchange, records it and answers with response
  void expect_exchange(unsigned status, const std::string& body = "",
                       const std::map<std::string, std::string>& headers = {}) {
    EXPECT_CALL(*transport, send(_))
      .WillOnce([this, status, body, headers](HttpRequest request) {
        record(request);
        return make_response(status, body, headers);
      });
  }

  void record(HttpRequest& request) {
    recorded.method = request.method;
    recorded.target = request.target;
    recorded.headers = request.headers;
    recorded.content_length = request.content_length;
    recorded.has_body = request.body != nullptr;
    if (request.body) {
      recorded.body = as_string(blob::read_all(*request.body));
    }
  }

  // Runs op and returns the S3ServiceError chained in the ProviderError it must throw
  template <typename Operation>
  std::optional<S3ServiceError> expect_service_error(Operation op) {
    try {
      op();
    } catch (const error::ProviderError& e) {
      try {
        e.rethrow_cause();
      } catch (const S3ServiceError& cause) {
        return cause;
      } catch (const std::exception& other) {
        ADD_FAILURE() << "Unexpected cause: " << other.what();
      }
      return std::nullopt;
    }
    ADD_FAILURE() << "Expected a ProviderError";
    return std::nullopt;
  }
};

//==============================================
// GET
//==============================================

TEST_F(S3ProviderTest, GetStreamsObject) {
  expect_exchange(200, "hello");

  std::optional<Blob> blob = provider->get_blob("a/b.txt");
  ASSERT_TRUE(blob.has_value());
  EXPECT_EQ(blob->key(), "a/b.txt");
  EXPECT_EQ(blob->size(), 5u);
  EXPECT_EQ(as_string(std::move(*blob).read_all()), "hello");

  EXPECT_EQ(recorded.method, "GET");
  EXPECT_EQ(recorded.target, "/test-bucket/a/b.txt");
  EXPECT_EQ(recorded.headers["host"], "127.0.0.1:9000");
  EXPECT_EQ(recorded.headers["x-amz-content-sha256"], EMPTY_PAYLOAD_SHA256);
  EXPECT_FALSE(recorded.has_body);
}

TEST_F(S3ProviderTest, GetOfMissingKeyIsAbsent) {
  expect_exchange(404, error_document("NoSuchKey", "The specified key does not exist."));
  EXPECT_FALSE(provider->get_blob("missing").has_value());
}

TEST_F(S3ProviderTest, GetOfMissingBucketIsProviderError) {
  expect_exchange(404, error_document("NoSuchBucket", "The specified bucket does not exist"));

  auto cause = expect_service_error([&] { provider->get_blob("key"); });
  ASSERT_TRUE(cause.has_value());
  EXPECT_EQ(cause->status(), 404u);
  EXPECT_EQ(cause->code(), "NoSuchBucket");
  EXPECT_EQ(cause->service_message(), "The specified bucket does not exist");
  EXPECT_EQ(cause->request_id(), "4442587FB7D0A2F9");
}

TEST_F(S3ProviderTest, GetAccessDeniedIsProviderError) {
  expect_exchange(403, error_document("AccessDenied", "Access Denied"));

  auto cause = expect_service_error([&] { provider->get_blob("key"); });
  ASSERT_TRUE(cause.has_value());
  EXPECT_EQ(cause->code(), "AccessDenied");
}

TEST_F(S3ProviderTest, NonXmlErrorBodyIsKeptAsMessage) {
  expect_exchange(502, "Bad Gateway", {{"x-amz-request-id", "REQ1"}});

  auto cause = expect_service_error([&] { provider->get_blob("key"); });
  ASSERT_TRUE(cause.has_value());
  EXPECT_EQ(cause->status(), 502u);
  EXPECT_TRUE(cause->code().empty());
  EXPECT_EQ(cause->service_message(), "Bad Gateway");
  EXPECT_EQ(cause->request_id(), "REQ1");
}

TEST_F(S3ProviderTest, GetWithoutContentLengthIsBodyError) {
  EXPECT_CALL(*transport, send(_)).WillOnce([](HttpRequest) {
    HttpResponse response = make_response(200, "data");
    response.content_length.reset();
    return response;
  });

  try {
    provider->get_blob("key");
    FAIL() << "Expected a BodyError";
  } catch (const error::BodyError& e) {
    EXPECT_EQ(std::string(e.what()), "Error while reading body: no content length in S3 response");
  }
}

TEST_F(S3ProviderTest, GetWithoutBodyIsBodyError) {
  EXPECT_CALL(*transport, send(_)).WillOnce([](HttpRequest) {
    HttpResponse response = make_response(200);
    response.body.reset();
    return response;
  });

  try {
    provider->get_blob("key");
    FAIL() << "Expected a BodyError";
  } catch (const error::BodyError& e) {
    EXPECT_EQ(std::string(e.what()), "Error while reading body: no body found in S3 response");
  }
}

TEST_F(S3ProviderTest, TruncatedBodyFailsWhileReading) {
  EXPECT_CALL(*transport, send(_)).WillOnce([](HttpRequest) {
    HttpResponse response = make_response(200, "abc");
    response.content_length = 10;
    return response;
  });

  std::optional<Blob> blob = provider->get_blob("key");
  ASSERT_TRUE(blob.has_value());
  EXPECT_EQ(blob->size(), 10u);
  EXPECT_THROW(std::move(*blob).read_all(), std::ios_base::failure);
}

TEST_F(S3ProviderTest, TransportFailureIsProviderError) {
  EXPECT_CALL(*transport, send(_)).WillOnce([](HttpRequest) -> HttpResponse {
    throw boost::system::system_error(boost::asio::error::connection_refused);
  });

  try {
    provider->get_blob("key");
    FAIL() << "Expected a ProviderError";
  } catch (const error::ProviderError& e) {
    try {
      e.rethrow_cause();
      FAIL() << "Expected the transport error as cause";
    } catch (const boost::system::system_error& cause) {
      EXPECT_EQ(cause.code(), boost::asio::error::connection_refused);
    }
  }
}

TEST_F(S3ProviderTest, KeysArePercentEncoded) {
  expect_exchange(200, "x");

  provider->get_blob("dir/my file+1.txt");
  EXPECT_EQ(recorded.target, "/test-bucket/dir/my%20file%2B1.txt");
}

//==============================================
// PUT
//==============================================

TEST_F(S3ProviderTest, PutStreamsPayload) {
  expect_exchange(200);

  const std::string data = random_payload(100000);
  Blob stored = provider->store_blob(Blob("a/b.txt", data.size(), chunked_stream(data, 4096)));

  EXPECT_EQ(stored.key(), "a/b.txt");
  EXPECT_EQ(stored.size(), data.size());
  EXPECT_TRUE(std::move(stored).read_all().empty());

  EXPECT_EQ(recorded.method, "PUT");
  EXPECT_EQ(recorded.target, "/test-bucket/a/b.txt");
  ASSERT_TRUE(recorded.content_length.has_value());
  EXPECT_EQ(*recorded.content_length, data.size());
  EXPECT_EQ(recorded.headers["x-amz-content-sha256"], UNSIGNED_PAYLOAD);
  EXPECT_EQ(recorded.headers["content-type"], "application/octet-stream");
  EXPECT_EQ(recorded.body, data);
}

TEST_F(S3ProviderTest, PutRejectedIsProviderError) {
  expect_exchange(403, error_document("AccessDenied", "Access Denied"));

  auto cause = expect_service_error([&] { provider->store_blob(Blob::from_string("key", "data")); });
  ASSERT_TRUE(cause.has_value());
  EXPECT_EQ(cause->status(), 403u);
}

TEST_F(S3ProviderTest, PutWithFailingPayloadIsProviderError) {
  EXPECT_CALL(*transport, send(_)).WillOnce([](HttpRequest request) {
    blob::read_all(*request.body);
    return make_response(200);
  });

  try {
    provider->store_blob(Blob("key", 100, failing_stream("partial")));
    FAIL() << "Expected a ProviderError";
  } catch (const error::ProviderError& e) {
    EXPECT_THROW(e.rethrow_cause(), std::ios_base::failure);
  }
}

//==============================================
// HEAD
//==============================================

TEST_F(S3ProviderTest, HeadReportsPresence) {
  EXPECT_CALL(*transport, send(_))
    .WillOnce([this](HttpRequest request) {
      record(request);
      HttpResponse response = make_response(200);
      response.body.reset();
      return response;
    });

  EXPECT_TRUE(provider->is_blob_present("a/b.txt"));
  EXPECT_EQ(recorded.method, "HEAD");
}

TEST_F(S3ProviderTest, HeadNotFoundWithoutBodyIsAbsent) {
  EXPECT_CALL(*transport, send(_)).WillOnce([](HttpRequest) {
    HttpResponse response = make_response(404);
    response.body.reset();
    return response;
  });

  EXPECT_FALSE(provider->is_blob_present("missing"));
}

TEST_F(S3ProviderTest, HeadForbiddenIsProviderError) {
  EXPECT_CALL(*transport, send(_)).WillOnce([](HttpRequest) {
    HttpResponse response = make_response(403);
    response.body.reset();
    return response;
  });

  auto cause = expect_service_error([&] { provider->is_blob_present("key"); });
  ASSERT_TRUE(cause.has_value());
  EXPECT_EQ(cause->status(), 403u);
}

//==============================================
// DELETE
//==============================================

TEST_F(S3ProviderTest, DeleteSucceedsOnNoContent) {
  expect_exchange(204);

  EXPECT_NO_THROW(provider->delete_blob("a/b.txt"));
  EXPECT_EQ(recorded.method, "DELETE");
  EXPECT_EQ(recorded.target, "/test-bucket/a/b.txt");
}

TEST_F(S3ProviderTest, DeleteOfMissingKeySucceeds) {
  expect_exchange(404, error_document("NoSuchKey", "The specified key does not exist."));
  EXPECT_NO_THROW(provider->delete_blob("missing"));
}

TEST_F(S3ProviderTest, DeleteFailureIsProviderError) {
  expect_exchange(500, error_document("InternalError", "We encountered an internal error."));

  auto cause = expect_service_error([&] { provider->delete_blob("key"); });
  ASSERT_TRUE(cause.has_value());
  EXPECT_EQ(cause->code(), "InternalError");
}

//==============================================
// ADDRESSING AND SIGNING
//==============================================

TEST_F(S3ProviderTest, RequestsAreSigned) {
  expect_exchange(200, "x");

  provider->get_blob("key");
  const std::string& authorization = recorded.headers["authorization"];
  EXPECT_EQ(authorization.rfind("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/", 0), 0u);
  EXPECT_NE(authorization.find("/us-east-1/s3/aws4_request"), std::string::npos);
  EXPECT_EQ(recorded.headers.count("x-amz-date"), 1u);
}

TEST(S3ProviderAddressingTest, VirtualHostedStyle) {
  ::unsetenv("AWS_ENDPOINT_URL");

  auto transport = std::make_shared<MockTransport>();
  S3Config config;
  config.bucket = "my-bucket";
  config.region = "eu-west-1";
  config.credentials = S3Credentials{"AKID", "secret", std::string("session")};
  config.path_style = false;

  S3Provider provider(config, transport);
  EXPECT_FALSE(provider.config().path_style);

  RecordedRequest seen;
  EXPECT_CALL(*transport, send(_)).WillOnce([&seen](HttpRequest request) {
    seen.target = request.target;
    seen.headers = request.headers;
    return make_response(204);
  });

  provider.delete_blob("a/b.txt");
  EXPECT_EQ(seen.target, "/a/b.txt");
  EXPECT_EQ(seen.headers["host"], "my-bucket.s3.eu-west-1.amazonaws.com");
  EXPECT_EQ(seen.headers["x-amz-security-token"], "session");
}

TEST(S3ProviderAddressingTest, AnonymousRequestsAreNotSigned) {
  ::unsetenv("AWS_ACCESS_KEY_ID");
  ::unsetenv("AWS_SECRET_ACCESS_KEY");

  auto transport = std::make_shared<MockTransport>();
  S3Config config;
  config.bucket = "public-bucket";
  config.endpoint = "http://localhost:9000";
  config.region = "us-east-1";

  S3Provider provider(config, transport);
  EXPECT_FALSE(provider.config().credentials.has_value());

  RecordedRequest seen;
  EXPECT_CALL(*transport, send(_)).WillOnce([&seen](HttpRequest request) {
    seen.headers = request.headers;
    return make_response(404, error_document("NoSuchKey", "missing"));
  });

  EXPECT_FALSE(provider.get_blob("key").has_value());
  EXPECT_EQ(seen.headers.count("authorization"), 0u);
  EXPECT_EQ(seen.headers["host"], "localhost:9000");
}

TEST(S3ProviderAddressingTest, EmptyKeyNeverReachesTransport) {
  ::unsetenv("AWS_ENDPOINT_URL");

  auto transport = std::make_shared<MockTransport>();
  S3Config config;
  config.bucket = "bucket";
  config.region = "us-east-1";
  S3Provider provider(config, transport);

  EXPECT_CALL(*transport, send(_)).Times(0);
  EXPECT_THROW(provider.get_blob(""), error::ProviderError);
}

//==============================================
// RESPONSE CLASSIFICATION
//==============================================

TEST(S3ClassificationTest, Get) {
  EXPECT_EQ(classify_get(200, ""), Outcome::SUCCESS);
  EXPECT_EQ(classify_get(206, ""), Outcome::SUCCESS);
  EXPECT_EQ(classify_get(404, NO_SUCH_KEY), Outcome::ABSENT);
  EXPECT_EQ(classify_get(404, "NoSuchBucket"), Outcome::FAILURE);
  EXPECT_EQ(classify_get(404, ""), Outcome::FAILURE);
  EXPECT_EQ(classify_get(403, "AccessDenied"), Outcome::FAILURE);
}

TEST(S3ClassificationTest, Put) {
  EXPECT_EQ(classify_put(200, ""), Outcome::SUCCESS);
  EXPECT_EQ(classify_put(404, NO_SUCH_KEY), Outcome::FAILURE);
  EXPECT_EQ(classify_put(500, "InternalError"), Outcome::FAILURE);
}

TEST(S3ClassificationTest, Head) {
  EXPECT_EQ(classify_head(200, ""), Outcome::SUCCESS);
  EXPECT_EQ(classify_head(404, ""), Outcome::ABSENT);
  EXPECT_EQ(classify_head(404, NO_SUCH_KEY), Outcome::ABSENT);
  EXPECT_EQ(classify_head(403, ""), Outcome::FAILURE);
}

TEST(S3ClassificationTest, Delete) {
  EXPECT_EQ(classify_delete(204, ""), Outcome::SUCCESS);
  EXPECT_EQ(classify_delete(404, NO_SUCH_KEY), Outcome::SUCCESS);
  EXPECT_EQ(classify_delete(404, "NoSuchBucket"), Outcome::FAILURE);
  EXPECT_EQ(classify_delete(403, "AccessDenied"), Outcome::FAILURE);
}
