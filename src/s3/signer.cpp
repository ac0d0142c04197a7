#include "s3/signer.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace hold {
namespace s3 {

namespace {

constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

} // namespace

//==============================================
// HASHING AND ENCODING HELPERS
//==============================================

std::string sha256_hex(const std::string& data) {
  std::vector<unsigned char> hash(SHA256_DIGEST_LENGTH);
  unsigned int hash_len = 0;
  if (!EVP_Digest(data.data(), data.size(), hash.data(), &hash_len, EVP_sha256(), nullptr)) {
    throw std::runtime_error("SigV4: SHA-256 digest failed");
  }
  hash.resize(hash_len);
  return to_hex(hash);
}

std::vector<unsigned char> hmac_sha256(const std::vector<unsigned char>& key, const std::string& data) {
  std::vector<unsigned char> result(EVP_MAX_MD_SIZE);
  unsigned int len = 0;

  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char*>(data.data()), data.size(),
           result.data(), &len) == nullptr) {
    throw std::runtime_error("SigV4: HMAC-SHA256 failed");
  }

  result.resize(len);
  return result;
}

std::string to_hex(const std::vector<unsigned char>& bytes) {
  std::ostringstream oss;
  for (unsigned char byte : bytes) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}

std::string uri_encode(const std::string& value, bool encode_slash) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex << std::uppercase;

  for (char c : value) {
    if (std::isalnum(static_cast<unsigned char>(c)) ||
        c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << c;
    } else if (c == '/' && !encode_slash) {
      escaped << c;
    } else {
      escaped << '%' << std::setw(2)
              << static_cast<int>(static_cast<unsigned char>(c));
    }
  }

  return escaped.str();
}

std::string format_amz_date(std::chrono::system_clock::time_point time) {
  std::time_t time_t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
  return oss.str();
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SigV4Signer::SigV4Signer(S3Credentials credentials, std::string region, std::string service)
  : credentials_(std::move(credentials))
  , region_(std::move(region))
  , service_(std::move(service)) {}


//==============================================
// SIGNING
//==============================================

std::string SigV4Signer::signed_headers(const HttpRequest& request) const {
  std::string names;
  // std::map keeps the lower-case names sorted, as SigV4 requires
  for (const auto& [name, value] : request.headers) {
    if (name == "authorization") {
      continue;
    }
    if (!names.empty()) {
      names += ";";
    }
    names += name;
  }
  return names;
}

std::string SigV4Signer::canonical_request(const HttpRequest& request) const {
  std::string target = request.target;
  std::string query;
  std::size_t query_start = target.find('?');
  if (query_start != std::string::npos) {
    query = target.substr(query_start + 1);
    target = target.substr(0, query_start);
  }

  std::ostringstream canonical_headers;
  for (const auto& [name, value] : request.headers) {
    if (name == "authorization") {
      continue;
    }
    canonical_headers << name << ":" << trim(value) << "\n";
  }

  auto payload_hash = request.headers.find("x-amz-content-sha256");

  std::ostringstream canonical;
  canonical << request.method << "\n";
  canonical << target << "\n";
  canonical << query << "\n";
  canonical << canonical_headers.str() << "\n";
  canonical << signed_headers(request) << "\n";
  canonical << (payload_hash == request.headers.end() ? UNSIGNED_PAYLOAD : payload_hash->second);
  return canonical.str();
}

std::vector<unsigned char> SigV4Signer::signing_key(const std::string& date_stamp) const {
  std::string secret = "AWS4" + credentials_.secret_access_key;
  auto k_date = hmac_sha256(std::vector<unsigned char>(secret.begin(), secret.end()), date_stamp);
  auto k_region = hmac_sha256(k_date, region_);
  auto k_service = hmac_sha256(k_region, service_);
  return hmac_sha256(k_service, "aws4_request");
}

void SigV4Signer::sign(HttpRequest& request, const std::string& amz_date) const {
  if (amz_date.size() < 8) {
    throw std::invalid_argument("SigV4: malformed request date: " + amz_date);
  }
  const std::string date_stamp = amz_date.substr(0, 8);

  request.headers.erase("authorization");
  request.headers["x-amz-date"] = amz_date;
  if (credentials_.session_token) {
    request.headers["x-amz-security-token"] = *credentials_.session_token;
  }
  if (request.headers.count("x-amz-content-sha256") == 0) {
    request.headers["x-amz-content-sha256"] = request.body ? UNSIGNED_PAYLOAD : EMPTY_PAYLOAD_SHA256;
  }

  const std::string credential_scope = date_stamp + "/" + region_ + "/" + service_ + "/aws4_request";

  std::ostringstream string_to_sign;
  string_to_sign << ALGORITHM << "\n";
  string_to_sign << amz_date << "\n";
  string_to_sign << credential_scope << "\n";
  string_to_sign << sha256_hex(canonical_request(request));

  const std::string signature = to_hex(hmac_sha256(signing_key(date_stamp), string_to_sign.str()));

  std::ostringstream authorization;
  authorization << ALGORITHM << " ";
  authorization << "Credential=" << credentials_.access_key_id << "/" << credential_scope << ",";
  authorization << "SignedHeaders=" << signed_headers(request) << ",";
  authorization << "Signature=" << signature;

  request.headers["authorization"] = authorization.str();
}

} // namespace s3
} // namespace hold
