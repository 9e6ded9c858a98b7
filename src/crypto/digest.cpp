#include "cr/crypto/digest.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <string>

#include "cr/car/cid.h"
#include "cr/error.h"
#include "cr/errors.h"

namespace cr::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

[[noreturn]] void ThrowDigestError(const std::string& message, int native = 0) {
  throw cr::Error(cr::ErrorDomain::Integrity, cr::errors::integrity::kDigestUnavailable,
                  std::string(cr::errors::msg::kDigestBackendFailed) + ": " + message, native);
}

template <std::size_t N>
std::array<uint8_t, N> Digest(std::span<const uint8_t> data, const EVP_MD* md, const char* context) {
  std::array<uint8_t, N> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, md, nullptr) != 1) {
    ThrowDigestError(BuildOpenSSLErrorMessage(context));
  }
  if (len != out.size()) {
    ThrowDigestError("unexpected digest length", static_cast<int>(len));
  }
  return out;
}

template <std::size_t N>
bool Matches(const std::array<uint8_t, N>& actual, std::span<const uint8_t> expected) {
  return std::equal(actual.begin(), actual.end(), expected.begin(), expected.end());
}

}  // namespace

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  return Digest<32>(data, EVP_sha256(), "EVP_Digest(EVP_sha256)");
}

std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data) {
  return SHA256_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

std::array<uint8_t, 64> SHA512_Hash(std::span<const uint8_t> data) {
  return Digest<64>(data, EVP_sha512(), "EVP_Digest(EVP_sha512)");
}

DigestCheck VerifyMultihash(uint64_t hash_code, std::span<const uint8_t> expected,
                            std::span<const uint8_t> data) {
  switch (hash_code) {
  case cr::car::multihash::kIdentity:
    return std::equal(data.begin(), data.end(), expected.begin(), expected.end()) ? DigestCheck::kMatch
                                                                                  : DigestCheck::kMismatch;
  case cr::car::multihash::kSha2_256:
    return Matches(SHA256_Hash(data), expected) ? DigestCheck::kMatch : DigestCheck::kMismatch;
  case cr::car::multihash::kSha2_512:
    return Matches(SHA512_Hash(data), expected) ? DigestCheck::kMatch : DigestCheck::kMismatch;
  default:
    return DigestCheck::kUnsupported;
  }
}

}  // namespace cr::crypto
