#include "digest.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace mountsync::util {
namespace {

std::string ToHex(const unsigned char* data, unsigned int size) {
  static constexpr char kTable[] = "0123456789abcdef";

  std::string result;
  result.reserve(size * 2);
  for (unsigned int i = 0; i < size; ++i) {
    result.push_back(kTable[(data[i] >> 4) & 0x0F]);
    result.push_back(kTable[data[i] & 0x0F]);
  }
  return result;
}

std::string Digest(const EVP_MD* md, std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  out_len = 0;

  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
    throw std::runtime_error("digest computation failed");
  }

  return ToHex(out, out_len);
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  return Digest(EVP_sha256(), data);
}

} // namespace mountsync::util
