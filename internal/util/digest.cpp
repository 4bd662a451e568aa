#include "digest.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>

#include "errors.hpp"

namespace waypoint::util {

std::string Md5Hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                                digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    throw std::runtime_error("OpenSSL: EVP md5 digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

std::string Base64Encode(std::string_view data) {
  if (data.empty()) return {};

  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int         n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
  if (n < 0) throw std::runtime_error("OpenSSL: base64 encode failed");
  out.resize(static_cast<std::size_t>(n));
  return out;
}

std::string Base64Decode(std::string_view text) {
  std::string s;
  s.reserve(text.size());
  for (unsigned char c : text) {
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
    s.push_back(static_cast<char>(c));
  }
  if (s.empty()) return {};

  std::string out((s.size() * 3) / 4 + 4, '\0');
  int         n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(s.data()),
                                  static_cast<int>(s.size()));
  if (n < 0) throw SerializationError("invalid base64 payload");
  out.resize(static_cast<std::size_t>(n));

  // EVP_DecodeBlock counts padding as zero bytes
  std::size_t pad = 0;
  if (s.back() == '=') pad++;
  if (s.size() >= 2 && s[s.size() - 2] == '=') pad++;
  if (pad) {
    if (out.size() < pad) throw SerializationError("invalid base64 padding");
    out.resize(out.size() - pad);
  }
  return out;
}

} // namespace waypoint::util
