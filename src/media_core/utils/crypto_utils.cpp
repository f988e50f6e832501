#include "media_core/utils/crypto_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cctype>
#include <iomanip>
#include <sstream>

#include "media_core/errors.hpp"

namespace media_core {

std::string sha256_hex(const std::vector<char> &data) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw StorageIOError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw StorageIOError("Failed to initialize SHA256 digest");
  }
  if (!data.empty() && EVP_DigestUpdate(mdctx, data.data(), data.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw StorageIOError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw StorageIOError("Failed to finalize SHA256 digest");
  }
  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string generate_uuid_v4() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw StorageIOError("Failed to gather random bytes for asset id");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  std::stringstream ss;
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      ss << '-';
    }
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

std::string base64_encode(const std::vector<char> &data) {
  if (data.empty()) {
    return "";
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  const int written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                      reinterpret_cast<const unsigned char *>(data.data()),
                      static_cast<int>(data.size()));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::vector<char> base64_decode(const std::string &encoded) {
  size_t begin = 0;
  size_t end = encoded.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(encoded[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(encoded[end - 1]))) --end;
  const std::string input = encoded.substr(begin, end - begin);

  if (input.empty()) {
    return {};
  }
  if (input.size() % 4 != 0) {
    throw InvalidArgumentError("Malformed base64 payload: length is not a multiple of 4");
  }

  size_t padding = 0;
  for (size_t i = 0; i < input.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(input[i]);
    if (c == '=') {
      // Padding is only allowed in the last two positions
      if (i + 2 < input.size()) {
        throw InvalidArgumentError("Malformed base64 payload: unexpected padding");
      }
      ++padding;
    } else if (padding > 0 || !(std::isalnum(c) || c == '+' || c == '/')) {
      throw InvalidArgumentError("Malformed base64 payload: invalid character at offset " +
                                 std::to_string(i));
    }
  }

  std::vector<char> out(3 * input.size() / 4);
  const int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                      reinterpret_cast<const unsigned char *>(input.data()),
                                      static_cast<int>(input.size()));
  if (decoded < 0) {
    throw InvalidArgumentError("Malformed base64 payload");
  }
  // EVP_DecodeBlock counts the padding bytes as output
  out.resize(static_cast<size_t>(decoded) - padding);
  return out;
}

}  // namespace media_core
