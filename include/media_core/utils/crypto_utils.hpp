#pragma once

#include <string>
#include <vector>

namespace media_core {

// Lower-case hex SHA-256 of the buffer.
std::string sha256_hex(const std::vector<char> &data);

// Random RFC 4122 version 4 identifier, e.g. "3f2b8c1e-5d4a-4e8b-9c7d-0a1b2c3d4e5f".
std::string generate_uuid_v4();

std::string base64_encode(const std::vector<char> &data);

// Strict standard-alphabet decoding; surrounding whitespace is ignored.
// Throws InvalidArgumentError on malformed input.
std::vector<char> base64_decode(const std::string &encoded);

}  // namespace media_core
