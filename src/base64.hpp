#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstddef>
#include <cstdint>

namespace ancryptor {
namespace internal {

/// Length of the padded Base64 encoding of n bytes
std::size_t base64_encoded_size(std::size_t n);

/// Encode bytes to standard Base64 (RFC 4648, with '=' padding)
/// @param data Input bytes to encode
/// @return Base64 encoded string
std::string base64_encode(std::span<const std::uint8_t> data);

/// Decode canonical standard Base64 to bytes (RFC 4648, padding required)
/// @param input Base64 encoded string
/// @return Decoded bytes
/// @throws std::invalid_argument on bad length, characters, padding or trailing bits
std::vector<std::uint8_t> base64_decode(std::string_view input);

} // namespace internal
} // namespace ancryptor
