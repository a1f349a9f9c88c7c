#pragma once

#include <span>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace ancryptor::internal {

/// Locate the first ill-formed UTF-8 sequence (Unicode Table 3-7)
/// @param data Bytes to check
/// @return Offset of the first byte of the offending sequence, or nullopt if well-formed
std::optional<std::size_t> find_invalid_utf8(std::span<const std::uint8_t> data);

}
