#pragma once

namespace ancryptor {

// Library version
inline constexpr const char* VERSION = "1.0.0";

// Padding character of the standard Base64 alphabet (RFC 4648 section 4)
inline constexpr char BASE64_PAD = '=';

} // namespace ancryptor
