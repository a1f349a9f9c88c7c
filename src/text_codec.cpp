#include "ancryptor/text_codec.hpp"
#include "base64.hpp"
#include "utf8.hpp"
#include <stdexcept>
#include <span>
#include <vector>
#include <cstdint>

namespace ancryptor {

const char* toString(DecodeError error) {
    switch (error) {
        case DecodeError::InvalidEncoding:
            return "invalid-encoding";
        case DecodeError::InvalidUtf8:
            return "invalid-utf8";
    }
    return "unknown";
}

std::string encode(std::string_view text) {
    std::span<const std::uint8_t> bytes(
        reinterpret_cast<const std::uint8_t*>(text.data()),
        text.size()
    );
    return internal::base64_encode(bytes);
}

DecodeResult tryDecode(std::string_view encoded) {
    std::vector<std::uint8_t> bytes;
    try {
        bytes = internal::base64_decode(encoded);
    } catch (const std::invalid_argument& e) {
        return DecodeResult::failure(DecodeError::InvalidEncoding, e.what());
    }

    if (auto offset = internal::find_invalid_utf8(bytes)) {
        return DecodeResult::failure(
            DecodeError::InvalidUtf8,
            "Invalid UTF-8 sequence at byte " + std::to_string(*offset)
        );
    }

    return DecodeResult::success(std::string(bytes.begin(), bytes.end()));
}

std::string decode(std::string_view encoded) {
    auto result = tryDecode(encoded);
    if (!result) {
        return "";
    }
    return std::move(result.text);
}

} // namespace ancryptor
