#include "base64.hpp"
#include "ancryptor/ancryptor_constants.hpp"
#include <stdexcept>
#include <array>

namespace ancryptor {
namespace internal {

namespace {
    // Standard Base64 alphabet (RFC 4648 section 4)
    constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    constexpr std::uint8_t invalid = 0xFF;

    // Lookup table for decoding (maps ASCII value to 6-bit value, 0xFF = invalid)
    constexpr std::array<std::uint8_t, 256> createDecodeLookup() {
        std::array<std::uint8_t, 256> lookup{};
        for (auto& val : lookup) val = invalid;

        for (std::uint8_t i = 0; i < 64; ++i) {
            lookup[static_cast<std::uint8_t>(alphabet[i])] = i;
        }
        // Padding is not a symbol: it is only accepted at the tail and stripped before lookup

        return lookup;
    }

    constexpr auto decode_lookup = createDecodeLookup();

    std::uint32_t sextet(std::string_view input, std::size_t pos) {
        std::uint8_t val = decode_lookup[static_cast<std::uint8_t>(input[pos])];
        if (val == invalid) {
            if (input[pos] == BASE64_PAD) {
                throw std::invalid_argument(
                    "Misplaced Base64 padding at offset " + std::to_string(pos));
            }
            throw std::invalid_argument(
                "Invalid Base64 character at offset " + std::to_string(pos));
        }
        return val;
    }
}

std::size_t base64_encoded_size(std::size_t n) {
    return ((n + 2) / 3) * 4;
}

std::string base64_encode(std::span<const std::uint8_t> data) {
    std::string result;
    result.reserve(base64_encoded_size(data.size()));

    size_t i = 0;
    // Process complete 3-byte groups
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                 static_cast<std::uint32_t>(data[i + 2]);

        result.push_back(alphabet[(triple >> 18) & 0x3F]);
        result.push_back(alphabet[(triple >> 12) & 0x3F]);
        result.push_back(alphabet[(triple >> 6) & 0x3F]);
        result.push_back(alphabet[triple & 0x3F]);

        i += 3;
    }

    // Handle remaining 1 or 2 bytes, padded to a full quad
    if (i < data.size()) {
        std::uint32_t remaining = static_cast<std::uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) {
            remaining |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }

        result.push_back(alphabet[(remaining >> 18) & 0x3F]);
        result.push_back(alphabet[(remaining >> 12) & 0x3F]);

        if (i + 1 < data.size()) {
            // 2 bytes remaining -> 3 symbols + 1 pad
            result.push_back(alphabet[(remaining >> 6) & 0x3F]);
        } else {
            // 1 byte remaining -> 2 symbols + 2 pads
            result.push_back(BASE64_PAD);
        }
        result.push_back(BASE64_PAD);
    }

    return result;
}

std::vector<std::uint8_t> base64_decode(std::string_view input) {
    if (input.empty()) {
        return {};
    }

    if (input.size() % 4 != 0) {
        throw std::invalid_argument(
            "Invalid Base64 input length: " + std::to_string(input.size()) +
            " is not a multiple of 4");
    }

    // At most two trailing pad characters; any other '=' is rejected by sextet()
    std::size_t padding = 0;
    if (input[input.size() - 1] == BASE64_PAD) {
        ++padding;
        if (input[input.size() - 2] == BASE64_PAD) {
            ++padding;
        }
    }
    const std::size_t body = input.size() - padding;

    // Reserve space: 3 output bytes per 4 input chars
    std::vector<std::uint8_t> result;
    result.reserve((input.size() / 4) * 3);

    size_t i = 0;
    // Process complete 4-char groups
    while (i + 3 < body) {
        std::uint32_t quad = (sextet(input, i) << 18) |
                             (sextet(input, i + 1) << 12) |
                             (sextet(input, i + 2) << 6) |
                              sextet(input, i + 3);

        result.push_back(static_cast<std::uint8_t>((quad >> 16) & 0xFF));
        result.push_back(static_cast<std::uint8_t>((quad >> 8) & 0xFF));
        result.push_back(static_cast<std::uint8_t>(quad & 0xFF));

        i += 4;
    }

    // Final padded group: 2 symbols (1 byte) or 3 symbols (2 bytes)
    if (padding > 0) {
        std::uint32_t a = sextet(input, i);
        std::uint32_t b = sextet(input, i + 1);
        std::uint32_t partial = (a << 18) | (b << 12);

        if (padding == 2) {
            if ((b & 0x0F) != 0) {
                throw std::invalid_argument(
                    "Invalid Base64 trailing bits at offset " + std::to_string(i + 1));
            }
            result.push_back(static_cast<std::uint8_t>((partial >> 16) & 0xFF));
        } else {
            std::uint32_t c = sextet(input, i + 2);
            if ((c & 0x03) != 0) {
                throw std::invalid_argument(
                    "Invalid Base64 trailing bits at offset " + std::to_string(i + 2));
            }
            partial |= c << 6;
            result.push_back(static_cast<std::uint8_t>((partial >> 16) & 0xFF));
            result.push_back(static_cast<std::uint8_t>((partial >> 8) & 0xFF));
        }
    }

    return result;
}

} // namespace internal
} // namespace ancryptor
