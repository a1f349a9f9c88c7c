#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ancryptor {

/// Why a decode attempt failed
enum class DecodeError {
    InvalidEncoding,    // Not canonical padded Base64
    InvalidUtf8         // Base64 was well-formed but the payload is not UTF-8 text
};

/// Stable name of a decode error ("invalid-encoding", "invalid-utf8")
[[nodiscard]] const char* toString(DecodeError error);

/**
 * Outcome of a decode: the decoded text on success, or the error kind
 * and a human-readable message on failure
 */
struct DecodeResult {
    bool ok;
    std::string text;
    std::optional<DecodeError> error;
    std::optional<std::string> message;

    explicit operator bool() const { return ok; }

    /// Decoded text, or fallback if decoding failed
    [[nodiscard]] std::string valueOr(std::string fallback) const {
        return ok ? text : fallback;
    }

    static DecodeResult success(std::string text) {
        return DecodeResult{true, std::move(text), std::nullopt, std::nullopt};
    }

    static DecodeResult failure(DecodeError error, const std::string& msg) {
        return DecodeResult{false, std::string(), error, msg};
    }
};

/**
 * Encode text as standard padded Base64
 * @param text UTF-8 text (the bytes are encoded as-is, no validation)
 * @return Base64 string of length 4 * ceil(text.size() / 3)
 */
[[nodiscard]] std::string encode(std::string_view text);

/**
 * Decode standard padded Base64 into UTF-8 text, reporting why it failed
 * @param encoded Base64 string
 * @return DecodeResult; never throws for malformed input
 */
[[nodiscard]] DecodeResult tryDecode(std::string_view encoded);

/**
 * Decode standard padded Base64 into UTF-8 text
 * Malformed Base64 and non-UTF-8 payloads both yield an empty string,
 * use tryDecode() to tell them apart from an empty payload.
 * @param encoded Base64 string
 * @return Decoded text, or "" on any failure
 */
[[nodiscard]] std::string decode(std::string_view encoded);

} // namespace ancryptor
