#include "utf8.hpp"
#include <simdutf.h>

namespace ancryptor::internal {

std::optional<std::size_t> find_invalid_utf8(std::span<const std::uint8_t> data) {
    const simdutf::result r = simdutf::validate_utf8_with_errors(
        reinterpret_cast<const char*>(data.data()), data.size());
    if (r.error != simdutf::SUCCESS) {
        return r.count;
    }
    return std::nullopt;
}

}
