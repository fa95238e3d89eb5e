#pragma once

#include "../types/enums.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace juhradial::crypto {

// Decimal digits from the OpenSSL CSPRNG, rejection sampled so each digit is uniform
Result<std::string> random_digits(size_t count);

// Lower-case hex of `bytes` random bytes
Result<std::string> random_token(size_t bytes = 32);

// Constant time for equal lengths; differing lengths compare unequal
bool constant_time_equals(std::string_view a, std::string_view b);

std::string base64_encode(std::span<const uint8_t> data);

// Returns nullopt on characters outside the alphabet or bad padding
std::optional<std::vector<uint8_t>> base64_decode(std::string_view text);

// Upper bound of decoded bytes for a base64 text of this length
inline size_t base64_decoded_size(size_t encoded_length) {
    return (encoded_length / 4) * 3;
}

} // namespace juhradial::crypto
