#include "crypto.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <array>

namespace juhradial::crypto {

Result<std::string> random_digits(size_t count) {
    std::string digits;
    digits.reserve(count);

    // 250 is the largest multiple of 10 below 256, bytes at or above it would bias 0-5
    std::array<uint8_t, 32> pool{};
    while (digits.size() < count) {
        if (RAND_bytes(pool.data(), static_cast<int>(pool.size())) != 1) {
            return fail<std::string>(Error::RandomSourceFailed);
        }
        for (uint8_t byte : pool) {
            if (byte >= 250) continue;
            digits.push_back(static_cast<char>('0' + byte % 10));
            if (digits.size() == count) break;
        }
    }

    OPENSSL_cleanse(pool.data(), pool.size());
    return {digits, Error::None};
}

Result<std::string> random_token(size_t bytes) {
    std::vector<uint8_t> raw(bytes);
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        return fail<std::string>(Error::RandomSourceFailed);
    }

    static constexpr char hex[] = "0123456789abcdef";
    std::string token;
    token.reserve(bytes * 2);
    for (uint8_t byte : raw) {
        token.push_back(hex[byte >> 4]);
        token.push_back(hex[byte & 0x0F]);
    }

    OPENSSL_cleanse(raw.data(), raw.size());
    return {token, Error::None};
}

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string base64_encode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written < 0 ? 0 : static_cast<size_t>(written));
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view text) {
    if (text.empty()) {
        return std::vector<uint8_t>{};
    }
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(base64_decoded_size(text.size()));
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;

    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace juhradial::crypto
