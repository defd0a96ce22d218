// PairingCode.cpp — Случайные коды через OpenSSL

#include "oreonpickup/PairingCode.h"
#include <spdlog/spdlog.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace OreonPickup {

namespace Crypto {

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> result(count);
    if (count == 0) return result;

    if (RAND_bytes(result.data(), static_cast<int>(count)) != 1) {
        spdlog::error("Crypto::randomBytes: RAND_bytes failed");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return result;
}

} // namespace Crypto

std::string generatePairingCode(size_t length) {
    if (length < MIN_CODE_LENGTH || length > MAX_CODE_LENGTH) {
        throw std::invalid_argument("Pairing code length must be between " +
            std::to_string(MIN_CODE_LENGTH) + " and " + std::to_string(MAX_CODE_LENGTH));
    }

    std::string code;
    code.reserve(length);

    // Rejection sampling: байты >= 250 отбрасываются, иначе цифры 0-5 выпадали бы чаще
    while (code.size() < length) {
        auto bytes = Crypto::randomBytes(length * 2);
        for (uint8_t b : bytes) {
            if (b >= 250) continue;
            code.push_back(static_cast<char>('0' + b % 10));
            if (code.size() == length) break;
        }
    }

    return code;
}

bool isValidPairingCode(const std::string& code) {
    if (code.size() < MIN_CODE_LENGTH || code.size() > MAX_CODE_LENGTH) {
        return false;
    }
    return std::all_of(code.begin(), code.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace OreonPickup
