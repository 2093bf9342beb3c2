#include "secure_random.hpp"

#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace wgp {

namespace {

void requireSodium() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("libsodium failed to initialize");
    }
}

} // namespace

std::string secureRoundId(std::size_t entropyBytes) {
    if (entropyBytes == 0) {
        throw std::invalid_argument("round id needs at least one byte of entropy");
    }
    requireSodium();

    std::vector<unsigned char> raw(entropyBytes);
    randombytes_buf(raw.data(), raw.size());

    std::string id(entropyBytes * 2 + 1, '\0');
    sodium_bin2hex(&id[0], id.size(), raw.data(), raw.size());
    id.pop_back();
    sodium_memzero(raw.data(), raw.size());
    return id;
}

std::uint32_t secureRandomBelow(std::uint32_t upperBound) {
    if (upperBound == 0) {
        throw std::invalid_argument("secureRandomBelow requires a positive bound");
    }
    requireSodium();
    return randombytes_uniform(upperBound);
}

} // namespace wgp
