#include "rng.hpp"

#include "secure_random.hpp"

#include <stdexcept>

namespace wgp {

InsecureTestRng::InsecureTestRng(std::uint64_t seed)
    : engine_(seed) {}

std::uint32_t InsecureTestRng::uniformBelow(std::uint32_t upperBound) {
    if (upperBound == 0) {
        throw std::invalid_argument("uniformBelow requires a positive bound");
    }
    std::uniform_int_distribution<std::uint32_t> dist(0, upperBound - 1);
    return dist(engine_);
}

std::uint32_t SecureRng::uniformBelow(std::uint32_t upperBound) {
    return secureRandomBelow(upperBound);
}

} // namespace wgp
