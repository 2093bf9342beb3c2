#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace wgp {

// Lower-case hex identifier drawn from libsodium; `entropyBytes` must be positive.
std::string secureRoundId(std::size_t entropyBytes);

// Uniform draw in [0, upperBound).
std::uint32_t secureRandomBelow(std::uint32_t upperBound);

} // namespace wgp
