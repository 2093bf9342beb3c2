#pragma once

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace wgp {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    // Uniform in [0, upperBound). upperBound must be positive.
    virtual std::uint32_t uniformBelow(std::uint32_t upperBound) = 0;
};

class InsecureTestRng : public RandomSource {
public:
    explicit InsecureTestRng(std::uint64_t seed);
    std::uint32_t uniformBelow(std::uint32_t upperBound) override;

private:
    std::mt19937_64 engine_;
};

// Backed by libsodium's unbiased randombytes_uniform.
class SecureRng : public RandomSource {
public:
    std::uint32_t uniformBelow(std::uint32_t upperBound) override;
};

// Fisher-Yates shuffle driven by `rng`.
template <typename T>
void shuffleWith(std::vector<T>& values, RandomSource& rng) {
    for (std::size_t i = values.size(); i > 1; --i) {
        std::size_t j = rng.uniformBelow(static_cast<std::uint32_t>(i));
        std::swap(values[i - 1], values[j]);
    }
}

} // namespace wgp
