#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/multiprecision/cpp_int.hpp>

namespace wgp {

// Exact rational quarter amounts. Every payout path stays exact so that hole deltas
// and running totals sum to zero without tolerance.
class Quarters {
public:
    using Rational = boost::multiprecision::cpp_rational;

    Quarters() : value_(0) {}
    explicit Quarters(std::int64_t whole) : value_(whole) {}
    // Wager units are unsigned and unbounded by doubling; never narrow them.
    static Quarters fromUnits(std::uint64_t units) { return Quarters(Rational(units)); }

    static Quarters fromRatio(std::int64_t numerator, std::int64_t denominator) {
        if (denominator == 0) {
            throw std::domain_error("Quarters denominator must be non-zero");
        }
        return Quarters(Rational(numerator, denominator));
    }

    const Rational& rational() const { return value_; }
    bool isZero() const { return value_ == 0; }
    bool isWhole() const { return boost::multiprecision::denominator(value_) == 1; }

    // "3", "-3/2"
    std::string str() const { return value_.str(); }

    Quarters operator+(const Quarters& other) const { return Quarters(value_ + other.value_); }
    Quarters operator-(const Quarters& other) const { return Quarters(value_ - other.value_); }
    Quarters operator*(const Quarters& other) const { return Quarters(value_ * other.value_); }
    Quarters operator/(const Quarters& other) const {
        if (other.value_ == 0) {
            throw std::domain_error("Quarters division by zero");
        }
        return Quarters(value_ / other.value_);
    }
    Quarters operator-() const { return Quarters(-value_); }

    Quarters& operator+=(const Quarters& other) {
        value_ += other.value_;
        return *this;
    }
    Quarters& operator-=(const Quarters& other) {
        value_ -= other.value_;
        return *this;
    }
    Quarters& operator*=(const Quarters& other) {
        value_ *= other.value_;
        return *this;
    }
    Quarters& operator/=(const Quarters& other) {
        *this = *this / other;
        return *this;
    }

    bool operator<(const Quarters& other) const { return value_ < other.value_; }
    bool operator>(const Quarters& other) const { return value_ > other.value_; }
    bool operator<=(const Quarters& other) const { return value_ <= other.value_; }
    bool operator>=(const Quarters& other) const { return value_ >= other.value_; }
    bool operator==(const Quarters& other) const { return value_ == other.value_; }
    bool operator!=(const Quarters& other) const { return value_ != other.value_; }

private:
    explicit Quarters(Rational value) : value_(std::move(value)) {}

    Rational value_;
};

inline std::ostream& operator<<(std::ostream& os, const Quarters& q) {
    return os << q.str();
}

} // namespace wgp
