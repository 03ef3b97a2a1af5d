#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace trade_rank {

/**
 * Exact fixed-point decimal for money and quantities.
 *
 * Stored as a signed 128-bit count of 1e-18 units, which covers magnitudes up to
 * about 1.7e20 with 18 fractional digits. Text with more than 18 fractional digits
 * is rejected. Multiplication and division go through 256-bit intermediates and
 * round half away from zero at the 18th place. Results that do not fit throw
 * std::overflow_error; division by zero throws std::domain_error.
 */
class Decimal {
public:
    using Raw = __int128;

    static constexpr int kScale = 18;
    static constexpr Raw kFactor = 1000000000000000000LL;

    Decimal() = default;
    explicit Decimal(int64_t whole);
    explicit Decimal(const std::string& text);

    static Decimal from_raw(Raw raw);

    /**
     * Parse "[-+]digits[.digits]" with at most kScale fractional digits.
     */
    static std::optional<Decimal> parse(const std::string& text);

    Raw raw() const { return raw_; }
    double to_double() const;

    // Shortest representation, e.g. "198", "-0.5", "12.3456".
    std::string to_string() const;
    // Fixed number of fractional digits, rounded, e.g. to_string(2) == "198.00".
    std::string to_string(int places) const;

    bool is_zero() const { return raw_ == 0; }
    bool is_positive() const { return raw_ > 0; }
    bool is_negative() const { return raw_ < 0; }
    Decimal abs() const;

    Decimal operator-() const;
    Decimal& operator+=(const Decimal& o);
    Decimal& operator-=(const Decimal& o);
    Decimal& operator*=(const Decimal& o);
    Decimal& operator/=(const Decimal& o);

    friend Decimal operator+(Decimal a, const Decimal& b) { return a += b; }
    friend Decimal operator-(Decimal a, const Decimal& b) { return a -= b; }
    friend Decimal operator*(Decimal a, const Decimal& b) { return a *= b; }
    friend Decimal operator/(Decimal a, const Decimal& b) { return a /= b; }

    friend bool operator==(const Decimal& a, const Decimal& b) { return a.raw_ == b.raw_; }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return a.raw_ != b.raw_; }
    friend bool operator<(const Decimal& a, const Decimal& b) { return a.raw_ < b.raw_; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return a.raw_ <= b.raw_; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return a.raw_ > b.raw_; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return a.raw_ >= b.raw_; }

private:
    Raw raw_{0};
};

inline Decimal min(const Decimal& a, const Decimal& b) { return b < a ? b : a; }
inline Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }

std::ostream& operator<<(std::ostream& os, const Decimal& d);

} // namespace trade_rank

namespace std {
template <>
struct hash<trade_rank::Decimal> {
    size_t operator()(const trade_rank::Decimal& d) const {
        auto bits = static_cast<unsigned __int128>(d.raw());
        size_t lo = std::hash<uint64_t>{}(static_cast<uint64_t>(bits));
        size_t hi = std::hash<uint64_t>{}(static_cast<uint64_t>(bits >> 64));
        return lo ^ (hi + 0x9e3779b97f4a7c15ULL + (lo << 6) + (lo >> 2));
    }
};
} // namespace std
