#include "decimal.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace trade_rank {

namespace {

using int128 = Decimal::Raw;
using uint128 = unsigned __int128;

// The most negative raw value is excluded so that every value can be negated.
const int128 kRawMax = static_cast<int128>(~static_cast<uint128>(0) >> 1);

// 256-bit unsigned intermediate.
struct Wide {
    uint128 hi;
    uint128 lo;
};

uint128 magnitude(int128 v) {
    return v < 0 ? static_cast<uint128>(0) - static_cast<uint128>(v) : static_cast<uint128>(v);
}

int128 with_sign(uint128 mag, bool negative) {
    if (mag > static_cast<uint128>(kRawMax)) {
        throw std::overflow_error("decimal overflow");
    }
    auto v = static_cast<int128>(mag);
    return negative ? -v : v;
}

int128 checked(int128 v) {
    if (v < -kRawMax) {
        throw std::overflow_error("decimal overflow");
    }
    return v;
}

Wide mul_wide(uint128 a, uint128 b) {
    const uint128 mask = 0xFFFFFFFFFFFFFFFFULL;
    uint128 a_lo = a & mask;
    uint128 a_hi = a >> 64;
    uint128 b_lo = b & mask;
    uint128 b_hi = b >> 64;

    uint128 ll = a_lo * b_lo;
    uint128 lh = a_lo * b_hi;
    uint128 hl = a_hi * b_lo;
    uint128 hh = a_hi * b_hi;

    uint128 mid = (ll >> 64) + (lh & mask) + (hl & mask);
    Wide w;
    w.lo = (ll & mask) | (mid << 64);
    w.hi = hh + (lh >> 64) + (hl >> 64) + (mid >> 64);
    return w;
}

// n / d rounded half away from zero; d must be non-zero and below 2^127.
uint128 div_wide_round(const Wide& n, uint128 d) {
    if (n.hi >= d) {
        throw std::overflow_error("decimal overflow");
    }
    uint128 rem = n.hi;
    uint128 q = 0;
    for (int bit = 127; bit >= 0; --bit) {
        rem = (rem << 1) | ((n.lo >> bit) & 1);
        q <<= 1;
        if (rem >= d) {
            rem -= d;
            q |= 1;
        }
    }
    if (rem >= d - rem) {
        if (q == ~static_cast<uint128>(0)) {
            throw std::overflow_error("decimal overflow");
        }
        ++q;
    }
    return q;
}

// Integer division rounding half away from zero, for divisors that are powers of ten.
int128 div_round(int128 num, int128 den) {
    int128 q = num / den;
    int128 r = num % den;
    if (r != 0) {
        int128 abs_r = r < 0 ? -r : r;
        if (abs_r * 2 >= den) {
            q += num < 0 ? -1 : 1;
        }
    }
    return q;
}

int128 pow10(int n) {
    int128 v = 1;
    while (n-- > 0) v *= 10;
    return v;
}

} // namespace

Decimal::Decimal(int64_t whole) : raw_(static_cast<int128>(whole) * kFactor) {}

Decimal::Decimal(const std::string& text) {
    auto parsed = parse(text);
    if (!parsed) {
        throw std::invalid_argument("invalid decimal: '" + text + "'");
    }
    raw_ = parsed->raw_;
}

Decimal Decimal::from_raw(Raw raw) {
    Decimal d;
    d.raw_ = checked(raw);
    return d;
}

std::optional<Decimal> Decimal::parse(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) return std::nullopt;

    bool negative = false;
    if (text[begin] == '-' || text[begin] == '+') {
        negative = text[begin] == '-';
        ++begin;
    }

    const uint128 limit = static_cast<uint128>(kRawMax);
    uint128 value = 0;
    int frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c == '.') {
            if (seen_dot) return std::nullopt;
            seen_dot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        seen_digit = true;
        if (seen_dot && ++frac_digits > kScale) return std::nullopt;
        auto digit = static_cast<uint128>(c - '0');
        if (value > (limit - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    if (!seen_digit) return std::nullopt;

    for (int i = frac_digits; i < kScale; ++i) {
        if (value > limit / 10) return std::nullopt;
        value *= 10;
    }
    auto v = static_cast<int128>(value);
    Decimal d;
    d.raw_ = negative ? -v : v;
    return d;
}

double Decimal::to_double() const {
    return static_cast<double>(raw_) / static_cast<double>(kFactor);
}

std::string Decimal::to_string() const {
    std::string out = to_string(kScale);
    auto dot = out.find('.');
    if (dot == std::string::npos) return out;
    size_t last = out.find_last_not_of('0');
    if (last == dot) {
        out.erase(dot);
    } else {
        out.erase(last + 1);
    }
    return out;
}

std::string Decimal::to_string(int places) const {
    places = std::clamp(places, 0, kScale);
    int128 scaled = div_round(raw_, pow10(kScale - places));
    bool negative = scaled < 0;
    uint128 mag = magnitude(scaled);

    std::string digits;
    do {
        digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    } while (mag > 0);
    while (static_cast<int>(digits.size()) <= places) digits.push_back('0');
    std::reverse(digits.begin(), digits.end());

    std::string out;
    if (negative) out.push_back('-');
    out += digits.substr(0, digits.size() - places);
    if (places > 0) {
        out.push_back('.');
        out += digits.substr(digits.size() - places);
    }
    return out;
}

Decimal Decimal::abs() const {
    return raw_ < 0 ? -*this : *this;
}

Decimal Decimal::operator-() const {
    Decimal d;
    d.raw_ = -raw_;
    return d;
}

Decimal& Decimal::operator+=(const Decimal& o) {
    int128 sum;
    if (__builtin_add_overflow(raw_, o.raw_, &sum)) {
        throw std::overflow_error("decimal overflow");
    }
    raw_ = checked(sum);
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& o) {
    int128 diff;
    if (__builtin_sub_overflow(raw_, o.raw_, &diff)) {
        throw std::overflow_error("decimal overflow");
    }
    raw_ = checked(diff);
    return *this;
}

Decimal& Decimal::operator*=(const Decimal& o) {
    bool negative = (raw_ < 0) != (o.raw_ < 0);
    uint128 mag = div_wide_round(mul_wide(magnitude(raw_), magnitude(o.raw_)),
                                 static_cast<uint128>(kFactor));
    raw_ = with_sign(mag, negative);
    return *this;
}

Decimal& Decimal::operator/=(const Decimal& o) {
    if (o.raw_ == 0) {
        throw std::domain_error("decimal division by zero");
    }
    bool negative = (raw_ < 0) != (o.raw_ < 0);
    uint128 mag = div_wide_round(mul_wide(magnitude(raw_), static_cast<uint128>(kFactor)),
                                 magnitude(o.raw_));
    raw_ = with_sign(mag, negative);
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Decimal& d) {
    return os << d.to_string();
}

} // namespace trade_rank
