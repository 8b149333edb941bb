#pragma once

#include <array>
#include <cstdint>
#include <string>

// OpenSSL BIGNUM forward declaration
struct bignum_st;

namespace v3lp
{

    // Unsigned integer of up to 256 bits backed by an OpenSSL BIGNUM.
    // Used for token amounts, liquidity and Q96 prices. Subtraction below
    // zero and values wider than 256 bits throw std::out_of_range.
    class Uint256
    {
    public:
        Uint256();
        Uint256(uint64_t value);
        ~Uint256();

        Uint256(const Uint256 &other);
        Uint256 &operator=(const Uint256 &other);
        Uint256(Uint256 &&other) noexcept;
        Uint256 &operator=(Uint256 &&other) noexcept;

        static Uint256 from_dec(const std::string &dec);
        static Uint256 from_hex(const std::string &hex); // with or without 0x
        static Uint256 from_bytes(const uint8_t *data, size_t len);
        static Uint256 max_uint128();
        static Uint256 max_uint256();

        std::string to_dec() const;
        std::string to_hex() const; // 0x-prefixed, no leading zeros ("0x0" for zero)
        std::array<uint8_t, 32> to_word() const;
        uint64_t to_u64() const;
        double to_double() const;

        bool is_zero() const;
        bool bit(int n) const;
        int bits() const;

        Uint256 operator+(const Uint256 &rhs) const;
        Uint256 operator-(const Uint256 &rhs) const;
        Uint256 operator*(const Uint256 &rhs) const;
        Uint256 operator/(const Uint256 &rhs) const;

        // floor(this * num / den) without intermediate truncation
        Uint256 mul_div(const Uint256 &num, const Uint256 &den) const;

        int compare(const Uint256 &rhs) const;
        bool operator==(const Uint256 &rhs) const { return compare(rhs) == 0; }
        bool operator!=(const Uint256 &rhs) const { return compare(rhs) != 0; }
        bool operator<(const Uint256 &rhs) const { return compare(rhs) < 0; }
        bool operator<=(const Uint256 &rhs) const { return compare(rhs) <= 0; }
        bool operator>(const Uint256 &rhs) const { return compare(rhs) > 0; }
        bool operator>=(const Uint256 &rhs) const { return compare(rhs) >= 0; }

    private:
        bignum_st *bn_;

        void check_width() const;
    };

    // Raw integer amount -> decimal string with `decimals` fractional digits, trailing zeros trimmed
    std::string format_units(const Uint256 &raw, int decimals);

    // Raw integer amount -> floating amount (raw / 10^decimals)
    double to_units(const Uint256 &raw, int decimals);

    // Floating amount -> raw integer amount, rounded down
    Uint256 parse_units(double amount, int decimals);

} // namespace v3lp
