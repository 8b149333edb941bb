#include "uint256.hpp"
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <memory>
#include <new>
#include <sstream>
#include <stdexcept>

namespace v3lp
{

    namespace
    {
        struct CtxDeleter
        {
            void operator()(BN_CTX *ctx) const { BN_CTX_free(ctx); }
        };

        std::unique_ptr<BN_CTX, CtxDeleter> make_ctx()
        {
            std::unique_ptr<BN_CTX, CtxDeleter> ctx(BN_CTX_new());
            if (!ctx)
            {
                throw std::bad_alloc();
            }
            return ctx;
        }

        BIGNUM *new_bn()
        {
            BIGNUM *bn = BN_new();
            if (!bn)
            {
                throw std::bad_alloc();
            }
            return bn;
        }
    } // namespace

    Uint256::Uint256()
        : bn_(new_bn())
    {
    }

    Uint256::Uint256(uint64_t value)
        : bn_(new_bn())
    {
        uint8_t be[8];
        for (int i = 0; i < 8; i++)
        {
            be[7 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
        }
        BN_bin2bn(be, 8, bn_);
    }

    Uint256::~Uint256()
    {
        if (bn_)
        {
            BN_free(bn_);
        }
    }

    Uint256::Uint256(const Uint256 &other)
        : bn_(BN_dup(other.bn_))
    {
        if (!bn_)
        {
            throw std::bad_alloc();
        }
    }

    Uint256 &Uint256::operator=(const Uint256 &other)
    {
        if (this != &other)
        {
            if (!bn_)
            {
                bn_ = new_bn();
            }
            if (!BN_copy(bn_, other.bn_))
            {
                throw std::bad_alloc();
            }
        }
        return *this;
    }

    Uint256::Uint256(Uint256 &&other) noexcept
        : bn_(other.bn_)
    {
        other.bn_ = nullptr;
    }

    Uint256 &Uint256::operator=(Uint256 &&other) noexcept
    {
        if (this != &other)
        {
            std::swap(bn_, other.bn_);
        }
        return *this;
    }

    void Uint256::check_width() const
    {
        if (BN_num_bits(bn_) > 256)
        {
            throw std::out_of_range("value exceeds 256 bits");
        }
    }

    Uint256 Uint256::from_dec(const std::string &dec)
    {
        if (dec.empty() || !std::all_of(dec.begin(), dec.end(), [](unsigned char c)
                                        { return std::isdigit(c); }))
        {
            throw std::invalid_argument("not a decimal integer: '" + dec + "'");
        }
        Uint256 out;
        BN_free(out.bn_);
        out.bn_ = nullptr;
        if (!BN_dec2bn(&out.bn_, dec.c_str()))
        {
            throw std::invalid_argument("not a decimal integer: '" + dec + "'");
        }
        out.check_width();
        return out;
    }

    Uint256 Uint256::from_hex(const std::string &hex)
    {
        std::string h = hex;
        if (h.size() >= 2 && (h.substr(0, 2) == "0x" || h.substr(0, 2) == "0X"))
        {
            h = h.substr(2);
        }
        if (h.empty())
        {
            return Uint256();
        }
        if (!std::all_of(h.begin(), h.end(), [](unsigned char c)
                         { return std::isxdigit(c); }))
        {
            throw std::invalid_argument("not a hex integer: '" + hex + "'");
        }
        Uint256 out;
        BN_free(out.bn_);
        out.bn_ = nullptr;
        if (!BN_hex2bn(&out.bn_, h.c_str()))
        {
            throw std::invalid_argument("not a hex integer: '" + hex + "'");
        }
        out.check_width();
        return out;
    }

    Uint256 Uint256::from_bytes(const uint8_t *data, size_t len)
    {
        Uint256 out;
        BN_bin2bn(data, static_cast<int>(len), out.bn_);
        out.check_width();
        return out;
    }

    Uint256 Uint256::max_uint128()
    {
        return from_hex("ffffffffffffffffffffffffffffffff");
    }

    Uint256 Uint256::max_uint256()
    {
        return from_hex("ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
    }

    std::string Uint256::to_dec() const
    {
        char *s = BN_bn2dec(bn_);
        if (!s)
        {
            throw std::bad_alloc();
        }
        std::string out(s);
        OPENSSL_free(s);
        return out;
    }

    std::string Uint256::to_hex() const
    {
        char *s = BN_bn2hex(bn_);
        if (!s)
        {
            throw std::bad_alloc();
        }
        std::string h(s);
        OPENSSL_free(s);
        std::transform(h.begin(), h.end(), h.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        size_t first = h.find_first_not_of('0');
        if (first == std::string::npos)
        {
            return "0x0";
        }
        return "0x" + h.substr(first);
    }

    std::array<uint8_t, 32> Uint256::to_word() const
    {
        check_width();
        std::array<uint8_t, 32> word{};
        BN_bn2binpad(bn_, word.data(), 32);
        return word;
    }

    uint64_t Uint256::to_u64() const
    {
        if (BN_num_bits(bn_) > 64)
        {
            throw std::out_of_range("value " + to_dec() + " exceeds 64 bits");
        }
        auto word = to_word();
        uint64_t value = 0;
        for (int i = 24; i < 32; i++)
        {
            value = (value << 8) | word[i];
        }
        return value;
    }

    double Uint256::to_double() const
    {
        return std::stod(to_dec());
    }

    bool Uint256::is_zero() const
    {
        return BN_is_zero(bn_);
    }

    bool Uint256::bit(int n) const
    {
        return BN_is_bit_set(bn_, n) == 1;
    }

    int Uint256::bits() const
    {
        return BN_num_bits(bn_);
    }

    Uint256 Uint256::operator+(const Uint256 &rhs) const
    {
        Uint256 out;
        if (!BN_add(out.bn_, bn_, rhs.bn_))
        {
            throw std::runtime_error("BN_add failed");
        }
        out.check_width();
        return out;
    }

    Uint256 Uint256::operator-(const Uint256 &rhs) const
    {
        if (compare(rhs) < 0)
        {
            throw std::out_of_range("unsigned subtraction underflow");
        }
        Uint256 out;
        if (!BN_sub(out.bn_, bn_, rhs.bn_))
        {
            throw std::runtime_error("BN_sub failed");
        }
        return out;
    }

    Uint256 Uint256::operator*(const Uint256 &rhs) const
    {
        auto ctx = make_ctx();
        Uint256 out;
        if (!BN_mul(out.bn_, bn_, rhs.bn_, ctx.get()))
        {
            throw std::runtime_error("BN_mul failed");
        }
        out.check_width();
        return out;
    }

    Uint256 Uint256::operator/(const Uint256 &rhs) const
    {
        if (rhs.is_zero())
        {
            throw std::domain_error("division by zero");
        }
        auto ctx = make_ctx();
        Uint256 out;
        if (!BN_div(out.bn_, nullptr, bn_, rhs.bn_, ctx.get()))
        {
            throw std::runtime_error("BN_div failed");
        }
        return out;
    }

    Uint256 Uint256::mul_div(const Uint256 &num, const Uint256 &den) const
    {
        if (den.is_zero())
        {
            throw std::domain_error("division by zero");
        }
        auto ctx = make_ctx();
        Uint256 product;
        if (!BN_mul(product.bn_, bn_, num.bn_, ctx.get()))
        {
            throw std::runtime_error("BN_mul failed");
        }
        Uint256 out;
        if (!BN_div(out.bn_, nullptr, product.bn_, den.bn_, ctx.get()))
        {
            throw std::runtime_error("BN_div failed");
        }
        out.check_width();
        return out;
    }

    int Uint256::compare(const Uint256 &rhs) const
    {
        return BN_cmp(bn_, rhs.bn_);
    }

    std::string format_units(const Uint256 &raw, int decimals)
    {
        std::string digits = raw.to_dec();
        if (decimals <= 0)
        {
            return digits;
        }
        if (digits.size() <= static_cast<size_t>(decimals))
        {
            digits.insert(0, static_cast<size_t>(decimals) + 1 - digits.size(), '0');
        }
        std::string int_part = digits.substr(0, digits.size() - decimals);
        std::string frac_part = digits.substr(digits.size() - decimals);

        size_t end = frac_part.find_last_not_of('0');
        if (end == std::string::npos)
        {
            return int_part;
        }
        return int_part + "." + frac_part.substr(0, end + 1);
    }

    double to_units(const Uint256 &raw, int decimals)
    {
        return std::stod(format_units(raw, decimals));
    }

    Uint256 parse_units(double amount, int decimals)
    {
        if (!std::isfinite(amount) || amount < 0.0)
        {
            throw std::invalid_argument("amount must be a finite non-negative number");
        }

        // Go through a fixed-point string so 3.0299999999 does not turn into 3029999...
        double rounded = std::floor(amount * 1e10) / 1e10;

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(10) << rounded;
        std::string str = oss.str();

        std::string int_part = str;
        std::string frac_part;
        size_t dot_pos = str.find('.');
        if (dot_pos != std::string::npos)
        {
            int_part = str.substr(0, dot_pos);
            frac_part = str.substr(dot_pos + 1);
        }

        while (frac_part.length() < static_cast<size_t>(decimals))
        {
            frac_part += '0';
        }
        if (frac_part.length() > static_cast<size_t>(decimals))
        {
            frac_part = frac_part.substr(0, decimals);
        }

        std::string result = int_part + frac_part;
        size_t first_nonzero = result.find_first_not_of('0');
        if (first_nonzero == std::string::npos)
        {
            return Uint256();
        }
        return Uint256::from_dec(result.substr(first_nonzero));
    }

} // namespace v3lp
