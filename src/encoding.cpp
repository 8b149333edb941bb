#include "encoding.hpp"
#include <ethash/keccak.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace v3lp
{

    const std::string ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";

    std::string to_hex(const std::vector<uint8_t> &data)
    {
        std::stringstream ss;
        ss << "0x";
        for (auto b : data)
        {
            ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
        }
        return ss.str();
    }

    std::string to_hex(const std::array<uint8_t, 32> &data)
    {
        return to_hex(std::vector<uint8_t>(data.begin(), data.end()));
    }

    std::vector<uint8_t> from_hex(const std::string &hex)
    {
        std::string h = hex;
        if (h.substr(0, 2) == "0x" || h.substr(0, 2) == "0X")
        {
            h = h.substr(2);
        }
        if (h.size() % 2 != 0)
        {
            throw std::invalid_argument("odd-length hex string");
        }
        std::vector<uint8_t> result;
        result.reserve(h.size() / 2);
        for (size_t i = 0; i < h.size(); i += 2)
        {
            if (!std::isxdigit(static_cast<unsigned char>(h[i])) ||
                !std::isxdigit(static_cast<unsigned char>(h[i + 1])))
            {
                throw std::invalid_argument("invalid hex digit in '" + hex + "'");
            }
            uint8_t byte = static_cast<uint8_t>(std::stoi(h.substr(i, 2), nullptr, 16));
            result.push_back(byte);
        }
        return result;
    }

    std::array<uint8_t, 32> keccak256(const std::vector<uint8_t> &data)
    {
        auto hash = ethash::keccak256(data.data(), data.size());
        std::array<uint8_t, 32> result;
        std::memcpy(result.data(), hash.bytes, 32);
        return result;
    }

    std::array<uint8_t, 32> keccak256(const std::string &data)
    {
        std::vector<uint8_t> bytes(data.begin(), data.end());
        return keccak256(bytes);
    }

    std::string normalize_address(const std::string &address)
    {
        std::string h = address;
        if (h.substr(0, 2) == "0x" || h.substr(0, 2) == "0X")
        {
            h = h.substr(2);
        }
        if (h.size() != 40 || !std::all_of(h.begin(), h.end(), [](unsigned char c)
                                           { return std::isxdigit(c); }))
        {
            throw std::invalid_argument("invalid address: '" + address + "'");
        }
        std::transform(h.begin(), h.end(), h.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return "0x" + h;
    }

    std::string to_checksum_address(const std::string &address)
    {
        std::string addr_lower = normalize_address(address).substr(2);
        auto addr_hash = keccak256(addr_lower);

        std::stringstream ss;
        ss << "0x";
        for (size_t i = 0; i < 40; i++)
        {
            char c = addr_lower[i];
            if (c >= 'a' && c <= 'f')
            {
                int hash_nibble = (addr_hash[i / 2] >> (i % 2 == 0 ? 4 : 0)) & 0x0F;
                if (hash_nibble >= 8)
                {
                    c = static_cast<char>(std::toupper(c));
                }
            }
            ss << c;
        }
        return ss.str();
    }

    bool is_zero_address(const std::string &address)
    {
        return normalize_address(address) == ZERO_ADDRESS;
    }

    bool address_less(const std::string &a, const std::string &b)
    {
        // Same-length lowercase hex compares the same as the numeric value
        return normalize_address(a) < normalize_address(b);
    }

    std::string address_topic(const std::string &address)
    {
        return "0x" + std::string(24, '0') + normalize_address(address).substr(2);
    }

} // namespace v3lp
