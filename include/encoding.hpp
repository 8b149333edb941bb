#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace v3lp
{

    // Hex helpers (output is 0x-prefixed lowercase)
    std::string to_hex(const std::vector<uint8_t> &data);
    std::string to_hex(const std::array<uint8_t, 32> &data);
    std::vector<uint8_t> from_hex(const std::string &hex);

    std::array<uint8_t, 32> keccak256(const std::vector<uint8_t> &data);
    std::array<uint8_t, 32> keccak256(const std::string &data);

    // Lowercase 0x-prefixed 20-byte address; throws std::invalid_argument otherwise
    std::string normalize_address(const std::string &address);

    // EIP-55 mixed-case form
    std::string to_checksum_address(const std::string &address);

    bool is_zero_address(const std::string &address);

    // Numeric ordering of two addresses (the protocol's token0 < token1 rule)
    bool address_less(const std::string &a, const std::string &b);

    // Address left-padded to a 32-byte log topic
    std::string address_topic(const std::string &address);

    extern const std::string ZERO_ADDRESS;

} // namespace v3lp
