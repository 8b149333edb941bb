#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace v3lp
{

    // Wallet collaborator: turns an intent into a signed raw transaction
    class Signer
    {
    public:
        virtual ~Signer() = default;

        // Address of the signing account (EIP-55 checksummed)
        virtual std::string address() const = 0;

        // 0x-prefixed raw transaction ready for eth_sendRawTransaction
        virtual std::string sign(const TransactionIntent &intent, uint64_t chain_id) = 0;
    };

    // Signs EIP-155 legacy transactions with a secp256k1 private key held in memory
    class LocalKeySigner : public Signer
    {
    public:
        explicit LocalKeySigner(const std::string &private_key);
        ~LocalKeySigner() override;

        LocalKeySigner(const LocalKeySigner &) = delete;
        LocalKeySigner &operator=(const LocalKeySigner &) = delete;

        std::string address() const override { return address_; }

        std::string sign(const TransactionIntent &intent, uint64_t chain_id) override;

        // keccak256 of the unsigned EIP-155 payload
        std::array<uint8_t, 32> signing_hash(const TransactionIntent &intent, uint64_t chain_id) const;

    private:
        std::vector<uint8_t> private_key_;
        std::string address_;
        void *secp256k1_ctx_; // secp256k1_context*

        // Derive address from private key
        std::string derive_address();
    };

    // Recursive-length-prefix encoding for the transaction payload
    namespace rlp
    {
        std::vector<uint8_t> encode_bytes(const std::vector<uint8_t> &bytes);
        std::vector<uint8_t> encode_uint(const Uint256 &value);
        std::vector<uint8_t> encode_list(const std::vector<std::vector<uint8_t>> &items);
    } // namespace rlp

} // namespace v3lp
