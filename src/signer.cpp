#include "signer.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <algorithm>

namespace v3lp
{

    namespace rlp
    {
        namespace
        {
            std::vector<uint8_t> length_prefix(size_t len, uint8_t short_base, uint8_t long_base)
            {
                if (len <= 55)
                {
                    return {static_cast<uint8_t>(short_base + len)};
                }
                std::vector<uint8_t> len_bytes;
                for (size_t v = len; v > 0; v >>= 8)
                {
                    len_bytes.insert(len_bytes.begin(), static_cast<uint8_t>(v & 0xFF));
                }
                std::vector<uint8_t> prefix{static_cast<uint8_t>(long_base + len_bytes.size())};
                prefix.insert(prefix.end(), len_bytes.begin(), len_bytes.end());
                return prefix;
            }
        } // namespace

        std::vector<uint8_t> encode_bytes(const std::vector<uint8_t> &bytes)
        {
            if (bytes.size() == 1 && bytes[0] < 0x80)
            {
                return bytes;
            }
            auto out = length_prefix(bytes.size(), 0x80, 0xb7);
            out.insert(out.end(), bytes.begin(), bytes.end());
            return out;
        }

        std::vector<uint8_t> encode_uint(const Uint256 &value)
        {
            auto word = value.to_word();
            size_t first = 0;
            while (first < word.size() && word[first] == 0)
            {
                first++;
            }
            return encode_bytes(std::vector<uint8_t>(word.begin() + first, word.end()));
        }

        std::vector<uint8_t> encode_list(const std::vector<std::vector<uint8_t>> &items)
        {
            std::vector<uint8_t> payload;
            for (const auto &item : items)
            {
                payload.insert(payload.end(), item.begin(), item.end());
            }
            auto out = length_prefix(payload.size(), 0xc0, 0xf7);
            out.insert(out.end(), payload.begin(), payload.end());
            return out;
        }
    } // namespace rlp

    namespace
    {
        std::vector<std::vector<uint8_t>> unsigned_fields(const TransactionIntent &intent)
        {
            return {
                rlp::encode_uint(Uint256(intent.nonce)),
                rlp::encode_uint(intent.gas_price),
                rlp::encode_uint(Uint256(intent.gas_limit)),
                rlp::encode_bytes(from_hex(normalize_address(intent.to))),
                rlp::encode_uint(intent.value),
                rlp::encode_bytes(from_hex(intent.data.empty() ? "0x" : intent.data)),
            };
        }
    } // namespace

    LocalKeySigner::LocalKeySigner(const std::string &private_key)
        : secp256k1_ctx_(nullptr)
    {
        try
        {
            private_key_ = from_hex(private_key);
        }
        catch (const std::invalid_argument &)
        {
            throw SigningError("private key is not valid hex");
        }
        if (private_key_.size() != 32)
        {
            throw SigningError("Invalid private key length");
        }
        secp256k1_ctx_ = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
        if (!secp256k1_ctx_)
        {
            throw SigningError("Failed to create secp256k1 context");
        }
        try
        {
            address_ = derive_address();
        }
        catch (...)
        {
            secp256k1_context_destroy(static_cast<secp256k1_context *>(secp256k1_ctx_));
            throw;
        }
    }

    LocalKeySigner::~LocalKeySigner()
    {
        std::fill(private_key_.begin(), private_key_.end(), 0);
        if (secp256k1_ctx_)
        {
            secp256k1_context_destroy(static_cast<secp256k1_context *>(secp256k1_ctx_));
        }
    }

    std::string LocalKeySigner::derive_address()
    {
        auto ctx = static_cast<secp256k1_context *>(secp256k1_ctx_);
        secp256k1_pubkey pubkey;
        if (!secp256k1_ec_pubkey_create(ctx, &pubkey, private_key_.data()))
        {
            throw SigningError("Failed to create public key");
        }
        uint8_t pubkey_serialized[65];
        size_t pubkey_len = 65;
        secp256k1_ec_pubkey_serialize(ctx, pubkey_serialized, &pubkey_len, &pubkey, SECP256K1_EC_UNCOMPRESSED);
        std::vector<uint8_t> pubkey_data(pubkey_serialized + 1, pubkey_serialized + 65);
        auto hash = keccak256(pubkey_data);

        return to_checksum_address(to_hex(std::vector<uint8_t>(hash.begin() + 12, hash.end())));
    }

    std::array<uint8_t, 32> LocalKeySigner::signing_hash(const TransactionIntent &intent, uint64_t chain_id) const
    {
        auto fields = unsigned_fields(intent);
        fields.push_back(rlp::encode_uint(Uint256(chain_id)));
        fields.push_back(rlp::encode_uint(Uint256()));
        fields.push_back(rlp::encode_uint(Uint256()));
        return keccak256(rlp::encode_list(fields));
    }

    std::string LocalKeySigner::sign(const TransactionIntent &intent, uint64_t chain_id)
    {
        auto ctx = static_cast<secp256k1_context *>(secp256k1_ctx_);
        auto hash = signing_hash(intent, chain_id);

        secp256k1_ecdsa_recoverable_signature sig;
        if (!secp256k1_ecdsa_sign_recoverable(ctx, &sig, hash.data(), private_key_.data(), nullptr, nullptr))
        {
            throw SigningError("Failed to sign " + intent.method + " transaction");
        }
        uint8_t sig_serialized[64];
        int recid;
        secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx, sig_serialized, &recid, &sig);

        Uint256 r = Uint256::from_bytes(sig_serialized, 32);
        Uint256 s = Uint256::from_bytes(sig_serialized + 32, 32);
        Uint256 v = Uint256(chain_id) * Uint256(2) + Uint256(35 + static_cast<uint64_t>(recid));

        auto fields = unsigned_fields(intent);
        fields.push_back(rlp::encode_uint(v));
        fields.push_back(rlp::encode_uint(r));
        fields.push_back(rlp::encode_uint(s));
        return to_hex(rlp::encode_list(fields));
    }

} // namespace v3lp
