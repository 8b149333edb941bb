#include "errors.hpp"

namespace v3lp
{

    const char *to_string(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::InvalidPrice:
            return "InvalidPrice";
        case ErrorKind::UnknownFeeTier:
            return "UnknownFeeTier";
        case ErrorKind::InvalidRange:
            return "InvalidRange";
        case ErrorKind::ContractCall:
            return "ContractCallError";
        case ErrorKind::InsufficientBalance:
            return "InsufficientBalance";
        case ErrorKind::PositionNotFound:
            return "PositionNotFound";
        case ErrorKind::UnconfirmedTransaction:
            return "UnconfirmedTransaction";
        case ErrorKind::PreconditionFailed:
            return "PreconditionFailed";
        case ErrorKind::Transport:
            return "TransportError";
        case ErrorKind::Config:
            return "ConfigError";
        case ErrorKind::Signing:
            return "SigningError";
        case ErrorKind::PriceUnavailable:
            return "PriceUnavailable";
        default:
            return "Unknown";
        }
    }

    Error::Error(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    InvalidPrice::InvalidPrice(const std::string &message)
        : Error(ErrorKind::InvalidPrice, "invalid price: " + message)
    {
    }

    UnknownFeeTier::UnknownFeeTier(int fee)
        : Error(ErrorKind::UnknownFeeTier, "unknown fee tier: " + std::to_string(fee))
    {
    }

    InvalidRange::InvalidRange(int tick_lower, int tick_upper)
        : Error(ErrorKind::InvalidRange,
                "invalid tick range: lower " + std::to_string(tick_lower) +
                    " is not below upper " + std::to_string(tick_upper))
    {
    }

    InvalidRange::InvalidRange(const std::string &detail)
        : Error(ErrorKind::InvalidRange, "invalid tick range: " + detail)
    {
    }

    ContractCallError::ContractCallError(const std::string &context, const std::string &detail)
        : Error(ErrorKind::ContractCall, context + ": " + detail), context_(context)
    {
    }

    InsufficientBalance::InsufficientBalance(const std::string &token, const std::string &required,
                                             const std::string &available)
        : Error(ErrorKind::InsufficientBalance,
                "insufficient balance of " + token + ": need " + required + ", have " + available),
          token_(token), required_(required), available_(available)
    {
    }

    PositionNotFound::PositionNotFound(uint64_t token_id)
        : Error(ErrorKind::PositionNotFound, "position " + std::to_string(token_id) + " not found"),
          token_id_(token_id)
    {
    }

    UnconfirmedTransaction::UnconfirmedTransaction(const std::string &tx_hash, const std::string &method)
        : Error(ErrorKind::UnconfirmedTransaction,
                method + " transaction " + tx_hash + " not confirmed before timeout"),
          tx_hash_(tx_hash)
    {
    }

    PreconditionFailed::PreconditionFailed(const std::string &message)
        : Error(ErrorKind::PreconditionFailed, message)
    {
    }

    RpcError::RpcError(long code, const std::string &message)
        : Error(ErrorKind::Transport, message), code_(code)
    {
    }

    ConfigError::ConfigError(const std::string &message)
        : Error(ErrorKind::Config, message)
    {
    }

    SigningError::SigningError(const std::string &message)
        : Error(ErrorKind::Signing, message)
    {
    }

    PriceUnavailable::PriceUnavailable(const std::string &network, const std::string &token,
                                       const std::string &detail)
        : Error(ErrorKind::PriceUnavailable, "no USD price for " + token + " on " + network + ": " + detail)
    {
    }

    WorkflowError::WorkflowError(const std::string &workflow, const std::string &reached_state,
                                 const std::string &step, const Error &cause, const std::string &tx_hash)
        : Error(cause.kind(), workflow + " halted at step '" + step + "' after state " + reached_state +
                                  ": " + cause.what()),
          workflow_(workflow), reached_state_(reached_state), step_(step), tx_hash_(tx_hash)
    {
    }

} // namespace v3lp
