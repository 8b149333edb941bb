#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace v3lp
{

    enum class ErrorKind
    {
        InvalidPrice,
        UnknownFeeTier,
        InvalidRange,
        ContractCall,
        InsufficientBalance,
        PositionNotFound,
        UnconfirmedTransaction,
        PreconditionFailed,
        Transport,
        Config,
        Signing,
        PriceUnavailable
    };

    const char *to_string(ErrorKind kind);

    // Base of every error the library throws
    class Error : public std::runtime_error
    {
    public:
        Error(ErrorKind kind, const std::string &message);

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    // TickMath input errors
    class InvalidPrice : public Error
    {
    public:
        explicit InvalidPrice(const std::string &message);
    };

    class UnknownFeeTier : public Error
    {
    public:
        explicit UnknownFeeTier(int fee);
    };

    class InvalidRange : public Error
    {
    public:
        InvalidRange(int tick_lower, int tick_upper);
        explicit InvalidRange(const std::string &detail);
    };

    // Transport failure or contract revert, with the call that failed
    class ContractCallError : public Error
    {
    public:
        ContractCallError(const std::string &context, const std::string &detail);

        const std::string &context() const { return context_; }

    private:
        std::string context_;
    };

    class InsufficientBalance : public Error
    {
    public:
        InsufficientBalance(const std::string &token, const std::string &required, const std::string &available);

        const std::string &token() const { return token_; }
        const std::string &required() const { return required_; }
        const std::string &available() const { return available_; }

    private:
        std::string token_;
        std::string required_;
        std::string available_;
    };

    class PositionNotFound : public Error
    {
    public:
        explicit PositionNotFound(uint64_t token_id);

        uint64_t token_id() const { return token_id_; }

    private:
        uint64_t token_id_;
    };

    // The transaction was sent but no receipt arrived in time; it may still be mined
    class UnconfirmedTransaction : public Error
    {
    public:
        UnconfirmedTransaction(const std::string &tx_hash, const std::string &method);

        const std::string &tx_hash() const { return tx_hash_; }

    private:
        std::string tx_hash_;
    };

    class PreconditionFailed : public Error
    {
    public:
        explicit PreconditionFailed(const std::string &message);
    };

    // JSON-RPC or HTTP level failure
    class RpcError : public Error
    {
    public:
        RpcError(long code, const std::string &message);

        long code() const { return code_; }

    private:
        long code_;
    };

    class ConfigError : public Error
    {
    public:
        explicit ConfigError(const std::string &message);
    };

    class SigningError : public Error
    {
    public:
        explicit SigningError(const std::string &message);
    };

    class PriceUnavailable : public Error
    {
    public:
        PriceUnavailable(const std::string &network, const std::string &token, const std::string &detail);
    };

    // Raised by the orchestrator when a workflow halts. Keeps the cause's kind
    // and the last state the workflow completed so it can be resumed by hand.
    class WorkflowError : public Error
    {
    public:
        WorkflowError(const std::string &workflow, const std::string &reached_state, const std::string &step,
                      const Error &cause, const std::string &tx_hash = "");

        const std::string &workflow() const { return workflow_; }
        const std::string &reached_state() const { return reached_state_; }
        const std::string &step() const { return step_; }
        const std::string &tx_hash() const { return tx_hash_; }

    private:
        std::string workflow_;
        std::string reached_state_;
        std::string step_;
        std::string tx_hash_;
    };

} // namespace v3lp
