#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace v3lp
{

    // ABI values travel as strings: addresses as 0x-hex, integers in decimal
    // (negative ints with a leading '-'), bools as "true"/"false", bytesN as 0x-hex.
    using AbiValues = std::vector<std::string>;

    struct AbiFunction
    {
        std::string name;
        std::string signature; // canonical, e.g. "balanceOf(address)"
        std::string selector;  // 0x + 4 bytes
        std::vector<std::string> inputs;  // static tuples flattened to their members
        std::vector<std::string> outputs;
    };

    struct AbiEvent
    {
        std::string name;
        std::string signature;
        std::string topic; // keccak256(signature)
        std::vector<std::string> types;
        std::vector<bool> indexed;
    };

    // One contract's ABI, loaded from the standard JSON description.
    // Encoding and decoding cover the static types (address, bool, intN,
    // uintN, bytesN and static tuples of them); anything else throws
    // std::invalid_argument when used.
    class ContractAbi
    {
    public:
        ContractAbi() = default;

        static ContractAbi from_json(const nlohmann::json &abi, const std::string &name);
        static ContractAbi load(const std::string &path, const std::string &name);

        const std::string &name() const { return name_; }

        const AbiFunction &function(const std::string &name) const;
        const AbiFunction *find_by_selector(const std::string &selector) const;
        const AbiEvent &event(const std::string &name) const;

        std::string encode_call(const std::string &function, const AbiValues &args) const;
        AbiValues decode_result(const std::string &function, const std::string &hex) const;

        // Decodes calldata back into its arguments (used by test doubles and logs)
        AbiValues decode_call(const std::string &data, std::string &function_name) const;

        // Event arguments in declaration order, indexed ones taken from topics
        AbiValues decode_event(const std::string &event, const LogEntry &log) const;

    private:
        std::string name_;
        std::map<std::string, AbiFunction> functions_;
        std::map<std::string, AbiEvent> events_;
    };

    // The four contracts the gateway talks to
    struct AbiSet
    {
        ContractAbi position_manager;
        ContractAbi factory;
        ContractAbi pool;
        ContractAbi erc20;

        // Reads NonfungiblePositionManager.json, UniswapV3Factory.json,
        // UniswapV3Pool.json and ERC20.json from `dir`
        static AbiSet load_dir(const std::string &dir);
    };

    namespace abi
    {
        std::array<uint8_t, 32> encode_word(const std::string &type, const std::string &value);
        std::string decode_word(const std::string &type, const uint8_t *word);

        std::vector<uint8_t> encode(const std::vector<std::string> &types, const AbiValues &values);
        AbiValues decode(const std::vector<std::string> &types, const std::vector<uint8_t> &data, size_t offset = 0);
    } // namespace abi

} // namespace v3lp
