#include "abi.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include <cstring>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace v3lp
{

    namespace
    {
        // Width N of "uintN"/"intN"/"bytesN"; bare "uint"/"int" mean 256
        int type_width(const std::string &type, const std::string &prefix)
        {
            std::string digits = type.substr(prefix.size());
            if (digits.empty())
            {
                return 256;
            }
            int width = std::stoi(digits);
            return width;
        }

        bool starts_with(const std::string &s, const std::string &prefix)
        {
            return s.compare(0, prefix.size(), prefix) == 0;
        }

        std::string canonical_type(const json &param)
        {
            std::string type = param.at("type").get<std::string>();
            if (starts_with(type, "tuple"))
            {
                std::string inner;
                for (const auto &component : param.at("components"))
                {
                    if (!inner.empty())
                    {
                        inner += ",";
                    }
                    inner += canonical_type(component);
                }
                return "(" + inner + ")" + type.substr(5);
            }
            return type;
        }

        void flatten_type(const json &param, std::vector<std::string> &out)
        {
            std::string type = param.at("type").get<std::string>();
            if (type == "tuple")
            {
                for (const auto &component : param.at("components"))
                {
                    flatten_type(component, out);
                }
                return;
            }
            out.push_back(starts_with(type, "tuple") ? canonical_type(param) : type);
        }

        std::string selector_of(const std::string &signature)
        {
            auto hash = keccak256(signature);
            return to_hex(std::vector<uint8_t>(hash.begin(), hash.begin() + 4));
        }

        Uint256 two_complement_negate(const Uint256 &magnitude)
        {
            // 2^256 - m, written so nothing exceeds 256 bits
            return Uint256::max_uint256() - (magnitude - Uint256(1));
        }
    } // namespace

    namespace abi
    {
        std::array<uint8_t, 32> encode_word(const std::string &type, const std::string &value)
        {
            std::array<uint8_t, 32> word{};

            if (type == "address")
            {
                auto bytes = from_hex(normalize_address(value));
                std::memcpy(word.data() + 12, bytes.data(), 20);
                return word;
            }
            if (type == "bool")
            {
                if (value != "true" && value != "false" && value != "1" && value != "0")
                {
                    throw std::invalid_argument("invalid bool '" + value + "'");
                }
                word[31] = (value == "true" || value == "1") ? 1 : 0;
                return word;
            }
            if (starts_with(type, "uint"))
            {
                int width = type_width(type, "uint");
                Uint256 v = starts_with(value, "0x") ? Uint256::from_hex(value) : Uint256::from_dec(value);
                if (v.bits() > width)
                {
                    throw std::invalid_argument(value + " does not fit in " + type);
                }
                return v.to_word();
            }
            if (starts_with(type, "int"))
            {
                int width = type_width(type, "int");
                bool negative = !value.empty() && value[0] == '-';
                Uint256 magnitude = Uint256::from_dec(negative ? value.substr(1) : value);
                if (negative && !magnitude.is_zero())
                {
                    if ((magnitude - Uint256(1)).bits() > width - 1)
                    {
                        throw std::invalid_argument(value + " does not fit in " + type);
                    }
                    return two_complement_negate(magnitude).to_word();
                }
                if (magnitude.bits() > width - 1)
                {
                    throw std::invalid_argument(value + " does not fit in " + type);
                }
                return magnitude.to_word();
            }
            if (starts_with(type, "bytes") && type.size() > 5)
            {
                int width = type_width(type, "bytes");
                auto bytes = from_hex(value);
                if (width > 32 || bytes.size() != static_cast<size_t>(width))
                {
                    throw std::invalid_argument(value + " is not a " + type);
                }
                std::memcpy(word.data(), bytes.data(), bytes.size());
                return word;
            }
            throw std::invalid_argument("unsupported ABI type '" + type + "'");
        }

        std::string decode_word(const std::string &type, const uint8_t *word)
        {
            if (type == "address")
            {
                return to_hex(std::vector<uint8_t>(word + 12, word + 32));
            }
            if (type == "bool")
            {
                Uint256 v = Uint256::from_bytes(word, 32);
                return v.is_zero() ? "false" : "true";
            }
            if (starts_with(type, "uint"))
            {
                return Uint256::from_bytes(word, 32).to_dec();
            }
            if (starts_with(type, "int"))
            {
                Uint256 v = Uint256::from_bytes(word, 32);
                if (v.bit(255))
                {
                    Uint256 magnitude = (Uint256::max_uint256() - v) + Uint256(1);
                    return "-" + magnitude.to_dec();
                }
                return v.to_dec();
            }
            if (starts_with(type, "bytes") && type.size() > 5)
            {
                int width = type_width(type, "bytes");
                if (width > 32)
                {
                    throw std::invalid_argument("unsupported ABI type '" + type + "'");
                }
                return to_hex(std::vector<uint8_t>(word, word + width));
            }
            throw std::invalid_argument("unsupported ABI type '" + type + "'");
        }

        std::vector<uint8_t> encode(const std::vector<std::string> &types, const AbiValues &values)
        {
            if (types.size() != values.size())
            {
                throw std::invalid_argument("expected " + std::to_string(types.size()) + " ABI values, got " +
                                            std::to_string(values.size()));
            }
            std::vector<uint8_t> encoded;
            encoded.reserve(types.size() * 32);
            for (size_t i = 0; i < types.size(); i++)
            {
                auto word = encode_word(types[i], values[i]);
                encoded.insert(encoded.end(), word.begin(), word.end());
            }
            return encoded;
        }

        AbiValues decode(const std::vector<std::string> &types, const std::vector<uint8_t> &data, size_t offset)
        {
            if (data.size() < offset + types.size() * 32)
            {
                throw std::invalid_argument("ABI data too short: " + std::to_string(data.size() - offset) +
                                            " bytes for " + std::to_string(types.size()) + " words");
            }
            AbiValues values;
            values.reserve(types.size());
            for (size_t i = 0; i < types.size(); i++)
            {
                values.push_back(decode_word(types[i], data.data() + offset + i * 32));
            }
            return values;
        }
    } // namespace abi

    ContractAbi ContractAbi::from_json(const json &abi, const std::string &name)
    {
        ContractAbi contract;
        contract.name_ = name;

        for (const auto &entry : abi)
        {
            std::string kind = entry.value("type", "function");
            if (kind != "function" && kind != "event")
            {
                continue;
            }

            std::string entry_name = entry.at("name").get<std::string>();
            std::string params;
            for (const auto &input : entry.value("inputs", json::array()))
            {
                if (!params.empty())
                {
                    params += ",";
                }
                params += canonical_type(input);
            }
            std::string signature = entry_name + "(" + params + ")";

            if (kind == "function")
            {
                AbiFunction fn;
                fn.name = entry_name;
                fn.signature = signature;
                fn.selector = selector_of(signature);
                for (const auto &input : entry.value("inputs", json::array()))
                {
                    flatten_type(input, fn.inputs);
                }
                for (const auto &output : entry.value("outputs", json::array()))
                {
                    flatten_type(output, fn.outputs);
                }
                contract.functions_[entry_name] = std::move(fn);
            }
            else
            {
                AbiEvent ev;
                ev.name = entry_name;
                ev.signature = signature;
                ev.topic = to_hex(keccak256(signature));
                for (const auto &input : entry.value("inputs", json::array()))
                {
                    ev.types.push_back(canonical_type(input));
                    ev.indexed.push_back(input.value("indexed", false));
                }
                contract.events_[entry_name] = std::move(ev);
            }
        }
        return contract;
    }

    ContractAbi ContractAbi::load(const std::string &path, const std::string &name)
    {
        std::ifstream file(path);
        if (!file)
        {
            throw ConfigError("cannot open ABI file " + path);
        }
        try
        {
            return from_json(json::parse(file), name);
        }
        catch (const json::exception &e)
        {
            throw ConfigError("malformed ABI file " + path + ": " + e.what());
        }
    }

    const AbiFunction &ContractAbi::function(const std::string &name) const
    {
        auto it = functions_.find(name);
        if (it == functions_.end())
        {
            throw std::invalid_argument(name_ + " ABI has no function '" + name + "'");
        }
        return it->second;
    }

    const AbiFunction *ContractAbi::find_by_selector(const std::string &selector) const
    {
        for (const auto &[fn_name, fn] : functions_)
        {
            if (fn.selector == selector)
            {
                return &fn;
            }
        }
        return nullptr;
    }

    const AbiEvent &ContractAbi::event(const std::string &name) const
    {
        auto it = events_.find(name);
        if (it == events_.end())
        {
            throw std::invalid_argument(name_ + " ABI has no event '" + name + "'");
        }
        return it->second;
    }

    std::string ContractAbi::encode_call(const std::string &function_name, const AbiValues &args) const
    {
        const auto &fn = function(function_name);
        auto data = from_hex(fn.selector);
        auto encoded = abi::encode(fn.inputs, args);
        data.insert(data.end(), encoded.begin(), encoded.end());
        return to_hex(data);
    }

    AbiValues ContractAbi::decode_result(const std::string &function_name, const std::string &hex) const
    {
        const auto &fn = function(function_name);
        return abi::decode(fn.outputs, from_hex(hex));
    }

    AbiValues ContractAbi::decode_call(const std::string &data, std::string &function_name) const
    {
        auto bytes = from_hex(data);
        if (bytes.size() < 4)
        {
            throw std::invalid_argument("calldata shorter than a selector");
        }
        std::string selector = to_hex(std::vector<uint8_t>(bytes.begin(), bytes.begin() + 4));
        const AbiFunction *fn = find_by_selector(selector);
        if (!fn)
        {
            throw std::invalid_argument(name_ + " ABI has no function with selector " + selector);
        }
        function_name = fn->name;
        return abi::decode(fn->inputs, bytes, 4);
    }

    AbiValues ContractAbi::decode_event(const std::string &event_name, const LogEntry &log) const
    {
        const auto &ev = event(event_name);
        if (log.topics.empty() || log.topics[0] != ev.topic)
        {
            throw std::invalid_argument("log is not a " + ev.signature + " event");
        }

        auto data = from_hex(log.data.empty() ? "0x" : log.data);
        AbiValues values;
        size_t topic_index = 1;
        size_t data_offset = 0;
        for (size_t i = 0; i < ev.types.size(); i++)
        {
            if (ev.indexed[i])
            {
                if (topic_index >= log.topics.size())
                {
                    throw std::invalid_argument(ev.signature + " log is missing indexed topics");
                }
                auto topic = from_hex(log.topics[topic_index++]);
                if (topic.size() != 32)
                {
                    throw std::invalid_argument("log topic is not 32 bytes");
                }
                values.push_back(abi::decode_word(ev.types[i], topic.data()));
            }
            else
            {
                if (data.size() < data_offset + 32)
                {
                    throw std::invalid_argument(ev.signature + " log data too short");
                }
                values.push_back(abi::decode_word(ev.types[i], data.data() + data_offset));
                data_offset += 32;
            }
        }
        return values;
    }

    AbiSet AbiSet::load_dir(const std::string &dir)
    {
        std::string base = dir;
        if (!base.empty() && base.back() != '/')
        {
            base += '/';
        }
        AbiSet set;
        set.position_manager = ContractAbi::load(base + "NonfungiblePositionManager.json", "NonfungiblePositionManager");
        set.factory = ContractAbi::load(base + "UniswapV3Factory.json", "UniswapV3Factory");
        set.pool = ContractAbi::load(base + "UniswapV3Pool.json", "UniswapV3Pool");
        set.erc20 = ContractAbi::load(base + "ERC20.json", "ERC20");
        return set;
    }

} // namespace v3lp
