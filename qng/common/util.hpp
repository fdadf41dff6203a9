#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <string>
#include <sstream>
#include <type_traits>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include <nlohmann/json.hpp>

namespace qng
{
using Ptree = boost::property_tree::ptree;
// JSON-RPC values, object members keep their wire order
using Json = nlohmann::ordered_json;

std::string BytesToHex(const uint8_t* data, size_t size);
bool HexToBytes(const std::string&, std::vector<uint8_t>&);

// Lower case with "0x" prefix, the form evm nodes expect
std::string BytesToEvmHex(const uint8_t* data, size_t size);
std::string BytesToEvmHex(const std::vector<uint8_t>&);
// Accepts an optional "0x" or "0X" prefix
bool EvmHexToBytes(const std::string&, std::vector<uint8_t>&);
// Quantities are encoded without leading zeros, "0x0" for zero
std::string Uint64ToEvmHex(uint64_t);
bool EvmHexToUint64(const std::string&, uint64_t&);

template <typename T>
bool StringToUint(const std::string& str, T& value)
{
    if (str.empty())
    {
        return true;
    }

    if (str.find_first_not_of("0123456789") != std::string::npos)
    {
        return true;
    }

    if ((str.size() > 1) && ('0' == str[0]))
    {
        return true;
    }

    try
    {
        unsigned long long ull = std::stoull(str);
        if (std::to_string(ull) != str)
        {
            return true;
        }

        if (ull > std::numeric_limits<T>::max())
        {
            return true;
        }

        value = static_cast<T>(ull);
    }
    catch (const std::exception&)
    {
        return true;
    }

    return false;
}

inline bool StringContain(const std::string& str, char c)
{
    return str.find(c) != std::string::npos;
}

void StringLeftTrim(std::string&, const std::string&);
void StringRightTrim(std::string&, const std::string&);
void StringTrim(std::string&, const std::string&);
std::string StringToLower(const std::string&);

template <typename T>
void ToStringStream(std::stringstream& stream, T value)
{
    stream << value;
}

template<typename T, typename... Args>
void ToStringStream(std::stringstream& stream, T value, Args... args)
{
    stream << value;
    ToStringStream(stream, args...);
}

template<typename... Args>
std::string ToString(Args... args)
{
    std::stringstream stream;
    ToStringStream(stream, args...);
    return stream.str();
}

template <class Container>
bool Contain(const Container& container,
              const typename Container::value_type& element)
{
    return std::find(container.begin(), container.end(), element)
           != container.end();
}

class Url
{
public:
    Url();
    Url(const std::string&);
    bool Parse(const std::string&);
    std::string String() const;
    uint16_t DefaultPort() const;
    explicit operator bool() const;
    bool CheckProtocol() const;
    bool Ssl() const;

    std::string protocol_;
    std::string host_;
    uint16_t port_;
    std::string path_;
};

}  // namespace qng

#define IF_ERROR_RETURN(error, ret) \
    if (error)                      \
    {                               \
        return ret;                 \
    }

#define IF_ERROR_RETURN_VOID(error) \
    if (error)                      \
    {                               \
        return;                     \
    }
