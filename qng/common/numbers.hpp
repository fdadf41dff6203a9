#pragma once

#include <array>
#include <functional>
#include <string>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>

namespace qng
{
using uint128_t = boost::multiprecision::uint128_t;
using uint256_t = boost::multiprecision::uint256_t;
using uint512_t = boost::multiprecision::uint512_t;

// Big endian 256 bit value, used for hashes, keys and evm words
union uint256_union
{
    uint256_union();
    uint256_union(const qng::uint256_union&) = default;
    uint256_union(uint64_t);
    uint256_union(const qng::uint256_t&);
    bool operator==(const qng::uint256_union&) const;
    bool operator!=(const qng::uint256_union&) const;
    bool operator<(const qng::uint256_union&) const;
    qng::uint256_t Number() const;
    void Clear();
    void SecureClear();
    bool IsZero() const;
    void EncodeHex(std::string&) const;
    bool DecodeHex(const std::string&);
    void EncodeDec(std::string&) const;
    bool DecodeDec(const std::string&);
    // "0x" prefixed lower case, 64 digits
    std::string StringEvmHex() const;
    // Exactly 32 bytes, optional "0x" prefix
    bool DecodeEvmHex(const std::string&);
    // Up to 32 bytes, optional "0x" prefix, shorter input is left padded
    bool DecodeEvmHexPadded(const std::string&);
    std::string StringHex() const;
    std::string StringDec() const;

    std::array<uint8_t, 32> bytes;
    std::array<char, 32> chars;
    std::array<uint32_t, 8> dwords;
    std::array<uint64_t, 4> qwords;
};
using Hash = uint256_union;

union uint512_union
{
    uint512_union();
    uint512_union(const qng::uint512_union&) = default;
    bool operator==(const qng::uint512_union&) const;
    bool operator!=(const qng::uint512_union&) const;
    void Clear();
    bool IsZero() const;
    std::string StringHex() const;

    std::array<uint8_t, 64> bytes;
    std::array<uint64_t, 8> qwords;
    std::array<uint256_union, 2> uint256s;
};
// Uncompressed secp256k1 point without the 0x04 prefix, x then y
using PublicKey = uint512_union;

class RawKey
{
public:
    RawKey() = default;
    ~RawKey();
    bool operator==(const qng::RawKey&) const;
    bool operator!=(const qng::RawKey&) const;
    bool DecodeHex(const std::string&);

    qng::uint256_union data_;
};

class EvmAddress
{
public:
    EvmAddress();
    bool operator==(const qng::EvmAddress&) const;
    bool operator!=(const qng::EvmAddress&) const;
    bool operator<(const qng::EvmAddress&) const;
    void Clear();
    bool IsZero() const;
    // 40 hex digits with optional "0x" prefix, any case
    bool DecodeHex(const std::string&);
    std::string StringHex() const;
    // Low 20 bytes of a 32-byte word
    void FromWord(const qng::uint256_union&);
    qng::uint256_union ToWord() const;

    std::array<uint8_t, 20> bytes;
};

// Evm json quantities, "0x" prefixed hex without leading zeros
std::string EncodeEvmQuantity(const qng::uint256_t&);
bool DecodeEvmQuantity(const std::string&, qng::uint256_t&);
bool DecodeEvmQuantity(const std::string&, uint64_t&);
}  // namespace qng

namespace std
{
template <>
struct hash<qng::uint256_union>
{
    size_t operator()(const qng::uint256_union& data) const
    {
        return static_cast<size_t>(data.qwords[0]);
    }
};
}  // namespace std
