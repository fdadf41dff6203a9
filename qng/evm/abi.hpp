#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <qng/common/numbers.hpp>

namespace qng
{
// Solidity ABI encoding of a flat argument list, dynamic arguments are
// placed in the tail and referenced by offset from the head
class AbiEncoder
{
public:
    AbiEncoder& Uint(const qng::uint256_t&);
    AbiEncoder& Bool(bool);
    AbiEncoder& Address(const qng::EvmAddress&);
    AbiEncoder& Bytes32(const qng::uint256_union&);
    AbiEncoder& Bytes(const std::vector<uint8_t>&);
    AbiEncoder& String(const std::string&);

    std::vector<uint8_t> Encode() const;
    // Selector followed by the encoded arguments
    std::vector<uint8_t> EncodeCall(const std::vector<uint8_t>&) const;

private:
    class Entry
    {
    public:
        bool dynamic_;
        std::vector<uint8_t> data_;
    };
    std::vector<Entry> entries_;
};

// Reads head words and offset-referenced tails of ABI encoded data.
// Methods return true on error.
class AbiDecoder
{
public:
    AbiDecoder(const std::vector<uint8_t>&);
    AbiDecoder(const std::vector<uint8_t>&, size_t);

    bool Word(size_t, qng::uint256_union&) const;
    bool Uint(size_t, qng::uint256_t&) const;
    bool Uint64(size_t, uint64_t&) const;
    bool Bool(size_t, bool&) const;
    bool Address(size_t, qng::EvmAddress&) const;
    bool Bytes(size_t, std::vector<uint8_t>&) const;
    bool String(size_t, std::string&) const;
    // Tuple or array payload referenced by the offset in a head word
    bool Child(size_t, qng::AbiDecoder&) const;
    // Element count of a dynamic array; its elements follow as a new frame
    bool Array(size_t, qng::AbiDecoder&, size_t&) const;

    static size_t constexpr WORD_SIZE = 32;

private:
    bool Offset_(size_t, size_t&) const;

    const std::vector<uint8_t>* data_;
    size_t base_;
};
}  // namespace qng
