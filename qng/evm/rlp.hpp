#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <qng/common/numbers.hpp>

namespace qng
{
// Recursive length prefix encoding. Items are appended in order, Encode()
// wraps them as a list, Bytes() returns them unwrapped.
class RlpStream
{
public:
    RlpStream& AppendBytes(const uint8_t*, size_t);
    RlpStream& AppendBytes(const std::vector<uint8_t>&);
    RlpStream& AppendString(const std::string&);
    RlpStream& AppendUint(const qng::uint256_t&);
    RlpStream& AppendAddress(const qng::EvmAddress&);
    RlpStream& AppendList(const qng::RlpStream&);
    RlpStream& AppendRaw(const std::vector<uint8_t>&);

    std::vector<uint8_t> Encode() const;
    const std::vector<uint8_t>& Bytes() const;

private:
    std::vector<uint8_t> data_;
};

std::vector<uint8_t> RlpLengthPrefix(size_t, uint8_t);
std::vector<uint8_t> RlpEncodeBytes(const std::vector<uint8_t>&);
std::vector<uint8_t> RlpEncodeUint(const qng::uint256_t&);
}  // namespace qng
