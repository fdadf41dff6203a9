#include <qng/evm/rlp.hpp>

namespace
{
std::vector<uint8_t> MinimalBigEndian(qng::uint256_t value)
{
    std::vector<uint8_t> result;
    while (value > 0)
    {
        result.insert(result.begin(), static_cast<uint8_t>(value & 0xff));
        value >>= 8;
    }
    return result;
}
}  // namespace

std::vector<uint8_t> qng::RlpLengthPrefix(size_t size, uint8_t offset)
{
    std::vector<uint8_t> result;
    if (size < 56)
    {
        result.push_back(static_cast<uint8_t>(offset + size));
        return result;
    }

    std::vector<uint8_t> length = MinimalBigEndian(qng::uint256_t(size));
    result.push_back(static_cast<uint8_t>(offset + 55 + length.size()));
    result.insert(result.end(), length.begin(), length.end());
    return result;
}

std::vector<uint8_t> qng::RlpEncodeBytes(const std::vector<uint8_t>& bytes)
{
    if (bytes.size() == 1 && bytes[0] < 0x80)
    {
        return bytes;
    }

    std::vector<uint8_t> result = qng::RlpLengthPrefix(bytes.size(), 0x80);
    result.insert(result.end(), bytes.begin(), bytes.end());
    return result;
}

std::vector<uint8_t> qng::RlpEncodeUint(const qng::uint256_t& value)
{
    return qng::RlpEncodeBytes(MinimalBigEndian(value));
}

qng::RlpStream& qng::RlpStream::AppendBytes(const uint8_t* data, size_t size)
{
    return AppendBytes(std::vector<uint8_t>(data, data + size));
}

qng::RlpStream& qng::RlpStream::AppendBytes(const std::vector<uint8_t>& bytes)
{
    return AppendRaw(qng::RlpEncodeBytes(bytes));
}

qng::RlpStream& qng::RlpStream::AppendString(const std::string& str)
{
    return AppendBytes(std::vector<uint8_t>(str.begin(), str.end()));
}

qng::RlpStream& qng::RlpStream::AppendUint(const qng::uint256_t& value)
{
    return AppendRaw(qng::RlpEncodeUint(value));
}

qng::RlpStream& qng::RlpStream::AppendAddress(const qng::EvmAddress& address)
{
    return AppendBytes(address.bytes.data(), address.bytes.size());
}

qng::RlpStream& qng::RlpStream::AppendList(const qng::RlpStream& list)
{
    return AppendRaw(list.Encode());
}

qng::RlpStream& qng::RlpStream::AppendRaw(const std::vector<uint8_t>& raw)
{
    data_.insert(data_.end(), raw.begin(), raw.end());
    return *this;
}

std::vector<uint8_t> qng::RlpStream::Encode() const
{
    std::vector<uint8_t> result = qng::RlpLengthPrefix(data_.size(), 0xc0);
    result.insert(result.end(), data_.begin(), data_.end());
    return result;
}

const std::vector<uint8_t>& qng::RlpStream::Bytes() const
{
    return data_;
}
