#include <qng/evm/abi.hpp>

#include <limits>
#include <qng/common/util.hpp>

size_t constexpr qng::AbiDecoder::WORD_SIZE;

namespace
{
std::vector<uint8_t> PadRight(const std::vector<uint8_t>& data)
{
    std::vector<uint8_t> result(data);
    size_t remainder = result.size() % qng::AbiDecoder::WORD_SIZE;
    if (remainder != 0)
    {
        result.resize(result.size() + qng::AbiDecoder::WORD_SIZE - remainder,
                      0);
    }
    return result;
}

std::vector<uint8_t> WordBytes(const qng::uint256_union& word)
{
    return std::vector<uint8_t>(word.bytes.begin(), word.bytes.end());
}
}  // namespace

qng::AbiEncoder& qng::AbiEncoder::Uint(const qng::uint256_t& value)
{
    entries_.push_back({false, WordBytes(qng::uint256_union(value))});
    return *this;
}

qng::AbiEncoder& qng::AbiEncoder::Bool(bool value)
{
    return Uint(value ? 1 : 0);
}

qng::AbiEncoder& qng::AbiEncoder::Address(const qng::EvmAddress& address)
{
    entries_.push_back({false, WordBytes(address.ToWord())});
    return *this;
}

qng::AbiEncoder& qng::AbiEncoder::Bytes32(const qng::uint256_union& value)
{
    entries_.push_back({false, WordBytes(value)});
    return *this;
}

qng::AbiEncoder& qng::AbiEncoder::Bytes(const std::vector<uint8_t>& bytes)
{
    std::vector<uint8_t> data =
        WordBytes(qng::uint256_union(static_cast<uint64_t>(bytes.size())));
    std::vector<uint8_t> padded = PadRight(bytes);
    data.insert(data.end(), padded.begin(), padded.end());
    entries_.push_back({true, data});
    return *this;
}

qng::AbiEncoder& qng::AbiEncoder::String(const std::string& str)
{
    return Bytes(std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> qng::AbiEncoder::Encode() const
{
    std::vector<uint8_t> head;
    std::vector<uint8_t> tail;
    size_t head_size = entries_.size() * qng::AbiDecoder::WORD_SIZE;
    for (const auto& entry : entries_)
    {
        if (entry.dynamic_)
        {
            qng::uint256_union offset(
                static_cast<uint64_t>(head_size + tail.size()));
            head.insert(head.end(), offset.bytes.begin(), offset.bytes.end());
            tail.insert(tail.end(), entry.data_.begin(), entry.data_.end());
        }
        else
        {
            head.insert(head.end(), entry.data_.begin(), entry.data_.end());
        }
    }
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

std::vector<uint8_t> qng::AbiEncoder::EncodeCall(
    const std::vector<uint8_t>& selector) const
{
    std::vector<uint8_t> result(selector);
    std::vector<uint8_t> encoded = Encode();
    result.insert(result.end(), encoded.begin(), encoded.end());
    return result;
}

qng::AbiDecoder::AbiDecoder(const std::vector<uint8_t>& data)
    : data_(&data), base_(0)
{
}

qng::AbiDecoder::AbiDecoder(const std::vector<uint8_t>& data, size_t base)
    : data_(&data), base_(base)
{
}

bool qng::AbiDecoder::Word(size_t index, qng::uint256_union& word) const
{
    size_t begin = base_ + index * WORD_SIZE;
    if (begin < base_ || begin + WORD_SIZE > data_->size())
    {
        return true;
    }
    std::copy(data_->begin() + begin, data_->begin() + begin + WORD_SIZE,
              word.bytes.begin());
    return false;
}

bool qng::AbiDecoder::Uint(size_t index, qng::uint256_t& value) const
{
    qng::uint256_union word;
    bool error = Word(index, word);
    IF_ERROR_RETURN(error, true);
    value = word.Number();
    return false;
}

bool qng::AbiDecoder::Uint64(size_t index, uint64_t& value) const
{
    qng::uint256_t number;
    bool error = Uint(index, number);
    IF_ERROR_RETURN(error, true);
    if (number > std::numeric_limits<uint64_t>::max())
    {
        return true;
    }
    value = static_cast<uint64_t>(number);
    return false;
}

bool qng::AbiDecoder::Bool(size_t index, bool& value) const
{
    qng::uint256_t number;
    bool error = Uint(index, number);
    IF_ERROR_RETURN(error, true);
    if (number > 1)
    {
        return true;
    }
    value = number == 1;
    return false;
}

bool qng::AbiDecoder::Address(size_t index, qng::EvmAddress& address) const
{
    qng::uint256_union word;
    bool error = Word(index, word);
    IF_ERROR_RETURN(error, true);
    address.FromWord(word);
    return false;
}

bool qng::AbiDecoder::Bytes(size_t index, std::vector<uint8_t>& bytes) const
{
    size_t offset = 0;
    bool error = Offset_(index, offset);
    IF_ERROR_RETURN(error, true);

    qng::AbiDecoder length_decoder(*data_, offset);
    uint64_t length = 0;
    error = length_decoder.Uint64(0, length);
    IF_ERROR_RETURN(error, true);

    size_t begin = offset + WORD_SIZE;
    if (length > data_->size() || begin + length > data_->size())
    {
        return true;
    }
    bytes.assign(data_->begin() + begin, data_->begin() + begin + length);
    return false;
}

bool qng::AbiDecoder::String(size_t index, std::string& str) const
{
    std::vector<uint8_t> bytes;
    bool error = Bytes(index, bytes);
    IF_ERROR_RETURN(error, true);
    str.assign(bytes.begin(), bytes.end());
    return false;
}

bool qng::AbiDecoder::Child(size_t index, qng::AbiDecoder& child) const
{
    size_t offset = 0;
    bool error = Offset_(index, offset);
    IF_ERROR_RETURN(error, true);
    child = qng::AbiDecoder(*data_, offset);
    return false;
}

bool qng::AbiDecoder::Array(size_t index, qng::AbiDecoder& elements,
                            size_t& size) const
{
    qng::AbiDecoder array(*data_);
    bool error = Child(index, array);
    IF_ERROR_RETURN(error, true);

    uint64_t length = 0;
    error = array.Uint64(0, length);
    IF_ERROR_RETURN(error, true);
    if (length > data_->size() / WORD_SIZE)
    {
        return true;
    }

    size = static_cast<size_t>(length);
    elements = qng::AbiDecoder(*data_, array.base_ + WORD_SIZE);
    return false;
}

bool qng::AbiDecoder::Offset_(size_t index, size_t& offset) const
{
    uint64_t relative = 0;
    bool error = Uint64(index, relative);
    IF_ERROR_RETURN(error, true);
    if (relative > data_->size())
    {
        return true;
    }
    offset = base_ + static_cast<size_t>(relative);
    if (offset > data_->size())
    {
        return true;
    }
    return false;
}
