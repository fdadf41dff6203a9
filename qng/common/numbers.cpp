#include <qng/common/numbers.hpp>

#include <iomanip>
#include <sstream>
#include <qng/common/util.hpp>

qng::uint256_union::uint256_union()
{
    qwords.fill(0);
}

qng::uint256_union::uint256_union(uint64_t value)
{
    *this = qng::uint256_t(value);
}

qng::uint256_union::uint256_union(const qng::uint256_t& value)
{
    qng::uint256_t value_l(value);

    for (auto i(bytes.rbegin()), n(bytes.rend()); i != n; ++i)
    {
        *i = static_cast<uint8_t>(value_l & static_cast<uint8_t>(0xff));
        value_l >>= 8;
    }
}

bool qng::uint256_union::operator==(const qng::uint256_union& other) const
{
    return qwords == other.qwords;
}

bool qng::uint256_union::operator!=(const qng::uint256_union& other) const
{
    return !(*this == other);
}

bool qng::uint256_union::operator<(const qng::uint256_union& other) const
{
    return bytes < other.bytes;
}

qng::uint256_t qng::uint256_union::Number() const
{
    qng::uint256_t result;
    int shift = 0;

    for (auto i = bytes.begin(), n = bytes.end(); i != n; ++i)
    {
        result <<= shift;
        result |= *i;
        shift = 8;
    }
    return result;
}

void qng::uint256_union::Clear()
{
    qwords.fill(0);
}

void qng::uint256_union::SecureClear()
{
    for (size_t i = 0; i < qwords.size(); ++i)
    {
        volatile uint64_t& qword = qwords[i];
        qword                    = 0;
    }
}

bool qng::uint256_union::IsZero() const
{
    for (auto i : qwords)
    {
        if (i != 0)
        {
            return false;
        }
    }
    return true;
}

void qng::uint256_union::EncodeHex(std::string& text) const
{
    text = qng::BytesToHex(bytes.data(), bytes.size());
}

bool qng::uint256_union::DecodeHex(const std::string& text)
{
    if (text.size() != 64)
    {
        return true;
    }

    std::vector<uint8_t> decoded;
    bool error = qng::HexToBytes(text, decoded);
    IF_ERROR_RETURN(error, true);
    std::copy(decoded.begin(), decoded.end(), bytes.begin());
    return false;
}

void qng::uint256_union::EncodeDec(std::string& text) const
{
    std::stringstream stream;
    stream << std::dec << std::noshowbase;
    stream << Number();
    text = stream.str();
}

bool qng::uint256_union::DecodeDec(const std::string& text)
{
    size_t size = text.size();
    if (text.empty() || (size > 78) || ((size > 1) && ('0' == text[0]))
        || text.find_first_not_of("0123456789") != std::string::npos)
    {
        return true;
    }

    try
    {
        std::stringstream stream(text);
        boost::multiprecision::checked_uint256_t number;

        stream << std::dec << std::noshowbase;
        stream >> number;
        if (stream.fail())
        {
            return true;
        }
        *this = qng::uint256_t(number);
        return false;
    }
    catch (const std::exception&)
    {
        return true;
    }
}

std::string qng::uint256_union::StringEvmHex() const
{
    return qng::BytesToEvmHex(bytes.data(), bytes.size());
}

bool qng::uint256_union::DecodeEvmHex(const std::string& text)
{
    std::vector<uint8_t> decoded;
    bool error = qng::EvmHexToBytes(text, decoded);
    IF_ERROR_RETURN(error, true);
    if (decoded.size() != bytes.size())
    {
        return true;
    }
    std::copy(decoded.begin(), decoded.end(), bytes.begin());
    return false;
}

bool qng::uint256_union::DecodeEvmHexPadded(const std::string& text)
{
    std::vector<uint8_t> decoded;
    bool error = qng::EvmHexToBytes(text, decoded);
    IF_ERROR_RETURN(error, true);
    if (decoded.size() > bytes.size())
    {
        return true;
    }
    Clear();
    std::copy(decoded.begin(), decoded.end(),
              bytes.begin() + (bytes.size() - decoded.size()));
    return false;
}

std::string qng::uint256_union::StringHex() const
{
    std::string result;
    EncodeHex(result);
    return result;
}

std::string qng::uint256_union::StringDec() const
{
    std::string result;
    EncodeDec(result);
    return result;
}

qng::uint512_union::uint512_union()
{
    qwords.fill(0);
}

bool qng::uint512_union::operator==(const qng::uint512_union& other) const
{
    return qwords == other.qwords;
}

bool qng::uint512_union::operator!=(const qng::uint512_union& other) const
{
    return !(*this == other);
}

void qng::uint512_union::Clear()
{
    qwords.fill(0);
}

bool qng::uint512_union::IsZero() const
{
    return uint256s[0].IsZero() && uint256s[1].IsZero();
}

std::string qng::uint512_union::StringHex() const
{
    return qng::BytesToHex(bytes.data(), bytes.size());
}

qng::RawKey::~RawKey()
{
    data_.SecureClear();
}

bool qng::RawKey::operator==(const qng::RawKey& other) const
{
    return data_ == other.data_;
}

bool qng::RawKey::operator!=(const qng::RawKey& other) const
{
    return !(*this == other);
}

bool qng::RawKey::DecodeHex(const std::string& text)
{
    return data_.DecodeEvmHex(text);
}

qng::EvmAddress::EvmAddress()
{
    bytes.fill(0);
}

bool qng::EvmAddress::operator==(const qng::EvmAddress& other) const
{
    return bytes == other.bytes;
}

bool qng::EvmAddress::operator!=(const qng::EvmAddress& other) const
{
    return !(*this == other);
}

bool qng::EvmAddress::operator<(const qng::EvmAddress& other) const
{
    return bytes < other.bytes;
}

void qng::EvmAddress::Clear()
{
    bytes.fill(0);
}

bool qng::EvmAddress::IsZero() const
{
    for (auto i : bytes)
    {
        if (i != 0)
        {
            return false;
        }
    }
    return true;
}

bool qng::EvmAddress::DecodeHex(const std::string& text)
{
    std::vector<uint8_t> decoded;
    bool error = qng::EvmHexToBytes(text, decoded);
    IF_ERROR_RETURN(error, true);
    if (decoded.size() != bytes.size())
    {
        return true;
    }
    std::copy(decoded.begin(), decoded.end(), bytes.begin());
    return false;
}

std::string qng::EvmAddress::StringHex() const
{
    return qng::BytesToEvmHex(bytes.data(), bytes.size());
}

void qng::EvmAddress::FromWord(const qng::uint256_union& word)
{
    std::copy(word.bytes.begin() + 12, word.bytes.end(), bytes.begin());
}

qng::uint256_union qng::EvmAddress::ToWord() const
{
    qng::uint256_union word;
    std::copy(bytes.begin(), bytes.end(), word.bytes.begin() + 12);
    return word;
}

std::string qng::EncodeEvmQuantity(const qng::uint256_t& value)
{
    std::stringstream stream;
    stream << std::hex << std::nouppercase << std::noshowbase << value;
    return "0x" + qng::StringToLower(stream.str());
}

bool qng::DecodeEvmQuantity(const std::string& text, qng::uint256_t& value)
{
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X'))
    {
        return true;
    }

    std::string digits = text.substr(2);
    if (digits.find_first_not_of("0123456789ABCDEFabcdef")
        != std::string::npos)
    {
        return true;
    }
    qng::StringLeftTrim(digits, "0");
    if (digits.size() > 64)
    {
        return true;
    }
    if (digits.size() % 2)
    {
        digits = "0" + digits;
    }

    std::vector<uint8_t> decoded;
    bool error = qng::HexToBytes(digits, decoded);
    IF_ERROR_RETURN(error, true);
    qng::uint256_union word;
    std::copy(decoded.begin(), decoded.end(),
              word.bytes.begin() + (word.bytes.size() - decoded.size()));
    value = word.Number();
    return false;
}

bool qng::DecodeEvmQuantity(const std::string& text, uint64_t& value)
{
    return qng::EvmHexToUint64(text, value);
}
