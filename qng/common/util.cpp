#include <qng/common/util.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <string>

std::string qng::BytesToHex(const uint8_t* data, size_t size)
{
    if (size == 0)
    {
        return "";
    }

    std::stringstream stream;

    stream << std::hex << std::uppercase << std::noshowbase
           << std::setfill('0');
    for (size_t i = 0; i < size; ++i)
    {
        stream << std::setw(2) << static_cast<int>(data[i]);
    }

    stream.flush();
    return stream.str();
}

bool qng::HexToBytes(const std::string& hex, std::vector<uint8_t>& bytes)
{
    if (hex.size() % 2)
    {
        return true;
    }

    if (hex.find_first_not_of("0123456789ABCDEFabcdef") != std::string::npos)
    {
        return true;
    }

    for (size_t i = 0; i < hex.size(); i += 2)
    {
        uint32_t u32;
        std::stringstream stream(hex.substr(i, 2));
        stream << std::hex << std::noshowbase;
        stream >> u32;
        if (stream.fail())
        {
            return true;
        }
        bytes.push_back(static_cast<uint8_t>(u32));
    }

    return false;
}

std::string qng::BytesToEvmHex(const uint8_t* data, size_t size)
{
    return "0x" + qng::StringToLower(qng::BytesToHex(data, size));
}

std::string qng::BytesToEvmHex(const std::vector<uint8_t>& bytes)
{
    return qng::BytesToEvmHex(bytes.data(), bytes.size());
}

bool qng::EvmHexToBytes(const std::string& hex, std::vector<uint8_t>& bytes)
{
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
    {
        return qng::HexToBytes(hex.substr(2), bytes);
    }
    return qng::HexToBytes(hex, bytes);
}

std::string qng::Uint64ToEvmHex(uint64_t value)
{
    std::stringstream stream;
    stream << "0x" << std::hex << std::nouppercase << std::noshowbase << value;
    return stream.str();
}

bool qng::EvmHexToUint64(const std::string& hex, uint64_t& value)
{
    if (hex.size() < 3 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X'))
    {
        return true;
    }

    std::string digits = hex.substr(2);
    if (digits.find_first_not_of("0123456789ABCDEFabcdef")
        != std::string::npos)
    {
        return true;
    }

    qng::StringLeftTrim(digits, "0");
    if (digits.size() > 16)
    {
        return true;
    }
    if (digits.empty())
    {
        value = 0;
        return false;
    }

    try
    {
        value = std::stoull(digits, nullptr, 16);
    }
    catch (const std::exception&)
    {
        return true;
    }
    return false;
}

void qng::StringLeftTrim(std::string& str, const std::string& trim)
{
    while (true)
    {
        if (str.empty())
        {
            break;
        }

        auto it = str.begin();
        if (!StringContain(trim, *it))
        {
            break;
        }
        str.erase(it);
    }
}

void qng::StringRightTrim(std::string& str, const std::string& trim)
{
    while (true)
    {
        if (str.empty())
        {
            break;
        }

        auto it = str.rbegin();
        if (!StringContain(trim, *it))
        {
            break;
        }
        str.erase(--it.base());
    }
}

void qng::StringTrim(std::string& str, const std::string& trim)
{
    qng::StringLeftTrim(str, trim);
    qng::StringRightTrim(str, trim);
}

std::string qng::StringToLower(const std::string& str)
{
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

qng::Url::Url() : Url("http")
{
}

qng::Url::Url(const std::string& protocol) : protocol_(protocol), port_(0)
{
}

bool qng::Url::Parse(const std::string& url)
{
    std::string str(url);
    qng::StringTrim(str, " \t\r\n");
    if (str.find("://") != std::string::npos)
    {
        protocol_ = str.substr(0, str.find("://"));
        if (CheckProtocol())
        {
            return true;
        }
        std::string prefix = protocol_ + "://";
        str = str.substr(prefix.size());
    }

    size_t path_begin = str.find("/");
    path_ = path_begin == std::string::npos ? "/" : str.substr(path_begin);

    size_t port_begin = str.find(":");
    if (port_begin != std::string::npos && path_begin != std::string::npos
        && port_begin > path_begin)
    {
        port_begin = std::string::npos;
    }

    if (port_begin == std::string::npos)
    {
        port_ = DefaultPort();
    }
    else
    {
        if (port_begin + 1 >= str.size())
        {
            return true;
        }
        std::string port_str;
        if (path_begin == std::string::npos)
        {
            port_str = str.substr(port_begin + 1);
        }
        else
        {
            port_str = str.substr(port_begin + 1, path_begin - port_begin - 1);
        }
        bool error = qng::StringToUint(port_str, port_);
        IF_ERROR_RETURN(error, true);
    }

    if (port_begin != std::string::npos)
    {
        host_ = str.substr(0, port_begin);
    }
    else if (path_begin != std::string::npos)
    {
        host_ = str.substr(0, path_begin);
    }
    else
    {
        host_ = str;
    }

    if (host_.empty() || path_.empty() || port_ == 0)
    {
        return true;
    }

    return false;
}

std::string qng::Url::String() const
{
    std::string url;

    if (host_.empty() || port_ == 0 || path_.empty())
    {
        return url;
    }

    url += protocol_;
    url += "://";
    url += host_;
    if (port_ != DefaultPort())
    {
        url += ":";
        url += std::to_string(port_);
    }
    if (path_ != "/")
    {
        url += path_;
    }

    return url;
}

uint16_t qng::Url::DefaultPort() const
{
    if (protocol_ == "http")
    {
        return 80;
    }
    else if (protocol_ == "https")
    {
        return 443;
    }
    else
    {
        return 0;
    }
}

qng::Url::operator bool() const
{
    return !String().empty();
}

bool qng::Url::CheckProtocol() const
{
    if (protocol_ != "http" && protocol_ != "https")
    {
        return true;
    }

    return false;
}

bool qng::Url::Ssl() const
{
    return protocol_ == "https";
}
