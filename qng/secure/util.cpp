#include <qng/secure/util.hpp>

#include <iostream>
#include <string>
#include <qng/secure/plat.hpp>

void qng::SecureClearString(std::string& str)
{
    volatile char* volatile ptr =
        const_cast<volatile char* volatile>(str.c_str());
    size_t size = str.size();
    for (size_t i = 0; i < size; ++i)
    {
        ptr[i] = 0;
    }
}

boost::filesystem::path qng::WorkingPath()
{
    boost::filesystem::path result(qng::AppPath());
    result /= "QngBridge";
    return result;
}

qng::SecretInput::SecretInput()
{
}

qng::SecretInput::~SecretInput()
{
    qng::SecureClearString(secret_);
}

const std::string& qng::SecretInput::Get() const
{
    return secret_;
}

void qng::SecretInput::Input(const std::string& prompt)
{
    secret_.reserve(1024);
    qng::SetStdinEcho(false);
    std::cout << prompt;
    std::cin >> secret_;
    std::cout << std::endl;
    qng::SetStdinEcho(true);
}

void qng::OpenOrCreate(std::fstream& stream, const std::string& path)
{
    stream.open(path, std::ios_base::in);
    if (stream.fail())
    {
        stream.open(path, std::ios_base::out);
    }
    stream.close();
    stream.open(path, std::ios_base::in | std::ios_base::out);
}
