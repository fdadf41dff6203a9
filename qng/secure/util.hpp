#pragma once

#include <fstream>
#include <boost/filesystem.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <qng/common/errors.hpp>
#include <qng/common/util.hpp>

namespace qng
{
void SecureClearString(std::string&);
boost::filesystem::path WorkingPath();

// Reads a secret from stdin with echo disabled
class SecretInput
{
public:
    SecretInput();
    ~SecretInput();
    const std::string& Get() const;
    void Input(const std::string&);

private:
    std::string secret_;
};

void OpenOrCreate(std::fstream&, const std::string&);

// Reads a json object from the file, writes it back if it was upgraded or
// the file was empty
template <typename T>
qng::ErrorCode FetchObject(T& object, const boost::filesystem::path& path,
                           std::fstream& stream)
{
    qng::ErrorCode error_code;
    qng::OpenOrCreate(stream, path.string());
    if (stream.fail())
    {
        return qng::ErrorCode::OPEN_OR_CREATE_FILE;
    }

    qng::Ptree ptree;
    boost::system::error_code ec;
    bool empty = boost::filesystem::file_size(path, ec) == 0;
    if (!empty)
    {
        try
        {
            boost::property_tree::read_json(stream, ptree);
        }
        catch (const std::runtime_error&)
        {
            return qng::ErrorCode::JSON_GENERIC;
        }
    }

    bool updated = false;
    error_code   = object.DeserializeJson(updated, ptree);
    IF_NOT_SUCCESS_RETURN(error_code);

    if (updated)
    {
        stream.close();
        stream.open(path.string(), std::ios_base::out | std::ios_base::trunc);
        try
        {
            boost::property_tree::write_json(stream, ptree);
        }
        catch (const std::runtime_error&)
        {
            error_code = qng::ErrorCode::WRITE_FILE;
        }
    }
    return error_code;
}

template <typename T>
qng::ErrorCode WriteObject(const T& object,
                           const boost::filesystem::path& path,
                           std::fstream& stream)
{
    qng::Ptree ptree;
    object.SerializeJson(ptree);
    stream.open(path.string(), std::ios_base::out | std::ios_base::trunc);
    if (stream.fail())
    {
        return qng::ErrorCode::OPEN_OR_CREATE_FILE;
    }
    try
    {
        boost::property_tree::write_json(stream, ptree);
    }
    catch (const std::runtime_error&)
    {
        return qng::ErrorCode::WRITE_FILE;
    }
    return qng::ErrorCode::SUCCESS;
}

}  // namespace qng
