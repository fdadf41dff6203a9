#include <qng/qng_bridge/cli.hpp>

#include <iostream>
#include <boost/filesystem.hpp>
#include <qng/qng_bridge/daemon.hpp>
#include <qng/secure/util.hpp>

namespace
{
char const QNG_BRIDGE_VERSION_STRING[] = "V1.0.0";

qng::ErrorCode ProcessDaemon(const boost::program_options::variables_map& vm,
                             const boost::filesystem::path& data_path)
{
    qng::Daemon daemon;
    return daemon.Run(data_path);
}

qng::ErrorCode ProcessConfigCreate(
    const boost::program_options::variables_map& vm,
    const boost::filesystem::path& data_path)
{
    return qng::CreateConfig(data_path);
}

qng::ErrorCode ProcessVersion(const boost::program_options::variables_map& vm,
                              const boost::filesystem::path& data_path)
{
    std::cout << "qng_bridge " << QNG_BRIDGE_VERSION_STRING << std::endl;
    return qng::ErrorCode::SUCCESS;
}
}  // namespace

void qng::CliAddOptions(boost::program_options::options_description& desc)
{
    // clang-format off
    desc.add_options()
        ("config_create", "Write a default config to the data directory")
        ("daemon", "Start the bridge daemon")
        ("data_path", boost::program_options::value<std::string>(), "Use the supplied path as the data directory")
        ("version", "Prints out version")
        ;
    // clang-format on
}

qng::ErrorCode qng::CliProcessOptions(
    const boost::program_options::variables_map& vm)
{
    try
    {
        qng::ErrorCode error_code = qng::ErrorCode::SUCCESS;
        boost::filesystem::path data_path;

        if (vm.count("data_path"))
        {
            data_path =
                boost::filesystem::path(vm["data_path"].as<std::string>());
            if (data_path.string().find(".") == 0)
            {
                data_path = boost::filesystem::absolute(data_path);
            }
        }
        else
        {
            data_path = qng::WorkingPath();
        }

        boost::system::error_code ec;
        boost::filesystem::create_directories(data_path, ec);
        if (ec)
        {
            return qng::ErrorCode::DATA_PATH;
        }

        if (vm.count("daemon"))
        {
            error_code = ProcessDaemon(vm, data_path);
        }
        else if (vm.count("config_create"))
        {
            error_code = ProcessConfigCreate(vm, data_path);
        }
        else if (vm.count("version"))
        {
            error_code = ProcessVersion(vm, data_path);
        }
        else
        {
            error_code = qng::ErrorCode::UNKNOWN_COMMAND;
        }

        return error_code;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Exception(" << e.what() << ")\n";
    }
    return qng::ErrorCode::GENERIC;
}
