#include <iostream>
#include <boost/program_options.hpp>

#include <qng/qng_bridge/cli.hpp>

int main(int argc, char* const* argv)
{
    boost::program_options::options_description desc("Command line options");
    desc.add_options()("help", "Print out options");
    qng::CliAddOptions(desc);

    boost::program_options::variables_map vm;
    try
    {
        boost::program_options::store(
            boost::program_options::parse_command_line(argc, argv, desc), vm);
    }
    catch (const boost::program_options::error& err)
    {
        std::cerr << err.what() << std::endl;
        return 1;
    }
    boost::program_options::notify(vm);

    if (vm.count("help"))
    {
        std::cout << desc << std::endl;
        return 0;
    }

    qng::ErrorCode error_code = qng::CliProcessOptions(vm);
    if (qng::ErrorCode::UNKNOWN_COMMAND == error_code)
    {
        std::cout << desc << std::endl;
        return 0;
    }

    if (qng::ErrorCode::SUCCESS != error_code)
    {
        std::cerr << qng::ErrorString(error_code) << ": "
                  << static_cast<int>(error_code) << std::endl;
        return 1;
    }

    return 0;
}
