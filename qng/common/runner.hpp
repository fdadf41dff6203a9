#pragma once

#include <thread>
#include <vector>
#include <boost/asio.hpp>

namespace qng
{
class ServiceRunner
{
public:
    ServiceRunner(boost::asio::io_service&, size_t);
    ~ServiceRunner();
    void Join();

private:
    std::vector<std::thread> threads_;
};
}  // namespace qng
