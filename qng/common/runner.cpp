#include <qng/common/runner.hpp>

#include <qng/common/log.hpp>

qng::ServiceRunner::ServiceRunner(boost::asio::io_service& service,
                                  size_t count)
{
    for (size_t i = 0; i < count; ++i)
    {
        threads_.push_back(std::thread([&service]() {
            while (true)
            {
                try
                {
                    service.run();
                    break;
                }
                catch (const std::exception& e)
                {
                    qng::Log::Error(std::string("Service throw exception:")
                                    + e.what());
                }
            }
        }));
    }
}

qng::ServiceRunner::~ServiceRunner()
{
    Join();
}

void qng::ServiceRunner::Join()
{
    for (auto& i : threads_)
    {
        if (i.joinable() && i.get_id() != std::this_thread::get_id())
        {
            i.join();
        }
    }
}
