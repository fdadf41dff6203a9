#pragma once

#include <boost/filesystem.hpp>
#include <qng/common/errors.hpp>

namespace qng
{
class Daemon
{
public:
    qng::ErrorCode Run(const boost::filesystem::path&);
};

qng::ErrorCode CreateConfig(const boost::filesystem::path&);
}  // namespace qng
