#pragma once

#include <boost/filesystem.hpp>

namespace qng
{
boost::filesystem::path AppPath();
void SetStdinEcho(bool);
}  // namespace qng
