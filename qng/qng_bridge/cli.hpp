#pragma once

#include <boost/program_options.hpp>
#include <qng/common/errors.hpp>

namespace qng
{
void CliAddOptions(boost::program_options::options_description&);
qng::ErrorCode CliProcessOptions(const boost::program_options::variables_map&);
}  // namespace qng
