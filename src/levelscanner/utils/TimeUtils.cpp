#include "TimeUtils.h"
#include <boost/date_time/posix_time/posix_time.hpp>

namespace levelscanner
{
namespace utils
{

std::string getRunTimestamp()
{
    return boost::posix_time::to_simple_string(boost::posix_time::second_clock::local_time());
}

} // namespace utils
} // namespace levelscanner
