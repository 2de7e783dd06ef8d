#pragma once

#include <string>

namespace levelscanner
{
namespace utils
{

/**
 * @brief Local wall-clock time for the run banner, e.g. "2024-Aug-25 14:30:07"
 */
std::string getRunTimestamp();

} // namespace utils
} // namespace levelscanner
