#include "TimeUtils.h"
#include <ctime>
#include <sstream>
#include <iomanip>

namespace abvalidator
{
namespace utils
{

std::string getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%b_%d_%Y_%H%M");
    return ss.str();
}

std::string formatElapsedTime(std::chrono::steady_clock::duration elapsed)
{
    auto elapsedTime = std::chrono::duration_cast<std::chrono::seconds>(elapsed);

    // Convert to hours, minutes, seconds
    auto hours = std::chrono::duration_cast<std::chrono::hours>(elapsedTime);
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(elapsedTime - hours);
    auto seconds = elapsedTime - hours - minutes;

    std::stringstream ss;
    ss << std::setfill('0') << std::setw(2) << hours.count() << ":"
       << std::setfill('0') << std::setw(2) << minutes.count() << ":"
       << std::setfill('0') << std::setw(2) << seconds.count();
    return ss.str();
}

} // namespace utils
} // namespace abvalidator
