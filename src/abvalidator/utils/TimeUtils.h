#pragma once

#include <chrono>
#include <string>

namespace abvalidator
{
namespace utils
{

/**
 * @brief Generate a timestamp string for file naming
 * 
 * Creates a timestamp in the format "MMM_DD_YYYY_HHMM" suitable for use in filenames.
 * Example: "Aug_25_2024_1430"
 * 
 * @return Current timestamp as a formatted string
 */
std::string getCurrentTimestamp();

/**
 * @brief Format an elapsed duration as HH:MM:SS
 * @param elapsed Duration to format, truncated to whole seconds
 * @return Zero padded "HH:MM:SS" string
 */
std::string formatElapsedTime(std::chrono::steady_clock::duration elapsed);

} // namespace utils
} // namespace abvalidator
