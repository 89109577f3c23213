#pragma once

#include <chrono>
#include <string>

namespace pomocl {

using timepoint_t = std::chrono::time_point<std::chrono::system_clock>;
using duration_t  = std::chrono::system_clock::duration;

/** Today's local date at HH:MM:00, relative to `now` */
timepoint_t string_to_timepoint(const std::string &input, timepoint_t now);

/** Print duration as HH:MM */
std::string print_duration(duration_t duration);

/** Print duration as MM:SS, minutes are not wrapped into hours */
std::string print_clock(duration_t duration);

/** Print timepoint as HH:MM:SS */
std::string print_time(timepoint_t time);

} // namespace pomocl
