#include "time_util.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pomocl {

namespace {

/** Two digits or throw.  atoi would accept garbage */
int parse_two_digits(const std::string &input, size_t pos, const std::string &whole) {
	if (pos + 2 > input.size() || !std::isdigit(static_cast<unsigned char>(input[pos])) ||
	    !std::isdigit(static_cast<unsigned char>(input[pos + 1]))) {
		throw std::invalid_argument("Time must be given as HH:MM, got '" + whole + "'");
	}
	return (input[pos] - '0') * 10 + (input[pos + 1] - '0');
}

} // namespace

timepoint_t string_to_timepoint(const std::string &input, timepoint_t now) {
	std::string padded = input;
	if (padded.size() == 4 && padded[1] == ':') {
		padded.insert(padded.begin(), '0');
	}
	if (padded.size() != 5 || padded[2] != ':') {
		throw std::invalid_argument("Time must be given as HH:MM, got '" + input + "'");
	}

	const int hour   = parse_two_digits(padded, 0, input);
	const int minute = parse_two_digits(padded, 3, input);
	if (hour > 23 || minute > 59) {
		throw std::invalid_argument("Time out of range: '" + input + "'");
	}

	auto tmp = std::chrono::system_clock::to_time_t(now);
	tm   local{};
	localtime_r(&tmp, &local);
	local.tm_hour  = hour;
	local.tm_min   = minute;
	local.tm_sec   = 0;
	local.tm_isdst = -1;
	tmp            = std::mktime(&local);
	if (tmp == static_cast<time_t>(-1)) {
		throw std::invalid_argument("Could not resolve local time '" + input + "'");
	}

	return std::chrono::system_clock::from_time_t(tmp);
}

std::string print_duration(duration_t duration) {
	duration = std::chrono::abs(duration);
	auto h   = std::chrono::duration_cast<std::chrono::hours>(duration);
	auto m   = std::chrono::duration_cast<std::chrono::minutes>(duration - h);

	std::stringstream ss;
	ss.fill('0');
	ss << std::setw(2) << h.count() << ':' << std::setw(2) << m.count();

	return ss.str();
}

std::string print_clock(duration_t duration) {
	if (duration < duration_t::zero()) {
		duration = duration_t::zero();
	}
	auto m = std::chrono::duration_cast<std::chrono::minutes>(duration);
	auto s = std::chrono::duration_cast<std::chrono::seconds>(duration - m);

	std::stringstream ss;
	ss.fill('0');
	ss << std::setw(2) << m.count() << ':' << std::setw(2) << s.count();

	return ss.str();
}

std::string print_time(const timepoint_t time) {
	char res[9];

	time_t ttmp = std::chrono::system_clock::to_time_t(time);
	tm     local{};
	localtime_r(&ttmp, &local);
	strftime(res, sizeof(res), "%H:%M:%S", &local);

	return res;
}

} // namespace pomocl
