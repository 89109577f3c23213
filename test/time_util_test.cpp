#include "time_util.hpp"

#include <gtest/gtest.h>

#include <ctime>
#include <stdexcept>

using namespace pomocl;
using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;

namespace {

tm local_time(timepoint_t t) {
	const time_t tmp = std::chrono::system_clock::to_time_t(t);
	tm           res{};
	localtime_r(&tmp, &res);
	return res;
}

} // namespace

TEST(StringToTimepoint, TodayAtTheGivenTime) {
	const auto now = std::chrono::system_clock::now();
	const tm   res = local_time(string_to_timepoint("17:30", now));
	const tm   ref = local_time(now);

	EXPECT_EQ(res.tm_hour, 17);
	EXPECT_EQ(res.tm_min, 30);
	EXPECT_EQ(res.tm_sec, 0);
	EXPECT_EQ(res.tm_mday, ref.tm_mday);
}

TEST(StringToTimepoint, SingleDigitHour) {
	const tm res = local_time(string_to_timepoint("7:05", std::chrono::system_clock::now()));
	EXPECT_EQ(res.tm_hour, 7);
	EXPECT_EQ(res.tm_min, 5);
}

TEST(StringToTimepoint, RejectsGarbage) {
	const auto now = std::chrono::system_clock::now();
	for (const char *input : {"", "1730", "24:00", "12:60", "ab:cd", "12:3", "12:345", " 12:30"}) {
		EXPECT_THROW(string_to_timepoint(input, now), std::invalid_argument) << input;
	}
}

TEST(PrintDuration, HoursAndMinutes) {
	EXPECT_EQ(print_duration(minutes(90)), "01:30");
	EXPECT_EQ(print_duration(-minutes(90)), "01:30");
	EXPECT_EQ(print_duration(hours(12) + seconds(59)), "12:00");
}

TEST(PrintClock, MinutesAndSeconds) {
	EXPECT_EQ(print_clock(seconds(65)), "01:05");
	EXPECT_EQ(print_clock(minutes(125)), "125:00");
	EXPECT_EQ(print_clock(-seconds(4)), "00:00");
}
