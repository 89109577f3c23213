#include "errors.hpp"
#include "schedule.hpp"

#include <gtest/gtest.h>

#include <optional>

using namespace pomocl;
using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;

namespace {

std::optional<parse_error::kind> failure_of(const std::string &definition) {
	try {
		parse_schedule(definition);
	} catch (const parse_error &e) {
		return e.which();
	}
	return std::nullopt;
}

} // namespace

TEST(ParseSchedule, BlankIsDefault) {
	const schedule expected{4, minutes(45), minutes(10)};
	EXPECT_EQ(parse_schedule(""), expected);
	EXPECT_EQ(parse_schedule("   \t"), expected);
	EXPECT_EQ(parse_schedule("4p45b10"), expected);
	EXPECT_EQ(default_schedule(), expected);
}

TEST(ParseSchedule, AllSegments) {
	EXPECT_EQ(parse_schedule("2p30b5"), (schedule{2, minutes(30), minutes(5)}));
	EXPECT_EQ(parse_schedule(" 2p30b5\n"), (schedule{2, minutes(30), minutes(5)}));
}

TEST(ParseSchedule, OmittedSegmentsKeepDefaults) {
	EXPECT_EQ(parse_schedule("p20"), (schedule{4, minutes(20), minutes(10)}));
	EXPECT_EQ(parse_schedule("3"), (schedule{3, minutes(45), minutes(10)}));
	EXPECT_EQ(parse_schedule("b15"), (schedule{4, minutes(45), minutes(15)}));
	EXPECT_EQ(parse_schedule("6b2"), (schedule{6, minutes(45), minutes(2)}));
}

TEST(ParseSchedule, UnitSuffixes) {
	EXPECT_EQ(parse_schedule("1p90sb30s"), (schedule{1, seconds(90), seconds(30)}));
	EXPECT_EQ(parse_schedule("p2hb15m"), (schedule{4, hours(2), minutes(15)}));
}

TEST(ParseSchedule, ZeroIsRejected) {
	EXPECT_EQ(failure_of("0p10"), parse_error::kind::zero_duration);
	EXPECT_EQ(failure_of("0"), parse_error::kind::zero_duration);
	EXPECT_EQ(failure_of("p0"), parse_error::kind::zero_duration);
	EXPECT_EQ(failure_of("2p10b0s"), parse_error::kind::zero_duration);
}

TEST(ParseSchedule, MalformedInput) {
	for (const char *definition :
	     {"b5p20", "p20x", "p", "4pb5", "4p45b10b5", "2 p30", "-3", "p45b10 x", "4p4.5",
	      "99999999999999999999999", "p99999999999999999h", "P45"}) {
		EXPECT_EQ(failure_of(definition), parse_error::kind::invalid_format) << definition;
	}
}

TEST(ParseSchedule, WholeRunMustFitTheClock) {
	EXPECT_EQ(failure_of("2p2562047h"), parse_error::kind::invalid_format);
	EXPECT_EQ(failure_of("100000p2000000m"), parse_error::kind::invalid_format);
	EXPECT_EQ(failure_of("3b2562047h"), parse_error::kind::invalid_format);

	const schedule longest = parse_schedule("1p2562047h");
	EXPECT_TRUE(fits(longest));
	EXPECT_EQ(total_duration(longest), hours(2562047));
	EXPECT_GT(total_duration(parse_schedule("100000p1500m")), duration_t::zero());
}

TEST(ParseSchedule, ErrorsAreInvalidArguments) {
	EXPECT_THROW(parse_schedule("x"), std::invalid_argument);
}

TEST(FormatSchedule, Canonical) {
	EXPECT_EQ(format_schedule(default_schedule()), "4p45b10");
	EXPECT_EQ(format_schedule(schedule{2, seconds(90), minutes(10)}), "2p90sb10");
	EXPECT_EQ(format_schedule(schedule{1, hours(2), minutes(5)}), "1p120b5");
}

TEST(FormatSchedule, NormalizationIsIdempotent) {
	for (const char *definition : {"", "2p30b5", "p20", "7", "b1", "3p1hb30s", "1p61sb59m"}) {
		const schedule parsed = parse_schedule(definition);
		EXPECT_EQ(parse_schedule(format_schedule(parsed)), parsed) << definition;
	}
}

TEST(TotalDuration, LastRepetitionHasNoBreak) {
	EXPECT_EQ(total_duration(schedule{2, minutes(10), minutes(5)}), minutes(25));
	EXPECT_EQ(total_duration(schedule{1, minutes(10), minutes(5)}), minutes(10));
	EXPECT_EQ(total_duration(default_schedule()), minutes(4 * 45 + 3 * 10));
}
