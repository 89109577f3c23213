#include "commands.hpp"
#include "errors.hpp"
#include "temp_dir.hpp"

#include <gtest/gtest.h>

using namespace pomocl;
using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;

namespace {

class CommandsTest : public ::testing::Test {
  protected:
	temp_dir          dir;
	state_store       store{dir.path() / "current_pomo"};
	const timepoint_t now = timepoint_t(hours(24 * 365 * 50));
};

template<typename F> state_error::kind failure_of(F command) {
	try {
		command();
	} catch (const state_error &e) {
		return e.which();
	}
	ADD_FAILURE() << "command succeeded";
	return state_error::kind::not_running;
}

} // namespace

TEST_F(CommandsTest, IdleStatus) {
	EXPECT_EQ(status_command(store, now), "no pomodoro running");
	EXPECT_EQ(info_command(store, now), "no pomodoro running");
}

TEST_F(CommandsTest, StartThenStatus) {
	EXPECT_EQ(start_command(store, "2p10b5", std::nullopt, now), "work 10:00 (next: break) 1/2");
	EXPECT_EQ(status_command(store, now + minutes(12)), "break 03:00 (next: work) 1/2");
	EXPECT_EQ(status_command(store, now + minutes(30)), "pomodoro finished");

	const auto state = store.load();
	ASSERT_TRUE(state.has_value());
	EXPECT_EQ(state->plan, (schedule{2, minutes(10), minutes(5)}));
	EXPECT_EQ(state->started_at, now);
}

TEST_F(CommandsTest, SecondStartFails) {
	start_command(store, "", std::nullopt, now);
	EXPECT_EQ(failure_of([&] { start_command(store, "1p5", std::nullopt, now); }),
	          state_error::kind::already_running);
	EXPECT_EQ(store.load()->plan, default_schedule());
}

TEST_F(CommandsTest, BadDefinitionLeavesStoreEmpty) {
	EXPECT_THROW(start_command(store, "0p10", std::nullopt, now), parse_error);
	EXPECT_FALSE(store.load().has_value());
}

TEST_F(CommandsTest, StopDeletesTheRun) {
	EXPECT_EQ(failure_of([&] { stop_command(store); }), state_error::kind::not_running);

	start_command(store, "", std::nullopt, now);
	EXPECT_EQ(stop_command(store), "pomodoro stopped");
	EXPECT_FALSE(store.load().has_value());
	EXPECT_EQ(status_command(store, now), "no pomodoro running");

	start_command(store, "3", std::nullopt, now);
	EXPECT_EQ(store.load()->plan.repetitions, 3u);
}

TEST_F(CommandsTest, PauseAndUnpause) {
	EXPECT_EQ(failure_of([&] { pause_command(store, now); }), state_error::kind::not_running);
	EXPECT_EQ(failure_of([&] { unpause_command(store, now); }), state_error::kind::not_running);

	start_command(store, "2p10b5", std::nullopt, now);
	EXPECT_EQ(failure_of([&] { unpause_command(store, now); }), state_error::kind::not_paused);

	EXPECT_EQ(pause_command(store, now + minutes(4)), "work 06:00 (next: break) 1/2 [paused]");
	EXPECT_EQ(failure_of([&] { pause_command(store, now + minutes(5)); }),
	          state_error::kind::already_paused);
	EXPECT_EQ(status_command(store, now + minutes(20)), "work 06:00 (next: break) 1/2 [paused]");

	EXPECT_EQ(unpause_command(store, now + minutes(20)), "work 06:00 (next: break) 1/2");
	EXPECT_EQ(status_command(store, now + minutes(21)), "work 05:00 (next: break) 1/2");
	EXPECT_EQ(store.load()->total_paused, minutes(16));
}

TEST_F(CommandsTest, StartUntilEndsAtTarget) {
	const timepoint_t wall   = string_to_timepoint("10:00", std::chrono::system_clock::now());
	const timepoint_t target = string_to_timepoint("12:05", wall);

	start_command(store, "4p30b5", "12:05", wall);
	const auto state = store.load();
	ASSERT_TRUE(state.has_value());
	EXPECT_EQ(state->plan.rest, minutes(5));
	EXPECT_EQ(state->started_at + total_duration(state->plan), target);
	EXPECT_GE(state->started_at, wall);
	EXPECT_LT(state->started_at - wall, seconds(1));
	if (target - wall == hours(2) + minutes(5)) {
		// No DST switch in between: 4 x 27.5 + 3 x 5
		EXPECT_EQ(state->plan, (schedule{4, minutes(27) + seconds(30), minutes(5)}));
		EXPECT_EQ(state->started_at, wall);
	}
}

TEST_F(CommandsTest, StartUntilInThePastFails) {
	const timepoint_t wall = std::chrono::system_clock::now();
	EXPECT_THROW(start_command(store, "", "00:00", wall), solver_error);
	EXPECT_FALSE(store.load().has_value());
}

TEST_F(CommandsTest, InfoShowsTheRun) {
	start_command(store, "2p10b5", std::nullopt, now);
	pause_command(store, now + minutes(1));
	const std::string info = info_command(store, now + minutes(3));
	EXPECT_NE(info.find("schedule:     2p10b5"), std::string::npos);
	EXPECT_NE(info.find("paused total: 00:02"), std::string::npos);
}
