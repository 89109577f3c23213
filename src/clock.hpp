#pragma once

#include "timer_state.hpp"

namespace pomocl {

enum class phase { work, rest, finished };

/** Where a run stands at one instant.  Derived, never stored */
struct clock_snapshot {
	phase      current;
	phase      next;
	unsigned   repetition;  // 1-based, == repetitions once finished
	unsigned   repetitions;
	duration_t remaining;   // until the end of the current phase
	duration_t elapsed;     // run time excluding pauses
	bool       paused;
};

/** Pure, callable as often as needed */
clock_snapshot evaluate(const timer_state &state, timepoint_t now);

} // namespace pomocl
