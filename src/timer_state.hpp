#pragma once

#include "schedule.hpp"
#include "time_util.hpp"

#include <optional>
#include <string>

namespace pomocl {

/** One active run, as persisted between invocations */
struct timer_state {
	schedule                   plan;
	timepoint_t                started_at;
	std::optional<timepoint_t> paused_at;
	duration_t                 total_paused{};

	bool operator==(const timer_state &rhs) const {
		return plan == rhs.plan && started_at == rhs.started_at && paused_at == rhs.paused_at &&
		       total_paused == rhs.total_paused;
	}
};

/** Throws state_error if already paused */
void pause(timer_state &state, timepoint_t now);

/** Throws state_error if not paused */
void unpause(timer_state &state, timepoint_t now);

/** Accumulated pauses including the one still open */
duration_t paused_for(const timer_state &state, timepoint_t now);

/** key=value lines, lossless */
std::string encode_state(const timer_state &state);

/** Throws store_error on a malformed record */
timer_state decode_state(const std::string &text);

} // namespace pomocl
