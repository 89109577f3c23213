#pragma once

#include "time_util.hpp"

#include <string>

namespace pomocl {

struct schedule {
	unsigned   repetitions;
	duration_t work;
	duration_t rest;

	bool operator==(const schedule &rhs) const {
		return repetitions == rhs.repetitions && work == rhs.work && rest == rhs.rest;
	}
	bool operator!=(const schedule &rhs) const { return !(*this == rhs); }
};

/** 4p45b10 */
schedule default_schedule();

/** True when total_duration() is representable in duration_t */
bool fits(const schedule &s);

/** Span of the whole run.  The last repetition has no trailing break */
duration_t total_duration(const schedule &s);

/**
 * Parse `[<repetitions>][p<work>][b<break>]`.  Durations are minutes unless
 * suffixed with s, m or h.  Omitted segments take the defaults of
 * default_schedule(), blank input is the default schedule.
 *
 * Throws parse_error.
 */
schedule parse_schedule(const std::string &definition);

/** Canonical definition string, parse_schedule() reads it back unchanged */
std::string format_schedule(const schedule &s);

} // namespace pomocl
