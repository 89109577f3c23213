#pragma once

#include "schedule.hpp"
#include "time_util.hpp"

namespace pomocl {

/**
 * Fit `base` into [start_time, target_end].  The break stays fixed, the
 * repetition count is recomputed and the work duration is stretched or
 * shrunk as little as possible.  Ties favor more repetitions.
 *
 * The work duration is truncated to clock resolution, so the result may end
 * up to `repetitions` ticks before target_end.
 *
 * Throws solver_error.
 */
schedule solve_until(const schedule &base, timepoint_t start_time, timepoint_t target_end);

} // namespace pomocl
