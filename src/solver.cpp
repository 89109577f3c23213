#include "solver.hpp"

#include "errors.hpp"

#include <cmath>

namespace pomocl {

namespace {

/** Shorter work phases are treated as degenerate */
const duration_t min_work   = std::chrono::seconds(1);
const long       max_offset = 10000;

using d_ticks_t = std::chrono::duration<double, duration_t::period>;

/** Work duration that makes `r` repetitions fill `span` exactly, zero if none does */
duration_t work_for(duration_t span, duration_t rest, long r) {
	// Breaks alone would exceed the span, and rest * (r - 1) could overflow
	if (r - 1 > span / rest) {
		return duration_t::zero();
	}
	const duration_t available = span - rest * (r - 1);
	if (available <= duration_t::zero()) {
		return duration_t::zero();
	}
	return available / r;
}

} // namespace

schedule solve_until(const schedule &base, timepoint_t start_time, timepoint_t target_end) {
	if (target_end <= start_time) {
		throw solver_error(solver_error::kind::past_target,
		                   "The target time " + print_time(target_end) + " is not after " +
		                       print_time(start_time));
	}

	if (!fits(schedule{1, base.work, base.rest})) {
		throw solver_error(solver_error::kind::infeasible, "The base schedule is too long");
	}

	const duration_t span = target_end - start_time;

	// A run of r repetitions takes r * cycle - rest.  Estimated in floating
	// point since span + rest may not fit in duration_t
	const auto estimate_ratio =
	    (d_ticks_t(span) + d_ticks_t(base.rest)) / d_ticks_t(base.work + base.rest);
	long       estimate       = 1;
	if (estimate_ratio > 1) {
		estimate = estimate_ratio < 1e9 ? std::lround(estimate_ratio) : 1000000000L;
	}

	long       best_r = 0;
	duration_t best_work{};
	duration_t best_deviation{};

	auto consider = [&](long r) {
		const duration_t work = work_for(span, base.rest, r);
		if (work < min_work) {
			return false;
		}
		const duration_t deviation = std::chrono::abs(work - base.work);
		if (best_r == 0 || deviation < best_deviation ||
		    (deviation == best_deviation && r > best_r)) {
			best_r         = r;
			best_work      = work;
			best_deviation = deviation;
		}
		return true;
	};

	// More repetitions only ever shorten the work phase, so the upward
	// direction is done at the first infeasible candidate.
	bool up   = true;
	bool down = true;
	for (long offset = 0; offset <= max_offset && (up || down); ++offset) {
		if (up) {
			up = consider(estimate + offset);
		}
		if (down && offset > 0) {
			const long r = estimate - offset;
			if (r < 1) {
				down = false;
			} else {
				consider(r);
			}
		}
	}

	if (best_r == 0) {
		throw solver_error(solver_error::kind::infeasible,
		                   "No schedule fits between " + print_time(start_time) + " and " +
		                       print_time(target_end));
	}

	return schedule{static_cast<unsigned>(best_r), best_work, base.rest};
}

} // namespace pomocl
