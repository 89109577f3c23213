#include "clock.hpp"

namespace pomocl {

clock_snapshot evaluate(const timer_state &state, timepoint_t now) {
	const schedule &plan = state.plan;

	clock_snapshot res{};
	res.repetitions = plan.repetitions;
	res.paused      = state.paused_at.has_value();
	res.elapsed     = now - state.started_at - paused_for(state, now);
	if (res.elapsed < duration_t::zero()) {
		res.elapsed = duration_t::zero();
	}

	duration_t offset = duration_t::zero();
	for (unsigned i = 1; i <= plan.repetitions; ++i) {
		const bool last = i == plan.repetitions;

		res.repetition = i;
		if (res.elapsed < offset + plan.work) {
			res.current   = phase::work;
			res.next      = last ? phase::finished : phase::rest;
			res.remaining = offset + plan.work - res.elapsed;
			return res;
		}
		offset += plan.work;

		if (!last) {
			if (res.elapsed < offset + plan.rest) {
				res.current   = phase::rest;
				res.next      = phase::work;
				res.remaining = offset + plan.rest - res.elapsed;
				return res;
			}
			offset += plan.rest;
		}
	}

	res.current   = phase::finished;
	res.next      = phase::finished;
	res.remaining = duration_t::zero();
	return res;
}

} // namespace pomocl
