#include "commands.hpp"

#include "clock.hpp"
#include "errors.hpp"
#include "render.hpp"
#include "schedule.hpp"
#include "solver.hpp"

namespace pomocl {

namespace {

/** Load, apply `change`, save, all under the store lock */
template<typename F> timer_state modify(const state_store &store, F change) {
	auto lock  = store.lock();
	auto state = store.load();
	if (!state) {
		throw state_error(state_error::kind::not_running);
	}
	change(*state);
	store.save(*state);
	return *state;
}

} // namespace

std::string start_command(const state_store &store, const std::string &definition,
                          const std::optional<std::string> &until, timepoint_t now) {
	timer_state state{};
	state.plan       = parse_schedule(definition);
	state.started_at = now;
	if (until) {
		const timepoint_t target = string_to_timepoint(*until, now);
		state.plan               = solve_until(state.plan, now, target);
		// Truncated work durations leave a few ticks of slack, start that much later
		state.started_at = target - total_duration(state.plan);
	}

	auto lock = store.lock();
	if (store.load()) {
		throw state_error(state_error::kind::already_running);
	}
	store.save(state);

	return render_status(evaluate(state, now));
}

std::string status_command(const state_store &store, timepoint_t now) {
	const auto state = store.load();
	if (!state) {
		return render_idle();
	}
	return render_status(evaluate(*state, now));
}

std::string stop_command(const state_store &store) {
	auto lock = store.lock();
	if (!store.remove()) {
		throw state_error(state_error::kind::not_running);
	}
	return "pomodoro stopped";
}

std::string pause_command(const state_store &store, timepoint_t now) {
	const auto state = modify(store, [now](timer_state &s) { pause(s, now); });
	return render_status(evaluate(state, now));
}

std::string unpause_command(const state_store &store, timepoint_t now) {
	const auto state = modify(store, [now](timer_state &s) { unpause(s, now); });
	return render_status(evaluate(state, now));
}

std::string info_command(const state_store &store, timepoint_t now) {
	const auto state = store.load();
	if (!state) {
		return render_idle();
	}
	return render_info(*state, now);
}

} // namespace pomocl
