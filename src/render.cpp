#include "render.hpp"

#include <sstream>

namespace pomocl {

const char *phase_name(phase p) {
	switch (p) {
	case phase::work:
		return "work";
	case phase::rest:
		return "break";
	case phase::finished:
		return "done";
	}
	return "unknown";
}

std::string render_status(const clock_snapshot &snapshot) {
	std::stringstream ss;
	if (snapshot.current == phase::finished) {
		ss << "pomodoro finished";
	} else {
		ss << phase_name(snapshot.current) << ' ' << print_clock(snapshot.remaining)
		   << " (next: " << phase_name(snapshot.next) << ") " << snapshot.repetition << '/'
		   << snapshot.repetitions;
	}
	if (snapshot.paused) {
		ss << " [paused]";
	}

	return ss.str();
}

std::string render_file(const clock_snapshot &snapshot) {
	if (snapshot.current == phase::finished) {
		return "Pomodoro finished";
	}

	std::stringstream ss;
	ss << (snapshot.current == phase::work ? "Work" : "Break") << ' '
	   << print_clock(snapshot.remaining) << " [" << snapshot.repetition << '/'
	   << snapshot.repetitions << ']';
	if (snapshot.paused) {
		ss << " (paused)";
	}

	return ss.str();
}

std::string render_idle() { return "no pomodoro running"; }

std::string render_info(const timer_state &state, timepoint_t now) {
	const auto snapshot = evaluate(state, now);
	const auto paused   = paused_for(state, now);

	std::stringstream ss;
	ss << "schedule:     " << format_schedule(state.plan) << " (" << state.plan.repetitions
	   << " x " << print_clock(state.plan.work) << " work, " << print_clock(state.plan.rest)
	   << " break)\n";
	ss << "started:      " << print_time(state.started_at) << '\n';
	ss << "ends:         " << print_time(state.started_at + total_duration(state.plan) + paused)
	   << (state.paused_at ? " (if resumed now)" : "") << '\n';
	ss << "elapsed:      " << print_duration(snapshot.elapsed) << " of "
	   << print_duration(total_duration(state.plan)) << '\n';
	ss << "paused total: " << print_duration(paused) << '\n';
	if (state.paused_at) {
		ss << "paused since: " << print_time(*state.paused_at) << '\n';
	}
	ss << "state:        " << render_status(snapshot);

	return ss.str();
}

} // namespace pomocl
