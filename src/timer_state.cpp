#include "timer_state.hpp"

#include "errors.hpp"

#include <charconv>
#include <cstdint>
#include <map>
#include <sstream>

namespace pomocl {

namespace {

const int format_version = 1;

duration_t::rep ticks(timepoint_t t) { return t.time_since_epoch().count(); }

int64_t parse_integer(const std::string &key, const std::string &value) {
	int64_t res    = 0;
	auto    result = std::from_chars(value.data(), value.data() + value.size(), res);
	if (result.ec != std::errc() || result.ptr != value.data() + value.size()) {
		throw store_error("Malformed value for '" + key + "': '" + value + "'");
	}
	return res;
}

const std::string &require(const std::map<std::string, std::string> &fields,
                           const std::string                        &key) {
	auto it = fields.find(key);
	if (it == fields.end()) {
		throw store_error("Missing field '" + key + "' in pomodoro state");
	}
	return it->second;
}

} // namespace

void pause(timer_state &state, timepoint_t now) {
	if (state.paused_at) {
		throw state_error(state_error::kind::already_paused);
	}
	state.paused_at = now;
}

void unpause(timer_state &state, timepoint_t now) {
	if (!state.paused_at) {
		throw state_error(state_error::kind::not_paused);
	}
	if (now > *state.paused_at) {
		state.total_paused += now - *state.paused_at;
	}
	state.paused_at.reset();
}

duration_t paused_for(const timer_state &state, timepoint_t now) {
	duration_t res = state.total_paused;
	if (state.paused_at && now > *state.paused_at) {
		res += now - *state.paused_at;
	}
	return res;
}

std::string encode_state(const timer_state &state) {
	std::stringstream ss;
	ss << "version=" << format_version << '\n';
	ss << "repetitions=" << state.plan.repetitions << '\n';
	ss << "work=" << state.plan.work.count() << '\n';
	ss << "break=" << state.plan.rest.count() << '\n';
	ss << "started_at=" << ticks(state.started_at) << '\n';
	if (state.paused_at) {
		ss << "paused_at=" << ticks(*state.paused_at) << '\n';
	}
	ss << "total_paused=" << state.total_paused.count() << '\n';

	return ss.str();
}

timer_state decode_state(const std::string &text) {
	std::map<std::string, std::string> fields;
	std::stringstream                  ss(text);
	std::string                        line;
	while (std::getline(ss, line)) {
		if (line.empty()) {
			continue;
		}
		const size_t pos_eq = line.find('=');
		if (pos_eq == std::string::npos) {
			throw store_error("Malformed line in pomodoro state: '" + line + "'");
		}
		auto key = line.substr(0, pos_eq);
		if (key != "version" && key != "repetitions" && key != "work" && key != "break" &&
		    key != "started_at" && key != "paused_at" && key != "total_paused") {
			throw store_error("Unknown field '" + key + "' in pomodoro state");
		}
		if (!fields.emplace(key, line.substr(pos_eq + 1)).second) {
			throw store_error("Duplicate field '" + key + "' in pomodoro state");
		}
	}

	const auto version = parse_integer("version", require(fields, "version"));
	if (version != format_version) {
		throw store_error("Unsupported pomodoro state version " + std::to_string(version));
	}

	const auto repetitions = parse_integer("repetitions", require(fields, "repetitions"));
	const auto work        = duration_t(parse_integer("work", require(fields, "work")));
	const auto rest        = duration_t(parse_integer("break", require(fields, "break")));
	if (repetitions < 1 || repetitions > UINT32_MAX || work <= duration_t::zero() ||
	    rest <= duration_t::zero()) {
		throw store_error("Pomodoro state holds an invalid schedule");
	}

	timer_state res{};
	res.plan       = schedule{static_cast<unsigned>(repetitions), work, rest};
	if (!fits(res.plan)) {
		throw store_error("Pomodoro state holds a schedule that is too long");
	}
	res.started_at = timepoint_t(duration_t(parse_integer("started_at", require(fields, "started_at"))));
	if (auto it = fields.find("paused_at"); it != fields.end()) {
		res.paused_at = timepoint_t(duration_t(parse_integer("paused_at", it->second)));
	}
	res.total_paused = duration_t(parse_integer("total_paused", require(fields, "total_paused")));
	if (res.total_paused < duration_t::zero()) {
		throw store_error("Pomodoro state holds a negative pause time");
	}

	return res;
}

} // namespace pomocl
