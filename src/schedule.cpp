#include "schedule.hpp"

#include "errors.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <sstream>

namespace pomocl {

namespace {

const unsigned   default_repetitions = 4;
const duration_t default_work        = std::chrono::minutes(45);
const duration_t default_rest        = std::chrono::minutes(10);

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

std::string trim(const std::string &input) {
	const char *ws    = " \t\r\n\v\f";
	const auto  first = input.find_first_not_of(ws);
	if (first == std::string::npos) {
		return "";
	}
	const auto last = input.find_last_not_of(ws);
	return input.substr(first, last - first + 1);
}

/** Scanner over a trimmed definition */
class scanner {
  public:
	explicit scanner(const std::string &input) : input_(input) {}

	bool done() const { return pos_ == input_.size(); }
	char peek() const { return done() ? '\0' : input_[pos_]; }
	void skip() { ++pos_; }

	uint64_t number(const char *what) {
		const auto begin = pos_;
		while (!done() && is_digit(input_[pos_])) {
			++pos_;
		}
		if (begin == pos_) {
			fail(std::string("expected a number for ") + what);
		}

		uint64_t value  = 0;
		auto     result = std::from_chars(input_.data() + begin, input_.data() + pos_, value);
		if (result.ec != std::errc()) {
			fail(std::string("number out of range for ") + what);
		}
		return value;
	}

	/** Number with an optional s/m/h unit, minutes by default */
	duration_t duration(const char *what) {
		const uint64_t value = number(what);

		duration_t unit = std::chrono::minutes(1);
		switch (peek()) {
		case 's':
			unit = std::chrono::seconds(1);
			skip();
			break;
		case 'm':
			skip();
			break;
		case 'h':
			unit = std::chrono::hours(1);
			skip();
			break;
		default:
			break;
		}

		const auto limit = static_cast<uint64_t>(duration_t::max().count() / unit.count());
		if (value > limit) {
			fail(std::string("duration out of range for ") + what);
		}
		return unit * static_cast<duration_t::rep>(value);
	}

	[[noreturn]] void fail(const std::string &reason) const {
		std::stringstream ss;
		ss << "Invalid pomodoro definition '" << input_ << "': " << reason << " at position "
		   << pos_;
		throw parse_error(parse_error::kind::invalid_format, ss.str());
	}

  private:
	const std::string &input_;
	size_t             pos_ = 0;
};

/** Minutes when exact, otherwise seconds */
std::string duration_token(duration_t d) {
	std::stringstream ss;
	if (d % std::chrono::minutes(1) == duration_t::zero()) {
		ss << std::chrono::duration_cast<std::chrono::minutes>(d).count();
	} else {
		ss << std::chrono::duration_cast<std::chrono::seconds>(d).count() << 's';
	}
	return ss.str();
}

} // namespace

schedule default_schedule() { return schedule{default_repetitions, default_work, default_rest}; }

bool fits(const schedule &s) {
	if (s.repetitions == 0) {
		return true;
	}
	if (s.work > duration_t::max() - s.rest) {
		return false;
	}
	return (s.work + s.rest).count() <= duration_t::max().count() / s.repetitions;
}

duration_t total_duration(const schedule &s) {
	if (s.repetitions == 0) {
		return duration_t::zero();
	}
	return s.work * s.repetitions + s.rest * (s.repetitions - 1);
}

schedule parse_schedule(const std::string &definition) {
	const std::string input = trim(definition);
	schedule          res   = default_schedule();
	scanner           scan(input);

	if (is_digit(scan.peek())) {
		const uint64_t repetitions = scan.number("repetitions");
		if (repetitions > 100000) {
			scan.fail("too many repetitions");
		}
		if (repetitions == 0) {
			throw parse_error(parse_error::kind::zero_duration,
			                  "Invalid pomodoro definition '" + input +
			                      "': repetitions must be at least 1");
		}
		res.repetitions = static_cast<unsigned>(repetitions);
	}
	if (scan.peek() == 'p') {
		scan.skip();
		res.work = scan.duration("work duration");
		if (res.work == duration_t::zero()) {
			throw parse_error(parse_error::kind::zero_duration,
			                  "Invalid pomodoro definition '" + input +
			                      "': work duration must be positive");
		}
	}
	if (scan.peek() == 'b') {
		scan.skip();
		res.rest = scan.duration("break duration");
		if (res.rest == duration_t::zero()) {
			throw parse_error(parse_error::kind::zero_duration,
			                  "Invalid pomodoro definition '" + input +
			                      "': break duration must be positive");
		}
	}
	if (!scan.done()) {
		scan.fail(std::string("unexpected '") + scan.peek() + "'");
	}
	if (!fits(res)) {
		scan.fail("the whole run is too long");
	}

	return res;
}

std::string format_schedule(const schedule &s) {
	std::stringstream ss;
	ss << s.repetitions << 'p' << duration_token(s.work) << 'b' << duration_token(s.rest);
	return ss.str();
}

} // namespace pomocl
