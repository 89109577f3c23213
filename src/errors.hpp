#pragma once

#include <stdexcept>
#include <string>

namespace pomocl {

/** Malformed schedule definition */
class parse_error : public std::invalid_argument {
  public:
	enum class kind { invalid_format, zero_duration };

	parse_error(kind k, const std::string &what) : std::invalid_argument(what), kind_(k) {}

	kind which() const noexcept { return kind_; }

  private:
	kind kind_;
};

/** `--until` request that cannot be satisfied */
class solver_error : public std::invalid_argument {
  public:
	enum class kind { past_target, infeasible };

	solver_error(kind k, const std::string &what) : std::invalid_argument(what), kind_(k) {}

	kind which() const noexcept { return kind_; }

  private:
	kind kind_;
};

/** Invalid transition of the timer state machine */
class state_error : public std::runtime_error {
  public:
	enum class kind { already_running, not_running, already_paused, not_paused };

	explicit state_error(kind k) : std::runtime_error(describe(k)), kind_(k) {}

	kind which() const noexcept { return kind_; }

  private:
	static const char *describe(kind k) {
		switch (k) {
		case kind::already_running:
			return "A pomodoro is already running";
		case kind::not_running:
			return "No pomodoro is running";
		case kind::already_paused:
			return "The pomodoro is already paused";
		case kind::not_paused:
			return "The pomodoro is not paused";
		}
		return "Invalid pomodoro state";
	}

	kind kind_;
};

/** I/O failure or malformed record in the state store */
class store_error : public std::runtime_error {
  public:
	using std::runtime_error::runtime_error;
};

} // namespace pomocl
