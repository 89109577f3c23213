#pragma once

#include "timer_state.hpp"

#include <filesystem>
#include <optional>

namespace pomocl {

/**
 * Single-slot persistent home of the running timer_state.
 *
 * Writes go to a temporary file that is renamed over the record, so readers
 * never see a partial record.  Mutating callers serialize their
 * load/compute/save through lock().
 */
class state_store {
  public:
	/** Exclusive advisory lock, released on destruction */
	class guard {
	  public:
		explicit guard(int fd) : fd_(fd) {}
		guard(guard &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
		guard(const guard &)            = delete;
		guard &operator=(const guard &) = delete;
		guard &operator=(guard &&)      = delete;
		~guard();

	  private:
		int fd_;
	};

	explicit state_store(std::filesystem::path path);

	const std::filesystem::path &path() const { return path_; }

	/** Empty when no pomodoro is running */
	std::optional<timer_state> load() const;

	void save(const timer_state &state) const;

	/** False when there was nothing to remove */
	bool remove() const;

	guard lock() const;

  private:
	void ensure_directory() const;

	std::filesystem::path path_;
};

/**
 * $POMOCL_STATE_FILE, else $XDG_STATE_HOME/pomocl/current_pomo, else
 * ~/.local/state/pomocl/current_pomo
 */
std::filesystem::path default_state_path();

/** Write `content` to `path` through `<path>.tmp.<pid>` and rename */
void write_atomically(const std::filesystem::path &path, const std::string &content);

} // namespace pomocl
