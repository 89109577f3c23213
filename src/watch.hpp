#pragma once

#include "state_store.hpp"
#include "time_util.hpp"

#include <filesystem>
#include <iosfwd>

namespace pomocl {

/**
 * Rewrites an overlay file once per second until the pomodoro is stopped
 * or the process receives SIGINT/SIGTERM.
 */
class watcher {
  public:
	/** Throws std::invalid_argument if the output directory does not exist */
	watcher(const state_store &store, std::filesystem::path output, std::ostream &echo);

	/**
	 * Render once.  Returns false when the pomodoro is gone and the loop
	 * should end.  Read or write failures are reported and skipped.
	 */
	bool tick(timepoint_t now);

	/** Blocks in the event loop */
	void run();

  private:
	const state_store    &store_;
	std::filesystem::path output_;
	std::ostream         &echo_;
};

} // namespace pomocl
