#pragma once

#include "clock.hpp"

#include <string>

namespace pomocl {

const char *phase_name(phase p);

/** One line for status bars, e.g. "work 05:00 (next: break) 1/2" */
std::string render_status(const clock_snapshot &snapshot);

/** Overlay file content, e.g. "Work 05:00 [1/2]" */
std::string render_file(const clock_snapshot &snapshot);

std::string render_idle();

/** Multi-line report for `info` */
std::string render_info(const timer_state &state, timepoint_t now);

} // namespace pomocl
