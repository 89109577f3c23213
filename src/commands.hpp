#pragma once

#include "state_store.hpp"
#include "time_util.hpp"

#include <optional>
#include <string>

namespace pomocl {

// Every command returns what it prints and throws on failure.  Mutating
// commands hold the store lock for their whole load/modify/save cycle.

/** `until` is a wall-clock HH:MM the run must end at */
std::string start_command(const state_store &store, const std::string &definition,
                          const std::optional<std::string> &until, timepoint_t now);
std::string status_command(const state_store &store, timepoint_t now);
std::string stop_command(const state_store &store);
std::string pause_command(const state_store &store, timepoint_t now);
std::string unpause_command(const state_store &store, timepoint_t now);
std::string info_command(const state_store &store, timepoint_t now);

} // namespace pomocl
