#include "watch.hpp"

#include "clock.hpp"
#include "render.hpp"

#include <event2/event.h>
#include <sys/time.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace pomocl {

namespace {

struct base_deleter {
	void operator()(event_base *base) const { event_base_free(base); }
};
struct event_deleter {
	void operator()(event *ev) const { event_free(ev); }
};
using base_ptr  = std::unique_ptr<event_base, base_deleter>;
using event_ptr = std::unique_ptr<event, event_deleter>;

struct loop_context {
	watcher    *self;
	event_base *base;
};

void on_tick(evutil_socket_t, short, void *arg) {
	auto *ctx = static_cast<loop_context *>(arg);
	if (!ctx->self->tick(std::chrono::system_clock::now())) {
		event_base_loopbreak(ctx->base);
	}
}

void on_signal(evutil_socket_t, short, void *arg) {
	event_base_loopbreak(static_cast<event_base *>(arg));
}

clock_snapshot finished_snapshot() {
	clock_snapshot res{};
	res.current = phase::finished;
	res.next    = phase::finished;
	return res;
}

} // namespace

watcher::watcher(const state_store &store, fs::path output, std::ostream &echo)
    : store_(store), output_(std::move(output)), echo_(echo) {
	const fs::path dir = output_.parent_path().empty() ? fs::path(".") : output_.parent_path();
	std::error_code ec;
	if (!fs::is_directory(dir, ec)) {
		throw std::invalid_argument("Output directory " + dir.string() + " does not exist");
	}
}

bool watcher::tick(timepoint_t now) {
	try {
		const auto state = store_.load();
		if (!state) {
			write_atomically(output_, render_file(finished_snapshot()));
			echo_ << '\r' << render_idle() << "        " << std::flush;
			return false;
		}
		const auto snapshot = evaluate(*state, now);
		write_atomically(output_, render_file(snapshot));
		echo_ << '\r' << render_status(snapshot) << "        " << std::flush;
	} catch (const std::exception &e) {
		std::cerr << "\npomocl: " << e.what() << '\n';
	}
	return true;
}

void watcher::run() {
	if (!tick(std::chrono::system_clock::now())) {
		echo_ << '\n';
		return;
	}

	base_ptr base(event_base_new());
	if (!base) {
		throw std::runtime_error("Cannot create event loop");
	}
	loop_context ctx{this, base.get()};

	event_ptr timer(event_new(base.get(), -1, EV_PERSIST, on_tick, &ctx));
	event_ptr sigint(evsignal_new(base.get(), SIGINT, on_signal, base.get()));
	event_ptr sigterm(evsignal_new(base.get(), SIGTERM, on_signal, base.get()));
	if (!timer || !sigint || !sigterm) {
		throw std::runtime_error("Cannot create watch events");
	}

	const timeval second{1, 0};
	if (event_add(timer.get(), &second) != 0 || event_add(sigint.get(), nullptr) != 0 ||
	    event_add(sigterm.get(), nullptr) != 0) {
		throw std::runtime_error("Cannot schedule watch events");
	}
	if (event_base_dispatch(base.get()) < 0) {
		throw std::runtime_error("Event loop failed");
	}
	echo_ << '\n';
}

} // namespace pomocl
