#include "state_store.hpp"

#include "errors.hpp"

#include <sys/file.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace pomocl {

namespace {

[[noreturn]] void fail(const std::string &what, const fs::path &path, int err) {
	throw store_error(what + " " + path.string() + ": " + std::strerror(err));
}

/** Owns a file descriptor */
class file_handle {
  public:
	explicit file_handle(int fd) : fd_(fd) {}
	file_handle(const file_handle &)            = delete;
	file_handle &operator=(const file_handle &) = delete;
	~file_handle() {
		if (fd_ >= 0) {
			::close(fd_);
		}
	}

	int get() const { return fd_; }

	/** Close explicitly to see the error */
	int close() {
		const int res = ::close(fd_);
		fd_           = -1;
		return res;
	}

  private:
	int fd_;
};

} // namespace

state_store::guard::~guard() {
	if (fd_ >= 0) {
		::flock(fd_, LOCK_UN);
		::close(fd_);
	}
}

state_store::state_store(fs::path path) : path_(std::move(path)) {}

std::optional<timer_state> state_store::load() const {
	file_handle file(::open(path_.c_str(), O_RDONLY | O_CLOEXEC));
	if (file.get() < 0) {
		if (errno == ENOENT) {
			return std::nullopt;
		}
		fail("Cannot open", path_, errno);
	}

	std::string content;
	char        buffer[4096];
	for (;;) {
		const ssize_t n = ::read(file.get(), buffer, sizeof(buffer));
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			fail("Cannot read", path_, errno);
		}
		if (n == 0) {
			break;
		}
		content.append(buffer, static_cast<size_t>(n));
	}

	try {
		return decode_state(content);
	} catch (const store_error &e) {
		throw store_error(path_.string() + ": " + e.what());
	}
}

void state_store::save(const timer_state &state) const {
	ensure_directory();
	write_atomically(path_, encode_state(state));
}

bool state_store::remove() const {
	if (::unlink(path_.c_str()) != 0) {
		if (errno == ENOENT) {
			return false;
		}
		fail("Cannot remove", path_, errno);
	}
	return true;
}

state_store::guard state_store::lock() const {
	ensure_directory();
	fs::path lock_path = path_;
	lock_path += ".lock";

	const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
	if (fd < 0) {
		fail("Cannot open lock file", lock_path, errno);
	}
	guard res(fd);
	while (::flock(fd, LOCK_EX) != 0) {
		if (errno != EINTR) {
			fail("Cannot lock", lock_path, errno);
		}
	}
	return res;
}

void state_store::ensure_directory() const {
	const fs::path dir = path_.parent_path();
	if (dir.empty()) {
		return;
	}
	std::error_code ec;
	fs::create_directories(dir, ec);
	if (ec) {
		throw store_error("Cannot create directory " + dir.string() + ": " + ec.message());
	}
}

fs::path default_state_path() {
	if (const char *file = std::getenv("POMOCL_STATE_FILE"); file && *file) {
		return file;
	}
	if (const char *state_home = std::getenv("XDG_STATE_HOME"); state_home && *state_home) {
		return fs::path(state_home) / "pomocl" / "current_pomo";
	}
	const char *home = std::getenv("HOME");
	if (!home || !*home) {
		throw store_error("Neither HOME nor XDG_STATE_HOME is set");
	}
	return fs::path(home) / ".local" / "state" / "pomocl" / "current_pomo";
}

void write_atomically(const fs::path &path, const std::string &content) {
	fs::path tmp_path = path;
	tmp_path += ".tmp." + std::to_string(::getpid());

	// A leftover from a killed process with the same pid is simply truncated
	file_handle file(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
	if (file.get() < 0) {
		fail("Cannot create temporary file", tmp_path, errno);
	}

	auto discard = [&](const char *what) {
		const int err = errno;
		::unlink(tmp_path.c_str());
		fail(what, path, err);
	};

	const char *data = content.data();
	size_t      left = content.size();
	while (left > 0) {
		const ssize_t n = ::write(file.get(), data, left);
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			discard("Cannot write");
		}
		data += n;
		left -= static_cast<size_t>(n);
	}
	if (::fsync(file.get()) != 0) {
		discard("Cannot sync");
	}
	if (file.close() != 0) {
		discard("Cannot close");
	}
	if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
		discard("Cannot replace");
	}
}

} // namespace pomocl
