// RAII owner of a file descriptor. The output file is closed on every exit
// path, including a sink that is destroyed without Finish().
#ifndef TASKFOLD_SRC_COMMON_SCOPED_FD_H_
#define TASKFOLD_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Taskfold {

class ScopedFd {
public:
	ScopedFd() = default;
	explicit ScopedFd(int fd) : fd_(fd) {}

	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			reset();
			fd_ = o.fd_;
			o.fd_ = -1;
		}
		return *this;
	}

	int get() const { return fd_; }
	bool valid() const { return fd_ >= 0; }

	// Release ownership; caller must close and check the result.
	int release() {
		int f = fd_;
		fd_ = -1;
		return f;
	}

	void reset(int fd = -1) {
		if (fd_ >= 0) {
			::close(fd_);
		}
		fd_ = fd;
	}

private:
	int fd_ = -1;
};

} // namespace Taskfold

#endif  // TASKFOLD_SRC_COMMON_SCOPED_FD_H_
