// RAII owner for a POSIX file descriptor.
#ifndef CHUNKSINK_SRC_COMMON_SCOPED_FD_H_
#define CHUNKSINK_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace ChunkSink {

class ScopedFd {
public:
	ScopedFd() = default;
	explicit ScopedFd(int fd) : fd_(fd) {}

	~ScopedFd() { Reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			Reset();
			fd_ = o.fd_;
			o.fd_ = -1;
		}
		return *this;
	}

	int get() const { return fd_; }
	bool valid() const { return fd_ >= 0; }

	// Closes the descriptor now. Returns the ::close() result, 0 if nothing was open.
	int Reset() {
		int rc = 0;
		if (fd_ >= 0) {
			rc = ::close(fd_);
			fd_ = -1;
		}
		return rc;
	}

private:
	int fd_ = -1;
};

}  // namespace ChunkSink

#endif  // CHUNKSINK_SRC_COMMON_SCOPED_FD_H_
