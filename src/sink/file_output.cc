#include "file_output.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <glog/logging.h>

namespace ChunkSink {

FileOutput::FileOutput(std::string path, bool force_sync)
    : path_(std::move(path)), force_sync_(force_sync) {
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) {
        throw std::system_error(errno, std::generic_category(), "open failed for " + path_);
    }
    fd_ = ScopedFd(fd);
    VLOG(1) << "Opened output " << path_ << (force_sync_ ? " (force sync)" : "");
}

FileOutput::~FileOutput() {
    if (fd_.valid() && fd_.Reset() != 0) {
        LOG(WARNING) << "close failed for " << path_ << ": " << strerror(errno);
    }
}

size_t FileOutput::Append(std::string_view bytes) {
    if (!fd_.valid()) {
        throw std::runtime_error("Append on closed output " + path_);
    }
    // O_APPEND and a single writer: the current end is where this fragment starts.
    off_t start = ::lseek(fd_.get(), 0, SEEK_END);
    if (start == -1) {
        throw std::system_error(errno, std::generic_category(), "lseek failed for " + path_);
    }
    size_t written = 0;
    try {
        while (written < bytes.size()) {
            ssize_t n = ::write(fd_.get(), bytes.data() + written, bytes.size() - written);
            if (n == -1) {
                if (errno == EINTR) continue;
                throw std::system_error(errno, std::generic_category(), "write failed for " + path_);
            }
            if (n == 0) {
                throw std::runtime_error("Incomplete write: expected " + std::to_string(bytes.size()) +
                        ", wrote " + std::to_string(written) + " for " + path_);
            }
            written += static_cast<size_t>(n);
        }
        if (force_sync_) {
            Sync();
        }
    } catch (const std::exception&) {
        RollBack(start, written);
        throw;
    }
    return written;
}

void FileOutput::RollBack(off_t size, size_t partial) {
    if (partial == 0 && ::lseek(fd_.get(), 0, SEEK_END) == size) {
        return;
    }
    if (::ftruncate(fd_.get(), size) == -1) {
        LOG(ERROR) << "ftruncate failed for " << path_ << ", " << partial
                   << " bytes of a failed append remain: " << strerror(errno);
        return;
    }
    VLOG(1) << "Dropped " << partial << " bytes of a failed append to " << path_;
}

void FileOutput::Sync() {
    if (!fd_.valid()) return;
    if (::fdatasync(fd_.get()) == -1) {
        throw std::system_error(errno, std::generic_category(), "fdatasync failed for " + path_);
    }
}

void FileOutput::Close() {
    if (!fd_.valid()) return;
    if (::fsync(fd_.get()) == -1) {
        int err = errno;
        fd_.Reset();
        throw std::system_error(err, std::generic_category(), "fsync failed for " + path_);
    }
    if (fd_.Reset() != 0) {
        throw std::system_error(errno, std::generic_category(), "close failed for " + path_);
    }
    VLOG(1) << "Closed output " << path_;
}

} // namespace ChunkSink
