#pragma once

#include <string>
#include <string_view>
#include <sys/types.h>
#include "output.h"
#include "../common/scoped_fd.h"

namespace ChunkSink {

/**
 * Output backed by a POSIX file opened with O_APPEND.
 * The file is created (or truncated) by the constructor, which throws
 * std::system_error if it cannot be opened. A failed Append (including a
 * failed fdatasync with force_sync) truncates the file back to its size
 * before the call.
 */
class FileOutput : public Output {
public:
    /**
     * @param path File to create
     * @param force_sync fdatasync() after every append
     */
    explicit FileOutput(std::string path, bool force_sync = false);
    ~FileOutput() override;

    FileOutput(const FileOutput&) = delete;
    FileOutput& operator=(const FileOutput&) = delete;

    size_t Append(std::string_view bytes) override;
    void Sync() override;
    void Close() override;
    std::string Describe() const override { return path_; }

    const std::string& path() const { return path_; }

private:
    // Truncates to size after a failed append that left partial bytes behind.
    void RollBack(off_t size, size_t partial);

    std::string path_;
    bool force_sync_;
    ScopedFd fd_;
};

} // namespace ChunkSink
