#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ChunkSink {

/**
 * Raised when a sequence number is handed to a sink twice.
 * This is a caller bug, so it derives from std::logic_error.
 */
class DuplicateSequenceError : public std::logic_error {
public:
    explicit DuplicateSequenceError(uint64_t seq)
        : std::logic_error("Duplicate sequence number " + std::to_string(seq)),
          seq_(seq) {}

    uint64_t seq() const { return seq_; }

private:
    uint64_t seq_;
};

/**
 * Base class for runtime failures reported by a sink.
 */
class SinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * The underlying output failed while appending the fragment for seq().
 * The sink is poisoned afterwards.
 */
class SinkWriteError : public SinkError {
public:
    SinkWriteError(uint64_t seq, const std::string& cause)
        : SinkError("Write failed for sequence " + std::to_string(seq) + ": " + cause),
          seq_(seq),
          cause_(cause) {}

    uint64_t seq() const { return seq_; }
    const std::string& cause() const { return cause_; }

private:
    uint64_t seq_;
    std::string cause_;
};

/**
 * Returned to every caller once a write has failed. failed_seq() names the
 * sequence number whose write poisoned the sink.
 */
class SinkPoisonedError : public SinkError {
public:
    SinkPoisonedError(uint64_t failed_seq, const std::string& cause)
        : SinkError("Sink poisoned by failed write of sequence " +
                    std::to_string(failed_seq) + ": " + cause),
          failed_seq_(failed_seq) {}

    uint64_t failed_seq() const { return failed_seq_; }

private:
    uint64_t failed_seq_;
};

// Submission after Close() or Abort().
class SinkClosedError : public SinkError {
public:
    explicit SinkClosedError(const std::string& what) : SinkError(what) {}
};

} // namespace ChunkSink
