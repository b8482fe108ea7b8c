#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ChunkSink {

struct SinkStats {
    uint64_t fragments_written = 0;
    uint64_t bytes_written = 0;
    // Fragments that arrived while an earlier sequence number was still missing
    uint64_t out_of_order_arrivals = 0;
    size_t max_pending = 0;
};

/**
 * Destination for sequenced fragments produced by concurrent workers.
 * Errors are reported with the exceptions declared in sink_errors.h.
 */
class FragmentSink {
public:
    virtual ~FragmentSink() = default;

    // Delivers one fragment. Blocks until the fragment has been appended.
    virtual void Submit(uint64_t seq, std::string fragment) = 0;

    // Waits for outstanding fragments, then closes the output. Call once.
    virtual void Close() = 0;

    // Releases blocked callers with SinkClosedError and drops unwritten fragments.
    virtual void Abort() = 0;

    virtual SinkStats GetStats() const = 0;
};

} // namespace ChunkSink
