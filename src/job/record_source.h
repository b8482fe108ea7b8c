#pragma once

#include <cstddef>
#include "absl/synchronization/mutex.h"
#include "record.h"
#include "../sink/sequencer.h"

namespace ChunkSink {

/**
 * Synchronized reader shared by all workers.
 * Generates num_records rows with ascending codes and hands them out in
 * chunks. The chunk's sequence number is drawn inside the same critical
 * section as its records, so sequence order always matches read order.
 */
class RecordSource {
public:
    RecordSource(size_t num_records, int first_code, size_t chunk_size, Sequencer& sequencer);

    RecordSource(const RecordSource&) = delete;
    RecordSource& operator=(const RecordSource&) = delete;

    // Fills chunk with the next batch. Returns false once the source is exhausted or stopped.
    bool NextChunk(Chunk& chunk);

    // Makes every later NextChunk() return false.
    void Stop();

    size_t records_read() const;
    size_t chunks_read() const;

    static Record MakeRecord(int code);

private:
    const size_t num_records_;
    const int first_code_;
    const size_t chunk_size_;
    Sequencer& sequencer_;

    mutable absl::Mutex mu_;
    size_t cursor_ ABSL_GUARDED_BY(mu_) = 0;
    size_t chunks_ ABSL_GUARDED_BY(mu_) = 0;
    bool stopped_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace ChunkSink
