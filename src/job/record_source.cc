#include "record_source.h"

#include <algorithm>
#include <glog/logging.h>
#include "absl/strings/str_format.h"

namespace ChunkSink {

RecordSource::RecordSource(size_t num_records, int first_code, size_t chunk_size, Sequencer& sequencer)
    : num_records_(num_records),
      first_code_(first_code),
      chunk_size_(chunk_size),
      sequencer_(sequencer) {
    CHECK_GT(chunk_size_, 0u) << "Chunk size must be positive";
}

Record RecordSource::MakeRecord(int code) {
    Record record;
    record.code = code;
    record.ref = absl::StrFormat("REF%010d", code);
    record.type = code % 7;
    record.nature = code % 3;
    record.etat = code % 2;
    record.ref2 = (code % 4 == 0) ? std::string() : absl::StrFormat("R2-%08d", code);
    return record;
}

bool RecordSource::NextChunk(Chunk& chunk) {
    absl::MutexLock lock(&mu_);
    if (stopped_ || cursor_ >= num_records_) {
        return false;
    }
    size_t count = std::min(chunk_size_, num_records_ - cursor_);
    chunk.records.clear();
    chunk.records.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        chunk.records.push_back(MakeRecord(first_code_ + static_cast<int>(cursor_ + i)));
    }
    cursor_ += count;
    chunk.seq = sequencer_.Next();
    chunks_++;
    VLOG(2) << "Read chunk " << chunk.seq << " with " << count << " records";
    return true;
}

void RecordSource::Stop() {
    absl::MutexLock lock(&mu_);
    stopped_ = true;
}

size_t RecordSource::records_read() const {
    absl::MutexLock lock(&mu_);
    return cursor_;
}

size_t RecordSource::chunks_read() const {
    absl::MutexLock lock(&mu_);
    return chunks_;
}

} // namespace ChunkSink
