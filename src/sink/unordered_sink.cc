#include "unordered_sink.h"

#include <exception>
#include <utility>
#include <glog/logging.h>
#include "sink_errors.h"

namespace ChunkSink {

UnorderedSink::UnorderedSink(std::unique_ptr<Output> output)
    : output_(std::move(output)) {
    CHECK(output_ != nullptr) << "UnorderedSink requires an output";
}

UnorderedSink::~UnorderedSink() {
    Abort();
}

void UnorderedSink::Submit(uint64_t seq, std::string fragment) {
    absl::MutexLock lock(&mu_);
    if (closed_) {
        throw SinkClosedError("Submit of sequence " + std::to_string(seq) + " after sink shutdown");
    }
    if (poisoned_) {
        throw SinkPoisonedError(failed_seq_, failure_);
    }
    if (!seen_.insert(seq).second) {
        LOG(WARNING) << "Rejecting duplicate sequence " << seq;
        throw DuplicateSequenceError(seq);
    }
    if (stats_.fragments_written > 0 && seq < highest_written_) {
        stats_.out_of_order_arrivals++;
        VLOG(2) << "Sequence " << seq << " written after " << highest_written_;
    }

    try {
        output_->Append(fragment);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Append of sequence " << seq << " to " << output_->Describe() << " failed: " << e.what();
        poisoned_ = true;
        failed_seq_ = seq;
        failure_ = e.what();
        throw SinkWriteError(seq, failure_);
    }
    if (seq > highest_written_) {
        highest_written_ = seq;
    }
    stats_.fragments_written++;
    stats_.bytes_written += fragment.size();
}

void UnorderedSink::Close() {
    absl::MutexLock lock(&mu_);
    if (closed_) {
        throw SinkClosedError("Close called on a sink that is already closed");
    }
    closed_ = true;
    if (poisoned_) {
        try {
            output_->Close();
        } catch (const std::exception& e) {
            LOG(WARNING) << "Closing poisoned output " << output_->Describe() << " also failed: " << e.what();
        }
        throw SinkPoisonedError(failed_seq_, failure_);
    }
    try {
        output_->Close();
    } catch (const std::exception& e) {
        throw SinkError("Failed to close " + output_->Describe() + ": " + e.what());
    }
}

void UnorderedSink::Abort() {
    absl::MutexLock lock(&mu_);
    if (closed_) {
        return;
    }
    closed_ = true;
    try {
        output_->Close();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Closing " << output_->Describe() << " during abort failed: " << e.what();
    }
}

SinkStats UnorderedSink::GetStats() const {
    absl::MutexLock lock(&mu_);
    return stats_;
}

} // namespace ChunkSink
