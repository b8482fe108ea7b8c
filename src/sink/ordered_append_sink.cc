#include "ordered_append_sink.h"

#include <exception>
#include <utility>
#include <glog/logging.h>
#include "sink_errors.h"

namespace ChunkSink {

OrderedAppendSink::OrderedAppendSink(std::unique_ptr<Output> output, uint64_t first_seq)
    : output_(std::move(output)),
      next_expected_(first_seq) {
    CHECK(output_ != nullptr) << "OrderedAppendSink requires an output";
    VLOG(1) << "OrderedAppendSink on " << output_->Describe() << " starting at sequence " << first_seq;
}

OrderedAppendSink::~OrderedAppendSink() {
    bool open;
    {
        absl::MutexLock lock(&mu_);
        open = state_ == State::kOpen || state_ == State::kClosing;
        if (open && !pending_.empty()) {
            LOG(WARNING) << "OrderedAppendSink destroyed with " << pending_.size()
                         << " unwritten fragments, next expected " << next_expected_;
        }
    }
    if (open) {
        Abort();
    }
}

void OrderedAppendSink::Submit(uint64_t seq, std::string fragment) {
    absl::MutexLock lock(&mu_);
    AcceptLocked(seq, std::move(fragment));
    DrainLocked();

    while (next_expected_ <= seq && !poisoned_ && state_ != State::kAborted) {
        cv_.Wait(&mu_);
    }
    if (next_expected_ > seq) {
        return;
    }
    if (poisoned_) {
        if (seq == failed_seq_) {
            throw SinkWriteError(seq, failure_);
        }
        throw SinkPoisonedError(failed_seq_, failure_);
    }
    throw SinkClosedError("Sink aborted before sequence " + std::to_string(seq) + " was written");
}

void OrderedAppendSink::Enqueue(uint64_t seq, std::string fragment) {
    absl::MutexLock lock(&mu_);
    AcceptLocked(seq, std::move(fragment));
    DrainLocked();
}

void OrderedAppendSink::AcceptLocked(uint64_t seq, std::string fragment) {
    if (state_ == State::kClosed || state_ == State::kAborted) {
        LOG(WARNING) << "Rejecting sequence " << seq << ": sink is "
                     << (state_ == State::kClosed ? "closed" : "aborted");
        throw SinkClosedError("Submit of sequence " + std::to_string(seq) + " after sink shutdown");
    }
    if (poisoned_) {
        throw SinkPoisonedError(failed_seq_, failure_);
    }
    bool in_flight = write_in_flight_ && seq == next_expected_;
    if (seq < next_expected_ || in_flight || pending_.contains(seq)) {
        LOG(WARNING) << "Rejecting duplicate sequence " << seq << " (next expected " << next_expected_ << ")";
        throw DuplicateSequenceError(seq);
    }

    if (seq != next_expected_) {
        stats_.out_of_order_arrivals++;
        VLOG(2) << "Sequence " << seq << " parked, waiting for " << next_expected_;
    }
    pending_.emplace(seq, std::move(fragment));
    if (pending_.size() > stats_.max_pending) {
        stats_.max_pending = pending_.size();
    }
}

void OrderedAppendSink::DrainLocked() {
    if (write_in_flight_) {
        // The active writer picks up whatever became consecutive.
        return;
    }
    while (!poisoned_ && state_ != State::kAborted) {
        auto it = pending_.find(next_expected_);
        if (it == pending_.end()) {
            break;
        }
        const uint64_t seq = it->first;
        std::string fragment = std::move(it->second);
        pending_.erase(it);
        write_in_flight_ = true;

        bool failed = false;
        std::string cause;
        mu_.Unlock();
        try {
            output_->Append(fragment);
        } catch (const std::exception& e) {
            failed = true;
            cause = e.what();
        } catch (...) {
            failed = true;
            cause = "unknown exception from output";
        }
        mu_.Lock();

        write_in_flight_ = false;
        if (failed) {
            PoisonLocked(seq, cause);
            break;
        }
        next_expected_ = seq + 1;
        stats_.fragments_written++;
        stats_.bytes_written += fragment.size();
        VLOG(3) << "Appended sequence " << seq << " (" << fragment.size() << " bytes)";
        cv_.SignalAll();
    }
}

void OrderedAppendSink::PoisonLocked(uint64_t seq, const std::string& cause) {
    LOG(ERROR) << "Append of sequence " << seq << " to " << output_->Describe()
               << " failed: " << cause << ". Dropping " << pending_.size() << " pending fragments";
    poisoned_ = true;
    failed_seq_ = seq;
    failure_ = cause;
    pending_.clear();
    cv_.SignalAll();
}

void OrderedAppendSink::CloseOutputLocked() {
    try {
        output_->Close();
    } catch (const std::exception& e) {
        throw SinkError("Failed to close " + output_->Describe() + ": " + e.what());
    }
}

void OrderedAppendSink::Close() {
    absl::MutexLock lock(&mu_);
    if (state_ != State::kOpen) {
        throw SinkClosedError("Close called on a sink that is already closing, closed or aborted");
    }
    // Submissions stay accepted until the pending map drains so late workers can fill gaps.
    state_ = State::kClosing;
    while (!poisoned_ && state_ == State::kClosing && (write_in_flight_ || !pending_.empty())) {
        cv_.Wait(&mu_);
    }
    if (state_ == State::kAborted) {
        throw SinkClosedError("Sink aborted while closing");
    }
    while (write_in_flight_) {
        cv_.Wait(&mu_);
    }
    state_ = State::kClosed;
    cv_.SignalAll();

    if (poisoned_) {
        try {
            output_->Close();
        } catch (const std::exception& e) {
            LOG(WARNING) << "Closing poisoned output " << output_->Describe() << " also failed: " << e.what();
        }
        throw SinkPoisonedError(failed_seq_, failure_);
    }
    CloseOutputLocked();
    LOG(INFO) << "Closed " << output_->Describe() << " after " << stats_.fragments_written
              << " fragments, " << stats_.bytes_written << " bytes";
}

void OrderedAppendSink::Abort() {
    absl::MutexLock lock(&mu_);
    if (state_ == State::kClosed || state_ == State::kAborted) {
        return;
    }
    LOG(WARNING) << "Aborting sink on " << output_->Describe() << ", discarding "
                 << pending_.size() << " pending fragments";
    state_ = State::kAborted;
    pending_.clear();
    cv_.SignalAll();
    // An append already in flight is allowed to finish so no partial fragment is left behind.
    while (write_in_flight_) {
        cv_.Wait(&mu_);
    }
    try {
        output_->Close();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Closing " << output_->Describe() << " during abort failed: " << e.what();
    }
}

SinkStats OrderedAppendSink::GetStats() const {
    absl::MutexLock lock(&mu_);
    return stats_;
}

uint64_t OrderedAppendSink::next_expected() const {
    absl::MutexLock lock(&mu_);
    return next_expected_;
}

size_t OrderedAppendSink::pending_count() const {
    absl::MutexLock lock(&mu_);
    return pending_.size();
}

bool OrderedAppendSink::poisoned() const {
    absl::MutexLock lock(&mu_);
    return poisoned_;
}

} // namespace ChunkSink
