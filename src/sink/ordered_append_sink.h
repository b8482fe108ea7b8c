#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"
#include "fragment_sink.h"
#include "output.h"

namespace ChunkSink {

/**
 * OrderedAppendSink appends fragments to its Output strictly in sequence
 * order, whatever order the submitting threads arrive in.
 *
 * Fragments that arrive ahead of their turn wait in a pending map. The thread
 * that delivers the next expected fragment becomes the writer: it appends
 * that fragment and keeps draining consecutive pending fragments until the
 * next gap. The append runs outside the sink mutex but only one append is
 * ever in flight.
 *
 * A failed append poisons the sink. The owner of the failed fragment gets
 * SinkWriteError, everyone else (pending, blocked or new) gets
 * SinkPoisonedError, and nothing more is written.
 */
class OrderedAppendSink : public FragmentSink {
public:
    /**
     * @param output Destination, owned exclusively by the sink
     * @param first_seq Sequence number of the first fragment
     */
    explicit OrderedAppendSink(std::unique_ptr<Output> output, uint64_t first_seq = 0);
    ~OrderedAppendSink() override;

    OrderedAppendSink(const OrderedAppendSink&) = delete;
    OrderedAppendSink& operator=(const OrderedAppendSink&) = delete;

    // Returns once seq and every earlier fragment has been appended.
    void Submit(uint64_t seq, std::string fragment) override;

    // Hand-off variant of Submit: returns as soon as the fragment is stored.
    // Write failures for enqueued fragments are reported by Close().
    void Enqueue(uint64_t seq, std::string fragment);

    void Close() override;
    void Abort() override;

    SinkStats GetStats() const override;

    uint64_t next_expected() const;
    size_t pending_count() const;
    bool poisoned() const;

private:
    enum class State { kOpen, kClosing, kClosed, kAborted };

    // Validates seq and stores the fragment in pending_.
    void AcceptLocked(uint64_t seq, std::string fragment) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
    // Writes consecutive pending fragments unless another thread already is.
    void DrainLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
    void PoisonLocked(uint64_t seq, const std::string& cause) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
    void CloseOutputLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

    mutable absl::Mutex mu_;
    absl::CondVar cv_;

    std::unique_ptr<Output> output_;

    uint64_t next_expected_ ABSL_GUARDED_BY(mu_);
    absl::btree_map<uint64_t, std::string> pending_ ABSL_GUARDED_BY(mu_);
    bool write_in_flight_ ABSL_GUARDED_BY(mu_) = false;
    State state_ ABSL_GUARDED_BY(mu_) = State::kOpen;

    bool poisoned_ ABSL_GUARDED_BY(mu_) = false;
    uint64_t failed_seq_ ABSL_GUARDED_BY(mu_) = 0;
    std::string failure_ ABSL_GUARDED_BY(mu_);

    SinkStats stats_ ABSL_GUARDED_BY(mu_);
};

} // namespace ChunkSink
