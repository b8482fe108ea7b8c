#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"
#include "fragment_sink.h"
#include "output.h"

namespace ChunkSink {

/**
 * Lock-only sink: each Submit takes the mutex and appends immediately, so
 * fragments land in the order threads win the lock, not in sequence order.
 * This is the behavior that corrupts a multi-threaded JSON export; the repro
 * harness runs it with mode "unordered" to show the defect.
 *
 * Error reporting matches OrderedAppendSink (duplicates, poisoning, close).
 */
class UnorderedSink : public FragmentSink {
public:
    explicit UnorderedSink(std::unique_ptr<Output> output);
    ~UnorderedSink() override;

    UnorderedSink(const UnorderedSink&) = delete;
    UnorderedSink& operator=(const UnorderedSink&) = delete;

    void Submit(uint64_t seq, std::string fragment) override;
    void Close() override;
    void Abort() override;
    SinkStats GetStats() const override;

private:
    mutable absl::Mutex mu_;
    std::unique_ptr<Output> output_;
    absl::flat_hash_set<uint64_t> seen_ ABSL_GUARDED_BY(mu_);
    uint64_t highest_written_ ABSL_GUARDED_BY(mu_) = 0;
    bool closed_ ABSL_GUARDED_BY(mu_) = false;
    bool poisoned_ ABSL_GUARDED_BY(mu_) = false;
    uint64_t failed_seq_ ABSL_GUARDED_BY(mu_) = 0;
    std::string failure_ ABSL_GUARDED_BY(mu_);
    SinkStats stats_ ABSL_GUARDED_BY(mu_);
};

} // namespace ChunkSink
