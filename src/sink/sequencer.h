#pragma once

#include <atomic>
#include <cstdint>

namespace ChunkSink {

/**
 * Hands out chunk sequence numbers.
 * Numbers start at the configured base and are strictly increasing, gap-free
 * and unique across all callers. Next() never blocks.
 */
class Sequencer {
public:
    explicit Sequencer(uint64_t first = 0) : next_(first) {}

    Sequencer(const Sequencer&) = delete;
    Sequencer& operator=(const Sequencer&) = delete;

    // Running out of 64-bit numbers is fatal.
    uint64_t Next();

    // Number the next Next() call would return.
    uint64_t Peek() const { return next_.load(std::memory_order_acquire); }

private:
    std::atomic<uint64_t> next_;
};

} // namespace ChunkSink
