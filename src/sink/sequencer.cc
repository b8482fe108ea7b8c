#include "sequencer.h"

#include <limits>
#include <glog/logging.h>

namespace ChunkSink {

uint64_t Sequencer::Next() {
    uint64_t seq = next_.fetch_add(1, std::memory_order_acq_rel);
    CHECK_NE(seq, std::numeric_limits<uint64_t>::max()) << "Sequencer exhausted the 64-bit range";
    VLOG(3) << "Sequencer issued " << seq;
    return seq;
}

} // namespace ChunkSink
