#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ChunkSink {

// One exported row.
struct Record {
    int code = 0;
    std::string ref;
    int type = 0;
    int nature = 0;
    int etat = 0;
    std::string ref2;
};

/**
 * A batch of records handled by one worker as a unit.
 * seq is assigned when the chunk is read and fixes its place in the output.
 */
struct Chunk {
    uint64_t seq = 0;
    std::vector<Record> records;
};

} // namespace ChunkSink
