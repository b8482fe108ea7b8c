#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "record.h"
#include "../sink/fragment_sink.h"
#include "../sink/output.h"

namespace ChunkSink {

struct JobOptions {
    size_t num_records = 200;
    int first_code = 10001;
    size_t chunk_size = 1;
    int num_workers = 2;
};

struct JobResult {
    bool success = false;
    size_t records = 0;
    size_t chunks = 0;
    SinkStats sink_stats;
    double elapsed_ms = 0;
    // First error raised by a worker or by closing the sink
    std::string error;
};

/**
 * Multi-threaded chunk export: workers pull chunks from a shared
 * RecordSource, run the processor over each record, format the chunk as a
 * JSON array segment and submit it to the sink.
 *
 * Sequence 0 is the array header and the number after the last chunk is the
 * footer. If any worker fails the sink is aborted, which releases the other
 * workers, and the job reports the first error. Options with no workers or an
 * empty chunk size fail the run before anything is written.
 */
class ChunkJob {
public:
    using RecordProcessor = std::function<Record(const Record&)>;

    ChunkJob(JobOptions options, FragmentSink& sink);

    // Replaces the default pass-through processor.
    void SetProcessor(RecordProcessor processor) { processor_ = std::move(processor); }

    JobResult Run();

private:
    JobOptions options_;
    FragmentSink& sink_;
    RecordProcessor processor_;
};

/**
 * <dir>/<prefix>_<yyyyMMdd_HHmmssSSS>.json, with a numeric suffix when a
 * file of that name already exists.
 */
std::string MakeOutputPath(const std::string& dir, const std::string& prefix);

// "ordered" -> OrderedAppendSink, "unordered" -> UnorderedSink. Throws std::invalid_argument otherwise.
std::unique_ptr<FragmentSink> MakeSink(const std::string& mode, std::unique_ptr<Output> output);

} // namespace ChunkSink
