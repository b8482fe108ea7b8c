#include "chunk_job.h"

#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>
#include <glog/logging.h>
#include "absl/synchronization/mutex.h"
#include "json_formatter.h"
#include "record_source.h"
#include "../sink/ordered_append_sink.h"
#include "../sink/sequencer.h"
#include "../sink/unordered_sink.h"

namespace fs = std::filesystem;

namespace ChunkSink {

ChunkJob::ChunkJob(JobOptions options, FragmentSink& sink)
    : options_(options),
      sink_(sink),
      processor_([](const Record& record) {
          VLOG(2) << "Processing item code=" << record.code << " ref=" << record.ref;
          return record;
      }) {}

JobResult ChunkJob::Run() {
    JobResult result;
    if (options_.num_workers < 1 || options_.chunk_size < 1) {
        result.error = "Invalid job options: " + std::to_string(options_.num_workers) + " workers, chunk size " +
                       std::to_string(options_.chunk_size);
        LOG(ERROR) << result.error;
        sink_.Abort();
        return result;
    }
    auto start = std::chrono::steady_clock::now();

    Sequencer sequencer;
    const uint64_t header_seq = sequencer.Next();
    JsonArrayFormatter formatter(header_seq + 1);
    RecordSource source(options_.num_records, options_.first_code, options_.chunk_size, sequencer);

    absl::Mutex error_mu;
    std::string first_error;
    auto fail = [&](const std::string& what) {
        {
            absl::MutexLock lock(&error_mu);
            if (!first_error.empty()) return;
            first_error = what;
        }
        source.Stop();
        sink_.Abort();
    };
    auto failed = [&]() {
        absl::MutexLock lock(&error_mu);
        return !first_error.empty();
    };

    try {
        sink_.Submit(header_seq, formatter.Header());
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to write array header: " << e.what();
        fail(e.what());
    }

    if (!failed()) {
        LOG(INFO) << "Starting " << options_.num_workers << " workers for " << options_.num_records
                  << " records in chunks of " << options_.chunk_size;
        std::vector<std::thread> workers;
        workers.reserve(options_.num_workers);
        for (int worker_id = 0; worker_id < options_.num_workers; ++worker_id) {
            workers.emplace_back([&, worker_id]() {
                Chunk chunk;
                try {
                    while (source.NextChunk(chunk)) {
                        for (auto& record : chunk.records) {
                            record = processor_(record);
                        }
                        std::string fragment = formatter.Format(chunk);
                        VLOG(2) << "Worker " << worker_id << " submitting chunk " << chunk.seq;
                        sink_.Submit(chunk.seq, std::move(fragment));
                    }
                } catch (const std::exception& e) {
                    LOG(ERROR) << "Worker " << worker_id << " failed on chunk " << chunk.seq << ": " << e.what();
                    fail(e.what());
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    if (!failed()) {
        try {
            sink_.Submit(sequencer.Next(), formatter.Footer());
            sink_.Close();
        } catch (const std::exception& e) {
            LOG(ERROR) << "Failed to finish output: " << e.what();
            fail(e.what());
        }
    }

    result.records = source.records_read();
    result.chunks = source.chunks_read();
    result.sink_stats = sink_.GetStats();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    {
        absl::MutexLock lock(&error_mu);
        result.error = first_error;
    }
    result.success = result.error.empty();

    if (result.success) {
        LOG(INFO) << "Job wrote " << result.records << " records in " << result.chunks << " chunks ("
                  << result.sink_stats.bytes_written << " bytes, " << result.sink_stats.out_of_order_arrivals
                  << " out-of-order arrivals, max pending " << result.sink_stats.max_pending << ") in "
                  << result.elapsed_ms << " ms";
    } else {
        LOG(ERROR) << "Job failed after " << result.chunks << " chunks (next sequence " << sequencer.Peek()
                   << "): " << result.error;
    }
    return result;
}

std::string MakeOutputPath(const std::string& dir, const std::string& prefix) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
    std::tm local_tm{};
    localtime_r(&time_t_now, &local_tm);

    std::stringstream name;
    name << prefix << "_" << std::put_time(&local_tm, "%Y%m%d_%H%M%S")
         << std::setw(3) << std::setfill('0') << millis;

    fs::path base = fs::path(dir) / name.str();
    fs::path candidate = base;
    candidate += ".json";
    for (int suffix = 1; fs::exists(candidate); ++suffix) {
        candidate = base;
        candidate += "_" + std::to_string(suffix) + ".json";
    }
    return candidate.string();
}

std::unique_ptr<FragmentSink> MakeSink(const std::string& mode, std::unique_ptr<Output> output) {
    if (mode == "ordered") {
        return std::make_unique<OrderedAppendSink>(std::move(output));
    }
    if (mode == "unordered") {
        return std::make_unique<UnorderedSink>(std::move(output));
    }
    throw std::invalid_argument("Unknown sink mode: " + mode);
}

} // namespace ChunkSink
