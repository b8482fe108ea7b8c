#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <cxxopts.hpp>
#include <glog/logging.h>
#include "../common/configuration.h"
#include "../job/chunk_job.h"
#include "../job/output_checker.h"
#include "../sink/file_output.h"

using namespace ChunkSink;

namespace {

constexpr int kExitMalformed = 1;
constexpr int kExitSetupError = 2;

// Command line values win over the YAML file.
void ApplyCommandLine(const cxxopts::ParseResult& result, ChunkSinkConfig& config) {
    if (result.count("loops")) config.repro.loop_count.set(result["loops"].as<int>());
    if (result.count("keep_going")) config.repro.keep_going.set(true);
    if (result.count("workers")) config.job.num_workers.set(result["workers"].as<int>());
    if (result.count("chunk_size")) config.job.chunk_size.set(result["chunk_size"].as<size_t>());
    if (result.count("records")) config.job.num_records.set(result["records"].as<size_t>());
    if (result.count("mode")) config.sink.mode.set(result["mode"].as<std::string>());
    if (result.count("output_dir")) config.output.dir.set(result["output_dir"].as<std::string>());
    if (result.count("prefix")) config.output.prefix.set(result["prefix"].as<std::string>());
    if (result.count("force_sync")) config.output.force_sync.set(result["force_sync"].as<bool>());
    if (result.count("log_level")) config.logging.verbosity.set(result["log_level"].as<int>());
}

bool IsWellFormed(const CheckReport& report, size_t expected_records) {
    return report.ok() && report.codes_ascending && report.records == expected_records;
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options("chunksink_repro",
            "Runs the multi-threaded JSON export repeatedly and stops at the first malformed file");
    options.add_options()
        ("f,config", "YAML configuration file", cxxopts::value<std::string>())
        ("n,loops", "Number of job executions", cxxopts::value<int>())
        ("keep_going", "Continue after a malformed file")
        ("w,workers", "Concurrent worker threads", cxxopts::value<int>())
        ("c,chunk_size", "Records per chunk", cxxopts::value<size_t>())
        ("r,records", "Records exported per run", cxxopts::value<size_t>())
        ("m,mode", "Sink mode: ordered or unordered", cxxopts::value<std::string>())
        ("o,output_dir", "Directory for the JSON files", cxxopts::value<std::string>())
        ("prefix", "Output file name prefix", cxxopts::value<std::string>())
        ("force_sync", "fdatasync after every fragment", cxxopts::value<bool>())
        ("l,log_level", "Verbose log level", cxxopts::value<int>())
        ("h,help", "Print usage");

    Configuration& configuration = Configuration::getInstance();
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return EXIT_SUCCESS;
        }
        if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
            LOG(ERROR) << "Could not load " << result["config"].as<std::string>();
            return kExitSetupError;
        }
        ApplyCommandLine(result, configuration.config());
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid command line: " << e.what();
        return kExitSetupError;
    }
    if (!configuration.validate()) {
        return kExitSetupError;
    }

    const ChunkSinkConfig& config = configuration.config();
    FLAGS_v = config.logging.verbosity.get();

    JobOptions job_options;
    job_options.num_records = config.job.num_records.get();
    job_options.first_code = config.job.first_code.get();
    job_options.chunk_size = configuration.getChunkSize();
    job_options.num_workers = configuration.getNumWorkers();
    const std::string mode = configuration.getSinkMode();
    const int loop_count = config.repro.loop_count.get();
    const bool keep_going = config.repro.keep_going.get();

    LOG(INFO) << "Running " << loop_count << " loops with the " << mode << " sink, "
              << job_options.num_workers << " workers, chunk size " << job_options.chunk_size;

    int malformed_runs = 0;
    for (int loop = 1; loop <= loop_count; ++loop) {
        LOG(INFO) << "================================ loop " << loop;

        std::string path = MakeOutputPath(config.output.dir.get(), config.output.prefix.get());
        std::unique_ptr<FragmentSink> sink;
        try {
            sink = MakeSink(mode, std::make_unique<FileOutput>(path, config.output.force_sync.get()));
        } catch (const std::exception& e) {
            LOG(ERROR) << "Cannot create output " << path << ": " << e.what();
            return kExitSetupError;
        }

        ChunkJob job(job_options, *sink);
        JobResult job_result = job.Run();
        sink.reset();
        if (!job_result.success) {
            LOG(ERROR) << "Loop " << loop << " failed, output " << path << " is invalid: " << job_result.error;
            return kExitSetupError;
        }

        CheckReport report;
        try {
            report = OutputChecker::CheckJsonArrayFile(path);
        } catch (const std::exception& e) {
            LOG(ERROR) << e.what();
            return kExitSetupError;
        }

        if (IsWellFormed(report, job_options.num_records)) {
            LOG(INFO) << path << " is well formed (" << report.records << " records)";
            continue;
        }

        malformed_runs++;
        LOG(ERROR) << "Error: malformed JSON in " << path << " (" << report.records << " of "
                   << job_options.num_records << " records"
                   << (report.codes_ascending ? "" : ", out of order") << ")";
        for (const auto& issue : report.issues) {
            LOG(ERROR) << "  " << issue;
        }
        if (!keep_going) {
            return kExitMalformed;
        }
    }

    LOG(INFO) << "Finished " << loop_count << " loops, " << malformed_runs << " malformed";
    return malformed_runs == 0 ? EXIT_SUCCESS : kExitMalformed;
}
