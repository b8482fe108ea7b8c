#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include "absl/strings/ascii.h"

namespace ChunkSink {

namespace {

// Shared by loadFromFile and loadFromString. Keys missing from the YAML keep their current value.
void ApplyYaml(const YAML::Node& yaml, ChunkSinkConfig& config) {
    if (!yaml["chunksink"]) {
        LOG(WARNING) << "Configuration has no 'chunksink' root, keeping defaults";
        return;
    }
    auto root = yaml["chunksink"];

    if (root["job"]) {
        auto job = root["job"];
        if (job["num_records"]) config.job.num_records.set(job["num_records"].as<size_t>());
        if (job["first_code"]) config.job.first_code.set(job["first_code"].as<int>());
        if (job["chunk_size"]) config.job.chunk_size.set(job["chunk_size"].as<size_t>());
        if (job["num_workers"]) config.job.num_workers.set(job["num_workers"].as<int>());
    }

    if (root["output"]) {
        auto output = root["output"];
        if (output["dir"]) config.output.dir.set(output["dir"].as<std::string>());
        if (output["prefix"]) config.output.prefix.set(output["prefix"].as<std::string>());
        if (output["force_sync"]) config.output.force_sync.set(output["force_sync"].as<bool>());
    }

    if (root["sink"]) {
        auto sink = root["sink"];
        if (sink["mode"]) config.sink.mode.set(sink["mode"].as<std::string>());
    }

    if (root["repro"]) {
        auto repro = root["repro"];
        if (repro["loop_count"]) config.repro.loop_count.set(repro["loop_count"].as<int>());
        if (repro["keep_going"]) config.repro.keep_going.set(repro["keep_going"].as<bool>());
    }

    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["verbosity"]) config.logging.verbosity.set(logging["verbosity"].as<int>());
    }
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val = absl::AsciiStrToLower(env_val);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        ApplyYaml(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        ApplyYaml(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::reset() {
    config_ = ChunkSinkConfig();
    validation_errors_.clear();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.job.chunk_size.get() < 1) {
        validation_errors_.push_back("Chunk size must be at least 1");
    }

    if (config_.job.num_workers.get() < 1) {
        validation_errors_.push_back("Number of workers must be at least 1");
    }

    if (config_.job.first_code.get() < 0) {
        validation_errors_.push_back("First record code cannot be negative");
    }

    if (config_.output.prefix.get().empty()) {
        validation_errors_.push_back("Output prefix cannot be empty");
    }

    if (config_.output.dir.get().empty()) {
        validation_errors_.push_back("Output directory cannot be empty");
    }

    std::string mode = config_.sink.mode.get();
    if (mode != "ordered" && mode != "unordered") {
        validation_errors_.push_back("Sink mode must be 'ordered' or 'unordered', got '" + mode + "'");
    }

    if (config_.repro.loop_count.get() < 1) {
        validation_errors_.push_back("Loop count must be at least 1");
    }

    for (const auto& error : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << error;
    }
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace ChunkSink
