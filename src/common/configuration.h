#ifndef CHUNKSINK_CONFIGURATION_H_
#define CHUNKSINK_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace ChunkSink {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct ChunkSinkConfig {
    // Chunk job (reader -> processor -> formatter -> sink)
    struct Job {
        ConfigValue<size_t> num_records{200, "CHUNKSINK_JOB_RECORDS"};
        ConfigValue<int> first_code{10001, "CHUNKSINK_JOB_FIRST_CODE"};
        ConfigValue<size_t> chunk_size{1, "CHUNKSINK_JOB_CHUNK_SIZE"};
        // Worker threads pulling chunks concurrently (the throttle limit)
        ConfigValue<int> num_workers{2, "CHUNKSINK_JOB_WORKERS"};
    } job;

    struct Output {
        ConfigValue<std::string> dir{".", "CHUNKSINK_OUTPUT_DIR"};
        ConfigValue<std::string> prefix{"mydata", "CHUNKSINK_OUTPUT_PREFIX"};
        // fdatasync after every appended fragment
        ConfigValue<bool> force_sync{true, "CHUNKSINK_OUTPUT_FORCE_SYNC"};
    } output;

    struct Sink {
        // "ordered" (OrderedAppendSink) or "unordered" (lock-only, reproduces the defect)
        ConfigValue<std::string> mode{"ordered", "CHUNKSINK_SINK_MODE"};
    } sink;

    struct Repro {
        ConfigValue<int> loop_count{100, "CHUNKSINK_REPRO_LOOPS"};
        // Keep looping after a malformed file instead of exiting with status 1
        ConfigValue<bool> keep_going{false, "CHUNKSINK_REPRO_KEEP_GOING"};
    } repro;

    struct Logging {
        ConfigValue<int> verbosity{0, "CHUNKSINK_LOG_LEVEL"};
    } logging;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    const ChunkSinkConfig& config() const { return config_; }
    ChunkSinkConfig& config() { return config_; }

    // Back to built-in defaults
    void reset();

    size_t getChunkSize() const { return config_.job.chunk_size.get(); }
    int getNumWorkers() const { return config_.job.num_workers.get(); }
    std::string getSinkMode() const { return config_.sink.mode.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ChunkSinkConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace ChunkSink

#endif // CHUNKSINK_CONFIGURATION_H_
