#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "absl/synchronization/mutex.h"

namespace ChunkSink {

/**
 * Append-only byte destination used by the sinks.
 * Append() either writes every byte or throws (std::system_error for OS
 * failures, std::runtime_error otherwise). An implementation that throws
 * after writing part of the bytes removes them again before returning; if
 * that is impossible it logs the leftover. Implementations make no ordering
 * promise across concurrent callers.
 */
class Output {
public:
    virtual ~Output() = default;

    virtual size_t Append(std::string_view bytes) = 0;

    // Durability point. No-op for outputs without one.
    virtual void Sync() {}

    virtual void Close() {}

    virtual std::string Describe() const = 0;
};

/**
 * In-memory output. Used for dry runs and by the tests.
 */
class StringOutput : public Output {
public:
    StringOutput() = default;

    size_t Append(std::string_view bytes) override {
        absl::MutexLock lock(&mu_);
        data_.append(bytes.data(), bytes.size());
        ++append_calls_;
        return bytes.size();
    }

    void Close() override {
        absl::MutexLock lock(&mu_);
        closed_ = true;
    }

    std::string Describe() const override { return "memory"; }

    std::string data() const {
        absl::MutexLock lock(&mu_);
        return data_;
    }

    size_t append_calls() const {
        absl::MutexLock lock(&mu_);
        return append_calls_;
    }

    bool closed() const {
        absl::MutexLock lock(&mu_);
        return closed_;
    }

private:
    mutable absl::Mutex mu_;
    std::string data_ ABSL_GUARDED_BY(mu_);
    size_t append_calls_ ABSL_GUARDED_BY(mu_) = 0;
    bool closed_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace ChunkSink
