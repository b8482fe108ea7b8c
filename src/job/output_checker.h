#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ChunkSink {

struct CheckReport {
    size_t records = 0;
    bool has_open_bracket = false;
    bool has_close_bracket = false;
    bool codes_ascending = true;
    // One entry per defect, prefixed with the 1-based line number
    std::vector<std::string> issues;

    bool ok() const { return issues.empty(); }
};

/**
 * Line-level checks for the JSON array files written by the chunk job.
 * Flags a separator alone on a line, two records sharing a line, records
 * without a separator between them, a dangling separator before ']', and
 * missing brackets. Also counts records and checks their codes ascend.
 */
class OutputChecker {
public:
    static CheckReport CheckJsonArray(std::string_view text);

    // Throws std::runtime_error if the file cannot be read.
    static CheckReport CheckJsonArrayFile(const std::string& path);
};

} // namespace ChunkSink
