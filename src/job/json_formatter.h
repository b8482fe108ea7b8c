#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include "record.h"

namespace ChunkSink {

/**
 * Renders chunks as segments of one JSON array, one object per line.
 *
 * The array brackets are fragments of their own (Header() and Footer()),
 * each with its own sequence number. The chunk numbered first_chunk_seq is
 * written bare; every later chunk starts with the ",\n" separator. Output is
 * only well formed when fragments are appended in sequence order.
 */
class JsonArrayFormatter {
public:
    explicit JsonArrayFormatter(uint64_t first_chunk_seq) : first_chunk_seq_(first_chunk_seq) {}

    std::string Header() const { return "[\n"; }
    std::string Footer() const { return "\n]\n"; }

    std::string Format(const Chunk& chunk) const;

    // {"code":..,"ref":..,...} on a single line, no indentation
    static std::string FormatRecord(const Record& record);

    static std::string Escape(std::string_view text);

private:
    uint64_t first_chunk_seq_;
};

} // namespace ChunkSink
