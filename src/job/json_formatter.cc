#include "json_formatter.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace ChunkSink {

namespace {
constexpr std::string_view kSeparator = ",\n";
constexpr absl::string_view kIndent = "  ";
} // namespace

std::string JsonArrayFormatter::Escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    absl::StrAppendFormat(&out, "\\u%04x", static_cast<unsigned char>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string JsonArrayFormatter::FormatRecord(const Record& record) {
    return absl::StrCat("{\"code\":", record.code,
                        ",\"ref\":\"", Escape(record.ref), "\"",
                        ",\"type\":", record.type,
                        ",\"nature\":", record.nature,
                        ",\"etat\":", record.etat,
                        ",\"ref2\":\"", Escape(record.ref2), "\"}");
}

std::string JsonArrayFormatter::Format(const Chunk& chunk) const {
    std::string out;
    if (chunk.seq != first_chunk_seq_) {
        out.append(kSeparator);
    }
    for (size_t i = 0; i < chunk.records.size(); ++i) {
        if (i > 0) {
            out.append(kSeparator);
        }
        absl::StrAppend(&out, kIndent, FormatRecord(chunk.records[i]));
    }
    return out;
}

} // namespace ChunkSink
