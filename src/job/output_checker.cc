#include "output_checker.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <glog/logging.h>
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace ChunkSink {

namespace {

constexpr absl::string_view kCodeKey = "{\"code\":";

// Codes of every record that starts on this line, in order.
std::vector<long> RecordCodes(absl::string_view line) {
    std::vector<long> codes;
    size_t pos = 0;
    while ((pos = line.find(kCodeKey, pos)) != absl::string_view::npos) {
        pos += kCodeKey.size();
        size_t end = pos;
        while (end < line.size() && (line[end] == '-' || absl::ascii_isdigit(line[end]))) {
            ++end;
        }
        long code = 0;
        if (absl::SimpleAtoi(line.substr(pos, end - pos), &code)) {
            codes.push_back(code);
        }
        pos = end;
    }
    return codes;
}

} // namespace

CheckReport OutputChecker::CheckJsonArray(std::string_view text) {
    CheckReport report;
    std::vector<absl::string_view> lines = absl::StrSplit(absl::string_view(text.data(), text.size()), '\n');

    // Index of the first and last non-blank lines
    size_t first = lines.size();
    size_t last = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!absl::StripAsciiWhitespace(lines[i]).empty()) {
            if (first == lines.size()) first = i;
            last = i;
        }
    }
    if (first == lines.size()) {
        report.issues.push_back("file is empty");
        return report;
    }

    report.has_open_bracket = absl::StripAsciiWhitespace(lines[first]) == "[";
    report.has_close_bracket = absl::StripAsciiWhitespace(lines[last]) == "]";
    if (!report.has_open_bracket) {
        report.issues.push_back(absl::StrCat("line ", first + 1, ": expected '['"));
    }
    if (!report.has_close_bracket) {
        report.issues.push_back(absl::StrCat("line ", last + 1, ": expected ']'"));
    }

    bool have_code = false;
    long last_code = 0;
    // Whether the previous record line ended with a separator
    bool prev_record_open = false;
    bool prev_record_terminated = true;

    for (size_t i = 0; i < lines.size(); ++i) {
        absl::string_view line = absl::StripAsciiWhitespace(lines[i]);
        const size_t line_no = i + 1;
        if (line.empty() || (i == first && report.has_open_bracket) ||
            (i == last && report.has_close_bracket)) {
            continue;
        }
        if (line == ",") {
            report.issues.push_back(absl::StrCat("line ", line_no, ": separator alone on a line"));
            continue;
        }

        std::vector<long> codes = RecordCodes(line);
        if (codes.empty()) {
            report.issues.push_back(absl::StrCat("line ", line_no, ": unexpected content '", line, "'"));
            continue;
        }
        if (codes.size() > 1) {
            report.issues.push_back(absl::StrCat("line ", line_no, ": ", codes.size(),
                                                 " records on one line"));
        }
        if (prev_record_open && !prev_record_terminated) {
            report.issues.push_back(absl::StrCat("line ", line_no,
                                                 ": record follows a record without a separator"));
        }
        for (long code : codes) {
            if (have_code && code <= last_code) {
                report.codes_ascending = false;
            }
            have_code = true;
            last_code = code;
        }
        report.records += codes.size();
        prev_record_open = true;
        prev_record_terminated = line.back() == ',';
    }

    if (prev_record_open && prev_record_terminated) {
        report.issues.push_back("last record is followed by a dangling separator");
    }
    return report;
}

CheckReport OutputChecker::CheckJsonArrayFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path + " for checking");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    CheckReport report = CheckJsonArray(buffer.str());
    VLOG(1) << "Checked " << path << ": " << report.records << " records, "
            << report.issues.size() << " issues";
    return report;
}

} // namespace ChunkSink
