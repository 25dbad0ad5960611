#include "utils.h"
#include <sstream>
#include <fstream>
#include <iomanip>
#include <cctype>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

std::string json_escape(const std::string& s) {
    std::ostringstream out;
    for (char ch : s) {
        switch (ch) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch) << std::dec << std::setfill(' ');
                } else {
                    out << ch;
                }
        }
    }
    return out.str();
}

void write_array(std::ostringstream& ss, const std::vector<double>& values) {
    ss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) ss << ", ";
        ss << values[i];
    }
    ss << "]";
}

std::ofstream open_for_write(const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.good()) {
        throw std::runtime_error("cannot write results to " + path);
    }
    return out;
}

}  // namespace

std::string record_to_json(const MetricsRecord& r) {
    std::ostringstream ss;
    // 17 significant digits read back as the same double
    ss << std::setprecision(std::numeric_limits<double>::max_digits10);
    ss << "{"
       << "\"config\": {"
       << "\"concurrent_queries\": " << r.config.concurrent_queries << ", "
       << "\"votes_per_minute\": " << r.config.votes_per_minute << ", "
       << "\"duration_minutes\": " << r.config.duration_minutes << "}, "
       << "\"timestamp\": \"" << format_timestamp(r.timestamp) << "\", "
       << "\"votes_processed\": " << r.votes_processed << ", "
       << "\"votes_failed\": " << r.votes_failed << ", "
       << "\"percentile_method\": \"" << to_string(r.percentile_method) << "\", "
       << "\"latency_mean\": " << r.latency_mean << ", "
       << "\"latency_p95\": " << r.latency_p95 << ", "
       << "\"latency_max\": " << r.latency_max << ", "
       << "\"duration_actual_seconds\": " << r.duration_actual_seconds << ", "
       << "\"throughput_per_minute\": " << r.throughput_per_minute << ", "
       << "\"error_rate_percent\": " << r.error_rate_percent << ", "
       << "\"cpu_mean_percent\": " << r.cpu_mean_percent << ", "
       << "\"memory_mean_mb\": " << r.memory_mean_mb << ", ";

    ss << "\"latencies_ms\": ";
    write_array(ss, r.latencies_ms);
    ss << ", \"cpu_samples\": ";
    write_array(ss, r.cpu_samples);
    ss << ", \"memory_samples\": ";
    write_array(ss, r.memory_samples);

    ss << ", \"errors\": [";
    for (size_t i = 0; i < r.errors.size(); ++i) {
        if (i) ss << ", ";
        ss << "\"" << json_escape(r.errors[i]) << "\"";
    }
    ss << "]}";
    return ss.str();
}

// Append a record as a JSON object to a results file that contains a JSON array.
// If the file doesn't exist, it will be created with a single-element array.
void append_result_to_file(const MetricsRecord& r, const std::string& path) {
    std::string obj = record_to_json(r);

    // Read existing file (if any)
    std::ifstream in(path);
    if (!in.good()) {
        std::ofstream out = open_for_write(path);
        out << "[" << obj << "]\n";
        return;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    // Trim trailing whitespace
    while (!content.empty() && isspace(static_cast<unsigned char>(content.back()))) content.pop_back();

    // Anything that isn't a JSON array gets overwritten
    size_t first_non_ws = content.find_first_not_of(" \t\n\r");
    size_t last_bracket = content.find_last_of(']');
    if (first_non_ws == std::string::npos || content[first_non_ws] != '[' ||
        last_bracket == std::string::npos) {
        std::ofstream out = open_for_write(path);
        out << "[" << obj << "]\n";
        return;
    }

    bool array_empty = true;
    for (size_t i = first_non_ws + 1; i < last_bracket; ++i) {
        if (!isspace(static_cast<unsigned char>(content[i]))) { array_empty = false; break; }
    }

    std::ofstream out = open_for_write(path);
    if (array_empty) {
        out << "[" << obj << "]\n";
    } else {
        std::string prefix = content.substr(0, last_bracket);
        out << prefix << ",\n" << obj << "]\n";
    }
}

int find_saturation_point(const ExperimentResultSet& results, double threshold_percent) {
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].error_rate_percent > threshold_percent) return static_cast<int>(i);
    }
    return -1;
}
