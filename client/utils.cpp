#include "utils.h"
#include <sstream>
#include <fstream>
#include <iomanip>
#include <cctype>
#include <stdexcept>

namespace {

std::string json_string(const std::string& s) {
    std::string quoted = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') quoted += '\\';
        quoted += c;
    }
    return quoted + "\"";
}

std::string to_json(const TestResult& r) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3);
    ss << "{"
       << "\"strategy\": " << json_string(r.strategy) << ", "
       << "\"threads\": " << r.threads << ", "
       << "\"endpoint\": " << json_string(r.endpoint) << ", "
       << "\"duration_sec\": " << r.duration_sec << ", "
       << "\"max_delay_sec\": " << r.max_delay_sec << ", "
       << "\"requests\": " << r.requests << ", "
       << "\"errors\": " << r.errors << ", "
       << "\"span_sec\": " << r.span_sec << ", "
       << "\"throughput\": " << r.throughput << ", "
       << "\"mean_response_ms\": " << r.mean_response_ms << ", "
       << "\"stdev_response_ms\": " << r.stdev_response_ms
       << "}";
    return ss.str();
}

void write_single(const std::string& path, const std::string& obj) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write results file " + path);
    }
    out << "[" << obj << "]\n";
}

}

// Appends a TestResult to a file holding a JSON array. A missing, empty or
// unreadable file is replaced by a single-element array.
void append_result_to_file(const TestResult& r, const std::string& path) {
    std::string obj = to_json(r);

    std::ifstream in(path);
    if (!in.good()) {
        write_single(path, obj);
        return;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    while (!content.empty() && isspace(static_cast<unsigned char>(content.back()))) content.pop_back();

    size_t first_non_ws = content.find_first_not_of(" \t\n\r");
    size_t last_bracket = content.find_last_of(']');
    if (first_non_ws == std::string::npos || content[first_non_ws] != '[' ||
        last_bracket == std::string::npos || last_bracket < first_non_ws) {
        write_single(path, obj);
        return;
    }

    bool array_empty = true;
    for (size_t i = first_non_ws + 1; i < last_bracket; ++i) {
        if (!isspace(static_cast<unsigned char>(content[i]))) { array_empty = false; break; }
    }
    if (array_empty) {
        write_single(path, obj);
        return;
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write results file " + path);
    }
    out << content.substr(0, last_bracket) << ",\n" << obj << "]\n";
}
