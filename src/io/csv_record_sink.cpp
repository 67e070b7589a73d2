#include "io/csv_record_sink.h"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string escape_field(const std::string &value, char sep) {
    if (value.find_first_of(std::string(1, sep) + "\"\r\n") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

CsvRecordSink::CsvRecordSink(std::string path, char separator)
        : path_(std::move(path)), sep_(separator) {}

CsvRecordSink::~CsvRecordSink() {
    if (out_.is_open()) {
        out_.close();
    }
}

std::string CsvRecordSink::header(char separator) {
    const char *columns[] = {
            "frame_number", "vehicle_id", "speed", "license_plate", "license_plate_confidence",
            "is_overspeed", "x1", "y1", "x2", "y2", "confidence", "vehicle_class", "timestamp"
    };
    std::string line;
    for (const char *c : columns) {
        if (!line.empty()) line += separator;
        line += c;
    }
    return line;
}

std::string CsvRecordSink::format_row(const DetectionRecord &r, char separator) {
    std::ostringstream oss;
    oss << r.frame_number << separator
        << r.vehicle_id << separator
        << std::fixed << std::setprecision(2) << r.speed << separator
        << escape_field(r.license_plate, separator) << separator
        << r.license_plate_confidence << separator
        << (r.is_overspeed ? "True" : "False") << separator
        << r.x1 << separator << r.y1 << separator
        << r.x2 << separator << r.y2 << separator
        << r.confidence << separator
        << escape_field(r.vehicle_class, separator) << separator
        << std::setprecision(4) << r.timestamp;
    return oss.str();
}

void CsvRecordSink::open() {
    out_.open(path_, std::ios::out | std::ios::trunc);
    if (!out_) {
        throw std::runtime_error("cannot open csv output: " + path_);
    }
    out_ << header(sep_) << '\n';
    rows_ = 0;
}

void CsvRecordSink::write(const DetectionRecord &record) {
    if (!out_.is_open()) {
        throw std::runtime_error("csv output is not open: " + path_);
    }
    out_ << format_row(record, sep_) << '\n';
    if (!out_) {
        throw std::runtime_error("csv write failed: " + path_);
    }
    ++rows_;
}

void CsvRecordSink::flush() {
    if (out_.is_open()) out_.flush();
}

void CsvRecordSink::close() {
    if (!out_.is_open()) return;
    out_.close();
    std::cout << "[CSV] saved " << rows_ << " detections to " << path_ << std::endl;
}
