// ExergySim/src/Logger.cpp
#include "Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace ExergySim {

namespace {
namespace fs = std::filesystem;

std::string run_id() {
    if (const char* run = std::getenv("RUN_ID")) {
        if (*run) return run;
    }
    return {};
}

// Resolve the base directory for logs.
//
// Priority:
//   1) env EXERGYSIM_LOG_DIR
//   2) <EXERGYSIM_SOURCE_DIR>/data/raw
//   3) ./data/raw
//
// RUN_ID, when set, is appended so each run gets its own folder.
fs::path resolve_base_dir() {
    fs::path base;
    const char* env = std::getenv("EXERGYSIM_LOG_DIR");
    if (env && *env) {
        base = fs::path(env);
    } else {
#ifdef EXERGYSIM_SOURCE_DIR
        base = fs::path(EXERGYSIM_SOURCE_DIR) / "data" / "raw";
#else
        base = fs::current_path() / "data" / "raw";
#endif
    }

    const std::string run = run_id();
    if (!run.empty()) base /= run;
    return base;
}

fs::path ensure_base_dir() {
    fs::path base_dir = resolve_base_dir();
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        throw std::runtime_error(
            "Logger: failed to create log directory " + base_dir.string() +
            " : " + ec.message()
        );
    }
    return base_dir;
}

// Stage and variable names are free text; quote them when they would
// break the row.
std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // anonymous namespace

const char* to_string(Logger::Level level) {
    switch (level) {
        case Logger::Level::Info:      return "info";
        case Logger::Level::Warn:      return "warn";
        case Logger::Level::Refuse:    return "refuse";
        case Logger::Level::Integrity: return "integrity";
        case Logger::Level::Fatal:     return "fatal";
    }
    return "unknown";
}

// ---------------- Logger public API ----------------

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (debug_.is_open()) debug_.close();
}

void Logger::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx_);
    enabled_ = enabled;
}

bool Logger::enabled() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return enabled_;
}

void Logger::set_rank(int rank) {
    std::lock_guard<std::mutex> lock(mtx_);
    rank_ = rank;
}

std::ofstream& Logger::debug_stream_() {
    if (debug_.is_open()) return debug_;

    const std::string run = run_id();
    fs::path path = ensure_base_dir() /
        ("exergysim_debug_" + (run.empty() ? std::string("local") : run) +
         "_rank" + std::to_string(rank_) + ".log");
    debug_.open(path, std::ios::out | std::ios::trunc);
    if (!debug_) {
        throw std::runtime_error("Logger: failed to open debug log " + path.string());
    }
    return debug_;
}

void Logger::message(Level level, const std::string& text) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!enabled_) return;

    const std::string line = std::string("[") + to_string(level) + "] " + text;
    if (rank_ == 0) std::cerr << line << '\n';

    std::ofstream& out = debug_stream_();
    out << line << '\n';
    out.flush();
}

void Logger::log(const std::string& run, const TimeSeries& records) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!enabled_) return;

    // One stream per call; only the run names stay behind.
    const bool first = written_.insert(run).second;
    fs::path csv_path = ensure_base_dir() / (run + ".csv");
    std::ofstream out(csv_path, first ? std::ios::out | std::ios::trunc
                                      : std::ios::out | std::ios::app);
    if (!out) {
        throw std::runtime_error("Logger: failed to open log file " + csv_path.string());
    }
    if (first) out << "time,step,stage,variable,value,unit,source_type\n";

    out << std::setprecision(17);
    for (const auto& r : records) {
        out << r.time << ',' << r.step << ','
            << csv_field(r.stage) << ',' << csv_field(r.variable) << ','
            << r.value << ',' << csv_field(r.unit) << ','
            << to_string(r.source_type) << '\n';
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Logger: failed to write log file " + csv_path.string());
    }
}

} // namespace ExergySim
