#pragma once
#include <fstream>
#include <mutex>
#include <set>
#include <string>

#include "TimeSeries.hpp"

namespace ExergySim {

class Logger {
public:
    enum class Level { Info, Warn, Refuse, Integrity, Fatal };

    static Logger& instance();
    ~Logger();

    // Disabled loggers drop everything and touch no files.
    void set_enabled(bool enabled);
    bool enabled() const;

    // Only rank 0 mirrors messages to stderr; every rank keeps its own
    // debug file.
    void set_rank(int rank);

    // "[refuse] <text>" to stderr and exergysim_debug_<RUN_ID>_rank<r>.log
    void message(Level level, const std::string& text);

    // Tall format, one row per record:
    //   time,step,stage,variable,value,unit,source_type
    // into <base>/<run>.csv, truncated on the first write of the process and
    // appended to afterwards. The file is closed again before log returns.
    void log(const std::string& run, const TimeSeries& records);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream& debug_stream_();

    mutable std::mutex mtx_;
    bool enabled_ = true;
    int rank_ = 0;
    std::ofstream debug_;
    std::set<std::string> written_;   // runs whose CSV was truncated already
};

const char* to_string(Logger::Level level);

} // namespace ExergySim
