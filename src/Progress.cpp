#include "../include/Progress.hpp"
#include "../misc/logger.hpp"

#include <iomanip>
#include <sstream>

LogProgress::LogProgress(const std::string &name): name(name) {}

void LogProgress::setName(const std::string &name) { this->name = name; }

void LogProgress::init(std::optional<std::size_t> max, const std::string &unit) {
    this->max = max; this->unit = unit; current = 0;
}

void LogProgress::inc(std::size_t by) {
    current += by;
    if (max) Logging::Debug(name, ": ", current, '/', *max, ' ', unit);
    else Logging::Debug(name, ": ", current, ' ', unit);
}

void LogProgress::showThroughput(cr::steady_clock::time_point start) {
    auto elapsed {cr::duration_cast<cr::microseconds>(cr::steady_clock::now() - start)};
    double seconds {static_cast<double>(elapsed.count()) / 1e6};

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << seconds << "s (" << std::setprecision(1)
        << (seconds > 0? static_cast<double>(current) / seconds: 0.0) << ' ' << unit << "/s)";

    Logging::Info(name, ": done ", current, ' ', unit, " in ", oss.str());
}
