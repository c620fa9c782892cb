#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace Logging {
    enum class Level { ERROR = 1, WARN, INFO, DEBUG, TRACE };

    constexpr std::string_view LevelStr(Level level) {
        switch (level) {
            case Level::ERROR: return "ERROR";
            case Level::WARN:  return  "WARN";
            case Level::INFO:  return  "INFO";
            case Level::DEBUG: return "DEBUG";
            case Level::TRACE: return "TRACE";
        }
        return "UNKNOWN";
    }

    inline std::string TimeStamp() {
        namespace cr = std::chrono;

        auto now = cr::system_clock::now();
        auto ms = cr::duration_cast<cr::milliseconds>(now.time_since_epoch()) % 1000;

        std::time_t t = cr::system_clock::to_time_t(now);
        std::tm tm = *std::localtime(&t);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    namespace impl {
        // Log lines go to stderr so stdout stays clean for command output
        class Logger {
            private:
                Level logLevel;
                std::ostream *sink;
                mutable std::mutex mutex;

                Logger(): logLevel{Level::INFO}, sink{&std::clog} {}

            public:
                inline void setLevel(Level level) { std::lock_guard lock {mutex}; this->logLevel = level; }
                inline Level getLevel() const { std::lock_guard lock {mutex}; return logLevel; }
                inline void setSink(std::ostream &os) { std::lock_guard lock {mutex}; sink = &os; }

                [[nodiscard]] static Logger &instance() {
                    static Logger logger {};
                    return logger;
                }

                template<typename ...Args>
                void log(Level lvl, Args &&...args) const {
                    using levelT = std::underlying_type_t<Level>;
                    std::lock_guard lock {mutex};
                    if (static_cast<levelT>(logLevel) >= static_cast<levelT>(lvl)) {
                        std::ostringstream msg;
                        (msg << ... << std::forward<Args>(args));
                        *sink << '[' << TimeStamp() << ' ' << LevelStr(lvl) << "] " << msg.str() << '\n';
                    }
                }
        };
    }

    inline void setLogLevel(Level level) { impl::Logger::instance().setLevel(level); }
    inline Level getLogLevel() { return impl::Logger::instance().getLevel(); }

    // Redirect log lines, the stream must outlive all logging calls
    inline void setLogSink(std::ostream &os) { impl::Logger::instance().setSink(os); }

    template<typename ...Args>
    inline void Error(Args &&...args) {
        impl::Logger::instance().log(Level::ERROR, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Warn(Args &&...args) {
        impl::Logger::instance().log(Level::WARN, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Info(Args &&...args) {
        impl::Logger::instance().log(Level::INFO, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Debug(Args &&...args) {
        impl::Logger::instance().log(Level::DEBUG, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Trace(Args &&...args) {
        impl::Logger::instance().log(Level::TRACE, std::forward<Args>(args)...);
    }
}
